#pragma once
#include <string>
#include <vector>

#include "apps/camera/FrameCapture.hpp"
#include "apps/camera/InstantReplay.hpp"
#include "msg/LedState.hpp"

namespace camera {

// ------------------------------
// Config
// ------------------------------
struct CheckerConfig {
    // Leniency for camera/processing jitter: shortens minimum holds and
    // extends maximum holds by at most this much.
    double tolerance_s = 0.1;

    // "Clear buffer" = wait for this many fresh frames before checking
    int clear_buffer_frames = 5;
    double clear_timeout_s = 2.0;

    // State changes shorter than this are not logged
    double min_loggable_s = 0.01;
};

static inline CheckerConfig sanitise(const CheckerConfig& in) {
    CheckerConfig c = in;
    if (c.tolerance_s < 0.0) c.tolerance_s = 0.0;
    if (c.clear_buffer_frames < 0) c.clear_buffer_frames = 0;
    if (c.clear_timeout_s < 0.1) c.clear_timeout_s = 0.1;
    if (c.min_loggable_s < 0.0) c.min_loggable_s = 0.0;
    return c;
}

/**
 * @brief Outcome of one check.
 * reason is a short machine-readable token, empty on success.
 */
struct CheckResult {
    bool ok = false;
    std::string reason;
    double held_s = 0.0;   // hold time observed for the deciding state

    explicit operator bool() const { return ok; }
};

struct CheckOptions {
    // LEDs that must stay off; any of them on counts as a mismatch
    std::vector<std::string> fail_leds;

    bool clear_buffer = true;

    // Arm instant replay around this call (ignored if an outer call armed it)
    bool manage_replay = true;
    ReplayContext context;

    // < 0 -> checker default
    double tolerance_s = -1.0;
};

// ------------------------------
// LedChecker: blocking matchers over the capture's latest frame.
// Call from one thread only; the capture task is the only producer.
// ------------------------------
class LedChecker {
public:
    LedChecker(FrameCapture& capture, const CheckerConfig& cfg, InstantReplay* replay = nullptr);

    /**
     * @brief Pass once target has been seen continuously for min_hold_s.
     * On timeout a hold within tolerance of min_hold_s still passes.
     */
    CheckResult confirmSolid(const msg::LedState& target, double min_hold_s = 2.0,
                             double timeout_s = 10.0, const CheckOptions& opt = CheckOptions{});

    /**
     * @brief Target must already be showing and hold for min_hold_s
     * from the call without a break.
     */
    CheckResult confirmSolidStrict(const msg::LedState& target, double min_hold_s,
                                   const CheckOptions& opt = CheckOptions{});

    // Appearance only. A fail_led turning on fails immediately.
    CheckResult awaitState(const msg::LedState& target, double timeout_s = 1.0,
                           const CheckOptions& opt = CheckOptions{});

    // Steps strictly in order: appearance phase, then hold phase.
    CheckResult confirmPattern(const msg::Pattern& pattern, const CheckOptions& opt = CheckOptions{});

    // awaitState(step 0) then confirmPattern without clearing in between.
    CheckResult awaitThenConfirmPattern(const msg::Pattern& pattern, double timeout_s = 5.0,
                                        const CheckOptions& opt = CheckOptions{});

    // Empty current -> false. Every target LED must match (missing = off).
    static bool matchesState(const msg::LedState& current, const msg::LedState& target,
                             const std::vector<std::string>& fail_leds = {});

    // "(1) (2) ( )" in display order
    std::string formatState(const msg::LedState& s) const;

    void setTolerance(double s) { m_cfg.tolerance_s = s < 0.0 ? 0.0 : s; }
    double tolerance() const { return m_cfg.tolerance_s; }

    bool isReady() const { return m_capture.isReady(); }

private:
    // Tracks the observed state for change logging
    struct StateTrack {
        msg::LedState state;
        double since = 0.0;
        bool valid = false;
    };

    FrameCapture& m_capture;
    CheckerConfig m_cfg{};
    InstantReplay* m_replay = nullptr;

    double tol(const CheckOptions& opt) const;
    bool beginReplay(const char* method, const CheckOptions& opt);
    CheckResult finish(bool armed, CheckResult r);
    void clearBuffer(const CheckOptions& opt);

    void track(StateTrack& st, const msg::LedState& cur, double t) const;
    void logFinal(const StateTrack& st, double now) const;

    CheckResult processStep(std::size_t i, const msg::PatternStep& step, double overall_end,
                            double tolerance, const CheckOptions& opt, StateTrack& st);

    std::string tokenState(const msg::LedState& s) const;
};

} // namespace camera
