#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "apps/camera/FrameCapture.hpp"
#include "msg/ReplayFrame.hpp"

namespace camera {

// ------------------------------
// Config
// ------------------------------
struct ReplayConfig {
    bool enabled = true;
    std::string output_dir = "replays";
    double post_roll_s = 5.0;   // recorded after the failure
};

// Labels drawn on every frame of a clip
struct ReplayContext {
    std::string current_state;
    std::string destination_state;

    bool empty() const { return current_state.empty() && destination_state.empty(); }
};

// Rows of key names, top to bottom
using KeypadLayout = std::vector<std::vector<std::string>>;

// ------------------------------
// InstantReplay: at most one armed session. On a failed check the ring
// is snapshotted as pre-roll, post-roll is sampled from the live capture,
// every frame is annotated, and the clip is encoded as mp4.
// ------------------------------
class InstantReplay {
public:
    InstantReplay(const FrameCapture& capture, const ReplayConfig& cfg);

    // No-op (returns false) when disabled, without an output dir, or already armed.
    bool arm(const std::string& method, const ReplayContext& ctx = ReplayContext{});

    // Always leaves the system disarmed. Returns true only if a clip was written.
    bool disarm(bool success, const std::string& reason);

    bool isArmed() const { return m_armed; }
    bool enabled() const { return m_cfg.enabled; }

    void setKeypadLayout(const KeypadLayout& layout);
    const KeypadLayout& keypadLayout() const { return m_keypad; }

    // Overlays for one frame (copy of f.image)
    cv::Mat annotate(const msg::ReplayFrame& f) const;

    // Writer size: the capture's negotiated frame size
    cv::Size clipSize(const std::vector<msg::ReplayFrame>& frames) const;
    // Annotated frames at `size`; empty frames are skipped
    std::vector<cv::Mat> renderClip(const std::vector<msg::ReplayFrame>& frames, const cv::Size& size,
                                    std::size_t* resized = nullptr) const;

    // replay_<HHMMSS>_<method>.mp4, spaces in method replaced by '_'
    static std::string clipFileName(const std::string& method);

    const std::string& lastSavedPath() const { return m_last_path; }
    const std::string& lastFailureReason() const { return m_failure_reason; }

    enum class Status : uint8_t {
        OK = 0,
        // IO FAILS
        DIR_FAIL,
        WRITER_OPEN_FAIL,

        // LOGIC FAILS
        DISABLED,
        NOT_ARMED,
        NO_FRAMES,
        NO_DIMENSIONS,
    };

    static const char* StatusStr(Status s);
    Status lastStatus() const { return m_status; }

private:
    const FrameCapture& m_capture;
    ReplayConfig m_cfg{};
    KeypadLayout m_keypad;

    bool m_armed = false;
    std::string m_method;
    ReplayContext m_ctx;
    std::string m_failure_reason;
    std::string m_last_path;

    Status m_status = Status::OK;

    bool ensureOutputDir();
    std::vector<msg::ReplayFrame> recordPostRoll() const;
    bool save(const std::vector<msg::ReplayFrame>& frames);
    bool fail(Status s);
};

} // namespace camera
