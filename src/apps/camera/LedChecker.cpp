#include "apps/camera/LedChecker.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <limits>

namespace camera {

namespace {

constexpr int POLL_MS = 1;
constexpr int NO_FRAME_MS = 10;

// Pattern budget
constexpr double UNBOUNDED_STEP_BUDGET_S = 10.0;
constexpr double PER_STEP_SLACK_S = 5.0;
constexpr double PATTERN_SLACK_S = 15.0;

// Step appearance window
constexpr double APPEAR_MIN_S = 1.0;
constexpr double APPEAR_UNBOUNDED_S = 5.0;
constexpr double APPEAR_SLACK_S = 2.0;
constexpr double OPTIONAL_FIRST_STEP_S = 0.5;

// Strict solid aims at min_hold + this
constexpr double STRICT_SLACK_S = 5.0;

std::string fmt2(double v) {
    char s[32];
    std::snprintf(s, sizeof(s), "%.2f", v);
    return s;
}

std::string underscored(std::string s) {
    std::replace(s.begin(), s.end(), ' ', '_');
    return s;
}

CheckResult pass(double held = 0.0) {
    CheckResult r;
    r.ok = true;
    r.held_s = held;
    return r;
}

CheckResult failed(const std::string& reason, double held = 0.0) {
    CheckResult r;
    r.ok = false;
    r.reason = reason;
    r.held_s = held;
    return r;
}

} // namespace

LedChecker::LedChecker(FrameCapture& capture, const CheckerConfig& cfg, InstantReplay* replay)
    : m_capture(capture), m_cfg(sanitise(cfg)), m_replay(replay) {}

// ---------------- helpers ----------------

bool LedChecker::matchesState(const msg::LedState& current, const msg::LedState& target,
                              const std::vector<std::string>& fail_leds) {
    if (current.empty()) return false;

    for (const auto& name : fail_leds) {
        auto it = current.find(name);
        if (it != current.end() && it->second == 1) return false;
    }
    for (const auto& kv : target) {
        auto it = current.find(kv.first);
        const uint8_t have = (it == current.end()) ? 0 : it->second;
        if (have != kv.second) return false;
    }
    return true;
}

std::string LedChecker::formatState(const msg::LedState& s) const {
    std::string out;
    const auto& leds = m_capture.leds();
    for (std::size_t i = 0; i < leds.size(); ++i) {
        if (i > 0) out += ' ';
        auto it = s.find(leds[i].name);
        if (it != s.end() && it->second == 1) {
            out += "(" + std::to_string(i + 1) + ")";
        } else {
            out += "( )";
        }
    }
    return out;
}

std::string LedChecker::tokenState(const msg::LedState& s) const {
    return underscored(formatState(s));
}

double LedChecker::tol(const CheckOptions& opt) const {
    return opt.tolerance_s >= 0.0 ? opt.tolerance_s : m_cfg.tolerance_s;
}

bool LedChecker::beginReplay(const char* method, const CheckOptions& opt) {
    if (!m_replay || !opt.manage_replay) return false;
    return m_replay->arm(method, opt.context);
}

CheckResult LedChecker::finish(bool armed, CheckResult r) {
    if (!r.ok) {
        std::cout << "[LEDCHECK] FAIL: " << r.reason << "\n";
    }
    if (armed && m_replay) {
        m_replay->disarm(r.ok, r.reason);
    }
    return r;
}

void LedChecker::clearBuffer(const CheckOptions& opt) {
    if (!opt.clear_buffer || m_cfg.clear_buffer_frames == 0) return;
    if (!m_capture.flush(m_cfg.clear_buffer_frames, m_cfg.clear_timeout_s)) {
        std::cerr << "[LEDCHECK] buffer clear incomplete: "
                  << FrameCapture::StatusStr(m_capture.lastStatus()) << "\n";
    }
}

void LedChecker::track(StateTrack& st, const msg::LedState& cur, double t) const {
    if (!st.valid) {
        st.state = cur;
        st.since = t;
        st.valid = true;
        return;
    }
    if (cur == st.state) return;

    const double dur = t - st.since;
    if (dur >= m_cfg.min_loggable_s) {
        std::cout << "[LEDCHECK] " << formatState(st.state) << " (" << fmt2(dur) << "S)\n";
    }
    st.state = cur;
    st.since = t;
}

void LedChecker::logFinal(const StateTrack& st, double now) const {
    if (!st.valid) return;
    std::cout << "[LEDCHECK] " << formatState(st.state) << " (" << fmt2(now - st.since) << "S)\n";
}

// ---------------- confirmSolid ----------------

CheckResult LedChecker::confirmSolid(const msg::LedState& target, double min_hold_s,
                                     double timeout_s, const CheckOptions& opt) {
    const bool armed = beginReplay("confirm_solid", opt);
    if (!isReady()) return finish(armed, failed("camera_not_initialized"));

    clearBuffer(opt);
    const double tolerance = tol(opt);

    std::cout << "[LEDCHECK] confirm solid " << formatState(target) << " for "
              << fmt2(min_hold_s) << "s (timeout " << fmt2(timeout_s) << "s)\n";

    StateTrack st;
    double cont_start = -1.0;
    double last_t = 0.0;
    uint32_t last_id = std::numeric_limits<uint32_t>::max();

    const double t0 = Rtos::NowSec();
    while (Rtos::NowSec() - t0 < timeout_s) {
        msg::ReplayFrame f;
        if (!m_capture.latest(f) || f.leds.empty()) {
            cont_start = -1.0;
            Rtos::SleepMs(NO_FRAME_MS);
            continue;
        }
        if (f.frame_id == last_id) {
            Rtos::SleepMs(POLL_MS);
            continue;
        }
        last_id = f.frame_id;
        last_t = f.tSec();
        track(st, f.leds, last_t);

        if (matchesState(f.leds, target, opt.fail_leds)) {
            // Credit time the state was already showing
            if (cont_start < 0.0) cont_start = st.since;
            const double held = last_t - cont_start;
            if (held >= min_hold_s) {
                std::cout << "[LEDCHECK] " << formatState(target) << " (" << fmt2(held)
                          << "S) - Solid Confirmed\n";
                return finish(armed, pass(held));
            }
        } else {
            cont_start = -1.0;
        }
        Rtos::SleepMs(POLL_MS);
    }

    logFinal(st, Rtos::NowSec());

    if (cont_start >= 0.0) {
        const double held = last_t - cont_start;
        if (held >= min_hold_s - tolerance) {
            std::cout << "[LEDCHECK] WARN: solid " << formatState(target) << " held "
                      << fmt2(held) << "s, accepted within tolerance of " << fmt2(min_hold_s) << "s\n";
            return finish(armed, pass(held));
        }
        return finish(armed, failed("timeout_target_active_for_" + fmt2(held) + "s_needed_"
                                    + fmt2(min_hold_s) + "s", held));
    }
    return finish(armed, failed("timeout_target_not_solid_for_" + fmt2(min_hold_s) + "s"));
}

// ---------------- confirmSolidStrict ----------------

CheckResult LedChecker::confirmSolidStrict(const msg::LedState& target, double min_hold_s,
                                           const CheckOptions& opt) {
    const bool armed = beginReplay("confirm_solid_strict", opt);
    if (!isReady()) return finish(armed, failed("camera_not_init_strict"));

    clearBuffer(opt);
    const double tolerance = tol(opt);

    msg::ReplayFrame f;
    if (!m_capture.latest(f) || f.leds.empty()) {
        return finish(armed, failed("frame_capture_err_strict"));
    }
    if (!matchesState(f.leds, target, opt.fail_leds)) {
        std::cout << "[LEDCHECK] strict: initial " << formatState(f.leds) << " is not "
                  << formatState(target) << "\n";
        return finish(armed, failed("initial_state_not_target_strict"));
    }

    const double began = f.tSec();
    const double op_start = Rtos::NowSec();

    while (true) {
        if (Rtos::NowSec() - op_start > min_hold_s + STRICT_SLACK_S) {
            return finish(armed, failed("op_timeout_strict_aiming_" + fmt2(min_hold_s) + "s"));
        }
        if (!m_capture.latest(f) || f.leds.empty()) {
            return finish(armed, failed("frame_capture_err_strict"));
        }

        const double held = f.tSec() - began;
        if (!matchesState(f.leds, target, opt.fail_leds)) {
            if (held >= min_hold_s - tolerance) {
                std::cout << "[LEDCHECK] WARN: strict " << formatState(target) << " broke at "
                          << fmt2(held) << "s, within tolerance of " << fmt2(min_hold_s) << "s\n";
                return finish(armed, pass(held));
            }
            return finish(armed, failed("state_broke_strict_held_" + fmt2(held) + "s_needed_"
                                        + fmt2(min_hold_s) + "s", held));
        }
        if (held >= min_hold_s) {
            std::cout << "[LEDCHECK] " << formatState(target) << " (" << fmt2(held)
                      << "S) - Strict Solid Confirmed\n";
            return finish(armed, pass(held));
        }
        Rtos::SleepMs(POLL_MS);
    }
}

// ---------------- awaitState ----------------

CheckResult LedChecker::awaitState(const msg::LedState& target, double timeout_s,
                                   const CheckOptions& opt) {
    const bool armed = beginReplay("await_state", opt);
    if (!isReady()) return finish(armed, failed("camera_not_init_await"));

    clearBuffer(opt);

    StateTrack st;
    const double t0 = Rtos::NowSec();
    while (Rtos::NowSec() - t0 < timeout_s) {
        msg::ReplayFrame f;
        if (!m_capture.latest(f) || f.leds.empty()) {
            Rtos::SleepMs(NO_FRAME_MS);
            continue;
        }
        track(st, f.leds, f.tSec());

        for (const auto& name : opt.fail_leds) {
            auto it = f.leds.find(name);
            if (it != f.leds.end() && it->second == 1) {
                logFinal(st, Rtos::NowSec());
                return finish(armed, failed("prohibited_led_" + name + "_on"));
            }
        }
        if (matchesState(f.leds, target)) {
            std::cout << "[LEDCHECK] " << formatState(target) << " observed after "
                      << fmt2(Rtos::NowSec() - t0) << "s\n";
            return finish(armed, pass());
        }
        Rtos::SleepMs(POLL_MS);
    }

    logFinal(st, Rtos::NowSec());
    return finish(armed, failed("timeout_await_await_" + tokenState(target)));
}

// ---------------- confirmPattern ----------------

CheckResult LedChecker::processStep(std::size_t i, const msg::PatternStep& step, double overall_end,
                                    double tolerance, const CheckOptions& opt, StateTrack& st) {
    const std::string n = std::to_string(i + 1);
    const bool unbounded = std::isinf(step.max_s);
    const double max_check = unbounded ? std::numeric_limits<double>::infinity() : step.max_s + tolerance;
    const bool optional = (i == 0 && step.min_s <= 0.0);

    // (a) appearance
    double appear_s = std::max(APPEAR_MIN_S, unbounded ? APPEAR_UNBOUNDED_S : step.max_s) + APPEAR_SLACK_S;
    if (optional) appear_s = OPTIONAL_FIRST_STEP_S;
    const double appear_end = std::min(overall_end, Rtos::NowSec() + appear_s);

    double seen = -1.0;
    msg::ReplayFrame f;
    while (Rtos::NowSec() < appear_end) {
        if (!m_capture.latest(f) || f.leds.empty()) {
            Rtos::SleepMs(NO_FRAME_MS);
            continue;
        }
        track(st, f.leds, f.tSec());
        if (matchesState(f.leds, step.target, opt.fail_leds)) {
            seen = f.tSec();
            break;
        }
        Rtos::SleepMs(POLL_MS);
    }

    if (seen < 0.0) {
        if (optional) {
            std::cout << "[LEDCHECK] step " << n << " " << formatState(step.target)
                      << " not seen, optional first step skipped\n";
            return pass();
        }
        return failed("step_" + n + "_not_seen_" + tokenState(step.target));
    }

    // (b) hold
    double held = 0.0;
    while (Rtos::NowSec() < overall_end) {
        if (!m_capture.latest(f) || f.leds.empty()) {
            Rtos::SleepMs(NO_FRAME_MS);
            continue;
        }
        track(st, f.leds, f.tSec());
        held = f.tSec() - seen;

        if (matchesState(f.leds, step.target, opt.fail_leds)) {
            if (held > max_check) {
                return failed("step_" + n + "_exceeded_max_duration_held_" + fmt2(held)
                              + "s_max_" + fmt2(step.max_s) + "s", held);
            }
            if (held >= step.min_s) return pass(held);
        } else {
            if (held >= step.min_s) return pass(held);
            if (held >= step.min_s - tolerance) {
                std::cout << "[LEDCHECK] WARN: step " << n << " held " << fmt2(held)
                          << "s, accepted within tolerance of " << fmt2(step.min_s) << "s\n";
                return pass(held);
            }
            return failed("step_" + n + "_state_" + tokenState(step.target) + "_changed_to_"
                          + tokenState(f.leds) + "_early_held_" + fmt2(held) + "s_min_"
                          + fmt2(step.min_s) + "s", held);
        }
        Rtos::SleepMs(POLL_MS);
    }
    return failed("timeout_hold_step_" + n + "_held_" + fmt2(held) + "s", held);
}

CheckResult LedChecker::confirmPattern(const msg::Pattern& pattern, const CheckOptions& opt) {
    const bool armed = beginReplay("confirm_pattern", opt);
    if (pattern.empty()) return finish(armed, failed("empty_pattern"));
    if (!isReady()) return finish(armed, failed("camera_not_init_pattern"));

    clearBuffer(opt);
    const double tolerance = tol(opt);

    double budget = PATTERN_SLACK_S + PER_STEP_SLACK_S * static_cast<double>(pattern.size());
    for (const auto& s : pattern) {
        budget += std::isinf(s.max_s) ? UNBOUNDED_STEP_BUDGET_S : s.max_s;
    }
    const double overall_end = Rtos::NowSec() + budget;

    std::cout << "[LEDCHECK] confirm pattern of " << pattern.size() << " step(s), budget "
              << fmt2(budget) << "s\n";

    StateTrack st;
    double held = 0.0;
    for (std::size_t i = 0; i < pattern.size(); ++i) {
        if (Rtos::NowSec() > overall_end) {
            logFinal(st, Rtos::NowSec());
            return finish(armed, failed("overall_timeout_pattern_at_step_" + std::to_string(i + 1)));
        }
        CheckResult r = processStep(i, pattern[i], overall_end, tolerance, opt, st);
        if (!r.ok) {
            logFinal(st, Rtos::NowSec());
            return finish(armed, r);
        }
        held = r.held_s;
    }

    logFinal(st, Rtos::NowSec());
    std::cout << "[LEDCHECK] pattern confirmed\n";
    return finish(armed, pass(held));
}

// ---------------- awaitThenConfirmPattern ----------------

CheckResult LedChecker::awaitThenConfirmPattern(const msg::Pattern& pattern, double timeout_s,
                                                const CheckOptions& opt) {
    const bool armed = beginReplay("await_then_confirm_pattern", opt);
    if (pattern.empty()) return finish(armed, failed("empty_pattern_await_confirm"));
    if (!isReady()) return finish(armed, failed("camera_not_init_await_confirm"));

    // The outer call owns replay; keep observation continuous
    CheckOptions inner = opt;
    inner.manage_replay = false;

    const CheckResult seen = awaitState(pattern.front().target, timeout_s, inner);
    if (!seen.ok) {
        return finish(armed, failed("first_state_" + tokenState(pattern.front().target)
                                    + "_not_observed_in_await_confirm"));
    }

    inner.clear_buffer = false;
    const CheckResult confirmed = confirmPattern(pattern, inner);
    if (!confirmed.ok) {
        std::cout << "[LEDCHECK] pattern after await failed: " << confirmed.reason << "\n";
        return finish(armed, failed("pattern_confirm_failed_after_await", confirmed.held_s));
    }
    return finish(armed, pass(confirmed.held_s));
}

} // namespace camera
