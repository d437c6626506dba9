#include "apps/camera/InstantReplay.hpp"

#include <ctime>
#include <filesystem>
#include <iostream>
#include <system_error>

#include <opencv2/imgproc.hpp>
#include <opencv2/videoio.hpp>

namespace camera {

namespace {

// ---------------- overlay constants ----------------
constexpr int    FONT = cv::FONT_HERSHEY_SIMPLEX;
constexpr double FONT_SCALE = 0.5;
constexpr int    FONT_THICKNESS = 1;
constexpr int    PADDING = 5;
constexpr int    LINE_HEIGHT = 20;
constexpr int    INDICATOR_RADIUS = 7;

const cv::Scalar TEXT_COLOR(255, 255, 255);
const cv::Scalar TEXT_BG_COLOR(20, 20, 20);
const cv::Scalar INDICATOR_OFF_COLOR(80, 80, 80);
const cv::Scalar KEY_COLOR(200, 200, 200);

constexpr int KEY_W = 45;
constexpr int KEY_H = 30;
constexpr int KEY_GAP = 5;
constexpr int KEYPAD_X_OFFSET = 10;
constexpr int KEYPAD_Y_OFFSET = 50;  // from the bottom edge

// 'pos' is the text baseline
void put_text_bg(cv::Mat& img, const std::string& text, cv::Point pos) {
    int baseline = 0;
    const cv::Size ts = cv::getTextSize(text, FONT, FONT_SCALE, FONT_THICKNESS, &baseline);
    cv::rectangle(img,
                  cv::Point(pos.x - PADDING, pos.y - ts.height - PADDING),
                  cv::Point(pos.x + ts.width + PADDING, pos.y + PADDING),
                  TEXT_BG_COLOR, cv::FILLED);
    cv::putText(img, text, pos, FONT, FONT_SCALE, TEXT_COLOR, FONT_THICKNESS, cv::LINE_AA);
}

} // namespace

const char* InstantReplay::StatusStr(Status s) {
    switch (s) {
        case Status::OK: return "OK";
        case Status::DIR_FAIL: return "DIR_FAIL";
        case Status::WRITER_OPEN_FAIL: return "WRITER_OPEN_FAIL";
        case Status::DISABLED: return "DISABLED";
        case Status::NOT_ARMED: return "NOT_ARMED";
        case Status::NO_FRAMES: return "NO_FRAMES";
        case Status::NO_DIMENSIONS: return "NO_DIMENSIONS";
        default: return "UNKNOWN";
    }
}

InstantReplay::InstantReplay(const FrameCapture& capture, const ReplayConfig& cfg)
    : m_capture(capture), m_cfg(cfg) {
    if (m_cfg.post_roll_s < 0.0) m_cfg.post_roll_s = 0.0;
    if (m_cfg.enabled) ensureOutputDir();
}

bool InstantReplay::fail(Status s) {
    m_status = s;
    return false;
}

bool InstantReplay::ensureOutputDir() {
    if (m_cfg.output_dir.empty()) return fail(Status::DIR_FAIL);

    std::error_code ec;
    std::filesystem::create_directories(m_cfg.output_dir, ec);
    if (ec) {
        // Replay stays off for the rest of the run
        std::cerr << "[REPLAY] cannot create " << m_cfg.output_dir << ": " << ec.message()
                  << "; instant replay disabled\n";
        m_cfg.enabled = false;
        return fail(Status::DIR_FAIL);
    }
    return true;
}

void InstantReplay::setKeypadLayout(const KeypadLayout& layout) {
    m_keypad = layout;
    std::cout << "[REPLAY] keypad layout set (" << layout.size() << " rows)\n";
}

bool InstantReplay::arm(const std::string& method, const ReplayContext& ctx) {
    if (!m_cfg.enabled) return fail(Status::DISABLED);
    if (m_cfg.output_dir.empty()) return fail(Status::DIR_FAIL);
    if (m_armed) {
        // Outer call owns the session
        return false;
    }

    m_armed = true;
    m_method = method;
    m_ctx = ctx;
    m_failure_reason.clear();
    m_status = Status::OK;
    return true;
}

std::vector<msg::ReplayFrame> InstantReplay::recordPostRoll() const {
    std::vector<msg::ReplayFrame> post;
    const double fps = m_capture.fps() > 0.0 ? m_capture.fps() : 15.0;
    const int period_ms = static_cast<int>(1000.0 / fps);

    const double t0 = Rtos::NowSec();
    while (Rtos::NowSec() - t0 < m_cfg.post_roll_s) {
        msg::ReplayFrame f;
        if (m_capture.latest(f) && !f.empty()) post.push_back(f);
        Rtos::SleepMs(period_ms > 0 ? period_ms : 10);
    }
    return post;
}

bool InstantReplay::disarm(bool success, const std::string& reason) {
    if (!m_armed) return fail(Status::NOT_ARMED);

    bool saved = false;
    if (!success) {
        m_failure_reason = reason;

        // Pre-roll first, before the ring moves on
        std::vector<msg::ReplayFrame> clip = m_capture.drain();

        if (!clip.empty() && m_cfg.enabled && !m_cfg.output_dir.empty()) {
            std::cout << "[REPLAY] failure '" << reason << "' in " << m_method << ": "
                      << clip.size() << " pre-roll frame(s), recording "
                      << m_cfg.post_roll_s << "s post-roll\n";

            std::vector<msg::ReplayFrame> post = recordPostRoll();
            clip.insert(clip.end(), post.begin(), post.end());
            saved = save(clip);
        } else {
            std::cout << "[REPLAY] failure in " << m_method
                      << " but no clip saved (buffer empty or replay off)\n";
            m_status = clip.empty() ? Status::NO_FRAMES : Status::DISABLED;
        }
    }

    m_armed = false;
    m_method.clear();
    m_ctx = ReplayContext{};
    return saved;
}

std::string InstantReplay::clipFileName(const std::string& method) {
    const std::time_t now = std::time(nullptr);
    std::tm tm_now{};
    localtime_r(&now, &tm_now);

    char ts[16];
    std::strftime(ts, sizeof(ts), "%H%M%S", &tm_now);

    std::string safe = method;
    for (auto& c : safe) {
        if (c == ' ') c = '_';
    }
    return std::string("replay_") + ts + "_" + safe + ".mp4";
}

cv::Size InstantReplay::clipSize(const std::vector<msg::ReplayFrame>& frames) const {
    // Negotiated capture size; the first frame only when capture never saw one
    const cv::Size negotiated = m_capture.frameSize();
    if (negotiated.area() > 0) return negotiated;
    for (const auto& f : frames) {
        if (!f.empty()) return f.image.size();
    }
    return cv::Size();
}

std::vector<cv::Mat> InstantReplay::renderClip(const std::vector<msg::ReplayFrame>& frames,
                                               const cv::Size& size, std::size_t* resized) const {
    std::vector<cv::Mat> out;
    out.reserve(frames.size());
    std::size_t n = 0;
    for (const auto& f : frames) {
        if (f.empty()) continue;
        cv::Mat img = annotate(f);
        if (img.size() != size) {
            cv::resize(img, img, size);
            ++n;
        }
        out.push_back(img);
    }
    if (resized) *resized = n;
    return out;
}

bool InstantReplay::save(const std::vector<msg::ReplayFrame>& frames) {
    if (frames.empty()) return fail(Status::NO_FRAMES);

    const cv::Size size = clipSize(frames);
    if (size.area() == 0) {
        std::cerr << "[REPLAY] frame dimensions not set, cannot save\n";
        return fail(Status::NO_DIMENSIONS);
    }

    const std::string path = m_cfg.output_dir + "/" + clipFileName(m_method);
    const double fps = m_capture.fps() > 0.0 ? m_capture.fps() : 15.0;

    cv::VideoWriter writer(path, cv::VideoWriter::fourcc('m', 'p', '4', 'v'), fps, size);
    if (!writer.isOpened()) {
        std::cerr << "[REPLAY] failed to open writer for " << path << "\n";
        return fail(Status::WRITER_OPEN_FAIL);
    }

    std::size_t resized = 0;
    const std::vector<cv::Mat> clip = renderClip(frames, size, &resized);
    for (const auto& img : clip) writer.write(img);
    writer.release();

    if (resized > 0) {
        std::cout << "[REPLAY] resized " << resized << " frame(s) to " << size.width << "x" << size.height << "\n";
    }
    std::cout << "[REPLAY] wrote " << clip.size() << " frame(s) to " << path << "\n";

    m_last_path = path;
    m_status = Status::OK;
    return true;
}

cv::Mat InstantReplay::annotate(const msg::ReplayFrame& f) const {
    cv::Mat img = f.image.clone();
    if (img.empty()) return img;

    // FSM labels
    int y = PADDING;
    if (!m_ctx.empty()) {
        const std::string cur = m_ctx.current_state.empty() ? "N/A" : m_ctx.current_state;
        const std::string dst = m_ctx.destination_state.empty() ? "N/A" : m_ctx.destination_state;

        put_text_bg(img, "Current State: " + cur, cv::Point(PADDING + 5, y + LINE_HEIGHT));
        y += LINE_HEIGHT;
        put_text_bg(img, "Destination State: " + dst, cv::Point(PADDING + 5, y + LINE_HEIGHT));
        y += LINE_HEIGHT * 2;
    }

    // Keypad, bottom-left
    if (!m_keypad.empty()) {
        const int rows = static_cast<int>(m_keypad.size());
        const int grid_h = KEY_H * rows + KEY_GAP * (rows - 1);
        const int start_x = PADDING + KEYPAD_X_OFFSET;
        const int start_y = img.rows - grid_h - PADDING - KEYPAD_Y_OFFSET;

        for (int r = 0; r < rows; ++r) {
            for (int c = 0; c < static_cast<int>(m_keypad[r].size()); ++c) {
                const std::string& key = m_keypad[r][c];
                const int x1 = start_x + c * (KEY_W + KEY_GAP);
                const int y1 = start_y + r * (KEY_H + KEY_GAP);
                const cv::Point p1(x1, y1), p2(x1 + KEY_W, y1 + KEY_H);

                const bool pressed = f.active_keys.count(key) > 0;
                cv::rectangle(img, p1, p2, KEY_COLOR, pressed ? cv::FILLED : 2);
                if (pressed) cv::rectangle(img, p1, p2, TEXT_COLOR, 2);

                cv::putText(img, key, cv::Point(x1 + 5, y1 + 20), FONT, 0.4,
                            pressed ? cv::Scalar(0, 0, 0) : TEXT_COLOR, 1);
            }
        }
    }

    // ROI boxes and indicator dots
    for (const auto& led : m_capture.leds()) {
        const cv::Rect& roi = led.roi;
        cv::rectangle(img, roi, led.display_bgr, 1);

        cv::Point dot(roi.x + roi.width / 2, roi.y - LINE_HEIGHT);
        if (dot.y < INDICATOR_RADIUS + PADDING) dot.y = INDICATOR_RADIUS + PADDING;

        auto it = f.leds.find(led.name);
        const bool on = it != f.leds.end() && it->second == 1;
        cv::circle(img, dot, INDICATOR_RADIUS, on ? TEXT_COLOR : INDICATOR_OFF_COLOR, cv::FILLED);
        cv::circle(img, dot, INDICATOR_RADIUS, TEXT_COLOR, 1);
    }

    return img;
}

} // namespace camera
