#include "apps/camera/FrameCapture.hpp"

#include <cmath>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

namespace camera {

static inline FrameCaptureConfig sanitise(const FrameCaptureConfig& in) {
    FrameCaptureConfig cfg = in;
    if (cfg.pre_roll_s < 0.5) cfg.pre_roll_s = 0.5;
    if (cfg.warmup_frames < 0) cfg.warmup_frames = 0;
    if (cfg.idle_sleep_ms < 1) cfg.idle_sleep_ms = 1;
    if (cfg.read_retry_ms < 1) cfg.read_retry_ms = 1;
    if (cfg.stop_join_ms < 1) cfg.stop_join_ms = 1;
    return cfg;
}

const char* FrameCapture::StatusStr(Status s) {
    switch (s) {
        case Status::OK: return "OK";
        case Status::OPEN_FAIL: return "OPEN_FAIL";
        case Status::TASK_FAIL: return "TASK_FAIL";
        case Status::NOT_RUNNING: return "NOT_RUNNING";
        case Status::FLUSH_TIMEOUT: return "FLUSH_TIMEOUT";
        case Status::BAD_LED_CONFIG: return "BAD_LED_CONFIG";
        default: return "UNKNOWN";
    }
}

FrameCapture::FrameCapture(platform::IFrameSource& source, const LedConfigs& leds,
                           const FrameCaptureConfig& cfg, const KeyOverlay* overlay)
    : m_source(source), m_detector(leds), m_cfg(sanitise(cfg)), m_overlay(overlay) {}

FrameCapture::~FrameCapture() {
    Stop();
}

bool FrameCapture::fail(Status s) {
    m_status = s;
    return false;
}

bool FrameCapture::Start() {
    if (m_running.load()) return true;

    std::string why;
    if (!validateLedConfigs(m_detector.leds(), why)) {
        std::cerr << "[CAPTURE] bad LED config: " << why << "\n";
        return fail(Status::BAD_LED_CONFIG);
    }

    if (!m_source.open()) {
        std::cerr << "[CAPTURE] frame source failed to open; camera not initialized\n";
        return fail(Status::OPEN_FAIL);
    }

    m_fps = m_source.fps() > 0.0 ? m_source.fps() : 15.0;

    // Let exposure settle; keep the size of the first good frame
    cv::Mat warm;
    for (int i = 0; i < m_cfg.warmup_frames; ++i) {
        if (m_source.read(warm) && !warm.empty()) {
            std::lock_guard<Rtos::Mutex> lk(m_size_mtx);
            if (m_frame_size.area() == 0) m_frame_size = warm.size();
        }
    }

    const std::size_t cap = static_cast<std::size_t>(std::ceil(m_cfg.pre_roll_s * m_fps));
    m_buffer = std::make_unique<ReplayBuffer>(cap);

    m_stop.store(false);
    m_ctx.self = this;
    m_running.store(true);
    if (!m_task.Create("FrameCapture", &FrameCapture::TaskEntry, &m_ctx)) {
        m_running.store(false);
        m_source.release();
        return fail(Status::TASK_FAIL);
    }

    std::cout << "[CAPTURE] started at " << m_fps << " fps, ring " << bufferCapacity() << " frames\n";
    m_status = Status::OK;
    return true;
}

void FrameCapture::Stop() {
    if (!m_running.load()) return;

    m_stop.store(true);
    if (!m_task.JoinFor(m_cfg.stop_join_ms)) {
        std::cerr << "[CAPTURE] capture task still running after "
                  << m_cfg.stop_join_ms << " ms, waiting for it\n";
        m_task.Join();
    }

    // Only now is the source no longer in use
    m_source.release();
    m_running.store(false);
    std::cout << "[CAPTURE] stopped (" << droppedFrames() << " dropped frame(s))\n";
}

void FrameCapture::TaskEntry(void* arg) {
    auto* ctx = static_cast<TaskCtx*>(arg);
    if (!ctx || !ctx->self) return;
    ctx->self->Run();
}

void FrameCapture::Run() {
    cv::Mat bgr;
    while (!m_stop.load()) {
        if (!m_source.isOpen()) {
            Rtos::SleepMs(m_cfg.idle_sleep_ms);
            continue;
        }

        if (!m_source.read(bgr) || bgr.empty()) {
            m_dropped.fetch_add(1);
            Rtos::SleepMs(m_cfg.read_retry_ms);
            continue;
        }

        msg::ReplayFrame f;
        f.t_us = Rtos::NowUs();
        f.frame_id = m_frame_id++;
        f.leds = m_detector.detect(bgr);
        if (m_overlay) f.active_keys = m_overlay->snapshot();

        // Fresh Mat per frame: the ring keeps the old buffer alive
        f.image = bgr;
        bgr = cv::Mat();

        {
            std::lock_guard<Rtos::Mutex> lk(m_size_mtx);
            if (m_frame_size.area() == 0) m_frame_size = f.image.size();
        }

        m_buffer->push(f);
        m_published.give();
    }
}

bool FrameCapture::isReady() const {
    return m_running.load() && m_task.Running() && m_buffer && m_source.isOpen();
}

bool FrameCapture::latest(msg::ReplayFrame& out) const {
    if (!m_buffer) return false;
    return m_buffer->latest(out);
}

std::vector<msg::ReplayFrame> FrameCapture::drain() const {
    if (!m_buffer) return {};
    return m_buffer->drain();
}

bool FrameCapture::flush(int n, double timeout_s) {
    if (!isReady()) return fail(Status::NOT_RUNNING);
    if (n <= 0) return true;

    const uint64_t target = m_buffer->pushed() + static_cast<uint64_t>(n);
    const double deadline = Rtos::NowSec() + timeout_s;

    // Drop a stale give from before the call
    m_published.try_take();

    while (m_buffer->pushed() < target) {
        const double left = deadline - Rtos::NowSec();
        if (left <= 0.0) {
            std::cerr << "[CAPTURE] flush timed out waiting for " << n << " frame(s)\n";
            return fail(Status::FLUSH_TIMEOUT);
        }
        m_published.take_for(static_cast<int>(left * 1000.0) + 1);
    }
    return true;
}

cv::Size FrameCapture::frameSize() const {
    std::lock_guard<Rtos::Mutex> lk(m_size_mtx);
    return m_frame_size;
}

} // namespace camera
