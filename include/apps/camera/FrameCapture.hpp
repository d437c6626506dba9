#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

#include <opencv2/core.hpp>

#include "os/rtos.hpp"
#include "platform/IFrameSource.hpp"
#include "apps/camera/LedDetector.hpp"
#include "apps/camera/KeyOverlay.hpp"
#include "apps/camera/ReplayBuffer.hpp"

namespace camera {

// ------------------------------
// Config
// ------------------------------
struct FrameCaptureConfig {
    // Ring capacity = pre_roll_s * fps
    double pre_roll_s = 7.0;

    // Frames read and discarded after open (auto-exposure settling)
    int warmup_frames = 5;

    // Sleep when the source is closed / a read failed
    int idle_sleep_ms = 100;
    int read_retry_ms = 10;

    // Bounded wait for the capture task in Stop()
    int stop_join_ms = 2000;
};

// ------------------------------
// FrameCapture: owns the frame source; the capture task is the only
// reader of it. Each frame is turned into an LedState and pushed, with
// the overlay key snapshot, into the ReplayBuffer.
// ------------------------------
class FrameCapture {
public:
    // Task entry wiring for OSAL (void* arg).
    struct TaskCtx {
        FrameCapture* self = nullptr;
    };

public:
    FrameCapture(platform::IFrameSource& source, const LedConfigs& leds,
                 const FrameCaptureConfig& cfg, const KeyOverlay* overlay = nullptr);
    ~FrameCapture();

    FrameCapture(const FrameCapture&) = delete;
    FrameCapture& operator=(const FrameCapture&) = delete;

    // Open the source, warm up, size the ring, spawn the capture task.
    // On failure nothing runs and every matcher sees "not initialized".
    bool Start();

    // Two-phase: stop flag, bounded join, then release the source.
    void Stop();

    // Capture loop; returns when the stop flag is set.
    void Run();

    // OSAL-compatible entry point
    static void TaskEntry(void* arg);

    bool isReady() const;

    // Copy-out accessors
    bool latest(msg::ReplayFrame& out) const;
    std::vector<msg::ReplayFrame> drain() const;

    // Block until n frames newer than the call have been published.
    bool flush(int n, double timeout_s);

    double fps() const { return m_fps; }
    cv::Size frameSize() const;
    const LedConfigs& leds() const { return m_detector.leds(); }
    std::size_t bufferCapacity() const { return m_buffer ? m_buffer->capacity() : 0; }
    uint64_t droppedFrames() const { return m_dropped.load(); }

    enum class Status : uint8_t {
        OK = 0,
        // SOURCE FAILS
        OPEN_FAIL,
        TASK_FAIL,

        // LOGIC FAILS
        NOT_RUNNING,
        FLUSH_TIMEOUT,
        BAD_LED_CONFIG,
    };

    static const char* StatusStr(Status s);
    Status lastStatus() const { return m_status; }

private:
    platform::IFrameSource& m_source;
    LedDetector m_detector;
    FrameCaptureConfig m_cfg{};
    const KeyOverlay* m_overlay = nullptr;

    std::unique_ptr<ReplayBuffer> m_buffer;
    Rtos::BinarySemaphore m_published;

    TaskCtx m_ctx{};
    Rtos::Task m_task;

    std::atomic<bool> m_stop{false};
    std::atomic<bool> m_running{false};
    std::atomic<uint64_t> m_dropped{0};

    double m_fps = 0.0;
    uint32_t m_frame_id = 0;

    mutable Rtos::Mutex m_size_mtx;
    cv::Size m_frame_size;

    Status m_status = Status::OK;

    bool fail(Status s);
};

} // namespace camera
