#pragma once

#include <opencv2/core.hpp>

namespace platform {

// Anything that produces BGR frames: a webcam, a file, a simulator.
class IFrameSource {
public:
    virtual bool open() = 0;
    virtual bool isOpen() const = 0;
    // Blocks for at most one frame period. Returns false on a dropped frame.
    virtual bool read(cv::Mat& bgr) = 0;
    virtual void release() = 0;
    // Negotiated frame rate, 0 if unknown
    virtual double fps() const = 0;
    virtual ~IFrameSource() = default;
};

} // namespace platform
