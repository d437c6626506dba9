#pragma once
#include <cstdint>
#include <set>
#include <string>

#include <opencv2/core.hpp>

#include "msg/LedState.hpp"

namespace msg {

struct ReplayFrame {
    uint64_t t_us = 0;       // capture timestamp (monotonic, µs)
    uint32_t frame_id = 0;   // increasing counter

    // Owned copy; consumers never share the capture thread's buffer
    cv::Mat image;

    LedState leds;                     // detector output for this frame
    std::set<std::string> active_keys; // overlay keys at capture time

    bool empty() const { return image.empty(); }
    double tSec() const { return static_cast<double>(t_us) * 1e-6; }
};

} // namespace msg
