#pragma once

#include <opencv2/core.hpp>

#include "apps/camera/LedConfig.hpp"
#include "msg/LedState.hpp"

namespace camera {

// ------------------------------
// LedDetector: ROI -> HSV threshold -> on/off
// Stateless; safe to call from the capture thread only while configs are immutable.
// ------------------------------
class LedDetector {
public:
    explicit LedDetector(const LedConfigs& leds);

    // Fraction of pixels of an HSV image inside [lo, hi]. When lo.hue > hi.hue
    // the hue range wraps and two masks are OR-ed.
    static double matchFractionHsv(const cv::Mat& hsv, const cv::Scalar& lo, const cv::Scalar& hi);

    // ROI clipped to the frame; empty intersection -> 0.
    static double matchFraction(const cv::Mat& bgr, const LedConfig& led);

    static bool matchesColor(const cv::Mat& bgr, const LedConfig& led);

    msg::LedState detect(const cv::Mat& bgr) const;

    const LedConfigs& leds() const { return m_leds; }

private:
    LedConfigs m_leds;
};

} // namespace camera
