#include "apps/camera/LedDetector.hpp"

#include <opencv2/imgproc.hpp>

namespace camera {

LedDetector::LedDetector(const LedConfigs& leds)
    : m_leds(leds) {}

double LedDetector::matchFractionHsv(const cv::Mat& hsv, const cv::Scalar& lo, const cv::Scalar& hi) {
    if (hsv.empty()) return 0.0;

    cv::Mat mask;
    if (lo[0] > hi[0]) {
        // Hue wraps: [lo.h, 179] U [0, hi.h]
        cv::Mat upper, lower;
        cv::inRange(hsv, cv::Scalar(lo[0], lo[1], lo[2]), cv::Scalar(179, hi[1], hi[2]), upper);
        cv::inRange(hsv, cv::Scalar(0, lo[1], lo[2]), cv::Scalar(hi[0], hi[1], hi[2]), lower);
        cv::bitwise_or(upper, lower, mask);
    } else {
        cv::inRange(hsv, lo, hi, mask);
    }

    const double total = static_cast<double>(mask.total());
    if (total <= 0.0) return 0.0;
    return static_cast<double>(cv::countNonZero(mask)) / total;
}

double LedDetector::matchFraction(const cv::Mat& bgr, const LedConfig& led) {
    if (bgr.empty()) return 0.0;

    const cv::Rect clipped = led.roi & cv::Rect(0, 0, bgr.cols, bgr.rows);
    if (clipped.area() <= 0) return 0.0;

    cv::Mat hsv;
    cv::cvtColor(bgr(clipped), hsv, cv::COLOR_BGR2HSV);
    return matchFractionHsv(hsv, led.hsv_lower, led.hsv_upper);
}

bool LedDetector::matchesColor(const cv::Mat& bgr, const LedConfig& led) {
    return matchFraction(bgr, led) >= led.min_match_fraction;
}

msg::LedState LedDetector::detect(const cv::Mat& bgr) const {
    msg::LedState state;
    for (const auto& led : m_leds) {
        state[led.name] = matchesColor(bgr, led) ? 1 : 0;
    }
    return state;
}

} // namespace camera
