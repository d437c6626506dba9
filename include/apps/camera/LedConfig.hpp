#pragma once
#include <map>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "platform/linux/CameraSource.hpp"

namespace camera {

// ------------------------------
// One LED as seen by the camera
// ------------------------------
struct LedConfig {
    std::string name;

    cv::Rect roi;            // pixels, in the negotiated frame

    // OpenCV HSV: H in [0,179], S,V in [0,255].
    // hsv_lower[0] > hsv_upper[0] means the hue range wraps through 0.
    cv::Scalar hsv_lower;
    cv::Scalar hsv_upper;

    double min_match_fraction = 0.1;  // fraction of ROI pixels in range

    cv::Scalar display_bgr;  // overlay colour
};

// Display order: index i is shown as "(i+1)" in state strings.
using LedConfigs = std::vector<LedConfig>;

LedConfigs defaultLedConfigs();
LedConfigs fallbackLedConfigs();

static inline LedConfig sanitise(const LedConfig& in) {
    LedConfig c = in;
    auto clampd = [](double v, double lo, double hi) { return v < lo ? lo : (v > hi ? hi : v); };

    c.hsv_lower[0] = clampd(c.hsv_lower[0], 0, 179);
    c.hsv_upper[0] = clampd(c.hsv_upper[0], 0, 179);
    for (int i = 1; i < 3; ++i) {
        c.hsv_lower[i] = clampd(c.hsv_lower[i], 0, 255);
        c.hsv_upper[i] = clampd(c.hsv_upper[i], 0, 255);
    }
    c.min_match_fraction = clampd(c.min_match_fraction, 0.0, 1.0);
    if (c.roi.width  < 1) c.roi.width  = 1;
    if (c.roi.height < 1) c.roi.height = 1;
    return c;
}

// Non-empty, unique non-empty names. Fills 'why' on failure.
bool validateLedConfigs(const LedConfigs& leds, std::string& why);

const LedConfig* findLed(const LedConfigs& leds, const std::string& name);

// ------------------------------
// Camera settings file (JSON via cv::FileStorage)
// ------------------------------
struct CameraSettings {
    std::vector<platform::CameraProperty> properties;  // defaults merged with file
    std::map<std::string, cv::Rect> roi_overrides;
    bool from_file = false;
};

// Missing or unreadable file -> defaults (returns false only for a file
// that exists but cannot be parsed).
bool loadCameraSettings(const std::string& path, CameraSettings& out);

// Returns the number of ROIs replaced. Unknown LED names are skipped.
std::size_t applyRoiOverrides(LedConfigs& leds, const std::map<std::string, cv::Rect>& rois);

} // namespace camera
