#include "apps/camera/LedConfig.hpp"

#include <fstream>
#include <iostream>
#include <set>

#include <opencv2/core/persistence.hpp>
#include <opencv2/videoio.hpp>

namespace camera {

LedConfigs defaultLedConfigs() {
    LedConfigs leds;
    leds.push_back(sanitise({"red",   cv::Rect(187, 165, 40, 40),
                             cv::Scalar(165, 150, 150), cv::Scalar(15, 255, 255),
                             0.15, cv::Scalar(0, 0, 255)}));
    leds.push_back(sanitise({"green", cv::Rect(302, 165, 40, 40),
                             cv::Scalar(40, 10, 100), cv::Scalar(85, 255, 255),
                             0.25, cv::Scalar(0, 255, 0)}));
    leds.push_back(sanitise({"blue",  cv::Rect(417, 165, 40, 40),
                             cv::Scalar(0, 0, 100), cv::Scalar(130, 255, 255),
                             0.75, cv::Scalar(255, 0, 0)}));
    return leds;
}

LedConfigs fallbackLedConfigs() {
    return {sanitise({"fallback_red", cv::Rect(50, 50, 20, 20),
                      cv::Scalar(0, 100, 100), cv::Scalar(10, 255, 255),
                      0.1, cv::Scalar(128, 128, 128)})};
}

bool validateLedConfigs(const LedConfigs& leds, std::string& why) {
    if (leds.empty()) {
        why = "no LEDs configured";
        return false;
    }
    std::set<std::string> seen;
    for (const auto& l : leds) {
        if (l.name.empty()) {
            why = "LED with empty name";
            return false;
        }
        if (!seen.insert(l.name).second) {
            why = "duplicate LED '" + l.name + "'";
            return false;
        }
        if (l.roi.width <= 0 || l.roi.height <= 0) {
            why = "LED '" + l.name + "' has an empty ROI";
            return false;
        }
    }
    return true;
}

const LedConfig* findLed(const LedConfigs& leds, const std::string& name) {
    for (const auto& l : leds) {
        if (l.name == name) return &l;
    }
    return nullptr;
}

static void setProperty(std::vector<platform::CameraProperty>& props, int id, double value) {
    for (auto& p : props) {
        if (p.id == id) {
            p.value = value;
            return;
        }
    }
    props.push_back({id, value});
}

bool loadCameraSettings(const std::string& path, CameraSettings& out) {
    out = CameraSettings{};
    out.properties = platform::defaultCameraProperties();

    if (path.empty()) return true;
    {
        std::ifstream probe(path);
        if (!probe.good()) {
            std::cout << "[CONFIG] settings file " << path << " not found, using defaults\n";
            return true;
        }
    }

    cv::FileStorage fs;
    try {
        if (!fs.open(path, cv::FileStorage::READ | cv::FileStorage::FORMAT_JSON)) {
            std::cerr << "[CONFIG] cannot read " << path << ", using defaults\n";
            return false;
        }
    } catch (const cv::Exception& e) {
        std::cerr << "[CONFIG] parse error in " << path << ": " << e.what() << ", using defaults\n";
        return false;
    }

    const cv::FileNode props = fs["camera_properties"];
    if (props.isMap()) {
        for (auto it = props.begin(); it != props.end(); ++it) {
            const cv::FileNode n = *it;
            const std::string key = n.name();
            if (!n.isInt() && !n.isReal()) {
                std::cerr << "[CONFIG] camera_properties." << key << " is not a number, skipped\n";
                continue;
            }
            const double v = static_cast<double>(n);
            if (key == "exposure") {
                // UI exposure is positive; the driver wants the negated log2 value
                setProperty(out.properties, cv::CAP_PROP_EXPOSURE, -v);
            } else if (key == "focus") {
                setProperty(out.properties, cv::CAP_PROP_FOCUS, v);
            } else if (key == "brightness") {
                setProperty(out.properties, cv::CAP_PROP_BRIGHTNESS, v);
            } else {
                std::cerr << "[CONFIG] unknown camera property '" << key << "', skipped\n";
            }
        }
    }

    const cv::FileNode rois = fs["roi_settings"];
    if (rois.isMap()) {
        for (auto it = rois.begin(); it != rois.end(); ++it) {
            const cv::FileNode n = *it;
            if (!n.isSeq() || n.size() != 4) {
                std::cerr << "[CONFIG] roi_settings." << n.name() << " must be [x,y,w,h], skipped\n";
                continue;
            }
            out.roi_overrides[n.name()] = cv::Rect(static_cast<int>(n[0]), static_cast<int>(n[1]),
                                                   static_cast<int>(n[2]), static_cast<int>(n[3]));
        }
    }

    out.from_file = true;
    std::cout << "[CONFIG] loaded " << path << " (" << out.roi_overrides.size() << " ROI override(s))\n";
    return true;
}

std::size_t applyRoiOverrides(LedConfigs& leds, const std::map<std::string, cv::Rect>& rois) {
    std::size_t applied = 0;
    for (const auto& kv : rois) {
        bool found = false;
        for (auto& l : leds) {
            if (l.name == kv.first) {
                l.roi = kv.second;
                l = sanitise(l);
                found = true;
                ++applied;
                break;
            }
        }
        if (!found) {
            std::cerr << "[CONFIG] ROI for unknown LED '" << kv.first << "', skipped\n";
        }
    }
    return applied;
}

} // namespace camera
