#include <filesystem>
#include <fstream>
#include <iostream>

#include <opencv2/imgproc.hpp>
#include <opencv2/videoio.hpp>

#include "apps/camera/LedConfig.hpp"
#include "apps/camera/LedDetector.hpp"
#include "support/SimulatedDevice.hpp"

static void printResult(const char* name, bool ok) {
    std::cout << name << ": " << (ok ? "OK" : "FAIL") << "\n";
}

static cv::Mat uniformHsv(int h, int s, int v) {
    return cv::Mat(10, 10, CV_8UC3, cv::Scalar(h, s, v));
}

static double propertyValue(const std::vector<platform::CameraProperty>& props, int id) {
    for (const auto& p : props) {
        if (p.id == id) return p.value;
    }
    return -9999.0;
}

int main() {
    using namespace camera;

    std::cout << "=== camera_leddetector_test ===\n";
    bool all = true;

    {
        std::cout << "\n[Test 1] HSV range, with and without hue wrap\n";
        const cv::Scalar red_lo(165, 150, 150), red_hi(15, 255, 255);
        const cv::Scalar green_lo(40, 10, 100), green_hi(85, 255, 255);

        const bool wrap_low = LedDetector::matchFractionHsv(uniformHsv(5, 200, 200), red_lo, red_hi) == 1.0;
        const bool wrap_high = LedDetector::matchFractionHsv(uniformHsv(175, 200, 200), red_lo, red_hi) == 1.0;
        const bool wrap_miss = LedDetector::matchFractionHsv(uniformHsv(90, 200, 200), red_lo, red_hi) == 0.0;
        const bool plain_hit = LedDetector::matchFractionHsv(uniformHsv(60, 200, 200), green_lo, green_hi) == 1.0;
        const bool dark_miss = LedDetector::matchFractionHsv(uniformHsv(60, 200, 50), green_lo, green_hi) == 0.0;
        const bool empty = LedDetector::matchFractionHsv(cv::Mat(), green_lo, green_hi) == 0.0;

        printResult("hue 5 in wrapped red", wrap_low);
        printResult("hue 175 in wrapped red", wrap_high);
        printResult("hue 90 outside wrapped red", wrap_miss);
        printResult("hue 60 in green", plain_hit);
        printResult("dark pixel rejected", dark_miss);
        printResult("empty image -> 0", empty);
        all = all && wrap_low && wrap_high && wrap_miss && plain_hit && dark_miss && empty;
    }

    {
        std::cout << "\n[Test 2] detect() on rendered frames\n";
        const LedConfigs leds = defaultLedConfigs();
        LedDetector det(leds);

        bool ok = true;
        for (int mask = 0; mask < 8; ++mask) {
            sim::LedSegment s;
            s.r = (mask & 1) ? 1 : 0;
            s.g = (mask & 2) ? 1 : 0;
            s.b = (mask & 4) ? 1 : 0;

            const msg::LedState st = det.detect(sim::renderLeds(s, leds));
            const bool match = st.at("red") == s.r && st.at("green") == s.g && st.at("blue") == s.b;
            if (!match) {
                std::cout << "  mismatch for r=" << s.r << " g=" << s.g << " b=" << s.b << "\n";
                ok = false;
            }
        }
        printResult("all 8 on/off combinations", ok);
        all = all && ok;
    }

    {
        std::cout << "\n[Test 3] ROI clipped to the frame\n";
        cv::Mat frame(100, 100, CV_8UC3, cv::Scalar(0, 255, 0));
        LedConfig led = defaultLedConfigs()[1];

        led.roi = cv::Rect(90, 90, 40, 40);   // partly outside
        const double partly = LedDetector::matchFraction(frame, led);
        led.roi = cv::Rect(200, 200, 40, 40); // fully outside
        const double outside = LedDetector::matchFraction(frame, led);

        const bool ok = partly == 1.0 && outside == 0.0;
        printResult("partly outside -> clipped, fully outside -> 0", ok);
        all = all && ok;
    }

    {
        std::cout << "\n[Test 4] sanitise / validate / find\n";
        LedConfig raw{"x", cv::Rect(0, 0, 0, -3), cv::Scalar(200, -5, 300), cv::Scalar(-1, 300, 10),
                      1.5, cv::Scalar(1, 2, 3)};
        const LedConfig c = sanitise(raw);
        const bool clamped = c.hsv_lower[0] == 179 && c.hsv_lower[1] == 0 && c.hsv_lower[2] == 255 &&
                             c.hsv_upper[0] == 0 && c.hsv_upper[1] == 255 &&
                             c.min_match_fraction == 1.0 && c.roi.width == 1 && c.roi.height == 1;
        printResult("values clamped", clamped);

        std::string why;
        LedConfigs dup = defaultLedConfigs();
        dup.push_back(dup.front());
        const bool dup_rejected = !validateLedConfigs(dup, why);
        std::cout << "  duplicate: " << why << "\n";
        const bool empty_rejected = !validateLedConfigs(LedConfigs{}, why);
        const bool defaults_ok = validateLedConfigs(defaultLedConfigs(), why);
        const LedConfigs fallback = fallbackLedConfigs();
        const bool fallback_ok = fallback.size() == 1 && validateLedConfigs(fallback, why);

        const LedConfigs leds = defaultLedConfigs();
        const bool found = findLed(leds, "green") != nullptr && findLed(leds, "amber") == nullptr;

        printResult("duplicate rejected", dup_rejected);
        printResult("empty rejected", empty_rejected);
        printResult("defaults valid", defaults_ok);
        printResult("fallback is one valid LED", fallback_ok);
        printResult("findLed", found);
        all = all && clamped && dup_rejected && empty_rejected && defaults_ok && fallback_ok && found;
    }

    {
        std::cout << "\n[Test 5] camera settings file\n";
        CameraSettings missing;
        const bool missing_ok = loadCameraSettings("/nonexistent/camera_settings.json", missing) &&
                                !missing.from_file &&
                                propertyValue(missing.properties, cv::CAP_PROP_EXPOSURE) == -6.0;
        printResult("missing file -> defaults", missing_ok);

        const std::filesystem::path path =
            std::filesystem::temp_directory_path() / "camera_leddetector_test_settings.json";
        {
            std::ofstream out(path);
            out << "{\n"
                << "  \"camera_properties\": { \"exposure\": 7, \"focus\": 12, \"zoom\": 3 },\n"
                << "  \"roi_settings\": {\n"
                << "    \"red\": [10, 20, 30, 40],\n"
                << "    \"green\": [1, 2],\n"
                << "    \"purple\": [5, 5, 5, 5]\n"
                << "  }\n"
                << "}\n";
        }

        CameraSettings s;
        const bool loaded = loadCameraSettings(path.string(), s) && s.from_file;
        const bool props = propertyValue(s.properties, cv::CAP_PROP_EXPOSURE) == -7.0 &&
                           propertyValue(s.properties, cv::CAP_PROP_FOCUS) == 12.0 &&
                           propertyValue(s.properties, cv::CAP_PROP_WB_TEMPERATURE) == 4500.0;
        const bool rois = s.roi_overrides.size() == 2 && s.roi_overrides.count("green") == 0;

        LedConfigs leds = defaultLedConfigs();
        const std::size_t applied = applyRoiOverrides(leds, s.roi_overrides);
        const bool red_moved = findLed(leds, "red")->roi == cv::Rect(10, 20, 30, 40);

        printResult("file loaded", loaded);
        printResult("exposure negated, focus set, defaults merged", props);
        printResult("malformed ROI skipped", rois);
        printResult("unknown LED ROI skipped", applied == 1 && red_moved);
        all = all && missing_ok && loaded && props && rois && applied == 1 && red_moved;

        std::error_code ec;
        std::filesystem::remove(path, ec);
    }

    {
        std::cout << "\n[Test 6] match fraction floor is monotonic\n";
        // Left half of the green ROI lit
        const LedConfigs leds = defaultLedConfigs();
        LedConfig green = *findLed(leds, "green");
        cv::Mat frame(480, 640, CV_8UC3, cv::Scalar(0, 0, 0));
        cv::rectangle(frame, cv::Rect(green.roi.x, green.roi.y, green.roi.width / 2, green.roi.height),
                      cv::Scalar(0, 255, 0), cv::FILLED);

        bool monotonic = true;
        bool failed_once = false;
        for (int i = 0; i <= 10; ++i) {
            green.min_match_fraction = i / 10.0;
            const bool on = LedDetector::matchesColor(frame, green);
            if (failed_once && on) monotonic = false;
            if (!on) failed_once = true;
        }
        green.min_match_fraction = 0.4;
        const bool low = LedDetector::matchesColor(frame, green);
        green.min_match_fraction = 0.6;
        const bool high = LedDetector::matchesColor(frame, green);

        printResult("never fail -> pass as the floor rises", monotonic);
        printResult("half lit: 0.4 passes, 0.6 fails", low && !high);
        all = all && monotonic && low && !high;
    }

    {
        std::cout << "\n[Test 7] wrapped hue range equals the rotated contiguous range\n";
        // One pixel per hue
        cv::Mat hsv(1, 180, CV_8UC3);
        for (int h = 0; h < 180; ++h) hsv.at<cv::Vec3b>(0, h) = cv::Vec3b(h, 200, 200);

        cv::Mat rotated(1, 180, CV_8UC3);
        const int shift = 180 - 165;
        for (int h = 0; h < 180; ++h) rotated.at<cv::Vec3b>(0, h) = cv::Vec3b((h + shift) % 180, 200, 200);

        const double wrapped = LedDetector::matchFractionHsv(hsv, cv::Scalar(165, 150, 150), cv::Scalar(15, 255, 255));
        const double straight = LedDetector::matchFractionHsv(rotated, cv::Scalar(0, 150, 150),
                                                              cv::Scalar(15 + shift, 255, 255));
        std::cout << "  wrapped " << wrapped << ", rotated " << straight << "\n";

        const bool ok = wrapped == straight && wrapped == 31.0 / 180.0;
        printResult("two-mask union == rotated single mask", ok);
        all = all && ok;
    }

    if (!all) {
        std::cout << "\ncamera_leddetector_test: FAIL\n";
        return 1;
    }
    std::cout << "\ncamera_leddetector_test: PASS\n";
    return 0;
}
