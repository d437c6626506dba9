#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include <opencv2/videoio.hpp>

#include "platform/IFrameSource.hpp"

namespace platform {

struct CameraProperty {
    int id = 0;          // cv::CAP_PROP_*
    double value = 0.0;
};

// ------------------------------
// Config
// ------------------------------
struct CameraSourceConfig {
    int index = 0;          // /dev/videoN
    int width = 640;
    int height = 480;
    double fps = 15.0;

    // Applied in order before the format request
    std::vector<CameraProperty> properties;
};

// Default fixed-exposure/fixed-focus settings for LED work
std::vector<CameraProperty> defaultCameraProperties();

// ------------------------------
// CameraSource: cv::VideoCapture over V4L2
// ------------------------------
class CameraSource : public IFrameSource {
public:
    explicit CameraSource(const CameraSourceConfig& cfg);
    ~CameraSource() override;

    bool open() override;
    bool isOpen() const override;
    bool read(cv::Mat& bgr) override;
    void release() override;
    double fps() const override { return m_fps; }

    int negotiatedWidth()  const { return m_width; }
    int negotiatedHeight() const { return m_height; }

    enum class Status : uint8_t {
        OK = 0,
        OPEN_FAIL,
        READ_FAIL,
        NOT_OPEN,
    };

    static const char* StatusStr(Status s);
    Status lastStatus() const { return m_status; }

private:
    CameraSourceConfig m_cfg{};
    cv::VideoCapture m_cap;

    int m_width = 0;
    int m_height = 0;
    double m_fps = 0.0;

    Status m_status = Status::OK;

    void applyProperties();
    bool fail(Status s);
};

} // namespace platform
