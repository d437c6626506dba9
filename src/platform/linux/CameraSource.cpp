#include "platform/linux/CameraSource.hpp"

#include <cmath>
#include <iostream>

namespace platform {

namespace {

const char* propName(int id) {
    switch (id) {
        case cv::CAP_PROP_AUTO_EXPOSURE: return "Auto Exposure";
        case cv::CAP_PROP_EXPOSURE: return "Exposure";
        case cv::CAP_PROP_AUTOFOCUS: return "Autofocus";
        case cv::CAP_PROP_FOCUS: return "Focus";
        case cv::CAP_PROP_AUTO_WB: return "Auto White Balance";
        case cv::CAP_PROP_WB_TEMPERATURE: return "White Balance Temp";
        case cv::CAP_PROP_GAIN: return "Gain";
        case cv::CAP_PROP_BRIGHTNESS: return "Brightness";
        case cv::CAP_PROP_CONTRAST: return "Contrast";
        case cv::CAP_PROP_SATURATION: return "Saturation";
        default: return "Property";
    }
}

// Drivers report auto modes with their own encodings; no read-back check.
bool isAutoProp(int id) {
    return id == cv::CAP_PROP_AUTO_EXPOSURE || id == cv::CAP_PROP_AUTOFOCUS || id == cv::CAP_PROP_AUTO_WB;
}

} // namespace

std::vector<CameraProperty> defaultCameraProperties() {
    return {
        {cv::CAP_PROP_AUTO_EXPOSURE, 0},
        {cv::CAP_PROP_EXPOSURE, -6},
        {cv::CAP_PROP_AUTOFOCUS, 0},
        {cv::CAP_PROP_FOCUS, 30},
        {cv::CAP_PROP_AUTO_WB, 0},
        {cv::CAP_PROP_WB_TEMPERATURE, 4500},
    };
}

const char* CameraSource::StatusStr(Status s) {
    switch (s) {
        case Status::OK: return "OK";
        case Status::OPEN_FAIL: return "OPEN_FAIL";
        case Status::READ_FAIL: return "READ_FAIL";
        case Status::NOT_OPEN: return "NOT_OPEN";
        default: return "UNKNOWN";
    }
}

CameraSource::CameraSource(const CameraSourceConfig& cfg)
    : m_cfg(cfg) {}

CameraSource::~CameraSource() {
    release();
}

bool CameraSource::fail(Status s) {
    m_status = s;
    return false;
}

bool CameraSource::open() {
    if (m_cap.isOpened()) return true;

    if (!m_cap.open(m_cfg.index, cv::CAP_V4L2)) {
        std::cerr << "[CAPTURE] cannot open camera " << m_cfg.index << "\n";
        return fail(Status::OPEN_FAIL);
    }

    applyProperties();

    if (!m_cap.set(cv::CAP_PROP_FRAME_WIDTH, m_cfg.width)) {
        std::cerr << "[CAPTURE] failed to set width " << m_cfg.width << "\n";
    }
    if (!m_cap.set(cv::CAP_PROP_FRAME_HEIGHT, m_cfg.height)) {
        std::cerr << "[CAPTURE] failed to set height " << m_cfg.height << "\n";
    }
    m_cap.set(cv::CAP_PROP_FPS, m_cfg.fps);

    m_width  = static_cast<int>(m_cap.get(cv::CAP_PROP_FRAME_WIDTH));
    m_height = static_cast<int>(m_cap.get(cv::CAP_PROP_FRAME_HEIGHT));

    const double actual_fps = m_cap.get(cv::CAP_PROP_FPS);
    m_fps = (actual_fps > 0.0) ? actual_fps : m_cfg.fps;

    std::cout << "[CAPTURE] camera " << m_cfg.index << " open "
              << m_width << "x" << m_height << " @ " << m_fps << " fps\n";

    m_status = Status::OK;
    return true;
}

void CameraSource::applyProperties() {
    for (const auto& p : m_cfg.properties) {
        const char* name = propName(p.id);
        if (m_cap.set(p.id, p.value)) {
            const double actual = m_cap.get(p.id);
            std::cout << "[CAPTURE] set " << name << " to " << p.value
                      << " (read back: " << actual << ")\n";
            if (!isAutoProp(p.id) && std::fabs(actual - p.value) > 1e-6) {
                std::cout << "[CAPTURE] note: " << name << " read back " << actual
                          << " differs from " << p.value << "\n";
            }
        } else {
            std::cerr << "[CAPTURE] FAILED to set " << name << " (" << p.id
                      << ") to " << p.value << "\n";
        }
    }
}

bool CameraSource::isOpen() const {
    return m_cap.isOpened();
}

bool CameraSource::read(cv::Mat& bgr) {
    if (!m_cap.isOpened()) return fail(Status::NOT_OPEN);
    if (!m_cap.read(bgr) || bgr.empty()) return fail(Status::READ_FAIL);
    m_status = Status::OK;
    return true;
}

void CameraSource::release() {
    if (m_cap.isOpened()) {
        m_cap.release();
        std::cout << "[CAPTURE] camera " << m_cfg.index << " released\n";
    }
}

} // namespace platform
