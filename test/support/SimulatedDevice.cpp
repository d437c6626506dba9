#include "support/SimulatedDevice.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <mutex>

#include <opencv2/imgproc.hpp>

#include "apps/device/HardwareActions.hpp"

namespace sim {

namespace {

// Firmware-like LED scripts
const std::vector<LedSegment> kBoot = {
    {1, 0, 0, 1.0}, {0, 1, 0, 1.0}, {0, 0, 1, 1.0},
};

const std::vector<LedSegment> kAccept = {
    {0, 0, 0, 0.5}, {0, 1, 0, 0.3}, {0, 0, 0, 0.3}, {0, 1, 0, 0.3},
    {0, 0, 0, 0.3}, {0, 1, 0, 0.3}, {0, 0, 0, 0.3},
};

const std::vector<LedSegment> kReject = {
    {0, 0, 0, 0.3}, {1, 0, 0, 0.3}, {0, 0, 0, 0.3}, {1, 0, 0, 0.3},
    {0, 0, 0, 0.3}, {1, 0, 0, 0.3}, {0, 0, 0, 0.3},
};

const std::vector<LedSegment> kGreenBlueBlink = {
    {0, 0, 1, 0.3}, {0, 1, 1, 0.3},
};

const std::vector<LedSegment> kEnumLegacy = {
    {0, 1, 0, 4.5}, {0, 0, 0, 0.3}, {0, 1, 0, 0.3}, {0, 0, 0, 0.3},
    {0, 1, 0, 1.0}, {0, 0, 0, 0.3},
};

const LedSegment kGreenBlue{0, 1, 1, 0.0};
const LedSegment kRed{1, 0, 0, 0.0};
const LedSegment kGreen{0, 1, 0, 0.0};
const LedSegment kBlue{0, 0, 1, 0.0};

std::vector<LedSegment> then(std::vector<LedSegment> a, const LedSegment& last) {
    a.push_back(last);
    return a;
}

} // namespace

// ---------------- LedTimeline ----------------

void LedTimeline::play(const std::vector<LedSegment>& once, const std::vector<LedSegment>& repeat) {
    std::lock_guard<Rtos::Mutex> lk(m_mtx);
    m_once = once;
    m_repeat = repeat;
    m_start = Rtos::NowSec();
}

LedSegment LedTimeline::current() const {
    std::lock_guard<Rtos::Mutex> lk(m_mtx);
    double t = Rtos::NowSec() - m_start;

    for (const auto& s : m_once) {
        if (s.dur_s <= 0.0 || t < s.dur_s) return s;
        t -= s.dur_s;
    }

    double period = 0.0;
    for (const auto& s : m_repeat) period += s.dur_s > 0.0 ? s.dur_s : 0.0;
    if (m_repeat.empty() || period <= 0.0) {
        if (!m_repeat.empty()) return m_repeat.front();
        return m_once.empty() ? LedSegment{} : m_once.back();
    }

    t = std::fmod(t, period);
    for (const auto& s : m_repeat) {
        if (t < s.dur_s) return s;
        t -= s.dur_s;
    }
    return m_repeat.back();
}

cv::Mat renderLeds(const LedSegment& s, const camera::LedConfigs& leds, cv::Size size) {
    cv::Mat img(size, CV_8UC3, cv::Scalar(0, 0, 0));
    for (const auto& led : leds) {
        bool on = false;
        if (led.name == "red") on = s.r != 0;
        else if (led.name == "green") on = s.g != 0;
        else if (led.name == "blue") on = s.b != 0;
        if (on) cv::rectangle(img, led.roi, led.display_bgr, cv::FILLED);
    }
    return img;
}

// ---------------- ScriptedFrameSource ----------------

ScriptedFrameSource::ScriptedFrameSource(const LedTimeline& timeline, double fps)
    : m_timeline(timeline), m_leds(camera::defaultLedConfigs()), m_fps(fps > 1.0 ? fps : 1.0) {}

bool ScriptedFrameSource::open() {
    if (m_open_fails) return false;
    m_open = true;
    m_next = Rtos::NowSec();
    return true;
}

bool ScriptedFrameSource::read(cv::Mat& bgr) {
    if (!m_open) return false;

    const double now = Rtos::NowSec();
    if (m_next > now) Rtos::SleepMs(static_cast<int>((m_next - now) * 1000.0));
    m_next = std::max(m_next, now) + 1.0 / m_fps;

    bgr = renderLeds(m_timeline.current(), m_leds);
    return true;
}

// ---------------- SimulatedDevice ----------------

SimulatedDevice::SimulatedDevice(double fps)
    : m_camera(m_timeline, fps) {
    m_timeline.hold(0, 0, 0);
}

const char* SimulatedDevice::modeName(Mode m) {
    switch (m) {
        case Mode::OFF: return "OFF";
        case Mode::OOB: return "OOB";
        case Mode::ENROLL_FIRST: return "ENROLL_FIRST";
        case Mode::ENROLL_CONFIRM: return "ENROLL_CONFIRM";
        case Mode::ADMIN: return "ADMIN";
        case Mode::STANDBY: return "STANDBY";
        case Mode::UNLOCKED: return "UNLOCKED";
        default: return "UNKNOWN";
    }
}

void SimulatedDevice::setFault(Fault f) {
    std::lock_guard<Rtos::Mutex> lk(m_mtx);
    m_fault = f;
}

SimulatedDevice::Mode SimulatedDevice::mode() const {
    std::lock_guard<Rtos::Mutex> lk(m_mtx);
    return m_mode;
}

device::Pin SimulatedDevice::adminPin() const {
    std::lock_guard<Rtos::Mutex> lk(m_mtx);
    return m_admin;
}

void SimulatedDevice::setMode(Mode m) {
    if (m != m_mode) std::cout << "[SIM] " << modeName(m_mode) << " -> " << modeName(m) << "\n";
    m_mode = m;
}

void SimulatedDevice::boot() {
    if (m_fault == Fault::DEAD) {
        m_timeline.hold(0, 0, 0);
        return;
    }
    std::vector<LedSegment> s = kBoot;
    s.insert(s.end(), kAccept.begin(), kAccept.end());
    if (m_admin.empty()) {
        setMode(Mode::OOB);
        m_timeline.play(then(s, kGreenBlue));
    } else {
        setMode(Mode::STANDBY);
        m_timeline.play(then(s, kRed));
    }
}

bool SimulatedDevice::turnOn(const std::string& channel) {
    if (!device::isKnownChannel(channel)) return false;

    std::lock_guard<Rtos::Mutex> lk(m_mtx);
    if (channel == "connect" && !m_powered) {
        m_powered = true;
        boot();
    }
    return true;
}

bool SimulatedDevice::turnOff(const std::string& channel) {
    if (!device::isKnownChannel(channel)) return false;

    std::lock_guard<Rtos::Mutex> lk(m_mtx);
    if (channel == "connect" && m_powered) {
        m_powered = false;
        m_entry.clear();
        setMode(Mode::OFF);
        m_timeline.hold(0, 0, 0);
    }
    return true;
}

bool SimulatedDevice::press(const platform::ChannelGroup& channels, int duration_ms) {
    if (duration_ms < 0 || channels.empty()) return false;
    for (const auto& ch : channels) {
        if (!device::isKnownChannel(ch)) return false;
    }
    Rtos::SleepMs(duration_ms);
    onRelease(channels);
    return true;
}

bool SimulatedDevice::sequence(const std::vector<platform::ChannelGroup>& items, int press_ms, int pause_ms) {
    if (press_ms < 0 || pause_ms < 0) return false;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (!press(items[i], press_ms)) return false;
        if (i + 1 < items.size()) Rtos::SleepMs(pause_ms);
    }
    return true;
}

void SimulatedDevice::onRelease(const platform::ChannelGroup& channels) {
    std::lock_guard<Rtos::Mutex> lk(m_mtx);
    if (!m_powered || m_mode == Mode::OFF) return;

    if (channels.size() == 2 && channels[0] == "unlock" && channels[1] == "key9") {
        if (m_mode == Mode::OOB || m_mode == Mode::ADMIN) {
            m_entry.clear();
            setMode(Mode::ENROLL_FIRST);
            m_timeline.play({}, kGreenBlueBlink);
        }
        return;
    }
    if (channels.size() != 1) return;

    const std::string& key = channels.front();
    if (key == "unlock") {
        submit();
    } else if (key == "lock") {
        if (m_mode == Mode::ADMIN || m_mode == Mode::UNLOCKED) {
            setMode(Mode::STANDBY);
            m_timeline.play({kRed});
        } else if (m_mode == Mode::ENROLL_FIRST || m_mode == Mode::ENROLL_CONFIRM) {
            setMode(m_admin.empty() ? Mode::OOB : Mode::ADMIN);
            m_timeline.play({m_admin.empty() ? kGreenBlue : kBlue});
        }
        m_entry.clear();
    } else if (key.compare(0, 3, "key") == 0) {
        m_entry.push_back(key);
    }
}

void SimulatedDevice::submit() {
    const device::Pin entry = m_entry;
    m_entry.clear();
    if (entry.empty()) return;

    switch (m_mode) {
        case Mode::ENROLL_FIRST:
            m_first = entry;
            setMode(Mode::ENROLL_CONFIRM);
            m_timeline.play(kAccept, kGreenBlueBlink);
            break;

        case Mode::ENROLL_CONFIRM:
            if (entry == m_first && m_fault != Fault::REJECT_CONFIRM) {
                m_admin = entry;
                setMode(Mode::ADMIN);
                m_timeline.play({{0, 1, 0, 0.8}, kBlue});
            } else {
                setMode(m_admin.empty() ? Mode::OOB : Mode::ADMIN);
                m_timeline.play(then(kReject, m_admin.empty() ? kGreenBlue : kBlue));
            }
            m_first.clear();
            break;

        case Mode::STANDBY:
            if (entry == m_admin) {
                setMode(Mode::UNLOCKED);
                m_timeline.play(then(kEnumLegacy, kGreen));
            } else {
                m_timeline.play(then(kReject, kRed));
            }
            break;

        default:
            break;
    }
}

} // namespace sim
