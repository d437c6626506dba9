#include "apps/device/HardwareActions.hpp"

#include <iostream>
#include <mutex>

namespace device {

const std::map<std::string, int>& channelMap() {
    static const std::map<std::string, int> kMap = {
        {"key0", 0},  {"key1", 1},  {"key2", 2},  {"key3", 3},
        {"key4", 4},  {"key5", 5},  {"key6", 6},  {"key7", 7},
        {"key8", 8},  {"key9", 9},
        {"lock", 10}, {"unlock", 11},
        {"hold", 12}, {"connect", 13}, {"usb3", 14}, {"barcode", 15},
    };
    return kMap;
}

bool isKnownChannel(const std::string& name) {
    return channelMap().count(name) > 0;
}

const std::vector<std::string>& relayDriverNames() {
    static const std::vector<std::string> kNames = {"manual"};
    return kNames;
}

std::unique_ptr<platform::IHardwareActions> makeRelayDriver(const std::string& name) {
    if (name == "manual") return std::make_unique<DryRunHardware>(/*verbose=*/true);
    return nullptr;
}

static std::string groupStr(const platform::ChannelGroup& g) {
    if (g.size() == 1) return g.front();
    std::string s = "[";
    for (std::size_t i = 0; i < g.size(); ++i) {
        if (i) s += ",";
        s += g[i];
    }
    return s + "]";
}

// ---------------- DryRunHardware ----------------

const char* DryRunHardware::StatusStr(Status s) {
    switch (s) {
        case Status::OK: return "OK";
        case Status::UNKNOWN_CHANNEL: return "UNKNOWN_CHANNEL";
        case Status::BAD_ARGUMENT: return "BAD_ARGUMENT";
        default: return "UNKNOWN";
    }
}

DryRunHardware::DryRunHardware(bool verbose)
    : m_verbose(verbose) {
    for (const auto& kv : channelMap()) m_outputs[kv.second] = false;
}

bool DryRunHardware::fail(Status s) {
    m_status = s;
    return false;
}

bool DryRunHardware::checkGroup(const platform::ChannelGroup& channels) {
    if (channels.empty()) {
        std::cerr << "[HW] empty channel group\n";
        return fail(Status::BAD_ARGUMENT);
    }
    for (const auto& ch : channels) {
        if (!isKnownChannel(ch)) {
            std::cerr << "[HW] unknown channel '" << ch << "'\n";
            return fail(Status::UNKNOWN_CHANNEL);
        }
    }
    return true;
}

void DryRunHardware::set(const std::string& channel, bool on) {
    std::lock_guard<Rtos::Mutex> lk(m_mtx);
    m_outputs[channelMap().at(channel)] = on;
    if (on) m_history.push_back(channel);
}

bool DryRunHardware::turnOn(const std::string& channel) {
    if (!checkGroup({channel})) return false;
    set(channel, true);
    if (m_verbose) std::cout << "[HW] on  " << channel << " (ch " << channelMap().at(channel) << ")\n";
    m_status = Status::OK;
    return true;
}

bool DryRunHardware::turnOff(const std::string& channel) {
    if (!checkGroup({channel})) return false;
    set(channel, false);
    if (m_verbose) std::cout << "[HW] off " << channel << " (ch " << channelMap().at(channel) << ")\n";
    m_status = Status::OK;
    return true;
}

bool DryRunHardware::press(const platform::ChannelGroup& channels, int duration_ms) {
    if (duration_ms < 0) {
        std::cerr << "[HW] negative press duration " << duration_ms << "\n";
        return fail(Status::BAD_ARGUMENT);
    }
    if (!checkGroup(channels)) return false;

    if (m_verbose) std::cout << "[HW] press " << groupStr(channels) << " " << duration_ms << "ms\n";
    for (const auto& ch : channels) set(ch, true);
    Rtos::SleepMs(duration_ms);
    for (const auto& ch : channels) set(ch, false);

    m_status = Status::OK;
    return true;
}

bool DryRunHardware::sequence(const std::vector<platform::ChannelGroup>& items,
                              int press_ms, int pause_ms) {
    if (press_ms < 0 || pause_ms < 0) {
        std::cerr << "[HW] negative sequence timing " << press_ms << "/" << pause_ms << "\n";
        return fail(Status::BAD_ARGUMENT);
    }
    // Whole sequence is rejected before any key goes down
    for (const auto& g : items) {
        if (!checkGroup(g)) return false;
    }

    for (std::size_t i = 0; i < items.size(); ++i) {
        if (!press(items[i], press_ms)) return false;
        if (i + 1 < items.size()) Rtos::SleepMs(pause_ms);
    }
    m_status = Status::OK;
    return true;
}

bool DryRunHardware::isOn(const std::string& channel) const {
    auto it = channelMap().find(channel);
    if (it == channelMap().end()) return false;
    std::lock_guard<Rtos::Mutex> lk(m_mtx);
    auto o = m_outputs.find(it->second);
    return o != m_outputs.end() && o->second;
}

std::vector<std::string> DryRunHardware::history() const {
    std::lock_guard<Rtos::Mutex> lk(m_mtx);
    return m_history;
}

void DryRunHardware::clearHistory() {
    std::lock_guard<Rtos::Mutex> lk(m_mtx);
    m_history.clear();
}

// ---------------- OverlayHardware ----------------

OverlayHardware::OverlayHardware(platform::IHardwareActions& inner, camera::KeyOverlay& overlay)
    : m_inner(inner), m_overlay(overlay) {}

bool OverlayHardware::turnOn(const std::string& channel) {
    m_overlay.startPress(channel);
    return m_inner.turnOn(channel);
}

bool OverlayHardware::turnOff(const std::string& channel) {
    m_overlay.stopPress(channel);
    return m_inner.turnOff(channel);
}

bool OverlayHardware::press(const platform::ChannelGroup& channels, int duration_ms) {
    for (const auto& ch : channels) m_overlay.logPress(ch, duration_ms / 1000.0);
    return m_inner.press(channels, duration_ms);
}

bool OverlayHardware::sequence(const std::vector<platform::ChannelGroup>& items,
                               int press_ms, int pause_ms) {
    bool valid = press_ms >= 0 && pause_ms >= 0;
    for (const auto& g : items) {
        if (g.empty()) valid = false;
        for (const auto& ch : g) valid = valid && isKnownChannel(ch);
    }
    // Let the inner implementation reject and report it
    if (!valid) return m_inner.sequence(items, press_ms, pause_ms);

    // Overlay timers are relative to now, so each item is logged as it goes down
    for (std::size_t i = 0; i < items.size(); ++i) {
        for (const auto& ch : items[i]) m_overlay.logPress(ch, press_ms / 1000.0);
        if (!m_inner.press(items[i], press_ms)) return false;
        if (i + 1 < items.size()) Rtos::SleepMs(pause_ms);
    }
    return true;
}

} // namespace device
