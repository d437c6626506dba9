#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "apps/camera/KeyOverlay.hpp"
#include "os/rtos.hpp"
#include "platform/IHardwareActions.hpp"

namespace device {

// Logical channel name -> physical relay output
const std::map<std::string, int>& channelMap();

bool isKnownChannel(const std::string& name);

// Relay backends this build can drive. "manual" logs every action for an
// operator at the bench; no relay board driver is linked in.
const std::vector<std::string>& relayDriverNames();

// nullptr for an unknown name
std::unique_ptr<platform::IHardwareActions> makeRelayDriver(const std::string& name);

// ------------------------------
// DryRunHardware: resolves channels and keeps relay state in memory,
// sleeping for press/pause times so timing matches the real rig.
// ------------------------------
class DryRunHardware : public platform::IHardwareActions {
public:
    explicit DryRunHardware(bool verbose = true);

    bool turnOn(const std::string& channel) override;
    bool turnOff(const std::string& channel) override;
    bool press(const platform::ChannelGroup& channels, int duration_ms = 100) override;
    bool sequence(const std::vector<platform::ChannelGroup>& items,
                  int press_ms = 100, int pause_ms = 100) override;

    bool isOn(const std::string& channel) const;

    // Every channel that went down, in order
    std::vector<std::string> history() const;
    void clearHistory();

    enum class Status : uint8_t {
        OK = 0,
        UNKNOWN_CHANNEL,
        BAD_ARGUMENT,
    };

    static const char* StatusStr(Status s);
    Status lastStatus() const { return m_status; }

private:
    bool m_verbose = true;

    mutable Rtos::Mutex m_mtx;
    std::map<int, bool> m_outputs;
    std::vector<std::string> m_history;

    Status m_status = Status::OK;

    bool fail(Status s);
    bool checkGroup(const platform::ChannelGroup& channels);
    void set(const std::string& channel, bool on);
};

// ------------------------------
// OverlayHardware: forwards to another IHardwareActions and mirrors every
// action into the replay key overlay.
// ------------------------------
class OverlayHardware : public platform::IHardwareActions {
public:
    OverlayHardware(platform::IHardwareActions& inner, camera::KeyOverlay& overlay);

    bool turnOn(const std::string& channel) override;
    bool turnOff(const std::string& channel) override;
    bool press(const platform::ChannelGroup& channels, int duration_ms = 100) override;
    bool sequence(const std::vector<platform::ChannelGroup>& items,
                  int press_ms = 100, int pause_ms = 100) override;

private:
    platform::IHardwareActions& m_inner;
    camera::KeyOverlay& m_overlay;
};

} // namespace device
