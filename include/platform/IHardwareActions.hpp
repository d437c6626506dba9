#pragma once

#include <string>
#include <vector>

namespace platform {

// One item of a key sequence: a single channel, or several pressed together.
using ChannelGroup = std::vector<std::string>;

// Physical actuation of the device: relays behind logical channel names
// ("key0".."key9", "lock", "unlock", "connect", "usb3", ...).
class IHardwareActions {
public:
    virtual bool turnOn(const std::string& channel) = 0;
    virtual bool turnOff(const std::string& channel) = 0;

    // All channels go down together, are held for duration_ms, released together.
    virtual bool press(const ChannelGroup& channels, int duration_ms = 100) = 0;

    // Items pressed one after another; pause_ms only between items.
    virtual bool sequence(const std::vector<ChannelGroup>& items,
                          int press_ms = 100, int pause_ms = 100) = 0;

    virtual ~IHardwareActions() = default;
};

} // namespace platform
