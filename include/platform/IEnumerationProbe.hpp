#pragma once

#include <string>

namespace platform {

struct EnumerationResult {
    std::string serial;     // as reported by the USB descriptor
    std::string disk_path;  // e.g. /dev/sdb, empty if no block device yet
};

// Confirms the device enumerated on the host bus.
class IEnumerationProbe {
public:
    // expected_serial may be empty: then any device reporting a serial is accepted.
    // require_disk: the device must also expose a block device (unlocked modes).
    virtual bool confirmEnumeration(const std::string& expected_serial,
                                    double timeout_s,
                                    bool require_disk,
                                    EnumerationResult& out) = 0;
    virtual ~IEnumerationProbe() = default;
};

} // namespace platform
