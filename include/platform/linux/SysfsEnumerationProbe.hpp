#pragma once
#include <cstdint>
#include <string>

#include "platform/IEnumerationProbe.hpp"

namespace platform {

struct SysfsProbeConfig {
    const char* usb_root = "/sys/bus/usb/devices";
    int poll_ms = 250;
};

static inline SysfsProbeConfig sanitise(const SysfsProbeConfig& in) {
    SysfsProbeConfig cfg = in;
    if (!cfg.usb_root) cfg.usb_root = "/sys/bus/usb/devices";
    if (cfg.poll_ms < 10) cfg.poll_ms = 10;
    return cfg;
}

// ------------------------------
// SysfsEnumerationProbe: polls sysfs for a USB device whose iSerial
// matches, then for a block device underneath it.
// ------------------------------
class SysfsEnumerationProbe : public IEnumerationProbe {
public:
    explicit SysfsEnumerationProbe(const SysfsProbeConfig& cfg = SysfsProbeConfig{});

    bool confirmEnumeration(const std::string& expected_serial,
                            double timeout_s,
                            bool require_disk,
                            EnumerationResult& out) override;

    enum class Status : uint8_t {
        OK = 0,
        NO_USB_ROOT,
        NOT_FOUND,
        NO_BLOCK_DEVICE,
    };

    static const char* StatusStr(Status s);
    Status lastStatus() const { return m_status; }
    int lastErrno() const { return m_errno; }

private:
    SysfsProbeConfig m_cfg{};
    Status m_status = Status::OK;
    int m_errno = 0;

    // Returns the sysfs device dir, empty if absent
    std::string findDevice(const std::string& serial, std::string& found_serial);
    static std::string findBlockDevice(const std::string& dev_dir);

    bool fail(Status s, int err = 0);
};

} // namespace platform
