#include "platform/linux/SysfsEnumerationProbe.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

#include "os/rtos.hpp"

namespace fs = std::filesystem;

namespace {

std::string readLine(const fs::path& p) {
    std::ifstream in(p);
    std::string s;
    if (in) std::getline(in, s);
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) s.pop_back();
    return s;
}

} // namespace

namespace platform {

const char* SysfsEnumerationProbe::StatusStr(Status s) {
    switch (s) {
        case Status::OK: return "OK";
        case Status::NO_USB_ROOT: return "NO_USB_ROOT";
        case Status::NOT_FOUND: return "NOT_FOUND";
        case Status::NO_BLOCK_DEVICE: return "NO_BLOCK_DEVICE";
        default: return "UNKNOWN";
    }
}

SysfsEnumerationProbe::SysfsEnumerationProbe(const SysfsProbeConfig& cfg)
    : m_cfg(sanitise(cfg)) {}

bool SysfsEnumerationProbe::fail(Status s, int err) {
    m_status = s;
    m_errno = err;
    return false;
}

std::string SysfsEnumerationProbe::findDevice(const std::string& serial, std::string& found_serial) {
    std::error_code ec;
    fs::directory_iterator it(m_cfg.usb_root, ec);
    if (ec) {
        m_errno = ec.value();
        return std::string();
    }

    for (const auto& entry : it) {
        const fs::path serial_file = entry.path() / "serial";
        if (!fs::exists(serial_file, ec)) continue;

        const std::string s = readLine(serial_file);
        if (s.empty()) continue;
        if (serial.empty() || s == serial) {
            found_serial = s;
            return entry.path().string();
        }
    }
    return std::string();
}

std::string SysfsEnumerationProbe::findBlockDevice(const std::string& dev_dir) {
    std::error_code ec;
    fs::recursive_directory_iterator it(dev_dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) return std::string();

    // .../host*/target*/*/block/sdX
    for (auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec)) {
        if (ec) break;
        if (it->is_symlink(ec)) {
            it.disable_recursion_pending();
            continue;
        }
        if (it->path().filename() == "block" && it->is_directory(ec)) {
            for (const auto& blk : fs::directory_iterator(it->path(), ec)) {
                return "/dev/" + blk.path().filename().string();
            }
        }
    }
    return std::string();
}

bool SysfsEnumerationProbe::confirmEnumeration(const std::string& expected_serial,
                                               double timeout_s,
                                               bool require_disk,
                                               EnumerationResult& out) {
    m_status = Status::OK;
    m_errno = 0;

    std::error_code ec;
    const fs::file_status root = fs::status(m_cfg.usb_root, ec);
    if (ec || !fs::is_directory(root)) {
        // status() reports a missing path without setting ec
        const int err = ec ? ec.value() : (fs::exists(root) ? ENOTDIR : ENOENT);
        std::cerr << "[ENUM] " << m_cfg.usb_root << " not available: " << std::strerror(err) << "\n";
        return fail(Status::NO_USB_ROOT, err);
    }

    const double t0 = Rtos::NowSec();
    std::string dev_dir;
    std::string serial;

    do {
        dev_dir = findDevice(expected_serial, serial);
        if (!dev_dir.empty()) {
            const std::string blk = findBlockDevice(dev_dir);
            if (!blk.empty() || !require_disk) {
                out.serial = serial;
                out.disk_path = blk;
                std::cout << "[ENUM] " << serial << " enumerated"
                          << (blk.empty() ? std::string() : " as " + blk) << "\n";
                return true;
            }
        }
        Rtos::SleepMs(m_cfg.poll_ms);
    } while (Rtos::NowSec() - t0 < timeout_s);

    if (dev_dir.empty()) {
        std::cerr << "[ENUM] serial '" << expected_serial << "' not seen within " << timeout_s << "s\n";
        return fail(Status::NOT_FOUND);
    }

    // Present on the bus but no storage: still report the serial
    out.serial = serial;
    out.disk_path.clear();
    std::cerr << "[ENUM] " << serial << " present but no block device\n";
    return fail(Status::NO_BLOCK_DEVICE);
}

} // namespace platform
