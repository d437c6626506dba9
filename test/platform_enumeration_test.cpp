#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "os/rtos.hpp"
#include "platform/linux/SysfsEnumerationProbe.hpp"

static void printResult(const char* name, bool ok) {
    std::cout << name << ": " << (ok ? "OK" : "FAIL") << "\n";
}

namespace fs = std::filesystem;

// <root>/<dev>/serial, plus an optional SCSI block node under the device
static void makeUsbDevice(const fs::path& root, const std::string& dev, const std::string& serial,
                          const std::string& disk) {
    const fs::path dir = root / dev;
    fs::create_directories(dir);
    std::ofstream(dir / "serial") << serial << "\n";
    if (!disk.empty()) {
        fs::create_directories(dir / (dev + ":1.0") / "host3" / "target3:0:0" / "3:0:0:0" / "block" / disk);
    }
}

int main() {
    using platform::SysfsEnumerationProbe;

    std::cout << "=== platform_enumeration_test ===\n";
    bool all = true;

    const fs::path root = fs::temp_directory_path() / "platform_enumeration_test";
    std::error_code ec;
    fs::remove_all(root, ec);

    {
        std::cout << "\n[Test 1] missing sysfs root\n";
        const std::string missing = (root / "absent").string();
        platform::SysfsProbeConfig cfg;
        cfg.usb_root = missing.c_str();
        SysfsEnumerationProbe probe(cfg);

        platform::EnumerationResult out;
        const bool found = probe.confirmEnumeration("SIM0001", 0.2, false, out);
        const bool ok = !found && probe.lastStatus() == SysfsEnumerationProbe::Status::NO_USB_ROOT &&
                        probe.lastErrno() == ENOENT;
        printResult("NO_USB_ROOT with ENOENT", ok);
        all = all && ok;
    }

    makeUsbDevice(root, "1-1", "SIM0001", "sdz");
    makeUsbDevice(root, "2-1", "NODISK", "");
    const std::string root_str = root.string();

    platform::SysfsProbeConfig cfg;
    cfg.usb_root = root_str.c_str();
    cfg.poll_ms = 10;

    {
        std::cout << "\n[Test 2] device with a block node\n";
        SysfsEnumerationProbe probe(cfg);
        platform::EnumerationResult out;
        const bool found = probe.confirmEnumeration("SIM0001", 0.5, true, out);
        std::cout << "  serial " << out.serial << ", disk " << out.disk_path << "\n";

        const bool ok = found && out.serial == "SIM0001" && out.disk_path == "/dev/sdz" &&
                        probe.lastStatus() == SysfsEnumerationProbe::Status::OK && probe.lastErrno() == 0;
        printResult("serial and /dev path reported", ok);
        all = all && ok;
    }

    {
        std::cout << "\n[Test 3] serial never appears\n";
        SysfsEnumerationProbe probe(cfg);
        platform::EnumerationResult out;
        const double t0 = Rtos::NowSec();
        const bool found = probe.confirmEnumeration("OTHER", 0.3, false, out);
        const double waited = Rtos::NowSec() - t0;

        const bool ok = !found && probe.lastStatus() == SysfsEnumerationProbe::Status::NOT_FOUND &&
                        waited >= 0.25;
        printResult("NOT_FOUND after the timeout", ok);
        all = all && ok;
    }

    {
        std::cout << "\n[Test 4] device without storage\n";
        SysfsEnumerationProbe probe(cfg);
        platform::EnumerationResult locked;
        const bool need_disk = probe.confirmEnumeration("NODISK", 0.2, true, locked);
        const bool no_block = !need_disk && probe.lastStatus() == SysfsEnumerationProbe::Status::NO_BLOCK_DEVICE &&
                              locked.serial == "NODISK" && locked.disk_path.empty();

        platform::EnumerationResult any;
        const bool bus_only = probe.confirmEnumeration("NODISK", 0.2, false, any) &&
                              any.serial == "NODISK" && any.disk_path.empty();

        printResult("disk required -> NO_BLOCK_DEVICE, serial kept", no_block);
        printResult("bus presence enough when no disk is required", bus_only);
        all = all && no_block && bus_only;
    }

    fs::remove_all(root, ec);

    if (!all) {
        std::cout << "\nplatform_enumeration_test: FAIL\n";
        return 1;
    }
    std::cout << "\nplatform_enumeration_test: PASS\n";
    return 0;
}
