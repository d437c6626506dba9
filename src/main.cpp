// Scenario runner: drives one DUT through power-on, admin enrollment,
// lock/unlock and power-off while the camera verifies every LED signature.
//
// The relay driver is picked with --relays. A run that would touch the
// device refuses to start without one.

#include <cstring>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

#include "os/rtos.hpp"

#include "apps/camera/FrameCapture.hpp"
#include "apps/camera/InstantReplay.hpp"
#include "apps/camera/KeyOverlay.hpp"
#include "apps/camera/LedChecker.hpp"
#include "apps/camera/LedConfig.hpp"

#include "apps/device/DeviceFsm.hpp"
#include "apps/device/DeviceUnderTest.hpp"
#include "apps/device/HardwareActions.hpp"
#include "apps/device/PinGenerator.hpp"

#include "platform/linux/CameraSource.hpp"
#include "platform/linux/SysfsEnumerationProbe.hpp"

struct Args {
    int camera = 0;
    std::string settings = "config/camera_settings.json";
    std::string replay_dir = "replays";
    bool replay = true;
    bool dry_run = false;    // print the plan, touch nothing
    bool battery = false;
    bool secure_key = false;
    std::string serial;
    std::string pin;         // digits; empty = generate
    std::string relays;      // relay driver name; required unless dry run
};

static void print_usage(const char* exe) {
    std::cerr
        << "Usage:\n"
        << "  " << exe << " [--camera N] [--settings FILE] [--replay-dir DIR] [--no-replay]\n"
        << "  " << std::string(std::string(exe).size(), ' ')
        << " [--dry-run] [--battery] [--secure-key] [--serial S] [--pin DIGITS]\n"
        << "  " << std::string(std::string(exe).size(), ' ') << " --relays NAME\n"
        << "\nRelay drivers:";
    for (const auto& n : device::relayDriverNames()) std::cerr << " " << n;
    std::cerr
        << "\n\nExample:\n"
        << "  " << exe << " --relays manual --camera 0 --serial 012345678901 --pin 52788791\n";
}

static bool parse_args(int argc, char** argv, Args& out) {
    // Defaults already set in Args. No args is OK.
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];

        auto need_value = [&](const char* name) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << name << "\n";
                return nullptr;
            }
            return argv[++i];
        };

        if (a == "--camera") {
            const char* v = need_value("--camera");
            if (!v) return false;
            int x = 0;
            try {
                x = std::stoi(v);
            } catch (const std::exception&) {
                std::cerr << "Invalid --camera: " << v << "\n";
                return false;
            }
            if (x < 0) {
                std::cerr << "Invalid --camera (>=0): " << x << "\n";
                return false;
            }
            out.camera = x;

        } else if (a == "--settings") {
            const char* v = need_value("--settings");
            if (!v) return false;
            out.settings = v;

        } else if (a == "--replay-dir") {
            const char* v = need_value("--replay-dir");
            if (!v) return false;
            out.replay_dir = v;

        } else if (a == "--no-replay") {
            out.replay = false;

        } else if (a == "--relays") {
            const char* v = need_value("--relays");
            if (!v) return false;
            out.relays = v;

        } else if (a == "--dry-run") {
            out.dry_run = true;

        } else if (a == "--battery") {
            out.battery = true;

        } else if (a == "--secure-key") {
            out.secure_key = true;

        } else if (a == "--serial") {
            const char* v = need_value("--serial");
            if (!v) return false;
            out.serial = v;

        } else if (a == "--pin") {
            const char* v = need_value("--pin");
            if (!v) return false;
            out.pin = v;
            for (char c : out.pin) {
                if (c < '0' || c > '9') {
                    std::cerr << "Invalid --pin (digits only): " << out.pin << "\n";
                    return false;
                }
            }

        } else if (a == "--help" || a == "-h") {
            return false; // triggers usage print in main

        } else {
            std::cerr << "Unknown arg: " << a << "\n";
            return false;
        }
    }
    return true;
}

static void print_table(const device::DeviceFsm& fsm) {
    for (const auto& t : fsm.table()) {
        std::cout << "  " << triggerName(t.trigger) << ": ";
        if (t.sources.empty()) {
            std::cout << "*";
        } else {
            for (std::size_t i = 0; i < t.sources.size(); ++i) {
                std::cout << (i ? "|" : "") << stateName(t.sources[i]);
            }
        }
        std::cout << " -> " << stateName(t.dest);
        for (const auto& c : t.conditions) std::cout << " [" << c.desc << "]";
        std::cout << (std::holds_alternative<device::Guarded>(t.action) ? " (gating)" : "") << "\n";
    }
}

// One step of the scenario; logs and reports whether the FSM landed where expected
static bool step(device::DeviceFsm& fsm, DeviceTrigger trigger, DeviceState expect,
                 const device::EventArgs& args = device::EventArgs{}) {
    std::cout << "\n[MAIN] >>> " << triggerName(trigger) << "\n";
    const bool fired = fsm.fire(trigger, args);
    const bool ok = fired && fsm.state() == expect;
    if (!ok) {
        std::cerr << "[MAIN] " << triggerName(trigger) << " ended in " << fsm.getStateName()
                  << " (" << device::DeviceFsm::StatusStr(fsm.lastStatus()) << "), expected "
                  << stateName(expect) << "\n";
    }
    return ok;
}

int main(int argc, char** argv) {
    Args args;
    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 2;
    }

    std::cout << "=== SECURE DUT HIL ===\n";

    // ---- CONFIGURATION ----
    camera::CameraSettings settings;
    if (!camera::loadCameraSettings(args.settings, settings)) {
        std::cerr << "[MAIN] continuing with default camera settings\n";
    }

    camera::LedConfigs leds = camera::defaultLedConfigs();
    camera::applyRoiOverrides(leds, settings.roi_overrides);
    std::string led_why;
    if (!camera::validateLedConfigs(leds, led_why)) {
        std::cerr << "[MAIN] LED config rejected (" << led_why << "), using the fallback LED\n";
        leds = camera::fallbackLedConfigs();
    }

    platform::CameraSourceConfig cam_cfg{};
    cam_cfg.index = args.camera;
    cam_cfg.properties = settings.properties;

    camera::FrameCaptureConfig cap_cfg{};
    camera::CheckerConfig chk_cfg{};

    camera::ReplayConfig rp_cfg{};
    rp_cfg.enabled = args.replay;
    rp_cfg.output_dir = args.replay_dir;

    camera::KeyOverlayConfig ov_cfg{};
    ov_cfg.enabled = args.replay;

    device::DeviceProfile profile{};
    profile.battery = args.battery;
    profile.secure_key = args.secure_key;
    if (args.secure_key) profile.name = "Secure Key";
    profile = device::sanitise(profile);

    device::FsmConfig fsm_cfg{};

    // ---- OBJECTS ----
    Rtos::TimerService timers;
    platform::CameraSource source(cam_cfg);
    camera::KeyOverlay overlay(timers, ov_cfg);
    camera::FrameCapture capture(source, leds, cap_cfg, &overlay);
    camera::InstantReplay replay(capture, rp_cfg);
    camera::LedChecker checker(capture, chk_cfg, args.replay ? &replay : nullptr);

    // Dry runs never press anything; the logging rig only feeds the table print
    std::unique_ptr<platform::IHardwareActions> relays =
        device::makeRelayDriver(args.dry_run ? "manual" : args.relays);
    if (!relays) {
        if (args.relays.empty()) {
            std::cerr << "[MAIN] no relay driver selected: pass --relays NAME or --dry-run\n";
        } else {
            std::cerr << "[MAIN] unknown relay driver '" << args.relays << "'\n";
        }
        print_usage(argv[0]);
        return 2;
    }
    if (!args.dry_run && args.relays == "manual") {
        std::cout << "[MAIN] relays: manual, perform each logged [HW] action on the bench\n";
    }
    device::OverlayHardware hw(*relays, overlay);
    platform::SysfsEnumerationProbe probe;

    device::DeviceUnderTest dut(profile, args.serial);
    device::DeviceFsm fsm(dut, hw, checker, fsm_cfg, &probe, args.replay ? &replay : nullptr);

    device::Pin admin_pin;
    if (!args.pin.empty()) {
        device::PinGenerator gen(dut);
        const std::string why = gen.whyInvalid(args.pin);
        if (!why.empty() || static_cast<int>(args.pin.size()) < profile.minimum_pin_length) {
            std::cerr << "[MAIN] --pin " << args.pin << " "
                      << (why.empty() ? "is shorter than the minimum PIN length" : why) << "\n";
            return 2;
        }
        admin_pin = device::pinFromDigits(args.pin);
    } else {
        device::PinGenerator gen(dut);
        device::PinInfo info;
        const int len = profile.minimum_pin_length > 8 ? profile.minimum_pin_length : 8;
        if (!gen.generateValid(len, info)) {
            std::cerr << "[MAIN] PIN generation failed: "
                      << device::PinGenerator::StatusStr(gen.lastStatus()) << "\n";
            return 1;
        }
        admin_pin = info.keys;
    }

    std::cout << "[MAIN] DUT " << dut.summary() << "\n";
    std::cout << "[MAIN] admin PIN " << device::pinToString(admin_pin) << "\n";

    if (args.dry_run) {
        std::cout << "[MAIN] dry run, transition table:\n";
        print_table(fsm);
        std::cout << "[MAIN] scenario: power_on -> enroll admin -> lock_admin -> unlock_admin"
                  << " -> lock_admin -> power_off\n";
        return 0;
    }

    if (!timers.Start()) {
        std::cerr << "[MAIN] timer service failed, key overlay disabled\n";
        overlay.setEnabled(false);
    }

    if (!capture.Start()) {
        std::cerr << "[MAIN] capture failed: " << camera::FrameCapture::StatusStr(capture.lastStatus())
                  << " (camera " << platform::CameraSource::StatusStr(source.lastStatus()) << ")\n";
        timers.Stop();
        return 1;
    }

    // ---- SCENARIO ----
    bool ok = step(fsm, DeviceTrigger::POWER_ON, DeviceState::OUT_OF_BOX);

    if (ok) {
        std::cout << "\n[MAIN] >>> enroll admin PIN\n";
        ok = fsm.enrollAdminPin(admin_pin) && fsm.state() == DeviceState::ADMIN;
        if (!ok) {
            std::cerr << "[MAIN] admin enrollment ended in " << fsm.getStateName() << " ("
                      << device::DeviceFsm::StatusStr(fsm.lastStatus()) << ") " << fsm.lastError() << "\n";
        }
    }
    if (ok) ok = step(fsm, DeviceTrigger::LOCK_ADMIN, DeviceState::STANDBY);
    if (ok) ok = step(fsm, DeviceTrigger::UNLOCK_ADMIN, DeviceState::UNLOCKED_ADMIN);
    if (ok) ok = step(fsm, DeviceTrigger::LOCK_ADMIN, DeviceState::STANDBY);

    step(fsm, DeviceTrigger::POWER_OFF, DeviceState::OFF);

    // ---- SHUTDOWN ----
    capture.Stop();
    overlay.clear();
    timers.Stop();

    std::cout << "\n[MAIN] final state " << fsm.getStateName() << ", DUT " << dut.summary() << "\n";
    if (!fsm.failures().empty()) {
        std::cout << "[MAIN] " << fsm.failures().size() << " verification failure(s):\n";
        for (const auto& f : fsm.failures()) std::cout << "  - " << f << "\n";
    }
    if (probe.lastStatus() != platform::SysfsEnumerationProbe::Status::OK) {
        std::cout << "[MAIN] last enumeration check: "
                  << platform::SysfsEnumerationProbe::StatusStr(probe.lastStatus());
        if (probe.lastErrno() != 0) std::cout << " (" << std::strerror(probe.lastErrno()) << ")";
        std::cout << "\n";
    }
    if (!replay.lastSavedPath().empty()) {
        std::cout << "[MAIN] last replay clip: " << replay.lastSavedPath() << "\n";
    }

    const bool pass = ok && fsm.failures().empty();
    std::cout << "\n[MAIN] scenario: " << (pass ? "PASS" : "FAIL") << "\n";
    return pass ? 0 : 1;
}
