#include <iostream>
#include <string>
#include <vector>

#include "apps/camera/KeyOverlay.hpp"
#include "apps/device/HardwareActions.hpp"

static void printResult(const char* name, bool ok) {
    std::cout << name << ": " << (ok ? "OK" : "FAIL") << "\n";
}

int main() {
    using namespace device;

    std::cout << "=== device_hardware_test ===\n";
    bool all = true;

    {
        std::cout << "\n[Test 1] channel map\n";
        const auto& m = channelMap();
        const bool ok = m.size() == 16 && m.at("key0") == 0 && m.at("key9") == 9 &&
                        m.at("lock") == 10 && m.at("unlock") == 11 && m.at("connect") == 13 &&
                        m.at("usb3") == 14 && isKnownChannel("barcode") && !isKnownChannel("key10");
        printResult("logical -> physical", ok);
        all = all && ok;
    }

    {
        std::cout << "\n[Test 2] on/off and errors\n";
        DryRunHardware hw(false);
        const bool on = hw.turnOn("connect") && hw.isOn("connect");
        const bool off = hw.turnOff("connect") && !hw.isOn("connect");

        const bool unknown = !hw.turnOn("key10") &&
                             hw.lastStatus() == DryRunHardware::Status::UNKNOWN_CHANNEL;
        const bool negative = !hw.press({"key1"}, -5) &&
                              hw.lastStatus() == DryRunHardware::Status::BAD_ARGUMENT;
        const bool empty = !hw.press({}, 10) &&
                           hw.lastStatus() == DryRunHardware::Status::BAD_ARGUMENT;

        printResult("turnOn/turnOff", on && off);
        printResult("unknown channel", unknown);
        printResult("negative duration", negative);
        printResult("empty group", empty);
        all = all && on && off && unknown && negative && empty;
    }

    {
        std::cout << "\n[Test 3] press and sequence\n";
        DryRunHardware hw(false);

        const double t0 = Rtos::NowSec();
        const bool pressed = hw.press({"unlock", "key9"}, 100);
        const double took = Rtos::NowSec() - t0;
        const bool released = !hw.isOn("unlock") && !hw.isOn("key9");
        const bool timed = took >= 0.09;

        hw.clearHistory();
        const bool seq = hw.sequence({{"key1"}, {"key2"}, {"unlock"}}, 10, 10);
        const std::vector<std::string> expect{"key1", "key2", "unlock"};
        const bool order = hw.history() == expect;

        hw.clearHistory();
        const bool rejected = !hw.sequence({{"key1"}, {"bogus"}, {"unlock"}}, 10, 10) &&
                              hw.lastStatus() == DryRunHardware::Status::UNKNOWN_CHANNEL &&
                              hw.history().empty();

        printResult("chord pressed and released", pressed && released);
        printResult("held for the duration", timed);
        printResult("sequence order", seq && order);
        printResult("bad sequence rejected before any press", rejected);
        all = all && pressed && released && timed && seq && order && rejected;
    }

    {
        std::cout << "\n[Test 4] overlay mirror\n";
        Rtos::TimerService timers;
        const bool started = timers.Start();

        camera::KeyOverlayConfig kcfg;
        kcfg.visual_delay_s = 0.0;
        kcfg.sustain_s = 0.05;
        camera::KeyOverlay overlay(timers, kcfg);

        DryRunHardware inner(false);
        OverlayHardware hw(inner, overlay);

        const bool on = hw.turnOn("usb3");
        Rtos::SleepMs(50);
        const bool shown = overlay.snapshot().count("usb3") == 1 && inner.isOn("usb3");
        const bool off = hw.turnOff("usb3");
        Rtos::SleepMs(150);
        const bool hidden = overlay.snapshot().count("usb3") == 0 && !inner.isOn("usb3");

        inner.clearHistory();
        const bool seq = hw.sequence({{"key4"}, {"key2"}}, 50, 50);
        const bool forwarded = inner.history() == std::vector<std::string>{"key4", "key2"};

        inner.clearHistory();
        const bool bad = !hw.sequence({{"key4"}, {"nope"}}, 50, 50) && inner.history().empty() &&
                         inner.lastStatus() == DryRunHardware::Status::UNKNOWN_CHANNEL;

        timers.Stop();

        printResult("timer service started", started);
        printResult("held channel shown while on", on && shown);
        printResult("hidden after off", off && hidden);
        printResult("sequence forwarded", seq && forwarded);
        printResult("bad sequence rejected by the inner rig", bad);
        all = all && started && on && shown && off && hidden && seq && forwarded && bad;
    }

    {
        std::cout << "\n[Test 5] relay driver selection\n";
        const auto& names = relayDriverNames();
        auto manual = makeRelayDriver("manual");
        const bool known = names.size() == 1 && names.front() == "manual" && manual != nullptr &&
                           manual->turnOn("connect") && manual->turnOff("connect");
        const bool unknown = makeRelayDriver("phidget") == nullptr && makeRelayDriver("") == nullptr;

        printResult("manual driver available", known);
        printResult("unknown or empty name -> none", unknown);
        all = all && known && unknown;
    }

    if (!all) {
        std::cout << "\ndevice_hardware_test: FAIL\n";
        return 1;
    }
    std::cout << "\ndevice_hardware_test: PASS\n";
    return 0;
}
