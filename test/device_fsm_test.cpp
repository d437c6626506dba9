#include <iostream>
#include <memory>
#include <string>

#include "apps/camera/FrameCapture.hpp"
#include "apps/camera/LedChecker.hpp"
#include "apps/device/DeviceFsm.hpp"
#include "support/SimulatedDevice.hpp"

static void printResult(const char* name, bool ok) {
    std::cout << name << ": " << (ok ? "OK" : "FAIL") << "\n";
}

// Simulated device + capture + checker + FSM, wired like the runner
struct Rig {
    sim::SimulatedDevice unit;
    camera::FrameCapture capture;
    camera::LedChecker checker;
    device::DeviceUnderTest dut;
    device::DeviceFsm fsm;

    static camera::FrameCaptureConfig captureConfig() {
        camera::FrameCaptureConfig c;
        c.pre_roll_s = 1.0;
        c.warmup_frames = 2;
        return c;
    }

    static device::FsmConfig fsmConfig() {
        device::FsmConfig c;
        c.power_settle_s = 0.1;
        c.enum_settle_s = 0.0;
        c.reset_hold_s = 0.5;
        c.enrollment_timeout_s = 1.0;
        c.long_press_ms = 300;
        c.enum_timeout_s = 1.0;
        return c;
    }

    Rig()
        : unit(30.0),
          capture(unit, camera::defaultLedConfigs(), captureConfig()),
          checker(capture, camera::CheckerConfig{}),
          dut(device::DeviceProfile{}, "SIM0001"),
          fsm(dut, unit, checker, fsmConfig()) {}

    ~Rig() { capture.Stop(); }
};

static const char* statusOf(const device::DeviceFsm& fsm) {
    return device::DeviceFsm::StatusStr(fsm.lastStatus());
}

int main() {
    using device::DeviceFsm;

    std::cout << "=== device_fsm_test ===\n";
    bool all = true;

    {
        std::cout << "\n[Test 0] table covers every trigger\n";
        device::DeviceUnderTest dut;
        sim::SimulatedDevice dev;
        sim::LedTimeline dark;
        sim::ScriptedFrameSource src(dark);
        camera::FrameCapture cap(src, camera::defaultLedConfigs(), camera::FrameCaptureConfig{});
        camera::LedChecker chk(cap, camera::CheckerConfig{});
        DeviceFsm fsm(dut, dev, chk, device::FsmConfig{});

        bool covered = true;
        const int last = static_cast<int>(DeviceTrigger::DELETE_PINS);
        for (int i = 0; i <= last; ++i) {
            const auto t = static_cast<DeviceTrigger>(i);
            bool found = false;
            for (const auto& row : fsm.table()) {
                if (row.trigger == t) { found = true; break; }
            }
            if (!found) {
                std::cout << "  no row for " << triggerName(t) << "\n";
                covered = false;
            }
        }
        const bool names = std::string(DeviceFsm::StatusStr(DeviceFsm::Status::GUARD_FAILED)) == "GUARD_FAILED" &&
                           std::string(DeviceFsm::StatusStr(DeviceFsm::Status::NOT_ALLOWED)) == "NOT_ALLOWED";

        printResult("every trigger has a row", covered);
        printResult("status names", names);
        all = all && covered && names;
    }

    auto rig = std::make_unique<Rig>();
    if (!rig->capture.Start()) {
        std::cout << "capture start failed\n";
        std::cout << "\ndevice_fsm_test: FAIL\n";
        return 1;
    }
    DeviceFsm& fsm = rig->fsm;

    {
        std::cout << "\n[Test 1] triggers that cannot fire\n";
        const bool not_allowed = !fsm.fire(DeviceTrigger::LOCK_ADMIN) &&
                                 fsm.lastStatus() == DeviceFsm::Status::NOT_ALLOWED &&
                                 fsm.state() == DeviceState::OFF;
        // Valid from OFF only for battery units
        const bool no_transition = !fsm.fire(DeviceTrigger::USER_RESET) &&
                                   fsm.lastStatus() == DeviceFsm::Status::NO_TRANSITION;
        const bool can = fsm.canFire(DeviceTrigger::POWER_ON) && !fsm.canFire(DeviceTrigger::LOCK_ADMIN) &&
                         !fsm.canFire(DeviceTrigger::USER_RESET);

        printResult("lock_admin from OFF -> NOT_ALLOWED", not_allowed);
        printResult("user_reset from OFF -> NO_TRANSITION", no_transition);
        printResult("canFire", can);
        all = all && not_allowed && no_transition && can;
    }

    {
        std::cout << "\n[Test 2] admin enrollment, lock, unlock, power off\n";
        bool ok = true;
        auto check = [&ok](const char* what, bool cond) {
            printResult(what, cond);
            ok = ok && cond;
        };

        check("power_on", fsm.fire(DeviceTrigger::POWER_ON));
        check("POST passed into OUT_OF_BOX", fsm.state() == DeviceState::OUT_OF_BOX);
        check("previous state is POWER_ON_SELF_TEST", fsm.previousState() == DeviceState::POWER_ON_SELF_TEST);

        const bool user_refused = !fsm.enrollUserPin(device::pinFromDigits("13572468")) &&
                                  fsm.lastStatus() == DeviceFsm::Status::BAD_ARGUMENT &&
                                  fsm.state() == DeviceState::OUT_OF_BOX;
        check("user enrollment refused outside admin mode", user_refused);

        check("enroll_admin", fsm.fire(DeviceTrigger::ENROLL_ADMIN));
        check("in PIN_ENROLLMENT", fsm.state() == DeviceState::PIN_ENROLLMENT);

        const bool no_pin = !fsm.fire(DeviceTrigger::ENROLL_PIN) &&
                            fsm.lastStatus() == DeviceFsm::Status::BAD_ARGUMENT &&
                            !fsm.lastError().empty() && fsm.state() == DeviceState::PIN_ENROLLMENT;
        check("enroll_pin without a PIN -> BAD_ARGUMENT", no_pin);

        const device::Pin pin = device::pinFromDigits("52813946");
        device::EventArgs a;
        a.new_pin = pin;
        check("enroll_pin", fsm.fire(DeviceTrigger::ENROLL_PIN, a));
        check("in ADMIN with the PIN tracked",
              fsm.state() == DeviceState::ADMIN && rig->dut.admin_pin == pin &&
              rig->unit.adminPin() == pin);

        check("lock_admin", fsm.fire(DeviceTrigger::LOCK_ADMIN) && fsm.state() == DeviceState::STANDBY);
        check("unlock_admin", fsm.fire(DeviceTrigger::UNLOCK_ADMIN) &&
                              fsm.state() == DeviceState::UNLOCKED_ADMIN &&
                              fsm.lastStatus() == DeviceFsm::Status::OK);
        check("lock_admin again", fsm.fire(DeviceTrigger::LOCK_ADMIN) && fsm.state() == DeviceState::STANDBY);
        check("power_off", fsm.fire(DeviceTrigger::POWER_OFF) && fsm.state() == DeviceState::OFF);

        for (const auto& f : fsm.failures()) std::cout << "  failure: " << f << "\n";
        check("no verification failures", fsm.failures().empty());
        all = all && ok;
    }

    rig.reset();

    {
        std::cout << "\n[Test 3] PIN confirmation rejected\n";
        Rig r;
        r.unit.setFault(sim::SimulatedDevice::Fault::REJECT_CONFIRM);
        bool ok = r.capture.Start();
        ok = ok && r.fsm.fire(DeviceTrigger::POWER_ON) && r.fsm.state() == DeviceState::OUT_OF_BOX;
        printResult("reached OUT_OF_BOX", ok);

        const bool enrolled = r.fsm.enrollAdminPin(device::pinFromDigits("52813946"));
        std::cout << "  status " << statusOf(r.fsm) << ", state " << r.fsm.getStateName() << "\n";
        const bool blocked = !enrolled && r.fsm.lastStatus() == DeviceFsm::Status::GUARD_FAILED &&
                             r.fsm.state() == DeviceState::PIN_ENROLLMENT &&
                             r.dut.admin_pin.empty() && !r.fsm.failures().empty();

        printResult("guarded enrollment blocked", blocked);
        all = all && ok && blocked;
    }

    {
        std::cout << "\n[Test 4] device that never lights\n";
        Rig r;
        r.unit.setFault(sim::SimulatedDevice::Fault::DEAD);
        const bool started = r.capture.Start();

        const bool fired = r.fsm.fire(DeviceTrigger::POWER_ON);
        std::cout << "  status " << statusOf(r.fsm) << "\n";
        const bool ok = started && !fired && r.fsm.lastStatus() == DeviceFsm::Status::GUARD_FAILED &&
                        r.fsm.state() == DeviceState::OFF;

        printResult("power_on blocked, still OFF", ok);
        all = all && ok;
    }

    if (!all) {
        std::cout << "\ndevice_fsm_test: FAIL\n";
        return 1;
    }
    std::cout << "\ndevice_fsm_test: PASS\n";
    return 0;
}
