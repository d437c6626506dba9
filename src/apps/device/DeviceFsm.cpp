#include "apps/device/DeviceFsm.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

#include "apps/camera/LedPatterns.hpp"
#include "apps/device/Keypad.hpp"
#include "os/rtos.hpp"

namespace device {

namespace leds = camera::leds;

namespace {

// ---------------- conditions ----------------
const Condition NOT_BATTERY{"battery == false",
    [](const DeviceUnderTest& d) { return !d.profile.battery; }};
const Condition CMFR_PENDING{"completed_cmfr == false",
    [](const DeviceUnderTest& d) { return !d.completed_cmfr; }};
const Condition BF_EXHAUSTED{"brute_force_counter_current == 0",
    [](const DeviceUnderTest& d) { return d.brute_force_counter_current == 0; }};
const Condition UFE{"user_forced_enrollment == true",
    [](const DeviceUnderTest& d) { return d.user_forced_enrollment; }};
const Condition NO_UFE{"user_forced_enrollment == false",
    [](const DeviceUnderTest& d) { return !d.user_forced_enrollment; }};
const Condition NO_ADMIN{"admin PIN not enrolled",
    [](const DeviceUnderTest& d) { return d.admin_pin.empty(); }};
const Condition HAS_ADMIN{"admin PIN enrolled",
    [](const DeviceUnderTest& d) { return !d.admin_pin.empty(); }};
const Condition NO_PROVISION_LOCK{"provision_lock == false",
    [](const DeviceUnderTest& d) { return !d.provision_lock; }};
const Condition BATTERY_NO_PROVISION_LOCK{"provision_lock == false AND battery == true",
    [](const DeviceUnderTest& d) { return !d.provision_lock && d.profile.battery; }};
const Condition HAS_USER_PIN{"user PIN(s) enrolled",
    [](const DeviceUnderTest& d) { return d.anyUserPin(); }};
const Condition FREE_USER_SLOT{"empty user slot available",
    [](const DeviceUnderTest& d) { return d.nextFreeUserSlot() != 0; }};

// Brute force trips at the halfway point and on the last attempt
bool bruteForceTrips(const DeviceUnderTest& d) {
    return d.brute_force_counter_current == d.brute_force_counter / 2 + 1 ||
           d.brute_force_counter_current == 1;
}

const Condition BF_NOT_TRIGGERED{"brute force not triggered",
    [](const DeviceUnderTest& d) { return d.brute_force_counter_current > 1 && !bruteForceTrips(d); }};
const Condition BF_TRIGGERED{"brute force triggered",
    [](const DeviceUnderTest& d) { return bruteForceTrips(d); }};
const Condition BF_HALFWAY{"brute force halfway point",
    [](const DeviceUnderTest& d) { return d.brute_force_counter_current == d.brute_force_counter / 2; }};

std::vector<platform::ChannelGroup> singles(const Pin& pin) {
    std::vector<platform::ChannelGroup> items;
    items.reserve(pin.size());
    for (const auto& k : pin) items.push_back({k});
    return items;
}

bool allDigits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

// n x (off, green) blinks echoing the enrolled brute force limit
msg::Pattern counterFeedback(int n) {
    msg::Pattern p;
    for (int i = 0; i < n; ++i) {
        p.push_back({{{"red", 0}, {"green", 0}, {"blue", 0}}, 0.00, 3.0});
        p.push_back({{{"red", 0}, {"green", 1}, {"blue", 0}}, 0.01, 1.0});
    }
    return p;
}

} // namespace

bool Transition::from(DeviceState s) const {
    if (sources.empty()) return true;
    for (auto src : sources) {
        if (src == s) return true;
    }
    return false;
}

const char* DeviceFsm::StatusStr(Status s) {
    switch (s) {
        case Status::OK: return "OK";
        case Status::NOT_ALLOWED: return "NOT_ALLOWED";
        case Status::NO_TRANSITION: return "NO_TRANSITION";
        case Status::GUARD_FAILED: return "GUARD_FAILED";
        case Status::ACTION_FAILED: return "ACTION_FAILED";
        case Status::BAD_ARGUMENT: return "BAD_ARGUMENT";
        case Status::REENTRANT: return "REENTRANT";
        default: return "UNKNOWN";
    }
}

DeviceFsm::DeviceFsm(DeviceUnderTest& dut,
                     platform::IHardwareActions& hw,
                     camera::LedChecker& checker,
                     const FsmConfig& cfg,
                     platform::IEnumerationProbe* probe,
                     camera::InstantReplay* replay)
    : m_dut(dut), m_hw(hw), m_checker(checker), m_cfg(sanitise(cfg)), m_probe(probe) {
    buildTable();
    if (replay) replay->setKeypadLayout(keypadLayoutFor(m_dut.profile));
    std::cout << "[FSM] initialised in " << getStateName() << " (" << m_table.size() << " transitions)\n";
}

// ------------------------------
// Transition table
// ------------------------------
void DeviceFsm::buildTable() {
    using S = DeviceState;
    using T = DeviceTrigger;
    using DF = DeviceFsm;

    m_table = {
        // Power. Rows for one trigger are tried in order.
        {T::POWER_ON, {S::OFF}, S::POWER_ON_SELF_TEST, {NOT_BATTERY}, Guarded{&DF::doPowerOn}},
        {T::POWER_ON, {S::OFF}, S::FACTORY, {CMFR_PENDING}, Guarded{&DF::doPowerOn}},
        {T::POWER_ON, {S::OFF}, S::BRUTE_FORCE, {BF_EXHAUSTED}, Guarded{&DF::doPowerOn}},
        {T::POWER_ON, {S::OFF}, S::USER_FORCED_ENROLLMENT, {UFE}, Guarded{&DF::doPowerOn}},
        {T::POWER_ON, {S::OFF}, S::OUT_OF_BOX, {NO_ADMIN}, Guarded{&DF::doPowerOn}},
        {T::POWER_ON, {S::OFF}, S::STANDBY, {HAS_ADMIN}, Guarded{&DF::doPowerOn}},
        {T::POWER_OFF, {}, S::OFF, {}, Plain{&DF::doPowerOff}},

        {T::USER_RESET, {S::OFF}, S::OUT_OF_BOX, {BATTERY_NO_PROVISION_LOCK}, Guarded{&DF::doUserReset}},
        {T::MANUFACTURER_RESET, {S::OFF}, S::OUT_OF_BOX, {BATTERY_NO_PROVISION_LOCK}, Guarded{&DF::doManufacturerReset}},

        // Self test outcome
        {T::POST_PASS, {S::POWER_ON_SELF_TEST}, S::FACTORY, {CMFR_PENDING}, Plain{}},
        {T::POST_PASS, {S::POWER_ON_SELF_TEST}, S::BRUTE_FORCE, {BF_EXHAUSTED}, Plain{}},
        {T::POST_PASS, {S::POWER_ON_SELF_TEST}, S::USER_FORCED_ENROLLMENT, {UFE}, Plain{}},
        {T::POST_PASS, {S::POWER_ON_SELF_TEST}, S::OUT_OF_BOX, {NO_ADMIN}, Plain{}},
        {T::POST_PASS, {S::POWER_ON_SELF_TEST}, S::STANDBY, {HAS_ADMIN}, Plain{}},

        // Manufacturer reset
        {T::MANUFACTURER_RESET, {S::FACTORY, S::OUT_OF_BOX, S::STANDBY, S::BRUTE_FORCE, S::USER_FORCED_ENROLLMENT},
            S::UNLOCKED_RESET, {}, Guarded{&DF::doManufacturerReset}},
        {T::LOCK_RESET, {S::UNLOCKED_RESET}, S::OUT_OF_BOX, {}, Plain{&DF::pressLock}},

        // Out of box
        {T::ENTER_DIAGNOSTIC_MODE, {S::OUT_OF_BOX, S::STANDBY, S::USER_FORCED_ENROLLMENT}, S::DIAGNOSTIC, {}, Plain{}},
        {T::EXIT_DIAGNOSTIC_MODE, {S::DIAGNOSTIC}, S::OUT_OF_BOX, {NO_ADMIN}, Plain{}},
        {T::EXIT_DIAGNOSTIC_MODE, {S::DIAGNOSTIC}, S::USER_FORCED_ENROLLMENT, {HAS_ADMIN, UFE}, Plain{}},
        {T::EXIT_DIAGNOSTIC_MODE, {S::DIAGNOSTIC}, S::STANDBY, {HAS_ADMIN}, Plain{}},
        {T::ENROLL_ADMIN, {S::OUT_OF_BOX, S::ADMIN}, S::PIN_ENROLLMENT, {}, Plain{&DF::initAdminEnrollment}},
        {T::USER_RESET, {S::OUT_OF_BOX, S::STANDBY, S::USER_FORCED_ENROLLMENT, S::BRUTE_FORCE},
            S::OUT_OF_BOX, {NO_PROVISION_LOCK}, Guarded{&DF::doUserReset}},
        {T::USER_RESET, {S::ADMIN}, S::OUT_OF_BOX, {}, Guarded{&DF::doUserReset}},

        // Standby / forced enrollment
        {T::ADMIN_MODE_LOGIN, {S::STANDBY, S::USER_FORCED_ENROLLMENT}, S::ADMIN, {}, Guarded{&DF::adminModeLogin}},
        {T::LOCK_ADMIN, {S::ADMIN, S::UNLOCKED_ADMIN}, S::STANDBY, {NO_UFE}, Plain{&DF::pressLock}},
        {T::LOCK_ADMIN, {S::ADMIN, S::UNLOCKED_ADMIN}, S::USER_FORCED_ENROLLMENT, {UFE}, Plain{&DF::pressLock}},
        {T::UNLOCK_ADMIN, {S::STANDBY, S::USER_FORCED_ENROLLMENT}, S::UNLOCKED_ADMIN, {}, Guarded{&DF::enterAdminPin}},
        {T::SELF_DESTRUCT, {S::STANDBY, S::USER_FORCED_ENROLLMENT}, S::UNLOCKED_ADMIN, {}, Guarded{&DF::enterSelfDestructPin}},
        {T::UNLOCK_USER, {S::STANDBY}, S::UNLOCKED_USER, {}, Guarded{&DF::enterUserPin}},
        {T::UNLOCK_USER, {S::USER_FORCED_ENROLLMENT}, S::UNLOCKED_USER, {HAS_USER_PIN}, Guarded{&DF::enterUserPin}},
        {T::LOCK_USER, {S::UNLOCKED_USER}, S::STANDBY, {NO_UFE}, Plain{&DF::pressLock}},
        {T::LOCK_USER, {S::UNLOCKED_USER}, S::USER_FORCED_ENROLLMENT, {UFE}, Plain{&DF::pressLock}},
        {T::ENROLL_USER, {S::USER_FORCED_ENROLLMENT}, S::STANDBY, {}, Guarded{&DF::forcedUserEnrollment}},
        {T::FAIL_UNLOCK, {S::STANDBY, S::USER_FORCED_ENROLLMENT}, S::STANDBY, {BF_NOT_TRIGGERED}, Guarded{&DF::enterInvalidPin}},
        {T::FAIL_UNLOCK, {S::STANDBY, S::USER_FORCED_ENROLLMENT}, S::BRUTE_FORCE, {BF_TRIGGERED}, Guarded{&DF::enterInvalidPin}},

        // Brute force
        {T::LAST_TRY_LOGIN, {S::BRUTE_FORCE}, S::STANDBY, {BF_HALFWAY}, Guarded{&DF::lastTryLogin}},
        {T::ADMIN_RECOVERY_FAILED, {S::BRUTE_FORCE}, S::BRICKED, {}, Plain{}},

        // Admin mode counters
        {T::ENROLL_BRUTE_FORCE_COUNTER, {S::ADMIN}, S::COUNTER_ENROLLMENT, {}, Plain{&DF::initBruteForceCounter}},
        {T::ENROLL_UNATTENDED_AUTO_LOCK_COUNTER, {S::ADMIN}, S::COUNTER_ENROLLMENT, {}, Plain{&DF::initUnattendedAutoLockCounter}},
        {T::ENROLL_MIN_PIN_COUNTER, {S::ADMIN}, S::COUNTER_ENROLLMENT, {}, Plain{&DF::initMinPinCounter}},
        {T::ENROLL_COUNTER, {S::COUNTER_ENROLLMENT}, S::ADMIN, {}, Plain{&DF::counterEnrollment}},
        {T::TIMEOUT_ENROLL_COUNTER, {S::COUNTER_ENROLLMENT}, S::ADMIN, {}, Plain{&DF::timeoutCounterEnrollment}},
        {T::EXIT_ENROLL_COUNTER, {S::COUNTER_ENROLLMENT}, S::ADMIN, {}, Plain{&DF::exitCounterEnrollment}},

        // Admin mode PIN enrollment
        {T::ENROLL_USER, {S::ADMIN}, S::PIN_ENROLLMENT, {FREE_USER_SLOT}, Plain{&DF::initUserEnrollment}},
        {T::ENROLL_RECOVERY, {S::ADMIN}, S::PIN_ENROLLMENT, {}, Plain{&DF::initRecoveryEnrollment}},
        {T::ENROLL_SELF_DESTRUCT, {S::ADMIN}, S::PIN_ENROLLMENT, {}, Plain{&DF::initSelfDestructEnrollment}},
        {T::ENROLL_PIN, {S::PIN_ENROLLMENT}, S::ADMIN, {}, Guarded{&DF::pinEnrollment}},
        {T::TIMEOUT_ENROLL_PIN, {S::PIN_ENROLLMENT}, S::ADMIN, {}, Plain{&DF::timeoutPinEnrollment}},
        {T::EXIT_ENROLL_PIN, {S::PIN_ENROLLMENT}, S::ADMIN, {}, Plain{&DF::exitPinEnrollment}},

        // Admin mode toggles
        {T::ENABLE_BASIC_DISK, {S::ADMIN}, S::ADMIN, {}, Plain{&DF::enableBasicDisk}},
        {T::ENABLE_REMOVABLE_MEDIA, {S::ADMIN}, S::ADMIN, {}, Plain{&DF::enableRemovableMedia}},
        {T::ENABLE_LED_FLICKER, {S::ADMIN}, S::ADMIN, {}, Plain{&DF::enableLedFlicker}},
        {T::DISABLE_LED_FLICKER, {S::ADMIN}, S::ADMIN, {}, Plain{&DF::disableLedFlicker}},
        {T::DELETE_PINS, {S::ADMIN}, S::ADMIN, {}, Plain{&DF::deletePins}},
        {T::TOGGLE_LOCK_OVERRIDE, {S::ADMIN}, S::ADMIN, {}, Plain{&DF::toggleLockOverride}},
        {T::TOGGLE_PROVISION_LOCK, {S::ADMIN}, S::ADMIN, {}, Plain{&DF::toggleProvisionLock}},
        {T::ENABLE_READ_ONLY, {S::ADMIN}, S::ADMIN, {}, Plain{&DF::enableReadOnly}},
        {T::ENABLE_READ_WRITE, {S::ADMIN}, S::ADMIN, {}, Plain{&DF::enableReadWrite}},
        {T::ENABLE_SELF_DESTRUCT, {S::ADMIN}, S::ADMIN, {}, Plain{&DF::enableSelfDestruct}},
        {T::ENABLE_USER_FORCED_ENROLLMENT, {S::ADMIN}, S::ADMIN, {}, Plain{&DF::enableUserForcedEnrollment}},
    };
}

// ------------------------------
// Driver
// ------------------------------
bool DeviceFsm::fail(Status s) {
    m_status = s;
    return false;
}

bool DeviceFsm::badArgument(const std::string& why) {
    m_last_error = why;
    std::cerr << "[FSM] bad argument: " << why << "\n";
    return fail(Status::BAD_ARGUMENT);
}

ActionResult DeviceFsm::badArgs(const std::string& why) {
    m_last_error = why;
    return ActionResult::BAD_ARGS;
}

void DeviceFsm::failure(const std::string& what) {
    std::cerr << "[FSM] FAIL: " << what << "\n";
    m_failures.push_back(what);
}

bool DeviceFsm::canFire(DeviceTrigger trigger) const {
    for (const auto& t : m_table) {
        if (t.trigger != trigger || !t.from(m_state)) continue;
        bool ok = true;
        for (const auto& c : t.conditions) {
            if (!c.test(m_dut)) { ok = false; break; }
        }
        if (ok) return true;
    }
    return false;
}

bool DeviceFsm::fire(DeviceTrigger trigger, const EventArgs& args) {
    if (m_in_transition) {
        std::cerr << "[FSM] '" << triggerName(trigger) << "' fired from inside a transition callback\n";
        return fail(Status::REENTRANT);
    }

    const bool changed = fireOne(trigger, args);

    // Outcome of the caller's trigger, not of whatever followed it
    const Status status = m_status;
    const std::string err = m_last_error;
    drainFollowUps();
    m_status = status;
    m_last_error = err;

    return changed;
}

void DeviceFsm::drainFollowUps() {
    while (!m_followups.empty()) {
        std::function<void()> fn = std::move(m_followups.front());
        m_followups.pop_front();
        fn();
    }
}

bool DeviceFsm::fireOne(DeviceTrigger trigger, const EventArgs& args) {
    m_last_error.clear();

    const Transition* row = nullptr;
    bool valid_from_here = false;
    for (const auto& t : m_table) {
        if (t.trigger != trigger || !t.from(m_state)) continue;
        valid_from_here = true;

        bool ok = true;
        for (const auto& c : t.conditions) {
            if (!c.test(m_dut)) { ok = false; break; }
        }
        if (ok) { row = &t; break; }
    }

    if (!valid_from_here) {
        std::cerr << "[FSM] '" << triggerName(trigger) << "' not allowed in " << getStateName() << "\n";
        return fail(Status::NOT_ALLOWED);
    }
    if (!row) {
        std::cerr << "[FSM] '" << triggerName(trigger) << "' in " << getStateName()
                  << ": no transition whose conditions hold\n";
        return fail(Status::NO_TRANSITION);
    }

    const DeviceState src = m_state;
    const DeviceState dst = row->dest;

    m_in_transition = true;
    m_trigger = trigger;
    m_ctx.current_state = stateName(src);
    m_ctx.destination_state = stateName(dst);

    ActionResult result = ActionResult::PASS;
    bool gating = false;
    if (const Guarded* g = std::get_if<Guarded>(&row->action)) {
        gating = true;
        result = (this->*(g->run))(args);
    } else if (const Plain* p = std::get_if<Plain>(&row->action)) {
        if (p->run) result = (this->*(p->run))(args);
    }

    if (result == ActionResult::BAD_ARGS) {
        m_in_transition = false;
        std::cerr << "[FSM] '" << triggerName(trigger) << "' aborted: " << m_last_error << "\n";
        return fail(Status::BAD_ARGUMENT);
    }
    if (gating && result == ActionResult::FAIL) {
        m_in_transition = false;
        std::cerr << "[FSM] '" << triggerName(trigger) << "' blocked, staying in " << getStateName() << "\n";
        return fail(Status::GUARD_FAILED);
    }

    m_source = src;
    m_state = dst;
    std::cout << "[FSM] State changed: " << stateName(src) << " -> " << stateName(dst)
              << " (Event: " << triggerName(trigger) << ")\n";

    onEnter(dst);

    m_in_transition = false;
    m_status = result == ActionResult::FAIL ? Status::ACTION_FAILED : Status::OK;
    return true;
}

// ------------------------------
// Helpers
// ------------------------------
void DeviceFsm::sleepS(double s) {
    if (s > 0.0) Rtos::SleepMs(static_cast<int>(s * 1000.0));
}

bool DeviceFsm::on(const std::string& ch) {
    if (m_hw.turnOn(ch)) return true;
    failure("hardware: turn on '" + ch + "' failed");
    return false;
}

bool DeviceFsm::off(const std::string& ch) {
    if (m_hw.turnOff(ch)) return true;
    failure("hardware: turn off '" + ch + "' failed");
    return false;
}

bool DeviceFsm::press(const platform::ChannelGroup& channels, int duration_ms) {
    if (m_hw.press(channels, duration_ms)) return true;
    failure("hardware: press failed");
    return false;
}

bool DeviceFsm::keys(const std::vector<platform::ChannelGroup>& items, int press_ms, int pause_ms) {
    if (m_hw.sequence(items, press_ms, pause_ms)) return true;
    failure("hardware: key sequence failed");
    return false;
}

bool DeviceFsm::enterPin(const Pin& pin) {
    std::vector<platform::ChannelGroup> items = singles(pin);
    items.push_back({"unlock"});
    return keys(items);
}

camera::CheckOptions DeviceFsm::opts(bool clear_buffer) const {
    camera::CheckOptions o;
    o.clear_buffer = clear_buffer;
    o.context = m_ctx;
    return o;
}

bool DeviceFsm::solid(const msg::LedState& s, double min_hold_s, double timeout_s, bool clear_buffer) {
    return m_checker.confirmSolid(s, min_hold_s, timeout_s, opts(clear_buffer)).ok;
}

bool DeviceFsm::await(const msg::LedState& s, double timeout_s, bool clear_buffer) {
    return m_checker.awaitState(s, timeout_s, opts(clear_buffer)).ok;
}

bool DeviceFsm::pattern(const msg::Pattern& p, bool clear_buffer) {
    return m_checker.confirmPattern(p, opts(clear_buffer)).ok;
}

bool DeviceFsm::awaitPattern(const msg::Pattern& p, double timeout_s, bool clear_buffer) {
    return m_checker.awaitThenConfirmPattern(p, timeout_s, opts(clear_buffer)).ok;
}

// ------------------------------
// On-enter verification
// ------------------------------
void DeviceFsm::recordEnumeration(bool require_disk) {
    if (!m_probe) {
        std::cout << "[FSM] no enumeration probe, skipping host check in " << getStateName() << "\n";
        return;
    }

    platform::EnumerationResult r;
    if (!m_probe->confirmEnumeration(m_dut.scanned_serial, m_cfg.enum_timeout_s, require_disk, r)) {
        failure("Device with serial '" + m_dut.scanned_serial + "' did not enumerate correctly in " +
                getStateName());
        return;
    }

    m_dut.serial_number = r.serial;
    if (!r.disk_path.empty()) m_dut.disk_path = r.disk_path;
    std::cout << "[FSM] enumeration confirmed for S/N " << m_dut.serial_number << "\n";
}

void DeviceFsm::onEnter(DeviceState state) {
    switch (state) {
        case DeviceState::OFF: {
            // Relays may still be closed after an aborted sequence
            off("usb3");
            off("connect");
            if (solid(leds::ALL_OFF, 1.0, m_dut.profile.battery ? 20.0 : 3.0)) {
                std::cout << "[FSM] device is confirmed OFF\n";
            } else {
                failure("Failed to confirm device LEDs are OFF");
            }
            break;
        }

        case DeviceState::POWER_ON_SELF_TEST: {
            std::cout << "[FSM] confirming POST result...\n";
            if (!awaitPattern(leds::ACCEPT_PATTERN, 5.0)) {
                failure("Did not observe ACCEPT_PATTERN. POST failed.");
            } else {
                post([this] { fire(DeviceTrigger::POST_PASS); });
            }
            break;
        }

        case DeviceState::FACTORY: {
            std::cout << "[FSM] confirming factory mode (solid red/green/blue)...\n";
            if (!solid(leds::ALL_ON, 3.0, 10.0)) {
                failure("Failed to confirm FACTORY LEDs");
                break;
            }
            for (const auto& key : keypadTestOrder(m_dut.profile)) {
                if (!on(key)) break;
                if (!await(leds::ACCEPT_STATE, 1.0, false)) failure("Failed '" + key + "' confirmation");
                off(key);
            }
            break;
        }

        case DeviceState::OUT_OF_BOX: {
            std::cout << "[FSM] confirming OOB mode (solid green/blue)...\n";
            const msg::LedState& expected =
                m_dut.profile.battery ? leds::GREEN_BLUE_BATTERY_STATE : leds::GREEN_BLUE_STATE;
            if (solid(expected, 3.0, 10.0)) {
                std::cout << "[FSM] stable OUT_OF_BOX confirmed\n";
            } else {
                m_dut.completed_cmfr = false;
                failure("Failed to confirm OOB mode LED pattern");
                if (m_dut.needs_block_orientation) post([this] { orientForBlock(); });
            }
            recordEnumeration(false);
            break;
        }

        case DeviceState::USER_FORCED_ENROLLMENT: {
            if (solid(leds::GREEN_BLUE_STATE, 3.0, 10.0)) {
                std::cout << "[FSM] stable USER_FORCED_ENROLLMENT confirmed\n";
            } else {
                failure("Failed to confirm USER_FORCED_ENROLLMENT LEDs");
            }
            break;
        }

        case DeviceState::STANDBY: {
            if (solid(leds::STANDBY_MODE, 2.5, 15.0)) {
                std::cout << "[FSM] stable STANDBY confirmed\n";
            } else {
                failure("Failed to confirm STANDBY LEDs");
            }
            break;
        }

        case DeviceState::ADMIN: {
            if (solid(leds::ADMIN_MODE, 3.0, 5.0)) {
                std::cout << "[FSM] stable ADMIN confirmed\n";
            } else {
                failure("Failed to confirm stable ADMIN LEDs");
            }
            break;
        }

        case DeviceState::UNLOCKED_ADMIN:
        case DeviceState::UNLOCKED_USER:
            recordEnumeration(true);
            break;

        case DeviceState::UNLOCKED_RESET: {
            if (!awaitPattern(leds::ENUM, 15.0)) failure("Failed manufacturer reset unlock LED pattern");
            recordEnumeration(true);
            break;
        }

        case DeviceState::BRUTE_FORCE: {
            if (pattern(leds::BRUTE_FORCED)) {
                std::cout << "[FSM] device is in BRUTE_FORCE\n";
            } else {
                failure("Failed to confirm BRUTE_FORCE LED pattern");
            }
            break;
        }

        case DeviceState::COUNTER_ENROLLMENT: {
            if (pattern(leds::RED_COUNTER)) {
                std::cout << "[FSM] awaiting counter enrollment...\n";
            } else {
                failure("Failed to confirm RED_COUNTER LED pattern");
            }
            break;
        }

        case DeviceState::PIN_ENROLLMENT: {
            const bool sd = m_trigger == DeviceTrigger::ENROLL_SELF_DESTRUCT;
            if (awaitPattern(sd ? leds::RED_BLUE : leds::GREEN_BLUE, 5.0)) {
                std::cout << "[FSM] awaiting " << enrollmentName(m_dut.pending_enrollment) << " PIN enrollment...\n";
            } else {
                failure(sd ? "Did not observe RED_BLUE pattern" : "Did not observe GREEN_BLUE pattern");
            }
            break;
        }

        default:
            break;
    }
}

// ------------------------------
// Power
// ------------------------------
ActionResult DeviceFsm::doPowerOn(const EventArgs& a) {
    std::cout << "[FSM] powering on (usb3=" << a.usb3 << ")...\n";
    m_dut.usb3 = a.usb3;
    if (a.usb3 && !on("usb3")) return ActionResult::FAIL;
    if (!on("connect")) return ActionResult::FAIL;
    sleepS(m_cfg.power_settle_s);

    if (!m_dut.profile.battery) {
        if (!pattern(leds::RED_GREEN_BLUE)) {
            failure("Failed startup self-test LED confirmation");
            return ActionResult::FAIL;
        }
        std::cout << "[FSM] startup self-test LEDs observed\n";
    }
    return ActionResult::PASS;
}

ActionResult DeviceFsm::doPowerOff(const EventArgs&) {
    std::cout << "[FSM] powering off...\n";
    const bool a = off("usb3");
    const bool b = off("connect");
    return (a && b) ? ActionResult::PASS : ActionResult::FAIL;
}

ActionResult DeviceFsm::pressLock(const EventArgs&) {
    std::cout << "[FSM] pressing lock\n";
    return press({"lock"}) ? ActionResult::PASS : ActionResult::FAIL;
}

// ------------------------------
// Resets
// ------------------------------
ActionResult DeviceFsm::doUserReset(const EventArgs&) {
    std::cout << "[FSM] initiating user reset...\n";
    const platform::ChannelGroup combo = {"lock", "unlock", "key2"};

    if (m_state == DeviceState::ADMIN) {
        if (!keys({combo})) return ActionResult::FAIL;
    } else {
        for (const auto& k : combo) {
            if (!on(k)) return ActionResult::FAIL;
        }
        const msg::Pattern& initiate = m_dut.profile.battery ? leds::USER_RESET_KEY : leds::RED_BLUE;
        if (!awaitPattern(initiate, 15.0)) {
            for (const auto& k : combo) off(k);
            failure("Failed to observe user reset initiation pattern");
            return ActionResult::FAIL;
        }
    }

    sleepS(m_cfg.reset_hold_s);
    for (const auto& k : combo) off(k);

    if (!solid(leds::KEY_GENERATION, 8.0, 15.0)) {
        failure("Failed to observe user reset confirmation pattern");
        return ActionResult::FAIL;
    }

    std::cout << "[FSM] user reset confirmed, resetting DUT model\n";
    m_dut.reset();
    if (m_dut.orienting && !on("connect")) return ActionResult::FAIL;
    return ActionResult::PASS;
}

ActionResult DeviceFsm::doManufacturerReset(const EventArgs&) {
    if (m_state == DeviceState::FACTORY) {
        std::cout << "[FSM] initiating configuration manufacturer reset...\n";
        const DeviceProfile& p = m_dut.profile;
        auto digit = [](int d) { return platform::ChannelGroup{"key" + std::to_string(d)}; };
        if (!keys({{"lock", "key2"}, {"key3"},
                   digit(p.hardware_id_1), digit(p.hardware_id_2),
                   digit(p.model_id_1), digit(p.model_id_2)})) {
            return ActionResult::FAIL;
        }
    } else {
        std::cout << "[FSM] initiating manufacturer reset...\n";
        if (!keys({{"lock", "key2"}, {"key3"}, {"key8"}}, 100, 200)) return ActionResult::FAIL;
        Rtos::SleepMs(200);
    }
    if (!press({"lock"}, m_cfg.long_press_ms)) return ActionResult::FAIL;

    if (!awaitPattern(leds::RED_GREEN_BLUE, 7.0)) {
        failure("Failed reset ready LED confirmation");
        return ActionResult::FAIL;
    }

    // Keypad self-test: every key lights green in turn, the last one starts key generation
    const std::vector<std::string> order = keypadTestOrder(m_dut.profile);
    for (std::size_t i = 0; i + 1 < order.size(); ++i) {
        const std::string& key = order[i];
        std::cout << "[FSM] testing key: " << key << "\n";
        if (!on(key)) return ActionResult::FAIL;

        const bool ok = (i == 0) ? pattern(leds::FIRST_KEY_KEYPAD_TEST, false)
                                 : await(leds::ACCEPT_STATE, 1.0, false);
        off(key);
        if (!ok) {
            failure("Failed '" + key + "' confirmation");
            return ActionResult::FAIL;
        }
        if (!solid(leds::ALL_OFF, 0.15, 1.0, false)) failure("No gap after '" + key + "'");
    }

    std::cout << "[FSM] testing key: " << order.back() << "\n";
    if (!press({order.back()})) return ActionResult::FAIL;
    if (!solid(leds::KEY_GENERATION, 2.0, 5.0)) {
        failure("Failed encryption key confirmation");
        return ActionResult::FAIL;
    }
    if (!solid(leds::KEY_GENERATION, 6.0, 15.0)) failure("Key generation did not hold");

    m_dut.reset();
    return ActionResult::PASS;
}

// ------------------------------
// Unlocks and logins
// ------------------------------
ActionResult DeviceFsm::unlockWith(const Pin& pin, bool self_destruct, const std::string& who) {
    std::cout << "[FSM] unlocking with " << who << " PIN...\n";
    if (!enterPin(pin)) return ActionResult::FAIL;

    const msg::Pattern* expected = self_destruct ? &leds::ENUM_SELF_DESTRUCT : &leds::ENUM_LEGACY;
    double settle = 0.0;
    if (m_dut.read_only_enabled && m_dut.lock_override) {
        expected = &leds::ENUM_LOCK_OVERRIDE_READ_ONLY;
        settle = m_cfg.enum_settle_s;
    } else if (m_dut.read_only_enabled) {
        expected = &leds::ENUM_READ_ONLY;
        settle = m_cfg.enum_settle_s;
    } else if (m_dut.lock_override) {
        expected = &leds::ENUM_LOCK_OVERRIDE;
        settle = m_cfg.enum_settle_s;
    }
    sleepS(settle);

    if (!awaitPattern(*expected, 15.0)) {
        failure("Failed " + who + " unlock LED pattern");
        return ActionResult::FAIL;
    }
    return ActionResult::PASS;
}

ActionResult DeviceFsm::enterAdminPin(const EventArgs&) {
    if (m_dut.admin_pin.empty()) return badArgs("unlock_admin: no admin PIN enrolled");
    return unlockWith(m_dut.admin_pin, false, "admin");
}

ActionResult DeviceFsm::enterSelfDestructPin(const EventArgs&) {
    if (m_dut.self_destruct_pin.empty()) return badArgs("self_destruct: no self-destruct PIN enrolled");
    const ActionResult r = unlockWith(m_dut.self_destruct_pin, true, "self-destruct");
    if (r == ActionResult::PASS) {
        m_dut.selfDestruct();
        std::cout << "[DUT] self-destruct applied: " << m_dut.summary() << "\n";
    }
    return r;
}

ActionResult DeviceFsm::enterUserPin(const EventArgs& a) {
    if (a.user_id == 0) return badArgs("unlock_user requires a user_id");
    if (!m_dut.validUserSlot(a.user_id)) {
        return badArgs("unlock_user: user " + std::to_string(a.user_id) + " is not a valid slot (1.." +
                       std::to_string(m_dut.maxUsers()) + ")");
    }
    const Pin& pin = m_dut.user_pin.at(a.user_id);
    if (pin.empty()) return badArgs("unlock_user: no PIN tracked for user " + std::to_string(a.user_id));

    const ActionResult r = unlockWith(pin, false, "user " + std::to_string(a.user_id));
    if (r == ActionResult::PASS) m_dut.user_pin_enum[a.user_id] = true;
    return r;
}

ActionResult DeviceFsm::enterInvalidPin(const EventArgs& a) {
    static const Pin kDefaultInvalid = {"key9", "key9", "key9", "key9", "key9", "key9", "key9"};
    const Pin& pin = a.pin.empty() ? kDefaultInvalid : a.pin;
    std::cout << "[FSM] entering " << (a.pin.empty() ? "a guaranteed-invalid" : "a known-invalid") << " PIN...\n";

    if (!enterPin(pin)) return ActionResult::FAIL;
    if (!awaitPattern(leds::REJECT, 5.0)) {
        failure("Device did not show REJECT after invalid PIN entry");
        return ActionResult::FAIL;
    }

    if (m_dut.brute_force_counter_current > 0) --m_dut.brute_force_counter_current;
    std::cout << "[DUT] brute force counter " << m_dut.brute_force_counter_current << "/"
              << m_dut.brute_force_counter << "\n";
    return ActionResult::PASS;
}

ActionResult DeviceFsm::adminModeLogin(const EventArgs&) {
    if (m_dut.admin_pin.empty()) return badArgs("admin_mode_login: no admin PIN enrolled");

    if (!press({"key0", "unlock"}, m_cfg.long_press_ms)) return ActionResult::FAIL;
    if (!pattern(leds::RED_LOGIN)) {
        failure("Failed admin mode login LED confirmation");
        return ActionResult::FAIL;
    }
    return enterPin(m_dut.admin_pin) ? ActionResult::PASS : ActionResult::FAIL;
}

ActionResult DeviceFsm::lastTryLogin(const EventArgs&) {
    std::cout << "[FSM] entering last try login...\n";
    if (!press({"key5", "unlock"}, m_cfg.long_press_ms)) return ActionResult::FAIL;
    if (!awaitPattern(leds::RED_GREEN, 10.0)) {
        failure("Failed LASTTRY login confirmation");
        return ActionResult::FAIL;
    }
    // L-A-S-T-T-R-Y on the phone-style keypad
    return enterPin(pinFromDigits("5278879")) ? ActionResult::PASS : ActionResult::FAIL;
}

// ------------------------------
// PIN enrollment
// ------------------------------
ActionResult DeviceFsm::initAdminEnrollment(const EventArgs&) {
    std::cout << "[FSM] entering admin PIN enrollment...\n";
    if (!press({"unlock", "key9"})) return ActionResult::FAIL;
    m_dut.pending_enrollment = EnrollmentType::ADMIN;
    return ActionResult::PASS;
}

ActionResult DeviceFsm::initUserEnrollment(const EventArgs&) {
    std::cout << "[FSM] entering user PIN enrollment...\n";
    if (!press({"unlock", "key1"})) return ActionResult::FAIL;
    m_dut.pending_enrollment = EnrollmentType::USER;
    return ActionResult::PASS;
}

ActionResult DeviceFsm::initRecoveryEnrollment(const EventArgs&) {
    std::cout << "[FSM] entering recovery PIN enrollment...\n";
    if (!press({"unlock", "key7"})) return ActionResult::FAIL;
    m_dut.pending_enrollment = EnrollmentType::RECOVERY;
    return ActionResult::PASS;
}

ActionResult DeviceFsm::initSelfDestructEnrollment(const EventArgs&) {
    if (!press({"key3", "unlock"})) return ActionResult::FAIL;

    if (!m_dut.self_destruct_enabled) {
        std::cout << "[FSM] self-destruct PIN enrollment with the feature disabled, expecting REJECT\n";
        if (!awaitPattern(leds::REJECT, 5.0)) {
            failure("Did not observe REJECT for self-destruct enrollment while disabled");
            return ActionResult::FAIL;
        }
        return ActionResult::PASS;
    }
    std::cout << "[FSM] entering self-destruct PIN enrollment...\n";
    m_dut.pending_enrollment = EnrollmentType::SELF_DESTRUCT;
    return ActionResult::PASS;
}

bool DeviceFsm::enterPinTwice(const Pin& pin, const msg::Pattern& prompt, bool solid_confirm) {
    std::cout << "[FSM] entering new PIN (first time)...\n";
    if (!enterPin(pin)) return false;
    if (!awaitPattern(leds::ACCEPT_PATTERN, 5.0)) failure("Did not observe ACCEPT_PATTERN after first PIN entry");
    if (!awaitPattern(prompt, 5.0)) failure("Did not observe confirmation prompt after first PIN entry");

    std::cout << "[FSM] re-entering PIN for confirmation...\n";
    if (!enterPin(pin)) return false;

    const bool ok = solid_confirm ? solid(leds::ACCEPT_STATE, 1.0, 3.0) : await(leds::ACCEPT_STATE, 5.0);
    if (!ok) failure("Did not observe ACCEPT after PIN confirmation");
    return ok;
}

ActionResult DeviceFsm::pinEnrollment(const EventArgs& a) {
    if (a.new_pin.empty()) return badArgs("enroll_pin requires a new_pin");

    const EnrollmentType type = m_dut.pending_enrollment;
    switch (type) {
        case EnrollmentType::ADMIN: {
            if (!enterPinTwice(a.new_pin, leds::GREEN_BLUE, false)) return ActionResult::FAIL;
            m_dut.old_admin_pin = m_dut.admin_pin;
            m_dut.admin_pin = a.new_pin;
            break;
        }

        case EnrollmentType::RECOVERY:
        case EnrollmentType::USER: {
            const bool user = type == EnrollmentType::USER;
            const int slot = user ? m_dut.nextFreeUserSlot() : m_dut.nextFreeRecoverySlot();
            if (slot == 0) {
                // Firmware refuses the enrollment, the device drops back to admin mode
                std::cout << "[FSM] all " << enrollmentName(type) << " slots are full, expecting REJECT\n";
                if (!awaitPattern(leds::REJECT, 5.0)) {
                    failure(std::string("Did not observe REJECT with all ") + enrollmentName(type) + " slots full");
                }
                break;
            }
            std::cout << "[FSM] enrolling " << enrollmentName(type) << " PIN into slot " << slot << "\n";
            if (!enterPinTwice(a.new_pin, leds::GREEN_BLUE, true)) return ActionResult::FAIL;
            if (user) {
                m_dut.user_pin[slot] = a.new_pin;
            } else {
                m_dut.recovery_pin[slot] = a.new_pin;
            }
            break;
        }

        case EnrollmentType::SELF_DESTRUCT: {
            if (!enterPinTwice(a.new_pin, leds::RED_BLUE, false)) return ActionResult::FAIL;
            m_dut.old_self_destruct_pin = m_dut.self_destruct_pin;
            m_dut.self_destruct_pin = a.new_pin;
            break;
        }

        case EnrollmentType::NONE:
        default:
            return badArgs("enroll_pin: no PIN enrollment pending");
    }

    m_dut.pending_enrollment = EnrollmentType::NONE;
    std::cout << "[DUT] " << m_dut.summary() << "\n";
    return ActionResult::PASS;
}

ActionResult DeviceFsm::forcedUserEnrollment(const EventArgs& a) {
    if (a.new_pin.empty()) return badArgs("enroll_user in forced enrollment requires a new_pin");
    const int slot = m_dut.nextFreeUserSlot();
    if (slot == 0) return badArgs("enroll_user: no free user slot");

    std::cout << "[FSM] forced user enrollment into slot " << slot << "\n";
    if (!press({"unlock", "key1"})) return ActionResult::FAIL;
    if (!awaitPattern(leds::GREEN_BLUE, 5.0)) {
        failure("Did not observe GREEN_BLUE pattern for user enrollment");
        return ActionResult::FAIL;
    }
    if (!enterPinTwice(a.new_pin, leds::GREEN_BLUE, true)) return ActionResult::FAIL;

    m_dut.user_pin[slot] = a.new_pin;
    m_dut.user_forced_enrollment = false;
    m_dut.user_forced_enrollment_used = true;
    return ActionResult::PASS;
}

ActionResult DeviceFsm::timeoutPinEnrollment(const EventArgs& a) {
    std::cout << "[FSM] waiting out the " << m_cfg.enrollment_timeout_s << "s PIN enrollment window...\n";
    sleepS(m_cfg.enrollment_timeout_s);
    m_dut.pending_enrollment = EnrollmentType::NONE;

    if (a.pin_entered && !awaitPattern(leds::REJECT, 5.0)) {
        failure("Did not observe REJECT for PIN enrollment timeout with partial entry");
        return ActionResult::FAIL;
    }
    return ActionResult::PASS;
}

ActionResult DeviceFsm::exitPinEnrollment(const EventArgs& a) {
    m_dut.pending_enrollment = EnrollmentType::NONE;
    return pressLock(a);
}

// ------------------------------
// Counter enrollment
// ------------------------------
ActionResult DeviceFsm::initBruteForceCounter(const EventArgs&) {
    std::cout << "[FSM] entering brute force counter enrollment...\n";
    if (!press({"unlock", "key5"}, m_cfg.long_press_ms)) return ActionResult::FAIL;
    m_dut.pending_counter = CounterType::BRUTE_FORCE;
    return ActionResult::PASS;
}

ActionResult DeviceFsm::initMinPinCounter(const EventArgs&) {
    std::cout << "[FSM] entering minimum PIN length enrollment...\n";
    if (!press({"unlock", "key4"}, m_cfg.long_press_ms)) return ActionResult::FAIL;
    m_dut.pending_counter = CounterType::MIN_PIN;
    return ActionResult::PASS;
}

ActionResult DeviceFsm::initUnattendedAutoLockCounter(const EventArgs&) {
    std::cout << "[FSM] entering unattended auto-lock enrollment...\n";
    if (!press({"unlock", "key6"}, m_cfg.long_press_ms)) return ActionResult::FAIL;
    m_dut.pending_counter = CounterType::UNATTENDED_AUTO_LOCK;
    return ActionResult::PASS;
}

ActionResult DeviceFsm::counterEnrollment(const EventArgs& a) {
    const CounterType type = m_dut.pending_counter;
    const std::string& v = a.new_counter;

    std::size_t digits = 0;
    switch (type) {
        case CounterType::BRUTE_FORCE:
        case CounterType::MIN_PIN:
            digits = 2;
            break;
        case CounterType::UNATTENDED_AUTO_LOCK:
            digits = 1;
            break;
        case CounterType::NONE:
        default:
            return badArgs("enroll_counter: no counter enrollment pending");
    }
    if (!allDigits(v) || v.size() != digits) {
        return badArgs(std::string("enroll_counter (") + counterName(type) + ") requires " +
                       std::to_string(digits) + " digit(s), got '" + v + "'");
    }

    const int value = std::stoi(v);
    for (char c : v) {
        if (!press({std::string("key") + c})) return ActionResult::FAIL;
    }

    bool accepted = false;
    msg::Pattern expect_ok = leds::ACCEPT_PATTERN;
    switch (type) {
        case CounterType::BRUTE_FORCE:
            accepted = value >= 2 && value <= 10;
            expect_ok = counterFeedback(value);
            break;
        case CounterType::MIN_PIN:
            accepted = value >= m_dut.default_minimum_pin_counter && value <= m_dut.maximum_pin_counter;
            break;
        case CounterType::UNATTENDED_AUTO_LOCK:
            accepted = value <= 3;
            break;
        default:
            break;
    }

    m_dut.pending_counter = CounterType::NONE;

    if (!accepted) {
        std::cout << "[FSM] " << counterName(type) << " value " << value << " out of range, expecting REJECT\n";
        if (!awaitPattern(leds::REJECT, 5.0)) {
            failure(std::string("Did not observe REJECT for invalid ") + counterName(type) + " value");
            return ActionResult::FAIL;
        }
        return ActionResult::PASS;
    }

    if (!awaitPattern(expect_ok, 5.0)) {
        failure(std::string("Did not observe acceptance feedback for ") + counterName(type) + " enrollment");
        return ActionResult::FAIL;
    }

    switch (type) {
        case CounterType::BRUTE_FORCE:
            m_dut.brute_force_counter = value;
            m_dut.brute_force_counter_current = value;
            break;
        case CounterType::MIN_PIN:
            m_dut.minimum_pin_counter = value;
            break;
        case CounterType::UNATTENDED_AUTO_LOCK:
            m_dut.unattended_auto_lock_counter = value;
            break;
        default:
            break;
    }
    std::cout << "[DUT] " << counterName(type) << " set to " << value << "\n";
    return ActionResult::PASS;
}

ActionResult DeviceFsm::timeoutCounterEnrollment(const EventArgs& a) {
    std::cout << "[FSM] waiting out the " << m_cfg.enrollment_timeout_s << "s counter enrollment window...\n";
    sleepS(m_cfg.enrollment_timeout_s);
    m_dut.pending_counter = CounterType::NONE;

    if (a.pin_entered && !awaitPattern(leds::REJECT, 5.0)) {
        failure("Did not observe REJECT for counter enrollment timeout");
        return ActionResult::FAIL;
    }
    return ActionResult::PASS;
}

ActionResult DeviceFsm::exitCounterEnrollment(const EventArgs& a) {
    m_dut.pending_counter = CounterType::NONE;
    return pressLock(a);
}

// ------------------------------
// Admin mode toggles
// ------------------------------
bool DeviceFsm::adminToggle(const platform::ChannelGroup& combo, bool expect_reject, const char* what) {
    std::cout << "[FSM] " << what << (expect_reject ? " (expecting REJECT)" : "") << "...\n";
    if (!press(combo)) return false;

    const msg::Pattern& expected = expect_reject ? leds::REJECT : leds::ACCEPT_PATTERN;
    if (!awaitPattern(expected, 5.0)) {
        failure(std::string("Did not observe ") + (expect_reject ? "REJECT" : "ACCEPT_PATTERN") + " for " + what);
        return false;
    }
    return true;
}

ActionResult DeviceFsm::enableBasicDisk(const EventArgs&) {
    if (!adminToggle({"key2", "key3"}, false, "basic disk")) return ActionResult::FAIL;
    m_dut.basic_disk = true;
    m_dut.removable_media = false;
    return ActionResult::PASS;
}

ActionResult DeviceFsm::enableRemovableMedia(const EventArgs&) {
    if (!adminToggle({"key3", "key7"}, false, "removable media")) return ActionResult::FAIL;
    m_dut.removable_media = true;
    m_dut.basic_disk = false;
    return ActionResult::PASS;
}

ActionResult DeviceFsm::enableLedFlicker(const EventArgs&) {
    if (!adminToggle({"key0", "key3"}, false, "enable LED flicker")) return ActionResult::FAIL;
    m_dut.led_flicker = true;
    return ActionResult::PASS;
}

ActionResult DeviceFsm::disableLedFlicker(const EventArgs&) {
    if (!adminToggle({"key0", "key3"}, false, "disable LED flicker")) return ActionResult::FAIL;
    m_dut.led_flicker = false;
    return ActionResult::PASS;
}

ActionResult DeviceFsm::toggleLockOverride(const EventArgs&) {
    if (!adminToggle({"key0", "key3"}, false, "lock override")) return ActionResult::FAIL;
    m_dut.lock_override = !m_dut.lock_override;
    std::cout << "[DUT] lock override: " << m_dut.lock_override << "\n";
    return ActionResult::PASS;
}

ActionResult DeviceFsm::toggleProvisionLock(const EventArgs&) {
    // Mutually exclusive with self-destruct
    const bool reject = m_dut.self_destruct_enabled;
    if (!adminToggle({"key2", "key5"}, reject, "provision lock")) return ActionResult::FAIL;
    if (!reject) m_dut.provision_lock = !m_dut.provision_lock;
    return ActionResult::PASS;
}

ActionResult DeviceFsm::enableReadOnly(const EventArgs&) {
    if (!adminToggle({"key6", "key7"}, false, "read-only")) return ActionResult::FAIL;
    m_dut.read_only_enabled = true;
    return ActionResult::PASS;
}

ActionResult DeviceFsm::enableReadWrite(const EventArgs&) {
    if (!adminToggle({"key7", "key9"}, false, "read-write")) return ActionResult::FAIL;
    m_dut.read_only_enabled = false;
    return ActionResult::PASS;
}

ActionResult DeviceFsm::enableSelfDestruct(const EventArgs&) {
    const bool reject = m_dut.provision_lock;
    if (!adminToggle({"key4", "key7"}, reject, "self-destruct")) return ActionResult::FAIL;
    if (!reject) m_dut.self_destruct_enabled = true;
    return ActionResult::PASS;
}

ActionResult DeviceFsm::enableUserForcedEnrollment(const EventArgs&) {
    // One-way: a second attempt is rejected
    const bool reject = m_dut.user_forced_enrollment;
    if (!adminToggle({"key0", "key1"}, reject, "user-forced enrollment")) return ActionResult::FAIL;
    if (!reject) m_dut.user_forced_enrollment = true;
    return ActionResult::PASS;
}

ActionResult DeviceFsm::deletePins(const EventArgs&) {
    if (m_dut.user_forced_enrollment) {
        std::cout << "[FSM] delete PINs unavailable with user-forced enrollment set\n";
        return ActionResult::PASS;
    }

    std::cout << "[FSM] deleting PINs...\n";
    if (!press({"key7", "key8"}, m_cfg.long_press_ms)) return ActionResult::FAIL;
    if (!awaitPattern(leds::ACCEPT_PATTERN, 5.0)) {
        failure("Did not observe ACCEPT_PATTERN for delete PINs");
        return ActionResult::FAIL;
    }
    if (!awaitPattern(leds::RED_BLUE, 5.0)) {
        failure("Did not observe RED_BLUE for delete PINs initiation");
        return ActionResult::FAIL;
    }
    if (!press({"key7", "key8"}, m_cfg.long_press_ms)) return ActionResult::FAIL;
    if (!solid(leds::ACCEPT_STATE, 1.0, 3.0)) {
        failure("Did not observe final ACCEPT for delete PINs");
        return ActionResult::FAIL;
    }

    m_dut.deletePins();
    std::cout << "[DUT] PINs deleted: " << m_dut.summary() << "\n";
    return ActionResult::PASS;
}

// ------------------------------
// High-level helpers
// ------------------------------
bool DeviceFsm::enrollAdminPin(const Pin& pin) {
    std::cout << "[FSM] --- admin PIN enrollment ---\n";
    if (m_state != DeviceState::OUT_OF_BOX && m_state != DeviceState::ADMIN) {
        return badArgument(std::string("cannot enroll admin PIN from ") + getStateName());
    }
    if (pin.empty()) return badArgument("admin PIN is empty");
    if (!fire(DeviceTrigger::ENROLL_ADMIN)) return false;

    EventArgs a;
    a.new_pin = pin;
    return fire(DeviceTrigger::ENROLL_PIN, a);
}

bool DeviceFsm::enrollUserPin(const Pin& pin) {
    std::cout << "[FSM] --- user PIN enrollment ---\n";
    if (m_state != DeviceState::ADMIN) {
        return badArgument(std::string("cannot enroll user PIN from ") + getStateName());
    }
    if (m_dut.nextFreeUserSlot() == 0) return badArgument("no available user slots");
    if (pin.empty()) return badArgument("user PIN is empty");
    if (!fire(DeviceTrigger::ENROLL_USER)) return false;

    EventArgs a;
    a.new_pin = pin;
    return fire(DeviceTrigger::ENROLL_PIN, a);
}

bool DeviceFsm::enrollRecoveryPin(const Pin& pin) {
    std::cout << "[FSM] --- recovery PIN enrollment ---\n";
    if (m_state != DeviceState::ADMIN) {
        return badArgument(std::string("cannot enroll recovery PIN from ") + getStateName());
    }
    if (m_dut.nextFreeRecoverySlot() == 0) return badArgument("no available recovery slots");
    if (pin.empty()) return badArgument("recovery PIN is empty");
    if (!fire(DeviceTrigger::ENROLL_RECOVERY)) return false;

    EventArgs a;
    a.new_pin = pin;
    return fire(DeviceTrigger::ENROLL_PIN, a);
}

bool DeviceFsm::enrollSelfDestructPin(const Pin& pin) {
    std::cout << "[FSM] --- self-destruct PIN enrollment ---\n";
    if (m_state != DeviceState::ADMIN) {
        return badArgument(std::string("cannot enroll self-destruct PIN from ") + getStateName());
    }
    if (pin.empty()) return badArgument("self-destruct PIN is empty");
    if (!fire(DeviceTrigger::ENROLL_SELF_DESTRUCT)) return false;

    EventArgs a;
    a.new_pin = pin;
    return fire(DeviceTrigger::ENROLL_PIN, a);
}

bool DeviceFsm::orientForBlock(bool usb3, int retries, double retry_delay_s) {
    if (retries < 0) retries = m_cfg.orient_retries;
    if (retry_delay_s < 0.0) retry_delay_s = m_cfg.orient_retry_delay_s;

    m_dut.orienting = true;
    m_dut.needs_block_orientation = false;
    std::cout << "[FSM] === orienting to OUT_OF_BOX from " << getStateName() << " ===\n";

    EventArgs a;
    a.usb3 = usb3;
    const int attempts = retries + 1;
    for (int i = 1; i <= attempts; ++i) {
        std::cout << "[FSM] orientation attempt " << i << "/" << attempts << " (usb3=" << usb3 << ")\n";

        bool ok = false;
        if (m_dut.provision_lock) {
            ok = fire(DeviceTrigger::MANUFACTURER_RESET, a) && fire(DeviceTrigger::LOCK_RESET, a);
        } else {
            ok = fire(DeviceTrigger::USER_RESET, a);
        }
        if (ok && m_state == DeviceState::OUT_OF_BOX) {
            m_dut.orienting = false;
            std::cout << "[FSM] === orientation success ===\n";
            return true;
        }
        if (i < attempts) sleepS(retry_delay_s);
    }

    m_dut.orienting = false;
    failure("Mode orientation failed");
    return false;
}

} // namespace device
