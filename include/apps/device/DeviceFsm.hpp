#pragma once
#include <cstdint>
#include <deque>
#include <functional>
#include <string>
#include <variant>
#include <vector>

#include "apps/camera/InstantReplay.hpp"
#include "apps/camera/LedChecker.hpp"
#include "apps/device/DeviceUnderTest.hpp"
#include "msg/LedState.hpp"
#include "platform/IEnumerationProbe.hpp"
#include "platform/IHardwareActions.hpp"
#include "types.hpp"

namespace device {

// ------------------------------
// Config
// ------------------------------
struct FsmConfig {
    double power_settle_s = 0.5;          // after connect, before the boot check
    double enum_settle_s = 10.0;          // before lock-override/read-only enumeration patterns
    double reset_hold_s = 10.0;           // reset keys held after the initiation pattern
    double enrollment_timeout_s = 30.0;   // firmware's enrollment inactivity window
    int    long_press_ms = 6000;          // hold-to-enter combinations
    double enum_timeout_s = 15.0;         // host enumeration probe

    int    orient_retries = 1;
    double orient_retry_delay_s = 3.0;
};

static inline FsmConfig sanitise(const FsmConfig& in) {
    FsmConfig c = in;
    if (c.power_settle_s < 0.0) c.power_settle_s = 0.0;
    if (c.enum_settle_s < 0.0) c.enum_settle_s = 0.0;
    if (c.reset_hold_s < 0.0) c.reset_hold_s = 0.0;
    if (c.enrollment_timeout_s < 0.0) c.enrollment_timeout_s = 0.0;
    if (c.long_press_ms < 0) c.long_press_ms = 0;
    if (c.enum_timeout_s < 0.1) c.enum_timeout_s = 0.1;
    if (c.orient_retries < 0) c.orient_retries = 0;
    if (c.orient_retry_delay_s < 0.0) c.orient_retry_delay_s = 0.0;
    return c;
}

// Per-trigger arguments; each action reads only the fields it needs.
struct EventArgs {
    bool usb3 = true;             // power_on
    int user_id = 0;              // unlock_user (1-based slot)
    Pin pin;                      // fail_unlock: known-wrong PIN, empty = default
    Pin new_pin;                  // enroll_pin, enroll_user (forced enrollment)
    std::string new_counter;      // enroll_counter, decimal digits
    bool pin_entered = false;     // timeout_enroll_*: partial entry before timeout
};

enum class ActionResult : uint8_t {
    PASS,
    FAIL,       // hardware or LED verification failed
    BAD_ARGS,   // malformed invocation, never retried
};

class DeviceFsm;

using Action = ActionResult (DeviceFsm::*)(const EventArgs&);

// Pure predicate over the DUT model
struct Condition {
    const char* desc;
    bool (*test)(const DeviceUnderTest&);
};

// Action result decides whether the transition happens.
struct Guarded {
    Action run;
};

// Action runs, the transition happens regardless; failures are recorded.
struct Plain {
    Action run = nullptr;
};

struct Transition {
    DeviceTrigger trigger;
    std::vector<DeviceState> sources;   // empty = any state
    DeviceState dest;
    std::vector<Condition> conditions;  // AND-combined
    std::variant<Guarded, Plain> action;

    bool from(DeviceState s) const;
};

// ------------------------------
// DeviceFsm: guarded model of the device's operating modes. Triggers run
// hardware sequences and LED checks; on entry to a state its LED signature
// is re-verified. Single-threaded and not re-entrant: a callback that needs
// another transition posts it and the driver fires it afterwards.
// ------------------------------
class DeviceFsm {
public:
    DeviceFsm(DeviceUnderTest& dut,
              platform::IHardwareActions& hw,
              camera::LedChecker& checker,
              const FsmConfig& cfg,
              platform::IEnumerationProbe* probe = nullptr,
              camera::InstantReplay* replay = nullptr);

    /**
     * @brief Fire a trigger from the current state.
     * Rows matching trigger and state are tried in table order; the first
     * whose conditions hold is taken. Returns true if the state changed.
     * A state change whose non-gating action failed sets ACTION_FAILED.
     */
    bool fire(DeviceTrigger trigger, const EventArgs& args = EventArgs{});

    // True if some row for trigger leaves the current state with its conditions met
    bool canFire(DeviceTrigger trigger) const;

    DeviceState state() const { return m_state; }
    DeviceState previousState() const { return m_source; }
    const char* getStateName() const { return stateName(m_state); }

    // ---------------- high-level helpers ----------------
    bool enrollAdminPin(const Pin& pin);
    bool enrollUserPin(const Pin& pin);
    bool enrollRecoveryPin(const Pin& pin);
    bool enrollSelfDestructPin(const Pin& pin);

    // Back to OUT_OF_BOX via user reset (manufacturer reset + lock_reset
    // when provision lock is set). retries < 0 -> config default.
    bool orientForBlock(bool usb3 = true, int retries = -1, double retry_delay_s = -1.0);

    // Verification failures that did not block a transition
    const std::vector<std::string>& failures() const { return m_failures; }
    void clearFailures() { m_failures.clear(); }

    const std::string& lastError() const { return m_last_error; }
    const std::vector<Transition>& table() const { return m_table; }

    enum class Status : uint8_t {
        OK = 0,
        NOT_ALLOWED,     // trigger not valid from this state
        NO_TRANSITION,   // valid from this state but no row's conditions hold
        GUARD_FAILED,    // gating action failed, state unchanged
        ACTION_FAILED,   // state changed, non-gating verification failed
        BAD_ARGUMENT,
        REENTRANT,
    };

    static const char* StatusStr(Status s);
    Status lastStatus() const { return m_status; }

private:
    DeviceUnderTest& m_dut;
    platform::IHardwareActions& m_hw;
    camera::LedChecker& m_checker;
    FsmConfig m_cfg{};
    platform::IEnumerationProbe* m_probe = nullptr;

    std::vector<Transition> m_table;

    DeviceState m_state = DeviceState::OFF;
    DeviceState m_source = DeviceState::OFF;
    DeviceTrigger m_trigger = DeviceTrigger::POWER_ON;
    camera::ReplayContext m_ctx;

    bool m_in_transition = false;
    std::deque<std::function<void()>> m_followups;

    std::vector<std::string> m_failures;
    std::string m_last_error;
    Status m_status = Status::OK;

    void buildTable();
    bool fireOne(DeviceTrigger trigger, const EventArgs& args);
    void drainFollowUps();
    void post(std::function<void()> fn) { m_followups.push_back(std::move(fn)); }

    bool fail(Status s);
    bool badArgument(const std::string& why);
    ActionResult badArgs(const std::string& why);
    void failure(const std::string& what);

    // ---------------- on-enter verification ----------------
    void onEnter(DeviceState state);
    void recordEnumeration(bool require_disk);

    // ---------------- hardware wrappers (record failures) ----------------
    bool on(const std::string& ch);
    bool off(const std::string& ch);
    bool press(const platform::ChannelGroup& channels, int duration_ms = 100);
    bool keys(const std::vector<platform::ChannelGroup>& items, int press_ms = 100, int pause_ms = 100);
    bool enterPin(const Pin& pin);   // PIN then unlock

    // ---------------- LED checks with the transition's replay context ----------------
    camera::CheckOptions opts(bool clear_buffer = true) const;
    bool solid(const msg::LedState& s, double min_hold_s, double timeout_s, bool clear_buffer = true);
    bool await(const msg::LedState& s, double timeout_s, bool clear_buffer = true);
    bool pattern(const msg::Pattern& p, bool clear_buffer = true);
    bool awaitPattern(const msg::Pattern& p, double timeout_s, bool clear_buffer = true);

    void sleepS(double s);

    // ---------------- actions ----------------
    ActionResult doPowerOn(const EventArgs& a);
    ActionResult doPowerOff(const EventArgs& a);
    ActionResult doUserReset(const EventArgs& a);
    ActionResult doManufacturerReset(const EventArgs& a);
    ActionResult pressLock(const EventArgs& a);

    ActionResult enterAdminPin(const EventArgs& a);
    ActionResult enterSelfDestructPin(const EventArgs& a);
    ActionResult enterUserPin(const EventArgs& a);
    ActionResult enterInvalidPin(const EventArgs& a);
    ActionResult unlockWith(const Pin& pin, bool self_destruct, const std::string& who);

    ActionResult adminModeLogin(const EventArgs& a);
    ActionResult lastTryLogin(const EventArgs& a);

    ActionResult initAdminEnrollment(const EventArgs& a);
    ActionResult initUserEnrollment(const EventArgs& a);
    ActionResult initRecoveryEnrollment(const EventArgs& a);
    ActionResult initSelfDestructEnrollment(const EventArgs& a);
    ActionResult forcedUserEnrollment(const EventArgs& a);
    ActionResult pinEnrollment(const EventArgs& a);
    ActionResult timeoutPinEnrollment(const EventArgs& a);
    ActionResult exitPinEnrollment(const EventArgs& a);

    ActionResult initBruteForceCounter(const EventArgs& a);
    ActionResult initUnattendedAutoLockCounter(const EventArgs& a);
    ActionResult initMinPinCounter(const EventArgs& a);
    ActionResult counterEnrollment(const EventArgs& a);
    ActionResult timeoutCounterEnrollment(const EventArgs& a);
    ActionResult exitCounterEnrollment(const EventArgs& a);

    ActionResult enableBasicDisk(const EventArgs& a);
    ActionResult enableRemovableMedia(const EventArgs& a);
    ActionResult enableLedFlicker(const EventArgs& a);
    ActionResult disableLedFlicker(const EventArgs& a);
    ActionResult toggleLockOverride(const EventArgs& a);
    ActionResult toggleProvisionLock(const EventArgs& a);
    ActionResult enableReadOnly(const EventArgs& a);
    ActionResult enableReadWrite(const EventArgs& a);
    ActionResult enableSelfDestruct(const EventArgs& a);
    ActionResult enableUserForcedEnrollment(const EventArgs& a);
    ActionResult deletePins(const EventArgs& a);

    // Press a two-key admin combination, expect ACCEPT (or REJECT when rejected)
    bool adminToggle(const platform::ChannelGroup& combo, bool expect_reject, const char* what);
    bool enterPinTwice(const Pin& pin, const msg::Pattern& prompt, bool solid_confirm);
};

} // namespace device
