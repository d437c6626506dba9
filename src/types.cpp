#include "types.hpp"

// Human-readable names for logging/Debugging
const char* stateName(DeviceState s) {
    switch (s) {
        case DeviceState::OFF: return "OFF";
        case DeviceState::POWER_ON_SELF_TEST: return "POWER_ON_SELF_TEST";
        case DeviceState::ERROR: return "ERROR";
        case DeviceState::BRUTE_FORCE: return "BRUTE_FORCE";
        case DeviceState::BRICKED: return "BRICKED";
        case DeviceState::OUT_OF_BOX: return "OUT_OF_BOX";
        case DeviceState::STANDBY: return "STANDBY";
        case DeviceState::USER_FORCED_ENROLLMENT: return "USER_FORCED_ENROLLMENT";
        case DeviceState::FACTORY: return "FACTORY";
        case DeviceState::UNLOCKED_ADMIN: return "UNLOCKED_ADMIN";
        case DeviceState::UNLOCKED_USER: return "UNLOCKED_USER";
        case DeviceState::UNLOCKED_RESET: return "UNLOCKED_RESET";
        case DeviceState::ADMIN: return "ADMIN";
        case DeviceState::PIN_ENROLLMENT: return "PIN_ENROLLMENT";
        case DeviceState::COUNTER_ENROLLMENT: return "COUNTER_ENROLLMENT";
        case DeviceState::DIAGNOSTIC: return "DIAGNOSTIC";
        default: return "UNKNOWN";
    }
}

const char* triggerName(DeviceTrigger t) {
    switch (t) {
        case DeviceTrigger::POWER_ON: return "power_on";
        case DeviceTrigger::POWER_OFF: return "power_off";
        case DeviceTrigger::POST_PASS: return "post_pass";
        case DeviceTrigger::USER_RESET: return "user_reset";
        case DeviceTrigger::MANUFACTURER_RESET: return "manufacturer_reset";
        case DeviceTrigger::LOCK_RESET: return "lock_reset";
        case DeviceTrigger::ENTER_DIAGNOSTIC_MODE: return "enter_diagnostic_mode";
        case DeviceTrigger::EXIT_DIAGNOSTIC_MODE: return "exit_diagnostic_mode";
        case DeviceTrigger::ADMIN_MODE_LOGIN: return "admin_mode_login";
        case DeviceTrigger::LOCK_ADMIN: return "lock_admin";
        case DeviceTrigger::UNLOCK_ADMIN: return "unlock_admin";
        case DeviceTrigger::SELF_DESTRUCT: return "self_destruct";
        case DeviceTrigger::UNLOCK_USER: return "unlock_user";
        case DeviceTrigger::LOCK_USER: return "lock_user";
        case DeviceTrigger::FAIL_UNLOCK: return "fail_unlock";
        case DeviceTrigger::LAST_TRY_LOGIN: return "last_try_login";
        case DeviceTrigger::ADMIN_RECOVERY_FAILED: return "admin_recovery_failed";
        case DeviceTrigger::ENROLL_ADMIN: return "enroll_admin";
        case DeviceTrigger::ENROLL_USER: return "enroll_user";
        case DeviceTrigger::ENROLL_RECOVERY: return "enroll_recovery";
        case DeviceTrigger::ENROLL_SELF_DESTRUCT: return "enroll_self_destruct";
        case DeviceTrigger::ENROLL_BRUTE_FORCE_COUNTER: return "enroll_brute_force_counter";
        case DeviceTrigger::ENROLL_UNATTENDED_AUTO_LOCK_COUNTER: return "enroll_unattended_auto_lock_counter";
        case DeviceTrigger::ENROLL_MIN_PIN_COUNTER: return "enroll_min_pin_counter";
        case DeviceTrigger::ENROLL_PIN: return "enroll_pin";
        case DeviceTrigger::TIMEOUT_ENROLL_PIN: return "timeout_enroll_pin";
        case DeviceTrigger::EXIT_ENROLL_PIN: return "exit_enroll_pin";
        case DeviceTrigger::ENROLL_COUNTER: return "enroll_counter";
        case DeviceTrigger::TIMEOUT_ENROLL_COUNTER: return "timeout_enroll_counter";
        case DeviceTrigger::EXIT_ENROLL_COUNTER: return "exit_enroll_counter";
        case DeviceTrigger::ENABLE_BASIC_DISK: return "enable_basic_disk";
        case DeviceTrigger::ENABLE_REMOVABLE_MEDIA: return "enable_removable_media";
        case DeviceTrigger::ENABLE_LED_FLICKER: return "enable_led_flicker";
        case DeviceTrigger::DISABLE_LED_FLICKER: return "disable_led_flicker";
        case DeviceTrigger::TOGGLE_LOCK_OVERRIDE: return "toggle_lock_override";
        case DeviceTrigger::TOGGLE_PROVISION_LOCK: return "toggle_provision_lock";
        case DeviceTrigger::ENABLE_READ_ONLY: return "enable_read_only";
        case DeviceTrigger::ENABLE_READ_WRITE: return "enable_read_write";
        case DeviceTrigger::ENABLE_SELF_DESTRUCT: return "enable_self_destruct";
        case DeviceTrigger::ENABLE_USER_FORCED_ENROLLMENT: return "enable_user_forced_enrollment";
        case DeviceTrigger::DELETE_PINS: return "delete_pins";
        default: return "unknown";
    }
}
