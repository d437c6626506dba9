#pragma once
#include <cstdint>

// Operating modes of the secure USB device, as observed through its LEDs.
enum class DeviceState : uint8_t {
    OFF,
    POWER_ON_SELF_TEST,
    ERROR,
    BRUTE_FORCE,
    BRICKED,
    OUT_OF_BOX,
    STANDBY,
    USER_FORCED_ENROLLMENT,
    FACTORY,
    UNLOCKED_ADMIN,
    UNLOCKED_USER,
    UNLOCKED_RESET,
    ADMIN,
    PIN_ENROLLMENT,
    COUNTER_ENROLLMENT,
    DIAGNOSTIC
};

enum class DeviceTrigger : uint8_t {
    // Power
    POWER_ON,
    POWER_OFF,
    POST_PASS,

    // Resets
    USER_RESET,
    MANUFACTURER_RESET,
    LOCK_RESET,

    // Diagnostics
    ENTER_DIAGNOSTIC_MODE,
    EXIT_DIAGNOSTIC_MODE,

    // Login / unlock
    ADMIN_MODE_LOGIN,
    LOCK_ADMIN,
    UNLOCK_ADMIN,
    SELF_DESTRUCT,
    UNLOCK_USER,
    LOCK_USER,
    FAIL_UNLOCK,
    LAST_TRY_LOGIN,
    ADMIN_RECOVERY_FAILED,

    // Enrollment initiators
    ENROLL_ADMIN,
    ENROLL_USER,
    ENROLL_RECOVERY,
    ENROLL_SELF_DESTRUCT,
    ENROLL_BRUTE_FORCE_COUNTER,
    ENROLL_UNATTENDED_AUTO_LOCK_COUNTER,
    ENROLL_MIN_PIN_COUNTER,

    // Enrollment commits
    ENROLL_PIN,
    TIMEOUT_ENROLL_PIN,
    EXIT_ENROLL_PIN,
    ENROLL_COUNTER,
    TIMEOUT_ENROLL_COUNTER,
    EXIT_ENROLL_COUNTER,

    // Admin toggles
    ENABLE_BASIC_DISK,
    ENABLE_REMOVABLE_MEDIA,
    ENABLE_LED_FLICKER,
    DISABLE_LED_FLICKER,
    TOGGLE_LOCK_OVERRIDE,
    TOGGLE_PROVISION_LOCK,
    ENABLE_READ_ONLY,
    ENABLE_READ_WRITE,
    ENABLE_SELF_DESTRUCT,
    ENABLE_USER_FORCED_ENROLLMENT,
    DELETE_PINS
};

const char* stateName(DeviceState s);
const char* triggerName(DeviceTrigger t);
