#pragma once
#include "msg/LedState.hpp"

// Named LED signatures of the device. Solid states are single LedStates,
// patterns are ordered timed steps. A step without a duration is [0, inf).
namespace camera {
namespace leds {

// ------------------------------
// Solid states
// ------------------------------
extern const msg::LedState ACCEPT_STATE;
extern const msg::LedState ADMIN_MODE;
extern const msg::LedState ALL_OFF;
extern const msg::LedState ALL_ON;
extern const msg::LedState FW_VERSION;
extern const msg::LedState DIAGNOSTIC_MODE;
extern const msg::LedState CONFIRMATION;
extern const msg::LedState GREEN_BLUE_STATE;
extern const msg::LedState GREEN_BLUE_BATTERY_STATE;
extern const msg::LedState KEY_GENERATION;
extern const msg::LedState KEY_GENERATION_LEGACY;
extern const msg::LedState SLEEP_MODE;
extern const msg::LedState STABLE_ENUM;
extern const msg::LedState STANDBY_MODE;
extern const msg::LedState RED_ONLY;
extern const msg::LedState GREEN_ONLY;
extern const msg::LedState BLUE_ONLY;

// ------------------------------
// Timed patterns
// ------------------------------
extern const msg::Pattern ACCEPT_PATTERN;
extern const msg::Pattern ACCEPT_PATTERN_INCOMPLETE;
extern const msg::Pattern BLUE;
extern const msg::Pattern BRUTE_FORCED;
extern const msg::Pattern ENUM;
extern const msg::Pattern ENUM_LEGACY;
extern const msg::Pattern ENUM_SELF_DESTRUCT;
extern const msg::Pattern ENUM_LOCK_OVERRIDE;
extern const msg::Pattern ENUM_LOCK_OVERRIDE_READ_ONLY;
extern const msg::Pattern ENUM_READ_ONLY;
extern const msg::Pattern ERROR_STATE;
extern const msg::Pattern FIRST_KEY_KEYPAD_TEST;
extern const msg::Pattern FLICKER_BLUE;
extern const msg::Pattern FLICKER_GREEN;
extern const msg::Pattern FLICKER_RED;
extern const msg::Pattern GREEN_BLUE;
extern const msg::Pattern OOB_CHARGE;
extern const msg::Pattern PROVISION_LOCK_BRICKED;
extern const msg::Pattern RED_COUNTER;
extern const msg::Pattern RED_LOGIN;
extern const msg::Pattern RED_BLUE;
extern const msg::Pattern RED_GREEN;
extern const msg::Pattern RED_GREEN_BLUE;
extern const msg::Pattern REJECT;
extern const msg::Pattern STANDBY_CHARGE;
extern const msg::Pattern USER_RESET_KEY;

} // namespace leds
} // namespace camera
