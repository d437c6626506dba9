#include "apps/camera/LedPatterns.hpp"

namespace camera {
namespace leds {

namespace {

msg::LedState rgb(int r, int g, int b) {
    return {{"red", static_cast<uint8_t>(r)},
            {"green", static_cast<uint8_t>(g)},
            {"blue", static_cast<uint8_t>(b)}};
}

// Red left unconstrained
msg::LedState gb(int g, int b) {
    return {{"green", static_cast<uint8_t>(g)}, {"blue", static_cast<uint8_t>(b)}};
}

msg::PatternStep step(int r, int g, int b, double min_s, double max_s) {
    return {rgb(r, g, b), min_s, max_s};
}

} // namespace

// ------------------------------
// Solid states
// ------------------------------
const msg::LedState ACCEPT_STATE     = rgb(0, 1, 0);
const msg::LedState ADMIN_MODE       = rgb(0, 0, 1);
const msg::LedState ALL_OFF          = rgb(0, 0, 0);
const msg::LedState ALL_ON           = rgb(1, 1, 1);
const msg::LedState FW_VERSION       = rgb(0, 0, 0);
const msg::LedState DIAGNOSTIC_MODE  = rgb(0, 0, 1);
const msg::LedState CONFIRMATION     = rgb(0, 1, 0);
const msg::LedState GREEN_BLUE_STATE = rgb(0, 1, 1);
// Battery units may show red while charging
const msg::LedState GREEN_BLUE_BATTERY_STATE = gb(1, 1);
const msg::LedState KEY_GENERATION        = rgb(1, 1, 0);
const msg::LedState KEY_GENERATION_LEGACY = rgb(1, 1, 0);
const msg::LedState SLEEP_MODE   = rgb(0, 0, 0);
const msg::LedState STABLE_ENUM  = rgb(0, 1, 0);
const msg::LedState STANDBY_MODE = rgb(1, 0, 0);
const msg::LedState RED_ONLY     = rgb(1, 0, 0);
const msg::LedState GREEN_ONLY   = rgb(0, 1, 0);
const msg::LedState BLUE_ONLY    = rgb(0, 0, 1);

// ------------------------------
// Timed patterns
// ------------------------------
const msg::Pattern ACCEPT_PATTERN = {
    step(0, 0, 0, 0.00, 3.0),
    step(0, 1, 0, 0.01, 1.0),
    step(0, 0, 0, 0.08, 0.6),
    step(0, 1, 0, 0.10, 0.6),
    step(0, 0, 0, 0.10, 0.6),
    step(0, 1, 0, 0.10, 0.6),
    step(0, 0, 0, 0.10, 0.6),
};

const msg::Pattern ACCEPT_PATTERN_INCOMPLETE = {
    step(0, 0, 0, 0.00, 3.0),
    step(0, 1, 0, 0.01, 1.0),
    step(0, 0, 0, 0.10, 0.6),
    step(0, 1, 0, 0.10, 0.6),
};

const msg::Pattern BLUE = {
    step(0, 0, 1, 0.00, 0.35),
    step(0, 0, 0, 0.05, 0.35),
    step(0, 0, 1, 0.05, 0.35),
    step(0, 0, 0, 0.05, 0.35),
    step(0, 0, 1, 0.05, 0.40),
    step(0, 0, 0, 0.05, 0.35),
};

const msg::Pattern BRUTE_FORCED = {
    step(0, 0, 0, 0.00, 1.0),
    step(1, 0, 0, 0.02, 1.0),
    step(0, 0, 0, 0.02, 0.30),
    step(1, 0, 0, 0.05, 0.30),
    step(0, 0, 0, 0.05, 0.30),
    step(1, 0, 0, 0.05, 0.30),
};

const msg::Pattern ENUM = {
    step(0, 0, 0, 0.05, 3.0),
    step(0, 1, 0, 0.05, 0.6),
    step(0, 0, 0, 0.05, 1.0),
    step(0, 1, 0, 0.05, 0.6),
    step(0, 0, 0, 0.05, 0.6),
    step(0, 1, 0, 0.05, 0.6),
};

const msg::Pattern ENUM_LEGACY = {
    step(0, 1, 0, 4.00, 12.0),
    step(0, 0, 0, 0.05, 1.0),
    step(0, 1, 0, 0.05, 1.0),
    step(0, 0, 0, 0.05, 1.0),
    step(0, 1, 0, 0.05, 4.0),
    step(0, 0, 0, 0.05, 1.0),
    step(0, 1, 0, 0.05, 1.0),
};

// Self-destruct wipes in the background for 5-7 s before enumerating
const msg::Pattern ENUM_SELF_DESTRUCT = {
    step(0, 1, 0, 4.0, 7.0),
    step(0, 0, 0, 0.05, 0.7),
    step(0, 1, 0, 0.05, 0.7),
    step(0, 0, 0, 0.05, 0.7),
    step(0, 1, 0, 0.05, 5.0),
};

const msg::Pattern ENUM_LOCK_OVERRIDE = {
    step(0, 1, 1, 0.00, 5.0),
    step(0, 1, 0, 2.50, 3.5),
    step(0, 1, 1, 0.20, 0.7),
    step(0, 1, 0, 2.50, 3.5),
};

const msg::Pattern ENUM_LOCK_OVERRIDE_READ_ONLY = {
    step(1, 1, 0, 0.00, 10.0),
    step(0, 1, 0, 1.00, 2.0),
    step(0, 1, 1, 0.15, 0.7),
    step(0, 1, 0, 1.00, 2.0),
    step(1, 1, 0, 0.15, 0.7),
    step(0, 1, 0, 1.00, 2.0),
    step(0, 1, 1, 0.15, 0.7),
};

const msg::Pattern ENUM_READ_ONLY = {
    step(1, 1, 0, 0.0, 5.0),
    step(0, 1, 0, 2.0, 3.5),
    step(1, 1, 0, 0.2, 1.2),
    step(0, 1, 0, 2.0, 3.5),
};

const msg::Pattern ERROR_STATE = {
    step(0, 0, 0, 0.00, 1.35),
    step(1, 0, 0, 0.01, 1.35),
    step(0, 0, 0, 0.50, 1.35),
    step(1, 0, 0, 0.50, 1.35),
};

const msg::Pattern FIRST_KEY_KEYPAD_TEST = {
    step(0, 0, 1, 0.01, 0.5),
    step(0, 1, 0, 0.01, 0.5),
};

const msg::Pattern FLICKER_BLUE = {
    step(0, 0, 1, 0.00, 3.0),
    step(0, 0, 0, 0.01, 0.8),
    step(0, 0, 1, 0.01, 0.8),
    step(0, 0, 0, 0.01, 0.8),
    step(0, 0, 1, 0.01, 0.8),
    step(0, 0, 0, 0.01, 0.8),
    step(0, 0, 1, 0.01, 1.0),
    step(0, 0, 0, 0.01, 0.8),
    step(0, 0, 1, 0.01, 0.8),
};

const msg::Pattern FLICKER_GREEN = {
    step(0, 1, 0, 0.00, 3.0),
    step(0, 0, 0, 0.01, 0.8),
    step(0, 1, 0, 0.01, 0.8),
    step(0, 0, 0, 0.01, 0.8),
    step(0, 1, 0, 0.01, 0.8),
    step(0, 0, 0, 0.01, 0.8),
    step(0, 1, 0, 0.01, 1.0),
    step(0, 0, 0, 0.01, 0.8),
    step(0, 1, 0, 0.01, 0.8),
};

const msg::Pattern FLICKER_RED = {
    step(1, 0, 0, 0.00, 3.0),
    step(0, 0, 0, 0.01, 0.7),
    step(1, 0, 0, 0.01, 0.7),
    step(0, 0, 0, 0.01, 0.7),
    step(1, 0, 0, 0.01, 0.7),
    step(0, 0, 0, 0.01, 0.7),
    step(1, 0, 0, 0.01, 1.0),
    step(0, 0, 0, 0.01, 0.7),
    step(1, 0, 0, 0.01, 0.7),
};

const msg::Pattern GREEN_BLUE = {
    step(0, 0, 1, 0.00, 1.0),
    step(0, 1, 1, 0.05, 1.0),
    step(0, 0, 1, 0.05, 0.7),
    step(0, 1, 1, 0.20, 0.7),
    step(0, 0, 1, 0.10, 0.7),
};

const msg::Pattern OOB_CHARGE = {
    {gb(1, 1), 3.0, 7.0},
};

const msg::Pattern PROVISION_LOCK_BRICKED = {
    step(0, 0, 0, 0.00, 1.0),
    step(1, 0, 0, 0.01, 1.0),
    step(0, 0, 0, 0.50, 1.0),
    step(1, 0, 0, 0.50, 1.0),
};

const msg::Pattern RED_COUNTER = {
    step(0, 0, 0, 0.00, 1.9),
    step(1, 0, 0, 0.05, 0.6),
    step(0, 0, 0, 0.05, 1.9),
    step(1, 0, 0, 0.05, 0.6),
    step(0, 0, 0, 0.05, 1.9),
};

const msg::Pattern RED_LOGIN = {
    step(0, 0, 0, 0.00, 1.9),
    step(1, 0, 0, 0.01, 2.1),
    step(0, 0, 0, 0.90, 1.9),
    step(1, 0, 0, 0.90, 1.9),
    step(0, 0, 0, 0.90, 1.9),
};

const msg::Pattern RED_BLUE = {
    step(1, 0, 0, 0.00, 1.0),
    step(0, 0, 1, 0.01, 1.0),
    step(1, 0, 0, 0.10, 0.7),
    step(0, 0, 1, 0.10, 0.7),
    step(1, 0, 0, 0.10, 0.7),
};

const msg::Pattern RED_GREEN = {
    step(0, 1, 0, 0.00, 1.1),
    step(1, 0, 0, 0.05, 1.1),
    step(0, 1, 0, 0.40, 1.1),
    step(1, 0, 0, 0.40, 1.1),
    step(0, 1, 0, 0.40, 1.1),
};

const msg::Pattern RED_GREEN_BLUE = {
    step(1, 0, 0, 0.00, 4.0),
    step(0, 1, 0, 0.50, 2.3),
    step(0, 0, 1, 0.01, 2.3),
};

const msg::Pattern REJECT = {
    step(0, 0, 0, 0.00, 3.0),
    step(1, 0, 0, 0.10, 1.1),
    step(0, 0, 0, 0.10, 0.4),
    step(1, 0, 0, 0.10, 0.4),
    step(0, 0, 0, 0.10, 0.4),
    step(1, 0, 0, 0.10, 0.4),
    step(0, 0, 0, 0.10, 0.4),
};

const msg::Pattern STANDBY_CHARGE = {
    step(0, 0, 0, 0.00, 30.0),
    step(1, 0, 0, 2.00, 30.0),
    step(0, 0, 0, 0.05, 30.0),
    step(1, 0, 0, 2.00, 30.0),
    step(0, 0, 0, 0.05, 30.0),
};

const msg::Pattern USER_RESET_KEY = {
    {gb(0, 0), 0.00, 1.0},
    {gb(0, 1), 0.01, 1.0},
    {gb(0, 0), 0.10, 0.7},
    {gb(0, 1), 0.10, 0.7},
    {gb(0, 0), 0.10, 0.7},
};

} // namespace leds
} // namespace camera
