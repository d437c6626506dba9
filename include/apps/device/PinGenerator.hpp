#pragma once
#include <cstdint>
#include <map>
#include <random>
#include <string>

#include "apps/device/DeviceUnderTest.hpp"

namespace device {

struct PinInfo {
    std::string digits;           // "52788791"
    Pin keys;                     // {"key5","key2",...}
    Pin sequence;                 // keys + "unlock"
    bool valid = false;
    std::string reason;           // "is valid", "is repeating", ...
    std::map<std::string, int> keypress;  // per-channel press count over sequence
};

enum class InvalidPinType : uint8_t {
    REPEATING,
    SEQUENTIAL,
};

// ------------------------------
// PinGenerator: random PINs checked against the firmware's rejection
// rules and the DUT's current self-destruct PIN.
// ------------------------------
class PinGenerator {
public:
    static constexpr int MIN_LENGTH = 2;
    static constexpr int MAX_LENGTH = 16;
    static constexpr int MAX_SEQUENTIAL = 10;
    static constexpr int MAX_ATTEMPTS = 500;

    explicit PinGenerator(const DeviceUnderTest& dut, uint32_t seed = std::random_device{}());

    bool generateValid(int length, PinInfo& out);

    // reverse < 0 picks the direction at random
    bool generateInvalid(InvalidPinType type, int length, PinInfo& out, int reverse = -1);

    // false if no self-destruct PIN is enrolled
    bool selfDestructPinInfo(PinInfo& out) const;

    // Rejection reason for a digit string, empty when acceptable
    std::string whyInvalid(const std::string& digits) const;

    PinInfo describe(const std::string& digits) const;

    enum class Status : uint8_t {
        OK = 0,
        BAD_LENGTH,
        EXHAUSTED,
    };

    static const char* StatusStr(Status s);
    Status lastStatus() const { return m_status; }

private:
    const DeviceUnderTest& m_dut;
    std::mt19937 m_rng;
    Status m_status = Status::OK;

    int randInt(int lo, int hi);
    bool fail(Status s);
};

} // namespace device
