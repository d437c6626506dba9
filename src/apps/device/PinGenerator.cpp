#include "apps/device/PinGenerator.hpp"

#include <iostream>

namespace device {

const char* PinGenerator::StatusStr(Status s) {
    switch (s) {
        case Status::OK: return "OK";
        case Status::BAD_LENGTH: return "BAD_LENGTH";
        case Status::EXHAUSTED: return "EXHAUSTED";
        default: return "UNKNOWN";
    }
}

PinGenerator::PinGenerator(const DeviceUnderTest& dut, uint32_t seed)
    : m_dut(dut), m_rng(seed) {}

bool PinGenerator::fail(Status s) {
    m_status = s;
    return false;
}

int PinGenerator::randInt(int lo, int hi) {
    std::uniform_int_distribution<int> d(lo, hi);
    return d(m_rng);
}

std::string PinGenerator::whyInvalid(const std::string& digits) const {
    if (digits.empty()) return "is empty";

    const Pin& sd = m_dut.self_destruct_pin;
    if (!sd.empty() && digits == pinToString(sd)) return "matches Self-Destruct PIN";

    bool repeating = true;
    for (char c : digits) {
        if (c != digits.front()) { repeating = false; break; }
    }
    if (repeating) return "is repeating";

    static const std::string kUp = "0123456789";
    static const std::string kDown = "9876543210";
    if (kUp.find(digits) != std::string::npos || kDown.find(digits) != std::string::npos) {
        return "is sequential";
    }
    return std::string();
}

PinInfo PinGenerator::describe(const std::string& digits) const {
    PinInfo info;
    info.digits = digits;
    info.keys = pinFromDigits(digits);
    info.sequence = info.keys;
    info.sequence.push_back("unlock");

    const std::string why = whyInvalid(digits);
    info.valid = why.empty();
    info.reason = info.valid ? "is valid" : why;

    for (const auto& k : info.sequence) info.keypress[k]++;
    return info;
}

bool PinGenerator::generateValid(int length, PinInfo& out) {
    if (length < MIN_LENGTH || length > MAX_LENGTH) {
        std::cerr << "[DUT] PIN length must be between " << MIN_LENGTH << " and " << MAX_LENGTH << "\n";
        return fail(Status::BAD_LENGTH);
    }

    for (int attempt = 0; attempt < MAX_ATTEMPTS; ++attempt) {
        std::string digits;
        for (int i = 0; i < length; ++i) digits += static_cast<char>('0' + randInt(0, 9));
        if (whyInvalid(digits).empty()) {
            out = describe(digits);
            m_status = Status::OK;
            return true;
        }
    }
    std::cerr << "[DUT] no valid PIN of length " << length << " after " << MAX_ATTEMPTS << " attempts\n";
    return fail(Status::EXHAUSTED);
}

bool PinGenerator::generateInvalid(InvalidPinType type, int length, PinInfo& out, int reverse) {
    std::string digits;

    switch (type) {
        case InvalidPinType::REPEATING: {
            if (length < 1 || length > MAX_LENGTH) return fail(Status::BAD_LENGTH);
            digits.assign(static_cast<std::size_t>(length), static_cast<char>('0' + randInt(0, 9)));
            break;
        }
        case InvalidPinType::SEQUENTIAL: {
            if (length < MIN_LENGTH || length > MAX_SEQUENTIAL) {
                std::cerr << "[DUT] sequential PIN length must be between "
                          << MIN_LENGTH << " and " << MAX_SEQUENTIAL << "\n";
                return fail(Status::BAD_LENGTH);
            }
            const bool down = reverse < 0 ? randInt(0, 1) == 1 : reverse != 0;
            if (!down) {
                const int start = randInt(0, 10 - length);
                for (int i = 0; i < length; ++i) digits += static_cast<char>('0' + start + i);
            } else {
                const int start = randInt(length - 1, 9);
                for (int i = 0; i < length; ++i) digits += static_cast<char>('0' + start - i);
            }
            break;
        }
    }

    out = describe(digits);
    m_status = Status::OK;
    return true;
}

bool PinGenerator::selfDestructPinInfo(PinInfo& out) const {
    if (m_dut.self_destruct_pin.empty()) return false;
    out = describe(pinToString(m_dut.self_destruct_pin));
    return true;
}

} // namespace device
