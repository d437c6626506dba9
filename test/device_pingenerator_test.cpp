#include <iostream>
#include <string>

#include "apps/device/PinGenerator.hpp"

static void printResult(const char* name, bool ok) {
    std::cout << name << ": " << (ok ? "OK" : "FAIL") << "\n";
}

static bool isRepeating(const std::string& d) {
    return d.find_first_not_of(d.front()) == std::string::npos;
}

static bool isSequential(const std::string& d) {
    return std::string("0123456789").find(d) != std::string::npos ||
           std::string("9876543210").find(d) != std::string::npos;
}

int main() {
    using namespace device;

    std::cout << "=== device_pingenerator_test ===\n";
    bool all = true;

    DeviceUnderTest dut;
    PinGenerator gen(dut, 1234);

    {
        std::cout << "\n[Test 1] valid PINs\n";
        bool ok = true;
        for (int len = PinGenerator::MIN_LENGTH; len <= PinGenerator::MAX_LENGTH; ++len) {
            PinInfo info;
            if (!gen.generateValid(len, info)) {
                std::cout << "  length " << len << ": " << PinGenerator::StatusStr(gen.lastStatus()) << "\n";
                ok = false;
                continue;
            }
            const bool good = info.valid && info.reason == "is valid" &&
                              static_cast<int>(info.digits.size()) == len &&
                              static_cast<int>(info.keys.size()) == len &&
                              info.sequence.back() == "unlock" &&
                              !isRepeating(info.digits) && !isSequential(info.digits);
            if (!good) {
                std::cout << "  bad PIN " << info.digits << " (" << info.reason << ")\n";
                ok = false;
            }
        }
        printResult("lengths 2..16", ok);
        all = all && ok;
    }

    {
        std::cout << "\n[Test 2] length limits\n";
        PinInfo info;
        const bool too_short = !gen.generateValid(1, info) && gen.lastStatus() == PinGenerator::Status::BAD_LENGTH;
        const bool too_long = !gen.generateValid(17, info) && gen.lastStatus() == PinGenerator::Status::BAD_LENGTH;
        const bool seq_long = !gen.generateInvalid(InvalidPinType::SEQUENTIAL, 11, info) &&
                              gen.lastStatus() == PinGenerator::Status::BAD_LENGTH;
        const bool rep_long = !gen.generateInvalid(InvalidPinType::REPEATING, 17, info) &&
                              gen.lastStatus() == PinGenerator::Status::BAD_LENGTH;

        printResult("length 1 rejected", too_short);
        printResult("length 17 rejected", too_long);
        printResult("sequential length 11 rejected", seq_long);
        printResult("repeating length 17 rejected", rep_long);
        all = all && too_short && too_long && seq_long && rep_long;
    }

    {
        std::cout << "\n[Test 3] invalid PINs\n";
        PinInfo rep;
        const bool a = gen.generateInvalid(InvalidPinType::REPEATING, 8, rep) &&
                       !rep.valid && rep.reason == "is repeating" && isRepeating(rep.digits);

        PinInfo up;
        PinInfo down;
        const bool b = gen.generateInvalid(InvalidPinType::SEQUENTIAL, 10, up, 0) &&
                       up.digits == "0123456789" && up.reason == "is sequential";
        const bool c = gen.generateInvalid(InvalidPinType::SEQUENTIAL, 10, down, 1) &&
                       down.digits == "9876543210" && !down.valid;

        std::cout << "  repeating " << rep.digits << ", up " << up.digits << ", down " << down.digits << "\n";
        printResult("repeating", a);
        printResult("ascending", b);
        printResult("descending", c);
        all = all && a && b && c;
    }

    {
        std::cout << "\n[Test 4] self-destruct PIN and describe()\n";
        PinInfo sd;
        const bool none = !gen.selfDestructPinInfo(sd);

        dut.self_destruct_pin = pinFromDigits("5278879");
        const bool have = gen.selfDestructPinInfo(sd) && sd.digits == "5278879" && !sd.valid &&
                          sd.reason == "matches Self-Destruct PIN";
        const bool why = gen.whyInvalid("5278879") == "matches Self-Destruct PIN" &&
                         gen.whyInvalid("5278870").empty() && gen.whyInvalid("") == "is empty";

        const PinInfo d = gen.describe("5278879");
        const bool presses = d.keypress.at("key7") == 2 && d.keypress.at("key8") == 2 &&
                             d.keypress.at("key5") == 1 && d.keypress.at("unlock") == 1 &&
                             d.keypress.count("key0") == 0;

        printResult("no self-destruct PIN", none);
        printResult("self-destruct PIN described", have);
        printResult("whyInvalid", why);
        printResult("keypress counts include unlock", presses);
        all = all && none && have && why && presses;
    }

    if (!all) {
        std::cout << "\ndevice_pingenerator_test: FAIL\n";
        return 1;
    }
    std::cout << "\ndevice_pingenerator_test: PASS\n";
    return 0;
}
