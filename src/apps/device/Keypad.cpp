#include "apps/device/Keypad.hpp"

namespace device {

camera::KeypadLayout secureKeyLayout() {
    return {
        {"key1", "key2"},
        {"key3", "key4"},
        {"key5", "key6"},
        {"key7", "key8"},
        {"key9", "key0"},
        {"lock", "unlock"},
    };
}

camera::KeypadLayout portableLayout() {
    return {
        {"key1", "key2", "key3"},
        {"key4", "key5", "key6"},
        {"key7", "key8", "key9"},
        {"lock", "key0", "unlock"},
    };
}

camera::KeypadLayout keypadLayoutFor(const DeviceProfile& profile) {
    return profile.secure_key ? secureKeyLayout() : portableLayout();
}

std::vector<std::string> keypadTestOrder(const DeviceProfile& profile) {
    if (profile.secure_key) {
        return {"key1", "key2", "key3", "key4", "key5", "key6",
                "key7", "key8", "key9", "key0", "lock", "unlock"};
    }
    return {"key1", "key2", "key3", "key4", "key5", "key6",
            "key7", "key8", "key9", "lock", "key0", "unlock"};
}

} // namespace device
