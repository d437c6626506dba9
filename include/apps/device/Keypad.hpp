#pragma once
#include <string>
#include <vector>

#include "apps/camera/InstantReplay.hpp"
#include "apps/device/DeviceUnderTest.hpp"

namespace device {

// Grid of key channel names, top row first, as printed on the product.
camera::KeypadLayout secureKeyLayout();   // 2 columns x 6 rows
camera::KeypadLayout portableLayout();    // 3 columns x 4 rows

camera::KeypadLayout keypadLayoutFor(const DeviceProfile& profile);

// Order the firmware walks the keys in during a keypad self-test.
// Both layouts start at key1 and end at unlock.
std::vector<std::string> keypadTestOrder(const DeviceProfile& profile);

} // namespace device
