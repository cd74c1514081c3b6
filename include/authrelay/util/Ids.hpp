#pragma once

#include <string>

namespace authrelay::util {

// Random 128-bit id in the 8-4-4-4-12 hex layout (version 4 bits set).
std::string randomId();

} // namespace authrelay::util
