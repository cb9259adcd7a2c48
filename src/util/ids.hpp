#pragma once
#include <string>

namespace royaos::util {

// Opaque unique token: "<prefix>-" followed by 32 random hex digits
std::string generate_token(const std::string& prefix);

} // namespace royaos::util
