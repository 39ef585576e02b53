#pragma once

#include <string>
#include <vector>
#include <stdint.h>

#include "types.hpp"

namespace cavro {

std::string bytesToHex(const std::vector<uint8_t>& data);
std::string to_string(Error error);
std::string to_string(ErrorCode code);

} // namespace cavro
