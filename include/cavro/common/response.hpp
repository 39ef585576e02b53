#pragma once

#include <stdint.h>
#include <vector>

#include "types.hpp"

namespace cavro {

struct Reply
{
    bool ready = false;
    ErrorCode status = ErrorCode::NO_ERROR;
    uint8_t status_byte = 0;
    std::vector<uint8_t> data;
};

} // namespace cavro
