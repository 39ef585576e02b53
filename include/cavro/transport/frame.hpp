#pragma once

#include <optional>
#include <string>
#include <vector>
#include <stdint.h>

#include "common/types.hpp"
#include "common/commands.hpp"
#include "common/response.hpp"

namespace cavro {

struct RequestFrame
{
    Address address;
    std::string body;
};

class CavroFrame{
public:
    static std::string body(const Command& command);
    static std::vector<uint8_t> encode(Address address, const Command& command);
    static std::optional<RequestFrame> parse_request(const uint8_t* frame, size_t len);
    static Result<Reply> decode(const uint8_t* frame, size_t len);
};

} // namespace cavro
