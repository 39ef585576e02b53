#pragma once

#include <memory>
#include <string>
#include <vector>
#include <stdint.h>

#include "common/types.hpp"

namespace cavro {

// Duplex byte stream to one device endpoint.
class Channel
{
public:
    virtual ~Channel() = default;

    virtual Result<bool> open(const std::string& endpoint) = 0;
    virtual Result<bool> close() = 0;
    virtual bool is_open() = 0;

    virtual void set_timeout_ms(int timeout_ms) = 0;
    virtual Result<bool> discard_buffers() = 0;
    virtual Result<size_t> write(const unsigned char* data, size_t len) = 0;

    // Blocks until `terminator` is seen or the timeout expires (Error::TIMEOUT).
    // The terminator is not part of the returned bytes.
    virtual Result<std::vector<unsigned char>> read_until(const std::string& terminator) = 0;
};

class ChannelFactory
{
public:
    virtual ~ChannelFactory() = default;

    virtual std::vector<std::string> enumerate() = 0;
    virtual std::unique_ptr<Channel> create() = 0;
};

} // namespace cavro
