#pragma once

#include "devices/session.hpp"
#include "transport/channel.hpp"
#include "common/types.hpp"
#include "common/commands.hpp"
#include "common/response.hpp"

#include <functional>
#include <string>
#include <stdint.h>

namespace cavro {

class CavroPump
{
public:
    using LogCallback = std::function<void(const std::string&)>;

    explicit CavroPump(Address address = Address::ADDR_0, SyringeSize syringe = SyringeSize::S250);

    CavroPump(const CavroPump&) = delete;
    CavroPump& operator=(const CavroPump&) = delete;

    // Scans every serial port under /dev.
    Result<bool> connect();
    Result<bool> connect(ChannelFactory& factory);
    Result<bool> connect_to(const std::string& port);
    void disconnect();

    [[nodiscard]] bool is_connected() const { return session_.is_connected(); }
    [[nodiscard]] SessionState state() const { return session_.state(); }
    [[nodiscard]] Address address() const { return session_.address(); }
    [[nodiscard]] SyringeSize syringe_size() const { return syringe_; }
    [[nodiscard]] std::string port() const { return session_.endpoint(); }

    // Succeeds with the status of the final Z command, which is not
    // necessarily NO_ERROR.
    Result<ErrorCode> initialize();
    Result<bool> set_speed(uint16_t speed);
    Result<bool> set_absolute_position(uint16_t position);
    Result<bool> set_valve_position(ValvePosition target);
    Result<ValvePosition> get_valve_position();
    Result<Reply> query_status();

    void cancel() { session_.cancel(); }
    void clear_cancel() { session_.clear_cancel(); }

    void set_read_timeout_ms(int timeout_ms) { session_.set_read_timeout_ms(timeout_ms); }
    void set_poll_interval_ms(int interval_ms) { session_.set_poll_interval_ms(interval_ms); }
    void set_max_wait_ms(int max_wait_ms) { session_.set_max_wait_ms(max_wait_ms); }
    void set_max_initialize_attempts(int attempts) { session_.set_max_initialize_attempts(attempts); }
    void set_log_callback(LogCallback cb);

private:
    Session session_;
    SyringeSize syringe_;
    LogCallback log_callback_;

    void log(const std::string& msg);
    Result<bool> execute(const Command& command);
};

} // namespace cavro
