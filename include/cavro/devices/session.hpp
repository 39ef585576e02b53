#pragma once

#include "transport/channel.hpp"
#include "common/types.hpp"
#include "common/commands.hpp"
#include "common/response.hpp"
#include "common/protocol.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <string>

namespace cavro {

enum class SessionState
{
    DISCONNECTED,
    CONNECTING,
    CONNECTED
};

// Connection to one addressed pump. Owns the channel exclusively and
// serializes every exchange; not safe for concurrent use except cancel().
class Session
{
public:
    using LogCallback = std::function<void(const std::string&)>;

    explicit Session(Address address) : address_(address) {}
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    Result<bool> connect(ChannelFactory& factory);
    Result<bool> connect_to(ChannelFactory& factory, const std::string& endpoint);
    void disconnect();

    [[nodiscard]] bool is_connected() const { return state_ == SessionState::CONNECTED; }
    [[nodiscard]] SessionState state() const { return state_; }
    [[nodiscard]] Address address() const { return address_; }
    [[nodiscard]] std::string endpoint() const { return endpoint_; }

    Result<Reply> transact(const Command& command);
    Result<bool> wait_for_ready();
    Result<ErrorCode> initialize();

    // Makes a pending or future wait_for_ready() fail with CANCELLED until
    // clear_cancel() or the next disconnect().
    void cancel() { cancel_requested_.store(true); }
    void clear_cancel() { cancel_requested_.store(false); }
    bool is_cancelled() const { return cancel_requested_.load(); }

    // Applies to the connected channel as well as later connect attempts.
    void set_read_timeout_ms(int timeout_ms);
    void set_poll_interval_ms(int interval_ms) { poll_interval_ms_ = interval_ms; }
    void set_max_wait_ms(int max_wait_ms) { max_wait_ms_ = max_wait_ms; }
    void set_max_initialize_attempts(int attempts) { max_initialize_attempts_ = attempts; }
    void set_log_callback(LogCallback cb) { log_callback_ = std::move(cb); }

private:
    Address address_;
    SessionState state_ = SessionState::DISCONNECTED;
    std::unique_ptr<Channel> channel_;
    std::string endpoint_;

    int read_timeout_ms_ = Protocol::READ_TIMEOUT_MS;
    int poll_interval_ms_ = Protocol::POLL_INTERVAL_MS;
    int max_wait_ms_ = 0;
    int max_initialize_attempts_ = 0;
    std::atomic<bool> cancel_requested_{false};
    LogCallback log_callback_;

    void log(const std::string& msg);
    Result<Reply> exchange(Channel& channel, const Command& command);
    std::unique_ptr<Channel> try_endpoint(ChannelFactory& factory, const std::string& endpoint);
};

} // namespace cavro
