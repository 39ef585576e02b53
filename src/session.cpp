#include "devices/session.hpp"
#include "transport/frame.hpp"
#include "common/helpers.hpp"

#include <chrono>
#include <thread>

namespace cavro {

Session::~Session()
{
    disconnect();
}

void Session::set_read_timeout_ms(int timeout_ms)
{
    read_timeout_ms_ = timeout_ms;
    if (channel_) {
        channel_->set_timeout_ms(timeout_ms);
    }
}

void Session::log(const std::string& msg)
{
    if (log_callback_) {
        log_callback_(msg);
    }
}

Result<Reply> Session::exchange(Channel& channel, const Command& command)
{
    std::vector<uint8_t> frame = CavroFrame::encode(address_, command);
    log("[TX] " + bytesToHex(frame));

    auto write_result = channel.write(frame.data(), frame.size());
    if (!write_result.ok()) {
        return Result<Reply>::failure(write_result);
    }

    auto read_result = channel.read_until(Protocol::REPLY_TERMINATOR);
    if (!read_result.ok()) {
        log("[RX] " + to_string(read_result.error()));
        return Result<Reply>::failure(read_result);
    }

    auto& raw = read_result.value();
    log("[RX] " + bytesToHex(raw));

    return CavroFrame::decode(raw.data(), raw.size());
}

std::unique_ptr<Channel> Session::try_endpoint(ChannelFactory& factory, const std::string& endpoint)
{
    std::unique_ptr<Channel> channel = factory.create();
    channel->set_timeout_ms(read_timeout_ms_);

    if (!channel->open(endpoint).ok()) {
        log("[CAVRO] " + endpoint + ": open failed");
        return nullptr;
    }

    if (!channel->discard_buffers().ok()) {
        log("[CAVRO] " + endpoint + ": flush failed");
        channel->close();
        return nullptr;
    }

    auto reply = exchange(*channel, cmd::QueryStatus{});
    if (!reply.ok()) {
        log("[CAVRO] " + endpoint + ": no answer (" + to_string(reply.error()) + ")");
        channel->close();
        return nullptr;
    }

    return channel;
}

Result<bool> Session::connect(ChannelFactory& factory)
{
    if (state_ == SessionState::CONNECTED) {
        return Result<bool>::success(true);
    }

    state_ = SessionState::CONNECTING;

    for (const auto& endpoint : factory.enumerate()) {
        auto channel = try_endpoint(factory, endpoint);
        if (channel) {
            channel_ = std::move(channel);
            endpoint_ = endpoint;
            state_ = SessionState::CONNECTED;
            log("[CAVRO] Connected on " + endpoint);
            return Result<bool>::success(true);
        }
    }

    state_ = SessionState::DISCONNECTED;
    log("[CAVRO] Device not found");
    return Result<bool>::failure(Error::DEVICE_NOT_FOUND);
}

Result<bool> Session::connect_to(ChannelFactory& factory, const std::string& endpoint)
{
    if (state_ == SessionState::CONNECTED) {
        return Result<bool>::success(true);
    }

    state_ = SessionState::CONNECTING;

    auto channel = try_endpoint(factory, endpoint);
    if (!channel) {
        state_ = SessionState::DISCONNECTED;
        return Result<bool>::failure(Error::DEVICE_NOT_FOUND);
    }

    channel_ = std::move(channel);
    endpoint_ = endpoint;
    state_ = SessionState::CONNECTED;
    log("[CAVRO] Connected on " + endpoint);
    return Result<bool>::success(true);
}

void Session::disconnect()
{
    state_ = SessionState::DISCONNECTED;
    cancel_requested_.store(false);

    if (channel_) {
        channel_->close();
        channel_.reset();
        log("[CAVRO] Disconnected from " + endpoint_);
    }
    endpoint_.clear();
}

Result<Reply> Session::transact(const Command& command)
{
    if (state_ != SessionState::CONNECTED || !channel_) {
        return Result<Reply>::failure(Error::NOT_CONNECTED);
    }
    return exchange(*channel_, command);
}

Result<bool> Session::wait_for_ready()
{
    const auto start = std::chrono::steady_clock::now();

    while (true)
    {
        if (cancel_requested_.load()) {
            return Result<bool>::failure(Error::CANCELLED);
        }

        auto reply = transact(cmd::QueryStatus{});
        if (!reply.ok()) {
            return Result<bool>::failure(reply);
        }

        if (reply.value().ready) {
            return Result<bool>::success(true);
        }

        if (max_wait_ms_ > 0) {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start).count();
            if (elapsed >= max_wait_ms_) {
                log("[CAVRO] Still busy after " + std::to_string(elapsed) + " ms");
                return Result<bool>::failure(Error::WAIT_TIMEOUT);
            }
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(poll_interval_ms_));
    }
}

Result<ErrorCode> Session::initialize()
{
    int attempts = 0;

    while (true)
    {
        auto ready = wait_for_ready();
        if (!ready.ok()) {
            return Result<ErrorCode>::failure(ready);
        }

        auto reply = transact(cmd::InitializePump{});
        if (!reply.ok()) {
            return Result<ErrorCode>::failure(reply);
        }
        ++attempts;

        ErrorCode status = reply.value().status;
        if (status != ErrorCode::DEVICE_NOT_INITIALIZED) {
            return Result<ErrorCode>::success(status);
        }

        log("[CAVRO] Not initialized yet, retrying (attempt " + std::to_string(attempts) + ")");

        if (max_initialize_attempts_ > 0 && attempts >= max_initialize_attempts_) {
            return Result<ErrorCode>::failure(Error::DEVICE_ERROR, ErrorCode::DEVICE_NOT_INITIALIZED);
        }
    }
}

} // namespace cavro
