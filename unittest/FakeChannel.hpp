#pragma once

#include "transport/channel.hpp"

#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cavro {
namespace test {

using Bytes = std::vector<unsigned char>;

// Reply as the transport hands it over: terminator already stripped.
inline Bytes reply(uint8_t status, const std::string& payload = "")
{
    Bytes b = {'/', '0', status};
    b.insert(b.end(), payload.begin(), payload.end());
    return b;
}

// State of one fake endpoint. Shared so tests can inspect it after the
// channel has been moved into a Session.
struct FakeLine
{
    bool open_fails = false;
    bool is_open = false;
    int open_count = 0;
    int close_count = 0;
    int flush_count = 0;
    int timeout_ms = 0;
    int read_timeout_ms = 0;

    std::vector<std::string> written;

    // nullopt entries time out
    std::deque<std::optional<Bytes>> replies;
    std::optional<Bytes> when_empty;

    void queue(Bytes b) { replies.push_back(std::move(b)); }
    void queue_timeout() { replies.push_back(std::nullopt); }

    // Frames written with the leading "/<addr>" and trailing '\r' removed.
    std::vector<std::string> bodies() const
    {
        std::vector<std::string> out;
        for (const auto& w : written) {
            out.push_back(w.size() >= 3 ? w.substr(2, w.size() - 3) : w);
        }
        return out;
    }
};

class FakeChannel : public Channel
{
public:
    explicit FakeChannel(std::map<std::string, std::shared_ptr<FakeLine>>& lines) : lines_(lines) {}

    Result<bool> open(const std::string& endpoint) override
    {
        auto it = lines_.find(endpoint);
        if (it == lines_.end() || it->second->open_fails) {
            return Result<bool>::failure(Error::PORT_ERROR);
        }
        line_ = it->second;
        line_->is_open = true;
        line_->open_count++;
        line_->timeout_ms = timeout_ms_;
        return Result<bool>::success(true);
    }

    Result<bool> close() override
    {
        if (!line_ || !line_->is_open) {
            return Result<bool>::success(false);
        }
        line_->is_open = false;
        line_->close_count++;
        return Result<bool>::success(true);
    }

    bool is_open() override { return line_ && line_->is_open; }

    void set_timeout_ms(int timeout_ms) override { timeout_ms_ = timeout_ms; }

    Result<bool> discard_buffers() override
    {
        if (!is_open()) {
            return Result<bool>::failure(Error::PORT_ERROR);
        }
        line_->flush_count++;
        return Result<bool>::success(true);
    }

    Result<size_t> write(const unsigned char* data, size_t len) override
    {
        if (!is_open()) {
            return Result<size_t>::failure(Error::PORT_ERROR);
        }
        line_->written.emplace_back(data, data + len);
        return Result<size_t>::success(len);
    }

    Result<Bytes> read_until(const std::string&) override
    {
        if (!is_open()) {
            return Result<Bytes>::failure(Error::PORT_ERROR);
        }

        line_->read_timeout_ms = timeout_ms_;

        std::optional<Bytes> next = line_->when_empty;
        if (!line_->replies.empty()) {
            next = line_->replies.front();
            line_->replies.pop_front();
        }

        if (!next) {
            return Result<Bytes>::failure(Error::TIMEOUT);
        }
        return Result<Bytes>::success(*next);
    }

private:
    std::map<std::string, std::shared_ptr<FakeLine>>& lines_;
    std::shared_ptr<FakeLine> line_;
    int timeout_ms_ = 0;
};

class FakeChannelFactory : public ChannelFactory
{
public:
    std::shared_ptr<FakeLine> add(const std::string& endpoint)
    {
        auto line = std::make_shared<FakeLine>();
        lines_[endpoint] = line;
        order_.push_back(endpoint);
        return line;
    }

    std::vector<std::string> enumerate() override { return order_; }

    std::unique_ptr<Channel> create() override
    {
        created_++;
        return std::make_unique<FakeChannel>(lines_);
    }

    int created() const { return created_; }

private:
    std::map<std::string, std::shared_ptr<FakeLine>> lines_;
    std::vector<std::string> order_;
    int created_ = 0;
};

} // namespace test
} // namespace cavro
