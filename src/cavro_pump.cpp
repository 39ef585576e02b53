#include "devices/cavro_pump.hpp"
#include "transport/serial.hpp"
#include "transport/frame.hpp"
#include "common/protocol.hpp"
#include "common/helpers.hpp"

#include <algorithm>

namespace cavro {

CavroPump::CavroPump(Address address, SyringeSize syringe)
    : session_(address), syringe_(syringe) {}

void CavroPump::set_log_callback(LogCallback cb)
{
    log_callback_ = cb;
    session_.set_log_callback(std::move(cb));
}

void CavroPump::log(const std::string& msg)
{
    if (log_callback_) {
        log_callback_(msg);
    }
}

Result<bool> CavroPump::connect()
{
    SerialChannelFactory factory;
    return session_.connect(factory);
}

Result<bool> CavroPump::connect(ChannelFactory& factory)
{
    return session_.connect(factory);
}

Result<bool> CavroPump::connect_to(const std::string& port)
{
    SerialChannelFactory factory;
    return session_.connect_to(factory, port);
}

void CavroPump::disconnect()
{
    session_.disconnect();
}

Result<bool> CavroPump::execute(const Command& command)
{
    auto reply = session_.transact(command);
    if (!reply.ok()) {
        return Result<bool>::failure(reply);
    }

    ErrorCode status = reply.value().status;
    if (status != ErrorCode::NO_ERROR) {
        log("[CAVRO] " + CavroFrame::body(command) + " failed: " + to_string(status));
        return Result<bool>::failure(Error::DEVICE_ERROR, status);
    }

    return Result<bool>::success(true);
}

Result<ErrorCode> CavroPump::initialize()
{
    auto result = session_.initialize();
    if (result.ok() && result.value() != ErrorCode::NO_ERROR) {
        log("[CAVRO] Initialize finished with " + to_string(result.value()));
    }
    return result;
}

Result<bool> CavroPump::set_speed(uint16_t speed)
{
    auto ready = session_.wait_for_ready();
    if (!ready.ok()) {
        return ready;
    }

    speed = std::min(speed, Protocol::MAX_SPEED);
    return execute(cmd::SetSpeed{speed});
}

Result<bool> CavroPump::set_absolute_position(uint16_t position)
{
    auto ready = session_.wait_for_ready();
    if (!ready.ok()) {
        return ready;
    }

    position = std::min(position, Protocol::MAX_POSITION);
    return execute(cmd::MoveAbsolute{position});
}

Result<bool> CavroPump::set_valve_position(ValvePosition target)
{
    auto ready = session_.wait_for_ready();
    if (!ready.ok()) {
        return ready;
    }

    auto current = get_valve_position();
    if (!current.ok()) {
        return Result<bool>::failure(current);
    }

    // Don't actuate a valve that is already there.
    if (current.value() == target) {
        return Result<bool>::success(true);
    }

    return execute(cmd::SelectValve{target});
}

Result<ValvePosition> CavroPump::get_valve_position()
{
    auto reply = session_.transact(cmd::QueryValve{});
    if (!reply.ok()) {
        return Result<ValvePosition>::failure(reply);
    }

    auto& data = reply.value().data;
    if (data.empty()) {
        log("[CAVRO] Valve query returned no data");
        return Result<ValvePosition>::failure(Error::INVALID_RESPONSE);
    }

    switch (static_cast<char>(data[0])) {
        case '1':
            return Result<ValvePosition>::success(ValvePosition::POS_1);
        case '2':
            return Result<ValvePosition>::success(ValvePosition::POS_2);
        case '3':
            return Result<ValvePosition>::success(ValvePosition::POS_3);
        default:
            log("[CAVRO] Unexpected valve position " + bytesToHex({data[0]}));
            return Result<ValvePosition>::failure(Error::INVALID_RESPONSE);
    }
}

Result<Reply> CavroPump::query_status()
{
    return session_.transact(cmd::QueryStatus{});
}

} // namespace cavro
