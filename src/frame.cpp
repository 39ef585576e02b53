#include "transport/frame.hpp"
#include "common/protocol.hpp"

namespace cavro {

namespace {

struct BodyBuilder
{
    std::string operator()(const cmd::QueryStatus&) const
    {
        return Protocol::Command::QUERY_STATUS;
    }

    std::string operator()(const cmd::InitializePump&) const
    {
        return std::string(Protocol::Command::INITIALIZE) + Protocol::EXECUTE;
    }

    std::string operator()(const cmd::SetSpeed& c) const
    {
        return Protocol::Command::SET_SPEED + std::to_string(c.speed) + Protocol::EXECUTE;
    }

    std::string operator()(const cmd::MoveAbsolute& c) const
    {
        return Protocol::Command::ABSOLUTE_POSITION + std::to_string(c.position) + Protocol::EXECUTE;
    }

    std::string operator()(const cmd::SelectValve& c) const
    {
        return Protocol::Command::VALVE_INPUT + std::to_string(static_cast<int>(c.position)) + Protocol::EXECUTE;
    }

    std::string operator()(const cmd::QueryValve&) const
    {
        return Protocol::Command::QUERY_VALVE;
    }
};

ErrorCode code_from_nibble(uint8_t nibble)
{
    switch (nibble) {
        case 0:  return ErrorCode::NO_ERROR;
        case 1:  return ErrorCode::INITIALIZATION;
        case 2:  return ErrorCode::INVALID_COMMAND;
        case 3:  return ErrorCode::INVALID_OPERAND;
        case 4:  return ErrorCode::INVALID_COMMAND_SEQUENCE;
        case 6:  return ErrorCode::EEPROM_FAILURE;
        case 7:  return ErrorCode::DEVICE_NOT_INITIALIZED;
        case 9:  return ErrorCode::PLUNGER_OVERLOAD;
        case 10: return ErrorCode::VALVE_OVERLOAD;
        case 11: return ErrorCode::PLUNGER_MOVE_NOT_ALLOWED;
        case 15: return ErrorCode::COMMAND_OVERFLOW;
        default: return ErrorCode::UNUSED;  // 5, 8, 12, 13, 14
    }
}

} // anonymous namespace

std::optional<Address> address_from_char(char c)
{
    auto byte = static_cast<uint8_t>(c);
    if (byte < Protocol::ADDRESS_FIRST || byte > Protocol::ADDRESS_LAST) {
        return std::nullopt;
    }
    return static_cast<Address>(byte);
}

std::string CavroFrame::body(const Command& command)
{
    return std::visit(BodyBuilder{}, command);
}

std::vector<uint8_t> CavroFrame::encode(Address address, const Command& command)
{
    std::vector<uint8_t> frame;

    frame.push_back(Protocol::FRAME_START);
    frame.push_back(static_cast<uint8_t>(address_char(address)));

    std::string b = body(command);
    frame.insert(frame.end(), b.begin(), b.end());

    frame.push_back(Protocol::FRAME_END);
    return frame;
}

std::optional<RequestFrame> CavroFrame::parse_request(const uint8_t* frame, size_t len)
{
    // '/' + address + '\r' at minimum
    if (len < 3) {
        return std::nullopt;
    }

    if (frame[0] != Protocol::FRAME_START || frame[len - 1] != Protocol::FRAME_END) {
        return std::nullopt;
    }

    auto address = address_from_char(static_cast<char>(frame[1]));
    if (!address) {
        return std::nullopt;
    }

    RequestFrame request;
    request.address = *address;
    request.body.assign(frame + 2, frame + len - 1);
    return request;
}

Result<Reply> CavroFrame::decode(const uint8_t* frame, size_t len)
{
    // Raw captures may still carry the full ETX CR LF or a bare CR.
    if (len >= 3 && frame[len - 3] == Protocol::ETX && frame[len - 2] == Protocol::CR
        && frame[len - 1] == Protocol::LF) {
        len -= 3;
    } else if (len > 0 && frame[len - 1] == Protocol::CR) {
        len--;
    }

    if (len <= Protocol::STATUS_INDEX) {
        return Result<Reply>::failure(Error::FRAMING_ERROR);
    }

    uint8_t status = frame[Protocol::STATUS_INDEX];
    uint8_t high = status >> 4;

    if (high != Protocol::Status::READY && high != Protocol::Status::BUSY) {
        return Result<Reply>::failure(Error::INVALID_RESPONSE);
    }

    Reply reply;
    reply.ready = (high == Protocol::Status::READY);
    reply.status = code_from_nibble(status & Protocol::Status::CODE_MASK);
    reply.status_byte = status;
    reply.data.assign(frame + Protocol::STATUS_INDEX + 1, frame + len);

    return Result<Reply>::success(std::move(reply));
}

} // namespace cavro
