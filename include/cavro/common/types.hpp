#pragma once

#include <utility>
#include <variant>
#include <cstdint>

namespace cavro {

enum class Error
{
    TIMEOUT,
    FRAMING_ERROR,
    INVALID_RESPONSE,
    PORT_ERROR,
    WRITE_ERROR,
    NOT_CONNECTED,
    DEVICE_NOT_FOUND,
    DEVICE_ERROR,
    WAIT_TIMEOUT,
    CANCELLED
};

// Low nibble of the reply status byte.
enum class ErrorCode : uint8_t
{
    NO_ERROR = 0,
    INITIALIZATION = 1,
    INVALID_COMMAND = 2,
    INVALID_OPERAND = 3,
    INVALID_COMMAND_SEQUENCE = 4,
    UNUSED = 5,
    EEPROM_FAILURE = 6,
    DEVICE_NOT_INITIALIZED = 7,
    PLUNGER_OVERLOAD = 9,
    VALVE_OVERLOAD = 10,
    PLUNGER_MOVE_NOT_ALLOWED = 11,
    COMMAND_OVERFLOW = 15
};

template<typename T>
class Result
{
public:
    bool ok() const
    {
        return std::holds_alternative<T>(data_);
    }

    const T& value() const
    {
        return std::get<T>(data_);
    }

    Error error() const
    {
        return std::get<Failure>(data_).error;
    }

    // Code reported by the device; meaningful when error() is DEVICE_ERROR.
    ErrorCode device_status() const
    {
        return std::get<Failure>(data_).status;
    }

    static Result success(T value)
    {
        return Result(std::move(value));
    }

    static Result failure(Error error, ErrorCode status = ErrorCode::NO_ERROR)
    {
        return Result(Failure{error, status});
    }

    template<typename U>
    static Result failure(const Result<U>& other)
    {
        return Result(Failure{other.error(), other.device_status()});
    }

private:
    struct Failure
    {
        Error error;
        ErrorCode status;
    };

    std::variant<T, Failure> data_;

    explicit Result(T value) : data_(std::move(value)) {}
    explicit Result(Failure failure) : data_(failure) {}
};

} // namespace cavro
