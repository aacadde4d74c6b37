#pragma once

#include <variant>
#include <string>
#include <utility>
#include <functional>
#include <chrono>

namespace bledom {

enum class Error
{
    // transport
    PORT_ERROR,
    TIMEOUT,
    READ_ERROR,
    WRITE_ERROR,
    INVALID_RESPONSE,
    DEVICE_ERROR,

    // acquisition
    NO_ADAPTERS_FOUND,
    SCAN_ERROR,
    DEVICE_NOT_FOUND,
    PROPERTIES_UNAVAILABLE,
    CONNECTION_FAILED,
    SERVICE_DISCOVERY_ERROR,
    CHARACTERISTIC_NOT_FOUND,

    // command codec
    INVALID_PARAMETER
};

const char* to_string(Error error);

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

    T& value()
    {
        return std::get<T>(data_);
    }

    const T* value_if() const
    {
        return std::get_if<T>(&data_);
    }

    Error error() const
    {
        return std::get<Error>(data_);
    }

    // Free-form context for the failure, empty on success.
    const std::string& detail() const
    {
        return detail_;
    }

    std::string describe() const
    {
        if (ok())
            return "OK";
        if (detail_.empty())
            return to_string(error());
        return std::string(to_string(error())) + ": " + detail_;
    }

    static Result success(T value)
    {
        return Result(std::move(value));
    }

    static Result failure(Error error, std::string detail = {})
    {
        return Result(error, std::move(detail));
    }

    // Re-wraps the failure of a Result holding another type.
    template<typename U>
    static Result failure(const Result<U>& other)
    {
        return Result(other.error(), other.detail());
    }

private:
    std::variant<T, Error> data_;
    std::string detail_;

    explicit Result(T value) : data_(std::move(value)) {}
    Result(Error error, std::string detail) : data_(error), detail_(std::move(detail)) {}
};

using LogCallback = std::function<void(const std::string&)>;
using SleepFunction = std::function<void(std::chrono::milliseconds)>;

} // namespace bledom
