/**
 * WarpSync - Shared error codes used across daemon, control protocol and client.
 */
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace warpsync
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidCommand = 1,
        InvalidPayload = 2,
        NotFound = 3,
        Busy = 4,
        QueueFull = 5,
        ValidationFailed = 6,
        SpawnFailed = 7,
        Timeout = 8,
        Cancelled = 9,
        Unsupported = 10,
        InternalError = 11
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

    class TransferError : public std::runtime_error
    {
    public:
        TransferError(ErrorCode code, const std::string &message);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

} // namespace warpsync
