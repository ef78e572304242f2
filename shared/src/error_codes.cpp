#include "warpsync/error_codes.hpp"

#include <array>

namespace warpsync
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 12> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::InvalidCommand, "invalid_command"},
            {ErrorCode::InvalidPayload, "invalid_payload"},
            {ErrorCode::NotFound, "not_found"},
            {ErrorCode::Busy, "busy"},
            {ErrorCode::QueueFull, "queue_full"},
            {ErrorCode::ValidationFailed, "validation_failed"},
            {ErrorCode::SpawnFailed, "spawn_failed"},
            {ErrorCode::Timeout, "timeout"},
            {ErrorCode::Cancelled, "cancelled"},
            {ErrorCode::Unsupported, "unsupported"},
            {ErrorCode::InternalError, "internal_error"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (static_cast<std::uint16_t>(entry.code) == value)
            {
                return entry.code;
            }
        }
        return ErrorCode::InternalError;
    }

    TransferError::TransferError(ErrorCode code, const std::string &message)
        : std::runtime_error(message), code_(code) {}

} // namespace warpsync
