/**
 * WarpSync - Control protocol schema spoken between warpsyncctl and warpsyncd.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "warpsync/error_codes.hpp"
#include "warpsync/transfer_types.hpp"

namespace warpsync::protocol
{

    enum class Command : std::uint8_t
    {
        Enqueue,
        EnqueueBatch,
        Cancel,
        Get,
        List,
        Stats,
        Health,
        Ping
    };

    std::string_view to_string(Command command) noexcept;
    std::optional<Command> command_from_string(std::string_view value) noexcept;

    enum class ResponseKind : std::uint8_t
    {
        Ok = 0,
        Error = 1
    };

    std::string_view to_string(ResponseKind kind) noexcept;
    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept;

    struct RequestEnvelope
    {
        Command command{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope);
    void from_json(const nlohmann::json &json, RequestEnvelope &envelope);

    struct ResponseEnvelope
    {
        ResponseKind kind{ResponseKind::Ok};
        ErrorCode error{ErrorCode::Ok};
        std::string message{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope);
    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope);

    // ENQUEUE carries a TransferSpec as its payload directly.
    struct EnqueueResponse
    {
        std::string transfer_id;
    };

    void to_json(nlohmann::json &json, const EnqueueResponse &response);
    void from_json(const nlohmann::json &json, EnqueueResponse &response);

    struct EnqueueBatchRequest
    {
        std::vector<TransferSpec> transfers;
    };

    void to_json(nlohmann::json &json, const EnqueueBatchRequest &request);
    void from_json(const nlohmann::json &json, EnqueueBatchRequest &request);

    struct EnqueueBatchResponse
    {
        std::vector<std::string> transfer_ids;
        std::size_t rejected{};
    };

    void to_json(nlohmann::json &json, const EnqueueBatchResponse &response);
    void from_json(const nlohmann::json &json, EnqueueBatchResponse &response);

    // CANCEL and GET.
    struct TransferIdRequest
    {
        std::string transfer_id;
    };

    void to_json(nlohmann::json &json, const TransferIdRequest &request);
    void from_json(const nlohmann::json &json, TransferIdRequest &request);

    struct CancelResponse
    {
        bool cancelled{};
    };

    void to_json(nlohmann::json &json, const CancelResponse &response);
    void from_json(const nlohmann::json &json, CancelResponse &response);

    ResponseEnvelope make_ok_response(nlohmann::json payload, std::optional<std::string> request_id = std::nullopt);
    ResponseEnvelope make_error_response(ErrorCode code, std::string message,
                                         std::optional<std::string> request_id = std::nullopt);

} // namespace warpsync::protocol
