#include "warpsync/protocol.hpp"

#include <array>
#include <utility>

namespace warpsync::protocol
{

    namespace
    {

        struct CommandMapping
        {
            Command command;
            std::string_view label;
        };

        constexpr std::array<CommandMapping, 8> kCommandMappings{{
            {Command::Enqueue, "ENQUEUE"},
            {Command::EnqueueBatch, "ENQUEUE_BATCH"},
            {Command::Cancel, "CANCEL"},
            {Command::Get, "GET"},
            {Command::List, "LIST"},
            {Command::Stats, "STATS"},
            {Command::Health, "HEALTH"},
            {Command::Ping, "PING"},
        }};

        struct ResponseKindMapping
        {
            ResponseKind kind;
            std::string_view label;
        };

        constexpr std::array<ResponseKindMapping, 2> kResponseMappings{{
            {ResponseKind::Ok, "OK"},
            {ResponseKind::Error, "ERROR"},
        }};

        std::optional<std::string> read_request_id(const nlohmann::json &json)
        {
            if (auto it = json.find("id"); it != json.end() && !it->is_null())
            {
                return it->get<std::string>();
            }
            return std::nullopt;
        }

    } // namespace

    std::string_view to_string(Command command) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.command == command)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<Command> command_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.label == value)
            {
                return mapping.command;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(ResponseKind kind) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.label == value)
            {
                return mapping.kind;
            }
        }
        return std::nullopt;
    }

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope)
    {
        json = {
            {"cmd", to_string(envelope.command)},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
    }

    void from_json(const nlohmann::json &json, RequestEnvelope &envelope)
    {
        const auto cmd_label = json.at("cmd").get<std::string>();
        auto cmd = command_from_string(cmd_label);
        if (!cmd)
        {
            throw TransferError(ErrorCode::InvalidCommand, "Unknown command: " + cmd_label);
        }
        envelope.command = *cmd;
        envelope.payload = json.value("payload", nlohmann::json::object());
        envelope.request_id = read_request_id(json);
    }

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope)
    {
        json = {
            {"status", to_string(envelope.kind)},
            {"error", to_int(envelope.error)},
            {"message", envelope.message},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
    }

    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope)
    {
        const auto status_label = json.at("status").get<std::string>();
        auto kind = response_kind_from_string(status_label);
        if (!kind)
        {
            throw TransferError(ErrorCode::InvalidPayload, "Unknown response status: " + status_label);
        }
        envelope.kind = *kind;
        const auto error_value = json.value("error", 0u);
        envelope.error = error_code_from_int(static_cast<std::uint16_t>(error_value));
        envelope.message = json.value("message", std::string{});
        envelope.payload = json.value("payload", nlohmann::json::object());
        envelope.request_id = read_request_id(json);
    }

    void to_json(nlohmann::json &json, const EnqueueResponse &response)
    {
        json = {{"transfer_id", response.transfer_id}};
    }

    void from_json(const nlohmann::json &json, EnqueueResponse &response)
    {
        response.transfer_id = json.at("transfer_id").get<std::string>();
    }

    void to_json(nlohmann::json &json, const EnqueueBatchRequest &request)
    {
        json = {{"transfers", request.transfers}};
    }

    void from_json(const nlohmann::json &json, EnqueueBatchRequest &request)
    {
        request.transfers = json.at("transfers").get<std::vector<TransferSpec>>();
    }

    void to_json(nlohmann::json &json, const EnqueueBatchResponse &response)
    {
        json = {
            {"transfer_ids", response.transfer_ids},
            {"rejected", response.rejected},
        };
    }

    void from_json(const nlohmann::json &json, EnqueueBatchResponse &response)
    {
        response.transfer_ids = json.value("transfer_ids", std::vector<std::string>{});
        response.rejected = json.value("rejected", std::size_t{0});
    }

    void to_json(nlohmann::json &json, const TransferIdRequest &request)
    {
        json = {{"transfer_id", request.transfer_id}};
    }

    void from_json(const nlohmann::json &json, TransferIdRequest &request)
    {
        request.transfer_id = json.at("transfer_id").get<std::string>();
    }

    void to_json(nlohmann::json &json, const CancelResponse &response)
    {
        json = {{"cancelled", response.cancelled}};
    }

    void from_json(const nlohmann::json &json, CancelResponse &response)
    {
        response.cancelled = json.value("cancelled", false);
    }

    ResponseEnvelope make_ok_response(nlohmann::json payload, std::optional<std::string> request_id)
    {
        ResponseEnvelope envelope;
        envelope.kind = ResponseKind::Ok;
        envelope.error = ErrorCode::Ok;
        envelope.payload = std::move(payload);
        envelope.request_id = std::move(request_id);
        return envelope;
    }

    ResponseEnvelope make_error_response(ErrorCode code, std::string message, std::optional<std::string> request_id)
    {
        ResponseEnvelope envelope;
        envelope.kind = ResponseKind::Error;
        envelope.error = code;
        envelope.message = std::move(message);
        envelope.request_id = std::move(request_id);
        return envelope;
    }

} // namespace warpsync::protocol
