#include "warpsync/ctl/control_client.hpp"

#include <asio/connect.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>

#include <array>
#include <span>
#include <vector>

#include "warpsync/error_codes.hpp"
#include "warpsync/framing.hpp"

namespace warpsync::ctl
{

    ControlClient::ControlClient(Logger &logger)
        : logger_(logger), socket_(io_context_)
    {
    }

    void ControlClient::connect(const std::string &host, std::uint16_t port)
    {
        asio::ip::tcp::resolver resolver(io_context_);
        const auto results = resolver.resolve(host, std::to_string(port));
        asio::connect(socket_, results);
        logger_.log("info", "connected to ", host, ':', port);
    }

    protocol::ResponseEnvelope ControlClient::rpc(protocol::Command command, const nlohmann::json &payload)
    {
        protocol::RequestEnvelope envelope;
        envelope.command = command;
        envelope.payload = payload;
        envelope.request_id = next_request_id();

        const auto frame = protocol::encode_frame(nlohmann::json(envelope));
        asio::write(socket_, asio::buffer(frame));

        std::array<std::uint8_t, 4> header{};
        asio::read(socket_, asio::buffer(header));
        const auto size = protocol::read_frame_size(std::span<const std::uint8_t, 4>(header));
        if (size > protocol::kMaxFrameSize)
        {
            throw TransferError(ErrorCode::InvalidPayload, "Response frame too large");
        }
        std::vector<char> buffer(size);
        asio::read(socket_, asio::buffer(buffer.data(), buffer.size()));

        nlohmann::json json_response;
        try
        {
            json_response = nlohmann::json::parse(std::string(buffer.begin(), buffer.end()));
        }
        catch (const nlohmann::json::exception &ex)
        {
            logger_.log("rpc", "parse_error size=", size, " msg=", ex.what());
            throw TransferError(ErrorCode::InvalidPayload, "Failed to decode daemon response");
        }
        auto response = json_response.get<protocol::ResponseEnvelope>();
        if (response.kind == protocol::ResponseKind::Error)
        {
            logger_.log("rpc", "error=", to_string(response.error), " msg=", response.message);
        }
        else
        {
            logger_.log("rpc", "success cmd=", protocol::to_string(command));
        }
        return response;
    }

    std::string ControlClient::next_request_id()
    {
        return "req-" + std::to_string(++request_counter_);
    }

} // namespace warpsync::ctl
