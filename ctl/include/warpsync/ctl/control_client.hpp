#pragma once

#include <cstdint>
#include <string>

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <nlohmann/json.hpp>

#include "warpsync/ctl/logger.hpp"
#include "warpsync/protocol.hpp"

namespace warpsync::ctl
{

    // Blocking request/response client for the daemon's control socket.
    class ControlClient
    {
    public:
        explicit ControlClient(Logger &logger);

        void connect(const std::string &host, std::uint16_t port);

        // Error responses are returned, not thrown; transport and decode
        // failures throw.
        protocol::ResponseEnvelope rpc(protocol::Command command,
                                       const nlohmann::json &payload = nlohmann::json::object());

    private:
        std::string next_request_id();

        Logger &logger_;
        asio::io_context io_context_;
        asio::ip::tcp::socket socket_;
        std::uint64_t request_counter_{0};
    };

} // namespace warpsync::ctl
