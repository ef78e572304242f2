#pragma once

#include <array>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <asio/ip/tcp.hpp>
#include <nlohmann/json.hpp>

#include "warpsync/daemon/state_recovery.hpp"
#include "warpsync/daemon/transfer_queue.hpp"
#include "warpsync/error_codes.hpp"
#include "warpsync/protocol.hpp"

namespace warpsync::daemon
{

    struct ControlServices
    {
        TransferQueue &queue;
        StateRecovery &recovery;
    };

    // One control connection. Requests are handled one at a time on the
    // daemon's event loop.
    class ControlSession : public std::enable_shared_from_this<ControlSession>
    {
    public:
        ControlSession(asio::ip::tcp::socket socket, ControlServices services);

        void start();

        void stop();

    private:
        void read_frame_header();
        void read_frame_payload(std::size_t size);
        void process_message(const nlohmann::json &json);
        void dispatch(const protocol::RequestEnvelope &envelope);
        void send_response(const protocol::ResponseEnvelope &envelope);
        void write_next();
        void send_error(ErrorCode code, std::string message, std::optional<std::string> request_id = std::nullopt);

        void handle_enqueue(const protocol::RequestEnvelope &envelope);
        void handle_enqueue_batch(const protocol::RequestEnvelope &envelope);
        void handle_cancel(const protocol::RequestEnvelope &envelope);
        void handle_get(const protocol::RequestEnvelope &envelope);
        void handle_list(const protocol::RequestEnvelope &envelope);
        void handle_stats(const protocol::RequestEnvelope &envelope);
        void handle_health(const protocol::RequestEnvelope &envelope);

        std::string remote_endpoint() const;

        asio::ip::tcp::socket socket_;
        ControlServices services_;
        std::array<std::uint8_t, 4> header_buffer_{};
        std::vector<std::uint8_t> buffer_;
        std::deque<std::vector<std::uint8_t>> outbox_;
        bool closed_{false};
    };

} // namespace warpsync::daemon
