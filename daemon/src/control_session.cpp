#include "warpsync/daemon/control_session.hpp"

#include <asio/read.hpp>
#include <asio/write.hpp>

#include <span>

#include <spdlog/spdlog.h>

#include "warpsync/framing.hpp"
#include "warpsync/version.hpp"

namespace warpsync::daemon
{

    ControlSession::ControlSession(asio::ip::tcp::socket socket, ControlServices services)
        : socket_(std::move(socket)), services_(services)
    {
    }

    void ControlSession::start()
    {
        spdlog::debug("Control client connected from {}", remote_endpoint());
        read_frame_header();
    }

    void ControlSession::stop()
    {
        if (closed_)
        {
            return;
        }
        closed_ = true;
        std::error_code ec;
        spdlog::debug("Closing control connection for {}", remote_endpoint());
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

    void ControlSession::read_frame_header()
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(header_buffer_),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             const auto payload_size = protocol::read_frame_size(std::span<const std::uint8_t, 4>(header_buffer_));
                             if (payload_size == 0)
                             {
                                 read_frame_header();
                                 return;
                             }
                             if (payload_size > protocol::kMaxFrameSize)
                             {
                                 spdlog::warn("Dropping {}: frame of {} bytes exceeds limit", remote_endpoint(), payload_size);
                                 send_error(ErrorCode::InvalidPayload, "Frame too large");
                                 stop();
                                 return;
                             }
                             buffer_.resize(payload_size);
                             read_frame_payload(payload_size);
                         });
    }

    void ControlSession::read_frame_payload(std::size_t size)
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(buffer_.data(), size),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             try
                             {
                                 const std::string payload(reinterpret_cast<const char *>(buffer_.data()), buffer_.size());
                                 process_message(nlohmann::json::parse(payload));
                             }
                             catch (const nlohmann::json::exception &ex)
                             {
                                 send_error(ErrorCode::InvalidPayload, ex.what());
                             }
                             read_frame_header();
                         });
    }

    void ControlSession::process_message(const nlohmann::json &json)
    {
        protocol::RequestEnvelope envelope;
        try
        {
            envelope = json.get<protocol::RequestEnvelope>();
        }
        catch (const TransferError &ex)
        {
            send_error(ex.code(), ex.what(), json.contains("id") && json["id"].is_string()
                                                 ? std::optional<std::string>(json["id"].get<std::string>())
                                                 : std::nullopt);
            return;
        }

        spdlog::debug("{} -> command {}", remote_endpoint(), protocol::to_string(envelope.command));
        try
        {
            dispatch(envelope);
        }
        catch (const TransferError &ex)
        {
            spdlog::warn("{} {} rejected: {}", remote_endpoint(), protocol::to_string(envelope.command), ex.what());
            send_error(ex.code(), ex.what(), envelope.request_id);
        }
        catch (const nlohmann::json::exception &ex)
        {
            send_error(ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
        }
    }

    void ControlSession::dispatch(const protocol::RequestEnvelope &envelope)
    {
        switch (envelope.command)
        {
        case protocol::Command::Enqueue:
            handle_enqueue(envelope);
            break;
        case protocol::Command::EnqueueBatch:
            handle_enqueue_batch(envelope);
            break;
        case protocol::Command::Cancel:
            handle_cancel(envelope);
            break;
        case protocol::Command::Get:
            handle_get(envelope);
            break;
        case protocol::Command::List:
            handle_list(envelope);
            break;
        case protocol::Command::Stats:
            handle_stats(envelope);
            break;
        case protocol::Command::Health:
            handle_health(envelope);
            break;
        case protocol::Command::Ping:
            send_response(protocol::make_ok_response({{"version", std::string(version())}}, envelope.request_id));
            break;
        default:
            send_error(ErrorCode::Unsupported, "Command not supported", envelope.request_id);
            break;
        }
    }

    void ControlSession::send_response(const protocol::ResponseEnvelope &envelope)
    {
        if (closed_)
        {
            return;
        }
        outbox_.push_back(protocol::encode_frame(nlohmann::json(envelope)));
        if (outbox_.size() == 1)
        {
            write_next();
        }
    }

    // Pipelined requests may produce a response while the previous write is
    // still in flight; frames go out strictly one at a time.
    void ControlSession::write_next()
    {
        if (closed_ || outbox_.empty())
        {
            return;
        }
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(outbox_.front()),
                          [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          {
                              if (ec)
                              {
                                  outbox_.clear();
                                  stop();
                                  return;
                              }
                              outbox_.pop_front();
                              write_next();
                          });
    }

    void ControlSession::send_error(ErrorCode code, std::string message, std::optional<std::string> request_id)
    {
        send_response(protocol::make_error_response(code, std::move(message), std::move(request_id)));
    }

    void ControlSession::handle_enqueue(const protocol::RequestEnvelope &envelope)
    {
        const auto spec = envelope.payload.get<TransferSpec>();
        const auto transfer_id = services_.queue.enqueue(spec);
        send_response(protocol::make_ok_response(protocol::EnqueueResponse{transfer_id}, envelope.request_id));
    }

    void ControlSession::handle_enqueue_batch(const protocol::RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<protocol::EnqueueBatchRequest>();
        protocol::EnqueueBatchResponse response;
        response.transfer_ids = services_.queue.enqueue_batch(request.transfers);
        response.rejected = request.transfers.size() - response.transfer_ids.size();
        send_response(protocol::make_ok_response(response, envelope.request_id));
    }

    void ControlSession::handle_cancel(const protocol::RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<protocol::TransferIdRequest>();
        const bool cancelled = services_.queue.cancel(request.transfer_id);
        spdlog::info("Cancel request for {} from {}: {}", request.transfer_id, remote_endpoint(),
                     cancelled ? "cancelled" : "nothing to cancel");
        send_response(protocol::make_ok_response(protocol::CancelResponse{cancelled}, envelope.request_id));
    }

    void ControlSession::handle_get(const protocol::RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<protocol::TransferIdRequest>();
        auto job = services_.queue.get(request.transfer_id);
        if (!job)
        {
            send_error(ErrorCode::NotFound, "Transfer not found: " + request.transfer_id, envelope.request_id);
            return;
        }
        send_response(protocol::make_ok_response(to_public_json(*job), envelope.request_id));
    }

    void ControlSession::handle_list(const protocol::RequestEnvelope &envelope)
    {
        const auto filter = envelope.payload.is_object() ? envelope.payload.get<TransferFilter>() : TransferFilter{};
        auto transfers = nlohmann::json::array();
        for (const auto &job : services_.queue.list(filter))
        {
            transfers.push_back(to_public_json(job));
        }
        send_response(protocol::make_ok_response({{"transfers", std::move(transfers)}}, envelope.request_id));
    }

    void ControlSession::handle_stats(const protocol::RequestEnvelope &envelope)
    {
        nlohmann::json payload = services_.queue.stats();
        payload["auto_start"] = services_.queue.auto_start();
        send_response(protocol::make_ok_response(std::move(payload), envelope.request_id));
    }

    void ControlSession::handle_health(const protocol::RequestEnvelope &envelope)
    {
        send_response(protocol::make_ok_response(services_.recovery.health(), envelope.request_id));
    }

    std::string ControlSession::remote_endpoint() const
    {
        std::error_code ec;
        const auto endpoint = socket_.remote_endpoint(ec);
        if (ec)
        {
            return "unknown";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

} // namespace warpsync::daemon
