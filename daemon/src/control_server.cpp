#include "warpsync/daemon/control_server.hpp"

#include <asio/ip/address.hpp>

#include <spdlog/spdlog.h>

namespace warpsync::daemon
{

    ControlServer::ControlServer(asio::io_context &io_context, const std::string &address, std::uint16_t port,
                                 ControlServices services)
        : acceptor_(io_context), services_(services)
    {
        const asio::ip::tcp::endpoint endpoint(asio::ip::make_address(address), port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();
        spdlog::info("Control socket listening on {}:{}", address, this->port());
    }

    void ControlServer::start()
    {
        accept_next();
    }

    void ControlServer::stop()
    {
        std::error_code ec;
        acceptor_.close(ec);
        if (ec)
        {
            spdlog::warn("Closing control socket: {}", ec.message());
        }
    }

    std::uint16_t ControlServer::port() const
    {
        std::error_code ec;
        const auto endpoint = acceptor_.local_endpoint(ec);
        return ec ? 0 : endpoint.port();
    }

    void ControlServer::accept_next()
    {
        acceptor_.async_accept([this](const std::error_code &ec, asio::ip::tcp::socket socket)
                               { on_accept(ec, std::move(socket)); });
    }

    void ControlServer::on_accept(std::error_code ec, asio::ip::tcp::socket socket)
    {
        if (!ec)
        {
            std::make_shared<ControlSession>(std::move(socket), services_)->start();
        }
        if (!acceptor_.is_open() || ec == asio::error::operation_aborted)
        {
            return;
        }
        if (ec)
        {
            spdlog::error("Accept error: {}", ec.message());
        }
        accept_next();
    }

} // namespace warpsync::daemon
