#pragma once

#include <cstdint>
#include <string>

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>

#include "warpsync/daemon/control_session.hpp"

namespace warpsync::daemon
{

    // Accepts control connections on the daemon's event loop.
    class ControlServer
    {
    public:
        ControlServer(asio::io_context &io_context, const std::string &address, std::uint16_t port,
                      ControlServices services);

        void start();

        void stop();

        // Actual bound port; differs from the configured one when that was 0.
        std::uint16_t port() const;

    private:
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);

        asio::ip::tcp::acceptor acceptor_;
        ControlServices services_;
    };

} // namespace warpsync::daemon
