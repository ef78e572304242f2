#pragma once

#include <cstdint>

#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>

#include "warpsync/daemon/concurrency_controller.hpp"
#include "warpsync/daemon/config.hpp"
#include "warpsync/daemon/control_server.hpp"
#include "warpsync/daemon/events.hpp"
#include "warpsync/daemon/key_store.hpp"
#include "warpsync/daemon/process_manager.hpp"
#include "warpsync/daemon/state_recovery.hpp"
#include "warpsync/daemon/transfer_queue.hpp"
#include "warpsync/daemon/transfer_store.hpp"

namespace warpsync::daemon
{

    // Composition root: owns the event loop and exactly one instance of every
    // component.
    class Daemon
    {
    public:
        explicit Daemon(DaemonConfig config);
        ~Daemon();

        Daemon(const Daemon &) = delete;
        Daemon &operator=(const Daemon &) = delete;

        // Validates the host, recovers persisted state and serves until
        // SIGINT/SIGTERM or stop().
        void run();

        // Graceful stop: no child process outlives this call.
        void stop();

        std::uint16_t port() const { return server_.port(); }

    private:
        DaemonConfig config_;
        asio::io_context io_context_;
        asio::signal_set signals_;

        EventBus events_;
        KeyStore keys_;
        JsonTransferStore store_;
        ProcessManager processes_;
        ConcurrencyController concurrency_;
        TransferQueue queue_;
        StateRecovery recovery_;
        ControlServer server_;
        bool stopped_{false};
    };

} // namespace warpsync::daemon
