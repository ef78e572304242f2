#include "warpsync/daemon/daemon.hpp"

#include <csignal>
#include <memory>

#include <spdlog/spdlog.h>

#include "warpsync/daemon/system_validator.hpp"
#include "warpsync/version.hpp"

namespace warpsync::daemon
{

    Daemon::Daemon(DaemonConfig config)
        : config_(std::move(config)),
          io_context_(1),
          signals_(io_context_),
          keys_(config_.keys_directory()),
          store_(config_.transfers_directory()),
          processes_(io_context_, config_.process, keys_, &events_),
          concurrency_(config_.queue.max_concurrent_transfers, config_.concurrency),
          queue_(io_context_, config_.queue, config_.retry, concurrency_, processes_, store_, &events_),
          recovery_(io_context_, config_.recovery, config_.queue.retention, store_, queue_, processes_, concurrency_),
          server_(io_context_, config_.address, config_.port, ControlServices{queue_, recovery_})
    {
        events_.subscribe(std::make_shared<LoggingEventSink>());
        if (config_.events_file)
        {
            events_.subscribe(std::make_shared<JsonLinesEventSink>(*config_.events_file));
            spdlog::info("Writing transfer events to {}", config_.events_file->string());
        }

        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const std::error_code &ec, int signal)
                            {
                                if (!ec)
                                {
                                    spdlog::info("Signal {} received, shutting down", signal);
                                    stop();
                                } });
    }

    Daemon::~Daemon()
    {
        stop();
    }

    void Daemon::run()
    {
        SystemValidator(config_.process).validate(config_.state_directory, true);

        const auto recovered = recovery_.recover();
        if (recovered.orphaned > 0)
        {
            spdlog::warn("{} transfer(s) were interrupted by the previous shutdown", recovered.orphaned);
        }

        queue_.start();
        recovery_.start();
        server_.start();

        spdlog::info("warpsyncd {} ready: {} transfer(s) known, global limit {}", version(), queue_.size(),
                     concurrency_.global_limit());
        io_context_.run();
    }

    void Daemon::stop()
    {
        if (stopped_)
        {
            return;
        }
        stopped_ = true;

        server_.stop();
        recovery_.stop();
        queue_.shutdown();
        processes_.shutdown();

        std::error_code ec;
        signals_.cancel(ec);
        io_context_.stop();
        spdlog::info("warpsyncd stopped");
    }

} // namespace warpsync::daemon
