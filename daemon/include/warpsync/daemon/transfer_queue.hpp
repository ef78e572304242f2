#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>

#include "warpsync/daemon/concurrency_controller.hpp"
#include "warpsync/daemon/config.hpp"
#include "warpsync/daemon/events.hpp"
#include "warpsync/daemon/process_manager.hpp"
#include "warpsync/daemon/transfer_store.hpp"
#include "warpsync/transfer_types.hpp"

namespace warpsync::daemon
{

    // Scheduler for every transfer the daemon knows about. All state lives on
    // the io_context thread; dispatch and monitoring are timer driven.
    class TransferQueue
    {
    public:
        TransferQueue(asio::io_context &io_context, QueueConfig config, RetryPolicy retry,
                      ConcurrencyController &concurrency, ProcessManager &processes, TransferStore &store,
                      EventSink *events = nullptr);
        ~TransferQueue();

        TransferQueue(const TransferQueue &) = delete;
        TransferQueue &operator=(const TransferQueue &) = delete;

        // Arms the dispatch and cleanup timers.
        void start();

        // Stops the timers and cancels every active transfer.
        void shutdown();

        // Throws TransferError: QueueFull at capacity, ValidationFailed for a
        // spec the command builder rejects.
        std::string enqueue(const TransferSpec &spec);

        // Failures are logged and skipped.
        std::vector<std::string> enqueue_batch(const std::vector<TransferSpec> &specs);

        bool cancel(const std::string &transfer_id);

        std::optional<TransferJob> get(const std::string &transfer_id) const;

        std::vector<TransferJob> list(const TransferFilter &filter = {}) const;

        QueueStats stats() const;

        void set_auto_start(bool enabled);
        bool auto_start() const noexcept { return auto_start_; }

        // One dispatch tick. Returns true when a transfer was handed to the
        // process manager.
        bool dispatch_next();

        // Drops terminal transfers older than the retention window.
        std::size_t cleanup_completed();

        // Adds a record loaded from the store. Active statuses are rejected;
        // recovery resolves them first.
        void restore(TransferJob job);

        std::size_t size() const noexcept { return transfers_.size(); }

        // transfer id -> process id for every transfer with a live process.
        const std::unordered_map<std::string, std::string> &active_processes() const noexcept { return active_; }

    private:
        struct Entry
        {
            TransferJob job;
            std::uint64_t sequence{};
        };

        Entry *find_entry(const std::string &transfer_id);
        Entry *next_candidate();
        bool start_transfer(Entry &entry);
        void monitor(const std::string &transfer_id);
        bool poll_transfer(const std::string &transfer_id);
        void handle_success(Entry &entry);
        void handle_failure(Entry &entry, const std::string &error);
        void schedule_retry(const std::string &transfer_id, std::chrono::milliseconds delay);
        void transition(Entry &entry, TransferStatus status, const std::string &message = {});
        void persist(const TransferJob &job);
        void arm_dispatch_timer();
        void arm_cleanup_timer();

        asio::io_context &io_context_;
        QueueConfig config_;
        RetryPolicy retry_;
        ConcurrencyController &concurrency_;
        ProcessManager &processes_;
        TransferStore &store_;
        EventSink *events_;

        bool auto_start_;
        bool running_{false};
        std::uint64_t next_sequence_{0};
        std::unordered_map<std::string, Entry> transfers_;
        std::unordered_map<std::string, std::string> active_;
        std::unordered_map<std::string, std::unique_ptr<asio::steady_timer>> monitors_;
        std::unordered_map<std::string, std::unique_ptr<asio::steady_timer>> retry_timers_;
        asio::steady_timer dispatch_timer_;
        asio::steady_timer cleanup_timer_;
    };

} // namespace warpsync::daemon
