#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>
#include <nlohmann/json.hpp>

#include "warpsync/daemon/concurrency_controller.hpp"
#include "warpsync/daemon/config.hpp"
#include "warpsync/daemon/process_manager.hpp"
#include "warpsync/daemon/transfer_queue.hpp"
#include "warpsync/daemon/transfer_store.hpp"

namespace warpsync::daemon
{

    struct RecoveryResult
    {
        std::size_t recovered{};
        std::size_t orphaned{};
        std::size_t cleaned{};
    };

    void to_json(nlohmann::json &json, const RecoveryResult &result);

    enum class IssueKind : std::uint8_t
    {
        MissingInMemory,
        MissingInStore,
        StateMismatch,
        SlotConflict
    };

    std::string_view to_string(IssueKind kind) noexcept;

    enum class IssueSeverity : std::uint8_t
    {
        Info,
        Warning,
        Error
    };

    std::string_view to_string(IssueSeverity severity) noexcept;

    struct ConsistencyIssue
    {
        IssueKind kind{IssueKind::StateMismatch};
        IssueSeverity severity{IssueSeverity::Warning};
        std::string transfer_id;
        std::string message;
    };

    void to_json(nlohmann::json &json, const ConsistencyIssue &issue);

    struct HealthReport
    {
        bool healthy{};
        bool store_accessible{};
        std::size_t stored_records{};
        std::size_t orphaned{};
        std::vector<ConsistencyIssue> issues;
        ConcurrencySnapshot concurrency;
        ProcessStats processes;
        QueueStats queue;
    };

    void to_json(nlohmann::json &json, const HealthReport &report);

    // Reconciles the persisted catalog with the live queue, process table and
    // slot accounting.
    class StateRecovery
    {
    public:
        StateRecovery(asio::io_context &io_context, RecoveryConfig config, std::chrono::milliseconds retention,
                      TransferStore &store, TransferQueue &queue, ProcessManager &processes,
                      ConcurrencyController &concurrency);
        ~StateRecovery();

        StateRecovery(const StateRecovery &) = delete;
        StateRecovery &operator=(const StateRecovery &) = delete;

        // Startup pass. Must run before the queue starts dispatching.
        RecoveryResult recover();

        // Arms the periodic orphan sweep.
        void start();
        void stop();

        // Repairs drift while the daemon is running. Returns the number of
        // orphans resolved.
        std::size_t sweep_orphans();

        // Reports discrepancies without changing anything.
        std::vector<ConsistencyIssue> validate() const;

        HealthReport health() const;

    private:
        TransferJob resolve_orphan(TransferJob job) const;
        void save_resolved(const TransferJob &job);
        void arm_sweep_timer();

        RecoveryConfig config_;
        std::chrono::milliseconds retention_;
        TransferStore &store_;
        TransferQueue &queue_;
        ProcessManager &processes_;
        ConcurrencyController &concurrency_;
        asio::steady_timer sweep_timer_;
        bool running_{false};
    };

} // namespace warpsync::daemon
