#include "warpsync/daemon/state_recovery.hpp"

#include <algorithm>
#include <array>
#include <exception>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include <spdlog/spdlog.h>

#include "warpsync/error_codes.hpp"

namespace warpsync::daemon
{

    namespace
    {

        constexpr std::array<std::pair<IssueKind, std::string_view>, 4> kIssueKindMapping{{
            {IssueKind::MissingInMemory, "missing_in_memory"},
            {IssueKind::MissingInStore, "missing_in_store"},
            {IssueKind::StateMismatch, "state_mismatch"},
            {IssueKind::SlotConflict, "slot_conflict"},
        }};

        constexpr std::array<std::pair<IssueSeverity, std::string_view>, 3> kSeverityMapping{{
            {IssueSeverity::Info, "info"},
            {IssueSeverity::Warning, "warning"},
            {IssueSeverity::Error, "error"},
        }};

        bool is_stale(const TransferJob &job, TimePoint cutoff)
        {
            return is_terminal(job.status) && job.completed_at && *job.completed_at < cutoff;
        }

    } // namespace

    std::string_view to_string(IssueKind kind) noexcept
    {
        for (const auto &[value, label] : kIssueKindMapping)
        {
            if (value == kind)
            {
                return label;
            }
        }
        return "unknown";
    }

    std::string_view to_string(IssueSeverity severity) noexcept
    {
        for (const auto &[value, label] : kSeverityMapping)
        {
            if (value == severity)
            {
                return label;
            }
        }
        return "unknown";
    }

    void to_json(nlohmann::json &json, const RecoveryResult &result)
    {
        json = {
            {"recovered", result.recovered},
            {"orphaned", result.orphaned},
            {"cleaned", result.cleaned},
        };
    }

    void to_json(nlohmann::json &json, const ConsistencyIssue &issue)
    {
        json = {
            {"kind", to_string(issue.kind)},
            {"severity", to_string(issue.severity)},
            {"transfer_id", issue.transfer_id},
            {"message", issue.message},
        };
    }

    void to_json(nlohmann::json &json, const HealthReport &report)
    {
        json = {
            {"healthy", report.healthy},
            {"store_accessible", report.store_accessible},
            {"stored_records", report.stored_records},
            {"orphaned", report.orphaned},
            {"issues", report.issues},
            {"concurrency", report.concurrency},
            {"processes", report.processes},
            {"queue", report.queue},
        };
    }

    StateRecovery::StateRecovery(asio::io_context &io_context, RecoveryConfig config,
                                 std::chrono::milliseconds retention, TransferStore &store, TransferQueue &queue,
                                 ProcessManager &processes, ConcurrencyController &concurrency)
        : config_(config), retention_(retention), store_(store), queue_(queue), processes_(processes),
          concurrency_(concurrency), sweep_timer_(io_context)
    {
    }

    StateRecovery::~StateRecovery()
    {
        stop();
    }

    RecoveryResult StateRecovery::recover()
    {
        RecoveryResult result;
        const auto cutoff = Clock::now() - retention_;
        auto records = store_.load_all();
        std::sort(records.begin(), records.end(), [](const TransferJob &lhs, const TransferJob &rhs)
                  { return lhs.created_at < rhs.created_at; });

        spdlog::info("Starting state recovery ({} persisted transfer(s))", records.size());
        for (auto &record : records)
        {
            if (queue_.get(record.id))
            {
                continue;
            }
            if (config_.purge_stale && is_stale(record, cutoff))
            {
                store_.remove(record.id);
                ++result.cleaned;
                continue;
            }

            if (is_active(record.status))
            {
                ++result.orphaned;
                record = resolve_orphan(std::move(record));
                save_resolved(record);
            }
            else if (record.status == TransferStatus::Retrying || record.status == TransferStatus::Scheduled)
            {
                spdlog::info("Transfer {} re-queued from {}", record.id, to_string(record.status));
                record.status = TransferStatus::Queued;
                save_resolved(record);
            }

            if (!is_terminal(record.status))
            {
                ++result.recovered;
            }
            queue_.restore(std::move(record));
        }

        spdlog::info("State recovery finished: {} recovered, {} orphaned, {} cleaned", result.recovered,
                     result.orphaned, result.cleaned);
        return result;
    }

    void StateRecovery::start()
    {
        if (running_)
        {
            return;
        }
        running_ = true;
        arm_sweep_timer();
    }

    void StateRecovery::stop()
    {
        running_ = false;
        sweep_timer_.cancel();
    }

    std::size_t StateRecovery::sweep_orphans()
    {
        std::size_t orphans = 0;
        const auto &active = queue_.active_processes();

        // Slots whose holder is no longer running.
        for (const auto &[transfer_id, job_id] : concurrency_.holders())
        {
            if (active.count(transfer_id) == 0)
            {
                spdlog::warn("Releasing orphaned slot held by transfer {} (job {})", transfer_id, job_id);
                concurrency_.release(job_id, transfer_id);
                ++orphans;
            }
        }

        // Processes nothing in the queue is waiting for.
        std::unordered_set<std::string> known_processes;
        for (const auto &[transfer_id, process_id] : active)
        {
            known_processes.insert(process_id);
        }
        for (const auto &process : processes_.active())
        {
            if (known_processes.count(process.id) == 0)
            {
                spdlog::warn("Cancelling orphaned process {} for transfer {}", process.id, process.transfer_id);
                processes_.cancel(process.id);
                ++orphans;
            }
        }

        // Records the store still shows as running.
        for (auto &record : store_.load_all())
        {
            if (!is_active(record.status))
            {
                continue;
            }
            auto live = queue_.get(record.id);
            if (live && is_active(live->status))
            {
                continue;
            }
            ++orphans;
            if (live)
            {
                spdlog::warn("Store shows transfer {} as {}, queue has {}", record.id, to_string(record.status),
                             to_string(live->status));
                store_.save(*live);
                continue;
            }
            auto resolved = resolve_orphan(std::move(record));
            store_.save(resolved);
            queue_.restore(std::move(resolved));
        }

        if (orphans > 0)
        {
            spdlog::info("Orphan sweep resolved {} issue(s)", orphans);
        }
        return orphans;
    }

    std::vector<ConsistencyIssue> StateRecovery::validate() const
    {
        std::vector<ConsistencyIssue> issues;

        std::unordered_map<std::string, TransferJob> stored;
        for (auto &record : store_.load_all())
        {
            auto id = record.id;
            stored.emplace(std::move(id), std::move(record));
        }
        const auto live = queue_.list();
        const auto &active = queue_.active_processes();

        for (const auto &job : live)
        {
            auto it = stored.find(job.id);
            if (it == stored.end())
            {
                issues.push_back({.kind = IssueKind::MissingInStore,
                                  .severity = IssueSeverity::Error,
                                  .transfer_id = job.id,
                                  .message = "Transfer is not persisted"});
                continue;
            }
            if (it->second.status != job.status)
            {
                const bool running = is_active(job.status) || is_active(it->second.status);
                issues.push_back({.kind = IssueKind::StateMismatch,
                                  .severity = running ? IssueSeverity::Error : IssueSeverity::Warning,
                                  .transfer_id = job.id,
                                  .message = "Store has " + std::string(to_string(it->second.status)) +
                                             ", queue has " + std::string(to_string(job.status))});
            }
            stored.erase(it);
        }
        for (const auto &[id, record] : stored)
        {
            issues.push_back({.kind = IssueKind::MissingInMemory,
                              .severity = is_terminal(record.status) ? IssueSeverity::Info : IssueSeverity::Warning,
                              .transfer_id = id,
                              .message = "Persisted as " + std::string(to_string(record.status)) +
                                         " but unknown to the queue"});
        }

        // Every held slot must belong to exactly one running transfer.
        std::unordered_map<std::string, std::string> owners;
        for (const auto &[transfer_id, process_id] : active)
        {
            auto [it, inserted] = owners.emplace(process_id, transfer_id);
            if (!inserted)
            {
                issues.push_back({.kind = IssueKind::SlotConflict,
                                  .severity = IssueSeverity::Error,
                                  .transfer_id = transfer_id,
                                  .message = "Process " + process_id + " is also claimed by " + it->second});
            }
        }
        for (const auto &[transfer_id, job_id] : concurrency_.holders())
        {
            if (active.count(transfer_id) == 0)
            {
                issues.push_back({.kind = IssueKind::SlotConflict,
                                  .severity = IssueSeverity::Error,
                                  .transfer_id = transfer_id,
                                  .message = "Holds a slot of job " + job_id + " without a running process"});
            }
        }
        for (const auto &slots : concurrency_.snapshot().job_breakdown)
        {
            if (slots.active > slots.limit)
            {
                issues.push_back({.kind = IssueKind::SlotConflict,
                                  .severity = IssueSeverity::Error,
                                  .transfer_id = {},
                                  .message = "Job " + slots.job_id + " holds " + std::to_string(slots.active) +
                                             " slots, limit " + std::to_string(slots.limit)});
            }
        }
        return issues;
    }

    HealthReport StateRecovery::health() const
    {
        HealthReport report;
        report.concurrency = concurrency_.snapshot();
        report.processes = processes_.stats();
        report.queue = queue_.stats();
        try
        {
            const auto records = store_.load_all();
            report.store_accessible = true;
            report.stored_records = records.size();
            for (const auto &record : records)
            {
                auto live = queue_.get(record.id);
                if (is_active(record.status) && (!live || !is_active(live->status)))
                {
                    ++report.orphaned;
                }
            }
            report.issues = validate();
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Health check could not read the transfer store: {}", ex.what());
            report.store_accessible = false;
        }
        report.healthy = report.store_accessible && report.orphaned == 0 &&
                         std::none_of(report.issues.begin(), report.issues.end(), [](const ConsistencyIssue &issue)
                                      { return issue.severity == IssueSeverity::Error; });
        return report;
    }

    TransferJob StateRecovery::resolve_orphan(TransferJob job) const
    {
        const auto previous = job.status;
        job.progress.reset();
        job.started_at.reset();
        if (job.retry_count < job.max_retries)
        {
            job.status = TransferStatus::Queued;
            job.error = "Interrupted while " + std::string(to_string(previous)) + ", re-queued";
            spdlog::warn("Orphaned transfer {} ({}) re-queued, retry {}/{}", job.id, to_string(previous),
                         job.retry_count, job.max_retries);
        }
        else
        {
            job.status = TransferStatus::Failed;
            job.error = "Interrupted while " + std::string(to_string(previous)) + " with no retries left";
            job.completed_at = Clock::now();
            spdlog::warn("Orphaned transfer {} ({}) failed, retries exhausted", job.id, to_string(previous));
        }
        return job;
    }

    void StateRecovery::save_resolved(const TransferJob &job)
    {
        try
        {
            store_.save(job);
        }
        catch (const std::exception &ex)
        {
            // The queue still gets the resolved record; the sweep rewrites it later.
            spdlog::error("Failed to persist recovered transfer {}: {}", job.id, ex.what());
        }
    }

    void StateRecovery::arm_sweep_timer()
    {
        if (!running_)
        {
            return;
        }
        sweep_timer_.expires_after(config_.sweep_interval);
        sweep_timer_.async_wait([this](const std::error_code &ec)
                                {
                                    if (ec || !running_)
                                    {
                                        return;
                                    }
                                    try
                                    {
                                        sweep_orphans();
                                    }
                                    catch (const std::exception &ex)
                                    {
                                        spdlog::error("Orphan sweep failed: {}", ex.what());
                                    }
                                    arm_sweep_timer(); });
    }

} // namespace warpsync::daemon
