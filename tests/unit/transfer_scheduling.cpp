#include <algorithm>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include <asio/io_context.hpp>

#include "test_support.hpp"
#include "warpsync/daemon/concurrency_controller.hpp"
#include "warpsync/daemon/config.hpp"
#include "warpsync/daemon/key_store.hpp"
#include "warpsync/daemon/process_manager.hpp"
#include "warpsync/daemon/state_recovery.hpp"
#include "warpsync/daemon/transfer_queue.hpp"
#include "warpsync/daemon/transfer_store.hpp"
#include "warpsync/error_codes.hpp"

using namespace warpsync;
using namespace warpsync::daemon;

namespace
{

    DaemonConfig make_config(const test::TempDir &temp, const std::string &rsync_body,
                             const std::function<void(DaemonConfig &)> &tweak)
    {
        DaemonConfig config;
        config.state_directory = temp.path() / "state";
        config.queue.process_interval = std::chrono::milliseconds{20};
        config.queue.monitor_interval = std::chrono::milliseconds{20};
        config.retry.base_delay = std::chrono::milliseconds{20};
        config.retry.max_delay = std::chrono::milliseconds{100};
        config.process.progress_update_interval = std::chrono::milliseconds{0};
        config.process.reap_interval = std::chrono::milliseconds{10};
        config.process.rsync_binary = test::write_fake_rsync(temp.path(), "rsync", rsync_body).string();
        config.process.max_concurrent_processes = config.queue.max_concurrent_transfers;
        if (tweak)
        {
            tweak(config);
        }
        return config;
    }

    // JSON store whose writes and listings can be made to fail.
    class FaultyStore : public TransferStore
    {
    public:
        explicit FaultyStore(std::filesystem::path directory) : inner_(std::move(directory)) {}

        void save(const TransferJob &job) override
        {
            if (job.id == unwritable_id)
            {
                throw TransferError(ErrorCode::InternalError, "Failed to write " + job.id + ": No space left on device");
            }
            inner_.save(job);
        }

        std::optional<TransferJob> find(const std::string &transfer_id) const override { return inner_.find(transfer_id); }

        std::vector<TransferJob> find_by_job(const std::string &job_id) const override
        {
            return inner_.find_by_job(job_id);
        }

        std::vector<TransferJob> load_all() const override
        {
            ++listings;
            if (fail_listing)
            {
                throw std::filesystem::filesystem_error("directory iterator cannot open directory", inner_.directory(),
                                                        std::make_error_code(std::errc::io_error));
            }
            return inner_.load_all();
        }

        bool remove(const std::string &transfer_id) override { return inner_.remove(transfer_id); }

        std::string unwritable_id;
        bool fail_listing{false};
        mutable std::size_t listings{0};

    private:
        JsonTransferStore inner_;
    };

    // Queue, process table, slots, store and recovery wired the way the
    // daemon wires them, on a private io_context.
    struct Harness
    {
        explicit Harness(const std::string &name, const std::string &rsync_body = test::successful_rsync_body(),
                         const std::function<void(DaemonConfig &)> &tweak = {})
            : temp(name), config(make_config(temp, rsync_body, tweak)), keys(config.keys_directory()),
              store(config.transfers_directory()), processes(io_context, config.process, keys, &sink),
              concurrency(config.queue.max_concurrent_transfers, config.concurrency),
              queue(io_context, config.queue, config.retry, concurrency, processes, store, &sink),
              recovery(io_context, config.recovery, config.queue.retention, store, queue, processes, concurrency)
        {
        }

        TransferStatus status(const std::string &id) const { return queue.get(id)->status; }

        bool wait_for(const std::string &id, TransferStatus expected)
        {
            return test::run_until(io_context, [&]
                                   { return status(id) == expected; });
        }

        test::TempDir temp;
        DaemonConfig config;
        asio::io_context io_context;
        test::RecordingSink sink;
        KeyStore keys;
        FaultyStore store;
        ProcessManager processes;
        ConcurrencyController concurrency;
        TransferQueue queue;
        StateRecovery recovery;
    };

    TransferJob make_record(const Harness &harness, const std::string &id, TransferStatus status)
    {
        const auto spec = test::make_spec(harness.temp.path(), "restored", id);
        TransferJob job;
        job.id = id;
        job.job_id = spec.job_id;
        job.file_id = spec.file_id;
        job.type = spec.type;
        job.priority = spec.priority;
        job.source = spec.source;
        job.destination = spec.destination;
        job.filename = spec.filename;
        job.relative_path = spec.relative_path;
        job.size = spec.size;
        job.ssh = spec.ssh;
        job.status = status;
        job.max_retries = 3;
        job.created_at = Clock::now();
        return job;
    }

    std::size_t count_of(const std::vector<std::string> &ids, const std::string &id)
    {
        return static_cast<std::size_t>(std::count(ids.begin(), ids.end(), id));
    }

    std::vector<std::string> read_lines(const std::filesystem::path &path)
    {
        std::ifstream in(path);
        std::vector<std::string> lines;
        std::string line;
        while (std::getline(in, line))
        {
            lines.push_back(line);
        }
        return lines;
    }

    void test_priority_dispatch_order()
    {
        Harness harness("priority");
        auto &queue = harness.queue;
        const auto root = harness.temp.path();
        const auto low = queue.enqueue(test::make_spec(root, "job-a", "low.bin", TransferPriority::Low));
        const auto urgent = queue.enqueue(test::make_spec(root, "job-b", "urgent.bin", TransferPriority::Urgent));
        const auto normal = queue.enqueue(test::make_spec(root, "job-c", "normal.bin", TransferPriority::Normal));

        queue.set_auto_start(false);
        assert(!queue.dispatch_next());
        queue.set_auto_start(true);

        assert(queue.dispatch_next());
        assert(queue.dispatch_next());
        assert(queue.dispatch_next());
        assert(!queue.dispatch_next());

        const auto started = harness.sink.transitions_to(TransferStatus::Starting);
        assert((started == std::vector<std::string>{urgent, normal, low}));
        assert(harness.status(urgent) == TransferStatus::Transferring);
        assert(queue.active_processes().size() == 3);

        for (const auto &id : {low, urgent, normal})
        {
            assert(harness.wait_for(id, TransferStatus::Completed));
            const auto job = queue.get(id);
            assert(job->progress && job->progress->percentage == 100);
            assert(job->completed_at && job->started_at && job->scheduled_at);
        }
        assert(harness.concurrency.active_total() == 0);
        assert(queue.active_processes().empty());
        assert(harness.store.find(urgent)->status == TransferStatus::Completed);
    }

    void test_fifo_when_priority_disabled()
    {
        Harness harness("fifo", test::successful_rsync_body(), [](DaemonConfig &config)
                        { config.queue.priority_scheduling = false; });
        auto &queue = harness.queue;
        const auto root = harness.temp.path();
        const auto first = queue.enqueue(test::make_spec(root, "job-a", "first.bin", TransferPriority::Low));
        const auto second = queue.enqueue(test::make_spec(root, "job-b", "second.bin", TransferPriority::Urgent));

        assert(queue.dispatch_next());
        assert(queue.dispatch_next());
        const auto started = harness.sink.transitions_to(TransferStatus::Starting);
        assert((started == std::vector<std::string>{first, second}));
        assert(harness.wait_for(second, TransferStatus::Completed));
        assert(harness.wait_for(first, TransferStatus::Completed));
    }

    void test_retryable_failure_exhausts_retries()
    {
        Harness harness("retry",
                        "echo 'ssh: connect to host files.example.com port 22: Connection refused' >&2\n"
                        "echo 'rsync: connection unexpectedly closed (0 bytes received so far) [Receiver]' >&2\n"
                        "exit 255");
        auto spec = test::make_spec(harness.temp.path(), "job-r", "flaky.bin");
        spec.max_retries = 2;
        const auto id = harness.queue.enqueue(spec);
        harness.queue.start();

        assert(harness.wait_for(id, TransferStatus::Failed));
        const auto job = harness.queue.get(id);
        assert(job->retry_count == 2);
        assert(job->max_retries == 2);
        assert(job->error.rfind("Rsync failed with exit code 255: ", 0) == 0);
        assert(job->error.find("Connection refused") != std::string::npos);
        assert(job->completed_at);
        assert(count_of(harness.sink.transitions_to(TransferStatus::Retrying), id) == 2);
        assert(count_of(harness.sink.transitions_to(TransferStatus::Starting), id) == 3);
        assert(harness.concurrency.active_total() == 0);

        const auto stored = harness.store.find(id);
        assert(stored && stored->status == TransferStatus::Failed && stored->retry_count == 2);
    }

    void test_non_retryable_failure()
    {
        Harness harness("no_retry", "echo 'rsync: [sender] link_stat \"/srv/data/gone.bin\" failed: No such file or directory (2)' >&2\n"
                                    "exit 23");
        const auto id = harness.queue.enqueue(test::make_spec(harness.temp.path(), "job-n", "gone.bin"));
        harness.queue.start();

        assert(harness.wait_for(id, TransferStatus::Failed));
        const auto job = harness.queue.get(id);
        assert(job->retry_count == 0);
        assert(job->error.find("exit code 23") != std::string::npos);
        assert(harness.sink.transitions_to(TransferStatus::Retrying).empty());
    }

    void test_cancel_is_idempotent()
    {
        Harness harness("cancel_queued");
        harness.queue.set_auto_start(false);
        const auto id = harness.queue.enqueue(test::make_spec(harness.temp.path(), "job-c", "later.bin"));

        assert(harness.queue.cancel(id));
        assert(!harness.queue.cancel(id));
        assert(!harness.queue.cancel("transfer_unknown"));
        const auto job = harness.queue.get(id);
        assert(job->status == TransferStatus::Cancelled);
        assert(job->completed_at);
        assert(harness.store.find(id)->status == TransferStatus::Cancelled);
        assert(count_of(harness.sink.transitions_to(TransferStatus::Cancelled), id) == 1);

        harness.queue.set_auto_start(true);
        assert(!harness.queue.dispatch_next());
    }

    void test_cancel_active_transfer()
    {
        Harness harness("cancel_active", "sleep 30\nexit 0");
        const auto id = harness.queue.enqueue(test::make_spec(harness.temp.path(), "job-c", "slow.bin"));
        assert(harness.queue.dispatch_next());
        assert(harness.status(id) == TransferStatus::Transferring);
        assert(harness.concurrency.holds(id));
        const auto process_id = harness.queue.active_processes().at(id);

        assert(harness.queue.cancel(id));
        assert(!harness.queue.cancel(id));
        assert(harness.queue.active_processes().empty());
        assert(!harness.concurrency.holds(id));

        assert(test::run_until(harness.io_context, [&]
                               { return harness.processes.get(process_id)->closed; }));
        assert(harness.processes.get(process_id)->status == ProcessStatus::Cancelled);
        assert(harness.status(id) == TransferStatus::Cancelled);
    }

    void test_enqueue_rejections()
    {
        Harness harness("rejections", test::successful_rsync_body(), [](DaemonConfig &config)
                        { config.queue.max_queue_size = 2; });
        harness.queue.set_auto_start(false);
        const auto root = harness.temp.path();

        auto invalid = test::make_spec(root, "job-v", "bad.bin");
        invalid.source = "srv/relative.bin";
        invalid.ssh.port = 0;
        bool validation_failed = false;
        try
        {
            harness.queue.enqueue(invalid);
        }
        catch (const TransferError &ex)
        {
            validation_failed = ex.code() == ErrorCode::ValidationFailed &&
                                std::string(ex.what()).find("Remote path must be absolute") != std::string::npos &&
                                std::string(ex.what()).find("SSH port must be between 1 and 65535") != std::string::npos;
        }
        assert(validation_failed);
        assert(harness.queue.size() == 0);

        const auto accepted = harness.queue.enqueue_batch(
            {test::make_spec(root, "job-v", "one.bin"), invalid, test::make_spec(root, "job-v", "two.bin")});
        assert(accepted.size() == 2);
        assert(harness.queue.size() == 2);

        bool full = false;
        try
        {
            harness.queue.enqueue(test::make_spec(root, "job-v", "three.bin"));
        }
        catch (const TransferError &ex)
        {
            full = ex.code() == ErrorCode::QueueFull && std::string(ex.what()) == "Transfer queue is full";
        }
        assert(full);
    }

    void test_job_limit_end_to_end()
    {
        Harness harness("job_limit", test::successful_rsync_body("0.1"), [](DaemonConfig &config)
                        { config.concurrency.job_limits["nightly"] = 1; });
        const auto root = harness.temp.path();
        const auto first = harness.queue.enqueue(test::make_spec(root, "nightly", "a.bin"));
        const auto second = harness.queue.enqueue(test::make_spec(root, "nightly", "b.bin"));
        const auto other = harness.queue.enqueue(test::make_spec(root, "adhoc", "c.bin"));
        harness.queue.start();

        std::size_t peak = 0;
        bool both_active = false;
        const bool done = test::run_until(harness.io_context, [&]
                                          {
                                              peak = std::max(peak, harness.concurrency.active_for_job("nightly"));
                                              both_active = both_active || (is_active(harness.status(first)) &&
                                                                            is_active(harness.status(second)));
                                              return harness.status(first) == TransferStatus::Completed &&
                                                     harness.status(second) == TransferStatus::Completed &&
                                                     harness.status(other) == TransferStatus::Completed; });
        assert(done);
        assert(peak == 1);
        assert(!both_active);
        assert(harness.concurrency.active_total() == 0);
        assert(harness.concurrency.snapshot().total_active_jobs == 0);
        assert(harness.queue.active_processes().empty());

        // Nightly transfers ran one after the other.
        const auto completed = harness.sink.transitions_to(TransferStatus::Completed);
        const auto started = harness.sink.transitions_to(TransferStatus::Starting);
        assert(count_of(started, first) == 1 && count_of(started, second) == 1);
        assert(count_of(completed, first) == 1 && count_of(completed, second) == 1);
    }

    void test_startup_recovery()
    {
        Harness harness("recovery");
        auto interrupted = make_record(harness, "transfer_interrupted", TransferStatus::Transferring);
        interrupted.progress = TransferProgress{.bytes_transferred = 40, .total_bytes = 100, .percentage = 40};
        interrupted.started_at = Clock::now();
        harness.store.save(interrupted);

        auto exhausted = make_record(harness, "transfer_exhausted", TransferStatus::Starting);
        exhausted.retry_count = 3;
        harness.store.save(exhausted);

        auto retrying = make_record(harness, "transfer_retrying", TransferStatus::Retrying);
        retrying.retry_count = 1;
        harness.store.save(retrying);

        auto stale = make_record(harness, "transfer_stale", TransferStatus::Completed);
        stale.completed_at = Clock::now() - std::chrono::hours{48};
        harness.store.save(stale);

        auto finished = make_record(harness, "transfer_finished", TransferStatus::Completed);
        finished.completed_at = Clock::now();
        harness.store.save(finished);

        const auto result = harness.recovery.recover();
        assert(result.recovered == 2);
        assert(result.orphaned == 2);
        assert(result.cleaned == 1);

        assert(!harness.store.find("transfer_stale"));
        assert(!harness.queue.get("transfer_stale"));
        assert(harness.queue.size() == 4);

        const auto requeued = harness.store.find("transfer_interrupted");
        assert(requeued->status == TransferStatus::Queued);
        assert(requeued->error == "Interrupted while transferring, re-queued");
        assert(!requeued->progress);

        const auto failed = harness.queue.get("transfer_exhausted");
        assert(failed->status == TransferStatus::Failed);
        assert(failed->completed_at);
        assert(harness.store.find("transfer_exhausted")->status == TransferStatus::Failed);
        assert(harness.status("transfer_retrying") == TransferStatus::Queued);
        assert(harness.status("transfer_finished") == TransferStatus::Completed);

        const auto again = harness.recovery.recover();
        assert(again.recovered == 0 && again.orphaned == 0 && again.cleaned == 0);

        harness.queue.start();
        assert(harness.wait_for("transfer_interrupted", TransferStatus::Completed));
        assert(harness.wait_for("transfer_retrying", TransferStatus::Completed));
        assert(harness.store.find("transfer_interrupted")->status == TransferStatus::Completed);
        assert(harness.recovery.health().healthy);
    }

    void test_validate_and_sweep()
    {
        Harness harness("sweep");
        harness.queue.set_auto_start(false);
        const auto queued = harness.queue.enqueue(test::make_spec(harness.temp.path(), "job-s", "queued.bin"));
        assert(harness.recovery.validate().empty());
        assert(harness.recovery.health().healthy);

        assert(harness.concurrency.try_acquire("ghost-job", "transfer_ghost"));
        harness.store.save(make_record(harness, "transfer_lost", TransferStatus::Transferring));
        auto drifted = *harness.queue.get(queued);
        drifted.status = TransferStatus::Completed;
        harness.store.save(drifted);

        const auto issues = harness.recovery.validate();
        const auto has = [&issues](IssueKind kind, IssueSeverity severity, const std::string &id)
        {
            return std::any_of(issues.begin(), issues.end(), [&](const ConsistencyIssue &issue)
                               { return issue.kind == kind && issue.severity == severity && issue.transfer_id == id; });
        };
        assert(has(IssueKind::SlotConflict, IssueSeverity::Error, "transfer_ghost"));
        assert(has(IssueKind::MissingInMemory, IssueSeverity::Warning, "transfer_lost"));
        assert(has(IssueKind::StateMismatch, IssueSeverity::Warning, queued));

        const auto report = harness.recovery.health();
        assert(!report.healthy);
        assert(report.store_accessible);
        assert(report.orphaned == 1);
        assert(report.stored_records == 2);

        assert(harness.recovery.sweep_orphans() == 2);
        assert(!harness.concurrency.holds("transfer_ghost"));
        assert(harness.status("transfer_lost") == TransferStatus::Queued);
        assert(harness.store.find("transfer_lost")->status == TransferStatus::Queued);

        // A drifted terminal status is not an orphan; it is reported, not repaired.
        const auto remaining = harness.recovery.validate();
        assert(remaining.size() == 1);
        assert(remaining.front().kind == IssueKind::StateMismatch);
        assert(harness.recovery.health().healthy);
    }

    void test_cleanup_completed()
    {
        Harness harness("cleanup", test::successful_rsync_body(), [](DaemonConfig &config)
                        { config.queue.retention = std::chrono::milliseconds{1}; });
        harness.queue.set_auto_start(false);
        const auto root = harness.temp.path();
        const auto cancelled = harness.queue.enqueue(test::make_spec(root, "job-x", "cancelled.bin"));
        const auto waiting = harness.queue.enqueue(test::make_spec(root, "job-x", "waiting.bin"));
        assert(harness.queue.cancel(cancelled));
        std::this_thread::sleep_for(std::chrono::milliseconds{5});

        assert(harness.queue.cleanup_completed() == 1);
        assert(!harness.queue.get(cancelled));
        assert(!harness.store.find(cancelled));
        assert(harness.queue.get(waiting));
        assert(harness.queue.cleanup_completed() == 0);
    }

    void test_queue_stats_and_filters()
    {
        Harness harness("stats");
        harness.queue.set_auto_start(false);
        const auto root = harness.temp.path();
        const auto a = harness.queue.enqueue(test::make_spec(root, "job-a", "a.bin", TransferPriority::High));
        const auto b = harness.queue.enqueue(test::make_spec(root, "job-a", "b.bin"));
        const auto c = harness.queue.enqueue(test::make_spec(root, "job-b", "c.bin"));
        assert(harness.queue.cancel(c));

        auto stats = harness.queue.stats();
        assert(stats.total == 3);
        assert(stats.queued == 2);
        assert(stats.cancelled == 1);
        assert(stats.total_bytes_queued == 200);
        assert(stats.estimated_time_remaining == std::chrono::milliseconds{0});

        TransferFilter by_job;
        by_job.job_id = "job-a";
        const auto listed = harness.queue.list(by_job);
        assert(listed.size() == 2);
        assert(listed[0].id == a && listed[1].id == b);

        TransferFilter by_priority;
        by_priority.priorities = {TransferPriority::High};
        assert(harness.queue.list(by_priority).size() == 1);

        harness.queue.set_auto_start(true);
        harness.queue.start();
        assert(harness.wait_for(a, TransferStatus::Completed));
        assert(harness.wait_for(b, TransferStatus::Completed));
        stats = harness.queue.stats();
        assert(stats.completed == 2);
        assert(stats.queued == 0);
        assert(stats.total_bytes_transferred == 200);
    }


    void test_full_process_table_keeps_transfers_queued()
    {
        Harness harness("process_table", "sleep 30\nexit 0", [](DaemonConfig &config)
                        { config.process.max_concurrent_processes = 1; });
        const auto root = harness.temp.path();
        const auto first = harness.queue.enqueue(test::make_spec(root, "job-a", "first.bin"));
        const auto second = harness.queue.enqueue(test::make_spec(root, "job-b", "second.bin"));

        assert(harness.queue.dispatch_next());
        assert(harness.status(first) == TransferStatus::Transferring);
        const auto first_process = harness.queue.active_processes().at(first);

        for (int tick = 0; tick < 5; ++tick)
        {
            assert(!harness.queue.dispatch_next());
        }
        assert(harness.status(second) == TransferStatus::Queued);
        assert(!harness.concurrency.holds(second));
        const auto events = harness.sink.events();
        assert(std::none_of(events.begin(), events.end(), [&](const TransferEvent &event)
                            { return event.type == EventType::StatusChange && event.transfer_id == second &&
                                     event.old_status.has_value(); }));

        // A cancelled child keeps its place until it has been reaped.
        assert(harness.queue.cancel(first));
        assert(!harness.queue.dispatch_next());
        assert(harness.status(second) == TransferStatus::Queued);

        harness.queue.start();
        bool first_reaped = false;
        assert(test::run_until(harness.io_context, [&]
                               {
                                   if (harness.status(second) != TransferStatus::Transferring)
                                   {
                                       return false;
                                   }
                                   first_reaped = harness.processes.get(first_process)->closed;
                                   return true; }));
        assert(first_reaped);
        assert(count_of(harness.sink.transitions_to(TransferStatus::Scheduled), second) == 1);
        assert(harness.queue.cancel(second));
    }

    void test_shutdown_cancels_active_transfers()
    {
        Harness harness("shutdown", "sleep 30\nexit 0");
        const auto root = harness.temp.path();
        const auto a = harness.queue.enqueue(test::make_spec(root, "job-a", "a.bin"));
        const auto b = harness.queue.enqueue(test::make_spec(root, "job-b", "b.bin"));
        harness.queue.start();
        assert(test::run_until(harness.io_context, [&]
                               { return harness.queue.active_processes().size() == 2; }));
        const auto a_process = harness.queue.active_processes().at(a);
        const auto b_process = harness.queue.active_processes().at(b);

        harness.queue.shutdown();
        assert(harness.status(a) == TransferStatus::Cancelled);
        assert(harness.status(b) == TransferStatus::Cancelled);
        assert(harness.queue.active_processes().empty());
        assert(harness.concurrency.active_total() == 0);
        assert(harness.store.find(a)->status == TransferStatus::Cancelled);

        assert(test::run_until(harness.io_context, [&]
                               { return harness.processes.active_count() == 0; }));
        for (const auto &process_id : {a_process, b_process})
        {
            const auto process = harness.processes.get(process_id);
            assert(process->closed);
            assert(process->status == ProcessStatus::Cancelled);
        }
    }

    void test_timeout_fails_without_retry()
    {
        Harness harness("queue_timeout", "sleep 30\nexit 0", [](DaemonConfig &config)
                        { config.queue.transfer_timeout = std::chrono::milliseconds{150}; });
        auto spec = test::make_spec(harness.temp.path(), "job-t", "stalled.bin");
        spec.max_retries = 3;
        const auto id = harness.queue.enqueue(spec);
        harness.queue.start();

        assert(harness.wait_for(id, TransferStatus::Failed));
        const auto job = harness.queue.get(id);
        assert(job->retry_count == 0);
        assert(job->error == "Transfer timeout");
        assert(job->completed_at);
        assert(harness.sink.transitions_to(TransferStatus::Retrying).empty());
        assert(count_of(harness.sink.transitions_to(TransferStatus::Starting), id) == 1);
        assert(harness.concurrency.active_total() == 0);
    }

    void test_retry_waits_for_backoff()
    {
        Harness harness("backoff",
                        "echo 'ssh: connect to host files.example.com port 22: Connection refused' >&2\nexit 255",
                        [](DaemonConfig &config)
                        {
                            config.retry.base_delay = std::chrono::milliseconds{300};
                            config.retry.max_delay = std::chrono::seconds{1};
                        });
        auto spec = test::make_spec(harness.temp.path(), "job-b", "backoff.bin");
        spec.max_retries = 1;
        const auto id = harness.queue.enqueue(spec);
        harness.queue.start();

        assert(harness.wait_for(id, TransferStatus::Retrying));
        const auto entered = std::chrono::steady_clock::now();
        assert(test::run_until(harness.io_context, [&]
                               { return harness.status(id) != TransferStatus::Retrying; }));
        assert(std::chrono::steady_clock::now() - entered >= std::chrono::milliseconds{250});

        assert(harness.wait_for(id, TransferStatus::Failed));
        assert(harness.queue.get(id)->retry_count == 1);
        // Once on enqueue, once when the backoff expired.
        assert(count_of(harness.sink.transitions_to(TransferStatus::Queued), id) == 2);
        assert(count_of(harness.sink.transitions_to(TransferStatus::Starting), id) == 2);
    }

    void test_password_transfer_through_sshpass()
    {
        const std::string record_args = "printf '%s\\n' \"$@\" > \"$(dirname \"$0\")/rsync.args\"\n";
        Harness harness("password", record_args + test::successful_rsync_body(), [](DaemonConfig &config)
                        {
                            config.process.sshpass_binary =
                                test::write_fake_rsync(config.state_directory.parent_path(), "sshpass",
                                                       "[ \"$1\" = -e ] || exit 3\n"
                                                       "printf '%s' \"$SSHPASS\" > \"$(dirname \"$0\")/sshpass.env\"\n"
                                                       "shift\n"
                                                       "exec \"$@\"")
                                    .string(); });
        const auto root = harness.temp.path();
        auto spec = test::make_spec(root, "job-p", "a b.txt");
        spec.source = "/srv/O'Brien's Files/a b.txt";
        spec.ssh.private_key.clear();
        spec.ssh.password = "correct horse";
        const auto id = harness.queue.enqueue(spec);
        harness.queue.start();

        assert(harness.wait_for(id, TransferStatus::Completed));
        const auto args = read_lines(root / "rsync.args");
        assert(args.size() > 2);
        assert(args[args.size() - 2] == "mirror@files.example.com:'/srv/O'\\''Brien'\\''s Files/a b.txt'");
        assert(args.back() == spec.destination);
        const auto e_flag = std::find(args.begin(), args.end(), "-e");
        assert(e_flag != args.end());
        assert((e_flag + 1)->rfind("ssh -o PubkeyAuthentication=no", 0) == 0);
        assert(std::none_of(args.begin(), args.end(), [](const std::string &arg)
                            { return arg.find("correct horse") != std::string::npos; }));

        std::ifstream env(root / "sshpass.env");
        std::string password;
        std::getline(env, password);
        assert(password == "correct horse");
        assert(harness.keys.tracked_count() == 0);
    }

    void test_process_records_follow_process_retention()
    {
        Harness harness("process_retention", test::successful_rsync_body(), [](DaemonConfig &config)
                        { config.process.retention = std::chrono::milliseconds{1}; });
        const auto id = harness.queue.enqueue(test::make_spec(harness.temp.path(), "job-r", "kept.bin"));
        assert(harness.queue.dispatch_next());
        const auto process_id = harness.queue.active_processes().at(id);
        assert(harness.wait_for(id, TransferStatus::Completed));
        assert(harness.processes.get(process_id));
        std::this_thread::sleep_for(std::chrono::milliseconds{5});

        assert(harness.queue.cleanup_completed() == 0);
        assert(!harness.processes.get(process_id));
        assert(harness.queue.get(id));
        assert(harness.store.find(id)->status == TransferStatus::Completed);
    }

    void test_recovery_survives_store_failures()
    {
        Harness harness("store_faults", test::successful_rsync_body(), [](DaemonConfig &config)
                        { config.recovery.sweep_interval = std::chrono::milliseconds{20}; });
        harness.store.save(make_record(harness, "transfer_unwritable", TransferStatus::Transferring));
        harness.store.save(make_record(harness, "transfer_writable", TransferStatus::Transferring));
        harness.store.unwritable_id = "transfer_unwritable";

        const auto result = harness.recovery.recover();
        assert(result.orphaned == 2);
        assert(result.recovered == 2);
        assert(harness.status("transfer_unwritable") == TransferStatus::Queued);
        assert(harness.status("transfer_writable") == TransferStatus::Queued);
        assert(harness.store.find("transfer_unwritable")->status == TransferStatus::Transferring);
        assert(harness.store.find("transfer_writable")->status == TransferStatus::Queued);

        // Sweeps keep running while the store cannot be listed.
        harness.store.fail_listing = true;
        harness.recovery.start();
        const auto before = harness.store.listings;
        assert(test::run_until(harness.io_context, [&]
                               { return harness.store.listings >= before + 3; }));

        harness.store.fail_listing = false;
        harness.store.unwritable_id.clear();
        assert(test::run_until(harness.io_context, [&]
                               { return harness.store.find("transfer_unwritable")->status == TransferStatus::Queued; }));
        harness.recovery.stop();
        assert(harness.recovery.health().healthy);
    }

} // namespace

void run_transfer_scheduling_tests()
{
    test_priority_dispatch_order();
    test_fifo_when_priority_disabled();
    test_retryable_failure_exhausts_retries();
    test_non_retryable_failure();
    test_cancel_is_idempotent();
    test_cancel_active_transfer();
    test_enqueue_rejections();
    test_job_limit_end_to_end();
    test_startup_recovery();
    test_validate_and_sweep();
    test_cleanup_completed();
    test_queue_stats_and_filters();
    test_full_process_table_keeps_transfers_queued();
    test_shutdown_cancels_active_transfers();
    test_timeout_fails_without_retry();
    test_retry_waits_for_backoff();
    test_password_transfer_through_sshpass();
    test_process_records_follow_process_retention();
    test_recovery_survives_store_failures();
}
