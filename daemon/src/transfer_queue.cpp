#include "warpsync/daemon/transfer_queue.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "warpsync/crypto.hpp"
#include "warpsync/daemon/progress_parser.hpp"
#include "warpsync/error_codes.hpp"

namespace warpsync::daemon
{

    namespace
    {

        TransferJob job_from_spec(const TransferSpec &spec, std::string id, int default_max_retries)
        {
            TransferJob job;
            job.id = std::move(id);
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
            job.options = spec.options;
            job.status = TransferStatus::Queued;
            job.retry_count = 0;
            job.max_retries = std::max(spec.max_retries.value_or(default_max_retries), 0);
            job.created_at = Clock::now();
            return job;
        }

    } // namespace

    TransferQueue::TransferQueue(asio::io_context &io_context, QueueConfig config, RetryPolicy retry,
                                 ConcurrencyController &concurrency, ProcessManager &processes, TransferStore &store,
                                 EventSink *events)
        : io_context_(io_context), config_(std::move(config)), retry_(std::move(retry)), concurrency_(concurrency),
          processes_(processes), store_(store), events_(events), auto_start_(config_.auto_start),
          dispatch_timer_(io_context), cleanup_timer_(io_context)
    {
    }

    TransferQueue::~TransferQueue()
    {
        shutdown();
    }

    void TransferQueue::start()
    {
        if (running_)
        {
            return;
        }
        running_ = true;
        spdlog::info("Transfer queue started ({} queued, {} total)",
                     std::count_if(transfers_.begin(), transfers_.end(), [](const auto &item)
                                   { return is_pending(item.second.job.status); }),
                     transfers_.size());
        arm_dispatch_timer();
        arm_cleanup_timer();
    }

    void TransferQueue::shutdown()
    {
        const bool was_running = running_;
        running_ = false;
        dispatch_timer_.cancel();
        cleanup_timer_.cancel();
        for (auto &[id, timer] : retry_timers_)
        {
            timer->cancel();
        }
        retry_timers_.clear();

        std::vector<std::string> active_ids;
        active_ids.reserve(active_.size());
        for (const auto &[transfer_id, process_id] : active_)
        {
            active_ids.push_back(transfer_id);
        }
        for (const auto &transfer_id : active_ids)
        {
            cancel(transfer_id);
        }
        for (auto &[id, timer] : monitors_)
        {
            timer->cancel();
        }
        monitors_.clear();
        if (was_running)
        {
            spdlog::info("Transfer queue stopped, cancelled {} active transfer(s)", active_ids.size());
        }
    }

    std::string TransferQueue::enqueue(const TransferSpec &spec)
    {
        if (transfers_.size() >= config_.max_queue_size)
        {
            throw TransferError(ErrorCode::QueueFull, "Transfer queue is full");
        }

        auto job = job_from_spec(spec, "transfer_" + crypto::random_token(8), config_.max_retries);
        const auto validation = processes_.builder().validate(command_spec_for(job));
        if (!validation.valid())
        {
            throw TransferError(ErrorCode::ValidationFailed, validation.joined());
        }

        persist(job);
        const auto id = job.id;
        auto &entry = transfers_[id];
        entry.job = std::move(job);
        entry.sequence = next_sequence_++;

        spdlog::info("Transfer {} queued (job {}, file {}, {} priority, {} bytes): {}", id, entry.job.job_id,
                     entry.job.file_id, to_string(entry.job.priority), entry.job.size, entry.job.filename);
        if (events_)
        {
            TransferEvent event;
            event.type = EventType::StatusChange;
            event.transfer_id = id;
            event.job_id = entry.job.job_id;
            event.file_id = entry.job.file_id;
            event.new_status = TransferStatus::Queued;
            events_->publish(event);
        }
        return id;
    }

    std::vector<std::string> TransferQueue::enqueue_batch(const std::vector<TransferSpec> &specs)
    {
        std::vector<std::string> ids;
        for (const auto &spec : specs)
        {
            try
            {
                ids.push_back(enqueue(spec));
            }
            catch (const TransferError &ex)
            {
                spdlog::error("Failed to add transfer {} to batch: {}", spec.filename, ex.what());
            }
        }
        spdlog::info("Batch enqueue: {} of {} transfer(s) accepted", ids.size(), specs.size());
        return ids;
    }

    bool TransferQueue::cancel(const std::string &transfer_id)
    {
        auto *entry = find_entry(transfer_id);
        if (!entry || is_terminal(entry->job.status))
        {
            return false;
        }

        if (auto it = active_.find(transfer_id); it != active_.end())
        {
            processes_.cancel(it->second);
            active_.erase(it);
        }
        concurrency_.release(entry->job.job_id, transfer_id);
        if (auto it = retry_timers_.find(transfer_id); it != retry_timers_.end())
        {
            it->second->cancel();
            retry_timers_.erase(it);
        }

        entry->job.completed_at = Clock::now();
        transition(*entry, TransferStatus::Cancelled);
        return true;
    }

    std::optional<TransferJob> TransferQueue::get(const std::string &transfer_id) const
    {
        auto it = transfers_.find(transfer_id);
        if (it == transfers_.end())
        {
            return std::nullopt;
        }
        return it->second.job;
    }

    std::vector<TransferJob> TransferQueue::list(const TransferFilter &filter) const
    {
        std::vector<const Entry *> matches;
        for (const auto &[id, entry] : transfers_)
        {
            if (filter.matches(entry.job))
            {
                matches.push_back(&entry);
            }
        }
        std::sort(matches.begin(), matches.end(), [](const Entry *lhs, const Entry *rhs)
                  { return lhs->sequence < rhs->sequence; });
        std::vector<TransferJob> result;
        result.reserve(matches.size());
        for (const auto *entry : matches)
        {
            result.push_back(entry->job);
        }
        return result;
    }

    QueueStats TransferQueue::stats() const
    {
        QueueStats stats;
        stats.total = transfers_.size();
        double bytes_per_second = 0.0;
        for (const auto &[id, entry] : transfers_)
        {
            const auto &job = entry.job;
            switch (job.status)
            {
            case TransferStatus::Queued:
                ++stats.queued;
                stats.total_bytes_queued += job.size;
                break;
            case TransferStatus::Scheduled:
                ++stats.scheduled;
                stats.total_bytes_queued += job.size;
                break;
            case TransferStatus::Starting:
            case TransferStatus::Transferring:
            {
                ++stats.active;
                const auto transferred = job.progress ? job.progress->bytes_transferred : 0;
                stats.total_bytes_transferred += transferred;
                stats.total_bytes_remaining += job.size > transferred ? job.size - transferred : 0;
                if (job.progress)
                {
                    bytes_per_second += parse_speed(job.progress->speed).value_or(0.0);
                }
                break;
            }
            case TransferStatus::Retrying:
                ++stats.retrying;
                stats.total_bytes_queued += job.size;
                break;
            case TransferStatus::Completed:
                ++stats.completed;
                stats.total_bytes_transferred += job.size;
                break;
            case TransferStatus::Failed:
                ++stats.failed;
                break;
            case TransferStatus::Cancelled:
                ++stats.cancelled;
                break;
            }
        }
        if (bytes_per_second > 0.0)
        {
            const auto pending = static_cast<double>(stats.total_bytes_remaining + stats.total_bytes_queued);
            stats.estimated_time_remaining =
                std::chrono::milliseconds{static_cast<std::int64_t>(pending / bytes_per_second * 1000.0)};
        }
        return stats;
    }

    void TransferQueue::set_auto_start(bool enabled)
    {
        if (auto_start_ != enabled)
        {
            spdlog::info("Transfer queue auto start {}", enabled ? "enabled" : "disabled");
        }
        auto_start_ = enabled;
    }

    bool TransferQueue::dispatch_next()
    {
        if (!auto_start_)
        {
            return false;
        }
        auto *entry = next_candidate();
        return entry && start_transfer(*entry);
    }

    std::size_t TransferQueue::cleanup_completed()
    {
        const auto cutoff = Clock::now() - config_.retention;
        std::size_t removed = 0;
        for (auto it = transfers_.begin(); it != transfers_.end();)
        {
            const auto &job = it->second.job;
            if (is_terminal(job.status) && job.completed_at && *job.completed_at < cutoff)
            {
                store_.remove(job.id);
                it = transfers_.erase(it);
                ++removed;
            }
            else
            {
                ++it;
            }
        }
        const auto processes_removed = processes_.cleanup();
        if (removed > 0 || processes_removed > 0)
        {
            spdlog::debug("Cleaned up {} completed transfer(s) and {} process record(s)", removed, processes_removed);
        }
        return removed;
    }

    void TransferQueue::restore(TransferJob job)
    {
        if (is_active(job.status))
        {
            throw TransferError(ErrorCode::InvalidPayload,
                                "Cannot restore transfer " + job.id + " in status " + std::string(to_string(job.status)));
        }
        const auto id = job.id;
        auto &entry = transfers_[id];
        entry.job = std::move(job);
        entry.sequence = next_sequence_++;
        if (entry.job.status == TransferStatus::Retrying)
        {
            schedule_retry(id, retry_.delay_for(std::max(entry.job.retry_count, 1)));
        }
    }

    TransferQueue::Entry *TransferQueue::find_entry(const std::string &transfer_id)
    {
        auto it = transfers_.find(transfer_id);
        return it == transfers_.end() ? nullptr : &it->second;
    }

    TransferQueue::Entry *TransferQueue::next_candidate()
    {
        std::vector<Entry *> candidates;
        for (auto &[id, entry] : transfers_)
        {
            if (entry.job.status == TransferStatus::Queued)
            {
                candidates.push_back(&entry);
            }
        }
        const bool by_priority = config_.priority_scheduling;
        std::sort(candidates.begin(), candidates.end(), [by_priority](const Entry *lhs, const Entry *rhs)
                  {
                      if (by_priority && lhs->job.priority != rhs->job.priority)
                      {
                          return lhs->job.priority > rhs->job.priority;
                      }
                      if (lhs->job.created_at != rhs->job.created_at)
                      {
                          return lhs->job.created_at < rhs->job.created_at;
                      }
                      return lhs->sequence < rhs->sequence; });

        // Nothing leaves the queue while the process table is full.
        if (!processes_.has_capacity())
        {
            return nullptr;
        }

        // The best candidate whose job still has a free slot; the rest stay queued.
        for (auto *candidate : candidates)
        {
            if (concurrency_.active_total() >= concurrency_.global_limit())
            {
                return nullptr;
            }
            if (concurrency_.active_for_job(candidate->job.job_id) < concurrency_.job_limit(candidate->job.job_id))
            {
                return candidate;
            }
        }
        return nullptr;
    }

    bool TransferQueue::start_transfer(Entry &entry)
    {
        auto &job = entry.job;
        if (!concurrency_.try_acquire(job.job_id, job.id))
        {
            return false;
        }

        job.scheduled_at = Clock::now();
        transition(entry, TransferStatus::Scheduled);
        job.started_at = Clock::now();
        job.progress.reset();
        transition(entry, TransferStatus::Starting);

        std::string process_id;
        try
        {
            process_id = processes_.start(ProcessRequest{
                .transfer_id = job.id,
                .job_id = job.job_id,
                .file_id = job.file_id,
                .command = command_spec_for(job),
                .timeout = config_.transfer_timeout,
            });
        }
        catch (const TransferError &ex)
        {
            concurrency_.release(job.job_id, job.id);
            if (ex.code() == ErrorCode::Busy)
            {
                // Capacity, not a failure: back off without spending a retry.
                const auto delay = retry_.delay_for(std::max(job.retry_count, 1));
                spdlog::warn("Process manager busy, transfer {} retries in {} ms: {}", job.id, delay.count(), ex.what());
                job.started_at.reset();
                transition(entry, TransferStatus::Retrying, ex.what());
                schedule_retry(job.id, delay);
                return false;
            }
            spdlog::error("Failed to start transfer {}: {}", job.id, ex.what());
            handle_failure(entry, ex.what());
            return true;
        }

        active_[job.id] = process_id;
        transition(entry, TransferStatus::Transferring);
        monitor(job.id);
        return true;
    }

    void TransferQueue::monitor(const std::string &transfer_id)
    {
        auto &timer = monitors_[transfer_id];
        if (!timer)
        {
            timer = std::make_unique<asio::steady_timer>(io_context_);
        }
        timer->expires_after(config_.monitor_interval);
        timer->async_wait([this, transfer_id](const std::error_code &ec)
                          {
                              if (ec)
                              {
                                  return;
                              }
                              if (poll_transfer(transfer_id))
                              {
                                  monitor(transfer_id);
                              }
                              else
                              {
                                  monitors_.erase(transfer_id);
                              } });
    }

    bool TransferQueue::poll_transfer(const std::string &transfer_id)
    {
        auto *entry = find_entry(transfer_id);
        auto active = active_.find(transfer_id);
        if (!entry || active == active_.end() || !is_active(entry->job.status))
        {
            return false;
        }

        auto snapshot = processes_.get(active->second);
        if (!snapshot)
        {
            active_.erase(active);
            concurrency_.release(entry->job.job_id, transfer_id);
            handle_failure(*entry, "Transfer process record lost");
            return false;
        }

        auto &job = entry->job;
        if (snapshot->progress)
        {
            const auto previous = job.progress ? job.progress->percentage : -1;
            job.progress = TransferProgress{
                .bytes_transferred = snapshot->progress->bytes_transferred,
                .total_bytes = snapshot->progress->total_bytes > 0 ? snapshot->progress->total_bytes : job.size,
                .percentage = snapshot->progress->percentage,
                .speed = snapshot->progress->speed,
                .eta = snapshot->progress->eta,
                .start_time = job.started_at.value_or(snapshot->start_time),
                .last_update = Clock::now(),
            };
            if (previous != job.progress->percentage)
            {
                persist(job);
            }
        }

        if (!snapshot->closed || !snapshot->result)
        {
            return true;
        }

        active_.erase(active);
        concurrency_.release(job.job_id, transfer_id);
        if (snapshot->result->success)
        {
            handle_success(*entry);
        }
        else
        {
            handle_failure(*entry, snapshot->result->error.empty() ? "Transfer failed" : snapshot->result->error);
        }
        return false;
    }

    void TransferQueue::handle_success(Entry &entry)
    {
        auto &job = entry.job;
        job.completed_at = Clock::now();
        job.error.clear();
        if (job.progress)
        {
            job.progress->percentage = 100;
            job.progress->bytes_transferred = std::max(job.progress->bytes_transferred, job.size);
            job.progress->last_update = *job.completed_at;
        }
        const auto duration = job.started_at
                                  ? std::chrono::duration_cast<std::chrono::milliseconds>(*job.completed_at - *job.started_at)
                                  : std::chrono::milliseconds{0};
        spdlog::info("Transfer {} completed in {} ms: {}", job.id, duration.count(), job.filename);
        transition(entry, TransferStatus::Completed);
    }

    void TransferQueue::handle_failure(Entry &entry, const std::string &error)
    {
        auto &job = entry.job;
        job.error = error;
        if (job.retry_count < job.max_retries && retry_.is_retryable(error))
        {
            ++job.retry_count;
            const auto delay = retry_.delay_for(job.retry_count);
            spdlog::warn("Transfer {} failed, retry {}/{} in {} ms: {}", job.id, job.retry_count, job.max_retries,
                         delay.count(), error);
            transition(entry, TransferStatus::Retrying, error);
            schedule_retry(job.id, delay);
            return;
        }
        job.completed_at = Clock::now();
        spdlog::error("Transfer {} failed permanently after {} retries: {}", job.id, job.retry_count, error);
        transition(entry, TransferStatus::Failed, error);
    }

    void TransferQueue::schedule_retry(const std::string &transfer_id, std::chrono::milliseconds delay)
    {
        auto &timer = retry_timers_[transfer_id];
        timer = std::make_unique<asio::steady_timer>(io_context_);
        timer->expires_after(delay);
        timer->async_wait([this, transfer_id](const std::error_code &ec)
                          {
                              if (ec)
                              {
                                  return;
                              }
                              retry_timers_.erase(transfer_id);
                              auto *entry = find_entry(transfer_id);
                              if (entry && entry->job.status == TransferStatus::Retrying)
                              {
                                  transition(*entry, TransferStatus::Queued);
                              } });
    }

    void TransferQueue::transition(Entry &entry, TransferStatus status, const std::string &message)
    {
        auto &job = entry.job;
        const auto old_status = job.status;
        if (!is_valid_transition(old_status, status))
        {
            spdlog::error("Rejected transfer {} transition {} -> {}", job.id, to_string(old_status),
                          to_string(status));
            throw TransferError(ErrorCode::InternalError, "Invalid transition for transfer " + job.id + ": " +
                                                              std::string(to_string(old_status)) + " -> " +
                                                              std::string(to_string(status)));
        }
        job.status = status;
        persist(job);

        const auto process = active_.find(job.id);
        spdlog::debug("Transfer {} (job {}, process {}) {} -> {}", job.id, job.job_id,
                      process == active_.end() ? std::string("-") : process->second, to_string(old_status),
                      to_string(status));
        if (!events_)
        {
            return;
        }
        TransferEvent event;
        event.type = EventType::StatusChange;
        event.transfer_id = job.id;
        event.job_id = job.job_id;
        event.file_id = job.file_id;
        if (process != active_.end())
        {
            event.process_id = process->second;
        }
        event.old_status = old_status;
        event.new_status = status;
        event.progress = job.progress;
        event.message = message;
        event.level = message.empty() ? "info" : "warn";
        events_->publish(event);
    }

    void TransferQueue::persist(const TransferJob &job)
    {
        try
        {
            store_.save(job);
        }
        catch (const TransferError &ex)
        {
            // The in-memory table stays authoritative until the next successful write.
            spdlog::error("Failed to persist transfer {}: {}", job.id, ex.what());
        }
    }

    void TransferQueue::arm_dispatch_timer()
    {
        if (!running_)
        {
            return;
        }
        dispatch_timer_.expires_after(config_.process_interval);
        dispatch_timer_.async_wait([this](const std::error_code &ec)
                                   {
                                       if (ec || !running_)
                                       {
                                           return;
                                       }
                                       dispatch_next();
                                       arm_dispatch_timer(); });
    }

    void TransferQueue::arm_cleanup_timer()
    {
        if (!running_)
        {
            return;
        }
        cleanup_timer_.expires_after(config_.cleanup_interval);
        cleanup_timer_.async_wait([this](const std::error_code &ec)
                                  {
                                      if (ec || !running_)
                                      {
                                          return;
                                      }
                                      cleanup_completed();
                                      arm_cleanup_timer(); });
    }

} // namespace warpsync::daemon
