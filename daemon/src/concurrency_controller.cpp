#include "warpsync/daemon/concurrency_controller.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace warpsync::daemon
{

    void to_json(nlohmann::json &json, const ConcurrencySnapshot &snapshot)
    {
        auto breakdown = nlohmann::json::array();
        for (const auto &job : snapshot.job_breakdown)
        {
            breakdown.push_back({{"job_id", job.job_id}, {"active", job.active}, {"limit", job.limit}});
        }
        json = {
            {"total_active_jobs", snapshot.total_active_jobs},
            {"total_active_transfers", snapshot.total_active_transfers},
            {"global_limit", snapshot.global_limit},
            {"job_breakdown", std::move(breakdown)},
        };
    }

    ConcurrencyController::ConcurrencyController(std::size_t global_limit, ConcurrencyConfig config)
        : global_limit_(global_limit), config_(std::move(config))
    {
    }

    bool ConcurrencyController::try_acquire(const std::string &job_id, const std::string &transfer_id)
    {
        std::lock_guard lock(mutex_);
        if (holders_.contains(transfer_id))
        {
            return true;
        }
        const auto job_active = active_by_job_.contains(job_id) ? active_by_job_.at(job_id) : 0;
        if (job_active >= limit_for(job_id) || holders_.size() >= global_limit_)
        {
            return false;
        }
        ++active_by_job_[job_id];
        holders_.emplace(transfer_id, job_id);
        spdlog::debug("Slot acquired by transfer {} (job {}: {}/{}, global {}/{})", transfer_id, job_id,
                      job_active + 1, limit_for(job_id), holders_.size(), global_limit_);
        return true;
    }

    bool ConcurrencyController::release(const std::string &job_id, const std::string &transfer_id)
    {
        std::lock_guard lock(mutex_);
        auto holder = holders_.find(transfer_id);
        if (holder == holders_.end())
        {
            return false;
        }
        if (holder->second != job_id)
        {
            spdlog::warn("Transfer {} released a slot for job {} but holds one for job {}", transfer_id, job_id,
                         holder->second);
        }
        const auto owner = holder->second;
        holders_.erase(holder);
        if (auto it = active_by_job_.find(owner); it != active_by_job_.end())
        {
            if (--it->second == 0)
            {
                active_by_job_.erase(it);
            }
        }
        spdlog::debug("Slot released by transfer {} (job {}, global {}/{})", transfer_id, owner, holders_.size(),
                      global_limit_);
        return true;
    }

    bool ConcurrencyController::holds(const std::string &transfer_id) const
    {
        std::lock_guard lock(mutex_);
        return holders_.contains(transfer_id);
    }

    void ConcurrencyController::set_job_limit(const std::string &job_id, std::size_t limit)
    {
        std::lock_guard lock(mutex_);
        config_.job_limits[job_id] = limit;
    }

    std::size_t ConcurrencyController::job_limit(const std::string &job_id) const
    {
        std::lock_guard lock(mutex_);
        return limit_for(job_id);
    }

    std::size_t ConcurrencyController::active_for_job(const std::string &job_id) const
    {
        std::lock_guard lock(mutex_);
        auto it = active_by_job_.find(job_id);
        return it == active_by_job_.end() ? 0 : it->second;
    }

    std::size_t ConcurrencyController::active_total() const
    {
        std::lock_guard lock(mutex_);
        return holders_.size();
    }

    std::unordered_map<std::string, std::string> ConcurrencyController::holders() const
    {
        std::lock_guard lock(mutex_);
        return holders_;
    }

    ConcurrencySnapshot ConcurrencyController::snapshot() const
    {
        std::lock_guard lock(mutex_);
        ConcurrencySnapshot snapshot;
        snapshot.total_active_jobs = active_by_job_.size();
        snapshot.total_active_transfers = holders_.size();
        snapshot.global_limit = global_limit_;
        for (const auto &[job_id, active] : active_by_job_)
        {
            snapshot.job_breakdown.push_back(JobSlots{.job_id = job_id, .active = active, .limit = limit_for(job_id)});
        }
        std::sort(snapshot.job_breakdown.begin(), snapshot.job_breakdown.end(),
                  [](const JobSlots &lhs, const JobSlots &rhs)
                  { return lhs.job_id < rhs.job_id; });
        return snapshot;
    }

    std::size_t ConcurrencyController::limit_for(const std::string &job_id) const
    {
        if (auto it = config_.job_limits.find(job_id); it != config_.job_limits.end())
        {
            return it->second;
        }
        return config_.default_job_limit;
    }

} // namespace warpsync::daemon
