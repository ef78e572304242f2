#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "warpsync/daemon/config.hpp"

namespace warpsync::daemon
{

    struct JobSlots
    {
        std::string job_id;
        std::size_t active{};
        std::size_t limit{};
    };

    struct ConcurrencySnapshot
    {
        std::size_t total_active_jobs{};
        std::size_t total_active_transfers{};
        std::size_t global_limit{};
        std::vector<JobSlots> job_breakdown;
    };

    void to_json(nlohmann::json &json, const ConcurrencySnapshot &snapshot);

    // Slot accounting per job and globally. A slot is identified by the
    // transfer holding it, so a repeated release is a no-op.
    class ConcurrencyController
    {
    public:
        ConcurrencyController(std::size_t global_limit, ConcurrencyConfig config);

        // Grants only if both the job and the global count are below their
        // limits. Re-acquiring a slot the transfer already holds succeeds
        // without counting twice.
        bool try_acquire(const std::string &job_id, const std::string &transfer_id);

        bool release(const std::string &job_id, const std::string &transfer_id);

        bool holds(const std::string &transfer_id) const;

        void set_job_limit(const std::string &job_id, std::size_t limit);

        std::size_t job_limit(const std::string &job_id) const;

        std::size_t active_for_job(const std::string &job_id) const;

        std::size_t active_total() const;

        std::size_t global_limit() const noexcept { return global_limit_; }

        // transfer id -> job id for every held slot.
        std::unordered_map<std::string, std::string> holders() const;

        ConcurrencySnapshot snapshot() const;

    private:
        std::size_t limit_for(const std::string &job_id) const;

        std::size_t global_limit_;
        ConcurrencyConfig config_;
        mutable std::mutex mutex_;
        std::unordered_map<std::string, std::size_t> active_by_job_;
        std::unordered_map<std::string, std::string> holders_;
    };

} // namespace warpsync::daemon
