#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace warpsync::daemon
{

    using std::chrono::milliseconds;

    struct QueueConfig
    {
        std::size_t max_concurrent_transfers{3};
        int max_retries{3};
        bool priority_scheduling{true};
        bool auto_start{true};
        milliseconds transfer_timeout{std::chrono::hours{1}};
        milliseconds cleanup_interval{std::chrono::minutes{5}};
        std::size_t max_queue_size{1000};
        milliseconds process_interval{std::chrono::seconds{1}};
        milliseconds monitor_interval{std::chrono::seconds{1}};
        milliseconds retention{std::chrono::hours{24}};
    };

    struct RetryPolicy
    {
        milliseconds base_delay{std::chrono::seconds{1}};
        milliseconds max_delay{std::chrono::seconds{60}};
        double backoff_multiplier{2.0};
        // Matched case-insensitively as substrings of the failure message.
        std::vector<std::string> retryable_errors{
            "connection timeout",
            "network unreachable",
            "connection refused",
            "host is down",
            "temporary failure",
            "too many connections",
        };

        bool is_retryable(std::string_view error) const;

        // Delay before the given attempt (1-based).
        milliseconds delay_for(int attempt) const;
    };

    struct ProcessManagerConfig
    {
        std::size_t max_concurrent_processes{3};
        milliseconds default_timeout{std::chrono::hours{1}};
        milliseconds progress_update_interval{std::chrono::seconds{1}};
        milliseconds retention{std::chrono::hours{1}};
        milliseconds reap_interval{std::chrono::milliseconds{50}};
        std::size_t max_output_lines{1000};
        std::string rsync_binary{"rsync"};
        std::string sshpass_binary{"sshpass"};
        std::string shell{"/bin/sh"};
    };

    struct ConcurrencyConfig
    {
        std::size_t default_job_limit{3};
        std::unordered_map<std::string, std::size_t> job_limits;
    };

    struct RecoveryConfig
    {
        milliseconds sweep_interval{std::chrono::minutes{5}};
        bool purge_stale{true};
    };

    struct DaemonConfig
    {
        std::string address{"127.0.0.1"};
        std::uint16_t port{7878};
        std::filesystem::path state_directory{"warpsync-state"};
        std::optional<std::filesystem::path> log_file;
        std::optional<std::filesystem::path> events_file;
        bool verbose{false};
        QueueConfig queue;
        RetryPolicy retry;
        ProcessManagerConfig process;
        ConcurrencyConfig concurrency;
        RecoveryConfig recovery;

        std::filesystem::path transfers_directory() const { return state_directory / "transfers"; }
        std::filesystem::path keys_directory() const { return state_directory / "keys"; }
    };

    // Overlays the keys present in `json` on top of `config`. Unknown keys throw.
    void apply_config(const nlohmann::json &json, DaemonConfig &config);

    DaemonConfig load_config_file(const std::filesystem::path &path);

} // namespace warpsync::daemon
