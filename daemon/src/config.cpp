#include "warpsync/daemon/config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <initializer_list>

#include "warpsync/error_codes.hpp"

namespace warpsync::daemon
{

    namespace
    {

        void reject_unknown_keys(const nlohmann::json &json, std::string_view section,
                                 std::initializer_list<std::string_view> allowed)
        {
            if (!json.is_object())
            {
                throw TransferError(ErrorCode::InvalidPayload, "Config section '" + std::string(section) +
                                                                   "' must be an object");
            }
            for (const auto &item : json.items())
            {
                if (std::find(allowed.begin(), allowed.end(), item.key()) == allowed.end())
                {
                    throw TransferError(ErrorCode::InvalidPayload,
                                        "Unknown config key '" + item.key() + "' in " + std::string(section));
                }
            }
        }

        void read_millis(const nlohmann::json &json, const char *key, milliseconds &target)
        {
            if (auto it = json.find(key); it != json.end())
            {
                target = milliseconds{it->get<std::int64_t>()};
            }
        }

        template <typename T>
        void read_value(const nlohmann::json &json, const char *key, T &target)
        {
            if (auto it = json.find(key); it != json.end())
            {
                target = it->get<T>();
            }
        }

        void apply_queue(const nlohmann::json &json, QueueConfig &queue)
        {
            reject_unknown_keys(json, "queue",
                                {"max_concurrent_transfers", "max_retries", "priority_scheduling", "auto_start",
                                 "transfer_timeout_ms", "cleanup_interval_ms", "max_queue_size",
                                 "process_interval_ms", "monitor_interval_ms", "retention_ms"});
            read_value(json, "max_concurrent_transfers", queue.max_concurrent_transfers);
            read_value(json, "max_retries", queue.max_retries);
            read_value(json, "priority_scheduling", queue.priority_scheduling);
            read_value(json, "auto_start", queue.auto_start);
            read_millis(json, "transfer_timeout_ms", queue.transfer_timeout);
            read_millis(json, "cleanup_interval_ms", queue.cleanup_interval);
            read_value(json, "max_queue_size", queue.max_queue_size);
            read_millis(json, "process_interval_ms", queue.process_interval);
            read_millis(json, "monitor_interval_ms", queue.monitor_interval);
            read_millis(json, "retention_ms", queue.retention);
            if (queue.max_retries < 0)
            {
                throw TransferError(ErrorCode::InvalidPayload, "queue.max_retries must not be negative");
            }
        }

        void apply_retry(const nlohmann::json &json, RetryPolicy &retry)
        {
            reject_unknown_keys(json, "retry", {"base_delay_ms", "max_delay_ms", "backoff_multiplier", "retryable_errors"});
            read_millis(json, "base_delay_ms", retry.base_delay);
            read_millis(json, "max_delay_ms", retry.max_delay);
            read_value(json, "backoff_multiplier", retry.backoff_multiplier);
            read_value(json, "retryable_errors", retry.retryable_errors);
        }

        void apply_process(const nlohmann::json &json, ProcessManagerConfig &process)
        {
            reject_unknown_keys(json, "process",
                                {"max_concurrent_processes", "default_timeout_ms", "progress_update_interval_ms",
                                 "retention_ms", "reap_interval_ms", "max_output_lines", "rsync_binary",
                                 "sshpass_binary", "shell"});
            read_value(json, "max_concurrent_processes", process.max_concurrent_processes);
            read_millis(json, "default_timeout_ms", process.default_timeout);
            read_millis(json, "progress_update_interval_ms", process.progress_update_interval);
            read_millis(json, "retention_ms", process.retention);
            read_millis(json, "reap_interval_ms", process.reap_interval);
            read_value(json, "max_output_lines", process.max_output_lines);
            read_value(json, "rsync_binary", process.rsync_binary);
            read_value(json, "sshpass_binary", process.sshpass_binary);
            read_value(json, "shell", process.shell);
        }

        void apply_concurrency(const nlohmann::json &json, ConcurrencyConfig &concurrency)
        {
            reject_unknown_keys(json, "concurrency", {"default_job_limit", "job_limits"});
            read_value(json, "default_job_limit", concurrency.default_job_limit);
            if (auto it = json.find("job_limits"); it != json.end())
            {
                for (const auto &[job_id, limit] : it->items())
                {
                    concurrency.job_limits[job_id] = limit.get<std::size_t>();
                }
            }
        }

        void apply_recovery(const nlohmann::json &json, RecoveryConfig &recovery)
        {
            reject_unknown_keys(json, "recovery", {"sweep_interval_ms", "purge_stale"});
            read_millis(json, "sweep_interval_ms", recovery.sweep_interval);
            read_value(json, "purge_stale", recovery.purge_stale);
        }

        std::string to_lower(std::string_view text)
        {
            std::string lowered(text);
            std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return lowered;
        }

    } // namespace

    bool RetryPolicy::is_retryable(std::string_view error) const
    {
        const auto lowered = to_lower(error);
        return std::any_of(retryable_errors.begin(), retryable_errors.end(), [&](const std::string &needle)
                           { return lowered.find(to_lower(needle)) != std::string::npos; });
    }

    milliseconds RetryPolicy::delay_for(int attempt) const
    {
        const auto exponent = std::max(attempt - 1, 0);
        const double delay = static_cast<double>(base_delay.count()) * std::pow(backoff_multiplier, exponent);
        if (delay >= static_cast<double>(max_delay.count()))
        {
            return max_delay;
        }
        return milliseconds{static_cast<milliseconds::rep>(delay)};
    }

    void apply_config(const nlohmann::json &json, DaemonConfig &config)
    {
        reject_unknown_keys(json, "config",
                            {"address", "port", "state_directory", "log_file", "events_file", "verbose", "queue",
                             "retry", "process", "concurrency", "recovery"});
        read_value(json, "address", config.address);
        read_value(json, "port", config.port);
        if (auto it = json.find("state_directory"); it != json.end())
        {
            config.state_directory = it->get<std::string>();
        }
        if (auto it = json.find("log_file"); it != json.end())
        {
            config.log_file = std::filesystem::path(it->get<std::string>());
        }
        if (auto it = json.find("events_file"); it != json.end())
        {
            config.events_file = std::filesystem::path(it->get<std::string>());
        }
        read_value(json, "verbose", config.verbose);
        if (auto it = json.find("queue"); it != json.end())
        {
            apply_queue(*it, config.queue);
        }
        if (auto it = json.find("retry"); it != json.end())
        {
            apply_retry(*it, config.retry);
        }
        if (auto it = json.find("process"); it != json.end())
        {
            apply_process(*it, config.process);
        }
        if (auto it = json.find("concurrency"); it != json.end())
        {
            apply_concurrency(*it, config.concurrency);
        }
        if (auto it = json.find("recovery"); it != json.end())
        {
            apply_recovery(*it, config.recovery);
        }
    }

    DaemonConfig load_config_file(const std::filesystem::path &path)
    {
        std::ifstream input(path);
        if (!input.is_open())
        {
            throw TransferError(ErrorCode::NotFound, "Unable to open config file: " + path.string());
        }
        DaemonConfig config;
        try
        {
            apply_config(nlohmann::json::parse(input), config);
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw TransferError(ErrorCode::InvalidPayload, "Invalid config file " + path.string() + ": " + ex.what());
        }
        return config;
    }

} // namespace warpsync::daemon
