/**
 * WarpSync - Transfer data model shared by the daemon, the persisted store and
 * the control protocol.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace warpsync
{

    using Clock = std::chrono::system_clock;
    using TimePoint = Clock::time_point;

    enum class TransferType : std::uint8_t
    {
        Download,
        Upload,
        Sync,
        Directory,
        DirectoryPackage
    };

    std::string_view to_string(TransferType type) noexcept;
    std::optional<TransferType> transfer_type_from_string(std::string_view value) noexcept;

    // Ordinal: higher value wins.
    enum class TransferPriority : std::uint8_t
    {
        Low = 0,
        Normal = 1,
        High = 2,
        Urgent = 3
    };

    std::string_view to_string(TransferPriority priority) noexcept;
    std::optional<TransferPriority> transfer_priority_from_string(std::string_view value) noexcept;

    enum class TransferStatus : std::uint8_t
    {
        Queued,
        Scheduled,
        Starting,
        Transferring,
        Completed,
        Failed,
        Cancelled,
        Retrying
    };

    std::string_view to_string(TransferStatus status) noexcept;
    std::optional<TransferStatus> transfer_status_from_string(std::string_view value) noexcept;

    bool is_terminal(TransferStatus status) noexcept;
    bool is_active(TransferStatus status) noexcept;
    bool is_pending(TransferStatus status) noexcept;

    // Edges of the transfer lifecycle; a status never moves to itself.
    bool is_valid_transition(TransferStatus from, TransferStatus to) noexcept;

    struct SshCredentials
    {
        std::string host;
        int port{22};
        std::string username;
        std::string private_key;
        std::string password;

        bool uses_password() const noexcept { return private_key.empty() && !password.empty(); }
    };

    void to_json(nlohmann::json &json, const SshCredentials &credentials);
    void from_json(const nlohmann::json &json, SshCredentials &credentials);

    // Every copy-tool flag the builder knows how to render. Decoding rejects
    // keys that are not listed here.
    struct RsyncOptions
    {
        bool archive{true};
        bool verbose{true};
        bool compress{true};
        bool partial{true};
        bool progress{true};
        bool delete_extraneous{false};
        bool dry_run{false};
        bool checksum{false};
        bool times{true};
        bool perms{true};
        bool owner{false};
        bool group{false};
        bool in_place{false};
        bool whole_file{false};
        bool sparse_files{false};
        bool hard_links{false};
        bool numeric_ids{false};
        bool itemize_changes{true};
        bool stats{true};
        bool human_readable{true};
        bool recursive{false};
        bool dirs{false};
        bool mkpath{false};
        std::vector<std::string> exclude;
        std::vector<std::string> include;
        std::optional<std::string> exclude_from;
        std::optional<std::string> include_from;
        std::optional<std::int64_t> bandwidth_limit;
        std::optional<std::int64_t> io_timeout;
        std::optional<std::string> max_size;
        std::optional<std::string> min_size;
        std::optional<std::string> log_file;
        std::optional<std::string> temp_dir;
        std::vector<std::string> ssh_options;
    };

    void to_json(nlohmann::json &json, const RsyncOptions &options);
    void from_json(const nlohmann::json &json, RsyncOptions &options);

    struct TransferProgress
    {
        std::uint64_t bytes_transferred{};
        std::uint64_t total_bytes{};
        int percentage{};
        std::string speed;
        std::string eta;
        TimePoint start_time{};
        TimePoint last_update{};
    };

    void to_json(nlohmann::json &json, const TransferProgress &progress);
    void from_json(const nlohmann::json &json, TransferProgress &progress);

    // What a producer hands to enqueue.
    struct TransferSpec
    {
        std::string job_id;
        std::string file_id;
        TransferType type{TransferType::Download};
        TransferPriority priority{TransferPriority::Normal};
        std::string source;
        std::string destination;
        std::string filename;
        std::string relative_path;
        std::uint64_t size{};
        SshCredentials ssh;
        RsyncOptions options;
        std::optional<int> max_retries;
    };

    void to_json(nlohmann::json &json, const TransferSpec &spec);
    void from_json(const nlohmann::json &json, TransferSpec &spec);

    struct TransferJob
    {
        std::string id;
        std::string job_id;
        std::string file_id;
        TransferType type{TransferType::Download};
        TransferPriority priority{TransferPriority::Normal};
        std::string source;
        std::string destination;
        std::string filename;
        std::string relative_path;
        std::uint64_t size{};
        SshCredentials ssh;
        RsyncOptions options;

        TransferStatus status{TransferStatus::Queued};
        int retry_count{};
        int max_retries{};
        std::string error;
        std::optional<TransferProgress> progress;
        TimePoint created_at{};
        std::optional<TimePoint> scheduled_at;
        std::optional<TimePoint> started_at;
        std::optional<TimePoint> completed_at;
    };

    void to_json(nlohmann::json &json, const TransferJob &job);
    void from_json(const nlohmann::json &json, TransferJob &job);

    // Same document as to_json with key material and passwords masked.
    nlohmann::json to_public_json(const TransferJob &job);

    struct TransferFilter
    {
        std::vector<TransferStatus> statuses;
        std::vector<TransferPriority> priorities;
        std::vector<TransferType> types;
        std::optional<std::string> job_id;
        std::optional<std::string> file_id;
        std::optional<std::string> filename;
        std::optional<TimePoint> created_after;
        std::optional<TimePoint> created_before;

        bool matches(const TransferJob &job) const;
    };

    void to_json(nlohmann::json &json, const TransferFilter &filter);
    void from_json(const nlohmann::json &json, TransferFilter &filter);

    struct QueueStats
    {
        std::size_t total{};
        std::size_t queued{};
        std::size_t scheduled{};
        std::size_t active{};
        std::size_t retrying{};
        std::size_t completed{};
        std::size_t failed{};
        std::size_t cancelled{};
        std::uint64_t total_bytes_queued{};
        std::uint64_t total_bytes_transferred{};
        std::uint64_t total_bytes_remaining{};
        std::chrono::milliseconds estimated_time_remaining{0};
    };

    void to_json(nlohmann::json &json, const QueueStats &stats);
    void from_json(const nlohmann::json &json, QueueStats &stats);

    std::int64_t to_unix_millis(TimePoint time) noexcept;
    TimePoint from_unix_millis(std::int64_t millis) noexcept;

} // namespace warpsync
