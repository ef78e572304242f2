#include "warpsync/transfer_types.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>

#include "warpsync/error_codes.hpp"

namespace warpsync
{

    namespace
    {

        struct TypeMapping
        {
            TransferType type;
            std::string_view label;
        };

        constexpr std::array<TypeMapping, 5> kTypeMappings{{
            {TransferType::Download, "download"},
            {TransferType::Upload, "upload"},
            {TransferType::Sync, "sync"},
            {TransferType::Directory, "directory"},
            {TransferType::DirectoryPackage, "directory_package"},
        }};

        struct PriorityMapping
        {
            TransferPriority priority;
            std::string_view label;
        };

        constexpr std::array<PriorityMapping, 4> kPriorityMappings{{
            {TransferPriority::Low, "low"},
            {TransferPriority::Normal, "normal"},
            {TransferPriority::High, "high"},
            {TransferPriority::Urgent, "urgent"},
        }};

        struct StatusMapping
        {
            TransferStatus status;
            std::string_view label;
        };

        constexpr std::array<StatusMapping, 8> kStatusMappings{{
            {TransferStatus::Queued, "queued"},
            {TransferStatus::Scheduled, "scheduled"},
            {TransferStatus::Starting, "starting"},
            {TransferStatus::Transferring, "transferring"},
            {TransferStatus::Completed, "completed"},
            {TransferStatus::Failed, "failed"},
            {TransferStatus::Cancelled, "cancelled"},
            {TransferStatus::Retrying, "retrying"},
        }};

        struct StatusTransition
        {
            TransferStatus from;
            TransferStatus to;
        };

        constexpr std::array<StatusTransition, 15> kStatusTransitions{{
            {TransferStatus::Queued, TransferStatus::Scheduled},
            {TransferStatus::Queued, TransferStatus::Cancelled},
            {TransferStatus::Scheduled, TransferStatus::Starting},
            {TransferStatus::Scheduled, TransferStatus::Cancelled},
            {TransferStatus::Starting, TransferStatus::Transferring},
            {TransferStatus::Starting, TransferStatus::Retrying},
            {TransferStatus::Starting, TransferStatus::Failed},
            {TransferStatus::Starting, TransferStatus::Cancelled},
            {TransferStatus::Transferring, TransferStatus::Completed},
            {TransferStatus::Transferring, TransferStatus::Retrying},
            {TransferStatus::Transferring, TransferStatus::Failed},
            {TransferStatus::Transferring, TransferStatus::Cancelled},
            {TransferStatus::Failed, TransferStatus::Retrying},
            {TransferStatus::Retrying, TransferStatus::Queued},
            {TransferStatus::Retrying, TransferStatus::Cancelled},
        }};

        struct FlagField
        {
            std::string_view key;
            bool RsyncOptions::*member;
        };

        constexpr std::array<FlagField, 23> kFlagFields{{
            {"archive", &RsyncOptions::archive},
            {"verbose", &RsyncOptions::verbose},
            {"compress", &RsyncOptions::compress},
            {"partial", &RsyncOptions::partial},
            {"progress", &RsyncOptions::progress},
            {"delete", &RsyncOptions::delete_extraneous},
            {"dry_run", &RsyncOptions::dry_run},
            {"checksum", &RsyncOptions::checksum},
            {"times", &RsyncOptions::times},
            {"perms", &RsyncOptions::perms},
            {"owner", &RsyncOptions::owner},
            {"group", &RsyncOptions::group},
            {"in_place", &RsyncOptions::in_place},
            {"whole_file", &RsyncOptions::whole_file},
            {"sparse_files", &RsyncOptions::sparse_files},
            {"hard_links", &RsyncOptions::hard_links},
            {"numeric_ids", &RsyncOptions::numeric_ids},
            {"itemize_changes", &RsyncOptions::itemize_changes},
            {"stats", &RsyncOptions::stats},
            {"human_readable", &RsyncOptions::human_readable},
            {"recursive", &RsyncOptions::recursive},
            {"dirs", &RsyncOptions::dirs},
            {"mkpath", &RsyncOptions::mkpath},
        }};

        struct TextField
        {
            std::string_view key;
            std::optional<std::string> RsyncOptions::*member;
        };

        constexpr std::array<TextField, 6> kTextFields{{
            {"exclude_from", &RsyncOptions::exclude_from},
            {"include_from", &RsyncOptions::include_from},
            {"max_size", &RsyncOptions::max_size},
            {"min_size", &RsyncOptions::min_size},
            {"log_file", &RsyncOptions::log_file},
            {"temp_dir", &RsyncOptions::temp_dir},
        }};

        struct NumberField
        {
            std::string_view key;
            std::optional<std::int64_t> RsyncOptions::*member;
        };

        constexpr std::array<NumberField, 2> kNumberFields{{
            {"bandwidth_limit", &RsyncOptions::bandwidth_limit},
            {"io_timeout", &RsyncOptions::io_timeout},
        }};

        struct ListField
        {
            std::string_view key;
            std::vector<std::string> RsyncOptions::*member;
        };

        constexpr std::array<ListField, 3> kListFields{{
            {"exclude", &RsyncOptions::exclude},
            {"include", &RsyncOptions::include},
            {"ssh_options", &RsyncOptions::ssh_options},
        }};

        template <typename Table>
        auto find_field(const Table &table, std::string_view key)
        {
            return std::find_if(table.begin(), table.end(), [key](const auto &field)
                                { return field.key == key; });
        }

        void write_time(nlohmann::json &json, const char *key, const std::optional<TimePoint> &time)
        {
            if (time)
            {
                json[key] = to_unix_millis(*time);
            }
        }

        std::optional<TimePoint> read_time(const nlohmann::json &json, const char *key)
        {
            if (auto it = json.find(key); it != json.end() && !it->is_null())
            {
                return from_unix_millis(it->get<std::int64_t>());
            }
            return std::nullopt;
        }

        TransferType parse_type(const nlohmann::json &json)
        {
            const auto label = json.value("type", std::string{"download"});
            auto type = transfer_type_from_string(label);
            if (!type)
            {
                throw TransferError(ErrorCode::InvalidPayload, "Unknown transfer type: " + label);
            }
            return *type;
        }

        TransferPriority parse_priority(const nlohmann::json &json)
        {
            const auto label = json.value("priority", std::string{"normal"});
            auto priority = transfer_priority_from_string(label);
            if (!priority)
            {
                throw TransferError(ErrorCode::InvalidPayload, "Unknown transfer priority: " + label);
            }
            return *priority;
        }

        std::string mask(const std::string &secret)
        {
            return secret.empty() ? std::string{} : std::string{"***"};
        }

    } // namespace

    std::string_view to_string(TransferType type) noexcept
    {
        for (const auto &mapping : kTypeMappings)
        {
            if (mapping.type == type)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<TransferType> transfer_type_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kTypeMappings)
        {
            if (mapping.label == value)
            {
                return mapping.type;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(TransferPriority priority) noexcept
    {
        for (const auto &mapping : kPriorityMappings)
        {
            if (mapping.priority == priority)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<TransferPriority> transfer_priority_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kPriorityMappings)
        {
            if (mapping.label == value)
            {
                return mapping.priority;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(TransferStatus status) noexcept
    {
        for (const auto &mapping : kStatusMappings)
        {
            if (mapping.status == status)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<TransferStatus> transfer_status_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kStatusMappings)
        {
            if (mapping.label == value)
            {
                return mapping.status;
            }
        }
        return std::nullopt;
    }

    bool is_terminal(TransferStatus status) noexcept
    {
        return status == TransferStatus::Completed || status == TransferStatus::Failed ||
               status == TransferStatus::Cancelled;
    }

    bool is_active(TransferStatus status) noexcept
    {
        return status == TransferStatus::Starting || status == TransferStatus::Transferring;
    }

    bool is_pending(TransferStatus status) noexcept
    {
        return status == TransferStatus::Queued || status == TransferStatus::Scheduled;
    }

    bool is_valid_transition(TransferStatus from, TransferStatus to) noexcept
    {
        for (const auto &edge : kStatusTransitions)
        {
            if (edge.from == from && edge.to == to)
            {
                return true;
            }
        }
        return false;
    }

    void to_json(nlohmann::json &json, const SshCredentials &credentials)
    {
        json = {
            {"host", credentials.host},
            {"port", credentials.port},
            {"username", credentials.username},
        };
        if (!credentials.private_key.empty())
        {
            json["private_key"] = credentials.private_key;
        }
        if (!credentials.password.empty())
        {
            json["password"] = credentials.password;
        }
    }

    void from_json(const nlohmann::json &json, SshCredentials &credentials)
    {
        credentials.host = json.value("host", std::string{});
        credentials.port = json.value("port", 22);
        credentials.username = json.value("username", std::string{});
        credentials.private_key = json.value("private_key", std::string{});
        credentials.password = json.value("password", std::string{});
    }

    void to_json(nlohmann::json &json, const RsyncOptions &options)
    {
        json = nlohmann::json::object();
        for (const auto &field : kFlagFields)
        {
            json[std::string(field.key)] = options.*field.member;
        }
        for (const auto &field : kTextFields)
        {
            if (const auto &value = options.*field.member)
            {
                json[std::string(field.key)] = *value;
            }
        }
        for (const auto &field : kNumberFields)
        {
            if (const auto &value = options.*field.member)
            {
                json[std::string(field.key)] = *value;
            }
        }
        for (const auto &field : kListFields)
        {
            const auto &values = options.*field.member;
            if (!values.empty())
            {
                json[std::string(field.key)] = values;
            }
        }
    }

    void from_json(const nlohmann::json &json, RsyncOptions &options)
    {
        if (!json.is_object())
        {
            throw TransferError(ErrorCode::InvalidPayload, "rsync options must be an object");
        }
        options = RsyncOptions{};
        for (const auto &[key, value] : json.items())
        {
            if (auto flag = find_field(kFlagFields, key); flag != kFlagFields.end())
            {
                options.*flag->member = value.get<bool>();
            }
            else if (auto text = find_field(kTextFields, key); text != kTextFields.end())
            {
                options.*text->member = value.get<std::string>();
            }
            else if (auto number = find_field(kNumberFields, key); number != kNumberFields.end())
            {
                options.*number->member = value.get<std::int64_t>();
            }
            else if (auto list = find_field(kListFields, key); list != kListFields.end())
            {
                options.*list->member = value.get<std::vector<std::string>>();
            }
            else
            {
                throw TransferError(ErrorCode::InvalidPayload, "Unknown rsync option: " + key);
            }
        }
    }

    void to_json(nlohmann::json &json, const TransferProgress &progress)
    {
        json = {
            {"bytes_transferred", progress.bytes_transferred},
            {"total_bytes", progress.total_bytes},
            {"percentage", progress.percentage},
            {"speed", progress.speed},
            {"eta", progress.eta},
            {"start_time", to_unix_millis(progress.start_time)},
            {"last_update", to_unix_millis(progress.last_update)},
        };
    }

    void from_json(const nlohmann::json &json, TransferProgress &progress)
    {
        progress.bytes_transferred = json.value("bytes_transferred", 0ULL);
        progress.total_bytes = json.value("total_bytes", 0ULL);
        progress.percentage = json.value("percentage", 0);
        progress.speed = json.value("speed", std::string{});
        progress.eta = json.value("eta", std::string{});
        progress.start_time = from_unix_millis(json.value("start_time", 0LL));
        progress.last_update = from_unix_millis(json.value("last_update", 0LL));
    }

    void to_json(nlohmann::json &json, const TransferSpec &spec)
    {
        json = {
            {"job_id", spec.job_id},
            {"file_id", spec.file_id},
            {"type", to_string(spec.type)},
            {"priority", to_string(spec.priority)},
            {"source", spec.source},
            {"destination", spec.destination},
            {"filename", spec.filename},
            {"relative_path", spec.relative_path},
            {"size", spec.size},
            {"ssh", spec.ssh},
            {"rsync_options", spec.options},
        };
        if (spec.max_retries)
        {
            json["max_retries"] = *spec.max_retries;
        }
    }

    void from_json(const nlohmann::json &json, TransferSpec &spec)
    {
        spec.job_id = json.at("job_id").get<std::string>();
        spec.file_id = json.value("file_id", std::string{});
        spec.type = parse_type(json);
        spec.priority = parse_priority(json);
        spec.source = json.at("source").get<std::string>();
        spec.destination = json.at("destination").get<std::string>();
        spec.filename = json.value("filename", std::string{});
        spec.relative_path = json.value("relative_path", std::string{});
        spec.size = json.value("size", 0ULL);
        spec.ssh = json.value("ssh", SshCredentials{});
        spec.options = json.value("rsync_options", RsyncOptions{});
        if (auto it = json.find("max_retries"); it != json.end() && !it->is_null())
        {
            spec.max_retries = it->get<int>();
        }
        else
        {
            spec.max_retries.reset();
        }
    }

    void to_json(nlohmann::json &json, const TransferJob &job)
    {
        json = {
            {"id", job.id},
            {"job_id", job.job_id},
            {"file_id", job.file_id},
            {"type", to_string(job.type)},
            {"priority", to_string(job.priority)},
            {"source", job.source},
            {"destination", job.destination},
            {"filename", job.filename},
            {"relative_path", job.relative_path},
            {"size", job.size},
            {"ssh", job.ssh},
            {"rsync_options", job.options},
            {"status", to_string(job.status)},
            {"retry_count", job.retry_count},
            {"max_retries", job.max_retries},
            {"error", job.error},
            {"created_at", to_unix_millis(job.created_at)},
        };
        if (job.progress)
        {
            json["progress"] = *job.progress;
        }
        write_time(json, "scheduled_at", job.scheduled_at);
        write_time(json, "started_at", job.started_at);
        write_time(json, "completed_at", job.completed_at);
    }

    void from_json(const nlohmann::json &json, TransferJob &job)
    {
        job.id = json.at("id").get<std::string>();
        job.job_id = json.value("job_id", std::string{});
        job.file_id = json.value("file_id", std::string{});
        job.type = parse_type(json);
        job.priority = parse_priority(json);
        job.source = json.value("source", std::string{});
        job.destination = json.value("destination", std::string{});
        job.filename = json.value("filename", std::string{});
        job.relative_path = json.value("relative_path", std::string{});
        job.size = json.value("size", 0ULL);
        job.ssh = json.value("ssh", SshCredentials{});
        job.options = json.value("rsync_options", RsyncOptions{});

        const auto status_label = json.at("status").get<std::string>();
        auto status = transfer_status_from_string(status_label);
        if (!status)
        {
            throw TransferError(ErrorCode::InvalidPayload, "Unknown transfer status: " + status_label);
        }
        job.status = *status;
        job.retry_count = json.value("retry_count", 0);
        job.max_retries = json.value("max_retries", 0);
        job.error = json.value("error", std::string{});
        if (auto it = json.find("progress"); it != json.end() && !it->is_null())
        {
            job.progress = it->get<TransferProgress>();
        }
        else
        {
            job.progress.reset();
        }
        job.created_at = from_unix_millis(json.value("created_at", 0LL));
        job.scheduled_at = read_time(json, "scheduled_at");
        job.started_at = read_time(json, "started_at");
        job.completed_at = read_time(json, "completed_at");
    }

    nlohmann::json to_public_json(const TransferJob &job)
    {
        nlohmann::json json = job;
        auto &ssh = json["ssh"];
        if (ssh.contains("private_key"))
        {
            ssh["private_key"] = mask(job.ssh.private_key);
        }
        if (ssh.contains("password"))
        {
            ssh["password"] = mask(job.ssh.password);
        }
        return json;
    }

    bool TransferFilter::matches(const TransferJob &job) const
    {
        if (!statuses.empty() && std::find(statuses.begin(), statuses.end(), job.status) == statuses.end())
        {
            return false;
        }
        if (!priorities.empty() && std::find(priorities.begin(), priorities.end(), job.priority) == priorities.end())
        {
            return false;
        }
        if (!types.empty() && std::find(types.begin(), types.end(), job.type) == types.end())
        {
            return false;
        }
        if (job_id && job.job_id != *job_id)
        {
            return false;
        }
        if (file_id && job.file_id != *file_id)
        {
            return false;
        }
        if (filename && job.filename.find(*filename) == std::string::npos)
        {
            return false;
        }
        if (created_after && job.created_at < *created_after)
        {
            return false;
        }
        if (created_before && job.created_at > *created_before)
        {
            return false;
        }
        return true;
    }

    void to_json(nlohmann::json &json, const TransferFilter &filter)
    {
        json = nlohmann::json::object();
        if (!filter.statuses.empty())
        {
            auto &list = json["status"] = nlohmann::json::array();
            for (const auto status : filter.statuses)
            {
                list.push_back(to_string(status));
            }
        }
        if (!filter.priorities.empty())
        {
            auto &list = json["priority"] = nlohmann::json::array();
            for (const auto priority : filter.priorities)
            {
                list.push_back(to_string(priority));
            }
        }
        if (!filter.types.empty())
        {
            auto &list = json["type"] = nlohmann::json::array();
            for (const auto type : filter.types)
            {
                list.push_back(to_string(type));
            }
        }
        if (filter.job_id)
        {
            json["job_id"] = *filter.job_id;
        }
        if (filter.file_id)
        {
            json["file_id"] = *filter.file_id;
        }
        if (filter.filename)
        {
            json["filename"] = *filter.filename;
        }
        write_time(json, "created_after", filter.created_after);
        write_time(json, "created_before", filter.created_before);
    }

    void from_json(const nlohmann::json &json, TransferFilter &filter)
    {
        filter = TransferFilter{};
        for (const auto &label : json.value("status", std::vector<std::string>{}))
        {
            auto status = transfer_status_from_string(label);
            if (!status)
            {
                throw TransferError(ErrorCode::InvalidPayload, "Unknown transfer status: " + label);
            }
            filter.statuses.push_back(*status);
        }
        for (const auto &label : json.value("priority", std::vector<std::string>{}))
        {
            auto priority = transfer_priority_from_string(label);
            if (!priority)
            {
                throw TransferError(ErrorCode::InvalidPayload, "Unknown transfer priority: " + label);
            }
            filter.priorities.push_back(*priority);
        }
        for (const auto &label : json.value("type", std::vector<std::string>{}))
        {
            auto type = transfer_type_from_string(label);
            if (!type)
            {
                throw TransferError(ErrorCode::InvalidPayload, "Unknown transfer type: " + label);
            }
            filter.types.push_back(*type);
        }
        if (auto it = json.find("job_id"); it != json.end())
        {
            filter.job_id = it->get<std::string>();
        }
        if (auto it = json.find("file_id"); it != json.end())
        {
            filter.file_id = it->get<std::string>();
        }
        if (auto it = json.find("filename"); it != json.end())
        {
            filter.filename = it->get<std::string>();
        }
        filter.created_after = read_time(json, "created_after");
        filter.created_before = read_time(json, "created_before");
    }

    void to_json(nlohmann::json &json, const QueueStats &stats)
    {
        json = {
            {"total", stats.total},
            {"queued", stats.queued},
            {"scheduled", stats.scheduled},
            {"active", stats.active},
            {"retrying", stats.retrying},
            {"completed", stats.completed},
            {"failed", stats.failed},
            {"cancelled", stats.cancelled},
            {"total_bytes_queued", stats.total_bytes_queued},
            {"total_bytes_transferred", stats.total_bytes_transferred},
            {"total_bytes_remaining", stats.total_bytes_remaining},
            {"estimated_time_remaining_ms", stats.estimated_time_remaining.count()},
        };
    }

    void from_json(const nlohmann::json &json, QueueStats &stats)
    {
        stats.total = json.value("total", std::size_t{0});
        stats.queued = json.value("queued", std::size_t{0});
        stats.scheduled = json.value("scheduled", std::size_t{0});
        stats.active = json.value("active", std::size_t{0});
        stats.retrying = json.value("retrying", std::size_t{0});
        stats.completed = json.value("completed", std::size_t{0});
        stats.failed = json.value("failed", std::size_t{0});
        stats.cancelled = json.value("cancelled", std::size_t{0});
        stats.total_bytes_queued = json.value("total_bytes_queued", 0ULL);
        stats.total_bytes_transferred = json.value("total_bytes_transferred", 0ULL);
        stats.total_bytes_remaining = json.value("total_bytes_remaining", 0ULL);
        stats.estimated_time_remaining = std::chrono::milliseconds{json.value("estimated_time_remaining_ms", 0LL)};
    }

    std::int64_t to_unix_millis(TimePoint time) noexcept
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
    }

    TimePoint from_unix_millis(std::int64_t millis) noexcept
    {
        return TimePoint{std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds{millis})};
    }

} // namespace warpsync
