#include "warpsync/daemon/transfer_store.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "warpsync/error_codes.hpp"

namespace warpsync::daemon
{

    namespace
    {
        constexpr auto kRecordExtension = ".json";

        bool is_safe_id(const std::string &id)
        {
            return !id.empty() && id.find('/') == std::string::npos && id.find("..") == std::string::npos;
        }

        void write_private_file(const std::filesystem::path &path, const std::string &content)
        {
            const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, S_IRUSR | S_IWUSR);
            if (fd < 0)
            {
                throw TransferError(ErrorCode::InternalError,
                                    "Failed to open " + path.string() + ": " + std::strerror(errno));
            }
            std::size_t written = 0;
            while (written < content.size())
            {
                const auto result = ::write(fd, content.data() + written, content.size() - written);
                if (result < 0 && errno == EINTR)
                {
                    continue;
                }
                if (result < 0)
                {
                    const auto error = errno;
                    ::close(fd);
                    throw TransferError(ErrorCode::InternalError,
                                        "Failed to write " + path.string() + ": " + std::strerror(error));
                }
                written += static_cast<std::size_t>(result);
            }
            if (::close(fd) != 0)
            {
                throw TransferError(ErrorCode::InternalError,
                                    "Failed to close " + path.string() + ": " + std::strerror(errno));
            }
        }
    } // namespace

    JsonTransferStore::JsonTransferStore(std::filesystem::path directory) : directory_(std::move(directory))
    {
        std::filesystem::create_directories(directory_);
        std::filesystem::permissions(directory_, std::filesystem::perms::owner_all,
                                     std::filesystem::perm_options::replace);
    }

    void JsonTransferStore::save(const TransferJob &job)
    {
        if (!is_safe_id(job.id))
        {
            throw TransferError(ErrorCode::InvalidPayload, "Invalid transfer id: " + job.id);
        }
        const nlohmann::json json = job;
        const auto path = record_path(job.id);
        auto temp_path = path;
        temp_path += ".tmp";

        std::lock_guard lock(mutex_);
        write_private_file(temp_path, json.dump(2));
        std::error_code ec;
        std::filesystem::rename(temp_path, path, ec);
        if (ec)
        {
            std::filesystem::remove(temp_path, ec);
            throw TransferError(ErrorCode::InternalError, "Failed to persist transfer " + job.id);
        }
    }

    std::optional<TransferJob> JsonTransferStore::find(const std::string &transfer_id) const
    {
        if (!is_safe_id(transfer_id))
        {
            return std::nullopt;
        }
        std::lock_guard lock(mutex_);
        return read_record(record_path(transfer_id));
    }

    std::vector<TransferJob> JsonTransferStore::find_by_job(const std::string &job_id) const
    {
        auto all = load_all();
        std::vector<TransferJob> result;
        for (auto &job : all)
        {
            if (job.job_id == job_id)
            {
                result.push_back(std::move(job));
            }
        }
        return result;
    }

    std::vector<TransferJob> JsonTransferStore::load_all() const
    {
        std::lock_guard lock(mutex_);
        std::vector<TransferJob> result;
        for (const auto &entry : std::filesystem::directory_iterator(directory_))
        {
            if (!entry.is_regular_file() || entry.path().extension() != kRecordExtension)
            {
                continue;
            }
            if (auto job = read_record(entry.path()))
            {
                result.push_back(std::move(*job));
            }
        }
        return result;
    }

    bool JsonTransferStore::remove(const std::string &transfer_id)
    {
        if (!is_safe_id(transfer_id))
        {
            return false;
        }
        std::lock_guard lock(mutex_);
        std::error_code ec;
        const bool removed = std::filesystem::remove(record_path(transfer_id), ec);
        if (ec)
        {
            spdlog::warn("Failed to remove transfer record {}: {}", transfer_id, ec.message());
        }
        return removed;
    }

    std::filesystem::path JsonTransferStore::record_path(const std::string &transfer_id) const
    {
        return directory_ / (transfer_id + kRecordExtension);
    }

    std::optional<TransferJob> JsonTransferStore::read_record(const std::filesystem::path &path) const
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            return std::nullopt;
        }
        try
        {
            return nlohmann::json::parse(in).get<TransferJob>();
        }
        catch (const nlohmann::json::exception &ex)
        {
            spdlog::warn("Skipping unreadable transfer record {}: {}", path.string(), ex.what());
        }
        catch (const TransferError &ex)
        {
            spdlog::warn("Skipping invalid transfer record {}: {}", path.string(), ex.what());
        }
        return std::nullopt;
    }

} // namespace warpsync::daemon
