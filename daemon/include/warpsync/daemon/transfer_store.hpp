#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "warpsync/transfer_types.hpp"

namespace warpsync::daemon
{

    // Persisted catalog of transfer records; the source of truth for recovery.
    class TransferStore
    {
    public:
        virtual ~TransferStore() = default;

        virtual void save(const TransferJob &job) = 0;
        virtual std::optional<TransferJob> find(const std::string &transfer_id) const = 0;
        virtual std::vector<TransferJob> find_by_job(const std::string &job_id) const = 0;
        virtual std::vector<TransferJob> load_all() const = 0;
        virtual bool remove(const std::string &transfer_id) = 0;
    };

    // One `<id>.json` file per transfer. Files are owner-only because records
    // carry SSH credentials.
    class JsonTransferStore : public TransferStore
    {
    public:
        explicit JsonTransferStore(std::filesystem::path directory);

        void save(const TransferJob &job) override;
        std::optional<TransferJob> find(const std::string &transfer_id) const override;
        std::vector<TransferJob> find_by_job(const std::string &job_id) const override;
        std::vector<TransferJob> load_all() const override;
        bool remove(const std::string &transfer_id) override;

        const std::filesystem::path &directory() const noexcept { return directory_; }

    private:
        std::filesystem::path record_path(const std::string &transfer_id) const;
        std::optional<TransferJob> read_record(const std::filesystem::path &path) const;

        std::filesystem::path directory_;
        mutable std::mutex mutex_;
    };

} // namespace warpsync::daemon
