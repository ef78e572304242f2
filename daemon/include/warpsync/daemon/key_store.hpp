#pragma once

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <set>
#include <string_view>

namespace warpsync::daemon
{

    // Owner-only temporary files holding SSH private keys for the lifetime of
    // one copy process.
    class KeyStore
    {
    public:
        explicit KeyStore(std::filesystem::path directory);
        ~KeyStore();

        KeyStore(const KeyStore &) = delete;
        KeyStore &operator=(const KeyStore &) = delete;

        // Throws TransferError(ValidationFailed) for material that is not a
        // PEM/OpenSSH key and TransferError(InternalError) on I/O failure.
        std::filesystem::path write_key(std::string_view material);

        void remove(const std::filesystem::path &path);

        std::size_t remove_all();

        std::size_t tracked_count() const;

        const std::filesystem::path &directory() const noexcept { return directory_; }

        static bool looks_like_private_key(std::string_view material) noexcept;

    private:
        std::filesystem::path directory_;
        mutable std::mutex mutex_;
        std::set<std::filesystem::path> files_;
    };

} // namespace warpsync::daemon
