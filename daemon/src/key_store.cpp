#include "warpsync/daemon/key_store.hpp"

#include <cerrno>
#include <cstring>
#include <string>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include "warpsync/crypto.hpp"
#include "warpsync/error_codes.hpp"

namespace warpsync::daemon
{

    namespace
    {

        std::string trim(std::string_view text)
        {
            const auto begin = text.find_first_not_of(" \t\r\n");
            if (begin == std::string_view::npos)
            {
                return {};
            }
            const auto end = text.find_last_not_of(" \t\r\n");
            return std::string(text.substr(begin, end - begin + 1));
        }

        void write_all(int fd, const std::string &content, const std::filesystem::path &path)
        {
            std::size_t written = 0;
            while (written < content.size())
            {
                const auto result = ::write(fd, content.data() + written, content.size() - written);
                if (result < 0)
                {
                    if (errno == EINTR)
                    {
                        continue;
                    }
                    throw TransferError(ErrorCode::InternalError,
                                        "Failed to write key file " + path.string() + ": " + std::strerror(errno));
                }
                written += static_cast<std::size_t>(result);
            }
        }

    } // namespace

    KeyStore::KeyStore(std::filesystem::path directory) : directory_(std::move(directory))
    {
        std::filesystem::create_directories(directory_);
        std::filesystem::permissions(directory_, std::filesystem::perms::owner_all,
                                     std::filesystem::perm_options::replace);
    }

    KeyStore::~KeyStore()
    {
        remove_all();
    }

    bool KeyStore::looks_like_private_key(std::string_view material) noexcept
    {
        return material.find("-----BEGIN") != std::string_view::npos &&
               material.find("-----END") != std::string_view::npos;
    }

    std::filesystem::path KeyStore::write_key(std::string_view material)
    {
        if (material.empty() || !looks_like_private_key(material))
        {
            throw TransferError(ErrorCode::ValidationFailed, "Invalid SSH private key format");
        }

        const auto path = directory_ / ("key_" + crypto::random_token(8));
        const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, S_IRUSR | S_IWUSR);
        if (fd < 0)
        {
            throw TransferError(ErrorCode::InternalError,
                                "Failed to create key file " + path.string() + ": " + std::strerror(errno));
        }
        try
        {
            write_all(fd, trim(material) + "\n", path);
        }
        catch (const TransferError &)
        {
            ::close(fd);
            std::error_code ec;
            std::filesystem::remove(path, ec);
            throw;
        }
        ::close(fd);

        // umask may have narrowed the mode further; anything wider is refused by ssh.
        const auto perms = std::filesystem::status(path).permissions();
        if ((perms & std::filesystem::perms::all) != (std::filesystem::perms::owner_read | std::filesystem::perms::owner_write))
        {
            std::error_code ec;
            std::filesystem::remove(path, ec);
            throw TransferError(ErrorCode::InternalError, "Failed to set 0600 permissions on key file");
        }

        {
            std::lock_guard lock(mutex_);
            files_.insert(path);
        }
        spdlog::debug("Wrote temporary key file {} (fingerprint {})", path.string(),
                      crypto::hash_text(trim(material)).substr(0, 16));
        return path;
    }

    void KeyStore::remove(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec)
        {
            spdlog::warn("Failed to remove key file {}: {}", path.string(), ec.message());
        }
        std::lock_guard lock(mutex_);
        files_.erase(path);
    }

    std::size_t KeyStore::remove_all()
    {
        std::set<std::filesystem::path> files;
        {
            std::lock_guard lock(mutex_);
            files.swap(files_);
        }
        for (const auto &path : files)
        {
            std::error_code ec;
            std::filesystem::remove(path, ec);
            if (ec)
            {
                spdlog::warn("Failed to remove key file {}: {}", path.string(), ec.message());
            }
        }
        if (!files.empty())
        {
            spdlog::info("Removed {} temporary key file(s)", files.size());
        }
        return files.size();
    }

    std::size_t KeyStore::tracked_count() const
    {
        std::lock_guard lock(mutex_);
        return files_.size();
    }

} // namespace warpsync::daemon
