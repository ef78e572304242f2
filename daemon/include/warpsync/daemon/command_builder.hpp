#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "warpsync/transfer_types.hpp"

namespace warpsync::daemon
{

    // Everything needed to render one copy-tool invocation. The key file is
    // the on-disk path the key store wrote; inline key material never reaches
    // the command line.
    struct CommandSpec
    {
        TransferType type{TransferType::Download};
        std::string source;
        std::string destination;
        SshCredentials ssh;
        RsyncOptions options;
        std::optional<std::filesystem::path> key_file;

        bool remote_source() const noexcept { return type != TransferType::Upload; }
    };

    CommandSpec command_spec_for(const TransferJob &job);

    struct RsyncCommand
    {
        std::string program;
        // Exact argv for exec, no shell involved.
        std::vector<std::string> arguments;
        // The same arguments escaped for a POSIX shell.
        std::vector<std::string> shell_words;
        // Words of the ssh sub-command passed through `-e`.
        std::vector<std::string> ssh_words;

        std::string to_shell_command() const;
        // Shell rendering with the key file path masked, for logs.
        std::string redacted() const;
    };

    struct ValidationResult
    {
        std::vector<std::string> errors;

        bool valid() const noexcept { return errors.empty(); }
        std::string joined() const;
    };

    // Passes [A-Za-z0-9_/:=.-] through untouched, single-quotes anything else
    // with embedded quotes rewritten as '\''.
    std::string escape_shell_arg(std::string_view value);

    // Always single-quoted; the remote shell parses it in every spawn mode.
    std::string quote_remote_path(std::string_view value);

    // Returns an error message or nullopt.
    std::optional<std::string> validate_path(std::string_view path, bool remote);

    class CommandBuilder
    {
    public:
        explicit CommandBuilder(std::string rsync_binary = "rsync");

        ValidationResult validate(const CommandSpec &spec) const;

        RsyncCommand build(const CommandSpec &spec) const;

        std::vector<std::string> ssh_words(const SshCredentials &ssh, const std::optional<std::filesystem::path> &key_file,
                                           const std::vector<std::string> &extra) const;

    private:
        std::string rsync_binary_;
    };

} // namespace warpsync::daemon
