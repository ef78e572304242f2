#include "warpsync/daemon/command_builder.hpp"

#include <algorithm>
#include <utility>

namespace warpsync::daemon
{

    namespace
    {

        bool is_safe_char(char c)
        {
            return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_' ||
                   c == '/' || c == ':' || c == '=' || c == '.' || c == '-';
        }

        std::string replace_single_quotes(std::string_view value)
        {
            std::string result;
            result.reserve(value.size() + 8);
            for (const char c : value)
            {
                if (c == '\'')
                {
                    result += "'\\''";
                }
                else
                {
                    result += c;
                }
            }
            return result;
        }

        std::string join(const std::vector<std::string> &words)
        {
            std::string result;
            for (const auto &word : words)
            {
                if (!result.empty())
                {
                    result += ' ';
                }
                result += word;
            }
            return result;
        }

        // Collects each argument twice: raw for exec, escaped for the shell.
        class ArgumentList
        {
        public:
            void flag(std::string flag)
            {
                raw_.push_back(flag);
                shell_.push_back(std::move(flag));
            }

            void flag_value(std::string_view flag, std::string_view value)
            {
                raw_.push_back(std::string(flag) + "=" + std::string(value));
                shell_.push_back(std::string(flag) + "=" + escape_shell_arg(value));
            }

            void value(std::string_view value)
            {
                raw_.emplace_back(value);
                shell_.push_back(escape_shell_arg(value));
            }

            std::vector<std::string> take_raw() { return std::move(raw_); }
            std::vector<std::string> take_shell() { return std::move(shell_); }

        private:
            std::vector<std::string> raw_;
            std::vector<std::string> shell_;
        };

        void add_basic_options(ArgumentList &args, const RsyncOptions &options)
        {
            struct FlagRendering
            {
                bool RsyncOptions::*member;
                const char *flag;
            };
            static constexpr FlagRendering kRenderings[] = {
                {&RsyncOptions::archive, "-a"},
                {&RsyncOptions::verbose, "-v"},
                {&RsyncOptions::compress, "-z"},
                {&RsyncOptions::partial, "--partial"},
                {&RsyncOptions::progress, "--progress"},
                {&RsyncOptions::delete_extraneous, "--delete"},
                {&RsyncOptions::dry_run, "--dry-run"},
                {&RsyncOptions::checksum, "-c"},
                {&RsyncOptions::times, "-t"},
                {&RsyncOptions::perms, "-p"},
                {&RsyncOptions::owner, "-o"},
                {&RsyncOptions::group, "-g"},
                {&RsyncOptions::in_place, "--inplace"},
                {&RsyncOptions::whole_file, "-W"},
                {&RsyncOptions::sparse_files, "-S"},
                {&RsyncOptions::hard_links, "-H"},
                {&RsyncOptions::numeric_ids, "--numeric-ids"},
                {&RsyncOptions::itemize_changes, "-i"},
                {&RsyncOptions::stats, "--stats"},
                {&RsyncOptions::human_readable, "-h"},
                {&RsyncOptions::recursive, "--recursive"},
                {&RsyncOptions::dirs, "--dirs"},
                {&RsyncOptions::mkpath, "--mkpath"},
            };
            for (const auto &rendering : kRenderings)
            {
                if (options.*rendering.member)
                {
                    args.flag(rendering.flag);
                }
            }
        }

        void add_filter_options(ArgumentList &args, const RsyncOptions &options)
        {
            if (options.exclude_from)
            {
                args.flag_value("--exclude-from", *options.exclude_from);
            }
            if (options.include_from)
            {
                args.flag_value("--include-from", *options.include_from);
            }
            for (const auto &pattern : options.exclude)
            {
                args.flag_value("--exclude", pattern);
            }
            for (const auto &pattern : options.include)
            {
                args.flag_value("--include", pattern);
            }
        }

        void add_performance_options(ArgumentList &args, const RsyncOptions &options)
        {
            if (options.bandwidth_limit && *options.bandwidth_limit > 0)
            {
                args.flag("--bwlimit=" + std::to_string(*options.bandwidth_limit));
            }
            if (options.io_timeout && *options.io_timeout > 0)
            {
                args.flag("--timeout=" + std::to_string(*options.io_timeout));
            }
            if (options.max_size)
            {
                args.flag_value("--max-size", *options.max_size);
            }
            if (options.min_size)
            {
                args.flag_value("--min-size", *options.min_size);
            }
            if (options.log_file)
            {
                args.flag_value("--log-file", *options.log_file);
            }
            if (options.temp_dir)
            {
                args.flag_value("--temp-dir", *options.temp_dir);
            }
        }

        // Host names, IPv4 and bracketed IPv6 literals. Anything else would
        // reach ssh or the local shell as syntax.
        bool is_host_char(char c)
        {
            return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '.' ||
                   c == '_' || c == '-' || c == ':' || c == '[' || c == ']';
        }

        bool is_username_char(char c)
        {
            return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '.' ||
                   c == '_' || c == '-';
        }

        template <typename Predicate>
        bool is_safe_name(const std::string &value, Predicate allowed)
        {
            return !value.empty() && value.front() != '-' && std::all_of(value.begin(), value.end(), allowed);
        }

        std::string with_trailing_slash(std::string path)
        {
            if (path.empty() || path.back() != '/')
            {
                path += '/';
            }
            return path;
        }

    } // namespace

    std::string escape_shell_arg(std::string_view value)
    {
        if (value.empty())
        {
            return "''";
        }
        if (std::all_of(value.begin(), value.end(), is_safe_char))
        {
            return std::string(value);
        }
        return "'" + replace_single_quotes(value) + "'";
    }

    std::string quote_remote_path(std::string_view value)
    {
        return "'" + replace_single_quotes(value) + "'";
    }

    std::optional<std::string> validate_path(std::string_view path, bool remote)
    {
        if (path.empty())
        {
            return std::string("Path must be a non-empty string");
        }
        if (path.size() > 1 && path.back() == '/')
        {
            path.remove_suffix(1);
        }
        if (path.front() != '/')
        {
            return std::string(remote ? "Remote path must be absolute (start with /)" : "Local path must be absolute");
        }
        if (path.find("..") != std::string_view::npos)
        {
            return std::string("Path cannot contain parent directory references (..)");
        }
        const bool has_control = std::any_of(path.begin(), path.end(), [](char c)
                                             {
                                                 const auto byte = static_cast<unsigned char>(c);
                                                 return byte < 0x20 || byte == 0x7f; });
        if (has_control)
        {
            return std::string("Path contains invalid control characters");
        }
        return std::nullopt;
    }

    CommandSpec command_spec_for(const TransferJob &job)
    {
        CommandSpec spec{
            .type = job.type,
            .source = job.source,
            .destination = job.destination,
            .ssh = job.ssh,
            .options = job.options,
            .key_file = std::nullopt,
        };
        if (job.type == TransferType::Directory || job.type == TransferType::DirectoryPackage)
        {
            spec.options.recursive = true;
        }
        if (job.type == TransferType::DirectoryPackage)
        {
            spec.options.dirs = true;
            spec.options.mkpath = true;
        }
        return spec;
    }

    std::string RsyncCommand::to_shell_command() const
    {
        auto words = shell_words;
        words.insert(words.begin(), escape_shell_arg(program));
        return join(words);
    }

    std::string RsyncCommand::redacted() const
    {
        auto masked = ssh_words;
        for (std::size_t i = 0; i + 1 < masked.size(); ++i)
        {
            if (masked[i] == "-i")
            {
                masked[i + 1] = "[PRIVATE_KEY_FILE]";
            }
        }
        auto words = shell_words;
        for (auto &word : words)
        {
            if (word.rfind("'ssh ", 0) == 0 || word.rfind("ssh ", 0) == 0)
            {
                word = escape_shell_arg(join(masked));
            }
        }
        words.insert(words.begin(), escape_shell_arg(program));
        return join(words);
    }

    std::string ValidationResult::joined() const
    {
        std::string result;
        for (const auto &error : errors)
        {
            if (!result.empty())
            {
                result += ", ";
            }
            result += error;
        }
        return result;
    }

    CommandBuilder::CommandBuilder(std::string rsync_binary) : rsync_binary_(std::move(rsync_binary)) {}

    ValidationResult CommandBuilder::validate(const CommandSpec &spec) const
    {
        ValidationResult result;
        if (auto error = validate_path(spec.source, spec.remote_source()))
        {
            result.errors.push_back("Invalid source path: " + *error);
        }
        if (auto error = validate_path(spec.destination, !spec.remote_source()))
        {
            result.errors.push_back("Invalid destination path: " + *error);
        }
        if (spec.ssh.host.empty())
        {
            result.errors.push_back("SSH host is required");
        }
        else if (!is_safe_name(spec.ssh.host, is_host_char))
        {
            result.errors.push_back("SSH host contains invalid characters");
        }
        if (spec.ssh.username.empty())
        {
            result.errors.push_back("SSH username is required");
        }
        else if (!is_safe_name(spec.ssh.username, is_username_char))
        {
            result.errors.push_back("SSH username contains invalid characters");
        }
        if (spec.ssh.port < 1 || spec.ssh.port > 65535)
        {
            result.errors.push_back("SSH port must be between 1 and 65535");
        }
        if (spec.ssh.private_key.empty() && spec.ssh.password.empty() && !spec.key_file)
        {
            result.errors.push_back("SSH private key or password is required");
        }
        if (spec.options.bandwidth_limit && *spec.options.bandwidth_limit < 0)
        {
            result.errors.push_back("Bandwidth limit must be positive");
        }
        if (spec.options.io_timeout && *spec.options.io_timeout < 0)
        {
            result.errors.push_back("Timeout must be positive");
        }
        return result;
    }

    std::vector<std::string> CommandBuilder::ssh_words(const SshCredentials &ssh,
                                                       const std::optional<std::filesystem::path> &key_file,
                                                       const std::vector<std::string> &extra) const
    {
        std::vector<std::string> words{"ssh"};
        const auto option = [&words](std::string value)
        {
            words.emplace_back("-o");
            words.push_back(std::move(value));
        };

        if (ssh.uses_password() && !key_file)
        {
            option("PubkeyAuthentication=no");
        }
        else
        {
            option("BatchMode=yes");
        }
        option("StrictHostKeyChecking=no");
        option("UserKnownHostsFile=/dev/null");
        option("LogLevel=ERROR");
        if (ssh.port != 22)
        {
            words.emplace_back("-p");
            words.push_back(std::to_string(ssh.port));
        }
        if (key_file)
        {
            words.emplace_back("-i");
            words.push_back(escape_shell_arg(key_file->string()));
        }
        option("Compression=yes");
        option("ConnectTimeout=30");
        option("ServerAliveInterval=60");
        option("ServerAliveCountMax=3");
        words.insert(words.end(), extra.begin(), extra.end());
        return words;
    }

    RsyncCommand CommandBuilder::build(const CommandSpec &spec) const
    {
        ArgumentList args;
        add_basic_options(args, spec.options);
        add_filter_options(args, spec.options);
        add_performance_options(args, spec.options);

        RsyncCommand command;
        command.program = rsync_binary_;
        command.ssh_words = ssh_words(spec.ssh, spec.key_file, spec.options.ssh_options);
        args.flag("-e");
        args.value(join(command.ssh_words));

        auto source = spec.source;
        if (spec.type == TransferType::DirectoryPackage)
        {
            source = with_trailing_slash(std::move(source));
        }
        // The path is quoted for the remote shell; the shell rendering quotes
        // the whole word again so the local shell hands it over intact.
        const auto remote_prefix = spec.ssh.username + "@" + spec.ssh.host + ":";
        if (spec.remote_source())
        {
            args.value(remote_prefix + quote_remote_path(source));
            args.value(spec.destination);
        }
        else
        {
            args.value(source);
            args.value(remote_prefix + quote_remote_path(spec.destination));
        }

        command.arguments = args.take_raw();
        command.shell_words = args.take_shell();
        return command;
    }

} // namespace warpsync::daemon
