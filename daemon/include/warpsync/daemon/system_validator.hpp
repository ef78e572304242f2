#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "warpsync/daemon/config.hpp"

namespace warpsync::daemon
{

    struct SystemValidation
    {
        bool valid{true};
        std::vector<std::string> errors;
        std::vector<std::string> warnings;
        std::optional<std::string> rsync_version;
        std::optional<std::string> ssh_version;
        std::optional<std::string> sshpass_version;
    };

    void to_json(nlohmann::json &json, const SystemValidation &validation);

    struct CommandOutput
    {
        int exit_code{-1};
        std::string output;
    };

    // Runs `command` through the shell with stderr folded into stdout.
    std::optional<CommandOutput> run_command(const std::string &command);

    // Checks the external binaries and the state directory. Never throws;
    // problems are reported in the result.
    class SystemValidator
    {
    public:
        explicit SystemValidator(ProcessManagerConfig config);

        SystemValidation validate(const std::filesystem::path &state_directory, bool check_sshpass) const;

    private:
        void check_rsync(SystemValidation &result) const;
        void check_ssh(SystemValidation &result) const;
        void check_sshpass(SystemValidation &result) const;
        void check_directory(SystemValidation &result, const std::filesystem::path &directory) const;

        ProcessManagerConfig config_;
    };

} // namespace warpsync::daemon
