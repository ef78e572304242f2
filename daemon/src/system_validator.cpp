#include "warpsync/daemon/system_validator.hpp"

#include <array>
#include <cstdio>
#include <fstream>
#include <regex>
#include <system_error>

#include <sys/wait.h>

#include <spdlog/spdlog.h>

#include "warpsync/crypto.hpp"
#include "warpsync/daemon/command_builder.hpp"

namespace warpsync::daemon
{

    namespace
    {

        std::optional<std::string> match_version(const std::string &output, const std::regex &pattern)
        {
            std::smatch match;
            if (std::regex_search(output, match, pattern))
            {
                return match[1].str();
            }
            return std::nullopt;
        }

    } // namespace

    void to_json(nlohmann::json &json, const SystemValidation &validation)
    {
        json = {
            {"valid", validation.valid},
            {"errors", validation.errors},
            {"warnings", validation.warnings},
        };
        if (validation.rsync_version)
        {
            json["rsync_version"] = *validation.rsync_version;
        }
        if (validation.ssh_version)
        {
            json["ssh_version"] = *validation.ssh_version;
        }
        if (validation.sshpass_version)
        {
            json["sshpass_version"] = *validation.sshpass_version;
        }
    }

    std::optional<CommandOutput> run_command(const std::string &command)
    {
        const auto full = command + " 2>&1";
        FILE *pipe = ::popen(full.c_str(), "r");
        if (!pipe)
        {
            return std::nullopt;
        }
        std::array<char, 4096> buffer{};
        CommandOutput result;
        while (std::fgets(buffer.data(), static_cast<int>(buffer.size()), pipe))
        {
            result.output += buffer.data();
        }
        const int status = ::pclose(pipe);
        if (status != -1 && WIFEXITED(status))
        {
            result.exit_code = WEXITSTATUS(status);
        }
        return result;
    }

    SystemValidator::SystemValidator(ProcessManagerConfig config)
        : config_(std::move(config))
    {
    }

    SystemValidation SystemValidator::validate(const std::filesystem::path &state_directory, bool check_sshpass) const
    {
        SystemValidation result;
        check_rsync(result);
        check_ssh(result);
        if (check_sshpass)
        {
            this->check_sshpass(result);
        }
        check_directory(result, state_directory);
        result.valid = result.errors.empty();

        spdlog::info("System validation {}: {} error(s), {} warning(s), rsync {}",
                     result.valid ? "passed" : "failed", result.errors.size(), result.warnings.size(),
                     result.rsync_version.value_or("unknown"));
        for (const auto &error : result.errors)
        {
            spdlog::error("System validation: {}", error);
        }
        for (const auto &warning : result.warnings)
        {
            spdlog::warn("System validation: {}", warning);
        }
        return result;
    }

    void SystemValidator::check_rsync(SystemValidation &result) const
    {
        const auto output = run_command(escape_shell_arg(config_.rsync_binary) + " --version");
        if (!output || output->exit_code != 0)
        {
            result.errors.push_back("rsync binary not found: " + config_.rsync_binary);
            return;
        }
        static const std::regex pattern{R"(rsync\s+version\s+v?(\d+\.\d+\.\d+))", std::regex::icase};
        result.rsync_version = match_version(output->output, pattern);
        if (!result.rsync_version)
        {
            result.warnings.push_back("Could not determine rsync version");
            return;
        }
        const auto major = std::stoi(result.rsync_version->substr(0, result.rsync_version->find('.')));
        if (major < 3)
        {
            result.warnings.push_back("rsync version " + *result.rsync_version +
                                      " is outdated. Version 3.0+ recommended.");
        }
    }

    void SystemValidator::check_ssh(SystemValidation &result) const
    {
        const auto output = run_command("ssh -V");
        if (!output || output->exit_code != 0)
        {
            result.errors.push_back("ssh client not found in PATH");
            return;
        }
        static const std::regex pattern{R"(OpenSSH[_\s](\d+\.\d+))", std::regex::icase};
        result.ssh_version = match_version(output->output, pattern);
        if (!result.ssh_version)
        {
            result.warnings.push_back("Could not determine SSH version");
        }
    }

    void SystemValidator::check_sshpass(SystemValidation &result) const
    {
        const auto output = run_command(escape_shell_arg(config_.sshpass_binary) + " -V");
        if (!output || output->exit_code != 0)
        {
            result.warnings.push_back("sshpass not available, password authentication will fail: " +
                                      config_.sshpass_binary);
            return;
        }
        static const std::regex pattern{R"(sshpass\s+(\d+\.\d+))", std::regex::icase};
        result.sshpass_version = match_version(output->output, pattern);
    }

    void SystemValidator::check_directory(SystemValidation &result, const std::filesystem::path &directory) const
    {
        std::error_code ec;
        std::filesystem::create_directories(directory, ec);
        if (ec)
        {
            result.errors.push_back("Cannot create state directory " + directory.string() + ": " + ec.message());
            return;
        }
        const auto probe = directory / (".probe_" + crypto::random_token(4));
        {
            std::ofstream out(probe, std::ios::trunc);
            if (!out.is_open() || !(out << "ok"))
            {
                result.errors.push_back("No write permission for state directory: " + directory.string());
                return;
            }
        }
        std::filesystem::remove(probe, ec);
        if (ec)
        {
            result.warnings.push_back("Could not remove probe file " + probe.string() + ": " + ec.message());
        }
    }

} // namespace warpsync::daemon
