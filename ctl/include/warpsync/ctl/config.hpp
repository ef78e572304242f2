#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace warpsync::ctl
{

    struct CtlConfig
    {
        std::string host{"127.0.0.1"};
        std::uint16_t port{7878};
        std::optional<std::filesystem::path> log_path;
        bool raw_json{false};
        std::string command;
        std::vector<std::string> args;
    };

    // Throws std::runtime_error with a usage hint on malformed input.
    CtlConfig parse_arguments(int argc, char *argv[]);

    std::string usage(const char *program_name);

} // namespace warpsync::ctl
