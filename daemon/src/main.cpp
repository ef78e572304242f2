#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "warpsync/daemon/daemon.hpp"
#include "warpsync/error_codes.hpp"
#include "warpsync/version.hpp"

namespace
{

    void print_usage(const char *program_name)
    {
        std::cout << "WarpSync daemon " << warpsync::version() << "\n"
                  << "Usage: " << program_name
                  << " [--config <FILE>] [--address <ADDRESS>] [--port <PORT>] [--state <DIR>] [--log <FILE>] "
                     "[--events <FILE>] [--verbose]\n";
    }

    std::optional<std::string> read_option(int &index, int argc, char *argv[])
    {
        if (index + 1 >= argc)
        {
            return std::nullopt;
        }
        ++index;
        return std::string(argv[index]);
    }

    struct Overrides
    {
        std::optional<std::filesystem::path> config_file;
        std::optional<std::string> address;
        std::optional<std::uint16_t> port;
        std::optional<std::filesystem::path> state_directory;
        std::optional<std::filesystem::path> log_file;
        std::optional<std::filesystem::path> events_file;
        bool verbose{false};
    };

} // namespace

int main(int argc, char *argv[])
{
    using warpsync::daemon::Daemon;
    using warpsync::daemon::DaemonConfig;

    Overrides overrides;

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v")
        {
            overrides.verbose = true;
            continue;
        }
        if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        }
        if (arg != "--config" && arg != "--address" && arg != "--port" && arg != "--state" && arg != "--log" &&
            arg != "--events")
        {
            std::cerr << "Unknown argument: " << arg << std::endl;
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }
        auto value = read_option(i, argc, argv);
        if (!value)
        {
            std::cerr << "Missing value for " << arg << std::endl;
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }
        if (arg == "--config")
        {
            overrides.config_file = std::filesystem::path(*value);
        }
        else if (arg == "--address")
        {
            overrides.address = *value;
        }
        else if (arg == "--port")
        {
            unsigned long port = 0;
            try
            {
                port = std::stoul(*value);
            }
            catch (const std::exception &)
            {
                port = 65536;
            }
            if (port == 0 || port > 65535)
            {
                std::cerr << "Invalid port: " << *value << std::endl;
                return EXIT_FAILURE;
            }
            overrides.port = static_cast<std::uint16_t>(port);
        }
        else if (arg == "--state")
        {
            overrides.state_directory = std::filesystem::path(*value);
        }
        else if (arg == "--log")
        {
            overrides.log_file = std::filesystem::path(*value);
        }
        else
        {
            overrides.events_file = std::filesystem::path(*value);
        }
    }

    DaemonConfig config;
    try
    {
        if (overrides.config_file)
        {
            config = warpsync::daemon::load_config_file(*overrides.config_file);
        }
    }
    catch (const warpsync::TransferError &ex)
    {
        std::cerr << "Configuration error: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
    if (overrides.address)
    {
        config.address = *overrides.address;
    }
    if (overrides.port)
    {
        config.port = *overrides.port;
    }
    if (overrides.state_directory)
    {
        config.state_directory = *overrides.state_directory;
    }
    if (overrides.log_file)
    {
        config.log_file = overrides.log_file;
    }
    if (overrides.events_file)
    {
        config.events_file = overrides.events_file;
    }
    config.verbose = config.verbose || overrides.verbose;

    try
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string(), false));
        }
        auto logger = std::make_shared<spdlog::logger>("warpsyncd", sinks.begin(), sinks.end());
        logger->set_level(config.verbose ? spdlog::level::debug : spdlog::level::info);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
        spdlog::info("Starting WarpSync daemon {} on {}:{} with state {}", warpsync::version(), config.address,
                     config.port, config.state_directory.string());

        Daemon daemon(std::move(config));
        daemon.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Daemon failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
