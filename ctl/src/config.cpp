#include "warpsync/ctl/config.hpp"

#include <stdexcept>
#include <string>

namespace warpsync::ctl
{

    std::string usage(const char *program_name)
    {
        return std::string("Usage: ") + program_name +
               " [--endpoint <host:port>] [--log <file>] [--json] <command> [args]\n"
               "Commands:\n"
               "  enqueue <spec.json>          queue one transfer\n"
               "  enqueue-batch <specs.json>   queue a JSON array of transfers\n"
               "  cancel <transfer-id>\n"
               "  get <transfer-id>\n"
               "  list [--status S]... [--priority P]... [--type T]... [--job ID] [--name TEXT]\n"
               "  stats\n"
               "  health\n"
               "  ping\n";
    }

    CtlConfig parse_arguments(int argc, char *argv[])
    {
        CtlConfig config;
        int index = 1;
        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (!config.command.empty())
            {
                config.args.push_back(arg);
            }
            else if (arg == "--endpoint")
            {
                if (index >= argc)
                {
                    throw std::runtime_error("--endpoint requires host:port");
                }
                const std::string endpoint = argv[index++];
                const auto colon_pos = endpoint.rfind(':');
                if (colon_pos == std::string::npos)
                {
                    throw std::runtime_error("Expected endpoint format host:port");
                }
                config.host = endpoint.substr(0, colon_pos);
                const auto port = std::stoul(endpoint.substr(colon_pos + 1));
                if (port == 0 || port > 65535)
                {
                    throw std::runtime_error("Invalid port in endpoint: " + endpoint);
                }
                config.port = static_cast<std::uint16_t>(port);
            }
            else if (arg == "--log")
            {
                if (index >= argc)
                {
                    throw std::runtime_error("--log requires a file path");
                }
                config.log_path = std::filesystem::path(argv[index++]);
            }
            else if (arg == "--json")
            {
                config.raw_json = true;
            }
            else if (!arg.empty() && arg.front() == '-')
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
            else
            {
                config.command = arg;
            }
        }
        if (config.command.empty())
        {
            throw std::runtime_error("Missing command");
        }
        return config;
    }

} // namespace warpsync::ctl
