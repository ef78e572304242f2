#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "warpsync/ctl/config.hpp"
#include "warpsync/ctl/control_client.hpp"
#include "warpsync/ctl/logger.hpp"
#include "warpsync/error_codes.hpp"
#include "warpsync/protocol.hpp"
#include "warpsync/transfer_types.hpp"
#include "warpsync/version.hpp"

namespace
{

    using warpsync::protocol::Command;
    using warpsync::protocol::ResponseEnvelope;
    using warpsync::protocol::ResponseKind;

    nlohmann::json read_json_file(const std::string &path)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw warpsync::TransferError(warpsync::ErrorCode::NotFound, "Unable to open " + path);
        }
        try
        {
            return nlohmann::json::parse(in);
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw warpsync::TransferError(warpsync::ErrorCode::InvalidPayload, path + ": " + ex.what());
        }
    }

    void require_args(const warpsync::ctl::CtlConfig &config, std::size_t count, const char *what)
    {
        if (config.args.size() != count)
        {
            throw std::runtime_error(config.command + " expects " + what);
        }
    }

    nlohmann::json build_filter(const std::vector<std::string> &args)
    {
        nlohmann::json filter = nlohmann::json::object();
        for (std::size_t i = 0; i < args.size(); ++i)
        {
            const auto &arg = args[i];
            if (i + 1 >= args.size())
            {
                throw std::runtime_error("Missing value for " + arg);
            }
            const auto &value = args[++i];
            if (arg == "--status")
            {
                filter["status"].push_back(value);
            }
            else if (arg == "--priority")
            {
                filter["priority"].push_back(value);
            }
            else if (arg == "--type")
            {
                filter["type"].push_back(value);
            }
            else if (arg == "--job")
            {
                filter["job_id"] = value;
            }
            else if (arg == "--name")
            {
                filter["filename"] = value;
            }
            else
            {
                throw std::runtime_error("Unknown list option: " + arg);
            }
        }
        return filter;
    }

    void print_error(const ResponseEnvelope &response)
    {
        std::cerr << "ERROR: " << warpsync::to_string(response.error) << std::endl;
        if (!response.message.empty())
        {
            std::cerr << response.message << std::endl;
        }
    }

    void print_transfer_table(const nlohmann::json &transfers)
    {
        std::cout << std::left << std::setw(26) << "ID" << std::setw(14) << "STATUS" << std::setw(8) << "PRIO"
                  << std::setw(7) << "PCT" << std::setw(8) << "RETRY" << "FILE" << "\n";
        for (const auto &transfer : transfers)
        {
            int percentage = 0;
            if (transfer.contains("progress") && transfer["progress"].is_object())
            {
                percentage = transfer["progress"].value("percentage", 0);
            }
            const auto retries = std::to_string(transfer.value("retry_count", 0)) + "/" +
                                 std::to_string(transfer.value("max_retries", 0));
            std::cout << std::left << std::setw(26) << transfer.value("id", std::string{}) << std::setw(14)
                      << transfer.value("status", std::string{}) << std::setw(8)
                      << transfer.value("priority", std::string{}) << std::setw(7)
                      << (std::to_string(percentage) + "%") << std::setw(8) << retries
                      << transfer.value("filename", std::string{}) << "\n";
            const auto error = transfer.value("error", std::string{});
            if (!error.empty())
            {
                std::cout << "    " << error << "\n";
            }
        }
        std::cout << transfers.size() << " transfer(s)" << std::endl;
    }

    int run(const warpsync::ctl::CtlConfig &config, warpsync::ctl::Logger &logger)
    {
        std::optional<Command> command;
        nlohmann::json payload = nlohmann::json::object();

        if (config.command == "enqueue")
        {
            require_args(config, 1, "<spec.json>");
            payload = read_json_file(config.args[0]);
            const auto spec = payload.get<warpsync::TransferSpec>();
            logger.log("enqueue", to_string(spec.type), ' ', spec.source, " -> ", spec.destination);
            command = Command::Enqueue;
        }
        else if (config.command == "enqueue-batch")
        {
            require_args(config, 1, "<specs.json>");
            auto specs = read_json_file(config.args[0]);
            payload = {{"transfers", specs.is_array() ? specs : specs.value("transfers", nlohmann::json::array())}};
            const auto request = payload.get<warpsync::protocol::EnqueueBatchRequest>();
            logger.log("enqueue", request.transfers.size(), " transfer(s) in batch");
            command = Command::EnqueueBatch;
        }
        else if (config.command == "cancel" || config.command == "get")
        {
            require_args(config, 1, "<transfer-id>");
            payload = warpsync::protocol::TransferIdRequest{config.args[0]};
            command = config.command == "cancel" ? Command::Cancel : Command::Get;
        }
        else if (config.command == "list")
        {
            payload = build_filter(config.args);
            command = Command::List;
        }
        else if (config.command == "stats" || config.command == "health" || config.command == "ping")
        {
            require_args(config, 0, "no arguments");
            command = config.command == "stats"    ? Command::Stats
                      : config.command == "health" ? Command::Health
                                                   : Command::Ping;
        }
        else
        {
            throw std::runtime_error("Unknown command: " + config.command);
        }

        warpsync::ctl::ControlClient client(logger);
        client.connect(config.host, config.port);
        const auto response = client.rpc(*command, payload);
        if (response.kind == ResponseKind::Error)
        {
            print_error(response);
            return EXIT_FAILURE;
        }

        if (!config.raw_json && *command == Command::List)
        {
            print_transfer_table(response.payload.value("transfers", nlohmann::json::array()));
        }
        else if (!config.raw_json && *command == Command::Enqueue)
        {
            std::cout << response.payload.value("transfer_id", std::string{}) << std::endl;
        }
        else if (!config.raw_json && *command == Command::Cancel)
        {
            const bool cancelled = response.payload.value("cancelled", false);
            std::cout << (cancelled ? "cancelled" : "not cancelled (unknown or already finished)") << std::endl;
        }
        else
        {
            std::cout << response.payload.dump(2) << std::endl;
        }
        return EXIT_SUCCESS;
    }

} // namespace

int main(int argc, char *argv[])
{
    if (argc >= 2 && (std::string(argv[1]) == "--help" || std::string(argv[1]) == "-h"))
    {
        std::cout << "WarpSync control client " << warpsync::version() << "\n" << warpsync::ctl::usage(argv[0]);
        return EXIT_SUCCESS;
    }

    warpsync::ctl::CtlConfig config;
    try
    {
        config = warpsync::ctl::parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << ex.what() << "\n" << warpsync::ctl::usage(argv[0]);
        return EXIT_FAILURE;
    }

    warpsync::ctl::Logger logger(config.log_path);
    try
    {
        return run(config, logger);
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        logger.log("error", "fatal: ", ex.what());
        return EXIT_FAILURE;
    }
}
