#include "warpsync/daemon/progress_parser.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <regex>

namespace warpsync::daemon
{

    namespace
    {

        const std::regex kProgressPattern{R"(^\s*([\d,.]+[KMGT]?)\s+(\d+)%\s+([\d.]+\w+/s)\s+(\d+:\d+:\d+))"};
        const std::regex kXfrPattern{R"(xfr#(\d+))"};
        const std::regex kCheckPattern{R"(to-ch(?:ec)?k=(\d+)/(\d+))"};
        const std::regex kConsiderPattern{R"((\d+) files to consider)"};
        const std::regex kItemizedPattern{R"(^[><][\w+.]+\s+(.+)$)"};

        struct StatsPattern
        {
            std::regex pattern;
            std::uint64_t TransferStats::*member;
        };

        const std::vector<StatsPattern> &size_patterns()
        {
            static const std::vector<StatsPattern> patterns{
                {std::regex{R"(Number of files:\s*([\d,]+))"}, &TransferStats::total_files},
                {std::regex{R"(Number of regular files transferred:\s*([\d,]+))"}, &TransferStats::regular_files_transferred},
                {std::regex{R"(Total file size:\s*([\d,.]+[KMGT]?))"}, &TransferStats::total_size},
                {std::regex{R"(Total transferred file size:\s*([\d,.]+[KMGT]?))"}, &TransferStats::transferred_size},
                {std::regex{R"(Literal data:\s*([\d,.]+[KMGT]?))"}, &TransferStats::literal_data},
                {std::regex{R"(Matched data:\s*([\d,.]+[KMGT]?))"}, &TransferStats::matched_data},
                {std::regex{R"(File list size:\s*([\d,.]+[KMGT]?))"}, &TransferStats::file_list_size},
                {std::regex{R"(sent\s+([\d,.]+[KMGT]?) bytes)"}, &TransferStats::bytes_sent},
                {std::regex{R"(received\s+([\d,.]+[KMGT]?) bytes)"}, &TransferStats::bytes_received},
            };
            return patterns;
        }

        const std::regex kGenerationPattern{R"(File list generation time:\s*([\d.]+))"};
        const std::regex kListTransferPattern{R"(File list transfer time:\s*([\d.]+))"};
        const std::regex kRatePattern{R"(([\d,.]+[KMGT]?) bytes/sec)"};

        int to_int(const std::string &text)
        {
            int value = 0;
            std::from_chars(text.data(), text.data() + text.size(), value);
            return value;
        }

        double to_double(std::string_view text)
        {
            std::string cleaned;
            for (const char c : text)
            {
                if (c != ',')
                {
                    cleaned += c;
                }
            }
            return std::strtod(cleaned.c_str(), nullptr);
        }

        double unit_multiplier(char unit)
        {
            switch (std::toupper(static_cast<unsigned char>(unit)))
            {
            case 'K':
                return 1024.0;
            case 'M':
                return 1024.0 * 1024.0;
            case 'G':
                return 1024.0 * 1024.0 * 1024.0;
            case 'T':
                return 1024.0 * 1024.0 * 1024.0 * 1024.0;
            default:
                return 1.0;
            }
        }

    } // namespace

    std::uint64_t parse_size(std::string_view text)
    {
        if (text.empty())
        {
            return 0;
        }
        double multiplier = 1.0;
        if (std::isalpha(static_cast<unsigned char>(text.back())))
        {
            multiplier = unit_multiplier(text.back());
            text.remove_suffix(1);
        }
        const auto value = to_double(text) * multiplier;
        return value > 0 ? static_cast<std::uint64_t>(value) : 0;
    }

    std::optional<double> parse_speed(std::string_view text)
    {
        static const std::regex kSpeedPattern{R"(^\s*([\d,.]+)\s*([kKMGT]?)(?:B|bytes)/s\s*$)"};
        const std::string value(text);
        std::smatch match;
        if (!std::regex_match(value, match, kSpeedPattern))
        {
            return std::nullopt;
        }
        const auto unit = match[2].str();
        return to_double(match[1].str()) * (unit.empty() ? 1.0 : unit_multiplier(unit.front()));
    }

    std::optional<ParsedProgress> ProgressParser::parse_line(std::string_view line)
    {
        const std::string text(line);
        std::smatch match;

        if (std::regex_search(text, match, kProgressPattern))
        {
            auto &progress = current_ ? *current_ : current_.emplace();
            progress.bytes_transferred = parse_size(match[1].str());
            progress.percentage = to_int(match[2].str());
            progress.speed = match[3].str();
            progress.eta = match[4].str();
            if (progress.percentage > 0)
            {
                progress.total_bytes = progress.bytes_transferred * 100 / static_cast<std::uint64_t>(progress.percentage);
            }
            if (std::regex_search(text, match, kXfrPattern))
            {
                progress.file_number = to_int(match[1].str());
            }
            if (std::regex_search(text, match, kCheckPattern))
            {
                const auto remaining = to_int(match[1].str());
                progress.total_files = to_int(match[2].str());
                progress.file_number = progress.total_files - remaining;
            }
            return progress;
        }

        if (std::regex_search(text, match, kConsiderPattern))
        {
            auto &progress = current_ ? *current_ : current_.emplace();
            progress.total_files = to_int(match[1].str());
            progress.file_number = 0;
            progress.percentage = 0;
            return progress;
        }

        std::string trimmed = text;
        trimmed.erase(0, trimmed.find_first_not_of(" \t"));
        if (std::regex_match(trimmed, match, kItemizedPattern))
        {
            auto &progress = current_ ? *current_ : current_.emplace();
            progress.filename = match[1].str();
            return progress;
        }

        return std::nullopt;
    }

    void ProgressParser::reset()
    {
        current_.reset();
    }

    std::optional<TransferStats> ProgressParser::parse_stats(const std::vector<std::string> &lines)
    {
        TransferStats stats;
        bool found = false;
        std::smatch match;
        for (const auto &line : lines)
        {
            for (const auto &entry : size_patterns())
            {
                if (std::regex_search(line, match, entry.pattern))
                {
                    stats.*entry.member = parse_size(match[1].str());
                    found = true;
                }
            }
            if (std::regex_search(line, match, kGenerationPattern))
            {
                stats.file_list_generation_seconds = to_double(match[1].str());
                found = true;
            }
            if (std::regex_search(line, match, kListTransferPattern))
            {
                stats.file_list_transfer_seconds = to_double(match[1].str());
                found = true;
            }
            if (std::regex_search(line, match, kRatePattern))
            {
                stats.transfer_rate = static_cast<double>(parse_size(match[1].str()));
                found = true;
            }
        }
        if (!found)
        {
            return std::nullopt;
        }
        if (stats.literal_data > 0 && stats.transferred_size > 0)
        {
            const auto transferred = static_cast<double>(stats.transferred_size);
            stats.compression_ratio = (transferred - static_cast<double>(stats.literal_data)) / transferred * 100.0;
        }
        return stats;
    }

    void to_json(nlohmann::json &json, const TransferStats &stats)
    {
        json = {
            {"total_files", stats.total_files},
            {"regular_files_transferred", stats.regular_files_transferred},
            {"total_size", stats.total_size},
            {"transferred_size", stats.transferred_size},
            {"literal_data", stats.literal_data},
            {"matched_data", stats.matched_data},
            {"file_list_size", stats.file_list_size},
            {"file_list_generation_seconds", stats.file_list_generation_seconds},
            {"file_list_transfer_seconds", stats.file_list_transfer_seconds},
            {"bytes_sent", stats.bytes_sent},
            {"bytes_received", stats.bytes_received},
            {"transfer_rate", stats.transfer_rate},
            {"compression_ratio", stats.compression_ratio},
        };
    }

} // namespace warpsync::daemon
