#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace warpsync::daemon
{

    struct ParsedProgress
    {
        std::string filename;
        int file_number{};
        int total_files{};
        int percentage{};
        std::string speed;
        std::string eta;
        std::uint64_t bytes_transferred{};
        std::uint64_t total_bytes{};
    };

    struct TransferStats
    {
        std::uint64_t total_files{};
        std::uint64_t regular_files_transferred{};
        std::uint64_t total_size{};
        std::uint64_t transferred_size{};
        std::uint64_t literal_data{};
        std::uint64_t matched_data{};
        std::uint64_t file_list_size{};
        double file_list_generation_seconds{};
        double file_list_transfer_seconds{};
        std::uint64_t bytes_sent{};
        std::uint64_t bytes_received{};
        double transfer_rate{};
        double compression_ratio{};
    };

    void to_json(nlohmann::json &json, const TransferStats &stats);

    // Stateful: a progress line without a filename inherits the one from the
    // most recent itemized line.
    class ProgressParser
    {
    public:
        // Never throws; unrecognized lines yield nullopt.
        std::optional<ParsedProgress> parse_line(std::string_view line);

        void reset();

        static std::optional<TransferStats> parse_stats(const std::vector<std::string> &lines);

    private:
        std::optional<ParsedProgress> current_;
    };

    // "1,234,567", "1.23M" (1024 based) -> bytes.
    std::uint64_t parse_size(std::string_view text);

    // "12.34MB/s", "512.00kB/s", "100 bytes/s" -> bytes per second.
    std::optional<double> parse_speed(std::string_view text);

} // namespace warpsync::daemon
