/**
 * WarpSync - Length-prefixed JSON framing for the control socket.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include <nlohmann/json.hpp>

namespace warpsync::protocol
{

    // Frames larger than this are rejected by readers.
    inline constexpr std::uint32_t kMaxFrameSize = 16u * 1024u * 1024u;

    struct DecodedFrame
    {
        nlohmann::json message;
        std::size_t bytes_consumed{};
    };

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message);

    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer);

    std::uint32_t read_frame_size(std::span<const std::uint8_t, 4> header) noexcept;

} // namespace warpsync::protocol
