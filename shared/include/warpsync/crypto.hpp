/**
 * WarpSync - Random identifiers and fingerprints built on libsodium.
 */
#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace warpsync::crypto
{

    void ensure_sodium_init();

    // Hex string of `bytes` random bytes.
    std::string random_token(std::size_t bytes = 16);

    std::string hash_bytes(std::span<const std::byte> data);

    std::string hash_text(std::string_view text);

} // namespace warpsync::crypto
