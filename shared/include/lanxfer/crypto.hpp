/**
 * lanxfer - Randomness and hashing helpers built on libsodium.
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>

#include <sodium.h>

namespace lanxfer::crypto
{

    void ensure_sodium_init();

    /// Random RFC 4122 version 4 identifier, lowercase hex with dashes.
    std::string random_uuid();

    /// Six decimal digits, uniformly drawn from 100000-999999.
    std::string random_pairing_code();

    std::string sha256_hex(std::string_view data);

    /// Incremental unkeyed BLAKE2b-256, used to compare sent and received files.
    class Blake2bHasher
    {
    public:
        Blake2bHasher();

        Blake2bHasher &update(std::span<const std::byte> data);
        std::string final_hex();

    private:
        crypto_generichash_state state_{};
        bool finalized_{false};
    };

    std::string hash_file(const std::filesystem::path &path);

} // namespace lanxfer::crypto
