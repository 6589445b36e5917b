#include "lanxfer/crypto.hpp"

#include <array>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace lanxfer::crypto
{

    namespace
    {

        std::string bin_to_hex(const unsigned char *data, std::size_t size)
        {
            std::string hex(size * 2 + 1, '\0');
            sodium_bin2hex(hex.data(), hex.size(), data, size);
            hex.pop_back();
            return hex;
        }

    } // namespace

    void ensure_sodium_init()
    {
        static std::once_flag flag;
        std::call_once(flag, []
                       {
                           if (sodium_init() < 0)
                           {
                               throw std::runtime_error("libsodium initialization failed");
                           } });
    }

    std::string random_uuid()
    {
        ensure_sodium_init();
        std::array<unsigned char, 16> bytes{};
        randombytes_buf(bytes.data(), bytes.size());
        // Version 4, RFC 4122 variant.
        bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
        bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

        // 8-4-4-4-12 hex digits.
        static constexpr std::array<std::size_t, 5> kGroupBytes = {4, 2, 2, 2, 6};
        std::string uuid;
        uuid.reserve(36);
        std::size_t offset = 0;
        for (const auto length : kGroupBytes)
        {
            if (!uuid.empty())
            {
                uuid.push_back('-');
            }
            uuid += bin_to_hex(bytes.data() + offset, length);
            offset += length;
        }
        return uuid;
    }

    std::string random_pairing_code()
    {
        ensure_sodium_init();
        return std::to_string(100000 + randombytes_uniform(900000));
    }

    std::string sha256_hex(std::string_view data)
    {
        ensure_sodium_init();
        std::array<unsigned char, crypto_hash_sha256_BYTES> digest{};
        if (crypto_hash_sha256(digest.data(), reinterpret_cast<const unsigned char *>(data.data()), data.size()) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256 failed");
        }
        return bin_to_hex(digest.data(), digest.size());
    }

    Blake2bHasher::Blake2bHasher()
    {
        ensure_sodium_init();
        if (crypto_generichash_init(&state_, nullptr, 0, crypto_generichash_BYTES) != 0)
        {
            throw std::runtime_error("crypto_generichash_init failed");
        }
    }

    Blake2bHasher &Blake2bHasher::update(std::span<const std::byte> data)
    {
        if (finalized_)
        {
            throw std::logic_error("Blake2bHasher updated after final_hex()");
        }
        if (!data.empty() &&
            crypto_generichash_update(&state_, reinterpret_cast<const unsigned char *>(data.data()), data.size()) != 0)
        {
            throw std::runtime_error("crypto_generichash_update failed");
        }
        return *this;
    }

    std::string Blake2bHasher::final_hex()
    {
        if (finalized_)
        {
            throw std::logic_error("Blake2bHasher finalized twice");
        }
        finalized_ = true;
        std::array<unsigned char, crypto_generichash_BYTES> digest{};
        if (crypto_generichash_final(&state_, digest.data(), digest.size()) != 0)
        {
            throw std::runtime_error("crypto_generichash_final failed");
        }
        return bin_to_hex(digest.data(), digest.size());
    }

    std::string hash_file(const std::filesystem::path &path)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
        {
            throw std::runtime_error("Failed to open file for hashing: " + path.string());
        }

        Blake2bHasher hasher;
        std::vector<std::byte> buffer(64 * 1024);
        while (file.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size())) ||
               file.gcount() > 0)
        {
            hasher.update(std::span(buffer).first(static_cast<std::size_t>(file.gcount())));
        }
        if (file.bad())
        {
            throw std::runtime_error("Failed to read file for hashing: " + path.string());
        }
        return hasher.final_hex();
    }

} // namespace lanxfer::crypto
