#include "lanxfer/encoding/base64.hpp"

#include <array>
#include <cctype>
#include <cstdint>

namespace lanxfer::encoding
{

    namespace
    {

        constexpr std::string_view kAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

        constexpr std::int8_t kInvalid = -1;
        constexpr std::int8_t kPadding = -2;

        consteval auto make_decode_table()
        {
            std::array<std::int8_t, 256> table{};
            table.fill(kInvalid);
            for (std::size_t i = 0; i < kAlphabet.size(); ++i)
            {
                table[static_cast<unsigned char>(kAlphabet[i])] = static_cast<std::int8_t>(i);
            }
            table[static_cast<unsigned char>('=')] = kPadding;
            return table;
        }

        constexpr auto kDecodeTable = make_decode_table();

    } // namespace

    std::string encode_base64(std::span<const std::byte> data)
    {
        std::string output;
        output.reserve(((data.size() + 2) / 3) * 4);

        std::size_t index = 0;
        for (; index + 3 <= data.size(); index += 3)
        {
            const auto triple = (std::to_integer<std::uint32_t>(data[index]) << 16) |
                                (std::to_integer<std::uint32_t>(data[index + 1]) << 8) |
                                std::to_integer<std::uint32_t>(data[index + 2]);
            output.push_back(kAlphabet[(triple >> 18) & 0x3F]);
            output.push_back(kAlphabet[(triple >> 12) & 0x3F]);
            output.push_back(kAlphabet[(triple >> 6) & 0x3F]);
            output.push_back(kAlphabet[triple & 0x3F]);
        }

        const auto remaining = data.size() - index;
        if (remaining == 1)
        {
            const auto value = std::to_integer<std::uint32_t>(data[index]) << 16;
            output.push_back(kAlphabet[(value >> 18) & 0x3F]);
            output.push_back(kAlphabet[(value >> 12) & 0x3F]);
            output.append("==");
        }
        else if (remaining == 2)
        {
            const auto value = (std::to_integer<std::uint32_t>(data[index]) << 16) |
                               (std::to_integer<std::uint32_t>(data[index + 1]) << 8);
            output.push_back(kAlphabet[(value >> 18) & 0x3F]);
            output.push_back(kAlphabet[(value >> 12) & 0x3F]);
            output.push_back(kAlphabet[(value >> 6) & 0x3F]);
            output.push_back('=');
        }

        return output;
    }

    std::optional<std::vector<std::byte>> decode_base64(std::string_view input)
    {
        std::vector<std::byte> output;
        output.reserve((input.size() * 3) / 4);

        std::uint32_t accumulator = 0;
        int bits_collected = 0;
        bool padding_seen = false;
        for (const char ch : input)
        {
            const auto c = static_cast<unsigned char>(ch);
            if (std::isspace(c))
            {
                continue;
            }
            const auto value = kDecodeTable[c];
            if (value == kInvalid)
            {
                return std::nullopt;
            }
            if (value == kPadding)
            {
                padding_seen = true;
                continue;
            }
            if (padding_seen)
            {
                return std::nullopt;
            }
            accumulator = (accumulator << 6) | static_cast<std::uint32_t>(value);
            bits_collected += 6;
            if (bits_collected >= 8)
            {
                bits_collected -= 8;
                output.push_back(static_cast<std::byte>((accumulator >> bits_collected) & 0xFFu));
            }
        }

        return output;
    }

} // namespace lanxfer::encoding
