#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace lanxfer::encoding
{

    std::string encode_base64(std::span<const std::byte> data);

    // Returns nullopt for characters outside the standard alphabet or data after padding.
    std::optional<std::vector<std::byte>> decode_base64(std::string_view input);

} // namespace lanxfer::encoding
