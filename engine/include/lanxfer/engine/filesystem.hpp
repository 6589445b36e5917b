#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "lanxfer/protocol.hpp"

namespace lanxfer::engine
{

    /// Pre-order, depth-first listing of everything a sender offers.
    struct Manifest
    {
        std::vector<protocol::FileEntry> files;
        std::vector<std::filesystem::path> sources;
        std::uint64_t total_size{};
    };

    // Directories are listed before their children; siblings in name order.
    // Throws TransferError(NotFound) for a missing top-level path.
    Manifest build_manifest(const std::vector<std::filesystem::path> &paths);

    // Joins a peer-supplied relative path onto base. Throws
    // TransferError(PathRejected) for "..", absolute or empty paths.
    std::filesystem::path resolve_under(const std::filesystem::path &base, const std::string &relative_path);

} // namespace lanxfer::engine
