#pragma once

#include <filesystem>
#include <optional>

namespace lanxfer::cli
{

    /// Installs the default spdlog logger: colour console plus an optional file sink.
    void configure_logging(const std::optional<std::filesystem::path> &log_path, bool verbose);

} // namespace lanxfer::cli
