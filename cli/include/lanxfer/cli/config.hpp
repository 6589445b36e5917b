#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "lanxfer/engine/config.hpp"

namespace lanxfer::cli
{

    enum class Command : std::uint8_t
    {
        Help,
        Send,
        Receive,
        Code,
        Info
    };

    struct CliConfig
    {
        Command command{Command::Help};
        engine::TransferConfig transfer;

        // send
        std::vector<std::filesystem::path> paths;
        std::optional<std::string> pairing_code;

        // receive
        std::string peer_host;
        std::uint16_t peer_port{engine::kDefaultTransferPort};
        std::filesystem::path save_path{"."};

        std::optional<std::filesystem::path> log_path;
        bool verbose{false};
        bool verify{false};
    };

    std::string usage(std::string_view program_name);

    /// Throws std::runtime_error with a user-facing message on bad input.
    CliConfig parse_arguments(int argc, char *argv[]);

} // namespace lanxfer::cli
