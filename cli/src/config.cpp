#include "lanxfer/cli/config.hpp"

#include <chrono>
#include <stdexcept>
#include <string>

namespace lanxfer::cli
{

    namespace
    {

        std::string require_value(int &index, int argc, char *argv[], const std::string &flag)
        {
            if (index >= argc)
            {
                throw std::runtime_error(flag + " requires a value");
            }
            return argv[index++];
        }

        std::uint16_t parse_port(const std::string &value)
        {
            const auto port = std::stoul(value);
            if (port > 65535)
            {
                throw std::runtime_error("Port out of range: " + value);
            }
            return static_cast<std::uint16_t>(port);
        }

        std::chrono::milliseconds parse_millis(const std::string &value)
        {
            return std::chrono::milliseconds(std::stoll(value));
        }

        engine::PacketPolicy parse_policy(const std::string &value)
        {
            auto policy = engine::packet_policy_from_string(value);
            if (!policy)
            {
                throw std::runtime_error("Unknown packet policy: " + value + " (expected drop or reply-error)");
            }
            return *policy;
        }

        Command parse_command(const std::string &value)
        {
            if (value == "send")
            {
                return Command::Send;
            }
            if (value == "receive")
            {
                return Command::Receive;
            }
            if (value == "code")
            {
                return Command::Code;
            }
            if (value == "info")
            {
                return Command::Info;
            }
            if (value == "help" || value == "--help" || value == "-h")
            {
                return Command::Help;
            }
            throw std::runtime_error("Unknown command: " + value);
        }

        void split_endpoint(const std::string &endpoint, CliConfig &config)
        {
            const auto colon_pos = endpoint.rfind(':');
            if (colon_pos == std::string::npos)
            {
                config.peer_host = endpoint;
                return;
            }
            config.peer_host = endpoint.substr(0, colon_pos);
            config.peer_port = parse_port(endpoint.substr(colon_pos + 1));
            if (config.peer_host.empty())
            {
                throw std::runtime_error("Expected endpoint format host[:port]");
            }
        }

    } // namespace

    std::string usage(std::string_view program_name)
    {
        std::string text;
        text += "Usage:\n";
        text += "  " + std::string(program_name) + " send [options] <path>...\n";
        text += "  " + std::string(program_name) + " receive [options] <host>[:<port>] <code> [<save-dir>]\n";
        text += "  " + std::string(program_name) + " code\n";
        text += "  " + std::string(program_name) + " info\n";
        text += "Options:\n"
                "  --address <ADDRESS>      listen address (default 0.0.0.0)\n"
                "  --port <PORT>            listen port (default 45679 for send, ephemeral for receive)\n"
                "  --code <CODE>            pairing code to offer when sending\n"
                "  --name <NAME>            device name reported to peers\n"
                "  --chunk-size <BYTES>     bytes per file-data packet\n"
                "  --max-packet <BYTES>     largest accepted frame, 0 for no limit\n"
                "  --settle-ms <MS>         delay between handshake and first file\n"
                "  --entry-ms <MS>          delay after each file-info\n"
                "  --chunk-ms <MS>          delay between chunks\n"
                "  --malformed <POLICY>     drop | reply-error\n"
                "  --unknown <POLICY>       drop | reply-error\n"
                "  --verify                 print BLAKE2b digests of transferred files\n"
                "  --log <FILE>             also write the log to FILE\n"
                "  --verbose                debug logging\n";
        return text;
    }

    CliConfig parse_arguments(int argc, char *argv[])
    {
        CliConfig config;
        if (argc < 2)
        {
            return config;
        }

        int index = 1;
        config.command = parse_command(argv[index++]);
        bool port_given = false;
        std::vector<std::string> positional;

        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--address")
            {
                config.transfer.address = require_value(index, argc, argv, arg);
            }
            else if (arg == "--port")
            {
                config.transfer.port = parse_port(require_value(index, argc, argv, arg));
                port_given = true;
            }
            else if (arg == "--code")
            {
                config.pairing_code = require_value(index, argc, argv, arg);
            }
            else if (arg == "--name")
            {
                config.transfer.device_name = require_value(index, argc, argv, arg);
            }
            else if (arg == "--chunk-size")
            {
                config.transfer.chunk_size = static_cast<std::size_t>(std::stoull(require_value(index, argc, argv, arg)));
                if (config.transfer.chunk_size == 0)
                {
                    throw std::runtime_error("--chunk-size must be positive");
                }
            }
            else if (arg == "--max-packet")
            {
                config.transfer.max_packet_size =
                    static_cast<std::size_t>(std::stoull(require_value(index, argc, argv, arg)));
            }
            else if (arg == "--settle-ms")
            {
                config.transfer.settle_delay = parse_millis(require_value(index, argc, argv, arg));
            }
            else if (arg == "--entry-ms")
            {
                config.transfer.entry_delay = parse_millis(require_value(index, argc, argv, arg));
            }
            else if (arg == "--chunk-ms")
            {
                config.transfer.chunk_delay = parse_millis(require_value(index, argc, argv, arg));
            }
            else if (arg == "--malformed")
            {
                config.transfer.malformed_packet_policy = parse_policy(require_value(index, argc, argv, arg));
            }
            else if (arg == "--unknown")
            {
                config.transfer.unknown_packet_policy = parse_policy(require_value(index, argc, argv, arg));
            }
            else if (arg == "--log")
            {
                config.log_path = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--verify")
            {
                config.verify = true;
            }
            else if (arg == "--verbose" || arg == "-v")
            {
                config.verbose = true;
            }
            else if (arg.rfind("--", 0) == 0)
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
            else
            {
                positional.push_back(arg);
            }
        }

        switch (config.command)
        {
        case Command::Send:
            if (positional.empty())
            {
                throw std::runtime_error("send requires at least one path");
            }
            config.paths.assign(positional.begin(), positional.end());
            break;
        case Command::Receive:
            if (positional.size() < 2 || positional.size() > 3)
            {
                throw std::runtime_error("receive expects <host>[:<port>] <code> [<save-dir>]");
            }
            split_endpoint(positional[0], config);
            config.pairing_code = positional[1];
            if (positional.size() == 3)
            {
                config.save_path = positional[2];
            }
            if (!port_given)
            {
                config.transfer.port = 0;
            }
            break;
        case Command::Code:
        case Command::Info:
        case Command::Help:
            if (!positional.empty())
            {
                throw std::runtime_error("Unexpected argument: " + positional.front());
            }
            break;
        }

        return config;
    }

} // namespace lanxfer::cli
