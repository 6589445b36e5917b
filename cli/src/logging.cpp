#include "lanxfer/cli/logging.hpp"

#include <memory>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace lanxfer::cli
{

    void configure_logging(const std::optional<std::filesystem::path> &log_path, bool verbose)
    {
        std::vector<spdlog::sink_ptr> sinks;
        // Console output is for warnings unless asked; progress goes to stdout directly.
        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console->set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
        sinks.push_back(console);
        if (log_path)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path->string(), true));
        }

        auto logger = std::make_shared<spdlog::logger>("lanxfer", sinks.begin(), sinks.end());
        logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
    }

} // namespace lanxfer::cli
