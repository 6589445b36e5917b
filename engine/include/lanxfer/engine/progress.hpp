#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace lanxfer::engine
{

    struct Session;

    struct ProgressSample
    {
        std::uint64_t transferred_size{};
        std::uint64_t total_size{};
        unsigned percent{};
        double bytes_per_second{};
        std::string speed;
    };

    namespace progress
    {

        /// floor(transferred / total * 100), 0 for an empty total, capped at 100.
        unsigned percent(std::uint64_t transferred, std::uint64_t total) noexcept;

        /// Cumulative average since the session started; 0 while no time has elapsed.
        double throughput(std::uint64_t transferred, std::chrono::steady_clock::duration elapsed) noexcept;

        /// Binary steps: B, KB, MB, GB.
        std::string format_size(double bytes);

        std::string format_speed(double bytes_per_second);

        ProgressSample sample(const Session &session,
                              std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    } // namespace progress

} // namespace lanxfer::engine
