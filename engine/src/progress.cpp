#include "lanxfer/engine/progress.hpp"

#include <algorithm>
#include <cmath>

#include <spdlog/spdlog.h>

#include "lanxfer/engine/session.hpp"

namespace lanxfer::engine::progress
{

    namespace
    {
        constexpr double kKiB = 1024.0;
        constexpr double kMiB = kKiB * 1024.0;
        constexpr double kGiB = kMiB * 1024.0;
    } // namespace

    unsigned percent(std::uint64_t transferred, std::uint64_t total) noexcept
    {
        if (total == 0)
        {
            return 0;
        }
        const auto bounded = std::min(transferred, total);
        // Split to avoid overflowing bounded * 100 for very large totals.
        const auto whole = (bounded / total) * 100;
        const auto fraction = ((bounded % total) * 100) / total;
        return static_cast<unsigned>(whole + fraction);
    }

    double throughput(std::uint64_t transferred, std::chrono::steady_clock::duration elapsed) noexcept
    {
        const auto seconds = std::chrono::duration<double>(elapsed).count();
        if (seconds <= 0.0)
        {
            return 0.0;
        }
        return static_cast<double>(transferred) / seconds;
    }

    std::string format_size(double bytes)
    {
        if (bytes < kKiB)
        {
            return spdlog::fmt_lib::format("{} B", static_cast<std::uint64_t>(std::floor(std::max(bytes, 0.0))));
        }
        if (bytes < kMiB)
        {
            return spdlog::fmt_lib::format("{:.1f} KB", bytes / kKiB);
        }
        if (bytes < kGiB)
        {
            return spdlog::fmt_lib::format("{:.1f} MB", bytes / kMiB);
        }
        return spdlog::fmt_lib::format("{:.2f} GB", bytes / kGiB);
    }

    std::string format_speed(double bytes_per_second)
    {
        return format_size(bytes_per_second) + "/s";
    }

    ProgressSample sample(const Session &session, std::chrono::steady_clock::time_point now)
    {
        ProgressSample result;
        result.transferred_size = session.transferred_size;
        result.total_size = session.total_size;
        result.percent = percent(session.transferred_size, session.total_size);
        result.bytes_per_second =
            session.start_time ? throughput(session.transferred_size, now - *session.start_time) : 0.0;
        result.speed = format_speed(result.bytes_per_second);
        return result;
    }

} // namespace lanxfer::engine::progress
