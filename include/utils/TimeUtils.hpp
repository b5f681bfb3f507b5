#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace PromptGuard
{
    namespace Utils
    {
        // Wall clock for model fit time and log lines; steady clock for
        // judge latency and timeouts.
        using Clock        = std::chrono::system_clock;
        using TimePoint    = Clock::time_point;
        using SteadyClock  = std::chrono::steady_clock;
        using milliseconds = std::chrono::milliseconds;

        TimePoint now() noexcept;

        /// Local time rendered with strftime-style format.
        std::string formatTimestamp(TimePoint tp, std::string_view format = "%Y-%m-%d %H:%M:%S");

        /// The model artifact stores fit time as milliseconds since the epoch.
        std::int64_t toMillisSinceEpoch(TimePoint tp) noexcept;
        TimePoint fromMillisSinceEpoch(std::int64_t ms) noexcept;

        /// Elapsed steady-clock time since construction.
        class Stopwatch
        {
        public:
            Stopwatch() noexcept : m_start(SteadyClock::now()) {}

            double elapsedMillis() const noexcept
            {
                return std::chrono::duration<double, std::milli>(SteadyClock::now() - m_start).count();
            }

        private:
            SteadyClock::time_point m_start;
        };

    } // namespace Utils
} // namespace PromptGuard
