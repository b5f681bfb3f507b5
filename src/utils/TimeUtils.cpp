#include "utils/TimeUtils.hpp"

#include <ctime>

namespace PromptGuard
{
    namespace Utils
    {
        TimePoint now() noexcept
        {
            return Clock::now();
        }

        std::string formatTimestamp(TimePoint tp, std::string_view format)
        {
            const std::time_t t = Clock::to_time_t(tp);
            std::tm local{};
            localtime_r(&t, &local);

            char buf[64];
            const std::size_t n = std::strftime(buf, sizeof buf, std::string(format).c_str(), &local);
            return std::string(buf, n);
        }

        std::int64_t toMillisSinceEpoch(TimePoint tp) noexcept
        {
            return std::chrono::duration_cast<milliseconds>(tp.time_since_epoch()).count();
        }

        TimePoint fromMillisSinceEpoch(std::int64_t ms) noexcept
        {
            return TimePoint(std::chrono::duration_cast<Clock::duration>(milliseconds(ms)));
        }

    } // namespace Utils
} // namespace PromptGuard
