#pragma once

#include <atomic>

namespace PromptGuard
{
    namespace Policy
    {
        /**
         * Cooperative cancellation flag for one evaluation request.
         *
         * The fuser polls it while waiting for the judge; once set, the
         * request ends with core::RequestCancelled and yields no Decision.
         */
        class CancellationToken
        {
        public:
            void cancel() noexcept { m_cancelled.store(true, std::memory_order_release); }

            bool isCancelled() const noexcept { return m_cancelled.load(std::memory_order_acquire); }

        private:
            std::atomic<bool> m_cancelled{false};
        };

    } // namespace Policy
} // namespace PromptGuard
