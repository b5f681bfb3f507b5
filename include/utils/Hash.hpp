#pragma once

#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>

namespace PromptGuard
{
    namespace Utils
    {
        /**
         * FNV-1a 64-bit, used for model/corpus fingerprints, the artifact
         * checksum and n-gram feature hashing. Not a cryptographic hash.
         */
        class Fnv1a64
        {
        public:
            static constexpr std::uint64_t kOffsetBasis = 14695981039346656037ULL;
            static constexpr std::uint64_t kPrime       = 1099511628211ULL;

            void update(const void *data, std::size_t size) noexcept
            {
                const auto *bytes = static_cast<const unsigned char *>(data);
                for (std::size_t i = 0; i < size; ++i)
                {
                    m_state ^= bytes[i];
                    m_state *= kPrime;
                }
            }

            void update(std::string_view text) noexcept
            {
                update(text.data(), text.size());
            }

            /// Hashes the object representation; doubles hash by bit pattern.
            void update(double value) noexcept
            {
                std::uint64_t bits = 0;
                std::memcpy(&bits, &value, sizeof(bits));
                update(&bits, sizeof(bits));
            }

            void update(std::uint64_t value) noexcept
            {
                update(&value, sizeof(value));
            }

            std::uint64_t digest() const noexcept { return m_state; }

        private:
            std::uint64_t m_state = kOffsetBasis;
        };

        inline std::uint64_t fnv1a64(std::string_view text) noexcept
        {
            Fnv1a64 h;
            h.update(text);
            return h.digest();
        }

        /// Fixed-width lowercase hex, 16 digits.
        inline std::string toHex64(std::uint64_t value)
        {
            static const char digits[] = "0123456789abcdef";
            std::string out(16, '0');
            for (int i = 15; i >= 0; --i)
            {
                out[static_cast<std::size_t>(i)] = digits[value & 0xFU];
                value >>= 4;
            }
            return out;
        }

    } // namespace Utils
} // namespace PromptGuard
