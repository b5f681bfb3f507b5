#include "input/HashingEmbedder.hpp"

#include <cctype>
#include <cmath>
#include <stdexcept>
#include <string>

#include "utils/Hash.hpp"

namespace PromptGuard
{
    namespace Input
    {
        namespace
        {
            std::string normalize(std::string_view text)
            {
                std::string out;
                out.reserve(text.size() + 2);
                out.push_back(' ');

                bool lastWasSpace = true;
                for (unsigned char ch : text)
                {
                    if (std::isspace(ch) != 0)
                    {
                        if (!lastWasSpace)
                            out.push_back(' ');
                        lastWasSpace = true;
                    }
                    else
                    {
                        out.push_back(static_cast<char>(std::tolower(ch)));
                        lastWasSpace = false;
                    }
                }

                if (!lastWasSpace)
                    out.push_back(' ');
                return out;
            }
        } // namespace

        HashingEmbedder::HashingEmbedder(std::size_t dimension, std::size_t minN, std::size_t maxN)
            : m_dimension(dimension),
              m_minN(minN),
              m_maxN(maxN)
        {
            if (m_dimension == 0)
                throw std::invalid_argument("embedding dimension must be positive");
            if (m_minN == 0 || m_minN > m_maxN)
                throw std::invalid_argument("invalid n-gram range");
        }

        core::Embedding HashingEmbedder::embed(std::string_view text) const
        {
            core::Embedding vec(m_dimension, 0.0);

            const std::string norm = normalize(text);
            if (norm.size() <= 1)
                return vec;

            const std::string_view sv(norm);
            for (std::size_t n = m_minN; n <= m_maxN; ++n)
            {
                if (sv.size() < n)
                    break;

                for (std::size_t i = 0; i + n <= sv.size(); ++i)
                {
                    const std::uint64_t h = Utils::fnv1a64(sv.substr(i, n));
                    const std::size_t bucket = static_cast<std::size_t>(h % m_dimension);
                    const double sign = ((h >> 63) != 0U) ? -1.0 : 1.0;
                    vec[bucket] += sign;
                }
            }

            double norm2 = 0.0;
            for (double v : vec)
                norm2 += v * v;

            if (norm2 > 0.0)
            {
                const double inv = 1.0 / std::sqrt(norm2);
                for (double &v : vec)
                    v *= inv;
            }
            return vec;
        }

    } // namespace Input
} // namespace PromptGuard
