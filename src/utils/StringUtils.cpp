#include "utils/StringUtils.hpp"

#include <cstdio>

namespace PromptGuard::Utils {

namespace {

inline bool isBlank(char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

inline char lowerAscii(char c) noexcept
{
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

} // namespace

std::string_view trim(std::string_view sv) noexcept
{
    std::size_t first = 0;
    std::size_t last = sv.size();
    while (first < last && isBlank(sv[first]))
        ++first;
    while (last > first && isBlank(sv[last - 1]))
        --last;
    return sv.substr(first, last - first);
}

std::string toLower(std::string_view sv)
{
    std::string out(sv);
    for (char& c : out)
        c = lowerAscii(c);
    return out;
}

bool iequals(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i)
    {
        if (lowerAscii(a[i]) != lowerAscii(b[i]))
            return false;
    }
    return true;
}

std::vector<std::string> splitAndTrim(std::string_view sv, char delimiter)
{
    std::vector<std::string> items;
    for (;;)
    {
        const auto cut = sv.find(delimiter);
        const auto item = trim(sv.substr(0, cut));
        if (!item.empty())
            items.emplace_back(item);
        if (cut == std::string_view::npos)
            break;
        sv.remove_prefix(cut + 1);
    }
    return items;
}

void replaceAllInPlace(std::string& str, std::string_view from, std::string_view to)
{
    if (from.empty())
        return;

    std::string out;
    out.reserve(str.size());
    std::size_t at = 0;
    for (auto hit = str.find(from); hit != std::string::npos; hit = str.find(from, at))
    {
        out.append(str, at, hit - at);
        out.append(to);
        at = hit + from.size();
    }
    out.append(str, at, std::string::npos);
    str.swap(out);
}

std::string previewForLog(std::string_view text, std::size_t maxChars)
{
    const bool cut = text.size() > maxChars;
    std::string out(text.substr(0, maxChars));
    for (char& c : out)
    {
        if (c == '\n' || c == '\r')
            c = ' ';
    }
    if (cut)
        out += "...";
    return out;
}

std::string escapeJson(std::string_view s)
{
    std::string out;
    out.reserve(s.size() + 8);

    for (const char c : s)
    {
        switch (c)
        {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20)
                {
                    char buf[8];
                    std::snprintf(buf, sizeof buf, "\\u%04X", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                }
                else
                {
                    out += c;
                }
                break;
        }
    }
    return out;
}

} // namespace PromptGuard::Utils
