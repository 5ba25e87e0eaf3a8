#include "core/utf8.h"

#include <cstdint>

namespace tomo::utf8
{
namespace
{
static constexpr char32_t kReplacement = 0xFFFDu;

static bool IsScalar(char32_t cp)
{
    if (cp > 0x10FFFFu)
        return false;
    if (cp >= 0xD800u && cp <= 0xDFFFu)
        return false;
    return true;
}
} // namespace

bool DecodeAt(std::string_view s, std::size_t pos, char32_t& out_cp, std::size_t& out_len)
{
    out_cp = 0;
    out_len = 1;
    if (pos >= s.size())
        return false;

    const unsigned char* p = reinterpret_cast<const unsigned char*>(s.data()) + pos;
    const std::size_t avail = s.size() - pos;

    auto is_cont = [](unsigned char c) { return (c & 0xC0u) == 0x80u; };

    std::uint32_t cp = 0;
    std::size_t need = 0;
    if ((p[0] & 0x80u) == 0x00u)
    {
        cp = p[0];
        need = 1;
    }
    else if ((p[0] & 0xE0u) == 0xC0u)
    {
        cp = (std::uint32_t)(p[0] & 0x1Fu);
        need = 2;
    }
    else if ((p[0] & 0xF0u) == 0xE0u)
    {
        cp = (std::uint32_t)(p[0] & 0x0Fu);
        need = 3;
    }
    else if ((p[0] & 0xF8u) == 0xF0u)
    {
        cp = (std::uint32_t)(p[0] & 0x07u);
        need = 4;
    }
    else
    {
        return false;
    }

    if (need > avail)
        return false;
    for (std::size_t i = 1; i < need; ++i)
    {
        if (!is_cont(p[i]))
            return false;
        cp = (cp << 6) | (std::uint32_t)(p[i] & 0x3Fu);
    }

    // Reject overlong encodings by checking minimal value for the length.
    if (need == 2 && cp < 0x80u) return false;
    if (need == 3 && cp < 0x800u) return false;
    if (need == 4 && cp < 0x10000u) return false;

    if (!IsScalar((char32_t)cp))
        return false;

    out_cp = (char32_t)cp;
    out_len = need;
    return true;
}

char32_t DecodeFirst(std::string_view s)
{
    char32_t cp = 0;
    std::size_t len = 0;
    if (!DecodeAt(s, 0, cp, len))
        return 0;
    return cp;
}

void Append(char32_t cp, std::string& out)
{
    if (!IsScalar(cp))
        cp = kReplacement;

    if (cp <= 0x7Fu)
    {
        out.push_back((char)cp);
    }
    else if (cp <= 0x7FFu)
    {
        out.push_back((char)(0xC0u | (cp >> 6)));
        out.push_back((char)(0x80u | (cp & 0x3Fu)));
    }
    else if (cp <= 0xFFFFu)
    {
        out.push_back((char)(0xE0u | (cp >> 12)));
        out.push_back((char)(0x80u | ((cp >> 6) & 0x3Fu)));
        out.push_back((char)(0x80u | (cp & 0x3Fu)));
    }
    else
    {
        out.push_back((char)(0xF0u | (cp >> 18)));
        out.push_back((char)(0x80u | ((cp >> 12) & 0x3Fu)));
        out.push_back((char)(0x80u | ((cp >> 6) & 0x3Fu)));
        out.push_back((char)(0x80u | (cp & 0x3Fu)));
    }
}

std::string Encode(char32_t cp)
{
    std::string out;
    Append(cp, out);
    return out;
}

long long CountCodePoints(std::string_view s)
{
    long long n = 0;
    std::size_t pos = 0;
    while (pos < s.size())
    {
        char32_t cp = 0;
        std::size_t len = 1;
        if (!DecodeAt(s, pos, cp, len))
            return -1;
        pos += len;
        ++n;
    }
    return n;
}
} // namespace tomo::utf8
