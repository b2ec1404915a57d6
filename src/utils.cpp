#include "utils.hpp"

namespace
{

static inline int
hexValue(char c) noexcept
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

} // namespace

bool
parseHexColor(std::string_view s, uint32_t &out)
{
    if (!s.empty() && s.front() == '#')
        s.remove_prefix(1);

    if (s.size() != 6 && s.size() != 8)
        return false;

    uint32_t value = 0;
    for (char c : s)
    {
        const int v = hexValue(c);
        if (v < 0)
            return false;
        value = (value << 4) | static_cast<uint32_t>(v);
    }

    // No alpha given, treat as opaque
    if (s.size() == 6)
        value = (value << 8) | 0xFF;

    out = value;
    return true;
}

QString
previewText(const QString &text, int maxChars)
{
    if (maxChars < 0 || text.size() <= maxChars)
        return text;

    return text.left(maxChars) + QStringLiteral("...");
}
