#pragma once

#include <QColor>
#include <QRectF>
#include <QString>
#include <cstdint>
#include <string_view>

// Accepts "#RRGGBB" and "#RRGGBBAA" (leading '#' optional)
bool
parseHexColor(std::string_view s, uint32_t &out);

static inline QColor
rgbaToQColor(uint32_t rgba) noexcept
{
    return QColor((rgba >> 24) & 0xFF, (rgba >> 16) & 0xFF, (rgba >> 8) & 0xFF,
                  rgba & 0xFF);
}

static inline QRectF
expandRect(const QRectF &r, qreal pad) noexcept
{
    return r.adjusted(-pad, -pad, pad, pad);
}

// First `maxChars` characters of `text` followed by "..." when cut
QString
previewText(const QString &text, int maxChars);
