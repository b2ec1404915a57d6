#pragma once

// Item type (plus search match state) -> font and color

#include "Config.hpp"
#include "DocumentItem.hpp"
#include "RenderSurface.hpp"

#include <QColor>

struct ItemStyle
{
    FontSpec font;
    QColor color;
};

struct ItemTypeTraits
{
    qreal size_multiplier;
    uint32_t Config::colors::*color;
};

const ItemTypeTraits &
itemTypeTraits(ItemType type) noexcept;

// Point size before the type multiplier: fontSize * scale clamped to the
// configured range
qreal
clampedFontSize(float fontSize, double scale,
                const Config::canvas &canvas) noexcept;

ItemStyle
resolveItemStyle(const DocumentItem &item, double scale, bool matched,
                 const Config &config) noexcept;

// Checkbox glyph: the square and, when checked, the tick polyline
struct CheckboxGlyph
{
    QRectF box;
    bool checked{false};
    QPolygonF tick;
};

bool
isCheckboxChecked(const QString &content) noexcept;

CheckboxGlyph
checkboxGlyph(const QPointF &topLeft, qreal side, bool checked) noexcept;
