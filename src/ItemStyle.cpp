#include "ItemStyle.hpp"

#include "utils.hpp"

#include <algorithm>
#include <cmath>

namespace
{

// Indexed by ItemType
static const ItemTypeTraits kItemTypeTraits[] = {
    {1.0, &Config::colors::text},       // Text
    {1.2, &Config::colors::text},       // Title
    {1.1, &Config::colors::text},       // Header
    {1.0, &Config::colors::text},       // Table
    {1.0, &Config::colors::form_label}, // FormLabel
    {0.95, &Config::colors::form_field}, // FormField
    {1.0, &Config::colors::checkbox},   // Checkbox
};

static_assert(sizeof(kItemTypeTraits) / sizeof(kItemTypeTraits[0])
                  == static_cast<size_t>(ItemType::COUNT),
              "Every item type needs an entry in kItemTypeTraits");

} // namespace

const ItemTypeTraits &
itemTypeTraits(ItemType type) noexcept
{
    const int i = static_cast<int>(type);
    if (i < 0 || i >= static_cast<int>(ItemType::COUNT))
        return kItemTypeTraits[0];
    return kItemTypeTraits[i];
}

qreal
clampedFontSize(float fontSize, double scale,
                const Config::canvas &canvas) noexcept
{
    const double fs = fontSize > 0 ? fontSize : DEFAULT_FONT_SIZE;
    double size     = fs * scale;
    if (!std::isfinite(size))
        size = DEFAULT_FONT_SIZE;

    const double lo = std::min(canvas.min_font_size, canvas.max_font_size);
    const double hi = std::max(canvas.min_font_size, canvas.max_font_size);
    return std::clamp(size, lo, hi);
}

ItemStyle
resolveItemStyle(const DocumentItem &item, double scale, bool matched,
                 const Config &config) noexcept
{
    const ItemTypeTraits &traits = itemTypeTraits(item.type);

    ItemStyle style;
    style.font.point_size
        = clampedFontSize(item.font_size, scale, config.canvas)
          * traits.size_multiplier;
    style.font.bold   = item.bold;
    style.font.italic = item.italic;
    style.color       = matched ? rgbaToQColor(config.colors.search_match)
                                : rgbaToQColor(config.colors.*traits.color);
    return style;
}

bool
isCheckboxChecked(const QString &content) noexcept
{
    return content.contains(QLatin1Char('x')) || content.contains(QLatin1Char('X'))
           || content.contains(QChar(0x2611))  // ☑
           || content.contains(QChar(0x25A0)); // ■
}

CheckboxGlyph
checkboxGlyph(const QPointF &topLeft, qreal side, bool checked) noexcept
{
    CheckboxGlyph glyph;
    glyph.box     = QRectF(topLeft, QSizeF(side, side));
    glyph.checked = checked;

    if (checked)
    {
        const QRectF &r = glyph.box;
        glyph.tick << QPointF(r.left() + side * 0.2, r.center().y())
                   << QPointF(r.center().x() - side * 0.1,
                              r.bottom() - side * 0.3)
                   << QPointF(r.right() - side * 0.2, r.top() + side * 0.3);
    }

    return glyph;
}
