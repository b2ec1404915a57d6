#pragma once

// Plain data describing one extracted text fragment

#include <QString>

// Reference page used until a real page size is known (US Letter, points)
#define DEFAULT_PAGE_WIDTH 612.0
#define DEFAULT_PAGE_HEIGHT 792.0

// Font size used when the extractor reports none (document units)
#define DEFAULT_FONT_SIZE 12.0f

enum class ItemType
{
    Text = 0,
    Title,
    Header,
    Table,
    FormLabel,
    FormField,
    Checkbox,
    COUNT
};

// Document-space rectangle. `top` is the top edge in whatever origin
// convention the page uses; width and height are never negative.
struct BoundingBox
{
    double left{0.0};
    double top{0.0};
    double width{0.0};
    double height{0.0};
};

struct DocumentItem
{
    QString id;
    BoundingBox bbox;
    QString content;
    float font_size{DEFAULT_FONT_SIZE};
    bool bold{false};
    bool italic{false};
    ItemType type{ItemType::Text};
};

inline bool
operator==(const BoundingBox &a, const BoundingBox &b)
{
    return a.left == b.left && a.top == b.top && a.width == b.width
           && a.height == b.height;
}
