#include "ItemModel.hpp"

#include <QDebug>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>
#include <algorithm>
#include <cmath>

namespace
{

static inline std::optional<double>
finiteNumber(const QJsonValue &value) noexcept
{
    if (!value.isDouble())
        return std::nullopt;

    const double d = value.toDouble();
    if (!std::isfinite(d))
        return std::nullopt;

    return d;
}

// Page entry for `pageIndex`: matched by 1-based `page_number`, otherwise
// by position in the array.
QJsonObject
findPageObject(const QJsonArray &pages, int pageIndex)
{
    for (const QJsonValue &value : pages)
    {
        const QJsonObject page = value.toObject();
        if (page.value("page_number").toInt(-1) == pageIndex + 1)
            return page;
    }

    if (pageIndex >= 0 && pageIndex < pages.size())
        return pages.at(pageIndex).toObject();

    return {};
}

} // namespace

ItemModel::ItemModel(std::vector<DocumentItem> items, const PageInfo &page,
                     int pageIndex) noexcept
    : m_items(std::move(items)), m_page(page), m_page_index(pageIndex)
{
    if (!(m_page.size.width() > 0) || !(m_page.size.height() > 0))
        m_page.size = QSizeF(DEFAULT_PAGE_WIDTH, DEFAULT_PAGE_HEIGHT);

    if (m_page.columns < 1)
        m_page.columns = 1;

    m_index.reserve(static_cast<int>(m_items.size()));
    for (int i = 0; i < static_cast<int>(m_items.size()); ++i)
        m_index.insert(m_items[i].id, i);
}

QString
ItemModel::makeItemId(int pageIndex, double left, double top) noexcept
{
    return QStringLiteral("item_%1_%2_%3")
        .arg(pageIndex)
        .arg(static_cast<qint64>(std::llround(left * 1000.0)))
        .arg(static_cast<qint64>(std::llround(top * 1000.0)));
}

ItemType
ItemModel::parseItemType(const QString &tag) noexcept
{
    if (tag == "TitleItem" || tag == "Title")
        return ItemType::Title;
    if (tag == "SectionHeaderItem" || tag == "Header")
        return ItemType::Header;
    if (tag == "TableItem" || tag == "Table")
        return ItemType::Table;
    if (tag == "FormLabel")
        return ItemType::FormLabel;
    if (tag == "FormField")
        return ItemType::FormField;
    if (tag == "Checkbox")
        return ItemType::Checkbox;

    return ItemType::Text;
}

std::optional<ViewTransform::Origin>
ItemModel::parseCoordOrigin(const QString &tag) noexcept
{
    const QString upper = tag.trimmed().toUpper();
    if (upper.endsWith("BOTTOMLEFT"))
        return ViewTransform::Origin::BottomLeft;
    if (upper.endsWith("TOPLEFT"))
        return ViewTransform::Origin::TopLeft;

    return std::nullopt;
}

std::optional<DocumentItem>
ItemModel::parseItem(const QJsonObject &obj, int pageIndex) noexcept
{
    const QJsonObject bbox = obj.value("bbox").toObject();
    const auto left        = finiteNumber(bbox.value("left"));
    const auto top         = finiteNumber(bbox.value("top"));
    const auto width       = finiteNumber(bbox.value("width"));
    const auto height      = finiteNumber(bbox.value("height"));

    if (!left || !top || !width || !height)
        return std::nullopt;

    QJsonValue text = obj.value("content");
    if (!text.isString())
        text = obj.value("text");

    const QString content = text.toString();
    if (content.trimmed().isEmpty())
        return std::nullopt;

    DocumentItem item;
    item.id      = makeItemId(pageIndex, *left, *top);
    item.bbox    = {*left, *top, std::abs(*width), std::abs(*height)};
    item.content = content;
    item.type    = parseItemType(obj.value("type").toString());

    const QJsonObject style
        = obj.value("attributes").toObject().value("style").toObject();
    if (const auto fs = finiteNumber(style.value("font_size")); fs && *fs > 0)
        item.font_size = static_cast<float>(*fs);
    item.bold   = style.value("bold").toBool(false);
    item.italic = style.value("italic").toBool(false);

    return item;
}

std::vector<double>
ItemModel::detectColumnBoundaries(const std::vector<DocumentItem> &items,
                                  double minGap, int minItems) noexcept
{
    std::vector<double> boundaries;
    if (static_cast<int>(items.size()) < minItems)
        return boundaries;

    std::vector<double> lefts;
    lefts.reserve(items.size());
    for (const DocumentItem &item : items)
        lefts.push_back(item.bbox.left);

    std::sort(lefts.begin(), lefts.end());

    for (size_t i = 1; i < lefts.size(); ++i)
    {
        const double gap = lefts[i] - lefts[i - 1];
        if (gap > minGap)
            boundaries.push_back(lefts[i - 1] + gap / 2.0);
    }

    return boundaries;
}

ItemModel
ItemModel::fromJson(const QJsonObject &document, int pageIndex,
                    ViewTransform::Origin origin)
{
    PageInfo page;
    const QJsonObject pageObj
        = findPageObject(document.value("pages").toArray(), pageIndex);

    const double w = pageObj.value("width").toDouble(0.0);
    const double h = pageObj.value("height").toDouble(0.0);
    if (std::isfinite(w) && std::isfinite(h) && w > 0 && h > 0)
        page.size = QSizeF(w, h);

    const QJsonArray jsonItems = document.value("items").toArray();
    std::vector<DocumentItem> items;
    QHash<QString, int> seen;
    int dropped = 0;

    for (const QJsonValue &value : jsonItems)
    {
        const QJsonObject obj = value.toObject();
        if (obj.value("page").toInt(0) != pageIndex + 1)
            continue;

        auto item = parseItem(obj, pageIndex);
        if (!item)
        {
            ++dropped;
            continue;
        }

        // Flipping the top edge maps either convention onto the other
        const auto itemOrigin = parseCoordOrigin(
            obj.value("bbox").toObject().value("coord_origin").toString());
        if (itemOrigin && *itemOrigin != origin)
        {
            item->bbox.top = page.size.height() - item->bbox.top;
            item->id = makeItemId(pageIndex, item->bbox.left, item->bbox.top);
        }

        // Two items anchored at the same point keep distinct ids
        int &n = seen[item->id];
        ++n;
        if (n > 1)
            item->id += QStringLiteral("#%1").arg(n);

        items.push_back(std::move(*item));
    }

    if (dropped > 0)
        qWarning() << "ItemModel: dropped" << dropped
                   << "malformed item(s) on page" << pageIndex + 1;

    if (pageObj.contains("columns"))
    {
        page.columns = std::max(1, pageObj.value("columns").toInt(1));
        // A leading 0 marks the start of the first column, not a divider
        for (const QJsonValue &b : pageObj.value("column_boundaries").toArray())
        {
            if (const auto x = finiteNumber(b); x && *x > 0)
                page.column_boundaries.push_back(*x);
        }
    }
    else
    {
        page.column_boundaries = detectColumnBoundaries(items);
        page.columns = static_cast<int>(page.column_boundaries.size()) + 1;
    }

#ifndef NDEBUG
    qDebug() << "ItemModel: page" << pageIndex + 1 << "items:" << items.size()
             << "columns:" << page.columns;
#endif

    return ItemModel(std::move(items), page, pageIndex);
}

std::optional<QJsonObject>
ItemModel::readJsonFile(const QString &path, QString *error)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly))
    {
        if (error)
            *error = QStringLiteral("Unable to open %1: %2")
                         .arg(path, file.errorString());
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject())
    {
        if (error)
            *error = QStringLiteral("Invalid extraction JSON in %1: %2")
                         .arg(path, parseError.error != QJsonParseError::NoError
                                        ? parseError.errorString()
                                        : QStringLiteral("not an object"));
        return std::nullopt;
    }

    return doc.object();
}

int
ItemModel::pageCount(const QJsonObject &document) noexcept
{
    int count = document.value("pages").toArray().size();
    for (const QJsonValue &value : document.value("items").toArray())
        count = std::max(count, value.toObject().value("page").toInt(0));
    return count;
}

const DocumentItem *
ItemModel::item(const QString &id) const noexcept
{
    const int i = indexOf(id);
    return i < 0 ? nullptr : &m_items[static_cast<size_t>(i)];
}

int
ItemModel::indexOf(const QString &id) const noexcept
{
    return m_index.value(id, -1);
}
