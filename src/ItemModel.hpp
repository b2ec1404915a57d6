#pragma once

// Immutable set of items for one page of an extraction. A new model is
// built whenever the extraction or the active page changes.

#include "DocumentItem.hpp"
#include "ViewTransform.hpp"

#include <QHash>
#include <QJsonObject>
#include <QSizeF>
#include <QString>
#include <optional>
#include <vector>

class ItemModel
{
public:
    struct PageInfo
    {
        QSizeF size{DEFAULT_PAGE_WIDTH, DEFAULT_PAGE_HEIGHT};
        int columns{1};
        std::vector<double> column_boundaries;
    };

    ItemModel() = default;
    ItemModel(std::vector<DocumentItem> items, const PageInfo &page,
              int pageIndex = 0) noexcept;

    // Builds the model for `pageIndex` (0-based) out of an extraction
    // document. Malformed items are dropped. Items tagged with a
    // `bbox.coord_origin` are converted into `origin`; untagged items are
    // taken as already being in it.
    static ItemModel
    fromJson(const QJsonObject &document, int pageIndex,
             ViewTransform::Origin origin = ViewTransform::Origin::TopLeft);

    // Reads and parses an extraction JSON file. On failure returns nullopt
    // and fills `error` when given.
    static std::optional<QJsonObject> readJsonFile(const QString &path,
                                                   QString *error = nullptr);

    // Number of pages described by the document (max of the `pages` array
    // length and the highest item page number)
    static int pageCount(const QJsonObject &document) noexcept;

    static QString makeItemId(int pageIndex, double left, double top) noexcept;
    static ItemType parseItemType(const QString &tag) noexcept;
    // Accepts "TOPLEFT", "BOTTOMLEFT" and their "CoordOrigin." spellings
    static std::optional<ViewTransform::Origin>
    parseCoordOrigin(const QString &tag) noexcept;
    static std::optional<DocumentItem> parseItem(const QJsonObject &obj,
                                                 int pageIndex) noexcept;

    // Left edge clustering: at least `minItems` items, any gap wider than
    // `minGap` between sorted left edges opens a new column.
    static std::vector<double>
    detectColumnBoundaries(const std::vector<DocumentItem> &items,
                           double minGap = 50.0, int minItems = 5) noexcept;

    inline const std::vector<DocumentItem> &items() const noexcept
    {
        return m_items;
    }

    inline int count() const noexcept
    {
        return static_cast<int>(m_items.size());
    }

    inline bool isEmpty() const noexcept
    {
        return m_items.empty();
    }

    inline QSizeF pageSize() const noexcept
    {
        return m_page.size;
    }

    inline int columnCount() const noexcept
    {
        return m_page.columns;
    }

    inline const std::vector<double> &columnBoundaries() const noexcept
    {
        return m_page.column_boundaries;
    }

    inline int pageIndex() const noexcept
    {
        return m_page_index;
    }

    const DocumentItem *item(const QString &id) const noexcept;
    int indexOf(const QString &id) const noexcept;

private:
    std::vector<DocumentItem> m_items;
    QHash<QString, int> m_index;
    PageInfo m_page;
    int m_page_index{0};
};
