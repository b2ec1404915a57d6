#pragma once

#include "DocumentItem.hpp"

#include <QSet>
#include <QString>
#include <vector>

class SearchMatcher
{
public:
    SearchMatcher() = default;

    // Sets a new query and recomputes the result set against `items`
    void search(const QString &query, const std::vector<DocumentItem> &items);

    // Recomputes the current query against a rebuilt item list
    void refresh(const std::vector<DocumentItem> &items);

    void clear() noexcept;

    static bool match(const QString &query, const DocumentItem &item) noexcept;

    inline const QString &query() const noexcept
    {
        return m_query;
    }

    inline const QSet<QString> &results() const noexcept
    {
        return m_results;
    }

    inline bool matches(const QString &id) const noexcept
    {
        return m_results.contains(id);
    }

    inline int count() const noexcept
    {
        return static_cast<int>(m_results.size());
    }

private:
    QString m_query;
    QSet<QString> m_results;
};
