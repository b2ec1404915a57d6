#include "SearchMatcher.hpp"

#include <QDebug>

void
SearchMatcher::search(const QString &query,
                      const std::vector<DocumentItem> &items)
{
    m_query = query;
    refresh(items);
}

void
SearchMatcher::refresh(const std::vector<DocumentItem> &items)
{
    m_results.clear();

    if (m_query.isEmpty())
        return;

    for (const DocumentItem &item : items)
    {
        if (match(m_query, item))
            m_results.insert(item.id);
    }

#ifndef NDEBUG
    qDebug() << "SearchMatcher:" << m_query << "->" << m_results.size()
             << "match(es)";
#endif
}

void
SearchMatcher::clear() noexcept
{
    m_query.clear();
    m_results.clear();
}

// Overrides are display only, matching always runs on the extracted content
bool
SearchMatcher::match(const QString &query, const DocumentItem &item) noexcept
{
    if (query.isEmpty())
        return false;

    return item.content.contains(query, Qt::CaseInsensitive);
}
