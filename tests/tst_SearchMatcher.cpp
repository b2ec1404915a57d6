#include "SearchMatcher.hpp"

#include <QTest>

class SearchMatcherTests : public QObject
{
    Q_OBJECT

private:
    std::vector<DocumentItem> m_items;

    static DocumentItem makeItem(const QString &id, const QString &content)
    {
        DocumentItem item;
        item.id      = id;
        item.content = content;
        return item;
    }

private slots:
    void init()
    {
        m_items = {makeItem("a", "Hello World"), makeItem("b", "Invoice total"),
                   makeItem("c", "hello again"), makeItem("d", "Signature")};
    }

    void testEmptyQueryMatchesNothing()
    {
        SearchMatcher matcher;
        matcher.search(QString(), m_items);
        QVERIFY(matcher.results().isEmpty());
        QCOMPARE(matcher.count(), 0);
    }

    void testCaseInsensitiveSubstring()
    {
        SearchMatcher matcher;
        matcher.search("HELLO", m_items);
        QCOMPARE(matcher.results(), QSet<QString>({"a", "c"}));
        QVERIFY(matcher.matches("a"));
        QVERIFY(!matcher.matches("b"));

        matcher.search("o t", m_items);
        QCOMPARE(matcher.results(), QSet<QString>({"b"}));
    }

    void testRefreshAgainstNewItems()
    {
        SearchMatcher matcher;
        matcher.search("sign", m_items);
        QCOMPARE(matcher.count(), 1);

        m_items.push_back(makeItem("e", "Must be signed"));
        matcher.refresh(m_items);
        QCOMPARE(matcher.results(), QSet<QString>({"d", "e"}));
        QCOMPARE(matcher.query(), QString("sign"));
    }

    void testClear()
    {
        SearchMatcher matcher;
        matcher.search("hello", m_items);
        matcher.clear();
        QVERIFY(matcher.query().isEmpty());
        QCOMPARE(matcher.count(), 0);
    }
};

QTEST_GUILESS_MAIN(SearchMatcherTests)
#include "tst_SearchMatcher.moc"
