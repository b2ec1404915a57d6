#include "FakeSurface.hpp"
#include "TextLayout.hpp"

#include <QTest>

class TextLayoutTests : public QObject
{
    Q_OBJECT

private:
    Config m_config;
    FakeSurface m_surface;
    const FontSpec m_font{12.0, false, false}; // 6px per glyph, 14.4px lines

private slots:
    void testWrapEligibility()
    {
        TextLayoutEngine engine(m_config.canvas);

        QVERIFY(!engine.isWrapEligible("Hello World"));
        QVERIFY(engine.isWrapEligible(QString(51, QLatin1Char('a'))));
        QVERIFY(!engine.isWrapEligible(QString(50, QLatin1Char('a'))));
        QVERIFY(engine.isWrapEligible("Done. Next"));
        QVERIFY(engine.isWrapEligible("This form must be signed"));
    }

    void testWrapWidth()
    {
        TextLayoutEngine engine(m_config.canvas);
        const QString longText(80, QLatin1Char('a'));

        // Short text follows its own box, with a floor
        QCOMPARE(engine.wrapWidth("Hello", 100, 1000), 110.0);
        QCOMPARE(engine.wrapWidth("Hello", 10, 1000), 40.0);

        // Eligible text takes the available width up to the cap
        QCOMPARE(engine.wrapWidth(longText, 100, 1000), 400.0);
        QCOMPARE(engine.wrapWidth(longText, 100, 300), 300.0);
        QCOMPARE(engine.wrapWidth(longText, 100, 10), 50.0);
    }

    void testEligibleTextNeverWiderThanCap()
    {
        TextLayoutEngine engine(m_config.canvas);
        const QString text
            = "The quick brown fox jumps over the lazy dog and keeps running "
              "through the field until it reaches the river bank at dusk. "
              "Supercalifragilisticexpialidociousandthensomemoreletters";

        const qreal width = engine.wrapWidth(text, 120, 2000);
        QVERIFY(width <= m_config.canvas.wrap_cap_width);

        const TextLayout layout = engine.layout(text, m_font, width, m_surface);
        QVERIFY(layout.lines.size() > 1);
        QVERIFY(layout.width <= m_config.canvas.wrap_cap_width);
        for (const QString &line : layout.lines)
            QVERIFY(m_surface.measureText(line, m_font).width() <= width);
    }

    void testGreedyWrap()
    {
        TextLayoutEngine engine(m_config.canvas);

        // 10 glyphs per line
        const TextLayout layout
            = engine.layout("aaaa bbbb cccc dddd", m_font, 60, m_surface);

        QCOMPARE(layout.lines, QStringList({"aaaa bbbb", "cccc dddd"}));
        QCOMPARE(layout.line_height, 14.4);
        QCOMPARE(layout.height, 28.8);
        QCOMPARE(layout.width, 54.0);
        QVERIFY(!layout.truncated);
    }

    void testExplicitNewlines()
    {
        TextLayoutEngine engine(m_config.canvas);
        const TextLayout layout
            = engine.layout("first\n\nthird", m_font, 1000, m_surface);

        QCOMPARE(layout.lines, QStringList({"first", "", "third"}));
    }

    void testMaxLinesElides()
    {
        m_config.canvas.max_lines = 2;
        TextLayoutEngine engine(m_config.canvas);

        const TextLayout layout
            = engine.layout("aaaa bbbb cccc dddd eeee", m_font, 30, m_surface);

        QCOMPARE(layout.lines.size(), 2);
        QVERIFY(layout.truncated);
        QVERIFY(layout.lines.last().endsWith(QChar(0x2026)));

        m_config.canvas.max_lines = 10;
    }

    void testLongWordOnlyBrokenWhenEligible()
    {
        TextLayoutEngine engine(m_config.canvas);

        const TextLayout shortText
            = engine.layout("abcdefghijkl", m_font, 30, m_surface);
        QCOMPARE(shortText.lines, QStringList({"abcdefghijkl"}));

        const QString eligible = QString(60, QLatin1Char('x'));
        const TextLayout broken = engine.layout(eligible, m_font, 60, m_surface);
        QCOMPARE(broken.lines.size(), 6);
        for (const QString &line : broken.lines)
            QCOMPARE(line.size(), 10);
    }
};

QTEST_GUILESS_MAIN(TextLayoutTests)
#include "tst_TextLayout.moc"
