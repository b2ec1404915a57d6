#include "TextLayout.hpp"

#include <algorithm>
#include <utility>

namespace
{
static const QString kEllipsis = QString(QChar(0x2026)); // …
}

TextLayoutEngine::TextLayoutEngine(const Config::canvas &config) noexcept
    : m_config(config)
{
}

bool
TextLayoutEngine::isWrapEligible(const QString &text) const noexcept
{
    if (text.size() > m_config.wrap_threshold)
        return true;

    if (text.contains(QStringLiteral(". ")))
        return true;

    for (const QString &trigger : m_config.wrap_triggers)
    {
        if (!trigger.isEmpty() && text.contains(trigger))
            return true;
    }

    return false;
}

qreal
TextLayoutEngine::wrapWidth(const QString &text, qreal bboxWidth,
                            qreal availableWidth) const noexcept
{
    if (!isWrapEligible(text))
        return std::max<qreal>(bboxWidth * 1.1, m_config.fallback_width);

    qreal width = std::min<qreal>(availableWidth, m_config.wrap_cap_width);
    width       = std::max<qreal>(width, m_config.min_wrap_width);
    return std::min<qreal>(width, m_config.wrap_cap_width);
}

// Splits a word that does not fit on a line into chunks that do. A chunk
// always holds at least one character.
QStringList
TextLayoutEngine::breakWord(const QString &word, const FontSpec &font,
                            qreal maxWidth,
                            const RenderSurface &surface) const noexcept
{
    QStringList chunks;
    QString current;

    for (const QChar c : word)
    {
        const QString candidate = current + c;
        if (!current.isEmpty()
            && surface.measureText(candidate, font).width() > maxWidth)
        {
            chunks << current;
            current = c;
        }
        else
        {
            current = candidate;
        }
    }

    if (!current.isEmpty())
        chunks << current;

    return chunks;
}

QString
TextLayoutEngine::elide(const QString &line, const FontSpec &font,
                        qreal maxWidth,
                        const RenderSurface &surface) const noexcept
{
    QString kept = line;
    while (!kept.isEmpty()
           && surface.measureText(kept + kEllipsis, font).width() > maxWidth)
        kept.chop(1);

    return kept + kEllipsis;
}

TextLayout
TextLayoutEngine::layout(const QString &text, const FontSpec &font,
                         qreal maxWidth,
                         const RenderSurface &surface) const noexcept
{
    TextLayout result;
    result.line_height = surface.measureText(QString(), font).height();

    const bool wrap      = maxWidth > 0;
    const bool breakLong = wrap && isWrapEligible(text);

    const QStringList paragraphs = text.split(QLatin1Char('\n'));
    for (const QString &paragraph : paragraphs)
    {
        const QStringList words
            = paragraph.simplified().split(QLatin1Char(' '), Qt::SkipEmptyParts);

        if (words.isEmpty())
        {
            result.lines << QString();
            continue;
        }

        QString current;
        for (const QString &word : words)
        {
            const QString candidate
                = current.isEmpty() ? word : current + QLatin1Char(' ') + word;

            if (!wrap || surface.measureText(candidate, font).width() <= maxWidth)
            {
                current = candidate;
                continue;
            }

            if (!current.isEmpty())
                result.lines << current;

            if (breakLong && surface.measureText(word, font).width() > maxWidth)
            {
                QStringList chunks = breakWord(word, font, maxWidth, surface);
                current            = chunks.takeLast();
                result.lines << chunks;
            }
            else
            {
                current = word;
            }
        }

        result.lines << current;
    }

    const int maxLines = std::max(1, m_config.max_lines);
    if (result.lines.size() > maxLines)
    {
        result.lines     = result.lines.mid(0, maxLines);
        QString &last    = result.lines.last();
        last = wrap ? elide(last, font, maxWidth, surface) : last + kEllipsis;
        result.truncated = true;
    }

    for (const QString &line : std::as_const(result.lines))
        result.width
            = std::max(result.width, surface.measureText(line, font).width());

    result.height = result.lines.size() * result.line_height;
    return result;
}
