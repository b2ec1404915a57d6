#pragma once

#include "Config.hpp"
#include "RenderSurface.hpp"

#include <QString>
#include <QStringList>

struct TextLayout
{
    QStringList lines;
    qreal width{0};
    qreal height{0};
    qreal line_height{0};
    bool truncated{false};
};

class TextLayoutEngine
{
public:
    explicit TextLayoutEngine(const Config::canvas &config) noexcept;

    bool isWrapEligible(const QString &text) const noexcept;

    // Wrap width for one item. `bboxWidth` is already in screen units.
    qreal wrapWidth(const QString &text, qreal bboxWidth,
                    qreal availableWidth) const noexcept;

    TextLayout layout(const QString &text, const FontSpec &font,
                      qreal maxWidth,
                      const RenderSurface &surface) const noexcept;

private:
    QStringList breakWord(const QString &word, const FontSpec &font,
                          qreal maxWidth,
                          const RenderSurface &surface) const noexcept;
    QString elide(const QString &line, const FontSpec &font, qreal maxWidth,
                  const RenderSurface &surface) const noexcept;

    const Config::canvas &m_config;
};
