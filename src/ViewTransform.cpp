#include "ViewTransform.hpp"

#include <algorithm>
#include <cmath>

ViewTransform::ViewTransform() noexcept
    : ViewTransform(Params{}, Origin::TopLeft, Fit::Uniform)
{
}

ViewTransform::ViewTransform(const Params &params, Origin origin,
                             Fit fit) noexcept
    : m_params(params), m_origin(origin)
{
    m_fit_scale = fitScale(params.panel_size, params.page_size, fit);
    m_scale     = m_fit_scale * params.zoom;
    if (!std::isfinite(m_scale) || m_scale <= 0.0)
        m_scale = m_fit_scale;

    m_base = QPointF(params.margin.x() + params.pan.x(),
                     params.margin.y() + params.pan.y());

    const double s = m_scale;
    if (m_origin == Origin::BottomLeft)
    {
        // Y grows upwards in the document, flip around the current page
        // height so that docY == pageHeight lands on the base line.
        const double pageH = params.page_size.height() > 0
                                 ? params.page_size.height()
                                 : DEFAULT_PAGE_HEIGHT;
        m_to_screen = QTransform(s, 0, 0, -s, m_base.x(), m_base.y() + pageH * s);
    }
    else
    {
        m_to_screen = QTransform(s, 0, 0, s, m_base.x(), m_base.y());
    }

    bool invertible = false;
    m_to_doc        = m_to_screen.inverted(&invertible);
    if (!invertible)
        m_to_doc = QTransform();
}

double
ViewTransform::fitScale(const QSizeF &panel, const QSizeF &page,
                        Fit fit) noexcept
{
    const double pw = page.width();
    const double ph = page.height();

    if (!(pw > 0.0) || !(panel.width() > 0.0))
        return 1.0;

    const double sx = panel.width() / pw;
    if (fit == Fit::WidthOnly)
        return sx;

    if (!(ph > 0.0) || !(panel.height() > 0.0))
        return 1.0;

    return std::min(sx, panel.height() / ph);
}

QPointF
ViewTransform::toScreen(const QPointF &docPoint) const noexcept
{
    return m_to_screen.map(docPoint);
}

QPointF
ViewTransform::toDoc(const QPointF &screenPoint) const noexcept
{
    return m_to_doc.map(screenPoint);
}

// Rects keep their "top" edge on top in both origin conventions: the
// top-left corner is mapped and the extent is scaled, never mirrored.
QRectF
ViewTransform::toScreen(const QRectF &docRect) const noexcept
{
    const QPointF topLeft = toScreen(docRect.topLeft());
    return QRectF(topLeft, QSizeF(docRect.width() * m_scale,
                                  docRect.height() * m_scale));
}

QRectF
ViewTransform::toDoc(const QRectF &screenRect) const noexcept
{
    const QPointF topLeft = toDoc(screenRect.topLeft());
    return QRectF(topLeft, QSizeF(screenRect.width() / m_scale,
                                  screenRect.height() / m_scale));
}

QRectF
ViewTransform::pageRect() const noexcept
{
    const QSizeF &page = m_params.page_size;
    const double top = m_origin == Origin::BottomLeft ? page.height() : 0.0;
    return toScreen(QRectF(0.0, top, page.width(), page.height()));
}

double
ViewTransform::clampZoom(double zoom, double min, double max) noexcept
{
    if (!std::isfinite(zoom))
        zoom = 1.0;
    if (min > max)
        std::swap(min, max);
    return std::clamp(zoom, min, max);
}
