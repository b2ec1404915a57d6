#pragma once

// Document space <-> screen space mapping for the overlay canvas

#include "DocumentItem.hpp"

#include <QPointF>
#include <QRectF>
#include <QSizeF>
#include <QTransform>

class ViewTransform
{
public:
    enum class Origin
    {
        TopLeft = 0,
        BottomLeft,
        COUNT
    };

    enum class Fit
    {
        WidthOnly = 0,
        Uniform,
        COUNT
    };

    struct Params
    {
        QSizeF panel_size;
        QSizeF page_size{DEFAULT_PAGE_WIDTH, DEFAULT_PAGE_HEIGHT};
        double zoom{1.0};
        QPointF pan;
        QPointF margin{20.0, 50.0};
    };

    ViewTransform() noexcept;
    ViewTransform(const Params &params, Origin origin, Fit fit) noexcept;

    static double fitScale(const QSizeF &panel, const QSizeF &page,
                           Fit fit) noexcept;
    static double clampZoom(double zoom, double min, double max) noexcept;

    inline double fitScale() const noexcept
    {
        return m_fit_scale;
    }

    inline double scale() const noexcept
    {
        return m_scale;
    }

    inline QPointF baseOffset() const noexcept
    {
        return m_base;
    }

    inline Origin origin() const noexcept
    {
        return m_origin;
    }

    inline const QTransform &transform() const noexcept
    {
        return m_to_screen;
    }

    QPointF toScreen(const QPointF &docPoint) const noexcept;
    QPointF toDoc(const QPointF &screenPoint) const noexcept;
    QRectF toScreen(const QRectF &docRect) const noexcept;
    QRectF toDoc(const QRectF &screenRect) const noexcept;

    // Screen rect of the whole page, used for the raster underlay
    QRectF pageRect() const noexcept;

private:
    Params m_params;
    Origin m_origin{Origin::TopLeft};
    double m_fit_scale{1.0};
    double m_scale{1.0};
    QPointF m_base;
    QTransform m_to_screen;
    QTransform m_to_doc;
};
