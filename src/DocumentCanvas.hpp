#pragma once

// Per-frame orchestration of the overlay: transform, style, layout, paint
// and input. Owns the view state (zoom, pan, per item offsets and text
// overrides, search) which outlives model rebuilds.

#include "Config.hpp"
#include "InteractionController.hpp"
#include "ItemModel.hpp"
#include "ItemStyle.hpp"
#include "RenderSurface.hpp"
#include "SearchMatcher.hpp"
#include "TextLayout.hpp"
#include "ViewTransform.hpp"

#include <QHash>
#include <QImage>
#include <memory>
#include <vector>

class DocumentCanvas
{
public:
    using Outcome = InteractionController::Outcome;

    struct Snapshot
    {
        int item_count{0};
        double zoom{1.0};
        QPointF pan;
        QString query;
        int match_count{0};
        int column_count{1};
        bool edit_mode{false};
        int page_index{0};
        QString hovered_id;
    };

    struct ItemFrame
    {
        int index{-1};
        const DocumentItem *item{nullptr};
        QString text;
        ItemStyle style;
        bool matched{false};
        TextLayout layout;
        bool checkbox{false};
        CheckboxGlyph checkbox_glyph;
        QRectF glyph_rect;
        QRectF hit_rect;
    };

    struct Frame
    {
        QSizeF panel_size;
        ViewTransform transform;
        std::vector<ItemFrame> items;
        std::vector<InteractionController::HitTarget> targets;
    };

    explicit DocumentCanvas(const Config &config) noexcept;

    void setModel(std::shared_ptr<const ItemModel> model) noexcept;

    inline const ItemModel *model() const noexcept
    {
        return m_model.get();
    }

    void setZoom(double zoom) noexcept;
    void zoomIn() noexcept;
    void zoomOut() noexcept;
    void resetView() noexcept;

    inline double zoom() const noexcept
    {
        return m_zoom;
    }

    void setPan(const QPointF &pan) noexcept;

    inline QPointF pan() const noexcept
    {
        return m_pan;
    }

    void setSearchQuery(const QString &query) noexcept;

    inline const SearchMatcher &search() const noexcept
    {
        return m_search;
    }

    // Offsets are in screen pixels and added after the view transform
    void setItemOffset(const QString &id, qreal dx, qreal dy) noexcept;
    QPointF itemOffset(const QString &id) const noexcept;

    void setItemOverrideText(const QString &id, const QString &text) noexcept;
    void clearOverrides() noexcept;
    QString effectiveText(const DocumentItem &item) const noexcept;

    inline bool hasOverride(const QString &id) const noexcept
    {
        return m_overrides.contains(id);
    }

    void setEditMode(bool enabled) noexcept;

    inline bool editMode() const noexcept
    {
        return m_edit_mode;
    }

    void setPageImage(const QImage &image) noexcept;

    Snapshot snapshot() const noexcept;

    ViewTransform transform(const QSizeF &panelSize) const noexcept;

    // Lays the current state out against `surface`. Cached until the view
    // state, the model or the surface size changes.
    const Frame &layoutFrame(const RenderSurface &surface) noexcept;
    void paint(RenderSurface &surface, qint64 nowMs) noexcept;

    Outcome mouseMove(const QPointF &pos, RenderSurface &surface) noexcept;
    Outcome mousePress(const QPointF &pos, Qt::MouseButton button,
                       RenderSurface &surface) noexcept;
    Outcome mouseRelease(const QPointF &pos, Qt::MouseButton button,
                         RenderSurface &surface, qint64 nowMs) noexcept;
    Outcome mouseDoubleClick(const QPointF &pos,
                             RenderSurface &surface) noexcept;
    Outcome wheel(const QPointF &delta, Qt::KeyboardModifiers modifiers) noexcept;
    Outcome keyPress(int key, Qt::KeyboardModifiers modifiers) noexcept;
    Outcome leave() noexcept;

    inline const InteractionController &controller() const noexcept
    {
        return m_controller;
    }

private:
    void apply(const Outcome &out) noexcept;
    void invalidate() noexcept;
    ItemFrame layoutItem(int index, const DocumentItem &item,
                         const ViewTransform &transform,
                         const QSizeF &panelSize,
                         const RenderSurface &surface) const noexcept;
    void paintItem(RenderSurface &surface, const ItemFrame &frame) noexcept;
    void paintOverlayText(RenderSurface &surface, qint64 nowMs) noexcept;

    const Config &m_config;
    std::shared_ptr<const ItemModel> m_model;
    TextLayoutEngine m_layout_engine;
    InteractionController m_controller;
    SearchMatcher m_search;

    double m_zoom{1.0};
    QPointF m_pan;
    QHash<QString, QPointF> m_offsets;
    QHash<QString, QString> m_overrides;
    bool m_edit_mode{false};
    QImage m_page_image;

    Frame m_frame;
    bool m_frame_dirty{true};
};
