#include "DocumentCanvas.hpp"

#include "utils.hpp"

#include <QDebug>

namespace
{
static const FontSpec kStatusFont{12.0, false, false};
static const FontSpec kHintFont{10.0, false, false};
static const FontSpec kToastFont{12.0, false, false};

static const QPointF kStatusPos(10.0, 10.0);
static const QPointF kHintPos(10.0, 25.0);

constexpr qreal HOVER_EXPAND        = 2.0;
constexpr qreal HOVER_RADIUS        = 4.0;
constexpr qreal CHECKBOX_RATIO      = 0.8;
constexpr qreal CHECKBOX_STROKE     = 1.5;
constexpr qreal CHECKBOX_RADIUS     = 2.0;
constexpr qreal CHECK_MARK_STROKE   = 2.0;
constexpr qreal TOAST_BOTTOM_MARGIN = 30.0;
constexpr qreal GUIDE_BOTTOM_MARGIN = 20.0;
} // namespace

DocumentCanvas::DocumentCanvas(const Config &config) noexcept
    : m_config(config), m_layout_engine(config.canvas), m_controller(config)
{
    m_zoom = ViewTransform::clampZoom(config.zoom.level, config.zoom.min,
                                      config.zoom.max);
    m_edit_mode = config.behavior.edit_mode;
}

void
DocumentCanvas::invalidate() noexcept
{
    m_frame_dirty = true;
}

void
DocumentCanvas::setModel(std::shared_ptr<const ItemModel> model) noexcept
{
    m_model = std::move(model);
    m_search.refresh(m_model ? m_model->items() : std::vector<DocumentItem>{});
    invalidate();
}

void
DocumentCanvas::setZoom(double zoom) noexcept
{
    m_zoom = ViewTransform::clampZoom(zoom, m_config.zoom.min,
                                      m_config.zoom.max);
    invalidate();
}

void
DocumentCanvas::zoomIn() noexcept
{
    setZoom(m_controller.zoomIn(m_zoom));
}

void
DocumentCanvas::zoomOut() noexcept
{
    setZoom(m_controller.zoomOut(m_zoom));
}

void
DocumentCanvas::resetView() noexcept
{
    m_pan = QPointF();
    setZoom(m_config.zoom.level);
}

void
DocumentCanvas::setPan(const QPointF &pan) noexcept
{
    m_pan = pan;
    invalidate();
}

void
DocumentCanvas::setSearchQuery(const QString &query) noexcept
{
    m_search.search(query,
                    m_model ? m_model->items() : std::vector<DocumentItem>{});
    invalidate();
}

void
DocumentCanvas::setItemOffset(const QString &id, qreal dx, qreal dy) noexcept
{
    m_offsets[id] = QPointF(dx, dy);
    invalidate();
}

QPointF
DocumentCanvas::itemOffset(const QString &id) const noexcept
{
    return m_offsets.value(id);
}

void
DocumentCanvas::setItemOverrideText(const QString &id,
                                    const QString &text) noexcept
{
    m_overrides[id] = text;
    invalidate();
}

void
DocumentCanvas::clearOverrides() noexcept
{
    m_overrides.clear();
    m_offsets.clear();
    invalidate();
}

QString
DocumentCanvas::effectiveText(const DocumentItem &item) const noexcept
{
    auto it = m_overrides.constFind(item.id);
    return it != m_overrides.constEnd() ? it.value() : item.content;
}

void
DocumentCanvas::setEditMode(bool enabled) noexcept
{
    m_edit_mode = enabled;
}

void
DocumentCanvas::setPageImage(const QImage &image) noexcept
{
    m_page_image = image;
}

DocumentCanvas::Snapshot
DocumentCanvas::snapshot() const noexcept
{
    Snapshot s;
    s.item_count   = m_model ? m_model->count() : 0;
    s.zoom         = m_zoom;
    s.pan          = m_pan;
    s.query        = m_search.query();
    s.match_count  = m_search.count();
    s.column_count = m_model ? m_model->columnCount() : 1;
    s.edit_mode    = m_edit_mode;
    s.page_index   = m_model ? m_model->pageIndex() : 0;
    s.hovered_id   = m_controller.hoveredId();
    return s;
}

ViewTransform
DocumentCanvas::transform(const QSizeF &panelSize) const noexcept
{
    ViewTransform::Params params;
    params.panel_size = panelSize;
    params.page_size  = m_model ? m_model->pageSize()
                                : QSizeF(DEFAULT_PAGE_WIDTH, DEFAULT_PAGE_HEIGHT);
    params.zoom       = m_zoom;
    params.pan        = m_pan;
    params.margin = QPointF(m_config.canvas.margin_x, m_config.canvas.margin_y);
    return ViewTransform(params, m_config.canvas.origin, m_config.canvas.fit);
}

DocumentCanvas::ItemFrame
DocumentCanvas::layoutItem(int index, const DocumentItem &item,
                           const ViewTransform &transform,
                           const QSizeF &panelSize,
                           const RenderSurface &surface) const noexcept
{
    const double scale = transform.scale();
    const QRectF docRect(item.bbox.left, item.bbox.top, item.bbox.width,
                         item.bbox.height);
    const QRectF screenRect = transform.toScreen(docRect);
    const QPointF topLeft   = screenRect.topLeft() + itemOffset(item.id);

    ItemFrame f;
    f.index    = index;
    f.item     = &item;
    f.text     = effectiveText(item);
    f.matched  = m_search.matches(item.id);
    f.style    = resolveItemStyle(item, scale, f.matched, m_config);
    f.checkbox = item.type == ItemType::Checkbox;

    if (f.checkbox)
    {
        const qreal side = f.style.font.point_size * CHECKBOX_RATIO;
        f.checkbox_glyph
            = checkboxGlyph(topLeft, side, isCheckboxChecked(item.content));
        f.glyph_rect = f.checkbox_glyph.box;
    }
    else
    {
        const qreal available
            = panelSize.width() - topLeft.x() - m_config.canvas.margin_x;
        const qreal maxWidth
            = m_layout_engine.wrapWidth(f.text, screenRect.width(), available);
        f.layout = m_layout_engine.layout(f.text, f.style.font, maxWidth, surface);

        // Unmeasurable text keeps the extractor's box
        const qreal height
            = f.layout.height > 0 ? f.layout.height : screenRect.height();
        f.glyph_rect = QRectF(topLeft, QSizeF(f.layout.width, height));
    }

    f.hit_rect = expandRect(f.glyph_rect, m_config.canvas.hit_padding);
    return f;
}

const DocumentCanvas::Frame &
DocumentCanvas::layoutFrame(const RenderSurface &surface) noexcept
{
    const QSizeF panel = surface.size();
    if (!m_frame_dirty && panel == m_frame.panel_size)
        return m_frame;

    Frame frame;
    frame.panel_size = panel;
    frame.transform  = transform(panel);

    if (m_model)
    {
        const auto &items = m_model->items();
        frame.items.reserve(items.size());
        frame.targets.reserve(items.size());

        for (int i = 0; i < static_cast<int>(items.size()); ++i)
        {
            ItemFrame f = layoutItem(i, items[static_cast<size_t>(i)],
                                     frame.transform, panel, surface);
            frame.targets.push_back({f.item->id, f.hit_rect, f.text});
            frame.items.push_back(std::move(f));
        }
    }

    m_frame       = std::move(frame);
    m_frame_dirty = false;
    m_controller.refreshHover(m_frame.targets);
    return m_frame;
}

void
DocumentCanvas::paintItem(RenderSurface &surface, const ItemFrame &f) noexcept
{
    const QColor none(Qt::transparent);

    if (f.matched)
        surface.drawRect(f.glyph_rect,
                         rgbaToQColor(m_config.colors.search_highlight), none);

    if (f.checkbox)
    {
        surface.drawRect(f.checkbox_glyph.box, none, f.style.color,
                         CHECKBOX_STROKE, CHECKBOX_RADIUS);
        if (f.checkbox_glyph.checked)
            surface.drawPolyline(f.checkbox_glyph.tick, f.style.color,
                                 CHECK_MARK_STROKE);
        return;
    }

    QPointF pos = f.glyph_rect.topLeft();
    for (const QString &line : f.layout.lines)
    {
        surface.drawText(pos, line, f.style.font, f.style.color);
        pos.ry() += f.layout.line_height;
    }
}

void
DocumentCanvas::paintOverlayText(RenderSurface &surface, qint64 nowMs) noexcept
{
    const Snapshot s     = snapshot();
    const bool inside    = m_controller.pointerInside();
    const QString columns
        = s.column_count > 1
              ? QStringLiteral(" | %1 columns").arg(s.column_count)
              : QString();
    const QString status = QStringLiteral("%1 items | Zoom: %2%%3")
                               .arg(QString::number(s.item_count),
                                    QString::number(qRound(s.zoom * 100.0)),
                                    columns);

    surface.drawText(kStatusPos, status, kStatusFont,
                     rgbaToQColor(inside ? m_config.colors.status_hover
                                         : m_config.colors.status));

    if (inside)
        surface.drawText(kHintPos,
                         QStringLiteral("Click to copy • Ctrl+scroll to zoom"),
                         kHintFont, rgbaToQColor(m_config.colors.hint));

    if (!m_controller.toastVisible(nowMs))
        return;

    const QString toast
        = QStringLiteral("Copied: ")
          + previewText(m_controller.copiedText(),
                        m_config.canvas.toast_preview_length);
    const QSizeF toastSize = surface.measureText(toast, kToastFont);
    const QSizeF panel     = surface.size();
    const QPointF toastPos((panel.width() - toastSize.width()) / 2.0,
                           panel.height() - TOAST_BOTTOM_MARGIN
                               - toastSize.height());
    surface.drawText(toastPos, toast, kToastFont,
                     rgbaToQColor(m_config.colors.toast));
}

void
DocumentCanvas::paint(RenderSurface &surface, qint64 nowMs) noexcept
{
    const Frame &frame = layoutFrame(surface);
    const QSizeF panel = frame.panel_size;
    const QColor none(Qt::transparent);

    surface.drawRect(QRectF(QPointF(0, 0), panel),
                     rgbaToQColor(m_config.colors.background), none);

    if (m_config.rendering.page_image && !m_page_image.isNull())
        surface.drawImage(frame.transform.pageRect(), m_page_image);

    for (const ItemFrame &f : frame.items)
        paintItem(surface, f);

    if (m_config.canvas.column_guides && m_model && m_model->columnCount() > 1)
    {
        const QColor guide = rgbaToQColor(m_config.colors.column_guide);
        for (double boundary : m_model->columnBoundaries())
        {
            const qreal x = frame.transform.toScreen(QPointF(boundary, 0)).x();
            surface.drawLine(QPointF(x, m_config.canvas.margin_y),
                             QPointF(x, panel.height() - GUIDE_BOTTOM_MARGIN),
                             guide);
        }
    }

    paintOverlayText(surface, nowMs);

    const QString &hovered = m_controller.hoveredId();
    if (!hovered.isEmpty())
    {
        for (const ItemFrame &f : frame.items)
        {
            if (f.item->id != hovered)
                continue;

            surface.drawRect(expandRect(f.hit_rect, HOVER_EXPAND), none,
                             rgbaToQColor(m_config.colors.hover), 1.0,
                             HOVER_RADIUS);
            break;
        }
    }

    surface.setCursor(m_controller.cursorShape());
}

void
DocumentCanvas::apply(const Outcome &out) noexcept
{
    if (out.reset_view)
        resetView();

    if (!out.pan_delta.isNull())
        setPan(m_pan + out.pan_delta);

    if (out.zoom)
        setZoom(*out.zoom);

    if (!out.offset_item.isEmpty() && !out.offset_delta.isNull())
    {
        const QPointF current = itemOffset(out.offset_item) + out.offset_delta;
        setItemOffset(out.offset_item, current.x(), current.y());
    }
}

DocumentCanvas::Outcome
DocumentCanvas::mouseMove(const QPointF &pos, RenderSurface &surface) noexcept
{
    const Frame &frame = layoutFrame(surface);
    Outcome out        = m_controller.pointerMoved(pos, frame.targets);
    apply(out);
    surface.setCursor(m_controller.cursorShape());
    return out;
}

DocumentCanvas::Outcome
DocumentCanvas::mousePress(const QPointF &pos, Qt::MouseButton button,
                           RenderSurface &surface) noexcept
{
    const Frame &frame = layoutFrame(surface);
    Outcome out
        = m_controller.pointerPressed(pos, button, frame.targets, m_edit_mode);
    apply(out);
    return out;
}

DocumentCanvas::Outcome
DocumentCanvas::mouseRelease(const QPointF &pos, Qt::MouseButton button,
                             RenderSurface &surface, qint64 nowMs) noexcept
{
    const Frame &frame = layoutFrame(surface);
    Outcome out = m_controller.pointerReleased(pos, button, frame.targets);
    apply(out);

    if (out.copy_text)
    {
        // No toast when the clipboard refuses the text
        if (surface.copyToClipboard(*out.copy_text))
        {
            m_controller.recordCopy(*out.copy_text, nowMs);
            out.repaint          = true;
            out.repaint_after_ms = m_config.canvas.toast_duration_ms;
        }
        else
        {
            qWarning() << "DocumentCanvas: clipboard unavailable";
            out.copy_text.reset();
        }
    }

    surface.setCursor(m_controller.cursorShape());
    return out;
}

DocumentCanvas::Outcome
DocumentCanvas::mouseDoubleClick(const QPointF &pos,
                                 RenderSurface &surface) noexcept
{
    const Frame &frame = layoutFrame(surface);
    Outcome out = m_controller.doubleClicked(pos, frame.targets, m_edit_mode);
    apply(out);
    return out;
}

DocumentCanvas::Outcome
DocumentCanvas::wheel(const QPointF &delta,
                      Qt::KeyboardModifiers modifiers) noexcept
{
    Outcome out = m_controller.wheel(delta, modifiers, m_zoom);
    apply(out);
    return out;
}

DocumentCanvas::Outcome
DocumentCanvas::keyPress(int key, Qt::KeyboardModifiers modifiers) noexcept
{
    Outcome out = m_controller.keyPressed(key, modifiers, m_zoom);
    apply(out);
    return out;
}

DocumentCanvas::Outcome
DocumentCanvas::leave() noexcept
{
    return m_controller.pointerLeft();
}
