#pragma once

#include "DocumentCanvas.hpp"
#include "PainterSurface.hpp"

#include <QElapsedTimer>
#include <QMouseEvent>
#include <QWidget>
#include <memory>

class CanvasView : public QWidget
{
    Q_OBJECT
public:
    explicit CanvasView(const Config &config, QWidget *parent = nullptr);

    inline DocumentCanvas &canvas() noexcept
    {
        return m_canvas;
    }

    inline const DocumentCanvas &canvas() const noexcept
    {
        return m_canvas;
    }

    void setModel(std::shared_ptr<const ItemModel> model) noexcept;
    void setPageImage(const QImage &image) noexcept;
    void setSearchQuery(const QString &query) noexcept;
    void setEditMode(bool enabled) noexcept;
    void setItemOverrideText(const QString &id, const QString &text) noexcept;
    void clearOverrides() noexcept;
    void applyRenderingConfig() noexcept;

    void ZoomIn() noexcept;
    void ZoomOut() noexcept;
    void ZoomReset() noexcept;
    void Pan(const QPointF &delta) noexcept;

signals:
    void viewChanged();
    void itemCopied(const QString &text);
    void editRequested(const QString &id);

protected:
    void paintEvent(QPaintEvent *event) override;
    void mousePressEvent(QMouseEvent *event) override;
    void mouseMoveEvent(QMouseEvent *event) override;
    void mouseReleaseEvent(QMouseEvent *event) override;
    void mouseDoubleClickEvent(QMouseEvent *event) override;
    void wheelEvent(QWheelEvent *event) override;
    void keyPressEvent(QKeyEvent *event) override;
    void leaveEvent(QEvent *event) override;

private:
    void handleOutcome(const DocumentCanvas::Outcome &out) noexcept;

    const Config &m_config;
    DocumentCanvas m_canvas;
    PainterSurface m_surface;
    QElapsedTimer m_clock;
};
