#include "MessageBar.hpp"

#include "utils.hpp"

#include <algorithm>

namespace
{
constexpr int BAR_HEIGHT = 30;
}

MessageBar::MessageBar(const Config::colors &colors, QWidget *parent)
    : QWidget(parent), m_colors(colors)
{
    QHBoxLayout *layout = new QHBoxLayout(this);
    layout->setContentsMargins(8, 0, 8, 0);
    layout->addWidget(m_label);
    m_label->setTextInteractionFlags(Qt::TextSelectableByMouse);
    setLayout(layout);
    setFixedHeight(0);

    m_timer->setSingleShot(true);
    connect(m_timer, &QTimer::timeout, this, &MessageBar::showNext);
}

void
MessageBar::showMessage(const QString &msg, float sec, Level level) noexcept
{
    if (msg.isEmpty())
        return;

    const QString &last = m_queue.isEmpty() ? m_current : m_queue.last().text;
    if ((m_showing || !m_queue.isEmpty()) && msg == last)
        return;

    m_queue.enqueue({msg, std::max(1, static_cast<int>(sec * 1000)), level});
    if (!m_showing)
        showNext();
}

void
MessageBar::clear() noexcept
{
    m_timer->stop();
    m_queue.clear();
    m_current.clear();
    m_label->clear();
    m_showing = false;
    setFixedHeight(0);
}

void
MessageBar::applyLevel(Level level) noexcept
{
    if (level == Level::Error)
    {
        const QColor color = rgbaToQColor(m_colors.message_error);
        m_label->setStyleSheet(
            QStringLiteral("color: %1; font-weight: bold;").arg(color.name()));
    }
    else
    {
        m_label->setStyleSheet(QString());
    }
}

void
MessageBar::showNext() noexcept
{
    if (m_queue.isEmpty())
    {
        m_showing = false;
        m_current.clear();
        m_label->clear();
        setFixedHeight(0);
        return;
    }

    const Notice notice = m_queue.dequeue();
    m_showing           = true;
    m_current           = notice.text;

    applyLevel(notice.level);
    m_label->setText(notice.text);
    setFixedHeight(BAR_HEIGHT);
    m_timer->start(notice.duration_ms);
}
