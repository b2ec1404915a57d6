#pragma once

// Strip above the statusbar for extraction results and short notices.
// Messages queue up and collapse to zero height when nothing is shown.

#include "Config.hpp"

#include <QHBoxLayout>
#include <QLabel>
#include <QQueue>
#include <QTimer>
#include <QWidget>

class MessageBar : public QWidget
{
    Q_OBJECT
public:
    enum class Level
    {
        Info,
        Error
    };

    MessageBar(const Config::colors &colors, QWidget *parent = nullptr);

    // A message equal to the one on screen or last in the queue is dropped
    void showMessage(const QString &msg, float sec = 2.0f,
                     Level level = Level::Info) noexcept;

    // Drops the current and queued messages
    void clear() noexcept;

    inline bool showing() const noexcept
    {
        return m_showing;
    }

    inline int pending() const noexcept
    {
        return m_queue.size();
    }

private:
    struct Notice
    {
        QString text;
        int duration_ms;
        Level level;
    };

    void showNext() noexcept;
    void applyLevel(Level level) noexcept;

    const Config::colors &m_colors;
    QLabel *m_label{new QLabel(this)};
    QTimer *m_timer{new QTimer(this)};
    QQueue<Notice> m_queue;
    QString m_current;
    bool m_showing{false};
};
