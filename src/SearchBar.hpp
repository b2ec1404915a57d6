#pragma once

#include <QKeyEvent>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QWidget>

class SearchBar : public QWidget
{
    Q_OBJECT

public:
    explicit SearchBar(QWidget *parent = nullptr);
    void setSearchCount(int matches, int total) noexcept;
    void clear() noexcept;

    inline QString text() const noexcept
    {
        return m_searchInput->text();
    }

    inline void focusSearchInput() noexcept
    {
        m_searchInput->setFocus();
        m_searchInput->selectAll();
    }

private:
    QLabel *m_label;
    QLineEdit *m_searchInput;
    QLabel *m_searchCountLabel;
    QPushButton *m_closeButton;

    void initConnections() noexcept;
    void dismiss() noexcept;

protected:
    void showEvent(QShowEvent *event) override;

    void keyPressEvent(QKeyEvent *event) override
    {
        if (event->key() == Qt::Key_Escape)
        {
            dismiss();
            return;
        }
        QWidget::keyPressEvent(event);
    }

signals:
    void searchRequested(const QString &term);
    void closed();
};
