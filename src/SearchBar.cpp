#include "SearchBar.hpp"

#include <QHBoxLayout>
#include <QStyle>

SearchBar::SearchBar(QWidget *parent) : QWidget(parent)
{
    m_label            = new QLabel("Search:", this);
    m_searchInput      = new QLineEdit(this);
    m_closeButton      = new QPushButton(this);
    m_searchCountLabel = new QLabel(this);

    m_searchInput->setFocusPolicy(Qt::ClickFocus);
    m_searchInput->setClearButtonEnabled(true);

    m_closeButton->setToolTip("Close Search Bar");
    m_closeButton->setIcon(style()->standardIcon(QStyle::SP_DialogCloseButton));

    QHBoxLayout *layout = new QHBoxLayout(this);
    layout->addWidget(m_label);
    layout->addWidget(m_searchInput, 1);
    layout->addWidget(m_searchCountLabel);
    layout->addWidget(m_closeButton);

    m_searchInput->setSizePolicy(QSizePolicy::Expanding,
                                 QSizePolicy::Preferred);
    m_searchInput->setPlaceholderText("Search items");
    m_searchCountLabel->hide();

    initConnections();
}

void
SearchBar::initConnections() noexcept
{
    // Matches update while typing
    connect(m_searchInput, &QLineEdit::textChanged, this,
            [this](const QString &text) { emit searchRequested(text); });

    connect(m_searchInput, &QLineEdit::returnPressed, this,
            [this]() { m_searchInput->clearFocus(); });

    connect(m_closeButton, &QPushButton::clicked, this, [this]() { dismiss(); });
}

void
SearchBar::dismiss() noexcept
{
    clear();
    m_searchInput->clearFocus();
    this->hide();
    emit closed();
}

void
SearchBar::clear() noexcept
{
    m_searchInput->clear();
    m_searchCountLabel->hide();
}

void
SearchBar::showEvent(QShowEvent *event)
{
    QWidget::showEvent(event);
    m_searchInput->setFocus();
}

// "<matches> of <total>" against the items of the current page
void
SearchBar::setSearchCount(int matches, int total) noexcept
{
    if (m_searchInput->text().isEmpty())
    {
        m_searchCountLabel->hide();
        return;
    }

    if (matches == 0)
    {
        m_searchCountLabel->setText("No matches");
        m_searchCountLabel->setStyleSheet("color: #DC2626;");
    }
    else
    {
        m_searchCountLabel->setText(QString("%1 of %2").arg(matches).arg(total));
        m_searchCountLabel->setStyleSheet(QString());
    }
    m_searchCountLabel->show();
}
