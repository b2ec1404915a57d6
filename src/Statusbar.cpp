#include "Statusbar.hpp"

#include <QFileInfo>
#include <QHBoxLayout>

Statusbar::Statusbar(const Config &config, QWidget *parent)
    : QWidget(parent), m_config(config)
{
    initGui();
}

QHBoxLayout *
Statusbar::section(int column, Qt::Alignment align) noexcept
{
    auto *layout = new QHBoxLayout;
    layout->setSpacing(8);
    m_layout->addLayout(layout, 0, column, align);
    return layout;
}

void
Statusbar::initGui() noexcept
{
    const auto padding = m_config.statusbar.padding;
    setContentsMargins(padding[0], padding[1], padding[2], padding[3]);
    m_layout->setContentsMargins(0, 0, 0, 0);
    setLayout(m_layout);

    // Source: PDF name, JSON marker, extraction in progress
    QHBoxLayout *source = section(0, Qt::AlignLeft);
    source->addWidget(m_filename_label);
    source->addWidget(m_json_label);
    source->addWidget(m_busy_label);
    m_filename_label->setTextInteractionFlags(Qt::TextSelectableByMouse);
    m_json_label->setHidden(true);
    m_busy_label->setHidden(true);

    // Page: "<n> / <total>", the number opens the goto dialog
    QHBoxLayout *page = section(1, Qt::AlignCenter);
    m_pageno_button->setFlat(true);
    m_pageno_button->setCursor(Qt::PointingHandCursor);
    m_pageno_button->setToolTip("Go to page");
    page->addWidget(m_pageno_button);
    page->addWidget(m_totalpage_label);

    // Canvas state
    QHBoxLayout *canvas = section(2, Qt::AlignRight);
    canvas->addWidget(m_items_label);
    canvas->addWidget(m_matches_label);
    canvas->addWidget(m_zoom_label);
    canvas->addWidget(m_mode_button);
    m_mode_button->setFlat(true);
    m_mode_button->setToolTip("Toggle edit mode");

    m_layout->setColumnStretch(0, 1);
    m_layout->setColumnStretch(1, 0);
    m_layout->setColumnStretch(2, 1);

    connect(m_mode_button, &QPushButton::clicked, this,
            &Statusbar::modeChangeRequested);
    connect(m_pageno_button, &QPushButton::clicked, this,
            &Statusbar::gotoPageRequested);

    m_items_label->setVisible(m_config.statusbar.show_item_count);
    m_mode_button->setVisible(m_config.statusbar.show_mode);
    m_matches_label->setHidden(true);

    setEditMode(m_config.behavior.edit_mode);
    setZoom(m_config.zoom.level);
    hidePageInfo(true);
}

void
Statusbar::setTotalPageCount(int total) noexcept
{
    m_totalpage_label->setText(QString("/ %1").arg(total));
}

void
Statusbar::setFileName(const QString &name) noexcept
{
    m_filename_label->setText(
        m_config.statusbar.file_name_only ? QFileInfo(name).fileName() : name);
    m_filename_label->setToolTip(name);
}

// Marks that the items come from an extraction JSON
void
Statusbar::setJsonSource(const QString &path) noexcept
{
    m_json_label->setVisible(!path.isEmpty());
    m_json_label->setToolTip(path);
}

void
Statusbar::setPageNo(int pageno) noexcept
{
    m_pageno_button->setText(QString::number(pageno));
}

void
Statusbar::setZoom(double zoom) noexcept
{
    m_zoom_label->setText(QString("%1%").arg(qRound(zoom * 100.0)));
}

void
Statusbar::setItemInfo(int items, int matches) noexcept
{
    m_items_label->setText(
        items == 1 ? QString("1 item") : QString("%1 items").arg(items));

    m_matches_label->setVisible(matches > 0);
    m_matches_label->setText(matches == 1 ? QString("1 match")
                                          : QString("%1 matches").arg(matches));
}

void
Statusbar::setEditMode(bool state) noexcept
{
    m_mode_button->setText(state ? "EDIT" : "VIEW");
}

void
Statusbar::setBusy(bool state) noexcept
{
    m_busy_label->setVisible(state);
}

void
Statusbar::hidePageInfo(bool state) noexcept
{
    const bool show = !state && m_config.statusbar.show_page_number;
    m_pageno_button->setVisible(show);
    m_totalpage_label->setVisible(show);
}
