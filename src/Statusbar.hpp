#pragma once

#include "Config.hpp"

#include <QGridLayout>
#include <QLabel>
#include <QPushButton>
#include <QWidget>

class Statusbar : public QWidget
{
    Q_OBJECT
public:
    Statusbar(const Config &config, QWidget *parent = nullptr);

    void hidePageInfo(bool state) noexcept;
    void setTotalPageCount(int total) noexcept;
    void setFileName(const QString &name) noexcept;
    void setJsonSource(const QString &path) noexcept;
    void setPageNo(int pageno) noexcept;
    void setZoom(double zoom) noexcept;
    void setItemInfo(int items, int matches) noexcept;
    void setEditMode(bool state) noexcept;
    void setBusy(bool state) noexcept;

signals:
    void modeChangeRequested();
    void gotoPageRequested();

private:
    void initGui() noexcept;
    QHBoxLayout *section(int column, Qt::Alignment align) noexcept;

    const Config &m_config;
    QLabel *m_filename_label     = new QLabel();
    QLabel *m_json_label         = new QLabel("JSON");
    QLabel *m_busy_label         = new QLabel("Extracting...");
    QPushButton *m_pageno_button = new QPushButton();
    QLabel *m_totalpage_label    = new QLabel();
    QLabel *m_items_label        = new QLabel();
    QLabel *m_matches_label      = new QLabel();
    QLabel *m_zoom_label         = new QLabel();
    QPushButton *m_mode_button   = new QPushButton();
    QGridLayout *m_layout        = new QGridLayout();
};
