#pragma once

#include <QDialog>
#include <QLabel>
#include <QPushButton>
#include <QTabWidget>
#include <QVBoxLayout>

class AboutDialog : public QDialog
{
    Q_OBJECT

public:
    explicit AboutDialog(QWidget *parent = nullptr);

private:
    QWidget *librariesSection() noexcept;
    QWidget *aboutSection() noexcept;
    QWidget *controlsSection() noexcept;

    QPushButton *closeButton;
    QTabWidget *m_tabWidget;
};
