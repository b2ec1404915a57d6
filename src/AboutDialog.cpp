#include "AboutDialog.hpp"

#include "PageRenderer.hpp"

#include <QFormLayout>
#include <toml++/toml.hpp>

AboutDialog::AboutDialog(QWidget *parent)
    : QDialog(parent), closeButton(new QPushButton("Close"))
{
    setWindowTitle("About");
    setWindowFlags(windowFlags() & ~Qt::WindowContextHelpButtonHint
                   & ~Qt::WindowMaximizeButtonHint);

    setMinimumSize(500, 320);

    QFont logoFont;
    logoFont.setPointSize(30);
    logoFont.setBold(true);

    QLabel *bannerText = new QLabel("chonker");
    bannerText->setAutoFillBackground(true);
    bannerText->setStyleSheet(
        "QLabel { background-color : #141414; color : #10B981; }");
    bannerText->setFont(logoFont);
    bannerText->setContentsMargins(10, 30, 30, 10);

    m_tabWidget = new QTabWidget(this);

    auto *layout = new QVBoxLayout();
    layout->addWidget(bannerText);
    layout->addWidget(m_tabWidget);
    layout->addWidget(closeButton, 0, Qt::AlignCenter);
    layout->setContentsMargins(0, 0, 0, 0);

    setLayout(layout);
    connect(closeButton, &QPushButton::clicked, this, &QDialog::accept);

    m_tabWidget->addTab(aboutSection(), "About");
    m_tabWidget->addTab(controlsSection(), "Controls");
    m_tabWidget->addTab(librariesSection(), "Libraries Used");
    setWindowModality(Qt::NonModal);
}

QWidget *
AboutDialog::librariesSection() noexcept
{
    QWidget *widget     = new QWidget();
    QFormLayout *layout = new QFormLayout();

    QVBoxLayout *outerLayout = new QVBoxLayout();
    layout->setAlignment(Qt::AlignCenter);

    layout->addRow("Qt", new QLabel(QT_VERSION_STR));
    layout->addRow("MuPDF", new QLabel(PageRenderer::mupdfVersion()));
    layout->addRow("toml++", new QLabel(QString("%1.%2.%3")
                                            .arg(TOML_LIB_MAJOR)
                                            .arg(TOML_LIB_MINOR)
                                            .arg(TOML_LIB_PATCH)));

    outerLayout->addLayout(layout);
    widget->setLayout(outerLayout);
    return widget;
}

QWidget *
AboutDialog::controlsSection() noexcept
{
    QWidget *widget     = new QWidget(this);
    QFormLayout *layout = new QFormLayout(widget);

    layout->addRow("Click", new QLabel("Copy item text"));
    layout->addRow("Drag", new QLabel("Pan the page"));
    layout->addRow("Ctrl + Scroll", new QLabel("Zoom"));
    layout->addRow("Scroll / Arrows", new QLabel("Pan"));
    layout->addRow("+ / - / 0", new QLabel("Zoom in / out / reset"));
    layout->addRow("Double click", new QLabel("Edit item text (edit mode)"));
    layout->addRow("Drag item", new QLabel("Move item (edit mode)"));
    widget->setLayout(layout);
    return widget;
}

QWidget *
AboutDialog::aboutSection() noexcept
{
    QWidget *widget = new QWidget(this);

    QFormLayout *layout = new QFormLayout(widget);
    layout->addRow("Version", new QLabel(APP_VERSION));
    layout->addRow("Description",
                   new QLabel("Viewer for text items extracted from PDFs"));
    widget->setLayout(layout);

    return widget;
}
