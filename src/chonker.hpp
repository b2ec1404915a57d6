#pragma once

#include "CanvasView.hpp"
#include "Config.hpp"
#include "ExtractionService.hpp"
#include "MessageBar.hpp"
#include "PageRenderer.hpp"
#include "SearchBar.hpp"
#include "Statusbar.hpp"

#include <QDir>
#include <QJsonObject>
#include <QKeySequence>
#include <QLabel>
#include <QMainWindow>
#include <QMenuBar>
#include <QScrollArea>
#include <QShortcut>
#include <QSplitter>
#include <QTimer>
#include <QVBoxLayout>
#include <argparse/argparse.hpp>
#include <functional>
#include <toml++/toml.hpp>

class chonker : public QMainWindow
{
    Q_OBJECT

    using ChonkerCommandHash
        = QHash<QString, std::function<void(const QStringList &args)>>;

public:
    chonker() noexcept;
    ~chonker() noexcept;

    void ReadArgsParser(argparse::ArgumentParser &argparser) noexcept;
    bool OpenFile(const QString &filename = QString()) noexcept;
    bool OpenJson(const QString &filename = QString()) noexcept;
    void Extract() noexcept;
    void CloseFile() noexcept;
    void Search() noexcept;
    void ToggleEditMode() noexcept;
    void ResetOverrides() noexcept;
    void ToggleMenubar() noexcept;
    void TogglePanel() noexcept;
    void TogglePagePanel() noexcept;
    void TogglePageImage() noexcept;
    void ToggleFullscreen() noexcept;
    void ZoomIn() noexcept;
    void ZoomOut() noexcept;
    void ZoomReset() noexcept;
    void ScrollLeft() noexcept;
    void ScrollRight() noexcept;
    void ScrollUp() noexcept;
    void ScrollDown() noexcept;
    void FirstPage() noexcept;
    void PrevPage() noexcept;
    void NextPage() noexcept;
    void LastPage() noexcept;
    void GotoPage() noexcept;
    void ShowAbout() noexcept;

private:
    void construct() noexcept;
    void initActionMap() noexcept;
    void initConfig() noexcept;
    void initGui() noexcept;
    void initMenubar() noexcept;
    void initDefaultKeybinds() noexcept;
    void initConnections() noexcept;
    void setupKeybinding(const QString &action, const QString &key) noexcept;
    void updateUiEnabledState() noexcept;
    void updatePanel() noexcept;
    void updateWindowTitle() noexcept;

    void gotoPage(int pageIndex) noexcept;
    void renderPageImage() noexcept;
    void setSource(const QString &path) noexcept;
    void applyExtractionResult(ExtractionResult result) noexcept;
    void pollExtraction() noexcept;
    void editItem(const QString &id) noexcept;

    QDir m_config_dir;
    QString m_config_file_path;
    Config m_config;
    bool m_load_default_keybinding{true};
    ChonkerCommandHash m_actionMap;

    QString m_source_path; // PDF or JSON the items came from
    QString m_json_path;
    QJsonObject m_document;
    int m_page_index{0};
    int m_page_count{0};

    PageRenderer m_renderer;
    ExtractionService m_extraction{m_config.extraction};
    QTimer *m_extraction_timer{nullptr};

    QVBoxLayout *m_layout{nullptr};
    QSplitter *m_splitter{nullptr};
    QScrollArea *m_page_panel{nullptr};
    QLabel *m_page_label{nullptr};
    CanvasView *m_canvas_view{nullptr};
    Statusbar *m_statusbar{nullptr};
    SearchBar *m_search_bar{nullptr};
    MessageBar *m_message_bar{nullptr};

    QMenuBar *m_menuBar{nullptr};
    QMenu *m_navMenu{nullptr};
    QAction *m_actionExtract{nullptr};
    QAction *m_actionCloseFile{nullptr};
    QAction *m_actionEditMode{nullptr};
    QAction *m_actionResetOverrides{nullptr};
    QAction *m_actionFullscreen{nullptr};
    QAction *m_actionZoomIn{nullptr};
    QAction *m_actionZoomOut{nullptr};
    QAction *m_actionZoomReset{nullptr};
    QAction *m_actionSearch{nullptr};
    QAction *m_actionToggleMenubar{nullptr};
    QAction *m_actionTogglePanel{nullptr};
    QAction *m_actionTogglePagePanel{nullptr};
    QAction *m_actionTogglePageImage{nullptr};
    QAction *m_actionGotoPage{nullptr};
    QAction *m_actionFirstPage{nullptr};
    QAction *m_actionPrevPage{nullptr};
    QAction *m_actionNextPage{nullptr};
    QAction *m_actionLastPage{nullptr};
};
