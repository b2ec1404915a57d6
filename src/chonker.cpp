#include "chonker.hpp"

#include "AboutDialog.hpp"
#include "ItemModel.hpp"
#include "utils.hpp"

#include <QApplication>
#include <QFileDialog>
#include <QFileInfo>
#include <QGuiApplication>
#include <QInputDialog>
#include <QMessageBox>
#include <QStandardPaths>
#include <algorithm>

namespace
{

static inline void
set_title_format_if_present(toml::node_view<toml::node> n,
                            QString &title_format)
{
    if (auto v = n.value<std::string>())
    {
        QString window_title = QString::fromStdString(*v);
        window_title.replace("{}", "%1");
        title_format = window_title;
    }
}

template <typename T>
static inline void
set_if_present(toml::node_view<toml::node> node, T &target)
{
    if (auto v = node.value<T>())
        target = *v;
}

static inline void
set_qstring_if_present(toml::node_view<toml::node> n, QString &dst)
{
    if (auto v = n.value<std::string>())
        dst = QString::fromStdString(*v);
}

static inline void
set_qstringlist_if_present(toml::node_view<toml::node> n, QStringList &dst)
{
    if (auto arr = n.as_array())
    {
        QStringList list;
        for (const auto &el : *arr)
        {
            if (auto v = el.value<std::string>())
                list << QString::fromStdString(*v);
        }
        dst = list;
    }
}

static inline void
set_color_if_present(toml::node_view<toml::node> n, uint32_t &dst)
{
    if (auto s = n.value<std::string>())
    {
        uint32_t tmp = dst;
        if (parseHexColor(*s, tmp))
            dst = tmp;
        else
            qWarning() << "Invalid color in config:" << QString::fromStdString(*s);
    }
}

static inline void
set_origin_if_present(toml::node_view<toml::node> n,
                      ViewTransform::Origin &dst)
{
    if (auto v = n.value<std::string>())
    {
        if (*v == "top_left")
            dst = ViewTransform::Origin::TopLeft;
        else if (*v == "bottom_left")
            dst = ViewTransform::Origin::BottomLeft;
        else
            qWarning() << "Unknown canvas origin:" << QString::fromStdString(*v);
    }
}

static inline void
set_fit_if_present(toml::node_view<toml::node> n, ViewTransform::Fit &dst)
{
    if (auto v = n.value<std::string>())
    {
        if (*v == "uniform")
            dst = ViewTransform::Fit::Uniform;
        else if (*v == "width_only")
            dst = ViewTransform::Fit::WidthOnly;
        else
            qWarning() << "Unknown canvas fit:" << QString::fromStdString(*v);
    }
}

inline bool
isJsonFile(const QString &path) noexcept
{
    return QFileInfo(path).suffix().compare("json", Qt::CaseInsensitive) == 0;
}

} // namespace

chonker::chonker() noexcept
{
    setAttribute(Qt::WA_NativeWindow);
}

chonker::~chonker() noexcept {}

// On-demand construction of `chonker` (for use with argparse)
void
chonker::construct() noexcept
{
    initActionMap();
    initConfig();
    m_extraction.setConfig(m_config.extraction);
    initGui();
    if (m_load_default_keybinding)
        initDefaultKeybinds();
    initMenubar();
    setMinimumSize(600, 400);
    initConnections();
    updateUiEnabledState();
    updatePanel();
    updateWindowTitle();

    const auto [width, height] = m_config.window.initial_size;
    if (width > 0 && height > 0)
        resize(width, height);

    if (m_config.window.fullscreen)
        this->showFullScreen();
    else
        this->show();
}

#define ACTION_NO_ARGS(name, func)                                             \
    {name, [this](const QStringList &) { func(); }}

// Initialize the action map
void
chonker::initActionMap() noexcept
{
    m_actionMap = {
        {"goto_page",
         [this](const QStringList &args)
    {
        if (args.isEmpty())
        {
            GotoPage();
            return;
        }
        bool ok;
        int pageno = args.at(0).toInt(&ok);
        if (ok)
            gotoPage(pageno - 1);
        else
            m_message_bar->showMessage(QStringLiteral("Invalid page number"));
    }},

        ACTION_NO_ARGS("open_file", OpenFile),
        ACTION_NO_ARGS("open_json", OpenJson),
        ACTION_NO_ARGS("extract", Extract),
        ACTION_NO_ARGS("close_file", CloseFile),
        ACTION_NO_ARGS("search", Search),
        ACTION_NO_ARGS("edit_mode", ToggleEditMode),
        ACTION_NO_ARGS("reset_overrides", ResetOverrides),
        ACTION_NO_ARGS("zoom_in", ZoomIn),
        ACTION_NO_ARGS("zoom_out", ZoomOut),
        ACTION_NO_ARGS("zoom_reset", ZoomReset),
        ACTION_NO_ARGS("scroll_left", ScrollLeft),
        ACTION_NO_ARGS("scroll_right", ScrollRight),
        ACTION_NO_ARGS("scroll_up", ScrollUp),
        ACTION_NO_ARGS("scroll_down", ScrollDown),
        ACTION_NO_ARGS("first_page", FirstPage),
        ACTION_NO_ARGS("prev_page", PrevPage),
        ACTION_NO_ARGS("next_page", NextPage),
        ACTION_NO_ARGS("last_page", LastPage),
        ACTION_NO_ARGS("toggle_menubar", ToggleMenubar),
        ACTION_NO_ARGS("toggle_panel", TogglePanel),
        ACTION_NO_ARGS("toggle_page_panel", TogglePagePanel),
        ACTION_NO_ARGS("toggle_page_image", TogglePageImage),
        ACTION_NO_ARGS("fullscreen", ToggleFullscreen),
        ACTION_NO_ARGS("about", ShowAbout),
    };
}

#undef ACTION_NO_ARGS

// Initialize the config related stuff
void
chonker::initConfig() noexcept
{
    m_config_dir = QDir(
        QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation));

    // If config file path is not set, use the default one
    if (m_config_file_path.isEmpty())
        m_config_file_path = m_config_dir.filePath("config.toml");

    if (!QFile::exists(m_config_file_path))
        return;

    toml::table toml;

    try
    {
        toml = toml::parse_file(m_config_file_path.toStdString());
    }
    catch (std::exception &e)
    {
        QMessageBox::critical(
            this, "Error in configuration file",
            QString("There are one or more error(s) in your config "
                    "file:\n%1\n\nLoading default config.")
                .arg(e.what()));
        return;
    }

    /* window */
    auto ui_window = toml["window"];
    set_if_present(ui_window["menubar"], m_config.window.menubar);
    set_if_present(ui_window["fullscreen"], m_config.window.fullscreen);
    set_if_present(ui_window["page_panel"], m_config.window.page_panel);
    set_title_format_if_present(ui_window["window_title"],
                                m_config.window.title_format);

    if (auto size_array = ui_window["initial_size"].as_array();
        size_array && size_array->size() >= 2)
    {
        auto w = size_array->get(0)->value<int>();
        auto h = size_array->get(1)->value<int>();
        if (w && h)
            m_config.window.initial_size = {*w, *h};
    }

    /* statusbar */
    auto ui_statusbar = toml["statusbar"];
    set_if_present(ui_statusbar["visible"], m_config.statusbar.visible);

    if (auto padding_array = ui_statusbar["padding"].as_array();
        padding_array && padding_array->size() >= 4)
    {
        for (int i = 0; i < 4; ++i)
        {
            if (auto v
                = padding_array->get(static_cast<size_t>(i))->value<int>())
                m_config.statusbar.padding[i] = *v;
        }
    }

    set_if_present(ui_statusbar["file_name_only"],
                   m_config.statusbar.file_name_only);
    set_if_present(ui_statusbar["show_page_number"],
                   m_config.statusbar.show_page_number);
    set_if_present(ui_statusbar["show_item_count"],
                   m_config.statusbar.show_item_count);
    set_if_present(ui_statusbar["show_mode"], m_config.statusbar.show_mode);

    /* zoom */
    auto ui_zoom = toml["zoom"];
    set_if_present(ui_zoom["level"], m_config.zoom.level);
    set_if_present(ui_zoom["factor"], m_config.zoom.factor);
    set_if_present(ui_zoom["min"], m_config.zoom.min);
    set_if_present(ui_zoom["max"], m_config.zoom.max);
    set_if_present(ui_zoom["wheel_factor"], m_config.zoom.wheel_factor);
    set_if_present(ui_zoom["pan_step"], m_config.zoom.pan_step);

    /* canvas */
    auto canvas = toml["canvas"];
    set_origin_if_present(canvas["origin"], m_config.canvas.origin);
    set_fit_if_present(canvas["fit"], m_config.canvas.fit);
    set_if_present(canvas["margin_x"], m_config.canvas.margin_x);
    set_if_present(canvas["margin_y"], m_config.canvas.margin_y);
    set_if_present(canvas["wrap_threshold"], m_config.canvas.wrap_threshold);
    set_qstringlist_if_present(canvas["wrap_triggers"],
                               m_config.canvas.wrap_triggers);
    set_if_present(canvas["wrap_cap_width"], m_config.canvas.wrap_cap_width);
    set_if_present(canvas["min_wrap_width"], m_config.canvas.min_wrap_width);
    set_if_present(canvas["fallback_width"], m_config.canvas.fallback_width);
    set_if_present(canvas["min_font_size"], m_config.canvas.min_font_size);
    set_if_present(canvas["max_font_size"], m_config.canvas.max_font_size);
    set_if_present(canvas["max_lines"], m_config.canvas.max_lines);
    set_if_present(canvas["hit_padding"], m_config.canvas.hit_padding);
    set_if_present(canvas["drag_threshold"], m_config.canvas.drag_threshold);
    set_if_present(canvas["toast_duration_ms"],
                   m_config.canvas.toast_duration_ms);
    set_if_present(canvas["toast_preview_length"],
                   m_config.canvas.toast_preview_length);
    set_if_present(canvas["column_guides"], m_config.canvas.column_guides);

    /* extraction */
    auto extraction = toml["extraction"];
    set_qstring_if_present(extraction["command"], m_config.extraction.command);
    set_qstringlist_if_present(extraction["args"], m_config.extraction.args);
    set_if_present(extraction["timeout_ms"], m_config.extraction.timeout_ms);
    set_if_present(extraction["auto_extract"],
                   m_config.extraction.auto_extract);
    set_if_present(extraction["poll_interval_ms"],
                   m_config.extraction.poll_interval_ms);

    /* colors */
    auto colors = toml["colors"];
    set_color_if_present(colors["background"], m_config.colors.background);
    set_color_if_present(colors["text"], m_config.colors.text);
    set_color_if_present(colors["form_label"], m_config.colors.form_label);
    set_color_if_present(colors["form_field"], m_config.colors.form_field);
    set_color_if_present(colors["checkbox"], m_config.colors.checkbox);
    set_color_if_present(colors["search_match"], m_config.colors.search_match);
    set_color_if_present(colors["search_highlight"],
                         m_config.colors.search_highlight);
    set_color_if_present(colors["hover"], m_config.colors.hover);
    set_color_if_present(colors["column_guide"], m_config.colors.column_guide);
    set_color_if_present(colors["status"], m_config.colors.status);
    set_color_if_present(colors["status_hover"], m_config.colors.status_hover);
    set_color_if_present(colors["hint"], m_config.colors.hint);
    set_color_if_present(colors["toast"], m_config.colors.toast);
    set_color_if_present(colors["message_error"], m_config.colors.message_error);

    /* rendering */
    auto rendering = toml["rendering"];
    set_if_present(rendering["page_image"], m_config.rendering.page_image);
    set_if_present(rendering["dpi"], m_config.rendering.dpi);
    set_if_present(rendering["antialiasing"], m_config.rendering.antialiasing);
    set_if_present(rendering["text_antialiasing"],
                   m_config.rendering.text_antialiasing);
    set_if_present(rendering["smooth_pixmap_transform"],
                   m_config.rendering.smooth_pixmap_transform);

    /* behavior */
    auto behavior = toml["behavior"];
    set_if_present(behavior["edit_mode"], m_config.behavior.edit_mode);
    set_if_present(behavior["clear_overrides_on_new_source"],
                   m_config.behavior.clear_overrides_on_new_source);

    if (toml.contains("keybindings"))
    {
        m_load_default_keybinding = false;
        auto keys                 = toml["keybindings"];

        for (auto &[action, value] : *keys.as_table())
        {
            if (value.is_value())
                setupKeybinding(
                    QString::fromStdString(std::string(action.str())),
                    QString::fromStdString(value.value_or<std::string>("")));
        }
    }

#ifndef NDEBUG
    qDebug() << "Finished reading config file:" << m_config_file_path;
#endif
}

// Initialize the keybindings related stuff. Bare +, -, 0 and the arrow keys
// are handled by the canvas itself.
void
chonker::initDefaultKeybinds() noexcept
{
    struct DefaultBinding
    {
        const char *action;
        const char *key;
    };

    static const DefaultBinding defaults[] = {
        {"open_file", "Ctrl+o"},
        {"open_json", "Ctrl+Shift+o"},
        {"extract", "Ctrl+e"},
        {"close_file", "Ctrl+w"},
        {"search", "/"},
        {"edit_mode", "e"},
        {"reset_overrides", "Ctrl+Shift+r"},
        {"zoom_in", "Ctrl+="},
        {"zoom_out", "Ctrl+-"},
        {"zoom_reset", "Ctrl+0"},
        {"scroll_left", "h"},
        {"scroll_down", "j"},
        {"scroll_up", "k"},
        {"scroll_right", "l"},
        {"next_page", "Shift+j"},
        {"prev_page", "Shift+k"},
        {"first_page", "g,g"},
        {"last_page", "Shift+g"},
        {"goto_page", "Ctrl+g"},
        {"toggle_menubar", "Ctrl+Shift+m"},
        {"toggle_page_panel", "p"},
        {"toggle_page_image", "i"},
        {"fullscreen", "F11"},
        {"about", "F1"},
    };

    for (const auto &binding : defaults)
    {
        setupKeybinding(QString::fromLatin1(binding.action),
                        QString::fromLatin1(binding.key));
    }
}

// Helper function to construct `QShortcut` Qt shortcut
// from the config file
void
chonker::setupKeybinding(const QString &action, const QString &key) noexcept
{
    auto it = m_actionMap.find(action);
    if (it != m_actionMap.end())
    {
        QShortcut *shortcut = new QShortcut(QKeySequence(key), this);
        connect(shortcut, &QShortcut::activated, [it]() { it.value()({}); });
    }
    else
    {
        qWarning() << "Unknown action in keybindings:" << action;
    }

#ifndef NDEBUG
    qDebug() << "Keybinding set:" << action << "->" << key;
#endif

    m_config.shortcuts[action] = key;
}

// Initialize the GUI related Stuff
void
chonker::initGui() noexcept
{
    QWidget *widget = new QWidget();
    m_layout        = new QVBoxLayout();
    m_layout->setContentsMargins(0, 0, 0, 0);
    m_layout->setSpacing(0);

    m_canvas_view = new CanvasView(m_config, this);
    m_canvas_view->setEditMode(m_config.behavior.edit_mode);
    m_canvas_view->canvas().setZoom(m_config.zoom.level);

    m_page_label = new QLabel();
    m_page_label->setAlignment(Qt::AlignHCenter | Qt::AlignTop);

    m_page_panel = new QScrollArea(this);
    m_page_panel->setWidget(m_page_label);
    m_page_panel->setWidgetResizable(true);
    m_page_panel->setFrameShape(QFrame::NoFrame);
    m_page_panel->setVisible(m_config.window.page_panel);

    m_splitter = new QSplitter(Qt::Horizontal, this);
    m_splitter->addWidget(m_page_panel);
    m_splitter->addWidget(m_canvas_view);
    m_splitter->setStretchFactor(0, 1);
    m_splitter->setStretchFactor(1, 1);
    m_splitter->setFrameShape(QFrame::NoFrame);
    m_splitter->setFrameShadow(QFrame::Plain);
    m_splitter->setHandleWidth(1);
    m_splitter->setContentsMargins(0, 0, 0, 0);
    m_splitter->setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Expanding);

    m_statusbar = new Statusbar(m_config, this);
    m_statusbar->setVisible(m_config.statusbar.visible);

    m_search_bar = new SearchBar(this);
    m_search_bar->setVisible(false);

    m_message_bar = new MessageBar(m_config.colors, this);

    m_layout->addWidget(m_splitter, 1);
    m_layout->addWidget(m_search_bar);
    m_layout->addWidget(m_message_bar);
    m_layout->addWidget(m_statusbar);

    widget->setLayout(m_layout);
    this->setCentralWidget(widget);

    m_menuBar = this->menuBar();
    m_menuBar->setVisible(m_config.window.menubar);

    m_extraction_timer = new QTimer(this);
    m_extraction_timer->setInterval(
        std::max(1, m_config.extraction.poll_interval_ms));

    m_canvas_view->setFocus();
}

// Initialize the menubar related stuff
void
chonker::initMenubar() noexcept
{
    // --- File Menu ---
    QMenu *fileMenu = m_menuBar->addMenu("&File");

    fileMenu->addAction(
        QString("Open PDF\t%1").arg(m_config.shortcuts["open_file"]), this,
        [&]() { OpenFile(); });

    fileMenu->addAction(
        QString("Open Extraction JSON\t%1").arg(m_config.shortcuts["open_json"]),
        this, [&]() { OpenJson(); });

    m_actionExtract = fileMenu->addAction(
        QString("Extract Items\t%1").arg(m_config.shortcuts["extract"]), this,
        &chonker::Extract);

    m_actionCloseFile = fileMenu->addAction(
        QString("Close File\t%1").arg(m_config.shortcuts["close_file"]), this,
        &chonker::CloseFile);

    fileMenu->addSeparator();
    fileMenu->addAction("Quit", this, &QMainWindow::close);

    // --- Edit Menu ---
    QMenu *editMenu = m_menuBar->addMenu("&Edit");

    m_actionEditMode = editMenu->addAction(
        QString("Edit Mode\t%1").arg(m_config.shortcuts["edit_mode"]), this,
        &chonker::ToggleEditMode);
    m_actionEditMode->setCheckable(true);
    m_actionEditMode->setChecked(m_config.behavior.edit_mode);

    m_actionResetOverrides = editMenu->addAction(
        QString("Reset Edits\t%1").arg(m_config.shortcuts["reset_overrides"]),
        this, &chonker::ResetOverrides);

    m_actionSearch = editMenu->addAction(
        QString("Search\t%1").arg(m_config.shortcuts["search"]), this,
        &chonker::Search);

    // --- View Menu ---
    QMenu *viewMenu    = m_menuBar->addMenu("&View");
    m_actionFullscreen = viewMenu->addAction(
        QString("Fullscreen\t%1").arg(m_config.shortcuts["fullscreen"]), this,
        &chonker::ToggleFullscreen);
    m_actionFullscreen->setCheckable(true);
    m_actionFullscreen->setChecked(m_config.window.fullscreen);

    m_actionZoomIn = viewMenu->addAction(
        QString("Zoom In\t%1").arg(m_config.shortcuts["zoom_in"]), this,
        &chonker::ZoomIn);
    m_actionZoomOut = viewMenu->addAction(
        QString("Zoom Out\t%1").arg(m_config.shortcuts["zoom_out"]), this,
        &chonker::ZoomOut);
    m_actionZoomReset = viewMenu->addAction(
        QString("Reset View\t%1").arg(m_config.shortcuts["zoom_reset"]), this,
        &chonker::ZoomReset);

    viewMenu->addSeparator();

    m_actionTogglePagePanel = viewMenu->addAction(
        QString("Page Panel\t%1").arg(m_config.shortcuts["toggle_page_panel"]),
        this, &chonker::TogglePagePanel);
    m_actionTogglePagePanel->setCheckable(true);
    m_actionTogglePagePanel->setChecked(m_config.window.page_panel);

    m_actionTogglePageImage = viewMenu->addAction(
        QString("Page Underlay\t%1").arg(m_config.shortcuts["toggle_page_image"]),
        this, &chonker::TogglePageImage);
    m_actionTogglePageImage->setCheckable(true);
    m_actionTogglePageImage->setChecked(m_config.rendering.page_image);

    m_actionToggleMenubar = viewMenu->addAction(
        QString("Menubar\t%1").arg(m_config.shortcuts["toggle_menubar"]), this,
        &chonker::ToggleMenubar);
    m_actionToggleMenubar->setCheckable(true);
    m_actionToggleMenubar->setChecked(m_config.window.menubar);

    m_actionTogglePanel = viewMenu->addAction(
        QString("Statusbar\t%1").arg(m_config.shortcuts["toggle_panel"]), this,
        &chonker::TogglePanel);
    m_actionTogglePanel->setCheckable(true);
    m_actionTogglePanel->setChecked(m_config.statusbar.visible);

    // --- Navigation Menu ---
    m_navMenu         = m_menuBar->addMenu("&Navigation");
    m_actionGotoPage  = m_navMenu->addAction(
        QString("Goto Page\t%1").arg(m_config.shortcuts["goto_page"]), this,
        &chonker::GotoPage);
    m_actionFirstPage = m_navMenu->addAction(
        QString("First Page\t%1").arg(m_config.shortcuts["first_page"]), this,
        &chonker::FirstPage);
    m_actionPrevPage = m_navMenu->addAction(
        QString("Previous Page\t%1").arg(m_config.shortcuts["prev_page"]),
        this, &chonker::PrevPage);
    m_actionNextPage = m_navMenu->addAction(
        QString("Next Page\t%1").arg(m_config.shortcuts["next_page"]), this,
        &chonker::NextPage);
    m_actionLastPage = m_navMenu->addAction(
        QString("Last Page\t%1").arg(m_config.shortcuts["last_page"]), this,
        &chonker::LastPage);

    // --- Help Menu ---
    QMenu *helpMenu = m_menuBar->addMenu("&Help");
    helpMenu->addAction(QString("About\t%1").arg(m_config.shortcuts["about"]),
                        this, &chonker::ShowAbout);
}

void
chonker::initConnections() noexcept
{
    connect(m_canvas_view, &CanvasView::viewChanged, this,
            &chonker::updatePanel);

    connect(m_canvas_view, &CanvasView::itemCopied, this,
            [this](const QString &text)
    {
#ifndef NDEBUG
        qDebug() << "Copied item text:" << text;
#endif
        Q_UNUSED(text);
    });

    connect(m_canvas_view, &CanvasView::editRequested, this,
            &chonker::editItem);

    connect(m_statusbar, &Statusbar::modeChangeRequested, this,
            &chonker::ToggleEditMode);

    connect(m_statusbar, &Statusbar::gotoPageRequested, this,
            &chonker::GotoPage);

    connect(m_search_bar, &SearchBar::searchRequested, this,
            [this](const QString &term)
    {
        m_canvas_view->setSearchQuery(term);
        const DocumentCanvas::Snapshot snap
            = m_canvas_view->canvas().snapshot();
        m_search_bar->setSearchCount(snap.match_count, snap.item_count);
    });

    connect(m_search_bar, &SearchBar::closed, this, [this]()
    {
        m_canvas_view->setSearchQuery(QString());
        m_canvas_view->setFocus();
    });

    connect(m_extraction_timer, &QTimer::timeout, this,
            &chonker::pollExtraction);
}

// Enables or disables actions depending on what is loaded
void
chonker::updateUiEnabledState() noexcept
{
    const bool hasPdf   = m_renderer.isOpen();
    const bool hasPages = m_page_count > 0;

    m_actionExtract->setEnabled(hasPdf && !m_extraction.busy());
    m_actionCloseFile->setEnabled(hasPdf || !m_document.isEmpty());
    m_actionGotoPage->setEnabled(hasPages);
    m_actionFirstPage->setEnabled(hasPages);
    m_actionPrevPage->setEnabled(hasPages && m_page_index > 0);
    m_actionNextPage->setEnabled(hasPages && m_page_index < m_page_count - 1);
    m_actionLastPage->setEnabled(hasPages);
}

// Pushes the canvas state into the statusbar
void
chonker::updatePanel() noexcept
{
    const DocumentCanvas::Snapshot snap = m_canvas_view->canvas().snapshot();

    m_statusbar->setZoom(snap.zoom);
    m_statusbar->setItemInfo(snap.item_count, snap.match_count);
    m_statusbar->setEditMode(snap.edit_mode);
    m_statusbar->setBusy(m_extraction.busy());

    if (m_page_count > 0)
    {
        m_statusbar->setPageNo(m_page_index + 1);
        m_statusbar->setTotalPageCount(m_page_count);
        m_statusbar->hidePageInfo(false);
    }
    else
    {
        m_statusbar->hidePageInfo(true);
    }
}

void
chonker::updateWindowTitle() noexcept
{
    if (m_source_path.isEmpty())
    {
        setWindowTitle("chonker");
        return;
    }

    setWindowTitle(
        m_config.window.title_format.arg(QFileInfo(m_source_path).fileName()));
}

// Switches the source file. Overrides belong to one source only.
void
chonker::setSource(const QString &path) noexcept
{
    const QString absPath = path.isEmpty() ? path : QFileInfo(path).absoluteFilePath();
    if (absPath == m_source_path)
        return;

    if (!m_source_path.isEmpty()
        && m_config.behavior.clear_overrides_on_new_source)
        m_canvas_view->clearOverrides();

    m_source_path = absPath;
    m_statusbar->setFileName(m_source_path);
    updateWindowTitle();
}

bool
chonker::OpenFile(const QString &filename) noexcept
{
    QString path = filename;
    if (path.isEmpty())
    {
        path = QFileDialog::getOpenFileName(
            this, "Open File", QString(),
            "PDF Files (*.pdf);;Extraction JSON (*.json);;All Files (*)");
        if (path.isEmpty())
            return false;
    }

    if (isJsonFile(path))
        return OpenJson(path);

    if (!m_renderer.open(path))
    {
        m_message_bar->showMessage(
            QString("Could not open %1").arg(QFileInfo(path).fileName()), 3.0f,
            MessageBar::Level::Error);
        return false;
    }

    setSource(path);

    // Items of the previous source do not describe this one
    m_document   = QJsonObject();
    m_json_path  = QString();
    m_page_count = m_renderer.pageCount();
    m_statusbar->setJsonSource(QString());

    int start = 0;
    if (m_config.behavior.startpage_override > 0)
        start = m_config.behavior.startpage_override - 1;
    gotoPage(start);

    if (m_config.extraction.auto_extract)
        Extract();

    return true;
}

bool
chonker::OpenJson(const QString &filename) noexcept
{
    QString path = filename;
    if (path.isEmpty())
    {
        path = QFileDialog::getOpenFileName(this, "Open Extraction JSON",
                                            QString(),
                                            "Extraction JSON (*.json)");
        if (path.isEmpty())
            return false;
    }

    ExtractionResult result = ExtractionService::loadJsonFile(path);
    const bool ok           = result.success;
    applyExtractionResult(std::move(result));
    return ok;
}

void
chonker::Extract() noexcept
{
    if (!m_renderer.isOpen())
    {
        m_message_bar->showMessage("Open a PDF before extracting");
        return;
    }

    if (!m_extraction.request(m_renderer.filePath()))
    {
        m_message_bar->showMessage("Extraction already running");
        return;
    }

    m_extraction_timer->start();
    m_statusbar->setBusy(true);
    updateUiEnabledState();
}

// One non blocking look into the mailbox per tick
void
chonker::pollExtraction() noexcept
{
    std::optional<ExtractionResult> result = m_extraction.poll();
    if (!result)
        return;

    m_extraction_timer->stop();
    m_statusbar->setBusy(false);

    // The PDF may have been switched or closed while the worker ran
    const QString current = m_renderer.isOpen() ? m_renderer.filePath() : QString();
    if (!ExtractionService::isResultFor(*result, current))
    {
        qWarning() << "Discarding extraction result for" << result->source_path;
        m_message_bar->showMessage(
            QString("Discarded extraction of %1")
                .arg(QFileInfo(result->source_path).fileName()));
        updateUiEnabledState();
        return;
    }

    applyExtractionResult(std::move(*result));
    updateUiEnabledState();
}

// Failed results only produce a message, the current items stay
void
chonker::applyExtractionResult(ExtractionResult result) noexcept
{
    if (!result.success)
    {
        qWarning() << result.message;
        m_message_bar->showMessage(result.message, 5.0f,
                                   MessageBar::Level::Error);
        return;
    }

    m_message_bar->showMessage(result.message);

    if (!m_renderer.isOpen())
        setSource(result.source_path);

    m_document   = std::move(result.document);
    m_json_path  = result.json_path;
    m_statusbar->setJsonSource(m_json_path);
    m_page_count = std::max(ItemModel::pageCount(m_document),
                            m_renderer.isOpen() ? m_renderer.pageCount() : 0);

    int start = m_page_index;
    if (m_config.behavior.startpage_override > 0)
        start = m_config.behavior.startpage_override - 1;
    gotoPage(start);
}

void
chonker::CloseFile() noexcept
{
    m_renderer.close();
    m_document   = QJsonObject();
    m_json_path  = QString();
    m_page_count = 0;
    m_page_index = 0;

    m_canvas_view->clearOverrides();
    m_canvas_view->setModel(std::make_shared<const ItemModel>());
    m_canvas_view->setPageImage(QImage());
    m_page_label->clear();
    m_message_bar->clear();

    m_source_path.clear();
    m_statusbar->setFileName(QString());
    m_statusbar->setJsonSource(QString());
    updateWindowTitle();
    updateUiEnabledState();
    updatePanel();
}

// Builds the item model and the page image for `pageIndex` (0-based)
void
chonker::gotoPage(int pageIndex) noexcept
{
    if (m_page_count <= 0)
        return;

    m_page_index = std::clamp(pageIndex, 0, m_page_count - 1);

    std::shared_ptr<const ItemModel> model;
    if (!m_document.isEmpty())
    {
        model = std::make_shared<const ItemModel>(
            ItemModel::fromJson(m_document, m_page_index,
                                m_config.canvas.origin));
    }
    else
    {
        ItemModel::PageInfo page;
        const QSizeF size = m_renderer.pageSize(m_page_index);
        if (size.isValid())
            page.size = size;
        model = std::make_shared<const ItemModel>(std::vector<DocumentItem>{},
                                                  page, m_page_index);
    }

#ifndef NDEBUG
    qDebug() << "Showing page" << m_page_index + 1 << "with" << model->count()
             << "items";
#endif

    m_canvas_view->setModel(std::move(model));
    if (!m_search_bar->text().isEmpty())
    {
        const DocumentCanvas::Snapshot snap = m_canvas_view->canvas().snapshot();
        m_search_bar->setSearchCount(snap.match_count, snap.item_count);
    }

    renderPageImage();
    updateUiEnabledState();
    updatePanel();
}

void
chonker::renderPageImage() noexcept
{
    if (!m_renderer.isOpen() || m_page_index >= m_renderer.pageCount())
    {
        m_canvas_view->setPageImage(QImage());
        m_page_label->clear();
        return;
    }

    const QSizeF points = m_renderer.pageSize(m_page_index);
    if (!points.isValid())
        return;

    const qreal scale  = m_config.rendering.dpi / 72.0 * devicePixelRatioF();
    const QSize target = (points * scale).toSize();
    const QImage image = m_renderer.renderPage(m_page_index, target);

    m_canvas_view->setPageImage(image);

    if (image.isNull())
    {
        m_page_label->clear();
        return;
    }

    const int width = std::max(100, m_page_panel->viewport()->width());
    m_page_label->setPixmap(QPixmap::fromImage(
        image.scaledToWidth(width, Qt::SmoothTransformation)));
}

void
chonker::editItem(const QString &id) noexcept
{
    const ItemModel *model = m_canvas_view->canvas().model();
    if (!model)
        return;

    const DocumentItem *item = model->item(id);
    if (!item)
        return;

    bool ok;
    const QString text = QInputDialog::getMultiLineText(
        this, "Edit Item", "Text:",
        m_canvas_view->canvas().effectiveText(*item), &ok);

    if (ok)
        m_canvas_view->setItemOverrideText(id, text);
}

void
chonker::Search() noexcept
{
    m_search_bar->setVisible(true);
    m_search_bar->focusSearchInput();
}

void
chonker::ToggleEditMode() noexcept
{
    const bool state = !m_canvas_view->canvas().editMode();
    m_canvas_view->setEditMode(state);
    m_actionEditMode->setChecked(state);
    m_message_bar->showMessage(state ? "Edit mode" : "View mode", 1.0f);
}

void
chonker::ResetOverrides() noexcept
{
    m_canvas_view->clearOverrides();
    m_message_bar->showMessage("Edits reset", 1.0f);
}

// Toggles the menubar
void
chonker::ToggleMenubar() noexcept
{
    bool shown = !m_menuBar->isHidden();
    m_menuBar->setHidden(shown);
    m_actionToggleMenubar->setChecked(!shown);
}

// Toggles the panel
void
chonker::TogglePanel() noexcept
{
    bool shown = !m_statusbar->isHidden();
    m_statusbar->setHidden(shown);
    m_actionTogglePanel->setChecked(!shown);
}

void
chonker::TogglePagePanel() noexcept
{
    bool shown = !m_page_panel->isHidden();
    m_page_panel->setHidden(shown);
    m_actionTogglePagePanel->setChecked(!shown);
    if (!shown)
        renderPageImage();
}

void
chonker::TogglePageImage() noexcept
{
    m_config.rendering.page_image = !m_config.rendering.page_image;
    m_actionTogglePageImage->setChecked(m_config.rendering.page_image);
    m_canvas_view->update();
}

// Toggles the fullscreen mode
void
chonker::ToggleFullscreen() noexcept
{
    bool isFullscreen = this->isFullScreen();
    if (isFullscreen)
        this->showNormal();
    else
        this->showFullScreen();
    m_actionFullscreen->setChecked(!isFullscreen);
}

void
chonker::ZoomIn() noexcept
{
    m_canvas_view->ZoomIn();
}

void
chonker::ZoomOut() noexcept
{
    m_canvas_view->ZoomOut();
}

void
chonker::ZoomReset() noexcept
{
    m_canvas_view->ZoomReset();
}

void
chonker::ScrollLeft() noexcept
{
    m_canvas_view->Pan({m_config.zoom.pan_step, 0});
}

void
chonker::ScrollRight() noexcept
{
    m_canvas_view->Pan({-m_config.zoom.pan_step, 0});
}

void
chonker::ScrollUp() noexcept
{
    m_canvas_view->Pan({0, m_config.zoom.pan_step});
}

void
chonker::ScrollDown() noexcept
{
    m_canvas_view->Pan({0, -m_config.zoom.pan_step});
}

void
chonker::FirstPage() noexcept
{
    gotoPage(0);
}

void
chonker::PrevPage() noexcept
{
    gotoPage(m_page_index - 1);
}

void
chonker::NextPage() noexcept
{
    gotoPage(m_page_index + 1);
}

void
chonker::LastPage() noexcept
{
    gotoPage(m_page_count - 1);
}

void
chonker::GotoPage() noexcept
{
    if (m_page_count <= 0)
        return;

    bool ok;
    int pageno = QInputDialog::getInt(
        this, "Goto Page", QString("Enter page number (1 - %1)").arg(m_page_count),
        m_page_index + 1, 1, m_page_count, 1, &ok);

    if (ok)
        gotoPage(pageno - 1);
}

// Shows the about page
void
chonker::ShowAbout() noexcept
{
    AboutDialog *abw = new AboutDialog(this);
    abw->setAttribute(Qt::WA_DeleteOnClose);
    abw->show();
}

// Reads the arguments passed with `chonker` from the
// commandline
void
chonker::ReadArgsParser(argparse::ArgumentParser &argparser) noexcept
{
    if (argparser.is_used("--config"))
    {
        m_config_file_path
            = QString::fromStdString(argparser.get<std::string>("--config"));
    }

    this->construct();

    if (argparser.is_used("--about"))
        ShowAbout();

    if (argparser.is_used("--page"))
        m_config.behavior.startpage_override = argparser.get<int>("--page");

    if (argparser.is_used("files"))
    {
        for (const std::string &file :
             argparser.get<std::vector<std::string>>("files"))
            OpenFile(QString::fromStdString(file));
    }

    if (argparser.is_used("--json"))
        OpenJson(QString::fromStdString(argparser.get<std::string>("--json")));

    if (argparser.get<bool>("--extract") && !m_extraction.busy())
        Extract();

    m_config.behavior.startpage_override = -1;
}
