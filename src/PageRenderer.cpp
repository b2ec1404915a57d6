#include "PageRenderer.hpp"

#include <QDebug>
#include <algorithm>
#include <array>

static std::array<std::mutex, FZ_LOCK_MAX> mupdf_mutexes;

// This is called by Qt when the last copy of the QImage is destroyed
static void
imageCleanupHandler(void *info) noexcept
{
    auto *payload = static_cast<PageRenderer::RenderPayload *>(info);
    if (payload)
    {
        // Drop the pixmap first, then the context
        fz_drop_pixmap(payload->ctx, payload->pix);
        fz_drop_context(payload->ctx);
        delete payload;
    }
}

static void
mupdf_lock_mutex(void *user, int lock)
{
    auto *m = static_cast<std::mutex *>(user);
    m[lock].lock();
}

static void
mupdf_unlock_mutex(void *user, int lock)
{
    auto *m = static_cast<std::mutex *>(user);
    m[lock].unlock();
}

PageRenderer::PageRenderer() noexcept
{
    initMuPDF();
}

PageRenderer::~PageRenderer() noexcept
{
    close();
    fz_drop_context(m_ctx);
}

void
PageRenderer::initMuPDF() noexcept
{
    m_fz_locks.user   = mupdf_mutexes.data();
    m_fz_locks.lock   = mupdf_lock_mutex;
    m_fz_locks.unlock = mupdf_unlock_mutex;
    m_ctx             = fz_new_context(nullptr, &m_fz_locks, FZ_STORE_DEFAULT);
    if (!m_ctx)
    {
        qWarning() << "PageRenderer: cannot create MuPDF context";
        return;
    }

    fz_register_document_handlers(m_ctx);
}

bool
PageRenderer::open(const QString &filePath) noexcept
{
    std::lock_guard<std::mutex> lock(m_doc_mutex);

    if (!m_ctx)
        return false;

    if (m_doc)
    {
        fz_drop_document(m_ctx, m_doc);
        m_doc = nullptr;
    }
    m_page_count = 0;
    m_filepath.clear();

    bool ok = false;
    fz_try(m_ctx)
    {
        m_doc = fz_open_document(m_ctx, CSTR(filePath));
        if (!m_doc)
            fz_throw(m_ctx, FZ_ERROR_GENERIC, "Failed to open document");

        m_page_count = fz_count_pages(m_ctx, m_doc);
        ok           = true;
    }
    fz_catch(m_ctx)
    {
        qWarning() << "PageRenderer: cannot open" << filePath << ":"
                   << fz_caught_message(m_ctx);
        ok = false;
    }

    if (ok)
        m_filepath = filePath;

    return ok;
}

void
PageRenderer::close() noexcept
{
    std::lock_guard<std::mutex> lock(m_doc_mutex);

    if (m_ctx && m_doc)
        fz_drop_document(m_ctx, m_doc);

    m_doc        = nullptr;
    m_page_count = 0;
    m_filepath.clear();
}

QSizeF
PageRenderer::pageSize(int pageIndex) noexcept
{
    std::lock_guard<std::mutex> lock(m_doc_mutex);

    if (!m_doc || pageIndex < 0 || pageIndex >= m_page_count)
        return {};

    QSizeF size;
    fz_page *page{nullptr};

    fz_try(m_ctx)
    {
        page          = fz_load_page(m_ctx, m_doc, pageIndex);
        fz_rect bound = fz_bound_page(m_ctx, page);
        size          = QSizeF(bound.x1 - bound.x0, bound.y1 - bound.y0);
    }
    fz_always(m_ctx)
    {
        fz_drop_page(m_ctx, page);
    }
    fz_catch(m_ctx)
    {
        qWarning() << "PageRenderer: cannot measure page" << pageIndex << ":"
                   << fz_caught_message(m_ctx);
        size = QSizeF();
    }

    return size;
}

QImage
PageRenderer::renderPage(int pageIndex, const QSize &targetSize) noexcept
{
    std::lock_guard<std::mutex> lock(m_doc_mutex);

    if (!m_doc || pageIndex < 0 || pageIndex >= m_page_count
        || targetSize.isEmpty())
        return {};

    // The image keeps its own context alive, see imageCleanupHandler
    fz_context *ctx = cloneContext();
    if (!ctx)
    {
        qWarning() << "PageRenderer: failed to clone context";
        return {};
    }

    fz_page *page{nullptr};
    fz_pixmap *pix{nullptr};
    bool ok = false;

    fz_try(ctx)
    {
        page                = fz_load_page(ctx, m_doc, pageIndex);
        const fz_rect bound = fz_bound_page(ctx, page);
        const float w       = bound.x1 - bound.x0;
        const float h       = bound.y1 - bound.y0;
        if (w <= 0 || h <= 0)
            fz_throw(ctx, FZ_ERROR_GENERIC, "Empty page bounds");

        const float scale = std::min(targetSize.width() / w,
                                     targetSize.height() / h);
        pix = fz_new_pixmap_from_page(ctx, page, fz_scale(scale, scale),
                                      fz_device_rgb(ctx), 0);
        ok  = true;
    }
    fz_always(ctx)
    {
        fz_drop_page(ctx, page);
    }
    fz_catch(ctx)
    {
        qWarning() << "PageRenderer: cannot render page" << pageIndex << ":"
                   << fz_caught_message(ctx);
        ok = false;
    }

    if (!ok || !pix)
    {
        fz_drop_pixmap(ctx, pix);
        fz_drop_context(ctx);
        return {};
    }

    const int width        = fz_pixmap_width(ctx, pix);
    const int height       = fz_pixmap_height(ctx, pix);
    const int n            = fz_pixmap_components(ctx, pix);
    const int stride       = fz_pixmap_stride(ctx, pix);
    unsigned char *samples = fz_pixmap_samples(ctx, pix);

    QImage::Format fmt;
    switch (n)
    {
        case 1:
            fmt = QImage::Format_Grayscale8;
            break;
        case 3:
            fmt = QImage::Format_RGB888;
            break;
        case 4:
            fmt = QImage::Format_RGBA8888;
            break;

        default:
            fmt = QImage::Format_Invalid;
            break;
    }

    if (!samples || fmt == QImage::Format_Invalid)
    {
        qWarning() << "Unsupported pixmap component count:" << n;
        fz_drop_pixmap(ctx, pix);
        fz_drop_context(ctx);
        return {};
    }

    RenderPayload *payload = new RenderPayload{ctx, pix};
    return QImage(samples, width, height, stride, fmt, imageCleanupHandler,
                  payload);
}
