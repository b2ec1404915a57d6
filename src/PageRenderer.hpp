#pragma once

// Wrapper for MuPDF, rasterizes the page shown under the overlay

#include <QImage>
#include <QSize>
#include <QSizeF>
#include <QString>
#include <mutex>

extern "C"
{
#include <mupdf/fitz.h>
}

#define CSTR(x) x.toStdString().c_str()

class PageRenderer
{
public:
    PageRenderer() noexcept;
    ~PageRenderer() noexcept;

    PageRenderer(const PageRenderer &)            = delete;
    PageRenderer &operator=(const PageRenderer &) = delete;

    // structure to carry the "Life Support" for the image memory
    struct RenderPayload
    {
        fz_context *ctx;
        fz_pixmap *pix;
    };

    bool open(const QString &filePath) noexcept;
    void close() noexcept;

    inline bool isOpen() const noexcept
    {
        return m_doc != nullptr;
    }

    inline const QString &filePath() const noexcept
    {
        return m_filepath;
    }

    inline int pageCount() const noexcept
    {
        return m_page_count;
    }

    // Page size in points, invalid QSizeF for a bad index
    QSizeF pageSize(int pageIndex) noexcept;

    // Renders `pageIndex` scaled to fit inside `targetSize` (device pixels)
    QImage renderPage(int pageIndex, const QSize &targetSize) noexcept;

    static QString mupdfVersion() noexcept
    {
        return QString::fromLatin1(FZ_VERSION);
    }

private:
    void initMuPDF() noexcept;

    inline fz_context *cloneContext() const noexcept
    {
        return fz_clone_context(m_ctx);
    }

    fz_context *m_ctx{nullptr};
    fz_locks_context m_fz_locks{};
    fz_document *m_doc{nullptr};
    std::mutex m_doc_mutex;
    QString m_filepath;
    int m_page_count{0};
};
