#pragma once

// Runs the external document analysis command off the GUI thread and hands
// the result back through a single slot mailbox polled once per frame.

#include "Config.hpp"

#include <QByteArray>
#include <QFuture>
#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <mutex>
#include <optional>

struct ExtractionResult
{
    bool success{false};
    QString source_path;
    QString json_path;
    QJsonObject document;
    int items{0};
    int pages{0};
    QString message;
};

class ExtractionMailbox
{
public:
    void post(ExtractionResult result) noexcept;

    // Non blocking take-and-clear. Returns nullopt when empty or when the
    // worker currently holds the slot.
    std::optional<ExtractionResult> take() noexcept;

private:
    std::mutex m_mutex;
    std::optional<ExtractionResult> m_slot;
};

class ExtractionService
{
public:
    explicit ExtractionService(const Config::extraction &config) noexcept;
    ~ExtractionService() noexcept;

    inline void setConfig(const Config::extraction &config) noexcept
    {
        m_config = config;
    }

    // Starts an extraction of `pdfPath`. Rejected (false) while another
    // request is outstanding.
    bool request(const QString &pdfPath) noexcept;

    // Called from the GUI tick; a delivered result ends the request
    std::optional<ExtractionResult> poll() noexcept;

    inline bool busy() const noexcept
    {
        return m_busy;
    }

    static ExtractionResult runExtraction(const Config::extraction &config,
                                          const QString &pdfPath) noexcept;
    static ExtractionResult parseExtractorOutput(const QByteArray &out,
                                                 const QByteArray &err,
                                                 bool exitedCleanly) noexcept;
    static ExtractionResult loadJsonFile(const QString &jsonPath,
                                         const QString &sourcePath
                                         = QString()) noexcept;

    // True when `result` was produced for the PDF at `pdfPath`
    static bool isResultFor(const ExtractionResult &result,
                            const QString &pdfPath) noexcept;

private:
    Config::extraction m_config;
    ExtractionMailbox m_mailbox;
    QFuture<void> m_future;
    bool m_busy{false};
};
