#include "ExtractionService.hpp"

#include "ItemModel.hpp"

#include <QDebug>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QProcess>
#include <QtConcurrent/QtConcurrent>

namespace
{

// Extractors may log to stdout before the result, the result object is
// then the last line.
std::optional<QJsonObject>
findResultObject(const QByteArray &out)
{
    QJsonParseError error;
    const QJsonDocument whole = QJsonDocument::fromJson(out.trimmed(), &error);
    if (error.error == QJsonParseError::NoError && whole.isObject())
        return whole.object();

    const QList<QByteArray> lines = out.trimmed().split('\n');
    for (auto it = lines.crbegin(); it != lines.crend(); ++it)
    {
        const QByteArray line = it->trimmed();
        if (line.isEmpty())
            continue;

        const QJsonDocument doc = QJsonDocument::fromJson(line, &error);
        if (error.error == QJsonParseError::NoError && doc.isObject())
            return doc.object();
        break;
    }

    return std::nullopt;
}

} // namespace

void
ExtractionMailbox::post(ExtractionResult result) noexcept
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_slot = std::move(result);
}

std::optional<ExtractionResult>
ExtractionMailbox::take() noexcept
{
    std::unique_lock<std::mutex> lock(m_mutex, std::try_to_lock);
    if (!lock.owns_lock() || !m_slot)
        return std::nullopt;

    std::optional<ExtractionResult> result = std::move(m_slot);
    m_slot.reset();
    return result;
}

ExtractionService::ExtractionService(const Config::extraction &config) noexcept
    : m_config(config)
{
}

ExtractionService::~ExtractionService() noexcept
{
    // The worker posts into m_mailbox, it must not outlive us
    m_future.waitForFinished();
}

bool
ExtractionService::request(const QString &pdfPath) noexcept
{
    if (m_busy)
    {
        qWarning() << "ExtractionService: extraction already running, ignoring"
                   << pdfPath;
        return false;
    }

    m_busy                          = true;
    const Config::extraction config = m_config;
    const QString absolutePath      = QFileInfo(pdfPath).absoluteFilePath();

#ifndef NDEBUG
    qDebug() << "ExtractionService: extracting" << absolutePath << "with"
             << config.command << config.args;
#endif

    m_future = QtConcurrent::run([this, config, absolutePath]()
    { m_mailbox.post(runExtraction(config, absolutePath)); });

    return true;
}

std::optional<ExtractionResult>
ExtractionService::poll() noexcept
{
    std::optional<ExtractionResult> result = m_mailbox.take();
    if (result)
        m_busy = false;
    return result;
}

ExtractionResult
ExtractionService::parseExtractorOutput(const QByteArray &out,
                                        const QByteArray &err,
                                        bool exitedCleanly) noexcept
{
    ExtractionResult result;
    const std::optional<QJsonObject> obj = findResultObject(out);

    if (!obj)
    {
        result.message
            = exitedCleanly
                  ? QStringLiteral("Extraction failed: unreadable extractor output")
                  : QStringLiteral("Extraction failed: %1 | %2")
                        .arg(QString::fromUtf8(err.trimmed()),
                             QString::fromUtf8(out.trimmed()));
        return result;
    }

    if (!obj->value("success").toBool(false))
    {
        const QString error = obj->value("error").toString("Unknown error");
        result.message      = QStringLiteral("Extraction failed: %1").arg(error);
        return result;
    }

    result.json_path = obj->value("json_path").toString();
    result.items     = obj->value("items").toInt(0);
    result.pages     = obj->value("pages").toInt(0);

    if (result.json_path.isEmpty())
    {
        result.message = QStringLiteral("Extraction failed: no json_path in output");
        return result;
    }

    result.success = true;
    result.message = QStringLiteral("Extracted %1 items from %2 pages")
                         .arg(result.items)
                         .arg(result.pages);
    return result;
}

ExtractionResult
ExtractionService::loadJsonFile(const QString &jsonPath,
                                const QString &sourcePath) noexcept
{
    ExtractionResult result;
    result.json_path   = jsonPath;
    result.source_path = sourcePath.isEmpty() ? jsonPath : sourcePath;

    QString error;
    std::optional<QJsonObject> doc = ItemModel::readJsonFile(jsonPath, &error);
    if (!doc)
    {
        result.message = error;
        return result;
    }

    result.document = std::move(*doc);
    result.items    = result.document.value("items").toArray().size();
    result.pages    = ItemModel::pageCount(result.document);
    result.success  = true;
    result.message  = QStringLiteral("Loaded %1 items from %2 pages")
                         .arg(result.items)
                         .arg(result.pages);
    return result;
}

ExtractionResult
ExtractionService::runExtraction(const Config::extraction &config,
                                 const QString &pdfPath) noexcept
{
    ExtractionResult result;
    result.source_path = pdfPath;

    if (config.command.isEmpty())
    {
        result.message = QStringLiteral("Extraction failed: no extractor command configured");
        return result;
    }

    QProcess process;
    process.start(config.command, QStringList(config.args) << pdfPath);

    if (!process.waitForStarted())
    {
        result.message = QStringLiteral("Extraction failed: cannot start %1: %2")
                             .arg(config.command, process.errorString());
        return result;
    }

    const int timeout = config.timeout_ms > 0 ? config.timeout_ms : -1;
    if (!process.waitForFinished(timeout))
    {
        process.kill();
        process.waitForFinished();
        result.message = QStringLiteral("Extraction failed: %1 timed out")
                             .arg(config.command);
        return result;
    }

    const bool clean = process.exitStatus() == QProcess::NormalExit
                       && process.exitCode() == 0;
    ExtractionResult parsed = parseExtractorOutput(
        process.readAllStandardOutput(), process.readAllStandardError(), clean);
    parsed.source_path = pdfPath;

    if (!parsed.success)
        return parsed;

    ExtractionResult loaded = loadJsonFile(parsed.json_path, pdfPath);
    if (!loaded.success)
        return loaded;

    loaded.message = parsed.message;
    return loaded;
}

bool
ExtractionService::isResultFor(const ExtractionResult &result,
                               const QString &pdfPath) noexcept
{
    if (result.source_path.isEmpty() || pdfPath.isEmpty())
        return false;

    return QFileInfo(result.source_path).absoluteFilePath()
           == QFileInfo(pdfPath).absoluteFilePath();
}
