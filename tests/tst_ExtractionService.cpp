#include "ExtractionService.hpp"

#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QTemporaryDir>
#include <QTemporaryFile>
#include <QTest>

class ExtractionServiceTests : public QObject
{
    Q_OBJECT

private:
    static QByteArray extractionJson()
    {
        const QJsonObject bbox{
            {"left", 72}, {"top", 72}, {"width", 200}, {"height", 20}};
        const QJsonObject doc{
            {"items", QJsonArray{QJsonObject{{"page", 1},
                                             {"type", "TextItem"},
                                             {"content", "Hello World"},
                                             {"bbox", bbox}}}},
            {"pages", QJsonArray{QJsonObject{{"page_number", 1},
                                             {"width", 612},
                                             {"height", 792}}}},
        };
        return QJsonDocument(doc).toJson(QJsonDocument::Compact);
    }

private slots:
    void testMailboxTakeClears()
    {
        ExtractionMailbox mailbox;
        QVERIFY(!mailbox.take().has_value());

        ExtractionResult result;
        result.message = "first";
        mailbox.post(result);
        result.message = "second";
        mailbox.post(result);

        // Only the latest result is kept
        const std::optional<ExtractionResult> taken = mailbox.take();
        QVERIFY(taken.has_value());
        QCOMPARE(taken->message, QString("second"));
        QVERIFY(!mailbox.take().has_value());
    }

    void testParseSuccessAfterLogLines()
    {
        const QByteArray out
            = "loading model...\n"
              "page 1/3\n"
              "{\"success\": true, \"json_path\": \"/tmp/out.json\", "
              "\"items\": 42, \"pages\": 3}\n";

        const ExtractionResult result
            = ExtractionService::parseExtractorOutput(out, QByteArray(), true);
        QVERIFY(result.success);
        QCOMPARE(result.json_path, QString("/tmp/out.json"));
        QCOMPARE(result.items, 42);
        QCOMPARE(result.pages, 3);
        QCOMPARE(result.message, QString("Extracted 42 items from 3 pages"));
    }

    void testParseReportedFailure()
    {
        const ExtractionResult result = ExtractionService::parseExtractorOutput(
            "{\"success\": false, \"error\": \"boom\"}", QByteArray(), false);
        QVERIFY(!result.success);
        QCOMPARE(result.message, QString("Extraction failed: boom"));
    }

    void testParseGarbage()
    {
        const ExtractionResult clean = ExtractionService::parseExtractorOutput(
            "no json here", QByteArray(), true);
        QVERIFY(!clean.success);
        QVERIFY(clean.message.startsWith("Extraction failed"));

        const ExtractionResult crashed = ExtractionService::parseExtractorOutput(
            "partial", "Traceback", false);
        QVERIFY(!crashed.success);
        QVERIFY(crashed.message.contains("Traceback"));

        const ExtractionResult noPath = ExtractionService::parseExtractorOutput(
            "{\"success\": true}", QByteArray(), true);
        QVERIFY(!noPath.success);
    }

    void testLoadJsonFile()
    {
        QTemporaryFile file;
        QVERIFY(file.open());
        file.write(extractionJson());
        file.close();

        const ExtractionResult result
            = ExtractionService::loadJsonFile(file.fileName());
        QVERIFY(result.success);
        QCOMPARE(result.items, 1);
        QCOMPARE(result.pages, 1);
        QCOMPARE(result.source_path, file.fileName());
        QCOMPARE(result.message, QString("Loaded 1 items from 1 pages"));

        const ExtractionResult missing
            = ExtractionService::loadJsonFile("/nonexistent/out.json");
        QVERIFY(!missing.success);
        QVERIFY(!missing.message.isEmpty());
    }

    void testFailedRequestReleasesService()
    {
        Config::extraction config;
        config.command = "/nonexistent/chonker-extractor";
        config.args.clear();

        ExtractionService service(config);
        QVERIFY(service.request("doc.pdf"));
        QVERIFY(service.busy());
        QVERIFY(!service.request("other.pdf"));

        std::optional<ExtractionResult> result;
        QTRY_VERIFY_WITH_TIMEOUT((result = service.poll()).has_value(), 10000);

        QVERIFY(!result->success);
        QVERIFY(result->message.startsWith("Extraction failed"));
        QVERIFY(result->source_path.endsWith("doc.pdf"));
        QVERIFY(!service.busy());

        QVERIFY(service.request("doc.pdf"));
        QTRY_VERIFY_WITH_TIMEOUT(service.poll().has_value(), 10000);
    }

    void testSuccessfulRequestLoadsDocument()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());

        const QString jsonPath = dir.filePath("out.json");
        {
            QFile json(jsonPath);
            QVERIFY(json.open(QIODevice::WriteOnly));
            json.write(extractionJson());
        }

        // A shell stands in for the extractor; the PDF path arrives as $1
        Config::extraction config;
        config.command = "/bin/sh";
        config.args    = {"-c",
                          QString("echo \"analysing $1\"; "
                                  "echo '{\"success\": true, \"json_path\": "
                                  "\"%1\", \"items\": 1, \"pages\": 1}'")
                              .arg(jsonPath),
                          "extractor"};

        ExtractionService service(config);
        QVERIFY(service.request(dir.filePath("doc.pdf")));

        std::optional<ExtractionResult> result;
        QTRY_VERIFY_WITH_TIMEOUT((result = service.poll()).has_value(), 10000);

        QVERIFY(result->success);
        QCOMPARE(result->json_path, jsonPath);
        QCOMPARE(result->items, 1);
        QCOMPARE(result->message, QString("Extracted 1 items from 1 pages"));
        QVERIFY(result->document.contains("items"));
        QVERIFY(!service.busy());

        QVERIFY(ExtractionService::isResultFor(*result, dir.filePath("doc.pdf")));
        QVERIFY(!ExtractionService::isResultFor(*result, dir.filePath("other.pdf")));
    }

    void testResultMatchesOnlyItsSource()
    {
        ExtractionResult result;
        result.success     = true;
        result.source_path = QFileInfo("a.pdf").absoluteFilePath();

        // Relative and absolute spellings of the same file agree
        QVERIFY(ExtractionService::isResultFor(result, "a.pdf"));
        QVERIFY(ExtractionService::isResultFor(
            result, QFileInfo("a.pdf").absoluteFilePath()));

        // Another file was opened while the worker ran
        QVERIFY(!ExtractionService::isResultFor(result, "b.pdf"));

        // The file was closed
        QVERIFY(!ExtractionService::isResultFor(result, QString()));

        result.source_path.clear();
        QVERIFY(!ExtractionService::isResultFor(result, "a.pdf"));
    }
};

QTEST_GUILESS_MAIN(ExtractionServiceTests)
#include "tst_ExtractionService.moc"
