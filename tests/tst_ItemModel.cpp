#include "ItemModel.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QTemporaryFile>
#include <QTest>

class ItemModelTests : public QObject
{
    Q_OBJECT

private:
    static QJsonObject item(int page, double left, double top, double width,
                            double height, const QString &content,
                            const QString &type = QString("TextItem"))
    {
        return QJsonObject{
            {"page", page},
            {"type", type},
            {"content", content},
            {"bbox", QJsonObject{{"left", left},
                                 {"top", top},
                                 {"width", width},
                                 {"height", height}}},
        };
    }

private slots:
    void testParseItem()
    {
        QJsonObject obj = item(1, 72, 72, 200, 20, "Hello World", "TitleItem");
        obj["attributes"] = QJsonObject{
            {"style", QJsonObject{{"font_size", 18}, {"bold", true}}}};

        const auto parsed = ItemModel::parseItem(obj, 0);
        QVERIFY(parsed.has_value());
        QCOMPARE(parsed->id, QString("item_0_72000_72000"));
        QCOMPARE(parsed->content, QString("Hello World"));
        QVERIFY(parsed->type == ItemType::Title);
        QCOMPARE(parsed->font_size, 18.0f);
        QVERIFY(parsed->bold);
        QVERIFY(!parsed->italic);
    }

    void testMalformedItemsDropped()
    {
        QJsonObject noBox{{"page", 1}, {"content", "orphan"}};
        QJsonObject badBox = item(1, 0, 0, 10, 10, "bad");
        badBox["bbox"]     = QJsonObject{{"left", "12"}, {"top", 0},
                                         {"width", 1}, {"height", 1}};

        const QJsonObject doc{
            {"items", QJsonArray{item(1, 10, 10, 50, 12, "kept"), noBox,
                                 badBox, item(1, 20, 20, 50, 12, "   "),
                                 item(2, 10, 10, 50, 12, "other page")}},
        };

        const ItemModel model = ItemModel::fromJson(doc, 0);
        QCOMPARE(model.count(), 1);
        QCOMPARE(model.items().front().content, QString("kept"));
    }

    void testNegativeExtentNormalized()
    {
        const auto parsed
            = ItemModel::parseItem(item(1, 10, 10, -40, -12, "flipped"), 0);
        QVERIFY(parsed.has_value());
        QCOMPARE(parsed->bbox.width, 40.0);
        QCOMPARE(parsed->bbox.height, 12.0);
    }

    void testTextFallbackAndDefaults()
    {
        QJsonObject obj = item(1, 10, 10, 40, 12, QString());
        obj.remove("content");
        obj["text"] = "from text";
        obj["type"] = "Unknown";

        const auto parsed = ItemModel::parseItem(obj, 3);
        QVERIFY(parsed.has_value());
        QCOMPARE(parsed->content, QString("from text"));
        QVERIFY(parsed->type == ItemType::Text);
        QCOMPARE(parsed->font_size, DEFAULT_FONT_SIZE);
        QVERIFY(parsed->id.startsWith("item_3_"));
    }

    void testDuplicateIdsDisambiguated()
    {
        const QJsonObject doc{
            {"items", QJsonArray{item(1, 10, 10, 50, 12, "one"),
                                 item(1, 10, 10, 50, 12, "two"),
                                 item(1, 10, 10, 50, 12, "three")}},
        };

        const ItemModel model = ItemModel::fromJson(doc, 0);
        QCOMPARE(model.count(), 3);

        const QString base = ItemModel::makeItemId(0, 10, 10);
        QCOMPARE(model.items()[0].id, base);
        QCOMPARE(model.items()[1].id, base + "#2");
        QCOMPARE(model.items()[2].id, base + "#3");
        QCOMPARE(model.indexOf(base + "#3"), 2);
        QCOMPARE(model.item(base + "#2")->content, QString("two"));
        QVERIFY(model.item("missing") == nullptr);
    }

    void testPageInfo()
    {
        const QJsonObject doc{
            {"items", QJsonArray{item(2, 10, 10, 50, 12, "second")}},
            {"pages",
             QJsonArray{QJsonObject{{"page_number", 1}, {"width", 595},
                                    {"height", 842}},
                        QJsonObject{{"page_number", 2},
                                    {"width", 612},
                                    {"height", 1008},
                                    {"columns", 2},
                                    {"column_boundaries",
                                     QJsonArray{0, 306}}}}},
        };

        const ItemModel first = ItemModel::fromJson(doc, 0);
        QCOMPARE(first.pageSize(), QSizeF(595, 842));
        QCOMPARE(first.count(), 0);

        const ItemModel second = ItemModel::fromJson(doc, 1);
        QCOMPARE(second.pageSize(), QSizeF(612, 1008));
        QCOMPARE(second.columnCount(), 2);
        QCOMPARE(second.columnBoundaries().size(), size_t(1));
        QCOMPARE(second.columnBoundaries().front(), 306.0);
        QCOMPARE(second.pageIndex(), 1);

        QCOMPARE(ItemModel::pageCount(doc), 2);
    }

    void testCoordOriginNormalized()
    {
        QJsonObject bottomLeft = item(1, 72, 720, 200, 20, "Flipped");
        QJsonObject bbox       = bottomLeft["bbox"].toObject();
        bbox["coord_origin"]   = "CoordOrigin.BOTTOMLEFT";
        bottomLeft["bbox"]     = bbox;

        QJsonObject topLeft  = item(1, 72, 300, 200, 20, "Tagged");
        bbox                 = topLeft["bbox"].toObject();
        bbox["coord_origin"] = "TOPLEFT";
        topLeft["bbox"]      = bbox;

        const QJsonObject doc{
            {"pages", QJsonArray{QJsonObject{
                          {"page_number", 1}, {"width", 612}, {"height", 792}}}},
            {"items", QJsonArray{bottomLeft, topLeft,
                                 item(1, 300, 500, 50, 12, "Untagged")}},
        };

        const ItemModel model = ItemModel::fromJson(doc, 0);
        QCOMPARE(model.count(), 3);

        const DocumentItem &flipped = model.items()[0];
        QCOMPARE(flipped.bbox.top, 72.0);
        QCOMPARE(flipped.bbox.left, 72.0);
        QCOMPARE(flipped.bbox.height, 20.0);
        QCOMPARE(flipped.id, QString("item_0_72000_72000"));
        QVERIFY(model.item("item_0_72000_72000") != nullptr);

        QCOMPARE(model.items()[1].bbox.top, 300.0);
        QCOMPARE(model.items()[2].bbox.top, 500.0);

        // A bottom-left canvas flips the top-left items instead
        const ItemModel bottom
            = ItemModel::fromJson(doc, 0, ViewTransform::Origin::BottomLeft);
        QCOMPARE(bottom.items()[0].bbox.top, 720.0);
        QCOMPARE(bottom.items()[1].bbox.top, 492.0);
        QCOMPARE(bottom.items()[2].bbox.top, 500.0);
    }

    void testParseCoordOrigin()
    {
        QVERIFY(ItemModel::parseCoordOrigin("BOTTOMLEFT")
                == ViewTransform::Origin::BottomLeft);
        QVERIFY(ItemModel::parseCoordOrigin("CoordOrigin.BOTTOMLEFT")
                == ViewTransform::Origin::BottomLeft);
        QVERIFY(ItemModel::parseCoordOrigin("topleft")
                == ViewTransform::Origin::TopLeft);
        QVERIFY(!ItemModel::parseCoordOrigin(QString()).has_value());
        QVERIFY(!ItemModel::parseCoordOrigin("CENTER").has_value());
    }

    void testMissingPageFallsBackToLetter()
    {
        const ItemModel model = ItemModel::fromJson(QJsonObject(), 0);
        QVERIFY(model.isEmpty());
        QCOMPARE(model.pageSize(), QSizeF(612, 792));
        QCOMPARE(model.columnCount(), 1);
    }

    void testColumnDetection()
    {
        std::vector<DocumentItem> items;
        for (double left : {72.0, 74.0, 72.0, 320.0, 322.0, 321.0})
        {
            DocumentItem it;
            it.bbox.left = left;
            items.push_back(it);
        }

        const std::vector<double> boundaries
            = ItemModel::detectColumnBoundaries(items);
        QCOMPARE(boundaries.size(), size_t(1));
        QCOMPARE(boundaries.front(), 197.0);

        // Too few items to tell
        items.resize(4);
        QVERIFY(ItemModel::detectColumnBoundaries(items).empty());
    }

    void testReadJsonFile()
    {
        QTemporaryFile file;
        QVERIFY(file.open());
        file.write(QJsonDocument(QJsonObject{{"items", QJsonArray()}}).toJson());
        file.close();

        QString error;
        const auto doc = ItemModel::readJsonFile(file.fileName(), &error);
        QVERIFY(doc.has_value());
        QVERIFY(error.isEmpty());

        QTemporaryFile broken;
        QVERIFY(broken.open());
        broken.write("{ not json");
        broken.close();

        QVERIFY(!ItemModel::readJsonFile(broken.fileName(), &error));
        QVERIFY(error.startsWith("Invalid extraction JSON"));

        QVERIFY(!ItemModel::readJsonFile("/nonexistent/items.json", &error));
        QVERIFY(error.startsWith("Unable to open"));
    }
};

QTEST_GUILESS_MAIN(ItemModelTests)
#include "tst_ItemModel.moc"
