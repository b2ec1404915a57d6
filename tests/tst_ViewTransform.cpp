#include "ViewTransform.hpp"

#include <QTest>
#include <cmath>

class ViewTransformTests : public QObject
{
    Q_OBJECT

private:
    static ViewTransform make(double zoom, const QPointF &pan,
                              ViewTransform::Origin origin,
                              ViewTransform::Fit fit,
                              const QSizeF &panel = QSizeF(612, 792),
                              const QSizeF &page  = QSizeF(612, 792))
    {
        ViewTransform::Params params;
        params.panel_size = panel;
        params.page_size  = page;
        params.zoom       = zoom;
        params.pan        = pan;
        return ViewTransform(params, origin, fit);
    }

    static bool close(const QPointF &a, const QPointF &b)
    {
        return std::abs(a.x() - b.x()) < 1e-6 && std::abs(a.y() - b.y()) < 1e-6;
    }

private slots:
    void testLetterPageAtUnitZoom()
    {
        const ViewTransform t = make(1.0, QPointF(), ViewTransform::Origin::TopLeft,
                                     ViewTransform::Fit::Uniform);

        QCOMPARE(t.fitScale(), 1.0);
        QCOMPARE(t.toScreen(QPointF(72, 72)), QPointF(92, 122));

        const QRectF r = t.toScreen(QRectF(72, 72, 200, 20));
        QCOMPARE(r, QRectF(92, 122, 200, 20));
    }

    void testRoundTrip()
    {
        const QList<QPointF> points{QPointF(0, 0), QPointF(72, 72),
                                    QPointF(611.5, 10.25), QPointF(-30, 900)};
        const QList<QPointF> pans{QPointF(), QPointF(-150, 40),
                                  QPointF(333.3, -77.7)};

        for (auto origin :
             {ViewTransform::Origin::TopLeft, ViewTransform::Origin::BottomLeft})
        {
            for (auto fit :
                 {ViewTransform::Fit::Uniform, ViewTransform::Fit::WidthOnly})
            {
                for (double zoom = 0.5; zoom <= 3.0; zoom += 0.25)
                {
                    for (const QPointF &pan : pans)
                    {
                        const ViewTransform t = make(zoom, pan, origin, fit,
                                                     QSizeF(800, 600),
                                                     QSizeF(595, 842));
                        for (const QPointF &p : points)
                            QVERIFY2(close(t.toDoc(t.toScreen(p)), p),
                                     qPrintable(QString("zoom %1").arg(zoom)));
                    }
                }
            }
        }
    }

    void testFitStrategies()
    {
        // A4 page in a wide panel: width fit ignores the height
        const QSizeF panel(1000, 500);
        const QSizeF page(595, 842);

        QCOMPARE(ViewTransform::fitScale(panel, page, ViewTransform::Fit::WidthOnly),
                 1000.0 / 595.0);
        QCOMPARE(ViewTransform::fitScale(panel, page, ViewTransform::Fit::Uniform),
                 500.0 / 842.0);

        // Degenerate sizes fall back to no scaling
        QCOMPARE(ViewTransform::fitScale(QSizeF(0, 0), page,
                                         ViewTransform::Fit::Uniform),
                 1.0);
        QCOMPARE(ViewTransform::fitScale(panel, QSizeF(0, 842),
                                         ViewTransform::Fit::Uniform),
                 1.0);
    }

    void testBottomLeftOrigin()
    {
        const ViewTransform t = make(1.0, QPointF(),
                                     ViewTransform::Origin::BottomLeft,
                                     ViewTransform::Fit::Uniform);

        // Document y grows upwards: the page top lands on the margin
        QCOMPARE(t.toScreen(QPointF(0, 792)), QPointF(20, 50));
        QCOMPARE(t.toScreen(QPointF(0, 0)), QPointF(20, 842));

        // Rects are not mirrored
        const QRectF r = t.toScreen(QRectF(72, 720, 100, 20));
        QCOMPARE(r.size(), QSizeF(100, 20));
        QCOMPARE(r.topLeft(), QPointF(92, 122));
    }

    void testZoomAndPan()
    {
        const ViewTransform t = make(2.0, QPointF(15, -10),
                                     ViewTransform::Origin::TopLeft,
                                     ViewTransform::Fit::Uniform);

        QCOMPARE(t.scale(), 2.0);
        QCOMPARE(t.baseOffset(), QPointF(35, 40));
        QCOMPARE(t.toScreen(QPointF(10, 10)), QPointF(55, 60));
        QCOMPARE(t.pageRect(), QRectF(35, 40, 1224, 1584));
    }

    void testClampZoom()
    {
        QCOMPARE(ViewTransform::clampZoom(0.1, 0.5, 3.0), 0.5);
        QCOMPARE(ViewTransform::clampZoom(10.0, 0.5, 3.0), 3.0);
        QCOMPARE(ViewTransform::clampZoom(1.5, 0.5, 3.0), 1.5);
        QCOMPARE(ViewTransform::clampZoom(std::nan(""), 0.5, 3.0), 1.0);
    }
};

QTEST_GUILESS_MAIN(ViewTransformTests)
#include "tst_ViewTransform.moc"
