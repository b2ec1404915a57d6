#include "InteractionController.hpp"

#include <QTest>

using HitTarget = InteractionController::HitTarget;
using State     = InteractionController::State;

class InteractionControllerTests : public QObject
{
    Q_OBJECT

private:
    Config m_config;
    std::vector<HitTarget> m_targets;

    // Config factors are floats
    static bool near(double a, double b)
    {
        return qAbs(a - b) < 1e-6;
    }

private slots:
    void init()
    {
        m_config  = Config();
        m_targets = {{"a", QRectF(90, 120, 100, 20), "Alpha"},
                     {"b", QRectF(150, 125, 100, 20), "Bravo"}};
    }

    void testHitTestPrefersTopmost()
    {
        QCOMPARE(InteractionController::hitTest(m_targets, QPointF(100, 130)), 0);
        QCOMPARE(InteractionController::hitTest(m_targets, QPointF(160, 130)), 1);
        QCOMPARE(InteractionController::hitTest(m_targets, QPointF(5, 5)), -1);
    }

    void testHover()
    {
        InteractionController ctl(m_config);

        InteractionController::Outcome out
            = ctl.pointerMoved(QPointF(100, 130), m_targets);
        QVERIFY(out.repaint);
        QCOMPARE(ctl.hoveredId(), QString("a"));
        QVERIFY(ctl.state() == State::Hovering);
        QVERIFY(ctl.cursorShape() == Qt::PointingHandCursor);

        ctl.pointerMoved(QPointF(5, 5), m_targets);
        QVERIFY(ctl.hoveredId().isEmpty());
        QVERIFY(ctl.state() == State::Idle);

        ctl.pointerLeft();
        QVERIFY(!ctl.pointerInside());
    }

    void testClickCopies()
    {
        InteractionController ctl(m_config);

        ctl.pointerPressed(QPointF(160, 130), Qt::LeftButton, m_targets, false);
        // Within the drag threshold a small jitter is still a click
        ctl.pointerMoved(QPointF(161, 131), m_targets);
        const InteractionController::Outcome out
            = ctl.pointerReleased(QPointF(161, 131), Qt::LeftButton, m_targets);

        QVERIFY(out.copy_text.has_value());
        QCOMPARE(*out.copy_text, QString("Bravo"));
    }

    void testReleaseOnOtherItemDoesNotCopy()
    {
        InteractionController ctl(m_config);

        ctl.pointerPressed(QPointF(100, 130), Qt::LeftButton, m_targets, false);
        const InteractionController::Outcome out
            = ctl.pointerReleased(QPointF(5, 5), Qt::LeftButton, m_targets);
        QVERIFY(!out.copy_text.has_value());
    }

    void testDragPans()
    {
        InteractionController ctl(m_config);

        ctl.pointerPressed(QPointF(100, 130), Qt::LeftButton, m_targets, false);
        InteractionController::Outcome out
            = ctl.pointerMoved(QPointF(110, 130), m_targets);

        QVERIFY(ctl.state() == State::Panning);
        QCOMPARE(out.pan_delta, QPointF(10, 0));
        QVERIFY(ctl.cursorShape() == Qt::ClosedHandCursor);

        out = ctl.pointerMoved(QPointF(110, 140), m_targets);
        QCOMPARE(out.pan_delta, QPointF(0, 10));

        out = ctl.pointerReleased(QPointF(110, 140), Qt::LeftButton, m_targets);
        QVERIFY(!out.copy_text.has_value());
        QVERIFY(ctl.state() != State::Panning);
    }

    void testDragMovesItemInEditMode()
    {
        InteractionController ctl(m_config);

        ctl.pointerPressed(QPointF(100, 130), Qt::LeftButton, m_targets, true);
        InteractionController::Outcome out
            = ctl.pointerMoved(QPointF(100, 150), m_targets);

        QVERIFY(ctl.state() == State::DraggingItem);
        QCOMPARE(out.offset_item, QString("a"));
        QCOMPARE(out.offset_delta, QPointF(0, 20));
        QVERIFY(out.pan_delta.isNull());
    }

    void testEscapeRevertsDrag()
    {
        InteractionController ctl(m_config);

        ctl.pointerPressed(QPointF(100, 130), Qt::LeftButton, m_targets, true);
        ctl.pointerMoved(QPointF(110, 130), m_targets);
        ctl.pointerMoved(QPointF(120, 135), m_targets);

        const InteractionController::Outcome out
            = ctl.keyPressed(Qt::Key_Escape, Qt::NoModifier, 1.0);
        QCOMPARE(out.offset_item, QString("a"));
        QCOMPARE(out.offset_delta, QPointF(-20, -5));
        QVERIFY(ctl.state() == State::Idle);
    }

    void testWheel()
    {
        InteractionController ctl(m_config);

        InteractionController::Outcome out
            = ctl.wheel(QPointF(0, -30), Qt::NoModifier, 1.0);
        QCOMPARE(out.pan_delta, QPointF(0, -30));
        QVERIFY(!out.zoom.has_value());

        out = ctl.wheel(QPointF(0, 120), Qt::ControlModifier, 1.0);
        QVERIFY(out.zoom.has_value());
        QVERIFY(near(*out.zoom, 1.12));

        // Clamped to the configured range
        out = ctl.wheel(QPointF(0, 100000), Qt::ControlModifier, 1.0);
        QVERIFY(near(*out.zoom, 3.0));
    }

    void testKeys()
    {
        InteractionController ctl(m_config);

        QVERIFY(near(*ctl.keyPressed(Qt::Key_Plus, Qt::NoModifier, 1.0).zoom, 1.2));
        QVERIFY(near(*ctl.keyPressed(Qt::Key_Minus, Qt::NoModifier, 1.2).zoom, 1.0));
        QVERIFY(ctl.keyPressed(Qt::Key_0, Qt::NoModifier, 2.0).reset_view);
        QCOMPARE(ctl.keyPressed(Qt::Key_Left, Qt::NoModifier, 1.0).pan_delta,
                 QPointF(40, 0));
        QCOMPARE(ctl.keyPressed(Qt::Key_Down, Qt::NoModifier, 1.0).pan_delta,
                 QPointF(0, -40));
        QVERIFY(!ctl.keyPressed(Qt::Key_A, Qt::NoModifier, 1.0).consumed);
    }

    void testModifiedKeysPassThrough()
    {
        InteractionController ctl(m_config);

        const InteractionController::Outcome left
            = ctl.keyPressed(Qt::Key_Left, Qt::ControlModifier, 1.0);
        QVERIFY(!left.consumed);
        QVERIFY(left.pan_delta.isNull());

        const InteractionController::Outcome plus
            = ctl.keyPressed(Qt::Key_Plus, Qt::ControlModifier, 1.0);
        QVERIFY(!plus.consumed);
        QVERIFY(!plus.zoom.has_value());

        QVERIFY(!ctl.keyPressed(Qt::Key_0, Qt::AltModifier, 1.0).consumed);

        // Shift is part of typing '+' on most layouts
        QVERIFY(near(*ctl.keyPressed(Qt::Key_Plus, Qt::ShiftModifier, 1.0).zoom, 1.2));
    }

    void testPressOnItemOutsideEditModePans()
    {
        InteractionController ctl(m_config);

        ctl.pointerPressed(QPointF(100, 130), Qt::LeftButton, m_targets, false);
        const InteractionController::Outcome out
            = ctl.pointerMoved(QPointF(100, 150), m_targets);

        QVERIFY(ctl.state() == State::Panning);
        QCOMPARE(out.pan_delta, QPointF(0, 20));
        QVERIFY(out.offset_item.isEmpty());
    }

    void testDoubleClickEditsOnlyInEditMode()
    {
        InteractionController ctl(m_config);

        QVERIFY(ctl.doubleClicked(QPointF(100, 130), m_targets, false)
                    .edit_item.isEmpty());
        QCOMPARE(ctl.doubleClicked(QPointF(100, 130), m_targets, true).edit_item,
                 QString("a"));
    }

    void testToastWindow()
    {
        InteractionController ctl(m_config);
        QVERIFY(!ctl.toastVisible(0));

        ctl.recordCopy("Alpha", 1000);
        QVERIFY(ctl.toastVisible(1000));
        QVERIFY(ctl.toastVisible(2999));
        QVERIFY(!ctl.toastVisible(3000));
        QCOMPARE(ctl.copiedText(), QString("Alpha"));
    }
};

QTEST_GUILESS_MAIN(InteractionControllerTests)
#include "tst_InteractionController.moc"
