// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>
#include <QRectF>

#include "core/edgeresizeengine.h"
#include "core/stepprimitives.h"
#include "core/undomemory.h"
#include "helpers/fakeplatform.h"

using namespace WinStepper;
using namespace WinStepper::Test;

namespace {

const QRectF ScreenFrame(0, 0, 1920, 1080);

struct Fixture
{
    Fixture()
    {
        platform.addScreen(QStringLiteral("laptop"), QStringLiteral("Built-in Retina Display"), ScreenFrame,
                           true);
    }

    FakeWindow* window(const QRectF& frame)
    {
        FakeWindow* w = platform.addWindow(QStringLiteral("w1"), frame);
        platform.setFocused(w);
        return w;
    }

    FakePlatform platform;
    UndoMemory memory;
    FakeHighlighter highlighter;
    EdgeResizeEngine engine{&memory, nullptr, &highlighter};
};

} // namespace

/**
 * @brief Unit tests for StepPrimitives and EdgeResizeEngine
 *
 * Screen is 1920x1080 with 30 divisions: one horizontal step is 64px,
 * one vertical step is 36px.
 */
class TestEdgeResize : public QObject
{
    Q_OBJECT

private Q_SLOTS:

    // ═══════════════════════════════════════════════════════════════════════════
    // Step primitives
    // ═══════════════════════════════════════════════════════════════════════════

    void test_stepSize_perAxis()
    {
        QCOMPARE(StepPrimitives::stepSize(ScreenFrame, Direction::Left), 64.0);
        QCOMPARE(StepPrimitives::stepSize(ScreenFrame, Direction::Down), 36.0);
        QCOMPARE(StepPrimitives::stepSize(ScreenFrame, Direction::Right, 10), 192.0);
        // Invalid divisions fall back to the default
        QCOMPARE(StepPrimitives::stepSize(ScreenFrame, Direction::Right, 0), 64.0);
    }

    void test_steppedMove_translatesOnly()
    {
        const QRectF frame(100, 100, 800, 600);
        QCOMPARE(StepPrimitives::steppedMove(frame, ScreenFrame, Direction::Right), QRectF(164, 100, 800, 600));
        QCOMPARE(StepPrimitives::steppedMove(frame, ScreenFrame, Direction::Up), QRectF(100, 64, 800, 600));
    }

    void test_steppedResize_keepsTopLeft()
    {
        const QRectF frame(100, 100, 800, 600);
        QCOMPARE(StepPrimitives::steppedResize(frame, ScreenFrame, Direction::Left), QRectF(100, 100, 736, 600));
        QCOMPARE(StepPrimitives::steppedResize(frame, ScreenFrame, Direction::Down), QRectF(100, 100, 800, 636));
    }

    void test_steppedResize_neverBelowOnePixel()
    {
        const QRectF frame(100, 100, 10, 600);
        QCOMPARE(StepPrimitives::steppedResize(frame, ScreenFrame, Direction::Left).width(), 1.0);
    }

    void test_stepMove_nullWindow()
    {
        QVERIFY(!StepPrimitives::stepMove(nullptr, Direction::Left));
        QVERIFY(!StepPrimitives::stepResize(nullptr, Direction::Left));
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Smart resize
    // ═══════════════════════════════════════════════════════════════════════════

    void test_resize_freeWindow_passesThrough()
    {
        Fixture f;
        FakeWindow* w = f.window(QRectF(500, 200, 800, 600));

        QVERIFY(f.engine.resize(w, Direction::Left));
        QCOMPARE(w->frame(), QRectF(500, 200, 736, 600));
        QVERIFY(f.engine.resize(w, Direction::Right));
        QCOMPARE(w->frame(), QRectF(500, 200, 800, 600));
    }

    void test_resize_leftStuck_growsAndStaysStuck()
    {
        Fixture f;
        FakeWindow* w = f.window(QRectF(0, 100, 800, 600));

        QVERIFY(f.engine.resize(w, Direction::Left));
        QCOMPARE(w->frame().x(), 0.0);
        QCOMPARE(w->frame().width(), 864.0);
    }

    void test_resize_leftStuck_pressRightShrinksInPlace()
    {
        Fixture f;
        FakeWindow* w = f.window(QRectF(0, 100, 800, 600));

        QVERIFY(f.engine.resize(w, Direction::Right));
        QCOMPARE(w->frame(), QRectF(0, 100, 736, 600));
    }

    void test_resize_rightStuck_growsLeftwards()
    {
        Fixture f;
        FakeWindow* w = f.window(QRectF(1120, 100, 800, 600));

        QVERIFY(f.engine.resize(w, Direction::Right));
        QCOMPARE(w->frame(), QRectF(1056, 100, 864, 600));
        QCOMPARE(f.highlighter.flashes.last().second, Edges(Edge::Left));
    }

    void test_resize_rightStuck_shrinksTowardsEdge()
    {
        Fixture f;
        FakeWindow* w = f.window(QRectF(1120, 100, 800, 600));

        QVERIFY(f.engine.resize(w, Direction::Left));
        QCOMPARE(w->frame(), QRectF(1184, 100, 736, 600));
    }

    void test_resize_fullWidth_shrinksAnchoredToPressedSide()
    {
        Fixture f;
        FakeWindow* w = f.window(QRectF(0, 0, 1920, 1080));

        QVERIFY(f.engine.resize(w, Direction::Left));
        QCOMPARE(w->frame(), QRectF(0, 0, 1856, 1080));

        w->setFrameDirect(QRectF(0, 0, 1920, 1080));
        QVERIFY(f.engine.resize(w, Direction::Right));
        QCOMPARE(w->frame(), QRectF(64, 0, 1856, 1080));
    }

    void test_resize_verticalAxis()
    {
        Fixture f;
        FakeWindow* w = f.window(QRectF(100, 480, 800, 600));

        // Bottom-stuck: pressing down grows upwards
        QVERIFY(f.engine.resize(w, Direction::Down));
        QCOMPARE(w->frame(), QRectF(100, 444, 800, 636));
    }

    void test_resize_edgeStuckInvariant_repeatedPresses()
    {
        Fixture f;
        FakeWindow* w = f.window(QRectF(0, 100, 400, 600));

        for (int i = 0; i < 40; ++i) {
            const Direction d = (i % 3 == 0) ? Direction::Right : Direction::Left;
            QVERIFY(f.engine.resize(w, d));
            QCOMPARE(w->frame().x(), 0.0);
        }
    }

    void test_resize_hostMinimum_staysStuck()
    {
        Fixture f;
        FakeWindow* w = f.window(QRectF(1120, 100, 800, 600));
        w->setMinimumSize(QSize(800, 200));

        // The host refuses to shrink; the window must not detach from the right edge
        QVERIFY(f.engine.resize(w, Direction::Left));
        QCOMPARE(w->frame().width(), 800.0);
        QCOMPARE(w->frame().x() + w->frame().width(), 1920.0);
    }

    void test_resize_resnapsFractionalDrift()
    {
        Fixture f;
        FakeWindow* w = f.window(QRectF(1.5, 100, 800, 600));

        QVERIFY(f.engine.resize(w, Direction::Left));
        QCOMPARE(w->frame().x(), 0.0);
    }

    void test_resize_customDivisions()
    {
        FakePlatform platform;
        platform.addScreen(QStringLiteral("s"), QStringLiteral("S"), ScreenFrame);
        FakeWindow* w = platform.addWindow(QStringLiteral("w1"), QRectF(500, 200, 800, 600));
        UndoMemory memory;
        FakeSettings settings;
        settings.steps = 10;
        EdgeResizeEngine engine(&memory, &settings);

        QVERIFY(engine.resize(w, Direction::Right));
        QCOMPARE(w->frame().width(), 992.0);
    }

    void test_resize_nullWindow()
    {
        Fixture f;
        QVERIFY(!f.engine.resize(nullptr, Direction::Left));
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Move to edge
    // ═══════════════════════════════════════════════════════════════════════════

    void test_moveToEdge_togglesAndRestores()
    {
        Fixture f;
        FakeWindow* w = f.window(QRectF(500, 200, 800, 600));

        QVERIFY(f.engine.moveToEdge(w, Direction::Left));
        QCOMPARE(w->frame(), QRectF(0, 200, 800, 600));

        QVERIFY(f.engine.moveToEdge(w, Direction::Left));
        QCOMPARE(w->frame(), QRectF(500, 200, 800, 600));
    }

    void test_moveToEdge_oppositeEdgeKeepsOriginalPosition()
    {
        Fixture f;
        FakeWindow* w = f.window(QRectF(500, 200, 800, 600));

        QVERIFY(f.engine.moveToEdge(w, Direction::Right));
        QCOMPARE(w->frame().x(), 1120.0);
        QVERIFY(f.engine.moveToEdge(w, Direction::Left));
        QCOMPARE(w->frame().x(), 0.0);
        QVERIFY(f.engine.moveToEdge(w, Direction::Left));
        QCOMPARE(w->frame().x(), 500.0);
    }

    void test_moveToEdge_axesIndependent()
    {
        Fixture f;
        FakeWindow* w = f.window(QRectF(500, 200, 800, 600));

        QVERIFY(f.engine.moveToEdge(w, Direction::Left));
        QVERIFY(f.engine.moveToEdge(w, Direction::Down));
        QCOMPARE(w->frame(), QRectF(0, 480, 800, 600));

        QVERIFY(f.engine.moveToEdge(w, Direction::Left));
        QCOMPARE(w->frame(), QRectF(500, 480, 800, 600));
        QVERIFY(f.engine.moveToEdge(w, Direction::Down));
        QCOMPARE(w->frame(), QRectF(500, 200, 800, 600));
    }

    void test_moveToEdge_alreadyThereWithoutMemory()
    {
        Fixture f;
        FakeWindow* w = f.window(QRectF(0, 200, 800, 600));

        QVERIFY(!f.engine.moveToEdge(w, Direction::Left));
        QCOMPARE(w->frame(), QRectF(0, 200, 800, 600));
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Resize to edge
    // ═══════════════════════════════════════════════════════════════════════════

    void test_resizeToEdge_extendsAndRestores()
    {
        Fixture f;
        FakeWindow* w = f.window(QRectF(500, 200, 800, 600));

        QVERIFY(f.engine.resizeToEdge(w, Direction::Right));
        QCOMPARE(w->frame(), QRectF(500, 200, 1420, 600));

        QVERIFY(f.engine.resizeToEdge(w, Direction::Right));
        QCOMPARE(w->frame(), QRectF(500, 200, 800, 600));
    }

    void test_resizeToEdge_leftKeepsRightSideFixed()
    {
        Fixture f;
        FakeWindow* w = f.window(QRectF(500, 200, 800, 600));

        QVERIFY(f.engine.resizeToEdge(w, Direction::Left));
        QCOMPARE(w->frame(), QRectF(0, 200, 1300, 600));
        QCOMPARE(f.highlighter.flashes.last().second, Edges(Edge::Left));
    }

    void test_resizeToEdge_vertical()
    {
        Fixture f;
        FakeWindow* w = f.window(QRectF(500, 200, 800, 600));

        QVERIFY(f.engine.resizeToEdge(w, Direction::Up));
        QCOMPARE(w->frame(), QRectF(500, 0, 800, 800));
        QVERIFY(f.engine.resizeToEdge(w, Direction::Up));
        QCOMPARE(w->frame(), QRectF(500, 200, 800, 600));
    }
};

QTEST_GUILESS_MAIN(TestEdgeResize)
#include "test_edge_resize.moc"
