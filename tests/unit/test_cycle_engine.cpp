// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>
#include <QRectF>

#include "core/cycleengine.h"
#include "core/undomemory.h"
#include "helpers/fakeplatform.h"

using namespace WinStepper;
using namespace WinStepper::Test;

namespace {

const QRectF ScreenFrame(0, 0, 1920, 1080);
const QRectF Original(100, 100, 800, 600);

struct Fixture
{
    Fixture()
    {
        platform.addScreen(QStringLiteral("laptop"), QStringLiteral("Built-in Retina Display"), ScreenFrame, true);
        window = platform.addWindow(QStringLiteral("w1"), Original);
        platform.setFocused(window);
    }

    FakePlatform platform;
    UndoMemory memory;
    FakeHighlighter highlighter;
    CycleEngine engine{&memory, nullptr, &highlighter};
    FakeWindow* window = nullptr;
};

} // namespace

/**
 * @brief Unit tests for CycleEngine
 *
 * Tests cover:
 * - Center: vertical, horizontal, restore
 * - Maximize: height, full, restore
 * - Half/third: fixed visiting order on both sides, restore, restart
 * - State recomputed from geometry (tolerance, external moves)
 */
class TestCycleEngine : public QObject
{
    Q_OBJECT

private Q_SLOTS:

    // ═══════════════════════════════════════════════════════════════════════════
    // Center
    // ═══════════════════════════════════════════════════════════════════════════

    void test_center_verticalThenHorizontalThenRestore()
    {
        Fixture f;

        QVERIFY(f.engine.toggleCenter(f.window));
        QCOMPARE(f.window->frame(), QRectF(100, 240, 800, 600));

        QVERIFY(f.engine.toggleCenter(f.window));
        QCOMPARE(f.window->frame(), QRectF(560, 240, 800, 600));

        QVERIFY(f.engine.toggleCenter(f.window));
        QCOMPARE(f.window->frame(), Original);
    }

    void test_center_enteredVerticallyCentered()
    {
        Fixture f;
        const QRectF start(100, 240, 800, 600);
        f.window->setFrameDirect(start);

        QVERIFY(f.engine.toggleCenter(f.window));
        QCOMPARE(f.window->frame(), QRectF(560, 240, 800, 600));
        QVERIFY(f.engine.toggleCenter(f.window));
        QCOMPARE(f.window->frame(), start);
    }

    void test_center_alreadyCenteredWithoutMemory()
    {
        Fixture f;
        f.window->setFrameDirect(QRectF(560, 240, 800, 600));
        QVERIFY(!f.engine.toggleCenter(f.window));
    }

    void test_center_withinTolerance()
    {
        Fixture f;
        // 6px off in both axes still counts as centred
        f.window->setFrameDirect(QRectF(566, 234, 800, 600));
        QVERIFY(!f.engine.toggleCenter(f.window));
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Maximize
    // ═══════════════════════════════════════════════════════════════════════════

    void test_maximize_heightThenFullThenRestore()
    {
        Fixture f;

        QVERIFY(f.engine.toggleMaximize(f.window));
        QCOMPARE(f.window->frame(), QRectF(100, 0, 800, 1080));

        QVERIFY(f.engine.toggleMaximize(f.window));
        QCOMPARE(f.window->frame(), ScreenFrame);

        QVERIFY(f.engine.toggleMaximize(f.window));
        QCOMPARE(f.window->frame(), Original);
    }

    void test_maximize_startingAtFullHeight()
    {
        Fixture f;
        const QRectF start(300, 0, 700, 1080);
        f.window->setFrameDirect(start);

        QVERIFY(f.engine.toggleMaximize(f.window));
        QCOMPARE(f.window->frame(), ScreenFrame);
        QVERIFY(f.engine.toggleMaximize(f.window));
        QCOMPARE(f.window->frame(), start);
    }

    void test_maximize_fullyMaximizedWithoutMemory()
    {
        Fixture f;
        f.window->setFrameDirect(ScreenFrame);
        QVERIFY(!f.engine.toggleMaximize(f.window));
        QCOMPARE(f.window->frame(), ScreenFrame);
    }

    void test_maximize_slotSurvivesCenter()
    {
        Fixture f;

        QVERIFY(f.engine.toggleMaximize(f.window)); // height
        QVERIFY(f.engine.toggleCenter(f.window)); // horizontal centre of the tall window
        QCOMPARE(f.window->frame(), QRectF(560, 0, 800, 1080));

        QVERIFY(f.engine.toggleMaximize(f.window)); // full
        QVERIFY(f.engine.toggleMaximize(f.window)); // restore
        QCOMPARE(f.window->frame(), Original);
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Half / third
    // ═══════════════════════════════════════════════════════════════════════════

    void test_halfThird_leftSequence()
    {
        Fixture f;

        QVERIFY(f.engine.cycleHalfThird(f.window, Direction::Left));
        QCOMPARE(f.window->frame(), QRectF(0, 0, 960, 1080));
        QVERIFY(f.engine.cycleHalfThird(f.window, Direction::Left));
        QCOMPARE(f.window->frame(), QRectF(0, 0, 640, 1080));
        QVERIFY(f.engine.cycleHalfThird(f.window, Direction::Left));
        QCOMPARE(f.window->frame(), QRectF(640, 0, 640, 1080));
        QVERIFY(f.engine.cycleHalfThird(f.window, Direction::Left));
        QCOMPARE(f.window->frame(), QRectF(0, 0, 1280, 1080));
        QVERIFY(f.engine.cycleHalfThird(f.window, Direction::Left));
        QCOMPARE(f.window->frame(), Original);
    }

    void test_halfThird_rightSequence()
    {
        Fixture f;

        QVERIFY(f.engine.cycleHalfThird(f.window, Direction::Right));
        QCOMPARE(f.window->frame(), QRectF(960, 0, 960, 1080));
        QVERIFY(f.engine.cycleHalfThird(f.window, Direction::Right));
        QCOMPARE(f.window->frame(), QRectF(1280, 0, 640, 1080));
        QVERIFY(f.engine.cycleHalfThird(f.window, Direction::Right));
        QCOMPARE(f.window->frame(), QRectF(640, 0, 640, 1080));
        QVERIFY(f.engine.cycleHalfThird(f.window, Direction::Right));
        QCOMPARE(f.window->frame(), QRectF(640, 0, 1280, 1080));
        QVERIFY(f.engine.cycleHalfThird(f.window, Direction::Right));
        QCOMPARE(f.window->frame(), Original);
    }

    void test_halfThird_monotonicOverSeveralRounds()
    {
        Fixture f;
        const QList<CycleStep> expected = {CycleStep::Half, CycleStep::Third, CycleStep::MidThird,
                                           CycleStep::TwoThirds, CycleStep::None};

        for (int i = 0; i < 15; ++i) {
            QVERIFY(f.engine.cycleHalfThird(f.window, Direction::Left));
            const CycleStep step = f.engine.halfThirdStep(f.window->frame(), ScreenFrame, Direction::Left);
            QCOMPARE(step, expected.at(i % expected.size()));
            if (step == CycleStep::None) {
                QCOMPARE(f.window->frame(), Original);
            }
        }
    }

    void test_halfThird_restartsAtHalfWithoutMemory()
    {
        Fixture f;
        // User-sized to exactly two thirds: no saved frame to go back to
        f.window->setFrameDirect(QRectF(0, 0, 1280, 1080));

        QVERIFY(f.engine.cycleHalfThird(f.window, Direction::Left));
        QCOMPARE(f.window->frame(), QRectF(0, 0, 960, 1080));
    }

    void test_halfThird_reentersAfterExternalMove()
    {
        Fixture f;
        QVERIFY(f.engine.cycleHalfThird(f.window, Direction::Left));

        const QRectF moved(300, 300, 500, 500);
        f.window->setFrameDirect(moved);
        QVERIFY(f.engine.cycleHalfThird(f.window, Direction::Left));
        QCOMPARE(f.window->frame(), QRectF(0, 0, 960, 1080));

        // The saved frame is the one from before this cycle
        QCOMPARE(f.memory.saved(UndoFeature::HalfThird, QStringLiteral("w1"))->frame, moved);
    }

    void test_halfThird_stepWithinTolerance()
    {
        Fixture f;
        QCOMPARE(f.engine.halfThirdStep(QRectF(3, 2, 956, 1077), ScreenFrame, Direction::Left), CycleStep::Half);
        QCOMPARE(f.engine.halfThirdStep(QRectF(0, 40, 960, 1040), ScreenFrame, Direction::Left), CycleStep::None);
        QCOMPARE(f.engine.halfThirdStep(QRectF(0, 0, 960, 1080), ScreenFrame, Direction::Right), CycleStep::None);
    }

    void test_halfThird_verticalSideRejected()
    {
        Fixture f;
        QVERIFY(!f.engine.cycleHalfThird(f.window, Direction::Up));
        QCOMPARE(f.window->frame(), Original);
    }

    void test_halfThirdTarget_offsetScreen()
    {
        const QRectF screen(1920, 0, 1280, 800);
        QCOMPARE(CycleEngine::halfThirdTarget(screen, CycleStep::Half, Direction::Right),
                 QRectF(2560, 0, 640, 800));
        QCOMPARE(CycleEngine::halfThirdTarget(screen, CycleStep::MidThird, Direction::Left).center().x(),
                 screen.center().x());
        QVERIFY(CycleEngine::halfThirdTarget(screen, CycleStep::None, Direction::Left).isNull());
    }

    void test_toggles_highlight()
    {
        Fixture f;
        QVERIFY(f.engine.cycleHalfThird(f.window, Direction::Right));
        QCOMPARE(f.highlighter.flashes.size(), 1);
        QCOMPARE(f.highlighter.flashes.last().second, Edges(Edge::Right));
    }

    void test_nullWindow()
    {
        Fixture f;
        QVERIFY(!f.engine.toggleCenter(nullptr));
        QVERIFY(!f.engine.toggleMaximize(nullptr));
        QVERIFY(!f.engine.cycleHalfThird(nullptr, Direction::Left));
    }
};

QTEST_GUILESS_MAIN(TestCycleEngine)
#include "test_cycle_engine.moc"
