// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>
#include <QRectF>

#include "core/focusnavigator.h"
#include "core/geometryutils.h"
#include "helpers/fakeplatform.h"

using namespace WinStepper;
using namespace WinStepper::Test;

namespace {

const QRectF LaptopFrame(0, 0, 1920, 1080);

struct Fixture
{
    Fixture()
    {
        laptop = platform.addScreen(QStringLiteral("laptop"), QStringLiteral("Built-in Retina Display"), LaptopFrame,
                                    true);
    }

    FakeScreen* addSide()
    {
        return platform.addScreen(QStringLiteral("side"), QStringLiteral("Side"), QRectF(1920, 0, 1920, 1080));
    }

    FakeWindow* add(const QString& id, const QRectF& frame, const QString& app = QStringLiteral("app"))
    {
        return platform.addWindow(id, frame, app);
    }

    FakePlatform platform;
    FakeScreen* laptop = nullptr;
    FakeHighlighter highlighter;
    FocusNavigator navigator{&platform, &platform, &highlighter};
};

} // namespace

/**
 * @brief Unit tests for FocusNavigator
 *
 * Tests cover:
 * - Occlusion filtering with 5 sample points
 * - Shadow set restriction and fallback to all candidates
 * - Wraparound ordering
 * - Cross-screen entry window selection
 * - Focus-jump guard for multi-window applications
 */
class TestFocusNavigator : public QObject
{
    Q_OBJECT

private Q_SLOTS:

    // ═══════════════════════════════════════════════════════════════════════════
    // Occlusion
    // ═══════════════════════════════════════════════════════════════════════════

    void test_occlusion_fullscreenFrontWindow()
    {
        Fixture f;
        FakeWindow* a = f.add(QStringLiteral("A"), QRectF(0, 0, 1920, 1080));
        FakeWindow* b = f.add(QStringLiteral("B"), QRectF(0, 0, 960, 1080));
        FakeWindow* c = f.add(QStringLiteral("C"), QRectF(1000, 0, 920, 1080));

        QVERIFY(!GeometryUtils::isFrameVisible(b->frame(), {a->frame()}));
        QVERIFY(!GeometryUtils::isFrameVisible(c->frame(), {a->frame()}));

        const QVector<IWindow*> visible = FocusNavigator::visibleWindowsOnScreen(f.platform.orderedWindows(),
                                                                                 LaptopFrame);
        QCOMPARE(visible.size(), 1);
        QCOMPARE(visible.first(), a);
    }

    void test_occlusion_currentWindowAlwaysKept()
    {
        Fixture f;
        f.add(QStringLiteral("A"), QRectF(0, 0, 1920, 1080));
        FakeWindow* b = f.add(QStringLiteral("B"), QRectF(0, 0, 960, 1080));

        const QVector<IWindow*> visible = FocusNavigator::visibleWindowsOnScreen(f.platform.orderedWindows(),
                                                                                 LaptopFrame, b);
        QCOMPARE(visible.size(), 2);
        QVERIFY(visible.contains(b));
    }

    void test_occlusion_skipsNonStandardAndMinimized()
    {
        Fixture f;
        FakeWindow* panel = f.add(QStringLiteral("panel"), QRectF(0, 0, 1920, 40));
        panel->setStandard(false);
        FakeWindow* minimized = f.add(QStringLiteral("min"), QRectF(100, 100, 400, 400));
        minimized->minimize();
        FakeWindow* normal = f.add(QStringLiteral("normal"), QRectF(600, 100, 400, 400));

        const QVector<IWindow*> visible = FocusNavigator::visibleWindowsOnScreen(f.platform.orderedWindows(),
                                                                                 LaptopFrame);
        QCOMPARE(visible.size(), 1);
        QCOMPARE(visible.first(), normal);
    }

    void test_occlusion_otherScreenWindowsDoNotOcclude()
    {
        Fixture f;
        f.addSide();
        // Mostly on the side screen, overlapping the laptop's right edge
        f.add(QStringLiteral("straddle"), QRectF(1700, 0, 1000, 1080));
        FakeWindow* under = f.add(QStringLiteral("under"), QRectF(1750, 100, 160, 200));

        const QVector<IWindow*> visible = FocusNavigator::visibleWindowsOnScreen(f.platform.orderedWindows(),
                                                                                 LaptopFrame);
        QCOMPARE(visible.size(), 1);
        QCOMPARE(visible.first(), under);
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Same-screen navigation
    // ═══════════════════════════════════════════════════════════════════════════

    void test_shadow_prefersOverlappingCandidate()
    {
        Fixture f;
        FakeWindow* current = f.add(QStringLiteral("current"), QRectF(0, 0, 400, 500));
        FakeWindow* x = f.add(QStringLiteral("X"), QRectF(500, 200, 400, 500));
        FakeWindow* y = f.add(QStringLiteral("Y"), QRectF(1500, 600, 400, 400));
        f.platform.setFocused(current);

        QCOMPARE(FocusNavigator::shadowSet(f.platform.orderedWindows(), current, Direction::Right).size(), 2);

        QVERIFY(f.navigator.focusDirection(Direction::Right));
        QCOMPARE(f.platform.focusedWindow(), x);

        // From X both neighbours overlap it vertically
        QVERIFY(f.navigator.focusDirection(Direction::Right));
        QCOMPARE(f.platform.focusedWindow(), y);
    }

    void test_noShadow_fallsBackToAllCandidates()
    {
        Fixture f;
        FakeWindow* current = f.add(QStringLiteral("current"), QRectF(0, 0, 400, 300));
        FakeWindow* lower = f.add(QStringLiteral("lower"), QRectF(500, 600, 400, 300));
        f.add(QStringLiteral("lowest"), QRectF(1000, 700, 400, 300));
        f.platform.setFocused(current);

        QVERIFY(f.navigator.focusDirection(Direction::Right));
        QCOMPARE(f.platform.focusedWindow(), lower);
    }

    void test_wraparound()
    {
        Fixture f;
        FakeWindow* left = f.add(QStringLiteral("left"), QRectF(0, 0, 640, 1080));
        f.add(QStringLiteral("mid"), QRectF(640, 0, 640, 1080));
        FakeWindow* right = f.add(QStringLiteral("right"), QRectF(1280, 0, 640, 1080));

        f.platform.setFocused(right);
        QVERIFY(f.navigator.focusDirection(Direction::Right));
        QCOMPARE(f.platform.focusedWindow(), left);

        QVERIFY(f.navigator.focusDirection(Direction::Left));
        QCOMPARE(f.platform.focusedWindow(), right);
    }

    void test_vertical()
    {
        Fixture f;
        FakeWindow* top = f.add(QStringLiteral("top"), QRectF(0, 0, 1920, 540));
        FakeWindow* bottom = f.add(QStringLiteral("bottom"), QRectF(0, 540, 1920, 540));
        f.platform.setFocused(top);

        QVERIFY(f.navigator.focusDirection(Direction::Down));
        QCOMPARE(f.platform.focusedWindow(), bottom);
        QVERIFY(f.navigator.focusDirection(Direction::Up));
        QCOMPARE(f.platform.focusedWindow(), top);
    }

    void test_occludedWindowSkipped()
    {
        Fixture f;
        FakeWindow* left = f.add(QStringLiteral("L"), QRectF(0, 0, 960, 1080));
        FakeWindow* right = f.add(QStringLiteral("R"), QRectF(960, 0, 960, 1080));
        f.add(QStringLiteral("hidden"), QRectF(1000, 100, 400, 400));
        f.platform.setFocused(left);

        QVERIFY(f.navigator.focusDirection(Direction::Right));
        QCOMPARE(f.platform.focusedWindow(), right);
        QVERIFY(f.navigator.focusDirection(Direction::Right));
        QCOMPARE(f.platform.focusedWindow(), left);
    }

    void test_singleWindow_noop()
    {
        Fixture f;
        FakeWindow* only = f.add(QStringLiteral("only"), QRectF(100, 100, 800, 600));
        f.platform.setFocused(only);

        QVERIFY(!f.navigator.focusDirection(Direction::Right));
        QVERIFY(f.highlighter.flashes.isEmpty());
    }

    void test_noFocusedWindow_noop()
    {
        Fixture f;
        f.add(QStringLiteral("a"), QRectF(100, 100, 800, 600));
        QVERIFY(!f.navigator.focusDirection(Direction::Left));
    }

    void test_activate_raisesAndHighlights()
    {
        Fixture f;
        FakeWindow* a = f.add(QStringLiteral("a"), QRectF(0, 0, 960, 1080));
        FakeWindow* b = f.add(QStringLiteral("b"), QRectF(960, 0, 960, 1080));
        f.platform.setFocused(a);

        QVERIFY(f.navigator.focusDirection(Direction::Right));
        QCOMPARE(b->raiseCount(), 1);
        QCOMPARE(f.platform.orderedWindows().first(), b);
        QCOMPARE(f.highlighter.flashes.size(), 1);
        QVERIFY(f.highlighter.flashes.first().second.testFlag(Edge::Right));
        QCOMPARE(f.navigator.lastFocusedId(), QStringLiteral("b"));
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Cross-screen navigation
    // ═══════════════════════════════════════════════════════════════════════════

    void test_focusScreen_entersNearestWindow()
    {
        Fixture f;
        f.addSide();
        FakeWindow* laptopNear = f.add(QStringLiteral("l2"), QRectF(1000, 100, 600, 400));
        FakeWindow* laptopFar = f.add(QStringLiteral("l1"), QRectF(0, 100, 600, 400));
        FakeWindow* sideNear = f.add(QStringLiteral("s1"), QRectF(2000, 100, 600, 400));
        FakeWindow* sideFar = f.add(QStringLiteral("s2"), QRectF(3000, 100, 600, 400));
        Q_UNUSED(laptopFar);
        Q_UNUSED(sideFar);

        f.platform.setFocused(laptopNear);
        QVERIFY(f.navigator.focusScreen(Direction::Right));
        QCOMPARE(f.platform.focusedWindow(), sideNear);

        QVERIFY(f.navigator.focusScreen(Direction::Left));
        QCOMPARE(f.platform.focusedWindow(), laptopNear);
    }

    void test_focusScreen_vertical()
    {
        Fixture f;
        f.platform.addScreen(QStringLiteral("above"), QStringLiteral("Above"), QRectF(0, -1080, 1920, 1080));
        FakeWindow* current = f.add(QStringLiteral("cur"), QRectF(100, 100, 600, 400));
        f.add(QStringLiteral("a1"), QRectF(100, -1080, 500, 400));
        FakeWindow* a2 = f.add(QStringLiteral("a2"), QRectF(100, -500, 500, 400));
        f.platform.setFocused(current);

        QVERIFY(f.navigator.focusScreen(Direction::Up));
        QCOMPARE(f.platform.focusedWindow(), a2);
    }

    void test_focusScreen_noNeighbour()
    {
        Fixture f;
        FakeWindow* current = f.add(QStringLiteral("cur"), QRectF(100, 100, 600, 400));
        f.platform.setFocused(current);
        QVERIFY(!f.navigator.focusScreen(Direction::Left));
    }

    void test_focusScreen_emptyNeighbour()
    {
        Fixture f;
        f.addSide();
        FakeWindow* current = f.add(QStringLiteral("cur"), QRectF(100, 100, 600, 400));
        f.platform.setFocused(current);
        QVERIFY(!f.navigator.focusScreen(Direction::Right));
        QCOMPARE(f.platform.focusedWindow(), current);
    }

    void test_focusScreen_withoutFocusUsesCursor()
    {
        Fixture f;
        f.addSide();
        FakeWindow* sideWindow = f.add(QStringLiteral("s1"), QRectF(2000, 100, 600, 400));
        f.platform.setCursor(QPointF(100, 100));

        QVERIFY(f.navigator.focusScreen(Direction::Right));
        QCOMPARE(f.platform.focusedWindow(), sideWindow);
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Focus-jump guard
    // ═══════════════════════════════════════════════════════════════════════════

    void test_focusJump_sameAppOtherScreen_continuesFromLast()
    {
        Fixture f;
        f.addSide();
        FakeWindow* chrome1 = f.add(QStringLiteral("c1"), QRectF(0, 0, 800, 1080), QStringLiteral("Chrome"));
        FakeWindow* terminal = f.add(QStringLiteral("t1"), QRectF(900, 0, 800, 1080), QStringLiteral("Terminal"));
        FakeWindow* chrome2 = f.add(QStringLiteral("c2"), QRectF(2000, 0, 800, 1080), QStringLiteral("Chrome"));
        f.platform.setFocused(terminal);

        QVERIFY(f.navigator.focusDirection(Direction::Left));
        QCOMPARE(f.platform.focusedWindow(), chrome1);

        // The application hands focus to its window on the other screen
        f.platform.setFocused(chrome2);

        QVERIFY(f.navigator.focusDirection(Direction::Right));
        QCOMPARE(f.platform.focusedWindow(), terminal);
    }

    void test_focusJump_differentAppResets()
    {
        Fixture f;
        f.addSide();
        FakeWindow* chrome1 = f.add(QStringLiteral("c1"), QRectF(0, 0, 800, 1080), QStringLiteral("Chrome"));
        FakeWindow* terminal = f.add(QStringLiteral("t1"), QRectF(900, 0, 800, 1080), QStringLiteral("Terminal"));
        FakeWindow* editor1 = f.add(QStringLiteral("e1"), QRectF(2000, 0, 800, 1080), QStringLiteral("Editor"));
        FakeWindow* editor2 = f.add(QStringLiteral("e2"), QRectF(2900, 0, 800, 1080), QStringLiteral("Editor"));
        Q_UNUSED(chrome1);
        f.platform.setFocused(terminal);

        QVERIFY(f.navigator.focusDirection(Direction::Left));

        // The user clicked another application on the side screen
        f.platform.setFocused(editor1);
        QVERIFY(f.navigator.focusDirection(Direction::Right));
        QCOMPARE(f.platform.focusedWindow(), editor2);
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Flash
    // ═══════════════════════════════════════════════════════════════════════════

    void test_flashFocused()
    {
        Fixture f;
        FakeWindow* w = f.add(QStringLiteral("w"), QRectF(100, 100, 800, 600));
        QVERIFY(!f.navigator.flashFocused());

        f.platform.setFocused(w);
        QVERIFY(f.navigator.flashFocused());
        QCOMPARE(f.highlighter.flashes.size(), 1);
        QCOMPARE(f.highlighter.flashes.first().first, w->frame());
        QCOMPARE(f.platform.focusedWindow(), w);
    }
};

QTEST_GUILESS_MAIN(TestFocusNavigator)
#include "test_focus_navigator.moc"
