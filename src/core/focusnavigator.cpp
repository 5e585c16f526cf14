// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "focusnavigator.h"
#include "geometryutils.h"
#include "interfaces.h"
#include "logging.h"
#include <algorithm>

namespace WinStepper {

FocusNavigator::FocusNavigator(IWindowPlatform* windows, IScreenPlatform* screens, IHighlighter* highlighter)
    : m_windows(windows)
    , m_screens(screens)
    , m_highlighter(highlighter)
{
}

QVector<IWindow*> FocusNavigator::visibleWindowsOnScreen(const QVector<IWindow*>& ordered, const QRectF& screen,
                                                         IWindow* keep)
{
    QVector<IWindow*> visible;
    QVector<QRectF> framesInFront;
    for (IWindow* window : ordered) {
        if (!window || !window->isStandard() || !window->isVisible()) {
            continue;
        }
        const QRectF frame = window->frame();
        if (!GeometryUtils::isCenterOnScreen(frame, screen)) {
            continue;
        }
        if (window == keep || GeometryUtils::isFrameVisible(frame, framesInFront)) {
            visible.append(window);
        } else {
            qCDebug(lcFocus) << "Occluded:" << window->appName() << frame;
        }
        framesInFront.append(frame);
    }
    return visible;
}

QVector<IWindow*> FocusNavigator::shadowSet(const QVector<IWindow*>& candidates, IWindow* current, Direction direction)
{
    QVector<IWindow*> shadow;
    if (!current) {
        return shadow;
    }
    const QRectF currentFrame = current->frame();
    for (IWindow* window : candidates) {
        if (window == current || GeometryUtils::overlapsPerpendicular(currentFrame, window->frame(), direction)) {
            shadow.append(window);
        }
    }
    return shadow;
}

IScreen* FocusNavigator::screenOf(IWindow* window) const
{
    if (!window) {
        return nullptr;
    }
    IScreen* byCenter = m_screens ? m_screens->screenAt(window->frame().center()) : nullptr;
    return byCenter ? byCenter : window->screen();
}

IWindow* FocusNavigator::nextInDirection(IWindow* current, Direction direction) const
{
    IScreen* screen = screenOf(current);
    if (!current || !screen || !m_windows) {
        return nullptr;
    }

    QVector<IWindow*> candidates = visibleWindowsOnScreen(m_windows->orderedWindows(), screen->frame(), current);
    if (!candidates.contains(current)) {
        candidates.prepend(current);
    }

    const QVector<IWindow*> shadow = shadowSet(candidates, current, direction);
    QVector<IWindow*> chosen = shadow.size() > 1 ? shadow : candidates;
    if (chosen.size() <= 1) {
        qCDebug(lcFocus) << "Nothing to focus" << directionToString(direction) << "of" << current->appName();
        return nullptr;
    }

    const bool horizontal = isHorizontal(direction);
    std::stable_sort(chosen.begin(), chosen.end(), [horizontal](IWindow* a, IWindow* b) {
        return horizontal ? a->frame().x() < b->frame().x() : a->frame().y() < b->frame().y();
    });

    const int index = chosen.indexOf(current);
    const int count = chosen.size();
    const bool backwards = direction == Direction::Left || direction == Direction::Up;
    const int next = backwards ? (index - 1 + count) % count : (index + 1) % count;

    qCDebug(lcFocus) << "Focus" << directionToString(direction) << (shadow.size() > 1 ? "(shadow)" : "(all)")
                     << current->appName() << "->" << chosen.at(next)->appName();
    return chosen.at(next);
}

IWindow* FocusNavigator::entryWindowOnScreen(IScreen* target, Direction direction) const
{
    if (!target || !m_windows) {
        return nullptr;
    }

    const QVector<IWindow*> windows = visibleWindowsOnScreen(m_windows->orderedWindows(), target->frame());
    IWindow* best = nullptr;
    qreal bestEdge = 0;
    for (IWindow* window : windows) {
        const QRectF frame = window->frame();
        // Trailing edge faces the screen we came from
        qreal edge = 0;
        bool better = false;
        switch (direction) {
        case Direction::Left:
            edge = frame.x() + frame.width();
            better = edge > bestEdge;
            break;
        case Direction::Right:
            edge = frame.x();
            better = edge < bestEdge;
            break;
        case Direction::Up:
            edge = frame.y() + frame.height();
            better = edge > bestEdge;
            break;
        case Direction::Down:
            edge = frame.y();
            better = edge < bestEdge;
            break;
        }
        if (!best || better) {
            best = window;
            bestEdge = edge;
        }
    }
    return best;
}

IWindow* FocusNavigator::resolveCurrent()
{
    IWindow* focused = m_windows ? m_windows->focusedWindow() : nullptr;
    if (!focused || m_lastFocusedId.isEmpty() || focused->id() == m_lastFocusedId) {
        return focused;
    }

    IWindow* last = m_windows->windowForId(m_lastFocusedId);
    if (!last || !last->isVisible()) {
        return focused;
    }

    if (last->appName() != focused->appName()) {
        // Different application: the user switched on purpose
        m_lastFocusedId.clear();
        return focused;
    }

    IScreen* lastScreen = m_screens ? m_screens->screenAt(last->frame().center()) : nullptr;
    IScreen* focusedScreen = m_screens ? m_screens->screenAt(focused->frame().center()) : nullptr;
    if (lastScreen && focusedScreen && lastScreen->id() != focusedScreen->id()) {
        qCInfo(lcFocus) << last->appName() << "moved focus to another screen, continuing from" << last->id();
        return last;
    }
    return focused;
}

void FocusNavigator::activate(IWindow* window, Direction direction)
{
    window->raise();
    window->focus();
    m_lastFocusedId = window->id();
    if (m_highlighter) {
        m_highlighter->flash(window->frame(), edgeFor(direction));
    }
}

bool FocusNavigator::focusDirection(Direction direction)
{
    IWindow* current = resolveCurrent();
    if (!current) {
        return false;
    }
    IWindow* target = nextInDirection(current, direction);
    if (!target || target == current) {
        return false;
    }
    activate(target, direction);
    return true;
}

bool FocusNavigator::focusScreen(Direction direction)
{
    if (!m_screens) {
        return false;
    }

    IWindow* current = resolveCurrent();
    IScreen* source = current ? screenOf(current) : nullptr;
    if (!source && m_windows) {
        source = m_screens->screenAt(m_windows->cursorPosition());
    }
    if (!source) {
        return false;
    }

    IScreen* neighbour = m_screens->screenInDirection(source, direction);
    if (!neighbour) {
        qCDebug(lcFocus) << "No screen" << directionToString(direction) << "of" << source->name();
        return false;
    }

    IWindow* target = entryWindowOnScreen(neighbour, direction);
    if (!target) {
        qCDebug(lcFocus) << "No visible window on" << neighbour->name();
        return false;
    }
    qCDebug(lcFocus) << "Focus screen" << directionToString(direction) << "->" << neighbour->name()
                     << target->appName();
    activate(target, direction);
    return true;
}

bool FocusNavigator::flashFocused()
{
    IWindow* focused = m_windows ? m_windows->focusedWindow() : nullptr;
    if (!focused || !m_highlighter) {
        return false;
    }
    m_highlighter->flash(focused->frame(), Edge::None);
    return true;
}

} // namespace WinStepper
