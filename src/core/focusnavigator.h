// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "types.h"
#include "winstepper_export.h"
#include <QRectF>
#include <QString>
#include <QVector>

namespace WinStepper {

class IHighlighter;
class IScreen;
class IScreenPlatform;
class IWindow;
class IWindowPlatform;

/**
 * @brief Occlusion-aware directional focus
 *
 * Same-screen navigation:
 * 1. Windows belong to the screen containing their centre point.
 * 2. Windows fully covered (at all 5 sample points) by windows in front of
 *    them are skipped. The current window is always kept.
 * 3. When more than one window overlaps the current one on the axis
 *    perpendicular to travel (its "shadow"), only those are considered.
 * 4. Candidates are sorted by x (left/right) or y (up/down) and the next
 *    one in the direction is chosen, wrapping at the ends.
 *
 * Cross-screen navigation picks, on the neighbouring screen, the visible
 * window whose trailing edge is nearest to the screen we came from.
 *
 * FocusNavigator never changes geometry.
 */
class WINSTEPPER_EXPORT FocusNavigator
{
public:
    FocusNavigator(IWindowPlatform* windows, IScreenPlatform* screens, IHighlighter* highlighter = nullptr);

    /**
     * @brief Focus the next window in a direction on the current screen
     * @return false if there is no focused window or nowhere to go
     */
    bool focusDirection(Direction direction);

    /**
     * @brief Focus the nearest window on the neighbouring screen
     */
    bool focusScreen(Direction direction);

    /**
     * @brief Highlight the focused window without changing focus
     */
    bool flashFocused();

    /**
     * @brief Next window from @p current in a direction, nullptr if none
     */
    IWindow* nextInDirection(IWindow* current, Direction direction) const;

    /**
     * @brief Window to focus on @p target when arriving from a direction, nullptr if none
     */
    IWindow* entryWindowOnScreen(IScreen* target, Direction direction) const;

    /**
     * @brief Visible standard windows whose centre lies on the screen, front to back
     * @param ordered Windows in z-order, front to back
     * @param screen Screen frame
     * @param keep Window retained even when occluded (may be nullptr)
     */
    static QVector<IWindow*> visibleWindowsOnScreen(const QVector<IWindow*>& ordered, const QRectF& screen,
                                                    IWindow* keep = nullptr);

    /**
     * @brief Candidates overlapping @p current on the axis perpendicular to travel
     *
     * @p current itself is part of its own shadow.
     */
    static QVector<IWindow*> shadowSet(const QVector<IWindow*>& candidates, IWindow* current, Direction direction);

    /// Id of the last window focused by this navigator
    QString lastFocusedId() const
    {
        return m_lastFocusedId;
    }

    void setHighlighter(IHighlighter* highlighter)
    {
        m_highlighter = highlighter;
    }

private:
    IWindow* resolveCurrent();
    IScreen* screenOf(IWindow* window) const;
    void activate(IWindow* window, Direction direction);

    IWindowPlatform* m_windows = nullptr;
    IScreenPlatform* m_screens = nullptr;
    IHighlighter* m_highlighter = nullptr;
    QString m_lastFocusedId;
};

} // namespace WinStepper
