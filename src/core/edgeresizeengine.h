// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "types.h"
#include "winstepper_export.h"
#include <QRectF>

namespace WinStepper {

class IHighlighter;
class ISettings;
class IWindow;
class UndoMemory;

/**
 * @brief Directional step resize that keeps edge-stuck windows stuck
 *
 * Plain step resize keeps the top-left corner fixed, so a window touching the
 * right screen edge would detach from it (or spill onto the next screen) on
 * every press. resize() special-cases windows touching a screen edge:
 *
 * - Pressing towards the edge the window touches grows it away from that edge.
 * - Pressing away from it shrinks the window while it stays on that edge.
 *
 * After every compensated resize the position is re-snapped to the screen
 * edge so fractional scaling cannot accumulate drift.
 *
 * moveToEdge()/resizeToEdge() are toggles: the first press snaps the window
 * to the edge, pressing again while there restores the saved axis.
 */
class WINSTEPPER_EXPORT EdgeResizeEngine
{
public:
    EdgeResizeEngine(UndoMemory* memory, ISettings* settings = nullptr, IHighlighter* highlighter = nullptr);

    /**
     * @brief Smart one-step resize
     * @return false if there is no window or screen
     */
    bool resize(IWindow* window, Direction direction);

    /**
     * @brief Move flush to the screen edge, or restore the axis position
     */
    bool moveToEdge(IWindow* window, Direction direction);

    /**
     * @brief Extend one side to the screen edge keeping the opposite side fixed,
     *        or restore the axis when already there
     */
    bool resizeToEdge(IWindow* window, Direction direction);

    void setHighlighter(IHighlighter* highlighter)
    {
        m_highlighter = highlighter;
    }

private:
    qreal tolerance() const;
    int divisions() const;
    void flash(IWindow* window, Edges edges) const;

    UndoMemory* m_memory = nullptr;
    ISettings* m_settings = nullptr;
    IHighlighter* m_highlighter = nullptr;
};

} // namespace WinStepper
