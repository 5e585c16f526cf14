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
 * @brief Progressive toggles: center, maximize, half/third cycle
 *
 * None of the toggles stores which step it is on. The step is recomputed on
 * every call by comparing the current frame with each candidate target within
 * CycleTolerance, so a window moved by something else simply re-enters the
 * cycle. A user-sized window that happens to match a step within tolerance is
 * treated as being at that step.
 *
 * Each toggle has its own UndoMemory slot holding the pre-toggle frame.
 */
class WINSTEPPER_EXPORT CycleEngine
{
public:
    CycleEngine(UndoMemory* memory, ISettings* settings = nullptr, IHighlighter* highlighter = nullptr);

    /**
     * @brief Center vertically, then horizontally, then restore
     */
    bool toggleCenter(IWindow* window);

    /**
     * @brief Maximize height, then maximize fully, then restore
     */
    bool toggleMaximize(IWindow* window);

    /**
     * @brief Advance the half/third cycle on one side
     * @param side Direction::Left or Direction::Right
     *
     * Half -> Third -> MidThird -> TwoThirds -> restore -> Half ...
     */
    bool cycleHalfThird(IWindow* window, Direction side);

    /**
     * @brief Cycle step the frame currently matches, CycleStep::None if none
     */
    CycleStep halfThirdStep(const QRectF& frame, const QRectF& screen, Direction side) const;

    /**
     * @brief Full-height target frame of a cycle step
     */
    static QRectF halfThirdTarget(const QRectF& screen, CycleStep step, Direction side);

    void setHighlighter(IHighlighter* highlighter)
    {
        m_highlighter = highlighter;
    }

private:
    qreal tolerance() const;
    void flash(IWindow* window, Edges edges) const;

    UndoMemory* m_memory = nullptr;
    ISettings* m_settings = nullptr;
    IHighlighter* m_highlighter = nullptr;
};

} // namespace WinStepper
