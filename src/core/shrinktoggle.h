// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "types.h"
#include "winstepper_export.h"

namespace WinStepper {

class EdgeResizeEngine;
class IHighlighter;
class ISettings;
class IWindow;
class UndoMemory;

/**
 * @brief Shrink-to-minimum / restore toggle
 *
 * Left/Up shrink width/height by repeated step resizes until the host stops
 * shrinking the window (its own minimum) or the per-application minimum from
 * settings is reached. The loop is capped at ShrinkMaxIterations.
 *
 * Right/Down restore the pre-shrink width+x / height+y. A window that was
 * never shrunk is grown to the screen edge instead.
 */
class WINSTEPPER_EXPORT ShrinkToggle
{
public:
    ShrinkToggle(UndoMemory* memory, EdgeResizeEngine* edgeEngine, ISettings* settings = nullptr,
                 IHighlighter* highlighter = nullptr);

    bool shrink(IWindow* window, Direction direction);

    void setHighlighter(IHighlighter* highlighter)
    {
        m_highlighter = highlighter;
    }

private:
    bool shrinkToMinimum(IWindow* window, Direction direction);
    bool restoreOrGrow(IWindow* window, Direction direction);

    UndoMemory* m_memory = nullptr;
    EdgeResizeEngine* m_edgeEngine = nullptr;
    ISettings* m_settings = nullptr;
    IHighlighter* m_highlighter = nullptr;
};

} // namespace WinStepper
