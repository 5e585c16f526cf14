// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "constants.h"
#include "winstepper_export.h"
#include <QPointF>
#include <QRectF>
#include <QSizeF>
#include <QVector>
#include <optional>

namespace WinStepper {

class IHighlighter;
class ISettings;
class IWindow;
class IWindowPlatform;
class UndoMemory;

/**
 * @brief Docks windows into small fixed-size slots along the bottom of a screen
 *
 * Docked windows are packed left to right; a full row wraps to the row above.
 * Rows are not stored: they are derived from the current frames of the docked
 * windows on the same screen. The registry of docked windows is the Compact
 * slot of UndoMemory, holding each window's pre-dock frame and screen.
 *
 * Placement is greedy, not optimal: the dock holds a handful of windows.
 */
class WINSTEPPER_EXPORT CompactPlacer
{
public:
    CompactPlacer(UndoMemory* memory, IWindowPlatform* windows, ISettings* settings = nullptr,
                  IHighlighter* highlighter = nullptr);

    /**
     * @brief Dock the window, or restore it if it is already docked
     * @return false if nothing changed (no window, every row full)
     */
    bool toggle(IWindow* window);

    /**
     * @brief Drop registry entries whose window is gone or invisible
     * @return Number of entries dropped
     */
    int pruneRegistry();

    /**
     * @brief Row a docked frame occupies, counted upwards from the screen bottom
     */
    static int rowOf(const QRectF& frame, const QRectF& screen, qreal compactHeight);

    /**
     * @brief First free slot for a new docked window
     * @param screen Screen frame
     * @param docked Frames of the windows already docked on that screen
     * @param compactSize Slot size
     * @param maxRow Highest row scanned
     * @return Top-left of the slot, nullopt when every row is full
     *
     * A slot overlapping any docked frame (one docked with another size) is
     * skipped in favour of the next row.
     */
    static std::optional<QPointF> findSlot(const QRectF& screen, const QVector<QRectF>& docked,
                                           const QSizeF& compactSize, int maxRow = Defaults::CompactMaxRow);

    void setHighlighter(IHighlighter* highlighter)
    {
        m_highlighter = highlighter;
    }

private:
    QSizeF compactSizeFor(IWindow* window) const;

    UndoMemory* m_memory = nullptr;
    IWindowPlatform* m_windows = nullptr;
    ISettings* m_settings = nullptr;
    IHighlighter* m_highlighter = nullptr;
};

} // namespace WinStepper
