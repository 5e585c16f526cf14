// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "types.h"
#include "winstepper_export.h"
#include <QRectF>
#include <QSizeF>
#include <QString>

namespace WinStepper {

class IHighlighter;
class IScreen;
class IScreenPlatform;
class ISettings;
class IWindow;
class UndoMemory;

/**
 * @brief Moves a window to the screen holding a spatial role
 *
 * The window keeps its apparent position: its offset from the source screen
 * origin is mapped proportionally onto the target, and a window touching one
 * edge (but not spanning the axis) lands on the same edge of the target.
 *
 * A window too large for the target is shrunk to fit and its natural size is
 * remembered (write-once); it grows back on the next move to a screen where
 * the natural size fits. The pre-clamp position offset is remembered the same
 * way.
 *
 * Repeating the same move within the undo window, while the window is still
 * on the screen it landed on, puts it back where it was.
 */
class WINSTEPPER_EXPORT CrossScreenMover
{
public:
    CrossScreenMover(UndoMemory* memory, IScreenPlatform* screens, ISettings* settings = nullptr,
                     IHighlighter* highlighter = nullptr);

    /**
     * @brief Move to the screen with the role in the current ScreenMap
     * @return false if no screen has the role or the window is already there
     */
    bool moveToScreen(IWindow* window, ScreenRole role);

    /**
     * @brief Move to an explicit screen (no undo bookkeeping)
     */
    bool moveToScreen(IWindow* window, IScreen* target);

    /**
     * @brief Forget the pending undo of a window
     *
     * Called for every other command applied to the window.
     */
    void clearPendingUndo(const QString& windowId);

    void setHighlighter(IHighlighter* highlighter)
    {
        m_highlighter = highlighter;
    }

private:
    void snapshotNaturalMemory(const QString& windowId);
    void restoreNaturalMemory(const QString& windowId);
    void dropNaturalSnapshot(const QString& windowId);
    QRectF relocate(IWindow* window, const QRectF& source, const QRectF& target);

    UndoMemory* m_memory = nullptr;
    IScreenPlatform* m_screens = nullptr;
    ISettings* m_settings = nullptr;
    IHighlighter* m_highlighter = nullptr;
};

} // namespace WinStepper
