// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "compactplacer.h"
#include "crossscreenmover.h"
#include "cycleengine.h"
#include "edgeresizeengine.h"
#include "focusnavigator.h"
#include "shrinktoggle.h"
#include "types.h"
#include "undomemory.h"
#include "winstepper_export.h"
#include <QObject>
#include <QString>
#include <functional>

namespace WinStepper {

class IHighlighter;
class IScreenPlatform;
class ISettings;
class IWindow;
class IWindowPlatform;

/**
 * @brief Entry point for keyboard commands
 *
 * Owns the undo memory and every engine. Each operation acts on the focused
 * window and depends only on its argument, so any binding scheme (global
 * shortcuts, a command socket, a scripting host) can drive it, either through
 * the typed methods or through execute() with a "verb:argument" string.
 *
 * Before each command, undo entries of windows that no longer exist are
 * pruned. Any command other than a repeated screen move cancels the pending
 * cross-screen undo of the window.
 */
class WINSTEPPER_EXPORT WindowCommandService : public QObject
{
    Q_OBJECT

public:
    explicit WindowCommandService(IWindowPlatform* windows, IScreenPlatform* screens, ISettings* settings = nullptr,
                                  IHighlighter* highlighter = nullptr, QObject* parent = nullptr);
    ~WindowCommandService() override;

    // ═══════════════════════════════════════════════════════════════════════════
    // Geometry commands (focused window)
    // ═══════════════════════════════════════════════════════════════════════════

    bool stepMove(Direction direction);
    bool smartResize(Direction direction);
    bool moveToEdge(Direction direction);
    bool resizeToEdge(Direction direction);
    bool shrink(Direction direction);
    bool toggleCenter();
    bool toggleMaximize();
    bool cycleHalfThird(Direction side);
    bool toggleCompact();
    bool moveToScreen(ScreenRole role);

    // ═══════════════════════════════════════════════════════════════════════════
    // Focus commands
    // ═══════════════════════════════════════════════════════════════════════════

    bool focusDirection(Direction direction);
    bool focusScreen(Direction direction);
    bool flashFocused();

    /**
     * @brief Run a command given as text
     * @param command "verb" or "verb:argument", e.g. "move:left", "screen:top", "center"
     * @return false for unknown commands and for commands that did nothing
     */
    bool execute(const QString& command);

    UndoMemory* undoMemory()
    {
        return &m_memory;
    }
    CycleEngine* cycleEngine()
    {
        return &m_cycle;
    }
    FocusNavigator* focusNavigator()
    {
        return &m_focus;
    }

Q_SIGNALS:
    void commandExecuted(const QString& command, const QString& windowId);

private:
    bool runOnFocused(const QString& command, const std::function<bool(IWindow*)>& action,
                      bool keepsScreenUndo = false);
    bool runFocus(const QString& command, const std::function<bool()>& action);

    IWindowPlatform* m_windows = nullptr;
    IScreenPlatform* m_screens = nullptr;
    ISettings* m_settings = nullptr;

    UndoMemory m_memory;
    EdgeResizeEngine m_edge;
    CycleEngine m_cycle;
    ShrinkToggle m_shrink;
    CompactPlacer m_compact;
    CrossScreenMover m_crossScreen;
    FocusNavigator m_focus;
};

} // namespace WinStepper
