// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "windowcommandservice.h"
#include "constants.h"
#include "interfaces.h"
#include "logging.h"
#include "stepprimitives.h"
#include <QList>
#include <QPair>

namespace WinStepper {

WindowCommandService::WindowCommandService(IWindowPlatform* windows, IScreenPlatform* screens, ISettings* settings,
                                           IHighlighter* highlighter, QObject* parent)
    : QObject(parent)
    , m_windows(windows)
    , m_screens(screens)
    , m_settings(settings)
    , m_edge(&m_memory, settings, highlighter)
    , m_cycle(&m_memory, settings, highlighter)
    , m_shrink(&m_memory, &m_edge, settings, highlighter)
    , m_compact(&m_memory, windows, settings, highlighter)
    , m_crossScreen(&m_memory, screens, settings, highlighter)
    , m_focus(windows, screens, highlighter)
{
}

WindowCommandService::~WindowCommandService() = default;

bool WindowCommandService::runOnFocused(const QString& command, const std::function<bool(IWindow*)>& action,
                                        bool keepsScreenUndo)
{
    IWindow* window = m_windows ? m_windows->focusedWindow() : nullptr;
    if (!window) {
        qCDebug(lcCore) << command << "- no focused window";
        return false;
    }

    m_memory.pruneStale([this](const QString& windowId) {
        return m_windows->windowForId(windowId) != nullptr;
    });

    const QString windowId = window->id();
    if (!keepsScreenUndo) {
        m_crossScreen.clearPendingUndo(windowId);
    }

    const bool changed = action(window);
    if (changed) {
        Q_EMIT commandExecuted(command, windowId);
    }
    return changed;
}

bool WindowCommandService::runFocus(const QString& command, const std::function<bool()>& action)
{
    const bool changed = action();
    if (changed) {
        const QString focusedId = m_focus.lastFocusedId();
        Q_EMIT commandExecuted(command, focusedId);
    }
    return changed;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Geometry commands
// ═══════════════════════════════════════════════════════════════════════════════

bool WindowCommandService::stepMove(Direction direction)
{
    const int divisions = m_settings ? m_settings->stepDivisions() : Defaults::StepDivisions;
    return runOnFocused(QStringLiteral("move:") + directionToString(direction), [=](IWindow* window) {
        return StepPrimitives::stepMove(window, direction, divisions);
    });
}

bool WindowCommandService::smartResize(Direction direction)
{
    return runOnFocused(QStringLiteral("resize:") + directionToString(direction), [=, this](IWindow* window) {
        return m_edge.resize(window, direction);
    });
}

bool WindowCommandService::moveToEdge(Direction direction)
{
    return runOnFocused(QStringLiteral("edge:") + directionToString(direction), [=, this](IWindow* window) {
        return m_edge.moveToEdge(window, direction);
    });
}

bool WindowCommandService::resizeToEdge(Direction direction)
{
    return runOnFocused(QStringLiteral("edge-resize:") + directionToString(direction), [=, this](IWindow* window) {
        return m_edge.resizeToEdge(window, direction);
    });
}

bool WindowCommandService::shrink(Direction direction)
{
    return runOnFocused(QStringLiteral("shrink:") + directionToString(direction), [=, this](IWindow* window) {
        return m_shrink.shrink(window, direction);
    });
}

bool WindowCommandService::toggleCenter()
{
    return runOnFocused(QStringLiteral("center"), [this](IWindow* window) {
        return m_cycle.toggleCenter(window);
    });
}

bool WindowCommandService::toggleMaximize()
{
    return runOnFocused(QStringLiteral("maximize"), [this](IWindow* window) {
        return m_cycle.toggleMaximize(window);
    });
}

bool WindowCommandService::cycleHalfThird(Direction side)
{
    return runOnFocused(QStringLiteral("halves:") + directionToString(side), [=, this](IWindow* window) {
        return m_cycle.cycleHalfThird(window, side);
    });
}

bool WindowCommandService::toggleCompact()
{
    return runOnFocused(QStringLiteral("compact"), [this](IWindow* window) {
        return m_compact.toggle(window);
    });
}

bool WindowCommandService::moveToScreen(ScreenRole role)
{
    return runOnFocused(
        QStringLiteral("screen:") + screenRoleToString(role),
        [=, this](IWindow* window) {
            return m_crossScreen.moveToScreen(window, role);
        },
        true);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Focus commands
// ═══════════════════════════════════════════════════════════════════════════════

bool WindowCommandService::focusDirection(Direction direction)
{
    return runFocus(QStringLiteral("focus:") + directionToString(direction), [=, this] {
        return m_focus.focusDirection(direction);
    });
}

bool WindowCommandService::focusScreen(Direction direction)
{
    return runFocus(QStringLiteral("focus-screen:") + directionToString(direction), [=, this] {
        return m_focus.focusScreen(direction);
    });
}

bool WindowCommandService::flashFocused()
{
    return m_focus.flashFocused();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Text commands
// ═══════════════════════════════════════════════════════════════════════════════

bool WindowCommandService::execute(const QString& command)
{
    const QString trimmed = command.trimmed();
    const qsizetype colon = trimmed.indexOf(QLatin1Char(':'));
    const QString verb = (colon < 0 ? trimmed : trimmed.left(colon)).toLower();
    const QString argument = colon < 0 ? QString() : trimmed.mid(colon + 1);

    if (verb == QLatin1String("center")) {
        return toggleCenter();
    }
    if (verb == QLatin1String("maximize")) {
        return toggleMaximize();
    }
    if (verb == QLatin1String("compact")) {
        return toggleCompact();
    }
    if (verb == QLatin1String("flash")) {
        return flashFocused();
    }

    if (verb == QLatin1String("screen")) {
        const auto role = screenRoleFromString(argument);
        if (!role) {
            qCWarning(lcCore) << "Unknown screen role in command" << command;
            return false;
        }
        return moveToScreen(*role);
    }

    const auto direction = directionFromString(argument);
    using DirectionCommand = bool (WindowCommandService::*)(Direction);
    static const QList<QPair<QLatin1String, DirectionCommand>> directionCommands = {
        {QLatin1String("move"), &WindowCommandService::stepMove},
        {QLatin1String("resize"), &WindowCommandService::smartResize},
        {QLatin1String("edge"), &WindowCommandService::moveToEdge},
        {QLatin1String("edge-resize"), &WindowCommandService::resizeToEdge},
        {QLatin1String("shrink"), &WindowCommandService::shrink},
        {QLatin1String("halves"), &WindowCommandService::cycleHalfThird},
        {QLatin1String("focus"), &WindowCommandService::focusDirection},
        {QLatin1String("focus-screen"), &WindowCommandService::focusScreen},
    };

    for (const auto& entry : directionCommands) {
        if (verb != entry.first) {
            continue;
        }
        if (!direction) {
            qCWarning(lcCore) << "Missing or invalid direction in command" << command;
            return false;
        }
        return (this->*entry.second)(*direction);
    }

    qCWarning(lcCore) << "Unknown command" << command;
    return false;
}

} // namespace WinStepper
