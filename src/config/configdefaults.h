// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "winstepper.h" // Generated from winstepper.kcfg via KConfigXT

#include <Qt>

namespace WinStepper {

/**
 * @brief Provides static access to default configuration values
 *
 * This class wraps the KConfigXT-generated WinStepperConfig class to provide
 * static access to default values. The .kcfg file is the single source of
 * truth for all user-configurable defaults.
 *
 * Usage:
 *   int steps = ConfigDefaults::stepDivisions();  // Returns 30 (from .kcfg)
 */
class ConfigDefaults
{
public:
    // ═══════════════════════════════════════════════════════════════════════════
    // Stepping
    // ═══════════════════════════════════════════════════════════════════════════

    static int stepDivisions() { return instance().defaultStepDivisionsValue(); }
    static int shrinkMaxIterations() { return instance().defaultShrinkMaxIterationsValue(); }

    // ═══════════════════════════════════════════════════════════════════════════
    // Tolerances
    // ═══════════════════════════════════════════════════════════════════════════

    static double snapTolerance() { return instance().defaultSnapToleranceValue(); }
    static double cycleTolerance() { return instance().defaultCycleToleranceValue(); }

    // ═══════════════════════════════════════════════════════════════════════════
    // Compact dock / cross-screen
    // ═══════════════════════════════════════════════════════════════════════════

    static int compactWidth() { return instance().defaultCompactWidthValue(); }
    static int compactHeight() { return instance().defaultCompactHeightValue(); }
    static int crossScreenUndoWindowMs() { return instance().defaultUndoWindowMsValue(); }

    // ═══════════════════════════════════════════════════════════════════════════
    // Pointer
    // ═══════════════════════════════════════════════════════════════════════════

    static int dragIntervalMs() { return instance().defaultDragIntervalMsValue(); }
    static int watchdogIntervalMs() { return instance().defaultWatchdogIntervalMsValue(); }
    static int watchdogStaleMs() { return instance().defaultWatchdogStaleMsValue(); }
    static Qt::KeyboardModifiers moveModifiers()
    {
        return Qt::KeyboardModifiers::fromInt(instance().defaultMoveModifiersValue());
    }
    static Qt::KeyboardModifiers resizeModifiers()
    {
        return Qt::KeyboardModifiers::fromInt(instance().defaultResizeModifiersValue());
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Feedback
    // ═══════════════════════════════════════════════════════════════════════════

    static int highlightDurationMs() { return instance().defaultHighlightDurationMsValue(); }

private:
    // Lazily-initialized singleton instance
    static WinStepperConfig& instance()
    {
        static WinStepperConfig config;
        return config;
    }

    // Non-instantiable
    ConfigDefaults() = delete;
};

} // namespace WinStepper
