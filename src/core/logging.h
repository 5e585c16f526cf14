// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "winstepper_export.h"
#include <QLoggingCategory>

/**
 * @file logging.h
 * @brief Centralized logging categories for WinStepper
 *
 * Use these categories instead of plain qDebug/qWarning.
 *
 * Usage:
 *   #include "logging.h"
 *   qCDebug(lcCycle) << "Debug message";
 *   qCInfo(lcCompact) << "Info message";
 *   qCWarning(lcConfig) << "Warning message";
 *
 * Runtime filtering via environment variable:
 *   QT_LOGGING_RULES="winstepper.*=true"                 # Enable all
 *   QT_LOGGING_RULES="winstepper.*.debug=false"          # Disable debug only
 *   QT_LOGGING_RULES="winstepper.core.focus=true"        # Enable focus navigation only
 *
 * Severity Guidelines:
 *   qCDebug    - Decision tracing (which branch, which cycle step)
 *   qCInfo     - Significant operational events (window docked, event source restarted)
 *   qCWarning  - Recoverable errors, invalid input, bad config values
 *   qCCritical - System failures preventing normal operation
 */

namespace WinStepper {

// Core module - engines, geometry, undo memory
WINSTEPPER_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcCore)
WINSTEPPER_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcGeometry)
WINSTEPPER_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcUndo)
WINSTEPPER_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcCycle)
WINSTEPPER_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcCompact)
WINSTEPPER_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcScreen)
WINSTEPPER_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcFocus)

// Pointer module - drag/resize controller, event source watchdog
WINSTEPPER_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcPointer)

// Configuration module - settings loading/saving
WINSTEPPER_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcConfig)

} // namespace WinStepper
