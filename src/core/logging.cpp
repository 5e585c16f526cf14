// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging.h"

namespace WinStepper {

// Core module categories
Q_LOGGING_CATEGORY(lcCore, "winstepper.core", QtInfoMsg)
Q_LOGGING_CATEGORY(lcGeometry, "winstepper.core.geometry", QtInfoMsg)
Q_LOGGING_CATEGORY(lcUndo, "winstepper.core.undo", QtInfoMsg)
Q_LOGGING_CATEGORY(lcCycle, "winstepper.core.cycle", QtInfoMsg)
Q_LOGGING_CATEGORY(lcCompact, "winstepper.core.compact", QtInfoMsg)
Q_LOGGING_CATEGORY(lcScreen, "winstepper.core.screen", QtInfoMsg)
Q_LOGGING_CATEGORY(lcFocus, "winstepper.core.focus", QtInfoMsg)

// Pointer module categories
Q_LOGGING_CATEGORY(lcPointer, "winstepper.pointer", QtInfoMsg)

// Configuration module categories
Q_LOGGING_CATEGORY(lcConfig, "winstepper.config", QtInfoMsg)

} // namespace WinStepper
