// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QtGlobal>
#include <QtCore/qnamespace.h>

namespace WinStepper {

/**
 * @brief Default values for core module constants
 *
 * These defaults are used by engines when no ISettings is injected.
 * For user-configurable settings, see ConfigDefaults and winstepper.kcfg.
 *
 * Structural constants (sample inset, row cap, drag minimum) are NOT in .kcfg.
 */
namespace Defaults {
// Stepping
constexpr int StepDivisions = 30; // One step = 1/30 of the screen dimension
constexpr int ShrinkMaxIterations = 30;

// Tolerances (pixels) absorbing fractional scaling and Retina rounding
constexpr qreal SnapTolerance = 5.0;
constexpr qreal CycleTolerance = 10.0;

// Compact dock
constexpr int CompactWidth = 400;
constexpr int CompactHeight = 300;
constexpr int CompactMaxRow = 10; // Rows 0..10 are scanned

// Cross-screen relocation
constexpr qreal CrossScreenEdgeSnap = 5.0;
constexpr int CrossScreenUndoWindowMs = 2000;

// Focus navigation
constexpr qreal VisibilitySampleInset = 5.0;

// Pointer drag/resize
constexpr int DragIntervalMs = 33; // ~30 FPS consumer tick
constexpr qreal MinimumDragSize = 50.0;
constexpr int WatchdogIntervalMs = 3000;
constexpr int WatchdogStaleMs = 10000;
constexpr Qt::KeyboardModifiers MoveModifiers{Qt::MetaModifier};
constexpr Qt::KeyboardModifiers ResizeModifiers{Qt::MetaModifier | Qt::ShiftModifier};

// Visual feedback
constexpr int HighlightDurationMs = 300;
}

} // namespace WinStepper
