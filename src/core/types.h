// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "winstepper_export.h"
#include <QFlags>
#include <QString>
#include <optional>

namespace WinStepper {

// ═══════════════════════════════════════════════════════════════════════════════
// Shared Types
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Direction of a keyboard command
 *
 * Left/Right act on the horizontal axis, Up/Down on the vertical axis.
 * Coordinates follow Qt: origin top-left, Y grows downward.
 */
enum class Direction {
    Left,
    Right,
    Up,
    Down
};

/**
 * @brief Spatial role of a screen relative to the built-in/primary display
 */
enum class ScreenRole {
    Bottom, ///< The anchor (built-in or primary display)
    Center, ///< Nearest screen above the anchor
    Top, ///< Second screen above the anchor (or the only one)
    Left, ///< Leftmost screen beside the anchor
    Right ///< Rightmost screen beside the anchor
};

/**
 * @brief Screen edge flags used for highlight emphasis
 */
enum class Edge {
    None = 0x0,
    Left = 0x1,
    Top = 0x2,
    Right = 0x4,
    Bottom = 0x8
};
Q_DECLARE_FLAGS(Edges, Edge)
Q_DECLARE_OPERATORS_FOR_FLAGS(Edges)

/**
 * @brief Feature families with independent undo slots
 *
 * Each family keeps its own saved frame per window, so one feature never
 * clobbers the state of another.
 */
enum class UndoFeature {
    EdgeMoveX,
    EdgeMoveY,
    EdgeResizeX,
    EdgeResizeY,
    ShrinkWidth,
    ShrinkHeight,
    Maximize,
    Center,
    HalfThird,
    Compact,
    NaturalSize,
    NaturalPosition,
    CrossScreenUndo,
    NaturalSizeBeforeMove, ///< NaturalSize as it was before the pending cross-screen move
    NaturalPositionBeforeMove
};

/**
 * @brief Step of the half/third cycle detected from geometry
 */
enum class CycleStep {
    None,
    Half,
    Third,
    MidThird,
    TwoThirds
};

WINSTEPPER_EXPORT bool isHorizontal(Direction direction);

/**
 * @brief Edge that faces the given direction (Left -> Edge::Left, Up -> Edge::Top)
 */
WINSTEPPER_EXPORT Edge edgeFor(Direction direction);

WINSTEPPER_EXPORT QString directionToString(Direction direction);
WINSTEPPER_EXPORT std::optional<Direction> directionFromString(const QString& name);

WINSTEPPER_EXPORT QString screenRoleToString(ScreenRole role);
WINSTEPPER_EXPORT std::optional<ScreenRole> screenRoleFromString(const QString& name);

WINSTEPPER_EXPORT QString cycleStepToString(CycleStep step);

} // namespace WinStepper
