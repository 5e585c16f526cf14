// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "constants.h"
#include "types.h"
#include "winstepper_export.h"
#include <QRectF>

namespace WinStepper {

class IWindow;

/**
 * @brief One-step move/resize primitives
 *
 * A step is 1/divisions of the screen dimension on the axis of the direction.
 * Resizing keeps the top-left corner fixed: Left/Up shrink, Right/Down grow.
 */
namespace StepPrimitives {

WINSTEPPER_EXPORT qreal stepSize(const QRectF& screen, Direction direction, int divisions = Defaults::StepDivisions);

/// Frame translated by one step
WINSTEPPER_EXPORT QRectF steppedMove(const QRectF& frame, const QRectF& screen, Direction direction,
                                     int divisions = Defaults::StepDivisions);

/// Frame resized by one step (never below 1px)
WINSTEPPER_EXPORT QRectF steppedResize(const QRectF& frame, const QRectF& screen, Direction direction,
                                       int divisions = Defaults::StepDivisions);

/**
 * @brief Move the window one step using its own screen
 * @return false if the window or its screen is missing
 */
WINSTEPPER_EXPORT bool stepMove(IWindow* window, Direction direction, int divisions = Defaults::StepDivisions);

/**
 * @brief Resize the window one step using its own screen
 *
 * Reads the window frame fresh; the host may clamp the request.
 */
WINSTEPPER_EXPORT bool stepResize(IWindow* window, Direction direction, int divisions = Defaults::StepDivisions);

} // namespace StepPrimitives

} // namespace WinStepper
