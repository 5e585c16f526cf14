// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "constants.h"
#include "types.h"
#include "winstepper_export.h"
#include <QPointF>
#include <QRectF>
#include <QVector>

namespace WinStepper {

class IScreen;

/**
 * @brief Centralized geometry calculation utilities
 *
 * Pure functions on QRectF frames. Every comparison that decides state uses a
 * tolerance: fractional scaling produces frames that are never exactly equal
 * to the computed target.
 */
namespace GeometryUtils {

/**
 * @brief |a - b| < tolerance
 */
WINSTEPPER_EXPORT bool fuzzyEqual(qreal a, qreal b, qreal tolerance);

/**
 * @brief All four components of two frames are within tolerance
 */
WINSTEPPER_EXPORT bool fuzzyRectEqual(const QRectF& a, const QRectF& b, qreal tolerance);

// Edge tests: the frame touches (or overhangs) the screen edge within tolerance
WINSTEPPER_EXPORT bool isAtLeftEdge(const QRectF& frame, const QRectF& screen, qreal tolerance);
WINSTEPPER_EXPORT bool isAtRightEdge(const QRectF& frame, const QRectF& screen, qreal tolerance);
WINSTEPPER_EXPORT bool isAtTopEdge(const QRectF& frame, const QRectF& screen, qreal tolerance);
WINSTEPPER_EXPORT bool isAtBottomEdge(const QRectF& frame, const QRectF& screen, qreal tolerance);

/**
 * @brief Half-open point containment: [x, x+w) × [y, y+h)
 *
 * Adjacent screens share an edge; half-open containment assigns a point on
 * that edge to exactly one of them.
 */
WINSTEPPER_EXPORT bool containsPoint(const QRectF& rect, const QPointF& point);

/**
 * @brief Whether the frame's centre point lies within the screen frame
 *
 * Used instead of the OS-reported owning screen for windows that straddle
 * a screen boundary.
 */
WINSTEPPER_EXPORT bool isCenterOnScreen(const QRectF& frame, const QRectF& screen);

/**
 * @brief Open interval overlap: (a0, a1) ∩ (b0, b1) is non-empty
 */
WINSTEPPER_EXPORT bool intervalsOverlap(qreal a0, qreal a1, qreal b0, qreal b1);

/**
 * @brief Overlap on the axis perpendicular to travel ("shadow")
 * @return Vertical overlap for Left/Right, horizontal overlap for Up/Down
 */
WINSTEPPER_EXPORT bool overlapsPerpendicular(const QRectF& a, const QRectF& b, Direction direction);

/**
 * @brief The 5 visibility sample points: 4 corners inset by @p inset plus the centre
 */
WINSTEPPER_EXPORT QVector<QPointF> visibilitySamplePoints(const QRectF& frame,
                                                          qreal inset = Defaults::VisibilitySampleInset);

/**
 * @brief Whether a frame is at least partly visible below the given frames
 * @param frame Frame under test
 * @param framesInFront Frames strictly above it in z-order
 * @param inset Corner inset of the sample points
 * @return true if any sample point is not covered by any frame in front
 */
WINSTEPPER_EXPORT bool isFrameVisible(const QRectF& frame, const QVector<QRectF>& framesInFront,
                                      qreal inset = Defaults::VisibilitySampleInset);

/**
 * @brief Fit a frame inside the screen: size capped to the screen, position moved inside
 */
WINSTEPPER_EXPORT QRectF clampToScreen(const QRectF& frame, const QRectF& screen);

/**
 * @brief Nearest screen lying in a direction from another screen
 * @param screens All screens
 * @param from Source screen
 * @param direction Travel direction
 * @return Neighbour screen or nullptr
 *
 * A candidate qualifies when its centre lies beyond the source's edge in the
 * travel direction. Candidates overlapping the source on the perpendicular
 * axis are preferred, ties broken by centre distance.
 */
WINSTEPPER_EXPORT IScreen* screenInDirection(const QVector<IScreen*>& screens, IScreen* from, Direction direction);

} // namespace GeometryUtils

} // namespace WinStepper
