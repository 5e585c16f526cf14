// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "geometryutils.h"
#include "interfaces.h"
#include "logging.h"
#include <QLineF>
#include <algorithm>
#include <limits>

namespace WinStepper {

namespace GeometryUtils {

bool fuzzyEqual(qreal a, qreal b, qreal tolerance)
{
    return qAbs(a - b) < tolerance;
}

bool fuzzyRectEqual(const QRectF& a, const QRectF& b, qreal tolerance)
{
    return fuzzyEqual(a.x(), b.x(), tolerance) && fuzzyEqual(a.y(), b.y(), tolerance)
        && fuzzyEqual(a.width(), b.width(), tolerance) && fuzzyEqual(a.height(), b.height(), tolerance);
}

bool isAtLeftEdge(const QRectF& frame, const QRectF& screen, qreal tolerance)
{
    return frame.x() <= screen.x() + tolerance;
}

bool isAtRightEdge(const QRectF& frame, const QRectF& screen, qreal tolerance)
{
    return frame.x() + frame.width() >= screen.x() + screen.width() - tolerance;
}

bool isAtTopEdge(const QRectF& frame, const QRectF& screen, qreal tolerance)
{
    return frame.y() <= screen.y() + tolerance;
}

bool isAtBottomEdge(const QRectF& frame, const QRectF& screen, qreal tolerance)
{
    return frame.y() + frame.height() >= screen.y() + screen.height() - tolerance;
}

bool containsPoint(const QRectF& rect, const QPointF& point)
{
    return point.x() >= rect.x() && point.x() < rect.x() + rect.width() && point.y() >= rect.y()
        && point.y() < rect.y() + rect.height();
}

bool isCenterOnScreen(const QRectF& frame, const QRectF& screen)
{
    return containsPoint(screen, frame.center());
}

bool intervalsOverlap(qreal a0, qreal a1, qreal b0, qreal b1)
{
    return a0 < b1 && b0 < a1;
}

bool overlapsPerpendicular(const QRectF& a, const QRectF& b, Direction direction)
{
    if (isHorizontal(direction)) {
        return intervalsOverlap(a.y(), a.y() + a.height(), b.y(), b.y() + b.height());
    }
    return intervalsOverlap(a.x(), a.x() + a.width(), b.x(), b.x() + b.width());
}

QVector<QPointF> visibilitySamplePoints(const QRectF& frame, qreal inset)
{
    const qreal left = frame.x() + inset;
    const qreal top = frame.y() + inset;
    const qreal right = frame.x() + frame.width() - inset;
    const qreal bottom = frame.y() + frame.height() - inset;

    return {QPointF(left, top), QPointF(right, top), QPointF(left, bottom), QPointF(right, bottom), frame.center()};
}

bool isFrameVisible(const QRectF& frame, const QVector<QRectF>& framesInFront, qreal inset)
{
    const QVector<QPointF> samples = visibilitySamplePoints(frame, inset);
    for (const QPointF& sample : samples) {
        const bool covered = std::any_of(framesInFront.cbegin(), framesInFront.cend(), [&sample](const QRectF& above) {
            return containsPoint(above, sample);
        });
        if (!covered) {
            return true;
        }
    }
    return false;
}

QRectF clampToScreen(const QRectF& frame, const QRectF& screen)
{
    const qreal width = qMin(frame.width(), screen.width());
    const qreal height = qMin(frame.height(), screen.height());
    const qreal x = qBound(screen.x(), frame.x(), screen.x() + screen.width() - width);
    const qreal y = qBound(screen.y(), frame.y(), screen.y() + screen.height() - height);
    return QRectF(x, y, width, height);
}

IScreen* screenInDirection(const QVector<IScreen*>& screens, IScreen* from, Direction direction)
{
    if (!from) {
        return nullptr;
    }

    const QRectF source = from->frame();
    IScreen* best = nullptr;
    bool bestOverlaps = false;
    qreal bestDistance = std::numeric_limits<qreal>::max();

    for (IScreen* candidate : screens) {
        if (!candidate || candidate == from) {
            continue;
        }

        const QRectF target = candidate->frame();
        const QPointF center = target.center();
        bool beyond = false;
        switch (direction) {
        case Direction::Left:
            beyond = center.x() < source.x();
            break;
        case Direction::Right:
            beyond = center.x() >= source.x() + source.width();
            break;
        case Direction::Up:
            beyond = center.y() < source.y();
            break;
        case Direction::Down:
            beyond = center.y() >= source.y() + source.height();
            break;
        }
        if (!beyond) {
            continue;
        }

        const bool overlaps = overlapsPerpendicular(source, target, direction);
        const qreal distance = QLineF(source.center(), center).length();
        if (!best || (overlaps && !bestOverlaps) || (overlaps == bestOverlaps && distance < bestDistance)) {
            best = candidate;
            bestOverlaps = overlaps;
            bestDistance = distance;
        }
    }

    if (best) {
        qCDebug(lcGeometry) << "Screen" << directionToString(direction) << "of" << from->name() << "is"
                            << best->name();
    }
    return best;
}

} // namespace GeometryUtils

} // namespace WinStepper
