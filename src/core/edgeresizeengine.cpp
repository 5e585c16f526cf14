// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "edgeresizeengine.h"
#include "constants.h"
#include "geometryutils.h"
#include "interfaces.h"
#include "logging.h"
#include "stepprimitives.h"
#include "undomemory.h"

namespace WinStepper {

namespace {

// Axis helpers: "near" is left/top, "far" is right/bottom
qreal axisPos(const QRectF& rect, bool horizontal)
{
    return horizontal ? rect.x() : rect.y();
}

qreal axisLength(const QRectF& rect, bool horizontal)
{
    return horizontal ? rect.width() : rect.height();
}

QRectF withAxisPos(QRectF rect, bool horizontal, qreal pos)
{
    if (horizontal) {
        rect.moveLeft(pos);
    } else {
        rect.moveTop(pos);
    }
    return rect;
}

QRectF withAxisSpan(QRectF rect, bool horizontal, qreal pos, qreal length)
{
    if (horizontal) {
        rect.setX(pos);
        rect.setWidth(length);
    } else {
        rect.setY(pos);
        rect.setHeight(length);
    }
    return rect;
}

bool isNearDirection(Direction direction)
{
    return direction == Direction::Left || direction == Direction::Up;
}

Edge nearEdge(bool horizontal)
{
    return horizontal ? Edge::Left : Edge::Top;
}

Edge farEdge(bool horizontal)
{
    return horizontal ? Edge::Right : Edge::Bottom;
}

UndoFeature moveSlot(bool horizontal)
{
    return horizontal ? UndoFeature::EdgeMoveX : UndoFeature::EdgeMoveY;
}

UndoFeature resizeSlot(bool horizontal)
{
    return horizontal ? UndoFeature::EdgeResizeX : UndoFeature::EdgeResizeY;
}

} // namespace

EdgeResizeEngine::EdgeResizeEngine(UndoMemory* memory, ISettings* settings, IHighlighter* highlighter)
    : m_memory(memory)
    , m_settings(settings)
    , m_highlighter(highlighter)
{
}

qreal EdgeResizeEngine::tolerance() const
{
    return m_settings ? m_settings->snapTolerance() : Defaults::SnapTolerance;
}

int EdgeResizeEngine::divisions() const
{
    return m_settings ? m_settings->stepDivisions() : Defaults::StepDivisions;
}

void EdgeResizeEngine::flash(IWindow* window, Edges edges) const
{
    if (m_highlighter && window) {
        m_highlighter->flash(window->frame(), edges);
    }
}

bool EdgeResizeEngine::resize(IWindow* window, Direction direction)
{
    if (!window || !window->screen()) {
        return false;
    }

    const bool horizontal = isHorizontal(direction);
    const QRectF frame = window->frame();
    const QRectF screen = window->screen()->frame();
    const qreal eps = tolerance();

    const bool atNear = axisPos(frame, horizontal) <= axisPos(screen, horizontal) + eps;
    const bool atFar = axisPos(frame, horizontal) + axisLength(frame, horizontal)
        >= axisPos(screen, horizontal) + axisLength(screen, horizontal) - eps;

    const Direction shrink = horizontal ? Direction::Left : Direction::Up;
    const Direction grow = horizontal ? Direction::Right : Direction::Down;

    enum class Anchor {
        None,
        Near,
        Far
    };
    Direction primitive = direction;
    Anchor anchor = Anchor::None;

    if (isNearDirection(direction)) {
        if (atNear) {
            // Stuck to the near edge: grow away from it (or shrink in place when spanning)
            primitive = atFar ? shrink : grow;
            anchor = Anchor::Near;
        } else if (atFar) {
            primitive = shrink;
            anchor = Anchor::Far;
        }
    } else {
        if (atFar) {
            primitive = atNear ? shrink : grow;
            anchor = Anchor::Far;
        } else if (atNear) {
            primitive = shrink;
            anchor = Anchor::Near;
        }
    }

    qCDebug(lcCore) << "Edge resize" << directionToString(direction) << "atNear:" << atNear << "atFar:" << atFar
                    << "primitive:" << directionToString(primitive);

    StepPrimitives::stepResize(window, primitive, divisions());

    Edges moved = farEdge(horizontal);
    if (anchor != Anchor::None) {
        // Re-snap from the frame the host actually applied
        const QRectF applied = window->frame();
        const qreal pos = anchor == Anchor::Near
            ? axisPos(screen, horizontal)
            : axisPos(screen, horizontal) + axisLength(screen, horizontal) - axisLength(applied, horizontal);
        window->setFrame(withAxisPos(applied, horizontal, pos));
        moved = anchor == Anchor::Near ? farEdge(horizontal) : nearEdge(horizontal);
    }

    flash(window, moved);
    return true;
}

bool EdgeResizeEngine::moveToEdge(IWindow* window, Direction direction)
{
    if (!window || !window->screen() || !m_memory) {
        return false;
    }

    const bool horizontal = isHorizontal(direction);
    const QRectF frame = window->frame();
    const QRectF screen = window->screen()->frame();
    const qreal eps = tolerance();
    const UndoFeature slot = moveSlot(horizontal);
    const QString id = window->id();

    const qreal nearPos = axisPos(screen, horizontal);
    const qreal farPos = nearPos + axisLength(screen, horizontal) - axisLength(frame, horizontal);
    const qreal target = isNearDirection(direction) ? nearPos : farPos;
    const qreal current = axisPos(frame, horizontal);

    if (GeometryUtils::fuzzyEqual(current, target, eps)) {
        const auto saved = m_memory->take(slot, id);
        if (!saved) {
            qCDebug(lcCore) << "Already at" << directionToString(direction) << "edge, nothing to restore";
            return false;
        }
        window->setFrame(withAxisPos(frame, horizontal, axisPos(saved->frame, horizontal)));
        flash(window, Edge::None);
        return true;
    }

    // A window parked at the other edge by a previous press keeps its original position
    const bool atEitherEdge = GeometryUtils::fuzzyEqual(current, nearPos, eps)
        || GeometryUtils::fuzzyEqual(current, farPos, eps);
    if (!(atEitherEdge && m_memory->has(slot, id))) {
        m_memory->store(slot, id, frame, window->screen()->id());
    }

    window->setFrame(withAxisPos(frame, horizontal, target));
    flash(window, edgeFor(direction));
    return true;
}

bool EdgeResizeEngine::resizeToEdge(IWindow* window, Direction direction)
{
    if (!window || !window->screen() || !m_memory) {
        return false;
    }

    const bool horizontal = isHorizontal(direction);
    const QRectF frame = window->frame();
    const QRectF screen = window->screen()->frame();
    const qreal eps = tolerance();
    const UndoFeature slot = resizeSlot(horizontal);
    const QString id = window->id();

    const qreal screenNear = axisPos(screen, horizontal);
    const qreal screenFar = screenNear + axisLength(screen, horizontal);
    const qreal frameNear = axisPos(frame, horizontal);
    const qreal frameFar = frameNear + axisLength(frame, horizontal);
    const bool towardsNear = isNearDirection(direction);

    const bool atTargetEdge = towardsNear ? frameNear <= screenNear + eps : frameFar >= screenFar - eps;
    if (atTargetEdge) {
        const auto saved = m_memory->take(slot, id);
        if (!saved) {
            qCDebug(lcCore) << "Already extended to" << directionToString(direction) << "edge";
            return false;
        }
        window->setFrame(withAxisSpan(frame, horizontal, axisPos(saved->frame, horizontal),
                                      axisLength(saved->frame, horizontal)));
        flash(window, Edge::None);
        return true;
    }

    const bool atOtherEdge = towardsNear ? frameFar >= screenFar - eps : frameNear <= screenNear + eps;
    if (!(atOtherEdge && m_memory->has(slot, id))) {
        m_memory->store(slot, id, frame, window->screen()->id());
    }

    const QRectF target = towardsNear ? withAxisSpan(frame, horizontal, screenNear, frameFar - screenNear)
                                      : withAxisSpan(frame, horizontal, frameNear, screenFar - frameNear);
    window->setFrame(target);
    flash(window, edgeFor(direction));
    return true;
}

} // namespace WinStepper
