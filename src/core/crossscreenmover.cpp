// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "crossscreenmover.h"
#include "constants.h"
#include "geometryutils.h"
#include "interfaces.h"
#include "logging.h"
#include "screenmap.h"
#include "undomemory.h"

namespace WinStepper {

CrossScreenMover::CrossScreenMover(UndoMemory* memory, IScreenPlatform* screens, ISettings* settings,
                                   IHighlighter* highlighter)
    : m_memory(memory)
    , m_screens(screens)
    , m_settings(settings)
    , m_highlighter(highlighter)
{
}

void CrossScreenMover::clearPendingUndo(const QString& windowId)
{
    if (m_memory) {
        m_memory->clear(UndoFeature::CrossScreenUndo, windowId);
        dropNaturalSnapshot(windowId);
    }
}

void CrossScreenMover::snapshotNaturalMemory(const QString& windowId)
{
    dropNaturalSnapshot(windowId);
    if (const auto size = m_memory->saved(UndoFeature::NaturalSize, windowId)) {
        m_memory->store(UndoFeature::NaturalSizeBeforeMove, windowId, size->frame, size->screenId);
    }
    if (const auto position = m_memory->saved(UndoFeature::NaturalPosition, windowId)) {
        m_memory->store(UndoFeature::NaturalPositionBeforeMove, windowId, position->frame, position->screenId);
    }
}

void CrossScreenMover::restoreNaturalMemory(const QString& windowId)
{
    m_memory->clear(UndoFeature::NaturalSize, windowId);
    m_memory->clear(UndoFeature::NaturalPosition, windowId);
    if (const auto size = m_memory->take(UndoFeature::NaturalSizeBeforeMove, windowId)) {
        m_memory->store(UndoFeature::NaturalSize, windowId, size->frame, size->screenId);
    }
    if (const auto position = m_memory->take(UndoFeature::NaturalPositionBeforeMove, windowId)) {
        m_memory->store(UndoFeature::NaturalPosition, windowId, position->frame, position->screenId);
    }
}

void CrossScreenMover::dropNaturalSnapshot(const QString& windowId)
{
    m_memory->clear(UndoFeature::NaturalSizeBeforeMove, windowId);
    m_memory->clear(UndoFeature::NaturalPositionBeforeMove, windowId);
}

bool CrossScreenMover::moveToScreen(IWindow* window, ScreenRole role)
{
    if (!window || !window->screen() || !m_memory || !m_screens) {
        return false;
    }

    const ScreenMap map = ScreenMap::build(m_screens, m_settings ? m_settings->screenNameOverrides()
                                                                 : QMap<ScreenRole, QString>());
    IScreen* target = map.screenFor(role);
    if (!target) {
        qCDebug(lcScreen) << "No screen for role" << screenRoleToString(role);
        return false;
    }

    const QString id = window->id();
    IScreen* current = window->screen();

    // Same command again, shortly after, while still on the landed screen: undo
    if (const auto pending = m_memory->saved(UndoFeature::CrossScreenUndo, id)) {
        const int undoWindowMs = m_settings ? m_settings->crossScreenUndoWindowMs()
                                            : Defaults::CrossScreenUndoWindowMs;
        const qint64 age = m_memory->now() - pending->timestampMs;
        if (pending->screenId == target->id() && current->id() == target->id() && age <= undoWindowMs) {
            qCDebug(lcScreen) << "Undo move to" << screenRoleToString(role) << "after" << age << "ms";
            m_memory->clear(UndoFeature::CrossScreenUndo, id);
            // Natural memory goes back to what it was before the move
            restoreNaturalMemory(id);
            window->setFrame(pending->frame);
            if (m_highlighter) {
                m_highlighter->flash(pending->frame, Edge::None);
            }
            return true;
        }
        clearPendingUndo(id);
    }

    const QRectF previous = window->frame();
    if (current->id() == target->id()) {
        qCDebug(lcScreen) << id << "is already on" << target->name();
        return false;
    }
    snapshotNaturalMemory(id);
    if (!moveToScreen(window, target)) {
        dropNaturalSnapshot(id);
        return false;
    }
    m_memory->store(UndoFeature::CrossScreenUndo, id, previous, target->id());
    return true;
}

bool CrossScreenMover::moveToScreen(IWindow* window, IScreen* target)
{
    if (!window || !window->screen() || !target || !m_memory) {
        return false;
    }

    IScreen* current = window->screen();
    if (current->id() == target->id()) {
        qCDebug(lcScreen) << window->id() << "is already on" << target->name();
        return false;
    }

    const QRectF landed = relocate(window, current->frame(), target->frame());
    qCDebug(lcScreen) << "Move" << window->id() << current->name() << "->" << target->name() << landed;
    window->setFrame(landed);
    if (m_highlighter) {
        m_highlighter->flash(landed, Edge::None);
    }
    return true;
}

QRectF CrossScreenMover::relocate(IWindow* window, const QRectF& source, const QRectF& target)
{
    const QString id = window->id();
    const QRectF frame = window->frame();
    const qreal snap = Defaults::CrossScreenEdgeSnap;
    if (source.isEmpty() || target.isEmpty()) {
        return GeometryUtils::clampToScreen(frame, target);
    }

    // Size: restore the natural size when it fits, otherwise shrink to fit
    QSizeF size = frame.size();
    const auto natural = m_memory->saved(UndoFeature::NaturalSize, id);
    if (natural && natural->frame.width() <= target.width() && natural->frame.height() <= target.height()) {
        size = natural->frame.size();
        m_memory->clear(UndoFeature::NaturalSize, id);
        qCDebug(lcScreen) << "Restored natural size" << size;
    } else {
        if (size.width() > target.width() || size.height() > target.height()) {
            m_memory->storeOnce(UndoFeature::NaturalSize, id, frame);
        }
        size = size.boundedTo(target.size());
    }

    const qreal offsetX = frame.x() - source.x();
    const qreal offsetY = frame.y() - source.y();

    // Position: natural offset when it fits, otherwise proportional with edge snap
    const auto naturalPos = m_memory->saved(UndoFeature::NaturalPosition, id);
    if (naturalPos) {
        const qreal natX = naturalPos->frame.x();
        const qreal natY = naturalPos->frame.y();
        if (natX >= 0 && natX + size.width() <= target.width() && natY >= 0
            && natY + size.height() <= target.height()) {
            m_memory->clear(UndoFeature::NaturalPosition, id);
            return QRectF(QPointF(target.x() + natX, target.y() + natY), size);
        }
    }

    const bool atLeft = GeometryUtils::isAtLeftEdge(frame, source, snap);
    const bool atRight = GeometryUtils::isAtRightEdge(frame, source, snap);
    const bool atTop = GeometryUtils::isAtTopEdge(frame, source, snap);
    const bool atBottom = GeometryUtils::isAtBottomEdge(frame, source, snap);

    qreal x = target.x() + (offsetX / source.width()) * target.width();
    if (atRight && !atLeft) {
        x = target.x() + target.width() - size.width();
    } else if (atLeft && !atRight) {
        x = target.x();
    }

    qreal y = target.y() + (offsetY / source.height()) * target.height();
    if (atBottom && !atTop) {
        y = target.y() + target.height() - size.height();
    } else if (atTop && !atBottom) {
        y = target.y();
    }

    const QRectF mapped(QPointF(x, y), size);
    const QRectF clamped = GeometryUtils::clampToScreen(mapped, target);
    if (clamped.topLeft() != mapped.topLeft()) {
        m_memory->storeOnce(UndoFeature::NaturalPosition, id, QRectF(QPointF(offsetX, offsetY), frame.size()));
    }
    return clamped;
}

} // namespace WinStepper
