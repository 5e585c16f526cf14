// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cycleengine.h"
#include "constants.h"
#include "geometryutils.h"
#include "interfaces.h"
#include "logging.h"
#include "undomemory.h"

namespace WinStepper {

using GeometryUtils::fuzzyEqual;

CycleEngine::CycleEngine(UndoMemory* memory, ISettings* settings, IHighlighter* highlighter)
    : m_memory(memory)
    , m_settings(settings)
    , m_highlighter(highlighter)
{
}

qreal CycleEngine::tolerance() const
{
    return m_settings ? m_settings->cycleTolerance() : Defaults::CycleTolerance;
}

void CycleEngine::flash(IWindow* window, Edges edges) const
{
    if (m_highlighter && window) {
        m_highlighter->flash(window->frame(), edges);
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Center toggle
// ═══════════════════════════════════════════════════════════════════════════════

bool CycleEngine::toggleCenter(IWindow* window)
{
    if (!window || !window->screen() || !m_memory) {
        return false;
    }

    const QRectF frame = window->frame();
    const QRectF screen = window->screen()->frame();
    const QString id = window->id();
    const qreal tol = tolerance();

    const qreal centeredY = screen.y() + (screen.height() - frame.height()) / 2.0;
    const qreal centeredX = screen.x() + (screen.width() - frame.width()) / 2.0;

    if (!fuzzyEqual(frame.y(), centeredY, tol)) {
        qCDebug(lcCycle) << "Center: vertical step for" << id;
        m_memory->store(UndoFeature::Center, id, frame, window->screen()->id());
        window->setFrame(QRectF(frame.x(), centeredY, frame.width(), frame.height()));
        flash(window, Edge::Top | Edge::Bottom);
        return true;
    }

    if (!fuzzyEqual(frame.x(), centeredX, tol)) {
        qCDebug(lcCycle) << "Center: horizontal step for" << id;
        // Entered already vertically centred: this is the first step
        m_memory->storeOnce(UndoFeature::Center, id, frame, window->screen()->id());
        window->setFrame(QRectF(centeredX, frame.y(), frame.width(), frame.height()));
        flash(window, Edge::Left | Edge::Right);
        return true;
    }

    const auto saved = m_memory->take(UndoFeature::Center, id);
    if (!saved) {
        qCDebug(lcCycle) << "Center: already centred, nothing to restore for" << id;
        return false;
    }
    qCDebug(lcCycle) << "Center: restore" << saved->frame;
    window->setFrame(saved->frame);
    flash(window, Edge::None);
    return true;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Maximize cycle
// ═══════════════════════════════════════════════════════════════════════════════

bool CycleEngine::toggleMaximize(IWindow* window)
{
    if (!window || !window->screen() || !m_memory) {
        return false;
    }

    const QRectF frame = window->frame();
    const QRectF screen = window->screen()->frame();
    const QString id = window->id();
    const qreal tol = tolerance();

    const bool isMaxHeight = fuzzyEqual(frame.y(), screen.y(), tol) && fuzzyEqual(frame.height(), screen.height(), tol);
    const bool isFullyMaximized = GeometryUtils::fuzzyRectEqual(frame, screen, tol);

    if (isFullyMaximized) {
        const auto saved = m_memory->take(UndoFeature::Maximize, id);
        if (!saved) {
            qCDebug(lcCycle) << "Maximize: fully maximized without saved frame for" << id;
            return false;
        }
        qCDebug(lcCycle) << "Maximize: restore" << saved->frame;
        window->setFrame(saved->frame);
        flash(window, Edge::None);
        return true;
    }

    if (isMaxHeight) {
        qCDebug(lcCycle) << "Maximize: full step for" << id;
        m_memory->storeOnce(UndoFeature::Maximize, id, frame, window->screen()->id());
        window->setFrame(screen);
        flash(window, Edge::Left | Edge::Top | Edge::Right | Edge::Bottom);
        return true;
    }

    qCDebug(lcCycle) << "Maximize: height step for" << id;
    m_memory->store(UndoFeature::Maximize, id, frame, window->screen()->id());
    window->setFrame(QRectF(frame.x(), screen.y(), frame.width(), screen.height()));
    flash(window, Edge::Top | Edge::Bottom);
    return true;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Half / third cycle
// ═══════════════════════════════════════════════════════════════════════════════

QRectF CycleEngine::halfThirdTarget(const QRectF& screen, CycleStep step, Direction side)
{
    qreal width = 0;
    switch (step) {
    case CycleStep::Half:
        width = screen.width() / 2.0;
        break;
    case CycleStep::Third:
    case CycleStep::MidThird:
        width = screen.width() / 3.0;
        break;
    case CycleStep::TwoThirds:
        width = screen.width() * 2.0 / 3.0;
        break;
    case CycleStep::None:
        return QRectF();
    }

    qreal x = side == Direction::Right ? screen.x() + screen.width() - width : screen.x();
    if (step == CycleStep::MidThird) {
        x = screen.x() + (screen.width() - width) / 2.0;
    }
    return QRectF(x, screen.y(), width, screen.height());
}

CycleStep CycleEngine::halfThirdStep(const QRectF& frame, const QRectF& screen, Direction side) const
{
    const qreal tol = tolerance();

    const bool fullHeight = fuzzyEqual(frame.y(), screen.y(), tol) && fuzzyEqual(frame.height(), screen.height(), tol);
    if (!fullHeight) {
        return CycleStep::None;
    }

    const bool aligned = side == Direction::Right
        ? fuzzyEqual(frame.x() + frame.width(), screen.x() + screen.width(), tol)
        : fuzzyEqual(frame.x(), screen.x(), tol);
    const bool centered = fuzzyEqual(frame.center().x(), screen.center().x(), tol);

    const qreal w = frame.width();
    if (aligned && fuzzyEqual(w, screen.width() / 2.0, tol)) {
        return CycleStep::Half;
    }
    if (aligned && fuzzyEqual(w, screen.width() / 3.0, tol)) {
        return CycleStep::Third;
    }
    if (centered && fuzzyEqual(w, screen.width() / 3.0, tol)) {
        return CycleStep::MidThird;
    }
    if (aligned && fuzzyEqual(w, screen.width() * 2.0 / 3.0, tol)) {
        return CycleStep::TwoThirds;
    }
    return CycleStep::None;
}

bool CycleEngine::cycleHalfThird(IWindow* window, Direction side)
{
    if (!isHorizontal(side)) {
        qCWarning(lcCycle) << "Half/third cycle needs a horizontal side, got" << directionToString(side);
        return false;
    }
    if (!window || !window->screen() || !m_memory) {
        return false;
    }

    const QRectF frame = window->frame();
    const QRectF screen = window->screen()->frame();
    const QString id = window->id();
    const CycleStep current = halfThirdStep(frame, screen, side);

    CycleStep next = CycleStep::None;
    switch (current) {
    case CycleStep::None:
        m_memory->store(UndoFeature::HalfThird, id, frame, window->screen()->id());
        next = CycleStep::Half;
        break;
    case CycleStep::Half:
        next = CycleStep::Third;
        break;
    case CycleStep::Third:
        next = CycleStep::MidThird;
        break;
    case CycleStep::MidThird:
        next = CycleStep::TwoThirds;
        break;
    case CycleStep::TwoThirds: {
        const auto saved = m_memory->take(UndoFeature::HalfThird, id);
        if (saved) {
            qCDebug(lcCycle) << "Half/third: restore" << saved->frame;
            window->setFrame(saved->frame);
            flash(window, Edge::None);
            return true;
        }
        // Nothing to restore: start over
        next = CycleStep::Half;
        break;
    }
    }

    qCDebug(lcCycle) << "Half/third" << directionToString(side) << cycleStepToString(current) << "->"
                     << cycleStepToString(next);
    window->setFrame(halfThirdTarget(screen, next, side));
    flash(window, edgeFor(side));
    return true;
}

} // namespace WinStepper
