// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "pointerdragcontroller.h"
#include "constants.h"
#include "interfaces.h"
#include "logging.h"

namespace WinStepper {

PointerDragController::PointerDragController(IWindowPlatform* windows, ISettings* settings,
                                             IHighlighter* highlighter, QObject* parent)
    : QObject(parent)
    , m_windows(windows)
    , m_settings(settings)
    , m_highlighter(highlighter)
{
    m_tickTimer.setInterval(m_settings ? m_settings->dragIntervalMs() : Defaults::DragIntervalMs);
    connect(&m_tickTimer, &QTimer::timeout, this, &PointerDragController::applyPendingDelta);
}

PointerDragController::~PointerDragController() = default;

Edges PointerDragController::computeResizeSection(const QRectF& frame, const QPointF& point)
{
    const qreal relX = point.x() - frame.x();
    const qreal relY = point.y() - frame.y();

    Edges edges;
    if (relX < frame.width() / 3.0) {
        edges |= Edge::Left;
    } else if (relX > 2.0 * frame.width() / 3.0) {
        edges |= Edge::Right;
    }
    if (relY < frame.height() / 3.0) {
        edges |= Edge::Top;
    } else if (relY > 2.0 * frame.height() / 3.0) {
        edges |= Edge::Bottom;
    }
    return edges;
}

bool PointerDragController::modifiersMatch(Qt::KeyboardModifiers modifiers) const
{
    return modifiers == m_startedWith;
}

void PointerDragController::modifiersChanged(Qt::KeyboardModifiers modifiers)
{
    Q_EMIT inputObserved();
    if (m_mode != Mode::Idle && !modifiersMatch(modifiers)) {
        qCDebug(lcPointer) << "Modifiers changed, ending" << m_mode;
        cancel();
    }
}

void PointerDragController::pointerMoved(const QPointF& position, const QPointF& delta,
                                         Qt::KeyboardModifiers modifiers)
{
    Q_EMIT inputObserved();

    if (m_mode != Mode::Idle && !modifiersMatch(modifiers)) {
        qCDebug(lcPointer) << "Modifiers changed, ending" << m_mode;
        cancel();
    }

    if (m_mode == Mode::Idle) {
        begin(position, modifiers);
        return;
    }

    m_pendingDelta += delta;
}

void PointerDragController::begin(const QPointF& position, Qt::KeyboardModifiers modifiers)
{
    if (!m_windows || modifiers == Qt::NoModifier) {
        return;
    }

    const Qt::KeyboardModifiers moveMods = m_settings ? m_settings->moveModifiers() : Defaults::MoveModifiers;
    const Qt::KeyboardModifiers resizeMods = m_settings ? m_settings->resizeModifiers() : Defaults::ResizeModifiers;

    const bool wantsResize = modifiers == resizeMods;
    const bool wantsMove = modifiers == moveMods;
    if (!wantsResize && !wantsMove) {
        return;
    }

    IWindow* window = m_windows->windowAt(position);
    if (!window) {
        return;
    }

    const QRectF frame = window->frame();
    m_resizeEdges = wantsResize ? computeResizeSection(frame, position) : Edges();
    m_mode = m_resizeEdges == Edges() ? Mode::Move : Mode::Resize;
    m_startedWith = modifiers;
    m_windowId = window->id();
    m_targetFrame = frame;
    m_pendingDelta = QPointF();

    window->raise();
    if (m_highlighter) {
        m_highlighter->showBorder(frame);
    }
    m_tickTimer.setInterval(m_settings ? m_settings->dragIntervalMs() : Defaults::DragIntervalMs);
    m_tickTimer.start();

    qCDebug(lcPointer) << "Started" << m_mode << "of" << m_windowId << "edges" << m_resizeEdges;
    Q_EMIT operationStarted(m_mode, m_windowId);
}

void PointerDragController::applyPendingDelta()
{
    if (m_mode == Mode::Idle) {
        m_tickTimer.stop();
        return;
    }

    IWindow* window = m_windows ? m_windows->windowForId(m_windowId) : nullptr;
    if (!window || !window->isVisible()) {
        qCDebug(lcPointer) << "Window" << m_windowId << "went away during" << m_mode;
        cancel();
        return;
    }

    if (m_pendingDelta.isNull()) {
        return;
    }
    const qreal dx = m_pendingDelta.x();
    const qreal dy = m_pendingDelta.y();
    m_pendingDelta = QPointF();

    // Only the cached frame is trusted as baseline
    QRectF frame = m_targetFrame;
    if (m_mode == Mode::Move) {
        frame.translate(dx, dy);
    } else {
        const qreal minimum = Defaults::MinimumDragSize;
        if (m_resizeEdges.testFlag(Edge::Left)) {
            const qreal right = frame.x() + frame.width();
            const qreal width = qMax(minimum, frame.width() - dx);
            frame.setX(right - width);
            frame.setWidth(width);
        } else if (m_resizeEdges.testFlag(Edge::Right)) {
            frame.setWidth(qMax(minimum, frame.width() + dx));
        }
        if (m_resizeEdges.testFlag(Edge::Top)) {
            const qreal bottom = frame.y() + frame.height();
            const qreal height = qMax(minimum, frame.height() - dy);
            frame.setY(bottom - height);
            frame.setHeight(height);
        } else if (m_resizeEdges.testFlag(Edge::Bottom)) {
            frame.setHeight(qMax(minimum, frame.height() + dy));
        }
    }

    m_targetFrame = frame;
    window->setFrame(frame);
    if (m_highlighter) {
        m_highlighter->showBorder(frame);
    }
}

void PointerDragController::cancel()
{
    if (m_mode == Mode::Idle) {
        return;
    }

    const QString windowId = m_windowId;
    m_mode = Mode::Idle;
    m_startedWith = Qt::NoModifier;
    m_windowId.clear();
    m_resizeEdges = Edges();
    m_targetFrame = QRectF();
    m_pendingDelta = QPointF();
    m_tickTimer.stop();
    if (m_highlighter) {
        m_highlighter->hideBorder();
    }
    Q_EMIT operationEnded(windowId);
}

} // namespace WinStepper
