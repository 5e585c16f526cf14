// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "types.h"
#include "winstepper_export.h"
#include <QObject>
#include <QPointF>
#include <QRectF>
#include <QString>
#include <QTimer>

namespace WinStepper {

class IHighlighter;
class ISettings;
class IWindowPlatform;

/**
 * @brief Modifier + pointer move/resize of the window under the cursor
 *
 * Holding the move modifiers while moving the pointer drags the front-most
 * window under it; holding the resize modifiers resizes it from the corner or
 * edge nearest the cursor (3×3 grid; the centre cell moves instead).
 *
 * Input callbacks are the producer: they only accumulate pointer deltas.
 * A fixed-interval timer is the consumer: once per tick it applies the
 * accumulated delta to a locally cached target frame and sends that frame to
 * the window. The consumer never reads the frame back from the window, since
 * slow applications report stale frames that would cancel movement on an axis.
 *
 * Changing the modifier combination away from the one that started the
 * operation ends it immediately and discards any undelivered delta.
 */
class WINSTEPPER_EXPORT PointerDragController : public QObject
{
    Q_OBJECT

public:
    enum class Mode {
        Idle,
        Move,
        Resize
    };
    Q_ENUM(Mode)

    explicit PointerDragController(IWindowPlatform* windows, ISettings* settings = nullptr,
                                   IHighlighter* highlighter = nullptr, QObject* parent = nullptr);
    ~PointerDragController() override;

    /**
     * @brief Pointer moved (producer)
     * @param position Cursor position in global coordinates
     * @param delta Movement since the previous event
     * @param modifiers Modifiers held during the event
     */
    void pointerMoved(const QPointF& position, const QPointF& delta, Qt::KeyboardModifiers modifiers);

    /**
     * @brief Modifier state changed without pointer movement
     */
    void modifiersChanged(Qt::KeyboardModifiers modifiers);

    /**
     * @brief Drain the pending delta into the cached frame (consumer)
     *
     * Runs on every timer tick; public so hosts and tests can drive it.
     */
    void applyPendingDelta();

    /**
     * @brief End the current operation, discarding pending deltas
     */
    void cancel();

    /**
     * @brief Edges resized when grabbing @p frame at @p point
     * @return Edge::None for the centre cell (move instead)
     */
    static Edges computeResizeSection(const QRectF& frame, const QPointF& point);

    Mode mode() const
    {
        return m_mode;
    }
    QString windowId() const
    {
        return m_windowId;
    }
    QRectF targetFrame() const
    {
        return m_targetFrame;
    }
    QPointF pendingDelta() const
    {
        return m_pendingDelta;
    }
    Edges resizeEdges() const
    {
        return m_resizeEdges;
    }
    bool isTicking() const
    {
        return m_tickTimer.isActive();
    }

Q_SIGNALS:
    void operationStarted(WinStepper::PointerDragController::Mode mode, const QString& windowId);
    void operationEnded(const QString& windowId);
    /// Emitted for every input callback, feeds EventSourceWatchdog
    void inputObserved();

private:
    bool modifiersMatch(Qt::KeyboardModifiers modifiers) const;
    void begin(const QPointF& position, Qt::KeyboardModifiers modifiers);

    IWindowPlatform* m_windows = nullptr;
    ISettings* m_settings = nullptr;
    IHighlighter* m_highlighter = nullptr;

    Mode m_mode = Mode::Idle;
    Qt::KeyboardModifiers m_startedWith = Qt::NoModifier;
    QString m_windowId;
    Edges m_resizeEdges;
    QRectF m_targetFrame;
    QPointF m_pendingDelta;
    QTimer m_tickTimer;
};

} // namespace WinStepper
