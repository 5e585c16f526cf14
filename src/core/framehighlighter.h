// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "interfaces.h"
#include "winstepper_export.h"
#include <QObject>
#include <QRectF>
#include <QTimer>

namespace WinStepper {

/**
 * @brief Highlight state for an external renderer
 *
 * Holds the transient flash and the persistent drag border and publishes them
 * as signals; drawing is left to whoever listens. A flash hides itself after
 * HighlightDurationMs; a new flash replaces the current one and restarts the
 * timeout.
 */
class WINSTEPPER_EXPORT FrameHighlighter : public QObject, public IHighlighter
{
    Q_OBJECT

public:
    explicit FrameHighlighter(ISettings* settings = nullptr, QObject* parent = nullptr);
    ~FrameHighlighter() override;

    void flash(const QRectF& frame, Edges emphasis) override;
    void showBorder(const QRectF& frame) override;
    void hideBorder() override;

    bool isFlashing() const
    {
        return m_flashTimer.isActive();
    }
    QRectF flashFrame() const
    {
        return m_flashFrame;
    }
    Edges flashEdges() const
    {
        return m_flashEdges;
    }
    bool isBorderVisible() const
    {
        return m_borderVisible;
    }
    QRectF borderFrame() const
    {
        return m_borderFrame;
    }
    int duration() const
    {
        return m_flashTimer.interval();
    }

Q_SIGNALS:
    void highlightShown(const QRectF& frame, WinStepper::Edges emphasis);
    void highlightHidden();
    void borderShown(const QRectF& frame);
    void borderHidden();

private Q_SLOTS:
    void hideFlash();
    void refreshDuration();

private:
    ISettings* m_settings = nullptr;
    QTimer m_flashTimer;
    QRectF m_flashFrame;
    Edges m_flashEdges;
    QRectF m_borderFrame;
    bool m_borderVisible = false;
};

} // namespace WinStepper
