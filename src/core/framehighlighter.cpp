// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "framehighlighter.h"
#include "constants.h"

namespace WinStepper {

FrameHighlighter::FrameHighlighter(ISettings* settings, QObject* parent)
    : QObject(parent)
    , m_settings(settings)
{
    m_flashTimer.setSingleShot(true);
    refreshDuration();
    connect(&m_flashTimer, &QTimer::timeout, this, &FrameHighlighter::hideFlash);
    if (m_settings) {
        connect(m_settings, &ISettings::settingsChanged, this, &FrameHighlighter::refreshDuration);
    }
}

FrameHighlighter::~FrameHighlighter() = default;

void FrameHighlighter::refreshDuration()
{
    const int duration = m_settings ? m_settings->highlightDurationMs() : Defaults::HighlightDurationMs;
    m_flashTimer.setInterval(qMax(0, duration));
}

void FrameHighlighter::flash(const QRectF& frame, Edges emphasis)
{
    if (frame.isEmpty()) {
        return;
    }
    m_flashFrame = frame;
    m_flashEdges = emphasis;
    m_flashTimer.start(); // Restarts a running flash
    Q_EMIT highlightShown(frame, emphasis);
}

void FrameHighlighter::hideFlash()
{
    m_flashFrame = QRectF();
    m_flashEdges = Edge::None;
    Q_EMIT highlightHidden();
}

void FrameHighlighter::showBorder(const QRectF& frame)
{
    if (m_borderVisible && m_borderFrame == frame) {
        return;
    }
    m_borderFrame = frame;
    m_borderVisible = true;
    Q_EMIT borderShown(frame);
}

void FrameHighlighter::hideBorder()
{
    if (!m_borderVisible) {
        return;
    }
    m_borderVisible = false;
    m_borderFrame = QRectF();
    Q_EMIT borderHidden();
}

} // namespace WinStepper
