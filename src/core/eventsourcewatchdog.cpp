// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "eventsourcewatchdog.h"
#include "constants.h"
#include "interfaces.h"
#include "logging.h"
#include <QDateTime>

namespace WinStepper {

EventSourceWatchdog::EventSourceWatchdog(IInputEventSource* source, ISettings* settings, QObject* parent)
    : QObject(parent)
    , m_source(source)
    , m_settings(settings)
{
    connect(&m_timer, &QTimer::timeout, this, &EventSourceWatchdog::checkNow);
    m_lastEventMs = now();
}

EventSourceWatchdog::~EventSourceWatchdog() = default;

void EventSourceWatchdog::setClock(Clock clock)
{
    m_clock = std::move(clock);
    m_lastEventMs = now();
}

qint64 EventSourceWatchdog::now() const
{
    return m_clock ? m_clock() : QDateTime::currentMSecsSinceEpoch();
}

void EventSourceWatchdog::start()
{
    m_lastEventMs = now();
    m_timer.start(m_settings ? m_settings->watchdogIntervalMs() : Defaults::WatchdogIntervalMs);
}

void EventSourceWatchdog::stop()
{
    m_timer.stop();
}

void EventSourceWatchdog::notifyEvent()
{
    m_lastEventMs = now();
}

bool EventSourceWatchdog::checkNow()
{
    if (!m_source) {
        return false;
    }

    const int staleMs = m_settings ? m_settings->watchdogStaleMs() : Defaults::WatchdogStaleMs;
    const qint64 silentFor = now() - m_lastEventMs;

    QString reason;
    if (!m_source->isEnabled()) {
        reason = QStringLiteral("disabled");
    } else if (silentFor > staleMs && m_source->isPointerActive()) {
        reason = QStringLiteral("silent for %1 ms").arg(silentFor);
    } else {
        return false;
    }

    qCInfo(lcPointer) << "Restarting input event source:" << reason;
    m_source->restart();
    m_lastEventMs = now();
    Q_EMIT sourceRestarted(reason);
    return true;
}

} // namespace WinStepper
