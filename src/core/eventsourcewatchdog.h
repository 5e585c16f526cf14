// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "winstepper_export.h"
#include <QObject>
#include <QString>
#include <QTimer>
#include <functional>

namespace WinStepper {

class IInputEventSource;
class ISettings;

/**
 * @brief Restarts an input event source that stopped delivering events
 *
 * Every WatchdogIntervalMs the source is checked. It is restarted when it
 * reports itself disabled, or when no event was observed for WatchdogStaleMs
 * while the pointer is active (a "zombie" source: enabled but silent). While
 * the pointer is inactive (screen locked) silence is expected.
 */
class WINSTEPPER_EXPORT EventSourceWatchdog : public QObject
{
    Q_OBJECT

public:
    using Clock = std::function<qint64()>;

    explicit EventSourceWatchdog(IInputEventSource* source, ISettings* settings = nullptr,
                                 QObject* parent = nullptr);
    ~EventSourceWatchdog() override;

    /// Replace the millisecond clock (tests)
    void setClock(Clock clock);

    void start();
    void stop();
    bool isRunning() const
    {
        return m_timer.isActive();
    }

    qint64 lastEventMs() const
    {
        return m_lastEventMs;
    }

public Q_SLOTS:
    /**
     * @brief Record that the source delivered an event
     */
    void notifyEvent();

    /**
     * @brief Run one check
     * @return true if the source was restarted
     */
    bool checkNow();

Q_SIGNALS:
    void sourceRestarted(const QString& reason);

private:
    qint64 now() const;

    IInputEventSource* m_source = nullptr;
    ISettings* m_settings = nullptr;
    Clock m_clock;
    QTimer m_timer;
    qint64 m_lastEventMs = 0;
};

} // namespace WinStepper
