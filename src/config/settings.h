// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "../core/constants.h"
#include "../core/interfaces.h"
#include <KConfigGroup>
#include <KSharedConfig>
#include <QHash>

namespace WinStepper {

/**
 * @brief Global settings for WinStepper
 *
 * Implements the ISettings interface with KConfig integration. Values are read
 * from winstepperrc; defaults come from winstepper.kcfg through ConfigDefaults.
 *
 * Per-application tables live in their own groups, one key per application
 * (lower-cased) with a "WxH" value:
 *
 *   [MinimumSizes]
 *   kitty=320x200
 *
 *   [ScreenRoles]
 *   top=DELL U27.*
 *
 * Note: This class does NOT use the singleton pattern. Create instances
 * where needed and pass via dependency injection.
 */
class WINSTEPPER_EXPORT Settings : public ISettings
{
    Q_OBJECT

    Q_PROPERTY(int stepDivisions READ stepDivisions WRITE setStepDivisions NOTIFY stepDivisionsChanged)
    Q_PROPERTY(int shrinkMaxIterations READ shrinkMaxIterations WRITE setShrinkMaxIterations NOTIFY
                   shrinkMaxIterationsChanged)
    Q_PROPERTY(qreal snapTolerance READ snapTolerance WRITE setSnapTolerance NOTIFY snapToleranceChanged)
    Q_PROPERTY(qreal cycleTolerance READ cycleTolerance WRITE setCycleTolerance NOTIFY cycleToleranceChanged)
    Q_PROPERTY(QSize compactSize READ compactSize WRITE setCompactSize NOTIFY compactSizeChanged)
    Q_PROPERTY(int crossScreenUndoWindowMs READ crossScreenUndoWindowMs WRITE setCrossScreenUndoWindowMs NOTIFY
                   crossScreenUndoWindowMsChanged)
    Q_PROPERTY(int dragIntervalMs READ dragIntervalMs WRITE setDragIntervalMs NOTIFY dragIntervalMsChanged)
    Q_PROPERTY(
        int watchdogIntervalMs READ watchdogIntervalMs WRITE setWatchdogIntervalMs NOTIFY watchdogIntervalMsChanged)
    Q_PROPERTY(int watchdogStaleMs READ watchdogStaleMs WRITE setWatchdogStaleMs NOTIFY watchdogStaleMsChanged)
    Q_PROPERTY(
        int highlightDurationMs READ highlightDurationMs WRITE setHighlightDurationMs NOTIFY highlightDurationMsChanged)

public:
    /**
     * @brief Settings backed by the user's winstepperrc
     */
    explicit Settings(QObject* parent = nullptr);

    /**
     * @brief Settings backed by an explicit config (tests, alternate profiles)
     */
    explicit Settings(KSharedConfig::Ptr config, QObject* parent = nullptr);
    ~Settings() override;

    // ISettings
    int stepDivisions() const override
    {
        return m_stepDivisions;
    }
    int shrinkMaxIterations() const override
    {
        return m_shrinkMaxIterations;
    }
    qreal snapTolerance() const override
    {
        return m_snapTolerance;
    }
    qreal cycleTolerance() const override
    {
        return m_cycleTolerance;
    }
    QSize compactSize() const override
    {
        return m_compactSize;
    }
    QSize compactSizeForApp(const QString& appName) const override;
    QSize minimumSizeForApp(const QString& appName) const override;
    QMap<ScreenRole, QString> screenNameOverrides() const override
    {
        return m_screenNameOverrides;
    }
    int crossScreenUndoWindowMs() const override
    {
        return m_crossScreenUndoWindowMs;
    }
    int dragIntervalMs() const override
    {
        return m_dragIntervalMs;
    }
    int watchdogIntervalMs() const override
    {
        return m_watchdogIntervalMs;
    }
    int watchdogStaleMs() const override
    {
        return m_watchdogStaleMs;
    }
    Qt::KeyboardModifiers moveModifiers() const override
    {
        return m_moveModifiers;
    }
    Qt::KeyboardModifiers resizeModifiers() const override
    {
        return m_resizeModifiers;
    }
    int highlightDurationMs() const override
    {
        return m_highlightDurationMs;
    }

    // Setters
    void setStepDivisions(int divisions);
    void setShrinkMaxIterations(int iterations);
    void setSnapTolerance(qreal tolerance);
    void setCycleTolerance(qreal tolerance);
    void setCompactSize(const QSize& size);
    void setCrossScreenUndoWindowMs(int ms);
    void setDragIntervalMs(int ms);
    void setWatchdogIntervalMs(int ms);
    void setWatchdogStaleMs(int ms);
    void setMoveModifiers(Qt::KeyboardModifiers modifiers);
    void setResizeModifiers(Qt::KeyboardModifiers modifiers);
    void setHighlightDurationMs(int ms);

    /// An empty size removes the override
    void setMinimumSizeForApp(const QString& appName, const QSize& size);
    void setCompactSizeForApp(const QString& appName, const QSize& size);
    /// An empty pattern removes the override
    void setScreenNameOverride(ScreenRole role, const QString& pattern);

    // Persistence
    Q_INVOKABLE void load();
    Q_INVOKABLE void save();
    Q_INVOKABLE void reset();

    /**
     * @brief Parse "WxH" (e.g. "400x300")
     * @return Invalid QSize if malformed or not positive
     */
    static QSize parseSize(const QString& text);
    static QString formatSize(const QSize& size);

Q_SIGNALS:
    void stepDivisionsChanged();
    void shrinkMaxIterationsChanged();
    void snapToleranceChanged();
    void cycleToleranceChanged();
    void compactSizeChanged();
    void crossScreenUndoWindowMsChanged();
    void dragIntervalMsChanged();
    void watchdogIntervalMsChanged();
    void watchdogStaleMsChanged();
    void moveModifiersChanged();
    void resizeModifiersChanged();
    void highlightDurationMsChanged();
    void applicationSizesChanged();
    void screenNameOverridesChanged();

private:
    int readValidatedInt(const KConfigGroup& group, const char* key, int defaultValue, int min, int max,
                         const char* settingName);
    qreal readValidatedDouble(const KConfigGroup& group, const char* key, qreal defaultValue, qreal min, qreal max,
                              const char* settingName);
    Qt::KeyboardModifiers readValidatedModifiers(const KConfigGroup& group, const char* key,
                                                 Qt::KeyboardModifiers defaultValue, const char* settingName);
    static QHash<QString, QSize> readSizeTable(const KConfigGroup& group);
    static void writeSizeTable(KConfigGroup group, const QHash<QString, QSize>& table);

    KSharedConfig::Ptr m_config;

    int m_stepDivisions = Defaults::StepDivisions;
    int m_shrinkMaxIterations = Defaults::ShrinkMaxIterations;
    qreal m_snapTolerance = Defaults::SnapTolerance;
    qreal m_cycleTolerance = Defaults::CycleTolerance;
    QSize m_compactSize{Defaults::CompactWidth, Defaults::CompactHeight};
    int m_crossScreenUndoWindowMs = Defaults::CrossScreenUndoWindowMs;
    int m_dragIntervalMs = Defaults::DragIntervalMs;
    int m_watchdogIntervalMs = Defaults::WatchdogIntervalMs;
    int m_watchdogStaleMs = Defaults::WatchdogStaleMs;
    Qt::KeyboardModifiers m_moveModifiers = Defaults::MoveModifiers;
    Qt::KeyboardModifiers m_resizeModifiers = Defaults::ResizeModifiers;
    int m_highlightDurationMs = Defaults::HighlightDurationMs;

    QHash<QString, QSize> m_minimumSizes; // lower-cased app name -> size
    QHash<QString, QSize> m_compactSizes;
    QMap<ScreenRole, QString> m_screenNameOverrides;
};

} // namespace WinStepper
