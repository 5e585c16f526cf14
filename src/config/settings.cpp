// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "settings.h"
#include "configdefaults.h"
#include "../core/logging.h"
#include <KConfig>
#include <QRegularExpression>
#include <QtNumeric>

namespace WinStepper {

// ═══════════════════════════════════════════════════════════════════════════════
// Macros for setter patterns
// ═══════════════════════════════════════════════════════════════════════════════

// Simple setter: if changed, update member, emit specific signal, emit settingsChanged
#define SETTINGS_SETTER(Type, name, member, signal) \
    void Settings::set##name(Type value) \
    { \
        if (member != value) { \
            member = value; \
            Q_EMIT signal(); \
            Q_EMIT settingsChanged(); \
        } \
    }

// Clamped setter: clamp value, then apply if changed
#define SETTINGS_SETTER_CLAMPED(Type, name, member, signal, minVal, maxVal) \
    void Settings::set##name(Type value) \
    { \
        value = qBound(Type(minVal), value, Type(maxVal)); \
        if (member != value) { \
            member = value; \
            Q_EMIT signal(); \
            Q_EMIT settingsChanged(); \
        } \
    }

namespace {
// Ranges match winstepper.kcfg
constexpr int StepDivisionsMin = 2;
constexpr int StepDivisionsMax = 200;
constexpr int ShrinkIterationsMin = 1;
constexpr int ShrinkIterationsMax = 100;
constexpr qreal SnapToleranceMax = 50.0;
constexpr qreal CycleToleranceMax = 100.0;
constexpr int CompactSizeMin = 50;
constexpr int CompactSizeMax = 4000;
constexpr int UndoWindowMax = 60000;
constexpr int DragIntervalMin = 5;
constexpr int DragIntervalMax = 1000;
constexpr int WatchdogIntervalMin = 100;
constexpr int WatchdogIntervalMax = 60000;
constexpr int WatchdogStaleMin = 1000;
constexpr int WatchdogStaleMax = 600000;
constexpr int HighlightDurationMax = 5000;

const QString MinimumSizesGroup = QStringLiteral("MinimumSizes");
const QString CompactSizesGroup = QStringLiteral("CompactSizes");
const QString ScreenRolesGroup = QStringLiteral("ScreenRoles");
} // namespace

Settings::Settings(QObject* parent)
    : Settings(KSharedConfig::openConfig(QStringLiteral("winstepperrc")), parent)
{
}

Settings::Settings(KSharedConfig::Ptr config, QObject* parent)
    : ISettings(parent)
    , m_config(std::move(config))
{
    load();
}

Settings::~Settings() = default;

// ═══════════════════════════════════════════════════════════════════════════════
// Helper Methods
// ═══════════════════════════════════════════════════════════════════════════════

int Settings::readValidatedInt(const KConfigGroup& group, const char* key, int defaultValue, int min, int max,
                               const char* settingName)
{
    int value = group.readEntry(QLatin1String(key), defaultValue);
    if (value < min || value > max) {
        qCWarning(lcConfig) << "Invalid" << settingName << ":" << value << "using default (must be" << min << "-"
                            << max << ")";
        value = defaultValue;
    }
    return value;
}

qreal Settings::readValidatedDouble(const KConfigGroup& group, const char* key, qreal defaultValue, qreal min,
                                    qreal max, const char* settingName)
{
    qreal value = group.readEntry(QLatin1String(key), defaultValue);
    if (qIsNaN(value) || value < min || value > max) {
        qCWarning(lcConfig) << "Invalid" << settingName << ":" << value << "using default (must be" << min << "-"
                            << max << ")";
        value = defaultValue;
    }
    return value;
}

Qt::KeyboardModifiers Settings::readValidatedModifiers(const KConfigGroup& group, const char* key,
                                                       Qt::KeyboardModifiers defaultValue, const char* settingName)
{
    const int value = group.readEntry(QLatin1String(key), static_cast<int>(defaultValue.toInt()));
    const quint32 bits = static_cast<quint32>(value);
    if (bits & ~static_cast<quint32>(Qt::KeyboardModifierMask)) {
        qCWarning(lcConfig) << "Invalid" << settingName << ":" << Qt::hex << value << "using default";
        return defaultValue;
    }
    return Qt::KeyboardModifiers::fromInt(value);
}

QSize Settings::parseSize(const QString& text)
{
    static const QRegularExpression pattern(QStringLiteral("^\\s*(\\d+)\\s*[xX]\\s*(\\d+)\\s*$"));
    const QRegularExpressionMatch match = pattern.match(text);
    if (!match.hasMatch()) {
        return QSize();
    }
    const int width = match.captured(1).toInt();
    const int height = match.captured(2).toInt();
    if (width <= 0 || height <= 0) {
        return QSize();
    }
    return QSize(width, height);
}

QString Settings::formatSize(const QSize& size)
{
    return QStringLiteral("%1x%2").arg(size.width()).arg(size.height());
}

QHash<QString, QSize> Settings::readSizeTable(const KConfigGroup& group)
{
    QHash<QString, QSize> table;
    const QStringList keys = group.keyList();
    for (const QString& key : keys) {
        const QString value = group.readEntry(key, QString());
        const QSize size = parseSize(value);
        if (!size.isValid()) {
            qCWarning(lcConfig) << "Ignoring malformed size" << value << "for" << key << "in" << group.name();
            continue;
        }
        table.insert(key.toLower(), size);
    }
    return table;
}

void Settings::writeSizeTable(KConfigGroup group, const QHash<QString, QSize>& table)
{
    for (auto it = table.cbegin(); it != table.cend(); ++it) {
        group.writeEntry(it.key(), formatSize(it.value()));
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Per-application tables
// ═══════════════════════════════════════════════════════════════════════════════

QSize Settings::compactSizeForApp(const QString& appName) const
{
    return m_compactSizes.value(appName.toLower(), m_compactSize);
}

QSize Settings::minimumSizeForApp(const QString& appName) const
{
    return m_minimumSizes.value(appName.toLower(), QSize());
}

void Settings::setMinimumSizeForApp(const QString& appName, const QSize& size)
{
    const QString key = appName.toLower();
    if (key.isEmpty()) {
        return;
    }
    if (size.isEmpty()) {
        if (m_minimumSizes.remove(key) == 0) {
            return;
        }
    } else if (m_minimumSizes.value(key) == size) {
        return;
    } else {
        m_minimumSizes.insert(key, size);
    }
    Q_EMIT applicationSizesChanged();
    Q_EMIT settingsChanged();
}

void Settings::setCompactSizeForApp(const QString& appName, const QSize& size)
{
    const QString key = appName.toLower();
    if (key.isEmpty()) {
        return;
    }
    if (size.isEmpty()) {
        if (m_compactSizes.remove(key) == 0) {
            return;
        }
    } else if (m_compactSizes.value(key) == size) {
        return;
    } else {
        m_compactSizes.insert(key, size);
    }
    Q_EMIT applicationSizesChanged();
    Q_EMIT settingsChanged();
}

void Settings::setScreenNameOverride(ScreenRole role, const QString& pattern)
{
    if (pattern.isEmpty()) {
        if (m_screenNameOverrides.remove(role) == 0) {
            return;
        }
    } else if (m_screenNameOverrides.value(role) == pattern) {
        return;
    } else {
        m_screenNameOverrides.insert(role, pattern);
    }
    Q_EMIT screenNameOverridesChanged();
    Q_EMIT settingsChanged();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Scalar setters
// ═══════════════════════════════════════════════════════════════════════════════

SETTINGS_SETTER_CLAMPED(int, StepDivisions, m_stepDivisions, stepDivisionsChanged, StepDivisionsMin,
                        StepDivisionsMax)
SETTINGS_SETTER_CLAMPED(int, ShrinkMaxIterations, m_shrinkMaxIterations, shrinkMaxIterationsChanged,
                        ShrinkIterationsMin, ShrinkIterationsMax)
SETTINGS_SETTER_CLAMPED(qreal, SnapTolerance, m_snapTolerance, snapToleranceChanged, 0.0, SnapToleranceMax)
SETTINGS_SETTER_CLAMPED(qreal, CycleTolerance, m_cycleTolerance, cycleToleranceChanged, 0.0, CycleToleranceMax)
SETTINGS_SETTER_CLAMPED(int, CrossScreenUndoWindowMs, m_crossScreenUndoWindowMs, crossScreenUndoWindowMsChanged, 0,
                        UndoWindowMax)
SETTINGS_SETTER_CLAMPED(int, DragIntervalMs, m_dragIntervalMs, dragIntervalMsChanged, DragIntervalMin,
                        DragIntervalMax)
SETTINGS_SETTER_CLAMPED(int, WatchdogIntervalMs, m_watchdogIntervalMs, watchdogIntervalMsChanged,
                        WatchdogIntervalMin, WatchdogIntervalMax)
SETTINGS_SETTER_CLAMPED(int, WatchdogStaleMs, m_watchdogStaleMs, watchdogStaleMsChanged, WatchdogStaleMin,
                        WatchdogStaleMax)
SETTINGS_SETTER_CLAMPED(int, HighlightDurationMs, m_highlightDurationMs, highlightDurationMsChanged, 0,
                        HighlightDurationMax)
SETTINGS_SETTER(Qt::KeyboardModifiers, MoveModifiers, m_moveModifiers, moveModifiersChanged)
SETTINGS_SETTER(Qt::KeyboardModifiers, ResizeModifiers, m_resizeModifiers, resizeModifiersChanged)

void Settings::setCompactSize(const QSize& size)
{
    const QSize bounded(qBound(CompactSizeMin, size.width(), CompactSizeMax),
                        qBound(CompactSizeMin, size.height(), CompactSizeMax));
    if (m_compactSize != bounded) {
        m_compactSize = bounded;
        Q_EMIT compactSizeChanged();
        Q_EMIT settingsChanged();
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Persistence
// ═══════════════════════════════════════════════════════════════════════════════

void Settings::load()
{
    // KSharedConfig caches in memory; re-read in case another process wrote the file
    m_config->reparseConfiguration();

    const KConfigGroup stepping = m_config->group(QStringLiteral("Stepping"));
    const KConfigGroup tolerances = m_config->group(QStringLiteral("Tolerances"));
    const KConfigGroup compact = m_config->group(QStringLiteral("Compact"));
    const KConfigGroup crossScreen = m_config->group(QStringLiteral("CrossScreen"));
    const KConfigGroup pointer = m_config->group(QStringLiteral("Pointer"));
    const KConfigGroup feedback = m_config->group(QStringLiteral("Feedback"));

    m_stepDivisions = readValidatedInt(stepping, "StepDivisions", ConfigDefaults::stepDivisions(), StepDivisionsMin,
                                       StepDivisionsMax, "step divisions");
    m_shrinkMaxIterations = readValidatedInt(stepping, "ShrinkMaxIterations", ConfigDefaults::shrinkMaxIterations(),
                                             ShrinkIterationsMin, ShrinkIterationsMax, "shrink iterations");

    m_snapTolerance = readValidatedDouble(tolerances, "SnapTolerance", ConfigDefaults::snapTolerance(), 0.0,
                                          SnapToleranceMax, "snap tolerance");
    m_cycleTolerance = readValidatedDouble(tolerances, "CycleTolerance", ConfigDefaults::cycleTolerance(), 0.0,
                                           CycleToleranceMax, "cycle tolerance");

    m_compactSize = QSize(readValidatedInt(compact, "CompactWidth", ConfigDefaults::compactWidth(), CompactSizeMin,
                                           CompactSizeMax, "compact width"),
                          readValidatedInt(compact, "CompactHeight", ConfigDefaults::compactHeight(), CompactSizeMin,
                                           CompactSizeMax, "compact height"));

    m_crossScreenUndoWindowMs = readValidatedInt(crossScreen, "UndoWindowMs", ConfigDefaults::crossScreenUndoWindowMs(),
                                                 0, UndoWindowMax, "cross-screen undo window");

    m_dragIntervalMs = readValidatedInt(pointer, "DragIntervalMs", ConfigDefaults::dragIntervalMs(), DragIntervalMin,
                                        DragIntervalMax, "drag interval");
    m_watchdogIntervalMs = readValidatedInt(pointer, "WatchdogIntervalMs", ConfigDefaults::watchdogIntervalMs(),
                                            WatchdogIntervalMin, WatchdogIntervalMax, "watchdog interval");
    m_watchdogStaleMs = readValidatedInt(pointer, "WatchdogStaleMs", ConfigDefaults::watchdogStaleMs(),
                                         WatchdogStaleMin, WatchdogStaleMax, "watchdog stale time");
    m_moveModifiers = readValidatedModifiers(pointer, "MoveModifiers", ConfigDefaults::moveModifiers(),
                                             "move modifiers");
    m_resizeModifiers = readValidatedModifiers(pointer, "ResizeModifiers", ConfigDefaults::resizeModifiers(),
                                               "resize modifiers");

    m_highlightDurationMs = readValidatedInt(feedback, "HighlightDurationMs", ConfigDefaults::highlightDurationMs(), 0,
                                             HighlightDurationMax, "highlight duration");

    m_minimumSizes = readSizeTable(m_config->group(MinimumSizesGroup));
    m_compactSizes = readSizeTable(m_config->group(CompactSizesGroup));

    m_screenNameOverrides.clear();
    const KConfigGroup roles = m_config->group(ScreenRolesGroup);
    const QStringList roleKeys = roles.keyList();
    for (const QString& key : roleKeys) {
        const auto role = screenRoleFromString(key);
        if (!role) {
            qCWarning(lcConfig) << "Unknown screen role" << key << "in" << ScreenRolesGroup;
            continue;
        }
        const QString pattern = roles.readEntry(key, QString());
        if (!QRegularExpression(pattern).isValid()) {
            qCWarning(lcConfig) << "Invalid screen name pattern" << pattern << "for" << key;
            continue;
        }
        m_screenNameOverrides.insert(*role, pattern);
    }

    qCDebug(lcConfig) << "Settings loaded: step divisions" << m_stepDivisions << "compact" << m_compactSize
                      << "app minimums" << m_minimumSizes.size();
    Q_EMIT settingsChanged();
}

void Settings::save()
{
    KConfigGroup stepping = m_config->group(QStringLiteral("Stepping"));
    KConfigGroup tolerances = m_config->group(QStringLiteral("Tolerances"));
    KConfigGroup compact = m_config->group(QStringLiteral("Compact"));
    KConfigGroup crossScreen = m_config->group(QStringLiteral("CrossScreen"));
    KConfigGroup pointer = m_config->group(QStringLiteral("Pointer"));
    KConfigGroup feedback = m_config->group(QStringLiteral("Feedback"));

    stepping.writeEntry(QLatin1String("StepDivisions"), m_stepDivisions);
    stepping.writeEntry(QLatin1String("ShrinkMaxIterations"), m_shrinkMaxIterations);
    tolerances.writeEntry(QLatin1String("SnapTolerance"), m_snapTolerance);
    tolerances.writeEntry(QLatin1String("CycleTolerance"), m_cycleTolerance);
    compact.writeEntry(QLatin1String("CompactWidth"), m_compactSize.width());
    compact.writeEntry(QLatin1String("CompactHeight"), m_compactSize.height());
    crossScreen.writeEntry(QLatin1String("UndoWindowMs"), m_crossScreenUndoWindowMs);
    pointer.writeEntry(QLatin1String("DragIntervalMs"), m_dragIntervalMs);
    pointer.writeEntry(QLatin1String("WatchdogIntervalMs"), m_watchdogIntervalMs);
    pointer.writeEntry(QLatin1String("WatchdogStaleMs"), m_watchdogStaleMs);
    pointer.writeEntry(QLatin1String("MoveModifiers"), static_cast<int>(m_moveModifiers.toInt()));
    pointer.writeEntry(QLatin1String("ResizeModifiers"), static_cast<int>(m_resizeModifiers.toInt()));
    feedback.writeEntry(QLatin1String("HighlightDurationMs"), m_highlightDurationMs);

    // Tables are rewritten so removed entries disappear
    m_config->deleteGroup(MinimumSizesGroup);
    m_config->deleteGroup(CompactSizesGroup);
    m_config->deleteGroup(ScreenRolesGroup);
    writeSizeTable(m_config->group(MinimumSizesGroup), m_minimumSizes);
    writeSizeTable(m_config->group(CompactSizesGroup), m_compactSizes);

    KConfigGroup roles = m_config->group(ScreenRolesGroup);
    for (auto it = m_screenNameOverrides.cbegin(); it != m_screenNameOverrides.cend(); ++it) {
        roles.writeEntry(screenRoleToString(it.key()), it.value());
    }

    if (!m_config->sync()) {
        qCWarning(lcConfig) << "Failed to write" << m_config->name();
    }
}

void Settings::reset()
{
    m_stepDivisions = ConfigDefaults::stepDivisions();
    m_shrinkMaxIterations = ConfigDefaults::shrinkMaxIterations();
    m_snapTolerance = ConfigDefaults::snapTolerance();
    m_cycleTolerance = ConfigDefaults::cycleTolerance();
    m_compactSize = QSize(ConfigDefaults::compactWidth(), ConfigDefaults::compactHeight());
    m_crossScreenUndoWindowMs = ConfigDefaults::crossScreenUndoWindowMs();
    m_dragIntervalMs = ConfigDefaults::dragIntervalMs();
    m_watchdogIntervalMs = ConfigDefaults::watchdogIntervalMs();
    m_watchdogStaleMs = ConfigDefaults::watchdogStaleMs();
    m_moveModifiers = ConfigDefaults::moveModifiers();
    m_resizeModifiers = ConfigDefaults::resizeModifiers();
    m_highlightDurationMs = ConfigDefaults::highlightDurationMs();
    m_minimumSizes.clear();
    m_compactSizes.clear();
    m_screenNameOverrides.clear();

    qCInfo(lcConfig) << "Settings reset to defaults";
    Q_EMIT settingsChanged();
}

} // namespace WinStepper
