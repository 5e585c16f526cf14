// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "winstepper_export.h"
#include "types.h"
#include <QMap>
#include <QObject>
#include <QPointF>
#include <QRectF>
#include <QSize>
#include <QString>
#include <QVector>

namespace WinStepper {

// ═══════════════════════════════════════════════════════════════════════════════
// Window / Screen Platform
// ═══════════════════════════════════════════════════════════════════════════════
// The host owns every window and screen object. Engines hold raw pointers only
// for the duration of one command and remember windows by id() between commands.
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief A physical or virtual display as seen by the host
 */
class WINSTEPPER_EXPORT IScreen
{
public:
    virtual ~IScreen() = default;

    /// Stable identifier for the lifetime of the display connection
    virtual QString id() const = 0;
    /// Human readable name (e.g. "Built-in Retina Display", "DELL U2723QE")
    virtual QString name() const = 0;
    /// Usable frame in global coordinates
    virtual QRectF frame() const = 0;
    /// Whether this is the laptop's own panel
    virtual bool isBuiltIn() const = 0;
};

/**
 * @brief Handle to a top-level window owned by the host
 *
 * setFrame() is a request: the host may clamp the result (minimum sizes,
 * screen constraints) and may apply it asynchronously.
 */
class WINSTEPPER_EXPORT IWindow
{
public:
    virtual ~IWindow() = default;

    /// Stable per OS window
    virtual QString id() const = 0;
    /// Application identity, used for per-application overrides
    virtual QString appName() const = 0;
    virtual QRectF frame() const = 0;
    virtual void setFrame(const QRectF& frame) = 0;
    /// Screen the host considers the window to be on (never null for a live window)
    virtual IScreen* screen() const = 0;
    /// False for panels, menus, popups
    virtual bool isStandard() const = 0;
    virtual bool isVisible() const = 0;
    virtual void raise() = 0;
    virtual void focus() = 0;
    virtual void minimize() = 0;
    virtual void unminimize() = 0;
};

/**
 * @brief Screen enumeration and directional neighbour lookup
 */
class WINSTEPPER_EXPORT IScreenPlatform
{
public:
    virtual ~IScreenPlatform() = default;

    virtual QVector<IScreen*> screens() const = 0;
    virtual IScreen* primaryScreen() const = 0;

    /**
     * @brief Neighbouring screen in a direction (toWest/toEast/toNorth/toSouth)
     * @return Screen or nullptr if there is none in that direction
     *
     * The default implementation uses GeometryUtils::screenInDirection() on screens().
     */
    virtual IScreen* screenInDirection(IScreen* from, Direction direction) const;

    /**
     * @brief Screen whose frame contains the point (half-open), nullptr if none
     */
    IScreen* screenAt(const QPointF& point) const;
};

/**
 * @brief Window enumeration, focus and cursor queries
 */
class WINSTEPPER_EXPORT IWindowPlatform
{
public:
    virtual ~IWindowPlatform() = default;

    virtual IWindow* focusedWindow() const = 0;
    /// Standard windows in z-order, front to back
    virtual QVector<IWindow*> orderedWindows() const = 0;
    /// nullptr when the window no longer exists
    virtual IWindow* windowForId(const QString& windowId) const = 0;
    virtual QPointF cursorPosition() const = 0;

    /**
     * @brief Front-most standard window containing the point, nullptr if none
     */
    IWindow* windowAt(const QPointF& point) const;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Visual feedback
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Transient highlight collaborator
 *
 * Engines call it but never manage its lifecycle: flash() owns its own
 * removal timing, showBorder()/hideBorder() are driven by pointer drags.
 */
class WINSTEPPER_EXPORT IHighlighter
{
public:
    virtual ~IHighlighter() = default;

    /**
     * @brief Briefly highlight a frame
     * @param frame Frame to outline
     * @param emphasis Edges drawn thicker (Edge::None for a uniform outline)
     */
    virtual void flash(const QRectF& frame, Edges emphasis) = 0;
    virtual void showBorder(const QRectF& frame) = 0;
    virtual void hideBorder() = 0;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Input event source
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Host-side producer of pointer/modifier events
 *
 * Event taps can silently die (disabled by the OS, or "zombie": enabled but
 * never firing). EventSourceWatchdog uses this interface to restart them.
 */
class WINSTEPPER_EXPORT IInputEventSource
{
public:
    virtual ~IInputEventSource() = default;

    virtual bool isEnabled() const = 0;
    /// Tear down and recreate the underlying handlers
    virtual void restart() = 0;
    /// False while the pointer is hidden (screen locked, screensaver)
    virtual bool isPointerActive() const = 0;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Settings
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Abstract interface for settings management
 *
 * Allows dependency inversion - engines depend on this interface
 * rather than the KConfig-backed Settings implementation, so they can be
 * tested with a stub. Engines accept nullptr and fall back to Defaults.
 */
class WINSTEPPER_EXPORT ISettings : public QObject
{
    Q_OBJECT

public:
    explicit ISettings(QObject* parent = nullptr)
        : QObject(parent)
    {
    }
    ~ISettings() override;

    // Stepping
    virtual int stepDivisions() const = 0;
    virtual int shrinkMaxIterations() const = 0;

    // Tolerances
    virtual qreal snapTolerance() const = 0;
    virtual qreal cycleTolerance() const = 0;

    // Compact dock
    virtual QSize compactSize() const = 0;
    /// Per-application dock size, compactSize() when there is no override
    virtual QSize compactSizeForApp(const QString& appName) const = 0;

    /// Per-application minimum size, an empty QSize when there is no override
    virtual QSize minimumSizeForApp(const QString& appName) const = 0;

    /// Regex on screen name per role, applied before spatial classification
    virtual QMap<ScreenRole, QString> screenNameOverrides() const = 0;
    virtual int crossScreenUndoWindowMs() const = 0;

    // Pointer drag/resize
    virtual int dragIntervalMs() const = 0;
    virtual int watchdogIntervalMs() const = 0;
    virtual int watchdogStaleMs() const = 0;
    virtual Qt::KeyboardModifiers moveModifiers() const = 0;
    virtual Qt::KeyboardModifiers resizeModifiers() const = 0;

    // Feedback
    virtual int highlightDurationMs() const = 0;

Q_SIGNALS:
    void settingsChanged();
};

} // namespace WinStepper
