// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "types.h"
#include "winstepper_export.h"
#include <QHash>
#include <QMap>
#include <QRectF>
#include <QString>
#include <QStringList>
#include <functional>
#include <optional>

namespace WinStepper {

/**
 * @brief A frame remembered by a toggle before it displaced the window
 */
struct SavedFrame
{
    QRectF frame;
    QString screenId; ///< Screen the window was on (Compact, CrossScreenUndo)
    qint64 timestampMs = 0; ///< Clock value at store time
};

/**
 * @brief Per-window saved-frame slots, one independent slot per feature family
 *
 * A slot is populated while its toggle is active and cleared when the toggle
 * restores. Features never share a slot, so e.g. centring a maximized window
 * does not lose the pre-maximize frame.
 *
 * Entries are keyed by IWindow::id(). There is no close hook: callers prune
 * entries of dead windows with pruneStale() before use.
 */
class WINSTEPPER_EXPORT UndoMemory
{
public:
    using Clock = std::function<qint64()>;

    /**
     * @param clock Millisecond clock used for timestamps; defaults to
     *              QDateTime::currentMSecsSinceEpoch()
     */
    explicit UndoMemory(Clock clock = Clock());

    /**
     * @brief Store a frame, replacing any existing one
     */
    void store(UndoFeature feature, const QString& windowId, const QRectF& frame, const QString& screenId = QString());

    /**
     * @brief Store a frame only if the slot is empty (write-once)
     * @return true if the frame was stored
     */
    bool storeOnce(UndoFeature feature, const QString& windowId, const QRectF& frame,
                   const QString& screenId = QString());

    std::optional<SavedFrame> saved(UndoFeature feature, const QString& windowId) const;
    bool has(UndoFeature feature, const QString& windowId) const;

    /**
     * @brief Remove and return the saved frame
     */
    std::optional<SavedFrame> take(UndoFeature feature, const QString& windowId);
    void clear(UndoFeature feature, const QString& windowId);

    /**
     * @brief Drop every slot of a window
     */
    void forgetWindow(const QString& windowId);

    QStringList windowIds(UndoFeature feature) const;
    int count(UndoFeature feature) const;

    /**
     * @brief Remove entries whose window is no longer alive
     * @param isAlive Predicate queried once per distinct window id
     * @return Number of windows forgotten
     */
    int pruneStale(const std::function<bool(const QString&)>& isAlive);

    qint64 now() const;

private:
    Clock m_clock;
    QMap<UndoFeature, QHash<QString, SavedFrame>> m_slots;
};

} // namespace WinStepper
