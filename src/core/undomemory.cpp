// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "undomemory.h"
#include "logging.h"
#include <QDateTime>
#include <QSet>

namespace WinStepper {

UndoMemory::UndoMemory(Clock clock)
    : m_clock(std::move(clock))
{
    if (!m_clock) {
        m_clock = [] {
            return QDateTime::currentMSecsSinceEpoch();
        };
    }
}

qint64 UndoMemory::now() const
{
    return m_clock();
}

void UndoMemory::store(UndoFeature feature, const QString& windowId, const QRectF& frame, const QString& screenId)
{
    if (windowId.isEmpty()) {
        return;
    }
    m_slots[feature].insert(windowId, SavedFrame{frame, screenId, now()});
    qCDebug(lcUndo) << "Stored" << static_cast<int>(feature) << "for" << windowId << frame;
}

bool UndoMemory::storeOnce(UndoFeature feature, const QString& windowId, const QRectF& frame,
                           const QString& screenId)
{
    if (windowId.isEmpty() || has(feature, windowId)) {
        return false;
    }
    store(feature, windowId, frame, screenId);
    return true;
}

std::optional<SavedFrame> UndoMemory::saved(UndoFeature feature, const QString& windowId) const
{
    const auto featureIt = m_slots.constFind(feature);
    if (featureIt == m_slots.constEnd()) {
        return std::nullopt;
    }
    const auto it = featureIt->constFind(windowId);
    if (it == featureIt->constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

bool UndoMemory::has(UndoFeature feature, const QString& windowId) const
{
    const auto featureIt = m_slots.constFind(feature);
    return featureIt != m_slots.constEnd() && featureIt->contains(windowId);
}

std::optional<SavedFrame> UndoMemory::take(UndoFeature feature, const QString& windowId)
{
    auto featureIt = m_slots.find(feature);
    if (featureIt == m_slots.end()) {
        return std::nullopt;
    }
    auto it = featureIt->find(windowId);
    if (it == featureIt->end()) {
        return std::nullopt;
    }
    SavedFrame result = it.value();
    featureIt->erase(it);
    return result;
}

void UndoMemory::clear(UndoFeature feature, const QString& windowId)
{
    auto featureIt = m_slots.find(feature);
    if (featureIt != m_slots.end()) {
        featureIt->remove(windowId);
    }
}

void UndoMemory::forgetWindow(const QString& windowId)
{
    for (auto it = m_slots.begin(); it != m_slots.end(); ++it) {
        it->remove(windowId);
    }
}

QStringList UndoMemory::windowIds(UndoFeature feature) const
{
    return m_slots.value(feature).keys();
}

int UndoMemory::count(UndoFeature feature) const
{
    return m_slots.value(feature).size();
}

int UndoMemory::pruneStale(const std::function<bool(const QString&)>& isAlive)
{
    if (!isAlive) {
        return 0;
    }

    QSet<QString> known;
    for (auto it = m_slots.cbegin(); it != m_slots.cend(); ++it) {
        for (auto slot = it->cbegin(); slot != it->cend(); ++slot) {
            known.insert(slot.key());
        }
    }

    int pruned = 0;
    for (const QString& windowId : std::as_const(known)) {
        if (!isAlive(windowId)) {
            forgetWindow(windowId);
            ++pruned;
            qCDebug(lcUndo) << "Pruned stale window" << windowId;
        }
    }
    return pruned;
}

} // namespace WinStepper
