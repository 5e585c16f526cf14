// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "compactplacer.h"
#include "interfaces.h"
#include "logging.h"
#include "undomemory.h"
#include <QMap>
#include <QtMath>
#include <algorithm>

namespace WinStepper {

CompactPlacer::CompactPlacer(UndoMemory* memory, IWindowPlatform* windows, ISettings* settings,
                             IHighlighter* highlighter)
    : m_memory(memory)
    , m_windows(windows)
    , m_settings(settings)
    , m_highlighter(highlighter)
{
}

QSizeF CompactPlacer::compactSizeFor(IWindow* window) const
{
    if (m_settings) {
        const QSize size = m_settings->compactSizeForApp(window->appName());
        if (size.isValid() && !size.isEmpty()) {
            return QSizeF(size);
        }
    }
    return QSizeF(Defaults::CompactWidth, Defaults::CompactHeight);
}

int CompactPlacer::rowOf(const QRectF& frame, const QRectF& screen, qreal compactHeight)
{
    if (compactHeight <= 0) {
        return 0;
    }
    const qreal screenBottom = screen.y() + screen.height();
    const int row = qFloor((screenBottom - frame.y() - frame.height() + compactHeight / 2.0) / compactHeight);
    return qMax(0, row);
}

std::optional<QPointF> CompactPlacer::findSlot(const QRectF& screen, const QVector<QRectF>& docked,
                                               const QSizeF& compactSize, int maxRow)
{
    const qreal screenRight = screen.x() + screen.width();
    const qreal screenBottom = screen.y() + screen.height();

    // Rightmost occupied edge per row
    QMap<int, qreal> rowRight;
    for (const QRectF& frame : docked) {
        const int row = rowOf(frame, screen, compactSize.height());
        const qreal right = frame.x() + frame.width();
        rowRight[row] = rowRight.contains(row) ? qMax(rowRight.value(row), right) : right;
    }

    // Windows docked with another size do not sit on this size's row grid
    const auto overlapsDocked = [&docked](const QRectF& slot) {
        return std::any_of(docked.cbegin(), docked.cend(), [&slot](const QRectF& frame) {
            return frame.intersects(slot);
        });
    };

    for (int row = 0; row <= maxRow; ++row) {
        const qreal y = screenBottom - (row + 1) * compactSize.height();
        const qreal x = rowRight.contains(row) ? rowRight.value(row) : screen.x();
        if (x + compactSize.width() > screenRight) {
            continue;
        }
        if (overlapsDocked(QRectF(QPointF(x, y), compactSize))) {
            qCDebug(lcCompact) << "Slot in row" << row << "overlaps a docked window, trying the next row";
            continue;
        }
        return QPointF(x, y);
    }
    return std::nullopt;
}

int CompactPlacer::pruneRegistry()
{
    if (!m_memory || !m_windows) {
        return 0;
    }

    int pruned = 0;
    const QStringList ids = m_memory->windowIds(UndoFeature::Compact);
    for (const QString& id : ids) {
        IWindow* window = m_windows->windowForId(id);
        if (!window || !window->isVisible()) {
            m_memory->clear(UndoFeature::Compact, id);
            ++pruned;
            qCDebug(lcCompact) << "Dropped stale dock entry" << id;
        }
    }
    return pruned;
}

bool CompactPlacer::toggle(IWindow* window)
{
    if (!window || !window->screen() || !m_memory) {
        return false;
    }

    pruneRegistry();

    const QString id = window->id();
    if (const auto saved = m_memory->take(UndoFeature::Compact, id)) {
        qCInfo(lcCompact) << "Undocked" << id << "to" << saved->frame;
        window->setFrame(saved->frame);
        if (m_highlighter) {
            m_highlighter->flash(saved->frame, Edge::None);
        }
        return true;
    }

    IScreen* screen = window->screen();
    const QRectF screenFrame = screen->frame();
    const QSizeF size = compactSizeFor(window);

    QVector<QRectF> docked;
    const QStringList ids = m_memory->windowIds(UndoFeature::Compact);
    for (const QString& dockedId : ids) {
        const auto entry = m_memory->saved(UndoFeature::Compact, dockedId);
        IWindow* other = m_windows ? m_windows->windowForId(dockedId) : nullptr;
        if (!entry || !other || entry->screenId != screen->id()) {
            continue;
        }
        docked.append(other->frame());
    }

    const auto slot = findSlot(screenFrame, docked, size);
    if (!slot) {
        qCInfo(lcCompact) << "Dock on" << screen->name() << "is full, not docking" << id;
        return false;
    }

    m_memory->store(UndoFeature::Compact, id, window->frame(), screen->id());
    const QRectF target(*slot, size);
    qCInfo(lcCompact) << "Docked" << id << "at row" << rowOf(target, screenFrame, size.height()) << target;
    window->setFrame(target);
    if (m_highlighter) {
        m_highlighter->flash(target, Edge::Bottom);
    }
    return true;
}

} // namespace WinStepper
