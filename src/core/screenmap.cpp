// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "screenmap.h"
#include "interfaces.h"
#include "logging.h"
#include <QRegularExpression>
#include <algorithm>

namespace WinStepper {

namespace {

bool looksBuiltIn(IScreen* screen)
{
    return screen->isBuiltIn() || screen->name().contains(QLatin1String("Built-in"), Qt::CaseInsensitive);
}

} // namespace

IScreen* ScreenMap::screenFor(ScreenRole role) const
{
    return m_roles.value(role, nullptr);
}

ScreenMap ScreenMap::build(IScreenPlatform* platform, const QMap<ScreenRole, QString>& nameOverrides)
{
    ScreenMap map;
    if (!platform) {
        return map;
    }

    QVector<IScreen*> pool = platform->screens();
    pool.removeAll(nullptr);
    if (pool.isEmpty()) {
        return map;
    }

    // 1. Name overrides
    for (auto it = nameOverrides.cbegin(); it != nameOverrides.cend(); ++it) {
        if (it.value().isEmpty()) {
            continue;
        }
        const QRegularExpression pattern(it.value(), QRegularExpression::CaseInsensitiveOption);
        if (!pattern.isValid()) {
            qCWarning(lcScreen) << "Invalid screen name pattern for" << screenRoleToString(it.key()) << it.value()
                                << pattern.errorString();
            continue;
        }
        const auto match = std::find_if(pool.cbegin(), pool.cend(), [&pattern](IScreen* screen) {
            return pattern.match(screen->name()).hasMatch();
        });
        if (match != pool.cend()) {
            IScreen* screen = *match;
            map.m_roles.insert(it.key(), screen);
            pool.removeOne(screen);
            qCDebug(lcScreen) << "Override" << screenRoleToString(it.key()) << "->" << screen->name();
        }
    }

    // 2. Anchor
    IScreen* anchor = map.screenFor(ScreenRole::Bottom);
    if (!anchor) {
        const auto builtIn = std::find_if(pool.cbegin(), pool.cend(), looksBuiltIn);
        if (builtIn != pool.cend()) {
            anchor = *builtIn;
        } else if (IScreen* primary = platform->primaryScreen(); primary && pool.contains(primary)) {
            anchor = primary;
        } else if (!pool.isEmpty()) {
            anchor = pool.first();
        }
        if (!anchor) {
            return map;
        }
        map.m_roles.insert(ScreenRole::Bottom, anchor);
        pool.removeOne(anchor);
    }

    const QRectF anchorFrame = anchor->frame();
    const qreal anchorLeft = anchorFrame.x();
    const qreal anchorRight = anchorFrame.x() + anchorFrame.width();

    // 3. Centre column vs sides
    QVector<IScreen*> column;
    QVector<IScreen*> sides;
    for (IScreen* screen : std::as_const(pool)) {
        const qreal centerX = screen->frame().center().x();
        if (centerX >= anchorLeft && centerX < anchorRight) {
            column.append(screen);
        } else {
            sides.append(screen);
        }
    }

    // Nearest above the anchor first (largest y with Y growing downward)
    std::stable_sort(column.begin(), column.end(), [](IScreen* a, IScreen* b) {
        return a->frame().y() > b->frame().y();
    });
    if (!column.isEmpty()) {
        if (!map.m_roles.contains(ScreenRole::Center)) {
            map.m_roles.insert(ScreenRole::Center, column.first());
        }
        if (!map.m_roles.contains(ScreenRole::Top)) {
            map.m_roles.insert(ScreenRole::Top, column.size() > 1 ? column.at(1) : column.first());
        }
    }

    // 4. Sides, by which side of the anchor each lies on (a lone side screen
    //    to the east is "right", not "left")
    IScreen* left = nullptr;
    IScreen* right = nullptr;
    for (IScreen* screen : std::as_const(sides)) {
        const QRectF frame = screen->frame();
        const qreal centerX = frame.center().x();
        if (centerX < anchorLeft) {
            if (!left || frame.x() < left->frame().x()) {
                left = screen;
            }
        } else if (!right || frame.x() + frame.width() > right->frame().x() + right->frame().width()) {
            right = screen;
        }
    }
    if (left && !map.m_roles.contains(ScreenRole::Left)) {
        map.m_roles.insert(ScreenRole::Left, left);
    }
    if (right && !map.m_roles.contains(ScreenRole::Right)) {
        map.m_roles.insert(ScreenRole::Right, right);
    }

    for (auto it = map.m_roles.cbegin(); it != map.m_roles.cend(); ++it) {
        qCDebug(lcScreen) << screenRoleToString(it.key()) << "->" << it.value()->name() << it.value()->frame();
    }
    return map;
}

} // namespace WinStepper
