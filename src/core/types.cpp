// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "types.h"

namespace WinStepper {

bool isHorizontal(Direction direction)
{
    return direction == Direction::Left || direction == Direction::Right;
}

Edge edgeFor(Direction direction)
{
    switch (direction) {
    case Direction::Left:
        return Edge::Left;
    case Direction::Right:
        return Edge::Right;
    case Direction::Up:
        return Edge::Top;
    case Direction::Down:
        return Edge::Bottom;
    }
    return Edge::None;
}

QString directionToString(Direction direction)
{
    switch (direction) {
    case Direction::Left:
        return QStringLiteral("left");
    case Direction::Right:
        return QStringLiteral("right");
    case Direction::Up:
        return QStringLiteral("up");
    case Direction::Down:
        return QStringLiteral("down");
    }
    return QString();
}

std::optional<Direction> directionFromString(const QString& name)
{
    const QString lower = name.trimmed().toLower();
    if (lower == QLatin1String("left")) {
        return Direction::Left;
    }
    if (lower == QLatin1String("right")) {
        return Direction::Right;
    }
    if (lower == QLatin1String("up")) {
        return Direction::Up;
    }
    if (lower == QLatin1String("down")) {
        return Direction::Down;
    }
    return std::nullopt;
}

QString screenRoleToString(ScreenRole role)
{
    switch (role) {
    case ScreenRole::Bottom:
        return QStringLiteral("bottom");
    case ScreenRole::Center:
        return QStringLiteral("center");
    case ScreenRole::Top:
        return QStringLiteral("top");
    case ScreenRole::Left:
        return QStringLiteral("left");
    case ScreenRole::Right:
        return QStringLiteral("right");
    }
    return QString();
}

std::optional<ScreenRole> screenRoleFromString(const QString& name)
{
    const QString lower = name.trimmed().toLower();
    if (lower == QLatin1String("bottom")) {
        return ScreenRole::Bottom;
    }
    if (lower == QLatin1String("center")) {
        return ScreenRole::Center;
    }
    if (lower == QLatin1String("top")) {
        return ScreenRole::Top;
    }
    if (lower == QLatin1String("left")) {
        return ScreenRole::Left;
    }
    if (lower == QLatin1String("right")) {
        return ScreenRole::Right;
    }
    return std::nullopt;
}

QString cycleStepToString(CycleStep step)
{
    switch (step) {
    case CycleStep::None:
        return QStringLiteral("none");
    case CycleStep::Half:
        return QStringLiteral("half");
    case CycleStep::Third:
        return QStringLiteral("third");
    case CycleStep::MidThird:
        return QStringLiteral("mid-third");
    case CycleStep::TwoThirds:
        return QStringLiteral("two-thirds");
    }
    return QString();
}

} // namespace WinStepper
