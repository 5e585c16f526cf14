// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "stepprimitives.h"
#include "interfaces.h"

namespace WinStepper {

namespace StepPrimitives {

qreal stepSize(const QRectF& screen, Direction direction, int divisions)
{
    if (divisions <= 0) {
        divisions = Defaults::StepDivisions;
    }
    return isHorizontal(direction) ? screen.width() / divisions : screen.height() / divisions;
}

QRectF steppedMove(const QRectF& frame, const QRectF& screen, Direction direction, int divisions)
{
    const qreal step = stepSize(screen, direction, divisions);
    switch (direction) {
    case Direction::Left:
        return frame.translated(-step, 0);
    case Direction::Right:
        return frame.translated(step, 0);
    case Direction::Up:
        return frame.translated(0, -step);
    case Direction::Down:
        return frame.translated(0, step);
    }
    return frame;
}

QRectF steppedResize(const QRectF& frame, const QRectF& screen, Direction direction, int divisions)
{
    const qreal step = stepSize(screen, direction, divisions);
    QRectF result = frame;
    switch (direction) {
    case Direction::Left:
        result.setWidth(qMax(1.0, frame.width() - step));
        break;
    case Direction::Right:
        result.setWidth(frame.width() + step);
        break;
    case Direction::Up:
        result.setHeight(qMax(1.0, frame.height() - step));
        break;
    case Direction::Down:
        result.setHeight(frame.height() + step);
        break;
    }
    return result;
}

bool stepMove(IWindow* window, Direction direction, int divisions)
{
    if (!window || !window->screen()) {
        return false;
    }
    window->setFrame(steppedMove(window->frame(), window->screen()->frame(), direction, divisions));
    return true;
}

bool stepResize(IWindow* window, Direction direction, int divisions)
{
    if (!window || !window->screen()) {
        return false;
    }
    window->setFrame(steppedResize(window->frame(), window->screen()->frame(), direction, divisions));
    return true;
}

} // namespace StepPrimitives

} // namespace WinStepper
