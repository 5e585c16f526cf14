// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "interfaces.h"
#include "geometryutils.h"

namespace WinStepper {

// Out-of-line destructor anchors the vtable in this translation unit
ISettings::~ISettings() = default;

IScreen* IScreenPlatform::screenInDirection(IScreen* from, Direction direction) const
{
    return GeometryUtils::screenInDirection(screens(), from, direction);
}

IScreen* IScreenPlatform::screenAt(const QPointF& point) const
{
    const auto all = screens();
    for (IScreen* screen : all) {
        if (screen && GeometryUtils::containsPoint(screen->frame(), point)) {
            return screen;
        }
    }
    return nullptr;
}

IWindow* IWindowPlatform::windowAt(const QPointF& point) const
{
    const auto windows = orderedWindows();
    for (IWindow* window : windows) {
        if (!window || !window->isStandard() || !window->isVisible()) {
            continue;
        }
        // Closed on the right/bottom so a cursor resting on the border still grabs the window
        const QRectF frame = window->frame();
        if (point.x() >= frame.x() && point.x() <= frame.x() + frame.width() && point.y() >= frame.y()
            && point.y() <= frame.y() + frame.height()) {
            return window;
        }
    }
    return nullptr;
}

} // namespace WinStepper
