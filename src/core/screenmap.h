// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "types.h"
#include "winstepper_export.h"
#include <QMap>
#include <QString>

namespace WinStepper {

class IScreen;
class IScreenPlatform;

/**
 * @brief Spatial role -> screen classification
 *
 * Built on demand from the current screen arrangement:
 *
 * 1. Name overrides (regex per role) are applied first.
 * 2. The anchor (Bottom) is the built-in display, else the primary one.
 * 3. Screens whose horizontal centre lies inside the anchor's x-range form
 *    the centre column: the nearest one above the anchor is Center, the next
 *    is Top. A single column screen fills both roles.
 * 4. Other screens are sides: Left is the leftmost screen left of the
 *    anchor, Right the rightmost screen right of it.
 */
class WINSTEPPER_EXPORT ScreenMap
{
public:
    ScreenMap() = default;

    /**
     * @brief Classify the platform's screens
     * @param platform Screen enumeration
     * @param nameOverrides Regex on IScreen::name() per role (case-insensitive)
     */
    static ScreenMap build(IScreenPlatform* platform, const QMap<ScreenRole, QString>& nameOverrides = {});

    /// Screen with the role, nullptr if no screen has it
    IScreen* screenFor(ScreenRole role) const;
    bool isEmpty() const
    {
        return m_roles.isEmpty();
    }
    QMap<ScreenRole, IScreen*> roles() const
    {
        return m_roles;
    }

private:
    QMap<ScreenRole, IScreen*> m_roles;
};

} // namespace WinStepper
