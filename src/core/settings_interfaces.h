// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "quickwheel_export.h"
#include "hittest.h"
#include <QColor>
#include <QString>
#include <optional>

namespace QuickWheel {

/**
 * @brief One half of the activation key pair
 */
enum class ActivationKey {
    Super = 0,
    Alt = 1,
    Ctrl = 2,
    Shift = 3
};

QUICKWHEEL_EXPORT QString activationKeyToString(ActivationKey key);
QUICKWHEEL_EXPORT std::optional<ActivationKey> activationKeyFromString(const QString& name);

/**
 * @brief When the post-navigation dwell suppression is lifted
 *
 * OnHoverChange: the first time the hovered slot differs from the previous
 * observation (an intermediate dead-zone observation counts as a change).
 * OnFirstObservation: on the first evaluation after the transition,
 * regardless of what is hovered.
 * Either way, reaching the dead zone or leaving the wheel clears both flags.
 */
enum class SuppressionReset {
    OnHoverChange = 0,
    OnFirstObservation = 1
};

/**
 * @brief Snapshot of everything the wheel engine reads from settings
 *
 * Values here are already validated. Colors, opacity and font size are
 * passed through to the renderer untouched.
 */
struct QUICKWHEEL_EXPORT WheelSettings {
    ActivationKey activationKey1 = ActivationKey::Super;
    ActivationKey activationKey2 = ActivationKey::Alt;

    int dwellMs = 400;
    int autoContinueExtraMs = 200;
    int keystrokeDelayMs = 150;
    int pollIntervalMs = 16;

    int wheelRadius = 180;
    int innerRadius = 50;
    int settingsButtonRadius = 14;

    int backgroundOpacity = 220;
    int fontSize = 9;
    QColor segmentColor{50, 50, 55, 200};
    QColor hoverColor{80, 120, 200, 200};
    QColor textColor{220, 220, 220, 255};
    QColor borderColor{100, 100, 110, 180};

    SuppressionReset suppressionReset = SuppressionReset::OnHoverChange;

    WheelGeometry geometry() const
    {
        return WheelGeometry::fromRadii(innerRadius, wheelRadius, settingsButtonRadius);
    }

    bool operator==(const WheelSettings& other) const;
    bool operator!=(const WheelSettings& other) const { return !(*this == other); }
};

} // namespace QuickWheel
