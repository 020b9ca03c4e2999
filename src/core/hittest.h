// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "quickwheel_export.h"
#include <QDebug>
#include <QPointF>

namespace QuickWheel {

/**
 * @brief Ring and settings button geometry, relative to the wheel center
 */
struct QUICKWHEEL_EXPORT WheelGeometry {
    qreal innerRadius = 50.0;
    qreal outerRadius = 180.0;
    QPointF settingsButtonCenter;
    qreal settingsButtonRadius = 14.0;

    /**
     * @brief Geometry with the settings button placed just outside the ring
     *        on the upper-right diagonal
     */
    static WheelGeometry fromRadii(qreal innerRadius, qreal outerRadius, qreal settingsButtonRadius);
};

/**
 * @brief Logical target under the cursor
 */
struct QUICKWHEEL_EXPORT HitResult {
    enum class Kind {
        None, ///< Dead zone or outside the wheel
        Slot,
        SettingsButton
    };

    Kind kind = Kind::None;
    int slot = -1; // 0-7 when kind == Slot

    static HitResult none() { return {}; }
    static HitResult forSlot(int index) { return {Kind::Slot, index}; }
    static HitResult settingsButton() { return {Kind::SettingsButton, -1}; }

    bool isSlot() const { return kind == Kind::Slot; }
    bool isSettingsButton() const { return kind == Kind::SettingsButton; }
    bool isNone() const { return kind == Kind::None; }

    bool operator==(const HitResult& other) const { return kind == other.kind && slot == other.slot; }
    bool operator!=(const HitResult& other) const { return !(*this == other); }
};

QUICKWHEEL_EXPORT QDebug operator<<(QDebug debug, const HitResult& hit);

/**
 * @brief Cursor-to-target mapping for the wheel
 *
 * Pure functions, no state. Evaluated on every poll tick because a
 * borderless overlay gets no discrete motion event to react to.
 */
namespace HitTest {

/**
 * @brief Map a cursor offset from the wheel center to a target
 *
 * The settings button wins over the ring when the regions overlap. Within
 * the ring, slot 0 is centered on the 0° axis (pointing right) and indices
 * increase clockwise in screen coordinates, each covering 45°.
 *
 * @param offset Cursor position minus wheel center (screen coordinates, y down)
 * @param geometry Current ring and button geometry
 */
QUICKWHEEL_EXPORT HitResult hitTest(const QPointF& offset, const WheelGeometry& geometry);

/**
 * @brief Slot index for an angle in degrees, ignoring distance
 */
QUICKWHEEL_EXPORT int slotForAngle(qreal degrees);

/**
 * @brief Center angle (degrees) of a slot, used for label placement
 */
QUICKWHEEL_EXPORT qreal slotCenterAngle(int index);

} // namespace HitTest

} // namespace QuickWheel
