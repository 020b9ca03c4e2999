// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "hittest.h"
#include "constants.h"
#include <QtMath>
#include <cmath>

namespace QuickWheel {

WheelGeometry WheelGeometry::fromRadii(qreal innerRadius, qreal outerRadius, qreal settingsButtonRadius)
{
    WheelGeometry geometry;
    geometry.innerRadius = innerRadius;
    geometry.outerRadius = outerRadius;
    geometry.settingsButtonRadius = settingsButtonRadius;

    const qreal distance = outerRadius + settingsButtonRadius + Defaults::SettingsButtonGap;
    const qreal radians = qDegreesToRadians(Defaults::SettingsButtonAngle);
    geometry.settingsButtonCenter = QPointF(distance * std::cos(radians), distance * std::sin(radians));
    return geometry;
}

QDebug operator<<(QDebug debug, const HitResult& hit)
{
    QDebugStateSaver saver(debug);
    switch (hit.kind) {
    case HitResult::Kind::None:
        debug.nospace() << "HitResult(None)";
        break;
    case HitResult::Kind::Slot:
        debug.nospace() << "HitResult(Slot " << hit.slot << ")";
        break;
    case HitResult::Kind::SettingsButton:
        debug.nospace() << "HitResult(SettingsButton)";
        break;
    }
    return debug;
}

namespace HitTest {

int slotForAngle(qreal degrees)
{
    qreal angle = std::fmod(degrees - Defaults::AngleOffset, 360.0);
    if (angle < 0.0) {
        angle += 360.0;
    }
    return static_cast<int>(std::floor(angle / Defaults::SegmentAngle)) % Defaults::SlotCount;
}

qreal slotCenterAngle(int index)
{
    return index * Defaults::SegmentAngle;
}

HitResult hitTest(const QPointF& offset, const WheelGeometry& geometry)
{
    const QPointF toButton = offset - geometry.settingsButtonCenter;
    if (std::hypot(toButton.x(), toButton.y()) <= geometry.settingsButtonRadius) {
        return HitResult::settingsButton();
    }

    const qreal dist = std::hypot(offset.x(), offset.y());
    if (dist < geometry.innerRadius || dist > geometry.outerRadius) {
        return HitResult::none();
    }

    const qreal degrees = qRadiansToDegrees(std::atan2(offset.y(), offset.x()));
    return HitResult::forSlot(slotForAngle(degrees));
}

} // namespace HitTest

} // namespace QuickWheel
