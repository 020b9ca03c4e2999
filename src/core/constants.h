// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QLatin1String>

namespace QuickWheel {

/**
 * @brief Structural constants of the wheel
 *
 * These are fixed by the slot layout and are NOT configurable. For
 * user-configurable values (radii, timings), see ConfigDefaults and
 * quickwheel.kcfg.
 */
namespace Defaults {
// Slot layout
constexpr int SlotCount = 8;
constexpr int BackSlotIndex = 7; // Top-right segment of every non-root folder
constexpr qreal SegmentAngle = 360.0 / SlotCount;
constexpr qreal AngleOffset = -SegmentAngle / 2.0; // Slot 0 centered on the 0° axis

// Settings button sits outside the ring, towards the upper right
constexpr qreal SettingsButtonAngle = -45.0;
constexpr qreal SettingsButtonGap = 6.0;

// Default label cut-off for command slots
constexpr int CommandLabelLength = 30;

// Folder id format: "folder_" + 8 hex digits
constexpr int FolderIdHexDigits = 8;
inline constexpr QLatin1String FolderIdPrefix{"folder_"};
}

/**
 * @brief JSON keys for wheel.json serialization
 */
namespace JsonKeys {
inline constexpr QLatin1String Root{"root"};
inline constexpr QLatin1String Slots{"slots"};
inline constexpr QLatin1String Label{"label"};
inline constexpr QLatin1String Type{"type"};
inline constexpr QLatin1String Value{"value"};
inline constexpr QLatin1String Icon{"icon"};
inline constexpr QLatin1String Kind{"kind"};
inline constexpr QLatin1String Data{"data"};
inline constexpr QLatin1String ShowLabel{"showLabel"};
}

/**
 * @brief Action type identifiers as stored on disk and sent over D-Bus
 */
namespace ActionTypeNames {
inline constexpr QLatin1String Keystroke{"keystroke"};
inline constexpr QLatin1String Command{"command"};
inline constexpr QLatin1String Launch{"launch"};
inline constexpr QLatin1String Folder{"folder"};
inline constexpr QLatin1String Back{"back"};
}

namespace IconKindNames {
inline constexpr QLatin1String Emoji{"emoji"};
inline constexpr QLatin1String Image{"image"};
}

namespace DBus {
inline constexpr QLatin1String ServiceName{"org.quickwheel"};
inline constexpr QLatin1String ObjectPath{"/QuickWheel"};

namespace Interface {
inline constexpr QLatin1String Wheel{"org.quickwheel.Wheel"};
}
}

} // namespace QuickWheel
