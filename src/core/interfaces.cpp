// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "interfaces.h"

namespace QuickWheel {

// Key functions for interface classes to anchor vtables to this translation unit

ISettings::~ISettings() = default;

IActionExecutor::~IActionExecutor() = default;

IKeystrokeInjector::~IKeystrokeInjector() = default;

IGraphPersistence::~IGraphPersistence() = default;

ICursorProvider::~ICursorProvider() = default;

IHotkeySource::~IHotkeySource() = default;

IWheelView::~IWheelView() = default;

// ═══════════════════════════════════════════════════════════════════════════════
// Settings value helpers
// ═══════════════════════════════════════════════════════════════════════════════

QString activationKeyToString(ActivationKey key)
{
    switch (key) {
    case ActivationKey::Super:
        return QStringLiteral("super");
    case ActivationKey::Alt:
        return QStringLiteral("alt");
    case ActivationKey::Ctrl:
        return QStringLiteral("ctrl");
    case ActivationKey::Shift:
        return QStringLiteral("shift");
    }
    return QString();
}

std::optional<ActivationKey> activationKeyFromString(const QString& name)
{
    const QString key = name.trimmed().toLower();
    if (key == QLatin1String("super") || key == QLatin1String("meta")) {
        return ActivationKey::Super;
    }
    if (key == QLatin1String("alt")) {
        return ActivationKey::Alt;
    }
    if (key == QLatin1String("ctrl") || key == QLatin1String("control")) {
        return ActivationKey::Ctrl;
    }
    if (key == QLatin1String("shift")) {
        return ActivationKey::Shift;
    }
    return std::nullopt;
}

bool WheelSettings::operator==(const WheelSettings& other) const
{
    return activationKey1 == other.activationKey1 && activationKey2 == other.activationKey2
        && dwellMs == other.dwellMs && autoContinueExtraMs == other.autoContinueExtraMs
        && keystrokeDelayMs == other.keystrokeDelayMs && pollIntervalMs == other.pollIntervalMs
        && wheelRadius == other.wheelRadius && innerRadius == other.innerRadius
        && settingsButtonRadius == other.settingsButtonRadius && backgroundOpacity == other.backgroundOpacity
        && fontSize == other.fontSize && segmentColor == other.segmentColor && hoverColor == other.hoverColor
        && textColor == other.textColor && borderColor == other.borderColor
        && suppressionReset == other.suppressionReset;
}

} // namespace QuickWheel
