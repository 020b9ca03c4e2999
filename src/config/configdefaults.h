// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "quickwheelconfig.h" // Generated from quickwheel.kcfg via KConfigXT

#include <QColor>
#include <QString>

namespace QuickWheel {

/**
 * @brief Provides static access to default configuration values
 *
 * Wraps the KConfigXT-generated QuickWheelConfig class. The .kcfg file is
 * the single source of truth for defaults; this class only exposes them.
 *
 * Usage:
 *   int dwell = ConfigDefaults::dwellMs();       // 400
 *   int radius = ConfigDefaults::wheelRadius();  // 180
 */
class ConfigDefaults
{
public:
    // ═══════════════════════════════════════════════════════════════════════════
    // Activation
    // ═══════════════════════════════════════════════════════════════════════════

    static QString activationKey1() { return instance().defaultActivationKey1Value(); }
    static QString activationKey2() { return instance().defaultActivationKey2Value(); }

    // ═══════════════════════════════════════════════════════════════════════════
    // Timing
    // ═══════════════════════════════════════════════════════════════════════════

    static int dwellMs() { return instance().defaultDwellMsValue(); }
    static int autoContinueExtraMs() { return instance().defaultAutoContinueExtraMsValue(); }
    static int keystrokeDelayMs() { return instance().defaultKeystrokeDelayMsValue(); }
    static int pollIntervalMs() { return instance().defaultPollIntervalMsValue(); }

    // ═══════════════════════════════════════════════════════════════════════════
    // Geometry
    // ═══════════════════════════════════════════════════════════════════════════

    static int wheelRadius() { return instance().defaultWheelRadiusValue(); }
    static int innerRadius() { return instance().defaultInnerRadiusValue(); }
    static int settingsButtonRadius() { return instance().defaultSettingsButtonRadiusValue(); }

    // ═══════════════════════════════════════════════════════════════════════════
    // Appearance (renderer only)
    // ═══════════════════════════════════════════════════════════════════════════

    static int backgroundOpacity() { return instance().defaultBackgroundOpacityValue(); }
    static int fontSize() { return instance().defaultFontSizeValue(); }
    static QColor segmentColor() { return instance().defaultSegmentColorValue(); }
    static QColor hoverColor() { return instance().defaultHoverColorValue(); }
    static QColor textColor() { return instance().defaultTextColorValue(); }
    static QColor borderColor() { return instance().defaultBorderColorValue(); }

    // ═══════════════════════════════════════════════════════════════════════════
    // Behavior
    // ═══════════════════════════════════════════════════════════════════════════

    static int suppressionReset() { return instance().defaultSuppressionResetValue(); }

    // Validation ranges, kept in sync with the <min>/<max> of quickwheel.kcfg
    static constexpr int DwellMsMin = 100;
    static constexpr int DwellMsMax = 2000;
    static constexpr int AutoContinueExtraMsMin = 0;
    static constexpr int AutoContinueExtraMsMax = 2000;
    static constexpr int KeystrokeDelayMsMin = 0;
    static constexpr int KeystrokeDelayMsMax = 1000;
    static constexpr int PollIntervalMsMin = 8;
    static constexpr int PollIntervalMsMax = 100;
    static constexpr int WheelRadiusMin = 100;
    static constexpr int WheelRadiusMax = 400;
    static constexpr int InnerRadiusMin = 20;
    static constexpr int InnerRadiusMax = 100;
    static constexpr int SettingsButtonRadiusMin = 8;
    static constexpr int SettingsButtonRadiusMax = 40;
    static constexpr int BackgroundOpacityMin = 50;
    static constexpr int BackgroundOpacityMax = 255;
    static constexpr int FontSizeMin = 6;
    static constexpr int FontSizeMax = 18;

private:
    // Lazily-initialized singleton instance
    static QuickWheelConfig& instance()
    {
        static QuickWheelConfig config;
        return config;
    }

    // Non-instantiable
    ConfigDefaults() = delete;
};

} // namespace QuickWheel
