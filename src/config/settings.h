// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "../core/interfaces.h"
#include "../core/constants.h"
#include <KConfigGroup>

namespace QuickWheel {

/**
 * @brief User settings for QuickWheel
 *
 * Implements the ISettings interface with KConfig integration (quickwheelrc).
 * Every value read from disk is validated against the ranges declared in
 * quickwheel.kcfg and falls back to the default when out of range.
 *
 * Note: This class does NOT use the singleton pattern. Create instances
 * where needed and pass via dependency injection.
 */
class QUICKWHEEL_EXPORT Settings : public ISettings
{
    Q_OBJECT

    // Activation
    Q_PROPERTY(QString activationKey1 READ activationKey1String NOTIFY activationKeysChanged)
    Q_PROPERTY(QString activationKey2 READ activationKey2String NOTIFY activationKeysChanged)

    // Timing
    Q_PROPERTY(int dwellMs READ dwellMs WRITE setDwellMs NOTIFY dwellMsChanged)
    Q_PROPERTY(int autoContinueExtraMs READ autoContinueExtraMs WRITE setAutoContinueExtraMs NOTIFY
                   autoContinueExtraMsChanged)
    Q_PROPERTY(int keystrokeDelayMs READ keystrokeDelayMs WRITE setKeystrokeDelayMs NOTIFY keystrokeDelayMsChanged)
    Q_PROPERTY(int pollIntervalMs READ pollIntervalMs WRITE setPollIntervalMs NOTIFY pollIntervalMsChanged)

    // Geometry
    Q_PROPERTY(int wheelRadius READ wheelRadius WRITE setWheelRadius NOTIFY geometryChanged)
    Q_PROPERTY(int innerRadius READ innerRadius WRITE setInnerRadius NOTIFY geometryChanged)
    Q_PROPERTY(int settingsButtonRadius READ settingsButtonRadius WRITE setSettingsButtonRadius NOTIFY geometryChanged)

    // Appearance (consumed by the renderer)
    Q_PROPERTY(int backgroundOpacity READ backgroundOpacity WRITE setBackgroundOpacity NOTIFY appearanceChanged)
    Q_PROPERTY(int fontSize READ fontSize WRITE setFontSize NOTIFY appearanceChanged)
    Q_PROPERTY(QColor segmentColor READ segmentColor WRITE setSegmentColor NOTIFY appearanceChanged)
    Q_PROPERTY(QColor hoverColor READ hoverColor WRITE setHoverColor NOTIFY appearanceChanged)
    Q_PROPERTY(QColor textColor READ textColor WRITE setTextColor NOTIFY appearanceChanged)
    Q_PROPERTY(QColor borderColor READ borderColor WRITE setBorderColor NOTIFY appearanceChanged)

public:
    explicit Settings(QObject* parent = nullptr);
    ~Settings() override = default;

    // ISettings
    WheelSettings wheelSettings() const override { return m_values; }
    void apply(const WheelSettings& settings) override;
    void load() override;
    void save() override;
    void reset() override;

    /**
     * @brief Clamp every field into its valid range
     *
     * Equal activation keys fall back to the default pair; an inner radius
     * not smaller than the wheel radius falls back to the default radii.
     */
    static WheelSettings validated(const WheelSettings& settings);

    // Activation
    ActivationKey activationKey1() const { return m_values.activationKey1; }
    ActivationKey activationKey2() const { return m_values.activationKey2; }
    QString activationKey1String() const { return activationKeyToString(m_values.activationKey1); }
    QString activationKey2String() const { return activationKeyToString(m_values.activationKey2); }
    /**
     * @return false (and no change) if both keys are the same
     */
    bool setActivationKeys(ActivationKey first, ActivationKey second);

    // Timing
    int dwellMs() const { return m_values.dwellMs; }
    void setDwellMs(int ms);
    int autoContinueExtraMs() const { return m_values.autoContinueExtraMs; }
    void setAutoContinueExtraMs(int ms);
    int keystrokeDelayMs() const { return m_values.keystrokeDelayMs; }
    void setKeystrokeDelayMs(int ms);
    int pollIntervalMs() const { return m_values.pollIntervalMs; }
    void setPollIntervalMs(int ms);

    // Geometry
    int wheelRadius() const { return m_values.wheelRadius; }
    void setWheelRadius(int radius);
    int innerRadius() const { return m_values.innerRadius; }
    void setInnerRadius(int radius);
    int settingsButtonRadius() const { return m_values.settingsButtonRadius; }
    void setSettingsButtonRadius(int radius);

    // Appearance
    int backgroundOpacity() const { return m_values.backgroundOpacity; }
    void setBackgroundOpacity(int opacity);
    int fontSize() const { return m_values.fontSize; }
    void setFontSize(int size);
    QColor segmentColor() const { return m_values.segmentColor; }
    void setSegmentColor(const QColor& color);
    QColor hoverColor() const { return m_values.hoverColor; }
    void setHoverColor(const QColor& color);
    QColor textColor() const { return m_values.textColor; }
    void setTextColor(const QColor& color);
    QColor borderColor() const { return m_values.borderColor; }
    void setBorderColor(const QColor& color);

    // Behavior
    SuppressionReset suppressionReset() const { return m_values.suppressionReset; }
    void setSuppressionReset(SuppressionReset mode);

Q_SIGNALS:
    void dwellMsChanged();
    void autoContinueExtraMsChanged();
    void keystrokeDelayMsChanged();
    void pollIntervalMsChanged();
    void geometryChanged();
    void appearanceChanged();
    void suppressionResetChanged();

private:
    static int readValidatedInt(const KConfigGroup& group, const char* key, int defaultValue, int min, int max,
                                const char* settingName);
    static QColor readValidatedColor(const KConfigGroup& group, const char* key, const QColor& defaultValue,
                                     const char* settingName);
    static ActivationKey readActivationKey(const KConfigGroup& group, const char* key, const QString& defaultValue);
    static WheelSettings defaults();

    WheelSettings m_values;
};

} // namespace QuickWheel
