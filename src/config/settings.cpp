// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "settings.h"
#include "configdefaults.h"
#include "../core/logging.h"
#include <KSharedConfig>

namespace QuickWheel {

namespace {
const QString ConfigFileName = QStringLiteral("quickwheelrc");
}

// ═══════════════════════════════════════════════════════════════════════════════
// Macros for setter patterns
// ═══════════════════════════════════════════════════════════════════════════════

// Simple setter: if changed, update member, emit specific signal, emit settingsChanged
#define SETTINGS_SETTER(Type, name, member, signal) \
    void Settings::set##name(Type value) \
    { \
        if (member != value) { \
            member = value; \
            Q_EMIT signal(); \
            Q_EMIT settingsChanged(); \
        } \
    }

// Clamped int setter: clamp value, then apply if changed
#define SETTINGS_SETTER_CLAMPED(name, member, signal, minVal, maxVal) \
    void Settings::set##name(int value) \
    { \
        value = qBound(minVal, value, maxVal); \
        if (member != value) { \
            member = value; \
            Q_EMIT signal(); \
            Q_EMIT settingsChanged(); \
        } \
    }

Settings::Settings(QObject* parent)
    : ISettings(parent)
{
    load();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Helper Methods
// ═══════════════════════════════════════════════════════════════════════════════

int Settings::readValidatedInt(const KConfigGroup& group, const char* key, int defaultValue, int min, int max,
                               const char* settingName)
{
    int value = group.readEntry(QLatin1String(key), defaultValue);
    if (value < min || value > max) {
        qCWarning(lcConfig) << "Invalid" << settingName << ":" << value << "using default (must be" << min << "-"
                            << max << ")";
        value = defaultValue;
    }
    return value;
}

QColor Settings::readValidatedColor(const KConfigGroup& group, const char* key, const QColor& defaultValue,
                                    const char* settingName)
{
    QColor color = group.readEntry(QLatin1String(key), defaultValue);
    if (!color.isValid()) {
        qCWarning(lcConfig) << "Invalid" << settingName << "color, using default";
        color = defaultValue;
    }
    return color;
}

ActivationKey Settings::readActivationKey(const KConfigGroup& group, const char* key, const QString& defaultValue)
{
    const QString name = group.readEntry(QLatin1String(key), defaultValue);
    if (auto parsed = activationKeyFromString(name)) {
        return *parsed;
    }
    qCWarning(lcConfig) << "Invalid activation key" << key << ":" << name << "using default" << defaultValue;
    return activationKeyFromString(defaultValue).value_or(ActivationKey::Super);
}

WheelSettings Settings::defaults()
{
    WheelSettings values;
    values.activationKey1 = activationKeyFromString(ConfigDefaults::activationKey1()).value_or(ActivationKey::Super);
    values.activationKey2 = activationKeyFromString(ConfigDefaults::activationKey2()).value_or(ActivationKey::Alt);
    values.dwellMs = ConfigDefaults::dwellMs();
    values.autoContinueExtraMs = ConfigDefaults::autoContinueExtraMs();
    values.keystrokeDelayMs = ConfigDefaults::keystrokeDelayMs();
    values.pollIntervalMs = ConfigDefaults::pollIntervalMs();
    values.wheelRadius = ConfigDefaults::wheelRadius();
    values.innerRadius = ConfigDefaults::innerRadius();
    values.settingsButtonRadius = ConfigDefaults::settingsButtonRadius();
    values.backgroundOpacity = ConfigDefaults::backgroundOpacity();
    values.fontSize = ConfigDefaults::fontSize();
    values.segmentColor = ConfigDefaults::segmentColor();
    values.hoverColor = ConfigDefaults::hoverColor();
    values.textColor = ConfigDefaults::textColor();
    values.borderColor = ConfigDefaults::borderColor();
    values.suppressionReset = static_cast<SuppressionReset>(ConfigDefaults::suppressionReset());
    return values;
}

WheelSettings Settings::validated(const WheelSettings& settings)
{
    using D = ConfigDefaults;
    const WheelSettings fallback = defaults();
    WheelSettings values = settings;

    if (values.activationKey1 == values.activationKey2) {
        qCWarning(lcConfig) << "Activation keys must differ, using default pair";
        values.activationKey1 = fallback.activationKey1;
        values.activationKey2 = fallback.activationKey2;
    }

    values.dwellMs = qBound(D::DwellMsMin, values.dwellMs, D::DwellMsMax);
    values.autoContinueExtraMs = qBound(D::AutoContinueExtraMsMin, values.autoContinueExtraMs, D::AutoContinueExtraMsMax);
    values.keystrokeDelayMs = qBound(D::KeystrokeDelayMsMin, values.keystrokeDelayMs, D::KeystrokeDelayMsMax);
    values.pollIntervalMs = qBound(D::PollIntervalMsMin, values.pollIntervalMs, D::PollIntervalMsMax);

    values.wheelRadius = qBound(D::WheelRadiusMin, values.wheelRadius, D::WheelRadiusMax);
    values.innerRadius = qBound(D::InnerRadiusMin, values.innerRadius, D::InnerRadiusMax);
    values.settingsButtonRadius = qBound(D::SettingsButtonRadiusMin, values.settingsButtonRadius,
                                         D::SettingsButtonRadiusMax);
    if (values.innerRadius >= values.wheelRadius) {
        qCWarning(lcConfig) << "Inner radius" << values.innerRadius << "must be smaller than wheel radius"
                            << values.wheelRadius << ", using defaults";
        values.innerRadius = fallback.innerRadius;
        values.wheelRadius = fallback.wheelRadius;
    }

    values.backgroundOpacity = qBound(D::BackgroundOpacityMin, values.backgroundOpacity, D::BackgroundOpacityMax);
    values.fontSize = qBound(D::FontSizeMin, values.fontSize, D::FontSizeMax);
    if (!values.segmentColor.isValid()) {
        values.segmentColor = fallback.segmentColor;
    }
    if (!values.hoverColor.isValid()) {
        values.hoverColor = fallback.hoverColor;
    }
    if (!values.textColor.isValid()) {
        values.textColor = fallback.textColor;
    }
    if (!values.borderColor.isValid()) {
        values.borderColor = fallback.borderColor;
    }

    if (values.suppressionReset != SuppressionReset::OnHoverChange
        && values.suppressionReset != SuppressionReset::OnFirstObservation) {
        values.suppressionReset = fallback.suppressionReset;
    }
    return values;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Setters
// ═══════════════════════════════════════════════════════════════════════════════

bool Settings::setActivationKeys(ActivationKey first, ActivationKey second)
{
    if (first == second) {
        qCWarning(lcConfig) << "Rejected activation pair, both keys are" << activationKeyToString(first);
        return false;
    }
    if (m_values.activationKey1 != first || m_values.activationKey2 != second) {
        m_values.activationKey1 = first;
        m_values.activationKey2 = second;
        Q_EMIT activationKeysChanged();
        Q_EMIT settingsChanged();
    }
    return true;
}

SETTINGS_SETTER_CLAMPED(DwellMs, m_values.dwellMs, dwellMsChanged, ConfigDefaults::DwellMsMin, ConfigDefaults::DwellMsMax)
SETTINGS_SETTER_CLAMPED(AutoContinueExtraMs, m_values.autoContinueExtraMs, autoContinueExtraMsChanged,
                        ConfigDefaults::AutoContinueExtraMsMin, ConfigDefaults::AutoContinueExtraMsMax)
SETTINGS_SETTER_CLAMPED(KeystrokeDelayMs, m_values.keystrokeDelayMs, keystrokeDelayMsChanged,
                        ConfigDefaults::KeystrokeDelayMsMin, ConfigDefaults::KeystrokeDelayMsMax)
SETTINGS_SETTER_CLAMPED(PollIntervalMs, m_values.pollIntervalMs, pollIntervalMsChanged,
                        ConfigDefaults::PollIntervalMsMin, ConfigDefaults::PollIntervalMsMax)
SETTINGS_SETTER_CLAMPED(SettingsButtonRadius, m_values.settingsButtonRadius, geometryChanged,
                        ConfigDefaults::SettingsButtonRadiusMin, ConfigDefaults::SettingsButtonRadiusMax)
SETTINGS_SETTER_CLAMPED(BackgroundOpacity, m_values.backgroundOpacity, appearanceChanged,
                        ConfigDefaults::BackgroundOpacityMin, ConfigDefaults::BackgroundOpacityMax)
SETTINGS_SETTER_CLAMPED(FontSize, m_values.fontSize, appearanceChanged, ConfigDefaults::FontSizeMin,
                        ConfigDefaults::FontSizeMax)
SETTINGS_SETTER(const QColor&, SegmentColor, m_values.segmentColor, appearanceChanged)
SETTINGS_SETTER(const QColor&, HoverColor, m_values.hoverColor, appearanceChanged)
SETTINGS_SETTER(const QColor&, TextColor, m_values.textColor, appearanceChanged)
SETTINGS_SETTER(const QColor&, BorderColor, m_values.borderColor, appearanceChanged)
SETTINGS_SETTER(SuppressionReset, SuppressionReset, m_values.suppressionReset, suppressionResetChanged)

void Settings::setWheelRadius(int radius)
{
    // Keep the dead zone strictly inside the ring
    radius = qBound(qMax(ConfigDefaults::WheelRadiusMin, m_values.innerRadius + 1), radius,
                    ConfigDefaults::WheelRadiusMax);
    if (m_values.wheelRadius != radius) {
        m_values.wheelRadius = radius;
        Q_EMIT geometryChanged();
        Q_EMIT settingsChanged();
    }
}

void Settings::setInnerRadius(int radius)
{
    radius = qBound(ConfigDefaults::InnerRadiusMin, radius, qMin(ConfigDefaults::InnerRadiusMax, m_values.wheelRadius - 1));
    if (m_values.innerRadius != radius) {
        m_values.innerRadius = radius;
        Q_EMIT geometryChanged();
        Q_EMIT settingsChanged();
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// ISettings
// ═══════════════════════════════════════════════════════════════════════════════

void Settings::apply(const WheelSettings& settings)
{
    const WheelSettings values = validated(settings);
    if (values == m_values) {
        return;
    }

    const bool keysChanged =
        values.activationKey1 != m_values.activationKey1 || values.activationKey2 != m_values.activationKey2;
    m_values = values;
    save();

    qCInfo(lcConfig) << "Settings applied";
    if (keysChanged) {
        Q_EMIT activationKeysChanged();
    }
    Q_EMIT settingsChanged();
}

void Settings::load()
{
    auto config = KSharedConfig::openConfig(ConfigFileName);

    // Force re-read from disk - KSharedConfig caches in memory, so an external
    // edit is only seen after invalidating the cache
    config->reparseConfiguration();

    KConfigGroup activation = config->group(QStringLiteral("Activation"));
    KConfigGroup timing = config->group(QStringLiteral("Timing"));
    KConfigGroup geometry = config->group(QStringLiteral("Geometry"));
    KConfigGroup appearance = config->group(QStringLiteral("Appearance"));
    KConfigGroup behavior = config->group(QStringLiteral("Behavior"));

    using D = ConfigDefaults;
    WheelSettings values;

    // Activation pair
    values.activationKey1 = readActivationKey(activation, "Key1", D::activationKey1());
    values.activationKey2 = readActivationKey(activation, "Key2", D::activationKey2());

    // Timing
    values.dwellMs = readValidatedInt(timing, "DwellMs", D::dwellMs(), D::DwellMsMin, D::DwellMsMax, "dwell time");
    values.autoContinueExtraMs = readValidatedInt(timing, "AutoContinueExtraMs", D::autoContinueExtraMs(),
                                                  D::AutoContinueExtraMsMin, D::AutoContinueExtraMsMax,
                                                  "auto-continue extra time");
    values.keystrokeDelayMs = readValidatedInt(timing, "KeystrokeDelayMs", D::keystrokeDelayMs(),
                                               D::KeystrokeDelayMsMin, D::KeystrokeDelayMsMax, "keystroke delay");
    values.pollIntervalMs = readValidatedInt(timing, "PollIntervalMs", D::pollIntervalMs(), D::PollIntervalMsMin,
                                             D::PollIntervalMsMax, "poll interval");

    // Geometry
    values.wheelRadius = readValidatedInt(geometry, "WheelRadius", D::wheelRadius(), D::WheelRadiusMin,
                                          D::WheelRadiusMax, "wheel radius");
    values.innerRadius = readValidatedInt(geometry, "InnerRadius", D::innerRadius(), D::InnerRadiusMin,
                                          D::InnerRadiusMax, "inner radius");
    values.settingsButtonRadius =
        readValidatedInt(geometry, "SettingsButtonRadius", D::settingsButtonRadius(), D::SettingsButtonRadiusMin,
                         D::SettingsButtonRadiusMax, "settings button radius");

    // Appearance
    values.backgroundOpacity = readValidatedInt(appearance, "BackgroundOpacity", D::backgroundOpacity(),
                                                D::BackgroundOpacityMin, D::BackgroundOpacityMax, "background opacity");
    values.fontSize =
        readValidatedInt(appearance, "FontSize", D::fontSize(), D::FontSizeMin, D::FontSizeMax, "font size");
    values.segmentColor = readValidatedColor(appearance, "SegmentColor", D::segmentColor(), "segment");
    values.hoverColor = readValidatedColor(appearance, "HoverColor", D::hoverColor(), "hover");
    values.textColor = readValidatedColor(appearance, "TextColor", D::textColor(), "text");
    values.borderColor = readValidatedColor(appearance, "BorderColor", D::borderColor(), "border");

    // Behavior
    values.suppressionReset = static_cast<SuppressionReset>(
        readValidatedInt(behavior, "SuppressionReset", D::suppressionReset(), 0, 1, "suppression reset"));

    // Cross-field rules (distinct keys, inner < outer)
    values = validated(values);

    const bool keysChanged =
        values.activationKey1 != m_values.activationKey1 || values.activationKey2 != m_values.activationKey2;
    m_values = values;

    qCInfo(lcConfig) << "Settings loaded successfully";

    if (keysChanged) {
        Q_EMIT activationKeysChanged();
    }
    Q_EMIT settingsChanged();
}

void Settings::save()
{
    auto config = KSharedConfig::openConfig(ConfigFileName);
    KConfigGroup activation = config->group(QStringLiteral("Activation"));
    KConfigGroup timing = config->group(QStringLiteral("Timing"));
    KConfigGroup geometry = config->group(QStringLiteral("Geometry"));
    KConfigGroup appearance = config->group(QStringLiteral("Appearance"));
    KConfigGroup behavior = config->group(QStringLiteral("Behavior"));

    activation.writeEntry(QLatin1String("Key1"), activationKeyToString(m_values.activationKey1));
    activation.writeEntry(QLatin1String("Key2"), activationKeyToString(m_values.activationKey2));

    timing.writeEntry(QLatin1String("DwellMs"), m_values.dwellMs);
    timing.writeEntry(QLatin1String("AutoContinueExtraMs"), m_values.autoContinueExtraMs);
    timing.writeEntry(QLatin1String("KeystrokeDelayMs"), m_values.keystrokeDelayMs);
    timing.writeEntry(QLatin1String("PollIntervalMs"), m_values.pollIntervalMs);

    geometry.writeEntry(QLatin1String("WheelRadius"), m_values.wheelRadius);
    geometry.writeEntry(QLatin1String("InnerRadius"), m_values.innerRadius);
    geometry.writeEntry(QLatin1String("SettingsButtonRadius"), m_values.settingsButtonRadius);

    appearance.writeEntry(QLatin1String("BackgroundOpacity"), m_values.backgroundOpacity);
    appearance.writeEntry(QLatin1String("FontSize"), m_values.fontSize);
    appearance.writeEntry(QLatin1String("SegmentColor"), m_values.segmentColor);
    appearance.writeEntry(QLatin1String("HoverColor"), m_values.hoverColor);
    appearance.writeEntry(QLatin1String("TextColor"), m_values.textColor);
    appearance.writeEntry(QLatin1String("BorderColor"), m_values.borderColor);

    behavior.writeEntry(QLatin1String("SuppressionReset"), static_cast<int>(m_values.suppressionReset));

    if (!config->sync()) {
        qCWarning(lcConfig) << "Failed to write" << ConfigFileName;
    }
}

void Settings::reset()
{
    // Clear all config groups and reload with defaults
    auto config = KSharedConfig::openConfig(ConfigFileName);

    const QStringList groups = {QStringLiteral("Activation"), QStringLiteral("Timing"), QStringLiteral("Geometry"),
                                QStringLiteral("Appearance"), QStringLiteral("Behavior")};
    for (const QString& groupName : groups) {
        config->deleteGroup(groupName);
    }
    if (!config->sync()) {
        qCWarning(lcConfig) << "Failed to write" << ConfigFileName;
    }

    // Reload from (now empty) config - will use ConfigDefaults for all values
    load();

    qCInfo(lcConfig) << "Settings reset to defaults";
}

} // namespace QuickWheel
