// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "slot.h"
#include "constants.h"
#include "logging.h"
#include <QFileInfo>

namespace QuickWheel {

QString actionTypeToString(ActionType type)
{
    switch (type) {
    case ActionType::Keystroke:
        return ActionTypeNames::Keystroke;
    case ActionType::Command:
        return ActionTypeNames::Command;
    case ActionType::Launch:
        return ActionTypeNames::Launch;
    case ActionType::Folder:
        return ActionTypeNames::Folder;
    case ActionType::Back:
        return ActionTypeNames::Back;
    case ActionType::None:
        break;
    }
    return QString();
}

std::optional<ActionType> actionTypeFromString(const QString& name)
{
    if (name.isEmpty()) {
        return ActionType::None;
    }
    if (name == ActionTypeNames::Keystroke) {
        return ActionType::Keystroke;
    }
    if (name == ActionTypeNames::Command) {
        return ActionType::Command;
    }
    if (name == ActionTypeNames::Launch) {
        return ActionType::Launch;
    }
    if (name == ActionTypeNames::Folder) {
        return ActionType::Folder;
    }
    if (name == ActionTypeNames::Back) {
        return ActionType::Back;
    }
    return std::nullopt;
}

bool actionRequiresValue(ActionType type)
{
    return type == ActionType::Keystroke || type == ActionType::Command || type == ActionType::Launch;
}

// ═══════════════════════════════════════════════════════════════════════════════
// SlotIcon
// ═══════════════════════════════════════════════════════════════════════════════

QJsonObject SlotIcon::toJson() const
{
    QJsonObject json;
    json[JsonKeys::Kind] = kind == Kind::Image ? QString(IconKindNames::Image) : QString(IconKindNames::Emoji);
    json[JsonKeys::Data] = data;
    return json;
}

std::optional<SlotIcon> SlotIcon::fromJson(const QJsonObject& json)
{
    const QString data = json[JsonKeys::Data].toString();
    if (data.isEmpty()) {
        return std::nullopt;
    }

    SlotIcon icon;
    icon.kind = json[JsonKeys::Kind].toString() == IconKindNames::Image ? Kind::Image : Kind::Emoji;
    icon.data = data;
    return icon;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Slot
// ═══════════════════════════════════════════════════════════════════════════════

bool Slot::operator==(const Slot& other) const
{
    return label == other.label && type == other.type && value == other.value && icon == other.icon
        && showLabel == other.showLabel;
}

QJsonObject Slot::toJson() const
{
    using namespace JsonKeys;

    QJsonObject json;
    json[Label] = label;
    // Empty slots store null type and value, matching hand-edited files
    json[Type] = type == ActionType::None ? QJsonValue(QJsonValue::Null) : QJsonValue(actionTypeToString(type));
    json[Value] = value.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(value);
    if (icon) {
        json[Icon] = icon->toJson();
    }
    if (!showLabel) {
        json[ShowLabel] = false;
    }
    return json;
}

Slot Slot::fromJson(const QJsonObject& json)
{
    using namespace JsonKeys;

    Slot slot;
    slot.label = json[Label].toString();
    slot.value = json[Value].toString();
    slot.showLabel = json[ShowLabel].toBool(true);

    const auto type = actionTypeFromString(json[Type].toString());
    if (!type) {
        qCWarning(lcCore) << "Unknown slot type" << json[Type].toString() << "treating slot as empty";
        return Slot::empty();
    }
    slot.type = *type;

    if (json[Icon].isObject()) {
        slot.icon = SlotIcon::fromJson(json[Icon].toObject());
    }

    if (slot.type == ActionType::None) {
        slot.value.clear();
        if (slot.label.isEmpty()) {
            slot.label = Slot::empty().label;
        }
    }
    return slot;
}

Slot Slot::empty()
{
    Slot slot;
    slot.label = QStringLiteral("Select to add action");
    return slot;
}

Slot Slot::back()
{
    Slot slot;
    slot.label = QStringLiteral("Back");
    slot.type = ActionType::Back;
    return slot;
}

Slot Slot::folder(const QString& folderId, const QString& label)
{
    Slot slot;
    slot.type = ActionType::Folder;
    slot.value = folderId;
    slot.label = label.isEmpty() ? defaultLabel(ActionType::Folder, folderId) : label;
    return slot;
}

QString Slot::defaultLabel(ActionType type, const QString& value)
{
    switch (type) {
    case ActionType::Keystroke:
        return value;
    case ActionType::Command:
        return value.left(Defaults::CommandLabelLength);
    case ActionType::Launch: {
        const QString name = QFileInfo(value).fileName();
        return name.isEmpty() ? value : name;
    }
    case ActionType::Folder:
        return QStringLiteral("Folder");
    case ActionType::Back:
        return Slot::back().label;
    case ActionType::None:
        break;
    }
    return Slot::empty().label;
}

} // namespace QuickWheel
