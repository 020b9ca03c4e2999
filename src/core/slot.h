// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "quickwheel_export.h"
#include <QJsonObject>
#include <QMetaType>
#include <QString>
#include <optional>

namespace QuickWheel {

/**
 * @brief What a slot does when committed
 *
 * Folder and Back only navigate (via dwell or primary click) and never
 * dispatch anything to the executor.
 */
enum class ActionType {
    None = 0, ///< Empty slot, committing opens the slot editor
    Keystroke, ///< Key sequence injected into the focused window
    Command, ///< Shell command line
    Launch, ///< Program path started detached
    Folder, ///< Opens the child folder named by value
    Back ///< Returns to the parent folder (fixed at slot 7)
};

QUICKWHEEL_EXPORT QString actionTypeToString(ActionType type);

/**
 * @brief Parse an action type name as stored in wheel.json
 * @return The type, ActionType::None for an empty name, or std::nullopt
 *         for an unknown name
 */
QUICKWHEEL_EXPORT std::optional<ActionType> actionTypeFromString(const QString& name);

/**
 * @brief True for types that carry a mandatory value (keystroke, command, launch)
 */
QUICKWHEEL_EXPORT bool actionRequiresValue(ActionType type);

/**
 * @brief Optional icon reference, passed through to the renderer unvalidated
 */
struct QUICKWHEEL_EXPORT SlotIcon {
    enum class Kind {
        Emoji,
        Image
    };

    Kind kind = Kind::Emoji;
    QString data; // Emoji text or image file path

    bool operator==(const SlotIcon& other) const { return kind == other.kind && data == other.data; }
    bool operator!=(const SlotIcon& other) const { return !(*this == other); }

    QJsonObject toJson() const;
    static std::optional<SlotIcon> fromJson(const QJsonObject& json);
};

/**
 * @brief One of the 8 positions of a folder
 *
 * Plain value type; folders own their slots by value. A Folder-typed slot
 * references its child by folder id, never by pointer.
 */
struct QUICKWHEEL_EXPORT Slot {
    QString label;
    ActionType type = ActionType::None;
    QString value; // Key sequence, command line, program path or child folder id
    std::optional<SlotIcon> icon;
    bool showLabel = true;

    bool operator==(const Slot& other) const;
    bool operator!=(const Slot& other) const { return !(*this == other); }

    bool isEmpty() const { return type == ActionType::None; }
    bool isBack() const { return type == ActionType::Back; }
    bool isFolder() const { return type == ActionType::Folder; }
    bool navigates() const { return type == ActionType::Folder || type == ActionType::Back; }

    QJsonObject toJson() const;
    static Slot fromJson(const QJsonObject& json);

    /// Placeholder slot shown for unassigned positions
    static Slot empty();
    /// The fixed back slot of every non-root folder
    static Slot back();
    static Slot folder(const QString& folderId, const QString& label = QString());

    /**
     * @brief Label used when the user leaves the label blank
     *
     * keystroke -> the key sequence, command -> its first characters,
     * launch -> the program file name, folder -> "Folder".
     */
    static QString defaultLabel(ActionType type, const QString& value);
};

} // namespace QuickWheel

Q_DECLARE_METATYPE(QuickWheel::Slot)
