// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "quickwheel_export.h"
#include "slot.h"
#include <QHash>
#include <QJsonObject>
#include <QObject>
#include <QSet>
#include <QStringList>
#include <QVector>
#include <optional>

namespace QuickWheel {

/**
 * @brief Outcome of a slot edit
 */
enum class SlotEditResult {
    Ok = 0,
    InvalidIndex, ///< Out of range, or the fixed back slot
    FolderNotFound, ///< Path does not resolve
    MissingValue, ///< Action type needs a value (or folder id) but none was given
    ReservedFolderId ///< Folder id collides with the root key of wheel.json
};

QUICKWHEEL_EXPORT QString slotEditResultToString(SlotEditResult result);

/**
 * @brief An ordered set of exactly 8 slots
 *
 * The root folder has an empty id. Every other folder is created with a
 * back slot at Defaults::BackSlotIndex.
 */
class QUICKWHEEL_EXPORT Folder
{
public:
    Folder() = default;
    explicit Folder(const QString& id);

    QString id() const { return m_id; }
    bool isRoot() const { return m_id.isEmpty(); }

    const Slot& slot(int index) const { return m_slots.at(index); }
    const QVector<Slot>& slotList() const { return m_slots; }
    bool hasBackSlot() const;

    QJsonObject toJson() const;
    static Folder fromJson(const QString& id, const QJsonObject& json);

private:
    friend class FolderGraph;

    QString m_id;
    QVector<Slot> m_slots;
};

/**
 * @brief Arena of folders keyed by stable id
 *
 * Folders reference each other only through folder-typed slots holding an
 * id, so the graph never owns cycles. The navigation cursor is a list of
 * ids resolved by looking up its last element directly.
 *
 * Deletion is never implicit: overwriting a folder slot leaves the old
 * subtree in place as an orphan until deleteRecursive() purges it or a new
 * folder slot reuses its id.
 *
 * Every mutation emits graphChanged(), which the owner wires to persistence.
 */
class QUICKWHEEL_EXPORT FolderGraph : public QObject
{
    Q_OBJECT

public:
    explicit FolderGraph(QObject* parent = nullptr);
    ~FolderGraph() override;

    const Folder& root() const { return m_root; }

    /**
     * @brief Resolve a navigation path
     * @param path Folder ids from root to target (empty = root)
     * @return The folder, or nullptr if the last id is unknown
     */
    const Folder* resolve(const QStringList& path) const;

    const Folder* folder(const QString& id) const;
    bool contains(const QString& id) const;
    QStringList folderIds() const;

    /**
     * @brief Create a folder with a back slot at index 7
     *
     * No-op if the id already exists, which restores an orphaned folder
     * when a new folder slot reuses its id.
     * @return The folder, or nullptr for a reserved id
     */
    const Folder* createFolder(const QString& id);

    /**
     * @brief Whether @p id can not name a folder
     *
     * Folders and the root share one key space in wheel.json, so "root"
     * is reserved.
     */
    static bool isReservedFolderId(const QString& id);

    /**
     * @brief Overwrite one slot of the folder at @p path
     *
     * Folder-typed slots create their target folder if it does not exist.
     * The back slot of a folder is immutable and rejected with InvalidIndex.
     * A folder id equal to the root key is rejected with ReservedFolderId.
     */
    SlotEditResult setSlot(const QStringList& path, int index, const Slot& slot);

    /**
     * @brief Folder ids not referenced by any folder slot in the graph
     */
    QSet<QString> findOrphans() const;

    /**
     * @brief Delete a folder and every folder reachable from its slots
     *
     * Slots elsewhere that still point at a deleted folder are cleared.
     * @return Ids that were removed (empty if @p id is unknown or root)
     */
    QStringList deleteRecursive(const QString& id);

    /**
     * @brief The slot in the parent folder that leads to the last folder of @p path
     *
     * Used for the center display while inside a folder.
     */
    std::optional<Slot> enclosingSlot(const QStringList& path) const;

    /**
     * @brief Fresh "folder_xxxxxxxx" id not yet present in the graph
     */
    QString generateFolderId() const;

    /**
     * @brief Replace the graph with the default (root with 8 empty slots)
     */
    void resetToDefault();

    QJsonObject toJson() const;

    /**
     * @brief Replace the graph with the contents of @p json
     * @return false if @p json has no valid root entry (graph unchanged)
     */
    bool fromJson(const QJsonObject& json);

Q_SIGNALS:
    /**
     * @brief Emitted after any edit, creation or deletion
     */
    void graphChanged();

    /**
     * @brief Emitted when the whole graph was replaced (load or reset)
     */
    void graphReset();

private:
    Folder* mutableFolder(const QString& id);
    static QVector<Slot> emptySlots();

    Folder m_root;
    QHash<QString, Folder> m_folders;
};

} // namespace QuickWheel
