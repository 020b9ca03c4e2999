// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "foldergraph.h"
#include "constants.h"
#include "logging.h"
#include <QJsonArray>
#include <QRandomGenerator>
#include <algorithm>

namespace QuickWheel {

QString slotEditResultToString(SlotEditResult result)
{
    switch (result) {
    case SlotEditResult::Ok:
        return QStringLiteral("ok");
    case SlotEditResult::InvalidIndex:
        return QStringLiteral("invalid-index");
    case SlotEditResult::FolderNotFound:
        return QStringLiteral("folder-not-found");
    case SlotEditResult::MissingValue:
        return QStringLiteral("missing-value");
    case SlotEditResult::ReservedFolderId:
        return QStringLiteral("reserved-folder-id");
    }
    return QString();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Folder
// ═══════════════════════════════════════════════════════════════════════════════

Folder::Folder(const QString& id)
    : m_id(id)
{
    m_slots.fill(Slot::empty(), Defaults::SlotCount);
    if (!isRoot()) {
        m_slots[Defaults::BackSlotIndex] = Slot::back();
    }
}

bool Folder::hasBackSlot() const
{
    return m_slots.size() > Defaults::BackSlotIndex && m_slots.at(Defaults::BackSlotIndex).isBack();
}

QJsonObject Folder::toJson() const
{
    QJsonArray slotArray;
    for (const Slot& slot : m_slots) {
        slotArray.append(slot.toJson());
    }

    QJsonObject json;
    json[JsonKeys::Slots] = slotArray;
    return json;
}

Folder Folder::fromJson(const QString& id, const QJsonObject& json)
{
    Folder folder;
    folder.m_id = id;
    folder.m_slots.reserve(Defaults::SlotCount);

    const QJsonArray slotArray = json[JsonKeys::Slots].toArray();
    if (slotArray.size() != Defaults::SlotCount) {
        qCWarning(lcFolder) << "Folder" << (id.isEmpty() ? QStringLiteral("root") : id) << "has" << slotArray.size()
                            << "slots, expected" << Defaults::SlotCount;
    }

    for (int i = 0; i < Defaults::SlotCount; ++i) {
        Slot slot = i < slotArray.size() ? Slot::fromJson(slotArray.at(i).toObject()) : Slot::empty();
        // Back may only live at its fixed index
        if (slot.isBack() && i != Defaults::BackSlotIndex) {
            qCWarning(lcFolder) << "Dropping misplaced back slot at index" << i << "in folder" << id;
            slot = Slot::empty();
        } else if (slot.isFolder() && FolderGraph::isReservedFolderId(slot.value)) {
            qCWarning(lcFolder) << "Dropping folder slot with reserved id at index" << i << "in folder" << id;
            slot = Slot::empty();
        }
        folder.m_slots.append(slot);
    }
    return folder;
}

// ═══════════════════════════════════════════════════════════════════════════════
// FolderGraph
// ═══════════════════════════════════════════════════════════════════════════════

FolderGraph::FolderGraph(QObject* parent)
    : QObject(parent)
    , m_root(QString())
{
}

FolderGraph::~FolderGraph() = default;

const Folder* FolderGraph::resolve(const QStringList& path) const
{
    if (path.isEmpty()) {
        return &m_root;
    }
    // Folders are addressed by id; intermediate path entries are not walked
    return folder(path.last());
}

const Folder* FolderGraph::folder(const QString& id) const
{
    if (id.isEmpty()) {
        return &m_root;
    }
    auto it = m_folders.constFind(id);
    return it != m_folders.constEnd() ? &it.value() : nullptr;
}

Folder* FolderGraph::mutableFolder(const QString& id)
{
    if (id.isEmpty()) {
        return &m_root;
    }
    auto it = m_folders.find(id);
    return it != m_folders.end() ? &it.value() : nullptr;
}

bool FolderGraph::contains(const QString& id) const
{
    return id.isEmpty() || m_folders.contains(id);
}

QStringList FolderGraph::folderIds() const
{
    QStringList ids = m_folders.keys();
    ids.sort();
    return ids;
}

const Folder* FolderGraph::createFolder(const QString& id)
{
    if (id.isEmpty()) {
        return &m_root;
    }
    if (isReservedFolderId(id)) {
        qCWarning(lcFolder) << "Cannot create folder with reserved id:" << id;
        return nullptr;
    }

    auto it = m_folders.find(id);
    if (it != m_folders.end()) {
        qCDebug(lcFolder) << "Folder already exists, reusing:" << id;
        return &it.value();
    }

    it = m_folders.insert(id, Folder(id));
    qCInfo(lcFolder) << "Created folder" << id;
    Q_EMIT graphChanged();
    return &it.value();
}

bool FolderGraph::isReservedFolderId(const QString& id)
{
    return id == JsonKeys::Root;
}

SlotEditResult FolderGraph::setSlot(const QStringList& path, int index, const Slot& slot)
{
    if (index < 0 || index >= Defaults::SlotCount) {
        qCWarning(lcFolder) << "Rejected slot edit, index out of range:" << index;
        return SlotEditResult::InvalidIndex;
    }

    const QString folderId = path.isEmpty() ? QString() : path.last();
    Folder* target = mutableFolder(folderId);
    if (!target) {
        qCWarning(lcFolder) << "Rejected slot edit, folder not found:" << path;
        return SlotEditResult::FolderNotFound;
    }

    if (index == Defaults::BackSlotIndex && target->hasBackSlot()) {
        qCWarning(lcFolder) << "Rejected slot edit, back slot is fixed in folder" << folderId;
        return SlotEditResult::InvalidIndex;
    }

    if (slot.isBack()) {
        qCWarning(lcFolder) << "Rejected slot edit, back slots cannot be assigned";
        return SlotEditResult::InvalidIndex;
    }

    if ((actionRequiresValue(slot.type) || slot.isFolder()) && slot.value.trimmed().isEmpty()) {
        qCWarning(lcFolder) << "Rejected slot edit," << actionTypeToString(slot.type) << "slot needs a value";
        return SlotEditResult::MissingValue;
    }

    if (slot.isFolder() && isReservedFolderId(slot.value)) {
        qCWarning(lcFolder) << "Rejected slot edit, folder id is reserved:" << slot.value;
        return SlotEditResult::ReservedFolderId;
    }

    if (slot.isFolder() && !m_folders.contains(slot.value)) {
        m_folders.insert(slot.value, Folder(slot.value));
        qCInfo(lcFolder) << "Created folder" << slot.value;
        // Re-resolve: the insert may have rehashed the arena
        target = mutableFolder(folderId);
    }

    target->m_slots[index] = slot.isEmpty() ? Slot::empty() : slot;
    qCDebug(lcFolder) << "Set slot" << index << "in folder" << (folderId.isEmpty() ? QStringLiteral("root") : folderId)
                      << "to" << actionTypeToString(slot.type) << slot.value;
    Q_EMIT graphChanged();
    return SlotEditResult::Ok;
}

QSet<QString> FolderGraph::findOrphans() const
{
    QSet<QString> referenced;
    auto collect = [&referenced](const Folder& folder) {
        for (const Slot& slot : folder.slotList()) {
            if (slot.isFolder() && !slot.value.isEmpty()) {
                referenced.insert(slot.value);
            }
        }
    };

    collect(m_root);
    for (const Folder& folder : m_folders) {
        collect(folder);
    }

    QSet<QString> orphans;
    for (auto it = m_folders.constBegin(); it != m_folders.constEnd(); ++it) {
        if (!referenced.contains(it.key())) {
            orphans.insert(it.key());
        }
    }
    return orphans;
}

QStringList FolderGraph::deleteRecursive(const QString& id)
{
    if (id.isEmpty() || !m_folders.contains(id)) {
        qCWarning(lcFolder) << "Cannot delete folder, unknown id:" << id;
        return {};
    }

    // Collect the subtree first; visited set guards against reference cycles
    QSet<QString> visited;
    QStringList pending{id};
    while (!pending.isEmpty()) {
        const QString current = pending.takeLast();
        if (visited.contains(current)) {
            continue;
        }
        auto it = m_folders.constFind(current);
        if (it == m_folders.constEnd()) {
            continue;
        }
        visited.insert(current);
        for (const Slot& slot : it->slotList()) {
            if (slot.isFolder() && !slot.value.isEmpty()) {
                pending.append(slot.value);
            }
        }
    }

    for (const QString& removed : std::as_const(visited)) {
        m_folders.remove(removed);
    }

    // Do not leave folder slots pointing into the deleted subtree
    auto clearDangling = [&visited](Folder& folder) {
        for (Slot& slot : folder.m_slots) {
            if (slot.isFolder() && visited.contains(slot.value)) {
                slot = Slot::empty();
            }
        }
    };
    clearDangling(m_root);
    for (Folder& folder : m_folders) {
        clearDangling(folder);
    }

    QStringList removedIds(visited.begin(), visited.end());
    removedIds.sort();
    qCInfo(lcFolder) << "Deleted folder" << id << "and descendants:" << removedIds;
    Q_EMIT graphChanged();
    return removedIds;
}

std::optional<Slot> FolderGraph::enclosingSlot(const QStringList& path) const
{
    if (path.isEmpty()) {
        return std::nullopt;
    }

    const QString childId = path.last();
    const Folder* parent = resolve(path.mid(0, path.size() - 1));
    if (!parent) {
        return std::nullopt;
    }

    const QVector<Slot>& parentSlots = parent->slotList();
    auto it = std::find_if(parentSlots.cbegin(), parentSlots.cend(), [&childId](const Slot& slot) {
        return slot.isFolder() && slot.value == childId;
    });
    if (it == parentSlots.cend()) {
        return std::nullopt;
    }
    return *it;
}

QString FolderGraph::generateFolderId() const
{
    QString id;
    do {
        const quint32 bits = QRandomGenerator::global()->generate();
        id = QString(Defaults::FolderIdPrefix)
            + QStringLiteral("%1").arg(bits, Defaults::FolderIdHexDigits, 16, QLatin1Char('0'));
    } while (m_folders.contains(id));
    return id;
}

void FolderGraph::resetToDefault()
{
    m_root = Folder(QString());
    m_folders.clear();
    Q_EMIT graphReset();
}

QJsonObject FolderGraph::toJson() const
{
    QJsonObject json;
    json[JsonKeys::Root] = m_root.toJson();
    for (auto it = m_folders.constBegin(); it != m_folders.constEnd(); ++it) {
        json[it.key()] = it->toJson();
    }
    return json;
}

bool FolderGraph::fromJson(const QJsonObject& json)
{
    if (!json[JsonKeys::Root].isObject()) {
        qCWarning(lcFolder) << "Wheel configuration has no root folder";
        return false;
    }

    Folder root = Folder::fromJson(QString(), json[JsonKeys::Root].toObject());
    QHash<QString, Folder> folders;
    for (auto it = json.constBegin(); it != json.constEnd(); ++it) {
        if (it.key() == JsonKeys::Root) {
            continue;
        }
        if (!it.value().isObject()) {
            qCWarning(lcFolder) << "Skipping malformed folder entry" << it.key();
            continue;
        }
        folders.insert(it.key(), Folder::fromJson(it.key(), it.value().toObject()));
    }

    m_root = root;
    m_folders = folders;
    qCInfo(lcFolder) << "Loaded wheel graph folders=" << m_folders.size();
    Q_EMIT graphReset();
    return true;
}

} // namespace QuickWheel
