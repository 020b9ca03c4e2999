// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>
#include <QSignalSpy>
#include <QJsonArray>
#include <QJsonObject>
#include <QRegularExpression>

#include "core/foldergraph.h"
#include "core/constants.h"

using namespace QuickWheel;

/**
 * @brief Unit tests for FolderGraph and the Slot value type
 *
 * Tests cover:
 * - Default graph shape and folder creation
 * - Slot edit validation (index range, fixed back slot, missing values)
 * - Orphan detection and recursive deletion
 * - JSON round trip including malformed input
 */
class TestFolderGraph : public QObject
{
    Q_OBJECT

private:
    static Slot command(const QString& label, const QString& value)
    {
        Slot slot;
        slot.label = label;
        slot.type = ActionType::Command;
        slot.value = value;
        return slot;
    }

private Q_SLOTS:
    // ═══════════════════════════════════════════════════════════════════════
    // Default shape
    // ═══════════════════════════════════════════════════════════════════════

    void test_default_rootHasEightEmptySlots()
    {
        FolderGraph graph;
        QCOMPARE(graph.root().slotList().size(), Defaults::SlotCount);
        for (const Slot& slot : graph.root().slotList()) {
            QVERIFY(slot.isEmpty());
            QCOMPARE(slot.label, QStringLiteral("Select to add action"));
        }
        QVERIFY(!graph.root().hasBackSlot());
        QVERIFY(graph.folderIds().isEmpty());
    }

    void test_resolve_emptyPathIsRoot()
    {
        FolderGraph graph;
        QCOMPARE(graph.resolve({}), &graph.root());
        QVERIFY(graph.resolve({QStringLiteral("missing")}) == nullptr);
    }

    void test_createFolder_hasBackSlotAtSeven()
    {
        FolderGraph graph;
        QSignalSpy spy(&graph, &FolderGraph::graphChanged);

        const Folder* folder = graph.createFolder(QStringLiteral("folder_a"));
        QVERIFY(folder);
        QCOMPARE(folder->id(), QStringLiteral("folder_a"));
        QVERIFY(folder->hasBackSlot());
        QVERIFY(folder->slot(Defaults::BackSlotIndex).isBack());
        QCOMPARE(folder->slot(Defaults::BackSlotIndex).label, QStringLiteral("Back"));
        for (int i = 0; i < Defaults::BackSlotIndex; ++i) {
            QVERIFY(folder->slot(i).isEmpty());
        }
        QCOMPARE(spy.count(), 1);
    }

    void test_createFolder_existingIdIsReused()
    {
        FolderGraph graph;
        graph.createFolder(QStringLiteral("folder_a"));
        QCOMPARE(graph.setSlot({QStringLiteral("folder_a")}, 0, command(QStringLiteral("ls"), QStringLiteral("ls"))),
                 SlotEditResult::Ok);

        QSignalSpy spy(&graph, &FolderGraph::graphChanged);
        const Folder* again = graph.createFolder(QStringLiteral("folder_a"));
        QVERIFY(again);
        QCOMPARE(again->slot(0).value, QStringLiteral("ls"));
        QCOMPARE(spy.count(), 0);
    }

    void test_createFolder_reservedIdRejected()
    {
        FolderGraph graph;
        QSignalSpy spy(&graph, &FolderGraph::graphChanged);

        QVERIFY(graph.createFolder(QStringLiteral("root")) == nullptr);
        QVERIFY(!graph.contains(QStringLiteral("root")));
        QVERIFY(graph.folderIds().isEmpty());
        QCOMPARE(spy.count(), 0);
    }

    // ═══════════════════════════════════════════════════════════════════════
    // setSlot validation
    // ═══════════════════════════════════════════════════════════════════════

    void test_setSlot_rootAcceptsAllIndices()
    {
        FolderGraph graph;
        for (int i = 0; i < Defaults::SlotCount; ++i) {
            QCOMPARE(graph.setSlot({}, i, command(QString::number(i), QStringLiteral("true"))), SlotEditResult::Ok);
        }
        QCOMPARE(graph.root().slot(7).type, ActionType::Command);
    }

    void test_setSlot_rejectsOutOfRange()
    {
        FolderGraph graph;
        QCOMPARE(graph.setSlot({}, -1, command(QStringLiteral("x"), QStringLiteral("x"))), SlotEditResult::InvalidIndex);
        QCOMPARE(graph.setSlot({}, 8, command(QStringLiteral("x"), QStringLiteral("x"))), SlotEditResult::InvalidIndex);
    }

    void test_setSlot_backSlotIsImmutable()
    {
        FolderGraph graph;
        graph.createFolder(QStringLiteral("folder_a"));
        QSignalSpy spy(&graph, &FolderGraph::graphChanged);

        QCOMPARE(graph.setSlot({QStringLiteral("folder_a")}, Defaults::BackSlotIndex,
                               command(QStringLiteral("x"), QStringLiteral("x"))),
                 SlotEditResult::InvalidIndex);
        QVERIFY(graph.folder(QStringLiteral("folder_a"))->slot(Defaults::BackSlotIndex).isBack());
        QCOMPARE(spy.count(), 0);
    }

    void test_setSlot_cannotAssignBack()
    {
        FolderGraph graph;
        QCOMPARE(graph.setSlot({}, 3, Slot::back()), SlotEditResult::InvalidIndex);
        QVERIFY(graph.root().slot(3).isEmpty());
    }

    void test_setSlot_unknownFolder()
    {
        FolderGraph graph;
        QCOMPARE(graph.setSlot({QStringLiteral("nope")}, 0, command(QStringLiteral("x"), QStringLiteral("x"))),
                 SlotEditResult::FolderNotFound);
    }

    void test_setSlot_missingValue_data()
    {
        QTest::addColumn<int>("type");
        QTest::addRow("keystroke") << int(ActionType::Keystroke);
        QTest::addRow("command") << int(ActionType::Command);
        QTest::addRow("launch") << int(ActionType::Launch);
        QTest::addRow("folder") << int(ActionType::Folder);
    }

    void test_setSlot_missingValue()
    {
        QFETCH(int, type);
        FolderGraph graph;
        Slot slot;
        slot.label = QStringLiteral("x");
        slot.type = static_cast<ActionType>(type);
        slot.value = QStringLiteral("   ");
        QCOMPARE(graph.setSlot({}, 0, slot), SlotEditResult::MissingValue);
        QVERIFY(graph.root().slot(0).isEmpty());
    }

    void test_setSlot_folderCreatesTarget()
    {
        FolderGraph graph;
        QCOMPARE(graph.setSlot({}, 2, Slot::folder(QStringLiteral("folder_b"), QStringLiteral("Tools"))),
                 SlotEditResult::Ok);
        QVERIFY(graph.contains(QStringLiteral("folder_b")));
        QVERIFY(graph.folder(QStringLiteral("folder_b"))->hasBackSlot());
        QCOMPARE(graph.root().slot(2).label, QStringLiteral("Tools"));
    }

    void test_setSlot_nestedFolder()
    {
        FolderGraph graph;
        graph.setSlot({}, 0, Slot::folder(QStringLiteral("folder_a")));
        QCOMPARE(graph.setSlot({QStringLiteral("folder_a")}, 1, Slot::folder(QStringLiteral("folder_b"))),
                 SlotEditResult::Ok);

        const QStringList path{QStringLiteral("folder_a"), QStringLiteral("folder_b")};
        QVERIFY(graph.resolve(path) != nullptr);
        QCOMPARE(graph.resolve(path)->id(), QStringLiteral("folder_b"));

        const std::optional<Slot> enclosing = graph.enclosingSlot(path);
        QVERIFY(enclosing.has_value());
        QCOMPARE(enclosing->value, QStringLiteral("folder_b"));
        QVERIFY(!graph.enclosingSlot({}).has_value());
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Orphans and deletion
    // ═══════════════════════════════════════════════════════════════════════

    void test_overwriteFolderSlot_leavesOrphan()
    {
        FolderGraph graph;
        graph.setSlot({}, 0, Slot::folder(QStringLiteral("folder_a")));
        graph.setSlot({QStringLiteral("folder_a")}, 0, command(QStringLiteral("ls"), QStringLiteral("ls")));
        QVERIFY(graph.findOrphans().isEmpty());

        graph.setSlot({}, 0, command(QStringLiteral("top"), QStringLiteral("top")));

        QCOMPARE(graph.findOrphans(), QSet<QString>{QStringLiteral("folder_a")});
        // Contents survive until explicitly purged
        QCOMPARE(graph.folder(QStringLiteral("folder_a"))->slot(0).value, QStringLiteral("ls"));
    }

    void test_reuseOrphanId_restoresContents()
    {
        FolderGraph graph;
        graph.setSlot({}, 0, Slot::folder(QStringLiteral("folder_a")));
        graph.setSlot({QStringLiteral("folder_a")}, 3, command(QStringLiteral("ls"), QStringLiteral("ls")));
        graph.setSlot({}, 0, Slot::empty());

        graph.setSlot({}, 5, Slot::folder(QStringLiteral("folder_a")));
        QVERIFY(graph.findOrphans().isEmpty());
        QCOMPARE(graph.folder(QStringLiteral("folder_a"))->slot(3).value, QStringLiteral("ls"));
    }

    void test_deleteRecursive_removesSubtree()
    {
        FolderGraph graph;
        graph.setSlot({}, 0, Slot::folder(QStringLiteral("folder_a")));
        graph.setSlot({QStringLiteral("folder_a")}, 0, Slot::folder(QStringLiteral("folder_b")));
        graph.setSlot({QStringLiteral("folder_a"), QStringLiteral("folder_b")}, 0, Slot::folder(QStringLiteral("folder_c")));
        graph.setSlot({}, 1, Slot::folder(QStringLiteral("folder_z")));

        QSignalSpy spy(&graph, &FolderGraph::graphChanged);
        const QStringList removed = graph.deleteRecursive(QStringLiteral("folder_a"));

        QCOMPARE(removed, (QStringList{QStringLiteral("folder_a"), QStringLiteral("folder_b"), QStringLiteral("folder_c")}));
        QCOMPARE(graph.folderIds(), QStringList{QStringLiteral("folder_z")});
        // Root slot pointing into the deleted subtree is cleared
        QVERIFY(graph.root().slot(0).isEmpty());
        QVERIFY(graph.root().slot(1).isFolder());
        QCOMPARE(spy.count(), 1);
    }

    void test_deleteRecursive_survivesCycles()
    {
        FolderGraph graph;
        graph.setSlot({}, 0, Slot::folder(QStringLiteral("folder_a")));
        graph.setSlot({QStringLiteral("folder_a")}, 0, Slot::folder(QStringLiteral("folder_b")));
        graph.setSlot({QStringLiteral("folder_b")}, 0, Slot::folder(QStringLiteral("folder_a")));

        const QStringList removed = graph.deleteRecursive(QStringLiteral("folder_a"));
        QCOMPARE(removed.size(), 2);
        QVERIFY(graph.folderIds().isEmpty());
    }

    void test_deleteRecursive_unknownOrRoot()
    {
        FolderGraph graph;
        QSignalSpy spy(&graph, &FolderGraph::graphChanged);
        QVERIFY(graph.deleteRecursive(QString()).isEmpty());
        QVERIFY(graph.deleteRecursive(QStringLiteral("nope")).isEmpty());
        QCOMPARE(spy.count(), 0);
    }

    void test_generateFolderId_format()
    {
        FolderGraph graph;
        static const QRegularExpression pattern(QStringLiteral("^folder_[0-9a-f]{8}$"));
        for (int i = 0; i < 20; ++i) {
            const QString id = graph.generateFolderId();
            QVERIFY2(pattern.match(id).hasMatch(), qPrintable(id));
            QVERIFY(!graph.contains(id));
        }
    }

    // ═══════════════════════════════════════════════════════════════════════
    // JSON
    // ═══════════════════════════════════════════════════════════════════════

    void test_json_roundTrip()
    {
        FolderGraph graph;
        Slot keys;
        keys.label = QStringLiteral("Copy");
        keys.type = ActionType::Keystroke;
        keys.value = QStringLiteral("ctrl+c");
        keys.icon = SlotIcon{SlotIcon::Kind::Emoji, QStringLiteral("📋")};
        keys.showLabel = false;
        graph.setSlot({}, 4, keys);
        graph.setSlot({}, 0, Slot::folder(QStringLiteral("folder_a"), QStringLiteral("Apps")));

        const QJsonObject json = graph.toJson();
        QVERIFY(json.contains(QStringLiteral("root")));
        QVERIFY(json.contains(QStringLiteral("folder_a")));
        QCOMPARE(json[QStringLiteral("root")].toObject()[QStringLiteral("slots")].toArray().size(), 8);

        FolderGraph restored;
        QSignalSpy resetSpy(&restored, &FolderGraph::graphReset);
        QVERIFY(restored.fromJson(json));
        QCOMPARE(resetSpy.count(), 1);
        QCOMPARE(restored.root().slot(4), keys);
        QCOMPARE(restored.root().slot(0).value, QStringLiteral("folder_a"));
        QVERIFY(restored.folder(QStringLiteral("folder_a"))->hasBackSlot());
    }

    void test_setSlot_reservedFolderIdKeepsRootIntact()
    {
        FolderGraph graph;
        QCOMPARE(graph.setSlot({}, 2, command(QStringLiteral("ls"), QStringLiteral("ls"))), SlotEditResult::Ok);

        QSignalSpy spy(&graph, &FolderGraph::graphChanged);
        QCOMPARE(graph.setSlot({}, 0, Slot::folder(QStringLiteral("root"))), SlotEditResult::ReservedFolderId);
        QCOMPARE(slotEditResultToString(SlotEditResult::ReservedFolderId), QStringLiteral("reserved-folder-id"));
        QCOMPARE(spy.count(), 0);
        QVERIFY(graph.root().slot(0).isEmpty());
        QVERIFY(!graph.contains(QStringLiteral("root")));

        FolderGraph restored;
        QVERIFY(restored.fromJson(graph.toJson()));
        QCOMPARE(restored.root().slot(2).value, QStringLiteral("ls"));
        QVERIFY(restored.root().slot(0).isEmpty());
        // Root never gains a back slot
        QVERIFY(!restored.root().hasBackSlot());
        QVERIFY(restored.folderIds().isEmpty());
    }

    void test_fromJson_dropsFolderSlotsTargetingRoot()
    {
        QJsonArray rootSlots;
        rootSlots.append(Slot::folder(QStringLiteral("root"), QStringLiteral("Loop")).toJson());
        rootSlots.append(command(QStringLiteral("ls"), QStringLiteral("ls")).toJson());

        FolderGraph graph;
        QVERIFY(graph.fromJson(QJsonObject{{QStringLiteral("root"), QJsonObject{{QStringLiteral("slots"), rootSlots}}}}));
        QVERIFY(graph.root().slot(0).isEmpty());
        QCOMPARE(graph.root().slot(1).value, QStringLiteral("ls"));
    }

    void test_json_emptySlotWritesNulls()
    {
        const QJsonObject json = Slot::empty().toJson();
        QVERIFY(json[QStringLiteral("type")].isNull());
        QVERIFY(json[QStringLiteral("value")].isNull());
    }

    void test_fromJson_missingRootRejected()
    {
        FolderGraph graph;
        graph.setSlot({}, 0, command(QStringLiteral("ls"), QStringLiteral("ls")));
        QVERIFY(!graph.fromJson(QJsonObject{{QStringLiteral("folder_a"), QJsonObject{}}}));
        // Unchanged
        QCOMPARE(graph.root().slot(0).value, QStringLiteral("ls"));
    }

    void test_fromJson_padsShortFoldersAndDropsUnknownTypes()
    {
        QJsonArray rootSlots;
        rootSlots.append(QJsonObject{{QStringLiteral("label"), QStringLiteral("?")},
                                     {QStringLiteral("type"), QStringLiteral("teleport")},
                                     {QStringLiteral("value"), QStringLiteral("x")}});
        rootSlots.append(QJsonObject{{QStringLiteral("label"), QStringLiteral("Back")},
                                     {QStringLiteral("type"), QStringLiteral("back")},
                                     {QStringLiteral("value"), QJsonValue()}});

        FolderGraph graph;
        QVERIFY(graph.fromJson(QJsonObject{{QStringLiteral("root"), QJsonObject{{QStringLiteral("slots"), rootSlots}}}}));
        QCOMPARE(graph.root().slotList().size(), Defaults::SlotCount);
        QVERIFY(graph.root().slot(0).isEmpty());
        // Back outside index 7 is dropped
        QVERIFY(graph.root().slot(1).isEmpty());
        QVERIFY(graph.root().slot(7).isEmpty());
    }

    void test_defaultLabel_data()
    {
        QTest::addColumn<int>("type");
        QTest::addColumn<QString>("value");
        QTest::addColumn<QString>("expected");

        QTest::addRow("keystroke") << int(ActionType::Keystroke) << QStringLiteral("ctrl+shift+t")
                                   << QStringLiteral("ctrl+shift+t");
        QTest::addRow("short command") << int(ActionType::Command) << QStringLiteral("ls -la") << QStringLiteral("ls -la");
        QTest::addRow("long command") << int(ActionType::Command)
                                      << QStringLiteral("notify-send 'hello there' 'this is long'")
                                      << QStringLiteral("notify-send 'hello there' 'thi");
        QTest::addRow("launch") << int(ActionType::Launch) << QStringLiteral("/usr/bin/firefox")
                                << QStringLiteral("firefox");
        QTest::addRow("folder") << int(ActionType::Folder) << QStringLiteral("folder_0000abcd") << QStringLiteral("Folder");
    }

    void test_defaultLabel()
    {
        QFETCH(int, type);
        QFETCH(QString, value);
        QFETCH(QString, expected);
        QCOMPARE(Slot::defaultLabel(static_cast<ActionType>(type), value), expected);
    }
};

QTEST_MAIN(TestFolderGraph)
#include "test_folder_graph.moc"
