// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "quickwheel_export.h"
#include "../core/dwellnavigator.h"
#include "../core/foldergraph.h"
#include "../core/interfaces.h"
#include <QObject>
#include <QPoint>
#include <QPointF>
#include <QPointer>
#include <QStringList>
#include <QTimer>

namespace QuickWheel {

/**
 * @brief What happens to a folder subtree whose slot is overwritten
 */
enum class FolderRemoval {
    KeepAsOrphan, ///< Subtree stays in the graph, offered for restoration later
    DeleteRecursively ///< Subtree is purged (caller has warned the user)
};

/**
 * @brief Editor model for one slot
 */
struct QUICKWHEEL_EXPORT SlotDraft {
    QStringList path;
    int index = -1;
    Slot slot;
    bool editable = false; // false for the back slot or an unresolvable path
    QStringList orphanCandidates; // Existing folders a new folder slot may reuse
};

/**
 * @brief Opens, drives and closes the wheel for one activation
 *
 * activateAtRoot() shows the wheel centered on the cursor and starts the
 * poll timer; each tick hit-tests the cursor offset and feeds the
 * DwellNavigator. deactivateAndCommit() snapshots the hovered slot and the
 * folder current at that instant, closes the wheel, then dispatches:
 *
 * - keystroke: to the executor after keystrokeDelayMs (activation keys up)
 * - command, launch: to the executor right away
 * - folder, back: nothing (navigation only happens through dwell or click)
 * - empty slot: slotEditorRequested()
 * - settings button: settingsRequested()
 *
 * The graph is saved through IGraphPersistence after every mutation.
 */
class QUICKWHEEL_EXPORT WheelController : public QObject
{
    Q_OBJECT

public:
    WheelController(FolderGraph* graph, IActionExecutor* executor, IGraphPersistence* persistence,
                    ICursorProvider* cursor, QObject* parent = nullptr);
    ~WheelController() override;

    void setView(IWheelView* view);

    FolderGraph* graph() const { return m_graph; }
    DwellNavigator* navigator() { return &m_navigator; }
    const WheelSettings& settings() const { return m_settings; }

    bool isActive() const { return m_active; }
    QStringList currentPath() const { return m_navigator.path(); }
    QPoint center() const { return m_center; }

    /**
     * @brief Load the graph, substituting the default graph on failure
     *
     * A failure is reported once through loadWarning().
     * @return false if the default graph had to be substituted
     */
    bool loadGraph();

    // ═══════════════════════════════════════════════════════════════════════════
    // Activation
    // ═══════════════════════════════════════════════════════════════════════════

    void activateAtRoot();
    void deactivateAndCommit();

    /**
     * @brief Close without committing anything
     */
    void cancel();

    /**
     * @brief Process one cursor sample, relative to the wheel center
     */
    void onTick(const QPointF& cursorOffset);

    /**
     * @brief Primary button on the overlay
     *
     * Folder and back slots navigate immediately and keep the wheel open;
     * any other slot (or the settings button) commits and closes.
     */
    void onPrimaryClick();

    /**
     * @brief Secondary button on the overlay: open the slot editor
     *
     * The release that follows closes the wheel without committing.
     */
    void onSecondaryClick();

    void applySettings(const WheelSettings& settings);

    // ═══════════════════════════════════════════════════════════════════════════
    // Slot editing
    // ═══════════════════════════════════════════════════════════════════════════

    SlotDraft editSlot(const QStringList& path, int index) const;

    /**
     * @brief Store an edited slot
     *
     * Blank labels get a default label; a folder slot without a value gets a
     * freshly generated folder id, one naming an existing folder restores it.
     */
    SlotEditResult commitSlotEdit(const QStringList& path, int index, const Slot& slot,
                                  FolderRemoval removal = FolderRemoval::KeepAsOrphan);

    bool deleteFolder(const QString& folderId);
    QStringList purgeOrphans();

    WheelViewState viewState();

Q_SIGNALS:
    void activeChanged(bool active);
    void slotEditorRequested(const QStringList& path, int index);
    void settingsRequested();
    void actionCommitted(ActionType type, const QString& value);
    void loadWarning(const QString& message);

private Q_SLOTS:
    void onPollTimeout();
    void onGraphChanged();

private:
    void close();
    void commit(const QStringList& path, int index, const Slot& slot);
    void dispatch(const Slot& slot);
    void refreshView();

    QPointer<FolderGraph> m_graph;
    IActionExecutor* m_executor = nullptr;
    IGraphPersistence* m_persistence = nullptr;
    ICursorProvider* m_cursor = nullptr;
    IWheelView* m_view = nullptr;

    DwellNavigator m_navigator;
    QTimer m_pollTimer;

    WheelSettings m_settings;
    WheelGeometry m_geometry;

    QPoint m_center;
    bool m_active = false;
    bool m_suppressReleaseCommit = false;
    bool m_loadWarningShown = false;
};

} // namespace QuickWheel
