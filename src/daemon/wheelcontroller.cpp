// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "wheelcontroller.h"
#include "../config/settings.h"
#include "../core/constants.h"
#include "../core/hittest.h"
#include "../core/logging.h"
#include <KLocalizedString>
#include <QSet>

namespace QuickWheel {

WheelController::WheelController(FolderGraph* graph, IActionExecutor* executor, IGraphPersistence* persistence,
                                 ICursorProvider* cursor, QObject* parent)
    : QObject(parent)
    , m_graph(graph)
    , m_executor(executor)
    , m_persistence(persistence)
    , m_cursor(cursor)
    , m_navigator(graph)
{
    Q_ASSERT(graph);
    Q_ASSERT(executor);
    Q_ASSERT(persistence);
    Q_ASSERT(cursor);

    m_geometry = m_settings.geometry();

    m_pollTimer.setInterval(m_settings.pollIntervalMs); // ~60fps cursor sampling
    connect(&m_pollTimer, &QTimer::timeout, this, &WheelController::onPollTimeout);

    connect(&m_navigator, &DwellNavigator::viewChanged, this, &WheelController::refreshView);
    connect(m_graph, &FolderGraph::graphChanged, this, &WheelController::onGraphChanged);

    applySettings(m_settings);
}

WheelController::~WheelController() = default;

void WheelController::setView(IWheelView* view)
{
    m_view = view;
}

bool WheelController::loadGraph()
{
    if (m_persistence->load(*m_graph)) {
        return true;
    }

    qCWarning(lcWheel) << "Could not load wheel from" << m_persistence->location() << ", using an empty wheel";
    m_graph->resetToDefault();
    if (!m_loadWarningShown) {
        m_loadWarningShown = true;
        Q_EMIT loadWarning(i18n("Could not read %1. Starting with an empty wheel.", m_persistence->location()));
    }
    return false;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Activation
// ═══════════════════════════════════════════════════════════════════════════════

void WheelController::activateAtRoot()
{
    if (m_active) {
        qCDebug(lcWheel) << "Already active, activation ignored";
        return;
    }

    m_center = m_cursor->cursorPos();
    m_navigator.reset();
    m_suppressReleaseCommit = false;
    m_active = true;

    qCInfo(lcWheel) << "Wheel opened at" << m_center;

    if (m_view) {
        m_view->showAt(m_center, m_settings);
    }
    m_pollTimer.start();
    refreshView();
    Q_EMIT activeChanged(true);
}

void WheelController::deactivateAndCommit()
{
    if (!m_active) {
        qCDebug(lcWheel) << "Not active, deactivation ignored";
        return;
    }

    // Snapshot first: nothing that happens after this instant may change the commit
    const int index = m_navigator.hoveredIndex();
    const bool onSettings = m_navigator.hoveringSettings();
    const Folder& folder = m_navigator.currentFolder();
    const QStringList path = m_navigator.path();
    const Slot slot = index >= 0 ? folder.slot(index) : Slot();
    const bool suppressed = m_suppressReleaseCommit;

    close();

    if (suppressed) {
        qCDebug(lcWheel) << "Release commit suppressed by slot editor";
        return;
    }
    if (onSettings) {
        qCInfo(lcWheel) << "Settings requested";
        Q_EMIT settingsRequested();
        return;
    }
    if (index < 0) {
        qCDebug(lcWheel) << "Released over dead zone, nothing to commit";
        return;
    }
    commit(path, index, slot);
}

void WheelController::cancel()
{
    if (m_active) {
        close();
    }
}

void WheelController::close()
{
    m_pollTimer.stop();
    m_navigator.stop();
    m_active = false;
    m_suppressReleaseCommit = false;

    if (m_view) {
        m_view->hide();
    }
    qCInfo(lcWheel) << "Wheel closed";
    Q_EMIT activeChanged(false);
}

void WheelController::onPollTimeout()
{
    onTick(QPointF(m_cursor->cursorPos() - m_center));
}

void WheelController::onTick(const QPointF& cursorOffset)
{
    if (!m_active) {
        return;
    }
    m_navigator.evaluate(HitTest::hitTest(cursorOffset, m_geometry));
}

void WheelController::onPrimaryClick()
{
    if (!m_active) {
        return;
    }

    if (m_navigator.hoveringSettings()) {
        close();
        Q_EMIT settingsRequested();
        return;
    }

    const int index = m_navigator.hoveredIndex();
    if (index < 0) {
        return;
    }

    // Folder and back slots navigate by dwell only
    const Slot slot = m_navigator.currentFolder().slot(index);
    const QStringList path = m_navigator.path();
    close();
    commit(path, index, slot);
}

void WheelController::onSecondaryClick()
{
    if (!m_active) {
        return;
    }

    const int index = m_navigator.hoveredIndex();
    if (index < 0) {
        return;
    }
    if (m_navigator.currentFolder().slot(index).isBack()) {
        qCDebug(lcWheel) << "Back slot is not editable";
        return;
    }

    m_suppressReleaseCommit = true;
    Q_EMIT slotEditorRequested(m_navigator.path(), index);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Commit
// ═══════════════════════════════════════════════════════════════════════════════

void WheelController::commit(const QStringList& path, int index, const Slot& slot)
{
    switch (slot.type) {
    case ActionType::None:
        qCInfo(lcWheel) << "Empty slot" << index << "committed, opening editor";
        Q_EMIT slotEditorRequested(path, index);
        return;

    case ActionType::Folder:
    case ActionType::Back:
        // Navigation slots commit nothing
        return;

    case ActionType::Keystroke: {
        // Wait for the activation keys to come up before synthesizing keys
        QTimer::singleShot(m_settings.keystrokeDelayMs, this, [this, slot]() {
            dispatch(slot);
        });
        return;
    }

    case ActionType::Command:
    case ActionType::Launch:
        dispatch(slot);
        return;
    }
}

void WheelController::dispatch(const Slot& slot)
{
    qCInfo(lcWheel) << "Dispatching" << actionTypeToString(slot.type) << slot.value;
    Q_EMIT actionCommitted(slot.type, slot.value);
    if (!m_executor->execute(slot.type, slot.value)) {
        qCWarning(lcWheel) << "Executor failed for" << actionTypeToString(slot.type) << slot.value;
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Settings
// ═══════════════════════════════════════════════════════════════════════════════

void WheelController::applySettings(const WheelSettings& settings)
{
    m_settings = Settings::validated(settings);
    m_geometry = m_settings.geometry();

    m_navigator.setDwellMs(m_settings.dwellMs);
    m_navigator.setAutoContinueExtraMs(m_settings.autoContinueExtraMs);
    m_navigator.setSuppressionReset(m_settings.suppressionReset);
    m_pollTimer.setInterval(m_settings.pollIntervalMs);

    qCDebug(lcWheel) << "Applied settings dwell=" << m_settings.dwellMs << "extra=" << m_settings.autoContinueExtraMs
                     << "radius=" << m_settings.innerRadius << "-" << m_settings.wheelRadius;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Slot editing
// ═══════════════════════════════════════════════════════════════════════════════

SlotDraft WheelController::editSlot(const QStringList& path, int index) const
{
    SlotDraft draft;
    draft.path = path;
    draft.index = index;
    draft.slot = Slot::empty();

    const Folder* folder = m_graph->resolve(path);
    if (!folder || index < 0 || index >= Defaults::SlotCount) {
        qCWarning(lcWheel) << "Cannot edit slot" << index << "in" << path;
        return draft;
    }

    draft.slot = folder->slot(index);
    draft.editable = !(index == Defaults::BackSlotIndex && folder->hasBackSlot());

    QStringList orphans(m_graph->findOrphans().values());
    orphans.sort();
    draft.orphanCandidates = orphans;
    return draft;
}

SlotEditResult WheelController::commitSlotEdit(const QStringList& path, int index, const Slot& slot,
                                               FolderRemoval removal)
{
    const Folder* folder = m_graph->resolve(path);
    if (!folder) {
        qCWarning(lcWheel) << "Slot edit for unknown folder" << path;
        return SlotEditResult::FolderNotFound;
    }
    if (index < 0 || index >= Defaults::SlotCount) {
        return SlotEditResult::InvalidIndex;
    }
    if (index == Defaults::BackSlotIndex && folder->hasBackSlot()) {
        qCWarning(lcWheel) << "Back slot cannot be edited";
        return SlotEditResult::InvalidIndex;
    }

    Slot edited = slot;
    edited.value = edited.value.trimmed();
    if (actionRequiresValue(edited.type) && edited.value.isEmpty()) {
        return SlotEditResult::MissingValue;
    }

    if (edited.isEmpty()) {
        edited = Slot::empty();
    } else {
        if (edited.isFolder() && edited.value.isEmpty()) {
            edited.value = m_graph->generateFolderId();
        }
        if (edited.label.trimmed().isEmpty()) {
            edited.label = Slot::defaultLabel(edited.type, edited.value);
        }
    }

    const Slot previous = folder->slot(index);
    const bool restoring = edited.isFolder() && m_graph->contains(edited.value);

    const SlotEditResult result = m_graph->setSlot(path, index, edited);
    if (result != SlotEditResult::Ok) {
        return result;
    }
    if (restoring && edited.value != previous.value) {
        qCInfo(lcWheel) << "Reattached existing folder" << edited.value;
    }

    if (previous.isFolder() && previous.value != edited.value) {
        // Only purge when nothing else still leads into the old subtree
        const bool orphaned = m_graph->findOrphans().contains(previous.value);
        if (removal == FolderRemoval::DeleteRecursively && orphaned) {
            m_graph->deleteRecursive(previous.value);
        } else if (removal == FolderRemoval::DeleteRecursively) {
            qCWarning(lcWheel) << "Folder" << previous.value << "is still referenced elsewhere, not deleting";
        } else if (orphaned) {
            qCInfo(lcWheel) << "Folder" << previous.value << "is now orphaned";
        }
    }
    return SlotEditResult::Ok;
}

bool WheelController::deleteFolder(const QString& folderId)
{
    return !m_graph->deleteRecursive(folderId).isEmpty();
}

QStringList WheelController::purgeOrphans()
{
    QStringList removed;
    // An orphan may already be gone as part of an earlier orphan's subtree
    const QSet<QString> orphans = m_graph->findOrphans();
    for (const QString& id : orphans) {
        if (m_graph->contains(id)) {
            removed += m_graph->deleteRecursive(id);
        }
    }
    removed.sort();
    return removed;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Persistence and view
// ═══════════════════════════════════════════════════════════════════════════════

void WheelController::onGraphChanged()
{
    if (!m_persistence->save(*m_graph)) {
        qCWarning(lcWheel) << "Failed to save wheel to" << m_persistence->location();
    }
    refreshView();
}

WheelViewState WheelController::viewState()
{
    WheelViewState state;
    const Folder& folder = m_navigator.currentFolder();
    state.path = m_navigator.path();
    state.slotList = folder.slotList();
    state.hoveredIndex = m_navigator.hoveredIndex();
    state.hoveringSettings = m_navigator.hoveringSettings();
    state.enclosingSlot = m_graph->enclosingSlot(state.path);
    return state;
}

void WheelController::refreshView()
{
    if (m_view && m_active) {
        m_view->render(viewState());
    }
}

} // namespace QuickWheel
