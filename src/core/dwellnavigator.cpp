// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "dwellnavigator.h"
#include "constants.h"
#include "foldergraph.h"
#include "logging.h"

namespace QuickWheel {

DwellNavigator::DwellNavigator(FolderGraph* graph, QObject* parent)
    : QObject(parent)
    , m_graph(graph)
{
    Q_ASSERT(graph);

    m_dwellTimer.setSingleShot(true);
    m_dwellTimer.setInterval(m_dwellMs);
    connect(&m_dwellTimer, &QTimer::timeout, this, &DwellNavigator::onDwellTimeout);

    // Slot edits and deletions may invalidate the path or the armed slot
    connect(m_graph, &FolderGraph::graphReset, this, [this]() {
        cancelDwell();
        m_path.clear();
        Q_EMIT viewChanged();
    });
}

DwellNavigator::~DwellNavigator() = default;

void DwellNavigator::setDwellMs(int ms)
{
    m_dwellMs = qMax(0, ms);
}

void DwellNavigator::setAutoContinueExtraMs(int ms)
{
    m_autoContinueExtraMs = qMax(0, ms);
}

void DwellNavigator::setSuppressionReset(SuppressionReset mode)
{
    m_suppressionReset = mode;
}

void DwellNavigator::reset()
{
    cancelDwell();
    m_hover = HoverState();
    m_path.clear();
    m_lastHit = HitResult::none();
    m_justTransitioned = false;
}

void DwellNavigator::stop()
{
    cancelDwell();
}

const Folder& DwellNavigator::currentFolder()
{
    if (const Folder* folder = m_graph->resolve(m_path)) {
        return *folder;
    }

    qCWarning(lcNavigation) << "Navigation path no longer resolves, returning to root:" << m_path;
    cancelDwell();
    m_path.clear();
    Q_EMIT navigated(m_path);
    return m_graph->root();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Evaluation
// ═══════════════════════════════════════════════════════════════════════════════

void DwellNavigator::evaluate(const HitResult& hit)
{
    if (hit.isSlot() && (hit.slot < 0 || hit.slot >= Defaults::SlotCount)) {
        qCWarning(lcNavigation) << "Ignoring out of range" << hit;
        return;
    }

    const bool afterTransition = m_justTransitioned;
    m_justTransitioned = false;
    m_lastHit = hit;

    if (hit.isNone()) {
        // Leaving the ring is an intentional reset
        clearSuppression();
        if (m_hover.hoveredIndex != -1 || m_hover.hoveringSettings) {
            cancelDwell();
            m_hover.hoveredIndex = -1;
            m_hover.hoveringSettings = false;
            Q_EMIT hoverChanged(-1, false);
            Q_EMIT viewChanged();
        }
        return;
    }

    if (hit.isSettingsButton()) {
        if (!m_hover.hoveringSettings) {
            cancelDwell();
            if (!afterTransition) {
                clearSuppression();
            }
            m_hover.hoveredIndex = -1;
            m_hover.hoveringSettings = true;
            Q_EMIT hoverChanged(-1, true);
            Q_EMIT viewChanged();
        }
        if (afterTransition && m_suppressionReset == SuppressionReset::OnFirstObservation) {
            clearSuppression();
        }
        return;
    }

    const int index = hit.slot;
    if (index == m_hover.hoveredIndex && !m_hover.hoveringSettings) {
        // Same slot as last tick: a pending dwell keeps running
        if (afterTransition && m_suppressionReset == SuppressionReset::OnFirstObservation) {
            clearSuppression();
        }
        return;
    }

    cancelDwell();
    // The synthetic post-transition evaluation is what suppression exists for
    if (!afterTransition) {
        clearSuppression();
    }

    m_hover.hoveredIndex = index;
    m_hover.hoveringSettings = false;

    const Slot& slot = currentFolder().slot(index);
    if (slot.navigates() && !isSuppressed(slot)) {
        armDwell(index, afterTransition);
    } else if (slot.navigates()) {
        qCDebug(lcNavigation) << "Dwell suppressed on slot" << index << actionTypeToString(slot.type);
    }

    if (afterTransition && m_suppressionReset == SuppressionReset::OnFirstObservation) {
        clearSuppression();
    }

    Q_EMIT hoverChanged(index, false);
    Q_EMIT viewChanged();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Dwell timer
// ═══════════════════════════════════════════════════════════════════════════════

void DwellNavigator::armDwell(int index, bool extended)
{
    const int interval = extended ? m_dwellMs + m_autoContinueExtraMs : m_dwellMs;
    m_hover.dwellArmedFor = index;
    m_dwellTimer.setInterval(interval);
    m_dwellTimer.start();
    qCDebug(lcNavigation) << "Dwell armed slot=" << index << "interval=" << interval;
}

void DwellNavigator::cancelDwell()
{
    if (m_dwellTimer.isActive()) {
        qCDebug(lcNavigation) << "Dwell cancelled slot=" << m_hover.dwellArmedFor.value_or(-1);
    }
    m_dwellTimer.stop();
    m_hover.dwellArmedFor.reset();
}

void DwellNavigator::onDwellTimeout()
{
    const std::optional<int> armed = m_hover.dwellArmedFor;
    m_hover.dwellArmedFor.reset();

    if (!armed || *armed != m_hover.hoveredIndex || m_hover.hoveringSettings) {
        return;
    }
    navigate(*armed);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Navigation
// ═══════════════════════════════════════════════════════════════════════════════

bool DwellNavigator::navigate(int index)
{
    const Slot slot = currentFolder().slot(index);

    if (slot.isFolder()) {
        if (slot.value.isEmpty()) {
            qCWarning(lcNavigation) << "Folder slot" << index << "has no folder id";
            return false;
        }
        if (!m_graph->contains(slot.value)) {
            qCWarning(lcNavigation) << "Folder" << slot.value << "missing from graph, creating it";
            if (!m_graph->createFolder(slot.value)) {
                return false;
            }
        }
        m_path.append(slot.value);
        qCInfo(lcNavigation) << "Entered folder" << slot.value << "path=" << m_path;
        transition(Direction::Into);
        return true;
    }

    if (slot.isBack()) {
        if (m_path.isEmpty()) {
            qCDebug(lcNavigation) << "Back at root ignored";
            return false;
        }
        m_path.removeLast();
        qCInfo(lcNavigation) << "Went back, path=" << m_path;
        transition(Direction::Back);
        return true;
    }

    return false;
}

void DwellNavigator::transition(Direction direction)
{
    m_hover.backSuppressed = direction == Direction::Into;
    m_hover.folderSuppressed = direction == Direction::Back;
    m_hover.hoveredIndex = -1;
    m_hover.hoveringSettings = false;
    m_justTransitioned = true;

    Q_EMIT navigated(m_path);
    Q_EMIT viewChanged();

    // Re-evaluate what is under the cursor in the new folder without waiting for motion
    evaluate(m_lastHit);
}

void DwellNavigator::clearSuppression()
{
    m_hover.backSuppressed = false;
    m_hover.folderSuppressed = false;
}

bool DwellNavigator::isSuppressed(const Slot& slot) const
{
    return (slot.isBack() && m_hover.backSuppressed) || (slot.isFolder() && m_hover.folderSuppressed);
}

} // namespace QuickWheel
