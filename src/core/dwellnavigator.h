// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "quickwheel_export.h"
#include "hittest.h"
#include "settings_interfaces.h"
#include <QObject>
#include <QPointer>
#include <QStringList>
#include <QTimer>
#include <optional>

namespace QuickWheel {

class Folder;
class FolderGraph;

/**
 * @brief Hover state of one activation session
 */
struct QUICKWHEEL_EXPORT HoverState {
    int hoveredIndex = -1; // -1 = dead zone, outside, or settings button
    bool hoveringSettings = false;
    bool backSuppressed = false;
    bool folderSuppressed = false;
    std::optional<int> dwellArmedFor;
};

/**
 * @brief Dwell-driven folder navigation
 *
 * Consumes one HitResult per poll tick. Hovering a folder or back slot arms
 * a single-shot dwell timer; when it fires on the same slot the navigation
 * cursor is pushed or popped and the view refreshes.
 *
 * Right after a dwell navigation the last hit is re-evaluated immediately
 * as the "just transitioned" evaluation:
 * - the dwell for whatever is now under the cursor is extended by
 *   autoContinueExtraMs, giving time to read the new folder;
 * - back (after entering a folder) or folder (after going back) slots are
 *   suppressed so the wheel cannot bounce straight back.
 * Suppression lifts per SuppressionReset, and always in the dead zone.
 *
 * All state lives on the GUI thread; there is at most one dwell timer.
 */
class QUICKWHEEL_EXPORT DwellNavigator : public QObject
{
    Q_OBJECT

public:
    explicit DwellNavigator(FolderGraph* graph, QObject* parent = nullptr);
    ~DwellNavigator() override;

    // ═══════════════════════════════════════════════════════════════════════════
    // Configuration
    // ═══════════════════════════════════════════════════════════════════════════

    int dwellMs() const { return m_dwellMs; }
    void setDwellMs(int ms);
    int autoContinueExtraMs() const { return m_autoContinueExtraMs; }
    void setAutoContinueExtraMs(int ms);
    SuppressionReset suppressionReset() const { return m_suppressionReset; }
    void setSuppressionReset(SuppressionReset mode);

    // ═══════════════════════════════════════════════════════════════════════════
    // Session
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief Start a fresh session at root with no hover and no pending dwell
     */
    void reset();

    /**
     * @brief Cancel the pending dwell; hover and path are kept
     */
    void stop();

    /**
     * @brief Feed one hit-test result
     */
    void evaluate(const HitResult& hit);

    // ═══════════════════════════════════════════════════════════════════════════
    // State
    // ═══════════════════════════════════════════════════════════════════════════

    const HoverState& hoverState() const { return m_hover; }
    int hoveredIndex() const { return m_hover.hoveredIndex; }
    bool hoveringSettings() const { return m_hover.hoveringSettings; }
    bool isDwellArmed() const { return m_dwellTimer.isActive(); }
    int armedDwellInterval() const { return m_dwellTimer.interval(); }
    bool justTransitioned() const { return m_justTransitioned; }

    QStringList path() const { return m_path; }

    /**
     * @brief Folder currently displayed
     *
     * A path that no longer resolves (e.g. the folder was deleted behind
     * our back) is reset to root.
     */
    const Folder& currentFolder();

Q_SIGNALS:
    void hoverChanged(int index, bool hoveringSettings);
    void navigated(const QStringList& path);
    /**
     * @brief Emitted whenever the displayed folder or hover changes
     */
    void viewChanged();

private Q_SLOTS:
    void onDwellTimeout();

private:
    enum class Direction {
        Into,
        Back
    };

    void cancelDwell();
    void armDwell(int index, bool extended);
    void clearSuppression();
    bool isSuppressed(const Slot& slot) const;
    bool navigate(int index);
    void transition(Direction direction);

    QPointer<FolderGraph> m_graph;
    QTimer m_dwellTimer;

    int m_dwellMs = 400;
    int m_autoContinueExtraMs = 200;
    SuppressionReset m_suppressionReset = SuppressionReset::OnHoverChange;

    HoverState m_hover;
    QStringList m_path;
    HitResult m_lastHit;
    bool m_justTransitioned = false;
};

} // namespace QuickWheel
