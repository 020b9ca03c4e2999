// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "quickwheel_export.h"
#include "settings_interfaces.h"
#include "slot.h"
#include <QObject>
#include <QPoint>
#include <QStringList>
#include <QVector>
#include <optional>

class QKeySequence;

namespace QuickWheel {

class FolderGraph;

/**
 * @brief Abstract interface for settings management
 *
 * Components depend on this interface rather than the concrete
 * KConfig-backed Settings class.
 */
class QUICKWHEEL_EXPORT ISettings : public QObject
{
    Q_OBJECT

public:
    explicit ISettings(QObject* parent = nullptr)
        : QObject(parent)
    {
    }
    ~ISettings() override;

    virtual WheelSettings wheelSettings() const = 0;

    /**
     * @brief Validate, store and persist a complete settings snapshot
     */
    virtual void apply(const WheelSettings& settings) = 0;

    virtual void load() = 0;
    virtual void save() = 0;
    virtual void reset() = 0;

Q_SIGNALS:
    void settingsChanged();
    void activationKeysChanged();
};

/**
 * @brief Performs committed actions
 *
 * Fire-and-forget: implementations start the action and return without
 * waiting for it to finish.
 */
class QUICKWHEEL_EXPORT IActionExecutor
{
public:
    virtual ~IActionExecutor();

    /**
     * @return false if the action could not be started
     */
    virtual bool execute(ActionType type, const QString& value) = 0;
};

/**
 * @brief Synthesizes key presses into the focused window
 *
 * Platform specific (virtual keyboard protocol, uinput, XTest); the daemon
 * runs without one unless a backend is available.
 */
class QUICKWHEEL_EXPORT IKeystrokeInjector
{
public:
    virtual ~IKeystrokeInjector();

    virtual bool sendKeySequence(const QKeySequence& sequence) = 0;
};

/**
 * @brief Loads and stores the folder graph
 */
class QUICKWHEEL_EXPORT IGraphPersistence
{
public:
    virtual ~IGraphPersistence();

    /**
     * @brief Replace @p graph with the stored graph
     * @return false if nothing usable could be read (graph left untouched)
     */
    virtual bool load(FolderGraph& graph) = 0;
    virtual bool save(const FolderGraph& graph) = 0;
    virtual QString location() const = 0;
};

/**
 * @brief Current pointer position in global screen coordinates
 */
class QUICKWHEEL_EXPORT ICursorProvider
{
public:
    virtual ~ICursorProvider();

    virtual QPoint cursorPos() const = 0;
};

/**
 * @brief Edge-triggered activation source
 *
 * activated() fires once when both configured keys are held,
 * deactivated() once when either is released.
 */
class QUICKWHEEL_EXPORT IHotkeySource : public QObject
{
    Q_OBJECT

public:
    explicit IHotkeySource(QObject* parent = nullptr)
        : QObject(parent)
    {
    }
    ~IHotkeySource() override;

Q_SIGNALS:
    void activated();
    void deactivated();
};

/**
 * @brief Everything the renderer needs for one frame
 */
struct QUICKWHEEL_EXPORT WheelViewState {
    QStringList path;
    QVector<Slot> slotList;
    int hoveredIndex = -1;
    bool hoveringSettings = false;
    std::optional<Slot> enclosingSlot; // Parent's slot leading here, for the center display
};

/**
 * @brief Renderer for the wheel overlay
 *
 * Pointer clicks on the overlay are reported back through
 * WheelController::onPrimaryClick() / onSecondaryClick().
 */
class QUICKWHEEL_EXPORT IWheelView
{
public:
    virtual ~IWheelView();

    virtual void showAt(const QPoint& center, const WheelSettings& settings) = 0;
    virtual void hide() = 0;
    virtual void render(const WheelViewState& state) = 0;
};

} // namespace QuickWheel
