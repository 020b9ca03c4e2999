// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "quickwheel_export.h"
#include "../core/interfaces.h"
#include <QKeySequence>

class QAction;

namespace QuickWheel {

/**
 * @brief Global activation shortcut for the wheel
 *
 * Registers one KGlobalAccel action whose shortcut is built from the
 * configured key pair (first key as modifier, second as key, e.g.
 * Meta+Alt) and turns KGlobalAccel's press/release notifications into the
 * edge-triggered activated()/deactivated() pair.
 */
class QUICKWHEEL_EXPORT ShortcutManager : public IHotkeySource
{
    Q_OBJECT

public:
    explicit ShortcutManager(ISettings* settings, QObject* parent = nullptr);
    ~ShortcutManager() override;

    /**
     * @brief Initialize and register the activation shortcut
     */
    void registerShortcuts();

    /**
     * @brief Re-register after the activation keys changed
     */
    void updateShortcuts();

    /**
     * @brief Clear the registered shortcut
     */
    void unregisterShortcuts();

    bool isHeld() const { return m_held; }

    /**
     * @brief Feed a press (true) or release (false) of the activation chord
     *
     * Repeated presses while held and releases while not held are ignored.
     */
    void handleActiveChanged(bool active);

    static QKeySequence sequenceFor(ActivationKey first, ActivationKey second);

private Q_SLOTS:
    void onGlobalShortcutActiveChanged(QAction* action, bool active);

private:
    ISettings* m_settings = nullptr;
    QAction* m_wheelAction = nullptr;
    bool m_held = false;
};

} // namespace QuickWheel
