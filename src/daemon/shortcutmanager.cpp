// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "shortcutmanager.h"
#include "../config/configdefaults.h"
#include "../core/logging.h"
#include <QAction>
#include <KGlobalAccel>
#include <KLocalizedString>

namespace QuickWheel {

namespace {

Qt::KeyboardModifier modifierFor(ActivationKey key)
{
    switch (key) {
    case ActivationKey::Super:
        return Qt::MetaModifier;
    case ActivationKey::Alt:
        return Qt::AltModifier;
    case ActivationKey::Ctrl:
        return Qt::ControlModifier;
    case ActivationKey::Shift:
        return Qt::ShiftModifier;
    }
    return Qt::NoModifier;
}

Qt::Key keyFor(ActivationKey key)
{
    switch (key) {
    case ActivationKey::Super:
        return Qt::Key_Meta;
    case ActivationKey::Alt:
        return Qt::Key_Alt;
    case ActivationKey::Ctrl:
        return Qt::Key_Control;
    case ActivationKey::Shift:
        return Qt::Key_Shift;
    }
    return Qt::Key_unknown;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Constructor / Destructor
// ═══════════════════════════════════════════════════════════════════════════════

ShortcutManager::ShortcutManager(ISettings* settings, QObject* parent)
    : IHotkeySource(parent)
    , m_settings(settings)
{
    Q_ASSERT(settings);

    connect(m_settings, &ISettings::activationKeysChanged, this, &ShortcutManager::updateShortcuts);
}

ShortcutManager::~ShortcutManager()
{
    unregisterShortcuts();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Public Methods
// ═══════════════════════════════════════════════════════════════════════════════

QKeySequence ShortcutManager::sequenceFor(ActivationKey first, ActivationKey second)
{
    return QKeySequence(QKeyCombination(modifierFor(first), keyFor(second)));
}

void ShortcutManager::registerShortcuts()
{
    if (m_wheelAction) {
        return;
    }

    m_wheelAction = new QAction(i18n("Show Quick Access Wheel"), this);
    m_wheelAction->setObjectName(QStringLiteral("show_quick_wheel"));

    const auto defaultFirst = activationKeyFromString(ConfigDefaults::activationKey1()).value_or(ActivationKey::Super);
    const auto defaultSecond = activationKeyFromString(ConfigDefaults::activationKey2()).value_or(ActivationKey::Alt);
    const WheelSettings settings = m_settings->wheelSettings();
    const QKeySequence defaultShortcut = sequenceFor(defaultFirst, defaultSecond);
    const QKeySequence shortcut = sequenceFor(settings.activationKey1, settings.activationKey2);

    KGlobalAccel::self()->setDefaultShortcut(m_wheelAction, {defaultShortcut});
    KGlobalAccel::setGlobalShortcut(m_wheelAction, shortcut);

    connect(KGlobalAccel::self(), &KGlobalAccel::globalShortcutActiveChanged, this,
            &ShortcutManager::onGlobalShortcutActiveChanged, Qt::UniqueConnection);

    qCInfo(lcShortcuts) << "Registered wheel shortcut" << shortcut.toString();
}

void ShortcutManager::updateShortcuts()
{
    if (!m_wheelAction) {
        return;
    }

    const WheelSettings settings = m_settings->wheelSettings();
    const QKeySequence shortcut = sequenceFor(settings.activationKey1, settings.activationKey2);
    KGlobalAccel::self()->setShortcut(m_wheelAction, {shortcut}, KGlobalAccel::NoAutoloading);

    // A chord held across the change can no longer be released through the new one
    if (m_held) {
        handleActiveChanged(false);
    }
    qCInfo(lcShortcuts) << "Updated wheel shortcut" << shortcut.toString();
}

void ShortcutManager::unregisterShortcuts()
{
    if (!m_wheelAction) {
        return;
    }
    // KGlobalAccel unregisters automatically when the action is deleted
    delete m_wheelAction;
    m_wheelAction = nullptr;
    m_held = false;
}

void ShortcutManager::handleActiveChanged(bool active)
{
    if (active == m_held) {
        return;
    }
    m_held = active;

    if (active) {
        qCDebug(lcShortcuts) << "Activation chord pressed";
        Q_EMIT activated();
    } else {
        qCDebug(lcShortcuts) << "Activation chord released";
        Q_EMIT deactivated();
    }
}

void ShortcutManager::onGlobalShortcutActiveChanged(QAction* action, bool active)
{
    if (action != m_wheelAction) {
        return;
    }
    handleActiveChanged(active);
}

} // namespace QuickWheel
