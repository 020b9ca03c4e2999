// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "daemon.h"

#include <QDBusConnection>
#include <QDBusError>
#include <QThread>

#include "actionexecutor.h"
#include "cursorprovider.h"
#include "shortcutmanager.h"
#include "wheelcontroller.h"
#include "../core/constants.h"
#include "../core/foldergraph.h"
#include "../core/jsongraphpersistence.h"
#include "../core/logging.h"
#include "../config/settings.h"
#include "../dbus/wheeladaptor.h"

namespace QuickWheel {

Daemon::Daemon(QObject* parent)
    : QObject(parent)
{
}

Daemon::~Daemon()
{
    stop();
}

bool Daemon::init()
{
    m_settings = std::make_unique<Settings>();
    m_graph = std::make_unique<FolderGraph>();
    m_persistence = std::make_unique<JsonGraphPersistence>();
    // No keystroke backend yet: keystroke slots are logged and dropped
    m_executor = std::make_unique<ProcessActionExecutor>();
    m_cursor = std::make_unique<QCursorProvider>();

    m_wheelController = std::make_unique<WheelController>(m_graph.get(), m_executor.get(), m_persistence.get(),
                                                          m_cursor.get());
    m_wheelController->applySettings(m_settings->wheelSettings());
    connect(m_settings.get(), &ISettings::settingsChanged, this, [this]() {
        m_wheelController->applySettings(m_settings->wheelSettings());
    });

    m_shortcutManager = std::make_unique<ShortcutManager>(m_settings.get());
    connect(m_shortcutManager.get(), &IHotkeySource::activated, m_wheelController.get(),
            &WheelController::activateAtRoot);
    connect(m_shortcutManager.get(), &IHotkeySource::deactivated, m_wheelController.get(),
            &WheelController::deactivateAndCommit);

    // The D-Bus adaptor doubles as the renderer bridge
    m_wheelAdaptor = new WheelAdaptor(m_wheelController.get(), m_settings.get(), this);
    m_wheelController->setView(m_wheelAdaptor);

    connect(m_wheelController.get(), &WheelController::loadWarning, this, [](const QString& message) {
        qCWarning(lcDaemon) << message;
    });
    m_wheelController->loadGraph();

    return registerDBus();
}

bool Daemon::registerDBus()
{
    QDBusConnection bus = QDBusConnection::sessionBus();
    if (!bus.isConnected()) {
        qCCritical(lcDaemon) << "No session bus, the wheel cannot be reached without D-Bus";
        return false;
    }

    // The bus daemon may still be starting up at login; back off 1s, 2s before giving up
    constexpr int attempts = 3;
    for (int attempt = 1; !bus.registerService(QString(DBus::ServiceName)); ++attempt) {
        const QDBusError error = bus.lastError();
        const bool transient = error.type() == QDBusError::ServiceUnknown || error.type() == QDBusError::NoReply;
        if (!transient || attempt == attempts) {
            qCCritical(lcDaemon) << "Could not claim" << DBus::ServiceName << "after" << attempt
                                 << "attempt(s):" << error.message();
            return false;
        }
        qCWarning(lcDaemon) << "Claiming" << DBus::ServiceName << "failed:" << error.message() << "retrying";
        QThread::msleep(1000 * attempt);
    }

    if (!bus.registerObject(QString(DBus::ObjectPath), this)) {
        qCCritical(lcDaemon) << "Could not export" << DBus::ObjectPath << ":" << bus.lastError().message();
        bus.unregisterService(QString(DBus::ServiceName));
        return false;
    }

    qCInfo(lcDaemon) << "D-Bus service registered service=" << DBus::ServiceName << "path=" << DBus::ObjectPath
                     << "interface=" << DBus::Interface::Wheel;
    return true;
}

void Daemon::start()
{
    if (m_running) {
        return;
    }

    m_shortcutManager->registerShortcuts();

    m_running = true;
    Q_EMIT started();
}

void Daemon::stop()
{
    if (!m_running) {
        return;
    }

    // Close the wheel first so no commit happens during teardown
    if (m_wheelController) {
        m_wheelController->cancel();
    }
    if (m_shortcutManager) {
        m_shortcutManager->unregisterShortcuts();
    }

    // Release the name so a --replace instance can take over
    QDBusConnection::sessionBus().unregisterService(QString(DBus::ServiceName));

    m_running = false;
    Q_EMIT stopped();
}

} // namespace QuickWheel
