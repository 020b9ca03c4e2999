// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QObject>
#include <memory>

namespace QuickWheel {

class FolderGraph;
class Settings;
class ShortcutManager;
class WheelController;
class WheelAdaptor;
class JsonGraphPersistence;
class ProcessActionExecutor;
class QCursorProvider;

/**
 * @brief Main daemon for QuickWheel
 *
 * Background process owning every wheel component:
 * - Settings and wheel.json persistence
 * - The global activation shortcut
 * - Driving the wheel and executing committed actions
 * - The org.quickwheel.Wheel D-Bus interface
 *
 * Note: This class does NOT use the singleton pattern. Create instances
 * where needed and pass via dependency injection.
 */
class Daemon : public QObject
{
    Q_OBJECT

public:
    explicit Daemon(QObject* parent = nullptr);
    ~Daemon() override;

    // Initialization
    bool init();
    void start();
    void stop();

    // Component access
    Settings* settings() const
    {
        return m_settings.get();
    }
    FolderGraph* graph() const
    {
        return m_graph.get();
    }
    WheelController* wheelController() const
    {
        return m_wheelController.get();
    }
    ShortcutManager* shortcutManager() const
    {
        return m_shortcutManager.get();
    }

Q_SIGNALS:
    void started();
    void stopped();

private:
    bool registerDBus();

    std::unique_ptr<Settings> m_settings;
    std::unique_ptr<FolderGraph> m_graph;
    std::unique_ptr<JsonGraphPersistence> m_persistence;
    std::unique_ptr<ProcessActionExecutor> m_executor;
    std::unique_ptr<QCursorProvider> m_cursor;
    std::unique_ptr<WheelController> m_wheelController;
    std::unique_ptr<ShortcutManager> m_shortcutManager;

    // Owned by this object as its QObject child (adaptors must be parented to what they export)
    WheelAdaptor* m_wheelAdaptor = nullptr;

    bool m_running = false;
};

} // namespace QuickWheel
