// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "quickwheel_export.h"
#include "../core/interfaces.h"
#include <QDBusAbstractAdaptor>
#include <QObject>
#include <QString>
#include <QStringList>

namespace QuickWheel {

class WheelController;

/**
 * @brief D-Bus adaptor for the wheel
 *
 * Provides D-Bus interface: org.quickwheel.Wheel
 *
 * Scripts can open and close the wheel where key release cannot be
 * observed, and an out-of-process renderer draws it from stateChanged()
 * (the adaptor is the controller's IWheelView) and reports clicks back
 * through primaryClick()/secondaryClick(). Slot editing and orphan cleanup
 * are exposed for an external settings UI.
 */
class QUICKWHEEL_EXPORT WheelAdaptor : public QDBusAbstractAdaptor, public IWheelView
{
    Q_OBJECT
    Q_CLASSINFO("D-Bus Interface", "org.quickwheel.Wheel")

public:
    explicit WheelAdaptor(WheelController* controller, ISettings* settings, QObject* parent = nullptr);
    ~WheelAdaptor() override = default;

    // IWheelView
    void showAt(const QPoint& center, const WheelSettings& settings) override;
    void hide() override;
    void render(const WheelViewState& state) override;

    static QString stateToJson(const WheelViewState& state);

public Q_SLOTS:
    // Activation
    void activate();
    void deactivate();
    void cancel();
    bool isActive();
    QStringList currentPath();

    // Renderer callbacks
    void primaryClick();
    void secondaryClick();

    // Slot editing
    QString slotDraft(const QStringList& path, int index);
    QString commitSlot(const QStringList& path, int index, const QString& slotJson, bool deleteReplacedFolder);

    // Folder maintenance
    QStringList orphanedFolders();
    bool deleteFolder(const QString& folderId);
    QStringList purgeOrphans();

    void reloadConfig();

Q_SIGNALS:
    void shown(int x, int y, int wheelRadius, int innerRadius);
    void hidden();
    void stateChanged(const QString& stateJson);
    void slotCommitted(const QString& type, const QString& value);
    void slotEditorRequested(const QStringList& path, int index);
    void settingsRequested();
    void loadWarning(const QString& message);

private:
    WheelController* m_controller;
    ISettings* m_settings;
};

} // namespace QuickWheel
