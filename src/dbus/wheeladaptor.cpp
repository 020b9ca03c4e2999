// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "wheeladaptor.h"
#include "../core/foldergraph.h"
#include "../core/logging.h"
#include "../daemon/wheelcontroller.h"
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

namespace QuickWheel {

WheelAdaptor::WheelAdaptor(WheelController* controller, ISettings* settings, QObject* parent)
    : QDBusAbstractAdaptor(parent)
    , m_controller(controller)
    , m_settings(settings)
{
    Q_ASSERT(controller);
    Q_ASSERT(settings);

    connect(m_controller, &WheelController::actionCommitted, this, [this](ActionType type, const QString& value) {
        Q_EMIT slotCommitted(actionTypeToString(type), value);
    });
    connect(m_controller, &WheelController::slotEditorRequested, this, &WheelAdaptor::slotEditorRequested);
    connect(m_controller, &WheelController::settingsRequested, this, &WheelAdaptor::settingsRequested);
    connect(m_controller, &WheelController::loadWarning, this, &WheelAdaptor::loadWarning);
}

// ═══════════════════════════════════════════════════════════════════════════════
// IWheelView
// ═══════════════════════════════════════════════════════════════════════════════

void WheelAdaptor::showAt(const QPoint& center, const WheelSettings& settings)
{
    Q_EMIT shown(center.x(), center.y(), settings.wheelRadius, settings.innerRadius);
}

void WheelAdaptor::hide()
{
    Q_EMIT hidden();
}

void WheelAdaptor::render(const WheelViewState& state)
{
    Q_EMIT stateChanged(stateToJson(state));
}

QString WheelAdaptor::stateToJson(const WheelViewState& state)
{
    QJsonArray slotArray;
    for (const Slot& slot : state.slotList) {
        slotArray.append(slot.toJson());
    }

    QJsonObject json;
    json[QLatin1String("path")] = QJsonArray::fromStringList(state.path);
    json[QLatin1String("slots")] = slotArray;
    json[QLatin1String("hoveredIndex")] = state.hoveredIndex;
    json[QLatin1String("hoveringSettings")] = state.hoveringSettings;
    if (state.enclosingSlot) {
        json[QLatin1String("enclosingSlot")] = state.enclosingSlot->toJson();
    }
    return QString::fromUtf8(QJsonDocument(json).toJson(QJsonDocument::Compact));
}

// ═══════════════════════════════════════════════════════════════════════════════
// Activation
// ═══════════════════════════════════════════════════════════════════════════════

void WheelAdaptor::activate()
{
    m_controller->activateAtRoot();
}

void WheelAdaptor::deactivate()
{
    m_controller->deactivateAndCommit();
}

void WheelAdaptor::cancel()
{
    m_controller->cancel();
}

bool WheelAdaptor::isActive()
{
    return m_controller->isActive();
}

QStringList WheelAdaptor::currentPath()
{
    return m_controller->currentPath();
}

void WheelAdaptor::primaryClick()
{
    m_controller->onPrimaryClick();
}

void WheelAdaptor::secondaryClick()
{
    m_controller->onSecondaryClick();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Slot editing
// ═══════════════════════════════════════════════════════════════════════════════

QString WheelAdaptor::slotDraft(const QStringList& path, int index)
{
    const SlotDraft draft = m_controller->editSlot(path, index);

    QJsonObject json;
    json[QLatin1String("path")] = QJsonArray::fromStringList(draft.path);
    json[QLatin1String("index")] = draft.index;
    json[QLatin1String("slot")] = draft.slot.toJson();
    json[QLatin1String("editable")] = draft.editable;
    json[QLatin1String("orphanCandidates")] = QJsonArray::fromStringList(draft.orphanCandidates);
    return QString::fromUtf8(QJsonDocument(json).toJson(QJsonDocument::Compact));
}

QString WheelAdaptor::commitSlot(const QStringList& path, int index, const QString& slotJson, bool deleteReplacedFolder)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(slotJson.toUtf8(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        qCWarning(lcDbus) << "commitSlot: invalid slot JSON:" << parseError.errorString();
        return QStringLiteral("invalid-json");
    }

    const QString typeName = doc.object().value(QLatin1String("type")).toString();
    if (!actionTypeFromString(typeName)) {
        qCWarning(lcDbus) << "commitSlot: unknown action type:" << typeName;
        return QStringLiteral("invalid-type");
    }

    const FolderRemoval removal =
        deleteReplacedFolder ? FolderRemoval::DeleteRecursively : FolderRemoval::KeepAsOrphan;
    const SlotEditResult result = m_controller->commitSlotEdit(path, index, Slot::fromJson(doc.object()), removal);
    return slotEditResultToString(result);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Folder maintenance
// ═══════════════════════════════════════════════════════════════════════════════

QStringList WheelAdaptor::orphanedFolders()
{
    QStringList orphans(m_controller->graph()->findOrphans().values());
    orphans.sort();
    return orphans;
}

bool WheelAdaptor::deleteFolder(const QString& folderId)
{
    if (folderId.isEmpty()) {
        qCWarning(lcDbus) << "Cannot delete folder - empty ID";
        return false;
    }
    return m_controller->deleteFolder(folderId);
}

QStringList WheelAdaptor::purgeOrphans()
{
    return m_controller->purgeOrphans();
}

void WheelAdaptor::reloadConfig()
{
    qCInfo(lcDbus) << "Reloading configuration";
    m_controller->cancel();
    m_settings->load();
    m_controller->loadGraph();
}

} // namespace QuickWheel
