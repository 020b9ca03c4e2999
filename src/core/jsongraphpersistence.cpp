// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "jsongraphpersistence.h"
#include "foldergraph.h"
#include "logging.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>
#include <QStandardPaths>

namespace QuickWheel {

JsonGraphPersistence::JsonGraphPersistence()
    : JsonGraphPersistence(defaultFilePath())
{
}

JsonGraphPersistence::JsonGraphPersistence(const QString& filePath)
    : m_filePath(filePath)
{
}

JsonGraphPersistence::~JsonGraphPersistence() = default;

QString JsonGraphPersistence::defaultFilePath()
{
    return QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation)
        + QStringLiteral("/quickwheel/wheel.json");
}

bool JsonGraphPersistence::ensureDirectory() const
{
    const QString dirPath = QFileInfo(m_filePath).absolutePath();
    QDir dir(dirPath);
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        qCWarning(lcConfig) << "Failed to create wheel directory:" << dirPath;
        return false;
    }
    return true;
}

bool JsonGraphPersistence::load(FolderGraph& graph)
{
    QFile file(m_filePath);

    if (!file.exists()) {
        // First run: write out the default wheel so users can find and edit it
        qCInfo(lcConfig) << "Wheel file does not exist, creating default:" << m_filePath;
        graph.resetToDefault();
        return save(graph);
    }

    if (!file.open(QIODevice::ReadOnly)) {
        qCWarning(lcConfig) << "Failed to open wheel file:" << m_filePath << "Error:" << file.errorString();
        return false;
    }

    const QByteArray data = file.readAll();
    if (data.isEmpty()) {
        qCWarning(lcConfig) << "Wheel file is empty:" << m_filePath;
        return false;
    }

    QJsonParseError parseError;
    const auto doc = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        qCWarning(lcConfig) << "Failed to parse wheel file:" << m_filePath << "Error:" << parseError.errorString()
                            << "at offset" << parseError.offset;
        return false;
    }

    if (!doc.isObject() || !graph.fromJson(doc.object())) {
        qCWarning(lcConfig) << "Wheel file has no usable root folder:" << m_filePath;
        return false;
    }

    qCInfo(lcConfig) << "Loaded wheel from" << m_filePath;
    return true;
}

bool JsonGraphPersistence::save(const FolderGraph& graph)
{
    if (!ensureDirectory()) {
        return false;
    }

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        qCWarning(lcConfig) << "Failed to open wheel file for writing:" << m_filePath << "Error:" << file.errorString();
        return false;
    }

    const QByteArray data = QJsonDocument(graph.toJson()).toJson(QJsonDocument::Indented);
    if (file.write(data) != data.size()) {
        qCWarning(lcConfig) << "Failed to write wheel file:" << m_filePath << "Error:" << file.errorString();
        file.cancelWriting();
        return false;
    }

    if (!file.commit()) {
        qCWarning(lcConfig) << "Failed to commit wheel file:" << m_filePath << "Error:" << file.errorString();
        return false;
    }

    qCDebug(lcConfig) << "Saved wheel to" << m_filePath;
    return true;
}

} // namespace QuickWheel
