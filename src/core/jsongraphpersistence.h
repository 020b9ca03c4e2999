// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "quickwheel_export.h"
#include "interfaces.h"
#include <QString>

namespace QuickWheel {

/**
 * @brief Stores the folder graph as wheel.json
 *
 * Default location: $XDG_DATA_HOME/quickwheel/wheel.json. Writes go through
 * QSaveFile so a crash mid-write never leaves a truncated file behind.
 */
class QUICKWHEEL_EXPORT JsonGraphPersistence : public IGraphPersistence
{
public:
    JsonGraphPersistence();
    explicit JsonGraphPersistence(const QString& filePath);
    ~JsonGraphPersistence() override;

    bool load(FolderGraph& graph) override;
    bool save(const FolderGraph& graph) override;
    QString location() const override { return m_filePath; }

    static QString defaultFilePath();

private:
    bool ensureDirectory() const;

    QString m_filePath;
};

} // namespace QuickWheel
