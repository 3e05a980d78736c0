// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "checklistmodel/settings/AppPaths.hpp"

#include "utils/PathUtils.hpp"

#include <QtCore/QDir>
#include <QtCore/QStandardPaths>

namespace ChecklistModel {

QString AppPaths::configFile() const
{
    return QDir(dataDir).filePath(configFileName());
}

QString AppPaths::applicationName()
{
    return QStringLiteral("Checklist");
}

QString AppPaths::configFileName()
{
    return QStringLiteral("config.json");
}

AppPaths AppPaths::resolve(const QString& overrideDir)
{
    AppPaths paths;
    const QString cleaned = Utils::PathUtils::normalizePath(overrideDir);
    if (!cleaned.isEmpty()) {
        paths.dataDir = QDir(cleaned).absolutePath();
        return paths;
    }

    paths.dataDir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (paths.dataDir.isEmpty())
        paths.dataDir = QDir::home().filePath(QStringLiteral(".%1").arg(applicationName().toLower()));
    return paths;
}

QString AppPaths::bundledDefaultsDir(const QString& applicationDir)
{
    const QDir appDir(applicationDir);
    const QStringList candidates{
        appDir.absoluteFilePath(QStringLiteral("defaults")),
        appDir.absoluteFilePath(QStringLiteral("../share/checklist/defaults")),
    };
    for (const QString& candidate : candidates) {
        if (QDir(candidate).exists())
            return QDir::cleanPath(candidate);
    }
    return {};
}

} // namespace ChecklistModel
