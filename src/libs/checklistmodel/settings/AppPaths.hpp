// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "checklistmodel/ChecklistModelGlobal.hpp"

#include <QtCore/QString>

namespace ChecklistModel {

struct CHECKLISTMODEL_EXPORT AppPaths final {
    QString dataDir;

    QString configFile() const;

    static QString applicationName();
    static QString configFileName();

    // An explicit override wins; otherwise the per-user AppDataLocation.
    static AppPaths resolve(const QString& overrideDir = {});

    // Read-only defaults shipped next to the executable, if any.
    static QString bundledDefaultsDir(const QString& applicationDir);
};

} // namespace ChecklistModel
