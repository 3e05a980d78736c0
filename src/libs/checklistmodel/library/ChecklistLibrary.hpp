// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "checklistmodel/ChecklistModelGlobal.hpp"

#include "utils/Result.hpp"

#include <QtCore/QString>
#include <QtCore/QVector>

namespace ChecklistModel {

struct CHECKLISTMODEL_EXPORT ChecklistEntry final {
    QString path;
    QString name;
};

// A directory holding one XML document per checklist.
class CHECKLISTMODEL_EXPORT ChecklistLibrary final {
public:
    explicit ChecklistLibrary(QString directory);

    const QString& directory() const noexcept { return m_directory; }
    Utils::Result ensureDirectory() const;

    // Sorted by file name. The display name is the document's name, or the
    // file stem when the document cannot be read.
    QVector<ChecklistEntry> list() const;

    Utils::Result create(const QString& name, QString* createdPath = nullptr) const;
    // Renames the checklist document; the file keeps its name.
    Utils::Result rename(const QString& path, const QString& name) const;
    Utils::Result remove(const QString& path) const;
    Utils::Result duplicate(const QString& path, QString* createdPath = nullptr) const;

    // First launch only: copies config.json and *.xml from sourceDir when the
    // library directory does not exist yet. *seeded is set when files were copied.
    Utils::Result seedDefaults(const QString& sourceDir, bool* seeded = nullptr) const;

private:
    QString m_directory;
};

} // namespace ChecklistModel
