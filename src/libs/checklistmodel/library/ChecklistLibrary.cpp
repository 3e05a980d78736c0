// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "checklistmodel/library/ChecklistLibrary.hpp"

#include "checklistmodel/persistence/ChecklistXml.hpp"
#include "checklistmodel/settings/AppPaths.hpp"

#include "utils/PathUtils.hpp"
#include "utils/filesystem/FileSystemUtils.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>

namespace ChecklistModel {

namespace {

bool isInside(const QDir& dir, const QString& path)
{
    return QFileInfo(path).absoluteDir() == QDir(dir.absolutePath());
}

} // namespace

ChecklistLibrary::ChecklistLibrary(QString directory)
    : m_directory(Utils::PathUtils::normalizePath(directory))
{
}

Utils::Result ChecklistLibrary::ensureDirectory() const
{
    if (m_directory.isEmpty())
        return Utils::Result::failure(QStringLiteral("Checklist directory is not set."));
    if (!QDir().mkpath(m_directory))
        return Utils::Result::failure(QStringLiteral("Failed to create directory: %1").arg(m_directory));
    return Utils::Result::success();
}

QVector<ChecklistEntry> ChecklistLibrary::list() const
{
    QVector<ChecklistEntry> entries;
    const QStringList files =
        Utils::FileSystemUtils::listFiles(QDir(m_directory), QString::fromLatin1(ChecklistXml::kFileExtension));
    entries.reserve(files.size());

    for (const QString& path : files) {
        const ChecklistLoadResult loaded = ChecklistXml::load(path);
        ChecklistEntry entry;
        entry.path = path;
        entry.name = loaded.ok() && !loaded.checklist.name.trimmed().isEmpty()
                         ? loaded.checklist.name
                         : Utils::PathUtils::stem(path);
        entries.push_back(entry);
    }
    return entries;
}

Utils::Result ChecklistLibrary::create(const QString& name, QString* createdPath) const
{
    const QString trimmed = name.trimmed();
    if (trimmed.isEmpty())
        return Utils::Result::failure(QStringLiteral("Checklist name is empty."));

    Utils::Result r = ensureDirectory();
    if (!r)
        return r;

    const QDir dir(m_directory);
    const QString fileName = Utils::FileSystemUtils::uniqueChildName(
        dir, Utils::PathUtils::sanitizeFileName(trimmed), QString::fromLatin1(ChecklistXml::kFileExtension));
    if (fileName.isEmpty())
        return Utils::Result::failure(QStringLiteral("No free file name for checklist '%1'.").arg(trimmed));

    const QString path = dir.absoluteFilePath(fileName);
    r = ChecklistXml::save(Checklist::createEmpty(trimmed), path);
    if (!r)
        return r;

    qCInfo(checklistmodellog).noquote() << "Created checklist" << path;
    if (createdPath)
        *createdPath = path;
    return Utils::Result::success();
}

Utils::Result ChecklistLibrary::rename(const QString& path, const QString& name) const
{
    const QString trimmed = name.trimmed();
    if (trimmed.isEmpty())
        return Utils::Result::failure(QStringLiteral("Checklist name is empty."));

    ChecklistLoadResult loaded = ChecklistXml::load(path);
    if (!loaded.ok())
        return Utils::Result::failure(loaded.error);

    loaded.checklist.name = trimmed;
    return ChecklistXml::save(loaded.checklist, path);
}

Utils::Result ChecklistLibrary::remove(const QString& path) const
{
    if (!isInside(QDir(m_directory), path))
        return Utils::Result::failure(QStringLiteral("Not a checklist of this library: %1").arg(path));

    QFile file(path);
    if (!file.exists())
        return Utils::Result::success();
    if (!file.remove())
        return Utils::Result::failure(QStringLiteral("Failed to delete %1 (%2)").arg(path, file.errorString()));

    qCInfo(checklistmodellog).noquote() << "Deleted checklist" << path;
    return Utils::Result::success();
}

Utils::Result ChecklistLibrary::duplicate(const QString& path, QString* createdPath) const
{
    ChecklistLoadResult loaded = ChecklistXml::load(path);
    if (!loaded.ok())
        return Utils::Result::failure(loaded.error);

    const QDir dir(m_directory);
    const QString fileName = Utils::FileSystemUtils::duplicateName(dir, QFileInfo(path).fileName());
    if (fileName.isEmpty())
        return Utils::Result::failure(QStringLiteral("No free file name to duplicate %1.").arg(path));

    const QString target = dir.absoluteFilePath(fileName);
    loaded.checklist.name = QStringLiteral("%1 copy").arg(loaded.checklist.name);
    const Utils::Result r = ChecklistXml::save(loaded.checklist, target);
    if (!r)
        return r;

    if (createdPath)
        *createdPath = target;
    return Utils::Result::success();
}

Utils::Result ChecklistLibrary::seedDefaults(const QString& sourceDir, bool* seeded) const
{
    if (seeded)
        *seeded = false;
    if (QFileInfo::exists(m_directory))
        return Utils::Result::success();

    Utils::Result r = ensureDirectory();
    if (!r)
        return r;

    const QDir source(sourceDir);
    if (sourceDir.isEmpty() || !source.exists()) {
        qCDebug(checklistmodellog).noquote() << "No bundled defaults at" << sourceDir;
        return Utils::Result::success();
    }

    const QDir target(m_directory);
    QStringList toCopy = Utils::FileSystemUtils::listFiles(source, QString::fromLatin1(ChecklistXml::kFileExtension));
    const QString configSource = source.absoluteFilePath(AppPaths::configFileName());
    if (QFileInfo::exists(configSource))
        toCopy.prepend(configSource);

    for (const QString& file : toCopy) {
        const QString dest = target.absoluteFilePath(QFileInfo(file).fileName());
        if (QFileInfo::exists(dest))
            continue;
        if (!QFile::copy(file, dest))
            r.addError(QStringLiteral("Failed to copy %1 to %2").arg(file, dest));
    }

    if (!r)
        return r;
    if (seeded)
        *seeded = true;
    return r;
}

} // namespace ChecklistModel
