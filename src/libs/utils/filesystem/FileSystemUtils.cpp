// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "utils/filesystem/FileSystemUtils.hpp"

#include <QtCore/QFileInfo>
#include <QtCore/QSaveFile>

namespace Utils::FileSystemUtils {

namespace {

QString bareExtension(const QString& ext)
{
    QString normalized = ext.trimmed();
    if (normalized.startsWith('.'))
        normalized.remove(0, 1);
    return normalized;
}

} // namespace

QString uniqueChildName(const QDir& dir, const QString& baseName, const QString& ext)
{
    const QString trimmedBase = baseName.trimmed();
    if (trimmedBase.isEmpty())
        return {};

    const QString normalizedExt = bareExtension(ext);
    const QString suffix = normalizedExt.isEmpty()
                               ? QString()
                               : QStringLiteral(".%1").arg(normalizedExt);
    const QString candidate = trimmedBase + suffix;
    if (!dir.exists(candidate))
        return candidate;

    for (int i = 1; i < 1000; ++i) {
        const QString indexed = QStringLiteral("%1 (%2)%3").arg(trimmedBase).arg(i).arg(suffix);
        if (!dir.exists(indexed))
            return indexed;
    }

    return {};
}

QString duplicateName(const QDir& dir, const QString& fileName)
{
    const QFileInfo fi(fileName);
    const QString base = fi.completeBaseName();
    if (base.trimmed().isEmpty())
        return {};

    const QString copied = uniqueChildName(dir, QStringLiteral("%1 copy").arg(base), fi.suffix());
    return copied.isEmpty() ? uniqueChildName(dir, base, fi.suffix()) : copied;
}

QStringList listFiles(const QDir& dir, const QString& ext)
{
    if (!dir.exists())
        return {};

    const QString normalizedExt = bareExtension(ext);
    const QStringList filters = normalizedExt.isEmpty()
                                    ? QStringList{}
                                    : QStringList{QStringLiteral("*.%1").arg(normalizedExt)};

    QStringList out;
    const QFileInfoList entries =
        dir.entryInfoList(filters, QDir::Files | QDir::Readable, QDir::Name | QDir::IgnoreCase);
    out.reserve(entries.size());
    for (const QFileInfo& fi : entries)
        out.push_back(fi.absoluteFilePath());
    return out;
}

Result writeFileAtomic(const QString& path, const QByteArray& bytes)
{
    const QString cleanedPath = path.trimmed();
    if (cleanedPath.isEmpty())
        return Result::failure(QStringLiteral("Output path is empty."));

    const QString parentDir = QFileInfo(cleanedPath).absolutePath();
    if (!QDir().mkpath(parentDir))
        return Result::failure(QStringLiteral("Failed to create directory: %1").arg(parentDir));

    QSaveFile file(cleanedPath);
    if (!file.open(QIODevice::WriteOnly))
        return Result::failure(QStringLiteral("Failed to open file for writing: %1 (%2)")
                                   .arg(cleanedPath, file.errorString()));

    if (file.write(bytes) != bytes.size()) {
        const QString error = file.errorString();
        file.cancelWriting();
        return Result::failure(QStringLiteral("Failed to write file: %1 (%2)").arg(cleanedPath, error));
    }

    if (!file.commit())
        return Result::failure(QStringLiteral("Failed to commit file: %1 (%2)")
                                   .arg(cleanedPath, file.errorString()));
    return Result::success();
}

} // namespace Utils::FileSystemUtils
