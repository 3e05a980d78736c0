// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "utils/filesystem/JsonFileUtils.hpp"

#include "utils/filesystem/FileSystemUtils.hpp"

#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QJsonParseError>

namespace Utils::JsonFileUtils {

Result writeObjectAtomic(const QString& path, const QJsonObject& object, QJsonDocument::JsonFormat format)
{
    if (path.trimmed().isEmpty())
        return Result::failure(QStringLiteral("JSON output path is empty."));

    return FileSystemUtils::writeFileAtomic(path, QJsonDocument(object).toJson(format));
}

QJsonObject readObject(const QString& path, QString* error)
{
    const QString cleanedPath = path.trimmed();
    if (cleanedPath.isEmpty()) {
        if (error)
            *error = QStringLiteral("JSON input path is empty.");
        return {};
    }

    if (error)
        error->clear();

    if (!QFileInfo::exists(cleanedPath))
        return {};

    QFile file(cleanedPath);
    if (!file.open(QIODevice::ReadOnly)) {
        if (error) {
            *error = QStringLiteral("Failed to open JSON file: %1 (%2)")
                         .arg(cleanedPath, file.errorString());
        }
        return {};
    }

    QJsonParseError parseError{};
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        if (error) {
            *error = QStringLiteral("Failed to parse JSON file: %1 (%2)")
                         .arg(cleanedPath, parseError.errorString());
        }
        return {};
    }

    if (!doc.isObject()) {
        if (error)
            *error = QStringLiteral("JSON document is not an object: %1").arg(cleanedPath);
        return {};
    }

    return doc.object();
}

} // namespace Utils::JsonFileUtils
