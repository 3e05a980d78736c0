// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/Result.hpp"
#include "utils/UtilsGlobal.hpp"

#include <QtCore/QByteArray>
#include <QtCore/QDir>
#include <QtCore/QString>
#include <QtCore/QStringList>

namespace Utils::FileSystemUtils {

// "Base.ext", then "Base (1).ext", "Base (2).ext"... Empty when the base is blank.
UTILS_EXPORT QString uniqueChildName(const QDir& dir, const QString& baseName, const QString& ext);
UTILS_EXPORT QString duplicateName(const QDir& dir, const QString& fileName);

// Absolute paths of regular files with the given extension, sorted by file name.
UTILS_EXPORT QStringList listFiles(const QDir& dir, const QString& ext);

// Writes through QSaveFile so readers never observe a partial file.
// Missing parent directories are created.
UTILS_EXPORT Result writeFileAtomic(const QString& path, const QByteArray& bytes);

} // namespace Utils::FileSystemUtils
