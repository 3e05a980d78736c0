// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "utils/PathUtils.hpp"

#include <QtCore/QDir>

namespace Utils::PathUtils {

namespace {

QString fileName(const QString& cleaned)
{
    const int slash = cleaned.lastIndexOf('/');
    return slash < 0 ? cleaned : cleaned.mid(slash + 1);
}

} // namespace

QString normalizePath(QStringView path)
{
    const QString s = QDir::fromNativeSeparators(path.toString()).trimmed();
    QString cleaned = QDir::cleanPath(s);
    if (cleaned == ".")
        cleaned.clear();
    return cleaned;
}

QString stem(QStringView path)
{
    const QString name = fileName(normalizePath(path));
    const int dot = name.lastIndexOf('.');
    if (dot <= 0)
        return name;
    return name.left(dot);
}

QString ensureExtension(QStringView path, QStringView ext)
{
    QString result = path.toString();
    QString wanted = ext.toString();
    if (wanted.startsWith('.'))
        wanted.remove(0, 1);
    if (wanted.isEmpty())
        return result;

    const QString suffix = QStringLiteral(".") + wanted;
    if (result.endsWith(suffix, Qt::CaseInsensitive))
        return result;
    if (result.endsWith('.'))
        result.chop(1);
    result.append(suffix);
    return result;
}

QString sanitizeFileName(QStringView name)
{
    QString out;
    out.reserve(name.size());

    for (const QChar c : name) {
        if (c.isLetterOrNumber() || c == u'_' || c == u'-' || c == u' ')
            out.append(c);
    }

    out = out.simplified();
    if (out.isEmpty())
        return QStringLiteral("untitled");
    return out;
}

} // namespace Utils::PathUtils
