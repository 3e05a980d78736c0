// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "checklistmodel/settings/AppSettings.hpp"

#include "utils/filesystem/JsonFileUtils.hpp"

#include <QtCore/QJsonObject>

#include <algorithm>
#include <utility>

namespace ChecklistModel {

namespace {

const QString kMaxItemWidthKey = QStringLiteral("max_item_width");

} // namespace

AppSettings::AppSettings(QString configPath)
    : m_configPath(std::move(configPath))
{
    reload();
}

void AppSettings::reload()
{
    m_maxItemWidth = kDefaultMaxItemWidth;

    QString error;
    const QJsonObject obj = Utils::JsonFileUtils::readObject(m_configPath, &error);
    if (!error.isEmpty()) {
        qCWarning(checklistmodellog).noquote() << "Using default settings:" << error;
        return;
    }

    const QJsonValue width = obj.value(kMaxItemWidthKey);
    if (width.isDouble())
        m_maxItemWidth = clampMaxItemWidth(width.toInt(kDefaultMaxItemWidth));
    else if (!width.isUndefined())
        qCWarning(checklistmodellog) << "Ignoring non-numeric max_item_width in" << m_configPath;
}

Utils::Result AppSettings::setMaxItemWidth(int width)
{
    const int clamped = clampMaxItemWidth(width);

    // Unknown keys written by other versions are preserved.
    QString error;
    QJsonObject obj = Utils::JsonFileUtils::readObject(m_configPath, &error);
    if (!error.isEmpty())
        obj = QJsonObject{};
    obj.insert(kMaxItemWidthKey, clamped);

    const Utils::Result r = Utils::JsonFileUtils::writeObjectAtomic(m_configPath, obj);
    if (!r) {
        qCWarning(checklistmodellog).noquote() << "Failed to write settings:" << r.errorString();
        return r;
    }
    m_maxItemWidth = clamped;
    return r;
}

int AppSettings::clampMaxItemWidth(int width) noexcept
{
    return std::clamp(width, kMinMaxItemWidth, kMaxMaxItemWidth);
}

} // namespace ChecklistModel
