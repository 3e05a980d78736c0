// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "checklistmodel/ChecklistModelGlobal.hpp"

#include "utils/Result.hpp"

#include <QtCore/QString>

namespace ChecklistModel {

// Application preferences persisted in config.json.
class CHECKLISTMODEL_EXPORT AppSettings final {
public:
    static constexpr int kDefaultMaxItemWidth = 800;
    static constexpr int kMinMaxItemWidth = 400;
    static constexpr int kMaxMaxItemWidth = 1400;

    explicit AppSettings(QString configPath);

    const QString& configPath() const noexcept { return m_configPath; }

    void reload();

    int maxItemWidth() const noexcept { return m_maxItemWidth; }
    Utils::Result setMaxItemWidth(int width);

    static int clampMaxItemWidth(int width) noexcept;

private:
    QString m_configPath;
    int m_maxItemWidth = kDefaultMaxItemWidth;
};

} // namespace ChecklistModel
