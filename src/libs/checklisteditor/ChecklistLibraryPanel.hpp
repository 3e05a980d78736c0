// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "checklisteditor/ChecklistEditorGlobal.hpp"

#include <checklistmodel/library/ChecklistLibrary.hpp>

#include <QtCore/QVector>
#include <QtWidgets/QWidget>

class QListWidget;
class QPoint;

namespace Utils {
class ContextMenu;
}

namespace ChecklistEditor {

// Sidebar listing the checklists of the library directory.
class CHECKLISTEDITOR_EXPORT ChecklistLibraryPanel final : public QWidget
{
    Q_OBJECT

public:
    explicit ChecklistLibraryPanel(QWidget* parent = nullptr);

    void setEntries(const QVector<ChecklistModel::ChecklistEntry>& entries, const QString& activePath = {});
    const QVector<ChecklistModel::ChecklistEntry>& entries() const { return m_entries; }

    void setActivePath(const QString& path);
    QString activePath() const;

signals:
    void checklistActivated(const QString& path);
    void newRequested();
    void renameRequested(const QString& path);
    void duplicateRequested(const QString& path);
    void deleteRequested(const QString& path);

private slots:
    void handleCurrentRowChanged(int row);
    void showContextMenu(const QPoint& pos);
    void handleContextAction(const QString& id);

private:
    QVector<ChecklistModel::ChecklistEntry> m_entries;
    QListWidget* m_list = nullptr;
    Utils::ContextMenu* m_contextMenu = nullptr;
    QString m_contextPath;
};

} // namespace ChecklistEditor
