// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "checklisteditor/ChecklistEditorGlobal.hpp"

#include <checklistmodel/library/ChecklistLibrary.hpp>
#include <checklistmodel/settings/AppPaths.hpp>
#include <checklistmodel/settings/AppSettings.hpp>

#include <QtWidgets/QMainWindow>

class QLabel;

namespace ChecklistModel {
class ChecklistSession;
}

namespace ChecklistEditor {

class ChecklistLibraryPanel;
class ChecklistView;

class CHECKLISTEDITOR_EXPORT MainWindow final : public QMainWindow
{
    Q_OBJECT

public:
    explicit MainWindow(const ChecklistModel::AppPaths& paths, QWidget* parent = nullptr);

    ChecklistModel::ChecklistSession* session() const { return m_session; }
    ChecklistLibraryPanel* libraryPanel() const { return m_panel; }
    ChecklistView* checklistView() const { return m_view; }

    void refreshLibrary();
    bool openChecklist(const QString& path);

protected:
    void closeEvent(QCloseEvent* event) override;

private slots:
    void handleNewChecklist();
    void handleRename(const QString& path);
    void handleDuplicate(const QString& path);
    void handleDelete(const QString& path);
    void handleResetStates();
    void handleItemWidth();
    void handleSaveFailed(const QString& message);
    void updateTitle();

private:
    void buildMenus();
    void reportFailure(const QString& title, const Utils::Result& result);

    ChecklistModel::AppPaths m_paths;
    ChecklistModel::ChecklistLibrary m_library;
    ChecklistModel::AppSettings m_settings;

    ChecklistModel::ChecklistSession* m_session = nullptr;
    ChecklistLibraryPanel* m_panel = nullptr;
    ChecklistView* m_view = nullptr;
    QLabel* m_title = nullptr;
};

} // namespace ChecklistEditor
