// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "checklisteditor/ChecklistLibraryPanel.hpp"

#include <utils/contextmenu/ContextMenu.hpp>

#include <QtCore/QSignalBlocker>
#include <QtWidgets/QHBoxLayout>
#include <QtWidgets/QLabel>
#include <QtWidgets/QListWidget>
#include <QtWidgets/QPushButton>
#include <QtWidgets/QVBoxLayout>

#include <utility>

namespace ChecklistEditor {

namespace {

using Utils::ContextMenuAction;

const QString kRenameActionId = QStringLiteral("checklist.library.rename");
const QString kDuplicateActionId = QStringLiteral("checklist.library.duplicate");
const QString kDeleteActionId = QStringLiteral("checklist.library.delete");

} // namespace

ChecklistLibraryPanel::ChecklistLibraryPanel(QWidget* parent)
    : QWidget(parent)
{
    setObjectName(QStringLiteral("ChecklistLibraryPanel"));

    auto* layout = new QVBoxLayout(this);
    layout->setContentsMargins(0, 0, 0, 8);
    layout->setSpacing(0);

    auto* title = new QLabel(QStringLiteral("CHECKLISTS"), this);
    title->setObjectName(QStringLiteral("ChecklistLibraryTitle"));
    title->setContentsMargins(12, 12, 12, 4);
    layout->addWidget(title);

    m_list = new QListWidget(this);
    m_list->setObjectName(QStringLiteral("ChecklistLibraryList"));
    m_list->setContextMenuPolicy(Qt::CustomContextMenu);
    m_list->setSelectionMode(QAbstractItemView::SingleSelection);
    layout->addWidget(m_list, 1);

    auto* buttons = new QHBoxLayout();
    buttons->setContentsMargins(8, 4, 8, 0);
    auto* newButton = new QPushButton(QStringLiteral("+ New"), this);
    newButton->setObjectName(QStringLiteral("ChecklistLibraryNew"));
    buttons->addWidget(newButton);
    buttons->addStretch();
    layout->addLayout(buttons);

    m_contextMenu = new Utils::ContextMenu(this);

    connect(newButton, &QPushButton::clicked, this, &ChecklistLibraryPanel::newRequested);
    connect(m_list, &QListWidget::currentRowChanged, this, &ChecklistLibraryPanel::handleCurrentRowChanged);
    connect(m_list, &QListWidget::customContextMenuRequested, this, &ChecklistLibraryPanel::showContextMenu);
    connect(m_contextMenu, &Utils::ContextMenu::actionTriggered,
            this, &ChecklistLibraryPanel::handleContextAction);
}

void ChecklistLibraryPanel::setEntries(const QVector<ChecklistModel::ChecklistEntry>& entries,
                                       const QString& activePath)
{
    const QSignalBlocker blocker(m_list);
    m_entries = entries;
    m_list->clear();
    for (const auto& entry : m_entries) {
        auto* item = new QListWidgetItem(entry.name, m_list);
        item->setToolTip(entry.path);
    }
    setActivePath(activePath);
}

void ChecklistLibraryPanel::setActivePath(const QString& path)
{
    const QSignalBlocker blocker(m_list);
    for (int row = 0; row < m_entries.size(); ++row) {
        if (m_entries.at(row).path == path) {
            m_list->setCurrentRow(row);
            return;
        }
    }
    m_list->setCurrentRow(-1);
}

QString ChecklistLibraryPanel::activePath() const
{
    const int row = m_list->currentRow();
    return (row >= 0 && row < m_entries.size()) ? m_entries.at(row).path : QString();
}

void ChecklistLibraryPanel::handleCurrentRowChanged(int row)
{
    if (row < 0 || row >= m_entries.size())
        return;
    emit checklistActivated(m_entries.at(row).path);
}

void ChecklistLibraryPanel::showContextMenu(const QPoint& pos)
{
    const int row = m_list->row(m_list->itemAt(pos));
    if (row < 0 || row >= m_entries.size())
        return;
    m_contextPath = m_entries.at(row).path;

    m_contextMenu->setActions({
        ContextMenuAction::item(kRenameActionId, QStringLiteral("Rename...")),
        ContextMenuAction::item(kDuplicateActionId, QStringLiteral("Duplicate")),
        ContextMenuAction::separatorAction(),
        ContextMenuAction::item(kDeleteActionId, QStringLiteral("Delete")),
    });
    m_contextMenu->exec(m_list->viewport()->mapToGlobal(pos));
}

void ChecklistLibraryPanel::handleContextAction(const QString& id)
{
    const QString path = std::exchange(m_contextPath, QString());
    if (path.isEmpty())
        return;

    if (id == kRenameActionId)
        emit renameRequested(path);
    else if (id == kDuplicateActionId)
        emit duplicateRequested(path);
    else if (id == kDeleteActionId)
        emit deleteRequested(path);
}

} // namespace ChecklistEditor
