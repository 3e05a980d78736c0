// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "checklisteditor/MainWindow.hpp"

#include "checklisteditor/ChecklistLibraryPanel.hpp"
#include "checklisteditor/ChecklistView.hpp"

#include <checklistmodel/session/ChecklistSession.hpp>

#include <QtCore/QFileInfo>
#include <QtGui/QAction>
#include <QtGui/QCloseEvent>
#include <QtGui/QKeySequence>
#include <QtWidgets/QHBoxLayout>
#include <QtWidgets/QInputDialog>
#include <QtWidgets/QLabel>
#include <QtWidgets/QLineEdit>
#include <QtWidgets/QMenu>
#include <QtWidgets/QMenuBar>
#include <QtWidgets/QMessageBox>
#include <QtWidgets/QSplitter>
#include <QtWidgets/QStatusBar>
#include <QtWidgets/QVBoxLayout>

namespace ChecklistEditor {

namespace {

constexpr int kStatusMessageMs = 5000;

} // namespace

MainWindow::MainWindow(const ChecklistModel::AppPaths& paths, QWidget* parent)
    : QMainWindow(parent)
    , m_paths(paths)
    , m_library(paths.dataDir)
    , m_settings(paths.configFile())
{
    setObjectName(QStringLiteral("ChecklistMainWindow"));
    resize(900, 620);

    m_session = new ChecklistModel::ChecklistSession(this);

    auto* splitter = new QSplitter(Qt::Horizontal, this);
    setCentralWidget(splitter);

    m_panel = new ChecklistLibraryPanel(splitter);
    splitter->addWidget(m_panel);

    auto* content = new QWidget(splitter);
    auto* contentLayout = new QVBoxLayout(content);
    contentLayout->setContentsMargins(16, 16, 16, 16);
    contentLayout->setSpacing(8);

    m_title = new QLabel(content);
    m_title->setObjectName(QStringLiteral("ChecklistTitle"));
    m_title->setAlignment(Qt::AlignCenter);
    QFont titleFont = m_title->font();
    titleFont.setPointSizeF(titleFont.pointSizeF() * 1.6);
    titleFont.setBold(true);
    m_title->setFont(titleFont);
    contentLayout->addWidget(m_title);

    // The view is centred and capped at the configured width.
    auto* row = new QHBoxLayout();
    m_view = new ChecklistView(m_session, content);
    m_view->setMaxItemWidth(m_settings.maxItemWidth());
    row->addStretch();
    row->addWidget(m_view, 100);
    row->addStretch();
    contentLayout->addLayout(row, 1);

    splitter->addWidget(content);
    splitter->setStretchFactor(0, 1);
    splitter->setStretchFactor(1, 3);

    buildMenus();

    connect(m_panel, &ChecklistLibraryPanel::checklistActivated, this, &MainWindow::openChecklist);
    connect(m_panel, &ChecklistLibraryPanel::newRequested, this, &MainWindow::handleNewChecklist);
    connect(m_panel, &ChecklistLibraryPanel::renameRequested, this, &MainWindow::handleRename);
    connect(m_panel, &ChecklistLibraryPanel::duplicateRequested, this, &MainWindow::handleDuplicate);
    connect(m_panel, &ChecklistLibraryPanel::deleteRequested, this, &MainWindow::handleDelete);

    connect(m_session, &ChecklistModel::ChecklistSession::checklistChanged, this, &MainWindow::updateTitle);
    connect(m_session, &ChecklistModel::ChecklistSession::saveFailed, this, &MainWindow::handleSaveFailed);
    connect(m_session, &ChecklistModel::ChecklistSession::editRejected, this,
            [](ChecklistModel::TreeEditError error, const QString& message) {
                qCDebug(checklisteditorlog).noquote()
                    << "Edit rejected:" << ChecklistModel::toString(error) << message;
            });

    refreshLibrary();
    if (!m_panel->entries().isEmpty())
        openChecklist(m_panel->entries().front().path);
    updateTitle();
}

void MainWindow::buildMenus()
{
    QMenu* fileMenu = menuBar()->addMenu(QStringLiteral("&File"));
    QAction* newAction = fileMenu->addAction(QStringLiteral("&New Checklist..."));
    newAction->setShortcut(QKeySequence::New);
    connect(newAction, &QAction::triggered, this, &MainWindow::handleNewChecklist);
    fileMenu->addSeparator();
    QAction* quitAction = fileMenu->addAction(QStringLiteral("&Quit"));
    quitAction->setShortcut(QKeySequence::Quit);
    connect(quitAction, &QAction::triggered, this, &QWidget::close);

    QMenu* editMenu = menuBar()->addMenu(QStringLiteral("&Edit"));
    QAction* addAction = editMenu->addAction(QStringLiteral("&Add Item"));
    addAction->setShortcut(QKeySequence(Qt::CTRL | Qt::SHIFT | Qt::Key_N));
    connect(addAction, &QAction::triggered, this, [this]() { m_session->addRootItem(); });
    editMenu->addSeparator();
    QAction* resetAction = editMenu->addAction(QStringLiteral("Reset States to Defaults"));
    connect(resetAction, &QAction::triggered, this, &MainWindow::handleResetStates);

    QMenu* viewMenu = menuBar()->addMenu(QStringLiteral("&View"));
    QAction* widthAction = viewMenu->addAction(QStringLiteral("Item &Width..."));
    connect(widthAction, &QAction::triggered, this, &MainWindow::handleItemWidth);
}

void MainWindow::refreshLibrary()
{
    const Utils::Result dir = m_library.ensureDirectory();
    if (!dir) {
        reportFailure(QStringLiteral("Library"), dir);
        return;
    }
    m_panel->setEntries(m_library.list(), m_session->path());
}

bool MainWindow::openChecklist(const QString& path)
{
    if (path.isEmpty())
        return false;
    if (m_session->hasChecklist() && m_session->path() == path)
        return true;

    const ChecklistModel::ChecklistLoadResult result = m_session->open(path);
    m_panel->setActivePath(path);
    if (!result.ok()) {
        statusBar()->showMessage(QStringLiteral("Could not read %1: %2")
                                     .arg(QFileInfo(path).fileName(), result.error),
                                 kStatusMessageMs);
        return false;
    }
    if (result.migrated)
        statusBar()->showMessage(QStringLiteral("Upgraded legacy checklist format."), kStatusMessageMs);
    return true;
}

void MainWindow::closeEvent(QCloseEvent* event)
{
    m_session->flush();
    QMainWindow::closeEvent(event);
}

void MainWindow::handleNewChecklist()
{
    bool ok = false;
    const QString name = QInputDialog::getText(this, QStringLiteral("New Checklist"),
                                               QStringLiteral("Name:"), QLineEdit::Normal, QString(), &ok)
                             .trimmed();
    if (!ok || name.isEmpty())
        return;

    QString path;
    const Utils::Result created = m_library.create(name, &path);
    if (!created) {
        reportFailure(QStringLiteral("New Checklist"), created);
        return;
    }
    m_session->flush();
    refreshLibrary();
    openChecklist(path);
}

void MainWindow::handleRename(const QString& path)
{
    const bool isCurrent = m_session->hasChecklist() && m_session->path() == path;
    QString currentName = QFileInfo(path).completeBaseName();
    if (isCurrent) {
        currentName = m_session->checklist().name;
    } else {
        for (const auto& entry : m_panel->entries()) {
            if (entry.path == path)
                currentName = entry.name;
        }
    }

    bool ok = false;
    const QString name = QInputDialog::getText(this, QStringLiteral("Rename"), QStringLiteral("New name:"),
                                               QLineEdit::Normal, currentName, &ok)
                             .trimmed();
    if (!ok || name.isEmpty())
        return;

    if (isCurrent) {
        m_session->rename(name);
    } else {
        const Utils::Result renamed = m_library.rename(path, name);
        if (!renamed) {
            reportFailure(QStringLiteral("Rename"), renamed);
            return;
        }
    }
    refreshLibrary();
}

void MainWindow::handleDuplicate(const QString& path)
{
    if (m_session->path() == path)
        m_session->flush();

    QString copyPath;
    const Utils::Result copied = m_library.duplicate(path, &copyPath);
    if (!copied) {
        reportFailure(QStringLiteral("Duplicate"), copied);
        return;
    }
    refreshLibrary();
}

void MainWindow::handleDelete(const QString& path)
{
    const QMessageBox::StandardButton reply = QMessageBox::question(
        this, QStringLiteral("Delete"),
        QStringLiteral("Delete '%1'?").arg(QFileInfo(path).completeBaseName()),
        QMessageBox::Yes | QMessageBox::No, QMessageBox::No);
    if (reply != QMessageBox::Yes)
        return;

    if (m_session->path() == path)
        m_session->close();

    const Utils::Result removed = m_library.remove(path);
    if (!removed)
        reportFailure(QStringLiteral("Delete"), removed);
    refreshLibrary();
}

void MainWindow::handleResetStates()
{
    if (!m_session->hasChecklist()) {
        QMessageBox::information(this, QStringLiteral("No checklist"),
                                 QStringLiteral("Open or create a checklist first."));
        return;
    }
    m_session->replaceCatalog(ChecklistModel::StateCatalog::defaultCatalog());
}

void MainWindow::handleItemWidth()
{
    bool ok = false;
    const int width = QInputDialog::getInt(this, QStringLiteral("Item Width"),
                                           QStringLiteral("Maximum item width (px):"),
                                           m_settings.maxItemWidth(),
                                           ChecklistModel::AppSettings::kMinMaxItemWidth,
                                           ChecklistModel::AppSettings::kMaxMaxItemWidth, 50, &ok);
    if (!ok)
        return;

    const Utils::Result saved = m_settings.setMaxItemWidth(width);
    if (!saved)
        reportFailure(QStringLiteral("Item Width"), saved);
    m_view->setMaxItemWidth(m_settings.maxItemWidth());
}

void MainWindow::handleSaveFailed(const QString& message)
{
    statusBar()->showMessage(QStringLiteral("Save failed: %1").arg(message), kStatusMessageMs);
}

void MainWindow::updateTitle()
{
    const QString appName = ChecklistModel::AppPaths::applicationName();
    if (!m_session->hasChecklist()) {
        setWindowTitle(appName);
        m_title->clear();
        m_title->setVisible(false);
        return;
    }

    const QString& name = m_session->checklist().name;
    setWindowTitle(QStringLiteral("%1 - %2").arg(appName, name));
    m_title->setText(name);
    m_title->setVisible(!name.isEmpty());
}

void MainWindow::reportFailure(const QString& title, const Utils::Result& result)
{
    qCWarning(checklisteditorlog).noquote() << title << "failed:" << result.errorString();
    QMessageBox::warning(this, title, result.errorString());
}

} // namespace ChecklistEditor
