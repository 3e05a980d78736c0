// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/UtilsGlobal.hpp"

#include <QtCore/QList>
#include <QtCore/QString>
#include <QtGui/QIcon>
#include <QtWidgets/QMenu>

#include <utility>

namespace Utils {

struct UTILS_EXPORT ContextMenuAction final {
    QString id;
    QString text;
    QIcon icon;
    bool enabled = true;
    bool checkable = false;
    bool checked = false;
    bool isSeparator = false;
    QList<ContextMenuAction> children;

    bool isSubmenu() const { return !children.isEmpty(); }

    static ContextMenuAction item(QString id, QString text, QIcon icon = {})
    {
        ContextMenuAction action;
        action.id = std::move(id);
        action.text = std::move(text);
        action.icon = std::move(icon);
        return action;
    }

    static ContextMenuAction submenu(QString text, QList<ContextMenuAction> children)
    {
        ContextMenuAction action;
        action.text = std::move(text);
        action.children = std::move(children);
        return action;
    }

    static ContextMenuAction separatorAction()
    {
        ContextMenuAction action;
        action.isSeparator = true;
        return action;
    }
};

// Declarative menu: rebuilt from specs, reports the id of the triggered entry.
class UTILS_EXPORT ContextMenu final : public QMenu
{
    Q_OBJECT

public:
    explicit ContextMenu(QWidget* parent = nullptr);

    void setActions(const QList<ContextMenuAction>& actions);
    QList<ContextMenuAction> actionsSpec() const;

signals:
    void actionTriggered(const QString& id);

private slots:
    void handleActionTriggered();

private:
    void populate(QMenu* menu, const QList<ContextMenuAction>& actions);

    QList<ContextMenuAction> m_actions;
};

} // namespace Utils
