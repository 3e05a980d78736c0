// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "checklistmodel/TreeEditor.hpp"

#include <QtCore/QSet>

namespace ChecklistModel {

QString toString(TreeEditError error)
{
    switch (error) {
    case TreeEditError::None: return QStringLiteral("none");
    case TreeEditError::InvalidArgument: return QStringLiteral("invalid-argument");
    case TreeEditError::NotFound: return QStringLiteral("not-found");
    case TreeEditError::NoPrecedingSibling: return QStringLiteral("no-preceding-sibling");
    case TreeEditError::AtRoot: return QStringLiteral("at-root");
    case TreeEditError::CycleRejected: return QStringLiteral("cycle-rejected");
    case TreeEditError::DuplicateId: return QStringLiteral("duplicate-id");
    }
    return QStringLiteral("unknown");
}

QString toString(DropZone zone)
{
    switch (zone) {
    case DropZone::Before: return QStringLiteral("before");
    case DropZone::After: return QStringLiteral("after");
    case DropZone::Inside: return QStringLiteral("inside");
    case DropZone::End: return QStringLiteral("end");
    }
    return QStringLiteral("unknown");
}

namespace TreeEditor {

namespace {

struct Step final {
    Forest* siblings = nullptr;
    qsizetype index = -1;
};

// Chain of positions from a root item down to the located item.
using Path = QVector<Step>;

bool buildPath(Forest& list, const ItemId& id, Path& path)
{
    for (qsizetype i = 0; i < static_cast<qsizetype>(list.size()); ++i) {
        path.push_back(Step{&list, i});
        if (list[i].id == id)
            return true;
        if (buildPath(list[i].children, id, path))
            return true;
        path.pop_back();
    }
    return false;
}

Path pathTo(Forest& forest, const ItemId& id)
{
    Path path;
    if (id.isNull() || !buildPath(forest, id, path))
        path.clear();
    return path;
}

ChecklistItem& at(const Step& step)
{
    return (*step.siblings)[static_cast<size_t>(step.index)];
}

void normalizeCollapsed(ChecklistItem& item)
{
    if (item.children.empty())
        item.collapsed = false;
}

ChecklistItem detach(const Path& path)
{
    const Step& last = path.back();
    ChecklistItem item = std::move(at(last));
    last.siblings->erase(last.siblings->begin() + last.index);
    if (path.size() > 1)
        normalizeCollapsed(at(path.at(path.size() - 2)));
    return item;
}

void insertAt(const Step& step, qsizetype index, ChecklistItem item)
{
    step.siblings->insert(step.siblings->begin() + index, std::move(item));
}

TreeEditResult fail(TreeEditError code, const QString& msg)
{
    qCDebug(checklistmodellog).noquote() << msg;
    return TreeEditResult::failure(code, msg);
}

TreeEditResult notFound(const char* op, const ItemId& id)
{
    return fail(TreeEditError::NotFound,
                QStringLiteral("%1: no item with id '%2'.").arg(QLatin1String(op), id.toString()));
}

void collectInto(const Forest& forest, QVector<ItemId>& out)
{
    for (const auto& item : forest) {
        out.push_back(item.id);
        collectInto(item.children, out);
    }
}

std::optional<TreeEditResult> rejectNewItem(const Forest& forest, const ChecklistItem& item, const char* op)
{
    if (item.id.isNull())
        return fail(TreeEditError::InvalidArgument,
                    QStringLiteral("%1: new item has no id.").arg(QLatin1String(op)));

    QVector<ItemId> incoming;
    incoming.push_back(item.id);
    collectInto(item.children, incoming);
    for (const ItemId& id : incoming) {
        if (contains(forest, id)) {
            const QString msg =
                QStringLiteral("%1: id '%2' is already in use.").arg(QLatin1String(op), id.toString());
            qCWarning(checklistmodellog).noquote() << msg;
            return TreeEditResult::failure(TreeEditError::DuplicateId, msg);
        }
    }
    return std::nullopt;
}

const ChecklistItem* findIn(const Forest& forest, const ItemId& id)
{
    for (const auto& item : forest) {
        if (item.id == id)
            return &item;
        if (const ChecklistItem* hit = findIn(item.children, id))
            return hit;
    }
    return nullptr;
}

bool parentSearch(const Forest& forest, const ItemId& parent, const ItemId& id, ItemId& out)
{
    for (const auto& item : forest) {
        if (item.id == id) {
            out = parent;
            return true;
        }
        if (parentSearch(item.children, item.id, id, out))
            return true;
    }
    return false;
}

} // namespace

TreeEditResult appendRoot(const Forest& forest, ChecklistItem item)
{
    if (auto rejected = rejectNewItem(forest, item, "AppendRoot"))
        return *rejected;

    Forest out = forest;
    const ItemId focus = item.id;
    out.push_back(std::move(item));
    return TreeEditResult::success(std::move(out), focus);
}

TreeEditResult insertAfter(const Forest& forest, const ItemId& refId, ChecklistItem item)
{
    if (auto rejected = rejectNewItem(forest, item, "InsertAfter"))
        return *rejected;

    Forest out = forest;
    const Path path = pathTo(out, refId);
    if (path.isEmpty())
        return notFound("InsertAfter", refId);

    const ItemId focus = item.id;
    insertAt(path.back(), path.back().index + 1, std::move(item));
    return TreeEditResult::success(std::move(out), focus);
}

TreeEditResult appendChild(const Forest& forest, const ItemId& parentId, ChecklistItem item)
{
    if (auto rejected = rejectNewItem(forest, item, "AppendChild"))
        return *rejected;

    Forest out = forest;
    const Path path = pathTo(out, parentId);
    if (path.isEmpty())
        return notFound("AppendChild", parentId);

    ChecklistItem& parent = at(path.back());
    const ItemId focus = item.id;
    parent.children.push_back(std::move(item));
    // The new child is about to receive focus; it must be visible.
    parent.collapsed = false;
    return TreeEditResult::success(std::move(out), focus);
}

TreeEditResult remove(const Forest& forest, const ItemId& id)
{
    Forest out = forest;
    const Path path = pathTo(out, id);
    if (path.isEmpty())
        return notFound("Remove", id);

    ChecklistItem subtree = detach(path);
    return TreeEditResult::removed(std::move(out), std::move(subtree));
}

TreeEditResult indent(const Forest& forest, const ItemId& id)
{
    Forest out = forest;
    const Path path = pathTo(out, id);
    if (path.isEmpty())
        return notFound("Indent", id);

    const Step self = path.back();
    if (self.index == 0)
        return fail(TreeEditError::NoPrecedingSibling,
                    QStringLiteral("Indent: '%1' has no preceding sibling.").arg(id.toString()));

    ChecklistItem item = std::move(at(self));
    self.siblings->erase(self.siblings->begin() + self.index);
    at(Step{self.siblings, self.index - 1}).children.push_back(std::move(item));
    return TreeEditResult::success(std::move(out));
}

TreeEditResult outdent(const Forest& forest, const ItemId& id)
{
    Forest out = forest;
    const Path path = pathTo(out, id);
    if (path.isEmpty())
        return notFound("Outdent", id);
    if (path.size() < 2)
        return fail(TreeEditError::AtRoot, QStringLiteral("Outdent: '%1' is already a root item.").arg(id.toString()));

    const Step parent = path.at(path.size() - 2);
    ChecklistItem item = detach(path);
    insertAt(parent, parent.index + 1, std::move(item));
    return TreeEditResult::success(std::move(out));
}

TreeEditResult relocate(const Forest& forest, const ItemId& sourceId, const ItemId& targetId, DropZone zone)
{
    if (sourceId.isNull())
        return fail(TreeEditError::InvalidArgument, QStringLiteral("Relocate: no source id."));

    if (zone != DropZone::End) {
        if (targetId.isNull())
            return fail(TreeEditError::NotFound,
                        QStringLiteral("Relocate: zone '%1' needs a target.").arg(toString(zone)));
        if (targetId == sourceId || isDescendant(forest, sourceId, targetId))
            return fail(TreeEditError::CycleRejected,
                        QStringLiteral("Relocate: '%1' cannot be moved into its own subtree.")
                            .arg(sourceId.toString()));
        if (!contains(forest, targetId))
            return notFound("Relocate", targetId);
    }

    Forest out = forest;
    const Path sourcePath = pathTo(out, sourceId);
    if (sourcePath.isEmpty())
        return notFound("Relocate", sourceId);

    ChecklistItem moving = detach(sourcePath);
    if (zone == DropZone::End) {
        out.push_back(std::move(moving));
        return TreeEditResult::success(std::move(out));
    }

    const Path targetPath = pathTo(out, targetId);
    Q_ASSERT(!targetPath.isEmpty());
    if (targetPath.isEmpty())
        return notFound("Relocate", targetId);

    const Step target = targetPath.back();
    switch (zone) {
    case DropZone::Before:
        insertAt(target, target.index, std::move(moving));
        break;
    case DropZone::After:
        insertAt(target, target.index + 1, std::move(moving));
        break;
    case DropZone::Inside:
        at(target).children.push_back(std::move(moving));
        break;
    case DropZone::End:
        break;
    }
    return TreeEditResult::success(std::move(out));
}

TreeEditResult updateText(const Forest& forest, const ItemId& id, const QString& text)
{
    Forest out = forest;
    const Path path = pathTo(out, id);
    if (path.isEmpty())
        return notFound("UpdateText", id);

    at(path.back()).text = text;
    return TreeEditResult::success(std::move(out));
}

TreeEditResult updateStatus(const Forest& forest, const ItemId& id, int statusNumber)
{
    Forest out = forest;
    const Path path = pathTo(out, id);
    if (path.isEmpty())
        return notFound("UpdateStatus", id);

    at(path.back()).statusNumber = statusNumber;
    return TreeEditResult::success(std::move(out));
}

TreeEditResult setCollapsed(const Forest& forest, const ItemId& id, bool collapsed)
{
    Forest out = forest;
    const Path path = pathTo(out, id);
    if (path.isEmpty())
        return notFound("SetCollapsed", id);

    ChecklistItem& item = at(path.back());
    item.collapsed = collapsed && item.hasChildren();
    return TreeEditResult::success(std::move(out));
}

const ChecklistItem* find(const Forest& forest, const ItemId& id)
{
    if (id.isNull())
        return nullptr;
    return findIn(forest, id);
}

bool contains(const Forest& forest, const ItemId& id)
{
    return find(forest, id) != nullptr;
}

bool isDescendant(const Forest& forest, const ItemId& ancestorId, const ItemId& id)
{
    const ChecklistItem* ancestor = find(forest, ancestorId);
    if (!ancestor || id.isNull())
        return false;
    return findIn(ancestor->children, id) != nullptr;
}

ItemId parentOf(const Forest& forest, const ItemId& id)
{
    ItemId parent;
    if (!id.isNull())
        parentSearch(forest, ItemId::null(), id, parent);
    return parent;
}

int count(const Forest& forest)
{
    int total = 0;
    for (const auto& item : forest)
        total += subtreeSize(item);
    return total;
}

int subtreeSize(const ChecklistItem& item)
{
    return 1 + count(item.children);
}

QVector<ItemId> collectIds(const Forest& forest)
{
    QVector<ItemId> out;
    collectInto(forest, out);
    return out;
}

std::optional<ItemId> findDuplicateId(const Forest& forest)
{
    QSet<ItemId> seen;
    for (const ItemId& id : collectIds(forest)) {
        if (seen.contains(id))
            return id;
        seen.insert(id);
    }
    return std::nullopt;
}

} // namespace TreeEditor

} // namespace ChecklistModel
