// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/StrongId.hpp"

#include <QtCore/QHash>
#include <QtCore/QSharedPointer>
#include <QtCore/QVector>

#include <algorithm>
#include <utility>

namespace Utils {

struct TreeNodeIdTag final {};
using TreeNodeId = StrongId<TreeNodeIdTag>;

// Flat node table mirroring a tree for item models. The root is invisible;
// a forest is stored as the root's children.
template <typename Payload>
class TreeIndex final {
public:
    struct Node final {
        TreeNodeId id{};
        TreeNodeId parent{};
        QVector<TreeNodeId> children{};
        Payload payload{};
    };

    TreeIndex() = default;
    TreeIndex(const TreeIndex&) = delete;
    TreeIndex& operator=(const TreeIndex&) = delete;
    TreeIndex(TreeIndex&&) = default;
    TreeIndex& operator=(TreeIndex&&) = default;

    bool hasRoot() const noexcept { return !m_root.isNull(); }
    TreeNodeId rootId() const noexcept { return m_root; }

    TreeNodeId createRoot(Payload payload = {})
    {
        clear();
        m_root = insertNode(TreeNodeId::null(), std::move(payload));
        return m_root;
    }

    void clear()
    {
        m_nodes.clear();
        m_root = TreeNodeId::null();
    }

    int size() const noexcept { return m_nodes.size(); }
    bool contains(TreeNodeId id) const noexcept { return m_nodes.contains(id); }

    Node* node(TreeNodeId id)
    {
        auto it = m_nodes.find(id);
        return it == m_nodes.end() ? nullptr : it.value().data();
    }

    const Node* node(TreeNodeId id) const
    {
        auto it = m_nodes.constFind(id);
        return it == m_nodes.cend() ? nullptr : it.value().data();
    }

    TreeNodeId parentOf(TreeNodeId id) const
    {
        const Node* n = node(id);
        return n ? n->parent : TreeNodeId::null();
    }

    QVector<TreeNodeId> children(TreeNodeId id) const
    {
        const Node* n = node(id);
        return n ? n->children : QVector<TreeNodeId>{};
    }

    int childCount(TreeNodeId id) const
    {
        const Node* n = node(id);
        return n ? n->children.size() : 0;
    }

    TreeNodeId childAt(TreeNodeId parent, int row) const
    {
        const Node* n = node(parent);
        if (!n || row < 0 || row >= n->children.size())
            return TreeNodeId::null();
        return n->children.at(row);
    }

    int childIndex(TreeNodeId parent, TreeNodeId child) const
    {
        const Node* n = node(parent);
        if (!n)
            return -1;
        const auto it = std::find(n->children.begin(), n->children.end(), child);
        if (it == n->children.end())
            return -1;
        return static_cast<int>(std::distance(n->children.begin(), it));
    }

    // Row of a node within its parent; -1 for the root or unknown ids.
    int rowOf(TreeNodeId id) const
    {
        const Node* n = node(id);
        if (!n || n->parent.isNull())
            return -1;
        return childIndex(n->parent, id);
    }

    TreeNodeId addChild(TreeNodeId parent, Payload payload = {})
    {
        // Hold the parent by value: inserting may rehash and invalidate iterators.
        const QSharedPointer<Node> parentNode = m_nodes.value(parent);
        if (!parentNode)
            return TreeNodeId::null();

        const TreeNodeId id = insertNode(parent, std::move(payload));
        parentNode->children.push_back(id);
        return id;
    }

private:
    TreeNodeId insertNode(TreeNodeId parent, Payload payload)
    {
        const TreeNodeId id = TreeNodeId::create();
        auto node = QSharedPointer<Node>::create();
        node->id = id;
        node->parent = parent;
        node->payload = std::move(payload);
        m_nodes.insert(id, node);
        return id;
    }

    QHash<TreeNodeId, QSharedPointer<Node>> m_nodes;
    TreeNodeId m_root{};
};

} // namespace Utils
