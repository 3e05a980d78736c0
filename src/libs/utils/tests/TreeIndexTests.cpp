// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "utils/TreeIndex.hpp"

using Utils::TreeIndex;
using Utils::TreeNodeId;

TEST(TreeIndexTests, InvisibleRootHoldsForest)
{
    TreeIndex<QString> tree;

    const TreeNodeId root = tree.createRoot();
    const TreeNodeId a = tree.addChild(root, "a");
    const TreeNodeId b = tree.addChild(root, "b");
    const TreeNodeId a1 = tree.addChild(a, "a1");

    EXPECT_EQ(tree.size(), 4);
    EXPECT_EQ(tree.childCount(root), 2);
    EXPECT_EQ(tree.childAt(root, 1), b);
    EXPECT_EQ(tree.childAt(a, 0), a1);
    EXPECT_TRUE(tree.childAt(a, 1).isNull());

    EXPECT_EQ(tree.parentOf(a1), a);
    EXPECT_EQ(tree.parentOf(a), root);
    EXPECT_TRUE(tree.parentOf(root).isNull());

    EXPECT_EQ(tree.rowOf(b), 1);
    EXPECT_EQ(tree.rowOf(a1), 0);
    EXPECT_EQ(tree.rowOf(root), -1);
    EXPECT_EQ(tree.node(a1)->payload, QStringLiteral("a1"));
}

TEST(TreeIndexTests, AddChildToUnknownParentFails)
{
    TreeIndex<int> tree;
    tree.createRoot(0);

    EXPECT_TRUE(tree.addChild(TreeNodeId::create(), 1).isNull());
    EXPECT_EQ(tree.size(), 1);
}

TEST(TreeIndexTests, CreateRootResetsTree)
{
    TreeIndex<int> tree;
    const TreeNodeId first = tree.createRoot(0);
    const TreeNodeId child = tree.addChild(first, 1);

    const TreeNodeId second = tree.createRoot(0);
    EXPECT_NE(first, second);
    EXPECT_FALSE(tree.contains(child));
    EXPECT_EQ(tree.size(), 1);

    tree.clear();
    EXPECT_FALSE(tree.hasRoot());
    EXPECT_EQ(tree.size(), 0);
}

TEST(TreeIndexTests, WideAndDeepTreesKeepParentLinksAcrossGrowth)
{
    TreeIndex<int> tree;
    const TreeNodeId root = tree.createRoot(-1);

    QVector<TreeNodeId> flat;
    for (int i = 0; i < 500; ++i)
        flat.push_back(tree.addChild(root, i));

    TreeNodeId chainParent = flat.front();
    QVector<TreeNodeId> chain;
    for (int i = 0; i < 300; ++i) {
        chainParent = tree.addChild(chainParent, 1000 + i);
        chain.push_back(chainParent);
    }

    ASSERT_EQ(tree.size(), 801);
    ASSERT_EQ(tree.childCount(root), 500);
    for (int i = 0; i < flat.size(); ++i) {
        EXPECT_EQ(tree.parentOf(flat.at(i)), root);
        EXPECT_EQ(tree.childAt(root, i), flat.at(i));
        EXPECT_EQ(tree.node(flat.at(i))->payload, i);
    }

    EXPECT_EQ(tree.childCount(flat.front()), 1);
    EXPECT_EQ(tree.parentOf(chain.front()), flat.front());
    for (int i = 1; i < chain.size(); ++i) {
        EXPECT_EQ(tree.parentOf(chain.at(i)), chain.at(i - 1));
        EXPECT_EQ(tree.childCount(chain.at(i - 1)), 1);
    }
    EXPECT_EQ(tree.childCount(chain.back()), 0);
}
