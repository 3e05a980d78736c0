// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "checklisteditor/ChecklistTreeModel.hpp"
#include "checklisteditor/ChecklistView.hpp"

#include <checklistmodel/session/ChecklistSession.hpp>

#include <QtTest/QTest>
#include <QtWidgets/QApplication>

#include <memory>

using ChecklistEditor::ChecklistTreeModel;
using ChecklistEditor::ChecklistView;
using namespace ChecklistModel;

namespace {

QApplication* ensureApp()
{
    static QApplication* app = []() {
        if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM"))
            qputenv("QT_QPA_PLATFORM", QByteArrayLiteral("offscreen"));

        static int argc = 1;
        static char arg0[] = "checklisteditor-view-tests";
        static char* argv[] = { arg0, nullptr };
        return new QApplication(argc, argv);
    }();
    return app;
}

ChecklistItem makeItem(const QString& id, const QString& text)
{
    ChecklistItem item;
    item.id = ItemId(id);
    item.text = text;
    return item;
}

class ChecklistViewTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ensureApp();
        Checklist checklist = Checklist::createEmpty(QStringLiteral("Week"));
        ChecklistItem parent = makeItem(QStringLiteral("p"), QStringLiteral("Errands"));
        parent.children.push_back(makeItem(QStringLiteral("c"), QStringLiteral("Post office")));
        parent.collapsed = true;
        checklist.items.push_back(parent);
        checklist.items.push_back(makeItem(QStringLiteral("q"), QStringLiteral("Gym")));
        m_session.setChecklist(checklist);

        m_view = std::make_unique<ChecklistView>(&m_session);
        m_view->resize(400, 300);
    }

    QModelIndex indexFor(const QString& id) const
    {
        return m_view->checklistModel()->indexForId(ItemId(id));
    }

    ChecklistSession m_session;
    std::unique_ptr<ChecklistView> m_view;
};

} // namespace

TEST_F(ChecklistViewTest, ExpansionMirrorsCollapsedFlag)
{
    const QModelIndex parent = indexFor(QStringLiteral("p"));
    ASSERT_TRUE(parent.isValid());
    EXPECT_FALSE(m_view->isExpanded(parent));

    m_view->expand(parent);
    EXPECT_FALSE(m_session.item(ItemId(QStringLiteral("p")))->collapsed);

    m_view->collapse(indexFor(QStringLiteral("p")));
    EXPECT_TRUE(m_session.item(ItemId(QStringLiteral("p")))->collapsed);
}

TEST_F(ChecklistViewTest, TabIndentsAndBacktabOutdents)
{
    m_view->setCurrentIndex(indexFor(QStringLiteral("q")));

    QTest::keyClick(m_view.get(), Qt::Key_Tab);
    EXPECT_EQ(TreeEditor::parentOf(m_session.checklist().items, ItemId(QStringLiteral("q"))),
              ItemId(QStringLiteral("p")));
    EXPECT_EQ(m_view->currentItemId(), ItemId(QStringLiteral("q")));

    QTest::keyClick(m_view.get(), Qt::Key_Backtab, Qt::ShiftModifier);
    EXPECT_TRUE(TreeEditor::parentOf(m_session.checklist().items, ItemId(QStringLiteral("q"))).isNull());
    EXPECT_EQ(m_session.checklist().items.size(), 2u);
}

TEST_F(ChecklistViewTest, DeleteRemovesCurrentSubtree)
{
    m_view->setCurrentIndex(indexFor(QStringLiteral("p")));
    QTest::keyClick(m_view.get(), Qt::Key_Delete);

    EXPECT_EQ(m_session.item(ItemId(QStringLiteral("p"))), nullptr);
    EXPECT_EQ(m_session.item(ItemId(QStringLiteral("c"))), nullptr);
    EXPECT_EQ(TreeEditor::count(m_session.checklist().items), 1);
}

TEST_F(ChecklistViewTest, SpaceClicksTheIndicator)
{
    m_view->setCurrentIndex(indexFor(QStringLiteral("q")));
    QTest::keyClick(m_view.get(), Qt::Key_Space);
    EXPECT_EQ(m_session.item(ItemId(QStringLiteral("q")))->statusNumber, 1);
}

TEST_F(ChecklistViewTest, NewItemReceivesFocus)
{
    m_view->setCurrentIndex(indexFor(QStringLiteral("q")));
    QTest::keyClick(m_view.get(), Qt::Key_Return);

    ASSERT_EQ(m_session.checklist().items.size(), 3u);
    const ItemId added = m_session.checklist().items.back().id;
    EXPECT_EQ(m_view->currentItemId(), added);
    EXPECT_EQ(m_view->state(), QAbstractItemView::EditingState);
}

TEST_F(ChecklistViewTest, MaxItemWidthCapsView)
{
    m_view->setMaxItemWidth(640);
    EXPECT_EQ(m_view->maximumWidth(), 640);
}
