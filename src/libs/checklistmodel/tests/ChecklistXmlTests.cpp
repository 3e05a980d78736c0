// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "checklistmodel/TreeEditor.hpp"
#include "checklistmodel/persistence/ChecklistXml.hpp"
#include "checklistmodel/persistence/LegacyStatus.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QTemporaryDir>

using namespace ChecklistModel;

namespace {

ChecklistItem item(const char* id, const char* text, int status, Forest children = {})
{
    ChecklistItem i;
    i.id = ItemId(QString::fromLatin1(id));
    i.text = QString::fromUtf8(text);
    i.statusNumber = status;
    i.children = std::move(children);
    return i;
}

Checklist groceries()
{
    Checklist c = Checklist::createEmpty(QStringLiteral("Groceries"));
    c.items = {
        item("3fa2b1c9", "Milk", 0, {item("77c0d2e1", "Oat", 1), item("77c0d2e2", "Soy & \"Rice\" <lite>", -1)}),
        item("00000001", "Bread", 4),
        item("00000002", "Grüner Tee", 2),
    };
    c.items[0].collapsed = true;
    return c;
}

void writeFile(const QString& path, const QByteArray& bytes)
{
    QFile f(path);
    ASSERT_TRUE(f.open(QIODevice::WriteOnly));
    f.write(bytes);
}

} // namespace

TEST(ChecklistXmlTests, SerializeThenParseReproducesChecklist)
{
    Checklist original = groceries();
    StateDefinition custom;
    custom.number = 9;
    custom.label = QStringLiteral("Later");
    custom.color = QStringLiteral("#FFB300");
    custom.symbol = QStringLiteral("star");
    custom.inCycle = false;
    QVector<StateDefinition> states = original.catalog.states();
    states.push_back(custom);
    original.catalog = StateCatalog(states, 2);

    const ChecklistLoadResult loaded = ChecklistXml::parse(ChecklistXml::serialize(original));
    ASSERT_TRUE(loaded.ok()) << loaded.error.toStdString();
    EXPECT_FALSE(loaded.migrated);
    EXPECT_EQ(loaded.reassignedIds, 0);
    EXPECT_EQ(loaded.checklist, original);
}

TEST(ChecklistXmlTests, SaveThenLoadFromDisk)
{
    QTemporaryDir temp;
    ASSERT_TRUE(temp.isValid());
    const QString path = QDir(temp.path()).filePath(QStringLiteral("nested/Groceries.xml"));

    const Checklist original = groceries();
    ASSERT_TRUE(ChecklistXml::save(original, path).ok);

    const ChecklistLoadResult loaded = ChecklistXml::load(path);
    ASSERT_TRUE(loaded.ok());
    EXPECT_EQ(loaded.checklist, original);
}

TEST(ChecklistXmlTests, WritesNumericFormat)
{
    const QString xml = QString::fromUtf8(ChecklistXml::serialize(groceries()));

    EXPECT_TRUE(xml.contains(QStringLiteral("<checklist name=\"Groceries\" default_state=\"0\">")));
    EXPECT_TRUE(xml.contains(QStringLiteral("state_number=\"1\"")));
    EXPECT_TRUE(xml.contains(QStringLiteral("collapsed=\"true\"")));
    EXPECT_TRUE(xml.contains(QStringLiteral("in_cycle=\"false\"")));
    EXPECT_FALSE(xml.contains(QStringLiteral(" state=\"")));
    EXPECT_EQ(xml.count(QStringLiteral("in_cycle=")), 1);
}

TEST(ChecklistXmlTests, OptionalAttributesDefault)
{
    const QByteArray doc = R"(<?xml version="1.0" encoding="UTF-8"?>
<checklist name="Minimal">
  <states>
    <state number="0" label="Open" color="#111111" symbol="empty"/>
    <state number="1" label="Closed"/>
  </states>
  <items>
    <item id="a" text="Parent" state_number="1">
      <item id="b" text="Child" state_number="0"/>
    </item>
    <item id="c" text="Leaf" state_number="0" collapsed="true"/>
  </items>
</checklist>
)";

    const ChecklistLoadResult loaded = ChecklistXml::parse(doc);
    ASSERT_TRUE(loaded.ok());
    const Checklist& c = loaded.checklist;
    EXPECT_EQ(c.catalog.defaultStatusNumber(), 0);
    ASSERT_EQ(c.catalog.size(), 2);
    EXPECT_TRUE(c.catalog.byNumber(0)->inCycle);
    EXPECT_EQ(c.catalog.byNumber(1)->color, QStringLiteral("#888888"));
    EXPECT_EQ(c.catalog.byNumber(1)->symbol, QStringLiteral("square"));

    ASSERT_EQ(c.items.size(), 2u);
    EXPECT_FALSE(c.items[0].collapsed);
    EXPECT_FALSE(c.items[1].collapsed);
    EXPECT_EQ(c.items[0].children.at(0).text, QStringLiteral("Child"));
}

TEST(ChecklistXmlTests, LegacyItemStatesAreUpgraded)
{
    const QByteArray doc = R"(<?xml version="1.0" encoding="UTF-8"?>
<checklist name="Old">
  <items>
    <item id="w1" text="Call back" state="waiting"/>
    <item id="d1" text="Paid" state="done">
      <item id="c1" text="Receipt" state="cancelled"/>
      <item id="t1" text="File it" state="todo"/>
    </item>
  </items>
</checklist>
)";

    const ChecklistLoadResult loaded = ChecklistXml::parse(doc);
    ASSERT_TRUE(loaded.ok());
    EXPECT_TRUE(loaded.migrated);

    const Checklist& c = loaded.checklist;
    EXPECT_EQ(c.catalog, StateCatalog::defaultCatalog());

    const ChecklistItem* waiting = TreeEditor::find(c.items, ItemId(QStringLiteral("w1")));
    ASSERT_NE(waiting, nullptr);
    EXPECT_EQ(waiting->statusNumber, 2);
    EXPECT_EQ(c.catalog.resolve(waiting->statusNumber).symbol, QStringLiteral("clock"));

    EXPECT_EQ(TreeEditor::find(c.items, ItemId(QStringLiteral("d1")))->statusNumber, 1);
    EXPECT_EQ(TreeEditor::find(c.items, ItemId(QStringLiteral("c1")))->statusNumber, 4);
    EXPECT_EQ(TreeEditor::find(c.items, ItemId(QStringLiteral("t1")))->statusNumber, 0);

    const QString rewritten = QString::fromUtf8(ChecklistXml::serialize(c));
    EXPECT_FALSE(rewritten.contains(QStringLiteral("state=\"waiting\"")));
    EXPECT_TRUE(rewritten.contains(QStringLiteral("state_number=\"2\"")));
}

TEST(ChecklistXmlTests, LegacyStateDefinitionsAreUpgradedAndUnknownDropped)
{
    const QByteArray doc = R"(<checklist name="Old">
  <states>
    <state id="todo" label="Open" color="#F44336"/>
    <state id="done" label="Finished" color="#4CAF50"/>
    <state id="urgent" label="Urgent" color="#FF0000"/>
  </states>
  <items>
    <item id="x" text="Thing" state="urgent"/>
  </items>
</checklist>)";

    const ChecklistLoadResult loaded = ChecklistXml::parse(doc);
    ASSERT_TRUE(loaded.ok());

    const StateCatalog& catalog = loaded.checklist.catalog;
    ASSERT_EQ(catalog.size(), 3);
    ASSERT_TRUE(catalog.contains(kBulletStatus));
    EXPECT_EQ(catalog.states().front().number, kBulletStatus);
    EXPECT_FALSE(catalog.byNumber(kBulletStatus)->inCycle);
    EXPECT_EQ(catalog.byNumber(1)->label, QStringLiteral("Finished"));
    EXPECT_EQ(catalog.byNumber(1)->symbol, QStringLiteral("check"));
    EXPECT_EQ(catalog.byNumber(0)->symbol, QStringLiteral("empty"));
    EXPECT_EQ(loaded.checklist.items.at(0).statusNumber, 0);
}

TEST(ChecklistXmlTests, StatesUpgradingToNothingFallBackToDefaultCatalog)
{
    const QByteArray doc = R"(<checklist name="Odd" default_state="3">
  <states><state id="someday" label="Someday"/></states>
  <items/>
</checklist>)";

    const ChecklistLoadResult loaded = ChecklistXml::parse(doc);
    ASSERT_TRUE(loaded.ok());
    EXPECT_EQ(loaded.checklist.catalog.size(), 6);
    EXPECT_EQ(loaded.checklist.catalog.defaultStatusNumber(), 3);
}

TEST(ChecklistXmlTests, LegacyMappingIsFixed)
{
    EXPECT_EQ(LegacyStatus::lookup(QStringLiteral("todo"))->number, 0);
    EXPECT_EQ(LegacyStatus::lookup(QStringLiteral("done"))->number, 1);
    EXPECT_EQ(LegacyStatus::lookup(QStringLiteral("waiting"))->number, 2);
    EXPECT_EQ(LegacyStatus::lookup(QStringLiteral("cancelled"))->number, 4);
    EXPECT_EQ(QString(LegacyStatus::lookup(QStringLiteral("cancelled"))->symbol), QStringLiteral("x"));
    EXPECT_FALSE(LegacyStatus::lookup(QStringLiteral("on-hold")).has_value());
}

TEST(ChecklistXmlTests, MissingAndDuplicateIdsAreReassigned)
{
    const QByteArray doc = R"(<checklist name="Ids">
  <items>
    <item id="same" text="First" state_number="0"/>
    <item text="No id" state_number="0"/>
    <item id="same" text="Second" state_number="0">
      <item id="same" text="Third" state_number="0"/>
    </item>
  </items>
</checklist>)";

    const ChecklistLoadResult loaded = ChecklistXml::parse(doc);
    ASSERT_TRUE(loaded.ok());
    EXPECT_EQ(loaded.reassignedIds, 3);

    const Forest& items = loaded.checklist.items;
    EXPECT_EQ(items.at(0).id, ItemId(QStringLiteral("same")));
    EXPECT_FALSE(items.at(1).id.isNull());
    EXPECT_NE(items.at(2).id, ItemId(QStringLiteral("same")));
    EXPECT_FALSE(TreeEditor::findDuplicateId(items).has_value());
    EXPECT_EQ(TreeEditor::count(items), 4);
}

TEST(ChecklistXmlTests, MalformedInputYieldsEmptyChecklistNamedAfterFallback)
{
    ChecklistLoadResult loaded = ChecklistXml::parse(QByteArrayLiteral("<checklist><items><item"),
                                                     QStringLiteral("Broken"));
    EXPECT_EQ(loaded.status, ChecklistLoadResult::Status::Malformed);
    EXPECT_FALSE(loaded.error.isEmpty());
    EXPECT_EQ(loaded.checklist.name, QStringLiteral("Broken"));
    EXPECT_TRUE(loaded.checklist.items.empty());
    EXPECT_EQ(loaded.checklist.catalog, StateCatalog::defaultCatalog());

    loaded = ChecklistXml::parse(QByteArrayLiteral("<notes/>"), QStringLiteral("Wrong"));
    EXPECT_EQ(loaded.status, ChecklistLoadResult::Status::Malformed);

    loaded = ChecklistXml::parse(QByteArray());
    EXPECT_EQ(loaded.status, ChecklistLoadResult::Status::Malformed);
    EXPECT_EQ(loaded.checklist.name, QStringLiteral("Untitled"));
}

TEST(ChecklistXmlTests, LoadReportsMalformedFileWithStemName)
{
    QTemporaryDir temp;
    ASSERT_TRUE(temp.isValid());
    const QString path = QDir(temp.path()).filePath(QStringLiteral("Chores.xml"));
    writeFile(path, QByteArrayLiteral("this is not xml"));

    const ChecklistLoadResult loaded = ChecklistXml::load(path);
    EXPECT_EQ(loaded.status, ChecklistLoadResult::Status::Malformed);
    EXPECT_EQ(loaded.checklist.name, QStringLiteral("Chores"));
}

TEST(ChecklistXmlTests, LoadOfMissingFileIsIoFailure)
{
    QTemporaryDir temp;
    ASSERT_TRUE(temp.isValid());

    const ChecklistLoadResult loaded = ChecklistXml::load(QDir(temp.path()).filePath(QStringLiteral("Gone.xml")));
    EXPECT_EQ(loaded.status, ChecklistLoadResult::Status::IoFailure);
    EXPECT_EQ(loaded.checklist.name, QStringLiteral("Gone"));
}

TEST(ChecklistXmlTests, SaveToUnwritableLocationFails)
{
    QTemporaryDir temp;
    ASSERT_TRUE(temp.isValid());
    const QString blocker = QDir(temp.path()).filePath(QStringLiteral("blocker"));
    writeFile(blocker, QByteArrayLiteral("file, not a directory"));

    const Utils::Result r = ChecklistXml::save(groceries(), QDir(blocker).filePath(QStringLiteral("x.xml")));
    EXPECT_FALSE(r.ok);
    EXPECT_FALSE(r.errors.isEmpty());
}
