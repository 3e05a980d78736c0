// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "checklistmodel/library/ChecklistLibrary.hpp"
#include "checklistmodel/persistence/ChecklistXml.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QTemporaryDir>

using namespace ChecklistModel;

namespace {

void writeFile(const QString& path, const QByteArray& bytes)
{
    QFile f(path);
    ASSERT_TRUE(f.open(QIODevice::WriteOnly));
    f.write(bytes);
}

} // namespace

TEST(ChecklistLibraryTests, CreateWritesEmptyChecklistWithSanitizedName)
{
    QTemporaryDir temp;
    ASSERT_TRUE(temp.isValid());
    const ChecklistLibrary library(QDir(temp.path()).filePath(QStringLiteral("lists")));

    QString created;
    ASSERT_TRUE(library.create(QStringLiteral("Trip: Rome/Paris"), &created).ok);
    EXPECT_EQ(QFileInfo(created).fileName(), QStringLiteral("Trip RomeParis.xml"));

    const ChecklistLoadResult loaded = ChecklistXml::load(created);
    ASSERT_TRUE(loaded.ok());
    EXPECT_EQ(loaded.checklist.name, QStringLiteral("Trip: Rome/Paris"));
    EXPECT_TRUE(loaded.checklist.items.empty());
    EXPECT_EQ(loaded.checklist.catalog, StateCatalog::defaultCatalog());

    QString second;
    ASSERT_TRUE(library.create(QStringLiteral("Trip: Rome/Paris"), &second).ok);
    EXPECT_EQ(QFileInfo(second).fileName(), QStringLiteral("Trip RomeParis (1).xml"));

    EXPECT_FALSE(library.create(QStringLiteral("   ")).ok);
}

TEST(ChecklistLibraryTests, ListUsesDocumentNamesSortedByFile)
{
    QTemporaryDir temp;
    ASSERT_TRUE(temp.isValid());
    const ChecklistLibrary library(temp.path());

    ASSERT_TRUE(library.create(QStringLiteral("beta")).ok);
    ASSERT_TRUE(library.create(QStringLiteral("Alpha")).ok);
    writeFile(QDir(temp.path()).filePath(QStringLiteral("corrupt.xml")), QByteArrayLiteral("<<<"));
    writeFile(QDir(temp.path()).filePath(QStringLiteral("readme.txt")), QByteArrayLiteral("ignored"));

    const QVector<ChecklistEntry> entries = library.list();
    ASSERT_EQ(entries.size(), 3);
    EXPECT_EQ(entries.at(0).name, QStringLiteral("Alpha"));
    EXPECT_EQ(entries.at(1).name, QStringLiteral("beta"));
    EXPECT_EQ(entries.at(2).name, QStringLiteral("corrupt"));
}

TEST(ChecklistLibraryTests, RenameKeepsFileAndItems)
{
    QTemporaryDir temp;
    ASSERT_TRUE(temp.isValid());
    const ChecklistLibrary library(temp.path());

    QString path;
    ASSERT_TRUE(library.create(QStringLiteral("Chores"), &path).ok);
    Checklist withItems = ChecklistXml::load(path).checklist;
    withItems.items.push_back(ChecklistItem::create(QStringLiteral("Dishes"), 0));
    ASSERT_TRUE(ChecklistXml::save(withItems, path).ok);

    ASSERT_TRUE(library.rename(path, QStringLiteral("House chores")).ok);
    const ChecklistLoadResult loaded = ChecklistXml::load(path);
    ASSERT_TRUE(loaded.ok());
    EXPECT_EQ(loaded.checklist.name, QStringLiteral("House chores"));
    EXPECT_EQ(loaded.checklist.items, withItems.items);

    EXPECT_FALSE(library.rename(path, QString()).ok);
    EXPECT_FALSE(library.rename(QDir(temp.path()).filePath(QStringLiteral("missing.xml")), QStringLiteral("X")).ok);
}

TEST(ChecklistLibraryTests, DuplicateAndRemove)
{
    QTemporaryDir temp;
    ASSERT_TRUE(temp.isValid());
    const ChecklistLibrary library(temp.path());

    QString path;
    ASSERT_TRUE(library.create(QStringLiteral("Packing"), &path).ok);

    QString copy;
    ASSERT_TRUE(library.duplicate(path, &copy).ok);
    EXPECT_EQ(QFileInfo(copy).fileName(), QStringLiteral("Packing copy.xml"));
    EXPECT_EQ(ChecklistXml::load(copy).checklist.name, QStringLiteral("Packing copy"));

    ASSERT_TRUE(library.remove(copy).ok);
    EXPECT_FALSE(QFileInfo::exists(copy));
    EXPECT_TRUE(library.remove(copy).ok);
    EXPECT_EQ(library.list().size(), 1);

    QTemporaryDir elsewhere;
    ASSERT_TRUE(elsewhere.isValid());
    const QString outside = QDir(elsewhere.path()).filePath(QStringLiteral("keep.xml"));
    writeFile(outside, QByteArrayLiteral("<checklist/>"));
    EXPECT_FALSE(library.remove(outside).ok);
    EXPECT_TRUE(QFileInfo::exists(outside));
}

TEST(ChecklistLibraryTests, SeedDefaultsOnlyOnFirstLaunch)
{
    QTemporaryDir temp;
    ASSERT_TRUE(temp.isValid());
    const QDir root(temp.path());

    ASSERT_TRUE(root.mkpath(QStringLiteral("defaults")));
    writeFile(root.filePath(QStringLiteral("defaults/Welcome.xml")), ChecklistXml::serialize(Checklist::createEmpty(QStringLiteral("Welcome"))));
    writeFile(root.filePath(QStringLiteral("defaults/config.json")), QByteArrayLiteral("{\"max_item_width\": 900}"));
    writeFile(root.filePath(QStringLiteral("defaults/notes.txt")), QByteArrayLiteral("skip"));

    const ChecklistLibrary library(root.filePath(QStringLiteral("data")));
    bool seeded = false;
    ASSERT_TRUE(library.seedDefaults(root.filePath(QStringLiteral("defaults")), &seeded).ok);
    EXPECT_TRUE(seeded);
    EXPECT_TRUE(QFileInfo::exists(root.filePath(QStringLiteral("data/Welcome.xml"))));
    EXPECT_TRUE(QFileInfo::exists(root.filePath(QStringLiteral("data/config.json"))));
    EXPECT_FALSE(QFileInfo::exists(root.filePath(QStringLiteral("data/notes.txt"))));

    ASSERT_TRUE(QFile::remove(root.filePath(QStringLiteral("data/Welcome.xml"))));
    ASSERT_TRUE(library.seedDefaults(root.filePath(QStringLiteral("defaults")), &seeded).ok);
    EXPECT_FALSE(seeded);
    EXPECT_FALSE(QFileInfo::exists(root.filePath(QStringLiteral("data/Welcome.xml"))));
}

TEST(ChecklistLibraryTests, MalformedFilesAreNeitherRenamedNorDuplicated)
{
    QTemporaryDir temp;
    ASSERT_TRUE(temp.isValid());
    const ChecklistLibrary library(temp.path());

    const QString path = QDir(temp.path()).filePath(QStringLiteral("Broken.xml"));
    const QByteArray bytes("<checklist name=\"Broken\"><items><item id=\"a\" text=\"half");
    writeFile(path, bytes);

    const Utils::Result renamed = library.rename(path, QStringLiteral("Fixed"));
    EXPECT_FALSE(renamed.ok);
    EXPECT_FALSE(renamed.errors.isEmpty());

    QString copy;
    EXPECT_FALSE(library.duplicate(path, &copy).ok);
    EXPECT_TRUE(copy.isEmpty());
    EXPECT_FALSE(QFileInfo::exists(QDir(temp.path()).filePath(QStringLiteral("Broken copy.xml"))));

    QFile f(path);
    ASSERT_TRUE(f.open(QIODevice::ReadOnly));
    EXPECT_EQ(f.readAll(), bytes);
    EXPECT_EQ(library.list().size(), 1);
}

TEST(ChecklistLibraryTests, FailedSeedCopyIsNotReportedAsSeeded)
{
    QTemporaryDir temp;
    ASSERT_TRUE(temp.isValid());
    const QDir root(temp.path());

    ASSERT_TRUE(root.mkpath(QStringLiteral("defaults")));
    writeFile(root.filePath(QStringLiteral("defaults/Welcome.xml")), ChecklistXml::serialize(Checklist::createEmpty(QStringLiteral("Welcome"))));
    // A directory in place of the config file cannot be copied.
    ASSERT_TRUE(root.mkpath(QStringLiteral("defaults/config.json")));

    const ChecklistLibrary library(root.filePath(QStringLiteral("data")));
    bool seeded = true;
    const Utils::Result r = library.seedDefaults(root.filePath(QStringLiteral("defaults")), &seeded);
    EXPECT_FALSE(r.ok);
    EXPECT_FALSE(seeded);
    EXPECT_FALSE(QFileInfo::exists(root.filePath(QStringLiteral("data/config.json"))));
}
