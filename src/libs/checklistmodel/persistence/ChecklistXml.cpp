// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "checklistmodel/persistence/ChecklistXml.hpp"

#include "checklistmodel/persistence/LegacyStatus.hpp"

#include "utils/PathUtils.hpp"
#include "utils/filesystem/FileSystemUtils.hpp"

#include <QtCore/QFile>
#include <QtCore/QSet>
#include <QtCore/QXmlStreamReader>
#include <QtCore/QXmlStreamWriter>

#include <algorithm>
#include <optional>

namespace ChecklistModel::ChecklistXml {

namespace {

const QLatin1String kChecklistTag("checklist");
const QLatin1String kStatesTag("states");
const QLatin1String kStateTag("state");
const QLatin1String kItemsTag("items");
const QLatin1String kItemTag("item");

const QLatin1String kNameAttr("name");
const QLatin1String kDefaultStateAttr("default_state");
const QLatin1String kNumberAttr("number");
const QLatin1String kLabelAttr("label");
const QLatin1String kColorAttr("color");
const QLatin1String kSymbolAttr("symbol");
const QLatin1String kInCycleAttr("in_cycle");
const QLatin1String kLegacyIdAttr("id");
const QLatin1String kIdAttr("id");
const QLatin1String kTextAttr("text");
const QLatin1String kStateNumberAttr("state_number");
const QLatin1String kLegacyStateAttr("state");
const QLatin1String kCollapsedAttr("collapsed");

const QString kFallbackColor = QStringLiteral("#888888");

struct ParseContext final {
    explicit ParseContext(const QByteArray& bytes) : xml(bytes) {}

    QXmlStreamReader xml;
    QSet<ItemId> seenIds;
    bool migrated = false;
    int reassignedIds = 0;
};

std::optional<int> parseInt(QStringView text)
{
    bool ok = false;
    const int value = text.trimmed().toInt(&ok);
    if (!ok)
        return std::nullopt;
    return value;
}

bool parseBool(QStringView text, bool fallback)
{
    if (text == QLatin1String("true"))
        return true;
    if (text == QLatin1String("false"))
        return false;
    return fallback;
}

bool containsNumber(const QVector<StateDefinition>& states, int number)
{
    for (const auto& s : states) {
        if (s.number == number)
            return true;
    }
    return false;
}

void addState(QVector<StateDefinition>& states, StateDefinition def)
{
    if (containsNumber(states, def.number)) {
        qCWarning(checklistpersistlog).noquote()
            << QStringLiteral("Ignoring duplicate state number %1.").arg(def.number);
        return;
    }
    states.push_back(std::move(def));
}

void readStates(ParseContext& ctx, QVector<StateDefinition>& states)
{
    while (ctx.xml.readNextStartElement()) {
        if (ctx.xml.name() != kStateTag) {
            ctx.xml.skipCurrentElement();
            continue;
        }

        const QXmlStreamAttributes attrs = ctx.xml.attributes();
        const QString label = attrs.value(kLabelAttr).toString();
        const QString color = attrs.hasAttribute(kColorAttr) ? attrs.value(kColorAttr).toString() : kFallbackColor;

        if (attrs.hasAttribute(kNumberAttr)) {
            const auto number = parseInt(attrs.value(kNumberAttr));
            if (!number) {
                qCWarning(checklistpersistlog).noquote()
                    << QStringLiteral("Skipping state with non-numeric number '%1'.")
                           .arg(attrs.value(kNumberAttr).toString());
            } else {
                StateDefinition def;
                def.number = *number;
                def.label = label;
                def.color = color;
                def.symbol = attrs.hasAttribute(kSymbolAttr) ? attrs.value(kSymbolAttr).toString()
                                                              : QString(Symbols::kSquare);
                def.inCycle = parseBool(attrs.value(kInCycleAttr), true);
                addState(states, std::move(def));
            }
        } else if (attrs.hasAttribute(kLegacyIdAttr)) {
            const QString tag = attrs.value(kLegacyIdAttr).toString();
            if (auto def = LegacyStatus::upgrade(tag, label, color)) {
                ctx.migrated = true;
                addState(states, std::move(*def));
            } else {
                qCWarning(checklistpersistlog).noquote()
                    << QStringLiteral("Dropping legacy state '%1': no numeric equivalent.").arg(tag);
            }
        } else {
            qCWarning(checklistpersistlog) << "Skipping state without number or id.";
        }

        ctx.xml.skipCurrentElement();
    }
}

ItemId freshId(const ParseContext& ctx)
{
    ItemId id = ItemId::create();
    while (ctx.seenIds.contains(id))
        id = ItemId::create();
    return id;
}

int readStatus(ParseContext& ctx, const QXmlStreamAttributes& attrs, const ItemId& id)
{
    if (attrs.hasAttribute(kStateNumberAttr)) {
        if (const auto number = parseInt(attrs.value(kStateNumberAttr)))
            return *number;
        qCWarning(checklistpersistlog).noquote()
            << QStringLiteral("Item '%1' has non-numeric state_number; using 0.").arg(id.toString());
        return 0;
    }

    if (attrs.hasAttribute(kLegacyStateAttr)) {
        const QString tag = attrs.value(kLegacyStateAttr).toString();
        ctx.migrated = true;
        if (const auto mapping = LegacyStatus::lookup(tag))
            return mapping->number;
        qCWarning(checklistpersistlog).noquote()
            << QStringLiteral("Item '%1' has unknown legacy state '%2'; using 0.").arg(id.toString(), tag);
        return 0;
    }

    return 0;
}

void readItems(ParseContext& ctx, Forest& out)
{
    while (ctx.xml.readNextStartElement()) {
        if (ctx.xml.name() != kItemTag) {
            ctx.xml.skipCurrentElement();
            continue;
        }

        const QXmlStreamAttributes attrs = ctx.xml.attributes();

        ChecklistItem item;
        item.id = ItemId(attrs.value(kIdAttr).toString().trimmed());
        if (item.id.isNull() || ctx.seenIds.contains(item.id)) {
            const ItemId fresh = freshId(ctx);
            if (item.id.isNull()) {
                qCDebug(checklistpersistlog).noquote()
                    << QStringLiteral("Assigned id '%1' to item without id.").arg(fresh.toString());
            } else {
                qCWarning(checklistpersistlog).noquote()
                    << QStringLiteral("Duplicate item id '%1' reassigned to '%2'.")
                           .arg(item.id.toString(), fresh.toString());
            }
            item.id = fresh;
            ++ctx.reassignedIds;
        }
        ctx.seenIds.insert(item.id);

        item.text = attrs.value(kTextAttr).toString();
        item.statusNumber = readStatus(ctx, attrs, item.id);
        const bool collapsed = parseBool(attrs.value(kCollapsedAttr), false);

        readItems(ctx, item.children);
        item.collapsed = collapsed && item.hasChildren();
        out.push_back(std::move(item));
    }
}

void writeItems(QXmlStreamWriter& w, const Forest& items)
{
    for (const auto& item : items) {
        if (item.hasChildren())
            w.writeStartElement(kItemTag);
        else
            w.writeEmptyElement(kItemTag);

        w.writeAttribute(kIdAttr, item.id.toString());
        w.writeAttribute(kTextAttr, item.text);
        w.writeAttribute(kStateNumberAttr, QString::number(item.statusNumber));
        if (!item.hasChildren())
            continue;

        if (item.collapsed)
            w.writeAttribute(kCollapsedAttr, QStringLiteral("true"));
        writeItems(w, item.children);
        w.writeEndElement();
    }
}

ChecklistLoadResult malformed(const QString& fallbackName, const QString& why)
{
    ChecklistLoadResult result;
    result.status = ChecklistLoadResult::Status::Malformed;
    result.checklist = Checklist::createEmpty(fallbackName);
    result.error = why;
    return result;
}

} // namespace

ChecklistLoadResult parse(const QByteArray& bytes, const QString& fallbackName)
{
    ParseContext ctx(bytes);

    if (!ctx.xml.readNextStartElement()) {
        return malformed(fallbackName,
                         ctx.xml.hasError() ? ctx.xml.errorString() : QStringLiteral("Document is empty."));
    }
    if (ctx.xml.name() != kChecklistTag) {
        return malformed(fallbackName,
                         QStringLiteral("Unexpected root element <%1>.").arg(ctx.xml.name().toString()));
    }

    Checklist checklist;
    const QXmlStreamAttributes rootAttrs = ctx.xml.attributes();
    if (rootAttrs.hasAttribute(kNameAttr))
        checklist.name = rootAttrs.value(kNameAttr).toString();
    const int defaultStatus = parseInt(rootAttrs.value(kDefaultStateAttr)).value_or(0);

    QVector<StateDefinition> states;
    bool sawStates = false;
    while (ctx.xml.readNextStartElement()) {
        if (ctx.xml.name() == kStatesTag) {
            sawStates = true;
            readStates(ctx, states);
        } else if (ctx.xml.name() == kItemsTag) {
            readItems(ctx, checklist.items);
        } else {
            ctx.xml.skipCurrentElement();
        }
    }

    if (ctx.xml.hasError()) {
        return malformed(fallbackName,
                         QStringLiteral("%1 (line %2, column %3)")
                             .arg(ctx.xml.errorString())
                             .arg(ctx.xml.lineNumber())
                             .arg(ctx.xml.columnNumber()));
    }

    if (states.isEmpty()) {
        if (sawStates)
            qCWarning(checklistpersistlog) << "No usable state definitions; using the default catalog.";
        checklist.catalog = StateCatalog::defaultCatalog();
        checklist.catalog.setDefaultStatusNumber(defaultStatus);
    } else {
        // Legacy catalogs predate the bullet; long-press still needs somewhere to land.
        const bool hasBullet = std::any_of(states.cbegin(), states.cend(),
                                           [](const StateDefinition& s) { return s.isBullet(); });
        if (ctx.migrated && !hasBullet) {
            if (const StateDefinition* bullet = StateCatalog::defaultCatalog().byNumber(kBulletStatus))
                states.prepend(*bullet);
        }
        checklist.catalog = StateCatalog(std::move(states), defaultStatus);
    }

    ChecklistLoadResult result;
    result.status = ChecklistLoadResult::Status::Ok;
    result.checklist = std::move(checklist);
    result.migrated = ctx.migrated;
    result.reassignedIds = ctx.reassignedIds;
    return result;
}

QByteArray serialize(const Checklist& checklist)
{
    QByteArray out;
    QXmlStreamWriter w(&out);
    w.setAutoFormatting(true);
    w.setAutoFormattingIndent(2);

    w.writeStartDocument();
    w.writeStartElement(kChecklistTag);
    w.writeAttribute(kNameAttr, checklist.name);
    w.writeAttribute(kDefaultStateAttr, QString::number(checklist.catalog.defaultStatusNumber()));

    w.writeStartElement(kStatesTag);
    for (const auto& s : checklist.catalog.states()) {
        w.writeEmptyElement(kStateTag);
        w.writeAttribute(kNumberAttr, QString::number(s.number));
        w.writeAttribute(kLabelAttr, s.label);
        w.writeAttribute(kColorAttr, s.color);
        w.writeAttribute(kSymbolAttr, s.symbol);
        if (!s.inCycle)
            w.writeAttribute(kInCycleAttr, QStringLiteral("false"));
    }
    w.writeEndElement();

    w.writeStartElement(kItemsTag);
    writeItems(w, checklist.items);
    w.writeEndElement();

    w.writeEndElement();
    w.writeEndDocument();
    return out;
}

ChecklistLoadResult load(const QString& path)
{
    const QString stem = Utils::PathUtils::stem(path);

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        ChecklistLoadResult result;
        result.status = ChecklistLoadResult::Status::IoFailure;
        result.checklist = Checklist::createEmpty(stem);
        result.error = QStringLiteral("Failed to open checklist: %1 (%2)").arg(path, file.errorString());
        qCWarning(checklistpersistlog).noquote() << result.error;
        return result;
    }

    ChecklistLoadResult result = parse(file.readAll(), stem);
    if (!result.ok()) {
        result.error = QStringLiteral("Malformed checklist %1: %2").arg(path, result.error);
        qCWarning(checklistpersistlog).noquote() << result.error;
        return result;
    }

    if (result.migrated)
        qCInfo(checklistpersistlog).noquote() << "Upgraded legacy statuses in" << path;
    if (result.reassignedIds > 0) {
        qCWarning(checklistpersistlog).noquote()
            << QStringLiteral("%1: reassigned %2 missing or duplicate item id(s).")
                   .arg(path)
                   .arg(result.reassignedIds);
    }
    return result;
}

Utils::Result save(const Checklist& checklist, const QString& path)
{
    const Utils::Result r = Utils::FileSystemUtils::writeFileAtomic(path, serialize(checklist));
    if (!r)
        qCWarning(checklistpersistlog).noquote() << "Failed to save checklist:" << r.errorString();
    return r;
}

} // namespace ChecklistModel::ChecklistXml
