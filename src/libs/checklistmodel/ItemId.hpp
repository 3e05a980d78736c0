// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "checklistmodel/ChecklistModelGlobal.hpp"

#include <QtCore/QHashFunctions>
#include <QtCore/QMetaType>
#include <QtCore/QString>
#include <QtCore/QUuid>

#include <utility>

namespace ChecklistModel {

// Persisted item identity. Generated ids are 8 lowercase hex characters;
// any non-empty string read from a document is accepted as-is.
class CHECKLISTMODEL_EXPORT ItemId final {
public:
    ItemId() = default;
    explicit ItemId(QString value) : m_value(std::move(value)) {}

    static ItemId create()
    {
        return ItemId(QUuid::createUuid().toString(QUuid::Id128).left(8));
    }
    static ItemId null() { return ItemId(); }

    bool isNull() const noexcept { return m_value.isEmpty(); }
    const QString& toString() const noexcept { return m_value; }

    friend bool operator==(const ItemId& a, const ItemId& b) noexcept { return a.m_value == b.m_value; }
    friend bool operator!=(const ItemId& a, const ItemId& b) noexcept { return !(a == b); }
    friend bool operator<(const ItemId& a, const ItemId& b) noexcept { return a.m_value < b.m_value; }

private:
    QString m_value;
};

inline size_t qHash(const ItemId& id, size_t seed = 0) noexcept
{
    return qHash(id.toString(), seed);
}

} // namespace ChecklistModel

Q_DECLARE_METATYPE(ChecklistModel::ItemId)
