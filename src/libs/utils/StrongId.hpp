// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QHashFunctions>
#include <QtCore/QString>
#include <QtCore/QUuid>

#include <compare>
#include <optional>

namespace Utils {

// Process-local identity keyed by a tag type. Never persisted.
template <typename Tag>
class StrongId final {
public:
    using tag_type = Tag;

    constexpr StrongId() noexcept = default;
    explicit StrongId(const QUuid& uuid) noexcept : m_uuid(uuid) {}

    static StrongId create() { return StrongId(QUuid::createUuid()); }
    static constexpr StrongId null() noexcept { return StrongId(); }

    bool isNull() const noexcept { return m_uuid.isNull(); }
    const QUuid& uuid() const noexcept { return m_uuid; }

    QString toString() const { return m_uuid.toString(QUuid::WithoutBraces); }

    static std::optional<StrongId> fromString(const QString& s)
    {
        const QUuid parsed = QUuid::fromString(s.trimmed());
        if (parsed.isNull())
            return std::nullopt;
        return StrongId(parsed);
    }

    friend bool operator==(const StrongId& a, const StrongId& b) noexcept
    {
        return a.m_uuid == b.m_uuid;
    }

    friend std::strong_ordering operator<=>(const StrongId& a, const StrongId& b) noexcept
    {
        if (a.m_uuid < b.m_uuid)
            return std::strong_ordering::less;
        if (b.m_uuid < a.m_uuid)
            return std::strong_ordering::greater;
        return std::strong_ordering::equal;
    }

private:
    QUuid m_uuid{};
};

template <typename Tag>
size_t qHash(const StrongId<Tag>& id, size_t seed = 0) noexcept
{
    return qHash(id.uuid(), seed);
}

} // namespace Utils
