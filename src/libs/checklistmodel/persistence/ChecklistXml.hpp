// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "checklistmodel/Checklist.hpp"
#include "checklistmodel/ChecklistModelGlobal.hpp"

#include "utils/Result.hpp"

#include <QtCore/QByteArray>
#include <QtCore/QString>

namespace ChecklistModel {

struct CHECKLISTMODEL_EXPORT ChecklistLoadResult final {
    enum class Status : unsigned char {
        Ok,
        Malformed,
        IoFailure
    };

    Status status = Status::IoFailure;
    // Always usable: on failure an empty checklist with the default catalog.
    Checklist checklist;
    // True when legacy string-tag statuses were upgraded on read.
    bool migrated = false;
    // Ids that were missing or duplicated and got a fresh value.
    int reassignedIds = 0;
    QString error;

    bool ok() const noexcept { return status == Status::Ok; }
};

namespace ChecklistXml {

inline constexpr char kFileExtension[] = "xml";

// fallbackName names the empty checklist produced for malformed input.
CHECKLISTMODEL_EXPORT ChecklistLoadResult parse(const QByteArray& bytes, const QString& fallbackName = {});
CHECKLISTMODEL_EXPORT QByteArray serialize(const Checklist& checklist);

CHECKLISTMODEL_EXPORT ChecklistLoadResult load(const QString& path);
CHECKLISTMODEL_EXPORT Utils::Result save(const Checklist& checklist, const QString& path);

} // namespace ChecklistXml

} // namespace ChecklistModel
