// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "checklistmodel/ChecklistModelGlobal.hpp"

Q_LOGGING_CATEGORY(checklistmodellog, "checklist.model")
Q_LOGGING_CATEGORY(checklistpersistlog, "checklist.persistence")
Q_LOGGING_CATEGORY(checklistsessionlog, "checklist.session")
