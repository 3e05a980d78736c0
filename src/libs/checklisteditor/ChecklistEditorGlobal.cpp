// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "checklisteditor/ChecklistEditorGlobal.hpp"

Q_LOGGING_CATEGORY(checklisteditorlog, "checklist.editor")
