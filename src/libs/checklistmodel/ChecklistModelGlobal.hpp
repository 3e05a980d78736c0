// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QLoggingCategory>
#include <QtCore/QtGlobal>

#if defined(CHECKLISTMODEL_BUILD_SHARED) && (CHECKLISTMODEL_BUILD_SHARED == 1)
#	if defined(CHECKLISTMODEL_LIBRARY)
#		define CHECKLISTMODEL_EXPORT Q_DECL_EXPORT
#	else
#		define CHECKLISTMODEL_EXPORT Q_DECL_IMPORT
#	endif
#else
#	define CHECKLISTMODEL_EXPORT
#endif

Q_DECLARE_LOGGING_CATEGORY(checklistmodellog)
Q_DECLARE_LOGGING_CATEGORY(checklistpersistlog)
Q_DECLARE_LOGGING_CATEGORY(checklistsessionlog)
