// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QLoggingCategory>
#include <QtCore/QtGlobal>

#if defined(CHECKLISTEDITOR_BUILD_SHARED) && (CHECKLISTEDITOR_BUILD_SHARED == 1)
#	if defined(CHECKLISTEDITOR_LIBRARY)
#		define CHECKLISTEDITOR_EXPORT Q_DECL_EXPORT
#	else
#		define CHECKLISTEDITOR_EXPORT Q_DECL_IMPORT
#	endif
#else
#	define CHECKLISTEDITOR_EXPORT
#endif

Q_DECLARE_LOGGING_CATEGORY(checklisteditorlog)
