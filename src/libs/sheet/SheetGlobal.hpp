// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QtGlobal>
#include <QtCore/QLoggingCategory>

#if defined(SHEET_BUILD_SHARED) && (SHEET_BUILD_SHARED == 1)
#	if defined(SHEET_LIBRARY)
#		define SHEET_EXPORT Q_DECL_EXPORT
#	else
#		define SHEET_EXPORT Q_DECL_IMPORT
#	endif
#else
#	define SHEET_EXPORT
#endif

Q_DECLARE_LOGGING_CATEGORY(sheetlog)
