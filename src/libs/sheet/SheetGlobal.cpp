// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "sheet/SheetGlobal.hpp"

Q_LOGGING_CATEGORY(sheetlog, "sheet.engine")
