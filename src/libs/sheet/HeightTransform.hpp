// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "sheet/SheetConfig.hpp"
#include "sheet/SheetGlobal.hpp"

namespace Sheet::HeightTransform {

// Maps a drag offset onto the sheet height. Linear between
// (minimizedOffset, minHeight) and (expandedOffset, maxHeight), clamped to
// [minHeight, maxHeight]. Dragging down (positive offset) shrinks the sheet.
SHEET_EXPORT double heightForOffset(double offset, const SheetConfig& config) noexcept;

// Inverse of heightForOffset. Heights outside [minHeight, maxHeight] are
// clamped first.
SHEET_EXPORT double offsetForHeight(double height, const SheetConfig& config) noexcept;

// Restricts an offset to [expandedOffset, minimizedOffset].
SHEET_EXPORT double clampOffset(double offset, const SheetConfig& config) noexcept;

} // namespace Sheet::HeightTransform
