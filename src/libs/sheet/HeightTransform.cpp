// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "sheet/HeightTransform.hpp"

#include <algorithm>

namespace Sheet::HeightTransform {

namespace {

double mapRange(double value, double fromA, double fromB, double toA, double toB) noexcept
{
    const double span = fromB - fromA;
    if (span == 0.0)
        return toA;

    const double t = (value - fromA) / span;
    return toA + t * (toB - toA);
}

} // namespace

double heightForOffset(double offset, const SheetConfig& config) noexcept
{
    const double h = mapRange(offset,
                              config.minimizedOffset(), config.expandedOffset(),
                              config.minHeight, config.maxHeight);
    return std::clamp(h, config.minHeight, config.maxHeight);
}

double offsetForHeight(double height, const SheetConfig& config) noexcept
{
    const double h = std::clamp(height, config.minHeight, config.maxHeight);
    const double y = mapRange(h,
                              config.minHeight, config.maxHeight,
                              config.minimizedOffset(), config.expandedOffset());
    return clampOffset(y, config);
}

double clampOffset(double offset, const SheetConfig& config) noexcept
{
    return std::clamp(offset, config.expandedOffset(), config.minimizedOffset());
}

} // namespace Sheet::HeightTransform
