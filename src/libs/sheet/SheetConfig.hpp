// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "sheet/SheetGlobal.hpp"

#include <utils/Result.hpp>

#include <QtCore/QJsonObject>
#include <QtCore/QString>

#include <stdexcept>

namespace Sheet {

class SHEET_EXPORT ConfigError final : public std::runtime_error
{
public:
    explicit ConfigError(const Utils::Result& result);

    const QStringList& errors() const noexcept { return m_errors; }

private:
    QStringList m_errors;
};

// Tuning for the snap transition. Values are cosmetic; any positive set
// converges.
struct SpringParams final {
    double stiffness = 400.0;
    double damping = 40.0;
    double mass = 0.5;
    double restDelta = 0.5;  // px
    double restSpeed = 2.0;  // px/s
};

struct SHEET_EXPORT SheetConfig final {
    double minHeight = 80.0;
    double maxHeight = 400.0;
    double defaultHeight = 340.0;

    SpringParams spring;

    // Offset at which the sheet shows minHeight (drag fully down).
    double minimizedOffset() const noexcept { return defaultHeight - minHeight; }
    // Offset at which the sheet shows maxHeight (drag fully up).
    double expandedOffset() const noexcept { return -(maxHeight - defaultHeight); }

    Utils::Result validate() const;

    // Members absent from `object` keep their current value in `out`. The
    // merged result is validated; `out` is only written when it is valid.
    static Utils::Result fromJson(const QJsonObject& object, SheetConfig& out);
    static Utils::Result loadFile(const QString& path, SheetConfig& out);
};

} // namespace Sheet
