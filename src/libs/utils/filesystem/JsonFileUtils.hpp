// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/Result.hpp"
#include "utils/UtilsGlobal.hpp"

#include <QtCore/QJsonObject>
#include <QtCore/QString>
#include <QtCore/QStringView>

namespace Utils::JsonFileUtils {

UTILS_EXPORT QJsonObject readObject(const QString& path, QString* error = nullptr);

// Reads an optional numeric member. A missing key leaves `out` untouched; a
// present key of the wrong type is recorded in `result` and also leaves `out`
// untouched.
UTILS_EXPORT void readNumber(const QJsonObject& object,
                             QStringView key,
                             double& out,
                             Result& result);

} // namespace Utils::JsonFileUtils
