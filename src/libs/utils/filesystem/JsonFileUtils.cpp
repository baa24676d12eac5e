// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "utils/filesystem/JsonFileUtils.hpp"

#include <QtCore/QFile>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonParseError>
#include <QtCore/QJsonValue>

namespace Utils::JsonFileUtils {

namespace {

void setError(QString* error, const QString& message)
{
    qCWarning(utilslog).noquote() << message;
    if (error)
        *error = message;
}

} // namespace

QJsonObject readObject(const QString& path, QString* error)
{
    const QString cleanedPath = path.trimmed();
    if (cleanedPath.isEmpty()) {
        setError(error, QStringLiteral("JSON input path is empty."));
        return {};
    }

    QFile file(cleanedPath);
    if (!file.open(QIODevice::ReadOnly)) {
        setError(error, QStringLiteral("Failed to open JSON file: %1 (%2)")
                            .arg(cleanedPath, file.errorString()));
        return {};
    }

    const QByteArray bytes = file.readAll();
    QJsonParseError parseError{};
    const QJsonDocument doc = QJsonDocument::fromJson(bytes, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        setError(error, QStringLiteral("Failed to parse JSON file: %1 (%2)")
                            .arg(cleanedPath, parseError.errorString()));
        return {};
    }

    if (!doc.isObject()) {
        setError(error, QStringLiteral("JSON document is not an object: %1").arg(cleanedPath));
        return {};
    }

    if (error)
        error->clear();
    return doc.object();
}

void readNumber(const QJsonObject& object, QStringView key, double& out, Result& result)
{
    const QJsonValue value = object.value(key);
    if (value.isUndefined())
        return;

    if (!value.isDouble()) {
        result.addError(QStringLiteral("'%1' must be a number.").arg(key));
        return;
    }

    out = value.toDouble();
}

} // namespace Utils::JsonFileUtils
