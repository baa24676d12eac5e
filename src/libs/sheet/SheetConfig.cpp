// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "sheet/SheetConfig.hpp"

#include <utils/filesystem/JsonFileUtils.hpp>

#include <QtCore/QJsonValue>

#include <cmath>

namespace Sheet {

using namespace Qt::StringLiterals;

namespace {

void requireFinite(Utils::Result& r, double value, const QString& name)
{
    if (!std::isfinite(value))
        r.addError(QStringLiteral("%1 must be a finite number.").arg(name));
}

void requirePositive(Utils::Result& r, double value, const QString& name)
{
    if (!std::isfinite(value) || value <= 0.0)
        r.addError(QStringLiteral("spring.%1 must be a positive number.").arg(name));
}

} // namespace

ConfigError::ConfigError(const Utils::Result& result)
    : std::runtime_error(QStringLiteral("Invalid sheet configuration: %1")
                             .arg(result.joined())
                             .toStdString())
    , m_errors(result.errors)
{
}

Utils::Result SheetConfig::validate() const
{
    Utils::Result r;

    requireFinite(r, minHeight, u"minHeight"_s);
    requireFinite(r, maxHeight, u"maxHeight"_s);
    requireFinite(r, defaultHeight, u"defaultHeight"_s);
    if (!r)
        return r;

    if (minHeight < 0.0)
        r.addError(QStringLiteral("minHeight (%1) must not be negative.").arg(minHeight));
    if (minHeight > defaultHeight)
        r.addError(QStringLiteral("minHeight (%1) exceeds defaultHeight (%2).").arg(minHeight).arg(defaultHeight));
    if (defaultHeight > maxHeight)
        r.addError(QStringLiteral("defaultHeight (%1) exceeds maxHeight (%2).").arg(defaultHeight).arg(maxHeight));

    requirePositive(r, spring.stiffness, u"stiffness"_s);
    requirePositive(r, spring.damping, u"damping"_s);
    requirePositive(r, spring.mass, u"mass"_s);
    requirePositive(r, spring.restDelta, u"restDelta"_s);
    requirePositive(r, spring.restSpeed, u"restSpeed"_s);

    return r;
}

Utils::Result SheetConfig::fromJson(const QJsonObject& object, SheetConfig& out)
{
    using Utils::JsonFileUtils::readNumber;

    SheetConfig parsed = out;
    Utils::Result r;

    readNumber(object, u"minHeight", parsed.minHeight, r);
    readNumber(object, u"maxHeight", parsed.maxHeight, r);
    readNumber(object, u"defaultHeight", parsed.defaultHeight, r);

    const QJsonValue springValue = object.value(u"spring");
    if (springValue.isObject()) {
        const QJsonObject springObject = springValue.toObject();
        readNumber(springObject, u"stiffness", parsed.spring.stiffness, r);
        readNumber(springObject, u"damping", parsed.spring.damping, r);
        readNumber(springObject, u"mass", parsed.spring.mass, r);
        readNumber(springObject, u"restDelta", parsed.spring.restDelta, r);
        readNumber(springObject, u"restSpeed", parsed.spring.restSpeed, r);
    } else if (!springValue.isUndefined()) {
        r.addError(u"'spring' must be an object."_s);
    }

    r.merge(parsed.validate());
    if (!r)
        return r;

    out = parsed;
    return r;
}

Utils::Result SheetConfig::loadFile(const QString& path, SheetConfig& out)
{
    QString error;
    const QJsonObject object = Utils::JsonFileUtils::readObject(path, &error);
    if (!error.isEmpty())
        return Utils::Result::failure(error);

    return fromJson(object, out);
}

} // namespace Sheet
