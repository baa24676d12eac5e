// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "sheet/SheetConfig.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QJsonDocument>
#include <QtCore/QTemporaryDir>

#include <limits>

using Sheet::SheetConfig;

TEST(SheetConfigTests, DefaultsAreValid)
{
    const SheetConfig cfg;
    EXPECT_TRUE(cfg.validate().ok);
    EXPECT_EQ(cfg.minHeight, 80.0);
    EXPECT_EQ(cfg.maxHeight, 400.0);
    EXPECT_EQ(cfg.defaultHeight, 340.0);
    EXPECT_EQ(cfg.minimizedOffset(), 260.0);
    EXPECT_EQ(cfg.expandedOffset(), -60.0);
}

TEST(SheetConfigTests, EqualBoundsAreValid)
{
    SheetConfig cfg;
    cfg.minHeight = 200.0;
    cfg.defaultHeight = 200.0;
    cfg.maxHeight = 200.0;
    EXPECT_TRUE(cfg.validate().ok);
}

TEST(SheetConfigTests, RejectsMinAboveDefault)
{
    SheetConfig cfg;
    cfg.minHeight = 350.0;

    const Utils::Result r = cfg.validate();
    EXPECT_FALSE(r.ok);
    ASSERT_EQ(r.errors.size(), 1);
    EXPECT_TRUE(r.errors.front().contains(QStringLiteral("minHeight")));
}

TEST(SheetConfigTests, RejectsDefaultAboveMax)
{
    SheetConfig cfg;
    cfg.defaultHeight = 500.0;

    const Utils::Result r = cfg.validate();
    EXPECT_FALSE(r.ok);
    ASSERT_EQ(r.errors.size(), 1);
    EXPECT_TRUE(r.errors.front().contains(QStringLiteral("maxHeight")));
}

TEST(SheetConfigTests, RejectsNonFiniteAndNegative)
{
    SheetConfig nan;
    nan.maxHeight = std::numeric_limits<double>::quiet_NaN();
    EXPECT_FALSE(nan.validate().ok);

    SheetConfig negative;
    negative.minHeight = -1.0;
    EXPECT_FALSE(negative.validate().ok);

    SheetConfig spring;
    spring.spring.mass = 0.0;
    EXPECT_FALSE(spring.validate().ok);
}

TEST(SheetConfigTests, ConfigErrorCarriesAllErrors)
{
    SheetConfig cfg;
    cfg.minHeight = 500.0;
    cfg.defaultHeight = 600.0;

    const Utils::Result r = cfg.validate();
    ASSERT_FALSE(r.ok);

    const Sheet::ConfigError error(r);
    EXPECT_EQ(error.errors(), r.errors);
    EXPECT_NE(std::string(error.what()).find("Invalid sheet configuration"), std::string::npos);
}

TEST(SheetConfigTests, FromJsonOverridesPresentKeys)
{
    const QJsonObject object = QJsonDocument::fromJson(R"({
        "minHeight": 96,
        "defaultHeight": 300,
        "spring": { "stiffness": 250 }
    })").object();

    SheetConfig cfg;
    const Utils::Result r = SheetConfig::fromJson(object, cfg);
    ASSERT_TRUE(r.ok) << r.joined().toStdString();

    EXPECT_EQ(cfg.minHeight, 96.0);
    EXPECT_EQ(cfg.defaultHeight, 300.0);
    EXPECT_EQ(cfg.maxHeight, 400.0);
    EXPECT_EQ(cfg.spring.stiffness, 250.0);
    EXPECT_EQ(cfg.spring.damping, 40.0);
}

TEST(SheetConfigTests, FromJsonReportsTypeErrorsAndKeepsOutput)
{
    const QJsonObject object = QJsonDocument::fromJson(R"({
        "minHeight": "tall",
        "maxHeight": 640,
        "spring": 3
    })").object();

    SheetConfig cfg;
    const Utils::Result r = SheetConfig::fromJson(object, cfg);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.errors.size(), 2);
    EXPECT_EQ(cfg.minHeight, 80.0);
    EXPECT_EQ(cfg.maxHeight, 400.0);
}

TEST(SheetConfigTests, FromJsonValidatesMergedValues)
{
    const QJsonObject object = QJsonDocument::fromJson(R"({
        "minHeight": 500,
        "spring": { "mass": "heavy", "damping": 0 }
    })").object();

    SheetConfig cfg;
    const Utils::Result r = SheetConfig::fromJson(object, cfg);
    EXPECT_FALSE(r.ok);
    // One type error, then minHeight above defaultHeight and a zero damping.
    EXPECT_EQ(r.errors.size(), 3) << r.joined().toStdString();
    EXPECT_TRUE(r.errors.first().contains(u"mass"));
    EXPECT_EQ(cfg.minHeight, 80.0);
    EXPECT_EQ(cfg.spring.damping, 40.0);
}

TEST(SheetConfigTests, LoadFileReadsJson)
{
    QTemporaryDir temp;
    ASSERT_TRUE(temp.isValid());

    const QString path = QDir(temp.path()).filePath(QStringLiteral("sheet.json"));
    {
        QFile file(path);
        ASSERT_TRUE(file.open(QIODevice::WriteOnly));
        file.write(R"({"maxHeight": 480})");
    }

    SheetConfig cfg;
    ASSERT_TRUE(SheetConfig::loadFile(path, cfg).ok);
    EXPECT_EQ(cfg.maxHeight, 480.0);

    SheetConfig untouched;
    const Utils::Result missing = SheetConfig::loadFile(QDir(temp.path()).filePath(QStringLiteral("nope.json")), untouched);
    EXPECT_FALSE(missing.ok);
    EXPECT_EQ(untouched.maxHeight, 400.0);
}
