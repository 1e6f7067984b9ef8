// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include <map>
#include <gtest/gtest.h>
#include "TestSupport.h"
#include "naming/FriendlyName.h"
#include "naming/NamingPipeline.h"
#include "naming/RenamePlan.h"

namespace
{
    CaptureTime at(int hour, int minute)
    {
        CaptureTime t;
        t.year = 2024;
        t.month = 5;
        t.day = 14;
        t.hour = hour;
        t.minute = minute;
        return t;
    }

    bool isScratchName(const std::string& name)
    {
        if (name.size() < 9) return false;
        for (int i = 0; i < 8; i++)
        {
            if (name[i] < '0' || name[i] > '9') return false;
        }
        return name[8] == '.';
    }
}

TEST(FriendlyNameTest, Matches)
{
    EXPECT_TRUE(FriendlyName::matches("001 - FEEC.jpg"));
    EXPECT_TRUE(FriendlyName::matches("012-IMECC.JPEG"));
    EXPECT_TRUE(FriendlyName::matches("999  -  A B.heic"));
    EXPECT_FALSE(FriendlyName::matches("01 - FEEC.jpg"));
    EXPECT_FALSE(FriendlyName::matches("001 FEEC.jpg"));
    EXPECT_FALSE(FriendlyName::matches("001 - .jpg"));
    EXPECT_FALSE(FriendlyName::matches("001 - FEEC"));
    EXPECT_FALSE(FriendlyName::matches("IMG_0001.jpg"));
    EXPECT_EQ(FriendlyName::number("042 - X.jpg"), 42);
    EXPECT_EQ(FriendlyName::number("IMG.jpg"), -1);
}

TEST(FriendlyNameTest, FormatSanitizesSigla)
{
    EXPECT_EQ(FriendlyName::sanitize("A/B:C*D?"), "A-B-C-D-");
    EXPECT_EQ(FriendlyName::format(7, "FE<EC>", ".jpg"), "007 - FE-EC-.jpg");
    EXPECT_EQ(FriendlyName::format(123, "X", ".png"), "123 - X.png");
}

TEST(RenamePlanTest, NumbersEachSiglaByCaptureTime)
{
    std::vector<std::string> listing = { "d.jpg", "a.JPG", "c.jpg", "b.jpg", "notes.txt" };
    std::vector<RenamePlan::Candidate> candidates =
    {
        { "d.jpg", "AAA", at(10, 30) },
        { "a.JPG", "AAA", at(10, 10) },
        { "c.jpg", "BBB", at(9, 0) },
        { "b.jpg", "aaa", at(10, 20) },
    };
    std::mt19937 random(42);
    RenamePlan plan = RenamePlan::build(listing, candidates, random);

    ASSERT_EQ(plan.scrambleSteps().size(), 4);
    for (const RenamePlan::Step& step : plan.scrambleSteps())
    {
        EXPECT_TRUE(isScratchName(step.to)) << step.to;
        EXPECT_EQ(step.from, candidates[step.candidate].fileName);
    }

    std::map<std::string, std::string> targets;
    for (const RenamePlan::Step& step : plan.canonicalSteps())
    {
        targets[candidates[step.candidate].fileName] = step.to;
    }
    EXPECT_EQ(targets["a.JPG"], "001 - AAA.jpg");
    EXPECT_EQ(targets["b.jpg"], "002 - aaa.jpg");
    EXPECT_EQ(targets["d.jpg"], "003 - AAA.jpg");
    EXPECT_EQ(targets["c.jpg"], "001 - BBB.jpg");
}

TEST(RenamePlanTest, FriendlyNamesStayAndBlockTheirNumber)
{
    std::vector<std::string> listing = { "001 - AAA.jpg", "x.jpg" };
    std::vector<RenamePlan::Candidate> candidates =
    {
        { "001 - AAA.jpg", "AAA", at(12, 0) },
        { "x.jpg", "AAA", at(8, 0) },
    };
    std::mt19937 random(1);
    RenamePlan plan = RenamePlan::build(listing, candidates, random);
    ASSERT_EQ(plan.keptNames().size(), 1);
    EXPECT_EQ(plan.keptNames()[0], "001 - AAA.jpg");
    ASSERT_EQ(plan.canonicalSteps().size(), 1);
    EXPECT_EQ(plan.canonicalSteps()[0].to, "002 - AAA.jpg");
}

TEST(NamingPipelineTest, RenamesIndependentOfListingOrder)
{
    TempDir dir;
    for (const char* name : { "IMG_4.jpg", "IMG_1.jpg", "IMG_3.jpg", "IMG_2.jpg" })
    {
        dir.write(name, name);
    }
    std::vector<NamingPipeline::Item> items =
    {
        { "IMG_4.jpg", "AAA", at(11, 0) },
        { "IMG_1.jpg", "BBB", at(8, 0) },
        { "IMG_3.jpg", "AAA", at(9, 0) },
        { "IMG_2.jpg", "AAA", at(10, 0) },
    };
    NamingPipeline pipeline(7);
    std::vector<std::string> names = pipeline.run(dir.path(), items);
    EXPECT_TRUE(pipeline.failures().empty());

    std::vector<std::string> expected =
        { "001 - AAA.jpg", "001 - BBB.jpg", "002 - AAA.jpg", "003 - AAA.jpg" };
    EXPECT_EQ(names, expected);
    EXPECT_EQ(dir.fileNames(), expected);

    // Content follows the files
    std::ifstream in(dir / "001 - AAA.jpg");
    std::string content;
    std::getline(in, content);
    EXPECT_EQ(content, "IMG_3.jpg");
}

TEST(NamingPipelineTest, IsIdempotent)
{
    TempDir dir;
    dir.write("001 - AAA.jpg", "a");
    dir.write("002 - AAA.jpg", "b");
    dir.write("001 - BBB.png", "c");
    std::vector<NamingPipeline::Item> items =
    {
        { "001 - AAA.jpg", "AAA", at(9, 0) },
        { "002 - AAA.jpg", "AAA", at(10, 0) },
        { "001 - BBB.png", "BBB", at(8, 0) },
    };
    std::vector<std::string> before = dir.fileNames();
    NamingPipeline pipeline(3);
    std::vector<std::string> names = pipeline.run(dir.path(), items);
    EXPECT_EQ(names, before);
    EXPECT_EQ(dir.fileNames(), before);
}

TEST(NamingPipelineTest, EmptyInputIsNoOp)
{
    TempDir dir;
    dir.write("photo.jpg", "x");
    NamingPipeline pipeline(5);
    EXPECT_TRUE(pipeline.run(dir.path(), {}).empty());
    EXPECT_EQ(dir.fileNames(), std::vector<std::string>{ "photo.jpg" });
}

TEST(NamingPipelineTest, MissingFileIsReportedAndSkipped)
{
    TempDir dir;
    dir.write("a.jpg", "a");
    std::vector<NamingPipeline::Item> items =
    {
        { "a.jpg", "AAA", at(9, 0) },
        { "gone.jpg", "AAA", at(8, 0) },
    };
    NamingPipeline pipeline(11);
    std::vector<std::string> names = pipeline.run(dir.path(), items);
    EXPECT_EQ(names, std::vector<std::string>{ "001 - AAA.jpg" });
    ASSERT_EQ(pipeline.failures().size(), 1);
    EXPECT_EQ(pipeline.failures()[0].fileName, "gone.jpg");
}

TEST(NamingPipelineTest, ReportsProgress)
{
    TempDir dir;
    dir.write("a.jpg", "a");
    dir.write("b.jpg", "b");
    std::vector<NamingPipeline::Item> items =
    {
        { "a.jpg", "AAA", at(9, 0) },
        { "b.jpg", "AAA", at(8, 0) },
    };
    size_t calls = 0;
    size_t last = 0;
    size_t lastTotal = 0;
    NamingPipeline pipeline(13);
    pipeline.run(dir.path(), items, [&](size_t current, size_t total)
    {
        calls++;
        last = current;
        lastTotal = total;
    });
    EXPECT_EQ(calls, 4);
    EXPECT_EQ(last, 4);
    EXPECT_EQ(lastTotal, 4);
}
