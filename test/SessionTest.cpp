// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include <gtest/gtest.h>
#include "TestSupport.h"
#include "session/InspectionSession.h"
#include "zone/ZoneException.h"

namespace
{
    const char* ZONES = R"({
        "type": "FeatureCollection",
        "features": [
            { "type": "Feature",
              "properties": { "Quadra": 1, "Sigla": "FEEC" },
              "geometry": { "type": "Polygon",
                  "coordinates": [[[-47.1,-22.9],[-47.0,-22.9],[-47.0,-22.8],[-47.1,-22.8],[-47.1,-22.9]]] } },
            { "type": "Feature",
              "properties": { "Canteiro": "C2", "Sigla": "IMECC" },
              "geometry": { "type": "Polygon",
                  "coordinates": [[[-47.0,-22.9],[-46.9,-22.9],[-46.9,-22.8],[-47.0,-22.8],[-47.0,-22.9]]] } }
        ]
    })";

    std::vector<uint8_t> photo(double lat, double lon, const char* time, uint8_t seed)
    {
        TestJpeg jpeg;
        jpeg.lat = lat;
        jpeg.lon = lon;
        jpeg.dateTimeOriginal = time;
        jpeg.scanData = { seed, 0x55, seed };
        return jpeg.build();
    }
}

TEST(InspectionSessionTest, ClassifyRequiresZones)
{
    TempDir dir;
    InspectionSession session(dir.path());
    EXPECT_FALSE(session.hasZones());
    EXPECT_THROW(session.classify(), ZoneException);
}

TEST(InspectionSessionTest, ClassifyRenameAndReport)
{
    TempDir zones;
    zones.write("zones.geojson", ZONES);
    TempDir dir;
    dir.write("IMG_3.jpg", photo(-22.85, -47.05, "2024:05:14 10:00:00", 1));
    dir.write("IMG_1.jpg", photo(-22.85, -47.05, "2024:05:14 09:00:00", 2));
    dir.write("IMG_2.jpg", photo(-22.85, -46.95, "2024:05:14 08:00:00", 3));
    dir.write("IMG_4.jpg", TestJpeg().build());

    InspectionSession session(dir.path(), 16);
    session.loadZones((zones / "zones.geojson").string().c_str());
    const std::vector<ClassifiedImage>& images = session.classify();
    ASSERT_EQ(images.size(), 4);
    EXPECT_EQ(images[0].classification.sigla, "FEEC");
    EXPECT_EQ(images[1].classification.sigla, "IMECC");
    EXPECT_EQ(images[1].classification.type, ZoneType::CANTEIRO);
    EXPECT_EQ(images[3].classification.sigla, "Unknown");

    // Edits are keyed by content, so they survive the rename
    EditStore edits;
    edits.edit(images[0].record.contentHash).comment = "Porta quebrada";
    edits.edit(images[0].record.contentHash).status = Status::PARTIAL;

    std::vector<std::string> names = session.rename();
    EXPECT_TRUE(session.renameFailures().empty());
    std::vector<std::string> expected =
        { "001 - FEEC.jpg", "001 - IMECC.jpg", "001 - Unknown.jpg", "002 - FEEC.jpg" };
    EXPECT_EQ(names, expected);
    EXPECT_EQ(dir.fileNames(), expected);
    ASSERT_EQ(session.images().size(), 4);

    ReportSettings settings;
    ReportOptions options;
    options.reportDate = "18/10/2026";
    std::filesystem::path output = dir / "relatorio.pdf";
    PagePlan plan = session.report(output.string().c_str(), settings, options, edits);
    EXPECT_EQ(session.entryCount(), 4);
    EXPECT_TRUE(std::filesystem::exists(output));

    // cover, Quadra and Canteiro status, Quadra comments, two photo pages
    EXPECT_EQ(plan.totalPages, 6);
    EXPECT_EQ(plan.pageOf("FEEC"), 4);
    EXPECT_EQ(plan.pageOf("Unknown"), 5);
}
