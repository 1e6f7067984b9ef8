// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include <cmath>
#include <gtest/gtest.h>
#include "TestSupport.h"
#include "zone/ZoneClassifier.h"
#include "zone/ZoneException.h"
#include "zone/ZoneIndex.h"
#include "zone/ZoneParser.h"

namespace
{
    Polygon square(double x0, double y0, double x1, double y1)
    {
        return Polygon({{ {x0, y0}, {x1, y0}, {x1, y1}, {x0, y1}, {x0, y0} }});
    }

    Zone zone(ZoneType type, const char* id, const char* sigla, Polygon polygon)
    {
        std::vector<Polygon> polygons;
        polygons.push_back(std::move(polygon));
        return Zone(type, id, sigla, std::move(polygons));
    }

    // Two overlapping squares and one far to the east
    ZoneIndex fixture()
    {
        std::vector<Zone> zones;
        zones.push_back(zone(ZoneType::QUADRA, "1", "AAA", square(0, 0, 10, 10)));
        zones.push_back(zone(ZoneType::CANTEIRO, "2", "BBB", square(5, 5, 15, 15)));
        zones.push_back(zone(ZoneType::QUADRA, "3", "CCC", square(30, 0, 40, 10)));
        return ZoneIndex(std::move(zones));
    }

    const char* GEOJSON = R"({
        "type": "FeatureCollection",
        "features": [
            { "type": "Feature",
              "properties": { "Quadra": 12.0, "Sigla": "FEEC" },
              "geometry": { "type": "Polygon",
                  "coordinates": [[[0,0],[10,0],[10,10],[0,10],[0,0]]] } },
            { "type": "Feature",
              "properties": { "Canteiro": "C7", "Sigla": "sem sigla" },
              "geometry": { "type": "MultiPolygon",
                  "coordinates": [[[[20,0],[25,0],[25,5],[20,0]]]] } },
            { "type": "Feature",
              "properties": { "Quadra": 5 },
              "geometry": { "type": "Point", "coordinates": [1, 2] } },
            { "type": "Feature",
              "properties": { "Quadra": 6 },
              "geometry": { "type": "Polygon", "coordinates": [[[0,0],[1,1]]] } },
            { "type": "Feature",
              "properties": { "Quadra": 7 },
              "geometry": null }
        ]
    })";
}

TEST(PolygonTest, ContainsInteriorButNotBoundary)
{
    Polygon p = square(0, 0, 10, 10);
    EXPECT_TRUE(p.contains({ 5, 5 }));
    EXPECT_FALSE(p.contains({ 10, 5 }));
    EXPECT_FALSE(p.contains({ 0, 0 }));
    EXPECT_FALSE(p.contains({ 11, 5 }));
}

TEST(PolygonTest, HoleIsNotContained)
{
    Polygon p({
        { {0, 0}, {10, 0}, {10, 10}, {0, 10}, {0, 0} },
        { {4, 4}, {6, 4}, {6, 6}, {4, 6}, {4, 4} } });
    EXPECT_TRUE(p.contains({ 2, 2 }));
    EXPECT_FALSE(p.contains({ 5, 5 }));
    EXPECT_DOUBLE_EQ(p.distance({ 5, 5 }), 1.0);
}

TEST(PolygonTest, DistanceToOutline)
{
    Polygon p = square(0, 0, 10, 10);
    EXPECT_DOUBLE_EQ(p.distance({ 13, 14 }), 5.0);
    EXPECT_DOUBLE_EQ(p.distance({ 5, -2 }), 2.0);
    EXPECT_DOUBLE_EQ(Polygon::segmentDistance({ 0, 3 }, { 0, 0 }, { 0, 0 }), 3.0);
}

TEST(ZoneClassifierTest, InsideReturnsZoneWithDistanceZero)
{
    ZoneIndex index = fixture();
    ZoneClassifier classifier(index);
    Classification c = classifier.classify(Point{ 2, 2 });
    EXPECT_EQ(c.type, ZoneType::QUADRA);
    EXPECT_EQ(c.zoneId, "1");
    EXPECT_EQ(c.sigla, "AAA");
    EXPECT_TRUE(c.isInside());
}

TEST(ZoneClassifierTest, OverlapGoesToFirstZoneInLoadOrder)
{
    ZoneIndex index = fixture();
    ZoneClassifier classifier(index);
    Classification c = classifier.classify(Point{ 7, 7 });
    EXPECT_EQ(c.sigla, "AAA");
    EXPECT_EQ(c.distance, 0);

    c = classifier.classify(Point{ 12, 12 });
    EXPECT_EQ(c.sigla, "BBB");
    EXPECT_EQ(c.type, ZoneType::CANTEIRO);
}

TEST(ZoneClassifierTest, OutsideReturnsNearestZone)
{
    ZoneIndex index = fixture();
    ZoneClassifier classifier(index);
    Classification c = classifier.classify(Point{ 27, 5 });
    EXPECT_EQ(c.sigla, "CCC");
    EXPECT_DOUBLE_EQ(c.distance, 3.0);
    EXPECT_FALSE(c.isInside());
    EXPECT_TRUE(c.hasZone());

    c = classifier.classify(Point{ 20, 5 });
    EXPECT_EQ(c.sigla, "BBB");
    EXPECT_DOUBLE_EQ(c.distance, 5.0);
}

TEST(ZoneClassifierTest, NearestTieGoesToFirstZone)
{
    std::vector<Zone> zones;
    zones.push_back(zone(ZoneType::QUADRA, "1", "WEST", square(0, 0, 10, 10)));
    zones.push_back(zone(ZoneType::QUADRA, "2", "EAST", square(20, 0, 30, 10)));
    ZoneIndex index(std::move(zones));
    Classification c = ZoneClassifier(index).classify(Point{ 15, 5 });
    EXPECT_EQ(c.sigla, "WEST");
    EXPECT_DOUBLE_EQ(c.distance, 5.0);
}

TEST(ZoneClassifierTest, NoLocationIsUnknown)
{
    ZoneIndex index = fixture();
    Classification c = ZoneClassifier(index).classify(std::nullopt);
    EXPECT_EQ(c.type, ZoneType::UNKNOWN);
    EXPECT_EQ(c.zoneId, "Unknown");
    EXPECT_EQ(c.sigla, "Unknown");
    EXPECT_TRUE(std::isinf(c.distance));
    EXPECT_FALSE(c.hasZone());
}

TEST(ZoneClassifierTest, NormalizeSigla)
{
    EXPECT_EQ(ZoneClassifier::normalizeSigla(""), "Unknown");
    EXPECT_EQ(ZoneClassifier::normalizeSigla("  "), "Unknown");
    EXPECT_EQ(ZoneClassifier::normalizeSigla("Sem Sigla"), "Unknown");
    EXPECT_EQ(ZoneClassifier::normalizeSigla("DESCONHECIDA"), "Unknown");
    EXPECT_EQ(ZoneClassifier::normalizeSigla(" IMECC "), "IMECC");
}

TEST(ZoneParserTest, SkipsUnusableFeatures)
{
    ZoneParser parser(GEOJSON);
    std::vector<Zone> zones = parser.parse();
    ASSERT_EQ(zones.size(), 2);
    EXPECT_EQ(parser.skippedCount(), 3);

    EXPECT_EQ(zones[0].type(), ZoneType::QUADRA);
    EXPECT_EQ(zones[0].id(), "12");
    EXPECT_EQ(zones[0].sigla(), "FEEC");

    EXPECT_EQ(zones[1].type(), ZoneType::CANTEIRO);
    EXPECT_EQ(zones[1].id(), "C7");
    EXPECT_EQ(zones[1].polygons().size(), 1);
}

TEST(ZoneIndexTest, LoadsDatasetFromFile)
{
    TempDir dir;
    dir.write("zones.geojson", GEOJSON);
    ZoneIndex index = ZoneIndex::load((dir / "zones.geojson").string().c_str());
    ASSERT_EQ(index.size(), 2);

    Classification c = ZoneClassifier(index).classify(Point{ 22, 1 });
    EXPECT_EQ(c.type, ZoneType::CANTEIRO);
    EXPECT_EQ(c.sigla, "Unknown");
    EXPECT_TRUE(c.isInside());
}

TEST(ZoneIndexTest, MissingMalformedOrEmptyDatasetIsFatal)
{
    TempDir dir;
    EXPECT_THROW(ZoneIndex::load((dir / "missing.geojson").string().c_str()), ZoneException);

    dir.write("bad.geojson", "{ \"type\": \"FeatureCollection\", \"features\": [ ");
    EXPECT_THROW(ZoneIndex::load((dir / "bad.geojson").string().c_str()), ZoneException);

    dir.write("empty.geojson", R"({ "type": "FeatureCollection", "features": [] })");
    EXPECT_THROW(ZoneIndex::load((dir / "empty.geojson").string().c_str()), ZoneException);
}
