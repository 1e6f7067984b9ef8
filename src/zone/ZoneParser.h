// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once

#include <string>
#include <vector>
#include "util/JsonParser.h"
#include "Zone.h"

// Reads zones from a GeoJSON FeatureCollection (or a single Feature).
// Structural JSON errors are fatal; a feature whose geometry cannot be
// used is skipped with a warning.

class ZoneParser : public JsonParser
{
public:
    explicit ZoneParser(const char* s) :
        JsonParser(s)
    {
    }

    std::vector<Zone> parse();
    int skippedCount() const { return skippedCount_; }

private:
    // Nested coordinate arrays, kept generic until the geometry type
    // is known (it may follow "coordinates")
    struct CoordinateArray
    {
        std::vector<double> numbers;
        std::vector<CoordinateArray> arrays;
        bool hasInvalidValues = false;
    };

    struct Geometry
    {
        std::string type;
        CoordinateArray coordinates;
        bool hasCoordinates = false;
    };

    struct Feature
    {
        std::string quadra;
        std::string canteiro;
        std::string sigla;
        Geometry geometry;
        bool hasGeometry = false;
    };

    void parseFeatureMember(const std::string& key, Feature& feature);
    void parseProperties(Feature& feature);
    void parseGeometry(Geometry& geometry);
    void parseCoordinates(CoordinateArray& array, int level);
    void addZone(Feature& feature, int index);
    void skipFeature(int index, const char* reason);

    static const char* buildPolygon(const CoordinateArray& rings, std::vector<Polygon>& polygons);
    static const char* buildPolygons(const Geometry& geometry, std::vector<Polygon>& polygons);

    std::vector<Zone> zones_;
    int skippedCount_ = 0;
};
