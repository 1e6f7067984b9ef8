// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include "ZoneParser.h"
#include <cmath>
#include <clarisma/cli/Console.h>
#include "util/TextUtils.h"

using clarisma::Console;

std::vector<Zone> ZoneParser::parse()
{
    std::string type;
    Feature topLevel;
    bool hasFeatures = false;

    expectObjectStart();
    members([&](const std::string& key)
    {
        if (key == "type")
        {
            type = expectString();
        }
        else if (key == "features")
        {
            hasFeatures = true;
            expect('[');
            elements([this](int index)
            {
                Feature feature;
                expectObjectStart();
                members([this, &feature](const std::string& k)
                {
                    parseFeatureMember(k, feature);
                });
                addZone(feature, index);
            });
        }
        else
        {
            parseFeatureMember(key, topLevel);
        }
    });

    if (type == "FeatureCollection")
    {
        if (!hasFeatures) error("Must have 'features'");
    }
    else if (type == "Feature")
    {
        addZone(topLevel, 0);
    }
    else
    {
        error("Expected type 'FeatureCollection' or 'Feature'");
    }
    return std::move(zones_);
}

void ZoneParser::parseFeatureMember(const std::string& key, Feature& feature)
{
    if (key == "properties")
    {
        if (acceptNull()) return;
        parseProperties(feature);
    }
    else if (key == "geometry")
    {
        if (acceptNull()) return;
        feature.hasGeometry = true;
        parseGeometry(feature.geometry);
    }
    else
    {
        skipValue(1);
    }
}

void ZoneParser::parseProperties(Feature& feature)
{
    expectObjectStart();
    members([this, &feature](const std::string& key)
    {
        if (key == "Quadra")
        {
            feature.quadra = TextUtils::trim(scalarAsString());
        }
        else if (key == "Canteiro")
        {
            feature.canteiro = TextUtils::trim(scalarAsString());
        }
        else if (key == "Sigla")
        {
            feature.sigla = TextUtils::trim(scalarAsString());
        }
        else
        {
            skipValue(2);
        }
    });
}

void ZoneParser::parseGeometry(Geometry& geometry)
{
    expectObjectStart();
    members([this, &geometry](const std::string& key)
    {
        if (key == "type")
        {
            geometry.type = expectString();
        }
        else if (key == "coordinates")
        {
            geometry.hasCoordinates = true;
            expect('[');
            parseCoordinates(geometry.coordinates, 0);
        }
        else
        {
            skipValue(2);
        }
    });
}

void ZoneParser::parseCoordinates(CoordinateArray& array, int level)  // NOLINT recursive
{
    if (level >= MAX_NESTING) error("Excessive nesting");
    elements([this, &array, level](int)
    {
        if (accept('['))
        {
            array.arrays.emplace_back();
            parseCoordinates(array.arrays.back(), level + 1);
            return;
        }
        if (*pNext_ == '"' || *pNext_ == '{' || *pNext_ == 'n' ||
            *pNext_ == 't' || *pNext_ == 'f')
        {
            array.hasInvalidValues = true;
            skipValue(level + 1);
            return;
        }
        double d = number();
        if (std::isnan(d)) error("Expected coordinate value");
        array.numbers.push_back(d);
    });
}

const char* ZoneParser::buildPolygon(const CoordinateArray& rings, std::vector<Polygon>& polygons)
{
    if (rings.arrays.empty() || !rings.numbers.empty())
    {
        return "polygon must be an array of rings";
    }
    std::vector<Polygon::Ring> result;
    result.reserve(rings.arrays.size());
    for (const CoordinateArray& ring : rings.arrays)
    {
        if (!ring.numbers.empty()) return "ring must be an array of positions";
        if (ring.arrays.size() < 3) return "ring has fewer than 3 positions";
        Polygon::Ring& points = result.emplace_back();
        points.reserve(ring.arrays.size());
        for (const CoordinateArray& pos : ring.arrays)
        {
            if (pos.hasInvalidValues || !pos.arrays.empty() || pos.numbers.size() < 2)
            {
                return "invalid position";
            }
            double lon = pos.numbers[0];
            double lat = pos.numbers[1];
            if (!std::isfinite(lon) || !std::isfinite(lat)) return "invalid position";
            points.push_back(Point::ofLonLat(lon, lat));
        }
    }
    polygons.emplace_back(std::move(result));
    return nullptr;
}

const char* ZoneParser::buildPolygons(const Geometry& geometry, std::vector<Polygon>& polygons)
{
    if (!geometry.hasCoordinates) return "geometry has no coordinates";
    if (geometry.type == "Polygon")
    {
        return buildPolygon(geometry.coordinates, polygons);
    }
    if (geometry.type == "MultiPolygon")
    {
        if (geometry.coordinates.arrays.empty() || !geometry.coordinates.numbers.empty())
        {
            return "multipolygon must be an array of polygons";
        }
        for (const CoordinateArray& polygon : geometry.coordinates.arrays)
        {
            const char* reason = buildPolygon(polygon, polygons);
            if (reason) return reason;
        }
        return nullptr;
    }
    return "unsupported geometry type";
}

void ZoneParser::skipFeature(int index, const char* reason)
{
    skippedCount_++;
    Console::msg("Skipped feature #%d: %s", index + 1, reason);
}

void ZoneParser::addZone(Feature& feature, int index)
{
    if (!feature.hasGeometry)
    {
        skipFeature(index, "no geometry");
        return;
    }
    std::vector<Polygon> polygons;
    const char* reason = buildPolygons(feature.geometry, polygons);
    if (reason)
    {
        skipFeature(index, reason);
        return;
    }

    ZoneType type;
    std::string id;
    if (!feature.quadra.empty())
    {
        type = ZoneType::QUADRA;
        id = std::move(feature.quadra);
    }
    else if (!feature.canteiro.empty())
    {
        type = ZoneType::CANTEIRO;
        id = std::move(feature.canteiro);
    }
    else
    {
        type = ZoneType::UNKNOWN;
        id = "Unknown";
    }
    zones_.emplace_back(type, std::move(id), std::move(feature.sigla), std::move(polygons));
}
