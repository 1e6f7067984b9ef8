// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include "ZoneIndex.h"
#include <limits>
#include <clarisma/cli/Console.h>
#include <clarisma/io/File.h>
#include "ZoneException.h"
#include "ZoneParser.h"

using namespace clarisma;

ZoneIndex::ZoneIndex(std::vector<Zone> zones) :
    zones_(std::move(zones))
{
    for (const Zone& zone : zones_)
    {
        bounds_.expandToInclude(zone.bounds());
    }
}

ZoneIndex ZoneIndex::load(const char* fileName)
{
    if (!File::exists(fileName))
    {
        throw ZoneException("Zone dataset not found: %s", fileName);
    }

    std::vector<Zone> zones;
    int skipped;
    try
    {
        std::string json = File::readString(fileName);
        ZoneParser parser(json.c_str());
        zones = parser.parse();
        skipped = parser.skippedCount();
    }
    catch (const std::exception& ex)
    {
        throw ZoneException("Unable to read zone dataset %s: %s", fileName, ex.what());
    }

    if (zones.empty())
    {
        throw ZoneException("Zone dataset %s contains no usable zones", fileName);
    }
    Console::log("Loaded %d zones (%d features skipped)",
        static_cast<int>(zones.size()), skipped);
    return ZoneIndex(std::move(zones));
}

const Zone* ZoneIndex::containing(Point p) const
{
    for (const Zone& zone : zones_)
    {
        if (zone.contains(p)) return &zone;
    }
    return nullptr;
}

const Zone* ZoneIndex::nearest(Point p, double* pDistance) const
{
    const Zone* best = nullptr;
    double bestDistance = std::numeric_limits<double>::infinity();
    for (const Zone& zone : zones_)
    {
        // A later zone must be strictly closer to win
        if (zone.bounds().distance(p) >= bestDistance) continue;
        double d = zone.distance(p);
        if (d < bestDistance)
        {
            best = &zone;
            bestDistance = d;
        }
    }
    if (pDistance) *pDistance = bestDistance;
    return best;
}
