// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include "Zone.h"
#include <algorithm>
#include <limits>

Zone::Zone(ZoneType type, std::string id, std::string sigla, std::vector<Polygon> polygons) :
    type_(type),
    id_(std::move(id)),
    sigla_(std::move(sigla)),
    polygons_(std::move(polygons))
{
    for (const Polygon& polygon : polygons_)
    {
        bounds_.expandToInclude(polygon.bounds());
    }
}

bool Zone::contains(Point p) const
{
    if (!bounds_.contains(p)) return false;
    for (const Polygon& polygon : polygons_)
    {
        if (polygon.contains(p)) return true;
    }
    return false;
}

double Zone::distance(Point p) const
{
    double best = std::numeric_limits<double>::infinity();
    for (const Polygon& polygon : polygons_)
    {
        best = std::min(best, polygon.distance(p));
    }
    return best;
}
