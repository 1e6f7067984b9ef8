// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include "Polygon.h"
#include <algorithm>
#include <cmath>
#include <limits>

Polygon::Polygon(std::vector<Ring> rings) :
    rings_(std::move(rings))
{
    for (Ring& ring : rings_)
    {
        if (!ring.empty() && ring.front() != ring.back())
        {
            ring.push_back(ring.front());
        }
    }
    if (!rings_.empty())
    {
        for (Point p : rings_.front()) bounds_.expandToInclude(p);
    }
}

bool Polygon::isOnSegment(Point p, Point a, Point b)
{
    double cross = (b.x - a.x) * (p.y - a.y) - (b.y - a.y) * (p.x - a.x);
    if (cross != 0) return false;
    return p.x >= std::min(a.x, b.x) && p.x <= std::max(a.x, b.x) &&
        p.y >= std::min(a.y, b.y) && p.y <= std::max(a.y, b.y);
}

bool Polygon::contains(Point p) const
{
    if (rings_.empty() || !bounds_.contains(p)) return false;

    // Even-odd crossing count over all rings, so holes cancel out
    bool inside = false;
    for (const Ring& ring : rings_)
    {
        for (size_t i = 1; i < ring.size(); i++)
        {
            Point a = ring[i - 1];
            Point b = ring[i];
            if (isOnSegment(p, a, b)) return false;
            if ((a.y > p.y) != (b.y > p.y))
            {
                double xCross = a.x + (p.y - a.y) * (b.x - a.x) / (b.y - a.y);
                if (p.x < xCross) inside = !inside;
            }
        }
    }
    return inside;
}

double Polygon::segmentDistance(Point p, Point a, Point b)
{
    double dx = b.x - a.x;
    double dy = b.y - a.y;
    double lenSquared = dx * dx + dy * dy;
    double t = 0;
    if (lenSquared > 0)
    {
        t = ((p.x - a.x) * dx + (p.y - a.y) * dy) / lenSquared;
        t = std::clamp(t, 0.0, 1.0);
    }
    double nx = a.x + t * dx - p.x;
    double ny = a.y + t * dy - p.y;
    return std::sqrt(nx * nx + ny * ny);
}

double Polygon::distance(Point p) const
{
    double best = std::numeric_limits<double>::infinity();
    for (const Ring& ring : rings_)
    {
        for (size_t i = 1; i < ring.size(); i++)
        {
            best = std::min(best, segmentDistance(p, ring[i - 1], ring[i]));
        }
    }
    return best;
}
