// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once
#include <cmath>

// A position in degrees. Zone geometry treats longitude/latitude as
// planar Cartesian coordinates (x = longitude, y = latitude).

struct Point
{
    double x;
    double y;

    static Point ofLonLat(double lon, double lat) { return { lon, lat }; }

    double lon() const { return x; }
    double lat() const { return y; }

    bool operator==(const Point& other) const = default;
};

struct Bounds
{
    double minX = 0;
    double minY = 0;
    double maxX = -1;
    double maxY = -1;

    bool isEmpty() const { return minX > maxX; }

    void expandToInclude(Point p)
    {
        if (isEmpty())
        {
            minX = maxX = p.x;
            minY = maxY = p.y;
            return;
        }
        if (p.x < minX) minX = p.x;
        if (p.x > maxX) maxX = p.x;
        if (p.y < minY) minY = p.y;
        if (p.y > maxY) maxY = p.y;
    }

    void expandToInclude(const Bounds& b)
    {
        if (b.isEmpty()) return;
        expandToInclude(Point{ b.minX, b.minY });
        expandToInclude(Point{ b.maxX, b.maxY });
    }

    bool contains(Point p) const
    {
        return p.x >= minX && p.x <= maxX && p.y >= minY && p.y <= maxY;
    }

    /// Lower bound for the distance from p to anything inside the box
    double distance(Point p) const
    {
        double dx = p.x < minX ? minX - p.x : (p.x > maxX ? p.x - maxX : 0);
        double dy = p.y < minY ? minY - p.y : (p.y > maxY ? p.y - maxY : 0);
        return std::sqrt(dx * dx + dy * dy);
    }
};
