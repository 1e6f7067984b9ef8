// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once
#include <vector>
#include "Point.h"

// A polygon made of an outer ring followed by zero or more holes.
// Rings are closed (first position equals last position).

class Polygon
{
public:
    using Ring = std::vector<Point>;

    Polygon() = default;
    explicit Polygon(std::vector<Ring> rings);

    const std::vector<Ring>& rings() const { return rings_; }
    const Bounds& bounds() const { return bounds_; }

    /// True if p lies in the interior. Points on the outline or on the
    /// outline of a hole are not contained.
    bool contains(Point p) const;

    /// Shortest planar distance from p to the outline (including holes)
    double distance(Point p) const;

    static double segmentDistance(Point p, Point a, Point b);

private:
    static bool isOnSegment(Point p, Point a, Point b);

    std::vector<Ring> rings_;
    Bounds bounds_;
};
