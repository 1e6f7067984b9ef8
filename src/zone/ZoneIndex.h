// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once
#include <vector>
#include "Zone.h"

// The zones of one dataset, in load order. Queries scan the zones in
// that order, so the first of several overlapping zones wins, and ties
// in nearest-distance go to the earlier zone. Bounding boxes only
// prune; they never change a result.

class ZoneIndex
{
public:
    ZoneIndex() = default;
    explicit ZoneIndex(std::vector<Zone> zones);

    /// Loads a GeoJSON dataset. Throws ZoneException if the file is
    /// missing, malformed or holds no usable zone.
    static ZoneIndex load(const char* fileName);

    const std::vector<Zone>& zones() const { return zones_; }
    size_t size() const { return zones_.size(); }
    bool isEmpty() const { return zones_.empty(); }
    const Bounds& bounds() const { return bounds_; }

    const Zone* containing(Point p) const;
    const Zone* nearest(Point p, double* pDistance) const;

private:
    std::vector<Zone> zones_;
    Bounds bounds_;
};
