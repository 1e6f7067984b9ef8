// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once
#include <string>
#include <string_view>
#include <vector>
#include "Polygon.h"

enum class ZoneType
{
    QUADRA,
    CANTEIRO,
    UNKNOWN
};

inline const char* zoneTypeName(ZoneType type)
{
    switch (type)
    {
    case ZoneType::QUADRA:
        return "Quadra";
    case ZoneType::CANTEIRO:
        return "Canteiro";
    default:
        return "Unknown";
    }
}

class Zone
{
public:
    Zone(ZoneType type, std::string id, std::string sigla, std::vector<Polygon> polygons);

    ZoneType type() const { return type_; }
    const std::string& id() const { return id_; }
    const std::string& sigla() const { return sigla_; }
    const std::vector<Polygon>& polygons() const { return polygons_; }
    const Bounds& bounds() const { return bounds_; }

    bool contains(Point p) const;
    double distance(Point p) const;

private:
    ZoneType type_;
    std::string id_;
    std::string sigla_;
    std::vector<Polygon> polygons_;
    Bounds bounds_;
};
