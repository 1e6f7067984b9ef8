// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include "ZoneIndex.h"

struct Classification
{
    ZoneType type = ZoneType::UNKNOWN;
    std::string zoneId = UNKNOWN;
    std::string sigla = UNKNOWN;
    double distance = std::numeric_limits<double>::infinity();

    bool isInside() const { return distance == 0; }
    bool hasZone() const { return distance != std::numeric_limits<double>::infinity(); }

    static constexpr const char* UNKNOWN = "Unknown";
};

// Resolves an image location to the zone that contains it, or else to
// the nearest zone. Images without a location resolve to the unknown
// sentinel, as do zones without a usable sigla (for the sigla only).

class ZoneClassifier
{
public:
    explicit ZoneClassifier(const ZoneIndex& index) : index_(index) {}

    Classification classify(const std::optional<Point>& location) const;

    /// Collapses empty, "sem sigla" and "desconhecida" (in any case)
    /// to "Unknown"; other values are trimmed.
    static std::string normalizeSigla(std::string_view sigla);

private:
    const ZoneIndex& index_;
};
