// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include "ZoneClassifier.h"
#include "util/TextUtils.h"

std::string ZoneClassifier::normalizeSigla(std::string_view sigla)
{
    std::string_view s = TextUtils::trim(sigla);
    if (s.empty() ||
        TextUtils::equalsIgnoreCase(s, "sem sigla") ||
        TextUtils::equalsIgnoreCase(s, "desconhecida") ||
        TextUtils::equalsIgnoreCase(s, Classification::UNKNOWN))
    {
        return Classification::UNKNOWN;
    }
    return std::string(s);
}

Classification ZoneClassifier::classify(const std::optional<Point>& location) const
{
    Classification result;
    if (!location) return result;

    const Zone* zone = index_.containing(*location);
    double distance = 0;
    if (!zone)
    {
        zone = index_.nearest(*location, &distance);
        if (!zone) return result;
    }
    result.type = zone->type();
    result.zoneId = zone->id();
    result.sigla = normalizeSigla(zone->sigla());
    result.distance = distance;
    return result;
}
