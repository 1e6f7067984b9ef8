// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once
#include <memory>
#include <string>
#include "photo/ImageRecord.h"
#include "RichText.h"
#include "zone/Zone.h"

// One photo cell of the report, in display order

struct Entry
{
    std::string fileName;
    std::shared_ptr<const Thumbnail> thumbnail;
    int orientation = 1;
    RichText caption;
    std::string status;         // empty if states are disabled
    ZoneType zoneType = ZoneType::UNKNOWN;
    std::string zoneId;
    std::string sigla;
    std::string comment;
};
