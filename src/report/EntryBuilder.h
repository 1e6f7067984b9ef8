// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once
#include <vector>
#include "Entry.h"
#include "EditStore.h"
#include "photo/ImageRecord.h"
#include "zone/ZoneClassifier.h"

struct ClassifiedImage
{
    ImageRecord record;
    Classification classification;
};

// Turns classified images and the user's edits into report entries.
// Only included images become entries; they are ordered by their
// persisted order (entries without one follow), then by file name.

class EntryBuilder
{
public:
    EntryBuilder(const EditStore& edits, bool disableStates) :
        edits_(edits),
        disableStates_(disableStates)
    {
    }

    std::vector<Entry> build(const std::vector<ClassifiedImage>& images) const;

    /// The caption of the entry shown at 1-based position `number`
    RichText caption(int number, const ClassifiedImage& image,
        const std::string& status, const std::string& comment) const;

    static std::string mapsUrl(const Point& location);

    /// Label of the zone-id caption line: "Quadra", "Canteiro" or "Área"
    static const char* zoneLabel(ZoneType type);

private:
    const EditStore& edits_;
    bool disableStates_;
};
