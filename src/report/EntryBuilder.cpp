// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include "EntryBuilder.h"
#include <algorithm>
#include <cstdio>
#include "util/TextUtils.h"

namespace
{
    struct Included
    {
        const ClassifiedImage* image;
        const ImageEdit* edit;      // null if never edited
        std::string fileName;
    };

    void addLabeled(RichText::Line& line, const char* label, std::string value)
    {
        line.push_back({ label, true });
        line.push_back({ " " + std::move(value) });
    }
}

const char* EntryBuilder::zoneLabel(ZoneType type)
{
    switch (type)
    {
    case ZoneType::QUADRA:
        return "Quadra";
    case ZoneType::CANTEIRO:
        return "Canteiro";
    default:
        return "Área";
    }
}

std::string EntryBuilder::mapsUrl(const Point& location)
{
    char buf[96];
    std::snprintf(buf, sizeof(buf), "https://www.google.com/maps?q=%.6f,%.6f",
        location.lat(), location.lon());
    return buf;
}

RichText EntryBuilder::caption(int number, const ClassifiedImage& image,
    const std::string& status, const std::string& comment) const
{
    const Classification& c = image.classification;
    RichText text;
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%03d", number);
    text.newLine().push_back({ buf, true });

    addLabeled(text.newLine(), "Data e hora:", image.record.capturedAt.toDisplayString());

    RichText::Line& zoneLine = text.newLine();
    addLabeled(zoneLine, zoneLabel(c.type), c.zoneId + ",");
    zoneLine.push_back({ " " });
    addLabeled(zoneLine, "Sigla:", c.sigla);

    RichText::Line& locationLine = text.newLine();
    locationLine.push_back({ "Localização:", true });
    locationLine.push_back({ " " });
    if (image.record.location)
    {
        std::string url = mapsUrl(*image.record.location);
        locationLine.push_back({ url, false, false, url });
    }
    else
    {
        locationLine.push_back({ "Sem localização" });
    }

    if (!disableStates_)
    {
        addLabeled(text.newLine(), "Estado:", status);
    }

    if (!TextUtils::trim(comment).empty())
    {
        text.newLine().push_back({ "Comentários", true, true });
        for (std::string_view line : TextUtils::lines(comment))
        {
            text.newLine().push_back({ std::string(line) });
        }
    }
    return text;
}

std::vector<Entry> EntryBuilder::build(const std::vector<ClassifiedImage>& images) const
{
    std::vector<Included> included;
    included.reserve(images.size());
    for (const ClassifiedImage& image : images)
    {
        const ImageEdit* edit = edits_.find(image.record.contentHash);
        if (edit && !edit->include && !edits_.toggleAllItems()) continue;
        included.push_back({ &image, edit, image.record.fileName() });
    }

    std::stable_sort(included.begin(), included.end(),
        [](const Included& a, const Included& b)
        {
            bool aHasOrder = a.edit && a.edit->order;
            bool bHasOrder = b.edit && b.edit->order;
            if (aHasOrder != bHasOrder) return aHasOrder;
            if (aHasOrder && *a.edit->order != *b.edit->order)
            {
                return *a.edit->order < *b.edit->order;
            }
            return a.fileName < b.fileName;
        });

    std::vector<Entry> entries;
    entries.reserve(included.size());
    int number = 0;
    for (const Included& inc : included)
    {
        const ClassifiedImage& image = *inc.image;
        const Classification& c = image.classification;
        Entry& entry = entries.emplace_back();
        entry.fileName = inc.fileName;
        entry.thumbnail = image.record.thumbnail;
        entry.orientation = image.record.orientation;
        entry.zoneType = c.type;
        entry.zoneId = c.zoneId;
        entry.sigla = c.sigla;
        if (inc.edit) entry.comment = inc.edit->comment;
        if (!disableStates_)
        {
            entry.status = inc.edit ? inc.edit->status : Status::DEFAULT;
        }
        entry.caption = caption(++number, image, entry.status, entry.comment);
    }
    return entries;
}
