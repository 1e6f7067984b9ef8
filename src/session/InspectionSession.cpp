// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include "InspectionSession.h"
#include <clarisma/cli/Console.h>
#include "layout/ReportRenderer.h"
#include "photo/PhotoScanner.h"
#include "report/EntryAggregator.h"
#include "zone/ZoneClassifier.h"
#include "zone/ZoneException.h"

using namespace clarisma;

InspectionSession::InspectionSession(std::filesystem::path photoDir, size_t cacheCapacity) :
    photoDir_(std::move(photoDir)),
    cache_(cacheCapacity)
{
}

void InspectionSession::loadZones(const char* fileName)
{
    zones_ = ZoneIndex::load(fileName);
}

const std::vector<ClassifiedImage>& InspectionSession::classify(const ProgressCallback& progress)
{
    if (!zones_) throw ZoneException("No zone dataset loaded");

    PhotoScanner scanner(&cache_);
    std::vector<ImageRecord> records = scanner.scan(photoDir_, progress);
    ZoneClassifier classifier(*zones_);

    images_.clear();
    images_.reserve(records.size());
    int outside = 0;
    for (ImageRecord& record : records)
    {
        Classification c = classifier.classify(record.location);
        if (c.hasZone() && !c.isInside()) outside++;
        images_.push_back({ std::move(record), std::move(c) });
    }
    Console::log("Classified %d images (%d outside of any zone, %d skipped)",
        static_cast<int>(images_.size()), outside, scanner.droppedCount());
    return images_;
}

std::vector<std::string> InspectionSession::rename(const ProgressCallback& progress)
{
    std::vector<NamingPipeline::Item> items;
    items.reserve(images_.size());
    for (const ClassifiedImage& image : images_)
    {
        items.push_back({ image.record.fileName(),
            image.classification.sigla, image.record.capturedAt });
    }
    std::vector<std::string> names = naming_.run(photoDir_, items, progress);
    Console::log("Renamed images (%d in place or renamed, %d failed)",
        static_cast<int>(names.size()), static_cast<int>(naming_.failures().size()));

    // File names changed; the cache keeps the thumbnails
    classify();
    return names;
}

PagePlan InspectionSession::report(const char* fileName, const ReportSettings& settings,
    const ReportOptions& options, const EditStore& edits)
{
    EntryBuilder builder(edits, options.disableStates);
    std::vector<Entry> entries = builder.build(images_);
    entryCount_ = entries.size();
    AggregatedTables tables = EntryAggregator::aggregate(entries);

    ReportLayout layout(settings, options, entries, tables);
    ReportRenderer renderer(layout);
    PagePlan plan = renderer.render(fileName, settings.title());
    Console::log("Wrote %s (%d pages, %d images)", fileName,
        plan.totalPages, static_cast<int>(entryCount_));
    return plan;
}
