// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "layout/PagePlan.h"
#include "layout/ReportLayout.h"
#include "naming/NamingPipeline.h"
#include "photo/ThumbnailCache.h"
#include "report/EditStore.h"
#include "report/EntryBuilder.h"
#include "report/ReportSettings.h"
#include "util/Progress.h"
#include "zone/ZoneIndex.h"

// One run over a photo directory: load the zones, scan and classify the
// images, optionally rename them, and render the report. The session
// owns the thumbnail cache, so rescans after a rename reuse the
// thumbnails of unchanged images.

class InspectionSession
{
public:
    explicit InspectionSession(std::filesystem::path photoDir,
        size_t cacheCapacity = ThumbnailCache::DEFAULT_CAPACITY);

    const std::filesystem::path& photoDir() const { return photoDir_; }

    /// Throws ZoneException if the dataset is missing, malformed or empty
    void loadZones(const char* fileName);
    bool hasZones() const { return zones_.has_value(); }

    /// Scans the directory and classifies every readable image. Throws
    /// ZoneException if no zones have been loaded.
    const std::vector<ClassifiedImage>& classify(const ProgressCallback& progress = nullptr);
    const std::vector<ClassifiedImage>& images() const { return images_; }

    /// Renames the classified images into canonical names, then scans
    /// and classifies the directory again. Returns the final names.
    std::vector<std::string> rename(const ProgressCallback& progress = nullptr);
    const std::vector<NamingPipeline::Failure>& renameFailures() const
    {
        return naming_.failures();
    }

    std::filesystem::path editStorePath() const
    {
        return photoDir_ / EditStore::FILE_NAME;
    }

    /// Builds the entries of the report and renders it as a PDF
    PagePlan report(const char* fileName, const ReportSettings& settings,
        const ReportOptions& options, const EditStore& edits);

    size_t entryCount() const { return entryCount_; }
    const ThumbnailCache& cache() const { return cache_; }

private:
    std::filesystem::path photoDir_;
    ThumbnailCache cache_;
    std::optional<ZoneIndex> zones_;
    std::vector<ClassifiedImage> images_;
    NamingPipeline naming_;
    size_t entryCount_ = 0;
};
