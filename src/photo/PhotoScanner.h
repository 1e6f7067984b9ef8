// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once
#include <filesystem>
#include <string_view>
#include <vector>
#include "ImageRecord.h"
#include "RecordResult.h"
#include "util/Progress.h"

class ThumbnailCache;

// Turns the image files of a directory into ImageRecords. Each file
// yields its own RecordResult; problems with one file never affect
// the others.

class PhotoScanner
{
public:
    explicit PhotoScanner(ThumbnailCache* cache = nullptr) : cache_(cache) {}

    /// True for .jpg, .jpeg, .png and .heic (in any case)
    static bool isImageFile(const std::filesystem::path& path);
    static bool isJpegFile(const std::filesystem::path& path);

    /// Image files of a directory, sorted by file name
    static std::vector<std::filesystem::path> list(const std::filesystem::path& dir);

    RecordResult<ImageRecord> read(const std::filesystem::path& file);

    /// Reads all images of a directory. Dropped records are logged and
    /// left out; degraded records are logged and kept.
    std::vector<ImageRecord> scan(const std::filesystem::path& dir,
        const ProgressCallback& progress = nullptr);

    int droppedCount() const { return droppedCount_; }
    int degradedCount() const { return degradedCount_; }

private:
    RecordResult<ImageRecord> readBytes(ImageRecord& record, const uint8_t* data, size_t size);
    RecordResult<ImageRecord> readJpeg(ImageRecord& record, const uint8_t* data, size_t size);

    ThumbnailCache* cache_;
    int droppedCount_ = 0;
    int degradedCount_ = 0;
};
