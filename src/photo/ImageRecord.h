// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "CaptureTime.h"
#include "zone/Point.h"

/// Clockwise quarter turns needed to display an image with the given
/// EXIF orientation upright
inline int quarterTurns(int orientation)
{
    switch (orientation)
    {
    case 3: case 4: return 2;
    case 5: case 6: return 1;
    case 7: case 8: return 3;
    default: return 0;
    }
}

// JPEG data ready for embedding. Shared by all files with the same
// image data, so it carries nothing taken from the metadata.

struct Thumbnail
{
    std::vector<uint8_t> jpeg;
    int width = 0;
    int height = 0;
    int components = 3;

    int displayWidth(int turns) const { return (turns & 1) ? height : width; }
    int displayHeight(int turns) const { return (turns & 1) ? width : height; }
};

struct ImageRecord
{
    std::filesystem::path path;
    CaptureTime capturedAt;
    std::optional<Point> location;
    std::string contentHash;
    int orientation = 1;                            // EXIF, 1 to 8
    std::shared_ptr<const Thumbnail> thumbnail;     // null if not embeddable

    std::string fileName() const { return path.filename().string(); }
};
