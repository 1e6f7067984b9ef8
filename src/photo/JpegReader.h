// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "CaptureTime.h"
#include "zone/Point.h"

// Walks the marker segments of a JPEG file to find its frame header,
// its EXIF block and the start of its entropy-coded data. No pixel
// data is decoded.

class JpegReader
{
public:
    struct Exif
    {
        std::optional<Point> location;
        std::optional<CaptureTime> capturedAt;
        int orientation = 1;
    };

    JpegReader(const uint8_t* data, size_t size);

    static bool isJpeg(const uint8_t* data, size_t size)
    {
        return size >= 3 && data[0] == 0xFF && data[1] == 0xD8 && data[2] == 0xFF;
    }

    /// Reads the segment structure; returns false (with error()) if the
    /// file has no usable frame header or scan
    bool read();

    int width() const { return width_; }
    int height() const { return height_; }
    int components() const { return components_; }
    size_t scanOffset() const { return scanOffset_; }

    bool hasExif() const { return hasExif_; }
    const Exif& exif() const { return exif_; }

    /// Describes the first problem found in the EXIF block, if any
    const std::string& exifProblem() const { return exifProblem_; }
    const std::string& error() const { return error_; }

    /// The file without APPn segments other than JFIF (APP0) and Adobe
    /// (APP14), and without comments
    std::vector<uint8_t> strippedCopy() const;

    // EXIF tags
    static constexpr uint16_t TAG_ORIENTATION = 274;
    static constexpr uint16_t TAG_DATE_TIME = 306;
    static constexpr uint16_t TAG_EXIF_IFD = 34665;
    static constexpr uint16_t TAG_GPS_IFD = 34853;
    static constexpr uint16_t TAG_DATE_TIME_ORIGINAL = 36867;
    static constexpr uint16_t TAG_DATE_TIME_DIGITIZED = 36868;
    static constexpr uint16_t TAG_GPS_LATITUDE_REF = 1;
    static constexpr uint16_t TAG_GPS_LATITUDE = 2;
    static constexpr uint16_t TAG_GPS_LONGITUDE_REF = 3;
    static constexpr uint16_t TAG_GPS_LONGITUDE = 4;

private:
    struct Segment
    {
        uint8_t marker;
        size_t start;       // offset of the 0xFF byte
        size_t length;      // including marker and length field
    };

    class TiffReader;

    void readExif(const uint8_t* p, size_t size);

    const uint8_t* data_;
    size_t size_;
    int width_ = 0;
    int height_ = 0;
    int components_ = 0;
    size_t scanOffset_ = 0;
    bool hasExif_ = false;
    Exif exif_;
    std::string exifProblem_;
    std::string error_;
    std::vector<Segment> segments_;
};
