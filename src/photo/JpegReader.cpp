// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include "JpegReader.h"
#include <cmath>
#include <cstring>

// Bounds-checked access to a TIFF structure (the payload of an EXIF
// segment), in either byte order

class JpegReader::TiffReader
{
public:
    TiffReader(const uint8_t* p, size_t size) : p_(p), size_(size) {}

    bool readHeader(uint32_t* pFirstIfd)
    {
        if (size_ < 8) return false;
        if (p_[0] == 'I' && p_[1] == 'I')
        {
            bigEndian_ = false;
        }
        else if (p_[0] == 'M' && p_[1] == 'M')
        {
            bigEndian_ = true;
        }
        else
        {
            return false;
        }
        if (u16(2) != 42) return false;
        *pFirstIfd = u32(4);
        return true;
    }

    bool has(size_t ofs, size_t len) const
    {
        return ofs <= size_ && len <= size_ - ofs;
    }

    uint16_t u16(size_t ofs) const
    {
        return bigEndian_ ?
            static_cast<uint16_t>((p_[ofs] << 8) | p_[ofs + 1]) :
            static_cast<uint16_t>(p_[ofs] | (p_[ofs + 1] << 8));
    }

    uint32_t u32(size_t ofs) const
    {
        return bigEndian_ ?
            (static_cast<uint32_t>(p_[ofs]) << 24) | (p_[ofs + 1] << 16) |
                (p_[ofs + 2] << 8) | p_[ofs + 3] :
            (static_cast<uint32_t>(p_[ofs + 3]) << 24) | (p_[ofs + 2] << 16) |
                (p_[ofs + 1] << 8) | p_[ofs];
    }

    struct Entry
    {
        uint16_t tag;
        uint16_t type;
        uint32_t count;
        size_t valueOfs;        // where the value bytes start
    };

    /// Reads the entries of the IFD at `ofs`; returns false if the
    /// directory runs past the end of the data
    bool readIfd(size_t ofs, std::vector<Entry>& entries) const
    {
        entries.clear();
        if (!has(ofs, 2)) return false;
        uint16_t count = u16(ofs);
        if (!has(ofs + 2, static_cast<size_t>(count) * 12)) return false;
        for (int i = 0; i < count; i++)
        {
            size_t p = ofs + 2 + static_cast<size_t>(i) * 12;
            Entry e;
            e.tag = u16(p);
            e.type = u16(p + 2);
            e.count = u32(p + 4);
            size_t len = static_cast<size_t>(e.count) * typeSize(e.type);
            e.valueOfs = len <= 4 ? p + 8 : u32(p + 8);
            if (typeSize(e.type) == 0 || !has(e.valueOfs, len)) continue;
            entries.push_back(e);
        }
        return true;
    }

    static size_t typeSize(uint16_t type)
    {
        switch (type)
        {
        case 1: case 2: case 6: case 7:
            return 1;
        case 3: case 8:
            return 2;
        case 4: case 9: case 11:
            return 4;
        case 5: case 10: case 12:
            return 8;
        default:
            return 0;
        }
    }

    uint32_t integer(const Entry& e) const
    {
        if (e.type == 3) return u16(e.valueOfs);
        if (e.type == 4) return u32(e.valueOfs);
        if (e.type == 1) return p_[e.valueOfs];
        return 0;
    }

    std::string ascii(const Entry& e) const
    {
        const char* s = reinterpret_cast<const char*>(p_ + e.valueOfs);
        size_t len = 0;
        while (len < e.count && s[len] != 0) len++;
        return std::string(s, len);
    }

    /// Degrees from a (degrees, minutes, seconds) rational triple;
    /// NaN if malformed
    double degrees(const Entry& e) const
    {
        if (e.type != 5 || e.count < 3) return std::nan("");
        double result = 0;
        double scale = 1;
        for (int i = 0; i < 3; i++)
        {
            uint32_t num = u32(e.valueOfs + i * 8);
            uint32_t den = u32(e.valueOfs + i * 8 + 4);
            if (den == 0)
            {
                if (num != 0) return std::nan("");
            }
            else
            {
                result += static_cast<double>(num) / den / scale;
            }
            scale *= 60;
        }
        return result;
    }

private:
    const uint8_t* p_;
    size_t size_;
    bool bigEndian_ = false;
};

JpegReader::JpegReader(const uint8_t* data, size_t size) :
    data_(data),
    size_(size)
{
}

bool JpegReader::read()
{
    if (!isJpeg(data_, size_))
    {
        error_ = "Not a JPEG file";
        return false;
    }
    size_t pos = 2;
    for (;;)
    {
        // Skip fill bytes
        while (pos < size_ && data_[pos] == 0xFF && pos + 1 < size_ && data_[pos + 1] == 0xFF)
        {
            pos++;
        }
        if (pos + 4 > size_ || data_[pos] != 0xFF)
        {
            error_ = "Truncated or corrupt JPEG segment structure";
            return false;
        }
        uint8_t marker = data_[pos + 1];
        if (marker == 0x01 || (marker >= 0xD0 && marker <= 0xD7))
        {
            pos += 2;       // standalone markers
            continue;
        }
        if (marker == 0xD9)
        {
            error_ = "JPEG ends before its image data";
            return false;
        }
        size_t length = (static_cast<size_t>(data_[pos + 2]) << 8) | data_[pos + 3];
        if (length < 2 || pos + 2 + length > size_)
        {
            error_ = "Truncated JPEG segment";
            return false;
        }
        const uint8_t* payload = data_ + pos + 4;
        size_t payloadSize = length - 2;

        if (marker == 0xDA)     // SOS
        {
            scanOffset_ = pos;
            break;
        }
        segments_.push_back({ marker, pos, length + 2 });

        if (marker == 0xE1 && payloadSize >= 6 && std::memcmp(payload, "Exif\0\0", 6) == 0)
        {
            if (!hasExif_)
            {
                hasExif_ = true;
                readExif(payload + 6, payloadSize - 6);
            }
        }
        else if (marker >= 0xC0 && marker <= 0xCF &&
            marker != 0xC4 && marker != 0xC8 && marker != 0xCC)
        {
            if (payloadSize < 6)
            {
                error_ = "Truncated frame header";
                return false;
            }
            height_ = (payload[1] << 8) | payload[2];
            width_ = (payload[3] << 8) | payload[4];
            components_ = payload[5];
        }
        pos += 2 + length;
    }

    if (width_ <= 0 || height_ <= 0 || components_ == 0)
    {
        error_ = "JPEG has no valid frame header";
        return false;
    }
    return true;
}

void JpegReader::readExif(const uint8_t* p, size_t size)
{
    TiffReader tiff(p, size);
    uint32_t ifd0;
    if (!tiff.readHeader(&ifd0))
    {
        exifProblem_ = "Invalid TIFF header in EXIF block";
        return;
    }

    std::vector<TiffReader::Entry> entries;
    if (!tiff.readIfd(ifd0, entries))
    {
        exifProblem_ = "Truncated EXIF directory";
        return;
    }

    uint32_t exifIfd = 0;
    uint32_t gpsIfd = 0;
    std::optional<CaptureTime> dateTime;
    for (const TiffReader::Entry& e : entries)
    {
        switch (e.tag)
        {
        case TAG_ORIENTATION:
        {
            uint32_t v = tiff.integer(e);
            if (v >= 1 && v <= 8) exif_.orientation = static_cast<int>(v);
            break;
        }
        case TAG_DATE_TIME:
            if (e.type == 2) dateTime = CaptureTime::parseExif(tiff.ascii(e));
            break;
        case TAG_EXIF_IFD:
            exifIfd = tiff.integer(e);
            break;
        case TAG_GPS_IFD:
            gpsIfd = tiff.integer(e);
            break;
        default:
            break;
        }
    }

    std::optional<CaptureTime> original;
    std::optional<CaptureTime> digitized;
    if (exifIfd)
    {
        if (tiff.readIfd(exifIfd, entries))
        {
            for (const TiffReader::Entry& e : entries)
            {
                if (e.type != 2) continue;
                if (e.tag == TAG_DATE_TIME_ORIGINAL)
                {
                    original = CaptureTime::parseExif(tiff.ascii(e));
                }
                else if (e.tag == TAG_DATE_TIME_DIGITIZED)
                {
                    digitized = CaptureTime::parseExif(tiff.ascii(e));
                }
            }
        }
        else
        {
            exifProblem_ = "Truncated EXIF sub-directory";
        }
    }
    exif_.capturedAt = original ? original : (digitized ? digitized : dateTime);

    if (gpsIfd)
    {
        if (!tiff.readIfd(gpsIfd, entries))
        {
            exifProblem_ = "Truncated GPS directory";
            return;
        }
        char latRef = 0;
        char lonRef = 0;
        double lat = std::nan("");
        double lon = std::nan("");
        for (const TiffReader::Entry& e : entries)
        {
            switch (e.tag)
            {
            case TAG_GPS_LATITUDE_REF:
                if (e.type == 2 && e.count > 0) latRef = tiff.ascii(e).c_str()[0];
                break;
            case TAG_GPS_LATITUDE:
                lat = tiff.degrees(e);
                break;
            case TAG_GPS_LONGITUDE_REF:
                if (e.type == 2 && e.count > 0) lonRef = tiff.ascii(e).c_str()[0];
                break;
            case TAG_GPS_LONGITUDE:
                lon = tiff.degrees(e);
                break;
            default:
                break;
            }
        }
        if (std::isnan(lat) && std::isnan(lon)) return;    // GPS block without a fix
        if (std::isnan(lat) || std::isnan(lon) || lat > 90 || lon > 180)
        {
            exifProblem_ = "Unusable GPS coordinates";
            return;
        }
        if (latRef == 'S' || latRef == 's') lat = -lat;
        if (lonRef == 'W' || lonRef == 'w') lon = -lon;
        exif_.location = Point::ofLonLat(lon, lat);
    }
}

std::vector<uint8_t> JpegReader::strippedCopy() const
{
    std::vector<uint8_t> out;
    out.reserve(size_);
    out.push_back(0xFF);
    out.push_back(0xD8);
    for (const Segment& seg : segments_)
    {
        bool isApp = seg.marker >= 0xE1 && seg.marker <= 0xEF && seg.marker != 0xEE;
        if (isApp || seg.marker == 0xFE) continue;
        out.insert(out.end(), data_ + seg.start, data_ + seg.start + seg.length);
    }
    out.insert(out.end(), data_ + scanOffset_, data_ + size_);
    return out;
}
