// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once
#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

// A scratch directory that is removed with everything in it

class TempDir
{
public:
    TempDir()
    {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
            ("vistoria-test-" + std::to_string(rd()) + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }

    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path operator/(std::string_view name) const { return path_ / name; }

    void write(std::string_view name, std::string_view content) const
    {
        std::ofstream out(path_ / name, std::ios::binary);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
    }

    void write(std::string_view name, const std::vector<uint8_t>& content) const
    {
        std::ofstream out(path_ / name, std::ios::binary);
        out.write(reinterpret_cast<const char*>(content.data()),
            static_cast<std::streamsize>(content.size()));
    }

    std::vector<std::string> fileNames() const
    {
        std::vector<std::string> names;
        for (const auto& entry : std::filesystem::directory_iterator(path_))
        {
            names.push_back(entry.path().filename().string());
        }
        std::sort(names.begin(), names.end());
        return names;
    }

private:
    std::filesystem::path path_;
};

// Builds minimal baseline JPEG files: a frame header, an optional EXIF
// block and a few bytes of "entropy-coded" data. Nothing decodes them;
// they only need a valid segment structure.

class TestJpeg
{
public:
    int width = 640;
    int height = 480;
    int orientation = 1;
    std::string dateTimeOriginal;       // "YYYY:MM:DD HH:MM:SS"
    std::optional<double> lat;
    std::optional<double> lon;
    std::vector<uint8_t> scanData = { 0x12, 0x34, 0x56, 0x78 };
    bool withComment = false;

    std::vector<uint8_t> build() const
    {
        std::vector<uint8_t> out = { 0xFF, 0xD8 };
        // JFIF
        segment(out, 0xE0, { 'J', 'F', 'I', 'F', 0, 1, 1, 0, 0, 1, 0, 1, 0, 0 });
        if (orientation != 1 || !dateTimeOriginal.empty() || lat)
        {
            std::vector<uint8_t> exif = { 'E', 'x', 'i', 'f', 0, 0 };
            std::vector<uint8_t> tiff = buildTiff();
            exif.insert(exif.end(), tiff.begin(), tiff.end());
            segment(out, 0xE1, exif);
        }
        if (withComment) segment(out, 0xFE, { 'h', 'e', 'l', 'l', 'o' });
        segment(out, 0xC0,
        {
            8,
            static_cast<uint8_t>(height >> 8), static_cast<uint8_t>(height),
            static_cast<uint8_t>(width >> 8), static_cast<uint8_t>(width),
            3, 1, 0x22, 0, 2, 0x11, 1, 3, 0x11, 1
        });
        segment(out, 0xDA, { 3, 1, 0x00, 2, 0x11, 3, 0x11, 0, 63, 0 });
        out.insert(out.end(), scanData.begin(), scanData.end());
        out.push_back(0xFF);
        out.push_back(0xD9);
        return out;
    }

private:
    static void segment(std::vector<uint8_t>& out, uint8_t marker,
        const std::vector<uint8_t>& payload)
    {
        size_t len = payload.size() + 2;
        out.push_back(0xFF);
        out.push_back(marker);
        out.push_back(static_cast<uint8_t>(len >> 8));
        out.push_back(static_cast<uint8_t>(len));
        out.insert(out.end(), payload.begin(), payload.end());
    }

    static void put16(std::vector<uint8_t>& b, size_t ofs, uint32_t v)
    {
        b[ofs] = static_cast<uint8_t>(v);
        b[ofs + 1] = static_cast<uint8_t>(v >> 8);
    }

    static void put32(std::vector<uint8_t>& b, size_t ofs, uint32_t v)
    {
        for (int i = 0; i < 4; i++) b[ofs + i] = static_cast<uint8_t>(v >> (i * 8));
    }

    static void entry(std::vector<uint8_t>& b, size_t ofs, uint16_t tag,
        uint16_t type, uint32_t count, uint32_t value)
    {
        put16(b, ofs, tag);
        put16(b, ofs + 2, type);
        put32(b, ofs + 4, count);
        put32(b, ofs + 8, value);
    }

    static void degrees(std::vector<uint8_t>& b, size_t ofs, double value)
    {
        // whole degrees, whole minutes, seconds in 1/1000
        value = value < 0 ? -value : value;
        uint32_t d = static_cast<uint32_t>(value);
        double rest = (value - d) * 60;
        uint32_t m = static_cast<uint32_t>(rest);
        uint32_t s = static_cast<uint32_t>((rest - m) * 60 * 1000 + 0.5);
        put32(b, ofs, d);       put32(b, ofs + 4, 1);
        put32(b, ofs + 8, m);   put32(b, ofs + 12, 1);
        put32(b, ofs + 16, s);  put32(b, ofs + 20, 1000);
    }

    // Little-endian TIFF: IFD0 (orientation, EXIF and GPS pointers),
    // EXIF IFD (DateTimeOriginal), GPS IFD (latitude, longitude)
    std::vector<uint8_t> buildTiff() const
    {
        constexpr size_t IFD0 = 8;
        constexpr size_t EXIF_IFD = IFD0 + 2 + 3 * 12 + 4;
        constexpr size_t DATE = EXIF_IFD + 2 + 12 + 4;
        constexpr size_t GPS_IFD = DATE + 20;
        constexpr size_t LAT = GPS_IFD + 2 + 4 * 12 + 4;
        constexpr size_t LON = LAT + 24;
        constexpr size_t END = LON + 24;

        std::vector<uint8_t> b(END, 0);
        b[0] = 'I';
        b[1] = 'I';
        put16(b, 2, 42);
        put32(b, 4, IFD0);

        put16(b, IFD0, 3);
        entry(b, IFD0 + 2, 274, 3, 1, static_cast<uint32_t>(orientation));
        entry(b, IFD0 + 14, 34665, 4, 1, dateTimeOriginal.empty() ? 0 : EXIF_IFD);
        entry(b, IFD0 + 26, 34853, 4, 1, lat ? GPS_IFD : 0);

        put16(b, EXIF_IFD, 1);
        entry(b, EXIF_IFD + 2, 36867, 2, 20, DATE);
        for (size_t i = 0; i < dateTimeOriginal.size() && i < 19; i++)
        {
            b[DATE + i] = static_cast<uint8_t>(dateTimeOriginal[i]);
        }

        if (lat && lon)
        {
            put16(b, GPS_IFD, 4);
            entry(b, GPS_IFD + 2, 1, 2, 2, *lat < 0 ? 'S' : 'N');
            entry(b, GPS_IFD + 14, 2, 5, 3, LAT);
            entry(b, GPS_IFD + 26, 3, 2, 2, *lon < 0 ? 'W' : 'E');
            entry(b, GPS_IFD + 38, 4, 5, 3, LON);
            degrees(b, LAT, *lat);
            degrees(b, LON, *lon);
        }
        return b;
    }
};
