// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once
#include <compare>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

// A civil date and time without time zone, as cameras record it

struct CaptureTime
{
    int year = 1970;
    int month = 1;
    int day = 1;
    int hour = 0;
    int minute = 0;
    int second = 0;

    auto operator<=>(const CaptureTime&) const = default;

    /// Parses the EXIF format "YYYY:MM:DD HH:MM:SS" (dashes are accepted
    /// as date separators). Returns nothing for blank or invalid values.
    static std::optional<CaptureTime> parseExif(std::string_view s);

    /// Local time of a file's last modification
    static CaptureTime ofFileTime(std::filesystem::file_time_type time);

    std::string toDisplayString() const;    // dd/mm/YYYY HH:MM:SS
};
