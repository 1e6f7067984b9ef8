// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include "CaptureTime.h"
#include <chrono>
#include <cstdio>
#include <ctime>

namespace
{
    bool parseDigits(std::string_view s, size_t pos, size_t count, int* pValue)
    {
        if (pos + count > s.size()) return false;
        int v = 0;
        for (size_t i = pos; i < pos + count; i++)
        {
            char ch = s[i];
            if (ch < '0' || ch > '9') return false;
            v = v * 10 + (ch - '0');
        }
        *pValue = v;
        return true;
    }

    bool isDateSeparator(char ch)
    {
        return ch == ':' || ch == '-';
    }
}

std::optional<CaptureTime> CaptureTime::parseExif(std::string_view s)
{
    CaptureTime t;
    if (s.size() < 19) return std::nullopt;
    if (!parseDigits(s, 0, 4, &t.year) || !isDateSeparator(s[4]) ||
        !parseDigits(s, 5, 2, &t.month) || !isDateSeparator(s[7]) ||
        !parseDigits(s, 8, 2, &t.day) || (s[10] != ' ' && s[10] != 'T') ||
        !parseDigits(s, 11, 2, &t.hour) || s[13] != ':' ||
        !parseDigits(s, 14, 2, &t.minute) || s[16] != ':' ||
        !parseDigits(s, 17, 2, &t.second))
    {
        return std::nullopt;
    }
    // Cameras without a clock set write "0000:00:00 00:00:00"
    if (t.year == 0 || t.month < 1 || t.month > 12 || t.day < 1 || t.day > 31 ||
        t.hour > 23 || t.minute > 59 || t.second > 60)
    {
        return std::nullopt;
    }
    return t;
}

CaptureTime CaptureTime::ofFileTime(std::filesystem::file_time_type time)
{
    auto sys = std::chrono::file_clock::to_sys(time);
    std::time_t secs = std::chrono::system_clock::to_time_t(
        std::chrono::time_point_cast<std::chrono::system_clock::duration>(sys));
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &secs);
#else
    localtime_r(&secs, &tm);
#endif
    CaptureTime t;
    t.year = tm.tm_year + 1900;
    t.month = tm.tm_mon + 1;
    t.day = tm.tm_mday;
    t.hour = tm.tm_hour;
    t.minute = tm.tm_min;
    t.second = tm.tm_sec;
    return t;
}

std::string CaptureTime::toDisplayString() const
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02d/%02d/%04d %02d:%02d:%02d",
        day, month, year, hour, minute, second);
    return buf;
}
