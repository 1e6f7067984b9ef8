// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include "TextUtils.h"

namespace
{
    bool isSpace(char ch)
    {
        return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' ||
            ch == '\f' || ch == '\v';
    }

    char lower(char ch)
    {
        return (ch >= 'A' && ch <= 'Z') ? static_cast<char>(ch - 'A' + 'a') : ch;
    }
}

std::string_view TextUtils::trim(std::string_view s)
{
    size_t start = 0;
    while (start < s.size() && isSpace(s[start])) start++;
    size_t end = s.size();
    while (end > start && isSpace(s[end - 1])) end--;
    return s.substr(start, end - start);
}

std::string TextUtils::toLowerAscii(std::string_view s)
{
    std::string out(s);
    for (char& ch : out) ch = lower(ch);
    return out;
}

std::string TextUtils::toUpperAscii(std::string_view s)
{
    std::string out(s);
    for (char& ch : out)
    {
        if (ch >= 'a' && ch <= 'z') ch = static_cast<char>(ch - 'a' + 'A');
    }
    return out;
}

bool TextUtils::equalsIgnoreCase(std::string_view a, std::string_view b)
{
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); i++)
    {
        if (lower(a[i]) != lower(b[i])) return false;
    }
    return true;
}

std::vector<std::string_view> TextUtils::lines(std::string_view s)
{
    std::vector<std::string_view> result;
    size_t start = 0;
    for (;;)
    {
        size_t end = s.find('\n', start);
        std::string_view line = s.substr(start,
            end == std::string_view::npos ? std::string_view::npos : end - start);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        result.push_back(line);
        if (end == std::string_view::npos) break;
        start = end + 1;
    }
    return result;
}
