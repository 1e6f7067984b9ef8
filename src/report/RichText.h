// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once
#include <string>
#include <vector>

// Lightly styled text: lines of runs, each run either plain, bold,
// underlined or a hyperlink. Lines are hard breaks; the layout may wrap
// a line further.

struct TextRun
{
    std::string text;           // UTF-8
    bool bold = false;
    bool underline = false;
    std::string link;           // URI, or empty
};

struct RichText
{
    using Line = std::vector<TextRun>;

    std::vector<Line> lines;

    Line& newLine() { return lines.emplace_back(); }

    std::string toPlainText() const
    {
        std::string s;
        for (size_t i = 0; i < lines.size(); i++)
        {
            if (i > 0) s.push_back('\n');
            for (const TextRun& run : lines[i]) s += run.text;
        }
        return s;
    }
};
