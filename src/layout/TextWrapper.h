// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <vistoria/pdf/FontMetrics.h>
#include "report/RichText.h"

using vistoria::PdfFont;

// A piece of WinAnsi text in one style

struct Span
{
    std::string text;
    bool bold = false;
    bool underline = false;
    std::string link;

    PdfFont font() const
    {
        return bold ? PdfFont::HELVETICA_BOLD : PdfFont::HELVETICA;
    }

    bool sameStyle(const Span& other) const
    {
        return bold == other.bold && underline == other.underline && link == other.link;
    }
};

using SpanLine = std::vector<Span>;

// Greedy word wrapping for the standard Helvetica faces. Lines break at
// spaces; runs of spaces collapse into one, and spaces at the start or
// end of a wrapped line are dropped. A word wider than the line is
// broken between characters. Non-breaking spaces count as letters.

class TextWrapper
{
public:
    TextWrapper(double fontSize, double maxWidth) :
        fontSize_(fontSize),
        maxWidth_(maxWidth)
    {
    }

    /// Wraps one line of UTF-8 runs
    std::vector<SpanLine> wrap(const RichText::Line& line) const;

    /// Wraps WinAnsi spans
    std::vector<SpanLine> wrapSpans(const std::vector<Span>& spans) const;

    /// Wraps UTF-8 text set in a single face. Each '\n' starts a new line;
    /// a blank source line yields an empty line. The result is WinAnsi.
    std::vector<std::string> wrapPlain(std::string_view utf8, PdfFont font) const;

    double width(const SpanLine& line) const;

private:
    struct Word
    {
        std::vector<Span> pieces;
        double width = 0;
        Span space;             // the space before the word, if any
        bool hasSpace = false;
    };

    void addWord(std::vector<SpanLine>& lines, SpanLine& current,
        double& currentWidth, const Word& word) const;
    void breakWord(std::vector<SpanLine>& lines, SpanLine& current,
        double& currentWidth, const Word& word) const;
    static void append(SpanLine& line, const Span& style, std::string_view text);

    double fontSize_;
    double maxWidth_;
};
