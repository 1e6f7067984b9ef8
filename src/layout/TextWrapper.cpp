// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include "TextWrapper.h"
#include <vistoria/pdf/WinAnsi.h>
#include "util/TextUtils.h"

using namespace vistoria;

namespace
{
    constexpr double TOLERANCE = 1e-6;
}

void TextWrapper::append(SpanLine& line, const Span& style, std::string_view text)
{
    if (!line.empty() && line.back().sameStyle(style))
    {
        line.back().text += text;
        return;
    }
    Span& span = line.emplace_back(style);
    span.text = text;
}

void TextWrapper::breakWord(std::vector<SpanLine>& lines, SpanLine& current,
    double& currentWidth, const Word& word) const
{
    for (const Span& piece : word.pieces)
    {
        for (char ch : piece.text)
        {
            double w = FontMetrics::charWidth(piece.font(),
                static_cast<uint8_t>(ch)) * fontSize_ / 1000;
            if (!current.empty() && currentWidth + w > maxWidth_ + TOLERANCE)
            {
                lines.push_back(std::move(current));
                current.clear();
                currentWidth = 0;
            }
            append(current, piece, std::string_view(&ch, 1));
            currentWidth += w;
        }
    }
}

void TextWrapper::addWord(std::vector<SpanLine>& lines, SpanLine& current,
    double& currentWidth, const Word& word) const
{
    if (!current.empty())
    {
        double spaceWidth = word.hasSpace ?
            FontMetrics::charWidth(word.space.font(), ' ') * fontSize_ / 1000 : 0;
        if (currentWidth + spaceWidth + word.width <= maxWidth_ + TOLERANCE)
        {
            if (word.hasSpace) append(current, word.space, " ");
            for (const Span& piece : word.pieces) append(current, piece, piece.text);
            currentWidth += spaceWidth + word.width;
            return;
        }
        lines.push_back(std::move(current));
        current.clear();
        currentWidth = 0;
    }

    if (word.width > maxWidth_ + TOLERANCE)
    {
        breakWord(lines, current, currentWidth, word);
        return;
    }
    for (const Span& piece : word.pieces) append(current, piece, piece.text);
    currentWidth = word.width;
}

std::vector<SpanLine> TextWrapper::wrapSpans(const std::vector<Span>& spans) const
{
    std::vector<SpanLine> lines;
    SpanLine current;
    double currentWidth = 0;
    Word word;
    Span pendingSpace;
    bool hasPendingSpace = false;

    auto flushWord = [&]()
    {
        if (word.pieces.empty()) return;
        word.hasSpace = hasPendingSpace;
        word.space = pendingSpace;
        addWord(lines, current, currentWidth, word);
        word = Word();
        hasPendingSpace = false;
    };

    for (const Span& span : spans)
    {
        for (char ch : span.text)
        {
            if (ch == ' ')
            {
                flushWord();
                if (!hasPendingSpace)
                {
                    pendingSpace = span;
                    pendingSpace.text = " ";
                    hasPendingSpace = true;
                }
                continue;
            }
            append(word.pieces, span, std::string_view(&ch, 1));
            word.width += FontMetrics::charWidth(span.font(),
                static_cast<uint8_t>(ch)) * fontSize_ / 1000;
        }
    }
    flushWord();
    if (!current.empty() || lines.empty()) lines.push_back(std::move(current));
    return lines;
}

std::vector<SpanLine> TextWrapper::wrap(const RichText::Line& line) const
{
    std::vector<Span> spans;
    spans.reserve(line.size());
    for (const TextRun& run : line)
    {
        spans.push_back({ WinAnsi::fromUtf8(run.text), run.bold, run.underline, run.link });
    }
    return wrapSpans(spans);
}

std::vector<std::string> TextWrapper::wrapPlain(std::string_view utf8, PdfFont font) const
{
    std::vector<std::string> result;
    for (std::string_view sourceLine : TextUtils::lines(utf8))
    {
        Span span;
        span.text = WinAnsi::fromUtf8(sourceLine);
        span.bold = font == PdfFont::HELVETICA_BOLD;
        for (const SpanLine& line : wrapSpans({ span }))
        {
            std::string& text = result.emplace_back();
            for (const Span& s : line) text += s.text;
        }
    }
    return result;
}

double TextWrapper::width(const SpanLine& line) const
{
    double w = 0;
    for (const Span& span : line)
    {
        w += FontMetrics::textWidth(span.font(), fontSize_, span.text);
    }
    return w;
}
