// Copyright (c) 2024 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once
#include <cstdint>
#include <string_view>

namespace vistoria {

enum class PdfFont
{
    HELVETICA,
    HELVETICA_BOLD
};

/// Advance widths of the standard-14 Helvetica faces (AFM values,
/// in 1/1000 em), indexed by WinAnsi code.
///
class FontMetrics
{
public:
    static int charWidth(PdfFont font, uint8_t ch);
    static double textWidth(PdfFont font, double size, std::string_view winAnsi);
    static const char* baseFontName(PdfFont font);

    static constexpr double ASCENT = 0.718;     // cap height ratio
    static constexpr double DESCENT = 0.207;

private:
    static const uint16_t HELVETICA_WIDTHS[256];
    static const uint16_t HELVETICA_BOLD_WIDTHS[256];
};

} // namespace vistoria
