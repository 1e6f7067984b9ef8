// Copyright (c) 2024 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once
#include <string>
#include <string_view>

namespace vistoria {

/// Conversion of UTF-8 text into the single-byte WinAnsiEncoding
/// used by the standard Type 1 fonts. All text that goes through
/// FontMetrics or PdfContent is expected in this encoding.
///
namespace WinAnsi
{
    constexpr char NBSP = '\xA0';

    /// Characters without a WinAnsi code point become '?'.
    /// Malformed UTF-8 sequences are skipped byte by byte.
    std::string fromUtf8(std::string_view utf8);

    /// Escapes a WinAnsi string as the body of a PDF literal string
    /// (without the enclosing parentheses).
    void appendLiteral(std::string& out, std::string_view s);
}

} // namespace vistoria
