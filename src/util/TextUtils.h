// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace TextUtils
{
    std::string_view trim(std::string_view s);

    /// Lower-cases ASCII letters; other bytes (including UTF-8
    /// sequences) are kept as they are.
    std::string toLowerAscii(std::string_view s);
    std::string toUpperAscii(std::string_view s);

    bool equalsIgnoreCase(std::string_view a, std::string_view b);

    /// Splits at '\n'; a trailing '\r' on each line is dropped.
    std::vector<std::string_view> lines(std::string_view s);
}
