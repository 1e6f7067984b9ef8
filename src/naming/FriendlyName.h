// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once
#include <string>
#include <string_view>

// File names of the form "NNN - <sigla>.<ext>", as assigned by the
// canonical rename pass

namespace FriendlyName
{
    /// Same as matching ^\d{3}\s*-\s*.+\.\w+$
    bool matches(std::string_view fileName);

    /// The three-digit number of a friendly name, or -1
    int number(std::string_view fileName);

    /// Replaces each of <>:"/\|?* with '-'
    std::string sanitize(std::string_view sigla);

    /// "{seq:03d} - {sanitize(sigla)}{extension}"
    std::string format(int seq, std::string_view sigla, std::string_view extension);
}
