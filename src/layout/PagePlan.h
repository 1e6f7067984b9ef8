// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once
#include <functional>
#include <map>
#include <string>
#include <string_view>

// The page budget of a report. Page indices are zero-based; the cover
// is page 0.

struct PagePlan
{
    int totalPages = 0;
    std::map<std::string, int, std::less<>> firstPhotoPage;    // by sigla

    /// The page on which `sigla` first appears, or -1
    int pageOf(std::string_view sigla) const
    {
        auto it = firstPhotoPage.find(sigla);
        return it == firstPhotoPage.end() ? -1 : it->second;
    }
};
