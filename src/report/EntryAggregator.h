// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once
#include <string>
#include <vector>
#include "Entry.h"

struct AggregatedRow
{
    std::string zoneId;
    std::string sigla;
    std::string status;
};

struct CommentBlock
{
    std::string zoneId;
    std::string sigla;
    std::string comments;       // distinct lines, sorted, joined by '\n'
};

struct AggregatedTables
{
    std::vector<AggregatedRow> quadraRows;
    std::vector<AggregatedRow> canteiroRows;
    std::vector<CommentBlock> quadraComments;
    std::vector<CommentBlock> canteiroComments;
};

// Summarizes entries per zone, keyed by (zone id, sigla) within each
// zone type. Groups appear in the order of their first entry; entries
// of unknown type are left out.

class EntryAggregator
{
public:
    static AggregatedTables aggregate(const std::vector<Entry>& entries);

    /// The most frequent status. On a tie, the status among the tied
    /// ones that occurs first in `statuses` wins.
    static std::string majorityStatus(const std::vector<std::string>& statuses);

    /// Splits each comment into lines, trims them, drops blank lines and
    /// duplicates, and joins the rest in lexicographic order
    static std::string mergeComments(const std::vector<std::string>& comments);
};
