// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once
#include <random>
#include <string>
#include <unordered_set>
#include <vector>
#include "photo/CaptureTime.h"

// The complete set of renames for one directory, computed from a single
// snapshot of its listing before anything is touched.
//
// Every image that does not already carry a friendly name first moves
// to a random scratch name, then to "NNN - <sigla>.<ext>", numbered per
// sigla (case-insensitive) in order of capture time. Friendly names
// stay where they are, and their names count as occupied.

class RenamePlan
{
public:
    struct Candidate
    {
        std::string fileName;
        std::string sigla;
        CaptureTime capturedAt;
    };

    struct Step
    {
        size_t candidate;       // index into the candidate list
        std::string from;
        std::string to;
    };

    /// `listing` holds every name in the directory (images or not);
    /// candidates whose file carries a friendly name are kept in place.
    static RenamePlan build(const std::vector<std::string>& listing,
        const std::vector<Candidate>& candidates, std::mt19937& random);

    const std::vector<Step>& scrambleSteps() const { return scrambleSteps_; }
    const std::vector<Step>& canonicalSteps() const { return canonicalSteps_; }
    const std::vector<std::string>& keptNames() const { return keptNames_; }
    bool isEmpty() const { return scrambleSteps_.empty(); }

    static constexpr int SCRATCH_MIN = 10000000;
    static constexpr int SCRATCH_MAX = 99999999;

private:
    using NameSet = std::unordered_set<std::string>;

    static std::string key(std::string_view name);
    static std::string scratchName(std::mt19937& random, std::string_view extension,
        NameSet& occupied);

    std::vector<Step> scrambleSteps_;
    std::vector<Step> canonicalSteps_;
    std::vector<std::string> keptNames_;
};
