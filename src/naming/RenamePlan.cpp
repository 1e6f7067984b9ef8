// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include "RenamePlan.h"
#include <algorithm>
#include <filesystem>
#include <map>
#include "FriendlyName.h"
#include "util/TextUtils.h"

// Names are compared case-insensitively, so the plan is also safe on
// file systems that ignore case
std::string RenamePlan::key(std::string_view name)
{
    return TextUtils::toLowerAscii(name);
}

std::string RenamePlan::scratchName(std::mt19937& random, std::string_view extension,
    NameSet& occupied)
{
    std::uniform_int_distribution<int> digits(SCRATCH_MIN, SCRATCH_MAX);
    for (;;)
    {
        std::string name = std::to_string(digits(random));
        name += extension;
        if (occupied.insert(key(name)).second) return name;
    }
}

RenamePlan RenamePlan::build(const std::vector<std::string>& listing,
    const std::vector<Candidate>& candidates, std::mt19937& random)
{
    RenamePlan plan;
    NameSet occupied;
    for (const std::string& name : listing)
    {
        occupied.insert(key(name));
    }

    // Scramble pass

    std::vector<size_t> movable;
    for (size_t i = 0; i < candidates.size(); i++)
    {
        const Candidate& c = candidates[i];
        if (FriendlyName::matches(c.fileName))
        {
            plan.keptNames_.push_back(c.fileName);
            continue;
        }
        movable.push_back(i);
    }

    std::vector<std::string> extensions(candidates.size());
    for (size_t i : movable)
    {
        const Candidate& c = candidates[i];
        extensions[i] = TextUtils::toLowerAscii(
            std::filesystem::path(c.fileName).extension().string());
        std::string scratch = scratchName(random, extensions[i], occupied);
        plan.scrambleSteps_.push_back({ i, c.fileName, std::move(scratch) });
    }

    // The original names are free once the scramble pass is done
    for (const Step& step : plan.scrambleSteps_)
    {
        occupied.erase(key(step.from));
    }

    // Canonical pass

    std::map<std::string, std::vector<const Step*>> groups;
    for (const Step& step : plan.scrambleSteps_)
    {
        groups[TextUtils::toUpperAscii(candidates[step.candidate].sigla)].push_back(&step);
    }

    for (auto& [groupKey, steps] : groups)
    {
        // Steps are in candidate order, so ties keep that order
        std::ranges::stable_sort(steps, [&candidates](const Step* a, const Step* b)
        {
            return candidates[a->candidate].capturedAt < candidates[b->candidate].capturedAt;
        });

        int seq = 1;
        for (const Step* step : steps)
        {
            const Candidate& c = candidates[step->candidate];
            std::string target;
            for (;;)
            {
                target = FriendlyName::format(seq, c.sigla, extensions[step->candidate]);
                seq++;
                if (occupied.insert(key(target)).second) break;
            }
            plan.canonicalSteps_.push_back({ step->candidate, step->to, std::move(target) });
        }
    }
    return plan;
}
