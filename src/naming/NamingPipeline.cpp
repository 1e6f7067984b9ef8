// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include "NamingPipeline.h"
#include <algorithm>
#include <unordered_set>
#include <clarisma/cli/Console.h>
#include <clarisma/io/File.h>
#include <clarisma/io/IOException.h>
#include <clarisma/util/log.h>
#include "RenamePlan.h"

using namespace clarisma;

NamingPipeline::NamingPipeline() :
    random_(std::random_device{}())
{
}

void NamingPipeline::fail(const std::string& fileName, ErrorKind kind, std::string message)
{
    Console::msg("Unable to rename %s: %s", fileName.c_str(), message.c_str());
    failures_.push_back({ fileName, kind, std::move(message) });
}

bool NamingPipeline::rename(const std::filesystem::path& dir,
    const std::string& from, const std::string& to)
{
    std::filesystem::path target = dir / to;
    std::error_code ec;
    if (std::filesystem::exists(target, ec))
    {
        fail(from, ErrorKind::RENAME_FAILED, to + " already exists");
        return false;
    }
    try
    {
        File::rename((dir / from).string().c_str(), target.string().c_str());
    }
    catch (IOException& ex)
    {
        fail(from, ErrorKind::RENAME_FAILED, ex.what());
        return false;
    }
    return true;
}

std::vector<std::string> NamingPipeline::run(const std::filesystem::path& dir,
    const std::vector<Item>& items, const ProgressCallback& progress)
{
    failures_.clear();
    std::vector<std::string> result;
    if (items.empty()) return result;

    // Snapshot of the directory; the plan is computed against it alone
    std::vector<std::string> listing;
    std::unordered_set<std::string> present;
    for (const auto& entry : std::filesystem::directory_iterator(dir))
    {
        listing.push_back(entry.path().filename().string());
        present.insert(listing.back());
    }

    std::vector<RenamePlan::Candidate> candidates;
    candidates.reserve(items.size());
    for (const Item& item : items)
    {
        if (!present.contains(item.fileName))
        {
            fail(item.fileName, ErrorKind::UNREADABLE, "file no longer exists");
            continue;
        }
        candidates.push_back({ item.fileName, item.sigla, item.capturedAt });
    }

    RenamePlan plan = RenamePlan::build(listing, candidates, random_);
    result = plan.keptNames();
    LOGS << "Rename plan: " << plan.scrambleSteps().size() << " to move, "
        << plan.keptNames().size() << " in place";

    size_t total = plan.scrambleSteps().size() + plan.canonicalSteps().size();
    size_t done = 0;
    std::vector<bool> scrambled(candidates.size(), false);
    for (const RenamePlan::Step& step : plan.scrambleSteps())
    {
        scrambled[step.candidate] = rename(dir, step.from, step.to);
        if (progress) progress(++done, total);
    }
    for (const RenamePlan::Step& step : plan.canonicalSteps())
    {
        if (scrambled[step.candidate] && rename(dir, step.from, step.to))
        {
            result.push_back(step.to);
        }
        if (progress) progress(++done, total);
    }
    std::ranges::sort(result);
    return result;
}
