// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include "EntryAggregator.h"
#include <map>
#include <set>
#include "util/TextUtils.h"

namespace
{
    struct Group
    {
        std::string zoneId;
        std::string sigla;
        std::vector<std::string> statuses;
        std::vector<std::string> comments;
    };

    class GroupList
    {
    public:
        Group& get(const Entry& entry)
        {
            auto key = std::make_pair(entry.zoneId, entry.sigla);
            auto it = index_.find(key);
            if (it != index_.end()) return groups_[it->second];
            index_.emplace(key, groups_.size());
            Group& group = groups_.emplace_back();
            group.zoneId = entry.zoneId;
            group.sigla = entry.sigla;
            return group;
        }

        void collect(std::vector<AggregatedRow>& rows, std::vector<CommentBlock>& blocks) const
        {
            for (const Group& group : groups_)
            {
                rows.push_back({ group.zoneId, group.sigla,
                    EntryAggregator::majorityStatus(group.statuses) });
                std::string merged = EntryAggregator::mergeComments(group.comments);
                if (!merged.empty())
                {
                    blocks.push_back({ group.zoneId, group.sigla, std::move(merged) });
                }
            }
        }

    private:
        std::vector<Group> groups_;
        std::map<std::pair<std::string, std::string>, size_t> index_;
    };
}

AggregatedTables EntryAggregator::aggregate(const std::vector<Entry>& entries)
{
    GroupList quadras;
    GroupList canteiros;
    for (const Entry& entry : entries)
    {
        GroupList* list;
        switch (entry.zoneType)
        {
        case ZoneType::QUADRA:
            list = &quadras;
            break;
        case ZoneType::CANTEIRO:
            list = &canteiros;
            break;
        default:
            continue;
        }
        Group& group = list->get(entry);
        group.statuses.push_back(entry.status);
        group.comments.push_back(entry.comment);
    }

    AggregatedTables tables;
    quadras.collect(tables.quadraRows, tables.quadraComments);
    canteiros.collect(tables.canteiroRows, tables.canteiroComments);
    return tables;
}

std::string EntryAggregator::majorityStatus(const std::vector<std::string>& statuses)
{
    // Counts in order of first occurrence
    std::vector<std::pair<std::string_view, int>> counts;
    for (const std::string& status : statuses)
    {
        bool found = false;
        for (auto& [s, n] : counts)
        {
            if (s == status)
            {
                n++;
                found = true;
                break;
            }
        }
        if (!found) counts.emplace_back(status, 1);
    }

    std::string_view best;
    int bestCount = 0;
    for (const auto& [s, n] : counts)
    {
        if (n > bestCount)
        {
            best = s;
            bestCount = n;
        }
    }
    return std::string(best);
}

std::string EntryAggregator::mergeComments(const std::vector<std::string>& comments)
{
    std::set<std::string> lines;
    for (const std::string& comment : comments)
    {
        for (std::string_view line : TextUtils::lines(comment))
        {
            line = TextUtils::trim(line);
            if (!line.empty()) lines.emplace(line);
        }
    }
    std::string merged;
    for (const std::string& line : lines)
    {
        if (!merged.empty()) merged.push_back('\n');
        merged += line;
    }
    return merged;
}
