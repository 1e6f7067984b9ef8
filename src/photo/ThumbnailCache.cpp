// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include "ThumbnailCache.h"

ThumbnailCache::ThumbnailCache(size_t capacity) :
    capacity_(capacity == 0 ? 1 : capacity)
{
}

std::shared_ptr<const Thumbnail> ThumbnailCache::get(const std::string& hash)
{
    auto it = index_.find(hash);
    if (it == index_.end())
    {
        misses_++;
        return nullptr;
    }
    hits_++;
    entries_.splice(entries_.begin(), entries_, it->second);
    return it->second->second;
}

void ThumbnailCache::put(const std::string& hash, std::shared_ptr<const Thumbnail> thumbnail)
{
    auto it = index_.find(hash);
    if (it != index_.end())
    {
        it->second->second = std::move(thumbnail);
        entries_.splice(entries_.begin(), entries_, it->second);
        return;
    }
    if (entries_.size() >= capacity_)
    {
        index_.erase(entries_.back().first);
        entries_.pop_back();
    }
    entries_.emplace_front(hash, std::move(thumbnail));
    index_[hash] = entries_.begin();
}

void ThumbnailCache::clear()
{
    entries_.clear();
    index_.clear();
}
