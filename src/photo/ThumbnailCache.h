// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once
#include <list>
#include <memory>
#include <string>
#include <unordered_map>
#include "ImageRecord.h"

// Thumbnails keyed by content hash, evicting the least recently used
// entry once the capacity is reached. Owned by whoever runs a session
// and handed to the scanner explicitly.

class ThumbnailCache
{
public:
    explicit ThumbnailCache(size_t capacity = DEFAULT_CAPACITY);

    std::shared_ptr<const Thumbnail> get(const std::string& hash);
    void put(const std::string& hash, std::shared_ptr<const Thumbnail> thumbnail);
    void clear();

    size_t size() const { return entries_.size(); }
    size_t capacity() const { return capacity_; }
    size_t hits() const { return hits_; }
    size_t misses() const { return misses_; }

    static constexpr size_t DEFAULT_CAPACITY = 512;

private:
    using Entry = std::pair<std::string, std::shared_ptr<const Thumbnail>>;

    size_t capacity_;
    size_t hits_ = 0;
    size_t misses_ = 0;
    std::list<Entry> entries_;      // most recently used first
    std::unordered_map<std::string, std::list<Entry>::iterator> index_;
};
