// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include "ContentHash.h"
#include <cstdio>
#include <clarisma/util/Crc32C.h>

using namespace clarisma;

std::string ContentHash::compute(const uint8_t* data, size_t size)
{
    uint64_t fnv = 0xcbf29ce484222325ULL;
    for (size_t i = 0; i < size; i++)
    {
        fnv ^= data[i];
        fnv *= 0x100000001b3ULL;
    }
    uint32_t crc = Crc32C::compute(data, size);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%016llx%08x",
        static_cast<unsigned long long>(fnv), crc);
    return buf;
}
