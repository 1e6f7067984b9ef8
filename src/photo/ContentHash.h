// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once
#include <cstdint>
#include <string>

// Identity of an image independent of its file name. For JPEG files,
// only the entropy-coded data (from the first scan on) is hashed, so
// rewriting metadata keeps the identity.

namespace ContentHash
{
    /// 24 hex digits: 64-bit FNV-1a followed by CRC-32C
    std::string compute(const uint8_t* data, size_t size);
}
