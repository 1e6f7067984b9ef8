// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once
#include <cstddef>
#include <functional>

// Reports (items completed, total items); called synchronously

using ProgressCallback = std::function<void(size_t current, size_t total)>;
