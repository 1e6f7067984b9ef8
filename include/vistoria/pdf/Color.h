// Copyright (c) 2024 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once

namespace vistoria {

struct Color
{
    double r;
    double g;
    double b;

    bool operator==(const Color& other) const = default;

    static constexpr Color black() { return { 0, 0, 0 }; }
    static constexpr Color white() { return { 1, 1, 1 }; }
    static constexpr Color gray(double level) { return { level, level, level }; }
};

} // namespace vistoria
