// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once
#include <string_view>
#include <vistoria/pdf/Color.h>

// Inspection states as shown in the report

namespace Status
{
    constexpr const char* DONE = "Concluído";
    constexpr const char* PARTIAL = "Parcial";
    constexpr const char* NOT_DONE = "Não Concluído";
    constexpr const char* DEFAULT = NOT_DONE;

    /// Background tint for a state; unknown and empty states are white
    inline vistoria::Color color(std::string_view status)
    {
        if (status == DONE) return { 0.90, 1.0, 0.90 };
        if (status == PARTIAL) return { 1.0, 1.0, 0.85 };
        if (status == NOT_DONE) return { 1.0, 0.90, 0.90 };
        return vistoria::Color::white();
    }
}
