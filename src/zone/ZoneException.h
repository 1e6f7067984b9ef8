// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once

#include <stdexcept>
#include <clarisma/text/Format.h>

// Raised when the zone dataset cannot be used at all

class ZoneException : public std::runtime_error
{
public:
    explicit ZoneException(const char* message)
        : std::runtime_error(message) {}

    explicit ZoneException(const std::string& message)
        : std::runtime_error(message) {}

    template <typename... Args>
    explicit ZoneException(const char* message, Args... args)
        : std::runtime_error(clarisma::Format::format(message, args...)) {}
};
