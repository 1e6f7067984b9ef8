// Copyright (c) 2024 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once
#include <stdexcept>
#include <string>
#include <clarisma/text/Format.h>

namespace vistoria {

class PdfException : public std::runtime_error
{
public:
    explicit PdfException(const char* message) :
        std::runtime_error(message)
    {
    }

    explicit PdfException(const std::string& message) :
        std::runtime_error(message)
    {
    }

    template <typename... Args>
    explicit PdfException(const char* message, Args... args) :
        std::runtime_error(clarisma::Format::format(message, args...))
    {
    }
};

} // namespace vistoria
