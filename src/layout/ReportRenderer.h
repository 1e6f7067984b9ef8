// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once
#include <string_view>
#include "PagePlan.h"
#include "ReportLayout.h"

// Plans and renders a report into a PDF file

class ReportRenderer
{
public:
    explicit ReportRenderer(ReportLayout& layout) : layout_(layout) {}

    /// Writes the PDF and returns the plan it was rendered with.
    /// Throws PdfException if the document cannot be built or written.
    PagePlan render(const char* fileName, std::string_view title);

private:
    ReportLayout& layout_;
};
