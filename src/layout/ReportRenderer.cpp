// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include "ReportRenderer.h"
#include <cassert>
#include <vistoria/pdf/PdfDocument.h>
#include "LayoutMetrics.h"
#include "PageBudgetPlanner.h"
#include "PdfPageCanvas.h"

PagePlan ReportRenderer::render(const char* fileName, std::string_view title)
{
    PagePlan plan = PageBudgetPlanner::plan(layout_);

    vistoria::PdfDocument doc(LayoutMetrics::PAGE_WIDTH, LayoutMetrics::PAGE_HEIGHT);
    PdfPageCanvas canvas(doc);
    layout_.draw(canvas, &plan);

    // The plan came from the same layout code
    assert(canvas.pageCount() == plan.totalPages);
    assert(canvas.anchors().size() == plan.firstPhotoPage.size());

    doc.setInfo(title, "vst");
    doc.write(fileName);
    return plan;
}
