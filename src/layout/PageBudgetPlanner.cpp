// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include "PageBudgetPlanner.h"
#include <clarisma/util/log.h>
#include "DryRunCanvas.h"

PagePlan PageBudgetPlanner::plan(ReportLayout& layout)
{
    DryRunCanvas canvas;
    layout.draw(canvas);

    PagePlan plan;
    plan.totalPages = canvas.pageCount();
    std::string_view prefix(ReportLayout::ANCHOR_PREFIX);
    for (const auto& [name, page] : canvas.anchors())
    {
        if (name.starts_with(prefix))
        {
            plan.firstPhotoPage.emplace(name.substr(prefix.size()), page);
        }
    }
    LOGS << "Planned " << plan.totalPages << " pages, "
        << plan.firstPhotoPage.size() << " anchors";
    return plan;
}
