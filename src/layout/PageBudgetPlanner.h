// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once
#include "PagePlan.h"
#include "ReportLayout.h"

// Computes the page budget of a report by running its layout against
// a canvas that only counts

class PageBudgetPlanner
{
public:
    static PagePlan plan(ReportLayout& layout);
};
