// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once
#include <string>
#include <string_view>
#include <vector>
#include "PageCanvas.h"
#include "PagePlan.h"
#include "TextWrapper.h"
#include "report/Entry.h"
#include "report/EntryAggregator.h"
#include "report/ReportSettings.h"

struct ReportOptions
{
    std::string reportDate;
    std::string generalComments;
    bool disableStates = false;
    bool disableCommentsTable = false;
    bool includeSignature = false;
};

// Lays out a report page by page. The same code runs for planning
// (against a DryRunCanvas) and for rendering, so the planned page
// count and anchor pages always match what gets drawn.
//
// Page sequence:
//   cover, Quadra status table, Canteiro status table, Quadra comment
//   table, Canteiro comment table, general comments, photo pages (two
//   entries each), signature page.
// All regions except the cover and the photo pages are optional.

class ReportLayout
{
public:
    ReportLayout(const ReportSettings& settings, const ReportOptions& options,
        const std::vector<Entry>& entries, const AggregatedTables& tables);

    /// Draws the report. With a plan, footers show the planned total
    /// and sigla cells of the status tables link to the photo pages.
    void draw(PageCanvas& canvas, const PagePlan* plan = nullptr);

    bool hasGeneralComments() const;

    static constexpr const char* ANCHOR_PREFIX = "sigla_";
    static std::string anchorName(std::string_view sigla);

private:
    using TextRow = std::vector<std::vector<std::string>>;  // cells of wrapped lines

    void beginPage();
    void finishPage();
    void drawFooter();
    void centered(PdfFont font, double size, double x, double y, std::string_view utf8);
    void rightAligned(PdfFont font, double size, double x, double y, std::string_view utf8);
    void leftAligned(PdfFont font, double size, double x, double y, std::string_view utf8);

    void drawCover();

    void drawStatusRegion(const char* title, const char* idHeader,
        const std::vector<AggregatedRow>& rows);
    void drawStatusBlock(double x, double y, const char* idHeader,
        const AggregatedRow* rows, size_t count, const double* widths);

    void drawCommentRegion(const char* title, const char* idHeader,
        const std::vector<CommentBlock>& blocks);
    double drawCommentHeader(double top, const char* idHeader, const double* widths);
    void drawCommentRow(double top, double height, const TextRow& cells,
        const double* widths, double fontSize, double leading, bool bold);

    void drawGeneralComments();

    void drawPhotoPages();
    void drawPageHeader();
    void drawCell(const Entry& entry, int column);
    void drawCaption(const RichText& caption, double x, double top);
    void drawSpanLine(const SpanLine& line, double size, double x, double baseline);

    void drawSignaturePage();

    const ReportSettings& settings_;
    const ReportOptions& options_;
    const std::vector<Entry>& entries_;
    const AggregatedTables& tables_;
    std::vector<std::string> footerLines_;
    PageCanvas* canvas_ = nullptr;
    const PagePlan* plan_ = nullptr;
};
