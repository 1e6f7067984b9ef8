// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include "ReportLayout.h"
#include <algorithm>
#include <cmath>
#include <unordered_set>
#include <vistoria/pdf/WinAnsi.h>
#include "LayoutMetrics.h"
#include "photo/ImageRecord.h"
#include "report/Status.h"
#include "util/TextUtils.h"

using namespace LayoutMetrics;
using vistoria::FontMetrics;
using vistoria::WinAnsi::fromUtf8;

namespace
{
    constexpr double STATUS_WIDTHS[3] =
    {
        STATUS_ID_WIDTH, STATUS_SIGLA_WIDTH, STATUS_STATE_WIDTH
    };

    constexpr double COMMENT_WIDTHS[3] =
    {
        COMMENT_KEY_WIDTH, COMMENT_KEY_WIDTH, USABLE_WIDTH - 2 * COMMENT_KEY_WIDTH
    };

    /// Baseline of the first line of a text block whose top is at `top`
    double firstBaseline(double top, double size)
    {
        return top - FontMetrics::ASCENT * size;
    }
}

ReportLayout::ReportLayout(const ReportSettings& settings, const ReportOptions& options,
    const std::vector<Entry>& entries, const AggregatedTables& tables) :
    settings_(settings),
    options_(options),
    entries_(entries),
    tables_(tables),
    footerLines_(settings.footerLines())
{
}

std::string ReportLayout::anchorName(std::string_view sigla)
{
    std::string name(ANCHOR_PREFIX);
    name += sigla;
    return name;
}

bool ReportLayout::hasGeneralComments() const
{
    return TextUtils::trim(options_.generalComments).size() > 10;
}

void ReportLayout::draw(PageCanvas& canvas, const PagePlan* plan)
{
    canvas_ = &canvas;
    plan_ = plan;

    drawCover();
    if (!options_.disableStates)
    {
        if (!tables_.quadraRows.empty())
        {
            drawStatusRegion("Tabela: Quadra", "Quadra", tables_.quadraRows);
        }
        if (!tables_.canteiroRows.empty())
        {
            drawStatusRegion("Tabela: Canteiro", "Canteiro", tables_.canteiroRows);
        }
    }
    if (!options_.disableCommentsTable)
    {
        if (!tables_.quadraComments.empty())
        {
            drawCommentRegion("Tabela: Comentários das Quadras", "Quadra",
                tables_.quadraComments);
        }
        if (!tables_.canteiroComments.empty())
        {
            drawCommentRegion("Tabela: Comentários dos Canteiros", "Canteiro",
                tables_.canteiroComments);
        }
    }
    if (hasGeneralComments()) drawGeneralComments();
    drawPhotoPages();
    if (options_.includeSignature) drawSignaturePage();

    canvas_ = nullptr;
    plan_ = nullptr;
}

// ----- Common -----

void ReportLayout::beginPage()
{
    canvas_->beginPage();
}

void ReportLayout::finishPage()
{
    drawFooter();
    canvas_->endPage();
}

void ReportLayout::leftAligned(PdfFont font, double size, double x, double y, std::string_view utf8)
{
    canvas_->text(font, size, x, y, fromUtf8(utf8));
}

void ReportLayout::centered(PdfFont font, double size, double x, double y, std::string_view utf8)
{
    std::string s = fromUtf8(utf8);
    canvas_->text(font, size, x - FontMetrics::textWidth(font, size, s) / 2, y, s);
}

void ReportLayout::rightAligned(PdfFont font, double size, double x, double y, std::string_view utf8)
{
    std::string s = fromUtf8(utf8);
    canvas_->text(font, size, x - FontMetrics::textWidth(font, size, s), y, s);
}

void ReportLayout::drawFooter()
{
    canvas_->line(MARGIN, FOOTER_RULE_Y, PAGE_WIDTH - MARGIN, FOOTER_RULE_Y);
    double y = FOOTER_TEXT_Y;
    for (const std::string& line : footerLines_)
    {
        centered(PdfFont::HELVETICA, FOOTER_FONT_SIZE, PAGE_WIDTH / 2, y, line);
        y -= FOOTER_LINE_STEP;
    }
    int total = plan_ ? plan_->totalPages : canvas_->pageCount();
    std::string pageNumber = "Página " + std::to_string(canvas_->pageIndex() + 1) +
        " de " + std::to_string(total);
    centered(PdfFont::HELVETICA, FOOTER_FONT_SIZE, PAGE_WIDTH / 2, y - 0.5 * MM, pageNumber);
}

// ----- Cover -----

void ReportLayout::drawCover()
{
    beginPage();
    double cx = PAGE_WIDTH / 2;
    centered(PdfFont::HELVETICA_BOLD, 14, cx, PAGE_HEIGHT - 30 * MM, settings_.header1());
    centered(PdfFont::HELVETICA_BOLD, 14, cx, PAGE_HEIGHT - 40 * MM, settings_.header2());
    centered(PdfFont::HELVETICA_BOLD, 16, cx, PAGE_HEIGHT - 60 * MM, settings_.title());

    std::string date = settings_.datePrefix() + " " + options_.reportDate;
    leftAligned(PdfFont::HELVETICA, 12, MARGIN, PAGE_HEIGHT - 80 * MM, date);
    leftAligned(PdfFont::HELVETICA, 12, MARGIN, PAGE_HEIGHT - 90 * MM, settings_.referenceNumber());
    leftAligned(PdfFont::HELVETICA, 12, MARGIN, PAGE_HEIGHT - 110 * MM, settings_.description());

    // The cover carries the contact lines, but no rule or page number
    double y = 20 * MM;
    for (const std::string& line : footerLines_)
    {
        centered(PdfFont::HELVETICA, FOOTER_FONT_SIZE, cx, y, line);
        y -= 5 * MM;
    }
    canvas_->endPage();
}

// ----- Status tables -----

void ReportLayout::drawStatusRegion(const char* title, const char* idHeader,
    const std::vector<AggregatedRow>& rows)
{
    size_t pages = (rows.size() + STATUS_ROWS_PER_PAGE - 1) / STATUS_ROWS_PER_PAGE;
    double naturalWidth = STATUS_ID_WIDTH + STATUS_SIGLA_WIDTH + STATUS_STATE_WIDTH;
    double blockWidth = (USABLE_WIDTH - STATUS_BLOCK_GAP) / 2;
    double scale = blockWidth / naturalWidth;
    double scaledWidths[3];
    for (int i = 0; i < 3; i++) scaledWidths[i] = STATUS_WIDTHS[i] * scale;

    for (size_t p = 0; p < pages; p++)
    {
        beginPage();
        std::string pageTitle(title);
        if (pages > 1)
        {
            pageTitle += " - Página " + std::to_string(p + 1) + " de " + std::to_string(pages);
        }
        leftAligned(PdfFont::HELVETICA_BOLD, REGION_TITLE_SIZE, MARGIN, REGION_TITLE_Y, pageTitle);

        size_t start = p * STATUS_ROWS_PER_PAGE;
        size_t count = std::min(rows.size() - start, static_cast<size_t>(STATUS_ROWS_PER_PAGE));
        const AggregatedRow* pageRows = rows.data() + start;
        if (count > STATUS_ROWS_PER_BLOCK)
        {
            drawStatusBlock(MARGIN, TABLE_Y, idHeader, pageRows,
                STATUS_ROWS_PER_BLOCK, scaledWidths);
            drawStatusBlock(MARGIN + blockWidth + STATUS_BLOCK_GAP, TABLE_Y, idHeader,
                pageRows + STATUS_ROWS_PER_BLOCK, count - STATUS_ROWS_PER_BLOCK, scaledWidths);
        }
        else
        {
            drawStatusBlock(MARGIN, TABLE_Y, idHeader, pageRows, count, STATUS_WIDTHS);
        }
        finishPage();
    }
}

void ReportLayout::drawStatusBlock(double x, double y, const char* idHeader,
    const AggregatedRow* rows, size_t count, const double* widths)
{
    const double rowHeight = STATUS_ROW_HEIGHT;
    double tableWidth = widths[0] + widths[1] + widths[2];
    double tableHeight = static_cast<double>(count + 1) * rowHeight;

    canvas_->fillRect(x, y - rowHeight, tableWidth, rowHeight, Color::gray(HEADER_GRAY));
    const char* headers[3] = { idHeader, "Sigla", "Estado" };
    double colX = x;
    for (int i = 0; i < 3; i++)
    {
        leftAligned(PdfFont::HELVETICA_BOLD, TABLE_FONT_SIZE, colX + TABLE_TEXT_INSET,
            y - rowHeight + TABLE_TEXT_INSET, headers[i]);
        colX += widths[i];
    }

    for (size_t r = 0; r < count; r++)
    {
        const AggregatedRow& row = rows[r];
        double rowY = y - static_cast<double>(r + 2) * rowHeight;
        double siglaX = x + widths[0];
        double stateX = siglaX + widths[1];
        canvas_->fillRect(stateX, rowY, widths[2], rowHeight, Status::color(row.status));
        leftAligned(PdfFont::HELVETICA, TABLE_FONT_SIZE, x + TABLE_TEXT_INSET,
            rowY + TABLE_TEXT_INSET, row.zoneId);
        leftAligned(PdfFont::HELVETICA, TABLE_FONT_SIZE, siglaX + TABLE_TEXT_INSET,
            rowY + TABLE_TEXT_INSET, row.sigla);
        leftAligned(PdfFont::HELVETICA, TABLE_FONT_SIZE, stateX + TABLE_TEXT_INSET,
            rowY + TABLE_TEXT_INSET, row.status);
        if (plan_ && plan_->pageOf(row.sigla) >= 0)
        {
            canvas_->link(siglaX, rowY, widths[1], rowHeight, anchorName(row.sigla));
        }
    }

    for (size_t i = 0; i <= count + 1; i++)
    {
        double lineY = y - static_cast<double>(i) * rowHeight;
        canvas_->line(x, lineY, x + tableWidth, lineY);
    }
    colX = x;
    for (int i = 0; i <= 3; i++)
    {
        canvas_->line(colX, y, colX, y - tableHeight);
        if (i < 3) colX += widths[i];
    }
}

// ----- Comment tables -----

void ReportLayout::drawCommentRow(double top, double height, const TextRow& cells,
    const double* widths, double fontSize, double leading, bool bold)
{
    PdfFont font = bold ? PdfFont::HELVETICA_BOLD : PdfFont::HELVETICA;
    double tableWidth = widths[0] + widths[1] + widths[2];
    double bottom = top - height;
    double colX = MARGIN;
    for (int i = 0; i < 3; i++)
    {
        double innerWidth = widths[i] - 2 * COMMENT_PADDING;
        double baseline = firstBaseline(top - COMMENT_PADDING, fontSize);
        for (const std::string& line : cells[i])
        {
            double x = colX + COMMENT_PADDING;
            if (i < 2)
            {
                // Key columns are centered
                x += (innerWidth - FontMetrics::textWidth(font, fontSize, line)) / 2;
            }
            canvas_->text(font, fontSize, x, baseline, line);
            baseline -= leading;
        }
        canvas_->line(colX, top, colX, bottom);
        colX += widths[i];
    }
    canvas_->line(colX, top, colX, bottom);
    canvas_->line(MARGIN, bottom, MARGIN + tableWidth, bottom);
}

double ReportLayout::drawCommentHeader(double top, const char* idHeader, const double* widths)
{
    const char* headers[3] = { idHeader, "Sigla", "Comentários" };
    TextRow cells(3);
    size_t maxLines = 1;
    for (int i = 0; i < 3; i++)
    {
        TextWrapper wrapper(COMMENT_HEADER_SIZE, widths[i] - 2 * COMMENT_PADDING);
        cells[i] = wrapper.wrapPlain(headers[i], PdfFont::HELVETICA_BOLD);
        maxLines = std::max(maxLines, cells[i].size());
    }
    double height = static_cast<double>(maxLines) * COMMENT_HEADER_LEADING + 2 * COMMENT_PADDING;
    double tableWidth = widths[0] + widths[1] + widths[2];
    canvas_->fillRect(MARGIN, top - height, tableWidth, height, Color::gray(HEADER_GRAY));

    // The comment header is left-aligned, like its column
    std::vector<std::string> comments = std::move(cells[2]);
    cells[2].clear();
    drawCommentRow(top, height, cells, widths, COMMENT_HEADER_SIZE, COMMENT_HEADER_LEADING, true);
    double baseline = firstBaseline(top - COMMENT_PADDING, COMMENT_HEADER_SIZE);
    for (const std::string& line : comments)
    {
        canvas_->text(PdfFont::HELVETICA_BOLD, COMMENT_HEADER_SIZE,
            MARGIN + widths[0] + widths[1] + COMMENT_PADDING, baseline, line);
        baseline -= COMMENT_HEADER_LEADING;
    }
    return height;
}

void ReportLayout::drawCommentRegion(const char* title, const char* idHeader,
    const std::vector<CommentBlock>& blocks)
{
    const double* widths = COMMENT_WIDTHS;
    double tableWidth = widths[0] + widths[1] + widths[2];
    const double top = TABLE_Y;

    beginPage();
    leftAligned(PdfFont::HELVETICA_BOLD, REGION_TITLE_SIZE, MARGIN, REGION_TITLE_Y, title);
    double y = top - drawCommentHeader(top, idHeader, widths);
    bool firstOnPage = true;

    for (const CommentBlock& block : blocks)
    {
        const std::string* texts[3] = { &block.zoneId, &block.sigla, &block.comments };
        TextRow cells(3);
        size_t maxLines = 1;
        for (int i = 0; i < 3; i++)
        {
            TextWrapper wrapper(COMMENT_CELL_SIZE, widths[i] - 2 * COMMENT_PADDING);
            cells[i] = wrapper.wrapPlain(*texts[i], PdfFont::HELVETICA);
            maxLines = std::max(maxLines, cells[i].size());
        }
        double height = static_cast<double>(maxLines) * COMMENT_CELL_LEADING + 2 * COMMENT_PADDING;

        if (!firstOnPage && y - height < COMMENT_BOTTOM)
        {
            canvas_->strokeRect(MARGIN, y, tableWidth, top - y);
            finishPage();
            beginPage();
            y = top - drawCommentHeader(top, idHeader, widths);
            firstOnPage = true;
        }
        if (y - height < COMMENT_BOTTOM)
        {
            // Taller than a whole page: keep what fits above the footer
            size_t fits = static_cast<size_t>(std::max(1.0, std::floor(
                (y - COMMENT_BOTTOM - 2 * COMMENT_PADDING) / COMMENT_CELL_LEADING)));
            for (auto& cell : cells)
            {
                if (cell.size() > fits) cell.resize(fits);
            }
            height = static_cast<double>(fits) * COMMENT_CELL_LEADING + 2 * COMMENT_PADDING;
        }
        drawCommentRow(y, height, cells, widths, COMMENT_CELL_SIZE, COMMENT_CELL_LEADING, false);
        y -= height;
        firstOnPage = false;
    }
    canvas_->strokeRect(MARGIN, y, tableWidth, top - y);
    finishPage();
}

// ----- General comments -----

void ReportLayout::drawGeneralComments()
{
    beginPage();
    centered(PdfFont::HELVETICA_BOLD, GENERAL_TITLE_SIZE, PAGE_WIDTH / 2,
        REGION_TITLE_Y, "Comentários Gerais");

    TextWrapper wrapper(GENERAL_FONT_SIZE, USABLE_WIDTH);
    double y = REGION_TITLE_Y - GENERAL_TEXT_OFFSET;
    bool atPageTop = true;      // the title is not counted as content
    bool breakPending = false;

    auto newPage = [&]()
    {
        finishPage();
        beginPage();
        y = GENERAL_CONTINUATION_Y;
        atPageTop = true;
    };

    for (std::string_view paragraph : TextUtils::lines(options_.generalComments))
    {
        if (breakPending)
        {
            newPage();
            breakPending = false;
        }

        // Leading spaces are kept as non-breaking spaces
        size_t indent = paragraph.find_first_not_of(' ');
        if (indent == std::string_view::npos) indent = paragraph.size();
        Span span;
        span.text.assign(indent, vistoria::WinAnsi::NBSP);
        span.text += fromUtf8(paragraph.substr(indent));
        if (span.text.empty()) span.text.push_back(vistoria::WinAnsi::NBSP);

        std::vector<SpanLine> lines = wrapper.wrapSpans({ span });
        double height = static_cast<double>(lines.size()) * GENERAL_LEADING;
        if (height > y - GENERAL_BOTTOM && !atPageTop) newPage();

        // A paragraph taller than a page continues line by line
        for (const SpanLine& line : lines)
        {
            if (y - GENERAL_LEADING < GENERAL_BOTTOM && !atPageTop) newPage();
            drawSpanLine(line, GENERAL_FONT_SIZE, MARGIN, firstBaseline(y, GENERAL_FONT_SIZE));
            y -= GENERAL_LEADING;
            atPageTop = false;
        }
        y -= GENERAL_PARAGRAPH_GAP;
        if (y - GENERAL_BOTTOM < GENERAL_MIN_REMAINING) breakPending = true;
    }
    finishPage();
}

// ----- Photo pages -----

void ReportLayout::drawPageHeader()
{
    double cx = PAGE_WIDTH / 2;
    double y = PHOTO_HEADER_Y;
    centered(PdfFont::HELVETICA, PHOTO_HEADER_SIZE, cx, y, settings_.header1());
    y -= 6 * MM;
    centered(PdfFont::HELVETICA, PHOTO_HEADER_SIZE, cx, y, settings_.header2());
    y -= 8 * MM;
    centered(PdfFont::HELVETICA_BOLD, PHOTO_TITLE_SIZE, cx, y, settings_.title());
}

void ReportLayout::drawPhotoPages()
{
    std::unordered_set<std::string> seen;
    for (size_t i = 0; i < entries_.size(); i += ENTRIES_PER_PAGE)
    {
        beginPage();
        drawPageHeader();
        size_t end = std::min(entries_.size(), i + ENTRIES_PER_PAGE);
        for (size_t j = i; j < end; j++)
        {
            const std::string& sigla = entries_[j].sigla;
            if (!sigla.empty() && seen.insert(sigla).second)
            {
                canvas_->anchor(anchorName(sigla));
            }
        }
        for (size_t j = i; j < end; j++)
        {
            drawCell(entries_[j], static_cast<int>(j - i));
        }
        finishPage();
    }
}

void ReportLayout::drawCell(const Entry& entry, int column)
{
    double x = column == 0 ? MARGIN : MARGIN + USABLE_WIDTH / 2 + PHOTO_SPACING / 2;
    double y = PHOTO_TOP;
    canvas_->fillRect(x - CELL_BLEED, y - CELL_HEIGHT - CELL_BLEED,
        CELL_WIDTH + 2 * CELL_BLEED, CELL_HEIGHT + 2 * CELL_BLEED,
        Status::color(entry.status));

    double captionTop = y;
    const Thumbnail* thumbnail = entry.thumbnail.get();
    if (thumbnail && thumbnail->width > 0 && thumbnail->height > 0)
    {
        int turns = quarterTurns(entry.orientation);
        double w = thumbnail->displayWidth(turns);
        double h = thumbnail->displayHeight(turns);
        double scale = std::min(PHOTO_MAX_WIDTH / w, PHOTO_MAX_HEIGHT / h);
        w *= scale;
        h *= scale;
        double centerX = x + CELL_WIDTH / 2;
        canvas_->image(*thumbnail, turns, centerX - w / 2, y - h, w, h);
        captionTop = y - h - CAPTION_GAP;
    }
    drawCaption(entry.caption, x, captionTop);
}

void ReportLayout::drawCaption(const RichText& caption, double x, double top)
{
    TextWrapper wrapper(CAPTION_FONT_SIZE, CAPTION_WIDTH - 2 * CAPTION_PADDING);
    int maxLines = static_cast<int>(
        (CAPTION_HEIGHT - 2 * CAPTION_PADDING) / CAPTION_LEADING + 1e-6);
    int lineCount = 0;
    double baseline = firstBaseline(top - CAPTION_PADDING, CAPTION_FONT_SIZE);
    for (const RichText::Line& source : caption.lines)
    {
        for (const SpanLine& line : wrapper.wrap(source))
        {
            // Lines that do not fit the caption box are dropped
            if (lineCount == maxLines) return;
            drawSpanLine(line, CAPTION_FONT_SIZE, x + CAPTION_PADDING, baseline);
            baseline -= CAPTION_LEADING;
            lineCount++;
        }
    }
}

void ReportLayout::drawSpanLine(const SpanLine& line, double size, double x, double baseline)
{
    for (const Span& span : line)
    {
        double w = FontMetrics::textWidth(span.font(), size, span.text);
        canvas_->text(span.font(), size, x, baseline, span.text);
        if (span.underline)
        {
            double underlineY = baseline - 0.1 * size;
            canvas_->line(x, underlineY, x + w, underlineY);
        }
        if (!span.link.empty())
        {
            canvas_->uriLink(x, baseline - FontMetrics::DESCENT * size, w,
                (FontMetrics::ASCENT + FontMetrics::DESCENT) * size, span.link);
        }
        x += w;
    }
}

// ----- Signature page -----

void ReportLayout::drawSignaturePage()
{
    beginPage();
    const double size = SIGNATURE_FONT_SIZE;
    rightAligned(PdfFont::HELVETICA, size, PAGE_WIDTH - MARGIN, LOCATION_DATE_Y,
        settings_.locationDate(options_.reportDate));

    double leftX = PAGE_WIDTH / 4;
    double rightX = 3 * PAGE_WIDTH / 4;
    double y = PAGE_HEIGHT / 4;
    centered(PdfFont::HELVETICA, size, leftX, y + 20, settings_.sign1());
    centered(PdfFont::HELVETICA, size, leftX, y + 10, settings_.sign1Name());
    centered(PdfFont::HELVETICA, size, leftX, y, "Data: ........./........../...........");
    centered(PdfFont::HELVETICA, size, rightX, y + 20, settings_.sign2());
    centered(PdfFont::HELVETICA, size, rightX, y + 10, settings_.sign2Name());
    centered(PdfFont::HELVETICA, size, rightX, y, "Data: .........../.........../...........");
    finishPage();
}
