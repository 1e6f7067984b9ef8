// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once

// Page geometry of the report, in points. Landscape A4.

namespace LayoutMetrics
{
    constexpr double MM = 72.0 / 25.4;

    constexpr double PAGE_WIDTH = 841.89;
    constexpr double PAGE_HEIGHT = 595.28;
    constexpr double MARGIN = 40 * MM;
    constexpr double USABLE_WIDTH = PAGE_WIDTH - 2 * MARGIN;

    // Footer
    constexpr double FOOTER_RULE_Y = 20 * MM;
    constexpr double FOOTER_TEXT_Y = 15 * MM;
    constexpr double FOOTER_LINE_STEP = 4 * MM;
    constexpr double FOOTER_FONT_SIZE = 8;

    // Region titles and tables
    constexpr double REGION_TITLE_Y = PAGE_HEIGHT - 30 * MM;
    constexpr double REGION_TITLE_SIZE = 12;
    constexpr double TABLE_Y = REGION_TITLE_Y - 10 * MM;
    constexpr double TABLE_FONT_SIZE = 10;
    constexpr double TABLE_TEXT_INSET = 2 * MM;
    constexpr double HEADER_GRAY = 0.8;

    // Status tables
    constexpr double STATUS_ID_WIDTH = 20 * MM;
    constexpr double STATUS_SIGLA_WIDTH = 50 * MM;
    constexpr double STATUS_STATE_WIDTH = 40 * MM;
    constexpr double STATUS_ROW_HEIGHT = 6 * MM;
    constexpr double STATUS_BLOCK_GAP = 5 * MM;
    constexpr int STATUS_ROWS_PER_BLOCK = 15;
    constexpr int STATUS_ROWS_PER_PAGE = 2 * STATUS_ROWS_PER_BLOCK;

    // Comment tables
    constexpr double COMMENT_KEY_WIDTH = 30 * MM;
    constexpr double COMMENT_PADDING = 2 * MM;
    constexpr double COMMENT_BOTTOM = 20 * MM;
    constexpr double COMMENT_HEADER_SIZE = 10;
    constexpr double COMMENT_HEADER_LEADING = 12;
    constexpr double COMMENT_CELL_SIZE = 9;
    constexpr double COMMENT_CELL_LEADING = 11;

    // General comments
    constexpr double GENERAL_TITLE_SIZE = 16;
    constexpr double GENERAL_TEXT_OFFSET = 5 * MM;
    constexpr double GENERAL_FONT_SIZE = 12;
    constexpr double GENERAL_LEADING = 14;
    constexpr double GENERAL_PARAGRAPH_GAP = 2;
    constexpr double GENERAL_BOTTOM = 20 * MM;
    constexpr double GENERAL_MIN_REMAINING = 10 * MM;
    constexpr double GENERAL_CONTINUATION_Y = PAGE_HEIGHT - GENERAL_BOTTOM;

    // Photo pages
    constexpr double PHOTO_HEADER_Y = PAGE_HEIGHT - 15 * MM;
    constexpr double PHOTO_HEADER_SIZE = 12;
    constexpr double PHOTO_TITLE_SIZE = 14;
    constexpr double PHOTO_TOP = PAGE_HEIGHT - 35 * MM;
    constexpr double PHOTO_SPACING = 5 * MM;
    constexpr double PHOTO_MAX_WIDTH = USABLE_WIDTH / 2 - 5 * MM;
    constexpr double PHOTO_MAX_HEIGHT = 76 * MM;
    constexpr double CAPTION_HEIGHT = 70 * MM;
    constexpr double CELL_HEIGHT = PHOTO_MAX_HEIGHT + CAPTION_HEIGHT + 5 * MM;
    constexpr double CELL_WIDTH = USABLE_WIDTH / 2 - PHOTO_SPACING / 2;
    constexpr double CELL_BLEED = 2 * MM;
    constexpr double CAPTION_WIDTH = CELL_WIDTH - 5 * MM;
    constexpr double CAPTION_GAP = 1 * MM;
    constexpr double CAPTION_PADDING = 6;
    constexpr double CAPTION_FONT_SIZE = 10;
    constexpr double CAPTION_LEADING = 12;
    constexpr int ENTRIES_PER_PAGE = 2;

    // Signature page
    constexpr double SIGNATURE_FONT_SIZE = 10;
    constexpr double LOCATION_DATE_Y = 25 * MM;
}
