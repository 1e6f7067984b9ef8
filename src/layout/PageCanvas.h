// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once
#include <string_view>
#include <vistoria/pdf/Color.h>
#include <vistoria/pdf/FontMetrics.h>

struct Thumbnail;

using vistoria::Color;
using vistoria::PdfFont;

// The drawing surface ReportLayout works against. Text is WinAnsi,
// coordinates are points from the bottom left of the page.

class PageCanvas
{
public:
    virtual ~PageCanvas() = default;

    virtual void beginPage() = 0;
    virtual void endPage() = 0;

    /// Zero-based index of the current (or last) page
    virtual int pageIndex() const = 0;
    virtual int pageCount() const = 0;

    virtual void fillRect(double x, double y, double w, double h, const Color& color) = 0;
    virtual void strokeRect(double x, double y, double w, double h) = 0;
    virtual void line(double x1, double y1, double x2, double y2) = 0;
    virtual void text(PdfFont font, double size, double x, double y, std::string_view winAnsi) = 0;

    /// Draws a JPEG thumbnail into the box (x, y, w, h), turned
    /// clockwise by the given number of quarter turns
    virtual void image(const Thumbnail& thumbnail, int quarterTurns,
        double x, double y, double w, double h) = 0;

    virtual void link(double x, double y, double w, double h, std::string_view anchor) = 0;
    virtual void uriLink(double x, double y, double w, double h, std::string_view uri) = 0;

    /// Marks the current page as the target of `name`. Only the first
    /// page marked with a given name counts.
    virtual void anchor(std::string_view name) = 0;
};
