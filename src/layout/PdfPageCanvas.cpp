// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include "PdfPageCanvas.h"
#include "photo/ImageRecord.h"

void PdfPageCanvas::beginPage()
{
    doc_.beginPage();
    doc_.content().setLineWidth(1);
}

void PdfPageCanvas::endPage()
{
    doc_.endPage();
}

int PdfPageCanvas::pageIndex() const
{
    // The open page is not counted by the document until it ends
    return doc_.isPageOpen() ? doc_.pageCount() : doc_.pageCount() - 1;
}

int PdfPageCanvas::pageCount() const
{
    return doc_.pageCount() + (doc_.isPageOpen() ? 1 : 0);
}

void PdfPageCanvas::fillRect(double x, double y, double w, double h, const Color& color)
{
    vistoria::PdfContent& content = doc_.content();
    content.saveState();
    content.setFillColor(color);
    content.fillRect(x, y, w, h);
    content.restoreState();
}

void PdfPageCanvas::strokeRect(double x, double y, double w, double h)
{
    doc_.content().strokeRect(x, y, w, h);
}

void PdfPageCanvas::line(double x1, double y1, double x2, double y2)
{
    doc_.content().line(x1, y1, x2, y2);
}

void PdfPageCanvas::text(PdfFont font, double size, double x, double y, std::string_view winAnsi)
{
    if (winAnsi.empty()) return;
    doc_.content().text(font, size, x, y, winAnsi);
}

void PdfPageCanvas::image(const Thumbnail& thumbnail, int quarterTurns,
    double x, double y, double w, double h)
{
    std::string name = doc_.addJpeg(thumbnail.jpeg.data(), thumbnail.jpeg.size(),
        thumbnail.width, thumbnail.height, thumbnail.components);
    doc_.content().image(name, x, y, w, h, quarterTurns);
}

void PdfPageCanvas::link(double x, double y, double w, double h, std::string_view anchor)
{
    doc_.addLink(x, y, w, h, anchor);
}

void PdfPageCanvas::uriLink(double x, double y, double w, double h, std::string_view uri)
{
    doc_.addUriLink(x, y, w, h, uri);
}

void PdfPageCanvas::anchor(std::string_view name)
{
    if (anchors_.emplace(std::string(name), pageIndex()).second)
    {
        doc_.addDestination(name);
    }
}
