// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once
#include <map>
#include <string>
#include <vistoria/pdf/PdfDocument.h>
#include "PageCanvas.h"

// Draws into a PdfDocument

class PdfPageCanvas : public PageCanvas
{
public:
    explicit PdfPageCanvas(vistoria::PdfDocument& doc) : doc_(doc) {}

    void beginPage() override;
    void endPage() override;
    int pageIndex() const override;
    int pageCount() const override;

    void fillRect(double x, double y, double w, double h, const Color& color) override;
    void strokeRect(double x, double y, double w, double h) override;
    void line(double x1, double y1, double x2, double y2) override;
    void text(PdfFont font, double size, double x, double y, std::string_view winAnsi) override;
    void image(const Thumbnail& thumbnail, int quarterTurns,
        double x, double y, double w, double h) override;
    void link(double x, double y, double w, double h, std::string_view anchor) override;
    void uriLink(double x, double y, double w, double h, std::string_view uri) override;
    void anchor(std::string_view name) override;

    /// Pages on which each anchor was placed
    const std::map<std::string, int>& anchors() const { return anchors_; }

private:
    vistoria::PdfDocument& doc_;
    std::map<std::string, int> anchors_;
};
