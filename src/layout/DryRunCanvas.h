// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once
#include <map>
#include <string>
#include "PageCanvas.h"

// Counts pages and records anchors without drawing anything

class DryRunCanvas : public PageCanvas
{
public:
    void beginPage() override { pageCount_++; }
    void endPage() override {}
    int pageIndex() const override { return pageCount_ - 1; }
    int pageCount() const override { return pageCount_; }

    void fillRect(double, double, double, double, const Color&) override {}
    void strokeRect(double, double, double, double) override {}
    void line(double, double, double, double) override {}
    void text(PdfFont, double, double, double, std::string_view) override {}
    void image(const Thumbnail&, int, double, double, double, double) override {}
    void link(double, double, double, double, std::string_view) override {}
    void uriLink(double, double, double, double, std::string_view) override {}

    void anchor(std::string_view name) override
    {
        anchors_.emplace(std::string(name), pageIndex());
    }

    const std::map<std::string, int>& anchors() const { return anchors_; }

private:
    int pageCount_ = 0;
    std::map<std::string, int> anchors_;
};
