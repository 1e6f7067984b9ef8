// Copyright (c) 2024 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once
#include <string>
#include <string_view>
#include <vistoria/pdf/Color.h>
#include <vistoria/pdf/FontMetrics.h>

namespace vistoria {

/// Builds the operator stream of a single page. Coordinates are in
/// points, origin at the bottom left. Text must be WinAnsi-encoded.
///
class PdfContent
{
public:
    void saveState() { data_ += "q\n"; }
    void restoreState() { data_ += "Q\n"; }

    void setFillColor(const Color& color);
    void setStrokeColor(const Color& color);
    void setLineWidth(double width);

    void fillRect(double x, double y, double w, double h);
    void strokeRect(double x, double y, double w, double h);
    void line(double x1, double y1, double x2, double y2);

    void text(PdfFont font, double size, double x, double y, std::string_view winAnsi);

    /// Paints the image XObject with the given resource name into the
    /// box (x, y, w, h), rotated clockwise by quarterTurns * 90 degrees
    /// around the box. For odd turns, the image's own width maps to
    /// the box height.
    void image(std::string_view resourceName,
        double x, double y, double w, double h, int quarterTurns = 0);

    const std::string& data() const { return data_; }
    bool isEmpty() const { return data_.empty(); }

private:
    void number(double v);
    void space() { data_.push_back(' '); }

    std::string data_;
};

} // namespace vistoria
