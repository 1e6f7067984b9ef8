// Copyright (c) 2024 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#include <vistoria/pdf/PdfContent.h>
#include <vistoria/pdf/WinAnsi.h>
#include <cmath>
#include <cstdio>

namespace vistoria {

void PdfContent::number(double v)
{
    char buf[32];
    double rounded = std::round(v * 1000.0) / 1000.0;
    if (rounded == 0) rounded = 0;      // no "-0"
    int len = std::snprintf(buf, sizeof(buf), "%.3f", rounded);
    // Trim trailing zeros and a trailing decimal point
    while (len > 0 && buf[len - 1] == '0') len--;
    if (len > 0 && buf[len - 1] == '.') len--;
    data_.append(buf, len);
}

void PdfContent::setFillColor(const Color& color)
{
    number(color.r); space();
    number(color.g); space();
    number(color.b);
    data_ += " rg\n";
}

void PdfContent::setStrokeColor(const Color& color)
{
    number(color.r); space();
    number(color.g); space();
    number(color.b);
    data_ += " RG\n";
}

void PdfContent::setLineWidth(double width)
{
    number(width);
    data_ += " w\n";
}

void PdfContent::fillRect(double x, double y, double w, double h)
{
    number(x); space();
    number(y); space();
    number(w); space();
    number(h);
    data_ += " re f\n";
}

void PdfContent::strokeRect(double x, double y, double w, double h)
{
    number(x); space();
    number(y); space();
    number(w); space();
    number(h);
    data_ += " re S\n";
}

void PdfContent::line(double x1, double y1, double x2, double y2)
{
    number(x1); space();
    number(y1);
    data_ += " m ";
    number(x2); space();
    number(y2);
    data_ += " l S\n";
}

void PdfContent::text(PdfFont font, double size, double x, double y, std::string_view winAnsi)
{
    data_ += font == PdfFont::HELVETICA_BOLD ? "BT\n/F2 " : "BT\n/F1 ";
    number(size);
    data_ += " Tf\n";
    number(x); space();
    number(y);
    data_ += " Td\n(";
    WinAnsi::appendLiteral(data_, winAnsi);
    data_ += ") Tj\nET\n";
}

void PdfContent::image(std::string_view resourceName,
    double x, double y, double w, double h, int quarterTurns)
{
    // The image space is the unit square; the matrix maps it onto
    // the target box, turning it as requested
    double a, b, c, d, e, f;
    switch (quarterTurns & 3)
    {
    case 1:     // 90 degrees clockwise
        a = 0;  b = -h; c = w;  d = 0;  e = x;     f = y + h;
        break;
    case 2:
        a = -w; b = 0;  c = 0;  d = -h; e = x + w; f = y + h;
        break;
    case 3:     // 90 degrees counter-clockwise
        a = 0;  b = h;  c = -w; d = 0;  e = x + w; f = y;
        break;
    default:
        a = w;  b = 0;  c = 0;  d = h;  e = x;     f = y;
        break;
    }
    data_ += "q\n";
    number(a); space();
    number(b); space();
    number(c); space();
    number(d); space();
    number(e); space();
    number(f);
    data_ += " cm\n/";
    data_ += resourceName;
    data_ += " Do\nQ\n";
}

} // namespace vistoria
