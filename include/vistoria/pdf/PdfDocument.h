// Copyright (c) 2024 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <vistoria/pdf/PdfContent.h>

namespace vistoria {

/// A PDF built page by page on top of qpdf's object model. Pages share
/// one page size and the two standard Helvetica faces (resources /F1
/// and /F2). Named destinations registered on a page are collected
/// into the catalog's /Dests name tree when the document is written.
///
class PdfDocument
{
public:
    PdfDocument(double pageWidth, double pageHeight);

    double pageWidth() const { return pageWidth_; }
    double pageHeight() const { return pageHeight_; }
    int pageCount() const { return pageCount_; }
    bool isPageOpen() const { return pageOpen_; }

    void beginPage();
    void endPage();
    PdfContent& content() { return content_; }

    /// Registers a JPEG stream as an image XObject of the current page
    /// and returns its resource name. The data is embedded unchanged.
    std::string addJpeg(const uint8_t* data, size_t size,
        int width, int height, int components);

    /// Adds a named destination pointing at the current page. The first
    /// registration of a name wins.
    void addDestination(std::string_view name);
    void addLink(double x, double y, double w, double h, std::string_view destination);
    void addUriLink(double x, double y, double w, double h, std::string_view uri);

    void setInfo(std::string_view title, std::string_view creator);
    void write(const char* fileName);

private:
    QPDFObjectHandle rect(double x, double y, double w, double h);
    QPDFObjectHandle newAnnotation(double x, double y, double w, double h);
    void requirePage(const char* operation) const;

    QPDF pdf_;
    double pageWidth_;
    double pageHeight_;
    int pageCount_ = 0;
    int imageCount_ = 0;
    bool pageOpen_ = false;
    QPDFObjectHandle fonts_;
    PdfContent content_;
    QPDFObjectHandle xobjects_;
    QPDFObjectHandle annotations_;
    std::vector<std::string> pendingDestinations_;
    std::map<std::string, QPDFObjectHandle> destinations_;
};

} // namespace vistoria
