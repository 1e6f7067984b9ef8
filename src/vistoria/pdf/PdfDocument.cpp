// Copyright (c) 2024 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#include <vistoria/pdf/PdfDocument.h>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <qpdf/QPDFWriter.hh>
#include <vistoria/pdf/PdfException.h>

namespace vistoria {

namespace
{
    QPDFObjectHandle newFont(const char* baseFont)
    {
        QPDFObjectHandle font = QPDFObjectHandle::newDictionary();
        font.replaceKey("/Type", QPDFObjectHandle::newName("/Font"));
        font.replaceKey("/Subtype", QPDFObjectHandle::newName("/Type1"));
        font.replaceKey("/BaseFont", QPDFObjectHandle::newName(baseFont));
        font.replaceKey("/Encoding", QPDFObjectHandle::newName("/WinAnsiEncoding"));
        return font;
    }
}

PdfDocument::PdfDocument(double pageWidth, double pageHeight) :
    pageWidth_(pageWidth),
    pageHeight_(pageHeight)
{
    pdf_.emptyPDF();
    fonts_ = QPDFObjectHandle::newDictionary();
    fonts_.replaceKey("/F1", pdf_.makeIndirectObject(
        newFont(FontMetrics::baseFontName(PdfFont::HELVETICA))));
    fonts_.replaceKey("/F2", pdf_.makeIndirectObject(
        newFont(FontMetrics::baseFontName(PdfFont::HELVETICA_BOLD))));
}

void PdfDocument::requirePage(const char* operation) const
{
    if (!pageOpen_)
    {
        throw PdfException("%s requires an open page", operation);
    }
}

void PdfDocument::beginPage()
{
    if (pageOpen_) throw PdfException("Page %d is still open", pageCount_ + 1);
    pageOpen_ = true;
    content_ = PdfContent();
    xobjects_ = QPDFObjectHandle::newDictionary();
    annotations_ = QPDFObjectHandle::newArray();
    pendingDestinations_.clear();
}

void PdfDocument::endPage()
{
    requirePage("endPage");

    QPDFObjectHandle resources = QPDFObjectHandle::newDictionary();
    resources.replaceKey("/Font", fonts_);
    if (!xobjects_.getKeys().empty())
    {
        resources.replaceKey("/XObject", xobjects_);
    }

    QPDFObjectHandle page = QPDFObjectHandle::newDictionary();
    page.replaceKey("/Type", QPDFObjectHandle::newName("/Page"));
    page.replaceKey("/MediaBox", rect(0, 0, pageWidth_, pageHeight_));
    page.replaceKey("/Resources", resources);
    page.replaceKey("/Contents", QPDFObjectHandle::newStream(&pdf_, content_.data()));
    if (annotations_.getArrayNItems() > 0)
    {
        page.replaceKey("/Annots", annotations_);
    }
    page = pdf_.makeIndirectObject(page);
    QPDFPageDocumentHelper(pdf_).addPage(QPDFPageObjectHelper(page), false);

    for (const std::string& name : pendingDestinations_)
    {
        QPDFObjectHandle dest = QPDFObjectHandle::newArray();
        dest.appendItem(page);
        dest.appendItem(QPDFObjectHandle::newName("/Fit"));
        destinations_.emplace(name, dest);
    }
    pendingDestinations_.clear();
    pageCount_++;
    pageOpen_ = false;
}

std::string PdfDocument::addJpeg(const uint8_t* data, size_t size,
    int width, int height, int components)
{
    requirePage("addJpeg");
    const char* colorSpace;
    switch (components)
    {
    case 1:
        colorSpace = "/DeviceGray";
        break;
    case 3:
        colorSpace = "/DeviceRGB";
        break;
    case 4:
        colorSpace = "/DeviceCMYK";
        break;
    default:
        throw PdfException("Unsupported JPEG color components: %d", components);
    }

    QPDFObjectHandle image = QPDFObjectHandle::newStream(&pdf_);
    image.replaceStreamData(
        std::string(reinterpret_cast<const char*>(data), size),
        QPDFObjectHandle::newName("/DCTDecode"),
        QPDFObjectHandle::newNull());
    QPDFObjectHandle dict = image.getDict();
    dict.replaceKey("/Type", QPDFObjectHandle::newName("/XObject"));
    dict.replaceKey("/Subtype", QPDFObjectHandle::newName("/Image"));
    dict.replaceKey("/Width", QPDFObjectHandle::newInteger(width));
    dict.replaceKey("/Height", QPDFObjectHandle::newInteger(height));
    dict.replaceKey("/ColorSpace", QPDFObjectHandle::newName(colorSpace));
    dict.replaceKey("/BitsPerComponent", QPDFObjectHandle::newInteger(8));
    if (components == 4)
    {
        // Adobe-style CMYK JPEGs store inverted samples
        QPDFObjectHandle decode = QPDFObjectHandle::newArray();
        for (int i = 0; i < 4; i++)
        {
            decode.appendItem(QPDFObjectHandle::newInteger(1));
            decode.appendItem(QPDFObjectHandle::newInteger(0));
        }
        dict.replaceKey("/Decode", decode);
    }

    imageCount_++;
    std::string name = "Im" + std::to_string(imageCount_);
    xobjects_.replaceKey("/" + name, image);
    return name;
}

void PdfDocument::addDestination(std::string_view name)
{
    requirePage("addDestination");
    std::string key(name);
    if (destinations_.contains(key)) return;
    pendingDestinations_.push_back(std::move(key));
}

QPDFObjectHandle PdfDocument::rect(double x, double y, double w, double h)
{
    QPDFObjectHandle r = QPDFObjectHandle::newArray();
    r.appendItem(QPDFObjectHandle::newReal(x, 3));
    r.appendItem(QPDFObjectHandle::newReal(y, 3));
    r.appendItem(QPDFObjectHandle::newReal(x + w, 3));
    r.appendItem(QPDFObjectHandle::newReal(y + h, 3));
    return r;
}

QPDFObjectHandle PdfDocument::newAnnotation(double x, double y, double w, double h)
{
    QPDFObjectHandle annot = QPDFObjectHandle::newDictionary();
    annot.replaceKey("/Type", QPDFObjectHandle::newName("/Annot"));
    annot.replaceKey("/Subtype", QPDFObjectHandle::newName("/Link"));
    annot.replaceKey("/Rect", rect(x, y, w, h));
    QPDFObjectHandle border = QPDFObjectHandle::newArray();
    border.appendItem(QPDFObjectHandle::newInteger(0));
    border.appendItem(QPDFObjectHandle::newInteger(0));
    border.appendItem(QPDFObjectHandle::newInteger(0));
    annot.replaceKey("/Border", border);
    return annot;
}

void PdfDocument::addLink(double x, double y, double w, double h, std::string_view destination)
{
    requirePage("addLink");
    QPDFObjectHandle annot = newAnnotation(x, y, w, h);
    annot.replaceKey("/Dest", QPDFObjectHandle::newString(std::string(destination)));
    annotations_.appendItem(pdf_.makeIndirectObject(annot));
}

void PdfDocument::addUriLink(double x, double y, double w, double h, std::string_view uri)
{
    requirePage("addUriLink");
    QPDFObjectHandle action = QPDFObjectHandle::newDictionary();
    action.replaceKey("/S", QPDFObjectHandle::newName("/URI"));
    action.replaceKey("/URI", QPDFObjectHandle::newString(std::string(uri)));
    QPDFObjectHandle annot = newAnnotation(x, y, w, h);
    annot.replaceKey("/A", action);
    annotations_.appendItem(pdf_.makeIndirectObject(annot));
}

void PdfDocument::setInfo(std::string_view title, std::string_view creator)
{
    QPDFObjectHandle info = QPDFObjectHandle::newDictionary();
    info.replaceKey("/Title", QPDFObjectHandle::newUnicodeString(std::string(title)));
    info.replaceKey("/Creator", QPDFObjectHandle::newUnicodeString(std::string(creator)));
    pdf_.getTrailer().replaceKey("/Info", pdf_.makeIndirectObject(info));
}

void PdfDocument::write(const char* fileName)
{
    if (pageOpen_) throw PdfException("Page %d was never closed", pageCount_ + 1);

    if (!destinations_.empty())
    {
        // std::map keeps the keys in the byte order a name tree requires
        QPDFObjectHandle names = QPDFObjectHandle::newArray();
        for (const auto& [name, dest] : destinations_)
        {
            names.appendItem(QPDFObjectHandle::newString(name));
            names.appendItem(dest);
        }
        QPDFObjectHandle tree = QPDFObjectHandle::newDictionary();
        tree.replaceKey("/Names", names);
        QPDFObjectHandle nameDict = QPDFObjectHandle::newDictionary();
        nameDict.replaceKey("/Dests", pdf_.makeIndirectObject(tree));
        pdf_.getRoot().replaceKey("/Names", nameDict);
    }

    try
    {
        QPDFWriter writer(pdf_, fileName);
        writer.setStreamDataMode(qpdf_s_compress);
        writer.setDeterministicID(true);
        writer.write();
    }
    catch (const std::exception& ex)
    {
        throw PdfException("Failed to write %s: %s", fileName, ex.what());
    }
}

} // namespace vistoria
