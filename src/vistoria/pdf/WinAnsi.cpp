// Copyright (c) 2024 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#include <vistoria/pdf/WinAnsi.h>
#include <cstdint>

namespace vistoria {

namespace
{
    // Code points that WinAnsiEncoding places in 0x80..0x9F
    struct SpecialChar
    {
        uint32_t codePoint;
        char code;
    };

    constexpr SpecialChar SPECIAL_CHARS[] =
    {
        { 0x20AC, '\x80' }, { 0x201A, '\x82' }, { 0x0192, '\x83' },
        { 0x201E, '\x84' }, { 0x2026, '\x85' }, { 0x2020, '\x86' },
        { 0x2021, '\x87' }, { 0x02C6, '\x88' }, { 0x2030, '\x89' },
        { 0x0160, '\x8A' }, { 0x2039, '\x8B' }, { 0x0152, '\x8C' },
        { 0x017D, '\x8E' }, { 0x2018, '\x91' }, { 0x2019, '\x92' },
        { 0x201C, '\x93' }, { 0x201D, '\x94' }, { 0x2022, '\x95' },
        { 0x2013, '\x96' }, { 0x2014, '\x97' }, { 0x02DC, '\x98' },
        { 0x2122, '\x99' }, { 0x0161, '\x9A' }, { 0x203A, '\x9B' },
        { 0x0153, '\x9C' }, { 0x017E, '\x9E' }, { 0x0178, '\x9F' },
    };

    char encode(uint32_t cp)
    {
        if (cp < 0x80)
        {
            // Control characters other than tab have no glyph
            if (cp < 0x20) return cp == '\t' ? ' ' : '?';
            return static_cast<char>(cp);
        }
        if (cp >= 0xA0 && cp <= 0xFF) return static_cast<char>(cp);
        for (const SpecialChar& sc : SPECIAL_CHARS)
        {
            if (sc.codePoint == cp) return sc.code;
        }
        return '?';
    }
}

std::string WinAnsi::fromUtf8(std::string_view utf8)
{
    std::string out;
    out.reserve(utf8.size());
    const uint8_t* p = reinterpret_cast<const uint8_t*>(utf8.data());
    const uint8_t* end = p + utf8.size();
    while (p < end)
    {
        uint32_t ch = *p;
        int extra;
        if (ch < 0x80)
        {
            out.push_back(encode(ch));
            p++;
            continue;
        }
        if ((ch & 0xE0) == 0xC0)
        {
            ch &= 0x1F;
            extra = 1;
        }
        else if ((ch & 0xF0) == 0xE0)
        {
            ch &= 0x0F;
            extra = 2;
        }
        else if ((ch & 0xF8) == 0xF0)
        {
            ch &= 0x07;
            extra = 3;
        }
        else
        {
            p++;        // stray continuation byte
            continue;
        }
        if (end - p <= extra)
        {
            break;
        }
        bool valid = true;
        for (int i = 1; i <= extra; i++)
        {
            if ((p[i] & 0xC0) != 0x80)
            {
                valid = false;
                break;
            }
            ch = (ch << 6) | (p[i] & 0x3F);
        }
        if (!valid)
        {
            p++;
            continue;
        }
        out.push_back(encode(ch));
        p += extra + 1;
    }
    return out;
}

void WinAnsi::appendLiteral(std::string& out, std::string_view s)
{
    for (char ch : s)
    {
        if (ch == '(' || ch == ')' || ch == '\\') out.push_back('\\');
        out.push_back(ch);
    }
}

} // namespace vistoria
