// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include "JsonParser.h"
#include <cmath>
#include <cstdint>
#include <cstdio>

std::string JsonParser::expectString()
{
    skipWhitespace();
    ParsedString s = string();
    if (s.isNull())
    {
        error("Expected string");
        return std::string();
    }
    std::string_view raw = s.asStringView();
    if (raw.find('\\') == std::string_view::npos) return std::string(raw);
    return unescape(raw);
}

bool JsonParser::acceptLiteral(std::string_view literal)
{
    skipWhitespace();
    for (size_t i = 0; i < literal.size(); i++)
    {
        if (pNext_[i] != literal[i]) return false;
    }
    char next = pNext_[literal.size()];
    if ((next >= 'a' && next <= 'z') || (next >= 'A' && next <= 'Z') ||
        (next >= '0' && next <= '9'))
    {
        return false;
    }
    pNext_ += literal.size();
    skipWhitespace();
    return true;
}

bool JsonParser::expectBoolean()
{
    if (acceptLiteral("true")) return true;
    if (acceptLiteral("false")) return false;
    error("Expected true or false");
    return false;
}

void JsonParser::expectObjectStart()
{
    skipWhitespace();
    expect('{');
}

std::string JsonParser::formatNumber(double d)
{
    char buf[64];
    if (std::floor(d) == d && std::fabs(d) < 1e15)
    {
        std::snprintf(buf, sizeof(buf), "%lld", static_cast<long long>(d));
    }
    else
    {
        std::snprintf(buf, sizeof(buf), "%.15g", d);
    }
    return buf;
}

std::string JsonParser::scalarAsString()
{
    skipWhitespace();
    if (*pNext_ == '"') return expectString();
    if (acceptNull()) return std::string();
    if (acceptLiteral("true")) return "true";
    if (acceptLiteral("false")) return "false";
    double d = number();
    if (std::isnan(d))
    {
        error("Expected string, number, boolean or null");
        return std::string();
    }
    return formatNumber(d);
}

void JsonParser::skipValue(int recursionLevel)  // NOLINT recursive
{
    skipWhitespace();
    if (*pNext_ == '"')
    {
        expectString();
        return;
    }
    if (acceptLiteral("null") || acceptLiteral("true") || acceptLiteral("false"))
    {
        return;
    }
    if (recursionLevel >= MAX_NESTING)
    {
        error("Excessive nesting");
        return;
    }
    if (accept('['))
    {
        elements([this, recursionLevel](int)
        {
            skipValue(recursionLevel + 1);
        });
        return;
    }
    if (accept('{'))
    {
        members([this, recursionLevel](const std::string&)
        {
            skipValue(recursionLevel + 1);
        });
        return;
    }
    double d = number();
    if (std::isnan(d)) error("Expected value");
}

namespace
{
    int hexValue(char ch)
    {
        if (ch >= '0' && ch <= '9') return ch - '0';
        if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
        if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
        return -1;
    }

    void appendUtf8(std::string& out, uint32_t cp)
    {
        if (cp < 0x80)
        {
            out.push_back(static_cast<char>(cp));
        }
        else if (cp < 0x800)
        {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
        else if (cp < 0x10000)
        {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
        else
        {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    // Reads the 4 hex digits of a \u escape; returns -1 if malformed
    int32_t readHex4(std::string_view s, size_t pos)
    {
        if (pos + 4 > s.size()) return -1;
        int32_t v = 0;
        for (size_t i = pos; i < pos + 4; i++)
        {
            int h = hexValue(s[i]);
            if (h < 0) return -1;
            v = (v << 4) | h;
        }
        return v;
    }
}

std::string JsonParser::unescape(std::string_view raw)
{
    std::string out;
    out.reserve(raw.size());
    size_t i = 0;
    while (i < raw.size())
    {
        char ch = raw[i++];
        if (ch != '\\' || i == raw.size())
        {
            out.push_back(ch);
            continue;
        }
        char esc = raw[i++];
        switch (esc)
        {
        case 'n': out.push_back('\n'); break;
        case 't': out.push_back('\t'); break;
        case 'r': out.push_back('\r'); break;
        case 'b': out.push_back('\b'); break;
        case 'f': out.push_back('\f'); break;
        case 'u':
        {
            int32_t cp = readHex4(raw, i);
            if (cp < 0)
            {
                out += "\\u";
                break;
            }
            i += 4;
            if (cp >= 0xD800 && cp <= 0xDBFF && i + 6 <= raw.size() &&
                raw[i] == '\\' && raw[i + 1] == 'u')
            {
                int32_t low = readHex4(raw, i + 2);
                if (low >= 0xDC00 && low <= 0xDFFF)
                {
                    cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                    i += 6;
                }
            }
            appendUtf8(out, static_cast<uint32_t>(cp));
            break;
        }
        default:
            out.push_back(esc);     // \" \\ \/
            break;
        }
    }
    return out;
}
