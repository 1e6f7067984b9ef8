// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include "FriendlyName.h"
#include <cstdio>

namespace
{
    bool isDigit(char ch) { return ch >= '0' && ch <= '9'; }

    bool isSpace(char ch)
    {
        return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\f' || ch == '\v';
    }

    bool isWordChar(char ch)
    {
        return isDigit(ch) || (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') ||
            ch == '_' || (static_cast<unsigned char>(ch) >= 0x80);
    }
}

bool FriendlyName::matches(std::string_view s)
{
    if (s.size() < 3 || !isDigit(s[0]) || !isDigit(s[1]) || !isDigit(s[2])) return false;
    if (s.find('\n') != std::string_view::npos) return false;
    size_t pos = 3;
    while (pos < s.size() && isSpace(s[pos])) pos++;
    if (pos == s.size() || s[pos] != '-') return false;
    std::string_view rest = s.substr(pos + 1);

    // The extension runs from the last dot; word characters never
    // include a dot, so no other split can match
    size_t dot = rest.rfind('.');
    if (dot == std::string_view::npos || dot == 0 || dot + 1 == rest.size()) return false;
    for (size_t i = dot + 1; i < rest.size(); i++)
    {
        if (!isWordChar(rest[i])) return false;
    }
    return true;
}

int FriendlyName::number(std::string_view fileName)
{
    if (!matches(fileName)) return -1;
    return (fileName[0] - '0') * 100 + (fileName[1] - '0') * 10 + (fileName[2] - '0');
}

std::string FriendlyName::sanitize(std::string_view sigla)
{
    std::string out(sigla);
    for (char& ch : out)
    {
        switch (ch)
        {
        case '<': case '>': case ':': case '"': case '/':
        case '\\': case '|': case '?': case '*':
            ch = '-';
            break;
        default:
            break;
        }
    }
    return out;
}

std::string FriendlyName::format(int seq, std::string_view sigla, std::string_view extension)
{
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%03d - ", seq);
    std::string name(buf);
    name += sanitize(sigla);
    name += extension;
    return name;
}
