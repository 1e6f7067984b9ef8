// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include "JsonWriter.h"
#include <cstdio>

void JsonWriter::newLine()
{
    out_.writeByte('\n');
    for (size_t i = 0; i < hasItems_.size(); i++) out_ << std::string_view("    ");
}

void JsonWriter::beforeValue()
{
    if (afterKey_)
    {
        afterKey_ = false;
        return;
    }
    if (hasItems_.empty()) return;
    if (hasItems_.back()) out_.writeByte(',');
    hasItems_.back() = true;
    newLine();
}

void JsonWriter::begin(char ch)
{
    beforeValue();
    out_.writeByte(ch);
    hasItems_.push_back(false);
}

void JsonWriter::end(char ch)
{
    bool any = hasItems_.back();
    hasItems_.pop_back();
    if (any) newLine();
    out_.writeByte(ch);
}

void JsonWriter::key(std::string_view k)
{
    beforeValue();
    writeString(out_, k);
    out_ << std::string_view(": ");
    afterKey_ = true;
}

void JsonWriter::value(std::string_view s)
{
    beforeValue();
    writeString(out_, s);
}

void JsonWriter::value(bool b)
{
    beforeValue();
    out_ << std::string_view(b ? "true" : "false");
}

void JsonWriter::value(int64_t v)
{
    beforeValue();
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%lld", static_cast<long long>(v));
    out_ << std::string_view(buf);
}

void JsonWriter::nullValue()
{
    beforeValue();
    out_ << std::string_view("null");
}

void JsonWriter::writeString(StringBuilder& out, std::string_view s)
{
    out.writeByte('"');
    for (char ch : s)
    {
        switch (ch)
        {
        case '"':
            out << std::string_view("\\\"");
            break;
        case '\\':
            out << std::string_view("\\\\");
            break;
        case '\n':
            out << std::string_view("\\n");
            break;
        case '\r':
            out << std::string_view("\\r");
            break;
        case '\t':
            out << std::string_view("\\t");
            break;
        default:
            if (static_cast<unsigned char>(ch) < 0x20)
            {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", ch);
                out << std::string_view(buf);
            }
            else
            {
                out.writeByte(ch);
            }
            break;
        }
    }
    out.writeByte('"');
}
