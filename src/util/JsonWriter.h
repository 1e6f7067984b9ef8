// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <clarisma/util/StringBuilder.h>

using namespace clarisma;

// Writes indented JSON into a StringBuilder. Callers are responsible
// for a well-formed sequence of calls (a key before each value inside
// an object).

class JsonWriter
{
public:
    void beginObject() { begin('{'); }
    void endObject() { end('}'); }
    void beginArray() { begin('['); }
    void endArray() { end(']'); }

    void key(std::string_view k);
    void value(std::string_view s);
    void value(const char* s) { value(std::string_view(s)); }
    void value(bool b);
    void value(int64_t v);
    void nullValue();

    std::string toString() { return out_.toString(); }

    /// Writes `s` as a quoted JSON string. Non-ASCII UTF-8 is written
    /// as is; control characters are escaped.
    static void writeString(StringBuilder& out, std::string_view s);

private:
    void begin(char ch);
    void end(char ch);
    void beforeValue();
    void newLine();

    StringBuilder out_;
    std::vector<bool> hasItems_;    // one per open object or array
    bool afterKey_ = false;
};
