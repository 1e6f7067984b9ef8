// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once

#include <string>
#include <string_view>
#include <clarisma/util/Parser.h>

using namespace clarisma;

// Common JSON reading on top of clarisma::Parser, shared by the zone,
// edit-store and settings readers. Values that are not of interest are
// skipped without building a document tree.

class JsonParser : public Parser
{
public:
    explicit JsonParser(const char* s) :
        Parser(s)
    {
    }

    static std::string unescape(std::string_view raw);
    static std::string formatNumber(double d);

protected:
    std::string expectString();
    bool acceptLiteral(std::string_view literal);
    bool acceptNull() { return acceptLiteral("null"); }
    bool expectBoolean();

    /// Reads a string, number, boolean or null, and returns it as text.
    /// Integral numbers lose their fraction ("12.0" becomes "12"), null
    /// becomes an empty string.
    std::string scalarAsString();

    void skipValue(int recursionLevel);
    void expectObjectStart();

    /// Calls `handler(key)` for each member of an object whose opening
    /// brace has already been consumed. The handler must consume the value.
    template<typename Handler>
    void members(Handler handler)
    {
        skipWhitespace();
        if (accept('}')) return;
        for (;;)
        {
            std::string key = expectString();
            expect(':');
            skipWhitespace();
            handler(key);
            skipWhitespace();
            if (accept('}')) break;
            expect(',');
        }
    }

    /// Calls `handler(index)` for each element of an array whose opening
    /// bracket has already been consumed.
    template<typename Handler>
    void elements(Handler handler)
    {
        skipWhitespace();
        if (accept(']')) return;
        int index = 0;
        for (;;)
        {
            skipWhitespace();
            handler(index++);
            skipWhitespace();
            if (accept(']')) break;
            expect(',');
        }
    }

    static constexpr int MAX_NESTING = 128;
};
