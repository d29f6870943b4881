/*
    This file is part of TiledMaps.

    Copyright © 2010, 2011, 2012, 2013, 2014, 2015, 2016, 2017, 2018, 2019
              Vladimír Vondruš <mosra@centrum.cz>

    Permission is hereby granted, free of charge, to any person obtaining a
    copy of this software and associated documentation files (the "Software"),
    to deal in the Software without restriction, including without limitation
    the rights to use, copy, modify, merge, publish, distribute, sublicense,
    and/or sell copies of the Software, and to permit persons to whom the
    Software is furnished to do so, subject to the following conditions:

    The above copyright notice and this permission notice shall be included
    in all copies or substantial portions of the Software.

    THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
    IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
    FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL
    THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
    LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING
    FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER
    DEALINGS IN THE SOFTWARE.
*/

#include "XmlHelpers.h"

#include <cctype>
#include <cstdlib>
#include <cstring>

namespace TiledMaps { namespace Implementation {

Containers::Optional<Color4> parseColor(const char* string) {
    if(*string == '#') ++string;

    const std::size_t length = std::strlen(string);
    if(length != 6 && length != 8) return Containers::NullOpt;

    /* strtoul() alone would accept a sign or a 0x prefix */
    for(const char* c = string; *c; ++c)
        if(!std::isxdigit(UnsignedByte(*c))) return Containers::NullOpt;

    const UnsignedInt value = UnsignedInt(std::strtoul(string, nullptr, 16));

    if(length == 6) return Color4{Color3::fromSrgb(value)};

    /* Tiled puts alpha first */
    return Color4::fromSrgbAlpha((value << 8)|(value >> 24));
}

Containers::Optional<std::vector<Vector2>> parsePoints(const char* string) {
    std::vector<Vector2> points;

    const char* c = string;
    for(;;) {
        while(*c == ' ' || *c == '\t' || *c == '\n' || *c == '\r') ++c;
        if(!*c) break;

        char* end;
        const Float x = std::strtof(c, &end);
        if(end == c || *end != ',') return Containers::NullOpt;
        c = end + 1;

        const Float y = std::strtof(c, &end);
        if(end == c) return Containers::NullOpt;
        c = end;

        /* Points are separated by whitespace only */
        if(*c && *c != ' ' && *c != '\t' && *c != '\n' && *c != '\r')
            return Containers::NullOpt;

        points.emplace_back(x, y);
    }

    return points;
}

}}
