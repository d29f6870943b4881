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

#include "Base64.h"

namespace TiledMaps { namespace Implementation {

namespace {

constexpr Byte Invalid = -1;
constexpr Byte Whitespace = -2;
constexpr Byte Padding = -3;

Byte sextet(const char c) {
    if(c >= 'A' && c <= 'Z') return c - 'A';
    if(c >= 'a' && c <= 'z') return c - 'a' + 26;
    if(c >= '0' && c <= '9') return c - '0' + 52;
    if(c == '+') return 62;
    if(c == '/') return 63;
    if(c == '=') return Padding;
    if(c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v')
        return Whitespace;
    return Invalid;
}

}

Containers::Optional<std::string> decodeBase64(const Containers::ArrayView<const char> data) {
    std::string out;
    out.reserve(data.size()*3/4);

    UnsignedInt accumulator = 0;
    std::size_t pending = 0;
    bool padded = false;
    for(const char c: data) {
        const Byte value = sextet(c);
        if(value == Whitespace) continue;
        if(value == Invalid) return Containers::NullOpt;
        if(value == Padding) {
            padded = true;
            continue;
        }

        /* Nothing but padding and whitespace can follow the padding */
        if(padded) return Containers::NullOpt;

        accumulator = (accumulator << 6)|UnsignedInt(value);
        if(++pending == 4) {
            out += char((accumulator >> 16) & 0xff);
            out += char((accumulator >> 8) & 0xff);
            out += char(accumulator & 0xff);
            accumulator = 0;
            pending = 0;
        }
    }

    /* A single leftover sextet doesn't form a whole byte */
    if(pending == 1) return Containers::NullOpt;
    if(pending == 2) {
        out += char((accumulator >> 4) & 0xff);
    } else if(pending == 3) {
        out += char((accumulator >> 10) & 0xff);
        out += char((accumulator >> 2) & 0xff);
    }

    return out;
}

}}
