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

#include "CellData.h"

#include <cstring>
#include <Corrade/Containers/Optional.h>
#include <Corrade/Utility/Debug.h>
#include <Corrade/Utility/DebugStl.h>
#include <Corrade/Utility/Endianness.h>

#include "TiledMaps/Map.h"
#include "TiledMaps/Tileset.h"
#include "TiledMaps/Implementation/Base64.h"
#include "TiledMaps/Implementation/Decompression.h"

namespace TiledMaps {

namespace {

bool isWhitespace(const char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

UnsignedInt littleEndianId(const char* data) {
    UnsignedInt id;
    std::memcpy(&id, data, 4);
    return Utility::Endianness::littleEndian(id);
}

/* Reads one raw ID per cell from `next`, row by row from the top */
template<class Reader> bool fillCells(TileLayer& layer, const TilesetRegistry& tilesets, const YAxis yAxis, Reader&& next) {
    const Vector2i size = layer.size();
    for(Int y = 0; y != size.y(); ++y) {
        for(Int x = 0; x != size.x(); ++x) {
            UnsignedInt raw;
            if(!next(raw)) return false;

            const Cell cell = cellForGlobalId(raw);
            if(!tilesets.tile(cell.tile)) continue;

            layer.setCell({x, yAxis == YAxis::Up ? size.y() - 1 - y : y}, cell);
        }
    }

    return true;
}

bool decodeCsv(TileLayer& layer, const TilesetRegistry& tilesets, const std::string& layerName, const Containers::ArrayView<const char> data, const YAxis yAxis) {
    const std::size_t expected = std::size_t(layer.size().x())*std::size_t(layer.size().y());

    const char* c = data.begin();
    const char* const end = data.end();
    std::size_t index = 0;
    const bool filled = fillCells(layer, tilesets, yAxis, [&](UnsignedInt& out) -> bool {
        if(c == end) {
            Error{} << "TiledMaps::decodeCellData(): malformed csv data in layer" << layerName << Debug::nospace << ": expected" << expected << "values, got" << index;
            return false;
        }

        const char* tokenEnd = c;
        while(tokenEnd != end && *tokenEnd != ',') ++tokenEnd;

        const char* tokenBegin = c;
        while(tokenBegin != tokenEnd && isWhitespace(*tokenBegin)) ++tokenBegin;
        const char* digitsEnd = tokenEnd;
        while(digitsEnd != tokenBegin && isWhitespace(*(digitsEnd - 1))) --digitsEnd;

        UnsignedLong value = 0;
        bool valid = tokenBegin != digitsEnd;
        for(const char* d = tokenBegin; valid && d != digitsEnd; ++d) {
            if(*d < '0' || *d > '9') valid = false;
            else value = value*10 + UnsignedLong(*d - '0');
            if(value > 0xffffffffull) valid = false;
        }

        if(!valid) {
            Error{} << "TiledMaps::decodeCellData(): malformed csv data in layer" << layerName << Debug::nospace << ": invalid value" << std::string{tokenBegin, digitsEnd} << "at index" << index;
            return false;
        }

        out = UnsignedInt(value);
        ++index;

        /* Skip the comma, the last value has none */
        c = tokenEnd == end ? end : tokenEnd + 1;
        return true;
    });
    if(!filled) return false;

    /* Tiled puts a trailing newline after the last value, anything else is
       excess data */
    while(c != end && isWhitespace(*c)) ++c;
    if(c != end) {
        Error{} << "TiledMaps::decodeCellData(): malformed csv data in layer" << layerName << Debug::nospace << ": expected" << expected << "values, got more";
        return false;
    }

    return true;
}

bool decodeBase64Cells(TileLayer& layer, const TilesetRegistry& tilesets, const std::string& layerName, const std::string& compression, const Containers::ArrayView<const char> data, const YAxis yAxis) {
    const Containers::Optional<std::string> bytes = Implementation::decodeBase64(data);
    if(!bytes) {
        Error{} << "TiledMaps::decodeCellData(): malformed base64 data in layer" << layerName;
        return false;
    }

    const std::size_t expected = 4*std::size_t(layer.size().x())*std::size_t(layer.size().y());

    if(compression.empty()) {
        if(bytes->size() != expected) {
            Error{} << "TiledMaps::decodeCellData(): malformed base64 data in layer" << layerName << Debug::nospace << ": expected" << expected << "bytes, got" << bytes->size();
            return false;
        }

        const char* c = bytes->data();
        return fillCells(layer, tilesets, yAxis, [&](UnsignedInt& out) -> bool {
            out = littleEndianId(c);
            c += 4;
            return true;
        });
    }

    Implementation::InflateStream stream{{bytes->data(), bytes->size()}, compression == "gzip" ?
        Implementation::CompressionFormat::Gzip :
        Implementation::CompressionFormat::Zlib};
    std::size_t read = 0;
    const bool filled = fillCells(layer, tilesets, yAxis, [&](UnsignedInt& out) -> bool {
        char id[4];
        const std::size_t size = stream.read(id);
        read += size;
        if(size != 4) {
            if(stream.hasError())
                Error{} << "TiledMaps::decodeCellData(): malformed" << compression << "data in layer" << layerName << Debug::nospace << ":" << stream.errorMessage();
            else
                Error{} << "TiledMaps::decodeCellData(): malformed" << compression << "data in layer" << layerName << Debug::nospace << ": expected" << expected << "bytes, got" << read;
            return false;
        }

        out = littleEndianId(id);
        return true;
    });
    if(!filled) return false;

    /* The stream should end right after the last cell */
    char extra;
    if(stream.read({&extra, 1})) {
        Error{} << "TiledMaps::decodeCellData(): malformed" << compression << "data in layer" << layerName << Debug::nospace << ": expected" << expected << "bytes, got more";
        return false;
    }
    if(stream.hasError()) {
        Error{} << "TiledMaps::decodeCellData(): malformed" << compression << "data in layer" << layerName << Debug::nospace << ":" << stream.errorMessage();
        return false;
    }

    return true;
}

}

Debug& operator<<(Debug& debug, const Rotation value) {
    debug << "TiledMaps::Rotation" << Debug::nospace;

    switch(value) {
        /* LCOV_EXCL_START */
        #define _c(value) case Rotation::value: return debug << "::" #value;
        _c(Rotate0)
        _c(Rotate90)
        _c(Rotate180)
        _c(Rotate270)
        #undef _c
        /* LCOV_EXCL_STOP */
    }

    return debug << "(" << Debug::nospace << reinterpret_cast<void*>(UnsignedByte(value)) << Debug::nospace << ")";
}

Cell cellForGlobalId(const UnsignedInt raw) {
    const GlobalId id = splitGlobalId(raw);

    if(!id.flipDiagonally)
        return Cell{id.id, id.flipHorizontally, id.flipVertically, Rotation::Rotate0};

    /* A diagonal flip is a transposition, which is a rotation combined with
       at most one flip */
    if(id.flipHorizontally && id.flipVertically)
        return Cell{id.id, true, false, Rotation::Rotate270};
    if(id.flipHorizontally)
        return Cell{id.id, false, false, Rotation::Rotate270};
    if(id.flipVertically)
        return Cell{id.id, false, false, Rotation::Rotate90};
    return Cell{id.id, false, true, Rotation::Rotate270};
}

bool decodeCellData(TileLayer& layer, const TilesetRegistry& tilesets, const std::string& layerName, const std::string& encoding, const std::string& compression, const Containers::ArrayView<const char> data, const YAxis yAxis) {
    if(encoding == "csv")
        return decodeCsv(layer, tilesets, layerName, data, yAxis);

    if(encoding == "base64") {
        if(!compression.empty() && compression != "gzip" && compression != "zlib") {
            Error{} << "TiledMaps::decodeCellData(): unsupported compression" << compression << "in layer" << layerName;
            return false;
        }

        return decodeBase64Cells(layer, tilesets, layerName, compression, data, yAxis);
    }

    /* No encoding means cells stored as XML elements */
    Error{} << "TiledMaps::decodeCellData(): unsupported encoding" << (encoding.empty() ? "xml" : encoding) << "in layer" << layerName;
    return false;
}

}
