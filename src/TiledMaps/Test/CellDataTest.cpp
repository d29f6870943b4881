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

#include <sstream>
#include <Corrade/TestSuite/Tester.h>
#include <Corrade/Utility/DebugStl.h>

#include "TiledMaps/CellData.h"
#include "TiledMaps/Map.h"
#include "TiledMaps/Tileset.h"

namespace TiledMaps { namespace Test { namespace {

using namespace Math::Literals;

struct CellDataTest: TestSuite::Tester {
    explicit CellDataTest();

    void splitGlobalId();
    void cellForGlobalId();

    void decode();
    void decodeYDown();
    void decodeFlippedGzip();
    void decodeSecondColumn();
    void decodeDanglingId();

    void unsupportedEncoding();
    void unsupportedCompression();
    void malformed();

    void debugRotation();
    void rotationAngle();
};

/* IDs 1, 0x80000002, 9, 0xA0000003, 0, 42 in a 3x2 layer */
const struct {
    const char* name;
    const char* encoding;
    const char* compression;
    const char* data;
} DecodeData[]{
    {"csv", "csv", "",
        "\n1,2147483650,9,\n2684354563,0,42\n"},
    {"base64", "base64", "",
        "\n   AQAAAAIAAIAJAAAAAwAAoAAAAAAqAAAA\n  "},
    {"base64 + gzip", "base64", "gzip",
        "H4sIAAAAAAAC/2NkYGBgYmBo4ATSzAwMC4AUgxYQAwD7A2jTGAAAAA=="},
    {"base64 + zlib", "base64", "zlib",
        "eJxjZGBgYGJgaOAE0swMDAuAFIMWEAMAD9QBWg=="}
};

const struct {
    const char* name;
    UnsignedInt raw;
    bool flipHorizontally, flipVertically;
    Rotation rotation;
} CellForGlobalIdData[]{
    {"no flips", 5, false, false, Rotation::Rotate0},
    {"horizontal", 0x80000005u, true, false, Rotation::Rotate0},
    {"vertical", 0x40000005u, false, true, Rotation::Rotate0},
    {"horizontal + vertical", 0xc0000005u, true, true, Rotation::Rotate0},
    {"diagonal", 0x20000005u, false, true, Rotation::Rotate270},
    {"diagonal + horizontal", 0xa0000005u, false, false, Rotation::Rotate270},
    {"diagonal + vertical", 0x60000005u, false, false, Rotation::Rotate90},
    {"diagonal + horizontal + vertical", 0xe0000005u, true, false, Rotation::Rotate270}
};

const struct {
    const char* name;
    const char* encoding;
    const char* compression;
    const char* data;
    const char* message;
} MalformedData[]{
    {"csv too short", "csv", "", "1,2,3,4,5",
        "TiledMaps::decodeCellData(): malformed csv data in layer ground: expected 6 values, got 5\n"},
    {"csv too long", "csv", "", "1,2,3,4,5,6,7",
        "TiledMaps::decodeCellData(): malformed csv data in layer ground: expected 6 values, got more\n"},
    {"csv invalid", "csv", "", "1,2,x,4,5,6",
        "TiledMaps::decodeCellData(): malformed csv data in layer ground: invalid value x at index 2\n"},
    {"csv out of range", "csv", "", "1,2,4294967296,4,5,6",
        "TiledMaps::decodeCellData(): malformed csv data in layer ground: invalid value 4294967296 at index 2\n"},
    {"base64 invalid", "base64", "", "AQAA*AAA",
        "TiledMaps::decodeCellData(): malformed base64 data in layer ground\n"},
    {"base64 too short", "base64", "", "AQAAAAIAAIAJAAAAAwAAoAAAAAA=",
        "TiledMaps::decodeCellData(): malformed base64 data in layer ground: expected 24 bytes, got 20\n"},
    {"gzip too short", "base64", "gzip",
        "H4sIAAAAAAAC/2NkYGBgYmBoAABclDnuCAAAAA==",
        "TiledMaps::decodeCellData(): malformed gzip data in layer ground: expected 24 bytes, got 8\n"},
    {"zlib too long", "base64", "zlib",
        "eJxjZGBgYGJgaOAE0swMDAuAFIMWAwQAABU8AVo=",
        "TiledMaps::decodeCellData(): malformed zlib data in layer ground: expected 24 bytes, got more\n"},
    {"zlib data as gzip", "base64", "gzip",
        "eJxjZGBgYGJgaOAE0swMDAuAFIMWEAMAD9QBWg==",
        "TiledMaps::decodeCellData(): malformed gzip data in layer ground: incorrect header check\n"}
};

CellDataTest::CellDataTest() {
    addTests({&CellDataTest::splitGlobalId});

    addInstancedTests({&CellDataTest::cellForGlobalId},
        Containers::arraySize(CellForGlobalIdData));

    addInstancedTests({&CellDataTest::decode},
        Containers::arraySize(DecodeData));

    addTests({&CellDataTest::decodeYDown,
              &CellDataTest::decodeFlippedGzip,
              &CellDataTest::decodeSecondColumn,
              &CellDataTest::decodeDanglingId,

              &CellDataTest::unsupportedEncoding,
              &CellDataTest::unsupportedCompression});

    addInstancedTests({&CellDataTest::malformed},
        Containers::arraySize(MalformedData));

    addTests({&CellDataTest::debugRotation,
              &CellDataTest::rotationAngle});
}

/* Tiles 1 to 8 in the first tileset, 9 and 10 in the second */
TilesetRegistry tilesets() {
    TilesetRegistry registry;
    Tileset terrain{"terrain", 1, {16, 16}};
    terrain.slice(0, {64, 32}, YAxis::Up);
    registry.add(std::move(terrain));
    Tileset items{"items", 9, {16, 16}};
    items.slice(1, {32, 16}, YAxis::Up);
    registry.add(std::move(items));
    return registry;
}

bool decodeString(TileLayer& layer, const TilesetRegistry& tilesets, const std::string& encoding, const std::string& compression, const std::string& data, YAxis yAxis) {
    return decodeCellData(layer, tilesets, "ground", encoding, compression, {data.data(), data.size()}, yAxis);
}

void CellDataTest::splitGlobalId() {
    GlobalId id = TiledMaps::splitGlobalId(0xa0000003u);
    CORRADE_COMPARE(id.id, 3);
    CORRADE_VERIFY(id.flipHorizontally);
    CORRADE_VERIFY(!id.flipVertically);
    CORRADE_VERIFY(id.flipDiagonally);

    GlobalId plain = TiledMaps::splitGlobalId(42);
    CORRADE_COMPARE(plain.id, 42);
    CORRADE_VERIFY(!plain.flipHorizontally);
    CORRADE_VERIFY(!plain.flipVertically);
    CORRADE_VERIFY(!plain.flipDiagonally);

    /* The ID is never larger than what's left after the flags */
    CORRADE_COMPARE(TiledMaps::splitGlobalId(0xffffffffu).id, 0x1fffffffu);
}

void CellDataTest::cellForGlobalId() {
    auto&& data = CellForGlobalIdData[testCaseInstanceId()];
    setTestCaseDescription(data.name);

    const Cell cell = TiledMaps::cellForGlobalId(data.raw);
    CORRADE_COMPARE(cell.tile, 5);
    CORRADE_COMPARE(cell.flipHorizontally, data.flipHorizontally);
    CORRADE_COMPARE(cell.flipVertically, data.flipVertically);
    CORRADE_COMPARE(cell.rotation, data.rotation);
}

void CellDataTest::decode() {
    auto&& data = DecodeData[testCaseInstanceId()];
    setTestCaseDescription(data.name);

    const TilesetRegistry registry = tilesets();
    TileLayer layer{{3, 2}, {16, 16}};
    CORRADE_VERIFY(decodeString(layer, registry, data.encoding, data.compression, data.data, YAxis::Up));

    /* First row of the data is the top one, which is row 1 with Y up */
    const Cell* a = layer.cell({0, 1});
    CORRADE_VERIFY(a);
    CORRADE_COMPARE(a->tile, 1);
    CORRADE_VERIFY(!a->flipHorizontally);
    CORRADE_VERIFY(!a->flipVertically);
    CORRADE_COMPARE(a->rotation, Rotation::Rotate0);

    const Cell* b = layer.cell({1, 1});
    CORRADE_VERIFY(b);
    CORRADE_COMPARE(b->tile, 2);
    CORRADE_VERIFY(b->flipHorizontally);
    CORRADE_VERIFY(!b->flipVertically);
    CORRADE_COMPARE(b->rotation, Rotation::Rotate0);

    const Cell* c = layer.cell({2, 1});
    CORRADE_VERIFY(c);
    CORRADE_COMPARE(c->tile, 9);

    const Cell* d = layer.cell({0, 0});
    CORRADE_VERIFY(d);
    CORRADE_COMPARE(d->tile, 3);
    CORRADE_VERIFY(!d->flipHorizontally);
    CORRADE_VERIFY(!d->flipVertically);
    CORRADE_COMPARE(d->rotation, Rotation::Rotate270);

    /* Zero and a dangling ID */
    CORRADE_VERIFY(!layer.cell({1, 0}));
    CORRADE_VERIFY(!layer.cell({2, 0}));
    CORRADE_COMPARE(layer.cellCount(), 4);
}

void CellDataTest::decodeYDown() {
    const TilesetRegistry registry = tilesets();
    TileLayer layer{{3, 2}, {16, 16}};
    CORRADE_VERIFY(decodeString(layer, registry, "csv", "",
        "1,2147483650,9,\n2684354563,0,42", YAxis::Down));

    CORRADE_VERIFY(layer.cell({0, 0}));
    CORRADE_COMPARE(layer.cell({0, 0})->tile, 1);
    CORRADE_VERIFY(layer.cell({2, 0}));
    CORRADE_COMPARE(layer.cell({2, 0})->tile, 9);
    CORRADE_VERIFY(layer.cell({0, 1}));
    CORRADE_COMPARE(layer.cell({0, 1})->tile, 3);
    CORRADE_VERIFY(!layer.cell({1, 1}));
    CORRADE_VERIFY(!layer.cell({2, 1}));
}

void CellDataTest::decodeFlippedGzip() {
    const TilesetRegistry registry = tilesets();
    TileLayer layer{{2, 2}, {16, 16}};
    CORRADE_VERIFY(decodeString(layer, registry, "base64", "gzip",
        "H4sIAAAAAAAC/2NmYGhgRsIAsJO2tBAAAAA=", YAxis::Up));

    CORRADE_COMPARE(layer.cellCount(), 4);
    for(const Vector2i position: {Vector2i{0, 0}, Vector2i{1, 0}, Vector2i{0, 1}, Vector2i{1, 1}}) {
        CORRADE_ITERATION(position);
        const Cell* cell = layer.cell(position);
        CORRADE_VERIFY(cell);
        CORRADE_COMPARE(cell->tile, 3);
        CORRADE_VERIFY(cell->flipHorizontally);
        CORRADE_VERIFY(!cell->flipVertically);
        CORRADE_COMPARE(cell->rotation, Rotation::Rotate0);
    }
}

void CellDataTest::decodeSecondColumn() {
    const TilesetRegistry registry = tilesets();

    /* Values are read row by row, so the first one is the leftmost cell */
    TileLayer layer{{2, 1}, {16, 16}};
    CORRADE_VERIFY(decodeString(layer, registry, "csv", "", "0,5", YAxis::Up));
    CORRADE_VERIFY(!layer.cell({0, 0}));
    CORRADE_VERIFY(layer.cell({1, 0}));
    CORRADE_COMPARE(layer.cell({1, 0})->tile, 5);

    TileLayer swapped{{2, 1}, {16, 16}};
    CORRADE_VERIFY(decodeString(swapped, registry, "csv", "", "5,0", YAxis::Up));
    CORRADE_VERIFY(swapped.cell({0, 0}));
    CORRADE_COMPARE(swapped.cell({0, 0})->tile, 5);
    CORRADE_VERIFY(!swapped.cell({1, 0}));
}

void CellDataTest::decodeDanglingId() {
    const TilesetRegistry registry = tilesets();
    TileLayer layer{{2, 1}, {16, 16}};

    /* No error, the cell is just left empty */
    std::ostringstream out;
    Error redirectError{&out};
    CORRADE_VERIFY(decodeString(layer, registry, "csv", "", "42,2684354603", YAxis::Up));
    CORRADE_COMPARE(layer.cellCount(), 0);
    CORRADE_COMPARE(out.str(), "");
}

void CellDataTest::unsupportedEncoding() {
    const TilesetRegistry registry = tilesets();
    TileLayer layer{{3, 2}, {16, 16}};

    std::ostringstream out;
    Error redirectError{&out};
    CORRADE_VERIFY(!decodeString(layer, registry, "", "", "<tile gid=\"1\"/>", YAxis::Up));
    CORRADE_VERIFY(!decodeString(layer, registry, "hex", "", "01000000", YAxis::Up));
    CORRADE_COMPARE(out.str(),
        "TiledMaps::decodeCellData(): unsupported encoding xml in layer ground\n"
        "TiledMaps::decodeCellData(): unsupported encoding hex in layer ground\n");
}

void CellDataTest::unsupportedCompression() {
    const TilesetRegistry registry = tilesets();
    TileLayer layer{{3, 2}, {16, 16}};

    std::ostringstream out;
    Error redirectError{&out};
    CORRADE_VERIFY(!decodeString(layer, registry, "base64", "zstd", "KLUv/QBYAA==", YAxis::Up));
    CORRADE_COMPARE(out.str(), "TiledMaps::decodeCellData(): unsupported compression zstd in layer ground\n");
}

void CellDataTest::malformed() {
    auto&& data = MalformedData[testCaseInstanceId()];
    setTestCaseDescription(data.name);

    const TilesetRegistry registry = tilesets();
    TileLayer layer{{3, 2}, {16, 16}};

    std::ostringstream out;
    Error redirectError{&out};
    CORRADE_VERIFY(!decodeString(layer, registry, data.encoding, data.compression, data.data, YAxis::Up));
    CORRADE_COMPARE(out.str(), data.message);
}

void CellDataTest::debugRotation() {
    std::ostringstream out;
    Debug{&out} << Rotation::Rotate90 << Rotation(0xde);
    CORRADE_COMPARE(out.str(), "TiledMaps::Rotation::Rotate90 TiledMaps::Rotation(0xde)\n");
}

void CellDataTest::rotationAngle() {
    CORRADE_COMPARE(TiledMaps::rotationAngle(Rotation::Rotate0), 0.0_degf);
    CORRADE_COMPARE(TiledMaps::rotationAngle(Rotation::Rotate270), 270.0_degf);
}

}}}

CORRADE_TEST_MAIN(TiledMaps::Test::CellDataTest)
