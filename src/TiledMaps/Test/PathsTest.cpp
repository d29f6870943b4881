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

#include <Corrade/TestSuite/Tester.h>
#include <Corrade/Utility/DebugStl.h>

#include "TiledMaps/Implementation/Paths.h"

namespace TiledMaps { namespace Test { namespace {

struct PathsTest: TestSuite::Tester {
    explicit PathsTest();

    void resolve();
};

const struct {
    const char* name;
    const char* document;
    const char* reference;
    const char* expected;
} ResolveData[]{
    {"same directory", "maps/level.tmx", "tiles.png", "maps/tiles.png"},
    {"subdirectory", "maps/level.tmx", "images/tiles.png", "maps/images/tiles.png"},
    {"parent directory", "maps/level.tmx", "../images/tiles.png", "images/tiles.png"},
    {"backslashes", "maps/level.tmx", "..\\images\\tiles.png", "images/tiles.png"},
    {"mixed separators", "maps\\sub/level.tmx", "..\\../tiles.png", "tiles.png"},
    {"current directory", "maps/level.tmx", "./images/./tiles.png", "maps/images/tiles.png"},
    {"document without directory", "level.tmx", "tiles.png", "tiles.png"},
    {"above the start", "level.tmx", "../tiles.png", "../tiles.png"},
    {"absolute document", "/data/maps/level.tmx", "../tiles.png", "/data/tiles.png"},
    {"absolute reference", "/data/maps/level.tmx", "/shared/tiles.png", "/shared/tiles.png"},
    {"duplicate separators", "/data//maps/level.tmx", "images//tiles.png", "/data/maps/images/tiles.png"}
};

PathsTest::PathsTest() {
    addInstancedTests({&PathsTest::resolve},
        Containers::arraySize(ResolveData));
}

void PathsTest::resolve() {
    auto&& data = ResolveData[testCaseInstanceId()];
    setTestCaseDescription(data.name);

    CORRADE_COMPARE(Implementation::resolveRelativePath(data.document, data.reference), data.expected);
}

}}}

CORRADE_TEST_MAIN(TiledMaps::Test::PathsTest)
