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

#ifndef TiledMaps_Implementation_XmlHelpers_h
#define TiledMaps_Implementation_XmlHelpers_h

#include <vector>
#include <Corrade/Containers/Optional.h>
#include <Magnum/Math/Color.h>
#include <Magnum/Math/Vector2.h>

#include "TiledMaps/TiledMaps.h"

namespace TiledMaps { namespace Implementation {

/* Parses `#rrggbb`, `#aarrggbb` or the same without the leading hash, as
   Tiled writes them. The color is treated as sRGB. */
Containers::Optional<Color4> parseColor(const char* string);

/* Parses a `x1,y1 x2,y2 ...` point list of a polygon or polyline. Returns
   NullOpt if any point isn't a pair of numbers. */
Containers::Optional<std::vector<Vector2>> parsePoints(const char* string);

}}

#endif
