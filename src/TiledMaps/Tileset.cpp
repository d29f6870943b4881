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

#include "Tileset.h"

#include <Corrade/Utility/Assert.h>
#include <Corrade/Utility/Debug.h>
#include <Corrade/Utility/DebugStl.h>

namespace TiledMaps {

Tileset::Tileset(std::string name, const UnsignedInt firstId, const Vector2i& tileSize, const Int margin, const Int spacing): _name{std::move(name)}, _firstId{firstId}, _tileSize{tileSize}, _margin{margin}, _spacing{spacing}, _image{} {}

Tile* Tileset::tile(const UnsignedInt id) {
    return contains(id) ? &_tiles[id - _firstId] : nullptr;
}

const Tile* Tileset::tile(const UnsignedInt id) const {
    return contains(id) ? &_tiles[id - _firstId] : nullptr;
}

std::size_t Tileset::slice(const ImageHandle image, const Vector2i& imageSize, const YAxis yAxis) {
    _image = image;
    _imageSize = imageSize;
    _tiles.clear();

    if(_tileSize.x() <= 0 || _tileSize.y() <= 0) {
        Warning{} << "TiledMaps::Tileset::slice(): tileset" << _name << "has a zero tile size" << _tileSize << Debug::nospace << ", no tiles created";
        return 0;
    }

    /* A negative spacing could make the step zero and the loop below never
       end */
    if(_margin < 0 || _spacing < 0) {
        Warning{} << "TiledMaps::Tileset::slice(): tileset" << _name << "has an invalid margin" << _margin << "and spacing" << _spacing << Debug::nospace << ", no tiles created";
        return 0;
    }

    const Vector2 imageSizeF{imageSize};
    const Vector2i step = _tileSize + Vector2i{_spacing};
    const Vector2i end = imageSize - Vector2i{_margin};

    UnsignedInt id = _firstId;
    for(Int y = _margin; y + _tileSize.y() <= end.y(); y += step.y()) {
        for(Int x = _margin; x + _tileSize.x() <= end.x(); x += step.x()) {
            const Range2Di rectangle = Range2Di::fromSize({x, y}, _tileSize);

            /* The rectangle has origin at top left, texture coordinates at
               bottom left */
            const Float left = Float(rectangle.left())/imageSizeF.x();
            const Float right = Float(rectangle.right())/imageSizeF.x();
            const Float bottom = Float(imageSize.y() - rectangle.top())/imageSizeF.y();
            const Float top = Float(imageSize.y() - rectangle.bottom())/imageSizeF.y();
            const Range2D textureCoordinates = yAxis == YAxis::Up ?
                Range2D{{left, bottom}, {right, top}} :
                Range2D{{left, top}, {right, bottom}};

            _tiles.emplace_back(id++, TileRegion{image, rectangle, textureCoordinates});
        }
    }

    return _tiles.size();
}

Tileset& TilesetRegistry::add(Tileset&& tileset) {
    _tilesets.push_back(std::move(tileset));
    return _tilesets.back();
}

Tileset& TilesetRegistry::operator[](const std::size_t i) {
    CORRADE_ASSERT(i < _tilesets.size(),
        "TiledMaps::TilesetRegistry::operator[](): index" << i << "out of range for" << _tilesets.size() << "tilesets", _tilesets[0]);
    return _tilesets[i];
}

const Tileset& TilesetRegistry::operator[](const std::size_t i) const {
    CORRADE_ASSERT(i < _tilesets.size(),
        "TiledMaps::TilesetRegistry::operator[](): index" << i << "out of range for" << _tilesets.size() << "tilesets", _tilesets[0]);
    return _tilesets[i];
}

const Tileset* TilesetRegistry::tilesetForId(const UnsignedInt id) const {
    for(const Tileset& tileset: _tilesets)
        if(tileset.contains(id)) return &tileset;
    return nullptr;
}

Tile* TilesetRegistry::tile(const UnsignedInt id) {
    for(Tileset& tileset: _tilesets)
        if(Tile* tile = tileset.tile(id)) return tile;
    return nullptr;
}

const Tile* TilesetRegistry::tile(const UnsignedInt id) const {
    for(const Tileset& tileset: _tilesets)
        if(const Tile* tile = tileset.tile(id)) return tile;
    return nullptr;
}

}
