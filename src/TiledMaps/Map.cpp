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

#include "Map.h"

#include <Corrade/Utility/Assert.h>
#include <Corrade/Utility/Debug.h>
#include <Corrade/Utility/DebugStl.h>
#include <Magnum/Math/Functions.h>

#include "TiledMaps/AbstractImageResolver.h"

namespace TiledMaps {

Debug& operator<<(Debug& debug, const LayerType value) {
    debug << "TiledMaps::LayerType" << Debug::nospace;

    switch(value) {
        /* LCOV_EXCL_START */
        #define _c(value) case LayerType::value: return debug << "::" #value;
        _c(Tile)
        _c(Object)
        #undef _c
        /* LCOV_EXCL_STOP */
    }

    return debug << "(" << Debug::nospace << reinterpret_cast<void*>(UnsignedByte(value)) << Debug::nospace << ")";
}

TileLayer::TileLayer(const Vector2i& size, const Vector2i& tileSize): _size{Math::max(size, Vector2i{0})}, _tileSize{tileSize}, _cells(std::size_t(_size.x())*std::size_t(_size.y())) {}

const Cell* TileLayer::cell(const Vector2i& position) const {
    if(position.x() < 0 || position.y() < 0 || position.x() >= _size.x() || position.y() >= _size.y())
        return nullptr;

    const Containers::Optional<Cell>& cell = _cells[std::size_t(position.y())*_size.x() + position.x()];
    return cell ? &*cell : nullptr;
}

TileLayer& TileLayer::setCell(const Vector2i& position, const Cell& cell) {
    CORRADE_ASSERT(position.x() >= 0 && position.y() >= 0 && position.x() < _size.x() && position.y() < _size.y(),
        "TiledMaps::TileLayer::setCell(): position" << position << "out of range for" << _size << "cells", *this);
    _cells[std::size_t(position.y())*_size.x() + position.x()] = cell;
    return *this;
}

TileLayer& TileLayer::clearCell(const Vector2i& position) {
    CORRADE_ASSERT(position.x() >= 0 && position.y() >= 0 && position.x() < _size.x() && position.y() < _size.y(),
        "TiledMaps::TileLayer::clearCell(): position" << position << "out of range for" << _size << "cells", *this);
    _cells[std::size_t(position.y())*_size.x() + position.x()] = Containers::NullOpt;
    return *this;
}

std::size_t TileLayer::cellCount() const {
    std::size_t count = 0;
    for(const Containers::Optional<Cell>& cell: _cells) if(cell) ++count;
    return count;
}

Layer::Layer(std::string name, TileLayer&& tiles): _type{LayerType::Tile}, _name{std::move(name)}, _visible{true}, _opacity{1.0f}, _tiles{std::move(tiles)} {}

Layer::Layer(std::string name, ObjectLayer&& objects): _type{LayerType::Object}, _name{std::move(name)}, _visible{true}, _opacity{1.0f}, _objects{std::move(objects)} {}

Layer& Layer::setOpacity(const Float opacity) {
    _opacity = Math::clamp(opacity, 0.0f, 1.0f);
    return *this;
}

TileLayer& Layer::tiles() {
    CORRADE_ASSERT(_type == LayerType::Tile,
        "TiledMaps::Layer::tiles():" << _name << "is" << _type, *_tiles);
    return *_tiles;
}

const TileLayer& Layer::tiles() const {
    CORRADE_ASSERT(_type == LayerType::Tile,
        "TiledMaps::Layer::tiles():" << _name << "is" << _type, *_tiles);
    return *_tiles;
}

ObjectLayer& Layer::objects() {
    CORRADE_ASSERT(_type == LayerType::Object,
        "TiledMaps::Layer::objects():" << _name << "is" << _type, *_objects);
    return *_objects;
}

const ObjectLayer& Layer::objects() const {
    CORRADE_ASSERT(_type == LayerType::Object,
        "TiledMaps::Layer::objects():" << _name << "is" << _type, *_objects);
    return *_objects;
}

Map::Map(const Vector2i& size, const Vector2i& tileSize): _size{size}, _tileSize{tileSize} {}

Map::~Map() { releaseImages(); }

Map::Map(Map&& other) noexcept: _size{other._size}, _tileSize{other._tileSize}, _orientation{std::move(other._orientation)}, _backgroundColor{std::move(other._backgroundColor)}, _tilesets{std::move(other._tilesets)}, _layers{std::move(other._layers)}, _properties{std::move(other._properties)}, _images{std::move(other._images)} {
    other._images.clear();
}

Map& Map::operator=(Map&& other) noexcept {
    releaseImages();
    _size = other._size;
    _tileSize = other._tileSize;
    _orientation = std::move(other._orientation);
    _backgroundColor = std::move(other._backgroundColor);
    _tilesets = std::move(other._tilesets);
    _layers = std::move(other._layers);
    _properties = std::move(other._properties);
    _images = std::move(other._images);
    other._images.clear();
    return *this;
}

Layer* Map::layer(const std::string& name) {
    for(Layer& layer: _layers) if(layer.name() == name) return &layer;
    return nullptr;
}

const Layer* Map::layer(const std::string& name) const {
    for(const Layer& layer: _layers) if(layer.name() == name) return &layer;
    return nullptr;
}

Map& Map::addImage(AbstractImageResolver& resolver, const ImageHandle image) {
    _images.emplace_back(&resolver, image);
    return *this;
}

void Map::releaseImages() {
    for(const std::pair<AbstractImageResolver*, ImageHandle>& image: _images)
        image.first->release(image.second);
    _images.clear();
}

}
