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

#include "MapObject.h"

#include <Corrade/Utility/Assert.h>
#include <Corrade/Utility/Debug.h>
#include <Corrade/Utility/DebugStl.h>

#include "TiledMaps/CellData.h"
#include "TiledMaps/Tileset.h"
#include "TiledMaps/Implementation/XmlHelpers.h"

namespace TiledMaps {

Debug& operator<<(Debug& debug, const ObjectType value) {
    debug << "TiledMaps::ObjectType" << Debug::nospace;

    switch(value) {
        /* LCOV_EXCL_START */
        #define _c(value) case ObjectType::value: return debug << "::" #value;
        _c(Rectangle)
        _c(Ellipse)
        _c(Polygon)
        _c(Polyline)
        _c(TileStamp)
        #undef _c
        /* LCOV_EXCL_STOP */
    }

    return debug << "(" << Debug::nospace << reinterpret_cast<void*>(UnsignedByte(value)) << Debug::nospace << ")";
}

MapObject::MapObject(const ObjectType shape): _shape{shape}, _visible{true}, _id{}, _tile{}, _scale{1.0f} {}

Vector2 MapObject::size() const {
    if(_shape == ObjectType::TileStamp) return _tileSize*_scale;
    return _size;
}

MapObject& MapObject::setSize(const Vector2& size) {
    CORRADE_ASSERT(_shape != ObjectType::Polygon && _shape != ObjectType::Polyline,
        "TiledMaps::MapObject::setSize():" << _shape << "has no size", *this);

    if(_shape == ObjectType::TileStamp) {
        CORRADE_ASSERT(_tileSize.x() && _tileSize.y(),
            "TiledMaps::MapObject::setSize(): the tile stamp has no tile", *this);
        _scale = size/_tileSize;
    } else _size = size;

    return *this;
}

MapObject& MapObject::setTile(const UnsignedInt tile, const Vector2& tileSize) {
    CORRADE_ASSERT(_shape == ObjectType::TileStamp,
        "TiledMaps::MapObject::setTile():" << _shape << "is not a tile stamp", *this);
    _tile = tile;
    _tileSize = tileSize;
    return *this;
}

Containers::Optional<MapObject> decodeObject(const pugi::xml_node node, const TilesetRegistry& tilesets, const Float mapHeight, const std::string& layerName, const YAxis yAxis) {
    const Float x = node.attribute("x").as_float();
    const Float declaredY = node.attribute("y").as_float();
    const Float y = yAxis == YAxis::Up ? mapHeight - declaredY : declaredY;
    const Vector2 size{node.attribute("width").as_float(),
                       node.attribute("height").as_float()};

    Containers::Optional<MapObject> object;
    pugi::xml_node points;
    if((points = node.child("polygon")))
        object.emplace(ObjectType::Polygon);
    else if((points = node.child("polyline")))
        object.emplace(ObjectType::Polyline);
    else if(node.child("ellipse"))
        object.emplace(ObjectType::Ellipse);
    else if(node.attribute("gid"))
        object.emplace(ObjectType::TileStamp);
    else
        object.emplace(ObjectType::Rectangle);

    switch(object->shape()) {
        case ObjectType::Polygon:
        case ObjectType::Polyline: {
            Containers::Optional<std::vector<Vector2>> parsed = Implementation::parsePoints(points.attribute("points").as_string());
            if(!parsed) {
                Error{} << "TiledMaps::decodeObject(): malformed points" << points.attribute("points").as_string() << "of object" << node.attribute("id").as_uint() << "in layer" << layerName;
                return Containers::NullOpt;
            }

            if(yAxis == YAxis::Up) for(Vector2& point: *parsed)
                point.y() = -point.y();

            object->points() = std::move(*parsed);
            object->setPosition({x, y});
        } break;

        case ObjectType::Rectangle:
        case ObjectType::Ellipse:
            object->setPosition({x, yAxis == YAxis::Up ? y - size.y() : y});
            object->setSize(size);
            break;

        case ObjectType::TileStamp: {
            const UnsignedInt raw = node.attribute("gid").as_uint();
            const Tile* tile = tilesets.tile(splitGlobalId(raw).id);
            object->setTile(raw, tile ? Vector2{tile->size()} : Vector2{});
            object->setPosition({x, y});
            object->properties().setNumber("gid", raw);
        } break;
    }

    object->setId(node.attribute("id").as_uint())
        .setName(node.attribute("name").as_string())
        .setVisible(node.attribute("visible").as_int(1) != 0);

    /* Derived properties first so the custom ones can override them */
    Properties& properties = object->properties();
    properties.setString("name", object->name());
    if(const pugi::xml_attribute type = node.attribute("type")) {
        object->setType(type.as_string());
        properties.setString("type", object->type());
    }
    properties.setNumber("x", object->position().x())
        .setNumber("y", object->position().y());
    loadProperties(node.child("properties"), properties);

    applyTileStampProperties(*object);

    return object;
}

void applyTileStampProperties(MapObject& object) {
    if(object.shape() != ObjectType::TileStamp) return;

    const Properties& properties = object.properties();
    if(properties.contains("rotation"))
        object.setRotation(Rad(Float(properties.number("rotation"))));
    else if(properties.contains("rotationDeg"))
        object.setRotation(Rad(Deg(Float(properties.number("rotationDeg")))));

    object.setScale({Float(properties.number("scaleX", 1.0)),
                     Float(properties.number("scaleY", 1.0))});

    /* Negative values mean no override */
    const Float width = Float(properties.number("width", -1.0));
    const Float height = Float(properties.number("height", -1.0));
    if(width >= 0.0f || height >= 0.0f) {
        if(object.tileSize().x() && object.tileSize().y()) {
            Vector2 size = object.size();
            if(width >= 0.0f) size.x() = width;
            if(height >= 0.0f) size.y() = height;
            object.setSize(size);
        } else Warning{} << "TiledMaps::applyTileStampProperties(): ignoring size of tile stamp" << object.id() << "without a tile";
    }

    object.setOrigin(object.size()/2.0f);
}

}
