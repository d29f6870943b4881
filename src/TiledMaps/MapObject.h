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

#ifndef TiledMaps_MapObject_h
#define TiledMaps_MapObject_h

/** @file
 * @brief Class @ref TiledMaps::MapObject, enum @ref TiledMaps::ObjectType, function @ref TiledMaps::decodeObject(), @ref TiledMaps::applyTileStampProperties()
 */

#include <string>
#include <vector>
#include <Corrade/Containers/Optional.h>
#include <Magnum/Math/Angle.h>
#include <Magnum/Math/Vector2.h>
#include <pugixml.hpp>

#include "TiledMaps/Properties.h"

namespace TiledMaps {

/**
@brief Object type

@see @ref MapObject::shape()
*/
enum class ObjectType: UnsignedByte {
    Rectangle,  /**< Rectangle */
    Ellipse,    /**< Ellipse, inscribed into a rectangle */
    Polygon,    /**< Closed polygon */
    Polyline,   /**< Open polyline */
    TileStamp   /**< A single tile placed at arbitrary position */
};

/** @debugoperatorenum{ObjectType} */
TILEDMAPS_EXPORT Debug& operator<<(Debug& debug, ObjectType value);

/**
@brief Map object

Object placed on an @ref ObjectLayer. The @ref shape() decides which of the
shape-specific properties are meaningful:

-   @ref ObjectType::Rectangle and @ref ObjectType::Ellipse use @ref size()
-   @ref ObjectType::Polygon and @ref ObjectType::Polyline use @ref points(),
    relative to @ref position()
-   @ref ObjectType::TileStamp uses @ref tile(), @ref origin(),
    @ref rotation() and @ref scale(), its @ref size() is derived from the
    tile size and the scale
*/
class TILEDMAPS_EXPORT MapObject {
    public:
        /** @brief Constructor */
        explicit MapObject(ObjectType shape);

        /** @brief Shape */
        ObjectType shape() const { return _shape; }

        /** @brief Object ID, zero if not set */
        UnsignedInt id() const { return _id; }

        /** @brief Set object ID */
        MapObject& setId(UnsignedInt id) {
            _id = id;
            return *this;
        }

        /** @brief Object name */
        const std::string& name() const { return _name; }

        /** @brief Set object name */
        MapObject& setName(std::string name) {
            _name = std::move(name);
            return *this;
        }

        /** @brief User-defined object type */
        const std::string& type() const { return _type; }

        /** @brief Set user-defined object type */
        MapObject& setType(std::string type) {
            _type = std::move(type);
            return *this;
        }

        /** @brief Whether the object is visible */
        bool isVisible() const { return _visible; }

        /** @brief Set object visibility */
        MapObject& setVisible(bool visible) {
            _visible = visible;
            return *this;
        }

        /** @brief Position in pixels */
        Vector2 position() const { return _position; }

        /** @brief Set position */
        MapObject& setPosition(const Vector2& position) {
            _position = position;
            return *this;
        }

        /**
         * @brief Size in pixels
         *
         * For a @ref ObjectType::TileStamp it's the tile size multiplied by
         * @ref scale(), zero if the tile doesn't exist. Zero for polygons and
         * polylines.
         */
        Vector2 size() const;

        /**
         * @brief Set size
         *
         * For a @ref ObjectType::TileStamp changes the @ref scale() so the
         * resulting size matches. Expects that the object isn't a polygon or
         * a polyline and that a tile stamp has a tile with nonzero size.
         */
        MapObject& setSize(const Vector2& size);

        /** @brief Polygon or polyline points relative to @ref position() */
        std::vector<Vector2>& points() { return _points; }
        const std::vector<Vector2>& points() const { return _points; } /**< @overload */

        /**
         * @brief Global ID of the tile
         *
         * Including the flip bits. Zero for everything except tile stamps.
         */
        UnsignedInt tile() const { return _tile; }

        /**
         * @brief Tile size in pixels
         *
         * Zero if the tile stamp doesn't reference an existing tile.
         */
        Vector2 tileSize() const { return _tileSize; }

        /**
         * @brief Set the tile
         *
         * Expects that the object is a tile stamp.
         */
        MapObject& setTile(UnsignedInt tile, const Vector2& tileSize);

        /** @brief Rotation origin relative to @ref position() */
        Vector2 origin() const { return _origin; }

        /** @brief Set rotation origin */
        MapObject& setOrigin(const Vector2& origin) {
            _origin = origin;
            return *this;
        }

        /** @brief Rotation around @ref origin() */
        Rad rotation() const { return _rotation; }

        /** @brief Set rotation */
        MapObject& setRotation(Rad rotation) {
            _rotation = rotation;
            return *this;
        }

        /** @brief Scale */
        Vector2 scale() const { return _scale; }

        /** @brief Set scale */
        MapObject& setScale(const Vector2& scale) {
            _scale = scale;
            return *this;
        }

        /** @brief Object properties */
        Properties& properties() { return _properties; }
        const Properties& properties() const { return _properties; } /**< @overload */

    private:
        ObjectType _shape;
        bool _visible;
        UnsignedInt _id, _tile;
        std::string _name, _type;
        Vector2 _position, _size, _tileSize, _origin, _scale;
        Rad _rotation;
        std::vector<Vector2> _points;
        Properties _properties;
};

/**
@brief Decode an `<object>` element
@param node         The `<object>` element
@param tilesets     Tilesets to look tile stamp tiles up in
@param mapHeight    Map height in pixels
@param layerName    Layer name used in error messages
@param yAxis        Vertical axis convention
@return Decoded object or @ref Corrade::Containers::NullOpt on error

The shape is picked from the first of these that applies: a `<polygon>`
child, a `<polyline>` child, an `<ellipse>` child, a `gid` attribute, and
finally a rectangle.

With @ref YAxis::Up the `y` attribute is converted to @cpp mapHeight - y @ce,
and rectangles and ellipses additionally move down by their height so
@ref MapObject::position() is their bottom-left corner. Polygon and polyline
points have their Y coordinate negated.

The `name`, `type` (if present), `x` and `y` are stored as properties, with
`y` being the same as the @ref MapObject::position() Y coordinate, tile
stamps also store the `gid`. Custom properties are loaded on top, replacing
these. Tile stamps are then processed with @ref applyTileStampProperties().

A malformed point list prints an error and returns
@ref Corrade::Containers::NullOpt.
*/
TILEDMAPS_EXPORT Containers::Optional<MapObject> decodeObject(pugi::xml_node node, const TilesetRegistry& tilesets, Float mapHeight, const std::string& layerName, YAxis yAxis);

/**
@brief Apply tile stamp properties

Sets the rotation from the `rotation` property in radians or, if that's not
present, from the `rotationDeg` property in degrees. Sets the scale from the
`scaleX` and `scaleY` properties, defaulting to @cpp 1.0 @ce. Then a
non-negative `width` or `height` property overrides the corresponding size
component through the scale. Finally the origin is set to the center of the
resulting size. Does nothing for objects that aren't tile stamps.

A `width` or `height` on a tile stamp without a tile prints a warning and is
ignored.
*/
TILEDMAPS_EXPORT void applyTileStampProperties(MapObject& object);

}

#endif
