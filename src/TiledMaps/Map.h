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

#ifndef TiledMaps_Map_h
#define TiledMaps_Map_h

/** @file
 * @brief Class @ref TiledMaps::TileLayer, @ref TiledMaps::ObjectLayer, @ref TiledMaps::Layer, @ref TiledMaps::Map, enum @ref TiledMaps::LayerType
 */

#include <string>
#include <utility>
#include <vector>
#include <Corrade/Containers/Optional.h>
#include <Magnum/Math/Color.h>
#include <Magnum/Math/Vector2.h>

#include "TiledMaps/CellData.h"
#include "TiledMaps/MapObject.h"
#include "TiledMaps/Properties.h"
#include "TiledMaps/Tileset.h"

namespace TiledMaps {

/**
@brief Layer type

@see @ref Layer::type()
*/
enum class LayerType: UnsignedByte {
    Tile,       /**< @ref TileLayer */
    Object      /**< @ref ObjectLayer */
};

/** @debugoperatorenum{LayerType} */
TILEDMAPS_EXPORT Debug& operator<<(Debug& debug, LayerType value);

/**
@brief Tile layer

Fixed-size grid of cells, each either empty or referencing a tile.
*/
class TILEDMAPS_EXPORT TileLayer {
    public:
        /**
         * @brief Constructor
         * @param size      Size in cells
         * @param tileSize  Tile size in pixels
         *
         * All cells are initially empty.
         */
        explicit TileLayer(const Vector2i& size, const Vector2i& tileSize);

        /** @brief Size in cells */
        Vector2i size() const { return _size; }

        /** @brief Tile size in pixels */
        Vector2i tileSize() const { return _tileSize; }

        /**
         * @brief Cell at given position
         *
         * Returns @cpp nullptr @ce if the cell is empty or the position is
         * outside of the layer.
         */
        const Cell* cell(const Vector2i& position) const;

        /**
         * @brief Set cell at given position
         *
         * Expects that the position is inside the layer.
         */
        TileLayer& setCell(const Vector2i& position, const Cell& cell);

        /**
         * @brief Clear cell at given position
         *
         * Expects that the position is inside the layer.
         */
        TileLayer& clearCell(const Vector2i& position);

        /** @brief Count of non-empty cells */
        std::size_t cellCount() const;

    private:
        Vector2i _size, _tileSize;
        std::vector<Containers::Optional<Cell>> _cells;
};

/**
@brief Object layer

Objects in document order.
*/
class TILEDMAPS_EXPORT ObjectLayer {
    public:
        /** @brief Objects */
        std::vector<MapObject>& objects() { return _objects; }
        const std::vector<MapObject>& objects() const { return _objects; } /**< @overload */

        /** @brief Color used to display the objects, if set */
        const Containers::Optional<Color4>& color() const { return _color; }

        /** @brief Set display color */
        ObjectLayer& setColor(const Color4& color) {
            _color = color;
            return *this;
        }

    private:
        std::vector<MapObject> _objects;
        Containers::Optional<Color4> _color;
};

/**
@brief Map layer

Either a @ref TileLayer or an @ref ObjectLayer, see @ref type().
*/
class TILEDMAPS_EXPORT Layer {
    public:
        /** @brief Construct a tile layer */
        explicit Layer(std::string name, TileLayer&& tiles);

        /** @brief Construct an object layer */
        explicit Layer(std::string name, ObjectLayer&& objects);

        /** @brief Layer type */
        LayerType type() const { return _type; }

        /** @brief Layer name */
        const std::string& name() const { return _name; }

        /** @brief Whether the layer is visible */
        bool isVisible() const { return _visible; }

        /** @brief Set layer visibility */
        Layer& setVisible(bool visible) {
            _visible = visible;
            return *this;
        }

        /** @brief Opacity in range @f$ [0, 1] @f$ */
        Float opacity() const { return _opacity; }

        /**
         * @brief Set opacity
         *
         * The value is clamped to @f$ [0, 1] @f$.
         */
        Layer& setOpacity(Float opacity);

        /** @brief Drawing offset in pixels */
        Vector2 offset() const { return _offset; }

        /** @brief Set drawing offset */
        Layer& setOffset(const Vector2& offset) {
            _offset = offset;
            return *this;
        }

        /**
         * @brief Tile layer
         *
         * Expects that @ref type() is @ref LayerType::Tile.
         */
        TileLayer& tiles();
        const TileLayer& tiles() const; /**< @overload */

        /**
         * @brief Object layer
         *
         * Expects that @ref type() is @ref LayerType::Object.
         */
        ObjectLayer& objects();
        const ObjectLayer& objects() const; /**< @overload */

        /** @brief Layer properties */
        Properties& properties() { return _properties; }
        const Properties& properties() const { return _properties; } /**< @overload */

    private:
        LayerType _type;
        std::string _name;
        bool _visible;
        Float _opacity;
        Vector2 _offset;
        Containers::Optional<TileLayer> _tiles;
        Containers::Optional<ObjectLayer> _objects;
        Properties _properties;
};

/**
@brief Map

Result of @ref MapLoader::load(). Holds references to the tileset images
acquired from an @ref AbstractImageResolver and releases them on
destruction, so the resolver has to outlive the map.
*/
class TILEDMAPS_EXPORT Map {
    public:
        /**
         * @brief Constructor
         * @param size      Size in tiles
         * @param tileSize  Tile size in pixels
         */
        explicit Map(const Vector2i& size, const Vector2i& tileSize);

        /** @brief Releases all images added with @ref addImage() */
        ~Map();

        /** @brief Copying is not allowed */
        Map(const Map&) = delete;

        /** @brief Move constructor */
        Map(Map&& other) noexcept;

        /** @brief Copying is not allowed */
        Map& operator=(const Map&) = delete;

        /** @brief Move assignment */
        Map& operator=(Map&& other) noexcept;

        /** @brief Size in tiles */
        Vector2i size() const { return _size; }

        /** @brief Tile size in pixels */
        Vector2i tileSize() const { return _tileSize; }

        /** @brief Size in pixels */
        Vector2i sizeInPixels() const { return _size*_tileSize; }

        /** @brief Orientation, such as `orthogonal`, empty if not specified */
        const std::string& orientation() const { return _orientation; }

        /** @brief Set orientation */
        Map& setOrientation(std::string orientation) {
            _orientation = std::move(orientation);
            return *this;
        }

        /** @brief Background color, if set */
        const Containers::Optional<Color4>& backgroundColor() const { return _backgroundColor; }

        /** @brief Set background color */
        Map& setBackgroundColor(const Color4& color) {
            _backgroundColor = color;
            return *this;
        }

        /** @brief Tilesets */
        TilesetRegistry& tilesets() { return _tilesets; }
        const TilesetRegistry& tilesets() const { return _tilesets; } /**< @overload */

        /**
         * @brief Tile with given global ID
         *
         * Flip bits are ignored. Returns @cpp nullptr @ce if there's no such
         * tile.
         */
        const Tile* tile(UnsignedInt id) const {
            return _tilesets.tile(splitGlobalId(id).id);
        }

        /** @brief Layers in document order */
        std::vector<Layer>& layers() { return _layers; }
        const std::vector<Layer>& layers() const { return _layers; } /**< @overload */

        /**
         * @brief Layer with given name
         *
         * The first one if there's more. Returns @cpp nullptr @ce if there's
         * no such layer.
         */
        Layer* layer(const std::string& name);
        const Layer* layer(const std::string& name) const; /**< @overload */

        /** @brief Map properties */
        Properties& properties() { return _properties; }
        const Properties& properties() const { return _properties; } /**< @overload */

        /**
         * @brief Take ownership of an image reference
         *
         * The @p image gets released in @p resolver on destruction.
         */
        Map& addImage(AbstractImageResolver& resolver, ImageHandle image);

        /** @brief Count of image references held by the map */
        std::size_t imageCount() const { return _images.size(); }

    private:
        void releaseImages();

        Vector2i _size, _tileSize;
        std::string _orientation;
        Containers::Optional<Color4> _backgroundColor;
        TilesetRegistry _tilesets;
        std::vector<Layer> _layers;
        Properties _properties;
        std::vector<std::pair<AbstractImageResolver*, ImageHandle>> _images;
};

}

#endif
