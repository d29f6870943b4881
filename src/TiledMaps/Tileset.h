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

#ifndef TiledMaps_Tileset_h
#define TiledMaps_Tileset_h

/** @file
 * @brief Struct @ref TiledMaps::TileRegion, class @ref TiledMaps::Tile, @ref TiledMaps::Tileset, @ref TiledMaps::TilesetRegistry
 */

#include <string>
#include <vector>
#include <Magnum/Math/Range.h>

#include "TiledMaps/Properties.h"

namespace TiledMaps {

/**
@brief Tile region

Part of an image occupied by a single tile. The image itself is owned by the
@ref AbstractImageResolver that provided it.
*/
struct TileRegion {
    /** @brief Image the tile is in */
    ImageHandle image;

    /** @brief Pixel rectangle, with origin in the top-left image corner */
    Range2Di rectangle;

    /**
     * @brief Texture coordinates
     *
     * In the usual Magnum convention with origin in the bottom-left corner of
     * the image. With @ref YAxis::Down the range is mirrored, i.e. its
     * bottom edge is above the top edge.
     */
    Range2D textureCoordinates;
};

/**
@brief Tile

One region of a tileset image identified by its global ID.
*/
class TILEDMAPS_EXPORT Tile {
    public:
        /**
         * @brief Constructor
         * @param id        Global tile ID
         * @param region    Image region
         */
        explicit Tile(UnsignedInt id, const TileRegion& region): _id{id}, _region(region) {}

        /** @brief Global tile ID */
        UnsignedInt id() const { return _id; }

        /** @brief Image region */
        const TileRegion& region() const { return _region; }

        /** @brief Size in pixels */
        Vector2i size() const { return _region.rectangle.size(); }

        /** @brief Tile properties */
        Properties& properties() { return _properties; }
        const Properties& properties() const { return _properties; } /**< @overload */

    private:
        UnsignedInt _id;
        TileRegion _region;
        Properties _properties;
};

/**
@brief Tileset

Set of equally sized tiles cut out of a single image. Tiles get consecutive
global IDs starting at @ref firstId(). The tiles are created by @ref slice()
once the image size is known.
*/
class TILEDMAPS_EXPORT Tileset {
    public:
        /**
         * @brief Constructor
         * @param name      Tileset name
         * @param firstId   Global ID of the first tile
         * @param tileSize  Tile size in pixels
         * @param margin    Margin around the tiles in the image
         * @param spacing   Spacing between tiles in the image
         */
        explicit Tileset(std::string name, UnsignedInt firstId, const Vector2i& tileSize, Int margin = 0, Int spacing = 0);

        /** @brief Tileset name */
        const std::string& name() const { return _name; }

        /** @brief Global ID of the first tile */
        UnsignedInt firstId() const { return _firstId; }

        /** @brief Tile size in pixels */
        Vector2i tileSize() const { return _tileSize; }

        /** @brief Margin around the tiles in the image */
        Int margin() const { return _margin; }

        /** @brief Spacing between tiles in the image */
        Int spacing() const { return _spacing; }

        /** @brief Image source as written in the document */
        const std::string& imageSource() const { return _imageSource; }

        /** @brief Set image source as written in the document */
        Tileset& setImageSource(std::string source) {
            _imageSource = std::move(source);
            return *this;
        }

        /** @brief Image path resolved against the document location */
        const std::string& imagePath() const { return _imagePath; }

        /** @brief Set resolved image path */
        Tileset& setImagePath(std::string path) {
            _imagePath = std::move(path);
            return *this;
        }

        /**
         * @brief Image size declared in the document
         *
         * Informative only, @ref slice() uses the actual size.
         */
        Vector2i declaredImageSize() const { return _declaredImageSize; }

        /** @brief Set image size declared in the document */
        Tileset& setDeclaredImageSize(const Vector2i& size) {
            _declaredImageSize = size;
            return *this;
        }

        /** @brief Drawing offset of the tiles in pixels */
        Vector2i tileOffset() const { return _tileOffset; }

        /** @brief Set drawing offset of the tiles */
        Tileset& setTileOffset(const Vector2i& offset) {
            _tileOffset = offset;
            return *this;
        }

        /**
         * @brief Image the tiles were sliced from
         *
         * Valid only after @ref slice() was called.
         */
        ImageHandle image() const { return _image; }

        /**
         * @brief Actual image size
         *
         * Zero before @ref slice() was called.
         */
        Vector2i imageSize() const { return _imageSize; }

        /** @brief Tile count */
        std::size_t tileCount() const { return _tiles.size(); }

        /** @brief All tiles in row-major image order */
        const std::vector<Tile>& tiles() const { return _tiles; }

        /** @brief Whether given global ID belongs to this tileset */
        bool contains(UnsignedInt id) const {
            return id >= _firstId && id - _firstId < _tiles.size();
        }

        /**
         * @brief Tile with given global ID
         *
         * Returns @cpp nullptr @ce if the ID doesn't belong to this tileset.
         */
        Tile* tile(UnsignedInt id);
        const Tile* tile(UnsignedInt id) const; /**< @overload */

        /** @brief Tileset properties */
        Properties& properties() { return _properties; }
        const Properties& properties() const { return _properties; } /**< @overload */

        /**
         * @brief Slice the image into tiles
         * @param image     Image handle
         * @param imageSize Actual image size in pixels
         * @param yAxis     Vertical axis convention
         * @return Tile count
         *
         * Replaces existing tiles. Starting at @ref margin() in both
         * directions, a tile is cut out wherever it fits into the image
         * without touching the margin on the opposite side, advancing by
         * @ref tileSize() plus @ref spacing(). Tiles are ordered row by row
         * and get IDs from @ref firstId() upwards. With @ref YAxis::Down the
         * texture coordinates are mirrored vertically.
         *
         * A zero or negative tile size produces no tiles and prints a
         * warning.
         */
        std::size_t slice(ImageHandle image, const Vector2i& imageSize, YAxis yAxis);

    private:
        std::string _name;
        UnsignedInt _firstId;
        Vector2i _tileSize;
        Int _margin, _spacing;
        std::string _imageSource, _imagePath;
        Vector2i _declaredImageSize, _tileOffset;
        ImageHandle _image;
        Vector2i _imageSize;
        std::vector<Tile> _tiles;
        Properties _properties;
};

/**
@brief Tileset registry

Tilesets of a map in document order, sharing a single global tile ID space.
*/
class TILEDMAPS_EXPORT TilesetRegistry {
    public:
        /** @brief Tileset count */
        std::size_t size() const { return _tilesets.size(); }

        /** @brief Whether there are no tilesets */
        bool isEmpty() const { return _tilesets.empty(); }

        /** @brief Add a tileset */
        Tileset& add(Tileset&& tileset);

        /** @brief Tileset at given position */
        Tileset& operator[](std::size_t i);
        const Tileset& operator[](std::size_t i) const; /**< @overload */

        /** @brief Iterator to the first tileset */
        std::vector<Tileset>::const_iterator begin() const { return _tilesets.begin(); }

        /** @brief Iterator past the last tileset */
        std::vector<Tileset>::const_iterator end() const { return _tilesets.end(); }

        /**
         * @brief Tileset containing given global ID
         *
         * The first tileset in document order that has a tile with this ID,
         * @cpp nullptr @ce if there's none.
         */
        const Tileset* tilesetForId(UnsignedInt id) const;

        /**
         * @brief Tile with given global ID
         *
         * Returns @cpp nullptr @ce if no tileset has a tile with this ID.
         */
        Tile* tile(UnsignedInt id);
        const Tile* tile(UnsignedInt id) const; /**< @overload */

    private:
        std::vector<Tileset> _tilesets;
};

}

#endif
