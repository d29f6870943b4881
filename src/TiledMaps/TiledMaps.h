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

#ifndef TiledMaps_TiledMaps_h
#define TiledMaps_TiledMaps_h

/** @file
 * @brief Forward declarations for the @ref TiledMaps namespace
 */

#include <Magnum/Magnum.h>

#include "TiledMaps/visibility.h"

/** @namespace TiledMaps
@brief Tiled TMX map loading

Loads Tiled TMX documents together with their external TSX tilesets into an
in-memory @ref TiledMaps::Map. See @ref TiledMaps::MapLoader for the entry
point.
*/
namespace TiledMaps {

using namespace Magnum;

/**
@brief Vertical axis convention

Tiled documents have their origin in the top-left corner with Y pointing
down. With @ref YAxis::Up the loaded map has its origin in the bottom-left
corner instead, matching Magnum's coordinate system.
*/
enum class YAxis: UnsignedByte {
    Up,     /**< Origin in the bottom-left corner, Y pointing up */
    Down    /**< Origin in the top-left corner, Y pointing down */
};

/** @debugoperatorenum{YAxis} */
TILEDMAPS_EXPORT Debug& operator<<(Debug& debug, YAxis value);

/**
@brief Image handle

Opaque identifier of an image acquired from an @ref AbstractImageResolver.
*/
typedef UnsignedInt ImageHandle;

#ifndef DOXYGEN_GENERATING_OUTPUT
class AbstractImageResolver;
class ImporterImageResolver;
struct ImageOptions;

enum class PropertyType: UnsignedByte;
class PropertyValue;
class Properties;

struct TileRegion;
class Tile;
class Tileset;
class TilesetRegistry;

enum class Rotation: UnsignedByte;
struct Cell;

enum class ObjectType: UnsignedByte;
class MapObject;

enum class LayerType: UnsignedByte;
class TileLayer;
class ObjectLayer;
class Layer;
class Map;

class PreparedMap;
class MapLoader;
#endif

}

#endif
