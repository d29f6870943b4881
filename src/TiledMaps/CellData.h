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

#ifndef TiledMaps_CellData_h
#define TiledMaps_CellData_h

/** @file
 * @brief Struct @ref TiledMaps::Cell, @ref TiledMaps::GlobalId, enum @ref TiledMaps::Rotation, function @ref TiledMaps::splitGlobalId(), @ref TiledMaps::cellForGlobalId(), @ref TiledMaps::decodeCellData()
 */

#include <string>
#include <Corrade/Containers/ArrayView.h>
#include <Magnum/Math/Angle.h>

#include "TiledMaps/TiledMaps.h"

namespace TiledMaps {

/**
@brief Cell rotation

Counterclockwise.
*/
enum class Rotation: UnsignedByte {
    Rotate0 = 0,        /**< No rotation */
    Rotate90 = 1,       /**< Rotated by 90° */
    Rotate180 = 2,      /**< Rotated by 180° */
    Rotate270 = 3       /**< Rotated by 270° */
};

/** @debugoperatorenum{Rotation} */
TILEDMAPS_EXPORT Debug& operator<<(Debug& debug, Rotation value);

/** @brief Rotation angle */
inline Deg rotationAngle(Rotation rotation) {
    return Deg(90.0f*Float(UnsignedByte(rotation)));
}

/**
@brief Tile layer cell

References a tile by its global ID. Flips are applied before the rotation.
*/
struct Cell {
    /** @brief Global ID of the tile, without the flip bits */
    UnsignedInt tile;

    /** @brief Whether the tile is flipped horizontally */
    bool flipHorizontally;

    /** @brief Whether the tile is flipped vertically */
    bool flipVertically;

    /** @brief Rotation */
    Rotation rotation;
};

/** @brief Global ID flag bits */
enum: UnsignedInt {
    FlippedHorizontallyFlag = 0x80000000u,  /**< Horizontal flip */
    FlippedVerticallyFlag = 0x40000000u,    /**< Vertical flip */
    FlippedDiagonallyFlag = 0x20000000u,    /**< Diagonal flip */

    /** All flip bits */
    GlobalIdFlagMask = FlippedHorizontallyFlag|FlippedVerticallyFlag|FlippedDiagonallyFlag
};

/**
@brief Global ID split into the tile ID and flip bits

@see @ref splitGlobalId()
*/
struct GlobalId {
    UnsignedInt id;             /**< Tile ID with the flip bits cleared */
    bool flipHorizontally;      /**< Horizontal flip bit */
    bool flipVertically;        /**< Vertical flip bit */
    bool flipDiagonally;        /**< Diagonal flip bit */
};

/** @brief Split a raw global ID into the tile ID and flip bits */
inline GlobalId splitGlobalId(UnsignedInt raw) {
    return GlobalId{raw & ~UnsignedInt(GlobalIdFlagMask),
        (raw & FlippedHorizontallyFlag) != 0,
        (raw & FlippedVerticallyFlag) != 0,
        (raw & FlippedDiagonallyFlag) != 0};
}

/**
@brief Cell for a raw global ID

Splits the flip bits off and composes them into a flip and rotation pair.
Without a diagonal flip the horizontal and vertical flips are kept as-is and
there's no rotation. With a diagonal flip:

| Horizontal | Vertical | @ref Cell::flipHorizontally | @ref Cell::flipVertically | @ref Cell::rotation |
|---|---|---|---|---|
| yes | yes | yes | no | @ref Rotation::Rotate270 |
| yes | no | no | no | @ref Rotation::Rotate270 |
| no | yes | no | no | @ref Rotation::Rotate90 |
| no | no | no | yes | @ref Rotation::Rotate270 |

Doesn't check whether the tile exists.
*/
TILEDMAPS_EXPORT Cell cellForGlobalId(UnsignedInt raw);

/**
@brief Decode tile layer data
@param layer        Layer to fill
@param tilesets     Tilesets to look the tiles up in
@param layerName    Layer name used in error messages
@param encoding     Value of the `encoding` attribute, empty if absent
@param compression  Value of the `compression` attribute, empty if absent
@param data         Text content of the `<data>` element
@param yAxis        Vertical axis convention
@return Whether the data was decoded successfully

Reads exactly as many global IDs as the layer has cells, row by row from the
top, and fills in a cell for each ID that has a tile in @p tilesets. IDs
without a tile leave the cell empty. With @ref YAxis::Up the rows are stored
upside down so row zero is the bottom one.

The `csv` encoding is a comma-separated list of unsigned integers. The
`base64` encoding holds little-endian 32-bit IDs, optionally compressed with
`gzip` or `zlib`, and these are inflated incrementally. Any other encoding,
including no encoding at all, any other compression, a wrong number of IDs,
an unparseable number or a corrupt stream prints an error naming the layer
and returns @cpp false @ce. The layer may be partially filled in that case.
*/
TILEDMAPS_EXPORT bool decodeCellData(TileLayer& layer, const TilesetRegistry& tilesets, const std::string& layerName, const std::string& encoding, const std::string& compression, Containers::ArrayView<const char> data, YAxis yAxis);

}

#endif
