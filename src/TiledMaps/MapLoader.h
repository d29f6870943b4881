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

#ifndef TiledMaps_MapLoader_h
#define TiledMaps_MapLoader_h

/** @file
 * @brief Class @ref TiledMaps::MapLoader, @ref TiledMaps::PreparedMap
 */

#include <functional>
#include <string>
#include <vector>
#include <Corrade/Containers/EnumSet.h>
#include <Corrade/Containers/Optional.h>
#include <Corrade/Containers/Pointer.h>
#include <Corrade/Utility/Utility.h>
#include <pugixml.hpp>

#include "TiledMaps/AbstractImageResolver.h"
#include "TiledMaps/Map.h"

namespace TiledMaps {

/**
@brief Parsed map waiting for its images

Result of @ref MapLoader::prepare(). Holds the parsed TMX document, the
parsed external TSX documents and the list of images the map needs. Pass it
to @ref MapLoader::finish() to get the @ref Map.
*/
class TILEDMAPS_EXPORT PreparedMap {
    public:
        ~PreparedMap();

        /** @brief Copying is not allowed */
        PreparedMap(const PreparedMap&) = delete;

        /** @brief Move constructor */
        PreparedMap(PreparedMap&&) noexcept;

        /** @brief Copying is not allowed */
        PreparedMap& operator=(const PreparedMap&) = delete;

        /** @brief Move assignment */
        PreparedMap& operator=(PreparedMap&&) noexcept;

        /** @brief Map filename */
        const std::string& filename() const { return _filename; }

        /**
         * @brief Images the map depends on
         *
         * Paths resolved against the location of the document referencing
         * them, in tileset order, without duplicates.
         */
        const std::vector<std::string>& dependencies() const { return _dependencies; }

    private:
        friend MapLoader;

        struct TilesetSource {
            /* Null for tilesets defined inline */
            Containers::Pointer<pugi::xml_document> document;
            pugi::xml_node tileset, node;
            std::string image;
        };

        explicit PreparedMap();

        std::string _filename;
        Containers::Pointer<pugi::xml_document> _document;
        std::vector<TilesetSource> _tilesets;
        std::vector<std::string> _dependencies;
};

/**
@brief Map loader

Loads a TMX document into a @ref Map in two phases. @ref prepare() parses
the document and any external TSX tilesets and collects the images the
tilesets need, without touching the images themselves. @ref finish() then
acquires the images from an @ref AbstractImageResolver, slices the tilesets
and decodes the layers. @ref load() does both at once.

Only orthogonal maps with `csv` or `base64` layer data, optionally with
`gzip` or `zlib` compression, are supported. Image layers are passed to the
callback set with @ref setImageLayerCallback() and ignored otherwise.
Infinite maps are not supported.

Errors are printed to @ref Corrade::Utility::Error and no partial map is
returned. A tile ID that doesn't refer to any tile is not an error, the cell
is left empty.

The loader has no state besides its options, so a single instance can be
used to load any number of maps.
*/
class TILEDMAPS_EXPORT MapLoader {
    public:
        /**
         * @brief Loader flag
         *
         * @see @ref Flags, @ref setFlags()
         */
        enum class Flag: UnsignedByte {
            /**
             * Keep the Tiled convention with origin in the top-left corner
             * and Y pointing down. Otherwise rows, object positions and
             * texture coordinates are converted to have origin in the
             * bottom-left corner with Y pointing up.
             */
            YDown = 1 << 0,

            /** Ask the image resolver to generate mipmaps */
            GenerateMipmaps = 1 << 1
        };

        /**
         * @brief Loader flags
         *
         * @see @ref setFlags()
         */
        typedef Containers::EnumSet<Flag> Flags;

        /**
         * @brief Object callback
         *
         * Called for every decoded object with the layer it's being added
         * to. The object can be modified, returning @cpp false @ce drops
         * it.
         */
        typedef std::function<bool(MapObject&, const Layer&)> ObjectCallback;

        /**
         * @brief Image layer callback
         *
         * Called with the map being assembled and the `<imagelayer>`
         * element.
         */
        typedef std::function<void(Map&, pugi::xml_node)> ImageLayerCallback;

        /** @brief Constructor */
        explicit MapLoader(Flags flags = {});

        /** @brief Flags */
        Flags flags() const { return _flags; }

        /** @brief Set flags */
        MapLoader& setFlags(Flags flags) {
            _flags = flags;
            return *this;
        }

        /** @brief Vertical axis convention given by the flags */
        YAxis yAxis() const {
            return _flags & Flag::YDown ? YAxis::Down : YAxis::Up;
        }

        /** @brief Minification filter passed to the image resolver */
        SamplerFilter minificationFilter() const { return _minificationFilter; }

        /**
         * @brief Set minification filter
         *
         * Default is @ref SamplerFilter::Nearest.
         */
        MapLoader& setMinificationFilter(SamplerFilter filter) {
            _minificationFilter = filter;
            return *this;
        }

        /** @brief Magnification filter passed to the image resolver */
        SamplerFilter magnificationFilter() const { return _magnificationFilter; }

        /**
         * @brief Set magnification filter
         *
         * Default is @ref SamplerFilter::Nearest.
         */
        MapLoader& setMagnificationFilter(SamplerFilter filter) {
            _magnificationFilter = filter;
            return *this;
        }

        /** @brief Image options passed to the image resolver */
        ImageOptions imageOptions() const;

        /**
         * @brief Set options from a configuration group
         *
         * Recognizes boolean `yDown` and `generateMipmaps` values and
         * `minificationFilter` and `magnificationFilter` values that are
         * either `nearest` or `linear`. Values not present in the group are
         * left untouched. Prints an error and returns @cpp false @ce on an
         * unknown filter, in which case no option is changed.
         */
        bool configure(const Utility::ConfigurationGroup& group);

        /** @brief Set object callback */
        MapLoader& setObjectCallback(ObjectCallback callback) {
            _objectCallback = std::move(callback);
            return *this;
        }

        /** @brief Set image layer callback */
        MapLoader& setImageLayerCallback(ImageLayerCallback callback) {
            _imageLayerCallback = std::move(callback);
            return *this;
        }

        /**
         * @brief Parse a map and collect its dependencies
         *
         * Parses the TMX file and all external TSX tilesets it references.
         * Prints an error and returns @ref Corrade::Containers::NullOpt if
         * any of them can't be opened or parsed or if a tileset has no
         * image.
         */
        Containers::Optional<PreparedMap> prepare(const std::string& filename) const;

        /**
         * @brief Assemble a prepared map
         *
         * Acquires all tileset images from @p resolver, which has to outlive
         * the returned map. Prints an error and returns
         * @ref Corrade::Containers::NullOpt if an image can't be acquired or
         * any layer can't be decoded, in which case all images acquired so
         * far are released again.
         */
        Containers::Optional<Map> finish(PreparedMap&& prepared, AbstractImageResolver& resolver) const;

        /**
         * @brief Load a map
         *
         * Equivalent to calling @ref prepare() and @ref finish().
         */
        Containers::Optional<Map> load(const std::string& filename, AbstractImageResolver& resolver) const;

        /**
         * @brief Images a map depends on
         *
         * Equivalent to @ref PreparedMap::dependencies() of the result of
         * @ref prepare().
         */
        Containers::Optional<std::vector<std::string>> dependencies(const std::string& filename) const;

    private:
        TILEDMAPS_LOCAL bool loadTileset(Map& map, const PreparedMap::TilesetSource& source, AbstractImageResolver& resolver) const;
        TILEDMAPS_LOCAL bool loadTileLayer(Map& map, pugi::xml_node node) const;
        TILEDMAPS_LOCAL bool loadObjectLayer(Map& map, pugi::xml_node node) const;

        Flags _flags;
        SamplerFilter _minificationFilter, _magnificationFilter;
        ObjectCallback _objectCallback;
        ImageLayerCallback _imageLayerCallback;
};

CORRADE_ENUMSET_OPERATORS(MapLoader::Flags)

/** @debugoperatorclassenum{MapLoader,MapLoader::Flag} */
TILEDMAPS_EXPORT Debug& operator<<(Debug& debug, MapLoader::Flag value);

/** @debugoperatorclassenum{MapLoader,MapLoader::Flags} */
TILEDMAPS_EXPORT Debug& operator<<(Debug& debug, MapLoader::Flags value);

}

#endif
