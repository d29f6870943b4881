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

#ifndef TiledMaps_ImporterImageResolver_h
#define TiledMaps_ImporterImageResolver_h

/** @file
 * @brief Class @ref TiledMaps::ImporterImageResolver
 */

#include <string>
#include <unordered_map>
#include <Corrade/PluginManager/Manager.h>
#include <Magnum/Trade/AbstractImporter.h>
#include <Magnum/Trade/ImageData.h>

#include "TiledMaps/AbstractImageResolver.h"

namespace TiledMaps {

/**
@brief Image resolver using an image importer plugin

Opens each image with an importer plugin from the supplied manager and keeps
the first image of the file around until its last reference is released.
Acquiring an already loaded path returns the existing handle and keeps the
options it was first acquired with. The image is dropped once its last
reference is released. Released handles are never reused.
*/
class TILEDMAPS_EXPORT ImporterImageResolver: public AbstractImageResolver {
    public:
        /**
         * @brief Constructor
         * @param manager   Importer plugin manager
         * @param plugin    Importer plugin name
         *
         * The @p manager has to outlive the resolver.
         */
        explicit ImporterImageResolver(PluginManager::Manager<Trade::AbstractImporter>& manager, std::string plugin = "AnyImageImporter");

        ~ImporterImageResolver();

        /** @brief Importer plugin name */
        const std::string& plugin() const { return _plugin; }

        /** @brief Count of images currently held */
        std::size_t imageCount() const { return _entries.size(); }

        /**
         * @brief Image data
         *
         * Expects that the image is currently acquired.
         */
        const Trade::ImageData2D& image(ImageHandle image) const;

        /**
         * @brief Options the image was first acquired with
         *
         * Expects that the image is currently acquired.
         */
        const ImageOptions& options(ImageHandle image) const;

        /**
         * @brief Reference count of an image
         *
         * Zero for released images.
         */
        UnsignedInt referenceCount(ImageHandle image) const;

    private:
        struct Entry {
            std::string filename;
            Trade::ImageData2D image;
            ImageOptions options;
            UnsignedInt references;
        };

        TILEDMAPS_LOCAL Containers::Optional<ImageHandle> doAcquire(const std::string& filename, const ImageOptions& options) override;
        TILEDMAPS_LOCAL Vector2i doSize(ImageHandle image) const override;
        TILEDMAPS_LOCAL void doRelease(ImageHandle image) override;

        PluginManager::Manager<Trade::AbstractImporter>& _manager;
        std::string _plugin;
        ImageHandle _nextHandle{};
        std::unordered_map<ImageHandle, Entry> _entries;
        std::unordered_map<std::string, ImageHandle> _handles;
};

}

#endif
