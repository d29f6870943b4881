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

#ifndef TiledMaps_AbstractImageResolver_h
#define TiledMaps_AbstractImageResolver_h

/** @file
 * @brief Class @ref TiledMaps::AbstractImageResolver, struct @ref TiledMaps::ImageOptions
 */

#include <string>
#include <Corrade/Containers/Optional.h>
#include <Magnum/Sampler.h>
#include <Magnum/Math/Vector2.h>

#include "TiledMaps/TiledMaps.h"

namespace TiledMaps {

/**
@brief Image options

Passed to the image resolver together with the image path. The loader itself
doesn't use these.
*/
struct ImageOptions {
    /** @brief Whether mipmaps should be generated for the image */
    bool generateMipmaps = false;

    /** @brief Minification filter */
    SamplerFilter minificationFilter = SamplerFilter::Nearest;

    /** @brief Magnification filter */
    SamplerFilter magnificationFilter = SamplerFilter::Nearest;
};

/**
@brief Base for image resolvers

Turns image paths referenced by tilesets into image handles. Handles are
reference counted: each successful @ref acquire() has to be paired with a
@ref release(). A @ref Map does that for all images it was loaded with.

@section TiledMaps-AbstractImageResolver-subclassing Subclassing

The implementation has to provide @ref doAcquire(), @ref doSize() and
@ref doRelease(). Acquiring the same path repeatedly is expected to return
the same handle until it's released the same number of times.
*/
class TILEDMAPS_EXPORT AbstractImageResolver {
    public:
        explicit AbstractImageResolver();

        /** @brief Copying is not allowed */
        AbstractImageResolver(const AbstractImageResolver&) = delete;

        /** @brief Copying is not allowed */
        AbstractImageResolver& operator=(const AbstractImageResolver&) = delete;

        virtual ~AbstractImageResolver();

        /**
         * @brief Acquire an image
         * @param filename  Image path
         * @param options   Image options
         *
         * Returns @ref Corrade::Containers::NullOpt if the image can't be
         * provided, the implementation is expected to print the reason.
         */
        Containers::Optional<ImageHandle> acquire(const std::string& filename, const ImageOptions& options = {});

        /** @brief Image size in pixels */
        Vector2i size(ImageHandle image) const;

        /**
         * @brief Release an image
         *
         * Drops one reference acquired with @ref acquire().
         */
        void release(ImageHandle image);

    private:
        /** @brief Implementation for @ref acquire() */
        virtual Containers::Optional<ImageHandle> doAcquire(const std::string& filename, const ImageOptions& options) = 0;

        /** @brief Implementation for @ref size() */
        virtual Vector2i doSize(ImageHandle image) const = 0;

        /** @brief Implementation for @ref release() */
        virtual void doRelease(ImageHandle image) = 0;
};

}

#endif
