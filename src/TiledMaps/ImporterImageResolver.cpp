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

#include "ImporterImageResolver.h"

#include <Corrade/Containers/Pointer.h>
#include <Corrade/Utility/Assert.h>
#include <Corrade/Utility/Debug.h>
#include <Corrade/Utility/DebugStl.h>

namespace TiledMaps {

ImporterImageResolver::ImporterImageResolver(PluginManager::Manager<Trade::AbstractImporter>& manager, std::string plugin): _manager(manager), _plugin{std::move(plugin)} {}

ImporterImageResolver::~ImporterImageResolver() = default;

const Trade::ImageData2D& ImporterImageResolver::image(const ImageHandle image) const {
    const auto found = _entries.find(image);
    CORRADE_ASSERT(found != _entries.end(),
        "TiledMaps::ImporterImageResolver::image(): image" << image << "is not acquired", found->second.image);
    return found->second.image;
}

const ImageOptions& ImporterImageResolver::options(const ImageHandle image) const {
    const auto found = _entries.find(image);
    CORRADE_ASSERT(found != _entries.end(),
        "TiledMaps::ImporterImageResolver::options(): image" << image << "is not acquired", found->second.options);
    return found->second.options;
}

UnsignedInt ImporterImageResolver::referenceCount(const ImageHandle image) const {
    const auto found = _entries.find(image);
    return found != _entries.end() ? found->second.references : 0;
}

Containers::Optional<ImageHandle> ImporterImageResolver::doAcquire(const std::string& filename, const ImageOptions& options) {
    /* Already loaded */
    auto found = _handles.find(filename);
    if(found != _handles.end()) {
        ++_entries.at(found->second).references;
        return found->second;
    }

    Containers::Pointer<Trade::AbstractImporter> importer = _manager.loadAndInstantiate(_plugin.c_str());
    if(!importer) {
        Error{} << "TiledMaps::ImporterImageResolver::acquire(): cannot load the" << _plugin << "plugin";
        return Containers::NullOpt;
    }

    /* The importer prints the reason itself */
    if(!importer->openFile(filename.c_str())) return Containers::NullOpt;

    if(!importer->image2DCount()) {
        Error{} << "TiledMaps::ImporterImageResolver::acquire():" << filename << "contains no 2D image";
        return Containers::NullOpt;
    }

    Containers::Optional<Trade::ImageData2D> image = importer->image2D(0);
    if(!image) return Containers::NullOpt;

    const ImageHandle handle = _nextHandle++;
    _entries.emplace(handle, Entry{filename, std::move(*image), options, 1});
    _handles.emplace(filename, handle);
    return handle;
}

Vector2i ImporterImageResolver::doSize(const ImageHandle image) const {
    const auto found = _entries.find(image);
    CORRADE_ASSERT(found != _entries.end(),
        "TiledMaps::ImporterImageResolver::size(): image" << image << "is not acquired", {});
    return found->second.image.size();
}

void ImporterImageResolver::doRelease(const ImageHandle image) {
    const auto found = _entries.find(image);
    CORRADE_ASSERT(found != _entries.end(),
        "TiledMaps::ImporterImageResolver::release(): image" << image << "is not acquired", );

    if(--found->second.references) return;

    /* Last reference gone, a later acquire() loads the file again under a
       new handle */
    _handles.erase(found->second.filename);
    _entries.erase(found);
}

}
