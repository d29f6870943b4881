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

#include <string>
#include <vector>
#include <Corrade/Containers/Optional.h>
#include <Corrade/PluginManager/Manager.h>
#include <Corrade/Utility/Arguments.h>
#include <Corrade/Utility/Debug.h>
#include <Corrade/Utility/DebugStl.h>
#include <Magnum/Math/Color.h>
#include <Magnum/Trade/AbstractImporter.h>

#include "TiledMaps/ImporterImageResolver.h"
#include "TiledMaps/MapLoader.h"

using namespace TiledMaps;

int main(int argc, char** argv) {
    Utility::Arguments args;
    args.addArgument("input").setHelp("input", "input TMX file")
        .addBooleanOption("y-down").setHelp("y-down", "keep the origin in the top-left corner")
        .addOption("importer", "AnyImageImporter").setHelp("importer", "image importer plugin", "PLUGIN")
        .addBooleanOption("dependencies").setHelp("dependencies", "only print the images the map depends on")
        .setGlobalHelp("Prints information about a Tiled map.")
        .parse(argc, argv);

    const std::string input = args.value<std::string>("input");

    MapLoader loader;
    if(args.isSet("y-down")) loader.setFlags(MapLoader::Flag::YDown);

    if(args.isSet("dependencies")) {
        Containers::Optional<std::vector<std::string>> dependencies = loader.dependencies(input);
        if(!dependencies) return 1;

        for(const std::string& dependency: *dependencies)
            Debug{} << dependency;
        return 0;
    }

    PluginManager::Manager<Trade::AbstractImporter> manager;
    ImporterImageResolver resolver{manager, args.value<std::string>("importer")};

    Containers::Optional<Map> map = loader.load(input, resolver);
    if(!map) return 2;

    Debug{} << "Map" << input << Debug::nospace << ":" << map->size().x() << Debug::nospace << "x" << Debug::nospace << map->size().y() << "tiles of" << map->tileSize().x() << Debug::nospace << "x" << Debug::nospace << map->tileSize().y() << "pixels";
    if(!map->orientation().empty())
        Debug{} << "  orientation:" << map->orientation();
    if(map->backgroundColor())
        Debug{} << "  background:" << *map->backgroundColor();
    for(const auto& property: map->properties().values())
        Debug{} << "  property" << property.first << Debug::nospace << ":" << property.second.toString();

    for(const Tileset& tileset: map->tilesets()) {
        Debug{} << "Tileset" << tileset.name() << Debug::nospace << ": first ID" << tileset.firstId() << Debug::nospace << "," << tileset.tileCount() << "tiles of" << tileset.tileSize().x() << Debug::nospace << "x" << Debug::nospace << tileset.tileSize().y() << "from" << tileset.imagePath();
    }

    for(const Layer& layer: map->layers()) {
        Debug d;
        d << "Layer" << layer.name() << Debug::nospace << ":";
        if(layer.type() == LayerType::Tile) {
            const TileLayer& tiles = layer.tiles();
            d << "tile layer," << tiles.size().x() << Debug::nospace << "x" << Debug::nospace << tiles.size().y() << "cells," << tiles.cellCount() << "non-empty";
        } else {
            d << "object layer," << layer.objects().objects().size() << "objects";
        }
        if(!layer.isVisible()) d << Debug::nospace << ", hidden";
    }

    return 0;
}
