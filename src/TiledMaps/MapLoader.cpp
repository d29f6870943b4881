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

#include "MapLoader.h"

#include <cstring>
#include <Corrade/Containers/EnumSet.hpp>
#include <Corrade/Utility/Assert.h>
#include <Corrade/Utility/ConfigurationGroup.h>
#include <Corrade/Utility/Debug.h>
#include <Corrade/Utility/DebugStl.h>

#include "TiledMaps/Implementation/Paths.h"
#include "TiledMaps/Implementation/XmlHelpers.h"

namespace TiledMaps {

namespace {

/* 4096x4096 cells */
constexpr UnsignedLong MaxLayerCells = 1ull << 24;

Containers::Pointer<pugi::xml_document> parseDocument(const std::string& filename) {
    Containers::Pointer<pugi::xml_document> document{new pugi::xml_document};
    const pugi::xml_parse_result result = document->load_file(filename.c_str());
    if(result) return document;

    if(result.status == pugi::status_file_not_found || result.status == pugi::status_io_error)
        Error{} << "TiledMaps::MapLoader::prepare(): cannot open" << filename;
    else
        Error{} << "TiledMaps::MapLoader::prepare(): cannot parse" << filename << Debug::nospace << ":" << result.description() << "at offset" << result.offset;
    return nullptr;
}

bool parseFilter(const std::string& value, const char* key, SamplerFilter& out) {
    if(value == "nearest") out = SamplerFilter::Nearest;
    else if(value == "linear") out = SamplerFilter::Linear;
    else {
        Error{} << "TiledMaps::MapLoader::configure(): expected nearest or linear for" << key << Debug::nospace << ", got" << value;
        return false;
    }

    return true;
}

void setFlag(const Utility::ConfigurationGroup& group, const char* key, const MapLoader::Flag flag, MapLoader::Flags& flags) {
    if(!group.hasValue(key)) return;
    if(group.value<bool>(key)) flags |= flag;
    else flags &= ~MapLoader::Flags{flag};
}

/* Tiled's offsets point down, flip them for the Y-up convention */
Vector2 layerOffset(const pugi::xml_node node, const YAxis yAxis) {
    const Vector2 offset{node.attribute("offsetx").as_float(),
                         node.attribute("offsety").as_float()};
    return yAxis == YAxis::Up ? Vector2{offset.x(), -offset.y()} : offset;
}

}

Debug& operator<<(Debug& debug, const MapLoader::Flag value) {
    debug << "TiledMaps::MapLoader::Flag" << Debug::nospace;

    switch(value) {
        /* LCOV_EXCL_START */
        #define _c(v) case MapLoader::Flag::v: return debug << "::" #v;
        _c(YDown)
        _c(GenerateMipmaps)
        #undef _c
        /* LCOV_EXCL_STOP */
    }

    return debug << "(" << Debug::nospace << reinterpret_cast<void*>(UnsignedByte(value)) << Debug::nospace << ")";
}

Debug& operator<<(Debug& debug, const MapLoader::Flags value) {
    return Containers::enumSetDebugOutput(debug, value, "TiledMaps::MapLoader::Flags{}", {
        MapLoader::Flag::YDown,
        MapLoader::Flag::GenerateMipmaps});
}

PreparedMap::PreparedMap() = default;

PreparedMap::~PreparedMap() = default;

PreparedMap::PreparedMap(PreparedMap&&) noexcept = default;

PreparedMap& PreparedMap::operator=(PreparedMap&&) noexcept = default;

MapLoader::MapLoader(const Flags flags): _flags{flags}, _minificationFilter{SamplerFilter::Nearest}, _magnificationFilter{SamplerFilter::Nearest} {}

ImageOptions MapLoader::imageOptions() const {
    ImageOptions options;
    options.generateMipmaps = !!(_flags & Flag::GenerateMipmaps);
    options.minificationFilter = _minificationFilter;
    options.magnificationFilter = _magnificationFilter;
    return options;
}

bool MapLoader::configure(const Utility::ConfigurationGroup& group) {
    SamplerFilter minificationFilter = _minificationFilter;
    if(group.hasValue("minificationFilter") && !parseFilter(group.value<std::string>("minificationFilter"), "minificationFilter", minificationFilter))
        return false;

    SamplerFilter magnificationFilter = _magnificationFilter;
    if(group.hasValue("magnificationFilter") && !parseFilter(group.value<std::string>("magnificationFilter"), "magnificationFilter", magnificationFilter))
        return false;

    Flags flags = _flags;
    setFlag(group, "yDown", Flag::YDown, flags);
    setFlag(group, "generateMipmaps", Flag::GenerateMipmaps, flags);

    _flags = flags;
    _minificationFilter = minificationFilter;
    _magnificationFilter = magnificationFilter;
    return true;
}

Containers::Optional<PreparedMap> MapLoader::prepare(const std::string& filename) const {
    PreparedMap prepared;
    prepared._filename = filename;
    if(!(prepared._document = parseDocument(filename)))
        return Containers::NullOpt;

    const pugi::xml_node root = prepared._document->child("map");
    if(!root) {
        Error{} << "TiledMaps::MapLoader::prepare():" << filename << "is not a TMX file";
        return Containers::NullOpt;
    }

    if(root.attribute("infinite").as_int()) {
        Error{} << "TiledMaps::MapLoader::prepare(): infinite maps are not supported";
        return Containers::NullOpt;
    }

    for(pugi::xml_node tileset: root.children("tileset")) {
        PreparedMap::TilesetSource source;
        source.tileset = tileset;

        /* External tilesets have their image relative to the TSX file */
        std::string base = filename;
        if(const pugi::xml_attribute reference = tileset.attribute("source")) {
            base = Implementation::resolveRelativePath(filename, reference.as_string());
            if(!(source.document = parseDocument(base)))
                return Containers::NullOpt;

            source.node = source.document->child("tileset");
            if(!source.node) {
                Error{} << "TiledMaps::MapLoader::prepare():" << base << "is not a TSX file";
                return Containers::NullOpt;
            }
        } else source.node = tileset;

        const pugi::xml_attribute image = source.node.child("image").attribute("source");
        if(!image) {
            Error{} << "TiledMaps::MapLoader::prepare(): tileset" << source.node.attribute("name").as_string() << "has no image";
            return Containers::NullOpt;
        }

        source.image = Implementation::resolveRelativePath(base, image.as_string());

        bool duplicate = false;
        for(const std::string& dependency: prepared._dependencies)
            if(dependency == source.image) duplicate = true;
        if(!duplicate) prepared._dependencies.push_back(source.image);

        prepared._tilesets.push_back(std::move(source));
    }

    return Containers::Optional<PreparedMap>{std::move(prepared)};
}

Containers::Optional<Map> MapLoader::finish(PreparedMap&& prepared, AbstractImageResolver& resolver) const {
    CORRADE_ASSERT(prepared._document,
        "TiledMaps::MapLoader::finish(): the prepared map was already consumed", {});

    const pugi::xml_node root = prepared._document->child("map");

    Map map{{root.attribute("width").as_int(), root.attribute("height").as_int()},
            {root.attribute("tilewidth").as_int(), root.attribute("tileheight").as_int()}};

    /* Derived properties first so the custom ones can override them */
    Properties& properties = map.properties();
    if(const pugi::xml_attribute orientation = root.attribute("orientation")) {
        map.setOrientation(orientation.as_string());
        properties.setString("orientation", map.orientation());
    }
    properties.setNumber("width", map.size().x())
        .setNumber("height", map.size().y())
        .setNumber("tilewidth", map.tileSize().x())
        .setNumber("tileheight", map.tileSize().y());
    if(const pugi::xml_attribute backgroundColor = root.attribute("backgroundcolor")) {
        if(const Containers::Optional<Color4> color = Implementation::parseColor(backgroundColor.as_string()))
            map.setBackgroundColor(*color);
        else
            Warning{} << "TiledMaps::MapLoader::finish(): ignoring invalid background color" << backgroundColor.as_string();
        properties.setString("backgroundcolor", backgroundColor.as_string());
    }
    loadProperties(root.child("properties"), properties);

    /* On failure the map destructor releases the images acquired so far */
    for(const PreparedMap::TilesetSource& source: prepared._tilesets)
        if(!loadTileset(map, source, resolver)) return Containers::NullOpt;

    for(pugi::xml_node child: root.children()) {
        if(std::strcmp(child.name(), "layer") == 0) {
            if(!loadTileLayer(map, child)) return Containers::NullOpt;
        } else if(std::strcmp(child.name(), "objectgroup") == 0) {
            if(!loadObjectLayer(map, child)) return Containers::NullOpt;
        } else if(std::strcmp(child.name(), "imagelayer") == 0) {
            if(_imageLayerCallback) _imageLayerCallback(map, child);
        }
    }

    return Containers::Optional<Map>{std::move(map)};
}

Containers::Optional<Map> MapLoader::load(const std::string& filename, AbstractImageResolver& resolver) const {
    Containers::Optional<PreparedMap> prepared = prepare(filename);
    if(!prepared) return Containers::NullOpt;

    return finish(std::move(*prepared), resolver);
}

Containers::Optional<std::vector<std::string>> MapLoader::dependencies(const std::string& filename) const {
    Containers::Optional<PreparedMap> prepared = prepare(filename);
    if(!prepared) return Containers::NullOpt;

    return prepared->dependencies();
}

bool MapLoader::loadTileset(Map& map, const PreparedMap::TilesetSource& source, AbstractImageResolver& resolver) const {
    const pugi::xml_node node = source.node;
    const pugi::xml_node image = node.child("image");

    Tileset tileset{node.attribute("name").as_string(),
        source.tileset.attribute("firstgid").as_uint(1),
        {node.attribute("tilewidth").as_int(), node.attribute("tileheight").as_int()},
        node.attribute("margin").as_int(),
        node.attribute("spacing").as_int()};
    tileset.setImageSource(image.attribute("source").as_string())
        .setImagePath(source.image)
        .setDeclaredImageSize({image.attribute("width").as_int(),
                               image.attribute("height").as_int()});
    if(const pugi::xml_node offset = node.child("tileoffset"))
        tileset.setTileOffset({offset.attribute("x").as_int(),
                               offset.attribute("y").as_int()});

    const Containers::Optional<ImageHandle> handle = resolver.acquire(source.image, imageOptions());
    if(!handle) {
        Error{} << "TiledMaps::MapLoader::finish(): cannot resolve image" << source.image << "of tileset" << tileset.name();
        return false;
    }
    map.addImage(resolver, *handle);

    tileset.slice(*handle, resolver.size(*handle), yAxis());

    /* Tile IDs in the tileset are local */
    for(pugi::xml_node tileNode: node.children("tile"))
        if(Tile* tile = tileset.tile(tileset.firstId() + tileNode.attribute("id").as_uint()))
            loadProperties(tileNode.child("properties"), tile->properties());

    Properties& properties = tileset.properties();
    properties.setNumber("firstgid", tileset.firstId())
        .setString("imagesource", tileset.imageSource())
        .setNumber("imagewidth", tileset.declaredImageSize().x())
        .setNumber("imageheight", tileset.declaredImageSize().y())
        .setNumber("tilewidth", tileset.tileSize().x())
        .setNumber("tileheight", tileset.tileSize().y())
        .setNumber("margin", tileset.margin())
        .setNumber("spacing", tileset.spacing());
    loadProperties(node.child("properties"), properties);

    map.tilesets().add(std::move(tileset));
    return true;
}

bool MapLoader::loadTileLayer(Map& map, const pugi::xml_node node) const {
    const std::string name = node.attribute("name").as_string();
    const Vector2i size{node.attribute("width").as_int(), node.attribute("height").as_int()};
    if(size.x() < 0 || size.y() < 0 || UnsignedLong(size.x())*UnsignedLong(size.y()) > MaxLayerCells) {
        Error{} << "TiledMaps::MapLoader::finish(): malformed layer" << name << Debug::nospace << ": size" << size << "is out of range";
        return false;
    }

    Layer layer{name, TileLayer{size, map.tileSize()}};
    layer.setVisible(node.attribute("visible").as_int(1) != 0)
        .setOpacity(node.attribute("opacity").as_float(1.0f))
        .setOffset(layerOffset(node, yAxis()));

    const pugi::xml_node data = node.child("data");
    if(!data) {
        Error{} << "TiledMaps::MapLoader::finish(): malformed layer" << name << Debug::nospace << ": no data";
        return false;
    }

    const char* const text = data.text().get();
    if(!decodeCellData(layer.tiles(), map.tilesets(), name,
        data.attribute("encoding").as_string(),
        data.attribute("compression").as_string(),
        {text, std::strlen(text)}, yAxis()))
        return false;

    loadProperties(node.child("properties"), layer.properties());

    map.layers().push_back(std::move(layer));
    return true;
}

bool MapLoader::loadObjectLayer(Map& map, const pugi::xml_node node) const {
    const std::string name = node.attribute("name").as_string();
    Layer layer{name, ObjectLayer{}};
    layer.setVisible(node.attribute("visible").as_int(1) != 0)
        .setOpacity(node.attribute("opacity").as_float(1.0f))
        .setOffset(layerOffset(node, yAxis()));
    if(const pugi::xml_attribute color = node.attribute("color")) {
        if(const Containers::Optional<Color4> parsed = Implementation::parseColor(color.as_string()))
            layer.objects().setColor(*parsed);
        else
            Warning{} << "TiledMaps::MapLoader::finish(): ignoring invalid color" << color.as_string() << "of layer" << name;
    }

    /* Properties go first so the object callback can see them */
    loadProperties(node.child("properties"), layer.properties());

    const Float mapHeight = Float(map.sizeInPixels().y());
    for(pugi::xml_node objectNode: node.children("object")) {
        Containers::Optional<MapObject> object = decodeObject(objectNode, map.tilesets(), mapHeight, name, yAxis());
        if(!object) return false;

        if(_objectCallback && !_objectCallback(*object, layer)) continue;

        layer.objects().objects().push_back(std::move(*object));
    }

    map.layers().push_back(std::move(layer));
    return true;
}

}
