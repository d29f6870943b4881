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

#include <sstream>
#include <pugixml.hpp>
#include <Corrade/Containers/Optional.h>
#include <Corrade/TestSuite/Tester.h>
#include <Corrade/Utility/DebugStl.h>

#include "TiledMaps/MapObject.h"
#include "TiledMaps/Tileset.h"

namespace TiledMaps { namespace Test { namespace {

struct MapObjectTest: TestSuite::Tester {
    explicit MapObjectTest();

    void construct();
    void tileStampSize();

    void decodeRectangle();
    void decodeRectangleYDown();
    void decodeEllipse();
    void decodePolygon();
    void decodePolygonYDown();
    void decodePolyline();
    void decodeShapePriority();
    void decodeTileStamp();
    void decodeTileStampFlipped();
    void decodeTileStampRotationRadians();
    void decodeTileStampMissingTile();
    void decodeInvisible();
    void decodeCustomProperties();
    void decodeMalformedPoints();

    void applyTileStampPropertiesOtherShape();

    void debugObjectType();
};

MapObjectTest::MapObjectTest() {
    addTests({&MapObjectTest::construct,
              &MapObjectTest::tileStampSize,

              &MapObjectTest::decodeRectangle,
              &MapObjectTest::decodeRectangleYDown,
              &MapObjectTest::decodeEllipse,
              &MapObjectTest::decodePolygon,
              &MapObjectTest::decodePolygonYDown,
              &MapObjectTest::decodePolyline,
              &MapObjectTest::decodeShapePriority,
              &MapObjectTest::decodeTileStamp,
              &MapObjectTest::decodeTileStampFlipped,
              &MapObjectTest::decodeTileStampRotationRadians,
              &MapObjectTest::decodeTileStampMissingTile,
              &MapObjectTest::decodeInvisible,
              &MapObjectTest::decodeCustomProperties,
              &MapObjectTest::decodeMalformedPoints,

              &MapObjectTest::applyTileStampPropertiesOtherShape,

              &MapObjectTest::debugObjectType});
}

/* Tiles 1 to 8, all 16x16 */
TilesetRegistry tilesets() {
    TilesetRegistry registry;
    Tileset terrain{"terrain", 1, {16, 16}};
    terrain.slice(0, {64, 32}, YAxis::Up);
    registry.add(std::move(terrain));
    return registry;
}

/* All objects are decoded in a map that's 48 pixels high */
Containers::Optional<MapObject> decodeString(const char* xml, YAxis yAxis = YAxis::Up) {
    pugi::xml_document document;
    if(!document.load_string(xml)) {
        Error{} << "Can't parse" << xml;
        return Containers::NullOpt;
    }

    return decodeObject(document.child("object"), tilesets(), 48.0f, "things", yAxis);
}

void MapObjectTest::construct() {
    MapObject object{ObjectType::Rectangle};
    CORRADE_COMPARE(object.shape(), ObjectType::Rectangle);
    CORRADE_COMPARE(object.id(), 0);
    CORRADE_COMPARE(object.name(), "");
    CORRADE_COMPARE(object.type(), "");
    CORRADE_VERIFY(object.isVisible());
    CORRADE_COMPARE(object.position(), Vector2{});
    CORRADE_COMPARE(object.size(), Vector2{});
    CORRADE_VERIFY(object.points().empty());
    CORRADE_COMPARE(object.tile(), 0);
    CORRADE_COMPARE(object.rotation(), Rad{0.0f});
    CORRADE_COMPARE(object.scale(), Vector2{1.0f});
    CORRADE_VERIFY(object.properties().isEmpty());

    object.setId(3)
        .setName("door")
        .setType("portal")
        .setVisible(false)
        .setPosition({1.0f, 2.0f})
        .setSize({3.0f, 4.0f});
    CORRADE_COMPARE(object.id(), 3);
    CORRADE_COMPARE(object.name(), "door");
    CORRADE_COMPARE(object.type(), "portal");
    CORRADE_VERIFY(!object.isVisible());
    CORRADE_COMPARE(object.position(), (Vector2{1.0f, 2.0f}));
    CORRADE_COMPARE(object.size(), (Vector2{3.0f, 4.0f}));
}

void MapObjectTest::tileStampSize() {
    MapObject object{ObjectType::TileStamp};
    object.setTile(5, {16.0f, 8.0f});
    CORRADE_COMPARE(object.tile(), 5);
    CORRADE_COMPARE(object.tileSize(), (Vector2{16.0f, 8.0f}));
    CORRADE_COMPARE(object.size(), (Vector2{16.0f, 8.0f}));

    /* The size is derived from the scale and the other way around */
    object.setScale({2.0f, 0.5f});
    CORRADE_COMPARE(object.size(), (Vector2{32.0f, 4.0f}));
    object.setSize({8.0f, 16.0f});
    CORRADE_COMPARE(object.scale(), (Vector2{0.5f, 2.0f}));
    CORRADE_COMPARE(object.size(), (Vector2{8.0f, 16.0f}));
}

void MapObjectTest::decodeRectangle() {
    Containers::Optional<MapObject> object = decodeString(
        "<object id=\"1\" name=\"door\" type=\"portal\" x=\"16\" y=\"8\" width=\"16\" height=\"24\"/>");
    CORRADE_VERIFY(object);
    CORRADE_COMPARE(object->shape(), ObjectType::Rectangle);
    CORRADE_COMPARE(object->id(), 1);
    CORRADE_COMPARE(object->name(), "door");
    CORRADE_COMPARE(object->type(), "portal");
    CORRADE_VERIFY(object->isVisible());

    /* Bottom left corner, measured from the bottom of the map */
    CORRADE_COMPARE(object->position(), (Vector2{16.0f, 16.0f}));
    CORRADE_COMPARE(object->size(), (Vector2{16.0f, 24.0f}));

    const Properties& properties = object->properties();
    CORRADE_COMPARE(properties.size(), 4);
    CORRADE_COMPARE(properties.string("name"), "door");
    CORRADE_COMPARE(properties.string("type"), "portal");
    CORRADE_COMPARE(properties.number("x"), 16.0);
    CORRADE_COMPARE(properties.number("y"), 16.0);
}

void MapObjectTest::decodeRectangleYDown() {
    Containers::Optional<MapObject> object = decodeString(
        "<object id=\"1\" x=\"16\" y=\"8\" width=\"16\" height=\"24\"/>", YAxis::Down);
    CORRADE_VERIFY(object);
    CORRADE_COMPARE(object->position(), (Vector2{16.0f, 8.0f}));
    CORRADE_COMPARE(object->size(), (Vector2{16.0f, 24.0f}));
    CORRADE_COMPARE(object->properties().number("y"), 8.0);

    /* No type attribute, no type property */
    CORRADE_VERIFY(!object->properties().contains("type"));
    CORRADE_COMPARE(object->properties().string("name", "unnamed"), "");
}

void MapObjectTest::decodeEllipse() {
    Containers::Optional<MapObject> object = decodeString(
        "<object id=\"2\" name=\"pond\" x=\"0\" y=\"4\" width=\"8\" height=\"4\"><ellipse/></object>");
    CORRADE_VERIFY(object);
    CORRADE_COMPARE(object->shape(), ObjectType::Ellipse);
    CORRADE_COMPARE(object->position(), (Vector2{0.0f, 40.0f}));
    CORRADE_COMPARE(object->size(), (Vector2{8.0f, 4.0f}));
}

void MapObjectTest::decodePolygon() {
    Containers::Optional<MapObject> object = decodeString(
        "<object id=\"3\" name=\"fence\" x=\"10\" y=\"20\"><polygon points=\"0,0 10,0 10,10\"/></object>");
    CORRADE_VERIFY(object);
    CORRADE_COMPARE(object->shape(), ObjectType::Polygon);

    /* The anchor is flipped, the points only negated */
    CORRADE_COMPARE(object->position(), (Vector2{10.0f, 28.0f}));
    CORRADE_COMPARE(object->size(), Vector2{});
    CORRADE_COMPARE(object->points().size(), 3);
    CORRADE_COMPARE(object->points()[0], (Vector2{0.0f, 0.0f}));
    CORRADE_COMPARE(object->points()[1], (Vector2{10.0f, 0.0f}));
    CORRADE_COMPARE(object->points()[2], (Vector2{10.0f, -10.0f}));
}

void MapObjectTest::decodePolygonYDown() {
    Containers::Optional<MapObject> object = decodeString(
        "<object id=\"3\" x=\"10\" y=\"20\"><polygon points=\"0,0 10,0 10,10\"/></object>", YAxis::Down);
    CORRADE_VERIFY(object);
    CORRADE_COMPARE(object->position(), (Vector2{10.0f, 20.0f}));
    CORRADE_COMPARE(object->points().size(), 3);
    CORRADE_COMPARE(object->points()[2], (Vector2{10.0f, 10.0f}));
}

void MapObjectTest::decodePolyline() {
    Containers::Optional<MapObject> object = decodeString(
        "<object id=\"4\" name=\"path\" x=\"4\" y=\"40\"><polyline points=\" 0,0\n4.5,2 \"/></object>");
    CORRADE_VERIFY(object);
    CORRADE_COMPARE(object->shape(), ObjectType::Polyline);
    CORRADE_COMPARE(object->position(), (Vector2{4.0f, 8.0f}));
    CORRADE_COMPARE(object->points().size(), 2);
    CORRADE_COMPARE(object->points()[1], (Vector2{4.5f, -2.0f}));
}

void MapObjectTest::decodeShapePriority() {
    /* Polygon wins over everything else */
    Containers::Optional<MapObject> polygon = decodeString(
        "<object id=\"1\" gid=\"2\" x=\"0\" y=\"0\"><ellipse/><polyline points=\"0,0\"/><polygon points=\"1,1\"/></object>");
    CORRADE_VERIFY(polygon);
    CORRADE_COMPARE(polygon->shape(), ObjectType::Polygon);

    Containers::Optional<MapObject> polyline = decodeString(
        "<object id=\"1\" gid=\"2\" x=\"0\" y=\"0\"><ellipse/><polyline points=\"0,0\"/></object>");
    CORRADE_VERIFY(polyline);
    CORRADE_COMPARE(polyline->shape(), ObjectType::Polyline);

    Containers::Optional<MapObject> ellipse = decodeString(
        "<object id=\"1\" gid=\"2\" x=\"0\" y=\"0\"><ellipse/></object>");
    CORRADE_VERIFY(ellipse);
    CORRADE_COMPARE(ellipse->shape(), ObjectType::Ellipse);
}

void MapObjectTest::decodeTileStamp() {
    Containers::Optional<MapObject> object = decodeString(
        "<object id=\"5\" name=\"stamp\" gid=\"2\" x=\"32\" y=\"48\" width=\"16\" height=\"16\">\n"
        "  <properties>\n"
        "    <property name=\"rotationDeg\" type=\"float\" value=\"90\"/>\n"
        "    <property name=\"width\" type=\"int\" value=\"32\"/>\n"
        "  </properties>\n"
        "</object>");
    CORRADE_VERIFY(object);
    CORRADE_COMPARE(object->shape(), ObjectType::TileStamp);
    CORRADE_COMPARE(object->tile(), 2);
    CORRADE_COMPARE(object->tileSize(), (Vector2{16.0f}));

    /* Tile stamps are anchored at the bottom left already */
    CORRADE_COMPARE(object->position(), (Vector2{32.0f, 0.0f}));
    CORRADE_COMPARE(object->rotation(), Rad(Deg(90.0f)));
    CORRADE_COMPARE(object->scale(), (Vector2{2.0f, 1.0f}));
    CORRADE_COMPARE(object->size(), (Vector2{32.0f, 16.0f}));
    CORRADE_COMPARE(object->origin(), (Vector2{16.0f, 8.0f}));

    CORRADE_COMPARE(object->properties().number("gid"), 2.0);
    CORRADE_COMPARE(object->properties().number("y"), 0.0);
}

void MapObjectTest::decodeTileStampFlipped() {
    Containers::Optional<MapObject> object = decodeString(
        "<object id=\"6\" gid=\"2147483651\" x=\"0\" y=\"16\">\n"
        "  <properties>\n"
        "    <property name=\"scaleX\" type=\"float\" value=\"0.5\"/>\n"
        "    <property name=\"scaleY\" type=\"float\" value=\"3\"/>\n"
        "  </properties>\n"
        "</object>");
    CORRADE_VERIFY(object);
    CORRADE_COMPARE(object->shape(), ObjectType::TileStamp);

    /* The raw ID is kept, the tile size comes from tile 3 */
    CORRADE_COMPARE(object->tile(), 0x80000003u);
    CORRADE_COMPARE(object->properties().number("gid"), 2147483651.0);
    CORRADE_COMPARE(object->tileSize(), (Vector2{16.0f}));
    CORRADE_COMPARE(object->position(), (Vector2{0.0f, 32.0f}));
    CORRADE_COMPARE(object->scale(), (Vector2{0.5f, 3.0f}));
    CORRADE_COMPARE(object->size(), (Vector2{8.0f, 48.0f}));
    CORRADE_COMPARE(object->origin(), (Vector2{4.0f, 24.0f}));
    CORRADE_COMPARE(object->rotation(), Rad{0.0f});
}

void MapObjectTest::decodeTileStampRotationRadians() {
    /* Radians take precedence over degrees */
    Containers::Optional<MapObject> object = decodeString(
        "<object id=\"5\" gid=\"1\" x=\"0\" y=\"0\">\n"
        "  <properties>\n"
        "    <property name=\"rotationDeg\" type=\"float\" value=\"90\"/>\n"
        "    <property name=\"rotation\" type=\"float\" value=\"0.25\"/>\n"
        "  </properties>\n"
        "</object>");
    CORRADE_VERIFY(object);
    CORRADE_COMPARE(object->rotation(), Rad{0.25f});
}

void MapObjectTest::decodeTileStampMissingTile() {
    std::ostringstream out;
    Warning redirectWarning{&out};
    Containers::Optional<MapObject> object = decodeString(
        "<object id=\"8\" name=\"missing\" gid=\"42\" x=\"0\" y=\"0\">\n"
        "  <properties>\n"
        "    <property name=\"height\" type=\"int\" value=\"10\"/>\n"
        "  </properties>\n"
        "</object>");
    CORRADE_VERIFY(object);
    CORRADE_COMPARE(object->shape(), ObjectType::TileStamp);
    CORRADE_COMPARE(object->tile(), 42);
    CORRADE_COMPARE(object->tileSize(), Vector2{});
    CORRADE_COMPARE(object->size(), Vector2{});
    CORRADE_COMPARE(out.str(), "TiledMaps::applyTileStampProperties(): ignoring size of tile stamp 8 without a tile\n");
}

void MapObjectTest::decodeInvisible() {
    Containers::Optional<MapObject> object = decodeString(
        "<object id=\"7\" name=\"hidden\" x=\"1\" y=\"2\" width=\"3\" height=\"4\" visible=\"0\"/>");
    CORRADE_VERIFY(object);
    CORRADE_VERIFY(!object->isVisible());
    CORRADE_COMPARE(object->position(), (Vector2{1.0f, 42.0f}));
}

void MapObjectTest::decodeCustomProperties() {
    Containers::Optional<MapObject> object = decodeString(
        "<object id=\"1\" name=\"door\" x=\"16\" y=\"8\" width=\"16\" height=\"24\">\n"
        "  <properties>\n"
        "    <property name=\"x\" type=\"float\" value=\"100\"/>\n"
        "    <property name=\"locked\" type=\"bool\" value=\"true\"/>\n"
        "  </properties>\n"
        "</object>");
    CORRADE_VERIFY(object);

    /* Custom properties override the derived ones, the geometry stays */
    CORRADE_COMPARE(object->properties().number("x"), 100.0);
    CORRADE_COMPARE(object->position().x(), 16.0f);
    CORRADE_VERIFY(object->properties().boolean("locked"));
}

void MapObjectTest::decodeMalformedPoints() {
    std::ostringstream out;
    Error redirectError{&out};
    CORRADE_VERIFY(!decodeString(
        "<object id=\"9\" x=\"0\" y=\"0\"><polygon points=\"0,0 1;2\"/></object>"));
    CORRADE_VERIFY(!decodeString(
        "<object id=\"10\" x=\"0\" y=\"0\"><polyline points=\"0,0 1,\"/></object>"));
    CORRADE_COMPARE(out.str(),
        "TiledMaps::decodeObject(): malformed points 0,0 1;2 of object 9 in layer things\n"
        "TiledMaps::decodeObject(): malformed points 0,0 1, of object 10 in layer things\n");
}

void MapObjectTest::applyTileStampPropertiesOtherShape() {
    MapObject object{ObjectType::Rectangle};
    object.setSize({4.0f, 2.0f});
    object.properties().setNumber("rotation", 1.0)
        .setNumber("width", 10.0);

    /* Only tile stamps are affected */
    applyTileStampProperties(object);
    CORRADE_COMPARE(object.rotation(), Rad{0.0f});
    CORRADE_COMPARE(object.size(), (Vector2{4.0f, 2.0f}));
    CORRADE_COMPARE(object.origin(), Vector2{});
}

void MapObjectTest::debugObjectType() {
    std::ostringstream out;
    Debug{&out} << ObjectType::TileStamp << ObjectType(0xde);
    CORRADE_COMPARE(out.str(), "TiledMaps::ObjectType::TileStamp TiledMaps::ObjectType(0xde)\n");
}

}}}

CORRADE_TEST_MAIN(TiledMaps::Test::MapObjectTest)
