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

#include "Properties.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <Corrade/Utility/Assert.h>
#include <Corrade/Utility/Debug.h>
#include <Corrade/Utility/DebugStl.h>

namespace TiledMaps {

namespace {

bool parseNumber(const std::string& string, Double& out) {
    if(string.empty()) return false;

    const char* begin = string.data();
    char* end;
    const Double value = std::strtod(begin, &end);
    if(end == begin) return false;

    /* Allow trailing whitespace, nothing else */
    while(*end == ' ' || *end == '\t' || *end == '\n' || *end == '\r') ++end;
    if(end != begin + string.size()) return false;

    out = value;
    return true;
}

bool parseBool(const std::string& string, bool& out) {
    if(string == "true" || string == "1") {
        out = true;
        return true;
    }
    if(string == "false" || string == "0") {
        out = false;
        return true;
    }
    return false;
}

}

Debug& operator<<(Debug& debug, const PropertyType value) {
    debug << "TiledMaps::PropertyType" << Debug::nospace;

    switch(value) {
        /* LCOV_EXCL_START */
        #define _c(value) case PropertyType::value: return debug << "::" #value;
        _c(String)
        _c(Number)
        _c(Bool)
        #undef _c
        /* LCOV_EXCL_STOP */
    }

    return debug << "(" << Debug::nospace << reinterpret_cast<void*>(UnsignedByte(value)) << Debug::nospace << ")";
}

const std::string& PropertyValue::asString() const {
    CORRADE_ASSERT(_type == PropertyType::String,
        "TiledMaps::PropertyValue::asString(): the value is" << _type, _string);
    return _string;
}

Double PropertyValue::asNumber() const {
    CORRADE_ASSERT(_type == PropertyType::Number,
        "TiledMaps::PropertyValue::asNumber(): the value is" << _type, {});
    return _number;
}

bool PropertyValue::asBool() const {
    CORRADE_ASSERT(_type == PropertyType::Bool,
        "TiledMaps::PropertyValue::asBool(): the value is" << _type, {});
    return _bool;
}

std::string PropertyValue::toString() const {
    if(_type == PropertyType::String) return _string;
    if(_type == PropertyType::Bool) return _bool ? "true" : "false";

    /* Shortest representation that parses back to the same value */
    char buffer[32];
    for(int precision = 1; precision <= 17; ++precision) {
        std::snprintf(buffer, sizeof(buffer), "%.*g", precision, _number);
        if(std::strtod(buffer, nullptr) == _number) break;
    }
    return buffer;
}

bool Properties::contains(const std::string& key) const {
    return _values.find(key) != _values.end();
}

const PropertyValue* Properties::find(const std::string& key) const {
    auto found = _values.find(key);
    return found == _values.end() ? nullptr : &found->second;
}

std::string Properties::string(const std::string& key, const std::string& defaultValue) const {
    const PropertyValue* value = find(key);
    return value ? value->toString() : defaultValue;
}

Double Properties::number(const std::string& key, const Double defaultValue) const {
    const PropertyValue* value = find(key);
    if(!value) return defaultValue;

    if(value->type() == PropertyType::Number) return value->asNumber();
    if(value->type() == PropertyType::Bool) return value->asBool() ? 1.0 : 0.0;

    Double out;
    return parseNumber(value->asString(), out) ? out : defaultValue;
}

bool Properties::boolean(const std::string& key, const bool defaultValue) const {
    const PropertyValue* value = find(key);
    if(!value) return defaultValue;

    if(value->type() == PropertyType::Bool) return value->asBool();
    if(value->type() == PropertyType::Number) return value->asNumber() != 0.0;

    bool out;
    return parseBool(value->asString(), out) ? out : defaultValue;
}

Properties& Properties::set(const std::string& key, PropertyValue value) {
    _values[key] = std::move(value);
    return *this;
}

Properties& Properties::remove(const std::string& key) {
    _values.erase(key);
    return *this;
}

Properties& Properties::merge(const Properties& other) {
    for(const auto& value: other._values) _values[value.first] = value.second;
    return *this;
}

void loadProperties(const pugi::xml_node node, Properties& properties) {
    for(pugi::xml_node property: node.children("property")) {
        const std::string name = property.attribute("name").as_string();

        /* Multi-line strings are stored in the element text */
        const pugi::xml_attribute valueAttribute = property.attribute("value");
        const std::string value = valueAttribute ?
            valueAttribute.as_string() : property.text().as_string();

        const std::string type = property.attribute("type").as_string();
        if(type == "int" || type == "float") {
            Double number;
            if(parseNumber(value, number)) {
                properties.setNumber(name, number);
                continue;
            }
        } else if(type == "bool") {
            bool boolean;
            if(parseBool(value, boolean)) {
                properties.setBool(name, boolean);
                continue;
            }
        } else {
            properties.setString(name, value);
            continue;
        }

        Warning{} << "TiledMaps::loadProperties(): can't parse" << value << "as" << type << Debug::nospace << ", storing property" << name << "as a string";
        properties.setString(name, value);
    }
}

}
