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

#ifndef TiledMaps_Properties_h
#define TiledMaps_Properties_h

/** @file
 * @brief Class @ref TiledMaps::PropertyValue, @ref TiledMaps::Properties, enum @ref TiledMaps::PropertyType, function @ref TiledMaps::loadProperties()
 */

#include <map>
#include <string>
#include <pugixml.hpp>

#include "TiledMaps/TiledMaps.h"

namespace TiledMaps {

/**
@brief Property type

@see @ref PropertyValue::type()
*/
enum class PropertyType: UnsignedByte {
    String,     /**< String */
    Number,     /**< Number, stored as a double */
    Bool        /**< Boolean */
};

/** @debugoperatorenum{PropertyType} */
TILEDMAPS_EXPORT Debug& operator<<(Debug& debug, PropertyType value);

/**
@brief Property value

A string, a number or a boolean.
*/
class TILEDMAPS_EXPORT PropertyValue {
    public:
        /** @brief Construct an empty string value */
        /*implicit*/ PropertyValue(): _type{PropertyType::String}, _number{}, _bool{} {}

        /** @brief Construct a string value */
        explicit PropertyValue(std::string value): _type{PropertyType::String}, _string{std::move(value)}, _number{}, _bool{} {}

        /** @overload */
        explicit PropertyValue(const char* value): PropertyValue{std::string{value}} {}

        /** @brief Construct a number value */
        explicit PropertyValue(Double value): _type{PropertyType::Number}, _number{value}, _bool{} {}

        /** @brief Construct a boolean value */
        explicit PropertyValue(bool value): _type{PropertyType::Bool}, _number{}, _bool{value} {}

        /** @brief Value type */
        PropertyType type() const { return _type; }

        /**
         * @brief String value
         *
         * Expects that the value is a string.
         */
        const std::string& asString() const;

        /**
         * @brief Number value
         *
         * Expects that the value is a number.
         */
        Double asNumber() const;

        /**
         * @brief Boolean value
         *
         * Expects that the value is a boolean.
         */
        bool asBool() const;

        /**
         * @brief Textual form of the value
         *
         * Strings are returned as-is, numbers in the shortest form that
         * round-trips, booleans as `true` or `false`.
         */
        std::string toString() const;

    private:
        PropertyType _type;
        std::string _string;
        Double _number;
        bool _bool;
};

/**
@brief Property bag

Maps string keys to @ref PropertyValue instances. Maps, tilesets, tiles,
layers and objects each carry one. Setting an existing key replaces its
value, which is how custom properties loaded from a document override the
properties derived from element attributes.
*/
class TILEDMAPS_EXPORT Properties {
    public:
        /** @brief Whether there are no properties */
        bool isEmpty() const { return _values.empty(); }

        /** @brief Property count */
        std::size_t size() const { return _values.size(); }

        /** @brief Whether given key is present */
        bool contains(const std::string& key) const;

        /**
         * @brief Find a property
         *
         * Returns @cpp nullptr @ce if there's no such key.
         */
        const PropertyValue* find(const std::string& key) const;

        /**
         * @brief String property
         *
         * Non-string values are converted with @ref PropertyValue::toString().
         * Returns @p defaultValue if the key is not present.
         */
        std::string string(const std::string& key, const std::string& defaultValue = {}) const;

        /**
         * @brief Number property
         *
         * A string value is parsed as a number, a boolean is converted to
         * @cpp 1.0 @ce or @cpp 0.0 @ce. Returns @p defaultValue if the key is
         * not present or the string isn't a number.
         */
        Double number(const std::string& key, Double defaultValue = 0.0) const;

        /**
         * @brief Boolean property
         *
         * A string value is accepted if it's `true`, `false`, `1` or `0`, a
         * number is @cpp true @ce if non-zero. Returns @p defaultValue if the
         * key is not present or the string is something else.
         */
        bool boolean(const std::string& key, bool defaultValue = false) const;

        /** @brief Set a property, replacing the existing value */
        Properties& set(const std::string& key, PropertyValue value);

        /** @brief Set a string property */
        Properties& setString(const std::string& key, std::string value) {
            return set(key, PropertyValue{std::move(value)});
        }

        /** @brief Set a number property */
        Properties& setNumber(const std::string& key, Double value) {
            return set(key, PropertyValue{value});
        }

        /** @brief Set a boolean property */
        Properties& setBool(const std::string& key, bool value) {
            return set(key, PropertyValue{value});
        }

        /** @brief Remove a property, if present */
        Properties& remove(const std::string& key);

        /**
         * @brief Merge properties
         *
         * Values from @p other replace values of the same key.
         */
        Properties& merge(const Properties& other);

        /** @brief All properties, ordered by key */
        const std::map<std::string, PropertyValue>& values() const { return _values; }

    private:
        std::map<std::string, PropertyValue> _values;
};

/**
@brief Load properties from a `<properties>` element

Each `<property>` child is stored under its `name` attribute. The value is
taken from the `value` attribute or, if that's missing, from the element text.
The `type` attribute picks the stored type: `int` and `float` produce a
number, `bool` a boolean, anything else a string. A value that can't be
parsed as the declared type is stored as a string with a warning. Loaded
values replace existing keys in @p properties. A null @p node does nothing.
*/
TILEDMAPS_EXPORT void loadProperties(pugi::xml_node node, Properties& properties);

}

#endif
