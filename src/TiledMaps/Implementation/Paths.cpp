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

#include "Paths.h"

#include <algorithm>
#include <vector>
#include <Corrade/Utility/Directory.h>
#include <Corrade/Utility/String.h>

namespace TiledMaps { namespace Implementation {

namespace {

/* Documents written on Windows may use backslashes regardless of the
   platform they are loaded on */
std::string withForwardSlashes(std::string path) {
    path = Utility::Directory::fromNativeSeparators(path);
    std::replace(path.begin(), path.end(), '\\', '/');
    return path;
}

}

std::string resolveRelativePath(const std::string& documentFilename, const std::string& reference) {
    const std::string joined = Utility::Directory::join(
        Utility::Directory::path(withForwardSlashes(documentFilename)),
        withForwardSlashes(reference));

    /* Directory::join() doesn't collapse . and .. components */
    std::vector<std::string> components;
    for(std::string& component: Utility::String::splitWithoutEmptyParts(joined, '/')) {
        if(component == ".") continue;

        /* Going above the start of a relative path keeps the .. */
        if(component == ".." && !components.empty() && components.back() != "..")
            components.pop_back();
        else components.push_back(std::move(component));
    }

    std::string out;
    if(!joined.empty() && joined[0] == '/') out += '/';
    for(std::size_t i = 0; i != components.size(); ++i) {
        if(i) out += '/';
        out += components[i];
    }
    return out;
}

}}
