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

#ifndef TiledMaps_Implementation_Decompression_h
#define TiledMaps_Implementation_Decompression_h

#include <Corrade/Containers/ArrayView.h>
#include <Corrade/Containers/Pointer.h>

#include "TiledMaps/TiledMaps.h"

namespace TiledMaps { namespace Implementation {

enum class CompressionFormat: UnsignedByte {
    Zlib,
    Gzip
};

/* Incremental inflate over an in-memory compressed buffer. The input has to
   stay alive for the whole lifetime of the stream. */
class InflateStream {
    public:
        explicit InflateStream(Containers::ArrayView<const char> input, CompressionFormat format);

        ~InflateStream();

        InflateStream(const InflateStream&) = delete;
        InflateStream& operator=(const InflateStream&) = delete;

        /* Fills as much of the output as the stream provides, returns the
           number of bytes written. Less than output.size() means the stream
           either ended or failed, see hasError(). */
        std::size_t read(Containers::ArrayView<char> output);

        /* Whether the stream reached its end marker */
        bool isFinished() const { return _finished; }

        /* Whether the data is corrupt, truncated or inflate failed to
           initialize */
        bool hasError() const { return _error; }

        /* zlib message for the last error, if any */
        const char* errorMessage() const;

    private:
        struct State;
        Containers::Pointer<State> _state;
        bool _finished, _error;
};

}}

#endif
