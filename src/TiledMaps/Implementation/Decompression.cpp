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

#include "Decompression.h"

#include <zlib.h>

namespace TiledMaps { namespace Implementation {

struct InflateStream::State {
    z_stream stream{};
    bool initialized = false;
};

InflateStream::InflateStream(const Containers::ArrayView<const char> input, const CompressionFormat format): _state{new State}, _finished{}, _error{} {
    _state->stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    _state->stream.avail_in = uInt(input.size());

    /* 15 is the maximal window size, +16 expects a gzip header instead of a
       zlib one */
    const int windowBits = format == CompressionFormat::Gzip ? 15 + 16 : 15;
    if(inflateInit2(&_state->stream, windowBits) != Z_OK) {
        _error = true;
        return;
    }

    _state->initialized = true;
}

InflateStream::~InflateStream() {
    if(_state->initialized) inflateEnd(&_state->stream);
}

std::size_t InflateStream::read(const Containers::ArrayView<char> output) {
    if(_error || _finished || output.empty()) return 0;

    z_stream& stream = _state->stream;
    stream.next_out = reinterpret_cast<Bytef*>(output.data());
    stream.avail_out = uInt(output.size());

    while(stream.avail_out) {
        const int result = inflate(&stream, Z_NO_FLUSH);
        if(result == Z_STREAM_END) {
            _finished = true;
            break;
        }

        /* Z_BUF_ERROR with output space left means the input ran out before
           the end marker, i.e. a truncated stream */
        if(result != Z_OK) {
            _error = true;
            break;
        }
    }

    return output.size() - stream.avail_out;
}

const char* InflateStream::errorMessage() const {
    if(!_error) return "";
    if(_state->stream.msg) return _state->stream.msg;
    return _state->initialized ? "unexpected end of stream" : "cannot initialize inflate";
}

}}
