/*
MIT License

Copyright (c) 2024 Tobias Staack

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files (the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.
*/

#ifdef LZSTREAM_C_API

#include <lzstream/api/lzstream_c_api.h>

#include <lzstream/core/lz77_stream.h>

#include <cstdlib>
#include <cstring>
#include <new>
#include <vector>

void *
lzstream_create()
{
    void *ptr = std::malloc( sizeof( c_lz77_stream ) );
    if ( ptr == nullptr )
    {
        return nullptr;
    }

    return new ( ptr ) c_lz77_stream();
}

e_lz_status
lzstream_setup( void *ctx, const lz_settings_t *settings )
{
    if ( !ctx )
    {
        return status_error;
    }

    return static_cast< c_lz77_stream * >( ctx )->setup( settings );
}

e_lz_status
lzstream_on( void *ctx, const char *event_name, void *callback )
{
    if ( !ctx )
    {
        return status_error;
    }

    return static_cast< c_lz77_stream * >( ctx )->on( event_name, callback );
}

e_lz_status
lzstream_tick( void *ctx, const lz_tick_input_t *input, lz_tick_output_t *output )
{
    if ( !ctx )
    {
        return status_error;
    }

    return static_cast< c_lz77_stream * >( ctx )->tick( input, output );
}

e_lz_status
lzstream_run( void *ctx, const unsigned long long *words, const size_t count, unsigned char *output, const size_t capacity, size_t *out_size )
{
    if ( !ctx || ( !words && count > 0 ) || !out_size )
    {
        return status_error;
    }

    *out_size = 0;

    std::vector< unsigned long long > input( words, words + count );
    std::vector< unsigned char > result;

    const e_lz_status status = static_cast< c_lz77_stream * >( ctx )->run( input, result );
    if ( status != status_ok )
    {
        return status;
    }

    if ( result.size() > capacity || ( !output && !result.empty() ) )
    {
        return status_error;
    }

    if ( !result.empty() )
    {
        std::memcpy( output, result.data(), result.size() );
    }

    *out_size = result.size();

    return status_ok;
}

e_lz_status
lzstream_reset( void *ctx )
{
    if ( !ctx )
    {
        return status_error;
    }

    return static_cast< c_lz77_stream * >( ctx )->reset();
}

const char *
lzstream_last_error( void *ctx )
{
    if ( !ctx )
    {
        return "";
    }

    return static_cast< c_lz77_stream * >( ctx )->last_error();
}

void
lzstream_destroy( void *ctx )
{
    if ( !ctx )
    {
        return;
    }

    static_cast< c_lz77_stream * >( ctx )->~c_lz77_stream();

    std::free( ctx );
}

#endif
