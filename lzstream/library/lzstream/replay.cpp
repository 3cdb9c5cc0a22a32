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

#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

#include <lzstream/core/lz77_stream.h>
#include <lzstream/core/mem_file.h>

static lz_settings_t settings;

static c_lz77_stream stream;

void
lzstream_on_error( void *ctx, const char *message )
{
    fprintf( stderr, "error: %s\n", message );
}

void
lzstream_on_end( void *ctx, const size_t total_bytes )
{
    printf( "end of stream after %zu bytes\n", total_bytes );
}

static bool
parse_unsigned( const char *text, unsigned long &value )
{
    char *end = nullptr;
    value = std::strtoul( text, &end, 10 );
    return end != text && *end == '\0';
}

static void
usage( const char *program )
{
    fprintf( stderr, "usage: %s <vector-dir> [distance_bits length_bits window_bits staging_depth]\n", program );
}

int
main( const int argc, char **argv )
{
    if ( argc != 2 && argc != 6 )
    {
        usage( argv[ 0 ] );
        return 1;
    }

    lz_settings_init( &settings );

    if ( argc == 6 )
    {
        unsigned long values[ 4 ];

        for ( int i = 0; i < 4; ++i )
        {
            if ( !parse_unsigned( argv[ i + 2 ], values[ i ] ) )
            {
                usage( argv[ 0 ] );
                return 1;
            }
        }

        settings.distance_bits = static_cast< unsigned int >( values[ 0 ] );
        settings.length_bits = static_cast< unsigned int >( values[ 1 ] );
        settings.window_bits = static_cast< unsigned int >( values[ 2 ] );
        settings.staging_depth = static_cast< size_t >( values[ 3 ] );
    }

    const std::string dir = argv[ 1 ];

    std::vector< unsigned long long > words;
    if ( c_mem_file::read_words( dir + "/tokens.mem", words ) != c_mem_file::e_status::status_ok )
    {
        fprintf( stderr, "cannot read `%s/tokens.mem`\n", dir.c_str() );
        return 1;
    }

    std::vector< unsigned char > expected;
    if ( c_mem_file::read_bytes( dir + "/expected.mem", expected ) != c_mem_file::e_status::status_ok )
    {
        fprintf( stderr, "cannot read `%s/expected.mem`\n", dir.c_str() );
        return 1;
    }

    size_t token_count = 0;
    size_t byte_count = 0;
    if ( c_mem_file::read_meta( dir + "/meta.mem", token_count, byte_count ) != c_mem_file::e_status::status_ok )
    {
        fprintf( stderr, "cannot read `%s/meta.mem`\n", dir.c_str() );
        return 1;
    }

    if ( token_count != words.size() || byte_count != expected.size() )
    {
        fprintf( stderr, "meta mismatch: %zu/%zu tokens, %zu/%zu bytes\n", words.size(), token_count, expected.size(), byte_count );
        return 1;
    }

    if ( stream.on( LZ_EVENT_ERROR, reinterpret_cast< void * >( lzstream_on_error ) ) == status_error )
    {
        return 1;
    }

    if ( stream.on( LZ_EVENT_END, reinterpret_cast< void * >( lzstream_on_end ) ) == status_error )
    {
        return 1;
    }

    if ( stream.setup( &settings ) != status_ok )
    {
        return 1;
    }

    std::vector< unsigned char > output;
    if ( stream.run( words, output ) != status_ok )
    {
        printf( "FAIL: decoding stopped after %zu bytes\n", output.size() );
        return 1;
    }

    std::string digest;
    if ( stream.digest( digest ) == status_ok )
    {
        printf( "sha1 %s\n", digest.c_str() );
    }

    if ( output.size() != expected.size() )
    {
        printf( "FAIL: produced %zu bytes, expected %zu\n", output.size(), expected.size() );
        return 1;
    }

    for ( size_t i = 0; i < output.size(); ++i )
    {
        if ( output[ i ] != expected[ i ] )
        {
            printf( "FAIL: byte %zu is %02X, expected %02X\n", i, output[ i ], expected[ i ] );
            return 1;
        }
    }

    printf( "PASS: %zu tokens, %zu bytes\n", words.size(), output.size() );

    return 0;
}
