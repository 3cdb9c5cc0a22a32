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

#include <lzstream/core/stream_digest.h>

#include <mbedtls/sha1.h>

static constexpr size_t sha1_size = 20;

struct c_stream_digest::impl_t
{
    mbedtls_sha1_context context{};

    impl_t()
    {
        mbedtls_sha1_init( &context );
    }

    ~
    impl_t()
    {
        mbedtls_sha1_free( &context );
    }
};

c_stream_digest::
c_stream_digest()
{
    impl = new impl_t();
}

c_stream_digest::~
c_stream_digest()
{
    if ( impl )
    {
        delete impl;
        impl = nullptr;
    }
}

int
c_stream_digest::restart()
{
    mbedtls_sha1_free( &impl->context );
    mbedtls_sha1_init( &impl->context );

    return mbedtls_sha1_starts( &impl->context );
}

int
c_stream_digest::update( const unsigned char *data, const size_t size )
{
    return mbedtls_sha1_update( &impl->context, data, size );
}

int
c_stream_digest::update( const unsigned char value )
{
    return mbedtls_sha1_update( &impl->context, &value, 1 );
}

int
c_stream_digest::hex( std::string &output ) const
{
    static constexpr char digits[] = "0123456789abcdef";

    mbedtls_sha1_context snapshot;
    mbedtls_sha1_init( &snapshot );
    mbedtls_sha1_clone( &snapshot, &impl->context );

    unsigned char hash[ sha1_size ];

    const int status = mbedtls_sha1_finish( &snapshot, hash );

    mbedtls_sha1_free( &snapshot );

    if ( status != 0 )
    {
        return status;
    }

    output.clear();
    output.reserve( sha1_size * 2 );

    for ( const unsigned char byte : hash )
    {
        output.push_back( digits[ byte >> 4 ] );
        output.push_back( digits[ byte & 0x0F ] );
    }

    return 0;
}
