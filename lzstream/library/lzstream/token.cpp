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

#include <lzstream/core/token.h>

static constexpr unsigned int literal_bits = 8;

static unsigned long long
field_mask( const unsigned int bits )
{
    return bits >= 64 ? ~0ULL : ( 1ULL << bits ) - 1;
}

c_token_framer::
c_token_framer( const unsigned int distance_bits, const unsigned int length_bits )
{
    distance_width = distance_bits;
    length_width = length_bits;
}

lz_token_t
c_token_framer::decode( const unsigned long long word ) const
{
    lz_token_t token{};

    token.literal = static_cast< unsigned char >( word & 0xFF );
    token.length = static_cast< unsigned int >( ( word >> literal_bits ) & field_mask( length_width ) );
    token.distance = static_cast< unsigned int >( ( word >> ( literal_bits + length_width ) ) & field_mask( distance_width ) );

    return token;
}

c_token_framer::e_status
c_token_framer::pack( const lz_token_t &token, unsigned long long &word ) const
{
    if ( token.distance > field_mask( distance_width ) )
    {
        return e_status::status_error;
    }

    if ( token.length > field_mask( length_width ) )
    {
        return e_status::status_error;
    }

    word = static_cast< unsigned long long >( token.distance ) << ( literal_bits + length_width ) |
        static_cast< unsigned long long >( token.length ) << literal_bits |
        token.literal;

    return e_status::status_ok;
}

size_t
c_token_framer::produced_bytes( const lz_token_t &token )
{
    return token.length == 0 ? 1 : static_cast< size_t >( token.length ) + 1;
}

unsigned int
c_token_framer::word_bits() const
{
    return distance_width + length_width + literal_bits;
}

unsigned int
c_token_framer::distance_bits() const
{
    return distance_width;
}

unsigned int
c_token_framer::length_bits() const
{
    return length_width;
}
