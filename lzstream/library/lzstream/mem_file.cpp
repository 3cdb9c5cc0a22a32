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

#include <lzstream/core/mem_file.h>

#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>

static bool
parse_hex( const std::string &line, unsigned long long &value )
{
    size_t begin = 0;
    size_t end = line.size();

    while ( begin < end && std::isspace( static_cast< unsigned char >( line[ begin ] ) ) )
    {
        ++begin;
    }

    while ( end > begin && std::isspace( static_cast< unsigned char >( line[ end - 1 ] ) ) )
    {
        --end;
    }

    // 16 digits fill 64 bits
    if ( end == begin || end - begin > 16 )
    {
        return false;
    }

    value = 0;

    for ( size_t i = begin; i < end; ++i )
    {
        const int c = std::tolower( static_cast< unsigned char >( line[ i ] ) );

        if ( c >= '0' && c <= '9' )
        {
            value = value << 4 | static_cast< unsigned long long >( c - '0' );
        }
        else if ( c >= 'a' && c <= 'f' )
        {
            value = value << 4 | static_cast< unsigned long long >( c - 'a' + 10 );
        }
        else
        {
            return false;
        }
    }

    return true;
}

static bool
is_blank( const std::string &line )
{
    for ( const char c : line )
    {
        if ( !std::isspace( static_cast< unsigned char >( c ) ) )
        {
            return false;
        }
    }

    return true;
}

static c_mem_file::e_status
read_file( const std::string &path, std::string &text )
{
    std::ifstream file( path, std::ios::binary );
    if ( !file )
    {
        return c_mem_file::e_status::status_io_error;
    }

    std::ostringstream oss;
    oss << file.rdbuf();

    if ( file.bad() )
    {
        return c_mem_file::e_status::status_io_error;
    }

    text = oss.str();

    return c_mem_file::e_status::status_ok;
}

static c_mem_file::e_status
write_file( const std::string &path, const std::string &text )
{
    std::ofstream file( path, std::ios::binary | std::ios::trunc );
    if ( !file )
    {
        return c_mem_file::e_status::status_io_error;
    }

    file << text;
    file.flush();

    if ( !file )
    {
        return c_mem_file::e_status::status_io_error;
    }

    return c_mem_file::e_status::status_ok;
}

c_mem_file::e_status
c_mem_file::parse( const std::string &text, std::vector< unsigned long long > &values )
{
    std::istringstream iss( text );
    std::string line;

    std::vector< unsigned long long > parsed;

    while ( std::getline( iss, line ) )
    {
        if ( is_blank( line ) )
        {
            continue;
        }

        unsigned long long value = 0;
        if ( !parse_hex( line, value ) )
        {
            return e_status::status_parse_error;
        }

        parsed.emplace_back( value );
    }

    values.swap( parsed );

    return e_status::status_ok;
}

c_mem_file::e_status
c_mem_file::read_words( const std::string &path, std::vector< unsigned long long > &words )
{
    std::string text;

    const e_status status = read_file( path, text );
    if ( status != e_status::status_ok )
    {
        return status;
    }

    return parse( text, words );
}

c_mem_file::e_status
c_mem_file::read_bytes( const std::string &path, std::vector< unsigned char > &bytes )
{
    std::vector< unsigned long long > values;

    const e_status status = read_words( path, values );
    if ( status != e_status::status_ok )
    {
        return status;
    }

    std::vector< unsigned char > parsed;
    parsed.reserve( values.size() );

    for ( const unsigned long long value : values )
    {
        if ( value > 0xFF )
        {
            return e_status::status_parse_error;
        }

        parsed.emplace_back( static_cast< unsigned char >( value ) );
    }

    bytes.swap( parsed );

    return e_status::status_ok;
}

c_mem_file::e_status
c_mem_file::read_meta( const std::string &path, size_t &token_count, size_t &byte_count )
{
    std::vector< unsigned long long > values;

    const e_status status = read_words( path, values );
    if ( status != e_status::status_ok )
    {
        return status;
    }

    if ( values.size() != 2 || values[ 0 ] > 0xFFFFFFFFULL || values[ 1 ] > 0xFFFFFFFFULL )
    {
        return e_status::status_parse_error;
    }

    token_count = static_cast< size_t >( values[ 0 ] );
    byte_count = static_cast< size_t >( values[ 1 ] );

    return e_status::status_ok;
}

c_mem_file::e_status
c_mem_file::write_words( const std::string &path, const std::vector< unsigned long long > &words, const unsigned int word_bits )
{
    const int digits = static_cast< int >( ( word_bits + 3 ) / 4 );

    std::ostringstream oss;
    oss << std::uppercase << std::hex << std::setfill( '0' );

    for ( const unsigned long long word : words )
    {
        oss << std::setw( digits ) << word << '\n';
    }

    return write_file( path, oss.str() );
}

c_mem_file::e_status
c_mem_file::write_bytes( const std::string &path, const std::vector< unsigned char > &bytes )
{
    std::ostringstream oss;
    oss << std::uppercase << std::hex << std::setfill( '0' );

    for ( const unsigned char byte : bytes )
    {
        oss << std::setw( 2 ) << static_cast< unsigned int >( byte ) << '\n';
    }

    return write_file( path, oss.str() );
}

c_mem_file::e_status
c_mem_file::write_meta( const std::string &path, const size_t token_count, const size_t byte_count )
{
    std::ostringstream oss;
    oss << std::uppercase << std::hex << std::setfill( '0' );
    oss << std::setw( 8 ) << token_count << '\n';
    oss << std::setw( 8 ) << byte_count << '\n';

    return write_file( path, oss.str() );
}
