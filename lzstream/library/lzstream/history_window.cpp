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

#include <lzstream/core/history_window.h>

#include <algorithm>

c_history_window::
c_history_window( const unsigned int address_bits )
{
    storage.assign( static_cast< size_t >( 1 ) << address_bits, 0 );
    mask = storage.size() - 1;
    write_cursor = 0;
    written = 0;
}

void
c_history_window::write( const unsigned char value )
{
    storage[ write_cursor ] = value;
    write_cursor = ( write_cursor + 1 ) & mask;

    if ( written < storage.size() )
    {
        ++written;
    }
}

unsigned char
c_history_window::read( const size_t distance ) const
{
    return storage[ ( write_cursor - distance ) & mask ];
}

unsigned char
c_history_window::at( const size_t slot ) const
{
    return storage[ slot & mask ];
}

size_t
c_history_window::wrap( const size_t slot ) const
{
    return slot & mask;
}

size_t
c_history_window::cursor() const
{
    return write_cursor;
}

size_t
c_history_window::capacity() const
{
    return storage.size();
}

size_t
c_history_window::filled() const
{
    return written;
}

void
c_history_window::reset()
{
    std::fill( storage.begin(), storage.end(), static_cast< unsigned char >( 0 ) );
    write_cursor = 0;
    written = 0;
}
