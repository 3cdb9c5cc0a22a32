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

#include <lzstream/core/staging_fifo.h>

c_staging_fifo::
c_staging_fifo( const size_t depth )
{
    ring.assign( depth, lz_staged_byte_t{} );
    head = 0;
    count = 0;
}

c_staging_fifo::e_status
c_staging_fifo::push( const lz_staged_byte_t &entry )
{
    if ( full() )
    {
        return e_status::busy;
    }

    ring[ ( head + count ) % ring.size() ] = entry;
    ++count;

    return e_status::ok;
}

c_staging_fifo::e_status
c_staging_fifo::pull( lz_staged_byte_t &entry )
{
    if ( !available() )
    {
        return e_status::empty;
    }

    entry = ring[ head ];
    head = ( head + 1 ) % ring.size();
    --count;

    return e_status::ok;
}

c_staging_fifo::e_status
c_staging_fifo::exchange( const bool pop, const lz_staged_byte_t *entry, lz_staged_byte_t *popped )
{
    e_status status = e_status::ok;

    if ( pop )
    {
        lz_staged_byte_t head_entry{};

        if ( pull( head_entry ) != e_status::ok )
        {
            status = e_status::empty;
        }
        else if ( popped )
        {
            *popped = head_entry;
        }
    }

    if ( entry && push( *entry ) != e_status::ok )
    {
        status = e_status::busy;
    }

    return status;
}

const lz_staged_byte_t &
c_staging_fifo::front() const
{
    return ring[ head ];
}

void
c_staging_fifo::flush()
{
    head = 0;
    count = 0;
}

size_t
c_staging_fifo::size() const
{
    return count;
}

size_t
c_staging_fifo::free() const
{
    return ring.size() - count;
}

size_t
c_staging_fifo::depth() const
{
    return ring.size();
}

bool
c_staging_fifo::available() const
{
    return count > 0;
}

bool
c_staging_fifo::full() const
{
    return count == ring.size();
}
