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

#include <lzstream/core/lz77_engine.h>

c_lz77_engine::
c_lz77_engine( const unsigned int window_bits ) :
    window( window_bits ),
    current( idle_t{} )
{
}

bool
c_lz77_engine::ready() const
{
    return std::holds_alternative< idle_t >( current );
}

c_lz77_engine::step_t
c_lz77_engine::step( const lz_token_t *offer )
{
    step_t result{};

    if ( auto *copying = std::get_if< copying_t >( &current ) )
    {
        const unsigned char value = window.at( copying->copy_cursor );

        copying->copy_cursor = window.wrap( copying->copy_cursor + 1 );

        result.produced = true;
        result.value = emit( value );

        if ( --copying->remaining == 0 )
        {
            current = emit_literal_t{ copying->literal };
        }

        return result;
    }

    if ( const auto *literal = std::get_if< emit_literal_t >( &current ) )
    {
        result.produced = true;
        result.value = emit( literal->literal );

        current = idle_t{};

        return result;
    }

    if ( offer == nullptr )
    {
        return result;
    }

    result.accepted = true;

    if ( offer->length == 0 )
    {
        result.produced = true;
        result.value = emit( offer->literal );

        return result;
    }

    // latch only; the first copy byte leaves on the next step
    current = copying_t{ window.wrap( window.cursor() - offer->distance ), offer->length, offer->literal };

    return result;
}

void
c_lz77_engine::reset()
{
    window.reset();
    current = idle_t{};
}

const c_lz77_engine::state_t &
c_lz77_engine::state() const
{
    return current;
}

const c_history_window &
c_lz77_engine::history() const
{
    return window;
}

unsigned char
c_lz77_engine::emit( const unsigned char value )
{
    window.write( value );
    return value;
}
