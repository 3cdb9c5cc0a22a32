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

#define MBEDTLS_STATUS( x ) \
    set_last_status( x )

#include <lzstream/core/lz77_stream.h>

#include <lzstream/core/lz77_engine.h>
#include <lzstream/core/staging_fifo.h>
#include <lzstream/core/stream_digest.h>
#include <lzstream/core/token.h>

#include <cstring>
#include <memory>
#include <new>
#include <sstream>
#include <stdexcept>
#include <string>

#include <mbedtls/error.h>

static constexpr unsigned int max_distance_bits = 32;
static constexpr unsigned int max_length_bits = 24;
static constexpr unsigned int max_window_bits = 24;
static constexpr unsigned int max_word_bits = 64;

struct eos_tracker_t
{
    bool is_final_token; /**< token in flight was flagged as the last one. */
    size_t remaining_output_bytes; /**< bytes still to be pushed for the token in flight. */

    eos_tracker_t()
    {
        is_final_token = false;
        remaining_output_bytes = 0;
    }

    void
    latch( bool final_token, size_t produced_bytes );

    lz_staged_byte_t
    tag( unsigned char value );
};

void
eos_tracker_t::latch( const bool final_token, const size_t produced_bytes )
{
    is_final_token = final_token;
    remaining_output_bytes = produced_bytes;
}

lz_staged_byte_t
eos_tracker_t::tag( const unsigned char value )
{
    lz_staged_byte_t entry{};
    entry.value = value;
    entry.end_of_stream = is_final_token && remaining_output_bytes == 1;

    if ( remaining_output_bytes > 0 )
    {
        --remaining_output_bytes;
    }

    return entry;
}

struct c_lz77_stream::impl_t
{
    c_lz77_stream *instance;

    lz_settings_t settings; /**< settings the session was built with. */

    std::unique_ptr< c_token_framer > framer;
    std::unique_ptr< c_lz77_engine > engine;
    std::unique_ptr< c_staging_fifo > fifo;

    eos_tracker_t tracker;
    c_stream_digest digest;

    bool is_finished; /**< a final token has been admitted. */
    bool is_faulted; /**< validation rejected a token. */

    size_t total_out; /**< bytes handed to the consumer since reset. */

    int last_status; /**< last mbedtls status code. */
    std::string last_error; /**< last error message. */

    int
    set_last_status( int status );

    void
    set_last_error( const std::string &message );

    e_lz_status
    setup( const lz_settings_t *in_settings );

    bool
    configured() const;

    bool
    distance_valid( const lz_token_t &token ) const;

    e_lz_status
    admit( const lz_token_t &token );

    e_lz_status
    tick( const lz_tick_input_t *input, lz_tick_output_t *output );

    e_lz_status
    run( const std::vector< unsigned long long > &words, std::vector< unsigned char > &output );

    int
    reset();

    impl_t();
};

c_lz77_stream::impl_t::
impl_t()
{
    instance = nullptr;

    lz_settings_init( &settings );

    is_finished = false;
    is_faulted = false;

    total_out = 0;

    last_status = 0;
    last_error = "";
}

int
c_lz77_stream::impl_t::set_last_status( const int status )
{
    last_status = status;

    if ( status < 0 )
    {
        char buffer[ 512 ];
        mbedtls_strerror( status, buffer, sizeof( buffer ) - 1 );
        set_last_error( buffer );
    }

    return status;
}

void
c_lz77_stream::impl_t::set_last_error( const std::string &message )
{
    last_error = message;

    instance->on_error( last_error.c_str() );
}

e_lz_status
c_lz77_stream::impl_t::setup( const lz_settings_t *in_settings )
{
    if ( in_settings == nullptr )
    {
        set_last_error( "setup: settings must not be null" );
        return status_error;
    }

    if ( in_settings->distance_bits == 0 || in_settings->distance_bits > max_distance_bits )
    {
        set_last_error( "setup: distance_bits must be within 1.." + std::to_string( max_distance_bits ) );
        return status_error;
    }

    if ( in_settings->length_bits == 0 || in_settings->length_bits > max_length_bits )
    {
        set_last_error( "setup: length_bits must be within 1.." + std::to_string( max_length_bits ) );
        return status_error;
    }

    if ( in_settings->distance_bits + in_settings->length_bits + 8 > max_word_bits )
    {
        set_last_error( "setup: token word exceeds 64 bits" );
        return status_error;
    }

    if ( in_settings->window_bits == 0 || in_settings->window_bits > max_window_bits )
    {
        set_last_error( "setup: window_bits must be within 1.." + std::to_string( max_window_bits ) );
        return status_error;
    }

    // a maximal token expands to 2^L bytes and must fit the staging buffer in one shot
    const size_t max_produced = static_cast< size_t >( 1 ) << in_settings->length_bits;

    if ( in_settings->staging_depth < max_produced )
    {
        std::ostringstream oss;
        oss << "setup: staging_depth " << in_settings->staging_depth << " cannot hold a maximal token of " << max_produced << " bytes";
        set_last_error( oss.str() );
        return status_error;
    }

    try
    {
        framer = std::make_unique< c_token_framer >( in_settings->distance_bits, in_settings->length_bits );
        engine = std::make_unique< c_lz77_engine >( in_settings->window_bits );
        fifo = std::make_unique< c_staging_fifo >( in_settings->staging_depth );
    }
    catch ( const std::bad_alloc & )
    {
        framer.reset();
        engine.reset();
        fifo.reset();

        set_last_error( "setup: out of memory allocating " + std::to_string( in_settings->staging_depth ) + " staging entries" );
        return status_error;
    }
    catch ( const std::length_error & )
    {
        framer.reset();
        engine.reset();
        fifo.reset();

        set_last_error( "setup: staging_depth " + std::to_string( in_settings->staging_depth ) + " is too large" );
        return status_error;
    }

    settings = *in_settings;

    if ( reset() != 0 )
    {
        return status_error;
    }

    return status_ok;
}

bool
c_lz77_stream::impl_t::configured() const
{
    return framer && engine && fifo;
}

bool
c_lz77_stream::impl_t::distance_valid( const lz_token_t &token ) const
{
    if ( token.length == 0 )
    {
        return true;
    }

    // filled() already saturates at the window capacity
    return token.distance != 0 && token.distance <= engine->history().filled();
}

e_lz_status
c_lz77_stream::impl_t::admit( const lz_token_t &token )
{
    if ( is_finished || is_faulted || !engine->ready() )
    {
        return status_busy;
    }

    if ( settings.validate_distance && !distance_valid( token ) )
    {
        is_faulted = true;

        std::ostringstream oss;
        oss << "invalid back-reference: distance " << token.distance << " length " << token.length << " with " << engine->history().filled() << " bytes of history";
        set_last_error( oss.str() );

        return status_invalid_distance;
    }

    if ( fifo->free() < c_token_framer::produced_bytes( token ) )
    {
        return status_busy;
    }

    return status_ok;
}

e_lz_status
c_lz77_stream::impl_t::tick( const lz_tick_input_t *input, lz_tick_output_t *output )
{
    if ( !configured() )
    {
        set_last_error( "tick: session is not set up" );
        return status_error;
    }

    if ( input == nullptr || output == nullptr )
    {
        set_last_error( "tick: input and output must not be null" );
        return status_error;
    }

    std::memset( output, 0, sizeof( lz_tick_output_t ) );

    // consumer side sees the state at the start of the tick
    if ( fifo->available() )
    {
        output->out_valid = true;
        output->out_byte = fifo->front().value;
        output->out_last = fifo->front().end_of_stream;
    }

    e_lz_status status = status_ok;

    lz_token_t token{};
    const lz_token_t *offer = nullptr;

    if ( input->token_valid )
    {
        token = framer->decode( input->token_word );

        status = admit( token );

        if ( status == status_ok )
        {
            offer = &token;
            output->token_ready = true;
        }
    }
    else
    {
        output->token_ready = !is_finished && !is_faulted && engine->ready() && !fifo->full();
    }

    const c_lz77_engine::step_t step = engine->step( offer );

    if ( step.accepted )
    {
        output->token_accepted = true;

        tracker.latch( input->token_last, c_token_framer::produced_bytes( token ) );

        if ( input->token_last )
        {
            is_finished = true;
        }
    }

    lz_staged_byte_t entry{};
    if ( step.produced )
    {
        entry = tracker.tag( step.value );
    }

    const bool pop = output->out_valid && input->out_ready;

    lz_staged_byte_t popped{};
    if ( fifo->exchange( pop, step.produced ? &entry : nullptr, &popped ) != c_staging_fifo::e_status::ok )
    {
        set_last_error( "tick: staging buffer overflow" );
        return status_error;
    }

    if ( pop )
    {
        output->out_transferred = true;

        ++total_out;

        if ( MBEDTLS_STATUS( digest.update( popped.value ) ) != 0 )
        {
            return status_error;
        }

        if ( popped.end_of_stream )
        {
            instance->on_end( total_out );
        }
    }

    return status;
}

e_lz_status
c_lz77_stream::impl_t::run( const std::vector< unsigned long long > &words, std::vector< unsigned char > &output )
{
    if ( !configured() )
    {
        set_last_error( "run: session is not set up" );
        return status_error;
    }

    if ( is_finished )
    {
        set_last_error( "run: session already finished, reset it first" );
        return status_error;
    }

    if ( is_faulted )
    {
        set_last_error( "run: session faulted, reset it first" );
        return status_invalid_distance;
    }

    if ( words.empty() )
    {
        return status_ok;
    }

    // every token drains within 2^L + 2 ticks once admitted
    const size_t ticks_per_token = ( static_cast< size_t >( 1 ) << settings.length_bits ) + 2;
    size_t budget = words.size() * ticks_per_token + settings.staging_depth + fifo->size() + 1;

    size_t next = 0;

    while ( budget-- > 0 )
    {
        lz_tick_input_t input{};
        input.token_valid = next < words.size();
        input.token_word = input.token_valid ? words[ next ] : 0;
        input.token_last = next + 1 == words.size();
        input.out_ready = true;

        lz_tick_output_t result{};

        const e_lz_status status = tick( &input, &result );

        if ( status == status_error )
        {
            return status;
        }

        if ( result.token_accepted )
        {
            ++next;
        }

        // a byte taken in a rejecting tick still belongs to the output
        if ( result.out_transferred )
        {
            output.push_back( result.out_byte );

            if ( result.out_last )
            {
                return status_ok;
            }
        }

        if ( status == status_invalid_distance )
        {
            return status;
        }
    }

    set_last_error( "run: token stream did not drain" );
    return status_error;
}

int
c_lz77_stream::impl_t::reset()
{
    if ( configured() )
    {
        engine->reset();
        fifo->flush();
    }

    tracker = eos_tracker_t();

    is_finished = false;
    is_faulted = false;

    total_out = 0;

    return MBEDTLS_STATUS( digest.restart() );
}

void
lz_settings_init( lz_settings_t *settings )
{
    if ( settings == nullptr )
    {
        return;
    }

    settings->distance_bits = 4;
    settings->length_bits = 4;
    settings->window_bits = 4;
    settings->staging_depth = 16;
    settings->validate_distance = false;
}

void
c_lz77_stream::on_error( const char *message ) const
{
    if ( event_error_callback )
    {
        event_error_callback( const_cast< c_lz77_stream * >( this ), message );
    }
}

void
c_lz77_stream::on_end( const size_t total_bytes ) const
{
    if ( event_end_callback )
    {
        event_end_callback( const_cast< c_lz77_stream * >( this ), total_bytes );
    }
}

c_lz77_stream::
c_lz77_stream()
{
    event_error_callback = nullptr;
    event_end_callback = nullptr;

    impl = new impl_t();
    impl->instance = this;
}

c_lz77_stream::~
c_lz77_stream()
{
    delete impl;
}

e_lz_status
c_lz77_stream::setup( const lz_settings_t *settings )
{
    return impl->setup( settings );
}

e_lz_status
c_lz77_stream::on( const char *event, void *callback )
{
    if ( event == nullptr )
    {
        return status_error;
    }

    if ( !std::strcmp( event, LZ_EVENT_ERROR ) )
    {
        event_error_callback = reinterpret_cast< t_lz_event_error >( callback );
        return status_ok;
    }

    if ( !std::strcmp( event, LZ_EVENT_END ) )
    {
        event_end_callback = reinterpret_cast< t_lz_event_end >( callback );
        return status_ok;
    }

    return status_error;
}

e_lz_status
c_lz77_stream::tick( const lz_tick_input_t *input, lz_tick_output_t *output )
{
    return impl->tick( input, output );
}

e_lz_status
c_lz77_stream::run( const std::vector< unsigned long long > &words, std::vector< unsigned char > &output )
{
    return impl->run( words, output );
}

e_lz_status
c_lz77_stream::reset()
{
    if ( impl->reset() != 0 )
    {
        return status_error;
    }

    return status_ok;
}

e_lz_status
c_lz77_stream::digest( std::string &output ) const
{
    if ( impl->set_last_status( impl->digest.hex( output ) ) != 0 )
    {
        return status_error;
    }

    return status_ok;
}

bool
c_lz77_stream::ready() const
{
    return impl->configured() && !impl->is_finished && !impl->is_faulted && impl->engine->ready();
}

bool
c_lz77_stream::finished() const
{
    return impl->is_finished;
}

bool
c_lz77_stream::faulted() const
{
    return impl->is_faulted;
}

size_t
c_lz77_stream::staged() const
{
    return impl->configured() ? impl->fifo->size() : 0;
}

size_t
c_lz77_stream::total_out() const
{
    return impl->total_out;
}

const char *
c_lz77_stream::last_error() const
{
    return impl->last_error.c_str();
}
