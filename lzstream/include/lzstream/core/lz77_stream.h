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

#pragma once

#include <lzstream/api/lzstream_api.h>
#include <lzstream/defs/lzstream_defs.h>

#include <cstddef>
#include <string>
#include <vector>

/**
 * @class c_lz77_stream
 * @brief Streaming token decoder with admission control and a bounded output stage.
 *
 * One call to tick() advances the whole session by one step: the consumer may take the
 * head of the staging buffer, the producer may hand over one token, and the expansion
 * engine may produce one byte. A token is admitted only when the engine is idle and the
 * staging buffer can hold every byte the token expands to, so expansion never stalls.
 *
 * The end-of-stream marker is carried by the last byte of the token flagged as final.
 * Once such a token is admitted the session admits nothing more until reset().
 */
class LZSTREAM_API c_lz77_stream
{
public:
    c_lz77_stream();

    c_lz77_stream( const c_lz77_stream &other ) = delete;

    c_lz77_stream &
    operator=( const c_lz77_stream &other ) = delete;

    ~
    c_lz77_stream();

    /**
     * @brief Validates the settings and builds the session.
     *
     * May be called again to rebuild with different settings; all state is discarded.
     *
     * @return `status_ok` on success, `status_error` if a parameter is out of range or the
     *         buffers cannot be allocated. A failed setup leaves the session unconfigured.
     */
    e_lz_status
    setup( const lz_settings_t *settings );

    /**
     * @brief Registers a callback for `LZ_EVENT_ERROR` or `LZ_EVENT_END`.
     */
    e_lz_status
    on( const char *event, void *callback );

    /**
     * @brief Advances the session by one tick.
     *
     * @return `status_ok` when nothing was refused, `status_busy` when an offered token
     *         was not admitted this tick, `status_invalid_distance` when validation rejected
     *         the offered token, `status_error` on misuse.
     */
    e_lz_status
    tick( const lz_tick_input_t *input, lz_tick_output_t *output );

    /**
     * @brief Feeds a complete token sequence and collects the output.
     *
     * The last word is flagged as final and the consumer is always ready. Returns once the
     * end-of-stream byte has been collected. A faulted session returns
     * `status_invalid_distance` without ticking.
     */
    e_lz_status
    run( const std::vector< unsigned long long > &words, std::vector< unsigned char > &output );

    /**
     * @brief Clears history, staging buffer, bookkeeping and digest.
     *
     * @return `status_error` if the digest could not be restarted.
     */
    e_lz_status
    reset();

    e_lz_status
    digest( std::string &output ) const;

    bool
    ready() const;

    bool
    finished() const;

    bool
    faulted() const;

    size_t
    staged() const;

    size_t
    total_out() const;

    const char *
    last_error() const;

private:
    t_lz_event_error event_error_callback;
    t_lz_event_end event_end_callback;

    void
    on_error( const char *message ) const;

    void
    on_end( size_t total_bytes ) const;

    struct impl_t;
    impl_t *impl;
};
