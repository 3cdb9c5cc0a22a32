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

#include <lzstream/defs/lzstream_defs.h>

#include <cstddef>
#include <vector>

/** \cond */
class c_staging_fifo final
{
public:
    enum class e_status
    {
        ok = 0, /**< Operation succeeded. */
        busy, /**< The fifo is full, nothing was stored. */
        empty /**< The fifo holds no entry. */
    };

public:
    explicit
    c_staging_fifo( size_t depth );

    e_status
    push( const lz_staged_byte_t &entry );

    e_status
    pull( lz_staged_byte_t &entry );

    /**
     * @brief Performs one tick worth of pop and push together.
     *
     * The pop is applied first, so a push into a full fifo succeeds when it is paired
     * with a pop. Occupancy is unchanged for push+pop, +1 for push only, -1 for pop only.
     *
     * @param pop Take the head entry into `popped`.
     * @param entry Entry to append, or nullptr for no push.
     * @param popped Receives the head entry when `pop` is set.
     * @return `e_status::busy` when the push was refused, `e_status::empty` when the
     *         pop found nothing; the other half of the exchange still takes effect.
     */
    e_status
    exchange( bool pop, const lz_staged_byte_t *entry, lz_staged_byte_t *popped );

    const lz_staged_byte_t &
    front() const;

    void
    flush();

    size_t
    size() const;

    size_t
    free() const;

    size_t
    depth() const;

    bool
    available() const;

    bool
    full() const;

private:
    std::vector< lz_staged_byte_t > ring;
    size_t head;
    size_t count;
};
/** \endcond */
