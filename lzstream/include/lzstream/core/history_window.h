#pragma once

#include <cstddef>
#include <vector>

/**
 * @class c_history_window
 * @brief Fixed-capacity ring of every byte emitted since the last reset.
 *
 * Capacity is always a power of two so that cursors wrap with a mask. Writing past
 * capacity silently overwrites the oldest byte; lookback is bounded to the capacity.
 */
class c_history_window final
{
public:
    explicit
    c_history_window( unsigned int address_bits );

    /**
     * @brief Appends a byte at the write cursor and advances the cursor.
     */
    void
    write( unsigned char value );

    /**
     * @brief Reads the byte written `distance` writes ago.
     *
     * A distance larger than the number of bytes written (or than the capacity) yields
     * whatever the slot currently holds.
     */
    unsigned char
    read( size_t distance ) const;

    unsigned char
    at( size_t slot ) const;

    size_t
    wrap( size_t slot ) const;

    size_t
    cursor() const;

    size_t
    capacity() const;

    /** number of valid bytes in the window, saturating at capacity. */
    size_t
    filled() const;

    void
    reset();

private:
    std::vector< unsigned char > storage;
    size_t mask;
    size_t write_cursor;
    size_t written;
};
