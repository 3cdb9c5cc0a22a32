#pragma once

#include <lzstream/defs/lzstream_defs.h>

#include <cstddef>

/**
 * @class c_token_framer
 * @brief Packs and unpacks fixed-width token words.
 *
 * Word layout, low to high: `[7:0]` literal, next `length_bits` bits length, next
 * `distance_bits` bits distance. Any bit pattern decodes to a structurally valid token.
 */
class c_token_framer final
{
public:
    enum class e_status : unsigned char
    {
        status_ok = 0x0,
        status_error = 0x1
    };

    c_token_framer( unsigned int distance_bits, unsigned int length_bits );

    lz_token_t
    decode( unsigned long long word ) const;

    /**
     * @brief Packs a token into a word.
     *
     * @return `e_status::status_error` if a field does not fit its width; `word` is left untouched.
     */
    e_status
    pack( const lz_token_t &token, unsigned long long &word ) const;

    /**
     * @brief Number of output bytes a token expands to: 1 for a pure literal, length + 1 otherwise.
     */
    static size_t
    produced_bytes( const lz_token_t &token );

    unsigned int
    word_bits() const;

    unsigned int
    distance_bits() const;

    unsigned int
    length_bits() const;

private:
    unsigned int distance_width;
    unsigned int length_width;
};
