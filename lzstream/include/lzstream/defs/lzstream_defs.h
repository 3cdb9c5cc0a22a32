#pragma once

#include <stddef.h>

#ifndef __cplusplus
#include <stdbool.h>
#endif

#define LZ_EVENT_ERROR "error"
#define LZ_EVENT_END "end"

/**
 * @enum e_lz_status
 * @brief Status codes shared by the C and C++ interfaces.
 */
typedef enum
{
    status_ok = 0, /**< operation succeeded. */
    status_error = -1, /**< operation failed. */
    status_busy = 1, /**< operation cannot proceed this tick. */
    status_invalid_distance = 2 /**< a back-reference points outside the written history. */
} e_lz_status;

/**
 * @struct lz_token_t
 * @brief A decoded token: copy `length` bytes from `distance` back, then emit `literal`.
 */
typedef struct
{
    unsigned int distance;
    unsigned int length;
    unsigned char literal;
} lz_token_t;

/**
 * @struct lz_staged_byte_t
 * @brief One entry of the output staging buffer.
 */
typedef struct
{
    unsigned char value;
    bool end_of_stream;
} lz_staged_byte_t;

/**
 * @struct lz_tick_input_t
 * @brief Signals driven into a session for one tick.
 */
typedef struct
{
    bool token_valid; /**< producer offers `token_word` this tick. */
    unsigned long long token_word; /**< packed token, held stable until accepted. */
    bool token_last; /**< the offered token is the final token of the stream. */
    bool out_ready; /**< consumer takes the output byte if one is valid. */
} lz_tick_input_t;

/**
 * @struct lz_tick_output_t
 * @brief Signals observed from a session for one tick.
 */
typedef struct
{
    bool token_ready; /**< the offered token would be admitted this tick. */
    bool token_accepted; /**< handshake completed, the token was admitted. */
    bool out_valid; /**< `out_byte` holds a staged byte. */
    unsigned char out_byte;
    bool out_last; /**< `out_byte` is the final byte of the stream. */
    bool out_transferred; /**< handshake completed, the consumer took `out_byte`. */
} lz_tick_output_t;

/**
 * @struct lz_settings_t
 * @brief Construction-time parameters of a decoding session.
 */
typedef struct
{
    unsigned int distance_bits; /**< width of the distance field. */
    unsigned int length_bits; /**< width of the length field. */
    unsigned int window_bits; /**< history window holds 2^window_bits bytes. */
    size_t staging_depth; /**< output staging buffer entries, at least 2^length_bits. */
    bool validate_distance; /**< reject back-references beyond the written history. */
} lz_settings_t;

typedef void ( *t_lz_event_error )( void *ctx, const char *message );
typedef void ( *t_lz_event_end )( void *ctx, size_t total_bytes );

#ifdef __cplusplus
extern "C" {
#endif

void
lz_settings_init( lz_settings_t *settings );

#ifdef __cplusplus
}
#endif
