#pragma once

#include <lzstream/api/lzstream_api.h>
#include <lzstream/defs/lzstream_defs.h>

#ifdef __cplusplus
extern "C" {
#endif

LZSTREAM_API void *
lzstream_create();

LZSTREAM_API e_lz_status
lzstream_setup( void *ctx, const lz_settings_t *settings );

LZSTREAM_API e_lz_status
lzstream_on( void *ctx, const char *event_name, void *callback );

LZSTREAM_API e_lz_status
lzstream_tick( void *ctx, const lz_tick_input_t *input, lz_tick_output_t *output );

/**
 * Feeds `count` token words, the last one flagged as final, and writes at most
 * `capacity` output bytes to `output`. `out_size` receives the number of bytes written.
 * Returns `status_error` if the output does not fit.
 */
LZSTREAM_API e_lz_status
lzstream_run( void *ctx, const unsigned long long *words, size_t count, unsigned char *output, size_t capacity, size_t *out_size );

LZSTREAM_API e_lz_status
lzstream_reset( void *ctx );

LZSTREAM_API const char *
lzstream_last_error( void *ctx );

LZSTREAM_API void
lzstream_destroy( void *ctx );

#ifdef __cplusplus
}
#endif
