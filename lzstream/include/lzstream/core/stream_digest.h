#pragma once

#include <cstddef>
#include <string>

/**
 * @class c_stream_digest
 * @brief Running SHA-1 over the bytes handed to the consumer.
 *
 * Status values are the raw mbedtls return codes (0 on success, negative on failure).
 * restart() must run before the first update().
 */
class c_stream_digest final
{
public:
    c_stream_digest();

    c_stream_digest( const c_stream_digest &other ) = delete;

    c_stream_digest &
    operator=( const c_stream_digest &other ) = delete;

    ~c_stream_digest();

    int
    restart();

    int
    update( const unsigned char *data, size_t size );

    int
    update( unsigned char value );

    /**
     * @brief Writes the lower-case hex digest of everything fed so far.
     *
     * Works on a copy of the running state, so more bytes may be fed afterwards.
     */
    int
    hex( std::string &output ) const;

private:
    struct impl_t;
    impl_t *impl;
};
