#pragma once

#include <cstddef>
#include <string>
#include <vector>

/**
 * @class c_mem_file
 * @brief Reads and writes the hex vector files used to replay token streams.
 *
 * - `tokens.mem`: one token word per line, zero padded to the word width.
 * - `expected.mem`: one output byte per line.
 * - `meta.mem`: token count and expected byte count, 32-bit hex each.
 */
class c_mem_file
{
public:
    enum class e_status : unsigned char
    {
        status_ok = 0x0,
        status_io_error = 0x1,
        status_parse_error = 0x2,
    };

    static e_status
    read_words( const std::string &path, std::vector< unsigned long long > &words );

    /**
     * @brief Reads one byte per line; any value above 0xFF is a parse error.
     */
    static e_status
    read_bytes( const std::string &path, std::vector< unsigned char > &bytes );

    static e_status
    read_meta( const std::string &path, size_t &token_count, size_t &byte_count );

    static e_status
    write_words( const std::string &path, const std::vector< unsigned long long > &words, unsigned int word_bits );

    static e_status
    write_bytes( const std::string &path, const std::vector< unsigned char > &bytes );

    static e_status
    write_meta( const std::string &path, size_t token_count, size_t byte_count );

    /**
     * @brief Parses one hex value per line into `values`, replacing its contents.
     *
     * `values` is left untouched when a line fails to parse.
     */
    static e_status
    parse( const std::string &text, std::vector< unsigned long long > &values );
};
