#include <lzstream/core/lz77_stream.h>
#include <lzstream/core/mem_file.h>

#include <gtest/gtest.h>

#include <fstream>
#include <sstream>
#include <string>
#include <vector>

static std::string
slurp( const std::string &path )
{
    std::ifstream file( path, std::ios::binary );
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

static void
spill( const std::string &path, const std::string &text )
{
    std::ofstream file( path, std::ios::binary | std::ios::trunc );
    file << text;
}

TEST( mem_file, writes_zero_padded_upper_case_hex )
{
    const std::string dir = ::testing::TempDir();

    ASSERT_EQ( c_mem_file::write_words( dir + "lzstream_tokens.mem", { 0x31, 0x2241, 0x2258 }, 16 ), c_mem_file::e_status::status_ok );
    EXPECT_EQ( slurp( dir + "lzstream_tokens.mem" ), "0031\n2241\n2258\n" );

    // 4 + 6 + 8 bits round up to 5 digits
    ASSERT_EQ( c_mem_file::write_words( dir + "lzstream_tokens.mem", { 0xABC }, 18 ), c_mem_file::e_status::status_ok );
    EXPECT_EQ( slurp( dir + "lzstream_tokens.mem" ), "00ABC\n" );

    ASSERT_EQ( c_mem_file::write_bytes( dir + "lzstream_expected.mem", { 0x31, 0x0A, 0xFF } ), c_mem_file::e_status::status_ok );
    EXPECT_EQ( slurp( dir + "lzstream_expected.mem" ), "31\n0A\nFF\n" );

    ASSERT_EQ( c_mem_file::write_meta( dir + "lzstream_meta.mem", 5, 9 ), c_mem_file::e_status::status_ok );
    EXPECT_EQ( slurp( dir + "lzstream_meta.mem" ), "00000005\n00000009\n" );
}

TEST( mem_file, parse_tolerates_case_blank_lines_and_crlf )
{
    std::vector< unsigned long long > values;

    ASSERT_EQ( c_mem_file::parse( "00ff\r\n\n  2241  \nAbC\n\n", values ), c_mem_file::e_status::status_ok );

    const std::vector< unsigned long long > expected = { 0xFF, 0x2241, 0xABC };
    EXPECT_EQ( values, expected );
}

TEST( mem_file, parse_rejects_non_hex )
{
    std::vector< unsigned long long > values;

    EXPECT_EQ( c_mem_file::parse( "0031\nzz\n", values ), c_mem_file::e_status::status_parse_error );
    EXPECT_EQ( c_mem_file::parse( "0x31\n", values ), c_mem_file::e_status::status_parse_error );
    EXPECT_EQ( c_mem_file::parse( "12 34\n", values ), c_mem_file::e_status::status_parse_error );
    EXPECT_EQ( c_mem_file::parse( "11112222333344445\n", values ), c_mem_file::e_status::status_parse_error );
}

TEST( mem_file, read_bytes_rejects_values_above_a_byte )
{
    const std::string path = ::testing::TempDir() + "lzstream_wide.mem";
    spill( path, "31\n1FF\n" );

    std::vector< unsigned char > bytes;
    EXPECT_EQ( c_mem_file::read_bytes( path, bytes ), c_mem_file::e_status::status_parse_error );
}

TEST( mem_file, parse_replaces_previous_contents )
{
    std::vector< unsigned long long > values = { 0x7 };

    ASSERT_EQ( c_mem_file::parse( "0031\n0032\n", values ), c_mem_file::e_status::status_ok );

    const std::vector< unsigned long long > expected = { 0x31, 0x32 };
    EXPECT_EQ( values, expected );
}

TEST( mem_file, failed_parse_keeps_output_untouched )
{
    std::vector< unsigned long long > values = { 0x7 };

    EXPECT_EQ( c_mem_file::parse( "0031\n0032\nzz\n", values ), c_mem_file::e_status::status_parse_error );
    ASSERT_EQ( values.size(), 1u );
    EXPECT_EQ( values[ 0 ], 0x7u );

    const std::string path = ::testing::TempDir() + "lzstream_partial.mem";
    spill( path, "31\n32\n1FF\n" );

    std::vector< unsigned char > bytes = { 0xAA };
    EXPECT_EQ( c_mem_file::read_bytes( path, bytes ), c_mem_file::e_status::status_parse_error );
    ASSERT_EQ( bytes.size(), 1u );
    EXPECT_EQ( bytes[ 0 ], 0xAA );
}

TEST( mem_file, read_meta_needs_exactly_two_counts )
{
    const std::string path = ::testing::TempDir() + "lzstream_meta_bad.mem";
    size_t tokens = 0;
    size_t bytes = 0;

    spill( path, "00000005\n" );
    EXPECT_EQ( c_mem_file::read_meta( path, tokens, bytes ), c_mem_file::e_status::status_parse_error );

    spill( path, "00000005\n00000009\n00000001\n" );
    EXPECT_EQ( c_mem_file::read_meta( path, tokens, bytes ), c_mem_file::e_status::status_parse_error );

    spill( path, "00000005\n00000009\n" );
    ASSERT_EQ( c_mem_file::read_meta( path, tokens, bytes ), c_mem_file::e_status::status_ok );
    EXPECT_EQ( tokens, 5u );
    EXPECT_EQ( bytes, 9u );
}

TEST( mem_file, missing_file_is_an_io_error )
{
    std::vector< unsigned long long > words;
    EXPECT_EQ( c_mem_file::read_words( ::testing::TempDir() + "lzstream_does_not_exist.mem", words ), c_mem_file::e_status::status_io_error );
}

class vector_set_test : public ::testing::TestWithParam< const char * >
{
};

TEST_P( vector_set_test, replays_byte_exact )
{
    const std::string dir = std::string( LZSTREAM_VECTOR_DIR ) + "/" + GetParam();

    std::vector< unsigned long long > words;
    ASSERT_EQ( c_mem_file::read_words( dir + "/tokens.mem", words ), c_mem_file::e_status::status_ok );

    std::vector< unsigned char > expected;
    ASSERT_EQ( c_mem_file::read_bytes( dir + "/expected.mem", expected ), c_mem_file::e_status::status_ok );

    size_t token_count = 0;
    size_t byte_count = 0;
    ASSERT_EQ( c_mem_file::read_meta( dir + "/meta.mem", token_count, byte_count ), c_mem_file::e_status::status_ok );
    ASSERT_EQ( token_count, words.size() );
    ASSERT_EQ( byte_count, expected.size() );

    lz_settings_t settings;
    lz_settings_init( &settings );
    settings.validate_distance = true;

    c_lz77_stream stream;
    ASSERT_EQ( stream.setup( &settings ), status_ok );

    std::vector< unsigned char > output;
    ASSERT_EQ( stream.run( words, output ), status_ok ) << stream.last_error();
    EXPECT_EQ( output, expected );
}

INSTANTIATE_TEST_SUITE_P( vectors, vector_set_test, ::testing::Values( "basic", "overlap" ) );
