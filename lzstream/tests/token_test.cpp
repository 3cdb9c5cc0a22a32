#include <lzstream/core/token.h>

#include <gtest/gtest.h>

TEST( token_framer, decodes_literal_length_distance )
{
    const c_token_framer framer( 4, 4 );

    const lz_token_t token = framer.decode( 0x2241 );

    EXPECT_EQ( token.distance, 2u );
    EXPECT_EQ( token.length, 2u );
    EXPECT_EQ( token.literal, 'A' );
    EXPECT_EQ( framer.word_bits(), 16u );
}

TEST( token_framer, ignores_bits_above_word )
{
    const c_token_framer framer( 4, 4 );

    const lz_token_t token = framer.decode( 0xABC2241ULL );

    EXPECT_EQ( token.distance, 2u );
    EXPECT_EQ( token.length, 2u );
    EXPECT_EQ( token.literal, 'A' );
}

TEST( token_framer, decodes_wide_fields )
{
    const c_token_framer framer( 12, 6 );

    // distance 0xABC, length 0x2A, literal 0x7F
    const unsigned long long word = 0xABCULL << 14 | 0x2AULL << 8 | 0x7F;
    const lz_token_t token = framer.decode( word );

    EXPECT_EQ( token.distance, 0xABCu );
    EXPECT_EQ( token.length, 0x2Au );
    EXPECT_EQ( token.literal, 0x7F );
    EXPECT_EQ( framer.word_bits(), 26u );
}

TEST( token_framer, pack_matches_vector_layout )
{
    const c_token_framer framer( 4, 4 );

    unsigned long long word = 0;
    ASSERT_EQ( framer.pack( lz_token_t{ 2, 2, 'X' }, word ), c_token_framer::e_status::status_ok );
    EXPECT_EQ( word, 0x2258ULL );

    ASSERT_EQ( framer.pack( lz_token_t{ 0, 0, '1' }, word ), c_token_framer::e_status::status_ok );
    EXPECT_EQ( word, 0x0031ULL );
}

TEST( token_framer, pack_rejects_fields_wider_than_configured )
{
    const c_token_framer framer( 4, 4 );

    unsigned long long word = 0x1234;

    EXPECT_EQ( framer.pack( lz_token_t{ 15, 15, 0xFF }, word ), c_token_framer::e_status::status_ok );
    EXPECT_EQ( word, 0xFFFFULL );

    word = 0x1234;
    EXPECT_EQ( framer.pack( lz_token_t{ 16, 0, 'a' }, word ), c_token_framer::e_status::status_error );
    EXPECT_EQ( framer.pack( lz_token_t{ 0, 16, 'a' }, word ), c_token_framer::e_status::status_error );
    EXPECT_EQ( word, 0x1234ULL );
}

TEST( token_framer, produced_bytes )
{
    EXPECT_EQ( c_token_framer::produced_bytes( lz_token_t{ 0, 0, 'a' } ), 1u );
    EXPECT_EQ( c_token_framer::produced_bytes( lz_token_t{ 3, 0, 'a' } ), 1u );
    EXPECT_EQ( c_token_framer::produced_bytes( lz_token_t{ 1, 1, 'a' } ), 2u );
    EXPECT_EQ( c_token_framer::produced_bytes( lz_token_t{ 1, 15, 'a' } ), 16u );
}
