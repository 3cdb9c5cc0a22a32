#include <lzstream/api/lzstream_c_api.h>

#include <gtest/gtest.h>

#include <cstdint>
#include <string>

TEST( lzstream_c_api, run_scenario )
{
    void *ctx = lzstream_create();
    ASSERT_NE( ctx, nullptr );

    lz_settings_t settings;
    lz_settings_init( &settings );
    ASSERT_EQ( lzstream_setup( ctx, &settings ), status_ok );

    const unsigned long long words[] = { 0x0031, 0x0030, 0x2241, 0x0042, 0x2258 };
    unsigned char output[ 16 ];
    size_t size = 0;

    ASSERT_EQ( lzstream_run( ctx, words, 5, output, sizeof( output ), &size ), status_ok );
    EXPECT_EQ( std::string( reinterpret_cast< char * >( output ), size ), "1010ABABX" );

    lzstream_destroy( ctx );
}

TEST( lzstream_c_api, output_too_small )
{
    void *ctx = lzstream_create();
    ASSERT_NE( ctx, nullptr );

    lz_settings_t settings;
    lz_settings_init( &settings );
    ASSERT_EQ( lzstream_setup( ctx, &settings ), status_ok );

    const unsigned long long words[] = { 0x0061, 0x1F62 };
    unsigned char output[ 4 ];
    size_t size = 0;

    EXPECT_EQ( lzstream_run( ctx, words, 2, output, sizeof( output ), &size ), status_error );
    EXPECT_EQ( size, 0u );

    lzstream_destroy( ctx );
}

TEST( lzstream_c_api, tick_and_reset )
{
    void *ctx = lzstream_create();
    ASSERT_NE( ctx, nullptr );

    EXPECT_EQ( lzstream_setup( ctx, nullptr ), status_error );
    EXPECT_STRNE( lzstream_last_error( ctx ), "" );

    lz_settings_t settings;
    lz_settings_init( &settings );
    ASSERT_EQ( lzstream_setup( ctx, &settings ), status_ok );

    lz_tick_input_t input{};
    input.token_valid = true;
    input.token_word = 0x0041;
    input.token_last = true;

    lz_tick_output_t output{};
    ASSERT_EQ( lzstream_tick( ctx, &input, &output ), status_ok );
    EXPECT_TRUE( output.token_accepted );

    EXPECT_EQ( lzstream_tick( ctx, &input, &output ), status_busy );

    EXPECT_EQ( lzstream_reset( ctx ), status_ok );
    ASSERT_EQ( lzstream_tick( ctx, &input, &output ), status_ok );
    EXPECT_TRUE( output.token_accepted );

    lzstream_destroy( ctx );
}

TEST( lzstream_c_api, oversized_staging_depth_is_reported_not_thrown )
{
    void *ctx = lzstream_create();
    ASSERT_NE( ctx, nullptr );

    lz_settings_t settings;
    lz_settings_init( &settings );
    settings.staging_depth = SIZE_MAX;

    EXPECT_EQ( lzstream_setup( ctx, &settings ), status_error );
    EXPECT_STRNE( lzstream_last_error( ctx ), "" );

    lzstream_destroy( ctx );
}

TEST( lzstream_c_api, null_context )
{
    EXPECT_EQ( lzstream_reset( nullptr ), status_error );
    EXPECT_EQ( lzstream_setup( nullptr, nullptr ), status_error );
    EXPECT_EQ( lzstream_tick( nullptr, nullptr, nullptr ), status_error );
    EXPECT_STREQ( lzstream_last_error( nullptr ), "" );
    lzstream_destroy( nullptr );
}
