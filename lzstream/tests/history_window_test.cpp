#include <lzstream/core/history_window.h>

#include <gtest/gtest.h>

TEST( history_window, capacity_is_power_of_two )
{
    const c_history_window window( 4 );

    EXPECT_EQ( window.capacity(), 16u );
    EXPECT_EQ( window.cursor(), 0u );
    EXPECT_EQ( window.filled(), 0u );
}

TEST( history_window, read_returns_byte_written_distance_ago )
{
    c_history_window window( 4 );

    window.write( 'a' );
    window.write( 'b' );
    window.write( 'c' );

    EXPECT_EQ( window.read( 1 ), 'c' );
    EXPECT_EQ( window.read( 2 ), 'b' );
    EXPECT_EQ( window.read( 3 ), 'a' );
    EXPECT_EQ( window.at( window.cursor() - 1 ), 'c' );
}

TEST( history_window, oldest_bytes_are_overwritten_past_capacity )
{
    c_history_window window( 2 );

    for ( const unsigned char c : { 'a', 'b', 'c', 'd', 'e' } )
    {
        window.write( c );
    }

    EXPECT_EQ( window.cursor(), 1u );
    EXPECT_EQ( window.filled(), 4u );
    EXPECT_EQ( window.read( 1 ), 'e' );
    EXPECT_EQ( window.read( 4 ), 'b' );

    // distance equal to capacity wraps onto the oldest retained byte
    EXPECT_EQ( window.at( 1 ), 'b' );
}

TEST( history_window, reset_clears_contents_and_cursor )
{
    c_history_window window( 3 );

    window.write( 'x' );
    window.write( 'y' );
    window.reset();

    EXPECT_EQ( window.cursor(), 0u );
    EXPECT_EQ( window.filled(), 0u );

    for ( size_t slot = 0; slot < window.capacity(); ++slot )
    {
        EXPECT_EQ( window.at( slot ), 0 );
    }
}
