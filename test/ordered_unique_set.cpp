////////////////////////////////////////////////////////////////////////////////
/// psi::persistent ordered_unique_set test suite
////////////////////////////////////////////////////////////////////////////////

#include <psi/persistent/ordered_unique_set.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <list>
#include <numeric>
#include <ranges>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::persistent
{
//------------------------------------------------------------------------------

//==============================================================================
// Type aliases for common configurations
//==============================================================================

using int_set    = ordered_unique_set<int>;
using string_set = ordered_unique_set<std::string>;

inline constexpr ordered_unique_set_options hardened_opts{ .sorted_input = sorted_input_check::always_throw };
using hardened_set = ordered_unique_set<int, std::less<>, hardened_opts>;

namespace
{
    int_set insert_all( int_set set, std::initializer_list<int> const values )
    {
        for ( int const value : values )
            set = set.insert( value );
        return set;
    }

    int_set iota_set( int const first, int const count )
    {
        std::vector<int> values( static_cast<std::size_t>( count ) );
        std::iota( values.begin(), values.end(), first );
        return int_set::from_sorted_vector( std::move( values ) );
    }

    template <typename Set>
    std::string render( Set const & set )
    {
        std::ostringstream os;
        os << set;
        return os.str();
    }

    bool strictly_ascending( int_set const & set )
    {
        auto const sorted{ set.iter_sorted() };
        return std::ranges::adjacent_find( sorted, std::ranges::greater_equal{} ) == sorted.end();
    }
} // anonymous namespace

//==============================================================================
// Construction & representation
//==============================================================================

TEST( ordered_unique_set, default_construction )
{
    int_set const s;
    EXPECT_TRUE( s.empty() );
    EXPECT_EQ( s.size(), 0 );
    EXPECT_EQ( s.representation(), representation::empty );
    EXPECT_FALSE( s.contains( 1 ) );
    EXPECT_EQ( s.begin(), s.end() );
    EXPECT_TRUE( s.iter_sorted().empty() );
    EXPECT_TRUE( s.to_sorted_vector().empty() );
}

TEST( ordered_unique_set, three_inserts_stay_small )
{
    auto const s{ int_set{}.insert( 1 ).insert( 2 ).insert( 3 ) };
    EXPECT_EQ( s.size(), 3 );
    EXPECT_EQ( s.representation(), representation::small );
    EXPECT_EQ( s.to_sorted_vector(), ( std::vector<int>{ 1, 2, 3 } ) );
}

TEST( ordered_unique_set, ninth_insert_promotes )
{
    auto const eight{ insert_all( {}, { 8, 3, 6, 1, 7, 2, 5, 4 } ) };
    EXPECT_EQ( eight.size(), 8 );
    EXPECT_EQ( eight.representation(), representation::small );

    auto const nine{ eight.insert( 9 ) };
    EXPECT_EQ( nine.size(), 9 );
    EXPECT_EQ( nine.representation(), representation::large );
    EXPECT_EQ( nine.to_sorted_vector(), ( std::vector<int>{ 1, 2, 3, 4, 5, 6, 7, 8, 9 } ) );

    // promotion sorts, storage order of the large representation is ascending
    EXPECT_TRUE( std::ranges::equal( nine.iter(), nine.to_sorted_vector() ) );

    // the source value is untouched
    EXPECT_EQ( eight.size(), 8 );
    EXPECT_FALSE( eight.contains( 9 ) );
}

TEST( ordered_unique_set, full_small_duplicate_does_not_promote )
{
    auto const eight{ insert_all( {}, { 1, 2, 3, 4, 5, 6, 7, 8 } ) };
    auto const same { eight.insert( 5 ) };
    EXPECT_EQ( same.representation(), representation::small );
    EXPECT_EQ( same.size(), 8 );
}

TEST( ordered_unique_set, removal_to_threshold_flattens )
{
    auto const nine{ insert_all( {}, { 1, 2, 3, 4, 5, 6, 7, 8, 9 } ) };
    ASSERT_EQ( nine.representation(), representation::large );

    auto const eight{ nine.remove( 5 ) };
    EXPECT_EQ( eight.representation(), representation::small );
    EXPECT_EQ( eight.size(), 8 );
    EXPECT_FALSE( eight.contains( 5 ) );
    EXPECT_EQ( eight.to_sorted_vector(), ( std::vector<int>{ 1, 2, 3, 4, 6, 7, 8, 9 } ) );
    EXPECT_EQ( eight, insert_all( {}, { 9, 8, 7, 6, 4, 3, 2, 1 } ) );

    EXPECT_EQ( nine.size(), 9 );
    EXPECT_TRUE( nine.contains( 5 ) );
}

TEST( ordered_unique_set, large_removal_stays_large )
{
    auto const ten  { iota_set( 1, 10 ) };
    auto const nine { ten.remove( 10 ) };
    EXPECT_EQ( nine.representation(), representation::large );
    EXPECT_EQ( nine.size(), 9 );
}

TEST( ordered_unique_set, removal_to_empty )
{
    auto const one{ int_set{}.insert( 42 ) };
    auto const none{ one.remove( 42 ) };
    EXPECT_TRUE( none.empty() );
    EXPECT_EQ( none.representation(), representation::empty );
    EXPECT_TRUE( int_set{}.remove( 42 ).empty() );
}

TEST( ordered_unique_set, absent_removal_is_noop )
{
    auto const small{ insert_all( {}, { 1, 2, 3 } ) };
    EXPECT_EQ( small.remove( 7 ), small );
    EXPECT_EQ( small.remove( 7 ).representation(), representation::small );
}

//==============================================================================
// Algebraic properties
//==============================================================================

TEST( ordered_unique_set, idempotence )
{
    for ( int_set const & s : { int_set{}, insert_all( {}, { 1, 5, 3 } ), iota_set( 0, 20 ) } )
    {
        for ( int const e : { 0, 3, 19, 100 } )
        {
            EXPECT_EQ( s.insert( e ).insert( e ), s.insert( e ) );
            EXPECT_EQ( s.remove( e ).remove( e ), s.remove( e ) );
        }
    }
}

TEST( ordered_unique_set, membership_consistency )
{
    for ( int_set const & s : { int_set{}, insert_all( {}, { 1, 5, 3 } ), insert_all( {}, { 1, 2, 3, 4, 5, 6, 7, 8 } ), iota_set( 0, 20 ) } )
    {
        for ( int const e : { -1, 0, 3, 8, 19, 100 } )
        {
            EXPECT_TRUE ( s.insert( e ).contains( e ) );
            EXPECT_FALSE( s.remove( e ).contains( e ) );
        }
    }
}

TEST( ordered_unique_set, sorted_iteration_ascending )
{
    EXPECT_TRUE( strictly_ascending( insert_all( {}, { 9, 2, 7, 4 } ) ) );
    EXPECT_TRUE( strictly_ascending( insert_all( {}, { 13, 2, 11, 4, 6, 1, 9, 20, 3, 15 } ) ) );
    auto const small { insert_all( {}, { 9, 2, 7, 4 } ) };
    auto const sorted{ small.iter_sorted() };
    EXPECT_EQ( sorted.size(), 4 );
    EXPECT_EQ( sorted.front(), 2 );
    EXPECT_EQ( sorted.back (), 9 );
}

TEST( ordered_unique_set, sorted_range_views_set_storage )
{
    for ( int_set const & s : { insert_all( {}, { 9, 2, 7, 4 } ), iota_set( 0, 16 ) } )
    {
        auto const sorted { s.iter_sorted() };
        auto const storage{ s.iter() };
        {
            auto const derived{ s.remove( 2 ).insert( 100 ) };
            EXPECT_FALSE( derived.contains( 2 ) );
        }
        for ( int const & element : sorted )
        {
            EXPECT_GE( &element, storage.data() );
            EXPECT_LT( &element, storage.data() + storage.size() );
        }
        EXPECT_TRUE( std::is_sorted( sorted.begin(), sorted.end() ) );
    }
}

TEST( ordered_unique_set, iter_covers_all_elements )
{
    auto const s{ insert_all( {}, { 4, 1, 3 } ) };
    std::vector<int> seen( s.begin(), s.end() );
    std::ranges::sort( seen );
    EXPECT_EQ( seen, ( std::vector<int>{ 1, 3, 4 } ) );
    EXPECT_EQ( s.iter().size(), 3 );
}

TEST( ordered_unique_set, sorted_vector_round_trip )
{
    for ( int const count : { 0, 1, 8, 9, 50 } )
    {
        std::vector<int> values( static_cast<std::size_t>( count ) );
        std::iota( values.begin(), values.end(), -3 );
        EXPECT_EQ( int_set::from_sorted_vector( values ).to_sorted_vector(), values );
    }
}

TEST( ordered_unique_set, from_sorted_representation )
{
    EXPECT_EQ( int_set::from_sorted_vector( {} ).representation(), representation::empty );
    EXPECT_EQ( iota_set( 0, 8 ).representation(), representation::small );
    EXPECT_EQ( iota_set( 0, 9 ).representation(), representation::large );
}

TEST( ordered_unique_set, from_sorted_range_matches_insert_fold )
{
    for ( int const count : { 0, 3, 8, 9, 25 } )
    {
        std::list<int> values( static_cast<std::size_t>( count ) );
        std::iota( values.begin(), values.end(), 100 );

        auto const bulk{ int_set::from_sorted_range( values ) };
        int_set folded;
        for ( int const value : values )
            folded = folded.insert( value );

        EXPECT_EQ( bulk, folded );
        EXPECT_EQ( bulk.representation(), folded.representation() );
    }
}

TEST( ordered_unique_set, from_sorted_input_ranges )
{
    auto const from_view{ int_set::from_sorted_range( std::views::iota( 0, 12 ) ) };
    EXPECT_EQ( from_view.size(), 12 );
    EXPECT_EQ( from_view, iota_set( 0, 12 ) );

    std::istringstream input{ "1 2 3 5 8 13 21 34 55 89" };
    auto const streamed{ int_set::from_sorted( std::istream_iterator<int>{ input }, std::istream_iterator<int>{} ) };
    EXPECT_EQ( streamed.size(), 10 );
    EXPECT_EQ( streamed.representation(), representation::large );
    EXPECT_TRUE( streamed.contains( 34 ) );
}

//==============================================================================
// Set algebra
//==============================================================================

TEST( ordered_unique_set, merge )
{
    auto const a{ insert_all( {}, { 1, 3, 5 } ) };
    auto const b{ insert_all( {}, { 2, 3, 4 } ) };
    EXPECT_EQ( a.merge( b ).to_sorted_vector(), ( std::vector<int>{ 1, 2, 3, 4, 5 } ) );
    EXPECT_EQ( a.merge( b ), b.merge( a ) );
    EXPECT_EQ( a.merge( a ), a );
}

TEST( ordered_unique_set, merge_promotes_and_shares_on_empty )
{
    auto const low { iota_set( 0, 6 ) };
    auto const high{ iota_set( 6, 6 ) };
    auto const all { low.merge( high ) };
    EXPECT_EQ( all.representation(), representation::large );
    EXPECT_EQ( all, iota_set( 0, 12 ) );

    auto const same{ all.merge( int_set{} ) };
    EXPECT_TRUE( same.shares_buffer_with( all ) );
    EXPECT_TRUE( int_set{}.merge( all ).shares_buffer_with( all ) );
}

TEST( ordered_unique_set, difference )
{
    auto const a{ insert_all( {}, { 1, 2, 3, 4, 5 } ) };
    auto const b{ insert_all( {}, { 3, 4, 5, 6, 7 } ) };
    EXPECT_EQ( a.difference( b ).to_sorted_vector(), ( std::vector<int>{ 1, 2 } ) );
    EXPECT_TRUE( a.difference( a ).empty() );
    EXPECT_EQ( a.difference( int_set{} ), a );
    EXPECT_TRUE( int_set{}.difference( a ).empty() );

    auto const large{ iota_set( 0, 20 ) };
    auto const small{ large.difference( iota_set( 5, 15 ) ) };
    EXPECT_EQ( small.representation(), representation::small );
    EXPECT_EQ( small.to_sorted_vector(), ( std::vector<int>{ 0, 1, 2, 3, 4 } ) );
}

TEST( ordered_unique_set, intersection )
{
    auto const a{ insert_all( {}, { 1, 2, 3, 4, 5 } ) };
    auto const b{ insert_all( {}, { 3, 4, 5, 6, 7 } ) };
    EXPECT_EQ( a.intersection( b ).to_sorted_vector(), ( std::vector<int>{ 3, 4, 5 } ) );
    EXPECT_EQ( a.intersection( b ), b.intersection( a ) );
    EXPECT_TRUE( a.intersection( int_set{} ).empty() );
    EXPECT_TRUE( int_set{}.intersection( a ).empty() );
}

TEST( ordered_unique_set, union_intersection_cardinality )
{
    auto const a{ iota_set( 0, 30 ) };
    auto const b{ insert_all( {}, { 2, 17, 29, 30, 31, 99 } ) };
    EXPECT_EQ( a.merge( b ).size() + a.intersection( b ).size(), a.size() + b.size() );
}

//==============================================================================
// Structural sharing
//==============================================================================

TEST( ordered_unique_set, copy_shares_large_buffer )
{
    auto const original{ iota_set( 0, 16 ) };
    auto const copy{ original };
    EXPECT_TRUE( copy.shares_buffer_with( original ) );
    EXPECT_EQ( copy.begin(), original.begin() );
}

TEST( ordered_unique_set, noop_modifications_share )
{
    auto const original{ iota_set( 0, 16 ) };
    EXPECT_TRUE( original.insert( 3   ).shares_buffer_with( original ) );
    EXPECT_TRUE( original.remove( 100 ).shares_buffer_with( original ) );
}

TEST( ordered_unique_set, changing_modifications_rebuild )
{
    auto const original{ iota_set( 0, 16 ) };
    auto const inserted{ original.insert( 100 ) };
    auto const removed { original.remove( 3 ) };
    EXPECT_FALSE( inserted.shares_buffer_with( original ) );
    EXPECT_FALSE( removed .shares_buffer_with( original ) );

    EXPECT_EQ( original, iota_set( 0, 16 ) );
    EXPECT_FALSE( original.contains( 100 ) );
    EXPECT_TRUE ( original.contains( 3 ) );
}

TEST( ordered_unique_set, small_values_never_share )
{
    auto const small{ iota_set( 0, 4 ) };
    auto const copy { small };
    EXPECT_FALSE( copy.shares_buffer_with( small ) );
    EXPECT_NE( copy.begin(), small.begin() );
}

//==============================================================================
// Borrowed keys
//==============================================================================

TEST( ordered_unique_set, string_view_and_c_string_lookup )
{
    string_set small;
    for ( char const * const word : { "kiwi", "apple", "fig" } )
        small = small.insert( word );

    auto large{ small };
    for ( char const * const word : { "lime", "pear", "plum", "date", "lemon", "mango", "cherry" } )
        large = large.insert( word );
    ASSERT_EQ( large.representation(), representation::large );

    for ( string_set const * const s : { &small, &large } )
    {
        EXPECT_TRUE ( s->contains( std::string_view{ "apple" } ) );
        EXPECT_TRUE ( s->contains( "fig" ) );
        char const * const kiwi{ "kiwi" };
        EXPECT_TRUE ( s->contains( kiwi ) );
        EXPECT_FALSE( s->contains( std::string_view{ "banana" } ) );

        auto const removed{ s->remove( std::string_view{ "apple" } ) };
        EXPECT_FALSE( removed.contains( "apple" ) );
        EXPECT_EQ( removed.size(), s->size() - 1 );
        EXPECT_EQ( s->remove( "banana" ).size(), s->size() );
    }
}

TEST( ordered_unique_set, string_literal_keys_on_large )
{
    std::vector<std::string> words;
    for ( char c{ 'a' }; c <= 'l'; ++c )
        words.emplace_back( 1, c );
    auto const large{ string_set::from_sorted_vector( words ) };
    ASSERT_EQ( large.representation(), representation::large );
    ASSERT_EQ( large.size(), 12 );

    EXPECT_TRUE ( large.contains( "c" ) );
    EXPECT_FALSE( large.contains( "zz" ) );

    // erased buffer path (stays large)
    auto const eleven{ large.remove( "c" ) };
    EXPECT_EQ( eleven.representation(), representation::large );
    EXPECT_EQ( eleven.size(), 11 );
    EXPECT_FALSE( eleven.contains( "c" ) );
    EXPECT_TRUE ( large .contains( "c" ) );
    EXPECT_TRUE ( large.remove( "zz" ).shares_buffer_with( large ) );

    // flattening path (threshold + 1 -> small)
    auto const nine{ eleven.remove( "a" ).remove( "b" ) };
    ASSERT_EQ( nine.representation(), representation::large );
    auto const eight{ nine.remove( "l" ) };
    EXPECT_EQ( eight.representation(), representation::small );
    EXPECT_FALSE( eight.contains( "l" ) );
    EXPECT_TRUE ( eight.contains( "k" ) );
    EXPECT_EQ( nine.remove( "zz" ).representation(), representation::large );
}

TEST( ordered_unique_set, key_comp_is_the_ordering )
{
    using descending_set = ordered_unique_set<int, std::greater<>>;
    auto const s{ descending_set{}.insert( 1 ) };
    EXPECT_TRUE ( s.key_comp()( 2, 1 ) );
    EXPECT_FALSE( s.key_comp()( 1, 2 ) );
}

TEST( ordered_unique_set, non_transparent_comparator )
{
    using set = ordered_unique_set<std::string, std::less<std::string>>;
    set s;
    for ( int i{ 0 }; i < 12; ++i )
        s = s.insert( std::string( 1, static_cast<char>( 'a' + i ) ) );
    EXPECT_EQ( s.representation(), representation::large );
    EXPECT_TRUE ( s.contains( std::string{ "c" } ) );
    EXPECT_TRUE ( s.contains( "d" ) );
    EXPECT_FALSE( s.contains( std::string{ "z" } ) );
    EXPECT_EQ( s.remove( std::string{ "a" } ).size(), 11 );
}

TEST( ordered_unique_set, custom_ordering )
{
    using descending_set = ordered_unique_set<int, std::greater<>>;
    descending_set s;
    for ( int i{ 0 }; i < 10; ++i )
        s = s.insert( i );
    EXPECT_EQ( s.to_sorted_vector(), ( std::vector<int>{ 9, 8, 7, 6, 5, 4, 3, 2, 1, 0 } ) );
    EXPECT_EQ( descending_set::from_sorted_vector( { 3, 2, 1 } ).to_sorted_vector(), ( std::vector<int>{ 3, 2, 1 } ) );
}

//==============================================================================
// Contract violations
//==============================================================================

#ifndef NDEBUG
TEST( ordered_unique_set_death, unsorted_bulk_input_asserts )
{
    EXPECT_DEATH( static_cast<void>( int_set::from_sorted_range( std::vector<int>{ 3, 1, 2 } ) ), "strictly increasing" );
    EXPECT_DEATH( static_cast<void>( int_set::from_sorted_vector( { 1, 2, 2 } ) ), "strictly increasing" );
    EXPECT_DEATH( static_cast<void>( int_set::from_sorted_vector( { 9, 1, 2, 3, 4, 5, 6, 7, 8, 10 } ) ), "strictly increasing" );
}
#endif

TEST( ordered_unique_set, hardened_policy_throws )
{
    EXPECT_THROW( static_cast<void>( hardened_set::from_sorted_range( std::vector<int>{ 3, 1, 2 } ) ), std::invalid_argument );
    EXPECT_THROW( static_cast<void>( hardened_set::from_sorted_vector( { 1, 2, 2 } ) ), std::invalid_argument );
    EXPECT_THROW( static_cast<void>( hardened_set::from_sorted_range( std::vector<int>{ 0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 9 } ) ), std::invalid_argument );

    auto const valid{ hardened_set::from_sorted_range( std::vector<int>{ 0, 1, 2, 3, 4, 5, 6, 7, 8, 9 } ) };
    EXPECT_EQ( valid.size(), 10 );
    EXPECT_EQ( valid.representation(), representation::large );
}

TEST( ordered_unique_set, hardened_policy_message )
{
    try
    {
        static_cast<void>( hardened_set::from_sorted_vector( { 2, 1 } ) );
        FAIL() << "expected std::invalid_argument";
    }
    catch ( std::invalid_argument const & error )
    {
        EXPECT_NE( std::string_view{ error.what() }.find( "strictly increasing" ), std::string_view::npos );
    }
}

//==============================================================================
// Misc
//==============================================================================

TEST( ordered_unique_set, debug_rendering )
{
    EXPECT_EQ( render( int_set{} ), "{}" );
    EXPECT_EQ( render( int_set{}.insert( 1 ) ), "{1}" );
    EXPECT_EQ( render( insert_all( {}, { 3, 1, 2 } ) ), "{3, 1, 2}" );
    EXPECT_EQ( render( string_set{}.insert( "a" ).insert( "b" ) ), "{a, b}" );
}

TEST( ordered_unique_set, equality_ignores_insertion_order )
{
    EXPECT_EQ( insert_all( {}, { 1, 2, 3 } ), insert_all( {}, { 3, 2, 1 } ) );
    EXPECT_NE( insert_all( {}, { 1, 2, 3 } ), insert_all( {}, { 1, 2, 4 } ) );
    EXPECT_NE( insert_all( {}, { 1, 2, 3 } ), insert_all( {}, { 1, 2 } ) );
    EXPECT_EQ( int_set{}, int_set{} );
}

TEST( ordered_unique_set, swap_and_move )
{
    auto a{ iota_set( 0, 3 ) };
    auto b{ iota_set( 0, 20 ) };
    swap( a, b );
    EXPECT_EQ( a.size(), 20 );
    EXPECT_EQ( b.size(), 3 );

    auto const moved{ std::move( a ) };
    EXPECT_EQ( moved.size(), 20 );
    EXPECT_EQ( moved.representation(), representation::large );
}

//------------------------------------------------------------------------------
} // namespace psi::persistent
//------------------------------------------------------------------------------
