////////////////////////////////////////////////////////////////////////////////
/// psi::persistent::ordered_unique_set
///
/// A persistent (immutable) ordered set of unique elements which picks its
/// storage representation from its size:
///   - empty: no storage at all
///   - small: up to options.inline_capacity (8) elements kept inline, in
///     insertion order (linear scan lookup, no heap allocation)
///   - large: a shared, immutable, strictly increasing buffer (binary search
///     lookup, O(1) copies through reference counting).
///
/// 'Modifying' operations are const and return a new value - the original is
/// never touched and any large buffer it references is never written to.
/// Operations that do not change membership return a copy of the original
/// (sharing its buffer).
///
/// Copyright (c) Domagoj Saric.
///
/// Use, modification and distribution is subject to the
/// Boost Software License, Version 1.0.
/// (See accompanying file LICENSE_1_0.txt or copy at
/// http://www.boost.org/LICENSE_1_0.txt)
///
/// For more information, see http://www.boost.org
///
////////////////////////////////////////////////////////////////////////////////
//------------------------------------------------------------------------------
#pragma once

#include "config.hpp"
#include "inline_buffer.hpp"
#include "komparator.hpp"
#include "lookup.hpp"
#include "set_algebra.hpp"
#include "shared_sorted_buffer.hpp"
#include "sorted_range.hpp"

#include <boost/assert.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <ostream>
#include <ranges>
#include <span>
#include <utility>
#include <variant>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::persistent
{
//------------------------------------------------------------------------------

enum class representation : std::uint8_t { empty, small, large };


template <typename T, typename Compare = std::less<>, ordered_unique_set_options options = {}>
class ordered_unique_set
    : private Komparator<Compare>
{
    using Komp = Komparator<Compare>;

    static_assert( options.inline_capacity > 0 );

public:
    using value_type      = T;
    using key_type        = T;
    using key_compare     = Compare;
    using size_type       = std::size_t;
    using difference_type = std::ptrdiff_t;
    using reference       = T const &;
    using const_reference = T const &;
    using const_iterator  = T const *;
    using iterator        = const_iterator;

    using small_buffer = inline_buffer<T, options.inline_capacity>;
    using large_buffer = shared_sorted_buffer<T, Compare>;
    using sorted_view  = sorted_range<T, options.inline_capacity>;

    using Komp::transparent_comparator;

    static size_type constexpr threshold{ options.inline_capacity };

public:
    ordered_unique_set() noexcept = default;
    explicit ordered_unique_set( Compare const & comp ) noexcept : Komp{ comp } {}

    ordered_unique_set( ordered_unique_set const &  ) = default;
    ordered_unique_set( ordered_unique_set       && ) = default;
    ordered_unique_set & operator=( ordered_unique_set const &  ) = default;
    ordered_unique_set & operator=( ordered_unique_set       && ) = default;

    //--------------------------------------------------------------------------
    // Bulk construction from strictly increasing input
    //--------------------------------------------------------------------------

    /// Streams the input: up to threshold elements are gathered inline and
    /// everything is spilled into a single vector on the first element past
    /// it.
    template <std::input_iterator It, std::sentinel_for<It> S>
    [[ nodiscard ]] static ordered_unique_set from_sorted( It first, S const last, Compare const & comp = Compare{} )
    {
        Komp const komparator{ comp };

        small_buffer inline_elements;
        for ( ; ( first != last ) && !inline_elements.full(); ++first )
        {
            auto const & element{ inline_elements.emplace_back( *first ) };
            if ( inline_elements.size() > 1 )
                verify_increasing( inline_elements[ static_cast<typename small_buffer::size_type>( inline_elements.size() - 2 ) ], element, komparator );
        }
        if ( first == last )
        {
            if ( inline_elements.empty() )
                return ordered_unique_set{ komparator, state_type{} };
            return ordered_unique_set{ komparator, std::move( inline_elements ) };
        }

        std::vector<T> elements( inline_elements.begin(), inline_elements.end() );
        if constexpr ( std::forward_iterator<It> && std::sized_sentinel_for<S, It> )
            elements.reserve( elements.size() + static_cast<size_type>( last - first ) );
        for ( ; first != last; ++first )
        {
            auto const & element{ elements.emplace_back( *first ) };
            verify_increasing( elements[ elements.size() - 2 ], element, komparator );
        }
        return ordered_unique_set{ komparator, large_buffer::adopt( std::move( elements ), comp ) };
    }

    template <std::ranges::input_range R>
    [[ nodiscard ]] static ordered_unique_set from_sorted_range( R && range, Compare const & comp = Compare{} )
    {
        return from_sorted( std::ranges::begin( range ), std::ranges::end( range ), comp );
    }

    [[ nodiscard ]] static ordered_unique_set from_sorted_vector( std::vector<T> elements, Compare const & comp = Compare{} )
    {
        Komp const komparator{ comp };
        if constexpr ( options.sorted_input == sorted_input_check::always_throw )
        {
            if ( !detail::is_strictly_increasing( elements.begin(), elements.end(), komparator ) ) [[ unlikely ]]
                detail::throw_unsorted_input();
        }
        else
        {
            BOOST_ASSERT_MSG( detail::is_strictly_increasing( elements.begin(), elements.end(), komparator ), "from_sorted_* requires strictly increasing input (sorted and deduplicated)" );
        }
        return materialize( std::move( elements ), komparator );
    }

    //--------------------------------------------------------------------------
    // Observers
    //--------------------------------------------------------------------------
    [[ nodiscard ]] size_type size() const noexcept
    {
        if ( auto const small{ as_small() } ) return small->size();
        if ( auto const large{ as_large() } ) return large->size();
        return 0;
    }

    [[ nodiscard ]] bool empty() const noexcept { return std::holds_alternative<std::monostate>( state_ ); }

    [[ nodiscard ]] persistent::representation representation() const noexcept { return static_cast<persistent::representation>( state_.index() ); }

    [[ nodiscard ]] Compare key_comp() const noexcept { return this->comp(); }

    /// True if both values are large and reference the same buffer.
    [[ nodiscard ]] bool shares_buffer_with( ordered_unique_set const & other ) const noexcept
    {
        auto const mine  {       as_large() };
        auto const theirs{ other.as_large() };
        return mine && theirs && mine->shares_storage_with( *theirs );
    }

    template <LookupType<transparent_comparator, T> K = T>
    [[ nodiscard ]] bool contains( K const & key ) const noexcept
    {
        if ( auto const small{ as_small() } ) return small->contains( key, key_eq() );
        if ( auto const large{ as_large() } ) return large->contains( key );
        return false;
    }

    //--------------------------------------------------------------------------
    // Iteration
    //--------------------------------------------------------------------------

    /// Storage order: insertion order for small sets, ascending for large ones.
    [[ nodiscard ]] std::span<T const> iter() const noexcept
    {
        if ( auto const small{ as_small() } ) return *small;
        if ( auto const large{ as_large() } ) return large->elements();
        return {};
    }

    [[ nodiscard ]] const_iterator begin() const noexcept { return iter().data(); }
    [[ nodiscard ]] const_iterator end  () const noexcept { auto const elements{ iter() }; return elements.data() + elements.size(); }

    /// Ascending order, regardless of the representation.
    [[ nodiscard ]] sorted_view iter_sorted() const
    {
        if ( auto const small{ as_small() } ) return sorted_view{ *small, komp() };
        if ( auto const large{ as_large() } ) return sorted_view{ large->elements() };
        return {};
    }

    [[ nodiscard ]] std::vector<T> to_sorted_vector() const
    {
        auto const sorted{ iter_sorted() };
        return std::vector<T>( sorted.begin(), sorted.end() );
    }

    //--------------------------------------------------------------------------
    // Persistent 'modifiers'
    //--------------------------------------------------------------------------
    [[ nodiscard ]] ordered_unique_set insert( T value ) const
    {
        if ( auto const small{ as_small() } )
        {
            if ( small->contains( value, key_eq() ) )
                return *this;
            if ( !small->full() )
                return ordered_unique_set{ komp(), small->with_appended( std::move( value ) ) };
            return ordered_unique_set{ komp(), promote( *small, std::move( value ) ) };
        }
        if ( auto const large{ as_large() } )
        {
            if ( auto inserted{ large->inserted( std::move( value ) ) } )
                return ordered_unique_set{ komp(), std::move( *inserted ) };
            return *this;
        }
        small_buffer single;
        single.push_back( std::move( value ) );
        return ordered_unique_set{ komp(), std::move( single ) };
    }

    template <LookupType<transparent_comparator, T> K = T>
    [[ nodiscard ]] ordered_unique_set remove( K const & key ) const
    {
        if ( auto const small{ as_small() } )
        {
            auto const pos{ small->find( key, key_eq() ) };
            if ( pos == small->end() )
                return *this;
            if ( small->size() == 1 )
                return ordered_unique_set{ komp(), state_type{} };
            return ordered_unique_set{ komp(), small->without( small->index_of( pos ) ) };
        }
        if ( auto const large{ as_large() } )
        {
            if ( large->size() == threshold + 1 )
            {
                auto const pos{ large->lower_bound_index( key ) };
                if ( !large->key_eq_at( pos, key ) )
                    return *this;
                return ordered_unique_set{ komp(), flatten( *large, pos ) };
            }
            if ( auto erased{ large->erased( key ) } )
                return ordered_unique_set{ komp(), std::move( *erased ) };
            return *this;
        }
        return *this;
    }

    //--------------------------------------------------------------------------
    // Set algebra (linear merges over the sorted views)
    //--------------------------------------------------------------------------
    [[ nodiscard ]] ordered_unique_set merge( ordered_unique_set const & other ) const
    {
        if ( other.empty() ) return *this;
        if (       empty() ) return other;
        auto const left { iter_sorted() };
        auto const right{ other.iter_sorted() };
        std::vector<T> result;
        result.reserve( left.size() + right.size() );
        detail::sorted_union( left.begin(), left.end(), right.begin(), right.end(), std::back_inserter( result ), komp() );
        return materialize( std::move( result ), komp() );
    }

    [[ nodiscard ]] ordered_unique_set difference( ordered_unique_set const & other ) const
    {
        if (       empty() ) return ordered_unique_set{ komp(), state_type{} };
        if ( other.empty() ) return *this;
        auto const left { iter_sorted() };
        auto const right{ other.iter_sorted() };
        std::vector<T> result;
        result.reserve( left.size() );
        detail::sorted_difference( left.begin(), left.end(), right.begin(), right.end(), std::back_inserter( result ), komp() );
        return materialize( std::move( result ), komp() );
    }

    [[ nodiscard ]] ordered_unique_set intersection( ordered_unique_set const & other ) const
    {
        if ( empty() || other.empty() )
            return ordered_unique_set{ komp(), state_type{} };
        auto const left { iter_sorted() };
        auto const right{ other.iter_sorted() };
        std::vector<T> result;
        result.reserve( std::min( left.size(), right.size() ) );
        detail::sorted_intersection( left.begin(), left.end(), right.begin(), right.end(), std::back_inserter( result ), komp() );
        return materialize( std::move( result ), komp() );
    }

    //--------------------------------------------------------------------------
    // Comparison & misc
    //--------------------------------------------------------------------------

    /// Membership equality (independent of the representation and of the
    /// small sets' insertion order).
    [[ nodiscard ]] friend bool operator==( ordered_unique_set const & left, ordered_unique_set const & right )
    {
        if ( left.size() != right.size() )
            return false;
        if ( left.shares_buffer_with( right ) )
            return true;
        return std::ranges::all_of( left.iter(), [&right]( T const & element ) { return right.contains( element ); } );
    }

    friend void swap( ordered_unique_set & left, ordered_unique_set & right ) noexcept
    {
        using std::swap;
        swap( static_cast<Komp &>( left ), static_cast<Komp &>( right ) );
        swap( left.state_, right.state_ );
    }

private:
    using state_type = std::variant<std::monostate, small_buffer, large_buffer>;

    ordered_unique_set( Komp const & komparator, state_type state ) noexcept
        : Komp( komparator ), state_{ std::move( state ) }
    {
        BOOST_ASSERT_MSG( !as_large() || ( as_large()->size() > threshold ), "Large representation with inline-sized content" );
        BOOST_ASSERT( !as_small() || !as_small()->empty() );
    }

    [[ nodiscard ]] Komp const & komp() const noexcept { return *this; }

    [[ nodiscard ]] auto key_eq() const noexcept
    {
        return [&komparator = komp()]( T const & element, auto const & key ) noexcept { return komparator.eq( element, key ); };
    }

    [[ nodiscard ]] small_buffer const * as_small() const noexcept { return std::get_if<small_buffer>( &state_ ); }
    [[ nodiscard ]] large_buffer const * as_large() const noexcept { return std::get_if<large_buffer>( &state_ ); }

    static void verify_increasing( [[ maybe_unused ]] T const & previous, [[ maybe_unused ]] T const & next, [[ maybe_unused ]] Komp const & komparator )
    {
        if constexpr ( options.sorted_input == sorted_input_check::always_throw )
        {
            if ( !komparator.le( previous, next ) ) [[ unlikely ]]
                detail::throw_unsorted_input();
        }
        else
        {
            BOOST_ASSERT_MSG( komparator.le( previous, next ), "from_sorted_* requires strictly increasing input (sorted and deduplicated)" );
        }
    }

    /// Picks the representation for an already verified, strictly increasing
    /// sequence.
    [[ nodiscard ]] static ordered_unique_set materialize( std::vector<T> elements, Komp const & komparator )
    {
        if ( elements.empty() )
            return ordered_unique_set{ komparator, state_type{} };
        if ( elements.size() <= threshold )
            return ordered_unique_set{ komparator, small_buffer( std::make_move_iterator( elements.begin() ), std::make_move_iterator( elements.end() ) ) };
        return ordered_unique_set{ komparator, large_buffer::adopt( std::move( elements ), komparator.comp() ) };
    }

    /// Small (full) + one more distinct element -> large
    [[ nodiscard ]] large_buffer promote( small_buffer const & small, T value ) const
    {
        BOOST_ASSERT( small.full() );
        std::vector<T> elements;
        elements.reserve( small.size() + 1U );
        elements.assign( small.begin(), small.end() );
        elements.push_back( std::move( value ) );
        komp().sort( elements.begin(), elements.end() );
        return large_buffer::adopt( std::move( elements ), this->comp() );
    }

    /// Large (threshold + 1) minus the element at pos -> small
    [[ nodiscard ]] static small_buffer flatten( large_buffer const & large, size_type const pos )
    {
        BOOST_ASSERT( large.size() == threshold + 1 );
        small_buffer result;
        for ( size_type i{ 0 }; i < large.size(); ++i )
        {
            if ( i != pos )
                result.push_back( large[ i ] );
        }
        return result;
    }

    state_type state_;
}; // class ordered_unique_set


/// Debug rendering, in storage order: {}, {3, 1, 2}
template <typename T, typename Compare, ordered_unique_set_options options>
std::ostream & operator<<( std::ostream & os, ordered_unique_set<T, Compare, options> const & set )
{
    os << '{';
    char const * separator{ "" };
    for ( auto const & element : set )
    {
        os << separator << element;
        separator = ", ";
    }
    return os << '}';
}

//------------------------------------------------------------------------------
} // namespace psi::persistent
//------------------------------------------------------------------------------
