////////////////////////////////////////////////////////////////////////////////
/// Ordering helpers shared by the psi::persistent containers.
///
/// Everything the containers derive from a single strict weak ordering goes
/// through Komparator: the less-than test, element equivalence (which for
/// plain operator< based orderings collapses to operator==) and sorting
/// (pdqsort, directly or through element pointers).
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

#include <boost/sort/pdqsort/pdqsort.hpp>

#include <functional>
#include <iterator>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::persistent
{
//------------------------------------------------------------------------------

/// Orderings for which 'neither is less than the other' is the same as
/// operator==. Users may specialize it for their own comparators.
template <typename Compare> bool constexpr equivalence_is_equality                       { false };
template <typename T      > bool constexpr equivalence_is_equality<std::less<T>>         { std::is_arithmetic_v<T> || std::is_pointer_v<T> };
template <>        inline   bool constexpr equivalence_is_equality<std::less<>>          { true };
template <>        inline   bool constexpr equivalence_is_equality<std::greater<>>       { true };
template <>        inline   bool constexpr equivalence_is_equality<std::ranges::less>    { true };
template <>        inline   bool constexpr equivalence_is_equality<std::ranges::greater> { true };


/// Hands a comparator to algorithms that take (and copy) predicates by value:
/// small trivial ones as they are, anything else behind a reference.
template <typename Predicate>
constexpr decltype( auto ) make_trivially_copyable_predicate( Predicate const & predicate ) noexcept
{
    if constexpr ( std::is_trivially_copyable_v<Predicate> && ( sizeof( Predicate ) <= 2 * sizeof( void * ) ) )
        return predicate;
    else
        return [&predicate]( auto const & left, auto const & right ) noexcept( noexcept( predicate( left, right ) ) ) { return predicate( left, right ); };
} // make_trivially_copyable_predicate


/// Empty base optimized holder of the container's Compare.
template <typename Compare>
struct Komparator : Compare
{
    static bool constexpr transparent_comparator{ requires{ typename Compare::is_transparent; } };

    [[ nodiscard ]] constexpr Compare const & comp() const noexcept { return *this; }

    [[ gnu::pure ]] constexpr bool le ( auto const & left, auto const & right ) const noexcept { return comp()( left, right ); }
    [[ gnu::pure ]] constexpr bool geq( auto const & left, auto const & right ) const noexcept { return !le( left, right ); }

    [[ gnu::pure ]] constexpr bool eq( auto const & left, auto const & right ) const noexcept
    {
        if constexpr ( equivalence_is_equality<Compare> && requires{ left == right; } )
            return left == right;
        else
            return !le( left, right ) && !le( right, left );
    }

    template <std::random_access_iterator It>
    constexpr void sort( It const first, It const last ) const
    {
        boost::sort::pdqsort( first, last, make_trivially_copyable_predicate( comp() ) );
    }

    /// Orders a range of element pointers by the pointed-to elements.
    template <std::random_access_iterator It>
    constexpr void sort_indirect( It const first, It const last ) const
    {
        boost::sort::pdqsort( first, last, [this]( auto const & left, auto const & right ) noexcept { return le( *left, *right ); } );
    }
}; // struct Komparator

//------------------------------------------------------------------------------
} // namespace psi::persistent
//------------------------------------------------------------------------------
