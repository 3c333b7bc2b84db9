////////////////////////////////////////////////////////////////////////////////
/// Linear time set algebra over strictly increasing sequences.
///
/// Two-pointer walkers: both inputs are traversed once, in lock-step, and the
/// (strictly increasing, duplicate free) result is written to an output
/// iterator. Elements are copied - the inputs are never modified.
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

#include <algorithm>
#include <iterator>
//------------------------------------------------------------------------------
namespace psi::persistent::detail
{
//------------------------------------------------------------------------------

/// left ∪ right: the lesser head is emitted, equal heads once.
template <std::input_iterator It1, std::input_iterator It2, typename Out, typename Komp>
constexpr Out sorted_union( It1 left, It1 const left_end, It2 right, It2 const right_end, Out out, Komp const & komp )
{
    while ( ( left != left_end ) && ( right != right_end ) )
    {
        if ( komp.le( *left, *right ) ) {
            *out = *left;
            ++left;
        } else if ( komp.le( *right, *left ) ) {
            *out = *right;
            ++right;
        } else {
            *out = *left;
            ++left;
            ++right;
        }
        ++out;
    }
    out = std::copy( left , left_end , out );
    return std::copy( right, right_end, out );
}

/// left - right
template <std::input_iterator It1, std::input_iterator It2, typename Out, typename Komp>
constexpr Out sorted_difference( It1 left, It1 const left_end, It2 right, It2 const right_end, Out out, Komp const & komp )
{
    while ( ( left != left_end ) && ( right != right_end ) )
    {
        if ( komp.le( *left, *right ) ) {
            *out = *left;
            ++out;
            ++left;
        } else if ( komp.le( *right, *left ) ) {
            ++right;
        } else {
            ++left;
            ++right;
        }
    }
    return std::copy( left, left_end, out );
}

/// left ∩ right
template <std::input_iterator It1, std::input_iterator It2, typename Out, typename Komp>
constexpr Out sorted_intersection( It1 left, It1 const left_end, It2 right, It2 const right_end, Out out, Komp const & komp )
{
    while ( ( left != left_end ) && ( right != right_end ) )
    {
        if      ( komp.le( *left, *right ) ) ++left;
        else if ( komp.le( *right, *left ) ) ++right;
        else
        {
            *out = *left;
            ++out;
            ++left;
            ++right;
        }
    }
    return out;
}

//------------------------------------------------------------------------------
} // namespace psi::persistent::detail
//------------------------------------------------------------------------------
