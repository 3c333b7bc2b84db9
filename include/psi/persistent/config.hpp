////////////////////////////////////////////////////////////////////////////////
/// Compile-time configuration of psi::persistent containers.
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

#include <cstdint>
//------------------------------------------------------------------------------
namespace psi::persistent
{
//------------------------------------------------------------------------------

/// Element count up to (and including) which ordered_unique_set keeps its
/// elements inline.
inline constexpr std::uint8_t small_threshold{ 8 };

/// How the from_sorted_* bulk constructors treat input that is not strictly
/// increasing.
enum class sorted_input_check : std::uint8_t
{
    debug_assert, // BOOST_ASSERT_MSG: aborts in debug builds, unchecked with NDEBUG
    always_throw  // checked in all builds, throws std::invalid_argument
}; // enum class sorted_input_check

struct ordered_unique_set_options
{
    std::uint8_t       inline_capacity{ small_threshold };
    sorted_input_check sorted_input   { sorted_input_check::debug_assert };
}; // struct ordered_unique_set_options

namespace detail
{
    inline constexpr char const unsorted_input_message[]{ "from_sorted_* requires strictly increasing input (sorted and deduplicated)" };

    [[ noreturn, gnu::cold ]] void throw_unsorted_input();
} // namespace detail

//------------------------------------------------------------------------------
} // namespace psi::persistent
//------------------------------------------------------------------------------
