////////////////////////////////////////////////////////////////////////////////
/// Borrowed-key lookup support for psi::persistent containers.
///
/// Lookups are generic over the key type: a std::string set can be queried
/// with a std::string_view or a char const * without materializing a
/// temporary std::string. Two pieces:
///   - LookupType    concept constraining the accepted key types
///   - lookup_arg_t  the form in which a key is handed down to the search
///                   workers: small trivial keys by value, strings as
///                   string_views (transparent comparators only) and
///                   everything else by const reference.
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

#include <concepts>
#include <string_view>
#include <type_traits>
//------------------------------------------------------------------------------
namespace psi::persistent
{
//------------------------------------------------------------------------------

/// Either the comparator is transparent (declares is_transparent) and orders
/// K against the elements directly, or K converts to the element type (and
/// the comparator converts at each call).
template <typename K, bool transparent_comparator, typename Element>
concept LookupType =
    transparent_comparator ||
    std::convertible_to<K const &, Element const &>;


namespace detail
{
    template <typename K>
    bool constexpr fits_in_registers{ std::is_trivially_copyable_v<K> && ( sizeof( K ) <= 2 * sizeof( void * ) ) };

    template <typename K>
    concept string_like = requires( K const & key ) {
        typename K::traits_type;
        std::basic_string_view<typename K::value_type, typename K::traits_type>{ key };
    };

    template <bool transparent_comparator, typename K>
    struct lookup_arg { using type = K const &; };

    template <bool transparent_comparator, typename K> requires std::is_array_v<K>
    struct lookup_arg<transparent_comparator, K> { using type = std::decay_t<K const>; };

    template <bool transparent_comparator, typename K> requires( !std::is_array_v<K> && fits_in_registers<K> )
    struct lookup_arg<transparent_comparator, K> { using type = K; };

    // a non-transparent comparator only accepts the key (or element) type itself
    template <string_like K> requires( !fits_in_registers<K> )
    struct lookup_arg<true, K> { using type = std::basic_string_view<typename K::value_type, typename K::traits_type>; };
} // namespace detail

template <bool transparent_comparator, typename K>
using lookup_arg_t = typename detail::lookup_arg<transparent_comparator, K>::type;

//------------------------------------------------------------------------------
} // namespace psi::persistent
//------------------------------------------------------------------------------
