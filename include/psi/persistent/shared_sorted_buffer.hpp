////////////////////////////////////////////////////////////////////////////////
/// Immutable, strictly increasing element sequence behind a reference counted
/// handle: the large representation of psi::persistent containers.
///
/// Architecture:
///   A published buffer is never written to again - any number of container
///   values may point at it. 'Modifications' (inserted/erased) binary search
///   for the position and build a brand-new sequence (prefix + change +
///   suffix) behind a brand-new handle, returning nullopt when the operation
///   would not change membership (so that the caller can keep sharing the
///   original buffer).
///   Copy-on-write is thus done at the container level: O(n) per changing
///   operation, O(1) for sharing an unchanged snapshot. There is no finer
///   grained (element or chunk level) sharing between buffers.
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
#include "komparator.hpp"
#include "lookup.hpp"

#include <boost/assert.hpp>

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <span>
#include <type_traits>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::persistent
{
//------------------------------------------------------------------------------

namespace detail
{
    // Out-of-line friendly search worker: the key arrives in its lookup_arg_t
    // form and the comparator is kept trivially copyable for std::lower_bound.
    template <typename Key, typename Keys, typename Compare>
    [[ nodiscard, gnu::pure ]] constexpr
    auto lower_bound_iter( Keys const & keys, Compare const & comparator, Key const key ) noexcept
    {
        return std::lower_bound( keys.begin(), keys.end(), key, make_trivially_copyable_predicate( comparator ) );
    }

    template <std::forward_iterator It, typename Komp>
    [[ nodiscard ]] constexpr bool is_strictly_increasing( It const first, It const last, Komp const & komp ) noexcept {
        return std::adjacent_find( first, last, [&komp]( auto const & left, auto const & right ) noexcept { return komp.geq( left, right ); } ) == last;
    }
} // namespace detail


template <typename T, typename Compare = std::less<>>
class shared_sorted_buffer
    : private Komparator<Compare>
{
    using Komp = Komparator<Compare>;

public:
    using value_type      = T;
    using size_type       = std::size_t;
    using difference_type = std::ptrdiff_t;
    using const_reference = T const &;
    using const_iterator  = T const *;
    using iterator        = const_iterator;
    using storage_type    = std::vector<T>;

    using Komp::transparent_comparator;

    //--------------------------------------------------------------------------
    // Construction: only through adopt() (which verifies the sortedness
    // invariant in debug builds).
    //--------------------------------------------------------------------------
    [[ nodiscard ]] static shared_sorted_buffer adopt( storage_type elements, Compare const & comp = Compare{} )
    {
        BOOST_ASSERT_MSG
        (
            detail::is_strictly_increasing( elements.begin(), elements.end(), Komp{ comp } ),
            "from_sorted_* requires strictly increasing input (sorted and deduplicated)"
        );
        return shared_sorted_buffer{ comp, std::make_shared<storage_type const>( std::move( elements ) ) };
    }

    shared_sorted_buffer( shared_sorted_buffer const & ) noexcept = default;
    shared_sorted_buffer( shared_sorted_buffer &&      ) noexcept = default;
    shared_sorted_buffer & operator=( shared_sorted_buffer const & ) noexcept = default;
    shared_sorted_buffer & operator=( shared_sorted_buffer &&      ) noexcept = default;

    //--------------------------------------------------------------------------
    // Observers
    //--------------------------------------------------------------------------
    [[ nodiscard ]] size_type size () const noexcept { return storage_->size();  }
    [[ nodiscard ]] bool      empty() const noexcept { return storage_->empty(); }

    [[ nodiscard ]] T const * data () const noexcept { return storage_->data(); }
    [[ nodiscard ]] const_iterator begin() const noexcept { return data();          }
    [[ nodiscard ]] const_iterator end  () const noexcept { return data() + size(); }

    [[ nodiscard ]] T const & operator[]( size_type const pos ) const noexcept { BOOST_ASSERT( pos < size() ); return data()[ pos ]; }

    [[ nodiscard ]] std::span<T const> elements() const noexcept { return { data(), size() }; }
    operator std::span<T const>() const noexcept { return elements(); }

    /// Structural sharing introspection
    [[ nodiscard ]] bool shares_storage_with( shared_sorted_buffer const & other ) const noexcept { return storage_ == other.storage_; }
    [[ nodiscard ]] long use_count          (                                   ) const noexcept { return storage_.use_count(); }

    //--------------------------------------------------------------------------
    // Lookup
    //--------------------------------------------------------------------------
    template <LookupType<transparent_comparator, T> K = T>
    [[ nodiscard ]] bool contains( K const & key ) const noexcept
    {
        auto const pos{ lower_bound_index( key ) };
        return key_eq_at( pos, key );
    }

    template <typename K>
    [[ nodiscard ]] size_type lower_bound_index( K const & key ) const noexcept
    {
        auto const & keys{ *storage_ };
        return static_cast<size_type>( detail::lower_bound_iter<lookup_arg_t<transparent_comparator, K>>( keys, this->comp(), key ) - keys.begin() );
    }

    template <typename K>
    [[ nodiscard ]] bool key_eq_at( size_type const pos, K const & key ) const noexcept
    {
        return pos < size() && !this->le( key, data()[ pos ] );
    }

    //--------------------------------------------------------------------------
    // Persistent 'modifiers' - nullopt: membership unchanged, keep sharing this
    //--------------------------------------------------------------------------
    [[ nodiscard ]] std::optional<shared_sorted_buffer> inserted( T value ) const
    {
        auto const pos{ lower_bound_index( value ) };
        if ( key_eq_at( pos, value ) )
            return std::nullopt;
        return inserted_at( pos, std::move( value ) );
    }

    template <LookupType<transparent_comparator, T> K = T>
    [[ nodiscard ]] std::optional<shared_sorted_buffer> erased( K const & key ) const
    {
        auto const pos{ lower_bound_index( key ) };
        if ( !key_eq_at( pos, key ) )
            return std::nullopt;
        return erased_at( pos );
    }

    /// A new buffer with value at pos; the caller guarantees that pos is value's
    /// (unoccupied) lower bound.
    [[ nodiscard ]] shared_sorted_buffer inserted_at( size_type const pos, T value ) const
    {
        BOOST_ASSERT( pos <= size() );
        auto const & source{ *storage_ };
        auto const   split { source.begin() + static_cast<difference_type>( pos ) };
        storage_type result;
        result.reserve( source.size() + 1 );
        result.insert( result.end(), source.begin(), split );
        result.emplace_back( std::move( value ) );
        result.insert( result.end(), split, source.end() );
        return adopt( std::move( result ), this->comp() );
    }

    [[ nodiscard ]] shared_sorted_buffer erased_at( size_type const pos ) const
    {
        BOOST_ASSERT_MSG( pos < size(), "erase position out of range" );
        auto const & source{ *storage_ };
        auto const   split { source.begin() + static_cast<difference_type>( pos ) };
        storage_type result;
        result.reserve( source.size() - 1 );
        result.insert( result.end(), source.begin(), split );
        result.insert( result.end(), std::next( split ), source.end() );
        return adopt( std::move( result ), this->comp() );
    }

private:
    shared_sorted_buffer( Compare const & comp, std::shared_ptr<storage_type const> storage ) noexcept
        : Komp{ comp }, storage_{ std::move( storage ) }
    {
        BOOST_ASSERT( storage_ );
    }

    std::shared_ptr<storage_type const> storage_;
}; // class shared_sorted_buffer

//------------------------------------------------------------------------------
} // namespace psi::persistent
//------------------------------------------------------------------------------
