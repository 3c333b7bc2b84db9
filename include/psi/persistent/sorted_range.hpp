////////////////////////////////////////////////////////////////////////////////
/// Ascending view over the elements of a psi::persistent container.
///
/// Two sources:
///   - an already sorted contiguous sequence (the large representation) which
///     is traversed directly (zero cost), and
///   - an unordered inline buffer (the small representation) for which the
///     range sorts an inline buffer of element pointers (no heap allocation).
///
/// The range does not own the elements: it views storage owned by the set it
/// was obtained from, so that set must outlive the range and its iterators
/// (in particular 'for ( x : s.insert( v ).iter_sorted() )' dangles). Iterators
/// of an 'indirect' range additionally point into the range object itself and
/// are invalidated when the range is moved or destroyed.
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

#include "inline_buffer.hpp"

#include <boost/assert.hpp>

#include <compare>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <span>
//------------------------------------------------------------------------------
namespace psi::persistent
{
//------------------------------------------------------------------------------

template <typename T, std::uint32_t inline_capacity>
class sorted_range
{
public:
    class iterator;

    using value_type      = T;
    using size_type       = std::size_t;
    using difference_type = std::ptrdiff_t;
    using reference       = T const &;
    using const_reference = T const &;
    using const_iterator  = iterator;

    constexpr sorted_range() noexcept = default;

    constexpr explicit sorted_range( std::span<T const> const ascending ) noexcept
        : direct_{ ascending }, indirect_{ false } {}

    template <typename Komp>
    constexpr sorted_range( inline_buffer<T, inline_capacity> const & unordered, Komp const & komp )
        : indirect_{ true }
    {
        for ( auto const & element : unordered )
            order_.push_back( &element );
        komp.sort_indirect( order_.data(), order_.data() + order_.size() );
    }

    [[ nodiscard ]] constexpr iterator begin() const noexcept { return indirect_ ? iterator{ order_.begin() } : iterator{ direct_.data() }; }
    [[ nodiscard ]] constexpr iterator end  () const noexcept { return indirect_ ? iterator{ order_.end  () } : iterator{ direct_.data() + direct_.size() }; }

    [[ nodiscard ]] constexpr size_type size () const noexcept { return indirect_ ? order_.size() : direct_.size(); }
    [[ nodiscard ]] constexpr bool      empty() const noexcept { return size() == 0; }

    [[ nodiscard ]] constexpr T const & front() const noexcept { BOOST_ASSERT( !empty() ); return *begin(); }
    [[ nodiscard ]] constexpr T const & back () const noexcept { BOOST_ASSERT( !empty() ); return *( end() - 1 ); }

    [[ nodiscard ]] constexpr T const & operator[]( size_type const pos ) const noexcept { BOOST_ASSERT( pos < size() ); return begin()[ static_cast<difference_type>( pos ) ]; }

private:
    inline_buffer<T const *, inline_capacity> order_;
    std::span<T const>                        direct_;
    bool                                      indirect_{ false };
}; // class sorted_range


////////////////////////////////////////////////////////////////////////////////
// \class sorted_range::iterator
////////////////////////////////////////////////////////////////////////////////

template <typename T, std::uint32_t inline_capacity>
class sorted_range<T, inline_capacity>::iterator
{
public:
    using iterator_concept  = std::random_access_iterator_tag;
    using iterator_category = std::random_access_iterator_tag;
    using value_type        = T;
    using difference_type   = std::ptrdiff_t;
    using reference         = T const &;
    using pointer           = T const *;

    constexpr iterator() noexcept = default;

    constexpr reference operator* () const noexcept { return indirect_ ? **indirect_ : *direct_; }
    constexpr pointer   operator->() const noexcept { return &**this; }
    constexpr reference operator[]( difference_type const n ) const noexcept { return *( *this + n ); }

    constexpr iterator & operator+=( difference_type const n ) noexcept
    {
        if ( indirect_ ) indirect_ += n;
        else             direct_   += n;
        return *this;
    }
    constexpr iterator & operator-=( difference_type const n ) noexcept { return *this += -n; }

    constexpr iterator & operator++(   ) noexcept { return *this += 1; }
    constexpr iterator   operator++(int) noexcept { auto current{ *this }; operator++(); return current; }
    constexpr iterator & operator--(   ) noexcept { return *this -= 1; }
    constexpr iterator   operator--(int) noexcept { auto current{ *this }; operator--(); return current; }

    friend constexpr iterator operator+( iterator it, difference_type const n ) noexcept { return it += n; }
    friend constexpr iterator operator+( difference_type const n, iterator it ) noexcept { return it += n; }
    friend constexpr iterator operator-( iterator it, difference_type const n ) noexcept { return it -= n; }

    friend constexpr difference_type operator-( iterator const & left, iterator const & right ) noexcept
    {
        BOOST_ASSERT( ( left.indirect_ == nullptr ) == ( right.indirect_ == nullptr ) );
        return left.indirect_ ? left.indirect_ - right.indirect_ : left.direct_ - right.direct_;
    }

    friend constexpr bool operator==( iterator const & left, iterator const & right ) noexcept = default;
    friend constexpr std::strong_ordering operator<=>( iterator const & left, iterator const & right ) noexcept { return ( left - right ) <=> 0; }

private: friend class sorted_range;
    constexpr explicit iterator( T const * const * const position ) noexcept : indirect_{ position } {}
    constexpr explicit iterator( T const *         const position ) noexcept : direct_  { position } {}

    T const * const * indirect_{ nullptr };
    T const *         direct_  { nullptr };
}; // class sorted_range::iterator

//------------------------------------------------------------------------------
} // namespace psi::persistent
//------------------------------------------------------------------------------
