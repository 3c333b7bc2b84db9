////////////////////////////////////////////////////////////////////////////////
/// Fixed capacity, in-object element buffer: the small representation of
/// psi::persistent containers.
///
/// Elements live directly inside the buffer object (no heap indirection),
/// in a union based array so that the contained values are directly visible
/// in the debugger (no need for special 'visualizers' over type-erased byte
/// arrays). The buffer is unordered: membership operations are linear scans
/// (which, for the handful of elements it is meant for, beat any smarter
/// structure).
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

#include <boost/assert.hpp>
#include <boost/integer.hpp>

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <memory>
#include <span>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::persistent
{
//------------------------------------------------------------------------------

template <typename T, std::uint32_t size>
union [[ clang::trivial_abi ]] noninitialized_array
{
    constexpr  noninitialized_array() noexcept {}
    constexpr ~noninitialized_array() noexcept {}

    T data[ size ];
}; // noninitialized_array

struct assert_on_overflow {
    [[ noreturn ]] void operator()() const noexcept {
        BOOST_ASSERT_MSG( false, "Inline buffer overflow!" );
        std::unreachable();
    }
}; // assert_on_overflow


template <typename T, std::uint32_t maximum_size, auto overflow_handler = assert_on_overflow{}>
class inline_buffer
{
public:
    using value_type      = T;
    using size_type       = typename boost::uint_value_t<maximum_size>::least;
    using difference_type = std::ptrdiff_t;
    using reference       = T const &;
    using const_reference = T const &;
    using iterator        = T const *;
    using const_iterator  = T const *;

    static size_type constexpr static_capacity{ maximum_size };

    static_assert( maximum_size > 0 );

public:
    constexpr inline_buffer() noexcept : size_{ 0 } {}

    template <std::input_iterator It>
    constexpr inline_buffer( It first, It const last ) : size_{ 0 }
    {
        for ( ; first != last; ++first )
            emplace_back( *first );
    }

    constexpr inline_buffer( inline_buffer const & other ) : size_{ 0 }
    {
        std::uninitialized_copy_n( other.data(), other.size(), data() );
        size_ = other.size_;
    }
    constexpr inline_buffer( inline_buffer && other ) noexcept( std::is_nothrow_move_constructible_v<T> ) : size_{ 0 }
    {
        std::uninitialized_move_n( other.data(), other.size(), data() );
        size_ = other.size_;
        other.clear();
    }

    constexpr inline_buffer & operator=( inline_buffer const & other )
    {
        if ( this != &other ) {
            clear();
            std::uninitialized_copy_n( other.data(), other.size(), data() );
            size_ = other.size_;
        }
        return *this;
    }
    constexpr inline_buffer & operator=( inline_buffer && other ) noexcept( std::is_nothrow_move_constructible_v<T> )
    {
        if ( this != &other ) {
            clear();
            std::uninitialized_move_n( other.data(), other.size(), data() );
            size_ = other.size_;
            other.clear();
        }
        return *this;
    }

    constexpr ~inline_buffer() noexcept { std::destroy_n( data(), size_ ); }

    //--------------------------------------------------------------------------
    // Capacity
    //--------------------------------------------------------------------------
    [[ nodiscard, gnu::pure  ]]        constexpr size_type size    () const noexcept { BOOST_ASSERT( size_ <= maximum_size ); return size_; }
    [[ nodiscard, gnu::const ]] static constexpr size_type capacity()       noexcept { return maximum_size; }
    [[ nodiscard, gnu::pure  ]]        constexpr bool      empty   () const noexcept { return size_ == 0; }
    [[ nodiscard, gnu::pure  ]]        constexpr bool      full    () const noexcept { return size_ == maximum_size; }

    //--------------------------------------------------------------------------
    // Element access
    //--------------------------------------------------------------------------
    [[ nodiscard ]] constexpr T       * data()       noexcept { return array_.data; }
    [[ nodiscard ]] constexpr T const * data() const noexcept { return array_.data; }

    [[ nodiscard ]] constexpr const_iterator begin() const noexcept { return data();         }
    [[ nodiscard ]] constexpr const_iterator end  () const noexcept { return data() + size_; }

    [[ nodiscard ]] constexpr T const & operator[]( size_type const pos ) const noexcept { BOOST_ASSERT( pos < size_ ); return data()[ pos ]; }
    [[ nodiscard ]] constexpr T const & front() const noexcept { BOOST_ASSERT( !empty() ); return data()[ 0         ]; }
    [[ nodiscard ]] constexpr T const & back () const noexcept { BOOST_ASSERT( !empty() ); return data()[ size_ - 1 ]; }

    constexpr operator std::span<T const>() const noexcept { return { data(), size_ }; }

    //--------------------------------------------------------------------------
    // Modifiers (only ever applied to buffers not yet shared with a container
    // value)
    //--------------------------------------------------------------------------
    template <typename... Args>
    constexpr T & emplace_back( Args &&... args )
    {
        if ( size_ == maximum_size ) [[ unlikely ]]
            overflow_handler();
        auto & element{ *std::construct_at( data() + size_, std::forward<Args>( args )... ) };
        ++size_;
        return element;
    }

    constexpr void push_back( T const &  value ) { emplace_back(            value   ); }
    constexpr void push_back( T       && value ) { emplace_back( std::move( value ) ); }

    constexpr void erase_at( size_type const pos ) noexcept( std::is_nothrow_move_assignable_v<T> )
    {
        BOOST_ASSERT_MSG( pos < size_, "erase position out of range" );
        std::move( data() + pos + 1, data() + size_, data() + pos );
        std::destroy_at( data() + size_ - 1 );
        --size_;
    }

    constexpr void clear() noexcept
    {
        std::destroy_n( data(), size_ );
        size_ = 0;
    }

    //--------------------------------------------------------------------------
    // Membership (linear scan, borrowed keys via the equality predicate)
    //--------------------------------------------------------------------------
    template <typename K, typename Eq>
    [[ nodiscard ]] constexpr const_iterator find( K const & key, Eq const & eq ) const noexcept
    {
        return std::find_if( begin(), end(), [&]( T const & element ) noexcept { return eq( element, key ); } );
    }

    template <typename K, typename Eq>
    [[ nodiscard ]] constexpr bool contains( K const & key, Eq const & eq ) const noexcept { return find( key, eq ) != end(); }

    [[ nodiscard ]] constexpr size_type index_of( const_iterator const pos ) const noexcept
    {
        BOOST_ASSERT( pos >= begin() && pos <= end() );
        return static_cast<size_type>( pos - begin() );
    }

    //--------------------------------------------------------------------------
    // Persistent (copying) modifiers
    //--------------------------------------------------------------------------

    /// A copy of this buffer with value appended (precondition: !full()).
    [[ nodiscard ]] constexpr inline_buffer with_appended( T value ) const
    {
        inline_buffer result{ *this };
        result.emplace_back( std::move( value ) );
        return result;
    }

    /// A copy of this buffer without the element at pos.
    [[ nodiscard ]] constexpr inline_buffer without( size_type const pos ) const
    {
        inline_buffer result{ *this };
        result.erase_at( pos );
        return result;
    }

private:
    size_type                             size_;
    noninitialized_array<T, maximum_size> array_;
}; // class inline_buffer

//------------------------------------------------------------------------------
} // namespace psi::persistent
//------------------------------------------------------------------------------
