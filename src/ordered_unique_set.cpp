////////////////////////////////////////////////////////////////////////////////
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
#include <psi/persistent/config.hpp>

#include <stdexcept>
//------------------------------------------------------------------------------
namespace psi::persistent
{
//------------------------------------------------------------------------------

namespace detail
{
    void throw_unsorted_input() { throw std::invalid_argument( unsorted_input_message ); }
} // namespace detail

//------------------------------------------------------------------------------
} // namespace psi::persistent
//------------------------------------------------------------------------------
