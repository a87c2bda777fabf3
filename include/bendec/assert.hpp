/*

Copyright (c) 2007-2010, 2013-2020, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef BENDEC_ASSERT_HPP_INCLUDED
#define BENDEC_ASSERT_HPP_INCLUDED

#include "bendec/config.hpp"

// these are for internal invariants and API misuse only. Malformed input is
// always reported through an error_code

#if BENDEC_USE_ASSERTS

#include <cassert>
#define BENDEC_ASSERT_PRECOND(x) assert(x)
#define BENDEC_ASSERT(x) assert(x)

#else // BENDEC_USE_ASSERTS

#define BENDEC_ASSERT_PRECOND(a) do {} BENDEC_WHILE_0
#define BENDEC_ASSERT(a) do {} BENDEC_WHILE_0

#endif // BENDEC_USE_ASSERTS

#endif // BENDEC_ASSERT_HPP_INCLUDED
