/*

Copyright (c) 2005-2018, 2020, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef BENDEC_CONFIG_HPP_INCLUDED
#define BENDEC_CONFIG_HPP_INCLUDED

#include <boost/config.hpp>

// backwards compatibility with older versions of boost
#if !defined BOOST_SYMBOL_EXPORT && !defined BOOST_SYMBOL_IMPORT
# if defined _MSC_VER || defined __MINGW32__
#  define BOOST_SYMBOL_EXPORT __declspec(dllexport)
#  define BOOST_SYMBOL_IMPORT __declspec(dllimport)
# elif __GNUC__ >= 4
#  define BOOST_SYMBOL_EXPORT __attribute__((visibility("default")))
#  define BOOST_SYMBOL_IMPORT __attribute__((visibility("default")))
# else
#  define BOOST_SYMBOL_EXPORT
#  define BOOST_SYMBOL_IMPORT
# endif
#endif

#if defined BENDEC_BUILDING_SHARED
# define BENDEC_EXPORT BOOST_SYMBOL_EXPORT
#elif defined BENDEC_LINKING_SHARED
# define BENDEC_EXPORT BOOST_SYMBOL_IMPORT
#endif

// when this is specified, export a bunch of extra
// symbols, mostly for the unit tests to reach
#if defined BENDEC_EXPORT_EXTRA
# if defined BENDEC_BUILDING_SHARED
#  define BENDEC_EXTRA_EXPORT BOOST_SYMBOL_EXPORT
# elif defined BENDEC_LINKING_SHARED
#  define BENDEC_EXTRA_EXPORT BOOST_SYMBOL_IMPORT
# endif
#endif

#ifndef BENDEC_EXPORT
# define BENDEC_EXPORT
#endif

#ifndef BENDEC_EXTRA_EXPORT
# define BENDEC_EXTRA_EXPORT
#endif

#if defined __GNUC__ || defined __clang__
#define BENDEC_FORMAT(fmt, ellipsis) __attribute__((__format__(__printf__, fmt, ellipsis)))
#else
#define BENDEC_FORMAT(fmt, ellipsis)
#endif

#ifndef BENDEC_USE_ASSERTS
#define BENDEC_USE_ASSERTS 0
#endif

#define BENDEC_WHILE_0 while (false)

#endif // BENDEC_CONFIG_HPP_INCLUDED
