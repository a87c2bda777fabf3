/*

Copyright (c) 2006, 2008-2009, 2013-2020, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef BENDEC_UTF8_HPP_INCLUDED
#define BENDEC_UTF8_HPP_INCLUDED

#include <cstdint>
#include <utility>

#include "bendec/config.hpp"
#include "bendec/string_view.hpp"

namespace bendec::aux {

	// returns the unicode codepoint and the number of bytes of the utf8 sequence
	// that was parsed. The codepoint is -1 if it's invalid
	BENDEC_EXTRA_EXPORT std::pair<std::int32_t, int> parse_utf8_codepoint(string_view str);

	// returns true if the whole string is well-formed UTF-8
	BENDEC_EXTRA_EXPORT bool is_valid_utf8(string_view str);
}

#endif
