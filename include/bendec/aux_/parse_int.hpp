/*

Copyright (c) 2015-2020, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef BENDEC_PARSE_INT_HPP_INCLUDED
#define BENDEC_PARSE_INT_HPP_INCLUDED

#include <limits>
#include <type_traits>

#include "bendec/config.hpp"
#include "bendec/error_code.hpp"
#include "bendec/span.hpp"
#include "bendec/aux_/cursor.hpp"

namespace bendec::aux {

	inline bool numeric(char const c) { return c >= '0' && c <= '9'; }

	// parses a run of decimal digits into ``T``. The first byte must be a
	// digit, otherwise expected_integer is reported. Parsing stops at the
	// first non-digit, which is left in the cursor. Values that cannot be
	// represented by ``T`` fail with integer_overflow.
	template <typename T>
	T parse_unsigned(cursor& c, error_code& ec)
	{
		static_assert(std::is_integral<T>::value && std::is_unsigned<T>::value
			, "parse_unsigned() requires an unsigned type");

		char const first = c.advance(ec);
		if (ec) return 0;
		if (!numeric(first))
		{
			ec = errors::expected_integer;
			return 0;
		}

		T val = T(first - '0');
		while (!c.empty() && numeric(c.front()))
		{
			T const digit = T(c.front() - '0');
			if (val > (std::numeric_limits<T>::max() - digit) / 10)
			{
				ec = errors::integer_overflow;
				return 0;
			}
			val = T(val * 10 + digit);
			c.advance(ec);
		}
		return val;
	}

	// an optional '-' followed by the digits parsed by parse_unsigned(). The
	// magnitude is accumulated unsigned, so the most negative value of ``T``
	// can be represented.
	template <typename T>
	T parse_signed(cursor& c, error_code& ec, bool const reject_negative_zero = false)
	{
		static_assert(std::is_integral<T>::value && std::is_signed<T>::value
			, "parse_signed() requires a signed type");
		using unsigned_type = typename std::make_unsigned<T>::type;

		char const sign = c.peek(ec);
		if (ec) return 0;
		bool const negative = sign == '-';
		if (negative) c.advance(ec);

		unsigned_type const mag = parse_unsigned<unsigned_type>(c, ec);
		if (ec) return 0;

		unsigned_type const limit = unsigned_type(std::numeric_limits<T>::max());
		if (!negative)
		{
			if (mag > limit)
			{
				ec = errors::integer_overflow;
				return 0;
			}
			return T(mag);
		}

		if (mag == 0 && reject_negative_zero)
		{
			ec = errors::negative_zero;
			return 0;
		}
		if (mag > limit + 1)
		{
			ec = errors::integer_overflow;
			return 0;
		}
		if (mag == limit + 1) return std::numeric_limits<T>::min();
		return -T(mag);
	}

	// an integer token: 'i' <signed integer> 'e'
	template <typename T>
	T parse_integer_token(cursor& c, error_code& ec, bool const reject_negative_zero = false)
	{
		char const i = c.advance(ec);
		if (ec) return 0;
		if (i != 'i')
		{
			ec = errors::expected_i;
			return 0;
		}

		T const val = parse_signed<T>(c, ec, reject_negative_zero);
		if (ec) return 0;

		char const e = c.advance(ec);
		if (ec) return 0;
		if (e != 'e')
		{
			ec = errors::expected_e;
			return 0;
		}
		return val;
	}

	// a byte string: <length> ':' <length bytes>. The returned span points
	// into the cursor's buffer.
	BENDEC_EXTRA_EXPORT span<char const> parse_byte_string(cursor& c, error_code& ec);
}

#endif
