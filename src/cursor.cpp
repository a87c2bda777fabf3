/*

Copyright (c) 2015-2020, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "bendec/aux_/cursor.hpp"
#include "bendec/aux_/parse_int.hpp"

namespace bendec::aux {

	char cursor::peek(error_code& ec) const
	{
		if (m_buf.empty())
		{
			ec = errors::unexpected_eof;
			return 0;
		}
		return m_buf.front();
	}

	char cursor::advance(error_code& ec)
	{
		char const ret = peek(ec);
		if (ec) return ret;
		m_buf = m_buf.subspan(1);
		return ret;
	}

	span<char const> cursor::take(std::ptrdiff_t const n)
	{
		BENDEC_ASSERT(n >= 0);
		BENDEC_ASSERT(n <= m_buf.size());
		span<char const> const ret = m_buf.first(n);
		m_buf = m_buf.subspan(n);
		return ret;
	}

	span<char const> parse_byte_string(cursor& c, error_code& ec)
	{
		std::size_t const len = parse_unsigned<std::size_t>(c, ec);
		if (ec) return {};

		char const colon = c.advance(ec);
		if (ec) return {};
		if (colon != ':')
		{
			ec = errors::expected_colon;
			return {};
		}

		if (len > std::size_t(c.remaining()))
		{
			ec = errors::length_exceeds_buffer;
			return {};
		}
		return c.take(std::ptrdiff_t(len));
	}
}
