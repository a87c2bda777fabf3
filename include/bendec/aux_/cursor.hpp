/*

Copyright (c) 2015-2020, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef BENDEC_CURSOR_HPP_INCLUDED
#define BENDEC_CURSOR_HPP_INCLUDED

#include "bendec/config.hpp"
#include "bendec/span.hpp"
#include "bendec/error_code.hpp"
#include "bendec/assert.hpp"

namespace bendec::aux {

	// the undecoded suffix of the input buffer. Consuming bytes only moves
	// the start of the view forward, the underlying bytes are never copied
	// or modified.
	struct BENDEC_EXTRA_EXPORT cursor
	{
		explicit cursor(span<char const> buf)
			: m_buf(buf)
			, m_start(buf.data())
		{}

		cursor(cursor const&) = delete;
		cursor& operator=(cursor const&) = delete;

		// returns the next byte without consuming it. If the buffer is
		// exhausted, ``ec`` is set to unexpected_eof and 0 is returned
		char peek(error_code& ec) const;

		// like peek(), but also consumes the byte
		char advance(error_code& ec);

		// the next byte. Only valid if the cursor is not empty
		char front() const { return m_buf.front(); }

		// consumes ``n`` bytes and returns them. The caller is responsible for
		// making sure there are at least ``n`` bytes left.
		span<char const> take(std::ptrdiff_t n);

		bool empty() const { return m_buf.empty(); }
		std::ptrdiff_t remaining() const { return m_buf.size(); }

		// the number of bytes consumed so far
		int offset() const { return int(m_buf.data() - m_start); }

		span<char const> rest() const { return m_buf; }

	private:
		span<char const> m_buf;
		char const* m_start;
	};
}

#endif
