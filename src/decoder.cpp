/*

Copyright (c) 2015-2020, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "bendec/decoder.hpp"
#include "bendec/assert.hpp"
#include "bendec/aux_/parse_int.hpp"

#include <algorithm> // for min
#include <cstring> // for memcmp
#include <cstdarg> // for va_list
#include <cstdio> // for vsnprintf

namespace bendec {

namespace {

	// returns true if a sorts strictly before b, comparing raw bytes
	bool key_less(string_view const a, string_view const b)
	{
		std::size_t const min_len = std::min(a.size(), b.size());
		int const cmp = min_len == 0 ? 0 : std::memcmp(a.data(), b.data(), min_len);
		if (cmp != 0) return cmp < 0;
		return a.size() < b.size();
	}

	// consumes ``expected`` if it's the next byte. Otherwise leaves the cursor
	// alone and sets ``ec`` to ``mismatch`` (or unexpected_eof)
	bool consume(aux::cursor& c, char const expected
		, errors::error_code_enum const mismatch, error_code& ec)
	{
		char const t = c.peek(ec);
		if (ec) return false;
		if (t != expected)
		{
			ec = mismatch;
			return false;
		}
		c.advance(ec);
		return !ec;
	}

} // anonymous namespace

	decoder::decoder(span<char const> const buffer, decode_config const& cfg)
		: m_cursor(buffer)
		, m_config(cfg)
	{
		if (buffer.size() > m_config.max_buffer_size)
			fail(errors::buffer_too_large);
	}

	void decoder::decode_any(visitor& v)
	{
		if (failed()) return;

		error_code ec;
		char const t = m_cursor.peek(ec);
		if (ec) return fail(ec);

		switch (t)
		{
			case 'i': decode_int(v); break;
			case 'l': decode_list(v); break;
			case 'd': decode_dict(v); break;
			default:
				if (aux::numeric(t)) decode_bytes(v);
				else fail(errors::syntax);
				break;
		}
	}

	void decoder::decode_int(visitor& v)
	{
		if (failed()) return;

		error_code ec;
		std::int64_t const val = aux::parse_integer_token<std::int64_t>(m_cursor, ec
			, bool(m_config.flags & decode_flags::reject_negative_zero));
		if (ec) return fail(ec);
		v.on_integer(*this, val);
	}

	void decoder::decode_bytes(visitor& v)
	{
		if (failed()) return;

		error_code ec;
		span<char const> const str = aux::parse_byte_string(m_cursor, ec);
		if (ec) return fail(ec);
		m_last_bytes = string_view(str.data(), std::size_t(str.size()));
		v.on_bytes(*this, m_last_bytes);
	}

	void decoder::decode_list(visitor& v)
	{
		if (failed()) return;

		error_code ec;
		if (!consume(m_cursor, 'l', errors::expected_list, ec)) return fail(ec);

		if (!enter_container()) return;
		list_reader list(*this);
		v.on_list(*this, list);
		--m_depth;
		if (failed()) return;

		if (!consume(m_cursor, 'e', errors::expected_list_end, ec)) return fail(ec);
	}

	void decoder::decode_dict(visitor& v)
	{
		if (failed()) return;

		error_code ec;
		if (!consume(m_cursor, 'd', errors::expected_dict, ec)) return fail(ec);

		if (!enter_container()) return;
		dict_reader dict(*this);
		v.on_dict(*this, dict);
		--m_depth;
		if (failed()) return;

		if (!consume(m_cursor, 'e', errors::expected_dict_end, ec)) return fail(ec);
	}

	void decoder::finish()
	{
		if (failed()) return;
		if (!m_cursor.empty()) return fail(errors::trailing_characters);

#ifndef BENDEC_DISABLE_LOGGING
		if (should_log())
			log("decoded %d bytes", offset());
#endif
	}

	void decoder::fail(error_code const& ec)
	{
		BENDEC_ASSERT(ec);
		if (failed()) return;
		m_error.ec = ec;
		m_error.pos = offset();

#ifndef BENDEC_DISABLE_LOGGING
		if (should_log())
			log("decode failed at offset %d (depth %d): %s"
				, m_error.pos, m_depth, ec.message().c_str());
#endif
	}

	void decoder::fail(std::string msg)
	{
		if (failed()) return;
		m_error.message = std::move(msg);
		m_error.ec = errors::custom_message;
		m_error.pos = offset();

#ifndef BENDEC_DISABLE_LOGGING
		if (should_log())
			log("decode failed at offset %d (depth %d): %s"
				, m_error.pos, m_depth, m_error.message.c_str());
#endif
	}

	bool decoder::enter_container()
	{
		if (m_depth >= m_config.max_depth)
		{
			fail(errors::depth_exceeded);
			return false;
		}
		++m_depth;
		return true;
	}

#ifndef BENDEC_DISABLE_LOGGING
	bool decoder::should_log() const
	{
		return m_config.logger != nullptr && m_config.logger->should_log();
	}

	void decoder::log(char const* fmt, ...) const
	{
		char buf[1024];
		va_list v;
		va_start(v, fmt);
		std::vsnprintf(buf, sizeof(buf), fmt, v);
		va_end(v);
		m_config.logger->log("%s", buf);
	}
#endif

	bool list_reader::next_element(visitor& v)
	{
		if (m_decoder.failed()) return false;

		error_code ec;
		char const t = m_decoder.m_cursor.peek(ec);
		if (ec)
		{
			m_decoder.fail(ec);
			return false;
		}
		if (t == 'e') return false;

		v.decode_from(m_decoder);
		return !m_decoder.failed();
	}

	bool dict_reader::next_key(visitor& v)
	{
		// the value for the previous key must be decoded first
		BENDEC_ASSERT_PRECOND(!m_value_pending);
		if (m_decoder.failed()) return false;

		error_code ec;
		char const t = m_decoder.m_cursor.peek(ec);
		if (ec)
		{
			m_decoder.fail(ec);
			return false;
		}
		if (t == 'e') return false;

		bool const check_order = bool(m_decoder.m_config.flags & decode_flags::reject_unsorted_keys);
		if (check_order && !aux::numeric(t))
		{
			m_decoder.fail(errors::syntax);
			return false;
		}

		v.decode_from(m_decoder);
		if (m_decoder.failed()) return false;

		if (check_order)
		{
			// a key starting with a digit can only have been decoded as a
			// byte string
			string_view const key = m_decoder.m_last_bytes;
			if (m_has_prev_key && !key_less(m_prev_key, key))
			{
				m_decoder.fail(errors::non_lexicographical);
				return false;
			}
			m_prev_key = key;
			m_has_prev_key = true;
		}

		m_value_pending = true;
		return true;
	}

	void dict_reader::next_value(visitor& v)
	{
		BENDEC_ASSERT_PRECOND(m_value_pending);
		m_value_pending = false;
		v.decode_from(m_decoder);
	}
}
