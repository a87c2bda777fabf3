/*

Copyright (c) 2015-2020, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef BENDEC_DECODER_HPP_INCLUDED
#define BENDEC_DECODER_HPP_INCLUDED

#include <cstdint>
#include <string>

#include "bendec/config.hpp"
#include "bendec/error_code.hpp"
#include "bendec/flags.hpp"
#include "bendec/logger.hpp"
#include "bendec/span.hpp"
#include "bendec/string_view.hpp"
#include "bendec/visitor.hpp"
#include "bendec/aux_/cursor.hpp"

/*

This is a single pass, type directed bdecoder. There is no intermediate
tree. The caller supplies a visitor for the value it expects, and the
decoder feeds it the integers, byte strings, lists and dictionaries it finds
in the buffer.

Lists and dictionaries are not decoded up-front. Instead the visitor receives
a list_reader or a dict_reader and pulls the elements (or key-value pairs) one
at a time, each pull recursing back into the decoder. For instance, decoding
``l5:hello5:worlde`` into a vector of strings looks like this:

	decoder::decode_list()       consumes 'l'
	  vector visitor::on_list()
	    list_reader::next_element()   peeks '5', decodes "hello"
	    list_reader::next_element()   peeks '5', decodes "world"
	    list_reader::next_element()   peeks 'e', returns false
	decoder::decode_list()       consumes 'e'

*/

namespace bendec {

	using decode_flags_t = flags::bitfield_flag<std::uint8_t, struct decode_flags_tag>;

namespace decode_flags {

	// fail with negative_zero on ``i-0e``
	constexpr decode_flags_t reject_negative_zero = 0_bit;

	// require dictionary keys to be byte strings in strictly ascending order
	// (compared as raw bytes). Out of order and duplicate keys fail with
	// non_lexicographical, keys that aren't byte strings fail with syntax.
	constexpr decode_flags_t reject_unsorted_keys = 1_bit;

	// all of the canonical-form checks above
	constexpr decode_flags_t strict = reject_negative_zero | reject_unsorted_keys;
}

	// limits and options for a decode() call. The defaults accept anything
	// that is well-formed, the way the format is commonly used in the wild.
	struct BENDEC_EXPORT decode_config
	{
		// the max size of a buffer to decode
		int max_buffer_size = 10000000;

		// the max number of nested lists and dictionaries
		int max_depth = 100;

		decode_flags_t flags{};

		// if set, receives diagnostics about the decode. Must outlive the
		// decode call
		decode_logger* logger = nullptr;
	};

	// the decoding engine. One decoder is used for one buffer, and is passed
	// by reference to every visitor and reader involved in decoding it. It
	// holds the cursor and the first error encountered.
	struct BENDEC_EXPORT decoder
	{
		explicit decoder(span<char const> buffer, decode_config const& cfg = {});

		decoder(decoder const&) = delete;
		decoder& operator=(decoder const&) = delete;

		// decodes the next value, choosing the path by its first byte:
		// 'i' integer, a digit byte string, 'l' list, 'd' dictionary. Any
		// other byte fails with syntax.
		void decode_any(visitor& v);

		// these expect a specific kind of value, and fail if the next value
		// is something else
		void decode_int(visitor& v);
		void decode_bytes(visitor& v);
		void decode_list(visitor& v);
		void decode_dict(visitor& v);

		// to be called when the top level value has been decoded. Fails with
		// trailing_characters if any bytes are left.
		void finish();

		// records an error. Only the first error is kept, subsequent calls are
		// ignored.
		void fail(error_code const& ec);

		// records a custom_message error with the given description
		void fail(std::string msg);

		bool failed() const { return bool(m_error.ec); }
		decode_error const& error() const { return m_error; }

		// the number of bytes consumed so far
		int offset() const { return m_cursor.offset(); }

		// the current nesting level of lists and dictionaries
		int depth() const { return m_depth; }

		decode_flags_t flags() const { return m_config.flags; }

	private:

		friend struct list_reader;
		friend struct dict_reader;

		bool enter_container();

#ifndef BENDEC_DISABLE_LOGGING
		bool should_log() const;
		void log(char const* fmt, ...) const BENDEC_FORMAT(2,3);
#endif

		aux::cursor m_cursor;
		decode_config m_config;
		int m_depth = 0;
		decode_error m_error;

		// the most recent byte string decoded. Used to check the order of
		// dictionary keys
		string_view m_last_bytes;
	};

	// handed to visitor::on_list(). Pulls the elements of a list one at a
	// time.
	struct BENDEC_EXPORT list_reader
	{
		explicit list_reader(decoder& d) : m_decoder(d) {}

		list_reader(list_reader const&) = delete;
		list_reader& operator=(list_reader const&) = delete;

		// if there is another element in the list, decodes it with ``v`` and
		// returns true. Returns false at the end of the list, or if decoding
		// failed. The terminating 'e' is left for the decoder to consume.
		bool next_element(visitor& v);

	private:
		decoder& m_decoder;
	};

	// handed to visitor::on_dict(). Pulls the key-value pairs of a
	// dictionary one at a time. Every successful next_key() must be followed
	// by exactly one next_value().
	struct BENDEC_EXPORT dict_reader
	{
		explicit dict_reader(decoder& d) : m_decoder(d) {}

		dict_reader(dict_reader const&) = delete;
		dict_reader& operator=(dict_reader const&) = delete;

		// if there is another entry in the dictionary, decodes its key with
		// ``v`` and returns true. Returns false at the end of the dictionary,
		// or if decoding failed.
		bool next_key(visitor& v);

		// decodes the value belonging to the key just returned by next_key()
		void next_value(visitor& v);

	private:
		decoder& m_decoder;

		// the previous key, only tracked with reject_unsorted_keys
		string_view m_prev_key;
		bool m_has_prev_key = false;

		bool m_value_pending = false;
	};
}

#endif // BENDEC_DECODER_HPP_INCLUDED
