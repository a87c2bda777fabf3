/*

Copyright (c) 2015-2020, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef BENDEC_VISITOR_HPP_INCLUDED
#define BENDEC_VISITOR_HPP_INCLUDED

#include <cstdint>
#include <string>

#include "bendec/config.hpp"
#include "bendec/string_view.hpp"

namespace bendec {

	struct decoder;
	struct list_reader;
	struct dict_reader;

	// a visitor turns the events produced by the decoder into a value of some
	// type. The decoder calls exactly one of the on_ functions for each node
	// it is asked to decode. The default implementations reject the node with
	// an "invalid type" error naming what the visitor expected (see
	// expecting()).
	//
	// Errors are reported by calling decoder::fail() on the decoder passed
	// in. Once the decoder has failed, list_reader and dict_reader stop
	// producing items, so visitors don't need to check after every call.
	struct BENDEC_EXPORT visitor
	{
		// asks the decoder for the shape this visitor wants. The default is
		// decoder::decode_any(), which lets the next byte decide.
		virtual void decode_from(decoder& d);

		virtual void on_integer(decoder& d, std::int64_t val);

		// ``val`` points into the buffer being decoded
		virtual void on_bytes(decoder& d, string_view val);

		virtual void on_list(decoder& d, list_reader& list);
		virtual void on_dict(decoder& d, dict_reader& dict);

		// a short description of the expected value, used in error messages.
		// e.g. "a string"
		virtual std::string expecting() const = 0;

	protected:
		~visitor() = default;
	};

	// accepts any value and discards it. Used to skip unknown dictionary
	// entries
	struct BENDEC_EXPORT skip_visitor final : visitor
	{
		void on_integer(decoder& d, std::int64_t val) override;
		void on_bytes(decoder& d, string_view val) override;
		void on_list(decoder& d, list_reader& list) override;
		void on_dict(decoder& d, dict_reader& dict) override;
		std::string expecting() const override;
	};
}

#endif // BENDEC_VISITOR_HPP_INCLUDED
