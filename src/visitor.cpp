/*

Copyright (c) 2015-2020, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "bendec/visitor.hpp"
#include "bendec/decoder.hpp"

namespace bendec {

	void visitor::decode_from(decoder& d)
	{
		d.decode_any(*this);
	}

	void visitor::on_integer(decoder& d, std::int64_t const val)
	{
		d.fail("invalid type: integer `" + std::to_string(val)
			+ "`, expected " + expecting());
	}

	void visitor::on_bytes(decoder& d, string_view)
	{
		d.fail("invalid type: byte string, expected " + expecting());
	}

	void visitor::on_list(decoder& d, list_reader&)
	{
		d.fail("invalid type: list, expected " + expecting());
	}

	void visitor::on_dict(decoder& d, dict_reader&)
	{
		d.fail("invalid type: dictionary, expected " + expecting());
	}

	void skip_visitor::on_integer(decoder&, std::int64_t) {}
	void skip_visitor::on_bytes(decoder&, string_view) {}

	void skip_visitor::on_list(decoder&, list_reader& list)
	{
		while (list.next_element(*this));
	}

	void skip_visitor::on_dict(decoder&, dict_reader& dict)
	{
		while (dict.next_key(*this))
			dict.next_value(*this);
	}

	std::string skip_visitor::expecting() const
	{
		return "any value";
	}
}
