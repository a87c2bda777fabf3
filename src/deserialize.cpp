/*

Copyright (c) 2015-2020, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "bendec/deserialize.hpp"
#include "bendec/record.hpp"
#include "bendec/aux_/utf8.hpp"

namespace bendec {

namespace aux {

	std::string integer_name(bool const is_signed, int const bits)
	{
		std::string ret = bits == 8 ? "an " : "a ";
		ret += std::to_string(bits);
		ret += is_signed ? "-bit signed integer" : "-bit unsigned integer";
		return ret;
	}

	std::string invalid_length(std::size_t const got, std::string const& expected)
	{
		return "invalid length " + std::to_string(got) + ", expected " + expected;
	}

	void field_key::on_bytes(decoder&, string_view const val)
	{
		m_out = val;
	}

	std::string field_key::expecting() const
	{
		return "a field name";
	}
}

	void deserializer<string_view>::decode_from(decoder& d)
	{
		d.decode_bytes(*this);
	}

	void deserializer<string_view>::on_bytes(decoder&, string_view const val)
	{
		m_out = val;
	}

	std::string deserializer<string_view>::expecting() const
	{
		return "a byte string";
	}

	void deserializer<std::string>::on_bytes(decoder& d, string_view const val)
	{
		if (!aux::is_valid_utf8(val))
		{
			d.fail("invalid value: byte string, expected " + expecting());
			return;
		}
		m_out.assign(val.data(), val.size());
	}

	std::string deserializer<std::string>::expecting() const
	{
		return "a string";
	}
}
