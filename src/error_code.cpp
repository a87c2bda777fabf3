/*

Copyright (c) 2008-2020, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "bendec/config.hpp"
#include "bendec/error_code.hpp"

#ifndef BOOST_SYSTEM_NOEXCEPT
#define BOOST_SYSTEM_NOEXCEPT noexcept
#endif

namespace bendec {

namespace {

	struct bendec_error_category final : boost::system::error_category
	{
		const char* name() const BOOST_SYSTEM_NOEXCEPT override;
		std::string message(int ev) const override;
		boost::system::error_condition default_error_condition(
			int ev) const BOOST_SYSTEM_NOEXCEPT override
		{ return {ev, *this}; }
	};

	const char* bendec_error_category::name() const BOOST_SYSTEM_NOEXCEPT
	{
		return "bdecode";
	}

	std::string bendec_error_category::message(int ev) const
	{
		static char const* msgs[] =
		{
			"no error",
			"unexpected end of file in bencoded string",
			"expected value (list, dict, int or string) in bencoded string",
			"expected digit in bencoded string",
			"expected 'i' at the start of a bencoded integer",
			"expected 'e' at the end of a bencoded integer",
			"expected colon in bencoded string",
			"expected 'l' at the start of a bencoded list",
			"expected 'e' at the end of a bencoded list",
			"expected 'd' at the start of a bencoded dictionary",
			"expected 'e' at the end of a bencoded dictionary",
			"unexpected trailing characters after bencoded value",
			"disallowed negative zero in bencoded integer",
			"disallowed non-ascii character in bencoded string",
			"disallowed zero-length bencoded string",
			"disallowed negative length of bencoded string",
			"bencoded dictionary keys not lexicographically sorted",
			"integer overflow",
			"bencoded string length exceeds the buffer",
			"bencoded nesting depth exceeded",
			"bencoded buffer too large",
			"bencoded value rejected",
		};
		static_assert(sizeof(msgs) / sizeof(msgs[0]) == errors::error_code_max
			, "every error code needs a message");
		if (ev < 0 || ev >= int(sizeof(msgs)/sizeof(msgs[0])))
			return "Unknown error";
		return msgs[ev];
	}

} // anonymous namespace

	boost::system::error_category& bendec_category()
	{
		static bendec_error_category category;
		return category;
	}

	namespace errors
	{
		error_code make_error_code(error_code_enum e)
		{
			return {e, bendec_category()};
		}
	}

	std::string decode_error::what() const
	{
		if (ec == errors::custom_message && !message.empty()) return message;
		return ec.message();
	}
}
