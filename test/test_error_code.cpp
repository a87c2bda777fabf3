/*

Copyright (c) 2015-2020, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "test.hpp"
#include "bendec/error_code.hpp"

#include <string>

using namespace bendec;

BENDEC_TEST(category)
{
	TEST_EQUAL(std::string(bendec_category().name()), "bdecode");
	error_code const ec = errors::expected_colon;
	TEST_CHECK(ec.category() == bendec_category());
	TEST_EQUAL(ec.value(), int(errors::expected_colon));
}

BENDEC_TEST(messages)
{
	TEST_EQUAL(error_code(errors::expected_colon).message()
		, "expected colon in bencoded string");
	TEST_EQUAL(error_code(errors::trailing_characters).message()
		, "unexpected trailing characters after bencoded value");
	TEST_EQUAL(error_code(errors::unexpected_eof).message()
		, "unexpected end of file in bencoded string");

	// every error code has a message of its own
	for (int i = 0; i < errors::error_code_max; ++i)
	{
		std::string const msg = error_code(i, bendec_category()).message();
		TEST_CHECK(!msg.empty());
		TEST_NE(msg, "Unknown error");
	}
	TEST_EQUAL(error_code(errors::error_code_max, bendec_category()).message(), "Unknown error");
	TEST_EQUAL(error_code(-1, bendec_category()).message(), "Unknown error");
}

BENDEC_TEST(decode_error_what)
{
	decode_error err;
	TEST_CHECK(!err);

	err.ec = errors::syntax;
	TEST_CHECK(bool(err));
	TEST_EQUAL(err.what(), error_code(errors::syntax).message());

	err.ec = errors::custom_message;
	err.message = "missing field `a`";
	TEST_EQUAL(err.what(), "missing field `a`");

	// without a message, fall back to the generic one
	err.message.clear();
	TEST_EQUAL(err.what(), "bencoded value rejected");

	err.pos = 12;
	err.message = "x";
	err.clear();
	TEST_CHECK(!err);
	TEST_EQUAL(err.pos, 0);
	TEST_CHECK(err.message.empty());
}

BENDEC_TEST(system_error)
{
	try
	{
		throw bendec::system_error(errors::depth_exceeded);
	}
	catch (bendec::system_error const& e)
	{
		TEST_EQUAL(e.code(), error_code(errors::depth_exceeded));
		TEST_CHECK(std::string(e.what()).find("bencoded nesting depth exceeded")
			!= std::string::npos);
	}
}
