/*

Copyright (c) 2014-2015, 2017, 2019-2021, Arvid Norberg
Copyright (c) 2016, Andrei Kurushin
Copyright (c) 2018, 2021, Alden Torres
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "test.hpp"
#include "bendec/aux_/utf8.hpp"

#include <cstdint>

using namespace bendec;

namespace {

void test_parse_utf8(string_view utf8, std::int32_t const expected)
{
	auto const [cp, len] = aux::parse_utf8_codepoint(utf8);
	TEST_EQUAL(len, int(utf8.size()));
	TEST_EQUAL(cp, expected);
}

void parse_error(string_view utf8)
{
	auto const [cp, len] = aux::parse_utf8_codepoint(utf8);
	TEST_EQUAL(cp, -1);
	TEST_CHECK(len >= 1);
	TEST_CHECK(len <= int(utf8.size()));
}

} // anonymous namespace

BENDEC_TEST(parse_utf8)
{
	test_parse_utf8("\x7f", 0x7f);
	test_parse_utf8("\xc3\xb0", 0xf0);
	test_parse_utf8("\xed\x9f\xbf", 0xd7ff);
	test_parse_utf8("\xee\x80\x80", 0xe000);
	test_parse_utf8("\xef\xbf\xbd", 0xfffd);

	// largest possible codepoint
	test_parse_utf8("\xf4\x8f\xbf\xbf", 0x10ffff);
}

BENDEC_TEST(parse_utf8_fail)
{
	// overlong
	parse_error("\xc0\x80");
	parse_error("\xe0\x80\x80");

	// surrogates
	parse_error("\xed\xa0\x80");
	parse_error("\xed\xbf\xbf");

	// beyond the largest codepoint
	parse_error("\xf4\x90\x80\x80");

	// invalid lead bytes
	parse_error("\x80");
	parse_error("\xff");

	// truncated
	parse_error("\xc3");
	parse_error("\xe2\x82");

	// bad continuation byte
	parse_error("\xc3\x28");
}

BENDEC_TEST(is_valid_utf8)
{
	TEST_CHECK(aux::is_valid_utf8(""));
	TEST_CHECK(aux::is_valid_utf8("hello"));
	TEST_CHECK(aux::is_valid_utf8("h\xc3\xa9llo"));
	TEST_CHECK(aux::is_valid_utf8("\xe2\x82\xac 10"));
	TEST_CHECK(aux::is_valid_utf8("\xf0\x9f\x98\x80"));

	TEST_CHECK(!aux::is_valid_utf8("\xff\xfe"));
	TEST_CHECK(!aux::is_valid_utf8("abc\xc3"));
	TEST_CHECK(!aux::is_valid_utf8("\xed\xa0\x80"));
}
