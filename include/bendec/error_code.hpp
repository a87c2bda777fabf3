/*

Copyright (c) 2008-2020, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef BENDEC_ERROR_CODE_HPP_INCLUDED
#define BENDEC_ERROR_CODE_HPP_INCLUDED

#include "bendec/config.hpp"

#include <string>

#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

namespace bendec {

	// bendec uses boost.system's ``error_code`` class to represent errors.
	using error_code = boost::system::error_code;
	using system_error = boost::system::system_error;

namespace errors
{
	// error codes for the bendec_category(). They are returned from the
	// decode() functions and can be compared against an error_code
	enum error_code_enum
	{
		// Not an error
		no_error = 0,

		// the input ended in the middle of a value
		unexpected_eof,
		// the next byte does not start an integer, byte string, list or
		// dictionary
		syntax,
		// expected a decimal digit
		expected_integer,
		// an integer token did not start with 'i'
		expected_i,
		// an integer token did not end with 'e'
		expected_e,
		// the length prefix of a byte string was not followed by ':'
		expected_colon,
		// a list did not start with 'l'
		expected_list,
		// a list was not terminated by 'e'
		expected_list_end,
		// a dictionary did not start with 'd'
		expected_dict,
		// a dictionary was not terminated by 'e'
		expected_dict_end,
		// there are bytes left in the buffer after the top level value
		trailing_characters,

		// the following are reserved for stricter validation. Only the ones
		// enabled through decode_flags are ever reported

		// the integer "-0" is not canonical
		negative_zero,
		// disallowed non-ASCII character (reserved)
		non_ascii,
		// disallowed zero-length byte string (reserved)
		zero_length,
		// disallowed negative byte string length (reserved)
		negative_length,
		// dictionary keys are not in ascending byte order
		non_lexicographical,

		// the integer does not fit in the target type
		integer_overflow,
		// a byte string's length prefix reaches past the end of the buffer
		length_exceeds_buffer,
		// lists and dictionaries are nested deeper than the configured limit
		depth_exceeded,
		// the buffer is larger than the configured limit
		buffer_too_large,

		// the visitor rejected the value. decode_error::message has the
		// details
		custom_message,

		// the number of error codes
		error_code_max
	};

	// hidden
	BENDEC_EXPORT error_code make_error_code(error_code_enum e);
}

	// the error category for decoding errors
	BENDEC_EXPORT boost::system::error_category& bendec_category();

	// describes why a decode() call failed. Evaluates to true in a boolean
	// context if there was an error.
	struct BENDEC_EXPORT decode_error
	{
		explicit operator bool() const { return bool(ec); }

		// the message for custom_message errors, or the error_code's message
		// otherwise
		std::string what() const;

		void clear()
		{
			ec.clear();
			pos = 0;
			message.clear();
		}

		error_code ec;

		// the byte offset into the input where decoding stopped
		int pos = 0;

		// only set for errors::custom_message
		std::string message;
	};
}

namespace boost { namespace system {

	template<> struct is_error_code_enum<bendec::errors::error_code_enum>
	{ static const bool value = true; };
} }

#endif // BENDEC_ERROR_CODE_HPP_INCLUDED
