/*

Copyright (c) 2014-2020, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef BENDEC_LOGGER_HPP_INCLUDED
#define BENDEC_LOGGER_HPP_INCLUDED

#include "bendec/config.hpp"

namespace bendec {

	// implement this interface and pass it in via decode_config::logger to
	// receive diagnostics from the decoder. Logging can be compiled out by
	// defining BENDEC_DISABLE_LOGGING
	struct BENDEC_EXPORT decode_logger
	{
#ifndef BENDEC_DISABLE_LOGGING
		virtual bool should_log() const = 0;
		virtual void log(char const* fmt, ...) BENDEC_FORMAT(2,3) = 0;
#endif

	protected:
		~decode_logger() = default;
	};
}

#endif // BENDEC_LOGGER_HPP_INCLUDED
