/**************************************************************************
*   Copyright (C) 2010-2014 by Eugene V. Lyubimkin                        *
*                                                                         *
*   This program is free software; you can redistribute it and/or modify  *
*   it under the terms of the GNU General Public License                  *
*   (version 3 or above) as published by the Free Software Foundation.    *
*                                                                         *
*   This program is distributed in the hope that it will be useful,       *
*   but WITHOUT ANY WARRANTY; without even the implied warranty of        *
*   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the         *
*   GNU General Public License for more details.                          *
*                                                                         *
*   You should have received a copy of the GNU GPL                        *
*   along with this program; if not, write to the                         *
*   Free Software Foundation, Inc.,                                       *
*   51 Franklin St, Fifth Floor, Boston, MA 02110-1301, USA               *
**************************************************************************/
#ifndef MIRRORPILOT_COMMON_SEEN
#define MIRRORPILOT_COMMON_SEEN

/// @cond
#define MIRRORPILOT_API __attribute__ ((visibility("default")))
#define MIRRORPILOT_LOCAL __attribute__ ((visibility("hidden")))
/// @endcond

/*! @file */

#include <cstdint>
#include <string>
#include <vector>
#include <memory>
#include <stdexcept>

/** @namespace mirrorpilot */
namespace mirrorpilot {

MIRRORPILOT_API extern const char* const libraryVersion; ///< the version of the mirrorpilot library

using std::vector;
using std::string;

/// general library exception class
/**
 * Any library function may throw this exception.
 */
class MIRRORPILOT_API Exception: public std::runtime_error
{
 public:
	/// constructor
	/**
	 * Creates Exception object with a message @a message.
	 *
	 * @param message human-readable exception description
	 */
	Exception(const char* message)
		: std::runtime_error(message)
	{}
	/// constructor
	/**
	 * @copydoc Exception(const char*)
	 */
	Exception(const string& message)
		: std::runtime_error(message)
	{}
};

using std::pair;

using std::shared_ptr;
using std::unique_ptr;

/// message file descriptor
/**
 * All library error, warning and debug messages will be pointed here.
 * If @a messageFd @c == @c -1, messages will be suppressed. Defaults to @c -1.
 */
MIRRORPILOT_API extern int messageFd;

/// @cond
MIRRORPILOT_API string join(const string& joiner, const vector< string >& parts);
MIRRORPILOT_API string humanReadableSizeString(uint64_t bytes);
MIRRORPILOT_API string humanReadableTimespan(uint64_t seconds);
/// @endcond

/// localizes message
/**
 * @param message input string
 * @return localized message
 */
MIRRORPILOT_API const char* __(const char* message);

} // namespace

#include <mirrorpilot/format2.hpp>

#endif

