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
#ifndef MIRRORPILOT_RELEASE_SEEN
#define MIRRORPILOT_RELEASE_SEEN

/// @file

#include <ctime>

#include <mirrorpilot/distributor.hpp>

namespace mirrorpilot {

/// a release of a distribution
/**
 * Dates are UTC timestamps, @c 0 means the date is not known.
 */
struct MIRRORPILOT_API Release
{
	Distributor distributor;
	string codename; ///< full name, like "Xenial Xerus"
	string series; ///< short lowercase name, like "xenial"
	string version; ///< like "16.04", may be empty
	time_t createdDate;
	time_t releaseDate;
	time_t eolDate;
	time_t extendedEolDate;
	bool isLts;
	string compatibleSeries; ///< Linux Mint: series of the Ubuntu release it is based on

	Release();
	string toString() const;
};

/// answer of an end-of-life check
enum class EolStatus { Supported, EndOfLife, Unknown };

MIRRORPILOT_API const char* getEolStatusString(EolStatus);

}

#endif
