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
#ifndef MIRRORPILOT_EXCLUSIONSET_SEEN
#define MIRRORPILOT_EXCLUSIONSET_SEEN

/// @file

#include <mirrorpilot/common.hpp>

namespace mirrorpilot {

/// ordered set of shell-style glob patterns excluding mirror URLs
/**
 * A pattern matches a URL with or without the trailing slash, so both
 * @c "*.example.com/debian" and @c "*.example.com/debian/" exclude
 * @c "http://ftp.example.com/debian/".
 */
class MIRRORPILOT_API ExclusionSet
{
	vector< string > __patterns;
 public:
	ExclusionSet();
	ExclusionSet(const vector< string >& patterns);

	/// adds a pattern, duplicates are ignored
	/**
	 * @exception Exception if the pattern is empty or malformed
	 */
	void add(const string& pattern);
	/// excludes exactly this URL
	void addUrl(const string& url);
	bool matches(const string& url) const;
	const vector< string >& getPatterns() const;
	bool empty() const;
};

}

#endif
