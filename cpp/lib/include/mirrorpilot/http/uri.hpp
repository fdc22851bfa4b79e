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
#ifndef MIRRORPILOT_HTTP_URI_SEEN
#define MIRRORPILOT_HTTP_URI_SEEN

/// @file

#include <mirrorpilot/common.hpp>

namespace mirrorpilot {

namespace internal {

struct UriData;

}

namespace http {

/// uniform resource identifier of a mirror or of a resource on it
class MIRRORPILOT_API Uri
{
	internal::UriData* __data;
 public:
	/// constructor
	/**
	 * @param uri string representation of URI
	 * @exception Exception if there is no scheme in @a uri
	 */
	Uri(const string& uri);
	/// copy constructor
	Uri(const Uri& other);
	/// assignment operator
	Uri& operator=(const Uri& other);
	/// destructor
	virtual ~Uri();

	/// gets protocol name
	string getProtocol() const;
	/// gets host name, without credentials and port
	string getHost() const;
	/// gets the path without protocol specification
	string getOpaque() const;
	/// gets the part after the host, starting with '/' or empty
	string getPath() const;
	operator string() const;

	/// builds a URI of @a relativePath under this one
	/**
	 * Exactly one slash separates the two parts.
	 */
	string join(const string& relativePath) const;

	/// strips trailing slashes, so that "http://a/b/" and "http://a/b" compare equal
	static string normalize(const string& uri);
	/// is @a uri a http, https or ftp URI
	static bool isNetworkUri(const string& uri);
};

}
}

#endif
