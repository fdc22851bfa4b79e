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
#ifndef MIRRORPILOT_SOURCESLIST_SEEN
#define MIRRORPILOT_SOURCESLIST_SEEN

/// @file

#include <mirrorpilot/distributor.hpp>

namespace mirrorpilot {

/// an APT package resource list in the one-line format
/**
 * Lines which are not entries (comments, blank lines) are kept as is.
 */
class MIRRORPILOT_API SourcesList
{
 public:
	/// a @c deb or @c deb-src line
	struct Entry
	{
		string type;
		string options; ///< contents of '[...]', without brackets, empty if none
		string uri;
		string suite;
		vector< string > components;
	};
 private:
	struct Line
	{
		string text;
		bool isEntry;
		Entry entry;
	};
	vector< Line > __lines;
	string __path;

	static bool __parse_entry(const string& text, Entry* entry);
	static string __compose_entry(const Entry&);
 public:
	/**
	 * @param text contents of the list
	 * @param path where the list was read from, for messages only
	 */
	SourcesList(const string& text, const string& path = string());
	/// reads the list from a file
	static SourcesList readFile(const string& path);

	vector< Entry > getEntries() const;

	/// the first @c deb or @c deb-src entry with a network mirror and the 'main' component
	/**
	 * @exception Exception if there is no such entry
	 */
	string findCurrentMirror() const;
	/// the release suite of the entries of the current mirror, without '-updates' and the like
	/**
	 * @exception Exception if there is no such entry
	 */
	string findCodename() const;
	/// replaces mirrors of the entries using any of @a oldMirrors with @a newMirror
	/**
	 * Mirrors are compared normalized. Options of the entries are kept.
	 *
	 * @return number of replaced entries
	 */
	size_t replaceMirror(const vector< string >& oldMirrors, const string& newMirror);

	string toString() const;
	const string& getPath() const;
};

/// generates a resource list for @a distributor
/**
 * @param suites of @ref DistributorTraits::validSuites, 'release' stands for @a codename itself
 * @param components of @ref DistributorTraits::validComponents
 * @param enableSources add @c deb-src entries
 * @exception Exception on invalid suites or components
 */
MIRRORPILOT_API string generateSourcesList(Distributor distributor, const string& mirror,
		const string& codename, const vector< string >& suites,
		const vector< string >& components, bool enableSources);

}

#endif
