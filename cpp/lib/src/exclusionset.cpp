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
#include <fnmatch.h>

#include <algorithm>

#include <mirrorpilot/exclusionset.hpp>
#include <mirrorpilot/http/uri.hpp>

#include <internal/common.hpp>

namespace mirrorpilot {

namespace {

void checkPattern(const string& pattern)
{
	if (pattern.empty())
	{
		fatal2(__("empty exclusion pattern"));
	}
	// fnmatch silently treats an unclosed bracket as a literal
	bool inBracket = false;
	for (size_t i = 0; i < pattern.size(); ++i)
	{
		char c = pattern[i];
		if (c == '\\' && !inBracket)
		{
			++i;
		}
		else if (c == '[' && !inBracket)
		{
			inBracket = true;
			// ']' right after '[' or '[!' is a literal
			if (i+1 < pattern.size() && (pattern[i+1] == '!' || pattern[i+1] == '^'))
			{
				++i;
			}
			if (i+1 < pattern.size() && pattern[i+1] == ']')
			{
				++i;
			}
		}
		else if (c == ']' && inBracket)
		{
			inBracket = false;
		}
	}
	if (inBracket)
	{
		fatal2(__("malformed exclusion pattern '%s': unclosed '['"), pattern);
	}
}

// escapes glob metacharacters
string escapeForGlob(const string& input)
{
	string result;
	for (char c: input)
	{
		if (c == '*' || c == '?' || c == '[' || c == ']' || c == '\\')
		{
			result += '\\';
		}
		result += c;
	}
	return result;
}

}

ExclusionSet::ExclusionSet()
{}

ExclusionSet::ExclusionSet(const vector< string >& patterns)
{
	for (const auto& pattern: patterns)
	{
		add(pattern);
	}
}

void ExclusionSet::add(const string& pattern)
{
	auto trimmed = internal::trim(pattern);
	checkPattern(trimmed);
	if (std::find(__patterns.begin(), __patterns.end(), trimmed) == __patterns.end())
	{
		__patterns.push_back(trimmed);
	}
}

void ExclusionSet::addUrl(const string& url)
{
	add(escapeForGlob(http::Uri::normalize(url)));
}

bool ExclusionSet::matches(const string& url) const
{
	auto normalized = http::Uri::normalize(url);
	auto withSlash = normalized + '/';
	for (const auto& pattern: __patterns)
	{
		if (fnmatch(pattern.c_str(), normalized.c_str(), 0) == 0 ||
				fnmatch(pattern.c_str(), withSlash.c_str(), 0) == 0)
		{
			return true;
		}
	}
	return false;
}

const vector< string >& ExclusionSet::getPatterns() const
{
	return __patterns;
}

bool ExclusionSet::empty() const
{
	return __patterns.empty();
}

}
