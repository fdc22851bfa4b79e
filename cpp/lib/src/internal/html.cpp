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
#include <cstring>

#include <common/regex.hpp>

#include <internal/common.hpp>
#include <internal/html.hpp>

namespace mirrorpilot {
namespace internal {
namespace html {

namespace {

sregex compileIcase(const string& pattern)
{
	return sregex::compile(pattern, regex_constants::icase);
}

}

vector< string > extractElements(const string& markup, const string& tag)
{
	vector< string > result;

	sregex openingRegex = compileIcase(string("<") + tag + "\\b[^>]*>");
	sregex closingRegex = compileIcase(string("</") + tag + "\\s*>");

	auto current = markup.cbegin();
	const auto end = markup.cend();
	smatch m;
	while (regex_search(current, end, m, openingRegex))
	{
		auto contentBegin = m[0].second;

		auto contentEnd = end;
		auto next = end;
		smatch closing;
		if (regex_search(contentBegin, end, closing, closingRegex))
		{
			contentEnd = closing[0].first;
			next = closing[0].second;
		}
		smatch nextOpening;
		if (regex_search(contentBegin, contentEnd, nextOpening, openingRegex))
		{
			// unclosed element
			contentEnd = nextOpening[0].first;
			next = contentEnd;
		}

		result.push_back(string(contentBegin, contentEnd));
		current = next;
	}
	return result;
}

vector< string > extractLinks(const string& markup)
{
	static const sregex linkRegex = compileIcase(
			"<a\\s[^>]*?\\bhref\\s*=\\s*(?:\"([^\"]*)\"|'([^']*)'|([^\\s>]+))");

	vector< string > result;
	sregex_iterator it(markup.begin(), markup.end(), linkRegex);
	sregex_iterator end;
	for (; it != end; ++it)
	{
		const smatch& m = *it;
		for (size_t group = 1; group <= 3; ++group)
		{
			if (m[group].matched)
			{
				result.push_back(decodeEntities(trim(m[group].str())));
				break;
			}
		}
	}
	return result;
}

string extractText(const string& markup)
{
	static const sregex tagRegex = sregex::compile("<[^>]*>");
	static const sregex whitespaceRegex = sregex::compile("\\s+");

	auto text = regex_replace(markup, tagRegex, string(" "));
	text = decodeEntities(text);
	text = regex_replace(text, whitespaceRegex, string(" "));
	return trim(text);
}

string decodeEntities(const string& input)
{
	static const pair< const char*, const char* > entities[] = {
		{ "&lt;", "<" },
		{ "&gt;", ">" },
		{ "&quot;", "\"" },
		{ "&#39;", "'" },
		{ "&nbsp;", " " },
		{ "&#160;", " " },
	};

	string result = input;
	for (const auto& entity: entities)
	{
		size_t position = 0;
		while ((position = result.find(entity.first, position)) != string::npos)
		{
			result.replace(position, strlen(entity.first), entity.second);
			position += strlen(entity.second);
		}
	}
	// last, so that '&amp;lt;' is decoded to '&lt;'
	size_t position = 0;
	while ((position = result.find("&amp;", position)) != string::npos)
	{
		result.replace(position, 5, "&");
		position += 1;
	}
	return result;
}

}
}
}
