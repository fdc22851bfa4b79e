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
#include <cstdlib>
#include <algorithm>

#include <mirrorpilot/sourceslist.hpp>
#include <mirrorpilot/file.hpp>
#include <mirrorpilot/http/uri.hpp>

#include <internal/common.hpp>
#include <internal/releasedata.hpp>

namespace mirrorpilot {

namespace {

bool isMirrorUri(const string& uri)
{
	static const char* const prefixes[] = {
		"http://", "https://", "ftp://", "mirror://", "mirror+file:/"
	};
	for (auto prefix: prefixes)
	{
		if (internal::startsWith(uri, prefix))
		{
			return true;
		}
	}
	return false;
}

bool isMainEntry(const SourcesList::Entry& entry)
{
	return (entry.type == "deb" || entry.type == "deb-src") && isMirrorUri(entry.uri) &&
			std::find(entry.components.begin(), entry.components.end(), "main") != entry.components.end();
}

}

SourcesList::SourcesList(const string& text, const string& path)
	: __path(path)
{
	for (const auto& lineText: internal::split('\n', text, true))
	{
		Line line;
		line.text = lineText;
		line.isEntry = __parse_entry(lineText, &line.entry);
		__lines.push_back(line);
	}
	// 'split' gives an empty element after the trailing newline
	if (!__lines.empty() && __lines.back().text.empty() && (text.empty() || *text.rbegin() == '\n'))
	{
		__lines.pop_back();
	}
}

SourcesList SourcesList::readFile(const string& path)
{
	RequiredFile file(path, "r");
	string text;
	file.getFile(text);
	return SourcesList(text, path);
}

bool SourcesList::__parse_entry(const string& text, Entry* entry)
{
	auto trimmed = internal::trim(text);
	if (trimmed.empty() || trimmed[0] == '#')
	{
		return false;
	}

	// options are put aside, they may contain spaces
	auto openingPosition = trimmed.find('[');
	if (openingPosition != string::npos)
	{
		auto closingPosition = trimmed.find(']', openingPosition);
		if (closingPosition == string::npos)
		{
			return false;
		}
		entry->options = internal::trim(trimmed.substr(openingPosition + 1,
				closingPosition - openingPosition - 1));
		trimmed.erase(openingPosition, closingPosition - openingPosition + 1);
	}

	auto tokens = internal::splitWords(trimmed);
	if (tokens.size() < 3 || (tokens[0] != "deb" && tokens[0] != "deb-src"))
	{
		return false;
	}
	entry->type = tokens[0];
	entry->uri = tokens[1];
	entry->suite = tokens[2];
	entry->components.assign(tokens.begin() + 3, tokens.end());
	return true;
}

string SourcesList::__compose_entry(const Entry& entry)
{
	auto result = entry.type;
	if (!entry.options.empty())
	{
		result += " [" + entry.options + "]";
	}
	result += ' ';
	result += entry.uri;
	result += ' ';
	result += entry.suite;
	for (const auto& component: entry.components)
	{
		result += ' ';
		result += component;
	}
	return result;
}

vector< SourcesList::Entry > SourcesList::getEntries() const
{
	vector< Entry > result;
	for (const auto& line: __lines)
	{
		if (line.isEntry)
		{
			result.push_back(line.entry);
		}
	}
	return result;
}

string SourcesList::findCurrentMirror() const
{
	for (const auto& line: __lines)
	{
		if (line.isEntry && isMainEntry(line.entry))
		{
			return line.entry.uri;
		}
	}
	fatal2(__("unable to find the current mirror in the sources list '%s'"), __path);
	__builtin_unreachable();
}

string SourcesList::findCodename() const
{
	auto mirror = http::Uri::normalize(findCurrentMirror());
	for (const auto& line: __lines)
	{
		if (line.isEntry && isMainEntry(line.entry) && http::Uri::normalize(line.entry.uri) == mirror)
		{
			auto suite = line.entry.suite;
			auto position = suite.find_first_of("-/");
			if (position != string::npos)
			{
				suite.erase(position);
			}
			return suite;
		}
	}
	fatal2i("the current mirror has no entries");
	__builtin_unreachable();
}

size_t SourcesList::replaceMirror(const vector< string >& oldMirrors, const string& newMirror)
{
	vector< string > normalizedOldMirrors;
	for (const auto& mirror: oldMirrors)
	{
		normalizedOldMirrors.push_back(http::Uri::normalize(mirror));
	}

	size_t count = 0;
	for (auto& line: __lines)
	{
		if (!line.isEntry || line.entry.components.empty())
		{
			continue;
		}
		auto normalizedUri = http::Uri::normalize(line.entry.uri);
		if (std::find(normalizedOldMirrors.begin(), normalizedOldMirrors.end(), normalizedUri) ==
				normalizedOldMirrors.end())
		{
			continue;
		}
		line.entry.uri = newMirror;
		line.text = __compose_entry(line.entry);
		++count;
	}
	return count;
}

string SourcesList::toString() const
{
	string result;
	for (const auto& line: __lines)
	{
		result += line.text;
		result += '\n';
	}
	return result;
}

const string& SourcesList::getPath() const
{
	return __path;
}

namespace {

void checkValues(const vector< string >& values, const vector< string >& validValues,
		const char* what, const char* distributorName)
{
	vector< string > invalidValues;
	for (const auto& value: values)
	{
		if (std::find(validValues.begin(), validValues.end(), value) == validValues.end())
		{
			invalidValues.push_back(value);
		}
	}
	if (!invalidValues.empty())
	{
		fatal2(__("invalid %s %s: %s"), distributorName, what, join(", ", invalidValues));
	}
}

// bullseye moved security updates from 'codename/updates' to 'codename-security'
bool hasOldDebianSecurityLayout(const string& codename)
{
	for (const auto& release: internal::getBundledReleases())
	{
		if (release.distributor == Distributor::Debian && codename == release.series)
		{
			auto version = string(release.version);
			return !version.empty() && atoi(version.c_str()) < 11;
		}
	}
	return false;
}

string getSuiteName(Distributor distributor, const string& codename, const string& suite)
{
	if (suite == "release")
	{
		return codename;
	}
	if (distributor == Distributor::Debian && suite == "security" && hasOldDebianSecurityLayout(codename))
	{
		return codename + "/updates";
	}
	return codename + '-' + suite;
}

}

string generateSourcesList(Distributor distributor, const string& mirror,
		const string& codename, const vector< string >& suites,
		const vector< string >& components, bool enableSources)
{
	const auto& traits = DistributorTraits::get(distributor);
	checkValues(suites, traits.validSuites, __("suites"), traits.displayName);
	checkValues(components, traits.validComponents, __("components"), traits.displayName);
	if (!http::Uri::isNetworkUri(mirror))
	{
		fatal2(__("invalid mirror URL '%s'"), mirror);
	}
	if (internal::trim(codename).empty())
	{
		fatal2(__("empty codename"));
	}

	bool isArchive = traits.hasArchiveTier() &&
			http::Uri::normalize(mirror) == http::Uri::normalize(traits.archiveUrl);

	const char* types[] = { "deb", "deb-src" };
	const size_t typeCount = enableSources ? 2 : 1;

	string result;
	for (const auto& suite: suites)
	{
		for (size_t i = 0; i < typeCount; ++i)
		{
			string suiteMirror = mirror;
			if (!isArchive && suite == "security")
			{
				suiteMirror = traits.securityUrl;
			}
			result += format2("%s %s %s %s\n", types[i], suiteMirror,
					getSuiteName(distributor, codename, suite), join(" ", components));
		}
	}
	return result;
}

}
