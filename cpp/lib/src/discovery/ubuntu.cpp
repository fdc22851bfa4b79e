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
#include <set>

#include <mirrorpilot/discovery.hpp>
#include <mirrorpilot/http/uri.hpp>

#include <internal/common.hpp>
#include <internal/html.hpp>
#include <internal/pagefetch.hpp>

namespace mirrorpilot {
namespace discovery {

namespace {

struct LaunchpadStatus
{
	const char* label;
	bool known;
	uint64_t seconds;
};

const LaunchpadStatus launchpadStatuses[] = {
	{ "Up to date", true, 0 },
	{ "One hour behind", true, 3600 },
	{ "Two hours behind", true, 2*3600 },
	{ "Four hours behind", true, 4*3600 },
	{ "Six hours behind", true, 6*3600 },
	{ "One day behind", true, 24*3600 },
	{ "Two days behind", true, 2*24*3600 },
	{ "One week behind", true, 7*24*3600 },
	{ "Unknown", false, 0 },
};

void addLaunchpadRow(vector< CandidateMirror >* mirrors, std::set< string >* seen, const string& row)
{
	for (const auto& link: internal::html::extractLinks(row))
	{
		if (!internal::startsWith(link, "http://") && !internal::startsWith(link, "https://"))
		{
			continue;
		}
		if (http::Uri(link).getHost() == "launchpad.net")
		{
			continue; // the page of the mirror itself
		}
		if (!seen->insert(http::Uri::normalize(link)).second)
		{
			return;
		}

		CandidateMirror mirror(link, DiscoverySource::Launchpad);
		auto text = internal::html::extractText(row);
		for (const auto& status: launchpadStatuses)
		{
			if (text.find(status.label) != string::npos)
			{
				mirror.hasStalenessHint = status.known;
				mirror.stalenessHint = status.seconds;
				break;
			}
		}
		mirrors->push_back(mirror);
		return; // one mirror per row
	}
}

}

vector< CandidateMirror > parseUbuntuMirrorList(const string& text)
{
	vector< CandidateMirror > result;
	std::set< string > seen;
	for (const auto& rawLine: internal::split('\n', text))
	{
		auto line = internal::trim(rawLine);
		if (!internal::startsWith(line, "http://") && !internal::startsWith(line, "https://"))
		{
			continue;
		}
		if (seen.insert(http::Uri::normalize(line)).second)
		{
			result.push_back(CandidateMirror(line, DiscoverySource::MirrorList));
		}
	}
	return result;
}

// the first table groups mirrors by country, a row with a '<th>' names the
// country; without a known country all mirrors are taken
vector< CandidateMirror > parseLaunchpadMirrorPage(const string& page, const string& country)
{
	auto tables = internal::html::extractElements(page, "table");
	if (tables.empty())
	{
		fatal2(__("unable to find the mirror table in the Launchpad mirror page"));
	}

	vector< CandidateMirror > result;
	std::set< string > seen;
	auto rows = internal::html::extractElements(tables[0], "tr");

	bool inCountry = false;
	if (!country.empty())
	{
		for (const auto& row: rows)
		{
			if (inCountry)
			{
				if (internal::html::extractLinks(row).empty())
				{
					break;
				}
				addLaunchpadRow(&result, &seen, row);
			}
			else
			{
				auto headers = internal::html::extractElements(row, "th");
				if (!headers.empty() && internal::html::extractText(headers[0]) == country)
				{
					inCountry = true;
				}
			}
		}
	}
	if (!inCountry)
	{
		for (const auto& row: rows)
		{
			addLaunchpadRow(&result, &seen, row);
		}
	}

	if (result.empty())
	{
		fatal2(__("no mirrors found in the Launchpad mirror page"));
	}
	return result;
}

vector< CandidateMirror > discoverUbuntu(const DiscoveryContext& context)
{
	const auto& traits = DistributorTraits::get(Distributor::Ubuntu);

	vector< CandidateMirror > result;
	try
	{
		// the service is flaky on unstable connections, so more attempts
		result = parseUbuntuMirrorList(internal::fetchPage(context, traits.mirrorListUrl, 5));
	}
	catch (Exception&)
	{
		warn2(__("failed to get the Ubuntu mirror list from '%s'"), traits.mirrorListUrl);
	}

	if (result.size() < 2)
	{
		if (context.debugging)
		{
			debug2("%zu mirrors from the mirror list, asking '%s'", result.size(), traits.fallbackMirrorListUrl);
		}
		vector< CandidateMirror > launchpadMirrors;
		try
		{
			launchpadMirrors = parseLaunchpadMirrorPage(
					internal::fetchPage(context, traits.fallbackMirrorListUrl, 3), context.country);
		}
		catch (Exception&)
		{
			if (result.empty())
			{
				fatal2(__("unable to discover Ubuntu mirrors"));
			}
			warn2(__("failed to get more Ubuntu mirrors from '%s'"), traits.fallbackMirrorListUrl);
		}

		std::set< string > seen;
		for (const auto& mirror: result)
		{
			seen.insert(http::Uri::normalize(mirror.url));
		}
		for (const auto& mirror: launchpadMirrors)
		{
			if (seen.insert(http::Uri::normalize(mirror.url)).second)
			{
				result.push_back(mirror);
			}
		}
	}

	if (context.debugging)
	{
		debug2("discovered %zu Ubuntu mirrors", result.size());
	}
	return result;
}

}
}
