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

#include <internal/html.hpp>
#include <internal/pagefetch.hpp>

namespace mirrorpilot {
namespace discovery {

namespace {

void addUnique(vector< CandidateMirror >* mirrors, std::set< string >* seen, const string& url)
{
	if (!http::Uri::isNetworkUri(url))
	{
		return;
	}
	if (seen->insert(http::Uri::normalize(url)).second)
	{
		mirrors->push_back(CandidateMirror(url, DiscoverySource::MirrorList));
	}
}

}

// the first table lists primary mirrors, the second one lists mirrors by
// country: a row with the country name followed by rows with one mirror each
vector< CandidateMirror > parseDebianMirrorPage(const string& page, const string& country)
{
	auto tables = internal::html::extractElements(page, "table");
	if (tables.size() < 2)
	{
		fatal2(__("unable to find the mirror tables in the Debian mirror page"));
	}

	vector< CandidateMirror > result;
	std::set< string > seen;

	if (!country.empty())
	{
		bool inCountry = false;
		for (const auto& row: internal::html::extractElements(tables[1], "tr"))
		{
			auto links = internal::html::extractLinks(row);
			if (inCountry)
			{
				if (links.empty())
				{
					break;
				}
				addUnique(&result, &seen, links[0]);
			}
			else if (internal::html::extractText(row) == country)
			{
				inCountry = true;
			}
		}
	}

	if (result.size() < 3)
	{
		for (const auto& link: internal::html::extractLinks(tables[0]))
		{
			addUnique(&result, &seen, link);
		}
	}
	if (result.empty())
	{
		fatal2(__("no mirrors found in the Debian mirror page"));
	}
	return result;
}

vector< CandidateMirror > discoverDebian(const DiscoveryContext& context)
{
	const auto& traits = DistributorTraits::get(Distributor::Debian);
	auto page = internal::fetchPage(context, traits.mirrorListUrl, 3);
	auto result = parseDebianMirrorPage(page, context.country);
	if (context.debugging)
	{
		debug2("discovered %zu Debian mirrors", result.size());
	}
	return result;
}

}
}
