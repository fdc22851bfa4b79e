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

void collectCountryMirrors(const vector< string >& rows, const string& country,
		vector< CandidateMirror >* mirrors, std::set< string >* seen)
{
	for (const auto& row: rows)
	{
		if (internal::html::extractText(row).find(country) == string::npos)
		{
			continue;
		}
		for (const auto& cell: internal::html::extractElements(row, "td"))
		{
			auto text = internal::html::extractText(cell);
			if (!internal::startsWith(text, "http://") && !internal::startsWith(text, "https://"))
			{
				continue;
			}
			if (seen->insert(http::Uri::normalize(text)).second)
			{
				mirrors->push_back(CandidateMirror(text, DiscoverySource::MirrorList));
			}
		}
	}
}

}

// the third table lists mirrors, one per row, with the country in one of the cells
vector< CandidateMirror > parseLinuxMintMirrorPage(const string& page, const string& country)
{
	auto tables = internal::html::extractElements(page, "table");
	if (tables.size() < 3)
	{
		fatal2(__("unable to find the mirror table in the Linux Mint mirror page"));
	}
	auto rows = internal::html::extractElements(tables[2], "tr");

	auto pageCountry = (country == "United States") ? string("USA") : country;

	vector< CandidateMirror > result;
	std::set< string > seen;
	if (!pageCountry.empty())
	{
		collectCountryMirrors(rows, pageCountry, &result, &seen);
	}
	if (result.size() < 3)
	{
		collectCountryMirrors(rows, "Worldwide", &result, &seen);
	}

	if (result.empty())
	{
		fatal2(__("no mirrors found in the Linux Mint mirror page"));
	}
	return result;
}

vector< CandidateMirror > discoverLinuxMint(const DiscoveryContext& context)
{
	const auto& traits = DistributorTraits::get(Distributor::LinuxMint);
	auto page = internal::fetchPage(context, traits.mirrorListUrl, 3);
	auto result = parseLinuxMintMirrorPage(page, context.country);
	if (context.debugging)
	{
		debug2("discovered %zu Linux Mint mirrors", result.size());
	}
	return result;
}

}
}
