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
#include <algorithm>
#include <sstream>

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>

#include <mirrorpilot/cancellation.hpp>
#include <mirrorpilot/discovery.hpp>
#include <mirrorpilot/http/probeclient.hpp>

#include <internal/common.hpp>

namespace mirrorpilot {
namespace discovery {

string parseCountry(const string& json, const string& key)
{
	namespace pt = boost::property_tree;

	pt::ptree tree;
	std::istringstream stream(json);
	try
	{
		pt::read_json(stream, tree);
		return internal::trim(tree.get< string >(key, string()));
	}
	catch (pt::ptree_error&)
	{
		return string();
	}
}

string detectCountry(const DiscoveryContext& context)
{
	// the first service is better, the second one is more permissive on rate limits
	static const pair< const char*, const char* > services[] = {
		{ "https://ipapi.co/json", "country_name" },
		{ "http://ip-api.com/json", "country" },
	};

	for (const auto& service: services)
	{
		if (context.token->isCancelled())
		{
			break;
		}
		auto outcome = context.client->probe(service.first, http::Method::Get,
				std::min(context.timeout, 5u), *context.token);
		if (outcome.type != http::ProbeOutcome::Type::Success)
		{
			if (context.debugging)
			{
				debug2("geolocation through '%s' failed: %s", service.first, outcome.error);
			}
			continue;
		}
		auto country = parseCountry(outcome.body, service.second);
		if (!country.empty())
		{
			if (context.debugging)
			{
				debug2("found the location '%s' by '%s'", country, service.first);
			}
			return country;
		}
	}
	return string();
}

}
}
