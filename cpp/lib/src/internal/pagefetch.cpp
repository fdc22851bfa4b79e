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
#include <mirrorpilot/cancellation.hpp>
#include <mirrorpilot/http/probeclient.hpp>

#include <internal/pagefetch.hpp>

namespace mirrorpilot {
namespace internal {

string fetchPage(const DiscoveryContext& context, const string& url, size_t attemptCount)
{
	string lastError;
	for (size_t attempt = 1; attempt <= attemptCount; ++attempt)
	{
		if (context.token->isCancelled())
		{
			fatal2(__("fetching '%s' was cancelled"), url);
		}
		if (context.debugging)
		{
			debug2("fetching '%s', attempt %zu", url, attempt);
		}
		auto outcome = context.client->probe(url, http::Method::Get, context.timeout, *context.token);
		if (outcome.type == http::ProbeOutcome::Type::Success)
		{
			if (outcome.truncated)
			{
				// the rest of the list would be lost silently
				fatal2(__("the mirror list '%s' is larger than the limit '%s'"),
						url, "mirrorpilot::probe::max-body-size");
			}
			return outcome.body;
		}
		lastError = outcome.error;
		if (!outcome.isIndeterminate())
		{
			break; // 404 will not go away on retry
		}
	}
	fatal2(__("unable to fetch the mirror list '%s': %s"), url, lastError);
	__builtin_unreachable();
}

}
}
