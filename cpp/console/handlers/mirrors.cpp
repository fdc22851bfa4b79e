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
#include <iostream>
using std::cout;
using std::endl;

#include <unistd.h>

#include <mirrorpilot/http/uri.hpp>

#include "../handlers.hpp"
#include "../sourceswriter.hpp"

namespace {

string truncateUrl(const string& url, size_t length)
{
	if (url.size() <= length || length <= 3)
	{
		return url;
	}
	return url.substr(0, length - 3) + "...";
}

string getBandwidthString(const MirrorStatus& status)
{
	if (!status.hasBandwidth)
	{
		return __("unknown");
	}
	return humanReadableSizeString((uint64_t)status.bandwidth) + "/s";
}

void printRankingTable(const vector< RankedMirror >& mirrors, size_t urlLength)
{
	cout << format2("%-4s  %-*s  %-10s  %-9s  %-16s  %s", __("Rank"), (int)urlLength,
			__("Mirror URL"), __("Available?"), __("Updating?"), __("Last updated"),
			__("Bandwidth")) << endl;

	vector< string > truncatedUrls;
	for (const auto& mirror: mirrors)
	{
		const auto& url = mirror.candidate.url;
		auto shownUrl = truncateUrl(url, urlLength);
		if (shownUrl != url)
		{
			truncatedUrls.push_back(format2("%zu: %s", mirror.rank, url));
		}
		cout << format2("%-4zu  %-*s  %-10s  %-9s  %-16s  %s", mirror.rank, (int)urlLength,
				shownUrl, MirrorStatus::availabilityString(mirror.status.availability),
				mirror.status.isUpdating ? __("yes") : __("no"),
				mirror.status.staleness.toString(), getBandwidthString(mirror.status)) << endl;
	}
	if (!truncatedUrls.empty())
	{
		cout << endl << __("Full URLs:") << endl;
		for (const auto& line: truncatedUrls)
		{
			cout << "  " << line << endl;
		}
	}
}

// checks the mirror serves the release before anything is changed
void validateMirror(Context& context, const string& url)
{
	if (!http::Uri::isNetworkUri(url))
	{
		fatal2(__("'%s' is not a http, https or ftp URL"), url);
	}
	auto& manager = context.getManager();
	auto ranked = manager.rank({ CandidateMirror(url, DiscoverySource::Manual) }, ExclusionSet());
	if (ranked.empty() || ranked[0].status.availability != Availability::Available)
	{
		fatal2(__("the mirror '%s' doesn't serve the release '%s'"), url, manager.getMirrorCodename());
	}
	if (ranked[0].status.isUpdating)
	{
		warn2(__("the mirror '%s' is being updated right now"), url);
	}
}

}

int findCurrentMirror(Context& context)
{
	vector< string > arguments;
	parseOptions(context, {""}, arguments);
	checkNoExtraArguments(arguments);

	cout << context.getManager().getCurrentMirror() << endl;
	return 0;
}

int findBestMirror(Context& context)
{
	vector< string > arguments;
	parseOptions(context, {""}, arguments);
	checkNoExtraArguments(arguments);

	cout << context.getManager().getBestMirror(context.getExclusions()) << endl;
	return 0;
}

int listMirrors(Context& context)
{
	auto config = context.getConfig();

	vector< string > arguments;
	bpo::options_description options;
	options.add_options()
		("url-char-len,L", bpo::value< size_t >()->default_value(
				config->getInteger("mirrorpilot::console::url-char-len")));
	auto variables = parseOptions(context, options, arguments);
	checkNoExtraArguments(arguments);

	auto mirrors = context.getManager().discoverAndRank(context.getExclusions());
	if (isatty(STDOUT_FILENO))
	{
		printRankingTable(mirrors, variables["url-char-len"].as< size_t >());
	}
	else
	{
		for (const auto& mirror: mirrors)
		{
			if (mirror.status.getTier() < 2)
			{
				cout << mirror.candidate.url << endl;
			}
		}
	}
	if (context.token.isCancelled())
	{
		warn2(__("interrupted, the list is incomplete"));
	}
	return 0;
}

static int installAndUpdate(Context& context, const string& mirror, bool allowMirrorSwitching)
{
	auto& manager = context.getManager();
	SourcesWriter writer(manager, context.getConfig());
	writer.install(manager.prepareSourcesList(mirror));
	writer.clearPackageLists();

	return smartUpdateWith(context, vector< string >(), allowMirrorSwitching);
}

int changeMirror(Context& context)
{
	vector< string > arguments;
	parseOptions(context, {""}, arguments);
	if (arguments.empty())
	{
		fatal2(__("no mirror URL specified"));
	}
	auto url = arguments[0];
	arguments.erase(arguments.begin());
	checkNoExtraArguments(arguments);

	validateMirror(context, url);
	return installAndUpdate(context, url, false);
}

int autoChangeMirror(Context& context)
{
	vector< string > arguments;
	parseOptions(context, {""}, arguments);
	checkNoExtraArguments(arguments);

	auto& manager = context.getManager();
	auto exclusions = context.getExclusions();

	string bestMirror;
	if (manager.isArchiveTierActive())
	{
		bestMirror = manager.getArchiveMirror();
		warn2(__("the release '%s' has reached its end of life, using the archive mirror"),
				manager.getRelease().series);
	}
	else
	{
		bestMirror = manager.getBestMirror(exclusions);
	}

	if (http::Uri::normalize(bestMirror) == http::Uri::normalize(manager.getCurrentMirror()))
	{
		info2(__("the best mirror '%s' is already in use"), bestMirror);
		return 0;
	}
	return installAndUpdate(context, bestMirror, true);
}

int generateSources(Context& context)
{
	vector< string > arguments;
	bpo::options_description options;
	options.add_options()
		("enable-sources", "");
	auto variables = parseOptions(context, options, arguments);
	if (arguments.empty())
	{
		fatal2(__("no mirror URL specified"));
	}
	auto url = arguments[0];
	arguments.erase(arguments.begin());
	checkNoExtraArguments(arguments);

	cout << context.getManager().generateSourcesList(url, variables.count("enable-sources"));
	return 0;
}
