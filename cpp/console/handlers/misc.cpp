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
#include <ctime>
#include <iostream>
using std::cout;
using std::endl;

#include <mirrorpilot/registry.hpp>

#include "../handlers.hpp"

namespace {

string formatDate(time_t date)
{
	if (!date)
	{
		return "-";
	}
	struct tm brokenDown;
	gmtime_r(&date, &brokenDown);
	char buffer[16];
	strftime(buffer, sizeof(buffer), "%Y-%m-%d", &brokenDown);
	return buffer;
}

unique_ptr< ReleaseRegistry > createRegistry(const Config& config)
{
	return unique_ptr< ReleaseRegistry >(new ReleaseRegistry(
			config.getPath("mirrorpilot::directory::distro-info")));
}

}

int checkEol(Context& context)
{
	auto config = context.getConfig();

	vector< string > arguments;
	parseOptions(context, {""}, arguments);

	auto& manager = context.getManager();
	auto registry = createRegistry(*config);
	Release release;
	if (arguments.empty())
	{
		release = manager.getRelease();
	}
	else
	{
		auto value = arguments[0];
		arguments.erase(arguments.begin());
		checkNoExtraArguments(arguments);

		auto distributorName = config->getString("mirrorpilot::distributor");
		release = distributorName.empty() ? registry->coerceRelease(value) :
				registry->coerceRelease(parseDistributor(distributorName), value);
	}

	auto status = manager.checkEol(release.distributor, release.series);
	cout << format2("%s: %s", release.toString(), getEolStatusString(status)) << endl;

	auto eolDate = registry->getApplicableEolDate(release, manager.getArchitecture());
	if (eolDate)
	{
		cout << format2(__("end of life: %s"), formatDate(eolDate)) << endl;
	}
	return 0;
}

int showReleases(Context& context)
{
	auto config = context.getConfig();

	vector< string > arguments;
	parseOptions(context, {""}, arguments);

	auto registry = createRegistry(*config);
	vector< Release > releases;
	if (arguments.empty())
	{
		releases = registry->getReleases();
	}
	else
	{
		auto distributor = parseDistributor(arguments[0]);
		arguments.erase(arguments.begin());
		checkNoExtraArguments(arguments);
		releases = registry->getReleases(distributor);
	}

	for (const auto& release: releases)
	{
		cout << format2("%-10s %-8s %-12s %-24s %-10s %-10s %s", getDistributorName(release.distributor),
				release.version.empty() ? string("-") : release.version, release.series,
				release.codename, formatDate(release.releaseDate), formatDate(release.eolDate),
				formatDate(release.extendedEolDate)) << endl;
	}
	return 0;
}

int dumpConfig(Context& context)
{
	auto config = context.getConfig();

	vector< string > arguments;
	parseOptions(context, {""}, arguments);
	checkNoExtraArguments(arguments);

	auto outputScalar = [&](const string& name)
	{
		auto value = config->getString(name);
		if (value.empty()) return;
		cout << format2("%s \"%s\";\n", name, value);
	};
	auto outputList = [&](const string& name)
	{
		cout << format2("%s {};\n", name);
		for (const auto& value: config->getList(name))
		{
			cout << format2("%s { \"%s\"; };\n", name, value);
		}
	};

	for (const auto& name: config->getScalarOptionNames())
	{
		outputScalar(name);
	}
	for (const auto& name: config->getListOptionNames())
	{
		outputList(name);
	}

	return 0;
}
