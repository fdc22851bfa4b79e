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
#include <clocale>
#include <cstring>
#include <iostream>
using std::cout;
using std::endl;
#include <map>

#include <unistd.h>

#include "common.hpp"
#include "misc.hpp"

void showOwnVersion();
void showHelp(const char*);
int mainEx(int argc, char* argv[], Context& context);

int main(int argc, char* argv[])
{
	setlocale(LC_ALL, "");
	mirrorpilot::messageFd = STDERR_FILENO;

	if (argc > 1)
	{
		if (!strcmp(argv[1], "version") || !strcmp(argv[1], "--version"))
		{
			if (argc > 2)
			{
				warn2(__("the command '%s' doesn't accept arguments"), argv[1]);
			}
			showOwnVersion();
			return 0;
		}
		if (!strcmp(argv[1], "help") || !strcmp(argv[1], "--help") || !strcmp(argv[1], "-h"))
		{
			if (argc > 2)
			{
				warn2(__("the command '%s' doesn't accept arguments"), argv[1]);
			}
			showHelp(argv[0]);
			return 0;
		}
	}
	else
	{
		showHelp(argv[0]);
		return 0;
	}

	Context context;
	installInterruptHandler(context.token);
	return mainEx(argc, argv, context);
}

int mainEx(int argc, char* argv[], Context& context)
{
	try
	{
		for (int i = 1; i < argc; ++i)
		{
			if (!strcmp(argv[i], "--"))
			{
				context.passthrough.assign(argv + i + 1, argv + argc);
				argc = i;
				break;
			}
		}
		auto command = parseCommonOptions(argc, argv, /* in */ *context.getConfig(),
				/* out */ context.unparsed);
		std::function< int (Context&) > handler = getHandler(command);
		try
		{
			return handler(context);
		}
		catch (Exception&)
		{
			if (context.token.isCancelled())
			{
				fatal2(__("interrupted"));
			}
			fatal2(__("error performing the command '%s'"), command);
		}
	}
	catch (Exception&)
	{
		return 1;
	}
	return 255;
}

void showOwnVersion()
{
	#define QUOTED(x) QUOTED_(x)
	#define QUOTED_(x) # x
	cout << "executable: " << QUOTED(MIRRORPILOT_VERSION) << endl;
	#undef QUOTED
	#undef QUOTED_
	cout << "library: " << mirrorpilot::libraryVersion << endl;
}

void showHelp(const char* argv0)
{
	using std::map;
	map< string, string > actionDescriptions = {
		{ "help", __("prints a short help") },
		{ "version", __("prints versions of this program and the underlying library") },
		{ "config-dump", __("prints values of configuration variables") },
		{ "find-current-mirror", __("prints the mirror from the APT sources list") },
		{ "find-best-mirror", __("discovers and ranks mirrors, prints the best one") },
		{ "list-mirrors", __("discovers and ranks mirrors, prints them all") },
		{ "change-mirror", __("switches the sources list to the given mirror and updates") },
		{ "auto-change-mirror", __("switches the sources list to the best mirror and updates") },
		{ "update", __("updates package lists, switching mirrors on failures") },
		{ "check-eol", __("checks whether a release is still supported") },
		{ "releases", __("prints known releases") },
		{ "generate-sources", __("prints a fresh sources list for the given mirror") },
	};

	cout << format2(__("Usage: %s <action> [<parameters>]"), argv0) << endl;
	cout << endl;
	cout << __("Actions:") << endl;
	for (const auto& pair: actionDescriptions)
	{
		cout << "  " << pair.first << ": " << pair.second << endl;
	}
	cout << endl;
	cout << __("Common options:") << endl;
	cout << "  -o <option>=<value>: " << __("sets a configuration option") << endl;
	cout << "  -x, --exclude <pattern>: " << __("excludes mirrors matching the glob pattern") << endl;
	cout << "  -F, --mirror-file <path>: " << __("reads additional candidate mirrors from the file") << endl;
	cout << "  -m, --max <number>: " << __("probes at most that many mirrors") << endl;
	cout << "  -U, --upstream: " << __("uses Ubuntu mirrors on Linux Mint") << endl;
	cout << "  -d, --distributor <name>: " << __("overrides the detected distributor") << endl;
	cout << "  -c, --codename <name>: " << __("overrides the detected release") << endl;
	cout << "  -q, --quiet: " << __("suppresses standard output") << endl;
	cout << "  -v, --verbose: " << __("prints debug messages") << endl;
}
