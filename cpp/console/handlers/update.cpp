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

#include <mirrorpilot/update/command.hpp>

#include "../handlers.hpp"
#include "../sourceswriter.hpp"

static void printAttemptLog(const update::UpdateResult& result)
{
	cout << endl << __("Update attempts:") << endl;
	for (const auto& attempt: result.attempts)
	{
		cout << format2("  %zu. %s: %s (exit code %d)", attempt.number,
				attempt.mirror.empty() ? string(__("<unknown mirror>")) : attempt.mirror,
				update::getFailureKindString(attempt.kind), attempt.exitCode) << endl;
		if (!attempt.reason.empty())
		{
			cout << "     " << attempt.reason << endl;
		}
	}
}

int smartUpdateWith(Context& context, const vector< string >& extraArguments,
		bool allowMirrorSwitching)
{
	auto& manager = context.getManager();
	SourcesWriter writer(manager, context.getConfig());
	ConsoleMirrorSelector selector(manager, writer);
	update::ShellCommandRunner runner([](const string& line)
	{
		cout << line << endl;
	});

	auto result = manager.smartUpdate(extraArguments, context.getExclusions(), runner, selector,
			allowMirrorSwitching);
	if (!result.succeeded)
	{
		printAttemptLog(result);
		fatal2(__("unable to update package lists: %s"), result.error);
	}
	if (result.attempts.size() > 1)
	{
		info2(__("package lists updated after %zu attempts"), result.attempts.size());
	}
	return 0;
}

int smartUpdate(Context& context)
{
	vector< string > arguments;
	parseOptions(context, {""}, arguments);
	checkNoExtraArguments(arguments);

	return smartUpdateWith(context, context.passthrough, true);
}
