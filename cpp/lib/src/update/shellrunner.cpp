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
#include <sys/wait.h>

#include <mirrorpilot/file.hpp>
#include <mirrorpilot/update/command.hpp>

#include <internal/common.hpp>

namespace mirrorpilot {
namespace update {

CommandResult::CommandResult()
	: exitCode(0)
{}

CommandRunner::~CommandRunner()
{}

ShellCommandRunner::ShellCommandRunner(const LineHandler& lineHandler)
	: __line_handler(lineHandler)
{}

CommandResult ShellCommandRunner::run(const string& command, const vector< string >& arguments)
{
	auto commandLine = command;
	for (const auto& argument: arguments)
	{
		commandLine += ' ';
		commandLine += internal::shellQuote(argument);
	}
	commandLine += " 2>&1";

	string openError;
	File pipe(commandLine, "pr", openError);
	if (!openError.empty())
	{
		fatal2(__("unable to run the command '%s': %s"), commandLine, openError);
	}

	CommandResult result;
	string line;
	while (!pipe.getLine(line).eof())
	{
		if (__line_handler)
		{
			__line_handler(line);
		}
		result.output += line;
		result.output += '\n';
	}

	auto status = pipe.closePipe();
	if (WIFEXITED(status))
	{
		result.exitCode = WEXITSTATUS(status);
	}
	else if (WIFSIGNALED(status))
	{
		result.exitCode = 128 + WTERMSIG(status);
	}
	else
	{
		fatal2(__("the command '%s' ended strangely: %s"), commandLine,
				internal::getWaitStatusDescription(status));
	}
	return result;
}

}
}
