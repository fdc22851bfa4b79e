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
#ifndef MIRRORPILOT_UPDATE_COMMAND_SEEN
#define MIRRORPILOT_UPDATE_COMMAND_SEEN

/// @file

#include <functional>

#include <mirrorpilot/fwd.hpp>

namespace mirrorpilot {
namespace update {

struct MIRRORPILOT_API CommandResult
{
	int exitCode; ///< 128 + signal number if killed by a signal
	string output;

	CommandResult();
};

/// runs the package list refresh command
class MIRRORPILOT_API CommandRunner
{
 public:
	virtual ~CommandRunner();
	/**
	 * @param command shell command line
	 * @param arguments appended verbatim, each quoted as a single word
	 * @exception Exception if the command cannot be started
	 */
	virtual CommandResult run(const string& command, const vector< string >& arguments) = 0;
};

/// runs commands through the shell, with standard error merged into the output
class MIRRORPILOT_API ShellCommandRunner: public CommandRunner
{
 public:
	typedef std::function< void (const string&) > LineHandler;
 private:
	LineHandler __line_handler;
 public:
	/**
	 * @param lineHandler if set, is called for each output line as it comes
	 */
	ShellCommandRunner(const LineHandler& lineHandler = LineHandler());
	CommandResult run(const string& command, const vector< string >& arguments);
};

}
}

#endif
