/**************************************************************************
*   Copyright (C) 2011 by Eugene V. Lyubimkin                             *
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

#include <mirrorpilot/config.hpp>
#include <mirrorpilot/file.hpp>

#include <internal/logger.hpp>

namespace mirrorpilot {
namespace internal {

const char* Logger::__subsystem_strings[4] = {
	"session", "discovery", "ranking", "update"
};

Logger::Logger(const Config& config)
	: __file(NULL)
{
	__enabled = config.getBool("mirrorpilot::log");
	__debugging = config.getBool("debug::logger");

	if (!__enabled)
	{
		return;
	}

	for (int i = 0; i < 4; ++i)
	{
		__levels[i] = config.getInteger(
				string("mirrorpilot::log::levels::") + __subsystem_strings[i]);
	}

	auto path = config.getPath("mirrorpilot::directory::log");
	string openError;
	__file = new File(path, "a", openError);
	if (!openError.empty())
	{
		// listing mirrors does not need root, so an unwritable log is not fatal
		warn2(__("unable to open the log file '%s': %s, logging is disabled"), path, openError);
		delete __file;
		__file = NULL;
		__enabled = false;
		return;
	}

	log(Subsystem::Session, 1, "started");
}

Logger::~Logger()
{
	if (__enabled)
	{
		log(Subsystem::Session, 1, "finished");
	}
	delete __file;
}

string Logger::__get_log_string(Subsystem subsystem, Level level, const string& message)
{
	char dateTime[10 + 1 + 8 + 1]; // "2011-05-20 12:34:56"
	{
		struct tm tm;
		auto timestamp = time(NULL);
		localtime_r(&timestamp, &tm);
		strftime(dateTime, sizeof(dateTime), "%F %T", &tm);
	}
	string indent((level - 1) * 2, ' ');
	return string(dateTime) + " | " + __subsystem_strings[(int)subsystem] +
			": " + indent + message;
}

void Logger::log(Subsystem subsystem, Level level, const string& message, bool force)
{
	if (level == 0)
	{
		fatal2i("logger: log: level should be >= 1");
	}

	if (!__enabled)
	{
		return;
	}

	if (__debugging)
	{
		debug2("log: %s", __get_log_string(subsystem, level, message));
	}

	if (force || (level <= __levels[(int)subsystem]))
	{
		std::lock_guard< std::mutex > guard(__mutex);
		__file->put(__get_log_string(subsystem, level, message) + "\n");
		__file->flush();
	}
}

}
}
