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
#include <libintl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include <mirrorpilot/common.hpp>

namespace mirrorpilot {

#define QUOTED(x) QUOTED_(x)
#define QUOTED_(x) # x
const char* const libraryVersion = QUOTED(MIRRORPILOT_VERSION);
#undef QUOTED
#undef QUOTED_

int messageFd = -1;

static void __mwrite(const string& output)
{
	if (messageFd == -1)
	{
		return;
	}
	size_t offset = 0;
	while (offset < output.size())
	{
		auto writeResult = write(messageFd, output.c_str() + offset, output.size() - offset);
		if (writeResult == -1)
		{
			if (errno == EINTR)
			{
				continue;
			}
			return; // nowhere to report it anyway
		}
		offset += writeResult;
	}
}

void __mwrite_line(const char* prefix, const string& message)
{
	__mwrite(string(prefix) + message + "\n");
}

string join(const string& joiner, const vector< string >& parts)
{
	if (parts.empty())
	{
		return "";
	}
	string result = parts[0];
	auto size = parts.size();
	for (size_t i = 1; i < size; ++i)
	{
		result += joiner;
		result += parts[i];
	}
	return result;
}

string humanReadableSizeString(uint64_t bytes)
{
	char buf[32];
	if (bytes < 10*1000)
	{
		sprintf(buf, "%uB", (unsigned int)bytes);
	}
	else if (bytes < 100*1024)
	{
		sprintf(buf, "%.1fKiB", float(bytes) / 1024);
	}
	else if (bytes < 10*1000*1024)
	{
		sprintf(buf, "%.0fKiB", float(bytes) / 1024);
	}
	else if (bytes < 100*1024*1024)
	{
		sprintf(buf, "%.1fMiB", float(bytes) / 1024 / 1024);
	}
	else
	{
		sprintf(buf, "%.0fMiB", float(bytes) / 1024 / 1024);
	}

	return string(buf);
}

string humanReadableTimespan(uint64_t seconds)
{
	struct Unit
	{
		uint64_t length;
		const char* singular;
		const char* plural;
	};
	static const Unit units[] = {
		{ 7*24*3600, "week", "weeks" },
		{ 24*3600, "day", "days" },
		{ 3600, "hour", "hours" },
		{ 60, "minute", "minutes" },
		{ 1, "second", "seconds" },
	};

	// only the largest unit is shown, "3 days" rather than "3 days and 2 hours"
	for (const auto& unit: units)
	{
		if (seconds >= unit.length)
		{
			auto count = seconds / unit.length;
			return format2("%llu %s", (unsigned long long)count,
					count == 1 ? unit.singular : unit.plural);
		}
	}
	return "0 seconds";
}

const char* __(const char* buf)
{
	return dgettext("mirrorpilot", buf);
}

} // namespace

