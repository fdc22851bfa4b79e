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
#include <cstdio>
#include <cstring>
#include <cctype>
#include <algorithm>

#include <internal/common.hpp>

namespace mirrorpilot {
namespace internal {

void chomp(string& str)
{
	while (!str.empty() && (*str.rbegin() == '\n' || *str.rbegin() == '\r'))
	{
		str.erase(str.end() - 1);
	}
}

string trim(const string& str)
{
	static const char* const spaces = " \t\r\n";
	auto begin = str.find_first_not_of(spaces);
	if (begin == string::npos)
	{
		return string();
	}
	auto end = str.find_last_not_of(spaces);
	return str.substr(begin, end - begin + 1);
}

string toLower(string str)
{
	std::transform(str.begin(), str.end(), str.begin(),
			[](char c) { return std::tolower((unsigned char)c); });
	return str;
}

bool startsWith(const string& str, const string& prefix)
{
	return str.compare(0, prefix.size(), prefix) == 0;
}

vector< string > split(char c, const string& str, bool allowEmpty)
{
	vector< string > result;

	size_t size = str.size();
	size_t startPosition = 0;
	for (size_t i = 0; i < size; ++i)
	{
		if (str[i] == c)
		{
			if (startPosition < i || allowEmpty)
			{
				// there is non-empty substring (or empty one allowed)
				result.push_back(string(str, startPosition, i - startPosition));
			}
			startPosition = i + 1;
		}
	}
	if (startPosition < size || allowEmpty)
	{
		// there is non-empty last substring (or empty allowed)
		result.push_back(string(str, startPosition, size - startPosition));
	}

	return result;
}

vector< string > splitWords(const string& str)
{
	vector< string > result;
	string current;
	for (char c: str)
	{
		if (std::isspace((unsigned char)c))
		{
			if (!current.empty())
			{
				result.push_back(current);
				current.clear();
			}
		}
		else
		{
			current += c;
		}
	}
	if (!current.empty())
	{
		result.push_back(current);
	}
	return result;
}

string getWaitStatusDescription(int status)
{
	if (status == 0)
	{
		return "success";
	}
	else if (WIFSIGNALED(status))
	{
		return format2("terminated by signal '%s'", strsignal(WTERMSIG(status)));
	}
	else if (WIFSTOPPED(status))
	{
		return format2("stopped by signal '%s'", strsignal(WSTOPSIG(status)));
	}
	else if (WIFEXITED(status))
	{
		return format2("exit code '%d'", WEXITSTATUS(status));
	}
	else
	{
		return "unknown status";
	}
}

string shellQuote(const string& argument)
{
	if (!argument.empty() && argument.find_first_not_of(
			"abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789-_=+./:,@") == string::npos)
	{
		return argument;
	}
	string result = "'";
	for (char c: argument)
	{
		if (c == '\'')
		{
			result += "'\\''";
		}
		else
		{
			result += c;
		}
	}
	result += "'";
	return result;
}

bool parseIsoDate(const string& input, time_t* result)
{
	struct tm tm;
	memset(&tm, 0, sizeof(tm));
	auto end = strptime(input.c_str(), "%Y-%m-%d", &tm);
	if (!end || *end != '\0')
	{
		return false;
	}
	*result = timegm(&tm);
	return true;
}

string formatIsoDate(time_t timestamp)
{
	struct tm tm;
	gmtime_r(&timestamp, &tm);
	char buffer[16];
	strftime(buffer, sizeof(buffer), "%Y-%m-%d", &tm);
	return buffer;
}

bool parseReleaseDate(const string& input, time_t* result)
{
	// strptime's %b follows LC_TIME, which the console sets from the environment
	static const char* const months[] = { "Jan", "Feb", "Mar", "Apr", "May", "Jun",
			"Jul", "Aug", "Sep", "Oct", "Nov", "Dec" };

	char weekday[4] = {0};
	char month[4] = {0};
	char zone[4] = {0};
	struct tm tm;
	memset(&tm, 0, sizeof(tm));
	int year;
	auto fieldCount = sscanf(input.c_str(), "%3[A-Za-z], %d %3[A-Za-z] %d %d:%d:%d %3s",
			weekday, &tm.tm_mday, month, &year, &tm.tm_hour, &tm.tm_min, &tm.tm_sec, zone);
	if (fieldCount != 8 || strcmp(zone, "UTC") != 0)
	{
		return false;
	}
	tm.tm_mon = -1;
	for (int i = 0; i < 12; ++i)
	{
		if (strcmp(month, months[i]) == 0)
		{
			tm.tm_mon = i;
		}
	}
	if (tm.tm_mon == -1)
	{
		return false;
	}
	tm.tm_year = year - 1900;
	*result = timegm(&tm);
	return true;
}

} // namespace
} // namespace

