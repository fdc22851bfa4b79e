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
#ifndef MIRRORPILOT_INTERNAL_COMMON_SEEN
#define MIRRORPILOT_INTERNAL_COMMON_SEEN

#include <sys/wait.h>

#include <ctime>

#include <mirrorpilot/common.hpp>

namespace mirrorpilot {
namespace internal {

void chomp(string& str);
string trim(const string& str);
string toLower(string str);
bool startsWith(const string& str, const string& prefix);

vector< string > split(char, const string&, bool allowEmpty = false);
// splits on any whitespace run, like the shell does for unquoted words
vector< string > splitWords(const string&);

string getWaitStatusDescription(int status);
string shellQuote(const string&);

// 'YYYY-MM-DD' -> UTC midnight; returns false on malformed input
bool parseIsoDate(const string&, time_t* result);
string formatIsoDate(time_t);
// 'Sun, 25 Aug 2019 23:35:36 UTC' as found in Release files
bool parseReleaseDate(const string&, time_t* result);

} // namespace
} // namespace

#define N__(arg) arg

#endif

