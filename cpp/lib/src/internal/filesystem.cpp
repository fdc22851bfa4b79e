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
#include <cerrno>

#include <glob.h>
#include <sys/types.h>
#include <sys/stat.h>

#include <internal/common.hpp>
#include <internal/filesystem.hpp>

namespace mirrorpilot {
namespace internal {
namespace fs {

vector< string > glob(const string& pattern)
{
	vector< string > result;

	glob_t matches;
	auto globResult = ::glob(pattern.c_str(), 0, NULL, &matches);
	if (globResult != 0 && globResult != GLOB_NOMATCH)
	{
		globfree(&matches);
		fatal2e(__("%s() failed: '%s'"), "glob", pattern);
	}
	for (size_t i = 0; i < matches.gl_pathc; ++i)
	{
		result.push_back(matches.gl_pathv[i]);
	}
	globfree(&matches);

	return result;
}

bool fileExists(const string& path)
{
	struct stat info;
	if (stat(path.c_str(), &info) == -1)
	{
		if (errno == ENOENT || errno == ENOTDIR)
		{
			return false;
		}
		fatal2e(__("%s() failed: '%s'"), "stat", path);
	}
	return S_ISREG(info.st_mode);
}

}
}
}
