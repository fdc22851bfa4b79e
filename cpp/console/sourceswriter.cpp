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
#include <cstdio>
#include <ctime>

#include <dirent.h>
#include <sys/stat.h>
#include <unistd.h>

#include <mirrorpilot/file.hpp>
#include <mirrorpilot/release.hpp>

#include "sourceswriter.hpp"

SourcesWriter::SourcesWriter(const MirrorManager& manager, const shared_ptr< const Config >& config)
	: __manager(manager), __config(config)
{}

string SourcesWriter::__get_backup_path(const string& path) const
{
	auto slashPosition = path.rfind('/');
	string directory = (slashPosition == string::npos) ? string(".") : path.substr(0, slashPosition);
	string basename = (slashPosition == string::npos) ? path : path.substr(slashPosition + 1);
	auto suffix = format2(".backup.%lld", (long long)time(NULL));

	if (__manager.getRelease().distributor == Distributor::LinuxMint && directory != "/etc/apt")
	{
		// sources.list.d would pick up the backup as one more list
		string backupDirectory = directory + "/backup_by_mirrorpilot";
		if (mkdir(backupDirectory.c_str(), 0755) == -1 && errno != EEXIST)
		{
			fatal2e(__("unable to create the directory '%s'"), backupDirectory);
		}
		return backupDirectory + '/' + basename + suffix;
	}
	return path + suffix;
}

void SourcesWriter::install(const string& contents)
{
	auto path = __manager.getSourcesListPath();

	string oldContents;
	{
		RequiredFile file(path, "r");
		file.getFile(oldContents);
	}
	if (oldContents == contents)
	{
		info2(__("the sources list '%s' is up to date"), path);
		return;
	}

	auto backupPath = __get_backup_path(path);
	info2(__("backing up '%s' to '%s'"), path, backupPath);
	{
		RequiredFile backup(backupPath, "w");
		backup.put(oldContents);
		backup.close();
	}

	auto temporaryPath = path + ".new";
	{
		RequiredFile file(temporaryPath, "w");
		file.put(contents);
		file.close();
	}
	if (chmod(temporaryPath.c_str(), 0644) == -1)
	{
		fatal2e(__("unable to change permissions of '%s'"), temporaryPath);
	}
	if (rename(temporaryPath.c_str(), path.c_str()) == -1)
	{
		fatal2e(__("unable to rename '%s' to '%s'"), temporaryPath, path);
	}
	info2(__("updated '%s'"), path);
}

void SourcesWriter::clearPackageLists()
{
	auto listsDirectory = __config->getString("mirrorpilot::lists-directory");

	DIR* dir = opendir(listsDirectory.c_str());
	if (!dir)
	{
		if (errno == ENOENT)
		{
			return;
		}
		fatal2e(__("unable to open the directory '%s'"), listsDirectory);
	}
	size_t removedCount = 0;
	while (auto entry = readdir(dir))
	{
		string name = entry->d_name;
		if (name == "." || name == ".." || name == "lock")
		{
			continue;
		}
		auto path = listsDirectory + '/' + name;
		struct stat pathStat;
		if (lstat(path.c_str(), &pathStat) == -1 || !S_ISREG(pathStat.st_mode))
		{
			continue;
		}
		if (unlink(path.c_str()) == -1)
		{
			warn2e(__("unable to remove the file '%s'"), path);
		}
		else
		{
			++removedCount;
		}
	}
	closedir(dir);
	debug2("removed %zu package list files from '%s'", removedCount, listsDirectory);
}

ConsoleMirrorSelector::ConsoleMirrorSelector(const MirrorManager& manager, SourcesWriter& writer)
	: __manager(manager), __writer(writer)
{}

string ConsoleMirrorSelector::currentMirror()
{
	try
	{
		return __manager.getCurrentMirror();
	}
	catch (Exception&)
	{
		warn2(__("unable to determine the current mirror"));
		return string();
	}
}

string ConsoleMirrorSelector::selectReplacement(const ExclusionSet& exclusions)
{
	return __manager.getBestMirror(exclusions);
}

bool ConsoleMirrorSelector::switchToArchiveIfEndOfLife()
{
	if (!__manager.isArchiveTierActive())
	{
		return false;
	}
	auto archiveMirror = __manager.getArchiveMirror();
	warn2(__("the release '%s' has reached its end of life, switching to '%s'"),
			__manager.getRelease().series, archiveMirror);
	activate(archiveMirror);
	return true;
}

void ConsoleMirrorSelector::activate(const string& mirror)
{
	__writer.install(__manager.prepareSourcesList(mirror));
	__writer.clearPackageLists();
}
