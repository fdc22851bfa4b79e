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
#ifndef SOURCESWRITER_SEEN
#define SOURCESWRITER_SEEN

#include "common.hpp"

#include <mirrorpilot/update/orchestrator.hpp>

/// installs sources lists prepared by MirrorManager
class SourcesWriter
{
	const MirrorManager& __manager;
	shared_ptr< const Config > __config;

	string __get_backup_path(const string& path) const;
 public:
	SourcesWriter(const MirrorManager&, const shared_ptr< const Config >&);

	/// backs up the current list and replaces it with @a contents
	void install(const string& contents);
	/// removes downloaded package lists, forcing the next update to fetch them all
	void clearPackageLists();
};

/// selects mirrors through the manager and makes them active on the system
class ConsoleMirrorSelector: public update::MirrorSelector
{
	const MirrorManager& __manager;
	SourcesWriter& __writer;
 public:
	ConsoleMirrorSelector(const MirrorManager&, SourcesWriter&);

	string currentMirror();
	string selectReplacement(const ExclusionSet&);
	bool switchToArchiveIfEndOfLife();
	void activate(const string& mirror);
};

#endif
