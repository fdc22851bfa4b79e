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
#ifndef MIRRORPILOT_MIRROR_SEEN
#define MIRRORPILOT_MIRROR_SEEN

/// @file

#include <mirrorpilot/common.hpp>

namespace mirrorpilot {

/// where a candidate came from
enum class DiscoverySource { MirrorFile, Reference, Current, MirrorList, Launchpad, Archive, Manual };

/// a mirror URL before any probing
struct MIRRORPILOT_API CandidateMirror
{
	string url;
	DiscoverySource source;
	bool hasStalenessHint; ///< Launchpad reports how far behind the mirror is
	uint64_t stalenessHint; ///< seconds, valid if @ref hasStalenessHint

	CandidateMirror(const string& url_, DiscoverySource source_);

	static const char* sourceString(DiscoverySource);
};

enum class Availability { Available, Unavailable, Unknown };

/// how far behind the reference mirror a mirror is
struct MIRRORPILOT_API Staleness
{
	enum class Kind { Unknown, UpToDate, Behind };
	Kind kind;
	uint64_t seconds; ///< valid for Behind

	Staleness();
	string toString() const;
};

/// the result of probing one candidate during one ranking
struct MIRRORPILOT_API MirrorStatus
{
	Availability availability;
	bool isUpdating;
	Staleness staleness;
	bool hasBandwidth;
	double bandwidth; ///< bytes per second, valid if @ref hasBandwidth

	MirrorStatus();
	/// 0: available and not updating, 1: available and updating, 2: the rest
	int getTier() const;

	static const char* availabilityString(Availability);
};

/// a probed candidate with its position, 1 is the best
struct MIRRORPILOT_API RankedMirror
{
	CandidateMirror candidate;
	MirrorStatus status;
	size_t rank;

	RankedMirror(const CandidateMirror&);
};

}

#endif
