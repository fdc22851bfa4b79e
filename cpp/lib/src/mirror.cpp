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
#include <mirrorpilot/mirror.hpp>

namespace mirrorpilot {

CandidateMirror::CandidateMirror(const string& url_, DiscoverySource source_)
	: url(url_), source(source_), hasStalenessHint(false), stalenessHint(0)
{}

const char* CandidateMirror::sourceString(DiscoverySource source)
{
	switch (source)
	{
		case DiscoverySource::MirrorFile: return "mirror file";
		case DiscoverySource::Reference: return "reference";
		case DiscoverySource::Current: return "current";
		case DiscoverySource::MirrorList: return "mirror list";
		case DiscoverySource::Launchpad: return "launchpad";
		case DiscoverySource::Archive: return "archive";
		case DiscoverySource::Manual: return "manual";
	}
	return "";
}

Staleness::Staleness()
	: kind(Kind::Unknown), seconds(0)
{}

string Staleness::toString() const
{
	switch (kind)
	{
		case Kind::UpToDate:
			return __("up to date");
		case Kind::Behind:
			return format2(__("%s behind"), humanReadableTimespan(seconds));
		case Kind::Unknown:
			break;
	}
	return __("unknown");
}

MirrorStatus::MirrorStatus()
	: availability(Availability::Unknown), isUpdating(false),
	hasBandwidth(false), bandwidth(0)
{}

int MirrorStatus::getTier() const
{
	if (availability == Availability::Available)
	{
		return isUpdating ? 1 : 0;
	}
	return 2;
}

const char* MirrorStatus::availabilityString(Availability availability)
{
	switch (availability)
	{
		case Availability::Available: return "available";
		case Availability::Unavailable: return "unavailable";
		case Availability::Unknown: return "unknown";
	}
	return "";
}

RankedMirror::RankedMirror(const CandidateMirror& candidate_)
	: candidate(candidate_), rank(0)
{}

}
