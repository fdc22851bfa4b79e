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
#ifndef MIRRORPILOT_DISTRIBUTOR_SEEN
#define MIRRORPILOT_DISTRIBUTOR_SEEN

/// @file

#include <mirrorpilot/fwd.hpp>

namespace mirrorpilot {

/// closed set of supported distributions
enum class Distributor { Debian, Ubuntu, LinuxMint };

/// context passed to a discovery backend
struct MIRRORPILOT_API DiscoveryContext
{
	http::ProbeClient* client;
	unsigned int timeout; ///< per request, seconds
	string country; ///< may be empty if unknown
	const CancellationToken* token;
	bool debugging;
};

typedef vector< CandidateMirror > (*DiscoveryFunction)(const DiscoveryContext&);

/// static per-distributor data: URLs, suites, discovery backend
struct MIRRORPILOT_API DistributorTraits
{
	Distributor distributor;
	const char* name; ///< lowercase identifier, as in /etc/os-release
	const char* displayName;
	string mirrorListUrl;
	string fallbackMirrorListUrl; ///< empty if none
	string securityUrl;
	string archiveUrl; ///< empty if there is no archive tier
	string referenceTemplate; ///< index of the trusted mirror, with 'codename' placeholder
	string indexSuffix; ///< suite suffix of the index probed on mirrors
	vector< string > validSuites;
	vector< string > defaultSuites;
	vector< string > validComponents;
	vector< string > defaultComponents;
	DiscoveryFunction discover;

	bool hasArchiveTier() const;
	/// trusted reference index URL for @a codename
	string getReferenceUrl(const string& codename) const;
	/// root URL of the trusted reference mirror
	string getReferenceRoot() const;
	/// '<mirror>/dists/<codename><suffix>/Release'
	string getIndexUrl(const string& mirror, const string& codename) const;

	static const DistributorTraits& get(Distributor);
};

/// lowercase name of @a distributor
MIRRORPILOT_API const char* getDistributorName(Distributor distributor);
/// parses a distributor name
/**
 * @exception Exception if @a name is not a supported distributor
 */
MIRRORPILOT_API Distributor parseDistributor(const string& name);

}

#endif
