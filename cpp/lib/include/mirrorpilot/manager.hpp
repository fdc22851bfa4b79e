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
#ifndef MIRRORPILOT_MANAGER_SEEN
#define MIRRORPILOT_MANAGER_SEEN

/// @file

#include <mirrorpilot/release.hpp>
#include <mirrorpilot/mirror.hpp>
#include <mirrorpilot/update/orchestrator.hpp>

namespace mirrorpilot {

namespace internal {

class MirrorManagerImpl;

}

/// the mirror selection pipeline for the running system
/**
 * Detects the distributor and release from the configuration and the APT
 * sources list, discovers and ranks mirrors, checks the end of life and
 * drives the resilient update. Never writes system files; the caller
 * installs the sources lists it prepares.
 */
class MIRRORPILOT_API MirrorManager
{
	internal::MirrorManagerImpl* __impl;

	MirrorManager(const MirrorManager&) = delete;
 public:
	/**
	 * @param client used for all network requests, must outlive the object
	 * @param token cancels discovery and ranking
	 */
	MirrorManager(const shared_ptr< const Config >& config, http::ProbeClient& client,
			const CancellationToken& token);
	~MirrorManager();

	/// path of the main APT sources list
	string getSourcesListPath() const;
	/// the release of the system, or the configured one
	/**
	 * @exception Exception if it cannot be detected
	 */
	const Release& getRelease() const;
	/// the distributor whose mirrors are used
	/**
	 * Differs from the release distributor for Linux Mint in upstream mode.
	 */
	Distributor getMirrorDistributor() const;
	/// the codename the mirrors must serve
	string getMirrorCodename() const;
	/// the mirror in the sources list
	string getCurrentMirror() const;
	/// the machine architecture, empty if unknown
	string getArchitecture() const;

	/// end-of-life status of @a series of @a distributor
	EolStatus checkEol(Distributor distributor, const string& series) const;
	/// end-of-life status of the release of the system
	EolStatus checkEol() const;
	/// is the release confirmed end of life and served by the archive tier
	/**
	 * Computed once and cached.
	 */
	bool isArchiveTierActive() const;
	/// the mirror of the archive tier, empty if none
	string getArchiveMirror() const;

	/// candidate mirrors, deduplicated, in discovery order
	vector< CandidateMirror > discover() const;
	/// discovers and ranks mirrors
	vector< RankedMirror > discoverAndRank(const ExclusionSet& exclusions) const;
	/// ranks given candidates
	vector< RankedMirror > rank(const vector< CandidateMirror >& candidates,
			const ExclusionSet& exclusions) const;
	/// the best available mirror
	/**
	 * @exception Exception if no mirror is available
	 */
	string getBestMirror(const ExclusionSet& exclusions) const;

	/// the sources list with the current mirror replaced by @a newMirror
	/**
	 * When switching to the archive tier, security mirror entries are
	 * replaced as well. If nothing could be replaced, a fresh list is
	 * generated.
	 */
	string prepareSourcesList(const string& newMirror) const;
	/// a fresh sources list for @a mirror with default suites and components
	string generateSourcesList(const string& mirror, bool enableSources = false) const;

	/// runs the update command with retries and mirror switching
	/**
	 * @param allowMirrorSwitching if @c false, mirrors are not switched even
	 * if the configuration allows it
	 * @param sleeper called between transient retries, real sleeping if empty
	 */
	update::UpdateResult smartUpdate(const vector< string >& extraArguments,
			const ExclusionSet& exclusions, update::CommandRunner& runner,
			update::MirrorSelector& selector, bool allowMirrorSwitching = true,
			const update::Orchestrator::Sleeper& sleeper = update::Orchestrator::Sleeper()) const;
};

}

#endif
