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
#ifndef MIRRORPILOT_RANKER_SEEN
#define MIRRORPILOT_RANKER_SEEN

/// @file

#include <ctime>

#include <mirrorpilot/distributor.hpp>
#include <mirrorpilot/mirror.hpp>

namespace mirrorpilot {

namespace internal {

class RankerImpl;
class Logger;

}

/// tunables of a ranking run
struct MIRRORPILOT_API RankerOptions
{
	unsigned int timeout; ///< per request, seconds
	size_t concurrency; ///< worker count, 0 means automatic
	unsigned int sampleWindow; ///< bandwidth read window, milliseconds
	uint64_t minimumBytes; ///< least bytes for a valid bandwidth measurement
	bool debugging;

	RankerOptions();
	static RankerOptions fromConfig(const Config&);
};

/// probes candidate mirrors concurrently and orders them
class MIRRORPILOT_API Ranker
{
	internal::RankerImpl* __impl;

	Ranker(const Ranker&) = delete;
 public:
	/**
	 * @param client used from several worker threads at once
	 * @param logger may be @c NULL
	 */
	Ranker(http::ProbeClient& client, const RankerOptions& options,
			internal::Logger* logger = NULL);
	~Ranker();

	/// probes and orders @a candidates
	/**
	 * Candidates matching @a exclusions are dropped before probing. Of the
	 * rest, at most @a maxProbeCount first ones (0 means no limit) are probed.
	 *
	 * The result contains every probed candidate, usable ones first: available
	 * and not updating ones by descending bandwidth, then available but
	 * updating ones, then the rest. Otherwise the input order is kept.
	 *
	 * Probe failures never raise. When @a token gets cancelled, no new probes
	 * are started and candidates not probed yet are reported with unknown
	 * availability.
	 *
	 * @param codename release the mirrors must serve
	 * @param archiveTier candidates are static archive mirrors, staleness is
	 * not computed
	 */
	vector< RankedMirror > rank(const vector< CandidateMirror >& candidates,
			const string& codename, Distributor distributor, const ExclusionSet& exclusions,
			size_t maxProbeCount, const CancellationToken& token, bool archiveTier = false) const;

	/// finds the raw value of the 'Date:' field of a release index
	static bool findIndexDate(const string& index, string* value);
	/// the 'Date:' field of a release index
	/**
	 * @return @c false if there is no such field or it is malformed
	 */
	static bool parseIndexDate(const string& index, time_t* result);
};

}

#endif
