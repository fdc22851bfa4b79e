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
#ifndef MIRRORPILOT_REGISTRY_SEEN
#define MIRRORPILOT_REGISTRY_SEEN

/// @file

#include <mirrorpilot/release.hpp>

namespace mirrorpilot {

namespace internal {

struct ReleaseRegistryImpl;

}

/// release table of all supported distributors, and the end-of-life oracle
/**
 * Holds the bundled release data, updated from distro-info CSV files when
 * they are present. The table is read-only after construction and may be
 * queried from several threads.
 */
class MIRRORPILOT_API ReleaseRegistry
{
	internal::ReleaseRegistryImpl* __impl;

	ReleaseRegistry(const ReleaseRegistry&) = delete;
 public:
	/// constructor
	/**
	 * @param distroInfoDirectory directory with @c debian.csv and
	 * @c ubuntu.csv; empty string or missing files mean bundled data only
	 */
	ReleaseRegistry(const string& distroInfoDirectory = string());
	~ReleaseRegistry();

	/// all known releases of @a distributor, oldest first
	vector< Release > getReleases(Distributor distributor) const;
	/// all known releases
	vector< Release > getReleases() const;
	/// finds a release by its series (case-insensitive)
	/**
	 * @return pointer to the release, or @c NULL if not found
	 */
	const Release* find(Distributor distributor, const string& series) const;
	/// releases matching @a value by series or version, or else by a part of codename
	/**
	 * @param value compared case-insensitively
	 */
	vector< Release > findMatches(const string& value) const;
	/// finds a release by series, unique part of codename or version
	/**
	 * @exception Exception if nothing or more than one release matches
	 */
	Release coerceRelease(Distributor distributor, const string& value) const;
	/// same as above, looking through all distributors
	Release coerceRelease(const string& value) const;

	/// the last day of support applicable on @a architecture, 0 if unknown
	/**
	 * The extended date takes precedence when present and applicable. For
	 * Debian, extended (LTS) support only applies to a few architectures;
	 * an empty @a architecture is treated as one of them.
	 */
	time_t getApplicableEolDate(const Release& release, const string& architecture) const;

	/// checks whether @a series is still supported
	/**
	 * If the table knows the end-of-life date, no request is made. Otherwise
	 * the security mirror is asked for the release index: a confirmed
	 * absence means EndOfLife, a network problem means Unknown.
	 *
	 * @param now current time
	 */
	EolStatus checkEol(Distributor distributor, const string& series, const string& architecture,
			http::ProbeClient& client, unsigned int timeout, const CancellationToken& token,
			time_t now) const;

	/// URL of the signed index of @a series on the security mirror
	string getSecurityIndexUrl(Distributor distributor, const string& series) const;

	/// checks that the archive tier serves @a series
	/**
	 * @return @c false if there is no archive tier or it doesn't answer
	 * positively
	 */
	bool isServedByArchive(Distributor distributor, const string& series,
			http::ProbeClient& client, unsigned int timeout, const CancellationToken& token) const;
};

}

#endif
