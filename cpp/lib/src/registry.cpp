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
#include <cstdlib>
#include <algorithm>
#include <map>

#include <common/common.hpp>

#include <mirrorpilot/registry.hpp>
#include <mirrorpilot/file.hpp>
#include <mirrorpilot/http/probeclient.hpp>
#include <mirrorpilot/http/uri.hpp>

#include <internal/common.hpp>
#include <internal/filesystem.hpp>
#include <internal/releasedata.hpp>

namespace mirrorpilot {

Release::Release()
	: distributor(Distributor::Debian), createdDate(0), releaseDate(0),
	eolDate(0), extendedEolDate(0), isLts(false)
{}

string Release::toString() const
{
	auto result = format2("%s %s (%s)", DistributorTraits::get(distributor).displayName,
			version.empty() ? series : version, codename);
	if (isLts)
	{
		result += " LTS";
	}
	return result;
}

const char* getEolStatusString(EolStatus status)
{
	switch (status)
	{
		case EolStatus::Supported: return __("supported");
		case EolStatus::EndOfLife: return __("end of life");
		case EolStatus::Unknown: return __("unknown");
	}
	return "";
}

namespace internal {

struct ReleaseRegistryImpl
{
	vector< Release > releases;

	void loadBundled();
	void mergeCsv(Distributor, const string& path);
	Release* findMutable(Distributor, const string& series);
	vector< const Release* > match(Distributor, const string& value, bool anyDistributor) const;
};

namespace {

time_t parseDateOrZero(const string& input)
{
	time_t result = 0;
	if (!input.empty() && !parseIsoDate(input, &result))
	{
		warn2(__("malformed date '%s' in the release data"), input);
		return 0;
	}
	return result;
}

}

void ReleaseRegistryImpl::loadBundled()
{
	const auto& ltsTable = getDebianLongTermSupport();
	for (const auto& row: getBundledReleases())
	{
		Release release;
		release.distributor = row.distributor;
		release.codename = row.codename;
		release.series = row.series;
		release.version = row.version;
		release.createdDate = parseDateOrZero(row.created);
		release.releaseDate = parseDateOrZero(row.release);
		release.eolDate = parseDateOrZero(row.eol);
		release.extendedEolDate = parseDateOrZero(row.extendedEol);
		release.isLts = row.isLts;
		release.compatibleSeries = row.compatibleSeries;

		if (release.distributor == Distributor::Debian)
		{
			for (const auto& lts: ltsTable)
			{
				if (release.series == lts.series)
				{
					release.extendedEolDate = parseDateOrZero(lts.end);
					release.isLts = true;
				}
			}
		}
		releases.push_back(std::move(release));
	}
}

Release* ReleaseRegistryImpl::findMutable(Distributor distributor, const string& series)
{
	auto loweredSeries = toLower(series);
	FORIT(it, releases)
	{
		if (it->distributor == distributor && it->series == loweredSeries)
		{
			return &*it;
		}
	}
	return NULL;
}

// distro-info format: a header line naming the columns, then one release per line
void ReleaseRegistryImpl::mergeCsv(Distributor distributor, const string& path)
{
	string openError;
	File file(path, "r", openError);
	if (!openError.empty())
	{
		warn2(__("unable to open the release data file '%s': %s"), path, openError);
		return;
	}

	std::map< string, size_t > columns;
	string line;
	size_t lineNumber = 0;
	while (!file.getLine(line).eof())
	{
		++lineNumber;
		auto fields = split(',', line, true);
		if (lineNumber == 1)
		{
			for (size_t i = 0; i < fields.size(); ++i)
			{
				columns[trim(fields[i])] = i;
			}
			if (!columns.count("series") || !columns.count("codename"))
			{
				warn2(__("the release data file '%s' has no 'series' or 'codename' column"), path);
				return;
			}
			continue;
		}
		if (trim(line).empty())
		{
			continue;
		}

		auto getField = [&columns, &fields](const char* name) -> string
		{
			auto it = columns.find(name);
			if (it == columns.end() || it->second >= fields.size())
			{
				return string();
			}
			return trim(fields[it->second]);
		};

		auto series = toLower(getField("series"));
		if (series.empty())
		{
			warn2(__("no series in the line %zu of the release data file '%s'"), lineNumber, path);
			continue;
		}
		auto release = findMutable(distributor, series);
		if (!release)
		{
			Release newRelease;
			newRelease.distributor = distributor;
			newRelease.series = series;
			releases.push_back(std::move(newRelease));
			release = &releases.back();
		}

		release->codename = getField("codename");
		auto version = getField("version");
		const string ltsSuffix = " LTS";
		if (version.size() > ltsSuffix.size() &&
				version.compare(version.size() - ltsSuffix.size(), ltsSuffix.size(), ltsSuffix) == 0)
		{
			version.erase(version.size() - ltsSuffix.size());
			release->isLts = true;
		}
		release->version = version;

		auto updateDate = [&getField](const char* name, time_t* target)
		{
			auto value = getField(name);
			if (!value.empty())
			{
				*target = parseDateOrZero(value);
			}
		};
		updateDate("created", &release->createdDate);
		updateDate("release", &release->releaseDate);
		updateDate("eol", &release->eolDate);
		updateDate("eol-server", &release->extendedEolDate);
		updateDate("eol-lts", &release->extendedEolDate);
		if (distributor == Distributor::Ubuntu && !getField("eol-server").empty())
		{
			release->isLts = true;
		}
	}
}

vector< const Release* > ReleaseRegistryImpl::match(Distributor distributor,
		const string& value, bool anyDistributor) const
{
	auto loweredValue = toLower(trim(value));
	vector< const Release* > result;
	if (loweredValue.empty())
	{
		return result;
	}

	auto isConsidered = [distributor, anyDistributor](const Release& release)
	{
		return anyDistributor || release.distributor == distributor;
	};

	// exact matches win over partial ones
	FORIT(it, releases)
	{
		if (isConsidered(*it) && (it->series == loweredValue || it->version == loweredValue))
		{
			result.push_back(&*it);
		}
	}
	if (result.empty())
	{
		FORIT(it, releases)
		{
			if (isConsidered(*it) && toLower(it->codename).find(loweredValue) != string::npos)
			{
				result.push_back(&*it);
			}
		}
	}
	return result;
}

}

ReleaseRegistry::ReleaseRegistry(const string& distroInfoDirectory)
	: __impl(new internal::ReleaseRegistryImpl)
{
	__impl->loadBundled();
	if (!distroInfoDirectory.empty())
	{
		const pair< Distributor, const char* > csvFiles[] = {
			{ Distributor::Debian, "debian.csv" },
			{ Distributor::Ubuntu, "ubuntu.csv" },
		};
		for (const auto& csvFile: csvFiles)
		{
			auto path = distroInfoDirectory + "/" + csvFile.second;
			if (internal::fs::fileExists(path))
			{
				__impl->mergeCsv(csvFile.first, path);
			}
		}
	}
}

ReleaseRegistry::~ReleaseRegistry()
{
	delete __impl;
}

vector< Release > ReleaseRegistry::getReleases(Distributor distributor) const
{
	vector< Release > result;
	for (const auto& release: __impl->releases)
	{
		if (release.distributor == distributor)
		{
			result.push_back(release);
		}
	}
	return result;
}

vector< Release > ReleaseRegistry::getReleases() const
{
	return __impl->releases;
}

const Release* ReleaseRegistry::find(Distributor distributor, const string& series) const
{
	return __impl->findMutable(distributor, series);
}

vector< Release > ReleaseRegistry::findMatches(const string& value) const
{
	vector< Release > result;
	for (auto release: __impl->match(Distributor::Debian, value, true))
	{
		result.push_back(*release);
	}
	return result;
}

static Release coerceFromMatches(const vector< const Release* >& matches, const string& value)
{
	if (matches.empty())
	{
		fatal2(__("unknown release '%s'"), value);
	}
	if (matches.size() > 1)
	{
		vector< string > names;
		for (auto release: matches)
		{
			names.push_back(release->toString());
		}
		fatal2(__("the release '%s' is ambiguous, candidates are: %s"), value, join(", ", names));
	}
	return *matches[0];
}

Release ReleaseRegistry::coerceRelease(Distributor distributor, const string& value) const
{
	return coerceFromMatches(__impl->match(distributor, value, false), value);
}

Release ReleaseRegistry::coerceRelease(const string& value) const
{
	return coerceFromMatches(__impl->match(Distributor::Debian, value, true), value);
}

time_t ReleaseRegistry::getApplicableEolDate(const Release& release, const string& architecture) const
{
	bool extendedApplies = true;
	if (release.distributor == Distributor::Debian && !architecture.empty())
	{
		const auto& ltsArchitectures = internal::getDebianLongTermSupportArchitectures();
		extendedApplies = std::find(ltsArchitectures.begin(), ltsArchitectures.end(),
				architecture) != ltsArchitectures.end();
	}
	if (extendedApplies && release.extendedEolDate)
	{
		return std::max(release.eolDate, release.extendedEolDate);
	}
	return release.eolDate;
}

string ReleaseRegistry::getSecurityIndexUrl(Distributor distributor, const string& series) const
{
	const auto& traits = DistributorTraits::get(distributor);
	auto loweredSeries = internal::toLower(series);
	switch (distributor)
	{
		case Distributor::Debian:
		{
			// the layout changed with bullseye
			bool oldLayout = false;
			auto release = find(distributor, loweredSeries);
			if (release && !release->version.empty())
			{
				oldLayout = (atoi(release->version.c_str()) < 11);
			}
			auto suite = oldLayout ? loweredSeries + "/updates" : loweredSeries + "-security";
			return http::Uri::normalize(traits.securityUrl) + "/dists/" + suite + "/Release";
		}
		case Distributor::Ubuntu:
			return http::Uri::normalize(traits.securityUrl) + "/dists/" + loweredSeries + "-security/Release";
		case Distributor::LinuxMint:
			// Linux Mint has no security mirror of its own
			return traits.getReferenceUrl(loweredSeries);
	}
	fatal2i("unknown distributor %d", (int)distributor);
	__builtin_unreachable();
}

EolStatus ReleaseRegistry::checkEol(Distributor distributor, const string& series,
		const string& architecture, http::ProbeClient& client, unsigned int timeout,
		const CancellationToken& token, time_t now) const
{
	auto release = find(distributor, series);
	if (release)
	{
		auto eolDate = getApplicableEolDate(*release, architecture);
		if (eolDate)
		{
			return (now < eolDate) ? EolStatus::Supported : EolStatus::EndOfLife;
		}
		if (release->version.empty())
		{
			return EolStatus::Supported; // unstable and experimental never reach end of life
		}
	}

	auto url = getSecurityIndexUrl(distributor, series);
	auto outcome = client.probe(url, http::Method::Head, timeout, token);
	switch (outcome.type)
	{
		case http::ProbeOutcome::Type::Success:
			return EolStatus::Supported;
		case http::ProbeOutcome::Type::NotFound:
			return EolStatus::EndOfLife;
		default:
			return EolStatus::Unknown;
	}
}

bool ReleaseRegistry::isServedByArchive(Distributor distributor, const string& series,
		http::ProbeClient& client, unsigned int timeout, const CancellationToken& token) const
{
	const auto& traits = DistributorTraits::get(distributor);
	if (!traits.hasArchiveTier())
	{
		return false;
	}
	auto url = http::Uri::normalize(traits.archiveUrl) + "/dists/" +
			internal::toLower(series) + "/Release";
	auto outcome = client.probe(url, http::Method::Head, timeout, token);
	return outcome.type == http::ProbeOutcome::Type::Success;
}

}
