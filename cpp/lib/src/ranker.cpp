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
#include <algorithm>
#include <atomic>
#include <thread>

#include <common/common.hpp>

#include <mirrorpilot/ranker.hpp>
#include <mirrorpilot/cancellation.hpp>
#include <mirrorpilot/config.hpp>
#include <mirrorpilot/exclusionset.hpp>
#include <mirrorpilot/http/probeclient.hpp>
#include <mirrorpilot/http/uri.hpp>

#include <internal/common.hpp>
#include <internal/exceptionlessfuture.hpp>
#include <internal/logger.hpp>

namespace mirrorpilot {

RankerOptions::RankerOptions()
	: timeout(10), concurrency(0), sampleWindow(2000), minimumBytes(4096), debugging(false)
{}

RankerOptions RankerOptions::fromConfig(const Config& config)
{
	RankerOptions result;

	auto timeout = config.getInteger("mirrorpilot::probe::timeout");
	if (timeout <= 0)
	{
		fatal2(__("the option '%s' should be positive"), "mirrorpilot::probe::timeout");
	}
	result.timeout = timeout;

	auto concurrency = config.getInteger("mirrorpilot::ranker::concurrency");
	if (concurrency < 0)
	{
		fatal2(__("the option '%s' should not be negative"), "mirrorpilot::ranker::concurrency");
	}
	result.concurrency = concurrency;

	auto sampleWindow = config.getInteger("mirrorpilot::probe::bandwidth::sample-window");
	if (sampleWindow <= 0)
	{
		fatal2(__("the option '%s' should be positive"), "mirrorpilot::probe::bandwidth::sample-window");
	}
	result.sampleWindow = sampleWindow;

	auto minimumBytes = config.getInteger("mirrorpilot::probe::bandwidth::minimum-bytes");
	if (minimumBytes < 0)
	{
		fatal2(__("the option '%s' should not be negative"), "mirrorpilot::probe::bandwidth::minimum-bytes");
	}
	result.minimumBytes = minimumBytes;

	result.debugging = config.getBool("debug::ranker");
	return result;
}

namespace internal {

typedef Logger::Subsystem LogSubsystem;

class RankerImpl
{
	http::ProbeClient& __client;
	const RankerOptions __options;
	Logger* __logger;

	struct Job
	{
		const vector< CandidateMirror >* candidates;
		vector< MirrorStatus >* statuses;
		string codename;
		const DistributorTraits* traits;
		bool archiveTier;
		time_t referenceDate;
		const CancellationToken* token;
		std::atomic< size_t > nextIndex;
	};

	size_t __get_worker_count(size_t candidateCount) const;
	time_t __get_reference_date(const DistributorTraits&, const string& codename,
			const CancellationToken&) const;
	string __get_index_url(const Job&, const string& mirror) const;
	void __probe_mirror(const Job&, const CandidateMirror&, MirrorStatus*) const;
	size_t __work(Job*) const;
	void __log(Logger::Level, const string&) const;
 public:
	RankerImpl(http::ProbeClient& client, const RankerOptions& options, Logger* logger)
		: __client(client), __options(options), __logger(logger)
	{}

	vector< RankedMirror > rank(const vector< CandidateMirror >&, const string& codename,
			Distributor, const ExclusionSet&, size_t maxProbeCount,
			const CancellationToken&, bool archiveTier) const;
};

void RankerImpl::__log(Logger::Level level, const string& message) const
{
	if (__logger)
	{
		__logger->log(LogSubsystem::Ranking, level, message);
	}
}

size_t RankerImpl::__get_worker_count(size_t candidateCount) const
{
	size_t result = __options.concurrency;
	if (!result)
	{
		result = std::max< size_t >(4, 2 * std::thread::hardware_concurrency());
	}
	return std::max< size_t >(1, std::min(result, candidateCount));
}

time_t RankerImpl::__get_reference_date(const DistributorTraits& traits,
		const string& codename, const CancellationToken& token) const
{
	auto url = traits.getReferenceUrl(codename);
	auto outcome = __client.probe(url, http::Method::Get, __options.timeout, token);
	time_t result;
	if (outcome.type == http::ProbeOutcome::Type::Success && Ranker::parseIndexDate(outcome.body, &result))
	{
		return result;
	}
	warn2(__("unable to get the date of the reference index '%s', comparing with the current time"), url);
	return time(NULL);
}

string RankerImpl::__get_index_url(const Job& job, const string& mirror) const
{
	if (job.archiveTier)
	{
		return http::Uri::normalize(mirror) + "/dists/" + job.codename + "/Release";
	}
	return job.traits->getIndexUrl(mirror, job.codename);
}

void RankerImpl::__probe_mirror(const Job& job, const CandidateMirror& candidate, MirrorStatus* status) const
{
	const auto& token = *job.token;

	if (!http::Uri::isNetworkUri(candidate.url))
	{
		status->availability = Availability::Unavailable;
		return;
	}

	auto indexUrl = __get_index_url(job, candidate.url);
	auto indexOutcome = __client.probe(indexUrl, http::Method::Get, __options.timeout, token);
	time_t mirrorDate = 0;
	bool hasMirrorDate = false;
	switch (indexOutcome.type)
	{
		case http::ProbeOutcome::Type::Success:
		{
			// a squatted domain may answer 200 with anything
			string dateValue;
			if (!Ranker::findIndexDate(indexOutcome.body, &dateValue))
			{
				status->availability = Availability::Unavailable;
				break;
			}
			status->availability = Availability::Available;
			hasMirrorDate = internal::parseReleaseDate(dateValue, &mirrorDate);
			if (!hasMirrorDate && __options.debugging)
			{
				debug2("unable to parse the index date '%s' of '%s'", dateValue, candidate.url);
			}
			break;
		}
		case http::ProbeOutcome::Type::NotFound:
			status->availability = Availability::Unavailable;
			break;
		default:
			status->availability = Availability::Unknown;
	}
	// the marker counts regardless of availability
	if (!token.isCancelled())
	{
		auto markerUrl = http::Uri(candidate.url).join(
				string("Archive-Update-in-Progress-") + http::Uri(candidate.url).getHost());
		auto markerOutcome = __client.probe(markerUrl, http::Method::Head, __options.timeout, token);
		status->isUpdating = (markerOutcome.type == http::ProbeOutcome::Type::Success);
	}

	if (!job.archiveTier)
	{
		if (hasMirrorDate)
		{
			if (mirrorDate >= job.referenceDate)
			{
				status->staleness.kind = Staleness::Kind::UpToDate;
			}
			else
			{
				status->staleness.kind = Staleness::Kind::Behind;
				status->staleness.seconds = job.referenceDate - mirrorDate;
			}
		}
		else if (candidate.hasStalenessHint)
		{
			status->staleness.kind = candidate.stalenessHint ?
					Staleness::Kind::Behind : Staleness::Kind::UpToDate;
			status->staleness.seconds = candidate.stalenessHint;
		}
	}

	if (status->getTier() == 0 && !token.isCancelled())
	{
		auto measurement = __client.streamRate(indexUrl, __options.timeout,
				__options.sampleWindow, __options.minimumBytes, token);
		if (measurement.valid)
		{
			status->hasBandwidth = true;
			status->bandwidth = measurement.bytesPerSecond;
		}
	}

	if (__options.debugging)
	{
		debug2("probed '%s': %s, %s, %s, %s", candidate.url,
				MirrorStatus::availabilityString(status->availability),
				status->isUpdating ? "updating" : "not updating",
				status->staleness.toString(),
				status->hasBandwidth ? humanReadableSizeString((uint64_t)status->bandwidth) + "/s" : string("no bandwidth"));
	}
}

size_t RankerImpl::__work(Job* job) const
{
	size_t probedCount = 0;
	const auto candidateCount = job->candidates->size();
	while (!job->token->isCancelled())
	{
		auto index = job->nextIndex++;
		if (index >= candidateCount)
		{
			break;
		}
		// each worker writes only to the slots it took
		__probe_mirror(*job, (*job->candidates)[index], &(*job->statuses)[index]);
		++probedCount;
	}
	return probedCount;
}

vector< RankedMirror > RankerImpl::rank(const vector< CandidateMirror >& allCandidates,
		const string& codename, Distributor distributor, const ExclusionSet& exclusions,
		size_t maxProbeCount, const CancellationToken& token, bool archiveTier) const
{
	vector< CandidateMirror > candidates;
	FORIT(it, allCandidates)
	{
		if (exclusions.matches(it->url))
		{
			if (__options.debugging)
			{
				debug2("excluded '%s'", it->url);
			}
			continue;
		}
		candidates.push_back(*it);
	}
	if (maxProbeCount && candidates.size() > maxProbeCount)
	{
		__log(2, format2("probing only the first %zu of %zu mirrors", maxProbeCount, candidates.size()));
		candidates.erase(candidates.begin() + maxProbeCount, candidates.end());
	}

	vector< MirrorStatus > statuses(candidates.size());
	if (!candidates.empty() && !token.isCancelled())
	{
		const auto& traits = DistributorTraits::get(distributor);

		Job job;
		job.candidates = &candidates;
		job.statuses = &statuses;
		job.codename = internal::toLower(codename);
		job.traits = &traits;
		job.archiveTier = archiveTier;
		job.referenceDate = archiveTier ? 0 : __get_reference_date(traits, job.codename, token);
		job.token = &token;
		job.nextIndex = 0;

		auto workerCount = __get_worker_count(candidates.size());
		__log(2, format2("probing %zu mirrors with %zu workers", candidates.size(), workerCount));

		vector< unique_ptr< ExceptionlessFuture< size_t > > > workers;
		for (size_t i = 0; i < workerCount; ++i)
		{
			workers.emplace_back(new ExceptionlessFuture< size_t >(
					[this, &job]() { return this->__work(&job); }));
		}
		for (auto& worker: workers)
		{
			worker->get();
			if (worker->failed())
			{
				warn2(__("a probing worker failed: %s"), worker->getError());
			}
		}
		if (token.isCancelled())
		{
			warn2(__("probing was cancelled, the results are partial"));
		}
	}

	vector< size_t > order(candidates.size());
	for (size_t i = 0; i < order.size(); ++i)
	{
		order[i] = i;
	}
	std::stable_sort(order.begin(), order.end(), [&statuses](size_t left, size_t right)
	{
		const auto& leftStatus = statuses[left];
		const auto& rightStatus = statuses[right];
		auto leftTier = leftStatus.getTier();
		auto rightTier = rightStatus.getTier();
		if (leftTier != rightTier)
		{
			return leftTier < rightTier;
		}
		if (leftTier != 0)
		{
			return false;
		}
		// unmeasured ones go last in the tier
		if (leftStatus.hasBandwidth != rightStatus.hasBandwidth)
		{
			return leftStatus.hasBandwidth;
		}
		return leftStatus.hasBandwidth && leftStatus.bandwidth > rightStatus.bandwidth;
	});

	vector< RankedMirror > result;
	size_t availableCount = 0;
	for (size_t i = 0; i < order.size(); ++i)
	{
		RankedMirror rankedMirror(candidates[order[i]]);
		rankedMirror.status = statuses[order[i]];
		rankedMirror.rank = i + 1;
		if (rankedMirror.status.availability == Availability::Available)
		{
			++availableCount;
		}
		result.push_back(rankedMirror);
	}
	__log(1, format2("ranked %zu mirrors, %zu available%s", result.size(), availableCount,
			result.empty() ? "" : format2(", the best is '%s'", result[0].candidate.url)));
	return result;
}

}

Ranker::Ranker(http::ProbeClient& client, const RankerOptions& options, internal::Logger* logger)
	: __impl(new internal::RankerImpl(client, options, logger))
{}

Ranker::~Ranker()
{
	delete __impl;
}

vector< RankedMirror > Ranker::rank(const vector< CandidateMirror >& candidates,
		const string& codename, Distributor distributor, const ExclusionSet& exclusions,
		size_t maxProbeCount, const CancellationToken& token, bool archiveTier) const
{
	return __impl->rank(candidates, codename, distributor, exclusions, maxProbeCount, token, archiveTier);
}

bool Ranker::findIndexDate(const string& index, string* value)
{
	size_t lineStart = 0;
	while (lineStart < index.size())
	{
		auto lineEnd = index.find('\n', lineStart);
		if (lineEnd == string::npos)
		{
			lineEnd = index.size();
		}
		if (index.compare(lineStart, 5, "Date:") == 0)
		{
			*value = internal::trim(index.substr(lineStart + 5, lineEnd - lineStart - 5));
			return true;
		}
		lineStart = lineEnd + 1;
	}
	return false;
}

bool Ranker::parseIndexDate(const string& index, time_t* result)
{
	string value;
	return findIndexDate(index, &value) && internal::parseReleaseDate(value, result);
}

}
