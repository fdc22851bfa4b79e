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
#include <unistd.h>

#include <set>

#include <common/common.hpp>

#include <mirrorpilot/manager.hpp>
#include <mirrorpilot/cancellation.hpp>
#include <mirrorpilot/config.hpp>
#include <mirrorpilot/discovery.hpp>
#include <mirrorpilot/exclusionset.hpp>
#include <mirrorpilot/file.hpp>
#include <mirrorpilot/ranker.hpp>
#include <mirrorpilot/registry.hpp>
#include <mirrorpilot/sourceslist.hpp>
#include <mirrorpilot/http/probeclient.hpp>
#include <mirrorpilot/http/uri.hpp>
#include <mirrorpilot/update/command.hpp>

#include <internal/common.hpp>
#include <internal/filesystem.hpp>
#include <internal/logger.hpp>

namespace mirrorpilot {
namespace internal {

typedef Logger::Subsystem LogSubsystem;

class MirrorManagerImpl
{
 public:
	shared_ptr< const Config > config;
	http::ProbeClient& client;
	const CancellationToken token;
	unique_ptr< Logger > logger;
	unique_ptr< ReleaseRegistry > registry;
	unique_ptr< Ranker > ranker;
	unsigned int timeout;

	mutable bool detected;
	mutable Release release;
	mutable Distributor mirrorDistributor;
	mutable string mirrorCodename;

	mutable bool architectureDetected;
	mutable string architecture;

	mutable int archiveTierState; // -1 means not checked yet

	MirrorManagerImpl(const shared_ptr< const Config >&, http::ProbeClient&, const CancellationToken&);

	string getSourcesListPath() const;
	void detect() const;
	Release detectRelease() const;
	string findCurrentMirror() const;
	string detectArchitecture() const;
	bool isArchiveTierActive() const;
	vector< CandidateMirror > readMirrorFile(const string& path) const;
	vector< CandidateMirror > discover() const;
};

MirrorManagerImpl::MirrorManagerImpl(const shared_ptr< const Config >& config_,
		http::ProbeClient& client_, const CancellationToken& token_)
	: config(config_), client(client_), token(token_),
	detected(false), mirrorDistributor(Distributor::Debian),
	architectureDetected(false), archiveTierState(-1)
{
	logger.reset(new Logger(*config));
	registry.reset(new ReleaseRegistry(config->getPath("mirrorpilot::directory::distro-info")));
	ranker.reset(new Ranker(client, RankerOptions::fromConfig(*config), logger.get()));
	timeout = RankerOptions::fromConfig(*config).timeout;
}

string MirrorManagerImpl::getSourcesListPath() const
{
	auto configured = config->getString("mirrorpilot::sources-list");
	if (!configured.empty())
	{
		return configured;
	}
	// Linux Mint keeps its mirrors in a separate list
	const string mintPath = "/etc/apt/sources.list.d/official-package-repositories.list";
	if (fs::fileExists(mintPath))
	{
		return mintPath;
	}
	return "/etc/apt/sources.list";
}

Release MirrorManagerImpl::detectRelease() const
{
	auto configuredDistributor = config->getString("mirrorpilot::distributor");
	auto configuredCodename = config->getString("mirrorpilot::codename");
	bool hasDistributor = !configuredDistributor.empty();
	auto distributor = hasDistributor ? parseDistributor(configuredDistributor) : Distributor::Debian;

	if (!configuredCodename.empty())
	{
		if (!hasDistributor)
		{
			return registry->coerceRelease(configuredCodename);
		}
		auto matches = registry->findMatches(configuredCodename);
		for (const auto& match: matches)
		{
			if (match.distributor == distributor)
			{
				return registry->coerceRelease(distributor, configuredCodename);
			}
		}
		// newer than the release table
		Release result;
		result.distributor = distributor;
		result.series = toLower(configuredCodename);
		result.codename = configuredCodename;
		warn2(__("the release '%s' is not known, assuming it exists"), configuredCodename);
		return result;
	}

	auto path = getSourcesListPath();
	auto sourcesList = SourcesList::readFile(path);
	for (const auto& entry: sourcesList.getEntries())
	{
		if (!http::Uri::isNetworkUri(entry.uri))
		{
			continue;
		}
		auto suite = entry.suite;
		auto position = suite.find_first_of("-/");
		if (position != string::npos)
		{
			suite.erase(position);
		}

		vector< Release > matches;
		for (const auto& match: registry->findMatches(suite))
		{
			if (!hasDistributor || match.distributor == distributor)
			{
				matches.push_back(match);
			}
		}
		if (matches.size() == 1)
		{
			return matches[0];
		}
	}
	fatal2(__("unable to detect the release from the sources list '%s', specify the codename"), path);
	__builtin_unreachable();
}

void MirrorManagerImpl::detect() const
{
	if (detected)
	{
		return;
	}
	release = detectRelease();
	mirrorDistributor = release.distributor;
	mirrorCodename = release.series;
	if (release.distributor == Distributor::LinuxMint &&
			config->getBool("mirrorpilot::discovery::upstream-mode"))
	{
		if (release.compatibleSeries.empty())
		{
			fatal2(__("the release '%s' has no compatible Ubuntu release"), release.toString());
		}
		mirrorDistributor = Distributor::Ubuntu;
		mirrorCodename = release.compatibleSeries;
	}
	detected = true;
	logger->log(LogSubsystem::Session, 2, format2("release: %s, mirrors: %s %s",
			release.toString(), getDistributorName(mirrorDistributor), mirrorCodename));
}

string MirrorManagerImpl::findCurrentMirror() const
{
	detect();
	auto sourcesList = SourcesList::readFile(getSourcesListPath());
	if (mirrorDistributor == release.distributor)
	{
		return sourcesList.findCurrentMirror();
	}
	// upstream mode: the entries of the compatible release
	for (const auto& entry: sourcesList.getEntries())
	{
		if (!http::Uri::isNetworkUri(entry.uri))
		{
			continue;
		}
		if (entry.suite == mirrorCodename || startsWith(entry.suite, mirrorCodename + '-'))
		{
			return entry.uri;
		}
	}
	fatal2(__("unable to find the mirror of '%s' in the sources list '%s'"),
			mirrorCodename, sourcesList.getPath());
	__builtin_unreachable();
}

string MirrorManagerImpl::detectArchitecture() const
{
	if (architectureDetected)
	{
		return architecture;
	}
	architectureDetected = true;
	architecture = config->getString("mirrorpilot::architecture");
	if (!architecture.empty())
	{
		return architecture;
	}

	string openError;
	File pipe("dpkg --print-architecture 2>/dev/null", "pr", openError);
	if (!openError.empty())
	{
		warn2(__("unable to run dpkg to detect the architecture: %s"), openError);
		return architecture;
	}
	string line;
	pipe.getLine(line);
	auto status = pipe.closePipe();
	if (status != 0)
	{
		warn2(__("unable to detect the architecture: dpkg: %s"), getWaitStatusDescription(status));
		return architecture;
	}
	architecture = trim(line);
	return architecture;
}

bool MirrorManagerImpl::isArchiveTierActive() const
{
	if (archiveTierState != -1)
	{
		return archiveTierState;
	}
	detect();
	archiveTierState = 0;

	const auto& traits = DistributorTraits::get(mirrorDistributor);
	auto status = registry->checkEol(mirrorDistributor, mirrorCodename, detectArchitecture(),
			client, timeout, token, time(NULL));
	logger->log(LogSubsystem::Session, 2, format2("end of life status of '%s': %s",
			mirrorCodename, getEolStatusString(status)));
	if (status != EolStatus::EndOfLife)
	{
		return false;
	}
	if (!traits.hasArchiveTier())
	{
		warn2(__("the release '%s' is end of life, but %s has no archive mirror"),
				release.toString(), traits.displayName);
		return false;
	}
	if (!registry->isServedByArchive(mirrorDistributor, mirrorCodename, client, timeout, token))
	{
		warn2(__("the release '%s' is end of life, but the archive mirror '%s' doesn't serve it, staying with regular mirrors"),
				mirrorCodename, traits.archiveUrl);
		return false;
	}
	archiveTierState = 1;
	logger->log(LogSubsystem::Session, 1, format2("'%s' is end of life, using the archive '%s'",
			mirrorCodename, traits.archiveUrl));
	return true;
}

vector< CandidateMirror > MirrorManagerImpl::readMirrorFile(const string& path) const
{
	vector< CandidateMirror > result;
	RequiredFile file(path, "r");
	string line;
	while (!file.getLine(line).eof())
	{
		auto url = trim(line);
		if (http::Uri::isNetworkUri(url))
		{
			result.push_back(CandidateMirror(url, DiscoverySource::MirrorFile));
		}
	}
	return result;
}

vector< CandidateMirror > MirrorManagerImpl::discover() const
{
	detect();
	const auto& traits = DistributorTraits::get(mirrorDistributor);

	vector< CandidateMirror > candidates;
	if (isArchiveTierActive())
	{
		warn2(__("skipping mirror discovery because '%s' is end of life"), release.toString());
		candidates.push_back(CandidateMirror(traits.archiveUrl, DiscoverySource::Archive));
		return candidates;
	}

	auto mirrorFilePath = config->getString("mirrorpilot::discovery::mirror-file");
	if (!mirrorFilePath.empty())
	{
		auto fileMirrors = readMirrorFile(mirrorFilePath);
		candidates.insert(candidates.end(), fileMirrors.begin(), fileMirrors.end());
	}
	// the reference mirror is missing from some mirror lists
	candidates.push_back(CandidateMirror(traits.getReferenceRoot(), DiscoverySource::Reference));
	try
	{
		candidates.push_back(CandidateMirror(findCurrentMirror(), DiscoverySource::Current));
	}
	catch (Exception& e)
	{
		warn2(__("unable to add the current mirror to the candidates: %s"), e.what());
	}

	DiscoveryContext context;
	context.client = &client;
	context.timeout = timeout;
	context.token = &token;
	context.debugging = config->getBool("debug::discovery");
	context.country = config->getString("mirrorpilot::discovery::country");
	if (context.country.empty())
	{
		context.country = discovery::detectCountry(context);
		if (context.country.empty())
		{
			warn2(__("unable to detect the country, using worldwide mirrors"));
		}
	}
	logger->log(LogSubsystem::Discovery, 2, format2("discovering %s mirrors, country '%s'",
			traits.name, context.country));
	auto discovered = traits.discover(context);
	candidates.insert(candidates.end(), discovered.begin(), discovered.end());

	vector< CandidateMirror > result;
	std::set< string > seen;
	for (const auto& candidate: candidates)
	{
		if (seen.insert(http::Uri::normalize(candidate.url)).second)
		{
			result.push_back(candidate);
		}
	}
	logger->log(LogSubsystem::Discovery, 1, format2("discovered %zu %s mirrors",
			result.size(), traits.name));
	return result;
}

}

MirrorManager::MirrorManager(const shared_ptr< const Config >& config, http::ProbeClient& client,
		const CancellationToken& token)
	: __impl(new internal::MirrorManagerImpl(config, client, token))
{}

MirrorManager::~MirrorManager()
{
	delete __impl;
}

string MirrorManager::getSourcesListPath() const
{
	return __impl->getSourcesListPath();
}

const Release& MirrorManager::getRelease() const
{
	__impl->detect();
	return __impl->release;
}

Distributor MirrorManager::getMirrorDistributor() const
{
	__impl->detect();
	return __impl->mirrorDistributor;
}

string MirrorManager::getMirrorCodename() const
{
	__impl->detect();
	return __impl->mirrorCodename;
}

string MirrorManager::getCurrentMirror() const
{
	return __impl->findCurrentMirror();
}

string MirrorManager::getArchitecture() const
{
	return __impl->detectArchitecture();
}

EolStatus MirrorManager::checkEol(Distributor distributor, const string& series) const
{
	return __impl->registry->checkEol(distributor, series, __impl->detectArchitecture(),
			__impl->client, __impl->timeout, __impl->token, time(NULL));
}

EolStatus MirrorManager::checkEol() const
{
	const auto& release = getRelease();
	return checkEol(release.distributor, release.series);
}

bool MirrorManager::isArchiveTierActive() const
{
	return __impl->isArchiveTierActive();
}

string MirrorManager::getArchiveMirror() const
{
	return DistributorTraits::get(getMirrorDistributor()).archiveUrl;
}

vector< CandidateMirror > MirrorManager::discover() const
{
	return __impl->discover();
}

vector< RankedMirror > MirrorManager::rank(const vector< CandidateMirror >& candidates,
		const ExclusionSet& exclusions) const
{
	auto maxMirrors = __impl->config->getInteger("mirrorpilot::ranker::max-mirrors");
	if (maxMirrors < 0)
	{
		fatal2(__("the option '%s' should not be negative"), "mirrorpilot::ranker::max-mirrors");
	}
	return __impl->ranker->rank(candidates, getMirrorCodename(), getMirrorDistributor(),
			exclusions, maxMirrors, __impl->token, isArchiveTierActive());
}

vector< RankedMirror > MirrorManager::discoverAndRank(const ExclusionSet& exclusions) const
{
	return rank(discover(), exclusions);
}

string MirrorManager::getBestMirror(const ExclusionSet& exclusions) const
{
	auto rankedMirrors = discoverAndRank(exclusions);
	if (rankedMirrors.empty() || rankedMirrors[0].status.availability != Availability::Available)
	{
		__impl->logger->loggedFatal2(internal::Logger::Subsystem::Ranking, 1,
				format2, "none of the %zu mirrors is available", rankedMirrors.size());
	}
	return rankedMirrors[0].candidate.url;
}

string MirrorManager::generateSourcesList(const string& mirror, bool enableSources) const
{
	const auto& traits = DistributorTraits::get(getMirrorDistributor());
	return mirrorpilot::generateSourcesList(getMirrorDistributor(), mirror, getMirrorCodename(),
			traits.defaultSuites, traits.defaultComponents, enableSources);
}

string MirrorManager::prepareSourcesList(const string& newMirror) const
{
	if (!http::Uri::isNetworkUri(newMirror))
	{
		fatal2(__("invalid mirror URL '%s'"), newMirror);
	}
	const auto& traits = DistributorTraits::get(getMirrorDistributor());
	auto sourcesList = SourcesList::readFile(getSourcesListPath());

	vector< string > oldMirrors;
	try
	{
		oldMirrors.push_back(getCurrentMirror());
	}
	catch (Exception&)
	{
		warn2(__("generating a new sources list"));
		return generateSourcesList(newMirror);
	}
	if (traits.hasArchiveTier() &&
			http::Uri::normalize(newMirror) == http::Uri::normalize(traits.archiveUrl))
	{
		// the security mirror drops retired releases too
		oldMirrors.push_back(traits.securityUrl);
		oldMirrors.push_back("http://" + http::Uri(traits.securityUrl).getHost());
	}

	if (!sourcesList.replaceMirror(oldMirrors, newMirror))
	{
		return generateSourcesList(newMirror);
	}
	return sourcesList.toString();
}

update::UpdateResult MirrorManager::smartUpdate(const vector< string >& extraArguments,
		const ExclusionSet& exclusions, update::CommandRunner& runner,
		update::MirrorSelector& selector, bool allowMirrorSwitching,
		const update::Orchestrator::Sleeper& sleeper) const
{
	auto classifier = update::FailureClassifier::fromConfig(*__impl->config);
	auto options = update::OrchestratorOptions::fromConfig(*__impl->config);
	options.switchMirrors = options.switchMirrors && allowMirrorSwitching;
	update::Orchestrator::Sleeper effectiveSleeper = sleeper;
	if (!effectiveSleeper)
	{
		effectiveSleeper = [](unsigned int seconds) { ::sleep(seconds); };
	}
	update::Orchestrator orchestrator(runner, selector, classifier, options,
			effectiveSleeper, __impl->logger.get());
	return orchestrator.run(extraArguments, exclusions);
}

}
