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
#include <map>

#include <common/common.hpp>

#include <mirrorpilot/distributor.hpp>
#include <mirrorpilot/discovery.hpp>
#include <mirrorpilot/http/uri.hpp>

#include <internal/common.hpp>

namespace mirrorpilot {

namespace {

DistributorTraits makeDebianTraits()
{
	DistributorTraits result;
	result.distributor = Distributor::Debian;
	result.name = "debian";
	result.displayName = "Debian";
	result.mirrorListUrl = "https://www.debian.org/mirror/list";
	result.securityUrl = "http://security.debian.org/debian-security/";
	result.archiveUrl = "http://archive.debian.org/debian/";
	result.referenceTemplate = "http://ftp.debian.org/debian/dists/codename-updates/InRelease";
	result.indexSuffix = "-updates";
	result.validSuites = { "release", "security", "updates", "backports", "proposed-updates" };
	result.defaultSuites = { "release", "security", "updates" };
	result.validComponents = { "main", "contrib", "non-free", "non-free-firmware" };
	result.defaultComponents = { "main", "contrib", "non-free" };
	result.discover = discovery::discoverDebian;
	return result;
}

DistributorTraits makeUbuntuTraits()
{
	DistributorTraits result;
	result.distributor = Distributor::Ubuntu;
	result.name = "ubuntu";
	result.displayName = "Ubuntu";
	result.mirrorListUrl = "http://mirrors.ubuntu.com/mirrors.txt";
	result.fallbackMirrorListUrl = "https://launchpad.net/ubuntu/+archivemirrors";
	result.securityUrl = "http://security.ubuntu.com/ubuntu/";
	result.archiveUrl = "http://old-releases.ubuntu.com/ubuntu/";
	result.referenceTemplate = "http://archive.ubuntu.com/ubuntu/dists/codename-security/InRelease";
	result.indexSuffix = "-security";
	result.validSuites = { "release", "security", "updates", "backports", "proposed" };
	result.defaultSuites = { "release", "updates", "backports", "security" };
	result.validComponents = { "main", "restricted", "universe", "multiverse" };
	result.defaultComponents = result.validComponents;
	result.discover = discovery::discoverUbuntu;
	return result;
}

DistributorTraits makeLinuxMintTraits()
{
	DistributorTraits result;
	result.distributor = Distributor::LinuxMint;
	result.name = "linuxmint";
	result.displayName = "Linux Mint";
	result.mirrorListUrl = "https://linuxmint.com/mirrors.php";
	result.securityUrl = "http://security.ubuntu.com/ubuntu/";
	// no archive tier
	result.referenceTemplate = "http://packages.linuxmint.com/dists/codename/Release";
	result.validSuites = { "release" };
	result.defaultSuites = { "release" };
	result.validComponents = { "main", "upstream", "import", "backport" };
	result.defaultComponents = result.validComponents;
	result.discover = discovery::discoverLinuxMint;
	return result;
}

}

bool DistributorTraits::hasArchiveTier() const
{
	return !archiveUrl.empty();
}

string DistributorTraits::getReferenceUrl(const string& codename) const
{
	auto result = referenceTemplate;
	auto position = result.find("/codename");
	if (position == string::npos)
	{
		fatal2i("no codename placeholder in the reference template '%s'", referenceTemplate);
	}
	result.replace(position + 1, 8, codename);
	return result;
}

string DistributorTraits::getReferenceRoot() const
{
	auto position = referenceTemplate.find("/dists/");
	if (position == string::npos)
	{
		fatal2i("no 'dists' path in the reference template '%s'", referenceTemplate);
	}
	return referenceTemplate.substr(0, position);
}

string DistributorTraits::getIndexUrl(const string& mirror, const string& codename) const
{
	return http::Uri::normalize(mirror) + "/dists/" + codename + indexSuffix + "/Release";
}

const DistributorTraits& DistributorTraits::get(Distributor distributor)
{
	static const std::map< Distributor, DistributorTraits > table =
	{
		{ Distributor::Debian, makeDebianTraits() },
		{ Distributor::Ubuntu, makeUbuntuTraits() },
		{ Distributor::LinuxMint, makeLinuxMintTraits() },
	};
	auto it = table.find(distributor);
	if (it == table.end())
	{
		fatal2i("unknown distributor %d", (int)distributor);
	}
	return it->second;
}

const char* getDistributorName(Distributor distributor)
{
	return DistributorTraits::get(distributor).name;
}

Distributor parseDistributor(const string& name)
{
	auto lowered = internal::toLower(internal::trim(name));
	if (lowered == "debian")
	{
		return Distributor::Debian;
	}
	if (lowered == "ubuntu")
	{
		return Distributor::Ubuntu;
	}
	if (lowered == "linuxmint" || lowered == "mint" || lowered == "linux mint")
	{
		return Distributor::LinuxMint;
	}
	fatal2(__("unsupported distributor '%s', supported are: debian, ubuntu, linuxmint"), name);
	__builtin_unreachable();
}

}
