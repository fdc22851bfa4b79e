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
#include <cstdio>
#include <cstdlib>
#include <ctime>

#include <unistd.h>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <mirrorpilot/registry.hpp>
#include <mirrorpilot/cancellation.hpp>
#include <mirrorpilot/file.hpp>

#include "mocks.hpp"

using namespace mirrorpilot;
using mirrorpilot::test::MockProbeClient;
using http::ProbeOutcome;
using ::testing::_;
using ::testing::Return;

namespace {

time_t date(int year, int month, int day)
{
	struct tm tm = {};
	tm.tm_year = year - 1900;
	tm.tm_mon = month - 1;
	tm.tm_mday = day;
	return timegm(&tm);
}

ProbeOutcome outcome(ProbeOutcome::Type type)
{
	ProbeOutcome result;
	result.type = type;
	return result;
}

}

class ReleaseRegistryTest: public ::testing::Test
{
 protected:
	ReleaseRegistry registry;
	MockProbeClient client;
	CancellationToken token;

	EolStatus checkEol(Distributor distributor, const string& series, const string& architecture, time_t now)
	{
		return registry.checkEol(distributor, series, architecture, client, 5, token, now);
	}
};

TEST_F(ReleaseRegistryTest, KnownDateIsDecisive)
{
	EXPECT_CALL(client, probe(_, _, _, _)).Times(0);
	EXPECT_EQ(EolStatus::EndOfLife, checkEol(Distributor::Ubuntu, "trusty", "amd64", date(2020, 1, 1)));
	EXPECT_EQ(EolStatus::Supported, checkEol(Distributor::Ubuntu, "noble", "amd64", date(2025, 1, 1)));
	EXPECT_EQ(EolStatus::EndOfLife, checkEol(Distributor::LinuxMint, "sarah", "", date(2022, 1, 1)));
}

TEST_F(ReleaseRegistryTest, LongTermSupportDependsOnArchitecture)
{
	EXPECT_CALL(client, probe(_, _, _, _)).Times(0);
	auto now = date(2023, 6, 1);
	EXPECT_EQ(EolStatus::Supported, checkEol(Distributor::Debian, "buster", "amd64", now));
	EXPECT_EQ(EolStatus::Supported, checkEol(Distributor::Debian, "buster", "armhf", now));
	EXPECT_EQ(EolStatus::EndOfLife, checkEol(Distributor::Debian, "buster", "arm64", now));
	EXPECT_EQ(EolStatus::Supported, checkEol(Distributor::Debian, "buster", "", now));
	EXPECT_EQ(EolStatus::EndOfLife, checkEol(Distributor::Debian, "buster", "amd64", date(2024, 7, 1)));
}

TEST_F(ReleaseRegistryTest, RollingReleaseIsSupported)
{
	EXPECT_CALL(client, probe(_, _, _, _)).Times(0);
	EXPECT_EQ(EolStatus::Supported, checkEol(Distributor::Debian, "sid", "amd64", date(2030, 1, 1)));
}

TEST_F(ReleaseRegistryTest, SecurityMirrorIsAskedWithoutDate)
{
	const string url = "http://security.debian.org/debian-security/dists/trixie-security/Release";
	EXPECT_CALL(client, probe(url, http::Method::Head, 5u, _))
			.WillOnce(Return(outcome(ProbeOutcome::Type::Success)))
			.WillOnce(Return(outcome(ProbeOutcome::Type::NotFound)))
			.WillOnce(Return(outcome(ProbeOutcome::Type::Unreachable)))
			.WillOnce(Return(outcome(ProbeOutcome::Type::InvalidResponse)));
	auto now = date(2026, 1, 1);
	EXPECT_EQ(EolStatus::Supported, checkEol(Distributor::Debian, "trixie", "amd64", now));
	EXPECT_EQ(EolStatus::EndOfLife, checkEol(Distributor::Debian, "trixie", "amd64", now));
	EXPECT_EQ(EolStatus::Unknown, checkEol(Distributor::Debian, "trixie", "amd64", now));
	EXPECT_EQ(EolStatus::Unknown, checkEol(Distributor::Debian, "trixie", "amd64", now));
}

TEST_F(ReleaseRegistryTest, UnknownSeriesIsAskedToo)
{
	EXPECT_CALL(client, probe("http://security.ubuntu.com/ubuntu/dists/zenith-security/Release", _, _, _))
			.WillOnce(Return(outcome(ProbeOutcome::Type::NotFound)));
	EXPECT_EQ(EolStatus::EndOfLife, checkEol(Distributor::Ubuntu, "zenith", "amd64", date(2030, 1, 1)));
}

TEST_F(ReleaseRegistryTest, SecurityIndexUrls)
{
	EXPECT_EQ("http://security.debian.org/debian-security/dists/stretch/updates/Release",
			registry.getSecurityIndexUrl(Distributor::Debian, "stretch"));
	EXPECT_EQ("http://security.debian.org/debian-security/dists/bullseye-security/Release",
			registry.getSecurityIndexUrl(Distributor::Debian, "Bullseye"));
	EXPECT_EQ("http://security.ubuntu.com/ubuntu/dists/focal-security/Release",
			registry.getSecurityIndexUrl(Distributor::Ubuntu, "focal"));
}

TEST_F(ReleaseRegistryTest, ArchiveTier)
{
	EXPECT_CALL(client, probe("http://archive.debian.org/debian/dists/stretch/Release", http::Method::Head, _, _))
			.WillOnce(Return(outcome(ProbeOutcome::Type::Success)));
	EXPECT_TRUE(registry.isServedByArchive(Distributor::Debian, "stretch", client, 5, token));
	EXPECT_FALSE(registry.isServedByArchive(Distributor::LinuxMint, "sarah", client, 5, token));
}

TEST_F(ReleaseRegistryTest, Lookup)
{
	auto xenial = registry.find(Distributor::Ubuntu, "Xenial");
	ASSERT_TRUE(xenial);
	EXPECT_EQ("16.04", xenial->version);
	EXPECT_TRUE(xenial->isLts);
	EXPECT_FALSE(registry.find(Distributor::Debian, "xenial"));

	auto sylvia = registry.find(Distributor::LinuxMint, "sylvia");
	ASSERT_TRUE(sylvia);
	EXPECT_EQ("xenial", sylvia->compatibleSeries);

	auto releases = registry.getReleases(Distributor::Debian);
	ASSERT_FALSE(releases.empty());
	for (const auto& release: releases)
	{
		EXPECT_EQ(Distributor::Debian, release.distributor);
	}
}

TEST_F(ReleaseRegistryTest, Coercion)
{
	EXPECT_EQ("xenial", registry.coerceRelease(Distributor::Ubuntu, "Xerus").series);
	EXPECT_EQ("xenial", registry.coerceRelease("16.04").series);
	EXPECT_EQ("bookworm", registry.coerceRelease(Distributor::Debian, "12").series);
	EXPECT_EQ(Distributor::LinuxMint, registry.coerceRelease("Sylvia").distributor);
	EXPECT_THROW(registry.coerceRelease("no-such-release"), Exception);
	// matches codenames of many releases
	EXPECT_THROW(registry.coerceRelease(Distributor::Ubuntu, "a"), Exception);
	EXPECT_EQ(1u, registry.findMatches("focal").size());
}

TEST(ReleaseRegistryCsvTest, Merge)
{
	char directoryTemplate[] = "/tmp/mirrorpilot-registry-XXXXXX";
	ASSERT_TRUE(mkdtemp(directoryTemplate));
	string directory = directoryTemplate;
	string path = directory + "/ubuntu.csv";
	{
		RequiredFile file(path, "w");
		file.put("version,codename,series,created,release,eol,eol-server,eol-esm\n"
				"16.04 LTS,Xenial Xerus,xenial,2015-10-22,2016-04-21,2021-04-21,2021-04-21,2026-04-23\n"
				"99.04,Zesty Zebra,zenith,2098-10-01,2099-04-01,2100-01-01\n");
		file.close();
	}

	ReleaseRegistry registry(directory);
	auto zenith = registry.find(Distributor::Ubuntu, "zenith");
	ASSERT_TRUE(zenith);
	EXPECT_EQ("99.04", zenith->version);
	EXPECT_EQ("Zesty Zebra", zenith->codename);
	EXPECT_FALSE(zenith->isLts);

	auto xenial = registry.find(Distributor::Ubuntu, "xenial");
	ASSERT_TRUE(xenial);
	EXPECT_EQ("16.04", xenial->version);
	EXPECT_TRUE(xenial->isLts);

	unlink(path.c_str());
	rmdir(directory.c_str());
}
