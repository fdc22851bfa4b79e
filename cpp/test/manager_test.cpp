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

#include <cstdio>
#include <cstdlib>

#include <gtest/gtest.h>

#include <mirrorpilot/manager.hpp>
#include <mirrorpilot/config.hpp>
#include <mirrorpilot/exclusionset.hpp>

#include "mocks.hpp"

using namespace mirrorpilot;
using mirrorpilot::test::FakeProbeClient;
using http::ProbeOutcome;

namespace {

const char* const sourcesList =
		"deb http://deb.debian.org/debian sid main contrib\n"
		"deb-src http://deb.debian.org/debian sid main\n"
		"deb cdrom:[Debian GNU/Linux]/ sid main\n";

const char* const mirrorPage =
		"<h2>Primary Debian mirror sites</h2>\n"
		"<table>\n"
		"<tr><td>Netherlands</td><td><a href=\"http://ftp.nl.debian.org/debian/\">ftp.nl.debian.org</a></td></tr>\n"
		"</table>\n"
		"<h2>Complete list of mirrors</h2>\n"
		"<table>\n"
		"<tr><td colspan=\"2\"><big><strong>Netherlands</strong></big></td></tr>\n"
		"<tr><td><a href=\"http://mirror.example.nl/debian/\">mirror.example.nl</a></td></tr>\n"
		"<tr><td><a href=\"http://deb.debian.org/debian/\">deb.debian.org</a></td></tr>\n"
		"<tr><td><a href=\"http://debian.example.nl/debian/\">debian.example.nl</a></td></tr>\n"
		"</table>\n";

const char* const referenceIndex = "Origin: Debian\nDate: Sat, 10 Jun 2023 09:30:00 UTC\n";

string writeTemporaryFile(const string& contents)
{
	char pathTemplate[] = "/tmp/mirrorpilot-test.XXXXXX";
	int fd = mkstemp(pathTemplate);
	if (fd == -1)
	{
		return string();
	}
	auto written = write(fd, contents.c_str(), contents.size());
	close(fd);
	if (written != (ssize_t)contents.size())
	{
		return string();
	}
	return pathTemplate;
}

string indexUrl(const string& mirror)
{
	return mirror + "/dists/sid-updates/Release";
}

}

class MirrorManagerTest: public ::testing::Test
{
 protected:
	FakeProbeClient client;
	CancellationToken token;
	shared_ptr< Config > config;
	string sourcesListPath;
	string mirrorFilePath;

	void SetUp()
	{
		sourcesListPath = writeTemporaryFile(sourcesList);
		mirrorFilePath = writeTemporaryFile("# local mirrors\nhttp://file.example.org/debian/\nfile:///srv/debian\n");
		ASSERT_FALSE(sourcesListPath.empty());
		ASSERT_FALSE(mirrorFilePath.empty());

		config.reset(new Config);
		config->setScalar("mirrorpilot::log", "no");
		config->setScalar("mirrorpilot::sources-list", sourcesListPath);
		config->setScalar("mirrorpilot::directory::distro-info", "/nonexistent");
		config->setScalar("mirrorpilot::architecture", "amd64");
		config->setScalar("mirrorpilot::discovery::country", "Netherlands");
		config->setScalar("mirrorpilot::discovery::mirror-file", mirrorFilePath);

		client.setOutcome("https://www.debian.org/mirror/list", ProbeOutcome::Type::Success, 200, mirrorPage);
		client.setOutcome("http://ftp.debian.org/debian/dists/sid-updates/InRelease",
				ProbeOutcome::Type::Success, 200, referenceIndex);
		client.setOutcome(indexUrl("http://mirror.example.nl/debian"), ProbeOutcome::Type::Success, 200, referenceIndex);
		client.setRate(indexUrl("http://mirror.example.nl/debian"), 900*1024);
		client.setOutcome(indexUrl("http://debian.example.nl/debian"), ProbeOutcome::Type::Success, 200, referenceIndex);
		client.setRate(indexUrl("http://debian.example.nl/debian"), 300*1024);
	}
	void TearDown()
	{
		unlink(sourcesListPath.c_str());
		unlink(mirrorFilePath.c_str());
	}
};

TEST_F(MirrorManagerTest, DetectsRelease)
{
	MirrorManager manager(config, client, token);
	EXPECT_EQ(Distributor::Debian, manager.getRelease().distributor);
	EXPECT_EQ("sid", manager.getRelease().series);
	EXPECT_EQ("sid", manager.getMirrorCodename());
	EXPECT_EQ("http://deb.debian.org/debian", manager.getCurrentMirror());
	EXPECT_EQ("amd64", manager.getArchitecture());
	EXPECT_EQ(EolStatus::Supported, manager.checkEol());
	EXPECT_FALSE(manager.isArchiveTierActive());
}

TEST_F(MirrorManagerTest, ConfiguredCodenameWins)
{
	config->setScalar("mirrorpilot::codename", "bookworm");
	MirrorManager manager(config, client, token);
	EXPECT_EQ("bookworm", manager.getMirrorCodename());
}

TEST_F(MirrorManagerTest, DiscoveryOrder)
{
	MirrorManager manager(config, client, token);
	auto candidates = manager.discover();

	vector< string > urls;
	for (const auto& candidate: candidates)
	{
		urls.push_back(candidate.url);
	}
	EXPECT_EQ((vector< string >{ "http://file.example.org/debian/", "http://ftp.debian.org/debian",
			"http://deb.debian.org/debian", "http://mirror.example.nl/debian/", "http://debian.example.nl/debian/" }),
			urls);
	EXPECT_EQ(DiscoverySource::MirrorFile, candidates[0].source);
	EXPECT_EQ(DiscoverySource::Reference, candidates[1].source);
	EXPECT_EQ(DiscoverySource::Current, candidates[2].source);
}

TEST_F(MirrorManagerTest, BestMirror)
{
	MirrorManager manager(config, client, token);
	EXPECT_EQ("http://mirror.example.nl/debian/", manager.getBestMirror(ExclusionSet()));
	EXPECT_EQ("http://debian.example.nl/debian/",
			manager.getBestMirror(ExclusionSet({ "*mirror.example.nl*" })));
	EXPECT_THROW(manager.getBestMirror(ExclusionSet({ "*.example.nl*" })), Exception);
}

TEST_F(MirrorManagerTest, PrepareSourcesList)
{
	MirrorManager manager(config, client, token);
	EXPECT_EQ(
			"deb http://mirror.example.nl/debian/ sid main contrib\n"
			"deb-src http://mirror.example.nl/debian/ sid main\n"
			"deb cdrom:[Debian GNU/Linux]/ sid main\n",
			manager.prepareSourcesList("http://mirror.example.nl/debian/"));
	EXPECT_THROW(manager.prepareSourcesList("mirror.example.nl"), Exception);
}

TEST_F(MirrorManagerTest, MissingSourcesList)
{
	config->setScalar("mirrorpilot::sources-list", "/nonexistent/sources.list");
	MirrorManager manager(config, client, token);
	EXPECT_THROW(manager.getRelease(), Exception);
}
