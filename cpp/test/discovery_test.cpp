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
#include <gtest/gtest.h>

#include <mirrorpilot/discovery.hpp>
#include <mirrorpilot/cancellation.hpp>

#include "mocks.hpp"

using namespace mirrorpilot;
using mirrorpilot::test::FakeProbeClient;
using http::ProbeOutcome;

namespace {

vector< string > urls(const vector< CandidateMirror >& mirrors)
{
	vector< string > result;
	for (const auto& mirror: mirrors)
	{
		result.push_back(mirror.url);
	}
	return result;
}

const char* const debianPage =
		"<html><body>\n"
		"<h2>Primary Debian mirror sites</h2>\n"
		"<table border=\"0\" class=\"center\">\n"
		"<tr><th>Country</th><th>Site</th><th>Architectures</th></tr>\n"
		"<tr><td>Austria</td><td><a rel=\"nofollow\" href=\"http://ftp.at.debian.org/debian/\">ftp.at.debian.org</a></td><td>amd64 arm64</td></tr>\n"
		"<tr><td>Germany</td><td><a rel=\"nofollow\" href=\"http://ftp.de.debian.org/debian/\">ftp.de.debian.org</a></td><td>amd64 arm64</td></tr>\n"
		"<tr><td>Netherlands</td><td><a rel=\"nofollow\" href=\"http://ftp.nl.debian.org/debian/\">ftp.nl.debian.org</a></td><td>amd64 arm64</td></tr>\n"
		"</table>\n"
		"<h2>Complete list of mirrors</h2>\n"
		"<table border=\"0\" class=\"center\">\n"
		"<tr><td colspan=\"2\"><big><strong>Germany</strong></big></td></tr>\n"
		"<tr><td><a href=\"http://ftp.de.debian.org/debian/\">ftp.de.debian.org</a></td><td>amd64</td></tr>\n"
		"<tr><td><a href='https://debian.example.de/debian/'>debian.example.de</a></td><td>amd64</td></tr>\n"
		"<tr><td colspan=\"2\"><big><strong>Netherlands</strong></big></td></tr>\n"
		"<tr><td><a href=http://mirror.example.nl/debian/>mirror.example.nl</a></td><td>amd64</td></tr>\n"
		"<tr><td><a href=\"http://debian.example.nl/debian/\">debian.example.nl</a></td><td>amd64</td></tr>\n"
		"<tr><td><a href=\"http://ftp.nluug.example.nl/os/debian/\">ftp.nluug.example.nl</a></td><td>amd64</td></tr>\n"
		"</table>\n"
		"</body></html>\n";

const char* const launchpadPage =
		"<table class=\"listing\" id=\"mirrors_list\">\n"
		"<tbody>\n"
		"<tr class=\"head\"><th colspan=\"2\">Germany</th><th>1 Gbps</th><th></th></tr>\n"
		"<tr><td><a href=\"https://launchpad.net/ubuntu/+mirror/a\">A</a></td>"
		"<td><a href=\"http://a.example.de/ubuntu/\">http</a></td><td>1 Gbps</td><td><span class=\"distromirrorstatusUP\">Up to date</span></td></tr>\n"
		"<tr><td><a href=\"https://launchpad.net/ubuntu/+mirror/b\">B</a></td>"
		"<td><a href=\"https://b.example.de/ubuntu/\">https</a></td><td>100 Mbps</td><td><span class=\"distromirrorstatusSIXHOURSBEHIND\">Six hours behind</span></td></tr>\n"
		"<tr class=\"head\"><th colspan=\"2\">Netherlands</th><th>10 Gbps</th><th></th></tr>\n"
		"<tr><td><a href=\"https://launchpad.net/ubuntu/+mirror/c\">C</a></td>"
		"<td><a href=\"http://c.example.nl/ubuntu/\">http</a></td><td>10 Gbps</td><td><span>Unknown</span></td></tr>\n"
		"</tbody>\n"
		"</table>\n";

const char* const mintPage =
		"<table><tr><td>menu</td></tr></table>\n"
		"<table><tr><td>news</td></tr></table>\n"
		"<table>\n"
		"<tr><td><img src=\"flags/us.png\"> USA</td><td>Example University</td><td>https://mint.example.edu/linuxmint/packages</td></tr>\n"
		"<tr><td><img src=\"flags/us.png\"> USA</td><td>Example Hosting</td><td>http://mirror.example.com/linuxmint-packages/</td></tr>\n"
		"<tr><td><img src=\"flags/de.png\"> Germany</td><td>Example GmbH</td><td>https://mint.example.de/packages</td></tr>\n"
		"<tr><td><img src=\"flags/ww.png\"> Worldwide</td><td>Example CDN</td><td>http://mint.example-cdn.net/packages</td></tr>\n"
		"</table>\n";

}

TEST(DebianDiscoveryTest, CountryMirrors)
{
	EXPECT_EQ((vector< string >{ "http://mirror.example.nl/debian/", "http://debian.example.nl/debian/",
			"http://ftp.nluug.example.nl/os/debian/" }),
			urls(discovery::parseDebianMirrorPage(debianPage, "Netherlands")));
}

TEST(DebianDiscoveryTest, FewCountryMirrorsArePaddedWithPrimaryOnes)
{
	auto mirrors = discovery::parseDebianMirrorPage(debianPage, "Germany");
	EXPECT_EQ((vector< string >{ "http://ftp.de.debian.org/debian/", "https://debian.example.de/debian/",
			"http://ftp.at.debian.org/debian/", "http://ftp.nl.debian.org/debian/" }), urls(mirrors));
	EXPECT_EQ(DiscoverySource::MirrorList, mirrors[0].source);
}

TEST(DebianDiscoveryTest, UnknownCountry)
{
	EXPECT_EQ(3u, discovery::parseDebianMirrorPage(debianPage, "").size());
	EXPECT_EQ(3u, discovery::parseDebianMirrorPage(debianPage, "Atlantis").size());
}

TEST(DebianDiscoveryTest, BrokenPage)
{
	EXPECT_THROW(discovery::parseDebianMirrorPage("<html>maintenance</html>", "Germany"), Exception);
}

TEST(UbuntuDiscoveryTest, FlatList)
{
	auto mirrors = discovery::parseUbuntuMirrorList(
			"http://a.example.org/ubuntu/\n"
			"  https://b.example.org/ubuntu/  \n"
			"\n"
			"rsync://c.example.org/ubuntu/\n"
			"http://a.example.org/ubuntu\n");
	EXPECT_EQ((vector< string >{ "http://a.example.org/ubuntu/", "https://b.example.org/ubuntu/" }), urls(mirrors));
}

TEST(UbuntuDiscoveryTest, LaunchpadCountry)
{
	auto mirrors = discovery::parseLaunchpadMirrorPage(launchpadPage, "Germany");
	ASSERT_EQ(2u, mirrors.size());
	EXPECT_EQ("http://a.example.de/ubuntu/", mirrors[0].url);
	EXPECT_EQ(DiscoverySource::Launchpad, mirrors[0].source);
	EXPECT_TRUE(mirrors[0].hasStalenessHint);
	EXPECT_EQ(0u, mirrors[0].stalenessHint);
	EXPECT_EQ("https://b.example.de/ubuntu/", mirrors[1].url);
	EXPECT_EQ(6*3600u, mirrors[1].stalenessHint);
}

TEST(UbuntuDiscoveryTest, LaunchpadUnknownCountry)
{
	auto mirrors = discovery::parseLaunchpadMirrorPage(launchpadPage, "Atlantis");
	ASSERT_EQ(3u, mirrors.size());
	EXPECT_EQ("http://c.example.nl/ubuntu/", mirrors[2].url);
	EXPECT_FALSE(mirrors[2].hasStalenessHint);
}

TEST(UbuntuDiscoveryTest, FallsBackToLaunchpad)
{
	FakeProbeClient client;
	client.setOutcome("http://mirrors.ubuntu.com/mirrors.txt", ProbeOutcome::Type::NotFound, 404);
	client.setOutcome("https://launchpad.net/ubuntu/+archivemirrors", ProbeOutcome::Type::Success, 200, launchpadPage);
	CancellationToken token;

	DiscoveryContext context;
	context.client = &client;
	context.timeout = 5;
	context.country = "Netherlands";
	context.token = &token;
	context.debugging = false;

	EXPECT_EQ((vector< string >{ "http://c.example.nl/ubuntu/" }), urls(discovery::discoverUbuntu(context)));

	client.setOutcome("http://mirrors.ubuntu.com/mirrors.txt", ProbeOutcome::Type::Success, 200,
			"http://x.example.org/ubuntu/\nhttp://y.example.org/ubuntu/\n");
	EXPECT_EQ((vector< string >{ "http://x.example.org/ubuntu/", "http://y.example.org/ubuntu/" }),
			urls(discovery::discoverUbuntu(context)));
}

TEST(DebianDiscoveryTest, CutPageIsAnError)
{
	FakeProbeClient client;
	client.setOutcome("https://www.debian.org/mirror/list", ProbeOutcome::Type::Success, 200, debianPage);
	client.setTruncated("https://www.debian.org/mirror/list");
	CancellationToken token;

	DiscoveryContext context;
	context.client = &client;
	context.timeout = 5;
	context.country = "Netherlands";
	context.token = &token;
	context.debugging = false;

	EXPECT_THROW(discovery::discoverDebian(context), Exception);
}

TEST(LinuxMintDiscoveryTest, Country)
{
	EXPECT_EQ((vector< string >{ "https://mint.example.edu/linuxmint/packages",
			"http://mirror.example.com/linuxmint-packages/", "http://mint.example-cdn.net/packages" }),
			urls(discovery::parseLinuxMintMirrorPage(mintPage, "United States")));
	EXPECT_EQ((vector< string >{ "http://mint.example-cdn.net/packages" }),
			urls(discovery::parseLinuxMintMirrorPage(mintPage, "")));
	EXPECT_THROW(discovery::parseLinuxMintMirrorPage("<table></table>", "Germany"), Exception);
}

TEST(GeoIpTest, ParseCountry)
{
	EXPECT_EQ("Netherlands", discovery::parseCountry(
			"{\"ip\": \"192.0.2.1\", \"country_name\": \"Netherlands\", \"country\": \"NL\"}", "country_name"));
	EXPECT_EQ("", discovery::parseCountry("{\"status\": \"fail\"}", "country"));
	EXPECT_EQ("", discovery::parseCountry("Too many requests", "country"));
}
