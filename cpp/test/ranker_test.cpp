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
#include <gmock/gmock.h>

#include <mirrorpilot/ranker.hpp>
#include <mirrorpilot/cancellation.hpp>
#include <mirrorpilot/exclusionset.hpp>

#include "mocks.hpp"

using namespace mirrorpilot;
using mirrorpilot::test::FakeProbeClient;
using mirrorpilot::test::MockProbeClient;
using http::ProbeOutcome;

namespace {

const char* const referenceUrl = "http://ftp.debian.org/debian/dists/bookworm-updates/InRelease";
const char* const referenceIndex =
		"-----BEGIN PGP SIGNED MESSAGE-----\n"
		"Hash: SHA256\n"
		"\n"
		"Origin: Debian\n"
		"Suite: stable-updates\n"
		"Codename: bookworm-updates\n"
		"Date: Sat, 10 Jun 2023 09:30:00 UTC\n";
const char* const freshIndex = "Origin: Debian\nDate: Sat, 10 Jun 2023 09:30:00 UTC\n";
const char* const staleIndex = "Origin: Debian\nDate: Sat, 10 Jun 2023 03:30:00 UTC\n";

string indexUrl(const string& mirror)
{
	return mirror + "/dists/bookworm-updates/Release";
}

vector< CandidateMirror > candidates(const vector< string >& urls)
{
	vector< CandidateMirror > result;
	for (const auto& url: urls)
	{
		result.push_back(CandidateMirror(url, DiscoverySource::MirrorList));
	}
	return result;
}

vector< string > urls(const vector< RankedMirror >& mirrors)
{
	vector< string > result;
	for (const auto& mirror: mirrors)
	{
		result.push_back(mirror.candidate.url);
	}
	return result;
}

}

class RankerTest: public ::testing::Test
{
 protected:
	FakeProbeClient client;
	RankerOptions options;
	CancellationToken token;

	RankerTest()
	{
		options.concurrency = 2;
		client.setOutcome(referenceUrl, ProbeOutcome::Type::Success, 200, referenceIndex);

		client.setOutcome(indexUrl("http://a.example.org/debian"), ProbeOutcome::Type::Success, 200, freshIndex);
		client.setRate(indexUrl("http://a.example.org/debian"), 500*1024);
		client.setOutcome(indexUrl("http://b.example.org/debian"), ProbeOutcome::Type::Success, 200, freshIndex);
		client.setRate(indexUrl("http://b.example.org/debian"), 900*1024);
		client.setOutcome(indexUrl("http://c.example.org/debian"), ProbeOutcome::Type::Unreachable);
	}

	vector< RankedMirror > rank(const vector< string >& mirrorUrls,
			const ExclusionSet& exclusions = ExclusionSet(), size_t maxProbeCount = 0)
	{
		Ranker ranker(client, options);
		return ranker.rank(candidates(mirrorUrls), "bookworm", Distributor::Debian,
				exclusions, maxProbeCount, token);
	}
};

TEST_F(RankerTest, OrdersByBandwidth)
{
	auto result = rank({ "http://a.example.org/debian", "http://b.example.org/debian/", "http://c.example.org/debian" });
	ASSERT_EQ(3u, result.size());
	EXPECT_EQ((vector< string >{ "http://b.example.org/debian/", "http://a.example.org/debian",
			"http://c.example.org/debian" }), urls(result));

	EXPECT_EQ(1u, result[0].rank);
	EXPECT_EQ(Availability::Available, result[0].status.availability);
	EXPECT_TRUE(result[0].status.hasBandwidth);
	EXPECT_DOUBLE_EQ(900*1024, result[0].status.bandwidth);
	EXPECT_EQ(Staleness::Kind::UpToDate, result[0].status.staleness.kind);

	EXPECT_EQ(3u, result[2].rank);
	EXPECT_EQ(Availability::Unknown, result[2].status.availability);
	EXPECT_FALSE(result[2].status.hasBandwidth);
}

TEST_F(RankerTest, Idempotent)
{
	vector< string > mirrorUrls = { "http://c.example.org/debian", "http://a.example.org/debian", "http://b.example.org/debian" };
	EXPECT_EQ(urls(rank(mirrorUrls)), urls(rank(mirrorUrls)));
}

TEST_F(RankerTest, UpdatingMirrorsGoAfterIdleOnes)
{
	client.setOutcome("http://b.example.org/debian/Archive-Update-in-Progress-b.example.org",
			ProbeOutcome::Type::Success, 200);
	auto result = rank({ "http://c.example.org/debian", "http://b.example.org/debian", "http://a.example.org/debian" });
	EXPECT_EQ((vector< string >{ "http://a.example.org/debian", "http://b.example.org/debian",
			"http://c.example.org/debian" }), urls(result));
	EXPECT_TRUE(result[1].status.isUpdating);
	EXPECT_EQ(1, result[1].status.getTier());
	// bandwidth is only measured for the first tier
	EXPECT_FALSE(result[1].status.hasBandwidth);
}

TEST_F(RankerTest, Staleness)
{
	client.setOutcome(indexUrl("http://d.example.org/debian"), ProbeOutcome::Type::Success, 200, staleIndex);
	auto result = rank({ "http://d.example.org/debian" });
	ASSERT_EQ(1u, result.size());
	EXPECT_EQ(Availability::Available, result[0].status.availability);
	EXPECT_EQ(Staleness::Kind::Behind, result[0].status.staleness.kind);
	EXPECT_EQ(6*3600u, result[0].status.staleness.seconds);
}

TEST_F(RankerTest, ResponseWithoutDateIsUnavailable)
{
	client.setOutcome(indexUrl("http://parked.example.org/debian"), ProbeOutcome::Type::Success, 200,
			"<html><body>This domain is for sale</body></html>");
	client.setOutcome(indexUrl("http://gone.example.org/debian"), ProbeOutcome::Type::NotFound, 404);
	auto result = rank({ "http://parked.example.org/debian", "http://gone.example.org/debian" });
	ASSERT_EQ(2u, result.size());
	EXPECT_EQ(Availability::Unavailable, result[0].status.availability);
	EXPECT_EQ(Availability::Unavailable, result[1].status.availability);
}

TEST_F(RankerTest, UnparsableDateLeavesStalenessUnknown)
{
	client.setOutcome(indexUrl("http://d.example.org/debian"), ProbeOutcome::Type::Success, 200,
			"Origin: Debian\nDate: Sat, 10 Jun 2023 09:30:00 +0000\n");
	client.setRate(indexUrl("http://d.example.org/debian"), 100*1024);
	auto result = rank({ "http://c.example.org/debian", "http://d.example.org/debian" });
	ASSERT_EQ(2u, result.size());
	EXPECT_EQ("http://d.example.org/debian", result[0].candidate.url);
	EXPECT_EQ(Availability::Available, result[0].status.availability);
	EXPECT_EQ(Staleness::Kind::Unknown, result[0].status.staleness.kind);
	EXPECT_TRUE(result[0].status.hasBandwidth);
}

TEST_F(RankerTest, EqualBandwidthKeepsDiscoveryOrder)
{
	client.setRate(indexUrl("http://a.example.org/debian"), 700*1024);
	client.setRate(indexUrl("http://b.example.org/debian"), 700*1024);
	EXPECT_EQ((vector< string >{ "http://a.example.org/debian", "http://b.example.org/debian" }),
			urls(rank({ "http://a.example.org/debian", "http://b.example.org/debian" })));
	EXPECT_EQ((vector< string >{ "http://b.example.org/debian", "http://a.example.org/debian" }),
			urls(rank({ "http://b.example.org/debian", "http://a.example.org/debian" })));
}

TEST_F(RankerTest, UpdatingMarkerOfUnreachableMirror)
{
	client.setOutcome("http://c.example.org/debian/Archive-Update-in-Progress-c.example.org",
			ProbeOutcome::Type::Success, 200);
	auto result = rank({ "http://c.example.org/debian" });
	ASSERT_EQ(1u, result.size());
	EXPECT_EQ(Availability::Unknown, result[0].status.availability);
	EXPECT_TRUE(result[0].status.isUpdating);
	EXPECT_EQ(2, result[0].status.getTier());
}

TEST_F(RankerTest, InvalidUrlsAreNotProbed)
{
	auto result = rank({ "file:/srv/mirror", "http://a.example.org/debian" });
	ASSERT_EQ(2u, result.size());
	EXPECT_EQ("http://a.example.org/debian", result[0].candidate.url);
	EXPECT_EQ(Availability::Unavailable, result[1].status.availability);
}

TEST_F(RankerTest, Exclusions)
{
	ExclusionSet exclusions({ "*://b.example.org/*" });
	auto result = rank({ "http://a.example.org/debian", "http://b.example.org/debian" }, exclusions);
	EXPECT_EQ((vector< string >{ "http://a.example.org/debian" }), urls(result));
}

TEST_F(RankerTest, MaxProbeCount)
{
	auto result = rank({ "http://c.example.org/debian", "http://a.example.org/debian", "http://b.example.org/debian" },
			ExclusionSet(), 2);
	EXPECT_EQ((vector< string >{ "http://a.example.org/debian", "http://c.example.org/debian" }), urls(result));
}

TEST_F(RankerTest, MissingReferenceDate)
{
	client.setOutcome(referenceUrl, ProbeOutcome::Type::Unreachable);
	auto result = rank({ "http://a.example.org/debian" });
	ASSERT_EQ(1u, result.size());
	EXPECT_EQ(Availability::Available, result[0].status.availability);
	// compared with the current time, the fixture date is long behind
	EXPECT_EQ(Staleness::Kind::Behind, result[0].status.staleness.kind);
}

TEST_F(RankerTest, CancelledBeforeStart)
{
	token.cancel();
	auto result = rank({ "http://a.example.org/debian", "http://b.example.org/debian" });
	ASSERT_EQ(2u, result.size());
	for (const auto& mirror: result)
	{
		EXPECT_EQ(Availability::Unknown, mirror.status.availability);
	}
}

TEST(RankerCancellationTest, CancelledDuringProbing)
{
	using ::testing::_;
	using ::testing::Invoke;

	MockProbeClient client;
	CancellationToken token;
	RankerOptions options;
	options.concurrency = 1;

	http::ProbeOutcome fresh;
	fresh.type = ProbeOutcome::Type::Success;
	fresh.body = freshIndex;

	EXPECT_CALL(client, probe(_, _, _, _)).WillRepeatedly(Invoke(
			[&](const string& url, http::Method, unsigned int, const CancellationToken&)
			{
				if (url == indexUrl("http://a.example.org/debian"))
				{
					// the user presses Control-C while the first mirror is probed
					token.cancel();
				}
				return fresh;
			}));
	EXPECT_CALL(client, streamRate(_, _, _, _, _)).Times(0);

	Ranker ranker(client, options);
	auto result = ranker.rank(candidates({ "http://a.example.org/debian", "http://b.example.org/debian" }),
			"bookworm", Distributor::Debian, ExclusionSet(), 0, token);
	ASSERT_EQ(2u, result.size());
	EXPECT_EQ("http://a.example.org/debian", result[0].candidate.url);
	EXPECT_EQ(Availability::Available, result[0].status.availability);
	EXPECT_EQ(Availability::Unknown, result[1].status.availability);
}

TEST(RankerIndexDateTest, Parse)
{
	time_t date;
	ASSERT_TRUE(Ranker::parseIndexDate(referenceIndex, &date));
	EXPECT_EQ(1686389400, date);
	EXPECT_FALSE(Ranker::parseIndexDate("Origin: Debian\nValid-Until: Sat, 17 Jun 2023 09:30:00 UTC\n", &date));
	EXPECT_FALSE(Ranker::parseIndexDate("Date: yesterday\n", &date));
	EXPECT_FALSE(Ranker::parseIndexDate("", &date));
}

TEST(RankerIndexDateTest, Find)
{
	string value;
	ASSERT_TRUE(Ranker::findIndexDate("Origin: Debian\nDate:  Sat, 10 Jun 2023 09:30:00 GMT \n", &value));
	EXPECT_EQ("Sat, 10 Jun 2023 09:30:00 GMT", value);
	time_t date;
	EXPECT_FALSE(Ranker::parseIndexDate("Date: Sat, 10 Jun 2023 09:30:00 GMT\n", &date));
	EXPECT_FALSE(Ranker::findIndexDate("Origin: Debian\nValid-Until: Sat, 17 Jun 2023 09:30:00 UTC\n", &value));
}
