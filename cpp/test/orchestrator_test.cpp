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

#include <mirrorpilot/update/orchestrator.hpp>

#include "mocks.hpp"

using namespace mirrorpilot;
using namespace mirrorpilot::update;
using mirrorpilot::test::MockCommandRunner;
using mirrorpilot::test::MockMirrorSelector;
using mirrorpilot::test::commandResult;
using ::testing::_;
using ::testing::Return;
using ::testing::Truly;
using ::testing::InSequence;

namespace {

const char* const hashMismatchOutput =
		"Get:1 http://a.example.org/debian bookworm/main amd64 Packages [8786 kB]\n"
		"E: Failed to fetch http://a.example.org/debian/dists/bookworm/main/binary-amd64/by-hash/SHA256/abc  Hash Sum mismatch\n";
const char* const timeoutOutput =
		"W: Failed to fetch http://deb.example.net/dists/bookworm/InRelease  Connection timed out\n";

}

class OrchestratorTest: public ::testing::Test
{
 protected:
	MockCommandRunner runner;
	MockMirrorSelector selector;
	FailureClassifier classifier;
	OrchestratorOptions options;
	vector< unsigned int > sleeps;

	OrchestratorTest()
		: classifier({ "hash sum mismatch" }, { "connection timed out" }, { "permission denied" })
	{}

	Orchestrator createOrchestrator()
	{
		return Orchestrator(runner, selector, classifier, options,
				[this](unsigned int seconds) { sleeps.push_back(seconds); });
	}
};

TEST_F(OrchestratorTest, SucceedsAtOnce)
{
	EXPECT_CALL(selector, currentMirror()).WillOnce(Return("http://a.example.org/debian/"));
	EXPECT_CALL(runner, run("apt-get update", vector< string >{ "-o", "Debug::NoLocking=1" }))
			.WillOnce(Return(commandResult(0, "Reading package lists...\n")));
	EXPECT_CALL(selector, selectReplacement(_)).Times(0);

	auto orchestrator = createOrchestrator();
	auto result = orchestrator.run({ "-o", "Debug::NoLocking=1" }, ExclusionSet());
	EXPECT_TRUE(result.succeeded);
	EXPECT_EQ(State::Succeeded, result.finalState);
	EXPECT_EQ(State::Succeeded, orchestrator.getState());
	ASSERT_EQ(1u, result.attempts.size());
	EXPECT_EQ(FailureKind::Success, result.attempts[0].kind);
}

TEST_F(OrchestratorTest, SwitchesMirrorOnHashMismatch)
{
	{
		InSequence sequence;
		EXPECT_CALL(selector, currentMirror()).WillOnce(Return("http://a.example.org/debian/"));
		EXPECT_CALL(runner, run(_, _)).WillOnce(Return(commandResult(100, hashMismatchOutput)));
		EXPECT_CALL(selector, selectReplacement(Truly([](const ExclusionSet& exclusions)
				{
					return exclusions.matches("http://a.example.org/debian") &&
							!exclusions.matches("http://b.example.org/debian");
				}))).WillOnce(Return("http://b.example.org/debian/"));
		EXPECT_CALL(selector, activate("http://b.example.org/debian/"));
		EXPECT_CALL(selector, currentMirror()).WillOnce(Return("http://b.example.org/debian/"));
		EXPECT_CALL(runner, run(_, _)).WillOnce(Return(commandResult(0, "")));
	}

	ExclusionSet initial({ "*.example.com*" });
	auto result = createOrchestrator().run({}, initial);
	EXPECT_TRUE(result.succeeded);
	ASSERT_EQ(2u, result.attempts.size());
	EXPECT_EQ("http://a.example.org/debian/", result.attempts[0].mirror);
	EXPECT_EQ(FailureKind::RetryableMirror, result.attempts[0].kind);
	EXPECT_EQ("http://b.example.org/debian/", result.attempts[1].mirror);
	EXPECT_TRUE(sleeps.empty());
	// the caller's exclusions are left alone
	EXPECT_EQ(1u, initial.getPatterns().size());
}

TEST_F(OrchestratorTest, PermissionProblemIsFatal)
{
	EXPECT_CALL(selector, currentMirror()).WillOnce(Return("http://a.example.org/debian/"));
	EXPECT_CALL(runner, run(_, _)).WillOnce(Return(commandResult(100,
			"E: Could not open lock file /var/lib/apt/lists/lock - open (13: Permission denied)\n"
			"E: Unable to lock directory /var/lib/apt/lists/\n")));
	EXPECT_CALL(selector, selectReplacement(_)).Times(0);

	auto orchestrator = createOrchestrator();
	auto result = orchestrator.run({}, ExclusionSet());
	EXPECT_FALSE(result.succeeded);
	EXPECT_EQ(State::FatalFailure, result.finalState);
	EXPECT_EQ(State::FatalFailure, orchestrator.getState());
	EXPECT_EQ(1u, result.attempts.size());
	EXPECT_TRUE(sleeps.empty());
}

TEST_F(OrchestratorTest, StopsAtTheCeiling)
{
	options.maxAttempts = 3;
	options.switchMirrors = false;
	EXPECT_CALL(selector, currentMirror()).WillRepeatedly(Return("http://a.example.org/debian/"));
	EXPECT_CALL(runner, run(_, _)).Times(3).WillRepeatedly(Return(commandResult(100, hashMismatchOutput)));
	EXPECT_CALL(selector, selectReplacement(_)).Times(0);

	auto result = createOrchestrator().run({}, ExclusionSet());
	EXPECT_FALSE(result.succeeded);
	EXPECT_EQ(3u, result.attempts.size());
	EXPECT_NE(string::npos, result.error.find("3 consecutive times"));
	// no sleep after the last attempt
	EXPECT_EQ((vector< unsigned int >{ 10, 20 }), sleeps);
}

TEST_F(OrchestratorTest, TransientRetriesBeforeSwitching)
{
	options.maxTransientRetries = 2;
	EXPECT_CALL(selector, currentMirror()).WillRepeatedly(Return("http://a.example.org/debian/"));
	EXPECT_CALL(runner, run(_, _))
			.WillOnce(Return(commandResult(100, timeoutOutput)))
			.WillOnce(Return(commandResult(100, timeoutOutput)))
			.WillOnce(Return(commandResult(100, timeoutOutput)))
			.WillOnce(Return(commandResult(0, "")));
	EXPECT_CALL(selector, selectReplacement(_)).WillOnce(Return("http://b.example.org/debian/"));
	EXPECT_CALL(selector, activate("http://b.example.org/debian/"));

	auto result = createOrchestrator().run({}, ExclusionSet());
	EXPECT_TRUE(result.succeeded);
	EXPECT_EQ(4u, result.attempts.size());
	EXPECT_EQ(FailureKind::RetryableTransient, result.attempts[0].kind);
	EXPECT_EQ((vector< unsigned int >{ 10, 20 }), sleeps);
}

TEST_F(OrchestratorTest, NoReplacementLeft)
{
	EXPECT_CALL(selector, currentMirror()).WillOnce(Return("http://a.example.org/debian/"));
	EXPECT_CALL(runner, run(_, _)).WillOnce(Return(commandResult(100, hashMismatchOutput)));
	EXPECT_CALL(selector, selectReplacement(_)).WillOnce(::testing::Throw(Exception("no mirrors")));
	EXPECT_CALL(selector, activate(_)).Times(0);

	auto result = createOrchestrator().run({}, ExclusionSet());
	EXPECT_FALSE(result.succeeded);
	EXPECT_EQ(State::FatalFailure, result.finalState);
	EXPECT_NE(string::npos, result.error.find("no mirrors"));
}

TEST_F(OrchestratorTest, EndOfLifeSwitchesToArchive)
{
	const char* notFoundOutput =
			"Err:5 http://a.example.org/ubuntu cosmic Release\n"
			"  404  Not Found [IP: 1.2.3.4 80]\n";
	EXPECT_CALL(selector, currentMirror())
			.WillOnce(Return("http://a.example.org/ubuntu/"))
			.WillOnce(Return("http://old-releases.ubuntu.com/ubuntu/"));
	EXPECT_CALL(runner, run(_, _))
			.WillOnce(Return(commandResult(100, notFoundOutput)))
			.WillOnce(Return(commandResult(0, "")));
	EXPECT_CALL(selector, switchToArchiveIfEndOfLife()).WillOnce(Return(true));
	EXPECT_CALL(selector, selectReplacement(_)).Times(0);

	auto result = createOrchestrator().run({}, ExclusionSet());
	EXPECT_TRUE(result.succeeded);
	ASSERT_EQ(2u, result.attempts.size());
	EXPECT_EQ("http://old-releases.ubuntu.com/ubuntu/", result.attempts[1].mirror);
}

TEST_F(OrchestratorTest, EndOfLifeWithoutSwitching)
{
	options.switchMirrors = false;
	EXPECT_CALL(selector, currentMirror()).WillOnce(Return("http://a.example.org/ubuntu/"));
	EXPECT_CALL(runner, run(_, _)).WillOnce(Return(commandResult(100,
			"Err:5 http://a.example.org/ubuntu cosmic Release\n  404  Not Found\n")));
	EXPECT_CALL(selector, switchToArchiveIfEndOfLife()).Times(0);

	auto result = createOrchestrator().run({}, ExclusionSet());
	EXPECT_FALSE(result.succeeded);
	EXPECT_EQ(1u, result.attempts.size());
	EXPECT_EQ(State::FatalFailure, result.finalState);
}

TEST(OrchestratorBackoffTest, Progression)
{
	EXPECT_EQ(20u, Orchestrator::getNextBackoff(10, 120));
	EXPECT_EQ(160u, Orchestrator::getNextBackoff(80, 120));
	EXPECT_EQ(240u, Orchestrator::getNextBackoff(120, 120));
	EXPECT_EQ(213u, Orchestrator::getNextBackoff(160, 120));
}
