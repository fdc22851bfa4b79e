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
#ifndef MIRRORPILOT_TEST_MOCKS_SEEN
#define MIRRORPILOT_TEST_MOCKS_SEEN

#include <map>

#include <gmock/gmock.h>

#include <mirrorpilot/cancellation.hpp>
#include <mirrorpilot/http/probeclient.hpp>
#include <mirrorpilot/update/command.hpp>
#include <mirrorpilot/update/orchestrator.hpp>

namespace mirrorpilot {
namespace test {

class MockProbeClient: public http::ProbeClient
{
 public:
	MOCK_METHOD(http::ProbeOutcome, probe, (const string&, http::Method, unsigned int,
			const CancellationToken&), (override));
	MOCK_METHOD(http::RateMeasurement, streamRate, (const string&, unsigned int, unsigned int,
			uint64_t, const CancellationToken&), (override));
};

// answers from a table, thread-safe as long as the table is not modified
class FakeProbeClient: public http::ProbeClient
{
	std::map< string, http::ProbeOutcome > __outcomes;
	std::map< string, http::RateMeasurement > __rates;
 public:
	void setOutcome(const string& url, http::ProbeOutcome::Type type,
			long status = 0, const string& body = string())
	{
		http::ProbeOutcome outcome;
		outcome.type = type;
		outcome.status = status;
		outcome.body = body;
		__outcomes[url] = outcome;
	}
	// the body was cut at the size limit
	void setTruncated(const string& url)
	{
		__outcomes[url].truncated = true;
	}
	void setRate(const string& url, double bytesPerSecond)
	{
		http::RateMeasurement rate;
		rate.valid = true;
		rate.bytes = (uint64_t)bytesPerSecond;
		rate.seconds = 1;
		rate.bytesPerSecond = bytesPerSecond;
		__rates[url] = rate;
	}

	http::ProbeOutcome probe(const string& url, http::Method, unsigned int,
			const CancellationToken&) override
	{
		auto it = __outcomes.find(url);
		if (it != __outcomes.end())
		{
			return it->second;
		}
		http::ProbeOutcome outcome;
		outcome.type = http::ProbeOutcome::Type::NotFound;
		outcome.status = 404;
		return outcome;
	}
	http::RateMeasurement streamRate(const string& url, unsigned int, unsigned int,
			uint64_t, const CancellationToken&) override
	{
		auto it = __rates.find(url);
		return it != __rates.end() ? it->second : http::RateMeasurement();
	}
};

class MockCommandRunner: public update::CommandRunner
{
 public:
	MOCK_METHOD(update::CommandResult, run, (const string&, const vector< string >&), (override));
};

class MockMirrorSelector: public update::MirrorSelector
{
 public:
	MOCK_METHOD(string, currentMirror, (), (override));
	MOCK_METHOD(string, selectReplacement, (const ExclusionSet&), (override));
	MOCK_METHOD(bool, switchToArchiveIfEndOfLife, (), (override));
	MOCK_METHOD(void, activate, (const string&), (override));
};

inline update::CommandResult commandResult(int exitCode, const string& output)
{
	update::CommandResult result;
	result.exitCode = exitCode;
	result.output = output;
	return result;
}

}
}

#endif
