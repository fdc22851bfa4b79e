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
#include <mirrorpilot/config.hpp>
#include <mirrorpilot/update/command.hpp>
#include <mirrorpilot/update/orchestrator.hpp>

#include <internal/common.hpp>
#include <internal/logger.hpp>

namespace mirrorpilot {
namespace update {

const char* getStateString(State state)
{
	switch (state)
	{
		case State::Idle: return "idle";
		case State::Running: return "running";
		case State::Succeeded: return "succeeded";
		case State::RetryableFailure: return "retryable failure";
		case State::FatalFailure: return "fatal failure";
	}
	return "";
}

MirrorSelector::~MirrorSelector()
{}

UpdateAttempt::UpdateAttempt()
	: number(0), kind(FailureKind::Fatal), exitCode(0)
{}

UpdateResult::UpdateResult()
	: succeeded(false), finalState(State::Idle)
{}

OrchestratorOptions::OrchestratorOptions()
	: command("apt-get update"), maxAttempts(5), maxTransientRetries(2),
	backoff(10), backoffThreshold(120), switchMirrors(true), debugging(false)
{}

OrchestratorOptions OrchestratorOptions::fromConfig(const Config& config)
{
	OrchestratorOptions result;
	result.command = config.getString("mirrorpilot::update::command");
	if (internal::trim(result.command).empty())
	{
		fatal2(__("the option '%s' is empty"), "mirrorpilot::update::command");
	}

	auto maxAttempts = config.getInteger("mirrorpilot::update::max-attempts");
	if (maxAttempts < 1)
	{
		fatal2(__("the option '%s' should be positive"), "mirrorpilot::update::max-attempts");
	}
	result.maxAttempts = maxAttempts;

	auto maxTransientRetries = config.getInteger("mirrorpilot::update::max-transient-retries");
	auto backoff = config.getInteger("mirrorpilot::update::backoff");
	auto backoffThreshold = config.getInteger("mirrorpilot::update::backoff::threshold");
	if (maxTransientRetries < 0 || backoff < 0 || backoffThreshold < 0)
	{
		fatal2(__("the options '%s' should not be negative"), "mirrorpilot::update::*");
	}
	result.maxTransientRetries = maxTransientRetries;
	result.backoff = backoff;
	result.backoffThreshold = backoffThreshold;

	result.switchMirrors = config.getBool("mirrorpilot::update::switch-mirrors");
	result.debugging = config.getBool("debug::update");
	return result;
}

typedef internal::Logger::Subsystem LogSubsystem;

Orchestrator::Orchestrator(CommandRunner& runner, MirrorSelector& selector,
		const FailureClassifier& classifier, const OrchestratorOptions& options,
		const Sleeper& sleeper, internal::Logger* logger)
	: __runner(runner), __selector(selector), __classifier(classifier),
	__options(options), __sleeper(sleeper), __logger(logger), __state(State::Idle)
{}

State Orchestrator::getState() const
{
	return __state;
}

void Orchestrator::__set_state(State state)
{
	if (__options.debugging)
	{
		debug2("update state: %s -> %s", getStateString(__state), getStateString(state));
	}
	__state = state;
}

void Orchestrator::__log(uint16_t level, const string& message)
{
	if (__logger)
	{
		__logger->log(LogSubsystem::Update, level, message);
	}
}

void Orchestrator::__fail(UpdateResult* result, const string& error)
{
	__set_state(State::FatalFailure);
	result->succeeded = false;
	result->finalState = State::FatalFailure;
	result->error = error;
	__log(1, string("update failed: ") + error);
}

bool Orchestrator::__switch_mirror(const string& failedMirror, ExclusionSet* exclusions,
		UpdateResult* result)
{
	if (!failedMirror.empty())
	{
		exclusions->addUrl(failedMirror);
	}
	string replacement;
	try
	{
		replacement = __selector.selectReplacement(*exclusions);
		__selector.activate(replacement);
	}
	catch (Exception& e)
	{
		__fail(result, format2(__("unable to switch to another mirror: %s"), e.what()));
		return false;
	}
	warn2(__("switched from the mirror '%s' to '%s'"), failedMirror, replacement);
	__log(1, format2("switched the mirror '%s' -> '%s'", failedMirror, replacement));
	return true;
}

unsigned int Orchestrator::getNextBackoff(unsigned int current, unsigned int threshold)
{
	if (current <= threshold)
	{
		return current * 2;
	}
	return current + current / 3;
}

UpdateResult Orchestrator::run(const vector< string >& extraArguments,
		const ExclusionSet& initialExclusions)
{
	__set_state(State::Idle);

	UpdateResult result;
	ExclusionSet exclusions = initialExclusions;
	unsigned int backoff = __options.backoff;
	size_t transientRetryCount = 0;

	for (size_t number = 1; number <= __options.maxAttempts; ++number)
	{
		__set_state(State::Running);

		UpdateAttempt attempt;
		attempt.number = number;
		attempt.mirror = __selector.currentMirror();
		__log(2, format2("attempt %zu, mirror '%s': running '%s'", number, attempt.mirror, __options.command));

		auto commandResult = __runner.run(__options.command, extraArguments);
		auto classification = __classifier.classify(commandResult.exitCode,
				commandResult.output, attempt.mirror);
		attempt.kind = classification.kind;
		attempt.exitCode = commandResult.exitCode;
		attempt.output = commandResult.output;
		attempt.reason = classification.reason;
		result.attempts.push_back(attempt);
		__log(2, format2("attempt %zu: %s%s", number, getFailureKindString(attempt.kind),
				attempt.reason.empty() ? "" : string(", ") + attempt.reason));

		if (classification.kind == FailureKind::Success)
		{
			__set_state(State::Succeeded);
			result.succeeded = true;
			result.finalState = State::Succeeded;
			__log(1, format2("package lists updated after %zu attempt(s)", number));
			return result;
		}
		if (classification.kind == FailureKind::Fatal)
		{
			__fail(&result, format2(__("the update command failed: %s"), attempt.reason));
			return result;
		}

		__set_state(State::RetryableFailure);
		if (number == __options.maxAttempts)
		{
			break;
		}

		if (classification.maybeEndOfLife)
		{
			if (!__options.switchMirrors)
			{
				__fail(&result, __("the current release looks end of life, but switching mirrors is not allowed, not retrying"));
				return result;
			}
			warn2(__("the mirror '%s' doesn't have the release, checking whether it is end of life"), attempt.mirror);
			if (__selector.switchToArchiveIfEndOfLife())
			{
				__log(1, "the release is end of life, switched to the archive");
				continue;
			}
		}

		bool shouldSwitch = false;
		if (classification.kind == FailureKind::RetryableMirror)
		{
			shouldSwitch = __options.switchMirrors;
		}
		else
		{
			++transientRetryCount;
			shouldSwitch = __options.switchMirrors && (transientRetryCount > __options.maxTransientRetries);
		}

		if (shouldSwitch)
		{
			transientRetryCount = 0;
			if (!__switch_mirror(attempt.mirror, &exclusions, &result))
			{
				return result;
			}
			continue;
		}

		warn2(__("retrying after a failed update (%zu/%zu) in %s"), number, __options.maxAttempts,
				humanReadableTimespan(backoff));
		if (__sleeper)
		{
			__sleeper(backoff);
		}
		backoff = getNextBackoff(backoff, __options.backoffThreshold);
	}

	__fail(&result, format2(__("failed to update package lists %zu consecutive times"),
			__options.maxAttempts));
	return result;
}

}
}
