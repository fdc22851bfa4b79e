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
#ifndef MIRRORPILOT_UPDATE_ORCHESTRATOR_SEEN
#define MIRRORPILOT_UPDATE_ORCHESTRATOR_SEEN

/// @file

#include <functional>

#include <mirrorpilot/exclusionset.hpp>
#include <mirrorpilot/update/classifier.hpp>

namespace mirrorpilot {

namespace internal {

class Logger;

}

namespace update {

/// state of an orchestrated update
enum class State { Idle, Running, Succeeded, RetryableFailure, FatalFailure };

MIRRORPILOT_API const char* getStateString(State);

/// chooses and activates mirrors on behalf of the orchestrator
class MIRRORPILOT_API MirrorSelector
{
 public:
	virtual ~MirrorSelector();

	/// the mirror the system is configured to use now
	virtual string currentMirror() = 0;
	/// ranks mirrors again and returns the best one not in @a exclusions
	/**
	 * @exception Exception if there is no usable mirror left
	 */
	virtual string selectReplacement(const ExclusionSet& exclusions) = 0;
	/// re-checks the end of life of the release and switches to the archive if confirmed
	/**
	 * @return @c true if the archive mirror was activated
	 */
	virtual bool switchToArchiveIfEndOfLife() = 0;
	/// makes the system use @a mirror
	virtual void activate(const string& mirror) = 0;
};

/// one run of the refresh command
struct MIRRORPILOT_API UpdateAttempt
{
	size_t number; ///< starting from 1
	string mirror;
	FailureKind kind;
	int exitCode;
	string output;
	string reason;

	UpdateAttempt();
};

struct MIRRORPILOT_API UpdateResult
{
	bool succeeded;
	State finalState;
	vector< UpdateAttempt > attempts;
	string error; ///< why it failed, empty on success

	UpdateResult();
};

struct MIRRORPILOT_API OrchestratorOptions
{
	string command;
	size_t maxAttempts;
	size_t maxTransientRetries; ///< same-mirror retries before switching
	unsigned int backoff; ///< initial sleep between transient retries, seconds
	unsigned int backoffThreshold; ///< the sleep doubles up to this, then grows slower
	bool switchMirrors;
	bool debugging;

	OrchestratorOptions();
	static OrchestratorOptions fromConfig(const Config&);
};

/// runs the refresh command, retrying and switching mirrors on failures
/**
 * Attempts are strictly sequential. Each run of @ref run starts from the
 * @c Idle state.
 */
class MIRRORPILOT_API Orchestrator
{
 public:
	typedef std::function< void (unsigned int) > Sleeper;
 private:
	CommandRunner& __runner;
	MirrorSelector& __selector;
	const FailureClassifier& __classifier;
	const OrchestratorOptions __options;
	Sleeper __sleeper;
	internal::Logger* __logger;
	State __state;

	void __set_state(State);
	void __log(uint16_t level, const string&);
	bool __switch_mirror(const string& failedMirror, ExclusionSet* exclusions, UpdateResult* result);
	void __fail(UpdateResult* result, const string& error);
 public:
	/**
	 * @param sleeper called with a number of seconds to wait
	 * @param logger may be @c NULL
	 */
	Orchestrator(CommandRunner& runner, MirrorSelector& selector,
			const FailureClassifier& classifier, const OrchestratorOptions& options,
			const Sleeper& sleeper, internal::Logger* logger = NULL);

	/**
	 * Never throws for command failures, they end up in the result.
	 *
	 * @param extraArguments passed to the command verbatim
	 * @param exclusions initial exclusions, failed mirrors are added to a
	 * copy for this run only
	 */
	UpdateResult run(const vector< string >& extraArguments, const ExclusionSet& exclusions);
	State getState() const;

	/// the sleep following @a current one
	static unsigned int getNextBackoff(unsigned int current, unsigned int threshold);
};

}
}

#endif
