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
#ifndef MIRRORPILOT_FWD_SEEN
#define MIRRORPILOT_FWD_SEEN

#include <mirrorpilot/common.hpp>

namespace mirrorpilot {

class Config;
class File;
class RequiredFile;
class CancellationToken;
class ExclusionSet;
class ReleaseRegistry;
class SourcesList;
class Ranker;
class MirrorManager;

struct Release;
struct CandidateMirror;
struct Staleness;
struct MirrorStatus;
struct RankedMirror;
struct DistributorTraits;
struct DiscoveryContext;
struct RankerOptions;

namespace http {

class Uri;
class ProbeClient;
class CurlProbeClient;
struct ProbeOutcome;
struct RateMeasurement;

}

namespace update {

class CommandRunner;
class MirrorSelector;
class FailureClassifier;
class Orchestrator;
struct Classification;
struct CommandResult;
struct UpdateAttempt;
struct UpdateResult;
struct OrchestratorOptions;

}

}

#endif

