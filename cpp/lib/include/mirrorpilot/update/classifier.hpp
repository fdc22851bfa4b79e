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
#ifndef MIRRORPILOT_UPDATE_CLASSIFIER_SEEN
#define MIRRORPILOT_UPDATE_CLASSIFIER_SEEN

/// @file

#include <mirrorpilot/fwd.hpp>

namespace mirrorpilot {
namespace update {

/// outcome class of one run of the refresh command
enum class FailureKind
{
	Success,
	RetryableMirror, ///< the mirror is at fault, switching it should help
	RetryableTransient, ///< a network blip not tied to the mirror
	Fatal ///< retrying won't help
};

MIRRORPILOT_API const char* getFailureKindString(FailureKind);

struct MIRRORPILOT_API Classification
{
	FailureKind kind;
	bool maybeEndOfLife; ///< the mirror doesn't have the release anymore
	string reason; ///< matched signature or a short description

	Classification();
};

/// classifies the refresh command output by known signatures
/**
 * Signatures are matched case-insensitively as substrings. Fatal signatures
 * are checked first, so an output showing both a local problem and a mirror
 * problem is fatal.
 */
class MIRRORPILOT_API FailureClassifier
{
	vector< string > __mirror_signatures;
	vector< string > __transient_signatures;
	vector< string > __fatal_signatures;
 public:
	FailureClassifier(const vector< string >& mirrorSignatures,
			const vector< string >& transientSignatures, const vector< string >& fatalSignatures);

	/**
	 * @param exitCode exit code of the command
	 * @param output combined standard output and error of the command
	 * @param currentMirror mirror the command was run against, may be empty
	 */
	Classification classify(int exitCode, const string& output, const string& currentMirror) const;

	/// reads the @c mirrorpilot::update::signatures::* lists
	static FailureClassifier fromConfig(const Config&);
};

}
}

#endif
