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
#include <mirrorpilot/http/uri.hpp>
#include <mirrorpilot/update/classifier.hpp>

#include <internal/common.hpp>

namespace mirrorpilot {
namespace update {

const char* getFailureKindString(FailureKind kind)
{
	switch (kind)
	{
		case FailureKind::Success: return "success";
		case FailureKind::RetryableMirror: return "retryable (mirror)";
		case FailureKind::RetryableTransient: return "retryable (transient)";
		case FailureKind::Fatal: return "fatal";
	}
	return "";
}

Classification::Classification()
	: kind(FailureKind::Fatal), maybeEndOfLife(false)
{}

namespace {

vector< string > lowerAll(const vector< string >& input)
{
	vector< string > result;
	for (const auto& item: input)
	{
		auto lowered = internal::toLower(internal::trim(item));
		if (!lowered.empty())
		{
			result.push_back(lowered);
		}
	}
	return result;
}

const string* findSignature(const string& text, const vector< string >& signatures)
{
	for (const auto& signature: signatures)
	{
		if (text.find(signature) != string::npos)
		{
			return &signature;
		}
	}
	return NULL;
}

bool hasWord(const string& line, const string& word)
{
	for (const auto& token: internal::splitWords(line))
	{
		if (token == word)
		{
			return true;
		}
	}
	return false;
}

// older apt prints the status on the same line as the URL, newer one on the next line:
//   Err:5 http://mirror.example.com/ubuntu cosmic Release
//     404  Not Found [IP: 1.2.3.4 80]
bool isMissingOnMirror(const vector< string >& lines, const string& mirror)
{
	for (size_t i = 0; i < lines.size(); ++i)
	{
		if (lines[i].find(mirror) == string::npos)
		{
			continue;
		}
		if (hasWord(lines[i], "404"))
		{
			return true;
		}
		if (i+1 < lines.size())
		{
			auto nextWords = internal::splitWords(lines[i+1]);
			if (!nextWords.empty() && nextWords[0] == "404")
			{
				return true;
			}
		}
	}
	return false;
}

}

FailureClassifier::FailureClassifier(const vector< string >& mirrorSignatures,
		const vector< string >& transientSignatures, const vector< string >& fatalSignatures)
	: __mirror_signatures(lowerAll(mirrorSignatures)),
	__transient_signatures(lowerAll(transientSignatures)),
	__fatal_signatures(lowerAll(fatalSignatures))
{}

Classification FailureClassifier::classify(int exitCode, const string& output,
		const string& currentMirror) const
{
	Classification result;

	auto loweredOutput = internal::toLower(output);
	auto lines = internal::split('\n', loweredOutput);
	auto mirror = currentMirror.empty() ? string() :
			internal::toLower(http::Uri::normalize(currentMirror));

	// apt mentions 'permission denied' in harmless warnings of successful runs
	auto signature = (exitCode != 0) ? findSignature(loweredOutput, __fatal_signatures) : NULL;
	if (signature)
	{
		result.kind = FailureKind::Fatal;
		result.reason = *signature;
		return result;
	}
	signature = findSignature(loweredOutput, __mirror_signatures);
	if (signature)
	{
		result.kind = FailureKind::RetryableMirror;
		result.reason = *signature;
		return result;
	}
	if (!mirror.empty() && isMissingOnMirror(lines, mirror))
	{
		result.kind = FailureKind::RetryableMirror;
		result.maybeEndOfLife = true;
		result.reason = __("the mirror doesn't have the release, it may be end of life");
		return result;
	}

	string mirrorHost;
	if (http::Uri::isNetworkUri(mirror))
	{
		mirrorHost = http::Uri(mirror).getHost();
	}
	const string* transientSignature = NULL;
	for (const auto& line: lines)
	{
		auto lineSignature = findSignature(line, __transient_signatures);
		if (!lineSignature)
		{
			continue;
		}
		if (!mirrorHost.empty() && line.find(mirrorHost) != string::npos)
		{
			result.kind = FailureKind::RetryableMirror;
			result.reason = *lineSignature + " (" + mirrorHost + ")";
			return result;
		}
		if (!transientSignature)
		{
			transientSignature = lineSignature;
		}
	}
	if (transientSignature)
	{
		result.kind = FailureKind::RetryableTransient;
		result.reason = *transientSignature;
		return result;
	}

	if (exitCode == 0)
	{
		result.kind = FailureKind::Success;
	}
	else
	{
		result.kind = FailureKind::Fatal;
		result.reason = format2(__("unrecognized failure, exit code %d"), exitCode);
	}
	return result;
}

FailureClassifier FailureClassifier::fromConfig(const Config& config)
{
	return FailureClassifier(
			config.getList("mirrorpilot::update::signatures::mirror"),
			config.getList("mirrorpilot::update::signatures::transient"),
			config.getList("mirrorpilot::update::signatures::fatal"));
}

}
}
