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
#ifndef MIRRORPILOT_HTTP_PROBECLIENT_SEEN
#define MIRRORPILOT_HTTP_PROBECLIENT_SEEN

/// @file

#include <mirrorpilot/fwd.hpp>

namespace mirrorpilot {

namespace internal {

class CurlProbeClientImpl;

}

namespace http {

/// result of one bounded request
struct MIRRORPILOT_API ProbeOutcome
{
	enum class Type
	{
		Success, ///< 2xx, body holds (a prefix of) the response
		NotFound, ///< 404, a confirmed and authoritative negative
		InvalidResponse, ///< any other status, indeterminate
		Unreachable ///< connection error, timeout or cancellation, indeterminate
	};
	Type type;
	long status; ///< protocol response code, 0 if none was received
	string body;
	double elapsed; ///< seconds from the request start
	string error; ///< human readable reason for non-success outcomes
	bool truncated; ///< the body was cut at the configured size limit

	ProbeOutcome();
	/// neither a success nor a confirmed absence
	bool isIndeterminate() const;
	static const char* typeString(Type);
};

/// transfer rate observed during a bounded streamed read
struct MIRRORPILOT_API RateMeasurement
{
	bool valid; ///< enough bytes were read to trust the value
	uint64_t bytes;
	double seconds;
	double bytesPerSecond;

	RateMeasurement();
};

/// request method of a probe
enum class Method { Get, Head };

/// performs bounded-timeout requests against mirrors
/**
 * Implementations must be usable from several threads at once, each call
 * being independent.
 */
class MIRRORPILOT_API ProbeClient
{
 public:
	virtual ~ProbeClient();

	/// performs a single request
	/**
	 * Never throws for network level problems, they are reported through
	 * the outcome type.
	 *
	 * @param url resource to request
	 * @param method request method
	 * @param timeout overall limit in seconds for this request
	 * @param token the request is abandoned when it becomes cancelled
	 */
	virtual ProbeOutcome probe(const string& url, Method method, unsigned int timeout,
			const CancellationToken& token) = 0;

	/// reads the start of a resource to measure the transfer rate
	/**
	 * Reading stops after @a sampleWindow milliseconds counted from the
	 * request start, or at the end of the resource.
	 *
	 * @param minimumBytes less transferred bytes make the measurement invalid
	 */
	virtual RateMeasurement streamRate(const string& url, unsigned int timeout,
			unsigned int sampleWindow, uint64_t minimumBytes, const CancellationToken& token) = 0;
};

/// libcurl-based ProbeClient
/**
 * Honors the standard proxy environment variables. The
 * @c mirrorpilot::probe::proxy option overrides them, @c "DIRECT" disables
 * proxying.
 */
class MIRRORPILOT_API CurlProbeClient: public ProbeClient
{
	internal::CurlProbeClientImpl* __impl;

	CurlProbeClient(const CurlProbeClient&) = delete;
 public:
	CurlProbeClient(const Config&);
	~CurlProbeClient();

	ProbeOutcome probe(const string& url, Method method, unsigned int timeout,
			const CancellationToken& token);
	RateMeasurement streamRate(const string& url, unsigned int timeout,
			unsigned int sampleWindow, uint64_t minimumBytes, const CancellationToken& token);
};

}
}

#endif
