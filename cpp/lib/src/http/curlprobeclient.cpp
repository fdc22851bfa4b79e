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
#include <cstring>
#include <chrono>
#include <mutex>

#include <curl/curl.h>

#include <mirrorpilot/cancellation.hpp>
#include <mirrorpilot/config.hpp>
#include <mirrorpilot/http/probeclient.hpp>

#include <internal/transfersummary.hpp>

namespace mirrorpilot {

namespace http {

ProbeOutcome::ProbeOutcome()
	: type(Type::Unreachable), status(0), elapsed(0), truncated(false)
{}

bool ProbeOutcome::isIndeterminate() const
{
	return type == Type::InvalidResponse || type == Type::Unreachable;
}

const char* ProbeOutcome::typeString(Type type)
{
	switch (type)
	{
		case Type::Success: return "success";
		case Type::NotFound: return "not found";
		case Type::InvalidResponse: return "invalid response";
		case Type::Unreachable: return "unreachable";
	}
	return "";
}

RateMeasurement::RateMeasurement()
	: valid(false), bytes(0), seconds(0), bytesPerSecond(0)
{}

ProbeClient::~ProbeClient()
{}

}

namespace internal {

typedef std::chrono::steady_clock Clock;

namespace {

class CurlWrapper
{
	CURL* __handle;
	char __error_buffer[CURL_ERROR_SIZE];
 public:
	CurlWrapper()
	{
		memset(__error_buffer, 0, sizeof(__error_buffer));
		__handle = curl_easy_init();
		if (!__handle)
		{
			fatal2(__("unable to create a Curl handle"));
		}
		__init();
	}
	void setOption(CURLoption optionName, long value, const char* alias)
	{
		__check(curl_easy_setopt(__handle, optionName, value), alias);
	}
	void setOption(CURLoption optionName, void* value, const char* alias)
	{
		__check(curl_easy_setopt(__handle, optionName, value), alias);
	}
	void setOption(CURLoption optionName, const string& value, const char* alias)
	{
		__check(curl_easy_setopt(__handle, optionName, value.c_str()), alias);
	}
	void __check(CURLcode returnCode, const char* alias)
	{
		if (returnCode != CURLE_OK)
		{
			fatal2(__("unable to set the Curl option '%s': curl_easy_setopt failed: %s"),
					alias, curl_easy_strerror(returnCode));
		}
	}
	void __init()
	{
		setOption(CURLOPT_NOSIGNAL, 1, "no signals");
		setOption(CURLOPT_FOLLOWLOCATION, 1, "follow-location");
		setOption(CURLOPT_MAXREDIRS, 5, "maximum redirects");
		setOption(CURLOPT_NOPROGRESS, 0L, "progress");
		setOption(CURLOPT_USERAGENT, format2("mirrorpilot/%s", libraryVersion), "user-agent");
		curl_easy_setopt(__handle, CURLOPT_ERRORBUFFER, __error_buffer);
	}
	long getResponseCode() const
	{
		long value = 0;
		curl_easy_getinfo(__handle, CURLINFO_RESPONSE_CODE, &value);
		return value;
	}
	CURLcode perform()
	{
		return curl_easy_perform(__handle);
	}
	string getError(CURLcode code) const
	{
		if (__error_buffer[0])
		{
			return string(__error_buffer);
		}
		return curl_easy_strerror(code);
	}
	~CurlWrapper()
	{
		curl_easy_cleanup(__handle);
	}
};

// per-request state, passed to the callbacks as user data
struct Transfer
{
	std::atomic< bool >* cancelled;
	string body;
	size_t maxBodySize;
	bool keepBody;
	bool bodyTruncated;
	uint64_t bytes;
	Clock::time_point start;
	Clock::time_point deadline; // for rate sampling only
	bool hasDeadline;
	bool deadlineReached;

	Transfer(const CancellationToken& token)
		: cancelled(token.getFlag()), maxBodySize(0), keepBody(true),
		bodyTruncated(false), bytes(0), start(Clock::now()),
		hasDeadline(false), deadlineReached(false)
	{}
	bool pastDeadline()
	{
		if (hasDeadline && Clock::now() >= deadline)
		{
			deadlineReached = true;
		}
		return deadlineReached;
	}
};

}

extern "C"
{
	size_t probeWriteFunction(char* data, size_t size, size_t nmemb, void* userData)
	{
		auto transfer = static_cast< Transfer* >(userData);
		size *= nmemb;
		transfer->bytes += size;

		if (transfer->keepBody)
		{
			auto room = transfer->maxBodySize - transfer->body.size();
			if (size > room)
			{
				transfer->body.append(data, room);
				transfer->bodyTruncated = true;
				return 0; // enough read, abort the transfer
			}
			transfer->body.append(data, size);
		}
		if (transfer->pastDeadline())
		{
			return 0;
		}
		return size;
	}

	int probeProgressFunction(void* userData, curl_off_t, curl_off_t, curl_off_t, curl_off_t)
	{
		auto transfer = static_cast< Transfer* >(userData);
		if (transfer->cancelled->load() || transfer->pastDeadline())
		{
			return 1;
		}
		return 0;
	}
}

namespace {

double secondsSince(Clock::time_point start)
{
	return std::chrono::duration< double >(Clock::now() - start).count();
}

}

class CurlProbeClientImpl
{
	string p_proxy;
	size_t p_maxBodySize;
	bool p_debugging;

	void p_setCommonOptions(CurlWrapper&, const string& url, unsigned int timeout, Transfer*);
 public:
	CurlProbeClientImpl(const Config&);
	http::ProbeOutcome probe(const string& url, http::Method, unsigned int timeout,
			const CancellationToken&);
	http::RateMeasurement streamRate(const string& url, unsigned int timeout,
			unsigned int sampleWindow, uint64_t minimumBytes, const CancellationToken&);
};

CurlProbeClientImpl::CurlProbeClientImpl(const Config& config)
	: p_proxy(config.getString("mirrorpilot::probe::proxy")),
	p_maxBodySize(config.getInteger("mirrorpilot::probe::max-body-size")),
	p_debugging(config.getBool("debug::probe"))
{
	static std::once_flag globalInitFlag;
	std::call_once(globalInitFlag, []()
	{
		auto initResult = curl_global_init(CURL_GLOBAL_ALL);
		if (initResult != CURLE_OK)
		{
			fatal2(__("unable to initialize the Curl library: %s"), curl_easy_strerror(initResult));
		}
	});
}

void CurlProbeClientImpl::p_setCommonOptions(CurlWrapper& curl, const string& url,
		unsigned int timeout, Transfer* transfer)
{
	curl.setOption(CURLOPT_URL, url, "uri");
	if (p_proxy == "DIRECT")
	{
		curl.setOption(CURLOPT_PROXY, string(), "proxy");
	}
	else if (!p_proxy.empty())
	{
		curl.setOption(CURLOPT_PROXY, p_proxy, "proxy");
	}
	if (timeout)
	{
		curl.setOption(CURLOPT_CONNECTTIMEOUT, long(timeout), "connect timeout");
		curl.setOption(CURLOPT_TIMEOUT, long(timeout), "timeout");
	}
	curl.setOption(CURLOPT_WRITEFUNCTION, (void*)&probeWriteFunction, "write function");
	curl.setOption(CURLOPT_WRITEDATA, (void*)transfer, "write data");
	curl.setOption(CURLOPT_XFERINFOFUNCTION, (void*)&probeProgressFunction, "progress function");
	curl.setOption(CURLOPT_XFERINFODATA, (void*)transfer, "progress data");
}

http::ProbeOutcome CurlProbeClientImpl::probe(const string& url, http::Method method,
		unsigned int timeout, const CancellationToken& token)
{
	typedef http::ProbeOutcome::Type Type;

	http::ProbeOutcome result;
	if (token.isCancelled())
	{
		result.error = __("cancelled");
		return result;
	}

	CurlWrapper curl;
	Transfer transfer(token);
	transfer.maxBodySize = p_maxBodySize;
	transfer.keepBody = (method == http::Method::Get);
	p_setCommonOptions(curl, url, timeout, &transfer);
	if (method == http::Method::Head)
	{
		curl.setOption(CURLOPT_NOBODY, 1, "no body");
	}

	auto performResult = curl.perform();

	TransferSummary summary;
	summary.status = curl.getResponseCode();
	summary.isFtp = isFtpUrl(url);
	summary.bytes = transfer.bytes;
	summary.seconds = secondsSince(transfer.start);
	if (performResult == CURLE_OK || (performResult == CURLE_WRITE_ERROR && transfer.bodyTruncated))
	{
		summary.end = TransferEnd::Complete; // a cut body was stopped on purpose
	}
	else if (performResult == CURLE_REMOTE_FILE_NOT_FOUND)
	{
		summary.end = TransferEnd::RemoteNotFound;
	}
	else if (performResult == CURLE_ABORTED_BY_CALLBACK)
	{
		summary.end = TransferEnd::Aborted;
	}

	result.type = classifyTransfer(summary);
	result.status = summary.status;
	result.elapsed = summary.seconds;
	switch (result.type)
	{
		case Type::Success:
			result.body.swap(transfer.body);
			result.truncated = transfer.bodyTruncated;
			break;
		case Type::NotFound:
		case Type::InvalidResponse:
			result.error = (summary.end == TransferEnd::Complete) ?
					format2("HTTP %ld", summary.status) : curl.getError(performResult);
			break;
		case Type::Unreachable:
			result.error = (summary.end == TransferEnd::Aborted) ?
					string(__("cancelled")) : curl.getError(performResult);
	}

	if (p_debugging)
	{
		debug2("probe: %s '%s': %s (%ld, %.3fs) %s",
				method == http::Method::Head ? "HEAD" : "GET", url,
				http::ProbeOutcome::typeString(result.type), result.status, result.elapsed, result.error);
	}
	return result;
}

http::RateMeasurement CurlProbeClientImpl::streamRate(const string& url, unsigned int timeout,
		unsigned int sampleWindow, uint64_t minimumBytes, const CancellationToken& token)
{
	http::RateMeasurement result;
	if (token.isCancelled())
	{
		return result;
	}

	CurlWrapper curl;
	Transfer transfer(token);
	transfer.keepBody = false;
	transfer.hasDeadline = true;
	transfer.deadline = transfer.start + std::chrono::milliseconds(sampleWindow);
	p_setCommonOptions(curl, url, timeout, &transfer);

	auto performResult = curl.perform();

	TransferSummary summary;
	summary.status = curl.getResponseCode();
	summary.isFtp = isFtpUrl(url);
	summary.bytes = transfer.bytes;
	summary.seconds = secondsSince(transfer.start);
	summary.windowEnded = transfer.deadlineReached && !token.isCancelled();
	if (performResult == CURLE_OK)
	{
		summary.end = TransferEnd::Complete;
	}
	else if (performResult == CURLE_WRITE_ERROR || performResult == CURLE_ABORTED_BY_CALLBACK)
	{
		summary.end = TransferEnd::Aborted;
	}
	result = measureTransferRate(summary, minimumBytes);

	if (p_debugging)
	{
		debug2("probe: rate '%s': %llu bytes in %.3fs, %s", url,
				(unsigned long long)result.bytes, result.seconds, result.valid ? "valid" : "invalid");
	}
	return result;
}

}

namespace http {

CurlProbeClient::CurlProbeClient(const Config& config)
	: __impl(new internal::CurlProbeClientImpl(config))
{}

CurlProbeClient::~CurlProbeClient()
{
	delete __impl;
}

ProbeOutcome CurlProbeClient::probe(const string& url, Method method, unsigned int timeout,
		const CancellationToken& token)
{
	return __impl->probe(url, method, timeout, token);
}

RateMeasurement CurlProbeClient::streamRate(const string& url, unsigned int timeout,
		unsigned int sampleWindow, uint64_t minimumBytes, const CancellationToken& token)
{
	return __impl->streamRate(url, timeout, sampleWindow, minimumBytes, token);
}

}
}
