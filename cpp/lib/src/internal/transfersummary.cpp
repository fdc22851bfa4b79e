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
#include <internal/common.hpp>
#include <internal/transfersummary.hpp>

namespace mirrorpilot {
namespace internal {

TransferSummary::TransferSummary()
	: end(TransferEnd::Failed), status(0), isFtp(false), windowEnded(false),
	bytes(0), seconds(0)
{}

static bool isSuccessfulStatus(const TransferSummary& summary)
{
	return summary.isFtp || (summary.status >= 200 && summary.status < 300);
}

http::ProbeOutcome::Type classifyTransfer(const TransferSummary& summary)
{
	typedef http::ProbeOutcome::Type Type;

	switch (summary.end)
	{
		case TransferEnd::Complete:
			if (isSuccessfulStatus(summary))
			{
				return Type::Success;
			}
			return (summary.status == 404) ? Type::NotFound : Type::InvalidResponse;
		case TransferEnd::RemoteNotFound:
			return Type::NotFound;
		case TransferEnd::Aborted:
		case TransferEnd::Failed:
			return Type::Unreachable;
	}
	__builtin_unreachable();
}

http::RateMeasurement measureTransferRate(const TransferSummary& summary, uint64_t minimumBytes)
{
	http::RateMeasurement result;
	result.bytes = summary.bytes;
	result.seconds = summary.seconds;

	bool finished = (summary.end == TransferEnd::Complete) ||
			(summary.end == TransferEnd::Aborted && summary.windowEnded);
	if (finished && isSuccessfulStatus(summary) &&
			summary.bytes >= minimumBytes && summary.seconds > 0)
	{
		result.valid = true;
		result.bytesPerSecond = summary.bytes / summary.seconds;
	}
	return result;
}

bool isFtpUrl(const string& url)
{
	return startsWith(toLower(url.substr(0, 4)), "ftp:");
}

}
}
