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
#ifndef MIRRORPILOT_INTERNAL_TRANSFERSUMMARY_SEEN
#define MIRRORPILOT_INTERNAL_TRANSFERSUMMARY_SEEN

#include <mirrorpilot/http/probeclient.hpp>

namespace mirrorpilot {
namespace internal {

// how a transfer ended, as seen by the transport
enum class TransferEnd
{
	Complete, // including a body cut at the size limit
	RemoteNotFound, // reported by the transport itself, e.g. for ftp
	Aborted, // stopped by our callbacks: cancellation or the end of a sample window
	Failed
};

struct TransferSummary
{
	TransferEnd end;
	long status;
	bool isFtp; // ftp servers have no status codes comparable to http ones
	bool windowEnded; // the rate sample window elapsed before the end of the resource
	uint64_t bytes;
	double seconds;

	TransferSummary();
};

http::ProbeOutcome::Type classifyTransfer(const TransferSummary&);
// a measurement needs a 2xx answer, @a minimumBytes bytes and either the whole
// resource or a full sample window
http::RateMeasurement measureTransferRate(const TransferSummary&, uint64_t minimumBytes);

bool isFtpUrl(const string& url);

}
}

#endif
