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
#ifndef MIRRORPILOT_CANCELLATION_SEEN
#define MIRRORPILOT_CANCELLATION_SEEN

/// @file

#include <atomic>

#include <mirrorpilot/common.hpp>

namespace mirrorpilot {

/// cooperative cancellation flag shared between a requester and workers
/**
 * Copies share the same flag. Workers check @ref isCancelled at their next
 * cooperative point and stop starting new work. @ref cancel is safe to call
 * from a signal handler.
 */
class MIRRORPILOT_API CancellationToken
{
	shared_ptr< std::atomic< bool > > __flag;
 public:
	CancellationToken();
	void cancel() const;
	bool isCancelled() const;
	/// @cond
	std::atomic< bool >* getFlag() const;
	/// @endcond
};

}

#endif
