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
#ifndef MIRRORPILOT_INTERNAL_EXCEPTIONLESSFUTURE_SEEN
#define MIRRORPILOT_INTERNAL_EXCEPTIONLESSFUTURE_SEEN

#include <thread>

#include <mirrorpilot/common.hpp>

namespace mirrorpilot {
namespace internal {

/* runs a functor in its own thread; an exception escaping the functor is
   kept as a message instead of terminating the process */

template< typename ResultT >
class ExceptionlessFuture
{
 public:
	template< typename FunctorT >
	ExceptionlessFuture(const FunctorT& functor)
		: p_result(), p_failed(false)
	{
		p_thread = std::thread([this, functor]()
		{
			try
			{
				p_result = functor();
			}
			catch (std::exception& e)
			{
				p_failed = true;
				p_error = e.what();
			}
		});
	}
	ExceptionlessFuture(const ExceptionlessFuture&) = delete;
	~ExceptionlessFuture()
	{
		if (p_thread.joinable())
		{
			p_thread.join();
		}
	}
	ResultT get()
	{
		if (p_thread.joinable())
		{
			p_thread.join();
		}
		return p_result;
	}
	// valid after get()
	bool failed() const { return p_failed; }
	const string& getError() const { return p_error; }
 private:
	std::thread p_thread;
	ResultT p_result; // for our purposes and simplicity we assume copyability
	bool p_failed;
	string p_error;
};

}
}

#endif
