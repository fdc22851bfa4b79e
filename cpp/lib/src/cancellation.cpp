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
#include <mirrorpilot/cancellation.hpp>

namespace mirrorpilot {

CancellationToken::CancellationToken()
	: __flag(std::make_shared< std::atomic< bool > >(false))
{}

void CancellationToken::cancel() const
{
	__flag->store(true);
}

bool CancellationToken::isCancelled() const
{
	return __flag->load();
}

std::atomic< bool >* CancellationToken::getFlag() const
{
	return __flag.get();
}

}
