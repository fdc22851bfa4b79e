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
#ifndef COMMON_SEEN
#define COMMON_SEEN

#include <mirrorpilot/common.hpp>
#include <mirrorpilot/config.hpp>
#include <mirrorpilot/cancellation.hpp>
#include <mirrorpilot/exclusionset.hpp>
#include <mirrorpilot/manager.hpp>
#include <mirrorpilot/http/probeclient.hpp>

using namespace mirrorpilot;

#endif
