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
#ifndef MIRRORPILOT_INTERNAL_HTML_SEEN
#define MIRRORPILOT_INTERNAL_HTML_SEEN

#include <mirrorpilot/common.hpp>

namespace mirrorpilot {
namespace internal {
namespace html {

// inner markup of every '<tag>' element; an element ends at its closing tag or
// at the next opening tag of the same name, nested elements of the same name
// are not supported
vector< string > extractElements(const string& markup, const string& tag);
// values of 'href' attributes of '<a>' elements, entities decoded
vector< string > extractLinks(const string& markup);
// text without tags, entities decoded, whitespace collapsed
string extractText(const string& markup);

string decodeEntities(const string&);

}
}
}

#endif
