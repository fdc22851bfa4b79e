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
#ifndef MISC_SEEN
#define MISC_SEEN

#include "common.hpp"

#include <functional>

#include <boost/program_options.hpp>
namespace bpo = boost::program_options;

class Context
{
	shared_ptr< Config > __config;
	unique_ptr< http::ProbeClient > __probe_client;
	unique_ptr< MirrorManager > __manager;
 public:
	Context();
	~Context();

	shared_ptr< Config > getConfig();
	http::ProbeClient& getProbeClient();
	MirrorManager& getManager();
	/// patterns of '-x' options and the configuration
	ExclusionSet getExclusions();

	CancellationToken token;
	vector< string > unparsed;
	vector< string > passthrough; ///< arguments after '--'
};
std::function< int (Context&) > getHandler(const string&);

string parseCommonOptions(int argc, char** argv, Config&, vector< string >& unparsed);
bpo::variables_map parseOptions(const Context& context, bpo::options_description options,
		vector< string >& arguments);

void checkNoExtraArguments(const vector< string >& arguments);

// Control-C cancels the token, the second one kills the program
void installInterruptHandler(const CancellationToken&);

#endif
