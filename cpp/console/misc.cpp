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
#include <csignal>
#include <algorithm>
#include <cstring>
#include <map>
using std::map;
#include <sstream>

#include <common/regex.hpp>

#include "common.hpp"
#include "misc.hpp"
#include "handlers.hpp"

void handleQuietOption(const Config&);

static void enableVerbosity(Config& config)
{
	for (const char* subsystem: { "discovery", "ranker", "update" })
	{
		config.setScalar(string("debug::") + subsystem, "yes");
	}
}

string parseCommonOptions(int argc, char** argv, Config& config, vector< string >& unparsed)
{
	string command;
	// parsing
	bpo::options_description options("Common options");
	vector< string > directOptions;
	vector< string > exclusions;
	string mirrorFile;
	string distributor;
	string codename;
	options.add_options()
		("option,o", bpo::value< vector< string > >(&directOptions))
		("exclude,x", bpo::value< vector< string > >(&exclusions))
		("mirror-file,F", bpo::value< string >(&mirrorFile))
		("max,m", bpo::value< string >())
		("upstream,U", "")
		("distributor,d", bpo::value< string >(&distributor))
		("codename,c", bpo::value< string >(&codename))
		("quiet,q", "")
		("verbose,v", "")
		("command", bpo::value< string >(&command))
		("arguments", bpo::value< vector< string > >());

	bpo::positional_options_description positionalOptions;
	positionalOptions.add("command", 1);
	positionalOptions.add("arguments", -1);

	try
	{
		bpo::variables_map variablesMap;
		bpo::parsed_options parsed = bpo::command_line_parser(argc, argv).options(options)
				.style(bpo::command_line_style::default_style & ~bpo::command_line_style::allow_guessing)
				.positional(positionalOptions).allow_unregistered().run();
		bpo::store(parsed, variablesMap);
		bpo::notify(variablesMap);

		{ // do not pass 'command' further
			auto commandOptionIt = std::find_if(parsed.options.begin(), parsed.options.end(),
					[](const bpo::option& o) { return o.string_key == "command"; });
			if (commandOptionIt != parsed.options.end())
			{
				parsed.options.erase(commandOptionIt);
			}
		}
		unparsed = bpo::collect_unrecognized(parsed.options, bpo::include_positional);

		{ // processing
			if (command.empty())
			{
				fatal2(__("no command specified"));
			}
			for (const string& exclusion: exclusions)
			{
				config.setList("mirrorpilot::exclude", exclusion);
			}
			if (!mirrorFile.empty())
			{
				config.setScalar("mirrorpilot::discovery::mirror-file", mirrorFile);
			}
			if (variablesMap.count("max"))
			{
				config.setScalar("mirrorpilot::ranker::max-mirrors", variablesMap["max"].as< string >());
			}
			if (variablesMap.count("upstream"))
			{
				config.setScalar("mirrorpilot::discovery::upstream-mode", "yes");
			}
			if (!distributor.empty())
			{
				config.setScalar("mirrorpilot::distributor", getDistributorName(parseDistributor(distributor)));
			}
			if (!codename.empty())
			{
				config.setScalar("mirrorpilot::codename", codename);
			}
			if (variablesMap.count("verbose"))
			{
				enableVerbosity(config);
			}
			if (variablesMap.count("quiet"))
			{
				config.setScalar("mirrorpilot::console::quiet", "yes");
				handleQuietOption(config);
			}
		}

		smatch m;
		for (const string& directOption: directOptions)
		{
			static const sregex optionRegex = sregex::compile("(.*?)=(.*)");
			if (!regex_match(directOption, m, optionRegex))
			{
				fatal2(__("invalid option syntax in '%s' (right is '<option>=<value>')"), directOption);
			}
			string key = m[1];
			string value = m[2];

			static const sregex listOptionNameRegex = sregex::compile("(.*?)::");
			if (regex_match(key, m, listOptionNameRegex))
			{
				// this is list option
				config.setList(m[1], value);
			}
			else
			{
				// regular option
				config.setScalar(key, value);
			}
		}
		// probe the value early, so a typo is reported before any network activity
		config.getInteger("mirrorpilot::ranker::max-mirrors");
	}
	catch (const bpo::error& e)
	{
		fatal2(__("failed to parse command-line options: %s"), e.what());
	}
	catch (Exception&)
	{
		fatal2(__("error while processing command-line options"));
	}
	return command;
}

bpo::variables_map parseOptions(const Context& context, bpo::options_description options,
		vector< string >& arguments)
{
	bpo::options_description argumentOptions("");
	argumentOptions.add_options()
		("arguments", bpo::value< vector< string > >(&arguments));

	bpo::options_description all("");
	all.add(options);
	all.add(argumentOptions);

	bpo::positional_options_description positionalOptions;
	positionalOptions.add("arguments", -1);

	bpo::variables_map variablesMap;
	try
	{
		bpo::parsed_options parsed = bpo::command_line_parser(context.unparsed)
				.style(bpo::command_line_style::default_style & ~bpo::command_line_style::allow_guessing)
				.options(all).positional(positionalOptions).run();
		bpo::store(parsed, variablesMap);
	}
	catch (const bpo::unknown_option& e)
	{
		fatal2(__("unknown option '%s'"), e.get_option_name());
	}
	catch (const bpo::error& e)
	{
		fatal2(__("failed to parse command-line options: %s"), e.what());
	}
	bpo::notify(variablesMap);

	return variablesMap;
}

std::function< int (Context&) > getHandler(const string& command)
{
	static map< string, std::function< int (Context&) > > handlerMap = {
		{ "find-current-mirror", &findCurrentMirror },
		{ "find-best-mirror", &findBestMirror },
		{ "list-mirrors", &listMirrors },
		{ "change-mirror", &changeMirror },
		{ "auto-change-mirror", &autoChangeMirror },
		{ "update", &smartUpdate },
		{ "check-eol", &checkEol },
		{ "releases", &showReleases },
		{ "generate-sources", &generateSources },
		{ "config-dump", &dumpConfig },
	};
	auto it = handlerMap.find(command);
	if (it == handlerMap.end())
	{
		fatal2(__("unrecognized command '%s'"), command);
	}
	return it->second;
}

void checkNoExtraArguments(const vector< string >& arguments)
{
	if (!arguments.empty())
	{
		auto argumentsString = join(" ", arguments);
		warn2(__("extra arguments '%s' are not processed"), argumentsString);
	}
}

void handleQuietOption(const Config& config)
{
	if (config.getBool("mirrorpilot::console::quiet"))
	{
		if (!freopen("/dev/null", "w", stdout))
		{
			fatal2e(__("unable to redirect standard output to '/dev/null'"));
		}
	}
}

namespace {

std::atomic< bool >* interruptFlag = NULL;

void interruptHandler(int)
{
	if (interruptFlag)
	{
		interruptFlag->store(true);
	}
	signal(SIGINT, SIG_DFL);
}

}

void installInterruptHandler(const CancellationToken& token)
{
	interruptFlag = token.getFlag();
	if (signal(SIGINT, interruptHandler) == SIG_ERR)
	{
		fatal2e(__("unable to install the interrupt handler"));
	}
}

Context::Context()
{}

Context::~Context()
{}

shared_ptr< Config > Context::getConfig()
{
	if (!__config)
	{
		try
		{
			__config.reset(new Config);
		}
		catch (Exception&)
		{
			fatal2(__("error while loading the configuration"));
		}
	}
	return __config;
}

http::ProbeClient& Context::getProbeClient()
{
	if (!__probe_client)
	{
		__probe_client.reset(new http::CurlProbeClient(*getConfig()));
	}
	return *__probe_client;
}

MirrorManager& Context::getManager()
{
	if (!__manager)
	{
		__manager.reset(new MirrorManager(getConfig(), getProbeClient(), token));
	}
	return *__manager;
}

ExclusionSet Context::getExclusions()
{
	try
	{
		return ExclusionSet(getConfig()->getList("mirrorpilot::exclude"));
	}
	catch (Exception&)
	{
		fatal2(__("invalid mirror exclusions"));
	}
	__builtin_unreachable();
}
