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
#include <cctype>
#include <cstdlib>
#include <map>
using std::map;

#include <boost/lexical_cast.hpp>

#include <common/common.hpp>
#include <common/regex.hpp>

#include <mirrorpilot/config.hpp>

#include <internal/common.hpp>
#include <internal/configparser.hpp>
#include <internal/filesystem.hpp>

namespace mirrorpilot {

namespace internal {

struct ConfigImpl
{
	map< string, string > regularVars;
	map< string, vector< string > > listVars;
	vector< string > optionalPatterns;

	void initializeVariables();
	void readConfigs(Config*);
	bool isOptionalOption(const string& optionName) const;
	void clearByPrefix(const string& prefix);
};

void ConfigImpl::initializeVariables()
{
	regularVars =
	{
		{ "mirrorpilot::architecture", "" }, // detected on demand
		{ "mirrorpilot::codename", "" },
		{ "mirrorpilot::console::quiet", "no" },
		{ "mirrorpilot::console::url-char-len", "34" },
		{ "mirrorpilot::directory", "/" },
		{ "mirrorpilot::directory::configuration", "etc/mirrorpilot" },
		{ "mirrorpilot::directory::configuration::main", "mirrorpilot.conf" },
		{ "mirrorpilot::directory::configuration::main-parts", "mirrorpilot.conf.d" },
		{ "mirrorpilot::directory::distro-info", "/usr/share/distro-info" },
		{ "mirrorpilot::directory::log", "var/log/mirrorpilot.log" },
		{ "mirrorpilot::discovery::country", "" },
		{ "mirrorpilot::discovery::mirror-file", "" },
		{ "mirrorpilot::discovery::upstream-mode", "no" },
		{ "mirrorpilot::distributor", "" },
		{ "mirrorpilot::lists-directory", "/var/lib/apt/lists" },
		{ "mirrorpilot::log", "yes" },
		{ "mirrorpilot::log::levels::discovery", "1" },
		{ "mirrorpilot::log::levels::ranking", "1" },
		{ "mirrorpilot::log::levels::session", "1" },
		{ "mirrorpilot::log::levels::update", "2" },
		{ "mirrorpilot::probe::bandwidth::minimum-bytes", "4096" },
		{ "mirrorpilot::probe::bandwidth::sample-window", "2000" },
		{ "mirrorpilot::probe::max-body-size", "8388608" },
		{ "mirrorpilot::probe::proxy", "" },
		{ "mirrorpilot::probe::timeout", "10" },
		{ "mirrorpilot::ranker::concurrency", "0" },
		{ "mirrorpilot::ranker::max-mirrors", "50" },
		{ "mirrorpilot::sources-list", "" },
		{ "mirrorpilot::update::backoff", "10" },
		{ "mirrorpilot::update::backoff::threshold", "120" },
		{ "mirrorpilot::update::command", "apt-get update" },
		{ "mirrorpilot::update::max-attempts", "5" },
		{ "mirrorpilot::update::max-transient-retries", "2" },
		{ "mirrorpilot::update::switch-mirrors", "yes" },
		{ "debug::discovery", "no" },
		{ "debug::logger", "no" },
		{ "debug::probe", "no" },
		{ "debug::ranker", "no" },
		{ "debug::update", "no" },
	};

	optionalPatterns =
	{
		// APT's own proxy settings may be shared through a common file
		"acquire::*::proxy",
		"acquire::*::proxy::*",
	};

	listVars =
	{
		{ "mirrorpilot::exclude", vector< string > {} },
		{ "mirrorpilot::update::signatures::fatal", vector< string > {
				"permission denied",
				"are you root",
				"no space left on device",
				"could not open lock file",
				"unable to lock directory",
				"malformed entry",
				"malformed line",
				"the list of sources could not be read",
		} },
		{ "mirrorpilot::update::signatures::mirror", vector< string > {
				"hash sum mismatch",
				"hashes do not match",
				"file has unexpected size",
				"mirror sync in progress",
				"archive-update-in-progress",
				"clearsigned file isn't valid",
				"is expired",
				"is not valid yet",
		} },
		{ "mirrorpilot::update::signatures::transient", vector< string > {
				"temporary failure resolving",
				"could not resolve",
				"connection timed out",
				"connection failed",
				"network is unreachable",
				"connection refused",
				"unable to connect",
		} },
	};
}

bool ConfigImpl::isOptionalOption(const string& optionName) const
{
	static const sregex convertRegex = sregex::compile("\\*");
	smatch m;
	FORIT(patternIt, optionalPatterns)
	{
		auto currentRegexString = regex_replace(*patternIt, convertRegex, "[^:]*?");
		sregex currentRegex = sregex::compile(currentRegexString);
		if (regex_match(optionName, m, currentRegex))
		{
			return true;
		}
	}
	return false;
}

void ConfigImpl::clearByPrefix(const string& prefix)
{
	auto normalizedPrefix = toLower(prefix);
	FORIT(it, regularVars)
	{
		if (startsWith(it->first, normalizedPrefix))
		{
			it->second.clear();
		}
	}
	FORIT(it, listVars)
	{
		if (startsWith(it->first, normalizedPrefix))
		{
			it->second.clear();
		}
	}
}

void ConfigImpl::readConfigs(Config* config)
{
	auto scalarHandler = [config](const string& name, const string& value)
	{
		config->setScalar(name, value);
	};
	auto listHandler = [config](const string& name, const string& value)
	{
		config->setList(name, value);
	};
	auto clearHandler = [this](const string& name, const string& /* no value */)
	{
		this->clearByPrefix(name);
	};

	internal::ConfigParser parser(scalarHandler, listHandler, clearHandler);

	vector< string > configFiles = internal::fs::glob(config->getPath(
			"mirrorpilot::directory::configuration::main-parts") + "/*");

	string mainFilePath = config->getPath("mirrorpilot::directory::configuration::main");
	const char* envConfig = getenv("MIRRORPILOT_CONFIG");
	if (envConfig)
	{
		mainFilePath = envConfig;
	}
	if (internal::fs::fileExists(mainFilePath))
	{
		configFiles.push_back(mainFilePath);
	}

	FORIT(configFileIt, configFiles)
	{
		try
		{
			parser.parse(*configFileIt);
		}
		catch (Exception&)
		{
			warn2(__("skipped the configuration file '%s'"), *configFileIt);
		}
	}
}

}

Config::Config()
{
	__impl = new internal::ConfigImpl;
	__impl->initializeVariables();
	__impl->readConfigs(this);
}

Config::~Config()
{
	delete __impl;
}

Config::Config(const Config& other)
{
	__impl = new internal::ConfigImpl(*other.__impl);
}

Config& Config::operator=(const Config& other)
{
	if (this == &other)
	{
		return *this;
	}
	delete __impl;
	__impl = new internal::ConfigImpl(*other.__impl);
	return *this;
}

vector< string > Config::getScalarOptionNames() const
{
	vector< string > result;
	FORIT(regularVariableIt, __impl->regularVars)
	{
		result.push_back(regularVariableIt->first);
	}
	return result;
}

vector< string > Config::getListOptionNames() const
{
	vector< string > result;
	FORIT(listVariableIt, __impl->listVars)
	{
		result.push_back(listVariableIt->first);
	}
	return result;
}

string Config::getString(const string& optionName) const
{
	auto it = __impl->regularVars.find(optionName);
	if (it != __impl->regularVars.cend())
	{
		return it->second;
	}
	else if (__impl->isOptionalOption(optionName))
	{
		return "";
	}
	else
	{
		fatal2(__("an attempt to get the wrong scalar option '%s'"), optionName);
	}
	__builtin_unreachable();
}

string Config::getPath(const string& optionName) const
{
	auto shallowResult = getString(optionName);
	if (!shallowResult.empty() && shallowResult[0] != '/')
	{
		// relative path, combine it with the parent option if there is one
		auto doubleColonPosition = optionName.rfind("::");
		if (doubleColonPosition != string::npos)
		{
			auto prefixOptionName = optionName.substr(0, doubleColonPosition);
			if (__impl->regularVars.find(prefixOptionName) != __impl->regularVars.cend())
			{
				auto prefix = getPath(prefixOptionName);
				if (!prefix.empty() && *prefix.rbegin() == '/')
				{
					return prefix + shallowResult;
				}
				return prefix + '/' + shallowResult;
			}
		}
	}
	return shallowResult;
}

bool Config::getBool(const string& optionName) const
{
	auto result = getString(optionName);
	return !(result.empty() || result == "false" || result == "0" || result == "no");
}

ssize_t Config::getInteger(const string& optionName) const
{
	auto source = getString(optionName);
	if (source.empty())
	{
		return 0;
	}
	ssize_t result = 0;
	try
	{
		result = boost::lexical_cast< ssize_t >(source);
	}
	catch (boost::bad_lexical_cast&)
	{
		fatal2(__("unable to convert '%s' to a number (option '%s')"), source, optionName);
	}
	return result;
}

vector< string > Config::getList(const string& optionName) const
{
	auto it = __impl->listVars.find(optionName);
	if (it != __impl->listVars.end())
	{
		return it->second;
	}
	else if (__impl->isOptionalOption(optionName))
	{
		return vector< string >();
	}
	else
	{
		fatal2(__("an attempt to get the wrong list option '%s'"), optionName);
	}
	__builtin_unreachable();
}

static bool isOwnOption(const string& optionName)
{
	return internal::startsWith(optionName, "mirrorpilot::") || internal::startsWith(optionName, "debug::");
}

void Config::setScalar(const string& optionName, const string& value)
{
	auto normalizedOptionName = internal::toLower(optionName);

	if (__impl->regularVars.count(normalizedOptionName) || __impl->isOptionalOption(normalizedOptionName))
	{
		__impl->regularVars[normalizedOptionName] = value;
	}
	else if (isOwnOption(normalizedOptionName))
	{
		warn2(__("an attempt to set the wrong scalar option '%s'"), optionName);
	}
}

void Config::setList(const string& optionName, const string& value)
{
	auto normalizedOptionName = internal::toLower(optionName);

	if (__impl->listVars.count(normalizedOptionName) || __impl->isOptionalOption(normalizedOptionName))
	{
		__impl->listVars[normalizedOptionName].push_back(value);
	}
	else if (isOwnOption(normalizedOptionName))
	{
		warn2(__("an attempt to set the wrong list option '%s'"), optionName);
	}
}

void Config::clearList(const string& optionName)
{
	auto it = __impl->listVars.find(internal::toLower(optionName));
	if (it == __impl->listVars.end())
	{
		fatal2(__("an attempt to clear the wrong list option '%s'"), optionName);
	}
	it->second.clear();
}

} // namespace
