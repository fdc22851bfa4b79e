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
#ifndef MIRRORPILOT_CONFIG_SEEN
#define MIRRORPILOT_CONFIG_SEEN

/// @file

#include <mirrorpilot/common.hpp>

namespace mirrorpilot {

namespace internal {

struct ConfigImpl;

}

/// stores the library's configuration variables
/**
 * Options are keyed by lowercase names with '::' separating levels, for
 * example @c mirrorpilot::probe::timeout. Every known option has a built-in
 * default; configuration files and command-line overrides change them.
 */
class MIRRORPILOT_API Config
{
	internal::ConfigImpl* __impl;
 public:
	/// constructor
	/**
	 * Sets built-in defaults and then reads configuration files.
	 */
	Config();
	/// destructor
	virtual ~Config();
	/// copy constructor
	Config(const Config& other);
	/// assignment operator
	Config& operator=(const Config& other);

	/// returns scalar option names
	vector< string > getScalarOptionNames() const;
	/// returns list option names
	vector< string > getListOptionNames() const;

	/// sets new value for the scalar option
	/**
	 * @param optionName name of the option to modify
	 * @param value new value for the option
	 */
	void setScalar(const string& optionName, const string& value);
	/// appends new element to the value of the list option
	/**
	 * @param optionName the name of the option to modify
	 * @param value new value element for the option
	 */
	void setList(const string& optionName, const string& value);
	/// empties the list option
	void clearList(const string& optionName);

	/// gets the contents of the list option
	/**
	 * @param optionName the name of the option
	 * @return the value of the option
	 * @exception Exception if the option is not known
	 */
	vector< string > getList(const string& optionName) const;
	/// gets the contents of the scalar option as a string
	/**
	 * @param optionName the name of the option
	 * @exception Exception if the option is not known
	 */
	string getString(const string& optionName) const;
	/// gets the contents of the scalar option as a path
	/**
	 * Relative values are joined with the path of the parent option, so with
	 * the defaults @c mirrorpilot::directory::log yields
	 * @c /var/log/mirrorpilot.log.
	 *
	 * @param optionName the name of the option
	 */
	string getPath(const string& optionName) const;
	/// gets the contents of the scalar option as a boolean
	/**
	 * Empty value, @c "false", @c "0" and @c "no" mean @c false, anything
	 * else means @c true.
	 */
	bool getBool(const string& optionName) const;
	/// gets the contents of the scalar option as an integer
	/**
	 * @exception Exception if the value is not a number
	 */
	ssize_t getInteger(const string& optionName) const;
};

} // namespace

#endif
