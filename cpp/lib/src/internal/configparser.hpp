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
#ifndef MIRRORPILOT_INTERNAL_CONFIGPARSER_SEEN
#define MIRRORPILOT_INTERNAL_CONFIGPARSER_SEEN

#include <functional>

#include <mirrorpilot/common.hpp>

namespace mirrorpilot {
namespace internal {

// reads APT-style configuration text:
//   name "value";
//   name { "element"; "element"; };
//   name { nested "value"; other { "element"; }; };
//   #clear name;
// with '// ...' and '# ...' comments
class ConfigParser
{
 public:
	typedef std::function< void (const string&, const string&) > Handler;
 private:
	struct Token
	{
		enum Type { Clear, Name, Value, Semicolon, OpeningBracket, ClosingBracket, End };

		Type type;
		string text;
		size_t line;
		size_t column;
	};

	Handler __scalar_handler;
	Handler __list_handler;
	Handler __clear_handler;

	vector< Token > __tokens;
	size_t __position;

	void __tokenize(const string& text);
	void __block(const string& prefix);
	void __option(const string& prefix);
	void __list_tail(const string& name);
	const Token& __peek() const;
	const Token& __expect(Token::Type type);
	void __error_out(const Token& token, const string& expected) const;

	static string __get_token_description(Token::Type type);
 public:
	ConfigParser(Handler scalarHandler, Handler listHandler, Handler clearHandler);
	void parse(const string& path);
	void parseText(const string& text);
};

} // namespace
} // namespace

#endif
