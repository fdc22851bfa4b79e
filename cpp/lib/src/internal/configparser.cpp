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

#include <mirrorpilot/file.hpp>

#include <internal/common.hpp>
#include <internal/configparser.hpp>

namespace mirrorpilot {
namespace internal {

ConfigParser::ConfigParser(Handler scalarHandler, Handler listHandler, Handler clearHandler)
	: __scalar_handler(scalarHandler), __list_handler(listHandler),
	__clear_handler(clearHandler), __position(0)
{}

void ConfigParser::parse(const string& path)
{
	RequiredFile file(path, "r");
	string content;
	file.getFile(content);

	try
	{
		parseText(content);
	}
	catch (Exception&)
	{
		fatal2(__("unable to parse the configuration file '%s'"), path);
	}
}

void ConfigParser::parseText(const string& text)
{
	__tokens.clear();
	__position = 0;
	__tokenize(text);

	__block("");
	__expect(Token::End);
}

static bool isNameCharacter(char c)
{
	return std::isalnum((unsigned char)c) || c == '_' || c == '-' || c == '.' || c == '/' || c == ':';
}

void ConfigParser::__tokenize(const string& text)
{
	size_t line = 1;
	size_t lineStart = 0;
	size_t i = 0;
	const size_t size = text.size();

	auto skipToEndOfLine = [&text, &i, size]()
	{
		while (i < size && text[i] != '\n')
		{
			++i;
		}
	};
	auto addToken = [this, &line, &lineStart](Token::Type type, const string& tokenText, size_t start)
	{
		__tokens.push_back(Token { type, tokenText, line, start - lineStart + 1 });
	};

	while (i < size)
	{
		char c = text[i];
		if (c == '\n')
		{
			++i;
			++line;
			lineStart = i;
		}
		else if (std::isspace((unsigned char)c))
		{
			++i;
		}
		else if (c == '/' && i+1 < size && text[i+1] == '/')
		{
			skipToEndOfLine();
		}
		else if (c == '#')
		{
			if (text.compare(i, 6, "#clear") == 0)
			{
				addToken(Token::Clear, "#clear", i);
				i += 6;
			}
			else if (i+1 == size || std::isspace((unsigned char)text[i+1]))
			{
				skipToEndOfLine();
			}
			else
			{
				Token bad { Token::End, string(), line, i - lineStart + 1 };
				__error_out(bad, __("comment ('# ') or clear directive ('#clear')"));
			}
		}
		else if (c == '"')
		{
			auto start = i;
			auto closing = text.find_first_of("\"\n", i+1);
			if (closing == string::npos || text[closing] != '"')
			{
				Token bad { Token::End, string(), line, start - lineStart + 1 };
				__error_out(bad, __("closing quote ('\"')"));
			}
			addToken(Token::Value, text.substr(start+1, closing - start - 1), start);
			i = closing + 1;
		}
		else if (c == ';')
		{
			addToken(Token::Semicolon, ";", i++);
		}
		else if (c == '{')
		{
			addToken(Token::OpeningBracket, "{", i++);
		}
		else if (c == '}')
		{
			addToken(Token::ClosingBracket, "}", i++);
		}
		else if (isNameCharacter(c))
		{
			auto start = i;
			while (i < size && isNameCharacter(text[i]))
			{
				++i;
			}
			string name = text.substr(start, i - start);
			// colons are only allowed as '::' level separators
			auto parts = split(':', name, true);
			bool wellFormed = (parts.size() % 2 == 1);
			for (size_t j = 0; j < parts.size() && wellFormed; ++j)
			{
				wellFormed = (j % 2 == 0) ? !parts[j].empty() : parts[j].empty();
			}
			if (!wellFormed)
			{
				Token bad { Token::End, string(), line, start - lineStart + 1 };
				__error_out(bad, __get_token_description(Token::Name));
			}
			addToken(Token::Name, name, start);
		}
		else
		{
			Token bad { Token::End, string(), line, i - lineStart + 1 };
			__error_out(bad, __get_token_description(Token::Name));
		}
	}
	__tokens.push_back(Token { Token::End, string(), line, i - lineStart + 1 });
}

const ConfigParser::Token& ConfigParser::__peek() const
{
	return __tokens[__position];
}

const ConfigParser::Token& ConfigParser::__expect(Token::Type type)
{
	const Token& token = __tokens[__position];
	if (token.type != type)
	{
		__error_out(token, __get_token_description(type));
	}
	if (type != Token::End)
	{
		++__position;
	}
	return token;
}

void ConfigParser::__block(const string& prefix)
{
	while (true)
	{
		auto type = __peek().type;
		if (type == Token::Clear)
		{
			++__position;
			string name = __expect(Token::Name).text;
			__expect(Token::Semicolon);
			__clear_handler(prefix + name, string());
		}
		else if (type == Token::Name)
		{
			__option(prefix);
		}
		else
		{
			break;
		}
	}
}

void ConfigParser::__option(const string& prefix)
{
	string name = prefix + __expect(Token::Name).text;
	if (__peek().type == Token::Value)
	{
		__scalar_handler(name, __expect(Token::Value).text);
	}
	else
	{
		__expect(Token::OpeningBracket);
		if (__peek().type == Token::Value)
		{
			__list_tail(name);
		}
		else
		{
			__block(name + "::");
		}
		__expect(Token::ClosingBracket);
	}
	__expect(Token::Semicolon);
}

void ConfigParser::__list_tail(const string& name)
{
	while (__peek().type == Token::Value)
	{
		string value = __expect(Token::Value).text;
		__expect(Token::Semicolon);
		__list_handler(name, value);
	}
}

string ConfigParser::__get_token_description(Token::Type type)
{
	switch (type)
	{
		case Token::Clear: return __("clear directive ('#clear')");
		case Token::ClosingBracket: return __("closing curly bracket ('}')");
		case Token::OpeningBracket: return __("opening curly bracket ('{')");
		case Token::Semicolon: return __("semicolon (';')");
		case Token::Value: return __("option value (quoted string)");
		case Token::Name: return __("option name (letters, numbers, slashes, points, dashes, double colons allowed)");
		case Token::End: return __("end of file");
		default:
			fatal2i("no description for token #%d", int(type));
	}
	return string(); // unreachable
}

void ConfigParser::__error_out(const Token& token, const string& expected) const
{
	fatal2(__("syntax error: line %u, character %u: expected: %s"),
			token.line, token.column, expected);
}

} // namespace
} // namespace
