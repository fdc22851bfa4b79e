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
#include <cstdlib>

#include <unistd.h>

#include <gtest/gtest.h>

#include <mirrorpilot/config.hpp>
#include <mirrorpilot/file.hpp>

#include <internal/configparser.hpp>

using namespace mirrorpilot;

class ConfigParserTest: public ::testing::Test
{
 protected:
	vector< pair< string, string > > scalars;
	vector< pair< string, string > > lists;
	vector< string > cleared;
	internal::ConfigParser parser;

	ConfigParserTest()
		: parser(
			[this](const string& name, const string& value) { scalars.push_back({ name, value }); },
			[this](const string& name, const string& value) { lists.push_back({ name, value }); },
			[this](const string& name, const string&) { cleared.push_back(name); })
	{}
};

TEST_F(ConfigParserTest, ScalarsAndLists)
{
	parser.parseText(
			"// probing\n"
			"mirrorpilot::probe::timeout \"5\";\n"
			"mirrorpilot::update { max-attempts \"3\"; backoff { threshold \"60\"; }; };\n"
			"# exclusions\n"
			"mirrorpilot::exclude { \"*.example.com*\"; \"http://slow.example.org/*\"; };\n"
			"#clear mirrorpilot::update::signatures::transient;\n");

	EXPECT_EQ((vector< pair< string, string > >{
			{ "mirrorpilot::probe::timeout", "5" },
			{ "mirrorpilot::update::max-attempts", "3" },
			{ "mirrorpilot::update::backoff::threshold", "60" } }), scalars);
	EXPECT_EQ((vector< pair< string, string > >{
			{ "mirrorpilot::exclude", "*.example.com*" },
			{ "mirrorpilot::exclude", "http://slow.example.org/*" } }), lists);
	EXPECT_EQ((vector< string >{ "mirrorpilot::update::signatures::transient" }), cleared);
}

TEST_F(ConfigParserTest, SyntaxErrors)
{
	EXPECT_THROW(parser.parseText("mirrorpilot::probe::timeout \"5\"\n"), Exception);
	EXPECT_THROW(parser.parseText("mirrorpilot::probe::timeout \"5;\n"), Exception);
	EXPECT_THROW(parser.parseText("mirrorpilot:probe \"5\";\n"), Exception);
	EXPECT_THROW(parser.parseText("mirrorpilot { \"a\"; \n"), Exception);
	EXPECT_THROW(parser.parseText("#bogus\n"), Exception);
}

TEST(ConfigTest, Defaults)
{
	Config config;
	EXPECT_EQ(10, config.getInteger("mirrorpilot::probe::timeout"));
	EXPECT_EQ("apt-get update", config.getString("mirrorpilot::update::command"));
	EXPECT_TRUE(config.getBool("mirrorpilot::update::switch-mirrors"));
	EXPECT_FALSE(config.getBool("mirrorpilot::discovery::upstream-mode"));
	EXPECT_EQ("/var/log/mirrorpilot.log", config.getPath("mirrorpilot::directory::log"));
	EXPECT_TRUE(config.getList("mirrorpilot::exclude").empty());
	EXPECT_FALSE(config.getList("mirrorpilot::update::signatures::fatal").empty());
}

TEST(ConfigTest, Modification)
{
	Config config;
	config.setScalar("mirrorpilot::probe::timeout", "3");
	config.setList("mirrorpilot::exclude", "*.example.com*");
	Config copy = config;
	config.clearList("mirrorpilot::exclude");

	EXPECT_EQ(3, copy.getInteger("mirrorpilot::probe::timeout"));
	EXPECT_EQ((vector< string >{ "*.example.com*" }), copy.getList("mirrorpilot::exclude"));
	EXPECT_TRUE(config.getList("mirrorpilot::exclude").empty());

	config.setScalar("mirrorpilot::probe::timeout", "soon");
	EXPECT_THROW(config.getInteger("mirrorpilot::probe::timeout"), Exception);
	EXPECT_THROW(config.getString("mirrorpilot::no-such-option"), Exception);
	EXPECT_THROW(config.getList("mirrorpilot::probe::timeout"), Exception);
}

TEST(ConfigTest, ConfigurationFile)
{
	char pathTemplate[] = "/tmp/mirrorpilot-config-XXXXXX";
	int fd = mkstemp(pathTemplate);
	ASSERT_NE(-1, fd);
	close(fd);
	string path = pathTemplate;
	{
		RequiredFile file(path, "w");
		file.put("mirrorpilot::ranker::max-mirrors \"7\";\n"
				"mirrorpilot::exclude { \"*://bad.example.org/*\"; };\n");
		file.close();
	}

	setenv("MIRRORPILOT_CONFIG", path.c_str(), 1);
	Config config;
	unsetenv("MIRRORPILOT_CONFIG");
	unlink(path.c_str());

	EXPECT_EQ(7, config.getInteger("mirrorpilot::ranker::max-mirrors"));
	EXPECT_EQ((vector< string >{ "*://bad.example.org/*" }), config.getList("mirrorpilot::exclude"));
}
