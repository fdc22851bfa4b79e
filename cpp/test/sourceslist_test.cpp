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
#include <gtest/gtest.h>

#include <mirrorpilot/sourceslist.hpp>

using namespace mirrorpilot;

namespace {

const char* const debianList =
		"# See https://wiki.debian.org/SourcesList\n"
		"\n"
		"deb http://deb.debian.org/debian/ bookworm main contrib non-free-firmware\n"
		"deb-src http://deb.debian.org/debian/ bookworm main\n"
		"deb [arch=amd64 signed-by=/usr/share/keyrings/debian-archive-keyring.gpg] http://deb.debian.org/debian bookworm-updates main\n"
		"deb http://security.debian.org/debian-security bookworm-security main\n"
		"deb https://download.example.com/linux/debian bookworm stable\n";

}

TEST(SourcesListTest, Entries)
{
	SourcesList list(debianList);
	auto entries = list.getEntries();
	ASSERT_EQ(5u, entries.size());
	EXPECT_EQ("deb-src", entries[1].type);
	EXPECT_EQ("arch=amd64 signed-by=/usr/share/keyrings/debian-archive-keyring.gpg", entries[2].options);
	EXPECT_EQ("http://deb.debian.org/debian", entries[2].uri);
	EXPECT_EQ("bookworm-updates", entries[2].suite);
	EXPECT_EQ((vector< string >{ "main", "contrib", "non-free-firmware" }), entries[0].components);
}

TEST(SourcesListTest, CurrentMirrorAndCodename)
{
	SourcesList list(debianList);
	EXPECT_EQ("http://deb.debian.org/debian/", list.findCurrentMirror());
	EXPECT_EQ("bookworm", list.findCodename());

	SourcesList oldLayout("deb http://ftp.de.debian.org/debian/ stretch/updates main\n");
	EXPECT_EQ("stretch", oldLayout.findCodename());
}

TEST(SourcesListTest, CdromAndThirdPartyEntriesAreSkipped)
{
	SourcesList list(
			"deb cdrom:[Debian GNU/Linux 12 _Bookworm_]/ bookworm main\n"
			"deb https://download.example.com/linux/debian bookworm stable\n"
			"deb http://ftp.fr.debian.org/debian bookworm main\n");
	EXPECT_EQ("http://ftp.fr.debian.org/debian", list.findCurrentMirror());
}

TEST(SourcesListTest, NoMirror)
{
	SourcesList list("# nothing here\n", "/etc/apt/sources.list");
	EXPECT_THROW(list.findCurrentMirror(), Exception);
	EXPECT_THROW(list.findCodename(), Exception);
}

TEST(SourcesListTest, ReplaceMirror)
{
	SourcesList list(debianList);
	EXPECT_EQ(3u, list.replaceMirror({ "http://deb.debian.org/debian" }, "http://ftp.nl.debian.org/debian/"));
	EXPECT_EQ(
			"# See https://wiki.debian.org/SourcesList\n"
			"\n"
			"deb http://ftp.nl.debian.org/debian/ bookworm main contrib non-free-firmware\n"
			"deb-src http://ftp.nl.debian.org/debian/ bookworm main\n"
			"deb [arch=amd64 signed-by=/usr/share/keyrings/debian-archive-keyring.gpg] http://ftp.nl.debian.org/debian/ bookworm-updates main\n"
			"deb http://security.debian.org/debian-security bookworm-security main\n"
			"deb https://download.example.com/linux/debian bookworm stable\n",
			list.toString());
}

TEST(SourcesListTest, ReplaceNothing)
{
	SourcesList list(debianList);
	EXPECT_EQ(0u, list.replaceMirror({ "http://ftp.se.debian.org/debian" }, "http://ftp.nl.debian.org/debian/"));
	EXPECT_EQ(debianList, list.toString());
}

TEST(SourcesListTest, AddsMissingTrailingNewline)
{
	SourcesList list("deb http://a.example.org/debian bookworm main");
	EXPECT_EQ("deb http://a.example.org/debian bookworm main\n", list.toString());
	EXPECT_EQ(1u, list.getEntries().size());
}

TEST(SourcesListGeneratorTest, Debian)
{
	EXPECT_EQ(
			"deb http://ftp.nl.debian.org/debian/ bookworm main contrib\n"
			"deb http://ftp.nl.debian.org/debian/ bookworm-updates main contrib\n"
			"deb http://security.debian.org/debian-security/ bookworm-security main contrib\n",
			generateSourcesList(Distributor::Debian, "http://ftp.nl.debian.org/debian/", "bookworm",
					{ "release", "updates", "security" }, { "main", "contrib" }, false));
	EXPECT_EQ(
			"deb http://security.debian.org/debian-security/ buster/updates main\n"
			"deb-src http://security.debian.org/debian-security/ buster/updates main\n",
			generateSourcesList(Distributor::Debian, "http://ftp.nl.debian.org/debian/", "buster",
					{ "security" }, { "main" }, true));
}

TEST(SourcesListGeneratorTest, ArchiveServesSecurityToo)
{
	EXPECT_EQ(
			"deb http://archive.debian.org/debian/ stretch main\n"
			"deb http://archive.debian.org/debian/ stretch/updates main\n",
			generateSourcesList(Distributor::Debian, "http://archive.debian.org/debian/", "stretch",
					{ "release", "security" }, { "main" }, false));
}

TEST(SourcesListGeneratorTest, Ubuntu)
{
	EXPECT_EQ(
			"deb http://mirror.example.org/ubuntu jammy-backports main universe\n"
			"deb http://security.ubuntu.com/ubuntu/ jammy-security main universe\n",
			generateSourcesList(Distributor::Ubuntu, "http://mirror.example.org/ubuntu", "jammy",
					{ "backports", "security" }, { "main", "universe" }, false));
}

TEST(SourcesListGeneratorTest, InvalidInput)
{
	EXPECT_THROW(generateSourcesList(Distributor::Debian, "http://a.example.org/debian", "bookworm",
			{ "release", "nightly" }, { "main" }, false), Exception);
	EXPECT_THROW(generateSourcesList(Distributor::Debian, "http://a.example.org/debian", "bookworm",
			{ "release" }, { "universe" }, false), Exception);
	EXPECT_THROW(generateSourcesList(Distributor::Ubuntu, "mirror.example.org/ubuntu", "jammy",
			{ "release" }, { "main" }, false), Exception);
}
