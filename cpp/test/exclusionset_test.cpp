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

#include <mirrorpilot/exclusionset.hpp>

using namespace mirrorpilot;

TEST(ExclusionSetTest, Empty)
{
	ExclusionSet set;
	EXPECT_TRUE(set.empty());
	EXPECT_FALSE(set.matches("http://ftp.debian.org/debian/"));
}

TEST(ExclusionSetTest, TrailingSlashIsIrrelevant)
{
	ExclusionSet withoutSlash({ "*.example.com/debian" });
	EXPECT_TRUE(withoutSlash.matches("http://ftp.example.com/debian/"));
	EXPECT_TRUE(withoutSlash.matches("http://ftp.example.com/debian"));

	ExclusionSet withSlash({ "*.example.com/debian/" });
	EXPECT_TRUE(withSlash.matches("http://ftp.example.com/debian/"));
	EXPECT_TRUE(withSlash.matches("http://ftp.example.com/debian"));
	EXPECT_FALSE(withSlash.matches("http://ftp.example.com/debian-security/"));
}

TEST(ExclusionSetTest, Globs)
{
	ExclusionSet set({ "*://mirror?.example.org/*", "http://[ab].example.net/*" });
	EXPECT_TRUE(set.matches("https://mirror1.example.org/ubuntu/"));
	EXPECT_FALSE(set.matches("https://mirror12.example.org/ubuntu/"));
	EXPECT_TRUE(set.matches("http://b.example.net/debian"));
	EXPECT_FALSE(set.matches("http://c.example.net/debian"));
}

TEST(ExclusionSetTest, Duplicates)
{
	ExclusionSet set;
	set.add("*.example.com*");
	set.add(" *.example.com* ");
	EXPECT_EQ(1u, set.getPatterns().size());
}

TEST(ExclusionSetTest, MalformedPatterns)
{
	ExclusionSet set;
	EXPECT_THROW(set.add(""), Exception);
	EXPECT_THROW(set.add("   "), Exception);
	EXPECT_THROW(set.add("http://[ab.example.net/"), Exception);
	EXPECT_NO_THROW(set.add("http://[]a].example.net/"));
	EXPECT_NO_THROW(set.add("http://\\[a.example.net/"));
}

TEST(ExclusionSetTest, AddUrlIsLiteral)
{
	ExclusionSet set;
	set.addUrl("http://mirror.example.org/debian[1]/");
	EXPECT_TRUE(set.matches("http://mirror.example.org/debian[1]"));
	EXPECT_FALSE(set.matches("http://mirror.example.org/debian1"));
	EXPECT_FALSE(set.matches("http://other.example.org/debian[1]"));
}
