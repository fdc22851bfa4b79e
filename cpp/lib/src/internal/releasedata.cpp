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
#include <internal/releasedata.hpp>

namespace mirrorpilot {
namespace internal {

const vector< BundledRelease >& getBundledReleases()
{
	static const vector< BundledRelease > releases =
	{
		// Debian
		{ Distributor::Debian, "Experimental", "experimental", "", "1993-08-16", "", "", "", false, "" },
		{ Distributor::Debian, "Sid", "sid", "", "1993-08-16", "", "", "", false, "" },
		{ Distributor::Debian, "Buzz", "buzz", "1.1", "1993-08-16", "1996-06-17", "1997-06-05", "", false, "" },
		{ Distributor::Debian, "Rex", "rex", "1.2", "1996-06-17", "1996-12-12", "1998-06-05", "", false, "" },
		{ Distributor::Debian, "Bo", "bo", "1.3", "1996-12-12", "1997-06-05", "1999-03-09", "", false, "" },
		{ Distributor::Debian, "Hamm", "hamm", "2.0", "1997-06-05", "1998-07-24", "2000-03-09", "", false, "" },
		{ Distributor::Debian, "Slink", "slink", "2.1", "1998-07-24", "1999-03-09", "2000-10-30", "", false, "" },
		{ Distributor::Debian, "Potato", "potato", "2.2", "1999-03-09", "2000-08-15", "2003-07-30", "", false, "" },
		{ Distributor::Debian, "Woody", "woody", "3.0", "2000-08-15", "2002-07-19", "2006-06-30", "", false, "" },
		{ Distributor::Debian, "Sarge", "sarge", "3.1", "2002-07-19", "2005-06-06", "2008-03-30", "", false, "" },
		{ Distributor::Debian, "Etch", "etch", "4.0", "2005-06-06", "2007-04-08", "2010-02-15", "", false, "" },
		{ Distributor::Debian, "Lenny", "lenny", "5.0", "2007-04-08", "2009-02-14", "2012-02-06", "", false, "" },
		{ Distributor::Debian, "Squeeze", "squeeze", "6.0", "2009-02-14", "2011-02-06", "2014-05-31", "", false, "" },
		{ Distributor::Debian, "Wheezy", "wheezy", "7", "2011-02-06", "2013-05-04", "2016-04-26", "", false, "" },
		{ Distributor::Debian, "Jessie", "jessie", "8", "2013-05-04", "2015-04-25", "2018-06-06", "", true, "" },
		{ Distributor::Debian, "Stretch", "stretch", "9", "2015-04-25", "2017-06-17", "2020-07-06", "", true, "" },
		{ Distributor::Debian, "Buster", "buster", "10", "2017-06-17", "2019-07-06", "2022-09-10", "", true, "" },
		{ Distributor::Debian, "Bullseye", "bullseye", "11", "2019-07-06", "2021-08-14", "2024-08-14", "", true, "" },
		{ Distributor::Debian, "Bookworm", "bookworm", "12", "2021-08-01", "2023-06-10", "2026-06-10", "", true, "" },
		{ Distributor::Debian, "Trixie", "trixie", "13", "2023-06-10", "2025-08-09", "", "", false, "" },
		{ Distributor::Debian, "Forky", "forky", "14", "2025-08-09", "", "", "", false, "" },

		// Linux Mint
		{ Distributor::LinuxMint, "Ada", "ada", "1.0", "2006-08-27", "2006-08-27", "2008-04-30", "2008-04-30", false, "dapper" },
		{ Distributor::LinuxMint, "Barbara", "barbara", "2.0", "2006-11-13", "2006-11-13", "2008-04-30", "2008-04-30", false, "edgy" },
		{ Distributor::LinuxMint, "Bea", "bea", "2.1", "2006-12-20", "2006-12-20", "2008-04-30", "2008-04-30", false, "edgy" },
		{ Distributor::LinuxMint, "Bianca", "bianca", "2.2", "2007-02-20", "2007-02-20", "2008-04-30", "2008-04-30", false, "edgy" },
		{ Distributor::LinuxMint, "Cassandra", "cassandra", "3.0", "2007-05-30", "2007-05-30", "2008-10-30", "2008-10-30", false, "feisty" },
		{ Distributor::LinuxMint, "Celena", "celena", "3.1", "2007-09-24", "2007-09-24", "2008-10-30", "2008-10-30", false, "feisty" },
		{ Distributor::LinuxMint, "Daryna", "daryna", "4.0", "2007-10-15", "2007-10-15", "2009-04-30", "2009-04-30", false, "gutsy" },
		{ Distributor::LinuxMint, "Elyssa", "elyssa", "5", "2008-06-08", "2008-06-08", "2011-04-30", "2011-04-30", true, "hardy" },
		{ Distributor::LinuxMint, "Felicia", "felicia", "6", "2008-12-15", "2008-12-15", "2010-04-30", "2010-04-30", false, "intrepid" },
		{ Distributor::LinuxMint, "Gloria", "gloria", "7", "2009-05-26", "2009-05-26", "2010-10-30", "2010-10-30", false, "jaunty" },
		{ Distributor::LinuxMint, "Helena", "helena", "8", "2009-11-28", "2009-11-28", "2011-04-30", "2011-04-30", false, "karmic" },
		{ Distributor::LinuxMint, "Isadora", "isadora", "9", "2010-05-18", "2010-05-18", "2013-04-30", "2013-04-30", true, "lucid" },
		{ Distributor::LinuxMint, "Julia", "julia", "10", "2010-11-12", "2010-11-12", "2012-04-30", "2012-04-30", false, "maverick" },
		{ Distributor::LinuxMint, "Katya", "katya", "11", "2011-05-26", "2011-05-26", "2012-10-30", "2012-10-30", false, "natty" },
		{ Distributor::LinuxMint, "Lisa", "lisa", "12", "2011-11-26", "2011-11-26", "2013-04-30", "2013-04-30", false, "oneiric" },
		{ Distributor::LinuxMint, "Maya", "maya", "13", "2012-05-23", "2012-05-23", "2017-04-30", "2017-04-30", true, "precise" },
		{ Distributor::LinuxMint, "Nadia", "nadia", "14", "2012-11-20", "2012-11-20", "2014-05-30", "2014-05-30", false, "quantal" },
		{ Distributor::LinuxMint, "Olivia", "olivia", "15", "2013-05-29", "2013-05-29", "2014-01-30", "2014-01-30", false, "raring" },
		{ Distributor::LinuxMint, "Petra", "petra", "16", "2013-11-30", "2013-11-30", "2014-07-30", "2014-07-30", false, "saucy" },
		{ Distributor::LinuxMint, "Qiana", "qiana", "17", "2014-05-31", "2014-05-31", "2019-04-30", "2019-04-30", true, "trusty" },
		{ Distributor::LinuxMint, "Rebecca", "rebecca", "17.1", "2014-11-29", "2014-11-29", "2019-04-30", "2019-04-30", true, "trusty" },
		{ Distributor::LinuxMint, "Rafaela", "rafaela", "17.2", "2015-06-30", "2015-06-30", "2019-04-30", "2019-04-30", true, "trusty" },
		{ Distributor::LinuxMint, "Rosa", "rosa", "17.3", "2015-12-04", "2015-12-04", "2019-04-30", "2019-04-30", true, "trusty" },
		{ Distributor::LinuxMint, "Sarah", "sarah", "18", "2016-06-30", "2016-06-30", "2021-04-30", "2021-04-30", true, "xenial" },
		{ Distributor::LinuxMint, "Serena", "serena", "18.1", "2016-12-16", "2016-12-16", "2021-04-30", "2021-04-30", true, "xenial" },
		{ Distributor::LinuxMint, "Sonya", "sonya", "18.2", "2017-07-02", "2017-07-02", "2021-04-30", "2021-04-30", true, "xenial" },
		{ Distributor::LinuxMint, "Sylvia", "sylvia", "18.3", "2017-11-27", "2017-11-27", "2021-04-30", "2021-04-30", true, "xenial" },
		{ Distributor::LinuxMint, "Tara", "tara", "19", "2018-06-29", "2018-06-29", "2023-04-30", "2023-04-30", true, "bionic" },
		{ Distributor::LinuxMint, "Tessa", "tessa", "19.1", "2018-12-19", "2018-12-19", "2023-04-30", "2023-04-30", true, "bionic" },
		{ Distributor::LinuxMint, "Tina", "tina", "19.2", "2019-08-02", "2019-08-02", "2023-04-30", "2023-04-30", true, "bionic" },

		// Ubuntu
		{ Distributor::Ubuntu, "Warty Warthog", "warty", "4.10", "2004-03-05", "2004-10-20", "2006-04-30", "", false, "" },
		{ Distributor::Ubuntu, "Hoary Hedgehog", "hoary", "5.04", "2004-10-20", "2005-04-08", "2006-10-31", "", false, "" },
		{ Distributor::Ubuntu, "Breezy Badger", "breezy", "5.10", "2005-04-08", "2005-10-12", "2007-04-13", "", false, "" },
		{ Distributor::Ubuntu, "Dapper Drake", "dapper", "6.06", "2005-10-12", "2006-06-01", "2009-07-14", "2011-06-01", true, "" },
		{ Distributor::Ubuntu, "Edgy Eft", "edgy", "6.10", "2006-06-01", "2006-10-26", "2008-04-25", "", false, "" },
		{ Distributor::Ubuntu, "Feisty Fawn", "feisty", "7.04", "2006-10-26", "2007-04-19", "2008-10-19", "", false, "" },
		{ Distributor::Ubuntu, "Gutsy Gibbon", "gutsy", "7.10", "2007-04-19", "2007-10-18", "2009-04-18", "", false, "" },
		{ Distributor::Ubuntu, "Hardy Heron", "hardy", "8.04", "2007-10-18", "2008-04-24", "2011-05-12", "2013-05-09", true, "" },
		{ Distributor::Ubuntu, "Intrepid Ibex", "intrepid", "8.10", "2008-04-24", "2008-10-30", "2010-04-30", "", false, "" },
		{ Distributor::Ubuntu, "Jaunty Jackalope", "jaunty", "9.04", "2008-10-30", "2009-04-23", "2010-10-23", "", false, "" },
		{ Distributor::Ubuntu, "Karmic Koala", "karmic", "9.10", "2009-04-23", "2009-10-29", "2011-04-29", "", false, "" },
		{ Distributor::Ubuntu, "Lucid Lynx", "lucid", "10.04", "2009-10-29", "2010-04-29", "2013-05-09", "2015-04-29", true, "" },
		{ Distributor::Ubuntu, "Maverick Meerkat", "maverick", "10.10", "2010-04-29", "2010-10-10", "2012-04-10", "", false, "" },
		{ Distributor::Ubuntu, "Natty Narwhal", "natty", "11.04", "2010-10-10", "2011-04-28", "2012-10-28", "", false, "" },
		{ Distributor::Ubuntu, "Oneiric Ocelot", "oneiric", "11.10", "2011-04-28", "2011-10-13", "2013-05-09", "", false, "" },
		{ Distributor::Ubuntu, "Precise Pangolin", "precise", "12.04", "2011-10-13", "2012-04-26", "2017-04-26", "2017-04-26", true, "" },
		{ Distributor::Ubuntu, "Quantal Quetzal", "quantal", "12.10", "2012-04-26", "2012-10-18", "2014-05-16", "", false, "" },
		{ Distributor::Ubuntu, "Raring Ringtail", "raring", "13.04", "2012-10-18", "2013-04-25", "2014-01-27", "", false, "" },
		{ Distributor::Ubuntu, "Saucy Salamander", "saucy", "13.10", "2013-04-25", "2013-10-17", "2014-07-17", "", false, "" },
		{ Distributor::Ubuntu, "Trusty Tahr", "trusty", "14.04", "2013-10-17", "2014-04-17", "2019-04-25", "2019-04-25", true, "" },
		{ Distributor::Ubuntu, "Utopic Unicorn", "utopic", "14.10", "2014-04-17", "2014-10-23", "2015-07-23", "", false, "" },
		{ Distributor::Ubuntu, "Vivid Vervet", "vivid", "15.04", "2014-10-23", "2015-04-23", "2016-01-23", "", false, "" },
		{ Distributor::Ubuntu, "Wily Werewolf", "wily", "15.10", "2015-04-23", "2015-10-22", "2016-07-22", "", false, "" },
		{ Distributor::Ubuntu, "Xenial Xerus", "xenial", "16.04", "2015-10-22", "2016-04-21", "2021-04-21", "2021-04-21", true, "" },
		{ Distributor::Ubuntu, "Yakkety Yak", "yakkety", "16.10", "2016-04-21", "2016-10-13", "2017-07-20", "", false, "" },
		{ Distributor::Ubuntu, "Zesty Zapus", "zesty", "17.04", "2016-10-13", "2017-04-13", "2018-01-13", "", false, "" },
		{ Distributor::Ubuntu, "Artful Aardvark", "artful", "17.10", "2017-04-13", "2017-10-19", "2018-07-19", "", false, "" },
		{ Distributor::Ubuntu, "Bionic Beaver", "bionic", "18.04", "2017-10-19", "2018-04-26", "2023-04-26", "2023-04-26", true, "" },
		{ Distributor::Ubuntu, "Cosmic Cuttlefish", "cosmic", "18.10", "2018-04-26", "2018-10-18", "2019-07-18", "", false, "" },
		{ Distributor::Ubuntu, "Disco Dingo", "disco", "19.04", "2018-10-18", "2019-04-18", "2020-01-18", "", false, "" },
		{ Distributor::Ubuntu, "Eoan Ermine", "eoan", "19.10", "2019-04-18", "2019-10-17", "2020-07-17", "", false, "" },
		{ Distributor::Ubuntu, "Focal Fossa", "focal", "20.04", "2019-10-17", "2020-04-23", "2025-04-23", "2025-04-23", true, "" },
		{ Distributor::Ubuntu, "Groovy Gorilla", "groovy", "20.10", "2020-04-23", "2020-10-22", "2021-07-22", "", false, "" },
		{ Distributor::Ubuntu, "Hirsute Hippo", "hirsute", "21.04", "2020-10-22", "2021-04-22", "2022-01-20", "", false, "" },
		{ Distributor::Ubuntu, "Impish Indri", "impish", "21.10", "2021-04-22", "2021-10-14", "2022-07-14", "", false, "" },
		{ Distributor::Ubuntu, "Jammy Jellyfish", "jammy", "22.04", "2021-10-14", "2022-04-21", "2027-06-01", "2027-06-01", true, "" },
		{ Distributor::Ubuntu, "Kinetic Kudu", "kinetic", "22.10", "2022-04-21", "2022-10-20", "2023-07-20", "", false, "" },
		{ Distributor::Ubuntu, "Lunar Lobster", "lunar", "23.04", "2022-10-20", "2023-04-20", "2024-01-25", "", false, "" },
		{ Distributor::Ubuntu, "Mantic Minotaur", "mantic", "23.10", "2023-04-20", "2023-10-12", "2024-07-11", "", false, "" },
		{ Distributor::Ubuntu, "Noble Numbat", "noble", "24.04", "2023-10-12", "2024-04-25", "2029-05-31", "2029-05-31", true, "" },
		{ Distributor::Ubuntu, "Oracular Oriole", "oracular", "24.10", "2024-04-25", "2024-10-10", "2025-07-10", "", false, "" },
		{ Distributor::Ubuntu, "Plucky Puffin", "plucky", "25.04", "2024-10-10", "2025-04-17", "2026-01-15", "", false, "" },
		{ Distributor::Ubuntu, "Questing Quokka", "questing", "25.10", "2025-04-17", "2025-10-09", "2026-07-09", "", false, "" },

		// Linux Mint
		{ Distributor::LinuxMint, "Tricia", "tricia", "19.3", "2019-12-18", "2019-12-18", "2023-04-30", "2023-04-30", true, "bionic" },
		{ Distributor::LinuxMint, "Ulyana", "ulyana", "20", "2020-06-30", "2020-06-30", "2025-04-30", "2025-04-30", true, "focal" },
		{ Distributor::LinuxMint, "Ulyssa", "ulyssa", "20.1", "2021-01-08", "2021-01-08", "2025-04-30", "2025-04-30", true, "focal" },
		{ Distributor::LinuxMint, "Uma", "uma", "20.2", "2021-07-08", "2021-07-08", "2025-04-30", "2025-04-30", true, "focal" },
		{ Distributor::LinuxMint, "Una", "una", "20.3", "2022-01-07", "2022-01-07", "2025-04-30", "2025-04-30", true, "focal" },
		{ Distributor::LinuxMint, "Vanessa", "vanessa", "21", "2022-07-31", "2022-07-31", "2027-04-30", "2027-04-30", true, "jammy" },
		{ Distributor::LinuxMint, "Vera", "vera", "21.1", "2022-12-20", "2022-12-20", "2027-04-30", "2027-04-30", true, "jammy" },
		{ Distributor::LinuxMint, "Victoria", "victoria", "21.2", "2023-07-16", "2023-07-16", "2027-04-30", "2027-04-30", true, "jammy" },
		{ Distributor::LinuxMint, "Virginia", "virginia", "21.3", "2024-01-10", "2024-01-10", "2027-04-30", "2027-04-30", true, "jammy" },
		{ Distributor::LinuxMint, "Wilma", "wilma", "22", "2024-07-25", "2024-07-25", "2029-04-30", "2029-04-30", true, "noble" },
		{ Distributor::LinuxMint, "Xia", "xia", "22.1", "2025-01-16", "2025-01-16", "2029-04-30", "2029-04-30", true, "noble" },
	};
	return releases;
}

// https://wiki.debian.org/LTS
const vector< LongTermSupport >& getDebianLongTermSupport()
{
	static const vector< LongTermSupport > table =
	{
		{ "jessie", "2020-06-30" },
		{ "stretch", "2022-06-30" },
		{ "buster", "2024-06-30" },
		{ "bullseye", "2026-08-31" },
		{ "bookworm", "2028-06-30" },
	};
	return table;
}

const vector< string >& getDebianLongTermSupportArchitectures()
{
	static const vector< string > architectures = { "i386", "amd64", "armel", "armhf" };
	return architectures;
}

}
}
