/*
 *  This file is part of nzbstream.
 *
 *  Copyright (C) 2007-2019 Andrey Prygunkov <hugbug@users.sourceforge.net>
 *
 *  This program is free software; you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation; either version 2 of the License, or
 *  (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */


#include "nzbstream.h"

#include <catch2/catch.hpp>

#include "Util.h"

TEST_CASE("Util: ParseSize", "[Util][Quick]")
{
	REQUIRE(Util::ParseSize("4096") == 4096);
	REQUIRE(Util::ParseSize("200K") == 200 * 1024);
	REQUIRE(Util::ParseSize("1.5 MB") == 1024 * 1024 * 3 / 2);
	REQUIRE(Util::ParseSize("2G") == 2LL * 1024 * 1024 * 1024);
	REQUIRE(Util::ParseSize("10B") == 10);
	REQUIRE(Util::ParseSize("") == -1);
	REQUIRE(Util::ParseSize(nullptr) == -1);
	REQUIRE(Util::ParseSize("abc") == -1);
	REQUIRE(Util::ParseSize("12x") == -1);
	REQUIRE(Util::ParseSize("-5") == -1);
	REQUIRE(Util::ParseSize("5 MiB") == -1);
}

TEST_CASE("Util: SplitStr", "[Util][Quick]")
{
	std::vector<CString> tokens = Util::SplitStr("<abc@news> 716800\tdeadbeef alt.binaries.test", " \t");
	REQUIRE(tokens.size() == 4);
	REQUIRE(!strcmp(tokens[0], "<abc@news>"));
	REQUIRE(!strcmp(tokens[1], "716800"));
	REQUIRE(!strcmp(tokens[2], "deadbeef"));
	REQUIRE(!strcmp(tokens[3], "alt.binaries.test"));

	std::vector<CString> groups = Util::SplitStr("alt.binaries.a,alt.binaries.b", ",");
	REQUIRE(groups.size() == 2);
	REQUIRE(!strcmp(groups[1], "alt.binaries.b"));
}

TEST_CASE("Util: Trim and EndsWith", "[Util][Quick]")
{
	char buf[] = "  name movie.mkv \r\n";
	REQUIRE(!strcmp(Util::Trim(buf), "name movie.mkv"));

	REQUIRE(Util::EndsWith("archive.part01.rar", ".rar", true));
	REQUIRE(Util::EndsWith("ARCHIVE.RAR", ".rar", false));
	REQUIRE_FALSE(Util::EndsWith("ARCHIVE.RAR", ".rar", true));
	REQUIRE_FALSE(Util::EndsWith("archive.r00", ".rar", false));
}

TEST_CASE("Util: Crc32", "[Util][Quick]")
{
	const char* text = "123456789";
	REQUIRE(Crc32::Calc(text, 9) == 0xCBF43926);

	Crc32 crc;
	crc.Append((const uchar*)text, 4);
	crc.Append((const uchar*)text + 4, 5);
	REQUIRE(crc.Finish() == 0xCBF43926);
}
