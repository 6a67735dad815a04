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

#include "RarArchive.h"
#include "RarTestData.h"
#include "TestUtil.h"

static void AddPart(RarPartMap& parts, const char* filename, const std::string& data)
{
	parts[filename].Assign(data.data(), (int)data.size());
}

static std::string ToString(CharBuffer& data)
{
	return std::string(data, data.Size());
}

TEST_CASE("Rar-archive: complete set", "[Rar][RarArchive][Quick]")
{
	int version = 0;
	SECTION("rar3") { version = 3; }
	SECTION("rar5") { version = 5; }

	std::string content = TestUtil::MakeContent(2500);
	std::vector<std::string> volumes = RarBuilder::MakeStoredSet(version, "movie.mkv", content, 1000);

	RarPartMap parts;
	AddPart(parts, "movie.part3.rar", volumes[2]);
	AddPart(parts, "movie.part1.rar", volumes[0]);
	AddPart(parts, "movie.part2.rar", volumes[1]);

	RarArchive archive;
	CString errmsg;
	REQUIRE(archive.Read(&parts, errmsg));
	REQUIRE(archive.GetVolumes()->size() == 3);
	REQUIRE(archive.GetVolumes()->at(0)->GetVolumeNo() == 0);
	REQUIRE(archive.GetVolumes()->at(2)->GetVolumeNo() == 2);
	REQUIRE_FALSE(archive.GetMissingVolumes());
	REQUIRE(archive.GetEntries()->size() == 1);

	RarEntry* entry = archive.FindEntry("movie.mkv");
	REQUIRE(entry != nullptr);
	REQUIRE(entry->GetComplete());
	REQUIRE(entry->GetStored());
	REQUIRE(entry->GetSize() == 2500);
	REQUIRE(entry->GetPackedSize() == 2500);
	REQUIRE(entry->GetChunks()->size() == 3);
	REQUIRE(strcmp(entry->GetChunks()->at(0).volume, "movie.part1.rar") == 0);
	REQUIRE(entry->GetChunks()->at(2).size == 500);

	CharBuffer data;
	REQUIRE(archive.Extract(entry, data, errmsg));
	REQUIRE(data.Size() == 2500);
	REQUIRE(ToString(data) == content);

	REQUIRE(archive.FindEntry("other.mkv") == nullptr);
}

TEST_CASE("Rar-archive: several files in one volume", "[Rar][RarArchive][Quick]")
{
	RarBuilder builder(5);
	builder.AddFile("movie.mkv", "movie data", 10);
	builder.AddFile("movie.nfo", "info", 4);
	builder.AddFile("sample.mkv", "compressed", 50, 3);

	RarPartMap parts;
	AddPart(parts, "movie.rar", builder.Build());
	AddPart(parts, "movie.sfv", "movie.rar 00000000");

	RarArchive archive;
	CString errmsg;
	REQUIRE(archive.Read(&parts, errmsg));
	REQUIRE(archive.GetVolumes()->size() == 1);
	REQUIRE(archive.GetEntries()->size() == 3);

	CharBuffer data;
	REQUIRE(archive.Extract(archive.FindEntry("movie.nfo"), data, errmsg));
	REQUIRE(ToString(data) == "info");
	REQUIRE(archive.Extract(archive.FindEntry("movie.mkv"), data, errmsg));
	REQUIRE(ToString(data) == "movie data");

	RarEntry* sample = archive.FindEntry("sample.mkv");
	REQUIRE(sample->GetMethod() == 3);
	REQUIRE_FALSE(archive.Extract(sample, data, errmsg));
	REQUIRE(strstr(*errmsg, "compressed") != nullptr);
}

TEST_CASE("Rar-archive: missing volumes", "[Rar][RarArchive][Quick]")
{
	std::string content = TestUtil::MakeContent(3000);
	std::vector<std::string> volumes = RarBuilder::MakeStoredSet(3, "movie.mkv", content, 1000);

	RarPartMap parts;
	RarArchive archive;
	CString errmsg;
	CharBuffer data;

	SECTION("middle volume")
	{
		AddPart(parts, "movie.part1.rar", volumes[0]);
		AddPart(parts, "movie.part3.rar", volumes[2]);
		REQUIRE(archive.Read(&parts, errmsg));
		REQUIRE(archive.GetMissingVolumes());

		// the chain is broken into two incomplete pieces
		REQUIRE(archive.GetEntries()->size() == 2);
		REQUIRE_FALSE(archive.GetEntries()->at(0).GetComplete());
		REQUIRE_FALSE(archive.GetEntries()->at(1).GetComplete());
	}

	SECTION("last volume")
	{
		AddPart(parts, "movie.part1.rar", volumes[0]);
		AddPart(parts, "movie.part2.rar", volumes[1]);
		REQUIRE(archive.Read(&parts, errmsg));
		REQUIRE(archive.GetMissingVolumes());
		REQUIRE(archive.GetEntries()->size() == 1);
		REQUIRE_FALSE(archive.GetEntries()->at(0).GetComplete());
	}

	SECTION("first volume")
	{
		AddPart(parts, "movie.part2.rar", volumes[1]);
		AddPart(parts, "movie.part3.rar", volumes[2]);
		REQUIRE(archive.Read(&parts, errmsg));
		REQUIRE(archive.GetEntries()->size() == 1);
		REQUIRE_FALSE(archive.GetEntries()->at(0).GetComplete());
	}

	RarEntry* entry = archive.FindEntry("movie.mkv");
	REQUIRE(entry != nullptr);
	REQUIRE_FALSE(archive.Extract(entry, data, errmsg));
	REQUIRE(strstr(*errmsg, "incomplete") != nullptr);
	REQUIRE(data.Size() == 0);
}

TEST_CASE("Rar-archive: inconsistent size", "[Rar][RarArchive][Quick]")
{
	RarBuilder builder(3);
	builder.AddFile("movie.mkv", "short", 20);

	RarPartMap parts;
	AddPart(parts, "movie.rar", builder.Build());

	RarArchive archive;
	CString errmsg;
	REQUIRE(archive.Read(&parts, errmsg));

	CharBuffer data;
	REQUIRE_FALSE(archive.Extract(archive.FindEntry("movie.mkv"), data, errmsg));
	REQUIRE(strstr(*errmsg, "inconsistent size") != nullptr);
}

TEST_CASE("Rar-archive: no volumes", "[Rar][RarArchive][Quick]")
{
	RarPartMap parts;
	AddPart(parts, "movie.nfo", "not an archive");
	AddPart(parts, "movie.rar", "Rar!\x1A\x07");

	RarArchive archive;
	CString errmsg;
	REQUIRE_FALSE(archive.Read(&parts, errmsg));
	REQUIRE(strcmp(errmsg, "no readable RAR volumes") == 0);
}

TEST_CASE("Rar-archive: encrypted headers", "[Rar][RarArchive][Slow]")
{
	int version = 0;
	SECTION("rar3") { version = 3; }
	SECTION("rar5") { version = 5; }

	std::string content = TestUtil::MakeContent(2560);
	std::vector<std::string> volumes = RarBuilder::MakeStoredSet(version, "movie.mkv", content, 1024, "secret");
	REQUIRE(volumes.size() == 3);

	RarPartMap parts;
	AddPart(parts, "movie.part1.rar", volumes[0]);
	AddPart(parts, "movie.part2.rar", volumes[1]);
	AddPart(parts, "movie.part3.rar", volumes[2]);

	CString errmsg;

	RarArchive locked;
	REQUIRE_FALSE(locked.Read(&parts, errmsg));
	REQUIRE(strcmp(errmsg, "no readable RAR volumes") == 0);

	RarArchive archive;
	archive.SetPassword("secret");
	REQUIRE(archive.Read(&parts, errmsg));
	REQUIRE(archive.GetVolumes()->size() == 3);
	REQUIRE_FALSE(archive.GetMissingVolumes());

	RarEntry* entry = archive.FindEntry("movie.mkv");
	REQUIRE(entry != nullptr);
	REQUIRE(entry->GetComplete());

	CharBuffer data;
	REQUIRE(archive.Extract(entry, data, errmsg));
	REQUIRE(ToString(data) == content);
}
