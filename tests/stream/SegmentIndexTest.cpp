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

#include "Segment.h"
#include "TestUtil.h"

TEST_CASE("SegmentIndex: contiguous segments", "[Segment][Quick]")
{
	SegmentIndex index;
	index.AddSegment("a@test", 100);
	index.AddSegment("b@test", 100);
	index.AddSegment("c@test", 50);

	REQUIRE(index.GetCount() == 3);
	REQUIRE(index.GetSize() == 250);
	REQUIRE(index.GetExtent() == 250);
	REQUIRE(index.GetSegment(1)->GetStart() == 100);
	REQUIRE(index.GetSegment(2)->GetEnd() == 250);

	CString errmsg;
	REQUIRE(index.Validate(errmsg));

	REQUIRE(index.FindSegment(0) == 0);
	REQUIRE(index.FindSegment(99) == 0);
	REQUIRE(index.FindSegment(100) == 1);
	REQUIRE(index.FindSegment(249) == 2);
	REQUIRE(index.FindSegment(250) == -1);
	REQUIRE(index.FindSegment(-1) == -1);
}

TEST_CASE("SegmentIndex: inconsistent segments", "[Segment][Quick]")
{
	CString errmsg;

	SegmentIndex gap;
	gap.AddSegment("a@test", 0, 100, 0);
	gap.AddSegment("b@test", 120, 100, 0);
	REQUIRE_FALSE(gap.Validate(errmsg));
	REQUIRE(strstr(errmsg, "gap"));
	REQUIRE(gap.FindSegment(110) == -1);
	REQUIRE(gap.FindSegment(130) == 1);

	SegmentIndex overlap;
	overlap.AddSegment("a@test", 0, 100, 0);
	overlap.AddSegment("b@test", 80, 100, 0);
	REQUIRE_FALSE(overlap.Validate(errmsg));
	REQUIRE(strstr(errmsg, "overlap"));

	SegmentIndex wrongSize;
	wrongSize.AddSegment("a@test", 100);
	wrongSize.SetSize(150);
	REQUIRE(wrongSize.GetExtent() == 100);
	REQUIRE_FALSE(wrongSize.Validate(errmsg));

	SegmentIndex empty;
	REQUIRE(empty.Validate(errmsg));
	REQUIRE(empty.GetExtent() == 0);
	REQUIRE(empty.FindSegment(0) == -1);
}

TEST_CASE("ParsedFile: load segment list", "[Segment][Quick]")
{
	TestUtil::PrepareWorkingDir();

	std::string listFilename = TestUtil::WriteFile("movie.segments",
		"# segment list\n"
		"name My Movie.mkv\n"
		"\n"
		"<part1@news.example> 716800 1a2b3c4d alt.binaries.test,alt.binaries.misc\n"
		"part2@news.example\t716800\n"
		"  <part3@news.example> 1000 0 alt.binaries.test  \r\n");

	CString errmsg;
	std::unique_ptr<ParsedFile> parsedFile = ParsedFile::Load(listFilename.c_str(), errmsg);
	REQUIRE(parsedFile != nullptr);
	REQUIRE(!strcmp(parsedFile->GetFilename(), "My Movie.mkv"));
	REQUIRE(parsedFile->GetSize() == 716800 * 2 + 1000);

	SegmentIndex* index = parsedFile->GetIndex();
	REQUIRE(index->GetCount() == 3);
	REQUIRE(index->Validate(errmsg));

	Segment* first = index->GetSegment(0);
	REQUIRE(!strcmp(first->GetId(), "<part1@news.example>"));
	REQUIRE(first->GetCrc() == 0x1a2b3c4d);
	REQUIRE(first->GetGroups()->size() == 2);
	REQUIRE(!strcmp(first->GetGroups()->at(1), "alt.binaries.misc"));

	Segment* second = index->GetSegment(1);
	REQUIRE(second->GetStart() == 716800);
	REQUIRE(second->GetCrc() == 0);
	REQUIRE(second->GetGroups()->empty());

	REQUIRE(index->GetSegment(2)->GetStart() == 716800 * 2);
}

TEST_CASE("ParsedFile: default name and errors", "[Segment][Quick]")
{
	TestUtil::PrepareWorkingDir();

	CString errmsg;
	std::string listFilename = TestUtil::WriteFile("archive.part01.rar", "a@test 10\n");
	std::unique_ptr<ParsedFile> parsedFile = ParsedFile::Load(listFilename.c_str(), errmsg);
	REQUIRE(parsedFile != nullptr);
	REQUIRE(!strcmp(parsedFile->GetFilename(), "archive.part01.rar"));

	listFilename = TestUtil::WriteFile("bad-size", "a@test 10\nb@test ten\n");
	REQUIRE(ParsedFile::Load(listFilename.c_str(), errmsg) == nullptr);
	REQUIRE(strstr(errmsg, "bad-size(2)"));
	REQUIRE(strstr(errmsg, "invalid segment size"));

	listFilename = TestUtil::WriteFile("no-size", "a@test\n");
	REQUIRE(ParsedFile::Load(listFilename.c_str(), errmsg) == nullptr);
	REQUIRE(strstr(errmsg, "missing segment size"));

	listFilename = TestUtil::WriteFile("bad-crc", "a@test 10 xyz\n");
	REQUIRE(ParsedFile::Load(listFilename.c_str(), errmsg) == nullptr);
	REQUIRE(strstr(errmsg, "invalid crc"));

	listFilename = TestUtil::WriteFile("zero-size", "a@test 0\n");
	REQUIRE(ParsedFile::Load(listFilename.c_str(), errmsg) == nullptr);

	REQUIRE(ParsedFile::Load((TestUtil::WorkingDir() + "/missing").c_str(), errmsg) == nullptr);
	REQUIRE(strstr(errmsg, "could not open file"));
}
