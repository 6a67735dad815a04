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

#include "SpoolSession.h"
#include "FileSystem.h"
#include "TestUtil.h"

static std::string SpoolFilename(const char* spoolDir, const char* group, const char* messageId)
{
	return *SpoolSession::ArticleFilename(spoolDir, group, messageId);
}

TEST_CASE("Spool session: article filenames", "[SpoolSession][Quick]")
{
	REQUIRE(SpoolFilename("/spool", nullptr, "<part1@test>") == "/spool/part1@test");
	REQUIRE(SpoolFilename("/spool", "", "part1@test") == "/spool/part1@test");
	REQUIRE(SpoolFilename("/spool", "alt.test", "<part1@test>") == "/spool/alt.test/part1@test");
	REQUIRE(SpoolFilename("/spool", nullptr, "<../a/b@test>") == "/spool/.._a_b@test");
}

TEST_CASE("Spool session: serves articles", "[SpoolSession][Quick]")
{
	TestUtil::PrepareWorkingDir();
	std::string groupDir = TestUtil::WorkingDir() + "/alt.test";
	REQUIRE(FileSystem::CreateDirectory(groupDir.c_str()));

	TestUtil::WriteFile("part1@test", "plain body");
	TestUtil::WriteFile("alt.test/part2@test", "group body");
	TestUtil::WriteFile("part2@test", "wrong body");

	NewsServer newsServer(1, true, "spool", TestUtil::WorkingDir().c_str(), 1, 0, 0, false);
	SpoolSession session(&newsServer);
	CharBuffer data;

	SECTION("top level article")
	{
		Segment segment("<part1@test>", 0, 10);
		REQUIRE(session.Body(&segment, nullptr, data) == NewsSession::nsFinished);
		REQUIRE(data.Size() == 10);
		REQUIRE(!strncmp(data, "plain body", 10));
	}

	SECTION("group directory is preferred")
	{
		Segment segment("part2@test", 0, 10);
		segment.GetGroups()->emplace_back("alt.other");
		segment.GetGroups()->emplace_back("alt.test");
		REQUIRE(session.Body(&segment, nullptr, data) == NewsSession::nsFinished);
		REQUIRE(!strncmp(data, "group body", 10));
	}

	SECTION("falls back to top level")
	{
		Segment segment("part1@test", 0, 10);
		segment.GetGroups()->emplace_back("alt.test");
		REQUIRE(session.Body(&segment, nullptr, data) == NewsSession::nsFinished);
		REQUIRE(!strncmp(data, "plain body", 10));
	}

	SECTION("missing article")
	{
		Segment segment("part3@test", 0, 10);
		REQUIRE(session.Body(&segment, nullptr, data) == NewsSession::nsNotFound);
	}

	SECTION("cancelled")
	{
		CancelToken cancel;
		cancel.Cancel();
		Segment segment("part1@test", 0, 10);
		REQUIRE(session.Body(&segment, &cancel, data) == NewsSession::nsFailed);
	}
}

TEST_CASE("Spool session: missing spool directory", "[SpoolSession][Quick]")
{
	TestUtil::PrepareWorkingDir();
	std::string spoolDir = TestUtil::WorkingDir() + "/offline";

	NewsServer newsServer(1, true, "spool", spoolDir.c_str(), 1, 0, 0, false);
	SpoolSession session(&newsServer);
	CharBuffer data;

	Segment segment("part1@test", 0, 10);
	REQUIRE(session.Body(&segment, nullptr, data) == NewsSession::nsConnectError);
}
