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

#include "StreamError.h"

TEST_CASE("StreamError: status mapping", "[StreamError][Quick]")
{
	REQUIRE(StreamError::HttpStatus(StreamError::ekCorruptedFile, StreamError::epOpen) == 404);
	REQUIRE(StreamError::HttpStatus(StreamError::ekFileIsCorrupted, StreamError::epOpen) == 404);
	REQUIRE(StreamError::HttpStatus(StreamError::ekCorruptedFile, StreamError::epRead) == 503);
	REQUIRE(StreamError::HttpStatus(StreamError::ekFileIsCorrupted, StreamError::epRead) == 503);
	REQUIRE(StreamError::HttpStatus(StreamError::ekPartialContent, StreamError::epRead) == 206);

	// everything else is passed through
	REQUIRE(StreamError::HttpStatus(StreamError::ekFetchFailed, StreamError::epOpen) == 0);
	REQUIRE(StreamError::HttpStatus(StreamError::ekCancelled, StreamError::epRead) == 0);
	REQUIRE(StreamError::HttpStatus(StreamError::ekTooManySegments, StreamError::epOpen) == 0);
}

TEST_CASE("StreamError: details", "[StreamError][Quick]")
{
	StreamError none;
	REQUIRE(none.Ok());
	REQUIRE(!strcmp(none.GetMessage(), "no error"));

	StreamError partial = StreamError::PartialContent(1000, 4000);
	REQUIRE(partial.GetKind() == StreamError::ekPartialContent);
	REQUIRE(partial.GetBytesRead() == 1000);
	REQUIRE(partial.GetTotalExpected() == 4000);
	REQUIRE(strstr(partial.GetMessage(), "1000"));

	StreamError corrupted = StreamError::CorruptedFile(5000);
	REQUIRE(corrupted.GetTotalExpected() == 5000);
	REQUIRE(corrupted.HttpStatus(StreamError::epOpen) == 404);

	StreamError copy = corrupted;
	copy.SetMessage("other message");
	REQUIRE(copy.GetKind() == StreamError::ekCorruptedFile);
	REQUIRE(copy.GetTotalExpected() == 5000);
	REQUIRE(!strcmp(copy.GetMessage(), "other message"));
	REQUIRE(strcmp(corrupted.GetMessage(), "other message"));

	StreamError cancelled(StreamError::ekCancelled);
	REQUIRE(!strcmp(cancelled.GetMessage(), "cancelled"));
}
