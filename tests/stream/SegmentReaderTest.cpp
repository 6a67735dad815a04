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

#include "SegmentReader.h"
#include "Container.h"
#include "Util.h"
#include "TestUtil.h"
#include "TestFetcher.h"

TEST_CASE("SegmentReader: sequential read", "[SegmentReader]")
{
	MemoryFetcher fetcher;
	std::string content = TestUtil::MakeContent(10000);
	std::unique_ptr<ParsedFile> file = TestUtil::MakeFile(&fetcher, "movie.mkv", content, 1000);

	SegmentReader reader(file->GetIndex(), &fetcher);
	reader.SetMaxWorkers(4);
	REQUIRE(reader.GetSize() == 10000);

	std::string result;
	char buf[768];
	int64 offset = 0;
	StreamError error;
	while (true)
	{
		int bytes = reader.ReadAt(buf, sizeof(buf), offset, error);
		result.append(buf, bytes);
		offset += bytes;
		if (!error.Ok())
		{
			break;
		}
	}

	REQUIRE(error.GetKind() == StreamError::ekEndOfStream);
	REQUIRE(result == content);
	REQUIRE(reader.GetTotalBytesRead() == 10000);

	// every segment fetched exactly once
	for (Segment& segment : file->GetIndex()->GetSegments())
	{
		REQUIRE(fetcher.GetFetchCount(segment.GetId()) == 1);
	}
}

TEST_CASE("SegmentReader: random access", "[SegmentReader]")
{
	MemoryFetcher fetcher;
	std::string content = TestUtil::MakeContent(5000, 7);
	std::unique_ptr<ParsedFile> file = TestUtil::MakeFile(&fetcher, "random.bin", content, 700);

	SegmentReader reader(file->GetIndex(), &fetcher);

	char buf[2000];
	StreamError error;

	int bytes = reader.ReadAt(buf, 1500, 3100, error);
	REQUIRE(error.Ok());
	REQUIRE(bytes == 1500);
	REQUIRE(std::string(buf, bytes) == content.substr(3100, 1500));

	bytes = reader.ReadAt(buf, 10, 0, error);
	REQUIRE(error.Ok());
	REQUIRE(std::string(buf, bytes) == content.substr(0, 10));

	// request past the end is clamped
	bytes = reader.ReadAt(buf, 100, 4990, error);
	REQUIRE(error.GetKind() == StreamError::ekEndOfStream);
	REQUIRE(bytes == 10);
	REQUIRE(std::string(buf, bytes) == content.substr(4990));

	bytes = reader.ReadAt(buf, 100, 5000, error);
	REQUIRE(error.GetKind() == StreamError::ekEndOfStream);
	REQUIRE(bytes == 0);

	bytes = reader.ReadAt(buf, 0, 100, error);
	REQUIRE(error.Ok());
	REQUIRE(bytes == 0);
}

TEST_CASE("SegmentReader: invalid arguments and closed reader", "[SegmentReader][Quick]")
{
	MemoryFetcher fetcher;
	std::unique_ptr<ParsedFile> file = TestUtil::MakeFile(&fetcher, "file.bin", TestUtil::MakeContent(300), 100);

	SegmentReader reader(file->GetIndex(), &fetcher);
	char buf[100];
	StreamError error;

	REQUIRE(reader.ReadAt(buf, 10, 301, error) == 0);
	REQUIRE(error.GetKind() == StreamError::ekInvalidRange);

	REQUIRE(reader.ReadAt(buf, 10, -1, error) == 0);
	REQUIRE(error.GetKind() == StreamError::ekInvalidRange);

	REQUIRE(reader.ReadAt(nullptr, 10, 0, error) == 0);
	REQUIRE(error.GetKind() == StreamError::ekInvalidRange);
	REQUIRE(fetcher.GetFetchCount() == 0);

	REQUIRE(reader.GetState() == SegmentReader::rsIdle);
	reader.Close();
	reader.Close();
	REQUIRE(reader.GetState() == SegmentReader::rsClosed);
	REQUIRE(reader.GetCachedBytes() == 0);

	REQUIRE(reader.ReadAt(buf, 10, 0, error) == 0);
	REQUIRE(error.GetKind() == StreamError::ekReaderClosed);
}

TEST_CASE("SegmentReader: missing segments", "[SegmentReader]")
{
	MemoryFetcher fetcher;
	std::string content = TestUtil::MakeContent(3000);
	std::unique_ptr<ParsedFile> file = TestUtil::MakeFile(&fetcher, "broken.bin", content, 1000);
	fetcher.SetStatus("broken.bin.2@test", SegmentFetcher::fsNotFound);

	SegmentReader reader(file->GetIndex(), &fetcher);
	char buf[3000];
	StreamError error;

	SECTION("missing in the middle of a read")
	{
		int bytes = reader.ReadAt(buf, 3000, 0, error);
		REQUIRE(bytes == 1000);
		REQUIRE(std::string(buf, bytes) == content.substr(0, 1000));
		REQUIRE(error.GetKind() == StreamError::ekPartialContent);
		REQUIRE(error.GetBytesRead() == 1000);
		REQUIRE(error.GetTotalExpected() == 3000);
		REQUIRE(error.HttpStatus(StreamError::epRead) == 206);
	}

	SECTION("missing at the start of a read")
	{
		int bytes = reader.ReadAt(buf, 500, 1200, error);
		REQUIRE(bytes == 0);
		REQUIRE(error.GetKind() == StreamError::ekFileIsCorrupted);
		REQUIRE(error.HttpStatus(StreamError::epOpen) == 404);
		REQUIRE(error.HttpStatus(StreamError::epRead) == 503);
	}

	SECTION("segments after the missing one stay readable")
	{
		int bytes = reader.ReadAt(buf, 1000, 2000, error);
		REQUIRE(error.GetKind() == StreamError::ekEndOfStream);
		REQUIRE(bytes == 1000);
		REQUIRE(std::string(buf, bytes) == content.substr(2000));
	}
}

TEST_CASE("SegmentReader: failed fetch", "[SegmentReader]")
{
	MemoryFetcher fetcher;
	std::unique_ptr<ParsedFile> file = TestUtil::MakeFile(&fetcher, "failing.bin", TestUtil::MakeContent(2000), 1000);
	fetcher.SetStatus("failing.bin.1@test", SegmentFetcher::fsFailed);

	SegmentReader reader(file->GetIndex(), &fetcher);
	char buf[2000];
	StreamError error;

	REQUIRE(reader.ReadAt(buf, 2000, 0, error) == 0);
	REQUIRE(error.GetKind() == StreamError::ekFetchFailed);
	REQUIRE(error.HttpStatus(StreamError::epOpen) == 0);

	// a failed segment is fetched again by the next read
	fetcher.SetStatus("failing.bin.1@test", SegmentFetcher::fsFinished);
	REQUIRE(reader.ReadAt(buf, 2000, 0, error) == 2000);
	REQUIRE(error.GetKind() == StreamError::ekEndOfStream);
	REQUIRE(fetcher.GetFetchCount("failing.bin.1@test") == 2);
}

TEST_CASE("SegmentReader: payload verification", "[SegmentReader]")
{
	MemoryFetcher fetcher;
	std::string content = TestUtil::MakeContent(2000);
	std::unique_ptr<ParsedFile> file = TestUtil::MakeFile(&fetcher, "verify.bin", content, 1000);
	char buf[2000];
	StreamError error;

	SECTION("wrong size")
	{
		fetcher.SetPayload("verify.bin.1@test", content.substr(0, 999));
		SegmentReader reader(file->GetIndex(), &fetcher);
		REQUIRE(reader.ReadAt(buf, 2000, 0, error) == 0);
		REQUIRE(error.GetKind() == StreamError::ekCorruptedFile);
		REQUIRE(error.GetTotalExpected() == 2000);
	}

	SECTION("wrong crc with check enabled")
	{
		std::string damaged = content.substr(0, 1000);
		damaged[10] ^= 0x55;
		fetcher.SetPayload("verify.bin.1@test", damaged);
		SegmentReader reader(file->GetIndex(), &fetcher);
		reader.SetCrcCheck(true);
		REQUIRE(reader.ReadAt(buf, 2000, 0, error) == 0);
		REQUIRE(error.GetKind() == StreamError::ekCorruptedFile);
	}

	SECTION("wrong crc with check disabled")
	{
		std::string damaged = content.substr(0, 1000);
		damaged[10] ^= 0x55;
		fetcher.SetPayload("verify.bin.1@test", damaged);
		SegmentReader reader(file->GetIndex(), &fetcher);
		reader.SetCrcCheck(false);
		REQUIRE(reader.ReadAt(buf, 2000, 0, error) == 2000);
		REQUIRE(error.GetKind() == StreamError::ekEndOfStream);
	}

	SECTION("correct crc with check enabled")
	{
		SegmentReader reader(file->GetIndex(), &fetcher);
		reader.SetCrcCheck(true);
		REQUIRE(reader.ReadAt(buf, 2000, 0, error) == 2000);
		REQUIRE(std::string(buf, 2000) == content);
	}
}

TEST_CASE("SegmentReader: cache and read-ahead", "[SegmentReader]")
{
	MemoryFetcher fetcher;
	std::string content = TestUtil::MakeContent(10000);
	std::unique_ptr<ParsedFile> file = TestUtil::MakeFile(&fetcher, "ahead.bin", content, 1000);

	SegmentReader reader(file->GetIndex(), &fetcher);
	reader.SetMaxWorkers(5);
	reader.SetReadAhead(2);

	char buf[100];
	StreamError error;
	REQUIRE(reader.ReadAt(buf, 100, 0, error) == 100);
	REQUIRE(reader.GetFetchCount() == 3);

	// wait for the prefetched segments
	for (int i = 0; i < 200 && reader.GetCachedBytes() < 3000; i++)
	{
		Util::Sleep(10);
	}
	REQUIRE(reader.GetCachedBytes() == 3000);

	REQUIRE(reader.ReadAt(buf, 100, 1500, error) == 100);
	REQUIRE(std::string(buf, 100) == content.substr(1500, 100));
	REQUIRE(fetcher.GetFetchCount("ahead.bin.2@test") == 1);

	REQUIRE(reader.ReadAt(buf, 100, 50, error) == 100);
	REQUIRE(fetcher.GetFetchCount("ahead.bin.1@test") == 1);
	REQUIRE(fetcher.GetFetchCount("ahead.bin.10@test") == 0);
}

TEST_CASE("SegmentReader: read-ahead depth", "[SegmentReader][Quick]")
{
	SegmentIndex index;
	MemoryFetcher fetcher;
	SegmentReader reader(&index, &fetcher);

	reader.SetMaxWorkers(1);
	REQUIRE(reader.GetReadAhead() == SegmentReader::MIN_READ_AHEAD);
	reader.SetMaxWorkers(4);
	REQUIRE(reader.GetReadAhead() == 8);
	reader.SetMaxWorkers(SegmentReader::DEFAULT_WORKERS);
	REQUIRE(reader.GetReadAhead() == SegmentReader::MAX_READ_AHEAD);
	reader.SetReadAhead(3);
	REQUIRE(reader.GetReadAhead() == 3);

	reader.SetMaxWorkers(0);
	REQUIRE(reader.GetMaxWorkers() == 1);
}

TEST_CASE("SegmentReader: bounded workers and cache budget", "[SegmentReader]")
{
	MemoryFetcher fetcher;
	fetcher.SetDelay(20);
	std::string content = TestUtil::MakeContent(8000);
	std::unique_ptr<ParsedFile> file = TestUtil::MakeFile(&fetcher, "bounded.bin", content, 1000);

	SegmentReader reader(file->GetIndex(), &fetcher);
	reader.SetMaxWorkers(2);
	reader.SetCacheBudget(2500);

	CharBuffer buf(8000);
	StreamError error;
	REQUIRE(reader.ReadAt(buf, 8000, 0, error) == 8000);
	REQUIRE(error.GetKind() == StreamError::ekEndOfStream);
	REQUIRE(std::string(buf, 8000) == content);
	REQUIRE(fetcher.GetMaxConcurrent() <= 2);
	REQUIRE(reader.GetCachedBytes() <= 2500);
}

TEST_CASE("SegmentReader: cache budget over sequential reads", "[SegmentReader]")
{
	MemoryFetcher fetcher;
	fetcher.SetDelay(5);
	std::string content = TestUtil::MakeContent(10000);
	std::unique_ptr<ParsedFile> file = TestUtil::MakeFile(&fetcher, "budget.bin", content, 1000);

	SegmentReader reader(file->GetIndex(), &fetcher);
	reader.SetMaxWorkers(3);
	reader.SetReadAhead(3);
	reader.SetCacheBudget(3500);

	char buf[500];
	int64 peak = 0;
	for (int64 offset = 0; offset < 10000; offset += 500)
	{
		StreamError error;
		REQUIRE(reader.ReadAt(buf, 500, offset, error) == 500);
		REQUIRE(std::string(buf, 500) == content.substr((size_t)offset, 500));

		// give the read-ahead time to land in the cache
		for (int i = 0; i < 20 && reader.GetCachedBytes() < 3000 && offset < 6000; i++)
		{
			Util::Sleep(5);
		}

		int64 cached = reader.GetCachedBytes();
		REQUIRE(cached <= 3500);
		peak = std::max(peak, cached);
	}

	REQUIRE(peak >= 2000);

	reader.Close();
	REQUIRE(reader.GetCachedBytes() == 0);
}

TEST_CASE("SegmentReader: cancellation", "[SegmentReader]")
{
	MemoryFetcher fetcher;
	fetcher.SetHang(true);
	std::unique_ptr<ParsedFile> file = TestUtil::MakeFile(&fetcher, "hang.bin", TestUtil::MakeContent(3000), 1000);

	CancelToken cancel;
	SegmentReader reader(file->GetIndex(), &fetcher, &cancel);

	CancelLater* thread = new CancelLater(&cancel, 100);
	thread->SetAutoDestroy(true);
	thread->Start();

	char buf[3000];
	StreamError error;
	REQUIRE(reader.ReadAt(buf, 3000, 0, error) == 0);
	REQUIRE(error.GetKind() == StreamError::ekCancelled);

	reader.Close();
	REQUIRE(reader.GetState() == SegmentReader::rsClosed);
}
