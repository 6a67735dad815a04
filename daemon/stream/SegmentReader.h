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


#ifndef SEGMENTREADER_H
#define SEGMENTREADER_H

#include "Log.h"
#include "Thread.h"
#include "CancelToken.h"
#include "SegmentFetcher.h"
#include "SegmentCache.h"
#include "RangePlanner.h"
#include "StreamError.h"

/*
 * Random access reader over a segmented remote file. Segments are fetched by a bounded
 * set of worker threads, kept in a byte-limited cache and prefetched ahead of the
 * current read position. ReadAt may be called from multiple threads.
 */
class SegmentReader : public Debuggable
{
public:
	enum EState
	{
		rsIdle,
		rsFetching,
		rsClosed
	};

	static const int DEFAULT_WORKERS = 15;
	static const int MIN_READ_AHEAD = 5;
	static const int MAX_READ_AHEAD = 20;
	static const int64 DEFAULT_CACHE_BUDGET = 64 * 1024 * 1024;

	SegmentReader(SegmentIndex* index, SegmentFetcher* fetcher, CancelToken* parent = nullptr);
	virtual ~SegmentReader();
	void SetMaxWorkers(int maxWorkers) { m_maxWorkers = std::max(1, maxWorkers); }
	int GetMaxWorkers() { return m_maxWorkers; }

	/* Number of segments prefetched past the end of a read; 0 derives it from the worker count */
	void SetReadAhead(int readAhead) { m_readAhead = readAhead; }
	int GetReadAhead();
	void SetCacheBudget(int64 budget);
	void SetCrcCheck(bool crcCheck) { m_crcCheck = crcCheck; }
	int64 GetSize() { return m_index->GetSize(); }

	/*
	 * Copies up to "len" bytes starting at "offset" into "buffer" and returns the number of
	 * bytes copied. The bytes copied before a failure are always valid. Reads reaching the
	 * end of the file report ekEndOfStream along with the data.
	 */
	int ReadAt(char* buffer, int len, int64 offset, StreamError& error);

	/* Stops prefetching, waits for running fetches and releases cached data */
	void Close();

	EState GetState();
	int64 GetCachedBytes();
	int GetFetchCount();
	int64 GetTotalBytesRead();

protected:
	virtual void LogDebugInfo();

private:
	enum EFailure
	{
		sfNone,
		sfMissing,
		sfFailed,
		sfCorrupted,
		sfCancelled
	};

	class FetchTask : public Thread
	{
	public:
		FetchTask(SegmentReader* owner, int index) : m_owner(owner), m_index(index) {}

	protected:
		virtual void Run();

	private:
		SegmentReader* m_owner;
		int m_index;
	};

	typedef std::deque<int> FetchQueue;
	typedef std::set<int> InFlightSet;
	typedef std::map<int, EFailure> FailureMap;

	SegmentIndex* m_index;
	SegmentFetcher* m_fetcher;
	CancelToken m_cancel;
	Mutex m_mutex;
	ConditionVar m_waitCond;
	SegmentCache m_cache{DEFAULT_CACHE_BUDGET};
	FetchQueue m_queue;
	InFlightSet m_inFlight;
	FailureMap m_failures;
	int m_maxWorkers = DEFAULT_WORKERS;
	int m_readAhead = 0;
	bool m_crcCheck = false;
	bool m_closed = false;
	int m_active = 0;
	int m_fetchCount = 0;
	int64 m_totalBytesRead = 0;

	void ScheduleRange(const SegmentPlan& plan);
	void StartFetches();
	void FetchCompleted(int index, SegmentFetcher::EStatus status, CharBuffer&& data);
	bool VerifySegment(Segment* segment, CharBuffer& data);
	bool IsPending(int index);
	StreamError MakeError(EFailure failure, int copied, int requested);
};

#endif
