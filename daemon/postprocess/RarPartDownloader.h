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


#ifndef RARPARTDOWNLOADER_H
#define RARPARTDOWNLOADER_H

#include "Log.h"
#include "Thread.h"
#include "CancelToken.h"
#include "Segment.h"
#include "SegmentFetcher.h"
#include "StreamError.h"
#include "RarArchive.h"

/*
 * Materializes the volumes of a RAR set in memory, several volumes at a time.
 */
class RarPartDownloader : public Debuggable
{
public:
	static const int DEFAULT_MAX_SEGMENTS = 200;

	RarPartDownloader(SegmentFetcher* fetcher, int maxWorkers);
	void SetMaxSegments(int maxSegments) { m_maxSegments = maxSegments; }
	/* Accept the result if at least one part succeeded; otherwise any failure fails the call */
	void SetPartialSuccess(bool partialSuccess) { m_partialSuccess = partialSuccess; }
	void SetStreamWorkers(int streamWorkers) { m_streamWorkers = streamWorkers; }
	void SetCacheBudget(int64 cacheBudget) { m_cacheBudget = cacheBudget; }
	void SetCrcCheck(bool crcCheck) { m_crcCheck = crcCheck; }

	/*
	 * Downloads all parts. On success "result" holds the buffers of the parts which could be
	 * downloaded. Parts exceeding the segment limit fail the call before any fetch.
	 */
	bool DownloadPartsToMemory(CancelToken* cancel, ParsedFileList* parts, RarPartMap& result, StreamError& streamError);
	bool DownloadSinglePart(CancelToken* cancel, ParsedFile* part, CharBuffer& data, StreamError& error);

protected:
	virtual void LogDebugInfo();

private:
	/* State of one DownloadPartsToMemory call, shared with its jobs */
	struct DownloadContext
	{
		CancelToken* cancel;
		RarPartMap* result;
		StreamErrorList errors;
		Mutex mutex;
		ConditionVar cond;
		int activeJobs = 0;
		int successCount = 0;
		int failureCount = 0;

		DownloadContext(CancelToken* cancel, RarPartMap* result) : cancel(cancel), result(result) {}
	};

	class RarPartJob : public Thread
	{
	public:
		RarPartJob(RarPartDownloader* owner, DownloadContext* context, ParsedFile* part) :
			m_owner(owner), m_context(context), m_part(part) {}

	protected:
		virtual void Run();

	private:
		RarPartDownloader* m_owner;
		DownloadContext* m_context;
		ParsedFile* m_part;
	};

	static const int READ_CHUNK_SIZE = 4 * 1024 * 1024;

	SegmentFetcher* m_fetcher;
	int m_maxWorkers;
	int m_maxSegments = DEFAULT_MAX_SEGMENTS;
	bool m_partialSuccess = true;
	int m_streamWorkers = 0;
	int64 m_cacheBudget = 0;
	bool m_crcCheck = false;
	Mutex m_statMutex;
	int m_activeJobs = 0;
	int m_runningCalls = 0;

	bool CheckSegmentLimit(ParsedFileList* parts, StreamError& error);
	void JobCompleted(DownloadContext* context, ParsedFile* part, bool ok, CharBuffer&& data, StreamError&& error);
	void UpdateStat(int activeJobsDelta, int runningCallsDelta);
	static StreamError WrapError(ParsedFile* part, const StreamError& error);
};

#endif
