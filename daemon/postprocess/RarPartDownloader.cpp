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
#include "RarPartDownloader.h"
#include "SegmentReader.h"
#include "Util.h"

static const int WAIT_SLICE_MSEC = 100;

const int RarPartDownloader::DEFAULT_MAX_SEGMENTS;
const int RarPartDownloader::READ_CHUNK_SIZE;

void RarPartDownloader::RarPartJob::Run()
{
	CharBuffer data;
	StreamError error;
	bool ok = m_owner->DownloadSinglePart(m_context->cancel, m_part, data, error);

	// the context and the owner may be destroyed as soon as the result is delivered
	m_owner->JobCompleted(m_context, m_part, ok, std::move(data), std::move(error));
}

RarPartDownloader::RarPartDownloader(SegmentFetcher* fetcher, int maxWorkers) :
	m_fetcher(fetcher), m_maxWorkers(std::max(1, maxWorkers))
{
}

bool RarPartDownloader::CheckSegmentLimit(ParsedFileList* parts, StreamError& error)
{
	for (std::unique_ptr<ParsedFile>& part : *parts)
	{
		int count = part->GetIndex()->GetCount();
		if (count > m_maxSegments)
		{
			error = StreamError(StreamError::ekTooManySegments,
				CString::FormatStr("RAR part %s has too many segments (%i > %i max), file too large for memory import",
					part->GetFilename(), count, m_maxSegments));
			return false;
		}
	}
	return true;
}

bool RarPartDownloader::DownloadPartsToMemory(CancelToken* cancel, ParsedFileList* parts,
	RarPartMap& result, StreamError& streamError)
{
	result.clear();
	streamError = StreamError();

	if (!CheckSegmentLimit(parts, streamError))
	{
		error("%s", streamError.GetMessage());
		return false;
	}

	info("Downloading %i RAR parts to memory with %i workers", (int)parts->size(), m_maxWorkers);

	int64 startTicks = Util::CurrentTicks();

	DownloadContext context(cancel, &result);
	UpdateStat(0, 1);

	bool cancelled = false;
	for (std::unique_ptr<ParsedFile>& part : *parts)
	{
		Guard guard(context.mutex);
		while (context.activeJobs >= m_maxWorkers)
		{
			context.cond.WaitFor(context.mutex, WAIT_SLICE_MSEC);
		}

		if (cancel && cancel->IsDone())
		{
			cancelled = true;
			break;
		}

		context.activeJobs++;
		UpdateStat(1, 0);
		RarPartJob* job = new RarPartJob(this, &context, part.get());
		job->SetAutoDestroy(true);
		job->Start();
	}

	{
		Guard guard(context.mutex);
		while (context.activeJobs > 0)
		{
			context.cond.WaitFor(context.mutex, WAIT_SLICE_MSEC);
		}
	}

	UpdateStat(0, -1);

	int successCount = context.successCount;
	int failureCount = context.failureCount;

	int64 duration = Util::CurrentTicks() - startTicks;
	int finished = successCount + failureCount;
	info("Downloaded %i of %i RAR parts in %.2f sec (%i failed, average %.2f sec per part)",
		successCount, (int)parts->size(), duration / 1000000.0, failureCount,
		finished > 0 ? duration / 1000000.0 / finished : 0.0);

	if (successCount > 0 && (m_partialSuccess || (failureCount == 0 && !cancelled)))
	{
		if (failureCount > 0 || cancelled)
		{
			warn("Continuing with %i of %i RAR parts", successCount, (int)parts->size());
		}
		return true;
	}

	result.clear();

	if (successCount == 0 && cancel && cancel->IsDone())
	{
		streamError = StreamError(StreamError::ekCancelled, "download of RAR parts cancelled");
	}
	else if (!context.errors.empty())
	{
		streamError = context.errors.front();
	}
	else if (cancelled)
	{
		streamError = StreamError(StreamError::ekCancelled, "download of RAR parts cancelled");
	}
	else
	{
		streamError = StreamError(StreamError::ekFetchFailed, "no RAR parts could be downloaded");
	}

	error("Could not download RAR parts: %s", streamError.GetMessage());

	return false;
}

void RarPartDownloader::JobCompleted(DownloadContext* context, ParsedFile* part, bool ok,
	CharBuffer&& data, StreamError&& error)
{
	UpdateStat(-1, 0);

	Guard guard(context->mutex);
	if (ok)
	{
		(*context->result)[part->GetFilename()] = std::move(data);
		context->successCount++;
	}
	else
	{
		context->errors.push_back(std::move(error));
		context->failureCount++;
	}
	context->activeJobs--;
	context->cond.NotifyAll();
}

void RarPartDownloader::UpdateStat(int activeJobsDelta, int runningCallsDelta)
{
	Guard guard(m_statMutex);
	m_activeJobs += activeJobsDelta;
	m_runningCalls += runningCallsDelta;
}

bool RarPartDownloader::DownloadSinglePart(CancelToken* cancel, ParsedFile* part, CharBuffer& data, StreamError& error)
{
	SegmentIndex* index = part->GetIndex();

	if (index->GetCount() > m_maxSegments)
	{
		error = StreamError(StreamError::ekTooManySegments,
			CString::FormatStr("RAR part %s has too many segments (%i > %i max), file too large for memory import",
				part->GetFilename(), index->GetCount(), m_maxSegments));
		return false;
	}

	int64 size = part->GetSize();
	int64 readable = std::min(size, index->GetExtent());
	if (readable > INT32_MAX)
	{
		error = StreamError(StreamError::ekTooManySegments,
			CString::FormatStr("RAR part %s is too large for memory import (%" PRIi64 " bytes)",
				part->GetFilename(), size));
		return false;
	}

	detail("Downloading RAR part %s (%i segments, %s)", part->GetFilename(), index->GetCount(),
		*Util::FormatSize(size));

	SegmentReader reader(index, m_fetcher, cancel);
	if (m_streamWorkers > 0)
	{
		reader.SetMaxWorkers(m_streamWorkers);
	}
	if (m_cacheBudget > 0)
	{
		reader.SetCacheBudget(m_cacheBudget);
	}
	reader.SetCrcCheck(m_crcCheck);

	data.Reserve((int)readable);
	int64 total = 0;

	while (total < readable)
	{
		int len = (int)std::min<int64>(readable - total, READ_CHUNK_SIZE);
		StreamError readError;
		int bytes = reader.ReadAt(data + total, len, total, readError);
		total += bytes;

		if (!readError.Ok() && readError.GetKind() != StreamError::ekEndOfStream)
		{
			data.Clear();
			error = WrapError(part, readError);
			detail("%s", error.GetMessage());
			return false;
		}

		if (bytes == 0)
		{
			break;
		}
	}

	reader.Close();

	if (total != size || index->GetExtent() != size)
	{
		data.Clear();
		StreamError mismatch(StreamError::ekSizeMismatch,
			CString::FormatStr("size mismatch: expected %" PRIi64 " bytes, got %" PRIi64 " bytes",
				size, total != size ? total : index->GetExtent()));
		error = WrapError(part, mismatch);
		detail("%s", error.GetMessage());
		return false;
	}

	return true;
}

StreamError RarPartDownloader::WrapError(ParsedFile* part, const StreamError& error)
{
	StreamError wrapped = error;
	wrapped.SetMessage(CString::FormatStr("failed to download %s: %s", part->GetFilename(), error.GetMessage()));
	return wrapped;
}

void RarPartDownloader::LogDebugInfo()
{
	Guard guard(m_statMutex);
	info("   RarPartDownloader: workers=%i, downloads=%i, active jobs=%i",
		m_maxWorkers, m_runningCalls, m_activeJobs);
}
