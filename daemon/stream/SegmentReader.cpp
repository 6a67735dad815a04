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
#include "SegmentReader.h"
#include "Util.h"

static const int WAIT_SLICE_MSEC = 100;

const int SegmentReader::DEFAULT_WORKERS;
const int SegmentReader::MIN_READ_AHEAD;
const int SegmentReader::MAX_READ_AHEAD;
const int64 SegmentReader::DEFAULT_CACHE_BUDGET;

void SegmentReader::FetchTask::Run()
{
	Segment* segment = m_owner->m_index->GetSegment(m_index);
	CharBuffer data;
	SegmentFetcher::EStatus status = m_owner->m_fetcher->Fetch(segment, 0, segment->GetSize(),
		&m_owner->m_cancel, data);

	// the owner may be destroyed as soon as it has received the result
	m_owner->FetchCompleted(m_index, status, std::move(data));
}

SegmentReader::SegmentReader(SegmentIndex* index, SegmentFetcher* fetcher, CancelToken* parent) :
	m_index(index), m_fetcher(fetcher), m_cancel(parent)
{
}

SegmentReader::~SegmentReader()
{
	Close();
}

int SegmentReader::GetReadAhead()
{
	if (m_readAhead > 0)
	{
		return m_readAhead;
	}
	return std::min(std::max(m_maxWorkers * 2, MIN_READ_AHEAD), MAX_READ_AHEAD);
}

void SegmentReader::SetCacheBudget(int64 budget)
{
	Guard guard(m_mutex);
	m_cache.SetBudget(budget);
	m_cache.Trim();
}

int SegmentReader::ReadAt(char* buffer, int len, int64 offset, StreamError& error)
{
	error = StreamError();

	Guard guard(m_mutex);

	if (m_closed)
	{
		error = StreamError(StreamError::ekReaderClosed);
		return 0;
	}

	if (!buffer || len < 0 || offset < 0 || offset > m_index->GetSize())
	{
		error = StreamError(StreamError::ekInvalidRange,
			CString::FormatStr("invalid read of %i bytes at offset %" PRIi64 " for file of %" PRIi64 " bytes",
				len, offset, m_index->GetSize()));
		return 0;
	}

	int64 end = offset + len;
	bool endOfStream = false;
	if (end >= m_index->GetSize())
	{
		end = m_index->GetSize();
		endOfStream = true;
	}

	SegmentPlan plan;
	if (!RangePlanner::Plan(m_index, offset, end, plan, error))
	{
		return 0;
	}

	for (SegmentPlanEntry& entry : plan)
	{
		m_cache.Pin(entry.segment->GetId());
		m_failures.erase(entry.index);
	}

	ScheduleRange(plan);
	StartFetches();

	int copied = 0;
	EFailure failure = sfNone;

	for (SegmentPlanEntry& entry : plan)
	{
		while (failure == sfNone)
		{
			if (m_closed)
			{
				break;
			}

			CharBuffer* data = m_cache.Find(entry.segment->GetId());
			if (data)
			{
				int sliceLen = entry.fetchEnd - entry.fetchStart;
				memcpy(buffer + copied, *data + entry.fetchStart, sliceLen);
				copied += sliceLen;
				break;
			}

			FailureMap::iterator it = m_failures.find(entry.index);
			if (it != m_failures.end())
			{
				failure = it->second;
				break;
			}

			if (m_cancel.IsDone())
			{
				failure = sfCancelled;
				break;
			}

			if (!IsPending(entry.index))
			{
				// dropped from the queue by a concurrent read, fetch it again
				m_queue.push_front(entry.index);
				StartFetches();
			}

			m_waitCond.WaitFor(m_mutex, WAIT_SLICE_MSEC);
		}

		if (failure != sfNone || m_closed)
		{
			break;
		}
	}

	for (SegmentPlanEntry& entry : plan)
	{
		m_cache.Unpin(entry.segment->GetId());
		m_failures.erase(entry.index);
	}
	m_cache.Trim();

	m_totalBytesRead += copied;

	if (m_closed && copied < end - offset)
	{
		error = StreamError(StreamError::ekReaderClosed);
	}
	else if (failure != sfNone)
	{
		error = MakeError(failure, copied, (int)(end - offset));
		debug("Read of %i bytes at offset %" PRIi64 " failed after %i bytes: %s",
			len, offset, copied, error.GetMessage());
	}
	else if (endOfStream)
	{
		error = StreamError(StreamError::ekEndOfStream);
	}

	return copied;
}

StreamError SegmentReader::MakeError(EFailure failure, int copied, int requested)
{
	switch (failure)
	{
		case sfCancelled:
			return StreamError(StreamError::ekCancelled);

		case sfCorrupted:
			return StreamError::CorruptedFile(m_index->GetSize());

		case sfMissing:
			if (copied > 0)
			{
				return StreamError::PartialContent(copied, requested);
			}
			return StreamError(StreamError::ekFileIsCorrupted, "file is corrupted: segment not found on any provider");

		default:
			if (copied > 0)
			{
				return StreamError::PartialContent(copied, requested);
			}
			return StreamError(StreamError::ekFetchFailed, "segment could not be fetched");
	}
}

void SegmentReader::ScheduleRange(const SegmentPlan& plan)
{
	if (plan.empty())
	{
		return;
	}

	// urgent segments go to the queue front keeping their order
	for (SegmentPlan::const_reverse_iterator it = plan.rbegin(); it != plan.rend(); it++)
	{
		int index = it->index;
		if (m_cache.Contains(it->segment->GetId()) || m_inFlight.find(index) != m_inFlight.end())
		{
			continue;
		}

		FetchQueue::iterator queued = std::find(m_queue.begin(), m_queue.end(), index);
		if (queued != m_queue.end())
		{
			m_queue.erase(queued);
		}
		m_queue.push_front(index);
	}

	int last = plan.back().index;
	int readAheadEnd = std::min(last + GetReadAhead(), m_index->GetCount() - 1);
	for (int index = last + 1; index <= readAheadEnd; index++)
	{
		if (!m_cache.Contains(m_index->GetSegment(index)->GetId()) && !IsPending(index) &&
			m_failures.find(index) == m_failures.end())
		{
			m_queue.push_back(index);
		}
	}
}

bool SegmentReader::IsPending(int index)
{
	return m_inFlight.find(index) != m_inFlight.end() ||
		std::find(m_queue.begin(), m_queue.end(), index) != m_queue.end();
}

void SegmentReader::StartFetches()
{
	while (!m_closed && m_active < m_maxWorkers && !m_queue.empty())
	{
		int index = m_queue.front();
		m_queue.pop_front();

		if (m_inFlight.find(index) != m_inFlight.end() ||
			m_cache.Contains(m_index->GetSegment(index)->GetId()))
		{
			continue;
		}

		m_inFlight.insert(index);
		m_active++;
		m_fetchCount++;

		debug("Fetching segment %s", m_index->GetSegment(index)->GetId());

		FetchTask* task = new FetchTask(this, index);
		task->SetAutoDestroy(true);
		task->Start();
	}
}

void SegmentReader::FetchCompleted(int index, SegmentFetcher::EStatus status, CharBuffer&& data)
{
	Guard guard(m_mutex);

	m_active--;
	m_inFlight.erase(index);

	if (!m_closed)
	{
		Segment* segment = m_index->GetSegment(index);
		switch (status)
		{
			case SegmentFetcher::fsFinished:
				if (VerifySegment(segment, data))
				{
					m_cache.Insert(segment->GetId(), std::move(data));
				}
				else
				{
					m_failures[index] = sfCorrupted;
				}
				break;

			case SegmentFetcher::fsNotFound:
				detail("Segment %s not found", segment->GetId());
				m_failures[index] = sfMissing;
				break;

			case SegmentFetcher::fsCancelled:
				m_failures[index] = sfCancelled;
				break;

			default:
				detail("Segment %s could not be fetched", segment->GetId());
				m_failures[index] = sfFailed;
				break;
		}

		StartFetches();
	}

	m_waitCond.NotifyAll();
}

bool SegmentReader::VerifySegment(Segment* segment, CharBuffer& data)
{
	if (data.Size() != segment->GetSize())
	{
		warn("Segment %s has wrong size: expected %i bytes, got %i bytes",
			segment->GetId(), segment->GetSize(), data.Size());
		return false;
	}

	if (m_crcCheck && segment->GetCrc() != 0)
	{
		uint32 crc = Crc32::Calc(data, data.Size());
		if (crc != segment->GetCrc())
		{
			warn("Segment %s has wrong CRC: expected %08x, got %08x",
				segment->GetId(), segment->GetCrc(), crc);
			return false;
		}
	}

	return true;
}

void SegmentReader::Close()
{
	Guard guard(m_mutex);

	if (!m_closed)
	{
		debug("Closing segment reader");
		m_closed = true;
		m_queue.clear();
		m_cancel.Cancel();
		m_waitCond.NotifyAll();
	}

	while (m_active > 0)
	{
		m_waitCond.WaitFor(m_mutex, WAIT_SLICE_MSEC);
	}

	m_cache.Clear();
	m_failures.clear();
}

SegmentReader::EState SegmentReader::GetState()
{
	Guard guard(m_mutex);
	return m_closed ? rsClosed : m_active > 0 ? rsFetching : rsIdle;
}

int64 SegmentReader::GetCachedBytes()
{
	Guard guard(m_mutex);
	return m_cache.GetCachedBytes();
}

int SegmentReader::GetFetchCount()
{
	Guard guard(m_mutex);
	return m_fetchCount;
}

int64 SegmentReader::GetTotalBytesRead()
{
	Guard guard(m_mutex);
	return m_totalBytesRead;
}

void SegmentReader::LogDebugInfo()
{
	Guard guard(m_mutex);
	info("   SegmentReader: size=%" PRIi64 ", segments=%i, active=%i, queued=%i, cached=%i (%" PRIi64 " bytes), fetches=%i",
		m_index->GetSize(), m_index->GetCount(), m_active, (int)m_queue.size(),
		m_cache.GetCount(), m_cache.GetCachedBytes(), m_fetchCount);
}
