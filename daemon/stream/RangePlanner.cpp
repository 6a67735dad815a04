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
#include "RangePlanner.h"

bool RangePlanner::Plan(SegmentIndex* index, int64 start, int64 end, SegmentPlan& plan, StreamError& error)
{
	plan.clear();

	if (start < 0 || start > end || end > index->GetSize())
	{
		error = StreamError(StreamError::ekInvalidRange,
			CString::FormatStr("invalid range [%" PRIi64 ", %" PRIi64 ") for file of %" PRIi64 " bytes",
				start, end, index->GetSize()));
		return false;
	}

	if (start == end)
	{
		return true;
	}

	int first = index->FindSegment(start);
	if (first < 0)
	{
		error = StreamError::CorruptedFile(index->GetSize());
		error.SetMessage(CString::FormatStr("corrupted file: offset %" PRIi64 " is not covered by any segment", start));
		return false;
	}

	int64 covered = start;
	for (int i = first; i < index->GetCount() && covered < end; i++)
	{
		Segment* segment = index->GetSegment(i);
		if (segment->GetStart() > covered)
		{
			break;
		}
		if (segment->GetEnd() <= covered)
		{
			continue;
		}

		int64 sliceStart = std::max(covered, segment->GetStart());
		int64 sliceEnd = std::min(end, segment->GetEnd());

		plan.push_back({segment, i,
			(int)(sliceStart - segment->GetStart()), (int)(sliceEnd - segment->GetStart())});
		covered = sliceEnd;
	}

	if (covered < end)
	{
		plan.clear();
		error = StreamError::CorruptedFile(index->GetSize());
		error.SetMessage(CString::FormatStr("corrupted file: bytes from %" PRIi64 " are not covered by segments", covered));
		return false;
	}

	return true;
}

bool RangePlanner::Resolve(int64 fileSize, int64 offset, int64 length, int64& end, StreamError& error)
{
	end = 0;

	if (offset < 0 || offset > fileSize)
	{
		error = StreamError(StreamError::ekInvalidRange,
			CString::FormatStr("invalid offset %" PRIi64 " for file of %" PRIi64 " bytes", offset, fileSize));
		return false;
	}

	end = length < 0 || length > fileSize - offset ? fileSize : offset + length;
	return true;
}
