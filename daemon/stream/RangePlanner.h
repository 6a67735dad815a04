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


#ifndef RANGEPLANNER_H
#define RANGEPLANNER_H

#include "Segment.h"
#include "StreamError.h"

/*
 * Part of a segment needed to serve a byte range. fetchStart and fetchEnd
 * are relative to the segment start.
 */
struct SegmentPlanEntry
{
	Segment* segment;
	int index;
	int fetchStart;
	int fetchEnd;
};

typedef std::vector<SegmentPlanEntry> SegmentPlan;

class RangePlanner
{
public:
	/*
	 * Computes the ordered list of segment slices covering [start, end) of the file.
	 * An empty range yields an empty plan. Ranges outside of the file fail with ekInvalidRange,
	 * ranges inside the file but not covered by segments fail with ekCorruptedFile.
	 */
	static bool Plan(SegmentIndex* index, int64 start, int64 end, SegmentPlan& plan, StreamError& error);

	/*
	 * Turns a requested read of "length" bytes at "offset" into the range end, clamped to the
	 * file size. A negative length means up to the end of the file.
	 */
	static bool Resolve(int64 fileSize, int64 offset, int64 length, int64& end, StreamError& error);
};

#endif
