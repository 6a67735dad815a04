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


#ifndef SEGMENTFETCHER_H
#define SEGMENTFETCHER_H

#include "Segment.h"
#include "CancelToken.h"

/*
 * Source of segment payloads. Implementations must be callable from
 * many threads at once.
 */
class SegmentFetcher
{
public:
	enum EStatus
	{
		fsFinished,
		fsNotFound,
		fsFailed,
		fsCancelled
	};

	virtual ~SegmentFetcher() {}

	/*
	 * Fetches bytes [from, to) of the segment payload into "data". The returned
	 * buffer may hold less or more than requested, the caller checks the size.
	 */
	virtual EStatus Fetch(Segment* segment, int from, int to, CancelToken* cancel, CharBuffer& data) = 0;
};

#endif
