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


#ifndef ARTICLEFETCHER_H
#define ARTICLEFETCHER_H

#include "SegmentFetcher.h"
#include "ServerPool.h"

/*
 * Segment source backed by the provider pool. Each fetch retries and fails over
 * between providers the same way for every segment.
 */
class ArticleFetcher : public SegmentFetcher
{
public:
	ArticleFetcher(ServerPool* serverPool) : m_serverPool(serverPool) {}
	void SetRetries(int retries) { m_retries = retries; }
	/* Delay before the first retry on the same provider, doubled on every further retry */
	void SetRetryInterval(int msec) { m_retryInterval = msec; }
	/* Upper time limit for one fetch including retries, in seconds; 0 means no limit */
	void SetTimeout(int sec) { m_timeout = sec; }

	virtual EStatus Fetch(Segment* segment, int from, int to, CancelToken* cancel, CharBuffer& data);

private:
	static const int MAX_RETRY_INTERVAL = 30000;

	ServerPool* m_serverPool;
	int m_retries = 3;
	int m_retryInterval = 1000;
	int m_timeout = 60;

	bool AllServersOnLevelFailed(int level, ServerPool::RawServerList* failedServers);
	void ExtractRange(CharBuffer& data, int from, int to);
};

#endif
