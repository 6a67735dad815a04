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


#ifndef TESTFETCHER_H
#define TESTFETCHER_H

#include "Thread.h"
#include "CancelToken.h"
#include "Util.h"
#include "SegmentFetcher.h"

/*
 * Segment source serving payloads from memory. Individual articles can be made
 * to fail, delayed or held until cancellation.
 */
class MemoryFetcher : public SegmentFetcher
{
public:
	void AddArticle(const char* id, const std::string& payload);
	void SetStatus(const char* id, EStatus status);
	void SetPayload(const char* id, const std::string& payload) { AddArticle(id, payload); }
	void SetDelay(int msec) { m_delay = msec; }
	/* Every fetch waits until its token is done */
	void SetHang(bool hang) { m_hang = hang; }

	int GetFetchCount();
	int GetFetchCount(const char* id);
	int GetMaxConcurrent();

	virtual EStatus Fetch(Segment* segment, int from, int to, CancelToken* cancel, CharBuffer& data);

private:
	typedef std::map<std::string, std::string> Articles;
	typedef std::map<std::string, EStatus> Statuses;
	typedef std::map<std::string, int> Counts;

	Mutex m_mutex;
	Articles m_articles;
	Statuses m_statuses;
	Counts m_counts;
	int m_delay = 0;
	bool m_hang = false;
	int m_fetchCount = 0;
	int m_concurrent = 0;
	int m_maxConcurrent = 0;
};

/*
 * Cancels the token after a delay.
 */
class CancelLater : public Thread
{
public:
	CancelLater(CancelToken* token, int delay) : m_token(token), m_delay(delay) {}

protected:
	virtual void Run()
	{
		Util::Sleep(m_delay);
		m_token->Cancel();
	}

private:
	CancelToken* m_token;
	int m_delay;
};

#endif
