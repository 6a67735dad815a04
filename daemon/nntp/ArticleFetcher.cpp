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
#include "ArticleFetcher.h"
#include "Log.h"
#include "Util.h"

const int ArticleFetcher::MAX_RETRY_INTERVAL;

/*
 * How provider management (for one particular segment) works:
	- there is a list of failed servers which is initially empty;
	- level is initially 0;

	<loop>
		- request a session from server pool for current level;
		- try to fetch the article body from the server;
		- if the server is unavailable, block it for <ServerRetryInterval> and request another session
		  (optional servers are treated as failed while blocked);
		- if the article is not found, add the server to failed server list;
		- if the fetch fails with a general error, try the same server again as many times as
		  defined by option <ArticleRetries>, waiting <ArticleInterval> before the first retry and
		  doubling the wait for each further one; if all attempts fail, add the server to failed server list;
		- if all servers from current level were tried, increase level;
		- if all servers from all levels were tried, break the loop with failure status.
	<end-loop>
*/
SegmentFetcher::EStatus ArticleFetcher::Fetch(Segment* segment, int from, int to, CancelToken* cancel, CharBuffer& data)
{
	if (m_serverPool->GetLevelCount() == 0)
	{
		error("Could not fetch %s: no news servers defined", segment->GetId());
		return fsFailed;
	}

	CancelToken fetchCancel(cancel);
	fetchCancel.SetDeadline(m_timeout * 1000);

	int retries = m_retries > 0 ? m_retries : 1;
	int remainedRetries = retries;
	int retryInterval = m_retryInterval;
	ServerPool::RawServerList failedServers;
	failedServers.reserve(m_serverPool->GetServers()->size());
	NewsServer* wantServer = nullptr;
	int level = 0;
	bool notFoundOnly = true;
	NewsSession::EStatus status = NewsSession::nsFailed;

	while (!fetchCancel.IsDone())
	{
		status = NewsSession::nsFailed;

		NewsSession* session = nullptr;
		while (!session && !fetchCancel.IsDone())
		{
			session = m_serverPool->GetSession(level, wantServer, &failedServers);
			if (!session)
			{
				fetchCancel.Wait(5);
			}
		}

		if (!session)
		{
			break;
		}

		NewsServer* lastServer = session->GetNewsServer();
		level = lastServer->GetNormLevel();

		detail("Fetching %s @ %s", segment->GetId(), lastServer->GetName());

		data.Clear();
		status = session->Body(segment, &fetchCancel, data);
		m_serverPool->FreeSession(session);

		bool connected = status != NewsSession::nsConnectError;
		if (!connected)
		{
			detail("Article %s @ %s failed: server not available", segment->GetId(), lastServer->GetName());
			status = NewsSession::nsFailed;
		}
		else if (status == NewsSession::nsNotFound)
		{
			detail("Article %s @ %s failed: article not found", segment->GetId(), lastServer->GetName());
		}
		else if (status == NewsSession::nsFailed)
		{
			detail("Article %s @ %s failed", segment->GetId(), lastServer->GetName());
			remainedRetries--;
		}

		if (status == NewsSession::nsFinished || fetchCancel.IsDone())
		{
			break;
		}

		if (status != NewsSession::nsNotFound)
		{
			notFoundOnly = false;
		}

		bool optionalBlocked = false;
		if (!connected)
		{
			m_serverPool->BlockServer(lastServer);
			optionalBlocked = lastServer->GetOptional();
		}

		wantServer = nullptr;
		if (connected && status == NewsSession::nsFailed && remainedRetries > 0)
		{
			wantServer = lastServer;
			if (!fetchCancel.Wait(retryInterval))
			{
				break;
			}
			retryInterval = std::min(retryInterval * 2, MAX_RETRY_INTERVAL);
		}

		if (!wantServer && (connected || optionalBlocked))
		{
			if (!optionalBlocked)
			{
				failedServers.push_back(lastServer);
			}

			// if all servers from current level were tried, increase level
			// if all servers from all levels were tried, break the loop with failure status
			if (AllServersOnLevelFailed(level, &failedServers))
			{
				if (level < m_serverPool->GetMaxNormLevel())
				{
					detail("Article %s @ all level %i servers failed, increasing level", segment->GetId(), level);
					level++;
				}
				else
				{
					detail("Article %s @ all servers failed", segment->GetId());
					break;
				}
			}

			remainedRetries = retries;
			retryInterval = m_retryInterval;
		}
	}

	if (status == NewsSession::nsFinished)
	{
		ExtractRange(data, from, to);
		return fsFinished;
	}

	data.Clear();

	if (cancel && cancel->IsDone())
	{
		detail("Fetching %s cancelled", segment->GetId());
		return fsCancelled;
	}

	if (fetchCancel.IsDone())
	{
		detail("Fetching %s timed out", segment->GetId());
		return fsFailed;
	}

	return notFoundOnly ? fsNotFound : fsFailed;
}

bool ArticleFetcher::AllServersOnLevelFailed(int level, ServerPool::RawServerList* failedServers)
{
	for (NewsServer* candidateServer : m_serverPool->GetServers())
	{
		if (candidateServer->GetNormLevel() == level)
		{
			bool serverFailed = !candidateServer->GetActive() || candidateServer->GetMaxConnections() == 0 ||
				(candidateServer->GetOptional() && m_serverPool->IsServerBlocked(candidateServer));
			if (!serverFailed)
			{
				for (NewsServer* ignoreServer : failedServers)
				{
					if (ignoreServer == candidateServer ||
						(ignoreServer->GetGroup() > 0 && ignoreServer->GetGroup() == candidateServer->GetGroup() &&
						 ignoreServer->GetNormLevel() == candidateServer->GetNormLevel()))
					{
						serverFailed = true;
						break;
					}
				}
			}
			if (!serverFailed)
			{
				return false;
			}
		}
	}

	return true;
}

void ArticleFetcher::ExtractRange(CharBuffer& data, int from, int to)
{
	if (from == 0 && to >= data.Size())
	{
		return;
	}

	from = std::min(from, data.Size());
	to = std::max(from, std::min(to, data.Size()));

	CharBuffer slice;
	slice.Assign(data + from, to - from);
	data = std::move(slice);
}
