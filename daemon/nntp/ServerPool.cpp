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
#include "ServerPool.h"
#include "Util.h"

void ServerPool::AddServer(std::unique_ptr<NewsServer> newsServer)
{
	debug("Adding server to ServerPool");

	m_sortedServers.push_back(newsServer.get());
	m_servers.push_back(std::move(newsServer));
}

/*
 * Calculate normalized levels for all servers.
 * Normalized Level means: starting from 0 with step 1.
 * The servers of minimum Level must be always used even if they are not active;
 * this is to prevent backup servers to act as main servers.
**/
void ServerPool::NormalizeLevels()
{
	if (m_servers.empty())
	{
		return;
	}

	std::stable_sort(m_sortedServers.begin(), m_sortedServers.end(),
		[](NewsServer* server1, NewsServer* server2)
		{
			return server1->GetLevel() < server2->GetLevel();
		});

	int minLevel = m_sortedServers.front()->GetLevel();

	m_maxNormLevel = 0;
	int lastLevel = minLevel;
	for (NewsServer* newsServer : m_sortedServers)
	{
		if ((newsServer->GetActive() && newsServer->GetMaxConnections() > 0) ||
			(newsServer->GetLevel() == minLevel))
		{
			if (newsServer->GetLevel() != lastLevel)
			{
				m_maxNormLevel++;
			}
			newsServer->SetNormLevel(m_maxNormLevel);
			lastLevel = newsServer->GetLevel();
		}
		else
		{
			newsServer->SetNormLevel(-1);
		}
	}
}

void ServerPool::InitSessions(SessionFactory factory)
{
	debug("Initializing sessions in ServerPool");

	Guard guard(m_sessionsMutex);

	NormalizeLevels();
	m_levels.clear();
	m_sessions.clear();

	for (NewsServer* newsServer : m_sortedServers)
	{
		newsServer->SetBlockTime(0);
		int normLevel = newsServer->GetNormLevel();
		if (normLevel > -1)
		{
			if ((int)m_levels.size() <= normLevel)
			{
				m_levels.push_back(0);
			}

			if (newsServer->GetActive())
			{
				for (int i = 0; i < newsServer->GetMaxConnections(); i++)
				{
					std::unique_ptr<PooledSession> pooled = std::make_unique<PooledSession>();
					pooled->session = factory(newsServer);
					m_sessions.push_back(std::move(pooled));
				}

				m_levels[normLevel] += newsServer->GetMaxConnections();
			}
		}
	}
}

/* Returns session to any server on a given level or nullptr if there is no free session at the moment.
 * If all servers are blocked and all are optional a session from the next level is returned instead.
 */
NewsSession* ServerPool::GetSession(int level, NewsServer* wantServer, RawServerList* ignoreServers)
{
	Guard guard(m_sessionsMutex);

	for (; level < (int)m_levels.size() && m_levels[level] > 0; level++)
	{
		NewsSession* session = LockedGetSession(level, wantServer, ignoreServers);
		if (session)
		{
			return session;
		}

		for (NewsServer* newsServer : m_sortedServers)
		{
			if (newsServer->GetNormLevel() == level && newsServer->GetActive() &&
				!(newsServer->GetOptional() && IsServerBlocked(newsServer)))
			{
				return nullptr;
			}
		}
	}

	return nullptr;
}

NewsSession* ServerPool::LockedGetSession(int level, NewsServer* wantServer, RawServerList* ignoreServers)
{
	if (level >= (int)m_levels.size() || m_levels[level] == 0)
	{
		return nullptr;
	}

	std::vector<PooledSession*> candidates;
	candidates.reserve(m_sessions.size());

	for (PooledSession* candidateSession : &m_sessions)
	{
		NewsServer* candidateServer = candidateSession->session->GetNewsServer();
		if (!candidateSession->inUse && candidateServer->GetActive() &&
			candidateServer->GetNormLevel() == level &&
			(!wantServer || candidateServer == wantServer ||
			 (wantServer->GetGroup() > 0 && wantServer->GetGroup() == candidateServer->GetGroup())) &&
			!IsServerBlocked(candidateServer))
		{
			// free session found, check if it's not from the server which should be ignored
			bool useSession = true;
			if (ignoreServers && !wantServer)
			{
				for (NewsServer* ignoreServer : ignoreServers)
				{
					if (ignoreServer == candidateServer ||
						(ignoreServer->GetGroup() > 0 && ignoreServer->GetGroup() == candidateServer->GetGroup() &&
						 ignoreServer->GetNormLevel() == candidateServer->GetNormLevel()))
					{
						useSession = false;
						break;
					}
				}
			}

			candidateServer->SetBlockTime(0);

			if (useSession)
			{
				candidates.push_back(candidateSession);
			}
		}
	}

	if (candidates.empty())
	{
		return nullptr;
	}

	// a random free session spreads the load across providers of the same level
	PooledSession* pooled = candidates[rand() % candidates.size()];
	pooled->inUse = true;
	m_levels[level]--;

	return pooled->session.get();
}

void ServerPool::FreeSession(NewsSession* session)
{
	Guard guard(m_sessionsMutex);

	for (PooledSession* pooled : &m_sessions)
	{
		if (pooled->session.get() == session)
		{
			pooled->inUse = false;
			break;
		}
	}

	NewsServer* newsServer = session->GetNewsServer();
	if (newsServer->GetNormLevel() > -1 && newsServer->GetActive())
	{
		m_levels[newsServer->GetNormLevel()]++;
	}
}

int ServerPool::GetFreeSessions(int level)
{
	Guard guard(m_sessionsMutex);
	return level >= 0 && level < (int)m_levels.size() ? m_levels[level] : 0;
}

void ServerPool::BlockServer(NewsServer* newsServer)
{
	bool newBlock = false;
	{
		Guard guard(m_sessionsMutex);
		time_t curTime = Util::CurrentTime();
		newBlock = newsServer->GetBlockTime() != curTime;
		newsServer->SetBlockTime(curTime);
	}

	if (newBlock && m_retryInterval > 0)
	{
		warn("Blocking %s (%s) for %i sec", newsServer->GetName(), newsServer->GetSpoolDir(), m_retryInterval);
	}
}

bool ServerPool::IsServerBlocked(NewsServer* newsServer)
{
	if (!newsServer->GetBlockTime())
	{
		return false;
	}

	time_t curTime = Util::CurrentTime();
	bool blocked = newsServer->GetBlockTime() <= curTime &&
		curTime < newsServer->GetBlockTime() + m_retryInterval;
	return blocked;
}

void ServerPool::LogDebugInfo()
{
	info("   ---------- ServerPool");

	info("    Max-Level: %i", m_maxNormLevel);

	Guard guard(m_sessionsMutex);

	time_t curTime = Util::CurrentTime();

	info("    Servers: %i", (int)m_servers.size());
	for (NewsServer* newsServer : &m_servers)
	{
		info("      %i) %s (%s): Level=%i, NormLevel=%i, BlockSec=%i", newsServer->GetId(), newsServer->GetName(),
			newsServer->GetSpoolDir(), newsServer->GetLevel(), newsServer->GetNormLevel(),
			newsServer->GetBlockTime() && newsServer->GetBlockTime() + m_retryInterval > curTime ?
				(int)(newsServer->GetBlockTime() + m_retryInterval - curTime) : 0);
	}

	info("    Levels: %i", (int)m_levels.size());
	int index = 0;
	for (int size : m_levels)
	{
		info("      %i: Free sessions=%i", index, size);
		index++;
	}

	info("    Sessions: %i", (int)m_sessions.size());
	for (PooledSession* pooled : &m_sessions)
	{
		NewsServer* newsServer = pooled->session->GetNewsServer();
		info("      %i) %s: Level=%i, NormLevel=%i, InUse:%i", newsServer->GetId(), newsServer->GetName(),
			newsServer->GetLevel(), newsServer->GetNormLevel(), (int)pooled->inUse);
	}
}
