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


#ifndef SERVERPOOL_H
#define SERVERPOOL_H

#include "Log.h"
#include "Container.h"
#include "Thread.h"
#include "NewsServer.h"
#include "NewsSession.h"

class ServerPool : public Debuggable
{
public:
	typedef std::vector<NewsServer*> RawServerList;

	void SetRetryInterval(int retryInterval) { m_retryInterval = retryInterval; }
	void AddServer(std::unique_ptr<NewsServer> newsServer);
	void InitSessions(SessionFactory factory);
	int GetMaxNormLevel() { return m_maxNormLevel; }
	int GetLevelCount() { return (int)m_levels.size(); }
	Servers* GetServers() { return &m_servers; } // Only for read access (no lockings)
	NewsSession* GetSession(int level, NewsServer* wantServer, RawServerList* ignoreServers);
	void FreeSession(NewsSession* session);
	void BlockServer(NewsServer* newsServer);
	bool IsServerBlocked(NewsServer* newsServer);
	int GetFreeSessions(int level);

protected:
	virtual void LogDebugInfo();

private:
	struct PooledSession
	{
		std::unique_ptr<NewsSession> session;
		bool inUse = false;
	};

	typedef std::vector<int> Levels;
	typedef std::vector<std::unique_ptr<PooledSession>> Sessions;

	Servers m_servers;
	RawServerList m_sortedServers;
	Sessions m_sessions;
	Levels m_levels;
	int m_maxNormLevel = 0;
	Mutex m_sessionsMutex;
	int m_retryInterval = 0;

	void NormalizeLevels();
	NewsSession* LockedGetSession(int level, NewsServer* wantServer, RawServerList* ignoreServers);
};

#endif
