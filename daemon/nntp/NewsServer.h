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


#ifndef NEWSSERVER_H
#define NEWSSERVER_H

#include "NString.h"

/*
 * Configured article provider. The spool directory is where the provider's
 * session looks up article bodies.
 */
class NewsServer
{
public:
	NewsServer(int id, bool active, const char* name, const char* spoolDir,
		int maxConnections, int level, int group, bool optional);
	int GetId() { return m_id; }
	bool GetActive() { return m_active; }
	void SetActive(bool active) { m_active = active; }
	const char* GetName() { return m_name; }
	const char* GetSpoolDir() { return m_spoolDir; }
	int GetGroup() { return m_group; }
	int GetMaxConnections() { return m_maxConnections; }
	int GetLevel() { return m_level; }
	int GetNormLevel() { return m_normLevel; }
	void SetNormLevel(int level) { m_normLevel = level; }
	bool GetOptional() { return m_optional; }
	time_t GetBlockTime() { return m_blockTime; }
	void SetBlockTime(time_t blockTime) { m_blockTime = blockTime; }

private:
	int m_id;
	bool m_active;
	CString m_name;
	CString m_spoolDir;
	int m_maxConnections;
	int m_level;
	int m_normLevel;
	int m_group;
	bool m_optional = false;
	time_t m_blockTime = 0;
};

typedef std::vector<std::unique_ptr<NewsServer>> Servers;

#endif
