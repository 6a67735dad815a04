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
#include "NewsServer.h"

NewsServer::NewsServer(int id, bool active, const char* name, const char* spoolDir,
	int maxConnections, int level, int group, bool optional) :
		m_id(id), m_active(active), m_name(name), m_spoolDir(spoolDir ? spoolDir : ""),
		m_maxConnections(maxConnections), m_level(level), m_normLevel(level),
		m_group(group), m_optional(optional)
{
	if (m_name.Empty())
	{
		m_name.Format("server%i", id);
	}
}
