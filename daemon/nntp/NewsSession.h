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


#ifndef NEWSSESSION_H
#define NEWSSESSION_H

#include "NewsServer.h"
#include "Segment.h"
#include "CancelToken.h"

/*
 * One connection slot to a provider. A session is used by one thread at a time,
 * the server pool hands it out and takes it back.
 */
class NewsSession
{
public:
	enum EStatus
	{
		nsFinished,
		nsNotFound,
		nsFailed,
		nsConnectError
	};

	NewsSession(NewsServer* newsServer) : m_newsServer(newsServer) {}
	virtual ~NewsSession() {}
	NewsServer* GetNewsServer() { return m_newsServer; }

	/* Retrieves the decoded body of the article */
	virtual EStatus Body(Segment* segment, CancelToken* cancel, CharBuffer& data) = 0;

protected:
	NewsServer* m_newsServer;
};

typedef std::function<std::unique_ptr<NewsSession>(NewsServer* newsServer)> SessionFactory;

#endif
