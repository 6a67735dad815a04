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


#ifndef SPOOLSESSION_H
#define SPOOLSESSION_H

#include "NewsSession.h"

/*
 * Serves article bodies from a spool directory. An article is looked up in
 * "<SpoolDir>/<group>/<message-id>" for each of its groups, then in
 * "<SpoolDir>/<message-id>". Angle brackets are stripped from the message-id.
 */
class SpoolSession : public NewsSession
{
public:
	using NewsSession::NewsSession;
	virtual EStatus Body(Segment* segment, CancelToken* cancel, CharBuffer& data);

	static CString ArticleFilename(const char* spoolDir, const char* group, const char* messageId);
};

#endif
