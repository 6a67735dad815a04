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
#include "SpoolSession.h"
#include "Log.h"
#include "FileSystem.h"

CString SpoolSession::ArticleFilename(const char* spoolDir, const char* group, const char* messageId)
{
	CString id = messageId;
	if (!id.Empty() && id[0] == '<')
	{
		id.Replace(0, 1, "");
	}
	int len = id.Length();
	if (len > 0 && id[len - 1] == '>')
	{
		id[len - 1] = '\0';
	}

	// message-ids may contain slashes, they must not escape the spool directory
	for (char* p = id; *p; p++)
	{
		if (*p == PATH_SEPARATOR || *p == ALT_PATH_SEPARATOR)
		{
			*p = '_';
		}
	}

	if (group && *group)
	{
		return CString::FormatStr("%s%c%s%c%s", spoolDir, PATH_SEPARATOR, group, PATH_SEPARATOR, *id);
	}
	return CString::FormatStr("%s%c%s", spoolDir, PATH_SEPARATOR, *id);
}

NewsSession::EStatus SpoolSession::Body(Segment* segment, CancelToken* cancel, CharBuffer& data)
{
	if (!FileSystem::DirectoryExists(m_newsServer->GetSpoolDir()))
	{
		detail("Spool directory %s of %s is not available", m_newsServer->GetSpoolDir(), m_newsServer->GetName());
		return nsConnectError;
	}

	if (cancel && cancel->IsDone())
	{
		return nsFailed;
	}

	CString filename;
	for (CString& group : *segment->GetGroups())
	{
		CString groupFilename = ArticleFilename(m_newsServer->GetSpoolDir(), group, segment->GetId());
		if (FileSystem::FileExists(groupFilename))
		{
			filename = std::move(groupFilename);
			break;
		}
	}

	if (filename.Empty())
	{
		filename = ArticleFilename(m_newsServer->GetSpoolDir(), nullptr, segment->GetId());
		if (!FileSystem::FileExists(filename))
		{
			return nsNotFound;
		}
	}

	if (!FileSystem::LoadFileIntoBuffer(filename, data, false))
	{
		detail("Could not read %s: %s", *filename, *FileSystem::GetLastErrorMessage());
		data.Clear();
		return nsFailed;
	}

	return nsFinished;
}
