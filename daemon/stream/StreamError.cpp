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
#include "StreamError.h"

StreamError& StreamError::operator=(const StreamError& other)
{
	if (this != &other)
	{
		m_kind = other.m_kind;
		m_bytesRead = other.m_bytesRead;
		m_totalExpected = other.m_totalExpected;
		m_message = other.m_message.Empty() ? nullptr : other.m_message.Str();
	}
	return *this;
}

StreamError StreamError::PartialContent(int64 bytesRead, int64 totalExpected)
{
	StreamError error(ekPartialContent);
	error.m_bytesRead = bytesRead;
	error.m_totalExpected = totalExpected;
	error.m_message.Format("partial content: got %" PRIi64 " of %" PRIi64 " bytes", bytesRead, totalExpected);
	return error;
}

StreamError StreamError::CorruptedFile(int64 totalExpected)
{
	StreamError error(ekCorruptedFile);
	error.m_totalExpected = totalExpected;
	error.m_message.Format("corrupted file: data inconsistent with declared size %" PRIi64, totalExpected);
	return error;
}

int StreamError::HttpStatus(EKind kind, EPhase phase)
{
	switch (kind)
	{
		case ekPartialContent:
			return 206;

		case ekCorruptedFile:
		case ekFileIsCorrupted:
			// before any byte was served the file is reported missing,
			// mid-stream the source is reported temporarily unavailable
			return phase == epOpen ? 404 : 503;

		default:
			return 0;
	}
}

const char* StreamError::KindName(EKind kind)
{
	switch (kind)
	{
		case ekNone: return "no error";
		case ekInvalidRange: return "invalid range";
		case ekReaderClosed: return "reader closed";
		case ekPartialContent: return "partial content";
		case ekCorruptedFile: return "corrupted file";
		case ekFileIsCorrupted: return "file is corrupted";
		case ekCancelled: return "cancelled";
		case ekFetchFailed: return "fetch failed";
		case ekTooManySegments: return "too many segments";
		case ekSizeMismatch: return "size mismatch";
		case ekEndOfStream: return "end of stream";
	}
	return "unknown error";
}
