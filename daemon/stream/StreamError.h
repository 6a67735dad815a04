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


#ifndef STREAMERROR_H
#define STREAMERROR_H

#include "NString.h"

/*
 * Outcome of a stream operation. The kind is a closed set; consumers translate it
 * into their transport status with HttpStatus().
 */
class StreamError
{
public:
	enum EKind
	{
		ekNone,
		ekInvalidRange,
		ekReaderClosed,
		ekPartialContent,
		ekCorruptedFile,
		ekFileIsCorrupted,
		ekCancelled,
		ekFetchFailed,
		ekTooManySegments,
		ekSizeMismatch,
		ekEndOfStream
	};

	enum EPhase
	{
		epOpen,
		epRead
	};

	StreamError() {}
	StreamError(EKind kind, const char* message = nullptr) : m_kind(kind), m_message(message) {}
	StreamError(const StreamError& other) { *this = other; }
	StreamError(StreamError&& other) = default;
	StreamError& operator=(const StreamError& other);
	StreamError& operator=(StreamError&& other) = default;

	static StreamError PartialContent(int64 bytesRead, int64 totalExpected);
	static StreamError CorruptedFile(int64 totalExpected);

	EKind GetKind() const { return m_kind; }
	bool Ok() const { return m_kind == ekNone; }
	int64 GetBytesRead() const { return m_bytesRead; }
	void SetBytesRead(int64 bytesRead) { m_bytesRead = bytesRead; }
	int64 GetTotalExpected() const { return m_totalExpected; }
	const char* GetMessage() const { return m_message.Empty() ? KindName(m_kind) : m_message.Str(); }
	void SetMessage(const char* message) { m_message = message; }

	/* Returns 0 when the error must be passed through unchanged */
	int HttpStatus(EPhase phase) const { return HttpStatus(m_kind, phase); }
	static int HttpStatus(EKind kind, EPhase phase);
	static const char* KindName(EKind kind);

private:
	EKind m_kind = ekNone;
	int64 m_bytesRead = 0;
	int64 m_totalExpected = 0;
	CString m_message;
};

typedef std::vector<StreamError> StreamErrorList;

#endif
