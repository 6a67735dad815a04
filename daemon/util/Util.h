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


#ifndef UTIL_H
#define UTIL_H

#include "NString.h"

class Util
{
public:
	static void TrimRight(char* str);
	static char* Trim(char* str);
	static bool EmptyStr(const char* str) { return !str || !*str; }
	static std::vector<CString> SplitStr(const char* str, const char* separators);
	static bool EndsWith(const char* str, const char* suffix, bool caseSensitive);

	static time_t CurrentTime();

	/* Returns monotonic ticks in microseconds */
	static int64 CurrentTicks();
	static void Sleep(int milliseconds);

	static void FormatTime(time_t timeSec, char* buffer, int bufsize);
	static CString FormatTime(time_t timeSec);
	static CString FormatSize(int64 fileSize);

	/* Parses "1.5 MB", "200K", "4096" etc. into bytes; returns -1 on syntax error */
	static int64 ParseSize(const char* str);

	static const char* VersionRevision() { return VersionRevisionString; };
	static const char* VersionRevisionString;
};

class Tokenizer
{
public:
	Tokenizer(const char* dataString, const char* separators);
	Tokenizer(char* dataString, const char* separators, bool inplaceBuf);
	char* Next();

private:
	BString<1024> m_shortString;
	CString m_longString;
	char* m_dataString;
	const char* m_separators;
	char* m_savePtr = nullptr;
	bool m_working = false;
};

/*
 * Incremental CRC32 (the checksum used by yEnc-encoded articles), computed with zlib.
 */
class Crc32
{
public:
	Crc32() { Reset(); }
	void Reset() { m_crc = crc32(0L, Z_NULL, 0); }
	void Append(const uchar* block, uint32 length) { m_crc = crc32(m_crc, block, length); }
	uint32 Finish() { return (uint32)m_crc; }
	static uint32 Calc(const char* block, int length);

private:
	uLong m_crc;
};

#endif
