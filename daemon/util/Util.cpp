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
#include "Util.h"

#ifndef VERSION
#define VERSION "1.0"
#endif

const char* Util::VersionRevisionString = VERSION;

void Util::TrimRight(char* str)
{
	char* end = str + strlen(str) - 1;
	while (end >= str && (*end == '\n' || *end == '\r' || *end == ' ' || *end == '\t'))
	{
		*end = '\0';
		end--;
	}
}

char* Util::Trim(char* str)
{
	TrimRight(str);
	while (*str == '\n' || *str == '\r' || *str == ' ' || *str == '\t')
	{
		str++;
	}
	return str;
}

std::vector<CString> Util::SplitStr(const char* str, const char* separators)
{
	std::vector<CString> result;
	Tokenizer tok(str, separators);
	while (const char* substr = tok.Next())
	{
		result.emplace_back(substr);
	}
	return result;
}

bool Util::EndsWith(const char* str, const char* suffix, bool caseSensitive)
{
	if (!str)
	{
		return false;
	}

	if (EmptyStr(suffix))
	{
		return true;
	}

	int lenStr = strlen(str);
	int lenSuf = strlen(suffix);

	if (lenSuf > lenStr)
	{
		return false;
	}

	return caseSensitive ? !strcmp(str + lenStr - lenSuf, suffix) :
		!strcasecmp(str + lenStr - lenSuf, suffix);
}

time_t Util::CurrentTime()
{
	return ::time(nullptr);
}

int64 Util::CurrentTicks()
{
	timespec t;
	clock_gettime(CLOCK_MONOTONIC, &t);
	return (int64)(t.tv_sec) * 1000000ll + (int64)(t.tv_nsec / 1000);
}

void Util::Sleep(int milliseconds)
{
	usleep(milliseconds * 1000);
}

void Util::FormatTime(time_t timeSec, char* buffer, int bufsize)
{
	ctime_r(&timeSec, buffer);
	buffer[bufsize-1] = '\0';

	// trim LF
	buffer[strlen(buffer) - 1] = '\0';
}

CString Util::FormatTime(time_t timeSec)
{
	CString result;
	result.Reserve(50);
	FormatTime(timeSec, result, 50);
	return result;
}

CString Util::FormatSize(int64 fileSize)
{
	CString result;

	if (fileSize > 1024 * 1024 * 1000)
	{
		result.Format("%.2f GB", (float)((float)fileSize / 1024 / 1024 / 1024));
	}
	else if (fileSize > 1024 * 1000)
	{
		result.Format("%.2f MB", (float)((float)fileSize / 1024 / 1024));
	}
	else if (fileSize > 1000)
	{
		result.Format("%.2f KB", (float)((float)fileSize / 1024));
	}
	else
	{
		result.Format("%i B", (int)fileSize);
	}
	return result;
}

int64 Util::ParseSize(const char* str)
{
	if (EmptyStr(str))
	{
		return -1;
	}

	char* endptr;
	double value = strtod(str, &endptr);
	if (endptr == str || value < 0)
	{
		return -1;
	}

	while (*endptr == ' ') endptr++;

	double multiplier = 1;
	switch (toupper(*endptr))
	{
		case '\0':
		case 'B':
			break;
		case 'K':
			multiplier = 1024.0;
			break;
		case 'M':
			multiplier = 1024.0 * 1024;
			break;
		case 'G':
			multiplier = 1024.0 * 1024 * 1024;
			break;
		default:
			return -1;
	}

	if (*endptr && endptr[1] && strcasecmp(endptr + 1, "B"))
	{
		return -1;
	}

	return (int64)(value * multiplier);
}


Tokenizer::Tokenizer(const char* dataString, const char* separators) :
	m_separators(separators)
{
	// an optimization to avoid memory allocation for short data string
	int len = strlen(dataString);
	if (len < m_shortString.Capacity())
	{
		m_shortString.Set(dataString);
		m_dataString = m_shortString;
	}
	else
	{
		m_longString.Set(dataString);
		m_dataString = m_longString;
	}
}

Tokenizer::Tokenizer(char* dataString, const char* separators, bool inplaceBuf) :
	m_separators(separators)
{
	if (inplaceBuf)
	{
		m_dataString = dataString;
	}
	else
	{
		m_longString.Set(dataString);
		m_dataString = m_longString;
	}
}

char* Tokenizer::Next()
{
	char* token = nullptr;
	while (!token || !*token)
	{
		token = strtok_r(m_working ? nullptr : m_dataString, m_separators, &m_savePtr);
		m_working = true;
		if (!token)
		{
			return nullptr;
		}
		token = Util::Trim(token);
	}
	return token;
}


uint32 Crc32::Calc(const char* block, int length)
{
	Crc32 crc;
	crc.Append((const uchar*)block, (uint32)length);
	return crc.Finish();
}
