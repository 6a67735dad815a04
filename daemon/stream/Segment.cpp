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
#include "Segment.h"
#include "Log.h"
#include "Util.h"
#include "FileSystem.h"

Segment& SegmentIndex::AddSegment(const char* id, int size, uint32 crc)
{
	int64 start = m_segments.empty() ? 0 : m_segments.back().GetEnd();
	return AddSegment(id, start, size, crc);
}

Segment& SegmentIndex::AddSegment(const char* id, int64 start, int size, uint32 crc)
{
	m_segments.emplace_back(id, start, size, crc);
	m_size += size;
	return m_segments.back();
}

bool SegmentIndex::Validate(CString& errmsg)
{
	int64 expectedStart = 0;
	int64 total = 0;

	for (Segment& segment : m_segments)
	{
		if (segment.GetSize() <= 0)
		{
			errmsg.Format("segment %s has invalid size %i", segment.GetId(), segment.GetSize());
			return false;
		}

		if (segment.GetStart() != expectedStart)
		{
			errmsg.Format("segment %s starts at %" PRIi64 " but previous segment ends at %" PRIi64 " (%s)",
				segment.GetId(), segment.GetStart(), expectedStart,
				segment.GetStart() < expectedStart ? "overlap" : "gap");
			return false;
		}

		expectedStart = segment.GetEnd();
		total += segment.GetSize();
	}

	if (total != m_size)
	{
		errmsg.Format("segments cover %" PRIi64 " bytes but file size is %" PRIi64, total, m_size);
		return false;
	}

	return true;
}

int SegmentIndex::FindSegment(int64 offset)
{
	if (offset < 0 || m_segments.empty() || offset >= m_segments.back().GetEnd())
	{
		return -1;
	}

	// first segment whose end is past the offset
	SegmentList::iterator it = std::upper_bound(m_segments.begin(), m_segments.end(), offset,
		[](int64 offset, const Segment& segment)
		{
			return offset < segment.GetEnd();
		});

	if (it == m_segments.end() || it->GetStart() > offset)
	{
		return -1;
	}

	return (int)(it - m_segments.begin());
}


std::unique_ptr<ParsedFile> ParsedFile::Load(const char* listFilename, CString& errmsg)
{
	DiskFile infile;
	if (!infile.Open(listFilename, DiskFile::omRead))
	{
		errmsg.Format("could not open file %s: %s", listFilename, *FileSystem::GetLastErrorMessage());
		return nullptr;
	}

	std::unique_ptr<ParsedFile> parsedFile = std::make_unique<ParsedFile>(FileSystem::BaseFileName(listFilename));

	char buf[1024];
	int lineNo = 0;
	while (infile.ReadLine(buf, sizeof(buf)))
	{
		lineNo++;
		char* line = Util::Trim(buf);
		if (*line == '\0' || *line == '#')
		{
			continue;
		}

		std::vector<CString> tokens = Util::SplitStr(line, " \t");

		if (!strcmp(tokens[0], "name"))
		{
			if (tokens.size() < 2)
			{
				errmsg.Format("%s(%i): missing file name", FileSystem::BaseFileName(listFilename), lineNo);
				return nullptr;
			}
			parsedFile->m_filename = Util::Trim(line + 4);
			continue;
		}

		if (tokens.size() < 2)
		{
			errmsg.Format("%s(%i): missing segment size", FileSystem::BaseFileName(listFilename), lineNo);
			return nullptr;
		}

		char* endptr;
		long size = strtol(tokens[1], &endptr, 10);
		if (*endptr != '\0' || size <= 0)
		{
			errmsg.Format("%s(%i): invalid segment size \"%s\"", FileSystem::BaseFileName(listFilename),
				lineNo, *tokens[1]);
			return nullptr;
		}

		uint32 crc = 0;
		if (tokens.size() > 2)
		{
			crc = (uint32)strtoul(tokens[2], &endptr, 16);
			if (*endptr != '\0')
			{
				errmsg.Format("%s(%i): invalid crc \"%s\"", FileSystem::BaseFileName(listFilename),
					lineNo, *tokens[2]);
				return nullptr;
			}
		}

		Segment& segment = parsedFile->m_index.AddSegment(tokens[0], (int)size, crc);

		if (tokens.size() > 3)
		{
			for (CString& group : Util::SplitStr(tokens[3], ","))
			{
				segment.GetGroups()->push_back(std::move(group));
			}
		}
	}

	debug("Loaded %i segments from %s", parsedFile->m_index.GetCount(), listFilename);

	return parsedFile;
}
