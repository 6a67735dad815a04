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


#ifndef SEGMENT_H
#define SEGMENT_H

#include "NString.h"

/*
 * One addressable remote unit (an article) holding the bytes
 * [start, start + size) of a logical file.
 */
class Segment
{
public:
	typedef std::vector<CString> GroupList;

	Segment(const char* id, int64 start, int size, uint32 crc = 0) :
		m_id(id), m_start(start), m_size(size), m_crc(crc) {}
	const char* GetId() const { return m_id; }
	int64 GetStart() const { return m_start; }
	int GetSize() const { return m_size; }
	int64 GetEnd() const { return m_start + m_size; }

	/* Expected CRC32 of the decoded payload; 0 if unknown */
	uint32 GetCrc() const { return m_crc; }
	GroupList* GetGroups() { return &m_groups; }

private:
	CString m_id;
	int64 m_start;
	int m_size;
	uint32 m_crc;
	GroupList m_groups;
};

/*
 * Ordered description of how a logical file maps onto segments.
 * Filled once by the importer and only read afterwards, so it can be shared
 * by any number of readers without locking.
 */
class SegmentIndex
{
public:
	typedef std::vector<Segment> SegmentList;

	/* Appends a segment placed right after the previous one */
	Segment& AddSegment(const char* id, int size, uint32 crc = 0);

	/* Appends a segment with an explicit start offset (validated later) */
	Segment& AddSegment(const char* id, int64 start, int size, uint32 crc);

	void SetSize(int64 size) { m_size = size; }
	int64 GetSize() const { return m_size; }
	/* Bytes covered by the segments, which differs from GetSize() for inconsistent data */
	int64 GetExtent() const { return m_segments.empty() ? 0 : m_segments.back().GetEnd(); }
	int GetCount() const { return (int)m_segments.size(); }
	Segment* GetSegment(int index) { return &m_segments[index]; }
	SegmentList* GetSegments() { return &m_segments; }

	/* Checks that segments are sorted, contiguous, non-empty and sum up to the declared size */
	bool Validate(CString& errmsg);

	/* Returns the index of the segment holding "offset" or -1 */
	int FindSegment(int64 offset);

private:
	SegmentList m_segments;
	int64 m_size = 0;
};

/*
 * Logical file as produced by the importer.
 */
class ParsedFile
{
public:
	ParsedFile(const char* filename) : m_filename(filename) {}
	const char* GetFilename() { return m_filename; }
	int64 GetSize() { return m_index.GetSize(); }
	SegmentIndex* GetIndex() { return &m_index; }

	/*
	 * Reads a segment list file: '#' starts a comment, "name <filename>" sets the
	 * logical file name, every other line is "<message-id> <size> [crc32-hex] [groups]"
	 * with comma separated groups. Segments are placed in file order.
	 */
	static std::unique_ptr<ParsedFile> Load(const char* listFilename, CString& errmsg);

private:
	CString m_filename;
	SegmentIndex m_index;
};

typedef std::vector<std::unique_ptr<ParsedFile>> ParsedFileList;

#endif
