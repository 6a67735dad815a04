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


#ifndef RARARCHIVE_H
#define RARARCHIVE_H

#include "NString.h"
#include "RarReader.h"

typedef std::unordered_map<std::string, CharBuffer> RarPartMap;

/*
 * Inner file of a multi-volume set, joined from the pieces stored in each volume.
 */
class RarEntry
{
public:
	struct Chunk
	{
		CString volume;
		int64 offset;
		int64 size;
	};

	typedef std::vector<Chunk> ChunkList;

	RarEntry(const char* filename, int64 size, int method) :
		m_filename(filename), m_size(size), m_method(method) {}
	const char* GetFilename() { return m_filename; }
	int64 GetSize() { return m_size; }
	int64 GetPackedSize() { return m_packedSize; }
	int GetMethod() { return m_method; }
	bool GetStored() { return m_method == 0; }
	/* All volumes of the entry's chain are present */
	bool GetComplete() { return m_complete; }
	ChunkList* GetChunks() { return &m_chunks; }

private:
	CString m_filename;
	int64 m_size;
	int64 m_packedSize = 0;
	int m_method;
	bool m_complete = true;
	bool m_open = false;
	uint32 m_lastVolumeNo = 0;
	ChunkList m_chunks;

	friend class RarArchive;
};

/*
 * Multi-volume set assembled from materialized parts. The part map passed to Read()
 * must outlive the archive.
 */
class RarArchive
{
public:
	typedef std::vector<std::unique_ptr<RarVolume>> VolumeList;
	typedef std::deque<RarEntry> EntryList;

	void SetPassword(const char* password) { m_password = password; }
	bool Read(RarPartMap* parts, CString& errmsg);
	VolumeList* GetVolumes() { return &m_volumes; }
	EntryList* GetEntries() { return &m_entries; }
	RarEntry* FindEntry(const char* filename);

	/* A volume of the set is missing, either in the middle or at the end */
	bool GetMissingVolumes() { return m_missingVolumes; }

	/* Copies the contents of a complete stored (uncompressed) entry */
	bool Extract(RarEntry* entry, CharBuffer& data, CString& errmsg);

private:
	CString m_password;
	RarPartMap* m_parts = nullptr;
	VolumeList m_volumes;
	EntryList m_entries;
	bool m_missingVolumes = false;

	void SortVolumes();
	void JoinEntries();
};

#endif
