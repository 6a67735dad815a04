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


#ifndef RARREADER_H
#define RARREADER_H

#include "NString.h"
#include "Log.h"

class RarFile
{
public:
	const char* GetFilename() { return m_filename; }
	uint32 GetTime() { return m_time; }
	uint32 GetAttr() { return m_attr; }
	int64 GetSize() { return m_size; }
	/* Bytes of this file stored in the volume */
	int64 GetPackedSize() { return m_packedSize; }
	/* Position of the file data within the volume */
	int64 GetDataOffset() { return m_dataOffset; }
	/* Compression method, 0 means stored */
	int GetMethod() { return m_method; }
	bool GetStored() { return m_method == 0; }
	bool GetSplitBefore() { return m_splitBefore; }
	bool GetSplitAfter() { return m_splitAfter; }
private:
	CString m_filename;
	uint32 m_time = 0;
	uint32 m_attr = 0;
	int64 m_size = 0;
	int64 m_packedSize = 0;
	int64 m_dataOffset = 0;
	int m_method = 0;
	bool m_splitBefore = false;
	bool m_splitAfter = false;
	friend class RarVolume;
};

/*
 * Parses the headers of a RAR3 or RAR5 volume held in memory.
 * The buffer must stay valid while Read() is running.
 */
class RarVolume
{
public:
	typedef std::deque<RarFile> FileList;

	RarVolume(const char* filename, const char* data, int64 size) :
		m_filename(filename), m_data((const uint8*)data), m_size(size) {}
	RarVolume(const RarVolume&) = delete;
	~RarVolume() { DecryptFree(); }
	bool Read();

	const char* GetFilename() { return m_filename; }
	int GetVersion() { return m_version; }
	uint32 GetVolumeNo() { return m_volumeNo; }
	bool GetNewNaming() { return m_newNaming; }
	bool GetHasNextVolume() { return m_hasNextVolume; }
	bool GetMultiVolume() { return m_multiVolume; }
	bool GetEncrypted() { return m_encrypted; }
	void SetPassword(const char* password) { m_password = password; }
	FileList* GetFiles() { return &m_files; }

	static int DetectRarVersion(const char* data, int64 size);

private:
	struct RarBlock
	{
		uint32 crc;
		uint8 type;
		uint16 flags;
		uint64 addsize;
		uint64 datasize;
		uint64 trailsize;
	};

	CString m_filename;
	const uint8* m_data;
	int64 m_size;
	int64 m_pos = 0;
	int m_version = 0;
	uint32 m_volumeNo = 0;
	bool m_newNaming = false;
	bool m_hasNextVolume = false;
	bool m_multiVolume = false;
	FileList m_files;
	bool m_encrypted = false;
	CString m_password;
	uint8 m_decryptKey[32];
	uint8 m_decryptIV[16];
	uint8 m_decryptBuf[16];
	uint8 m_decryptPos = 16;

	// using "void*" to prevent the including of OpenSSL header files into RarReader.h
	void* m_context = nullptr;

	void LogDebugInfo();
	bool RawRead(void* buffer, int64 size);
	bool Seek(int64 position);
	bool Skip(RarBlock* block, int64 size);
	bool Read(RarBlock* block, void* buffer, int64 size);
	bool Read16(RarBlock* block, uint16* result);
	bool Read32(RarBlock* block, uint32* result);
	bool ReadV(RarBlock* block, uint64* result);
	bool ReadRar3Volume();
	bool ReadRar5Volume();
	RarBlock ReadRar3Block();
	RarBlock ReadRar5Block();
	bool ReadRar3File(RarBlock& block, RarFile& innerFile);
	bool ReadRar5File(RarBlock& block, RarFile& innerFile);
	bool DecryptRar3Prepare(const uint8 salt[8]);
	bool DecryptRar5Prepare(uint8 kdfCount, const uint8 salt[16]);
	bool DecryptInit(int keyLength);
	bool DecryptBuf(const uint8 in[16], uint8 out[16]);
	void DecryptFree();
	bool DecryptRead(void* buffer, int64 size);
};

#endif
