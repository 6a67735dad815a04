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

#include "RarReader.h"
#include "Log.h"
#include "Util.h"
#include "FileSystem.h"

// RAR3 constants

static const uint16 RAR3_MAIN_VOLUME = 0x0001;
static const uint16 RAR3_MAIN_NEWNUMBERING = 0x0010;
static const uint16 RAR3_MAIN_PASSWORD = 0x0080;

static const uint8 RAR3_BLOCK_MAIN = 0x73; // s
static const uint8 RAR3_BLOCK_FILE = 0x74; // t
static const uint8 RAR3_BLOCK_ENDARC = 0x7b; // {

static const uint16 RAR3_BLOCK_ADDSIZE = 0x8000;

static const uint16 RAR3_FILE_ADDSIZE = 0x0100;
static const uint16 RAR3_FILE_SPLITBEFORE = 0x0001;
static const uint16 RAR3_FILE_SPLITAFTER = 0x0002;

static const uint8 RAR3_METHOD_STORE = 0x30;

static const uint16 RAR3_ENDARC_NEXTVOL = 0x0001;
static const uint16 RAR3_ENDARC_DATACRC = 0x0002;
static const uint16 RAR3_ENDARC_VOLNUMBER = 0x0008;

// RAR5 constants

static const uint8 RAR5_BLOCK_MAIN = 1;
static const uint8 RAR5_BLOCK_FILE = 2;
static const uint8 RAR5_BLOCK_ENCRYPTION = 4;
static const uint8 RAR5_BLOCK_ENDARC = 5;

static const uint8 RAR5_BLOCK_EXTRADATA = 0x01;
static const uint8 RAR5_BLOCK_DATAAREA = 0x02;
static const uint8 RAR5_BLOCK_SPLITBEFORE = 0x08;
static const uint8 RAR5_BLOCK_SPLITAFTER = 0x10;

static const uint8 RAR5_MAIN_ISVOL = 0x01;
static const uint8 RAR5_MAIN_VOLNR = 0x02;

static const uint8 RAR5_FILE_TIME = 0x02;
static const uint8 RAR5_FILE_CRC = 0x04;
static const uint8 RAR5_FILE_EXTRATIME = 0x03;
static const uint8 RAR5_FILE_EXTRATIMEUNIXFORMAT = 0x01;

static const uint8 RAR5_ENDARC_NEXTVOL = 0x01;

static const int RAR5_SIGNATURE_SIZE = 8;

bool RarVolume::Read()
{
	debug("Checking volume %s", *m_filename);

	m_version = DetectRarVersion((const char*)m_data, m_size);
	m_pos = 0;

	bool ok = false;

	switch (m_version)
	{
		case 3:
			ok = ReadRar3Volume();
			break;

		case 5:
			ok = ReadRar5Volume();
			break;
	}

	DecryptFree();

	LogDebugInfo();

	return ok;
}

int RarVolume::DetectRarVersion(const char* data, int64 size)
{
	static const char RAR3_SIGNATURE[] = { 0x52, 0x61, 0x72, 0x21, 0x1A, 0x07, 0x00 };
	static const char RAR5_SIGNATURE[] = { 0x52, 0x61, 0x72, 0x21, 0x1A, 0x07, 0x01, 0x00 };

	bool rar5 = size >= (int64)sizeof(RAR5_SIGNATURE) && !memcmp(RAR5_SIGNATURE, data, sizeof(RAR5_SIGNATURE));
	bool rar3 = !rar5 && size >= (int64)sizeof(RAR3_SIGNATURE) && !memcmp(RAR3_SIGNATURE, data, sizeof(RAR3_SIGNATURE));

	return rar3 ? 3 : rar5 ? 5 : 0;
}

bool RarVolume::RawRead(void* buffer, int64 size)
{
	if (size < 0 || m_pos + size > m_size) return false;
	memcpy(buffer, m_data + m_pos, (size_t)size);
	m_pos += size;
	return true;
}

bool RarVolume::Seek(int64 position)
{
	if (position < 0 || position > m_size) return false;
	m_pos = position;
	return true;
}

bool RarVolume::Read(RarBlock* block, void* buffer, int64 size)
{
	if (m_encrypted)
	{
		if (!DecryptRead(buffer, size)) return false;
	}
	else
	{
		if (!RawRead(buffer, size)) return false;
	}

	if (block)
	{
		block->trailsize -= size;
	}

	return true;
}

bool RarVolume::Read16(RarBlock* block, uint16* result)
{
	uint8 buf[2];
	if (!Read(block, buf, sizeof(buf))) return false;
	*result = ((uint16)buf[1] << 8) + buf[0];
	return true;
}

bool RarVolume::Read32(RarBlock* block, uint32* result)
{
	uint8 buf[4];
	if (!Read(block, buf, sizeof(buf))) return false;
	*result = ((uint32)buf[3] << 24) + ((uint32)buf[2] << 16) + ((uint32)buf[1] << 8) + buf[0];
	return true;
}

bool RarVolume::ReadV(RarBlock* block, uint64* result)
{
	*result = 0;
	uint8 val;
	uint8 bits = 0;
	do
	{
		if (!Read(block, &val, sizeof(val))) return false;
		if (bits > 63) return false; // malformed
		*result += (uint64)(val & 0x7f) << bits;
		bits += 7;
	} while (val & 0x80);

	return true;
}

bool RarVolume::Skip(RarBlock* block, int64 size)
{
	uint8 buf[256];
	while (size > 0)
	{
		int64 len = size <= (int64)sizeof(buf) ? size : (int64)sizeof(buf);
		if (!Read(block, buf, len)) return false;
		size -= len;
	}
	return true;
}

bool RarVolume::ReadRar3Volume()
{
	debug("Reading rar3-volume %s", *m_filename);

	while (m_pos < m_size)
	{
		RarBlock block = ReadRar3Block();
		if (!block.type)
		{
			return false;
		}

		if (block.type == RAR3_BLOCK_MAIN)
		{
			if (block.flags & RAR3_MAIN_PASSWORD)
			{
				m_encrypted = true;
				if (m_password.Empty()) return false;
			}
			m_newNaming = block.flags & RAR3_MAIN_NEWNUMBERING;
			m_multiVolume = block.flags & RAR3_MAIN_VOLUME;
		}

		else if (block.type == RAR3_BLOCK_FILE)
		{
			RarFile innerFile;
			if (!ReadRar3File(block, innerFile)) return false;
			m_files.push_back(std::move(innerFile));
		}

		else if (block.type == RAR3_BLOCK_ENDARC)
		{
			if (block.flags & RAR3_ENDARC_DATACRC)
			{
				if (!Skip(&block, 4)) return false;
			}
			if (block.flags & RAR3_ENDARC_VOLNUMBER)
			{
				if (!Read32(&block, &m_volumeNo)) return false;
			}
			m_hasNextVolume = (block.flags & RAR3_ENDARC_NEXTVOL) != 0;
			break;
		}

		else if (block.type < 0x72 || block.type > 0x7b)
		{
			// invalid block type
			return false;
		}

		uint64 skip = block.trailsize;
		if (m_encrypted)
		{
			skip -= 16 - m_decryptPos;
			m_decryptPos = 16;
			DecryptFree();
		}

		if (!Seek(m_pos + (int64)skip))
		{
			return false;
		}

		if (block.type == RAR3_BLOCK_FILE)
		{
			// file data ends where the block ends
			RarFile& innerFile = m_files.back();
			innerFile.m_dataOffset = m_pos - innerFile.m_packedSize;
		}
	}

	return true;
}

RarVolume::RarBlock RarVolume::ReadRar3Block()
{
	RarBlock block {0};
	uint8 salt[8];

	if (m_encrypted &&
		!(RawRead(salt, sizeof(salt)) && DecryptRar3Prepare(salt) && DecryptInit(128)))
	{
		return {0};
	}

	uint8 buf[7];

	if (!Read(nullptr, &buf, sizeof(buf))) return {0};
	block.crc = ((uint16)buf[1] << 8) + buf[0];
	block.type = buf[2];
	block.flags = ((uint16)buf[4] << 8) + buf[3];
	uint16 size = ((uint16)buf[6] << 8) + buf[5];

	uint32 blocksize = size;
	if (m_encrypted)
	{
		// Align to 16 bytes
		blocksize = (blocksize + ((~blocksize + 1) & (16 - 1)));
	}

	if (blocksize < sizeof(buf)) return {0};
	block.trailsize = blocksize - sizeof(buf);

	if (block.flags & RAR3_BLOCK_ADDSIZE)
	{
		uint8 addbuf[4];
		if (!Read(nullptr, &addbuf, sizeof(addbuf))) return {0};
		block.addsize = ((uint32)addbuf[3] << 24) + ((uint32)addbuf[2] << 16) + ((uint32)addbuf[1] << 8) + addbuf[0];

		if (blocksize < sizeof(buf) + 4) return {0};
		blocksize += (uint32)block.addsize;
		block.trailsize = (uint64)blocksize - sizeof(buf) - 4;
	}

	block.datasize = block.addsize;

#ifdef DEBUG
	static int num = 0;
	debug("%i) %u, %i, %i, %i, %" PRIu64 ", %" PRIu64, ++num, block.crc, block.type, block.flags, size, block.addsize, block.trailsize);
#endif

	return block;
}

bool RarVolume::ReadRar3File(RarBlock& block, RarFile& innerFile)
{
	innerFile.m_splitBefore = block.flags & RAR3_FILE_SPLITBEFORE;
	innerFile.m_splitAfter = block.flags & RAR3_FILE_SPLITAFTER;
	innerFile.m_packedSize = (int64)block.datasize;

	uint16 namelen;

	uint32 size;
	if (!Read32(&block, &size)) return false;
	innerFile.m_size = size;

	if (!Skip(&block, 1)) return false;
	if (!Skip(&block, 4)) return false;
	if (!Read32(&block, &innerFile.m_time)) return false;
	if (!Skip(&block, 1)) return false;

	uint8 method;
	if (!Read(&block, &method, sizeof(method))) return false;
	innerFile.m_method = method - RAR3_METHOD_STORE;

	if (!Read16(&block, &namelen)) return false;
	if (!Read32(&block, &innerFile.m_attr)) return false;

	if (block.flags & RAR3_FILE_ADDSIZE)
	{
		uint32 highsize;
		if (!Read32(&block, &highsize)) return false;
		block.trailsize += (uint64)highsize << 32;
		innerFile.m_packedSize += (int64)highsize << 32;

		if (!Read32(&block, &highsize)) return false;
		innerFile.m_size += (int64)highsize << 32;
	}

	if (namelen > 8192) return false; // an error
	CharBuffer name;
	name.Reserve(namelen + 1);
	if (!Read(&block, (char*)name, namelen)) return false;
	name[namelen] = '\0';
	innerFile.m_filename = name;
	debug("%i, %i, %s", (int)block.trailsize, (int)namelen, (const char*)name);

	return true;
}

bool RarVolume::ReadRar5Volume()
{
	debug("Reading rar5-volume %s", *m_filename);

	if (!Seek(RAR5_SIGNATURE_SIZE)) return false;

	while (m_pos < m_size)
	{
		RarBlock block = ReadRar5Block();
		if (!block.type)
		{
			return false;
		}

		if (block.type == RAR5_BLOCK_MAIN)
		{
			uint64 arcflags;
			if (!ReadV(&block, &arcflags)) return false;
			if (arcflags & RAR5_MAIN_VOLNR)
			{
				uint64 volnr;
				if (!ReadV(&block, &volnr)) return false;
				m_volumeNo = (uint32)volnr;
			}
			m_newNaming = true;
			m_multiVolume = (arcflags & RAR5_MAIN_ISVOL) != 0;
		}

		else if (block.type == RAR5_BLOCK_ENCRYPTION)
		{
			uint64 val;
			if (!ReadV(&block, &val)) return false;
			if (val != 0) return false; // supporting only AES
			if (!ReadV(&block, &val)) return false;
			uint8 kdfCount;
			uint8 salt[16];
			if (!Read(&block, &kdfCount, sizeof(kdfCount))) return false;
			if (!Read(&block, &salt, sizeof(salt))) return false;
			m_encrypted = true;
			if (m_password.Empty()) return false;
			if (!DecryptRar5Prepare(kdfCount, salt)) return false;
		}

		else if (block.type == RAR5_BLOCK_FILE)
		{
			RarFile innerFile;
			if (!ReadRar5File(block, innerFile)) return false;
			m_files.push_back(std::move(innerFile));
		}

		else if (block.type == RAR5_BLOCK_ENDARC)
		{
			uint64 endflags;
			if (!ReadV(&block, &endflags)) return false;
			m_hasNextVolume = (endflags & RAR5_ENDARC_NEXTVOL) != 0;
			break;
		}

		else if (block.type < 1 || block.type > 5)
		{
			// invalid block type
			return false;
		}

		uint64 skip = block.trailsize;
		if (m_encrypted)
		{
			skip -= 16 - m_decryptPos;
			if (m_decryptPos < 16)
			{
				skip += skip % 16 > 0 ? 16 - skip % 16 : 0;
				m_decryptPos = 16;
			}
			DecryptFree();
		}

		if (!Seek(m_pos + (int64)skip))
		{
			return false;
		}

		if (block.type == RAR5_BLOCK_FILE)
		{
			RarFile& innerFile = m_files.back();
			innerFile.m_dataOffset = m_pos - innerFile.m_packedSize;
		}
	}

	return true;
}

RarVolume::RarBlock RarVolume::ReadRar5Block()
{
	RarBlock block {0};
	uint64 buf = 0;

	if (m_encrypted &&
		!(RawRead(m_decryptIV, sizeof(m_decryptIV)) && DecryptInit(256)))
	{
		return {0};
	}

	if (!Read32(nullptr, &block.crc)) return {0};

	if (!ReadV(nullptr, &buf)) return {0};
	uint32 size = (uint32)buf;
	block.trailsize = size;

	if (!ReadV(&block, &buf)) return {0};
	block.type = (uint8)buf;

	if (!ReadV(&block, &buf)) return {0};
	block.flags = (uint16)buf;

	block.addsize = 0;
	if ((block.flags & RAR5_BLOCK_EXTRADATA) && !ReadV(&block, &block.addsize)) return {0};

	block.datasize = 0;
	if ((block.flags & RAR5_BLOCK_DATAAREA) && !ReadV(&block, &block.datasize)) return {0};
	block.trailsize += block.datasize;

#ifdef DEBUG
	static int num = 0;
	debug("%i) %u, %i, %i, %i, %" PRIu64 ", %" PRIu64, ++num, block.crc, block.type, block.flags, size, block.addsize, block.trailsize);
#endif

	return block;
}

bool RarVolume::ReadRar5File(RarBlock& block, RarFile& innerFile)
{
	innerFile.m_splitBefore = block.flags & RAR5_BLOCK_SPLITBEFORE;
	innerFile.m_splitAfter = block.flags & RAR5_BLOCK_SPLITAFTER;
	innerFile.m_packedSize = (int64)block.datasize;

	uint64 val;

	uint64 fileflags;
	if (!ReadV(&block, &fileflags)) return false;

	if (!ReadV(&block, &val)) return false;
	innerFile.m_size = (int64)val;

	if (!ReadV(&block, &val)) return false;
	innerFile.m_attr = (uint32)val;

	if (fileflags & RAR5_FILE_TIME && !Read32(&block, &innerFile.m_time)) return false;
	if (fileflags & RAR5_FILE_CRC && !Skip(&block, 4)) return false;

	// compression info, method in bits 7-9
	if (!ReadV(&block, &val)) return false;
	innerFile.m_method = (int)((val >> 7) & 0x07);

	if (!ReadV(&block, &val)) return false; // host os

	uint64 namelen;
	if (!ReadV(&block, &namelen)) return false;
	if (namelen > 8192) return false; // an error
	CharBuffer name;
	name.Reserve((uint32)namelen + 1);
	if (!Read(&block, (char*)name, namelen)) return false;
	name[namelen] = '\0';
	innerFile.m_filename = name;

	// reading extra headers to find file time
	if (block.flags & RAR5_BLOCK_EXTRADATA)
	{
		uint64 remsize = block.addsize;
		while (remsize > 0)
		{
			uint64 trailsize = block.trailsize;

			uint64 len;
			if (!ReadV(&block, &len)) return false;
			if (remsize < trailsize - block.trailsize + len) return false;
			remsize -= trailsize - block.trailsize + len;
			trailsize = block.trailsize;

			uint64 type;
			if (!ReadV(&block, &type)) return false;

			if (type == RAR5_FILE_EXTRATIME)
			{
				uint64 flags;
				if (!ReadV(&block, &flags)) return false;
				if (flags & RAR5_FILE_EXTRATIMEUNIXFORMAT)
				{
					if (!Read32(&block, &innerFile.m_time)) return false;
				}
				else
				{
					uint32 timelow, timehigh;
					if (!Read32(&block, &timelow)) return false;
					if (!Read32(&block, &timehigh)) return false;
					uint64 wintime = ((uint64)timehigh << 32) + timelow;
					innerFile.m_time = (uint32)(wintime / 10000000 - 11644473600LL);
				}
			}

			len -= trailsize - block.trailsize;

			if (!Skip(&block, len)) return false;
		}
	}

	debug("%" PRIu64 ", %" PRIu64 ", %s", block.trailsize, namelen, (const char*)name);

	return true;
}

void RarVolume::LogDebugInfo()
{
#ifdef DEBUG
	debug("Volume: version:%i, multi:%i, vol-no:%i, new-naming:%i, has-next:%i, encrypted:%i, file-count:%i, [%s]",
		(int)m_version, (int)m_multiVolume, m_volumeNo, (int)m_newNaming, (int)m_hasNextVolume,
		(int)m_encrypted, (int)m_files.size(), FileSystem::BaseFileName(m_filename));

	for (RarFile& file : m_files)
	{
		debug("  time:%i, size:%" PRIi64 ", packed:%" PRIi64 ", offset:%" PRIi64 ", method:%i, split-before:%i, split-after:%i, [%s]",
			file.m_time, file.m_size, file.m_packedSize, file.m_dataOffset, file.m_method,
			file.m_splitBefore, file.m_splitAfter, *file.m_filename);
	}
#endif
}

bool RarVolume::DecryptRar3Prepare(const uint8 salt[8])
{
	WString wstr(*m_password);
	int len = wstr.Length();
	if (len == 0) return false;

	// password as UTF-16LE followed by the salt
	CharBuffer seed(len * 2 + 8);
	for (int i = 0; i < len; i++)
	{
		wchar_t ch = wstr[i];
		seed[i * 2] = ch & 0xFF;
		seed[i * 2 + 1] = (ch & 0xFF00) >> 8;
	}
	memcpy(seed + len * 2, salt, 8);

#ifdef HAVE_OPENSSL
	std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> context(EVP_MD_CTX_new(), EVP_MD_CTX_free);
	std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ivContext(EVP_MD_CTX_new(), EVP_MD_CTX_free);
	if (!context || !ivContext || !EVP_DigestInit_ex(context.get(), EVP_sha1(), nullptr))
	{
		return false;
	}

	const int rounds = 0x40000;
	const int ivStep = rounds / 16;
	uint8 digest[20];

	for (int i = 0; i < rounds; i++)
	{
		uint8 counter[3] = { (uint8)i, (uint8)(i >> 8), (uint8)(i >> 16) };
		if (!EVP_DigestUpdate(context.get(), *seed, seed.Size()) ||
			!EVP_DigestUpdate(context.get(), counter, sizeof(counter)))
		{
			return false;
		}

		// every 16th of the rounds contributes one byte of the IV
		if (i % ivStep == 0)
		{
			if (!EVP_MD_CTX_copy_ex(ivContext.get(), context.get()) ||
				!EVP_DigestFinal_ex(ivContext.get(), digest, nullptr))
			{
				return false;
			}
			m_decryptIV[i / ivStep] = digest[sizeof(digest) - 1];
		}
	}

	if (!EVP_DigestFinal_ex(context.get(), digest, nullptr))
	{
		return false;
	}

	// key is the first four digest words in little endian
	for (int i = 0; i < 4; i++)
	{
		for (int j = 0; j < 4; j++)
		{
			m_decryptKey[i * 4 + j] = digest[i * 4 + 3 - j];
		}
	}

	debug("Prepared rar3 header key for %s", *m_filename);

	return true;
#else
	return false;
#endif
}

bool RarVolume::DecryptRar5Prepare(uint8 kdfCount, const uint8 salt[16])
{
	if (kdfCount > 24) return false;

	int iterations = 1 << kdfCount;

#ifdef HAVE_OPENSSL
	if (!PKCS5_PBKDF2_HMAC(m_password, m_password.Length(), salt, 16,
		iterations, EVP_sha256(), sizeof(m_decryptKey), m_decryptKey)) return false;

	debug("Prepared rar5 header key for %s (%i iterations)", *m_filename, iterations);

	return true;
#else
	return false;
#endif
}

bool RarVolume::DecryptInit(int keyLength)
{
#ifdef HAVE_OPENSSL
	DecryptFree();

	EVP_CIPHER_CTX* context = EVP_CIPHER_CTX_new();
	if (!context) return false;
	m_context = context;

	// headers are padded to whole blocks, every block is decrypted as it is read
	return EVP_DecryptInit_ex(context, keyLength == 128 ? EVP_aes_128_cbc() : EVP_aes_256_cbc(),
		nullptr, m_decryptKey, m_decryptIV) &&
		EVP_CIPHER_CTX_set_padding(context, 0);
#else
	return false;
#endif
}

bool RarVolume::DecryptBuf(const uint8 in[16], uint8 out[16])
{
#ifdef HAVE_OPENSSL
	int outlen = 0;
	if (!EVP_DecryptUpdate((EVP_CIPHER_CTX*)m_context, out, &outlen, in, 16)) return false;
	return outlen == 16;
#else
	return false;
#endif
}

void RarVolume::DecryptFree()
{
	if (m_context)
	{
#ifdef HAVE_OPENSSL
		EVP_CIPHER_CTX_free((EVP_CIPHER_CTX*)m_context);
#endif
		m_context = nullptr;
	}
}

bool RarVolume::DecryptRead(void* buffer, int64 size)
{
	while (size > 0)
	{
		if (m_decryptPos >= 16)
		{
			uint8 buf[16];
			if (!RawRead(&buf, sizeof(buf))) return false;
			m_decryptPos = 0;
			if (!DecryptBuf(buf, m_decryptBuf)) return false;
		}

		uint8 remainingBuf = 16 - m_decryptPos;
		uint8 len = size <= remainingBuf ? (uint8)size : remainingBuf;
		memcpy(buffer, m_decryptBuf + m_decryptPos, len);
		m_decryptPos += len;
		size -= len;
		buffer = (char*)buffer + len;
	}

	return true;
}
