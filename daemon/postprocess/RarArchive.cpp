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
#include "RarArchive.h"
#include "Log.h"
#include "Util.h"
#include "Container.h"

bool RarArchive::Read(RarPartMap* parts, CString& errmsg)
{
	m_parts = parts;
	m_volumes.clear();
	m_entries.clear();
	m_missingVolumes = false;

	for (RarPartMap::value_type& part : *parts)
	{
		const char* filename = part.first.c_str();
		CharBuffer& data = part.second;

		if (!RarVolume::DetectRarVersion(data, data.Size()))
		{
			detail("Skipping %s: not a RAR volume", filename);
			continue;
		}

		std::unique_ptr<RarVolume> volume = std::make_unique<RarVolume>(filename, data, data.Size());
		volume->SetPassword(m_password);
		if (!volume->Read())
		{
			warn("Could not read RAR volume %s%s", filename,
				volume->GetEncrypted() && m_password.Empty() ? ": encrypted headers, password required" : "");
			continue;
		}

		m_volumes.push_back(std::move(volume));
	}

	if (m_volumes.empty())
	{
		errmsg = "no readable RAR volumes";
		return false;
	}

	SortVolumes();
	JoinEntries();

	if (m_volumes.back()->GetHasNextVolume())
	{
		m_missingVolumes = true;
	}

	debug("Archive has %i volumes and %i entries", (int)m_volumes.size(), (int)m_entries.size());

	return true;
}

/*
 * Volumes are ordered by volume number. Old style sets without numbers in
 * the headers fall back to the names: ".rar" first, then ".r00", ".r01" and so on.
 */
void RarArchive::SortVolumes()
{
	std::stable_sort(m_volumes.begin(), m_volumes.end(),
		[](const std::unique_ptr<RarVolume>& vol1, const std::unique_ptr<RarVolume>& vol2)
		{
			if (vol1->GetVolumeNo() != vol2->GetVolumeNo())
			{
				return vol1->GetVolumeNo() < vol2->GetVolumeNo();
			}
			bool rar1 = Util::EndsWith(vol1->GetFilename(), ".rar", false);
			bool rar2 = Util::EndsWith(vol2->GetFilename(), ".rar", false);
			if (rar1 != rar2)
			{
				return rar1;
			}
			return strcmp(vol1->GetFilename(), vol2->GetFilename()) < 0;
		});
}

void RarArchive::JoinEntries()
{
	uint32 prevVolumeNo = 0;
	bool first = true;

	for (std::unique_ptr<RarVolume>& volume : m_volumes)
	{
		uint32 volumeNo = volume->GetVolumeNo();
		if (!first && volumeNo > 0 && volumeNo != prevVolumeNo + 1)
		{
			detail("RAR volume before %s is missing", volume->GetFilename());
			m_missingVolumes = true;
		}

		for (RarFile& file : volume->GetFiles())
		{
			RarEntry* entry = FindEntry(file.GetFilename());
			bool continues = entry && entry->m_open && file.GetSplitBefore() &&
				(volumeNo == 0 || entry->m_lastVolumeNo + 1 == volumeNo);

			if (!continues)
			{
				if (entry && entry->m_open)
				{
					// chain interrupted by a missing volume
					entry->m_complete = false;
					entry->m_open = false;
				}

				m_entries.emplace_back(file.GetFilename(), file.GetSize(), file.GetMethod());
				entry = &m_entries.back();
				if (file.GetSplitBefore())
				{
					// head of the file is in a missing volume
					entry->m_complete = false;
				}
			}

			entry->m_chunks.push_back({volume->GetFilename(), file.GetDataOffset(), file.GetPackedSize()});
			entry->m_packedSize += file.GetPackedSize();
			entry->m_open = file.GetSplitAfter();
			entry->m_lastVolumeNo = volumeNo;
		}

		prevVolumeNo = volumeNo;
		first = false;
	}

	for (RarEntry& entry : m_entries)
	{
		if (entry.m_open)
		{
			entry.m_complete = false;
			entry.m_open = false;
		}
	}
}

RarEntry* RarArchive::FindEntry(const char* filename)
{
	// search from the end, the most recent entry of that name is the one being continued
	for (EntryList::reverse_iterator it = m_entries.rbegin(); it != m_entries.rend(); it++)
	{
		if (!strcmp(it->GetFilename(), filename))
		{
			return &*it;
		}
	}
	return nullptr;
}

bool RarArchive::Extract(RarEntry* entry, CharBuffer& data, CString& errmsg)
{
	if (!entry->GetComplete())
	{
		errmsg.Format("%s is incomplete, a volume is missing", entry->GetFilename());
		return false;
	}

	if (!entry->GetStored())
	{
		errmsg.Format("%s is compressed (method %i), only stored files can be extracted",
			entry->GetFilename(), entry->GetMethod());
		return false;
	}

	if (entry->GetPackedSize() != entry->GetSize() || entry->GetSize() > INT32_MAX)
	{
		errmsg.Format("%s has inconsistent size: %" PRIi64 " bytes stored for %" PRIi64 " bytes",
			entry->GetFilename(), entry->GetPackedSize(), entry->GetSize());
		return false;
	}

	data.Reserve((int)entry->GetSize());
	int64 pos = 0;

	for (RarEntry::Chunk& chunk : *entry->GetChunks())
	{
		RarPartMap::iterator part = m_parts->find(chunk.volume.Str());
		if (part == m_parts->end() || chunk.offset < 0 || chunk.offset + chunk.size > part->second.Size())
		{
			errmsg.Format("%s: data of volume %s is out of bounds", entry->GetFilename(), *chunk.volume);
			data.Clear();
			return false;
		}

		memcpy(data + pos, part->second + chunk.offset, (size_t)chunk.size);
		pos += chunk.size;
	}

	return true;
}
