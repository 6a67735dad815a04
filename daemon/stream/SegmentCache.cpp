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
#include "SegmentCache.h"
#include "Log.h"

bool SegmentCache::Insert(const char* id, CharBuffer&& data)
{
	CacheMap::iterator it = m_items.find(id);
	if (it != m_items.end())
	{
		Evict(it);
	}

	std::unique_ptr<CacheItem> item = std::make_unique<CacheItem>();
	item->data = std::move(data);
	m_cachedBytes += item->data.Size();
	m_lru.push_front(id);
	item->lru = m_lru.begin();
	m_items.emplace(id, std::move(item));

	Trim();

	return Contains(id);
}

CharBuffer* SegmentCache::Find(const char* id)
{
	CacheMap::iterator it = m_items.find(id);
	if (it == m_items.end())
	{
		return nullptr;
	}

	Touch(it->second.get());
	return &it->second->data;
}

void SegmentCache::Pin(const char* id)
{
	m_pins[id]++;
}

void SegmentCache::Unpin(const char* id)
{
	PinMap::iterator it = m_pins.find(id);
	if (it != m_pins.end() && --it->second <= 0)
	{
		m_pins.erase(it);
	}
}

bool SegmentCache::IsPinned(const char* id)
{
	return m_pins.find(id) != m_pins.end();
}

void SegmentCache::Trim()
{
	// walk from the least recently used end
	LruList::iterator lit = m_lru.end();
	while (m_cachedBytes > m_budget && lit != m_lru.begin())
	{
		--lit;
		if (IsPinned(lit->c_str()))
		{
			continue;
		}

		CacheMap::iterator it = m_items.find(*lit);
		LruList::iterator next = lit;
		++next;
		debug("Evicting segment %s from cache", lit->c_str());
		Evict(it);
		lit = next;
	}
}

void SegmentCache::Clear()
{
	m_items.clear();
	m_lru.clear();
	m_pins.clear();
	m_cachedBytes = 0;
}

void SegmentCache::Touch(CacheItem* item)
{
	m_lru.splice(m_lru.begin(), m_lru, item->lru);
}

void SegmentCache::Evict(CacheMap::iterator it)
{
	m_cachedBytes -= it->second->data.Size();
	m_lru.erase(it->second->lru);
	m_items.erase(it);
}
