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


#ifndef SEGMENTCACHE_H
#define SEGMENTCACHE_H

#include "NString.h"

/*
 * Byte-bounded store of decoded segment payloads with least recently used eviction.
 * Pinned entries are never evicted. The class is not thread safe, the owner
 * serializes access.
 */
class SegmentCache
{
public:
	SegmentCache(int64 budget) : m_budget(budget) {}
	void SetBudget(int64 budget) { m_budget = budget; }
	int64 GetBudget() { return m_budget; }

	/* Stores the payload and evicts unpinned entries if over budget. Returns false if the
	 * payload itself had to be dropped. */
	bool Insert(const char* id, CharBuffer&& data);
	CharBuffer* Find(const char* id);
	bool Contains(const char* id) { return m_items.find(id) != m_items.end(); }
	void Pin(const char* id);
	void Unpin(const char* id);
	bool IsPinned(const char* id);
	void Trim();
	void Clear();
	int64 GetCachedBytes() { return m_cachedBytes; }
	int GetCount() { return (int)m_items.size(); }

private:
	typedef std::list<std::string> LruList;

	struct CacheItem
	{
		CharBuffer data;
		LruList::iterator lru;
	};

	typedef std::unordered_map<std::string, std::unique_ptr<CacheItem>> CacheMap;
	typedef std::unordered_map<std::string, int> PinMap;

	CacheMap m_items;
	LruList m_lru;
	PinMap m_pins;
	int64 m_budget;
	int64 m_cachedBytes = 0;

	void Touch(CacheItem* item);
	void Evict(CacheMap::iterator it);
};

#endif
