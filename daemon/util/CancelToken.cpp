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
#include "CancelToken.h"
#include "Util.h"

static const int WAIT_SLICE_MSEC = 50;

void CancelToken::Cancel()
{
	Guard guard(m_mutex);
	m_cancelled = true;
	m_cancelCond.NotifyAll();
}

void CancelToken::SetDeadline(int msec)
{
	Guard guard(m_mutex);
	m_deadline = msec > 0 ? Util::CurrentTicks() + (int64)msec * 1000 : 0;
}

bool CancelToken::IsCancelled()
{
	{
		Guard guard(m_mutex);
		if (m_cancelled)
		{
			return true;
		}
	}
	return m_parent && m_parent->IsCancelled();
}

bool CancelToken::IsExpired()
{
	int64 deadline;
	{
		Guard guard(m_mutex);
		deadline = m_deadline;
	}
	if (deadline > 0 && Util::CurrentTicks() >= deadline)
	{
		return true;
	}
	return m_parent && m_parent->IsExpired();
}

bool CancelToken::Wait(int msec)
{
	int64 end = Util::CurrentTicks() + (int64)msec * 1000;

	while (!IsDone())
	{
		int64 remaining = (end - Util::CurrentTicks()) / 1000;
		if (remaining <= 0)
		{
			return true;
		}

		// parent cancellation does not signal our condition, therefore waiting in slices
		Guard guard(m_mutex);
		m_cancelCond.WaitFor(m_mutex, (int)std::min<int64>(remaining, WAIT_SLICE_MSEC),
			[&]{ return m_cancelled; });
	}

	return false;
}
