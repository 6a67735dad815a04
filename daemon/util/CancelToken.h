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


#ifndef CANCELTOKEN_H
#define CANCELTOKEN_H

#include "Thread.h"

/*
 * Cancellation signal with optional deadline, passed down to every blocking operation.
 * A token linked to a parent is cancelled whenever the parent is; the parent must
 * outlive the token.
 */
class CancelToken
{
public:
	CancelToken(CancelToken* parent = nullptr) : m_parent(parent) {}
	CancelToken(const CancelToken&) = delete;
	void Cancel();

	/* Deadline relative to now, in milliseconds; 0 removes the deadline */
	void SetDeadline(int msec);

	/* Explicitly cancelled (directly or via a parent) */
	bool IsCancelled();

	/* Deadline of this token or of any parent has passed */
	bool IsExpired();

	bool IsDone() { return IsCancelled() || IsExpired(); }

	/* Sleeps up to "msec" milliseconds; returns false if the token became done while waiting */
	bool Wait(int msec);

private:
	CancelToken* m_parent;
	Mutex m_mutex;
	ConditionVar m_cancelCond;
	bool m_cancelled = false;
	int64 m_deadline = 0;
};

#endif
