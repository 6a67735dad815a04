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

#include <catch2/catch.hpp>

#include "Thread.h"
#include "Util.h"

class CountingThread : public Thread
{
public:
	CountingThread(int delay, Mutex* mutex, int* finished) :
		m_delay(delay), m_mutex(mutex), m_finished(finished) {}

protected:
	virtual void Run()
	{
		Util::Sleep(m_delay);
		Guard guard(m_mutex);
		(*m_finished)++;
	}

private:
	int m_delay;
	Mutex* m_mutex;
	int* m_finished;
};

TEST_CASE("Thread: wait for auto-destroying threads", "[Thread]")
{
	REQUIRE(Thread::WaitForOtherThreads(5000));

	Mutex mutex;
	int finished = 0;
	for (int i = 0; i < 4; i++)
	{
		CountingThread* thread = new CountingThread(20 + i * 10, &mutex, &finished);
		thread->SetAutoDestroy(true);
		thread->Start();
	}

	REQUIRE(Thread::WaitForOtherThreads(5000));
	REQUIRE(Thread::GetThreadCount() == 1);

	Guard guard(mutex);
	REQUIRE(finished == 4);
}

TEST_CASE("Thread: wait timeout", "[Thread]")
{
	REQUIRE(Thread::WaitForOtherThreads(5000));

	Mutex mutex;
	int finished = 0;
	CountingThread* thread = new CountingThread(300, &mutex, &finished);
	thread->SetAutoDestroy(true);
	thread->Start();

	REQUIRE_FALSE(Thread::WaitForOtherThreads(10));
	REQUIRE(Thread::WaitForOtherThreads(5000));

	Guard guard(mutex);
	REQUIRE(finished == 1);
}
