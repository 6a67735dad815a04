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
#include "Log.h"
#include "Thread.h"

int Thread::m_threadCount = 1; // take the main program thread into account
std::unique_ptr<Mutex> Thread::m_threadMutex;
ConditionVar Thread::m_threadCond;


void Thread::Init()
{
	debug("Initializing global thread data");

	if (!m_threadMutex)
	{
		m_threadMutex = std::make_unique<Mutex>();
	}
}

Thread::Thread()
{
	debug("Creating Thread");
}

Thread::~Thread()
{
	debug("Destroying Thread");
}

void Thread::Start()
{
	debug("Starting Thread");

	m_running = true;

	// NOTE: "m_threadMutex" ensures that "t" lives until the very end of the function
	Guard guard(m_threadMutex);

	std::thread t([&]{
		{
			// waits until function "Start()" is completed and "t" is detached
			Guard guard(m_threadMutex);
		}

		thread_handler();
	});

	t.detach();
}

void Thread::Stop()
{
	debug("Stopping Thread");

	m_stopped = true;
}

void Thread::thread_handler()
{
	{
		Guard guard(m_threadMutex);
		m_threadCount++;
	}

	debug("Entering Thread-func");

	Run();

	debug("Thread-func exited");

	// a non auto-destroying object may be deleted by its owner once it is not running
	bool autoDestroy = m_autoDestroy;
	m_running = false;

	if (autoDestroy)
	{
		debug("Autodestroying Thread-object");
		delete this;
	}

	// the object may be gone, only static data from here on
	Guard guard(m_threadMutex);
	m_threadCount--;
	m_threadCond.NotifyAll();
}

int Thread::GetThreadCount()
{
	Guard guard(m_threadMutex);
	return m_threadCount;
}

bool Thread::WaitForOtherThreads(int timeoutMsec)
{
	if (!m_threadMutex)
	{
		return true;
	}

	Guard guard(m_threadMutex);
	return m_threadCond.WaitFor(*m_threadMutex, timeoutMsec, [&]{ return m_threadCount <= 1; });
}
