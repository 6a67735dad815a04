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
#include "Options.h"
#include "Log.h"
#include "Util.h"
#include "FileSystem.h"

Log* g_Log = nullptr;

static const int DEFAULT_LOG_BUFFER = 1000;

Log::Log()
{
	g_Log = this;
}

Log::~Log()
{
	g_Log = nullptr;
}

void Log::LogDebugInfo()
{
	info("--------------------------------------------");
	info("Dumping debug info to log");
	info("--------------------------------------------");

	Guard guard(m_debugMutex);
	for (Debuggable* debuggable : m_debuggables)
	{
		debuggable->LogDebugInfo();
	}

	info("--------------------------------------------");
}

void Log::Filelog(const char* msg, ...)
{
	if (m_logFilename.Empty())
	{
		return;
	}

	char tmp2[1024];

	va_list ap;
	va_start(ap, msg);
	vsnprintf(tmp2, 1024, msg, ap);
	tmp2[1024-1] = '\0';
	va_end(ap);

	char time[50];
	Util::FormatTime(Util::CurrentTime(), time, 50);

	if (!m_logFile)
	{
		m_logFile = std::make_unique<DiskFile>();
		if (!m_logFile->Open(m_logFilename, DiskFile::omAppend))
		{
			perror(m_logFilename);
			m_logFile.reset();
			m_logFilename.Clear();
			return;
		}
	}

#ifdef DEBUG
	uint64 threadId = (uint64)pthread_self();
	m_logFile->Print("%s\t%" PRIu64 "\t%s%s", time, threadId, tmp2, LINE_ENDING);
#else
	m_logFile->Print("%s\t%s%s", time, tmp2, LINE_ENDING);
#endif

	m_logFile->Flush();
}

void Log::Dispatch(Message::EKind kind, int messageTarget, const char* text)
{
	const char* messageType[] = { "INFO", "WARNING", "ERROR", "DEBUG", "DETAIL"};

	if (messageTarget == Options::mtScreen || messageTarget == Options::mtBoth)
	{
		AddMessage(kind, text);
	}
	if (messageTarget == Options::mtLog || messageTarget == Options::mtBoth)
	{
		Filelog("%s\t%s", messageType[kind], text);
	}
}

#ifdef DEBUG
#undef debug
void debug(const char* filename, const char* funcname, int lineNr, const char* msg, ...)
{
	if (!g_Log)
	{
		return;
	}

	char tmp1[1024];

	va_list ap;
	va_start(ap, msg);
	vsnprintf(tmp1, 1024, msg, ap);
	tmp1[1024-1] = '\0';
	va_end(ap);

	BString<1024> tmp2("%s (%s:%i:%s)", tmp1, FileSystem::BaseFileName(filename), lineNr, funcname);

	Guard guard(g_Log->m_logMutex);
	g_Log->Dispatch(Message::mkDebug, g_Options ? g_Options->GetDebugTarget() : Options::mtNone, tmp2);
}
#endif

void error(const char* msg, ...)
{
	if (!g_Log)
	{
		return;
	}

	char tmp2[1024];

	va_list ap;
	va_start(ap, msg);
	vsnprintf(tmp2, 1024, msg, ap);
	tmp2[1024-1] = '\0';
	va_end(ap);

	Guard guard(g_Log->m_logMutex);
	g_Log->Dispatch(Message::mkError, g_Options ? g_Options->GetErrorTarget() : Options::mtBoth, tmp2);
}

void warn(const char* msg, ...)
{
	if (!g_Log)
	{
		return;
	}

	char tmp2[1024];

	va_list ap;
	va_start(ap, msg);
	vsnprintf(tmp2, 1024, msg, ap);
	tmp2[1024-1] = '\0';
	va_end(ap);

	Guard guard(g_Log->m_logMutex);
	g_Log->Dispatch(Message::mkWarning, g_Options ? g_Options->GetWarningTarget() : Options::mtScreen, tmp2);
}

void info(const char* msg, ...)
{
	if (!g_Log)
	{
		return;
	}

	char tmp2[1024];

	va_list ap;
	va_start(ap, msg);
	vsnprintf(tmp2, 1024, msg, ap);
	tmp2[1024-1] = '\0';
	va_end(ap);

	Guard guard(g_Log->m_logMutex);
	g_Log->Dispatch(Message::mkInfo, g_Options ? g_Options->GetInfoTarget() : Options::mtScreen, tmp2);
}

void detail(const char* msg, ...)
{
	if (!g_Log)
	{
		return;
	}

	char tmp2[1024];

	va_list ap;
	va_start(ap, msg);
	vsnprintf(tmp2, 1024, msg, ap);
	tmp2[1024-1] = '\0';
	va_end(ap);

	Guard guard(g_Log->m_logMutex);
	g_Log->Dispatch(Message::mkDetail, g_Options ? g_Options->GetDetailTarget() : Options::mtScreen, tmp2);
}


void Log::Clear()
{
	Guard guard(m_logMutex);
	m_messages.clear();
}

void Log::AddMessage(Message::EKind kind, const char * text)
{
	m_messages.emplace_back(++m_idGen, kind, Util::CurrentTime(), text);

	uint32 logBuffer = m_optInit && g_Options ? (uint32)g_Options->GetLogBuffer() : DEFAULT_LOG_BUFFER;
	while (m_messages.size() > logBuffer)
	{
		m_messages.pop_front();
	}

	if (m_consoleOutput)
	{
		PrintMessage(kind, text);
	}
}

void Log::PrintMessage(Message::EKind kind, const char* text)
{
	switch (kind)
	{
		case Message::mkDebug:
			fprintf(stderr, "[DEBUG] %s\n", text);
			break;
		case Message::mkError:
			fprintf(stderr, "[ERROR] %s\n", text);
			break;
		case Message::mkWarning:
			fprintf(stderr, "[WARNING] %s\n", text);
			break;
		case Message::mkInfo:
			fprintf(stderr, "[INFO] %s\n", text);
			break;
		case Message::mkDetail:
			fprintf(stderr, "[DETAIL] %s\n", text);
			break;
	}
}

void Log::ResetLog()
{
	FileSystem::DeleteFile(g_Options->GetLogFile());
}

/*
* During intializing stage (when options were not read yet) all messages
* are saved in screen log, even if they shouldn't (according to options).
* Method "InitOptions()" check all messages added to screen log during
* intializing stage and does three things:
* 1) save the messages to log-file (if they should according to options);
* 2) delete messages from screen log (if they should not be saved in screen log).
* 3) renumerate IDs
*/
void Log::InitOptions()
{
	const char* messageType[] = { "INFO", "WARNING", "ERROR", "DEBUG", "DETAIL"};

	Guard guard(m_logMutex);

	if (g_Options->GetWriteLog() != Options::wlNone && !Util::EmptyStr(g_Options->GetLogFile()))
	{
		m_logFilename = g_Options->GetLogFile();
		if (g_Options->GetWriteLog() == Options::wlReset)
		{
			ResetLog();
		}
	}

	m_idGen = 0;

	for (uint32 i = 0; i < m_messages.size(); )
	{
		Message& message = m_messages.at(i);
		Options::EMessageTarget target = Options::mtNone;
		switch (message.GetKind())
		{
			case Message::mkDebug:
				target = g_Options->GetDebugTarget();
				break;
			case Message::mkDetail:
				target = g_Options->GetDetailTarget();
				break;
			case Message::mkInfo:
				target = g_Options->GetInfoTarget();
				break;
			case Message::mkWarning:
				target = g_Options->GetWarningTarget();
				break;
			case Message::mkError:
				target = g_Options->GetErrorTarget();
				break;
		}

		if (target == Options::mtLog || target == Options::mtBoth)
		{
			Filelog("%s\t%s", messageType[message.GetKind()], message.GetText());
		}

		if (target == Options::mtLog || target == Options::mtNone)
		{
			m_messages.erase(m_messages.begin() + i);
		}
		else
		{
			message.m_id = ++m_idGen;
			i++;
		}
	}

	m_optInit = true;
}

void Log::RegisterDebuggable(Debuggable* debuggable)
{
	Guard guard(m_debugMutex);
	m_debuggables.push_back(debuggable);
}

void Log::UnregisterDebuggable(Debuggable* debuggable)
{
	Guard guard(m_debugMutex);
	m_debuggables.remove(debuggable);
}
