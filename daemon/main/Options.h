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


#ifndef OPTIONS_H
#define OPTIONS_H

#include "NString.h"
#include "Thread.h"
#include "Util.h"

class Options
{
public:
	enum EWriteLog
	{
		wlNone,
		wlAppend,
		wlReset
	};
	enum EMessageTarget
	{
		mtNone,
		mtScreen,
		mtLog,
		mtBoth
	};

	class OptEntry
	{
	public:
		OptEntry(const char* name, const char* value) :
			m_name(name), m_value(value) {}
		void SetName(const char* name) { m_name = name; }
		const char* GetName() { return m_name; }
		void SetValue(const char* value);
		const char* GetValue() { return m_value; }
		const char* GetDefValue() { return m_defValue; }
		int GetLineNo() { return m_lineNo; }

	private:
		CString m_name;
		CString m_value;
		CString m_defValue;
		int m_lineNo = 0;

		void SetLineNo(int lineNo) { m_lineNo = lineNo; }

		friend class Options;
	};

	typedef std::deque<OptEntry> OptEntriesBase;

	class OptEntries: public OptEntriesBase
	{
	public:
		OptEntry* FindOption(const char* name);
	};

	typedef GuardedPtr<OptEntries> GuardedOptEntries;
	typedef std::vector<const char*> CmdOptList;

	class Extender
	{
	public:
		virtual void AddNewsServer(int id, bool active, const char* name, const char* spoolDir,
			int maxConnections, int level, int group, bool optional) = 0;
	};

	Options(const char* configFilename, CmdOptList* commandLineOptions, Extender* extender);
	~Options();

	static bool SplitOptionString(const char* option, CString& optName, CString& optValue);
	bool GetFatalError() { return m_fatalError; }
	GuardedOptEntries GuardOptEntries() { return GuardedOptEntries(&m_optEntries, &m_optEntriesMutex); }

	// Options
	const char* GetConfigFilename() { return m_configFilename; }
	bool GetConfigErrors() { return m_configErrors; }
	const char* GetLogFile() { return m_logFile; }
	EWriteLog GetWriteLog() { return m_writeLog; }
	int GetLogBuffer() { return m_logBuffer; }
	EMessageTarget GetInfoTarget() const { return m_infoTarget; }
	EMessageTarget GetWarningTarget() const { return m_warningTarget; }
	EMessageTarget GetErrorTarget() const { return m_errorTarget; }
	EMessageTarget GetDebugTarget() const { return m_debugTarget; }
	EMessageTarget GetDetailTarget() const { return m_detailTarget; }
	int GetStreamWorkers() { return m_streamWorkers; }
	int GetReadAhead() { return m_readAhead; }
	int GetSegmentCache() { return m_segmentCache; }
	bool GetCrcCheck() { return m_crcCheck; }
	int GetArticleRetries() { return m_articleRetries; }
	int GetArticleInterval() { return m_articleInterval; }
	int GetArticleTimeout() { return m_articleTimeout; }
	int GetServerRetryInterval() { return m_serverRetryInterval; }
	int GetRarWorkers() { return m_rarWorkers; }
	int GetRarMaxSegments() { return m_rarMaxSegments; }
	bool GetRarPartialSuccess() { return m_rarPartialSuccess; }
	const char* GetRarPassword() { return m_rarPassword; }

private:
	OptEntries m_optEntries;
	Mutex m_optEntriesMutex;
	bool m_fatalError = false;
	Extender* m_extender;

	// Options
	bool m_configErrors = false;
	int m_configLine = 0;
	CString m_configFilename;
	CString m_logFile;
	EWriteLog m_writeLog = wlNone;
	int m_logBuffer = 0;
	EMessageTarget m_infoTarget = mtScreen;
	EMessageTarget m_warningTarget = mtScreen;
	EMessageTarget m_errorTarget = mtScreen;
	EMessageTarget m_debugTarget = mtNone;
	EMessageTarget m_detailTarget = mtScreen;
	int m_streamWorkers = 0;
	int m_readAhead = 0;
	int m_segmentCache = 0;
	bool m_crcCheck = false;
	int m_articleRetries = 0;
	int m_articleInterval = 0;
	int m_articleTimeout = 0;
	int m_serverRetryInterval = 0;
	int m_rarWorkers = 0;
	int m_rarMaxSegments = 0;
	bool m_rarPartialSuccess = true;
	CString m_rarPassword;

	void InitDefaults();
	void InitOptions();
	void InitOptFile();
	void InitServers();
	void InitCommandLineOptions(CmdOptList* commandLineOptions);
	void CheckOptions();
	void CheckRange(int& value, const char* optName, int minValue, int maxValue);
	int ParseEnumValue(const char* OptName, int argc, const char* argn[], const int argv[]);
	int ParseIntValue(const char* OptName, int base);
	OptEntry* FindOption(const char* optname);
	const char* GetOption(const char* optname);
	void SetOption(const char* optname, const char* value);
	bool SetOptionString(const char* option);
	bool ValidateOptionName(const char* optname, const char* optvalue);
	void LoadConfigFile();
	void ConfigError(const char* msg, ...) PRINTF_SYNTAX(2);
	void ConfigWarn(const char* msg, ...) PRINTF_SYNTAX(2);
	void LocateOptionSrcPos(const char *optionName);
};

extern Options* g_Options;

#endif
