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
#include "FileSystem.h"
#include "Container.h"

// Options

static const char* OPTION_CONFIGFILE			= "ConfigFile";
static const char* OPTION_VERSION				= "Version";
static const char* OPTION_LOGFILE				= "LogFile";
static const char* OPTION_WRITELOG				= "WriteLog";
static const char* OPTION_LOGBUFFER				= "LogBuffer";
static const char* OPTION_INFOTARGET			= "InfoTarget";
static const char* OPTION_WARNINGTARGET			= "WarningTarget";
static const char* OPTION_ERRORTARGET			= "ErrorTarget";
static const char* OPTION_DEBUGTARGET			= "DebugTarget";
static const char* OPTION_DETAILTARGET			= "DetailTarget";
static const char* OPTION_STREAMWORKERS			= "StreamWorkers";
static const char* OPTION_READAHEAD				= "ReadAhead";
static const char* OPTION_SEGMENTCACHE			= "SegmentCache";
static const char* OPTION_CRCCHECK				= "CrcCheck";
static const char* OPTION_ARTICLERETRIES		= "ArticleRetries";
static const char* OPTION_ARTICLEINTERVAL		= "ArticleInterval";
static const char* OPTION_ARTICLETIMEOUT		= "ArticleTimeout";
static const char* OPTION_SERVERRETRYINTERVAL	= "ServerRetryInterval";
static const char* OPTION_RARWORKERS			= "RarWorkers";
static const char* OPTION_RARMAXSEGMENTS		= "RarMaxSegments";
static const char* OPTION_RARPARTIALSUCCESS		= "RarPartialSuccess";
static const char* OPTION_RARPASSWORD			= "RarPassword";

const char* BoolNames[] = { "yes", "no", "true", "false", "1", "0", "on", "off", "enable", "disable", "enabled", "disabled" };
const int BoolValues[] = { 1, 0, 1, 0, 1, 0, 1, 0, 1, 0, 1, 0 };
const int BoolCount = 12;

const char* PossibleConfigLocations[] =
	{
		"/etc/nzbstream.conf",
		"/usr/etc/nzbstream.conf",
		"/usr/local/etc/nzbstream.conf",
		nullptr
	};

Options* g_Options = nullptr;

void Options::OptEntry::SetValue(const char* value)
{
	m_value = value;
	if (!m_defValue)
	{
		m_defValue = value;
	}
}

Options::OptEntry* Options::OptEntries::FindOption(const char* name)
{
	if (!name)
	{
		return nullptr;
	}

	for (OptEntry& optEntry : this)
	{
		if (!strcasecmp(optEntry.GetName(), name))
		{
			return &optEntry;
		}
	}

	return nullptr;
}


Options::Options(const char* configFilename, CmdOptList* commandLineOptions, Extender* extender)
{
	g_Options = this;
	m_extender = extender;
	m_configFilename = configFilename;

	SetOption(OPTION_CONFIGFILE, "");
	SetOption(OPTION_VERSION, Util::VersionRevision());

	InitDefaults();

	InitOptFile();
	if (m_fatalError)
	{
		return;
	}

	if (commandLineOptions)
	{
		InitCommandLineOptions(commandLineOptions);
	}

	InitOptions();
	CheckOptions();

	InitServers();
}

Options::~Options()
{
	g_Options = nullptr;
}

void Options::ConfigError(const char* msg, ...)
{
	char tmp2[1024];

	va_list ap;
	va_start(ap, msg);
	vsnprintf(tmp2, 1024, msg, ap);
	tmp2[1024-1] = '\0';
	va_end(ap);

	error("%s(%i): %s", m_configFilename ? FileSystem::BaseFileName(m_configFilename) : "<noconfig>", m_configLine, tmp2);

	m_configErrors = true;
}

void Options::ConfigWarn(const char* msg, ...)
{
	char tmp2[1024];

	va_list ap;
	va_start(ap, msg);
	vsnprintf(tmp2, 1024, msg, ap);
	tmp2[1024-1] = '\0';
	va_end(ap);

	warn("%s(%i): %s", m_configFilename ? FileSystem::BaseFileName(m_configFilename) : "<noconfig>", m_configLine, tmp2);
}

void Options::LocateOptionSrcPos(const char *optionName)
{
	OptEntry* optEntry = FindOption(optionName);
	if (optEntry)
	{
		m_configLine = optEntry->GetLineNo();
	}
	else
	{
		m_configLine = 0;
	}
}

void Options::InitDefaults()
{
	SetOption(OPTION_LOGFILE, "");
	SetOption(OPTION_WRITELOG, "none");
	SetOption(OPTION_LOGBUFFER, "1000");
	SetOption(OPTION_INFOTARGET, "screen");
	SetOption(OPTION_WARNINGTARGET, "screen");
	SetOption(OPTION_ERRORTARGET, "both");
	SetOption(OPTION_DEBUGTARGET, "none");
	SetOption(OPTION_DETAILTARGET, "screen");
	SetOption(OPTION_STREAMWORKERS, "15");
	SetOption(OPTION_READAHEAD, "0");
	SetOption(OPTION_SEGMENTCACHE, "64");
	SetOption(OPTION_CRCCHECK, "no");
	SetOption(OPTION_ARTICLERETRIES, "3");
	SetOption(OPTION_ARTICLEINTERVAL, "1000");
	SetOption(OPTION_ARTICLETIMEOUT, "60");
	SetOption(OPTION_SERVERRETRYINTERVAL, "10");
	SetOption(OPTION_RARWORKERS, "4");
	SetOption(OPTION_RARMAXSEGMENTS, "200");
	SetOption(OPTION_RARPARTIALSUCCESS, "yes");
	SetOption(OPTION_RARPASSWORD, "");
}

void Options::InitOptFile()
{
	if (!m_configFilename)
	{
		// search for config file in default locations, running without one is allowed
		int p = 0;
		while (const char* filename = PossibleConfigLocations[p++])
		{
			if (FileSystem::FileExists(filename))
			{
				m_configFilename = filename;
				break;
			}
		}
	}

	if (m_configFilename)
	{
		SetOption(OPTION_CONFIGFILE, m_configFilename);
		LoadConfigFile();
	}
}

void Options::InitOptions()
{
	m_logFile = GetOption(OPTION_LOGFILE);
	m_rarPassword = GetOption(OPTION_RARPASSWORD);

	m_logBuffer = ParseIntValue(OPTION_LOGBUFFER, 10);
	m_streamWorkers = ParseIntValue(OPTION_STREAMWORKERS, 10);
	m_readAhead = ParseIntValue(OPTION_READAHEAD, 10);
	m_segmentCache = ParseIntValue(OPTION_SEGMENTCACHE, 10);
	m_articleRetries = ParseIntValue(OPTION_ARTICLERETRIES, 10);
	m_articleInterval = ParseIntValue(OPTION_ARTICLEINTERVAL, 10);
	m_articleTimeout = ParseIntValue(OPTION_ARTICLETIMEOUT, 10);
	m_serverRetryInterval = ParseIntValue(OPTION_SERVERRETRYINTERVAL, 10);
	m_rarWorkers = ParseIntValue(OPTION_RARWORKERS, 10);
	m_rarMaxSegments = ParseIntValue(OPTION_RARMAXSEGMENTS, 10);

	m_crcCheck = (bool)ParseEnumValue(OPTION_CRCCHECK, BoolCount, BoolNames, BoolValues);
	m_rarPartialSuccess = (bool)ParseEnumValue(OPTION_RARPARTIALSUCCESS, BoolCount, BoolNames, BoolValues);

	const char* WriteLogNames[] = { "none", "append", "reset" };
	const int WriteLogValues[] = { wlNone, wlAppend, wlReset };
	const int WriteLogCount = 3;
	m_writeLog = (EWriteLog)ParseEnumValue(OPTION_WRITELOG, WriteLogCount, WriteLogNames, WriteLogValues);

	const char* TargetNames[] = { "screen", "log", "both", "none" };
	const int TargetValues[] = { mtScreen, mtLog, mtBoth, mtNone };
	const int TargetCount = 4;
	m_infoTarget = (EMessageTarget)ParseEnumValue(OPTION_INFOTARGET, TargetCount, TargetNames, TargetValues);
	m_warningTarget = (EMessageTarget)ParseEnumValue(OPTION_WARNINGTARGET, TargetCount, TargetNames, TargetValues);
	m_errorTarget = (EMessageTarget)ParseEnumValue(OPTION_ERRORTARGET, TargetCount, TargetNames, TargetValues);
	m_debugTarget = (EMessageTarget)ParseEnumValue(OPTION_DEBUGTARGET, TargetCount, TargetNames, TargetValues);
	m_detailTarget = (EMessageTarget)ParseEnumValue(OPTION_DETAILTARGET, TargetCount, TargetNames, TargetValues);
}

int Options::ParseEnumValue(const char* OptName, int argc, const char * argn[], const int argv[])
{
	OptEntry* optEntry = FindOption(OptName);
	if (!optEntry)
	{
		ConfigError("Undefined value for option \"%s\"", OptName);
		return argv[0];
	}

	int defNum = 0;

	for (int i = 0; i < argc; i++)
	{
		if (!strcasecmp(optEntry->GetValue(), argn[i]))
		{
			// normalizing option value in option list, for example "NO" -> "no"
			for (int j = 0; j < argc; j++)
			{
				if (argv[j] == argv[i])
				{
					if (strcmp(argn[j], optEntry->GetValue()))
					{
						optEntry->SetValue(argn[j]);
					}
					break;
				}
			}

			return argv[i];
		}

		if (!strcasecmp(optEntry->GetDefValue(), argn[i]))
		{
			defNum = i;
		}
	}

	m_configLine = optEntry->GetLineNo();
	ConfigError("Invalid value for option \"%s\": \"%s\"", OptName, optEntry->GetValue());
	optEntry->SetValue(argn[defNum]);
	return argv[defNum];
}

int Options::ParseIntValue(const char* OptName, int base)
{
	OptEntry* optEntry = FindOption(OptName);
	if (!optEntry)
	{
		ConfigError("Undefined value for option \"%s\"", OptName);
		return 0;
	}

	char *endptr;
	int val = strtol(optEntry->GetValue(), &endptr, base);

	if (endptr && *endptr != '\0')
	{
		m_configLine = optEntry->GetLineNo();
		ConfigError("Invalid value for option \"%s\": \"%s\"", OptName, optEntry->GetValue());
		optEntry->SetValue(optEntry->GetDefValue());
		val = strtol(optEntry->GetDefValue(), nullptr, base);
	}

	return val;
}

void Options::SetOption(const char* optname, const char* value)
{
	OptEntry* optEntry = FindOption(optname);
	if (!optEntry)
	{
		m_optEntries.emplace_back(optname, nullptr);
		optEntry = &m_optEntries.back();
	}

	CString curvalue = value;

	optEntry->SetLineNo(m_configLine);

	// expand variables
	while (const char* dollar = strstr(curvalue, "${"))
	{
		const char* end = strchr(dollar, '}');
		if (end)
		{
			int varlen = (int)(end - dollar - 2);
			BString<100> variable;
			variable.Set(dollar + 2, varlen);
			const char* varvalue = GetOption(variable);
			if (varvalue)
			{
				curvalue.Replace((int)(dollar - curvalue), 2 + varlen + 1, varvalue);
			}
			else
			{
				break;
			}
		}
		else
		{
			break;
		}
	}

	optEntry->SetValue(curvalue);
}

Options::OptEntry* Options::FindOption(const char* optname)
{
	OptEntry* optEntry = m_optEntries.FindOption(optname);

	// normalize option name in option list; for example "server1.spooldir" -> "Server1.SpoolDir"
	if (optEntry && strcmp(optEntry->GetName(), optname))
	{
		optEntry->SetName(optname);
	}

	return optEntry;
}

const char* Options::GetOption(const char* optname)
{
	OptEntry* optEntry = FindOption(optname);
	if (optEntry)
	{
		if (optEntry->GetLineNo() > 0)
		{
			m_configLine = optEntry->GetLineNo();
		}
		return optEntry->GetValue();
	}
	return nullptr;
}

void Options::InitServers()
{
	int n = 1;
	while (true)
	{
		const char* nactive = GetOption(BString<100>("Server%i.Active", n));
		bool active = true;
		if (nactive)
		{
			active = (bool)ParseEnumValue(BString<100>("Server%i.Active", n), BoolCount, BoolNames, BoolValues);
		}

		const char* nname = GetOption(BString<100>("Server%i.Name", n));
		const char* nlevel = GetOption(BString<100>("Server%i.Level", n));
		const char* ngroup = GetOption(BString<100>("Server%i.Group", n));
		const char* nspooldir = GetOption(BString<100>("Server%i.SpoolDir", n));

		const char* noptional = GetOption(BString<100>("Server%i.Optional", n));
		bool optional = false;
		if (noptional)
		{
			optional = (bool)ParseEnumValue(BString<100>("Server%i.Optional", n), BoolCount, BoolNames, BoolValues);
		}

		const char* nconnections = GetOption(BString<100>("Server%i.Connections", n));

		bool definition = nactive || nname || nlevel || ngroup || nspooldir || noptional || nconnections;
		bool completed = nspooldir && *nspooldir;

		if (!definition)
		{
			break;
		}

		if (completed)
		{
			if (m_extender)
			{
				m_extender->AddNewsServer(n, active, nname, nspooldir,
					nconnections ? atoi(nconnections) : 1,
					nlevel ? atoi(nlevel) : 0,
					ngroup ? atoi(ngroup) : 0,
					optional);
			}
		}
		else
		{
			ConfigError("Server definition not complete for \"Server%i\"", n);
		}

		n++;
	}
}

void Options::LoadConfigFile()
{
	DiskFile infile;

	if (!infile.Open(m_configFilename, DiskFile::omRead))
	{
		ConfigError("Could not open file %s", *m_configFilename);
		m_fatalError = true;
		return;
	}

	m_configLine = 0;
	int bufLen = (int)FileSystem::FileSize(m_configFilename) + 1;
	CharBuffer buf(bufLen);

	int line = 0;
	while (infile.ReadLine(buf, buf.Size() - 1))
	{
		m_configLine = ++line;

		if (buf[0] != 0 && buf[strlen(buf)-1] == '\n')
		{
			buf[strlen(buf)-1] = 0; // remove traling '\n'
		}
		if (buf[0] != 0 && buf[strlen(buf)-1] == '\r')
		{
			buf[strlen(buf)-1] = 0; // remove traling '\r' (for windows line endings)
		}

		if (buf[0] == 0 || buf[0] == '#' || strspn(buf, " ") == strlen(buf))
		{
			continue;
		}

		SetOptionString(buf);
	}

	infile.Close();

	m_configLine = 0;
}

void Options::InitCommandLineOptions(CmdOptList* commandLineOptions)
{
	for (const char* option : *commandLineOptions)
	{
		SetOptionString(option);
	}
}

bool Options::SetOptionString(const char* option)
{
	CString optname;
	CString optvalue;

	if (!SplitOptionString(option, optname, optvalue))
	{
		ConfigError("Invalid option \"%s\"", option);
		return false;
	}

	bool ok = ValidateOptionName(optname, optvalue);
	if (ok)
	{
		SetOption(optname, optvalue);
	}
	else
	{
		ConfigError("Invalid option \"%s\"", *optname);
	}

	return ok;
}

/*
 * Splits option string into name and value;
 * Returns true if the option string has name and value;
 */
bool Options::SplitOptionString(const char* option, CString& optName, CString& optValue)
{
	const char* eq = strchr(option, '=');
	if (!eq || eq == option)
	{
		return false;
	}

	optName.Set(option, (int)(eq - option));
	optValue.Set(eq + 1);

	return true;
}

bool Options::ValidateOptionName(const char* optname, const char* optvalue)
{
	if (!strcasecmp(optname, OPTION_CONFIGFILE) || !strcasecmp(optname, OPTION_VERSION))
	{
		// read-only options
		return false;
	}

	const char* v = GetOption(optname);
	if (v)
	{
		// it's predefined option, OK
		return true;
	}

	if (!strncasecmp(optname, "server", 6))
	{
		char* p = (char*)optname + 6;
		while (*p >= '0' && *p <= '9') p++;
		if (p &&
			(!strcasecmp(p, ".active") || !strcasecmp(p, ".name") ||
			!strcasecmp(p, ".level") || !strcasecmp(p, ".group") ||
			!strcasecmp(p, ".optional") || !strcasecmp(p, ".connections") ||
			!strcasecmp(p, ".spooldir")))
		{
			return true;
		}
	}

	return false;
}

void Options::CheckRange(int& value, const char* optName, int minValue, int maxValue)
{
	if (value < minValue || value > maxValue)
	{
		OptEntry* optEntry = FindOption(optName);
		LocateOptionSrcPos(optName);
		ConfigError("Invalid value for option \"%s\": \"%i\", allowed range %i..%i",
			optName, value, minValue, maxValue);
		optEntry->SetValue(optEntry->GetDefValue());
		value = atoi(optEntry->GetDefValue());
	}
}

void Options::CheckOptions()
{
	CheckRange(m_streamWorkers, OPTION_STREAMWORKERS, 1, 1000);
	CheckRange(m_readAhead, OPTION_READAHEAD, 0, 1000);
	CheckRange(m_segmentCache, OPTION_SEGMENTCACHE, 1, 65536);
	CheckRange(m_articleRetries, OPTION_ARTICLERETRIES, 0, 100);
	CheckRange(m_articleInterval, OPTION_ARTICLEINTERVAL, 0, 3600000);
	CheckRange(m_articleTimeout, OPTION_ARTICLETIMEOUT, 0, 86400);
	CheckRange(m_serverRetryInterval, OPTION_SERVERRETRYINTERVAL, 0, 86400);
	CheckRange(m_rarWorkers, OPTION_RARWORKERS, 1, 1000);
	CheckRange(m_rarMaxSegments, OPTION_RARMAXSEGMENTS, 1, 1000000);

	if (m_writeLog != wlNone && m_logFile.Empty())
	{
		LocateOptionSrcPos(OPTION_WRITELOG);
		ConfigWarn("Option \"%s\" has no effect without \"%s\"", OPTION_WRITELOG, OPTION_LOGFILE);
		m_writeLog = wlNone;
	}

	if (m_articleInterval == 0 && m_articleRetries > 1)
	{
		LocateOptionSrcPos(OPTION_ARTICLEINTERVAL);
		ConfigWarn("Option \"%s\" is 0, retries will follow each other without a pause", OPTION_ARTICLEINTERVAL);
	}
}
