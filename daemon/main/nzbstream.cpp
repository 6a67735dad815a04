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
#include "Thread.h"
#include "Container.h"
#include "CancelToken.h"
#include "Segment.h"
#include "SegmentReader.h"
#include "RangePlanner.h"
#include "ServerPool.h"
#include "SpoolSession.h"
#include "ArticleFetcher.h"
#include "RarPartDownloader.h"
#include "RarArchive.h"

class NzbStream : public Options::Extender
{
public:
	int Run(int argc, char* argv[]);
	void Stop();

	virtual void AddNewsServer(int id, bool active, const char* name, const char* spoolDir,
		int maxConnections, int level, int group, bool optional);

private:
	enum ECommand
	{
		ecNone,
		ecRead,
		ecRar,
		ecExtract
	};

	std::unique_ptr<Log> m_log;
	std::unique_ptr<Options> m_options;
	std::unique_ptr<ServerPool> m_serverPool;
	std::unique_ptr<ArticleFetcher> m_fetcher;
	CancelToken m_cancel;
	const char* m_configFilename = nullptr;
	Options::CmdOptList m_optionList;
	ECommand m_command = ecNone;
	std::vector<const char*> m_args;

	bool ParseCommandLine(int argc, char* argv[]);
	void PrintUsage(const char* com);
	bool Init();
	int ProcessRead();
	int ProcessRar();
	int ReportError(const char* action, const StreamError& streamError, StreamError::EPhase phase);
	bool LoadParts(int first, ParsedFileList& parts);
	bool DownloadArchive(ParsedFileList& parts, RarPartMap& partMap, RarArchive& archive);
};

static const int SHUTDOWN_TIMEOUT_MSEC = 10000;

std::unique_ptr<NzbStream> g_NzbStream;

void SignalProc(int signum)
{
	switch (signum)
	{
		case SIGINT:
		case SIGTERM:
			signal(signum, SIG_DFL);   // Reset the signal handler
			if (g_NzbStream)
			{
				g_NzbStream->Stop();
			}
			break;
	}
}

/*
 * Main entry point
 */
int main(int argc, char *argv[])
{
	srand((unsigned int)Util::CurrentTime());

	signal(SIGINT, SignalProc);
	signal(SIGTERM, SignalProc);
	signal(SIGPIPE, SIG_IGN);

	g_NzbStream = std::make_unique<NzbStream>();
	int ret = g_NzbStream->Run(argc, argv);

	if (!Thread::WaitForOtherThreads(SHUTDOWN_TIMEOUT_MSEC))
	{
		warn("%i threads did not finish in time", Thread::GetThreadCount() - 1);
	}

	g_NzbStream.reset();

	return ret;
}

void NzbStream::PrintUsage(const char* com)
{
	printf("Usage:\n"
		"  %s [switches] read <listfile> [offset] [length] [outfile]\n"
		"  %s [switches] rar <listfile>...\n"
		"  %s [switches] extract <entry> <outfile> <listfile>...\n\n"
		"Switches:\n"
		"  -h, --help                Print this help screen\n"
		"  -v, --version             Print version and exit\n"
		"  -c, --configfile <file>   Filename of configuration file\n"
		"  -o, --option <name=value> Set or override option in configuration file\n\n"
		"Commands:\n"
		"  read      Print the byte range of a segmented file to <outfile> or to\n"
		"            standard output; offset and length accept size suffixes (K, M, G)\n"
		"  rar       Download all listed RAR volumes into memory and list their content\n"
		"  extract   Download all listed RAR volumes into memory and save a stored entry\n",
		FileSystem::BaseFileName(com), FileSystem::BaseFileName(com), FileSystem::BaseFileName(com));
}

bool NzbStream::ParseCommandLine(int argc, char* argv[])
{
	static struct option longOptions[] =
	{
		{"help", no_argument, 0, 'h'},
		{"version", no_argument, 0, 'v'},
		{"configfile", required_argument, 0, 'c'},
		{"option", required_argument, 0, 'o'},
		{0, 0, 0, 0}
	};

	optind = 1;
	int c;
	while ((c = getopt_long(argc, argv, "+hvc:o:", longOptions, nullptr)) != -1)
	{
		switch (c)
		{
			case 'c':
				m_configFilename = optarg;
				break;

			case 'o':
				m_optionList.push_back(optarg);
				break;

			case 'v':
				printf("nzbstream version: %s\n", Util::VersionRevision());
				exit(0);

			case 'h':
				PrintUsage(argv[0]);
				exit(0);

			default:
				PrintUsage(argv[0]);
				return false;
		}
	}

	if (optind >= argc)
	{
		PrintUsage(argv[0]);
		return false;
	}

	const char* command = argv[optind++];
	for (; optind < argc; optind++)
	{
		m_args.push_back(argv[optind]);
	}

	int minArgs = 0;
	if (!strcasecmp(command, "read"))
	{
		m_command = ecRead;
		minArgs = 1;
	}
	else if (!strcasecmp(command, "rar"))
	{
		m_command = ecRar;
		minArgs = 1;
	}
	else if (!strcasecmp(command, "extract"))
	{
		m_command = ecExtract;
		minArgs = 3;
	}
	else
	{
		printf("Unknown command: %s\n", command);
		return false;
	}

	if ((int)m_args.size() < minArgs || (m_command == ecRead && m_args.size() > 4))
	{
		PrintUsage(argv[0]);
		return false;
	}

	return true;
}

int NzbStream::Run(int argc, char* argv[])
{
	m_log = std::make_unique<Log>();
	m_log->SetConsoleOutput(true);

	if (!ParseCommandLine(argc, argv))
	{
		return 1;
	}

	Thread::Init();

	if (!Init())
	{
		return 1;
	}

	int ret = 1;
	switch (m_command)
	{
		case ecRead:
			ret = ProcessRead();
			break;

		case ecRar:
		case ecExtract:
			ret = ProcessRar();
			break;

		case ecNone:
			break;
	}

	m_fetcher.reset();
	m_serverPool.reset();
	m_options.reset();

	return ret;
}

bool NzbStream::Init()
{
	m_serverPool = std::make_unique<ServerPool>();

	m_options = std::make_unique<Options>(m_configFilename, &m_optionList, this);
	if (m_options->GetFatalError())
	{
		return false;
	}

	m_log->InitOptions();

	debug("nzbstream %s", Util::VersionRevision());

	m_serverPool->SetRetryInterval(m_options->GetServerRetryInterval());
	m_serverPool->InitSessions([](NewsServer* newsServer)
		{
			return std::unique_ptr<NewsSession>(new SpoolSession(newsServer));
		});

	if (m_serverPool->GetLevelCount() == 0)
	{
		error("No news servers defined, check options \"ServerX.SpoolDir\"");
		return false;
	}

	m_fetcher = std::make_unique<ArticleFetcher>(m_serverPool.get());
	m_fetcher->SetRetries(m_options->GetArticleRetries());
	m_fetcher->SetRetryInterval(m_options->GetArticleInterval());
	m_fetcher->SetTimeout(m_options->GetArticleTimeout());

	return true;
}

void NzbStream::Stop()
{
	m_cancel.Cancel();
}

void NzbStream::AddNewsServer(int id, bool active, const char* name, const char* spoolDir,
	int maxConnections, int level, int group, bool optional)
{
	m_serverPool->AddServer(std::make_unique<NewsServer>(id, active, name, spoolDir,
		maxConnections, level, group, optional));
}

int NzbStream::ReportError(const char* action, const StreamError& streamError, StreamError::EPhase phase)
{
	int httpStatus = streamError.HttpStatus(phase);
	if (httpStatus > 0)
	{
		error("%s failed: %s (HTTP %i)", action, streamError.GetMessage(), httpStatus);
	}
	else
	{
		error("%s failed: %s", action, streamError.GetMessage());
	}
	return 1;
}

int NzbStream::ProcessRead()
{
	const char* listFilename = m_args[0];

	CString errmsg;
	std::unique_ptr<ParsedFile> parsedFile = ParsedFile::Load(listFilename, errmsg);
	if (!parsedFile)
	{
		error("Could not load segment list: %s", *errmsg);
		return 1;
	}

	if (!parsedFile->GetIndex()->Validate(errmsg))
	{
		StreamError streamError = StreamError::CorruptedFile(parsedFile->GetSize());
		streamError.SetMessage(errmsg);
		return ReportError(parsedFile->GetFilename(), streamError, StreamError::epOpen);
	}

	int64 offset = 0;
	if (m_args.size() > 1)
	{
		offset = Util::ParseSize(m_args[1]);
		if (offset < 0)
		{
			error("Invalid offset \"%s\"", m_args[1]);
			return 1;
		}
	}

	int64 length = -1;
	if (m_args.size() > 2)
	{
		length = Util::ParseSize(m_args[2]);
		if (length < 0)
		{
			error("Invalid length \"%s\"", m_args[2]);
			return 1;
		}
	}

	int64 end = 0;
	StreamError rangeError;
	if (!RangePlanner::Resolve(parsedFile->GetSize(), offset, length, end, rangeError))
	{
		return ReportError(parsedFile->GetFilename(), rangeError, StreamError::epOpen);
	}
	length = end - offset;

	DiskFile outfile;
	if (m_args.size() > 3 && !outfile.Open(m_args[3], DiskFile::omWrite))
	{
		error("Could not create file %s: %s", m_args[3], *FileSystem::GetLastErrorMessage());
		return 1;
	}

	SegmentReader reader(parsedFile->GetIndex(), m_fetcher.get(), &m_cancel);
	reader.SetMaxWorkers(m_options->GetStreamWorkers());
	reader.SetReadAhead(m_options->GetReadAhead());
	reader.SetCacheBudget((int64)m_options->GetSegmentCache() * 1024 * 1024);
	reader.SetCrcCheck(m_options->GetCrcCheck());

	info("Reading %s from %s, %s at offset %" PRIi64, parsedFile->GetFilename(),
		FileSystem::BaseFileName(listFilename), *Util::FormatSize(length), offset);

	const int bufSize = 1024 * 1024;
	CharBuffer buffer(bufSize);
	int64 written = 0;
	int ret = 0;

	while (written < length)
	{
		StreamError streamError;
		int len = (int)std::min((int64)bufSize, length - written);
		int bytes = reader.ReadAt(buffer, len, offset + written, streamError);

		if (bytes > 0)
		{
			bool ok = outfile.Active() ? outfile.Write(buffer, bytes) == bytes :
				fwrite(buffer, 1, bytes, stdout) == (size_t)bytes;
			if (!ok)
			{
				error("Could not write output: %s", *FileSystem::GetLastErrorMessage());
				ret = 1;
				break;
			}
			written += bytes;
		}

		if (streamError.GetKind() == StreamError::ekEndOfStream)
		{
			break;
		}

		if (!streamError.Ok())
		{
			ret = ReportError(parsedFile->GetFilename(), streamError,
				written > 0 ? StreamError::epRead : StreamError::epOpen);
			break;
		}
	}

	reader.Close();

	if (outfile.Active() && !outfile.Close())
	{
		error("Could not close file %s: %s", m_args[3], *FileSystem::GetLastErrorMessage());
		ret = 1;
	}
	fflush(stdout);

	if (ret == 0)
	{
		info("Read %" PRIi64 " bytes of %s, %i segment fetches", written, parsedFile->GetFilename(),
			reader.GetFetchCount());
	}

	return ret;
}

bool NzbStream::LoadParts(int first, ParsedFileList& parts)
{
	for (int i = first; i < (int)m_args.size(); i++)
	{
		CString errmsg;
		std::unique_ptr<ParsedFile> parsedFile = ParsedFile::Load(m_args[i], errmsg);
		if (!parsedFile)
		{
			error("Could not load segment list: %s", *errmsg);
			return false;
		}
		parts.push_back(std::move(parsedFile));
	}
	return true;
}

bool NzbStream::DownloadArchive(ParsedFileList& parts, RarPartMap& partMap, RarArchive& archive)
{
	RarPartDownloader downloader(m_fetcher.get(), m_options->GetRarWorkers());
	downloader.SetMaxSegments(m_options->GetRarMaxSegments());
	downloader.SetPartialSuccess(m_options->GetRarPartialSuccess());
	downloader.SetStreamWorkers(m_options->GetStreamWorkers());
	downloader.SetCacheBudget((int64)m_options->GetSegmentCache() * 1024 * 1024);
	downloader.SetCrcCheck(m_options->GetCrcCheck());

	StreamError streamError;
	if (!downloader.DownloadPartsToMemory(&m_cancel, &parts, partMap, streamError))
	{
		ReportError("RAR import", streamError, StreamError::epOpen);
		return false;
	}

	CString errmsg;
	archive.SetPassword(m_options->GetRarPassword());
	if (!archive.Read(&partMap, errmsg))
	{
		error("Could not read RAR archive: %s", *errmsg);
		return false;
	}

	if (archive.GetMissingVolumes())
	{
		warn("RAR set is incomplete, some volumes are missing");
	}

	return true;
}

int NzbStream::ProcessRar()
{
	int first = m_command == ecExtract ? 2 : 0;

	ParsedFileList parts;
	if (!LoadParts(first, parts))
	{
		return 1;
	}

	RarPartMap partMap;
	RarArchive archive;
	if (!DownloadArchive(parts, partMap, archive))
	{
		return 1;
	}

	if (m_command == ecRar)
	{
		printf("%-40s %14s %14s  %s\n", "Name", "Size", "Packed", "Status");
		for (RarEntry& entry : archive.GetEntries())
		{
			printf("%-40s %14" PRIi64 " %14" PRIi64 "  %s%s\n", entry.GetFilename(), entry.GetSize(),
				entry.GetPackedSize(), entry.GetStored() ? "stored" : "compressed",
				entry.GetComplete() ? "" : ", incomplete");
		}
		return 0;
	}

	RarEntry* entry = archive.FindEntry(m_args[0]);
	if (!entry)
	{
		error("Entry %s not found in RAR archive", m_args[0]);
		return 1;
	}

	CharBuffer data;
	CString errmsg;
	if (!archive.Extract(entry, data, errmsg))
	{
		error("Could not extract %s: %s", entry->GetFilename(), *errmsg);
		return 1;
	}

	if (!FileSystem::SaveBufferIntoFile(m_args[1], data, data.Size()))
	{
		error("Could not write file %s: %s", m_args[1], *FileSystem::GetLastErrorMessage());
		return 1;
	}

	info("Extracted %s (%s) to %s", entry->GetFilename(), *Util::FormatSize(data.Size()), m_args[1]);

	return 0;
}
