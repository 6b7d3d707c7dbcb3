/*

  This file is a part of HaloLens, a library to compute the gravitational
  lensing properties of dark matter halos.

  Copyright (C) 2008-2012 Jori Liesenborgs

  Contact: jori.liesenborgs@gmail.com
  
  This program is free software; you can redistribute it and/or modify
  it under the terms of the GNU General Public License as published by
  the Free Software Foundation; either version 2 of the License, or
  (at your option) any later version.
  
  This program is distributed in the hope that it will be useful,
  but WITHOUT ANY WARRANTY; without even the implied warranty of
  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
  GNU General Public License for more details.
  
  You should have received a copy of the GNU General Public License
  along with this program; if not, write to the Free Software
  Foundation, Inc., 51 Franklin St, Fifth Floor, Boston, MA  02110-1301  USA
  
*/

#include "log.h"
#include "utils.h"
#include <stdlib.h>
#include <time.h>
#include <stdio.h>
#include <iostream>
#include <sstream>

#ifdef HALOLENSCONFIG_SUPPORT_LOGGING
#include <unistd.h>
#include <libgen.h>
#include <string.h>

static int GetPID()
{
	return getpid();
}

static std::string GetBaseName(const std::string &s)
{
	char tmp[4096];
	strncpy(tmp, s.c_str(), 4095);
	tmp[4095] = 0;
	return std::string(basename(tmp));
}
#endif // HALOLENSCONFIG_SUPPORT_LOGGING

using namespace std;

namespace halolens
{

#ifdef HALOLENSCONFIG_SUPPORT_LOGGING

static string getDateTimeString()
{
	time_t t = time(0);
	struct tm *lt = localtime(&t);
	char str[1024];

	snprintf(str, sizeof(str), "[%02d:%02d:%02d %04d/%02d/%02d]", lt->tm_hour, lt->tm_min, lt->tm_sec, 
			                                        1900+lt->tm_year, lt->tm_mon+1, lt->tm_mday);
	return string(str);
}

static string getDateTimeStringForFileName()
{
	time_t t = time(0);
	struct tm *lt = localtime(&t);
	char str[1024];

	snprintf(str, sizeof(str), "%04d%02d%02d%02d%02d%02d", 1900+lt->tm_year, lt->tm_mon+1, lt->tm_mday, lt->tm_hour, lt->tm_min, lt->tm_sec);
	return string(str);
}

Log::Log()
{
	m_pStream = nullptr;
	m_outputLevel = NONE;
}

errut::bool_t Log::init(const string &execName)
{
	string logName;
	if (!getenv("HALOLENSLOG_LOGNAME", logName)) // not set, logging stays disabled
		return true;

	errut::bool_t r;

	if (logName == "stdout")
		openStdOut();
	else if (logName == "stderr")
		openStdErr();
	else
	{
		if (logName == "auto" or logName.length() == 0)
		{
			stringstream ss;

			ss << "/tmp/halolenslog_" << GetBaseName(execName) << "_" << getDateTimeStringForFileName() << "_" << GetPID() << ".log";
			logName = ss.str();
		}

		if (!(r = openFile(logName)))
			return r;
	}

	string level;
	if (getenv("HALOLENSLOG_LEVEL", level))
	{
		if (level == "err" || level == "error" || level == "ERR" || level == "ERROR")
			setLogLevel(ERR);
		else if (level == "wrn" || level == "warn" || level == "WRN" || level == "WARN")
			setLogLevel(WRN);
		else if (level == "inf" || level == "info" || level == "INF" || level == "INFO")
			setLogLevel(INF);
		else if (level == "dbg" || level == "debug" || level == "DBG" || level == "DEBUG")
			setLogLevel(DBG);
		else
		{
			m_pStream = nullptr;
			return "Unknown log level specified: '" + level + "'";
		}
	}
	else
	{
		setLogLevel(DBG);
		(*this)(DBG, "No log level specified, setting to DEBUG");
	}

	(*this)(DBG, "Using log: " + logName);
	return true;
}

Log::~Log()
{
}

errut::bool_t Log::openFile(const string &fileName)
{
	if (m_fileStream.is_open())
		m_fileStream.close();

	m_fileStream.open(fileName, std::fstream::out);
	if (!m_fileStream.is_open())
		return "Unable to open logfile '" + fileName + "'";

	m_pStream = &m_fileStream;
	return true;
}

void Log::openStdOut()
{
	if (m_fileStream.is_open())
		m_fileStream.close();

	m_pStream = &cout;
}

void Log::openStdErr()
{
	if (m_fileStream.is_open())
		m_fileStream.close();

	m_pStream = &cerr;
}

void Log::operator()(Level lvl, const string &s)
{
	if (!isEnabled(lvl))
		return;

	string lvlStr = "?????";
	if (lvl == DBG) lvlStr = "DEBUG";
	else if (lvl == INF) lvlStr = "INFO ";
	else if (lvl == WRN) lvlStr = "WARN ";
	else if (lvl == ERR) lvlStr = "ERROR";

	(*m_pStream) << getDateTimeString() << " " << lvlStr << ": " << s << endl;
	m_pStream->flush();
}

#endif // HALOLENSCONFIG_SUPPORT_LOGGING

Log LOG;

} // end namespace
