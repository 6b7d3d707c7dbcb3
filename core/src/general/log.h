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

#ifndef HALOLENS_LOG_H

#define HALOLENS_LOG_H

#include "halolensconfig.h"
#include <errut/booltype.h>
#include <string>
#include <fstream>

namespace halolens
{

#ifdef HALOLENSCONFIG_SUPPORT_LOGGING
class HALOLENS_IMPORTEXPORT Log
{
public:
	enum Level { NONE = -1, ERR, WRN, INF, DBG };

	Log();
	~Log();

	/** Configures the log from the HALOLENSLOG_LOGNAME and HALOLENSLOG_LEVEL
	 *  environment variables; nothing is logged if the first one is not set. */
	errut::bool_t init(const std::string &execName);
	void operator()(Level lvl, const std::string &s);
	bool isEnabled(Level lvl) const								{ return m_pStream != nullptr && lvl <= m_outputLevel; }
private:
	errut::bool_t openFile(const std::string &fileName);
	void openStdOut();
	void openStdErr();
	void setLogLevel(Level lvl)									{ m_outputLevel = lvl; }

	std::ostream *m_pStream;
	std::fstream m_fileStream;
	Level m_outputLevel;
};
#else
class HALOLENS_IMPORTEXPORT Log
{
public:
	enum Level { NONE = -1, ERR, WRN, INF, DBG };

	Log() { }
	~Log() { }

	errut::bool_t init(const std::string &execName) { return true; }
	void operator()(Level lvl, const std::string &s) { }
	bool isEnabled(Level lvl) const { return false; }
};
#endif // HALOLENSCONFIG_SUPPORT_LOGGING

extern HALOLENS_IMPORTEXPORT Log LOG;

} // end namespace

#endif // HALOLENS_LOG_H
