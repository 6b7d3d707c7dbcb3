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

#ifndef HALOLENS_PARAMETERCONTEXT_H

#define HALOLENS_PARAMETERCONTEXT_H

#include "halolensconfig.h"
#include "ndarray.h"
#include <errut/errorbase.h>
#include <errut/booltype.h>
#include <map>
#include <string>
#include <vector>

namespace halolens
{

/** Set of named, real valued (and possibly batched) lens parameters.
 *  The same class is used for the defaults that are stored in a lens,
 *  and for the per-call overrides that a caller can pass to it. Each
 *  parameter keeps a marker that is set when the value is retrieved, so
 *  that keys that no lens has used (e.g. because of a typo) can be detected.
 */
class HALOLENS_IMPORTEXPORT ParameterContext : public errut::ErrorBase
{
public:
	ParameterContext();
	ParameterContext(const ParameterContext &ctx);
	~ParameterContext();

	const ParameterContext &operator=(const ParameterContext &ctx);

	void dump() const;

	size_t getNumberOfParameters() const								{ return m_parameters.size(); }
	void getAllKeys(std::vector<std::string> &keys) const;

	void clearParameters()												{ m_parameters.clear(); }
	void setParameter(const std::string &key, const NDArrayd &v);
	void removeParameter(const std::string &key)						{ m_parameters.erase(key); }

	bool hasParameter(const std::string &key) const;
	bool getParameter(const std::string &key, NDArrayd &v) const;

	/** Returns the value for \c key (or null), without touching the retrieval marker. */
	const NDArrayd *findParameter(const std::string &key) const;

	void clearRetrievalMarkers();
	void getUnretrievedKeys(std::vector<std::string> &keys) const;
private:
	class ParamWithMarker
	{
	public:
		ParamWithMarker()												{ m_marker = false; }
		ParamWithMarker(const NDArrayd &v) : m_value(v)					{ m_marker = false; }

		const NDArrayd &getValue() const								{ return m_value; }
		bool isMarkerSet() const										{ return m_marker; }
		void setMarker(bool v = true) const								{ m_marker = v; }
	private:
		NDArrayd m_value;
		mutable bool m_marker;
	};

	std::map<std::string, ParamWithMarker> m_parameters;
};

/** Looks up each of the parameters in \c names, first in \c pOverrides (if
 *  not null), then in \c defaults. The values are stored in the same order
 *  in \c values; a parameter that is present in neither is an error.
 *  Only the override markers are set, so \c defaults can be shared.
 */
HALOLENS_IMPORTEXPORT errut::bool_t resolveParameters(const ParameterContext *pOverrides, const ParameterContext &defaults,
                                                      const std::vector<std::string> &names, std::vector<NDArrayd> &values);

} // end namespace

#endif // HALOLENS_PARAMETERCONTEXT_H
