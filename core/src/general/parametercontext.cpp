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

#include "halolensconfig.h"
#include "parametercontext.h"
#include "utils.h"
#include <iostream>

using namespace std;

namespace halolens
{

ParameterContext::ParameterContext()
{
}

ParameterContext::ParameterContext(const ParameterContext &ctx)
{
	m_parameters = ctx.m_parameters;
}

ParameterContext::~ParameterContext()
{
}

const ParameterContext &ParameterContext::operator=(const ParameterContext &ctx)
{
	m_parameters = ctx.m_parameters;
	return *this; 
}

void ParameterContext::setParameter(const std::string &key, const NDArrayd &v)
{
	m_parameters[key] = ParamWithMarker(v);
}

bool ParameterContext::hasParameter(const std::string &key) const
{
	if (m_parameters.find(key) != m_parameters.end())
		return true;
	return false;
}

bool ParameterContext::getParameter(const std::string &key, NDArrayd &v) const
{
	auto it = m_parameters.find(key);
	if (it == m_parameters.end())
	{
		setErrorString("Specified key '" + key + "' was not found in the parameters");
		return false;
	}

	it->second.setMarker();
	v = it->second.getValue();
	return true;
}

const NDArrayd *ParameterContext::findParameter(const std::string &key) const
{
	auto it = m_parameters.find(key);
	if (it == m_parameters.end())
		return nullptr;
	return &(it->second.getValue());
}

void ParameterContext::clearRetrievalMarkers()
{
	for (auto &p : m_parameters)
		p.second.setMarker(false);
}

void ParameterContext::getUnretrievedKeys(std::vector<std::string> &keys) const
{
	keys.clear();
	for (auto &p : m_parameters)
	{
		if (!p.second.isMarkerSet())
			keys.push_back(p.first);
	}
}

void ParameterContext::getAllKeys(std::vector<std::string> &keys) const
{
	keys.clear();
	for (auto &p : m_parameters)
		keys.push_back(p.first);
}

void ParameterContext::dump() const
{
	for (auto &p : m_parameters)
	{
		const NDArrayd &v = p.second.getValue();

		cerr << p.first << " = shape " << NDArrayd::getShapeString(v.getShape()) << " [";
		for (auto x : v.getValues())
			cerr << double_to_string(x) << ",";
		cerr << "]" << endl;
	}
}

errut::bool_t resolveParameters(const ParameterContext *pOverrides, const ParameterContext &defaults,
                                const vector<string> &names, vector<NDArrayd> &values)
{
	values.resize(names.size());
	for (size_t i = 0 ; i < names.size() ; i++)
	{
		const string &name = names[i];

		if (pOverrides && pOverrides->hasParameter(name) && pOverrides->getParameter(name, values[i]))
			continue;

		const NDArrayd *pDefault = defaults.findParameter(name);
		if (pDefault)
		{
			values[i] = *pDefault;
			continue;
		}

		return "No value for parameter '" + name + "' was specified, neither in the parameter context nor as a default";
	}
	return true;
}

} // end namespace
