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
#include "gravitationallens.h"
#include "log.h"
#include <algorithm>

using namespace std;

namespace halolens
{

GravitationalLens::GravitationalLens(const string &name)
{
	m_name = name;
	m_init = false;
}

GravitationalLens::~GravitationalLens()
{
}

bool GravitationalLens::init(const shared_ptr<const Cosmology> &pCosmology, const GravitationalLensParams &params)
{
	if (m_init)
	{
		setErrorString("Already initialized");
		return false;
	}

	if (!pCosmology.get())
	{
		setErrorString("No cosmology was specified");
		return false;
	}

	vector<string> keys;
	vector<string> names = getParameterNames();
	params.getDefaults().getAllKeys(keys);
	for (auto &k : keys)
	{
		if (find(names.begin(), names.end(), k) == names.end())
		{
			setErrorString("Default specified for unknown parameter '" + k + "'");
			return false;
		}
	}

	m_pParameters = params.createCopy();
	if (m_pParameters.get() == 0)
	{
		setErrorString("Can't create copy of the lens parameters");
		return false;
	}

	if (!processParameters(params))
	{
		m_pParameters = nullptr; // free this immediately
		return false;
	}

	m_pCosmology = pCosmology;
	m_init = true;

	LOG(Log::DBG, "Initialized lens '" + m_name + "' with " + to_string(keys.size()) + " default parameter(s)");
	return true;
}

bool GravitationalLens::checkInit() const
{
	if (!m_init)
	{
		setErrorString("Lens is not initialized");
		return false;
	}
	return true;
}

bool GravitationalLens::resolveParameters(const ParameterContext *pCtx, const vector<string> &names,
                                          vector<NDArrayd> &values) const
{
	errut::bool_t r = halolens::resolveParameters(pCtx, m_pParameters->getDefaults(), names, values);
	if (!r)
	{
		setErrorString("Lens '" + m_name + "': " + r.getErrorString());
		LOG(Log::WRN, getErrorString());
		return false;
	}
	return true;
}

bool GravitationalLens::getDeflectionAngle(const NDArrayd &x, const NDArrayd &y, const NDArrayd &z_s,
                                           NDArrayd &alphaX, NDArrayd &alphaY, const ParameterContext *pCtx) const
{
	if (!checkInit())
		return false;

	vector<NDArrayd> params;
	if (!resolveParameters(pCtx, { "z_l" }, params))
		return false;

	const NDArrayd &z_l = params[0];
	NDArrayd D_s, D_ls, ahx, ahy;
	errut::bool_t r;

	if (!(r = m_pCosmology->getAngularDiameterDistance(z_s, D_s)) ||
	    !(r = m_pCosmology->getAngularDiameterDistanceBetween(z_l, z_s, D_ls)))
	{
		setErrorString(r.getErrorString());
		return false;
	}

	if (!getReducedDeflectionAngle(x, y, z_s, ahx, ahy, pCtx))
		return false;

	auto scale = [](double ah, double Dls, double Ds) { return Dls/Ds*ah; };

	if (!(r = elementWise(alphaX, scale, ahx, D_ls, D_s)) ||
	    !(r = elementWise(alphaY, scale, ahy, D_ls, D_s)))
	{
		setErrorString(r.getErrorString());
		return false;
	}
	return true;
}

bool GravitationalLens::traceTheta(const NDArrayd &x, const NDArrayd &y, const NDArrayd &z_s,
                                   NDArrayd &betaX, NDArrayd &betaY, const ParameterContext *pCtx) const
{
	NDArrayd ax, ay;

	if (!getDeflectionAngle(x, y, z_s, ax, ay, pCtx))
		return false;

	auto diff = [](double theta, double alpha) { return theta - alpha; };
	errut::bool_t r;

	if (!(r = elementWise(betaX, diff, x, ax)) ||
	    !(r = elementWise(betaY, diff, y, ay)))
	{
		setErrorString(r.getErrorString());
		return false;
	}
	return true;
}

} // end namespace
