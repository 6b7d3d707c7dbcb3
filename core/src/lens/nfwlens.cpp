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

#include "nfwlens.h"
#include "coordinates.h"

using namespace std;

namespace halolens
{

NFWLensParams::NFWLensParams(double softening)
{
	m_softening = softening;
}

NFWLensParams::NFWLensParams(const NDArrayd &z_l, const NDArrayd &x0, const NDArrayd &y0, const NDArrayd &m,
                             const NDArrayd &c, double softening)
{
	m_softening = softening;
	setDefault("z_l", z_l);
	setDefault("x0", x0);
	setDefault("y0", y0);
	setDefault("m", m);
	setDefault("c", c);
}

NFWLensParams::~NFWLensParams()
{
}

unique_ptr<GravitationalLensParams> NFWLensParams::createCopy() const
{
	NFWLensParams *pParams = new NFWLensParams(m_softening);
	pParams->copyDefaultsFrom(*this);
	return unique_ptr<GravitationalLensParams>(pParams);
}

NFWLens::NFWLens(const string &name) : GravitationalLens(name)
{
	m_softening = 0;
}

NFWLens::~NFWLens()
{
}

vector<string> NFWLens::getParameterNames() const
{
	return { "z_l", "x0", "y0", "m", "c" };
}

bool NFWLens::processParameters(const GravitationalLensParams &params)
{
	const NFWLensParams *pParams = dynamic_cast<const NFWLensParams *>(&params);
	if (!pParams)
	{
		setErrorString("Parameters are not of type 'NFWLensParams'");
		return false;
	}

	if (pParams->getSoftening() < 0)
	{
		setErrorString("The softening length must not be negative");
		return false;
	}

	m_softening = pParams->getSoftening();
	return true;
}

bool NFWLens::resolveHalo(const ParameterContext *pCtx, HaloInfo &halo) const
{
	if (!checkInit())
		return false;

	vector<NDArrayd> values;
	if (!resolveParameters(pCtx, getParameterNames(), values))
		return false;

	halo.z_l = values[0];
	halo.x0 = values[1];
	halo.y0 = values[2];
	halo.m = values[3];
	halo.c = values[4];

	errut::bool_t r;
	if (!(r = getCosmology()->getAngularDiameterDistance(halo.z_l, halo.D_l)) ||
	    !(r = getCosmology()->getCriticalDensity(halo.z_l, halo.rhoCrit)))
	{
		setErrorString(r.getErrorString());
		return false;
	}
	return true;
}

bool NFWLens::getScaleRadius(const NDArrayd &z_l, const NDArrayd &m, const NDArrayd &c, NDArrayd &r_s) const
{
	if (!checkInit())
		return false;

	NDArrayd rhoCrit;
	errut::bool_t r;

	if (!(r = getCosmology()->getCriticalDensity(z_l, rhoCrit)) ||
	    !(r = elementWise(r_s, [](double rho, double mv, double cv) { return calculateScaleRadius(rho, mv, cv); },
	                      rhoCrit, m, c)))
	{
		setErrorString(r.getErrorString());
		return false;
	}
	return true;
}

bool NFWLens::getScaleDensity(const NDArrayd &z_l, const NDArrayd &c, NDArrayd &rho_s) const
{
	if (!checkInit())
		return false;

	NDArrayd rhoCrit;
	errut::bool_t r;

	if (!(r = getCosmology()->getCriticalDensity(z_l, rhoCrit)) ||
	    !(r = elementWise(rho_s, [](double rho, double cv) { return calculateScaleDensity(rho, cv); }, rhoCrit, c)))
	{
		setErrorString(r.getErrorString());
		return false;
	}
	return true;
}

bool NFWLens::getDimensionlessSurfaceDensity(const NDArrayd &z_l, const NDArrayd &z_s, const NDArrayd &m,
                                             const NDArrayd &c, NDArrayd &kappa_s) const
{
	if (!checkInit())
		return false;

	NDArrayd rhoCrit, sigmaCrit;
	errut::bool_t r;

	if (!(r = getCosmology()->getCriticalDensity(z_l, rhoCrit)) ||
	    !(r = getCosmology()->getCriticalSurfaceDensity(z_l, z_s, sigmaCrit)) ||
	    !(r = elementWise(kappa_s, [](double rho, double sigma, double mv, double cv)
	                      {
	                          return calculateDimensionlessSurfaceDensity(rho, sigma, mv, cv);
	                      }, rhoCrit, sigmaCrit, m, c)))
	{
		setErrorString(r.getErrorString());
		return false;
	}
	return true;
}

bool NFWLens::getReducedDeflectionAngle(const NDArrayd &x, const NDArrayd &y, const NDArrayd &z_s,
                                        NDArrayd &alphaX, NDArrayd &alphaY, const ParameterContext *pCtx) const
{
	HaloInfo halo;
	if (!resolveHalo(pCtx, halo))
		return false;

	NDArrayd xl, yl, scale, ax, ay;
	const double s = m_softening;
	errut::bool_t r;

	// The source redshift does not enter the calculation, but it does take
	// part in the broadcast so that all observables have the same shape
	auto getScale = [s](double xv, double yv, double, double mv, double cv, double D_l, double rho)
	{
		return getReducedDeflectionScale(xv, yv, mv, cv, s, D_l, rho);
	};
	auto project = [](double scaleValue, double coord) { return scaleValue*coord; };

	if (!(r = translateRotate(x, y, halo.x0, halo.y0, xl, yl)) ||
	    !(r = elementWise(scale, getScale, xl, yl, z_s, halo.m, halo.c, halo.D_l, halo.rhoCrit)) ||
	    !(r = elementWise(ax, project, scale, xl)) ||
	    !(r = elementWise(ay, project, scale, yl)))
	{
		setErrorString(r.getErrorString());
		return false;
	}

	alphaX = move(ax);
	alphaY = move(ay);
	return true;
}

bool NFWLens::getConvergence(const NDArrayd &x, const NDArrayd &y, const NDArrayd &z_s,
                             NDArrayd &kappa, const ParameterContext *pCtx) const
{
	HaloInfo halo;
	if (!resolveHalo(pCtx, halo))
		return false;

	NDArrayd xl, yl, sigmaCrit;
	const double s = m_softening;
	errut::bool_t r;

	auto func = [s](double xv, double yv, double mv, double cv, double D_l, double rho, double sigma)
	{
		return calculateConvergence(xv, yv, mv, cv, s, D_l, rho, sigma);
	};

	if (!(r = getCosmology()->getCriticalSurfaceDensity(halo.z_l, z_s, sigmaCrit)) ||
	    !(r = translateRotate(x, y, halo.x0, halo.y0, xl, yl)) ||
	    !(r = elementWise(kappa, func, xl, yl, halo.m, halo.c, halo.D_l, halo.rhoCrit, sigmaCrit)))
	{
		setErrorString(r.getErrorString());
		return false;
	}
	return true;
}

bool NFWLens::getPotential(const NDArrayd &x, const NDArrayd &y, const NDArrayd &z_s,
                           NDArrayd &psi, const ParameterContext *pCtx) const
{
	HaloInfo halo;
	if (!resolveHalo(pCtx, halo))
		return false;

	NDArrayd xl, yl, sigmaCrit;
	const double s = m_softening;
	errut::bool_t r;

	auto func = [s](double xv, double yv, double mv, double cv, double D_l, double rho, double sigma)
	{
		return calculatePotential(xv, yv, mv, cv, s, D_l, rho, sigma);
	};

	if (!(r = getCosmology()->getCriticalSurfaceDensity(halo.z_l, z_s, sigmaCrit)) ||
	    !(r = translateRotate(x, y, halo.x0, halo.y0, xl, yl)) ||
	    !(r = elementWise(psi, func, xl, yl, halo.m, halo.c, halo.D_l, halo.rhoCrit, sigmaCrit)))
	{
		setErrorString(r.getErrorString());
		return false;
	}
	return true;
}

bool NFWLens::getProjectedMass(const NDArrayd &x, const NDArrayd &y, NDArrayd &mass, const ParameterContext *pCtx) const
{
	HaloInfo halo;
	if (!resolveHalo(pCtx, halo))
		return false;

	NDArrayd xl, yl;
	const double s = m_softening;
	errut::bool_t r;

	auto func = [s](double xv, double yv, double mv, double cv, double D_l, double rho)
	{
		return calculateProjectedMass(xv, yv, mv, cv, s, D_l, rho);
	};

	if (!(r = translateRotate(x, y, halo.x0, halo.y0, xl, yl)) ||
	    !(r = elementWise(mass, func, xl, yl, halo.m, halo.c, halo.D_l, halo.rhoCrit)))
	{
		setErrorString(r.getErrorString());
		return false;
	}
	return true;
}

} // end namespace
