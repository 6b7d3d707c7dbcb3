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

/**
 * \file gravitationallens.h
 */

#ifndef HALOLENS_GRAVITATIONALLENS_H

#define HALOLENS_GRAVITATIONALLENS_H

#include "halolensconfig.h"
#include "ndarray.h"
#include "parametercontext.h"
#include "cosmology.h"
#include <errut/errorbase.h>
#include <string>
#include <vector>
#include <memory>

namespace halolens
{

/** Base class for gravitational lens parameters.
 *  Stores the default values of the named lens parameters, which are used
 *  when the parameter context of a calculation does not override them.
 */
class HALOLENS_IMPORTEXPORT GravitationalLensParams : public errut::ErrorBase
{
public:
	GravitationalLensParams()											{ }
	virtual ~GravitationalLensParams()									{ }

	void setDefault(const std::string &key, const NDArrayd &value)		{ m_defaults.setParameter(key, value); }
	const ParameterContext &getDefaults() const							{ return m_defaults; }

	/** Creates a copy of the parameters. */
	virtual std::unique_ptr<GravitationalLensParams> createCopy() const = 0;
protected:
	void copyDefaultsFrom(const GravitationalLensParams &src)			{ m_defaults = src.m_defaults; }
private:
	ParameterContext m_defaults;
};

/** Base class for thin lenses at a single redshift.
 *  All calculations accept batched inputs (see NDArray), which are
 *  broadcast against each other and against the resolved lens parameters.
 *  Angles are expressed in arcsec. Named parameters are taken from the
 *  optional parameter context, falling back to the defaults that were
 *  specified in GravitationalLens::init. Every lens has at least the
 *  redshift parameter \c z_l.
 *
 *  A failing calculation stores its error message in the lens object.
 *  An initialized lens can therefore only be used by several threads at
 *  once as long as all calculations succeed; threads that need to report
 *  errors should each use their own lens instance, which can share the
 *  cosmology and parameters of the others.
 */
class HALOLENS_IMPORTEXPORT GravitationalLens : public errut::ErrorBase
{
protected:
	/** Meant to be used by a specific lens implementation. */
	GravitationalLens(const std::string &name);
public:
	virtual ~GravitationalLens();

	const std::string &getName() const										{ return m_name; }

	/** Initializes the lens, using \c pCosmology for all distance calculations. */
	bool init(const std::shared_ptr<const Cosmology> &pCosmology, const GravitationalLensParams &params);
	bool isInit() const														{ return m_init; }

	/** Returns the names of the parameters this lens can resolve. */
	virtual std::vector<std::string> getParameterNames() const = 0;

	const GravitationalLensParams *getLensParameters() const				{ return m_pParameters.get(); }
	const Cosmology *getCosmology() const									{ return m_pCosmology.get(); }

	/** Calculates the reduced deflection angle, which does not depend on the
	 *  source distance. The source redshift \c z_s is part of the signature
	 *  so that all observables can be called in the same way.
	 */
	virtual bool getReducedDeflectionAngle(const NDArrayd &x, const NDArrayd &y, const NDArrayd &z_s,
	                                       NDArrayd &alphaX, NDArrayd &alphaY, const ParameterContext *pCtx = nullptr) const = 0;

	/** Calculates the deflection angle, i.e. the reduced one scaled by D_ls/D_s. */
	bool getDeflectionAngle(const NDArrayd &x, const NDArrayd &y, const NDArrayd &z_s,
	                        NDArrayd &alphaX, NDArrayd &alphaY, const ParameterContext *pCtx = nullptr) const;

	/** Calculates the convergence (dimensionless surface mass density). */
	virtual bool getConvergence(const NDArrayd &x, const NDArrayd &y, const NDArrayd &z_s,
	                            NDArrayd &kappa, const ParameterContext *pCtx = nullptr) const = 0;

	/** Calculates the lensing potential (arcsec^2). */
	virtual bool getPotential(const NDArrayd &x, const NDArrayd &y, const NDArrayd &z_s,
	                          NDArrayd &psi, const ParameterContext *pCtx = nullptr) const = 0;

	/** Calculates the result of the lens equation, beta = theta - alpha(theta). */
	bool traceTheta(const NDArrayd &x, const NDArrayd &y, const NDArrayd &z_s,
	                NDArrayd &betaX, NDArrayd &betaY, const ParameterContext *pCtx = nullptr) const;
protected:
	/** Specific lens implementations implement this function to check and
	 *  process the parameters specified in the GravitationalLens::init function.
	 */
	virtual bool processParameters(const GravitationalLensParams &params) = 0;

	/** Resolves the parameters in \c names, the error string is set on failure. */
	bool resolveParameters(const ParameterContext *pCtx, const std::vector<std::string> &names,
	                       std::vector<NDArrayd> &values) const;
	bool checkInit() const;
private:
	std::string m_name;
	bool m_init;
	std::shared_ptr<const Cosmology> m_pCosmology;
	std::unique_ptr<GravitationalLensParams> m_pParameters;
};

} // end namespace

#endif // HALOLENS_GRAVITATIONALLENS_H
