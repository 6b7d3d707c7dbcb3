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

#ifndef HALOLENS_NFWLENS_H

#define HALOLENS_NFWLENS_H

#include "halolensconfig.h"
#include "gravitationallens.h"
#include "mathfunctions.h"
#include "constants.h"

namespace halolens
{

/** Parameters for the NFWLens.
 *  The softening length (arcsec) is fixed for a lens instance; the named
 *  parameters \c z_l, \c x0, \c y0 (arcsec), \c m (solar masses) and \c c
 *  (concentration) can be given defaults here and be overridden per call.
 */
class HALOLENS_IMPORTEXPORT NFWLensParams : public GravitationalLensParams
{
public:
	NFWLensParams(double softening = 0);
	NFWLensParams(const NDArrayd &z_l, const NDArrayd &x0, const NDArrayd &y0, const NDArrayd &m,
	              const NDArrayd &c, double softening = 0);
	~NFWLensParams();

	std::unique_ptr<GravitationalLensParams> createCopy() const override;

	double getSoftening() const										{ return m_softening; }
private:
	double m_softening;
};

/** Lensing by a spherically symmetric Navarro-Frenk-White profile (NFW).
 *  The halo is described by its mass \f$m\f$ within the radius
 *  \f$r_\Delta\f$ where the mean density is \f$\Delta = 200\f$ times the
 *  critical density, and by its concentration \f$c = r_\Delta/r_s\f$:
 *
 *  \f[ r_s = \frac{1}{c}\left(\frac{3 m}{4 \pi \Delta \rho_{crit}(z_l)}\right)^{1/3} \f]
 *  \f[ \rho_s = \frac{\Delta}{3} \rho_{crit}(z_l) \frac{c^3}{\ln(1+c) - c/(1+c)} \f]
 *  \f[ \kappa_s = \frac{\rho_s r_s}{\Sigma_{crit}} \f]
 *
 *  With \f$\xi = D_l \theta\f$ and \f$x = \xi/r_s\f$:
 *
 *  \f[ \kappa(x) = 2 \kappa_s \frac{f(x)}{x^2-1} \f]
 *  \f[ \hat{\alpha}(x) = \frac{16 \pi G \rho_s r_s^3}{c^2 \xi} h(x) \f]
 *  \f[ \psi(x) = 2 \kappa_s \frac{r_s^2}{D_l^2} g(x) \f]
 *
 *  The functions f, g and h (and the ratio \f$k(x) = f(x)/(x^2-1)\f$) are
 *  defined piecewise, with a removable singularity at \f$x = 1\f$. For every
 *  input all three branches are evaluated, each one on an argument that is
 *  moved into its own domain when it belongs to another branch, and the
 *  correct result is selected afterwards. For
 *  \f$|x - 1| <\f$ NFW_KERNEL_EXPANSION_RANGE the closed forms lose their
 *  precision, and the second order expansion around \f$x = 1\f$ is used
 *  instead. At \f$x = 1\f$ this gives the exact limit, and derivatives
 *  (see DualNumber) are correct as well.
 *
 *  \b References
 *  \li <A href="http://adsabs.harvard.edu/abs/2000ApJ...534...34W">Wright, C., Brainerd, T., Gravitational Lensing by NFW Halos, The Astrophysical Journal, Volume 534, Issue 1, pp. 34-40, May 2000.</A>
 *  \li <A href="http://adsabs.harvard.edu/abs/1996A%26A...313..697B">Bartelmann, M., Arcs from a universal dark-matter halo profile, Astronomy and Astrophysics, Volume 313, pp. 697-702, 1996.</A>
 */
class HALOLENS_IMPORTEXPORT NFWLens : public GravitationalLens
{
public:
	NFWLens(const std::string &name = "NFW");
	~NFWLens();

	std::vector<std::string> getParameterNames() const override;
	double getSoftening() const													{ return m_softening; }

	/** Scale radius (Mpc) for the specified lens redshift, mass and concentration. */
	bool getScaleRadius(const NDArrayd &z_l, const NDArrayd &m, const NDArrayd &c, NDArrayd &r_s) const;

	/** Scale density (solar masses per Mpc^3). */
	bool getScaleDensity(const NDArrayd &z_l, const NDArrayd &c, NDArrayd &rho_s) const;

	/** The characteristic convergence \f$\kappa_s\f$ of the profile. */
	bool getDimensionlessSurfaceDensity(const NDArrayd &z_l, const NDArrayd &z_s, const NDArrayd &m,
	                                    const NDArrayd &c, NDArrayd &kappa_s) const;

	bool getReducedDeflectionAngle(const NDArrayd &x, const NDArrayd &y, const NDArrayd &z_s,
	                               NDArrayd &alphaX, NDArrayd &alphaY, const ParameterContext *pCtx = nullptr) const override;
	bool getConvergence(const NDArrayd &x, const NDArrayd &y, const NDArrayd &z_s,
	                    NDArrayd &kappa, const ParameterContext *pCtx = nullptr) const override;
	bool getPotential(const NDArrayd &x, const NDArrayd &y, const NDArrayd &z_s,
	                  NDArrayd &psi, const ParameterContext *pCtx = nullptr) const override;

	/** Mass (solar masses) inside the cylinder with the (softened) radius of each query point. */
	bool getProjectedMass(const NDArrayd &x, const NDArrayd &y, NDArrayd &mass, const ParameterContext *pCtx = nullptr) const;

	template<class T> static T calculateScaleRadius(double rhoCrit, T m, T c);
	template<class T> static T calculateScaleDensity(double rhoCrit, T c);
	template<class T> static T calculateDimensionlessSurfaceDensity(double rhoCrit, double sigmaCrit, T m, T c);

	// Per-point versions of the observables, for a point (x,y) in the frame
	// of the lens and an already resolved set of parameters and distances
	template<class T> static void calculateReducedDeflectionAngle(T x, T y, T m, T c, double softening,
	                                                              double D_l, double rhoCrit, T &alphaX, T &alphaY);
	template<class T> static T calculateConvergence(T x, T y, T m, T c, double softening,
	                                                double D_l, double rhoCrit, double sigmaCrit);
	template<class T> static T calculatePotential(T x, T y, T m, T c, double softening,
	                                              double D_l, double rhoCrit, double sigmaCrit);
	template<class T> static T calculateProjectedMass(T x, T y, T m, T c, double softening, double D_l, double rhoCrit);

	template<class T> static T F(T r);
	template<class T> static T G(T r);
	template<class T> static T H(T r);
	template<class T> static T K(T r);

	static errut::bool_t F(const NDArrayd &r, NDArrayd &result)				{ return elementWise(result, [](double x) { return F(x); }, r); }
	static errut::bool_t G(const NDArrayd &r, NDArrayd &result)				{ return elementWise(result, [](double x) { return G(x); }, r); }
	static errut::bool_t H(const NDArrayd &r, NDArrayd &result)				{ return elementWise(result, [](double x) { return H(x); }, r); }
	static errut::bool_t K(const NDArrayd &r, NDArrayd &result)				{ return elementWise(result, [](double x) { return K(x); }, r); }
protected:
	bool processParameters(const GravitationalLensParams &params) override;
private:
	class HaloInfo
	{
	public:
		NDArrayd z_l, x0, y0, m, c;
		NDArrayd D_l, rhoCrit;
	};

	bool resolveHalo(const ParameterContext *pCtx, HaloInfo &halo) const;
	template<class T> static T getDimensionlessRadius(T x, T y, T r_s, double softening, double D_l, T &theta);
	template<class T> static T getReducedDeflectionScale(T x, T y, T m, T c, double softening, double D_l, double rhoCrit);

	double m_softening;
};

template<class T>
inline T NFWLens::calculateScaleRadius(double rhoCrit, T m, T c)
{
	T r_delta = POW(3.0*m/(4.0*CONST_PI*NFW_OVERDENSITY*rhoCrit), 1.0/3.0);
	return r_delta/c;
}

template<class T>
inline T NFWLens::calculateScaleDensity(double rhoCrit, T c)
{
	return (NFW_OVERDENSITY/3.0)*rhoCrit*c*c*c/(LN(1.0 + c) - c/(1.0 + c));
}

template<class T>
inline T NFWLens::calculateDimensionlessSurfaceDensity(double rhoCrit, double sigmaCrit, T m, T c)
{
	return calculateScaleDensity(rhoCrit, c)*calculateScaleRadius(rhoCrit, m, c)/sigmaCrit;
}

template<class T>
inline T NFWLens::getDimensionlessRadius(T x, T y, T r_s, double softening, double D_l, T &theta)
{
	theta = SQRT(x*x + y*y) + softening;
	T xi = D_l*theta*ARCSEC_TO_RAD;
	return xi/r_s;
}

// Size of the reduced deflection divided by the (softened) angular distance
// to the center; multiplying by x and y gives the components
template<class T>
inline T NFWLens::getReducedDeflectionScale(T x, T y, T m, T c, double softening, double D_l, double rhoCrit)
{
	T theta;
	T r_s = calculateScaleRadius(rhoCrit, m, c);
	T r = getDimensionlessRadius(x, y, r_s, softening, D_l, theta);
	T xi = r*r_s;
	T alpha = 16.0*CONST_PI*CONST_G_OVER_C2*calculateScaleDensity(rhoCrit, c)*r_s*r_s*r_s*H(r)*RAD_TO_ARCSEC/xi;

	return alpha/theta;
}

template<class T>
inline void NFWLens::calculateReducedDeflectionAngle(T x, T y, T m, T c, double softening,
                                                     double D_l, double rhoCrit, T &alphaX, T &alphaY)
{
	T scale = getReducedDeflectionScale(x, y, m, c, softening, D_l, rhoCrit);

	alphaX = scale*x;
	alphaY = scale*y;
}

template<class T>
inline T NFWLens::calculateConvergence(T x, T y, T m, T c, double softening,
                                       double D_l, double rhoCrit, double sigmaCrit)
{
	T theta;
	T r_s = calculateScaleRadius(rhoCrit, m, c);
	T r = getDimensionlessRadius(x, y, r_s, softening, D_l, theta);
	T kappa_s = calculateScaleDensity(rhoCrit, c)*r_s/sigmaCrit;

	return 2.0*kappa_s*K(r);
}

template<class T>
inline T NFWLens::calculatePotential(T x, T y, T m, T c, double softening,
                                     double D_l, double rhoCrit, double sigmaCrit)
{
	T theta;
	T r_s = calculateScaleRadius(rhoCrit, m, c);
	T r = getDimensionlessRadius(x, y, r_s, softening, D_l, theta);
	T kappa_s = calculateScaleDensity(rhoCrit, c)*r_s/sigmaCrit;

	return 2.0*kappa_s*G(r)*r_s*r_s/(D_l*D_l*ARCSEC_TO_RAD*ARCSEC_TO_RAD);
}

template<class T>
inline T NFWLens::calculateProjectedMass(T x, T y, T m, T c, double softening, double D_l, double rhoCrit)
{
	T theta;
	T r_s = calculateScaleRadius(rhoCrit, m, c);
	T r = getDimensionlessRadius(x, y, r_s, softening, D_l, theta);

	return 4.0*CONST_PI*calculateScaleDensity(rhoCrit, c)*r_s*r_s*r_s*H(r);
}

// In the kernels below, rOut and rIn are the arguments for the r > 1 and
// r < 1 branches; outside their own branch they are replaced by a harmless
// value, so that neither the discarded result nor its derivative can become
// NaN or infinite. Close to r = 1 the closed forms lose their precision and
// the second order expansion around r = 1 is used instead.

template<class T>
inline void getKernelBranchArguments(T r, bool &outside, bool &inside, T &rOut, T &rIn)
{
	outside = (r > 1.0 + NFW_KERNEL_EXPANSION_RANGE);
	inside = (r < 1.0 - NFW_KERNEL_EXPANSION_RANGE);
	rOut = SELECT(outside, r, T(2.0));
	rIn = SELECT(inside, r, T(0.5));
}

/** \f$ f(r) = 1 - \frac{2}{\sqrt{r^2-1}}\textrm{atan}\sqrt{\frac{r-1}{r+1}} \f$ for r > 1,
 *  \f$ 1 - \frac{2}{\sqrt{1-r^2}}\textrm{atanh}\sqrt{\frac{1-r}{1+r}} \f$ for r < 1, 0 for r = 1. */
template<class T>
inline T NFWLens::F(T r)
{
	bool outside, inside;
	T rOut, rIn;
	getKernelBranchArguments(r, outside, inside, rOut, rIn);

	T fOut = 1.0 - 2.0/SQRT(rOut*rOut - 1.0)*ATAN(SQRT((rOut - 1.0)/(rOut + 1.0)));
	T fIn = 1.0 - 2.0/SQRT(1.0 - rIn*rIn)*ATANH(SQRT((1.0 - rIn)/(1.0 + rIn)));
	T e = r - 1.0;
	T fOne = (2.0/3.0)*e - (7.0/15.0)*e*e;

	return SELECT(outside, fOut, SELECT(inside, fIn, fOne));
}

/** \f$ g(r) = \ln^2\frac{r}{2} + \textrm{acos}^2\frac{1}{r} \f$ for r > 1,
 *  \f$ \ln^2\frac{r}{2} - \textrm{acosh}^2\frac{1}{r} \f$ for r < 1, \f$ \ln^2\frac{1}{2} \f$ for r = 1. */
template<class T>
inline T NFWLens::G(T r)
{
	bool outside, inside;
	T rOut, rIn;
	getKernelBranchArguments(r, outside, inside, rOut, rIn);
	T l = LN(r/2.0);

	T gOut = l*l + SQUARE(ACOS(1.0/rOut));
	T gIn = l*l - SQUARE(ACOSH(1.0/rIn));
	T e = r - 1.0;
	T gOne = l*l + 2.0*e - (5.0/3.0)*e*e;

	return SELECT(outside, gOut, SELECT(inside, gIn, gOne));
}

/** \f$ h(r) = \ln\frac{r}{2} + \frac{\textrm{acos}(1/r)}{\sqrt{r^2-1}} \f$ for r > 1,
 *  \f$ \ln\frac{r}{2} + \frac{\textrm{acosh}(1/r)}{\sqrt{1-r^2}} \f$ for r < 1, \f$ 1 + \ln\frac{1}{2} \f$ for r = 1. */
template<class T>
inline T NFWLens::H(T r)
{
	bool outside, inside;
	T rOut, rIn;
	getKernelBranchArguments(r, outside, inside, rOut, rIn);
	T l = LN(r/2.0);

	T hOut = l + ACOS(1.0/rOut)/SQRT(rOut*rOut - 1.0);
	T hIn = l + ACOSH(1.0/rIn)/SQRT(1.0 - rIn*rIn);
	T e = r - 1.0;
	T hOne = l + 1.0 - (2.0/3.0)*e + (7.0/15.0)*e*e;

	return SELECT(outside, hOut, SELECT(inside, hIn, hOne));
}

/** \f$ k(r) = f(r)/(r^2-1) \f$, with the limit 1/3 at r = 1. */
template<class T>
inline T NFWLens::K(T r)
{
	bool outside, inside;
	T rOut, rIn;
	getKernelBranchArguments(r, outside, inside, rOut, rIn);
	const bool away = outside || inside;
	T rOff = SELECT(outside, rOut, rIn);

	T kOff = F(rOff)/(rOff*rOff - 1.0);
	T e = r - 1.0;
	T kOne = 1.0/3.0 - 0.4*e + (13.0/35.0)*e*e;

	return SELECT(away, kOff, kOne);
}

} // end namespace

#endif // HALOLENS_NFWLENS_H
