#pragma once

#include "halolensconfig.h"
#include "ndarray.h"
#include <errut/booltype.h>

namespace halolens
{

/** Source of the cosmological distances and densities needed by the lenses.
 *  Distances are angular diameter distances in Mpc, the critical density is
 *  expressed in solar masses per Mpc^3 and the critical surface density in
 *  solar masses per Mpc^2.
 */
class HALOLENS_IMPORTEXPORT Cosmology
{
public:
	Cosmology()																{ }
	virtual ~Cosmology()													{ }

	virtual errut::bool_t getCriticalDensity(double z, double &rhoCrit) const = 0;
	virtual errut::bool_t getAngularDiameterDistanceBetween(double z1, double z2, double &D) const = 0;
	errut::bool_t getAngularDiameterDistance(double z, double &D) const		{ return getAngularDiameterDistanceBetween(0, z, D); }
	virtual errut::bool_t getCriticalSurfaceDensity(double z_l, double z_s, double &sigmaCrit) const;

	// Batched versions, the result has the broadcast shape of the inputs
	errut::bool_t getCriticalDensity(const NDArrayd &z, NDArrayd &rhoCrit) const;
	errut::bool_t getAngularDiameterDistance(const NDArrayd &z, NDArrayd &D) const;
	errut::bool_t getAngularDiameterDistanceBetween(const NDArrayd &z1, const NDArrayd &z2, NDArrayd &D) const;
	errut::bool_t getCriticalSurfaceDensity(const NDArrayd &z_l, const NDArrayd &z_s, NDArrayd &sigmaCrit) const;
};

/** Friedmann-Lemaitre-Robertson-Walker cosmology with matter, radiation,
 *  and a dark energy component with constant equation of state \c w.
 *  The curvature density follows from the other parameters; open, flat and
 *  closed geometries are supported.
 *
 *  \note Integration failures are reported through the returned status,
 *  for which the constructor switches off GSL's error handler. This is a
 *  process wide setting that also affects other GSL code in the program.
 */
class HALOLENS_IMPORTEXPORT FLRWCosmology : public Cosmology
{
public:
	FLRWCosmology(double h = 0.7, double Wm = 0.3, double Wr = 0, double Wv = 0.7, double w = -1.0);
	~FLRWCosmology();

	double getH() const                                                     { return m_h; }
	double getOmegaM() const                                                { return m_Wm; }
	double getOmegaR() const                                                { return m_Wr; }
	double getOmegaV() const                                                { return m_Wv; }
	double getW() const                                                     { return m_w; }

	errut::bool_t getCriticalDensity(double z, double &rhoCrit) const override;
	errut::bool_t getAngularDiameterDistanceBetween(double z1, double z2, double &D) const override;

	using Cosmology::getCriticalDensity;
	using Cosmology::getAngularDiameterDistanceBetween;
private:
	static double integrationFunction(double R, void *params);

	double m_h, m_Wm, m_Wr, m_Wv, m_w;
};

} // end namespace
