#include "cosmology.h"
#include "constants.h"
#include "log.h"
#include <limits>
#include <cmath>
#include <gsl/gsl_integration.h>
#include <gsl/gsl_errno.h>

using namespace std;

namespace halolens
{

errut::bool_t Cosmology::getCriticalSurfaceDensity(double z_l, double z_s, double &sigmaCrit) const
{
	double D_l = 0, D_s = 0, D_ls = 0;
	errut::bool_t r;

	if (!(r = getAngularDiameterDistance(z_l, D_l)) ||
	    !(r = getAngularDiameterDistance(z_s, D_s)) ||
		!(r = getAngularDiameterDistanceBetween(z_l, z_s, D_ls)))
		return r;

	sigmaCrit = D_s/(4.0*CONST_PI*CONST_G_OVER_C2*D_l*D_ls);
	return true;
}

// Wraps a per-redshift calculation so that it can be used element-wise;
// the first failure is remembered and stops further evaluation.
template<class F, class... Args>
errut::bool_t batchCalculation(NDArrayd &result, F calc, const NDArray<Args> &... z)
{
	errut::bool_t status(true);
	auto func = [&status, &calc](Args... zValues) -> double
	{
		if (!status)
			return numeric_limits<double>::quiet_NaN();

		double value = numeric_limits<double>::quiet_NaN();
		errut::bool_t r = calc(zValues..., value);
		if (!r)
		{
			status = r;
			return numeric_limits<double>::quiet_NaN();
		}
		return value;
	};

	errut::bool_t r = elementWise(result, func, z...);
	if (!r)
		return r;
	if (!status)
	{
		LOG(Log::WRN, "Cosmology calculation failed: " + status.getErrorString());
		return status;
	}
	return true;
}

errut::bool_t Cosmology::getCriticalDensity(const NDArrayd &z, NDArrayd &rhoCrit) const
{
	return batchCalculation(rhoCrit, [this](double zValue, double &v) { return getCriticalDensity(zValue, v); }, z);
}

errut::bool_t Cosmology::getAngularDiameterDistance(const NDArrayd &z, NDArrayd &D) const
{
	return batchCalculation(D, [this](double zValue, double &v) { return getAngularDiameterDistance(zValue, v); }, z);
}

errut::bool_t Cosmology::getAngularDiameterDistanceBetween(const NDArrayd &z1, const NDArrayd &z2, NDArrayd &D) const
{
	return batchCalculation(D, [this](double zValue1, double zValue2, double &v) { return getAngularDiameterDistanceBetween(zValue1, zValue2, v); }, z1, z2);
}

errut::bool_t Cosmology::getCriticalSurfaceDensity(const NDArrayd &z_l, const NDArrayd &z_s, NDArrayd &sigmaCrit) const
{
	return batchCalculation(sigmaCrit, [this](double zLens, double zSource, double &v) { return getCriticalSurfaceDensity(zLens, zSource, v); }, z_l, z_s);
}

FLRWCosmology::FLRWCosmology(double h, double Wm, double Wr, double Wv, double w)
{
	m_h = h;
	m_Wm = Wm;
	m_Wr = Wr;
	m_Wv = Wv;
	m_w = w;

	// Integration failures are reported through the returned status codes
	gsl_set_error_handler_off();
}

FLRWCosmology::~FLRWCosmology()
{
}

struct CosmParams
{
	CosmParams(double _h, double _Wm, double _Wr, double _Wv, double _w)
	{
		h = _h;
		Wm = _Wm;
		Wr = _Wr;
		Wv = _Wv;
		w = _w;

		Wk = 1.0-Wm-Wr-Wv;
		if (std::abs(Wk) < 1.0e-7)
		{
			Wk = 0;
			Wv = 1.0-Wm-Wr;
		}
	}

	double getHubbleParameterSquared(double z) const // in units of H0^2
	{
		double a1 = 1.0+z;
		return Wm*a1*a1*a1 + Wr*a1*a1*a1*a1 + Wk*a1*a1 + Wv*std::pow(a1, 3.0*(1.0+w));
	}

	double h, Wm, Wr, Wv, Wk, w;
};

errut::bool_t FLRWCosmology::getCriticalDensity(double z, double &rhoCrit) const
{
	if (z < 0)
		return "Redshift must be positive";

	CosmParams cosm(m_h, m_Wm, m_Wr, m_Wv, m_w);
	double H0 = 100000.0*m_h/DIST_MPC; // 100h km/s/Mpc, in 1/s
	double H2 = H0*H0*cosm.getHubbleParameterSquared(z);
	double rho = 3.0*H2/(8.0*CONST_PI*CONST_G); // kg/m^3

	rhoCrit = rho*DIST_MPC*DIST_MPC*DIST_MPC/MASS_SOLAR;
	return true;
}

errut::bool_t FLRWCosmology::getAngularDiameterDistanceBetween(double z1, double z2, double &D) const
{
    if (z1 < 0 || z2 < 0)
        return "Redshifts must be positive";

    if (z1 > z2)
        std::swap(z1, z2);

   	CosmParams cosm(m_h, m_Wm, m_Wr, m_Wv, m_w);
	gsl_function F;
	F.function = integrationFunction;
	F.params = &cosm;

	double result = 0, abserr = 0;
	size_t neval = 0;

    int status = gsl_integration_qng(&F, 1.0/(1.0+z2), 1.0/(1.0+z1), 0, 1e-7, &result, &abserr, &neval);
	if (status)
		return "Error performing gsl_integration_qng: " + string(gsl_strerror(status));

	double T_H = DIST_MPC/100000.0;
	double commonFactor = 1.0/(1.0+z2) * SPEED_C*T_H/m_h;
	double dist = 0;

	if (cosm.Wk == 0)
		dist = commonFactor * result;
	else if (cosm.Wk < 0)
		dist = commonFactor/std::sqrt(-cosm.Wk) * std::sin(std::sqrt(-cosm.Wk) * result);
	else // Wk > 0
		dist = commonFactor/std::sqrt(cosm.Wk) * std::sinh(std::sqrt(cosm.Wk) * result);

	D = dist/DIST_MPC;
	return true;
}

double FLRWCosmology::integrationFunction(double R, void *params)
{
	CosmParams *pInst = reinterpret_cast<CosmParams*>(params);
	double R2 = R*R;
	return 1.0/std::sqrt(pInst->Wm*R + pInst->Wr + pInst->Wv*std::pow(R, 1.0-3.0*pInst->w) + pInst->Wk*R2);
}

} // end namespace
