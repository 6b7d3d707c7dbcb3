#pragma once

#include "halolensconfig.h"
#include "ndarray.h"
#include <errut/booltype.h>
#include <cmath>

namespace halolens
{

/** Expresses the point (x,y) in the frame that is centered on (x0,y0) and
 *  rotated over the angle \c phi (radians, counter-clockwise). */
template<class T>
inline void translateRotate(T x, T y, T x0, T y0, double phi, T &xOut, T &yOut)
{
	T dx = x - x0;
	T dy = y - y0;

	if (phi == 0)
	{
		xOut = dx;
		yOut = dy;
		return;
	}

	double cs = std::cos(phi);
	double sn = std::sin(phi);
	xOut = dx*cs + dy*sn;
	yOut = dy*cs - dx*sn;
}

inline errut::bool_t translateRotate(const NDArrayd &x, const NDArrayd &y, const NDArrayd &x0, const NDArrayd &y0,
                                     NDArrayd &xOut, NDArrayd &yOut, double phi = 0)
{
	NDArrayd xTmp, yTmp;
	errut::bool_t r;

	auto getX = [phi](double xv, double yv, double x0v, double y0v)
	{
		double xt, yt;
		translateRotate(xv, yv, x0v, y0v, phi, xt, yt);
		return xt;
	};
	auto getY = [phi](double xv, double yv, double x0v, double y0v)
	{
		double xt, yt;
		translateRotate(xv, yv, x0v, y0v, phi, xt, yt);
		return yt;
	};

	if (!(r = elementWise(xTmp, getX, x, y, x0, y0)) ||
	    !(r = elementWise(yTmp, getY, x, y, x0, y0)))
		return r;

	xOut = std::move(xTmp);
	yOut = std::move(yTmp);
	return true;
}

} // end namespace
