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

#ifndef HALOLENS_MATHFUNCTIONS_H

#define HALOLENS_MATHFUNCTIONS_H

#include <cmath>
#include <algorithm>

namespace halolens
{
	// The macros below expand to unqualified calls, so that the same
	// expressions work for plain floating point values and for types
	// like DualNumber which provide their own overloads.
	using std::sqrt;
	using std::log;
	using std::pow;
	using std::atan;
	using std::atanh;
	using std::acos;
	using std::acosh;

	/** Element-wise selection: returns \c a if \c cond is true and \c b otherwise.
	 *  Both alternatives have already been evaluated by the caller, which is
	 *  what makes this usable for branch-free piecewise definitions.
	 */
	template<class T>
	inline T SELECT(bool cond, const T &a, const T &b)
	{
		return (cond)?a:b;
	}

	template<class T>
	inline T SQUARE(const T &x)
	{
		return x*x;
	}
}

#define SQRT(x)		sqrt(x)
#define ACOS(x)		acos(x)
#define ATAN(x)		atan(x)
#define LN(x)		log(x)
#define ACOSH(x)	acosh(x)
#define ATANH(x)	atanh(x)
#define POW(x,y)	pow(x,y)

#endif // HALOLENS_MATHFUNCTIONS_H
